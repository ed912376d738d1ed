#include <gtest/gtest.h>
#include "rendezvous/username.hh"
#include <string>

using namespace qx;

TEST(UsernameTest, AcceptsWellFormedNames) {
    EXPECT_TRUE(is_valid_username("user123"));
    EXPECT_TRUE(is_valid_username("test_user"));
    EXPECT_TRUE(is_valid_username("ValidUser"));
    EXPECT_TRUE(is_valid_username("abc"));
    EXPECT_TRUE(is_valid_username("___"));
}

TEST(UsernameTest, LengthBounds) {
    EXPECT_FALSE(is_valid_username(""));
    EXPECT_FALSE(is_valid_username("ab"));
    EXPECT_TRUE(is_valid_username(std::string(32, 'a')));
    EXPECT_FALSE(is_valid_username(std::string(33, 'a')));
    EXPECT_FALSE(is_valid_username("verylongusernamethatisinvalid12345678"));
}

TEST(UsernameTest, RejectsPunctuationAndWhitespace) {
    EXPECT_FALSE(is_valid_username("user@name"));
    EXPECT_FALSE(is_valid_username("user-name"));
    EXPECT_FALSE(is_valid_username("user name"));
    EXPECT_FALSE(is_valid_username("user.name"));
    EXPECT_FALSE(is_valid_username("us\xc3\xa9r"));
}

TEST(UsernameTest, RejectsReservedWordsInAnyCase) {
    EXPECT_FALSE(is_valid_username("admin"));
    EXPECT_FALSE(is_valid_username("ADMIN"));
    EXPECT_FALSE(is_valid_username("Root"));
    EXPECT_FALSE(is_valid_username("system"));
    EXPECT_FALSE(is_valid_username("QuantaRax"));

    // Only exact matches are reserved
    EXPECT_TRUE(is_valid_username("admin1"));
    EXPECT_TRUE(is_valid_username("rooted"));
}

TEST(UsernameTest, ReservedCheckAlone) {
    EXPECT_TRUE(is_reserved_username("aDmIn"));
    EXPECT_FALSE(is_reserved_username("administrator"));
}
