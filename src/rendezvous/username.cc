#include "rendezvous/username.hh"
#include "core/types.hh"
#include <algorithm>
#include <array>

namespace qx {

namespace {

constexpr std::array<std::string_view, 4> RESERVED_USERNAMES = {
    "admin", "root", "system", "quantarax",
};

bool is_username_char(char c) {
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') ||
           c == '_';
}

char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

}  // namespace

bool is_reserved_username(std::string_view name) {
    return std::any_of(RESERVED_USERNAMES.begin(), RESERVED_USERNAMES.end(),
                       [name](std::string_view reserved) {
                           return name.size() == reserved.size() &&
                                  std::equal(name.begin(), name.end(), reserved.begin(),
                                             [](char a, char b) { return ascii_lower(a) == b; });
                       });
}

bool is_valid_username(std::string_view name) {
    if (name.size() < USERNAME_MIN_LENGTH || name.size() > USERNAME_MAX_LENGTH) {
        return false;
    }
    if (!std::all_of(name.begin(), name.end(), is_username_char)) {
        return false;
    }
    return !is_reserved_username(name);
}

}  // namespace qx
