#pragma once

#include <string_view>

namespace qx {

// Usernames: USERNAME_MIN_LENGTH..USERNAME_MAX_LENGTH characters of
// [A-Za-z0-9_], and not a reserved word in any letter case.
[[nodiscard]] bool is_valid_username(std::string_view name);

[[nodiscard]] bool is_reserved_username(std::string_view name);

}  // namespace qx
