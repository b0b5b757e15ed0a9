/**
 * @file user.hpp
 * @brief Web application user record
 */

#pragma once

#include "role.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace ampsetup::security {

/**
 * @brief A row of the users table
 *
 * password_hash always holds a salted hash produced by password_hasher,
 * never the plaintext password.
 */
struct User {
    std::string username;
    std::string longname;
    std::string email;
    std::vector<Capability> roles;
    bool enabled{true};
    std::string password_hash;

    bool has_role(Capability capability) const {
        return std::ranges::find(roles, capability) != roles.end();
    }

    /**
     * @brief True when every capability in other is also held by this user
     */
    bool has_all(const std::vector<Capability>& other) const {
        return std::ranges::all_of(other, [this](Capability c) { return has_role(c); });
    }
};

} // namespace ampsetup::security
