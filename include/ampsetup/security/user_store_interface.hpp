/**
 * @file user_store_interface.hpp
 * @brief Storage interface for web application users
 */

#pragma once

#include "user.hpp"

#include <ampsetup/core/result.hpp>

#include <string_view>
#include <vector>

namespace ampsetup::security {

/**
 * @brief Abstract interface for persisting users
 */
class user_store_interface {
public:
    template <typename T> using Result = ampsetup::Result<T>;
    using VoidResult = ampsetup::VoidResult;

    virtual ~user_store_interface() = default;

    /**
     * @brief Insert a user, or replace the password, display name, roles and
     *        enabled flag of an existing user with the same username
     */
    [[nodiscard]] virtual auto upsert_user(const User& user) -> VoidResult = 0;

    /**
     * @brief Fetch a user by username
     * @return user_not_found error when absent
     */
    [[nodiscard]] virtual auto get_user(std::string_view username)
        -> Result<User> = 0;

    /**
     * @brief Replace only the role set of an existing user
     * @return user_not_found error when no such user exists
     */
    [[nodiscard]] virtual auto set_roles(std::string_view username,
                                         const std::vector<Capability>& roles)
        -> VoidResult = 0;

protected:
    user_store_interface() = default;
    user_store_interface(const user_store_interface&) = delete;
    user_store_interface& operator=(const user_store_interface&) = delete;
    user_store_interface(user_store_interface&&) = default;
    user_store_interface& operator=(user_store_interface&&) = default;
};

} // namespace ampsetup::security
