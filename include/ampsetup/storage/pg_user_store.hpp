/**
 * @file pg_user_store.hpp
 * @brief users table implementation of the user store
 */

#pragma once

#include <ampsetup/security/user_store_interface.hpp>
#include <ampsetup/storage/sql_connection.hpp>

#include <string>
#include <vector>

namespace ampsetup::storage {

/**
 * @brief Stores users in the "users" table of the web application database
 *
 * Table layout:
 * @code
 * users (username TEXT PRIMARY KEY, longname TEXT, email TEXT,
 *        roles TEXT[], enabled BOOLEAN, password TEXT)
 * @endcode
 *
 * The connection is borrowed and must outlive the store.
 */
class pg_user_store final : public security::user_store_interface {
public:
    explicit pg_user_store(sql_connection& connection);

    [[nodiscard]] auto upsert_user(const security::User& user)
        -> VoidResult override;

    [[nodiscard]] auto get_user(std::string_view username)
        -> Result<security::User> override;

    [[nodiscard]] auto set_roles(std::string_view username,
                                 const std::vector<security::Capability>& roles)
        -> VoidResult override;

private:
    sql_connection& connection_;
};

/**
 * @brief Format capabilities as a PostgreSQL text[] literal ("{a,b}")
 */
[[nodiscard]] auto format_role_array(const std::vector<security::Capability>& roles)
    -> std::string;

/**
 * @brief Parse a PostgreSQL text[] literal; unknown tags are dropped
 */
[[nodiscard]] auto parse_role_array(std::string_view text)
    -> std::vector<security::Capability>;

}  // namespace ampsetup::storage
