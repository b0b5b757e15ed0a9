/**
 * @file pg_user_store.cpp
 * @brief Implementation of the users table store
 */

#include <ampsetup/storage/pg_user_store.hpp>

#include <ampsetup/compat/format.hpp>

namespace ampsetup::storage {

using namespace security;

namespace {

constexpr const char* kUpsertUserSql = R"(
    INSERT INTO users (username, longname, email, roles, enabled, password)
    VALUES ($1, $2, NULLIF($3, ''), $4::text[], $5::boolean, $6)
    ON CONFLICT (username) DO UPDATE
    SET longname = EXCLUDED.longname,
        roles = EXCLUDED.roles,
        enabled = EXCLUDED.enabled,
        password = EXCLUDED.password
)";

constexpr const char* kSelectUserSql = R"(
    SELECT username, longname, email, roles, enabled, password
    FROM users WHERE username = $1
)";

constexpr const char* kSetRolesSql =
    "UPDATE users SET roles = $2::text[] WHERE username = $1";

}  // namespace

pg_user_store::pg_user_store(sql_connection& connection)
    : connection_(connection) {}

auto pg_user_store::upsert_user(const User& user) -> VoidResult {
    auto result = connection_.query(
        kUpsertUserSql,
        {user.username, user.longname.empty() ? user.username : user.longname,
         user.email, format_role_array(user.roles), user.enabled ? "true" : "false",
         user.password_hash});
    if (result.is_err()) {
        return make_error<std::monostate>(
            error_codes::user_store_error,
            compat::format("Failed to store user {}: {}", user.username,
                           result.error().message),
            "pg_user_store");
    }
    return ok();
}

auto pg_user_store::get_user(std::string_view username) -> Result<User> {
    auto result = connection_.query(kSelectUserSql, {std::string(username)});
    if (result.is_err()) {
        return make_error<User>(error_codes::user_store_error,
                                result.error().message, "pg_user_store");
    }

    const auto& rows = result.value();
    if (rows.empty()) {
        return make_error<User>(
            error_codes::user_not_found,
            compat::format("User {} not found", username), "pg_user_store");
    }

    const auto& row = rows[0];
    User user;
    user.username = row.at("username");
    user.longname = row.at("longname");
    user.email = row.at("email");
    user.roles = parse_role_array(row.at("roles"));
    user.enabled = row.at("enabled") == "t" || row.at("enabled") == "true";
    user.password_hash = row.at("password");
    return user;
}

auto pg_user_store::set_roles(std::string_view username,
                              const std::vector<Capability>& roles) -> VoidResult {
    auto result = connection_.query(kSetRolesSql,
                                    {std::string(username), format_role_array(roles)});
    if (result.is_err()) {
        return make_error<std::monostate>(error_codes::user_store_error,
                                          result.error().message, "pg_user_store");
    }

    if (result.value().affected_rows == 0) {
        return make_error<std::monostate>(
            error_codes::user_not_found,
            compat::format("User {} not found", username), "pg_user_store");
    }
    return ok();
}

// ============================================================================
// text[] helpers
// ============================================================================

auto format_role_array(const std::vector<Capability>& roles) -> std::string {
    std::string literal = "{";
    for (std::size_t i = 0; i < roles.size(); ++i) {
        if (i > 0) {
            literal.push_back(',');
        }
        literal.append(to_string(roles[i]));
    }
    literal.push_back('}');
    return literal;
}

auto parse_role_array(std::string_view text) -> std::vector<Capability> {
    std::vector<Capability> roles;
    if (text.size() < 2 || text.front() != '{' || text.back() != '}') {
        return roles;
    }

    text = text.substr(1, text.size() - 2);
    while (!text.empty()) {
        auto comma = text.find(',');
        auto element = text.substr(0, comma);
        if (element.size() >= 2 && element.front() == '"' && element.back() == '"') {
            element = element.substr(1, element.size() - 2);
        }
        if (auto capability = parse_capability(element)) {
            roles.push_back(*capability);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return roles;
}

}  // namespace ampsetup::storage
