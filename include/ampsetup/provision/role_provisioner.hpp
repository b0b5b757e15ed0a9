/**
 * @file role_provisioner.hpp
 * @brief Idempotent creation of database roles
 */

#pragma once

#include "provision_status.hpp"

#include <ampsetup/storage/sql_connection.hpp>

#include <string>
#include <string_view>

namespace ampsetup::provision {

/**
 * @brief Result of ensure_role()
 */
struct role_provision_result {
    std::string name;
    provision_status status{provision_status::failed};
    std::string message;  ///< Error text when status is failed
};

/**
 * @brief Ensures database roles exist
 *
 * Roles are created as LOGIN NOSUPERUSER NOCREATEDB NOCREATEROLE. Errors are
 * best effort: they are logged and reported as provision_status::failed but
 * never stop provisioning, since the role very likely exists already.
 *
 * The administrative connection is borrowed and must outlive the
 * provisioner.
 */
class role_provisioner {
public:
    explicit role_provisioner(storage::sql_connection& admin);

    /**
     * @brief Create the role when it does not exist
     * @return created on the first successful call, exists afterwards
     */
    [[nodiscard]] auto ensure_role(std::string_view name) -> role_provision_result;

    /**
     * @brief Check for a role in pg_roles
     */
    [[nodiscard]] auto role_exists(std::string_view name) -> Result<bool>;

private:
    storage::sql_connection& admin_;
};

}  // namespace ampsetup::provision
