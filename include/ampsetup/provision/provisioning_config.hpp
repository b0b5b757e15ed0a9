/**
 * @file provisioning_config.hpp
 * @brief Configuration for a provisioning run
 *
 * Values come from built-in defaults describing the stock AMP web
 * deployment, then an optional JSON file, then AMPSETUP_* environment
 * variables, each layer overriding the previous one.
 *
 * @code{.json}
 * {
 *   "connection": "host=/var/run/postgresql user=postgres dbname=postgres",
 *   "roles": ["cuz"],
 *   "databases": [
 *     {"name": "ampweb", "owner": "cuz",
 *      "schema_dump": "/usr/share/amp-web/sql/ampweb.sql.gz"}
 *   ],
 *   "user_database": "ampweb",
 *   "meta_database": "ampmeta",
 *   "application_role": "cuz",
 *   "admin": {"username": "admin", "password": "secret"},
 *   "legacy": {"users_file": "/etc/amp-web/users", "import_before": "2.6-1"},
 *   "migration_policy": "continue_on_error",
 *   "hash_rounds": 29000,
 *   "logging": {"directory": "/var/log/ampsetup", "level": "info"}
 * }
 * @endcode
 */

#pragma once

#include "database_provisioner.hpp"

#include <ampsetup/core/error_policy.hpp>
#include <ampsetup/core/result.hpp>
#include <ampsetup/storage/migration_catalog.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ampsetup::provision {

/**
 * @brief Settings consumed by the provisioning orchestrator
 */
struct provisioning_config {
    /// libpq connection string for the administrative connection
    std::string connection{"host=/var/run/postgresql user=postgres dbname=postgres"};

    std::vector<std::string> roles{"cuz"};
    std::vector<database_spec> databases{
        {"ampweb", "cuz", "/usr/share/amp-web/sql/ampweb.sql.gz"},
        {"ampmeta", "cuz", "/usr/share/amp-web/sql/ampmeta.sql.gz"}};

    /// Database holding the users table
    std::string user_database{"ampweb"};

    /// Database holding sites, meshes and schedules
    std::string meta_database{"ampmeta"};

    /// Role the web application connects as
    std::string application_role{"cuz"};

    std::optional<std::string> admin_username;
    std::optional<std::string> admin_password;

    std::filesystem::path legacy_users_file{"/etc/amp-web/users"};

    /// Upgrades from versions strictly older than this import legacy users
    std::string legacy_import_threshold{"2.6-1"};

    core::error_policy migration_policy{core::error_policy::continue_on_error};
    std::uint32_t hash_rounds{29000};

    std::filesystem::path log_directory{"/var/log/ampsetup"};
    std::string log_level{"info"};

    /**
     * @brief Override fields present in a JSON file
     * @return file_not_found, or invalid_configuration for malformed JSON or
     *         a value of the wrong type
     */
    [[nodiscard]] auto load_from_file(const std::filesystem::path& path) -> VoidResult;

    /**
     * @brief Override fields from a JSON document already in memory
     */
    [[nodiscard]] auto load_from_string(const std::string& text) -> VoidResult;

    /**
     * @brief Override fields from environment variables
     *
     * Recognised: <prefix>CONNECTION, <prefix>ADMIN_USERNAME,
     * <prefix>ADMIN_PASSWORD, <prefix>LEGACY_USERS_FILE, <prefix>LOG_DIR,
     * <prefix>LOG_LEVEL.
     */
    [[nodiscard]] auto load_from_environment(const std::string& prefix = "AMPSETUP_")
        -> VoidResult;

    /**
     * @brief Check cross-field consistency
     *
     * user_database and meta_database must be among the configured
     * databases and application_role among the configured roles, since
     * upgrade migrations run against them.
     *
     * @return invalid_configuration naming the first problem found
     */
    [[nodiscard]] auto validate() const -> VoidResult;

    /**
     * @brief Databases and role the migration catalog is built against
     */
    [[nodiscard]] auto migration_targets() const -> storage::catalog_targets;
};

/**
 * @brief Parse "continue_on_error" or "fail_fast"
 */
[[nodiscard]] auto parse_error_policy(const std::string& name)
    -> std::optional<core::error_policy>;

}  // namespace ampsetup::provision
