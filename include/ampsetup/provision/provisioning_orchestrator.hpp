/**
 * @file provisioning_orchestrator.hpp
 * @brief Package life-cycle entry point driving all provisioning
 *
 * Invoked by the package manager after unpacking, with the life-cycle event
 * and the previously configured version:
 *
 * | event                                   | prior version | action        |
 * |-----------------------------------------|---------------|---------------|
 * | configure, reconfigure                  | empty         | fresh install |
 * | configure, reconfigure                  | non-empty     | upgrade       |
 * | abort-upgrade, abort-remove, abort-deconfigure | any    | nothing       |
 * | anything else                           | any           | failure       |
 */

#pragma once

#include "credential_source.hpp"
#include "database_provisioner.hpp"
#include "legacy_credential_importer.hpp"
#include "provisioning_config.hpp"
#include "role_provisioner.hpp"

#include <ampsetup/storage/migration_sequencer.hpp>
#include <ampsetup/storage/migration_step.hpp>
#include <ampsetup/storage/sql_connection.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ampsetup::provision {

/**
 * @brief Life-cycle events understood by the orchestrator
 */
enum class lifecycle_event {
    configure,
    reconfigure,
    abort_upgrade,
    abort_remove,
    abort_deconfigure
};

/**
 * @brief Map a maintainer-script argument to an event
 * @return unknown_lifecycle_event for anything unrecognised
 */
[[nodiscard]] auto parse_lifecycle_event(std::string_view name) -> Result<lifecycle_event>;

[[nodiscard]] auto to_string(lifecycle_event event) -> std::string_view;

/**
 * @brief True for the abort family, which never touches the cluster
 */
[[nodiscard]] constexpr auto is_abort(lifecycle_event event) noexcept -> bool {
    return event == lifecycle_event::abort_upgrade ||
           event == lifecycle_event::abort_remove ||
           event == lifecycle_event::abort_deconfigure;
}

/**
 * @brief How a run ended
 */
enum class terminal_state {
    fresh_install_complete,
    upgrade_complete,
    aborted,
    failed
};

[[nodiscard]] auto to_string(terminal_state state) -> std::string_view;

/**
 * @brief Process exit status for a terminal state: 0 unless failed
 */
[[nodiscard]] constexpr auto exit_code(terminal_state state) noexcept -> int {
    return state == terminal_state::failed ? 1 : 0;
}

/**
 * @brief Everything a run did, for logging and tests
 */
struct provisioning_outcome {
    terminal_state state{terminal_state::failed};
    std::string message;

    std::vector<role_provision_result> roles;
    std::vector<database_provision_result> databases;
    bool admin_created{false};

    std::optional<storage::migration_report> migrations;
    std::optional<import_report> legacy_import;
};

/**
 * @brief Runs the provisioning appropriate to a life-cycle event
 *
 * A fresh install creates roles, databases and the first administrator; it
 * never runs migrations or the legacy import. An upgrade runs the migration
 * catalog and, for sufficiently old prior versions, imports the legacy users
 * file. Abort events change nothing.
 *
 * Thread Safety: not thread-safe; one run at a time.
 */
class provisioning_orchestrator {
public:
    /**
     * @param config Settings; must outlive the orchestrator
     * @param factory Source of database connections
     * @param credentials Source of the first administrator
     */
    provisioning_orchestrator(const provisioning_config& config,
                              storage::connection_factory& factory,
                              credential_source& credentials);

    /**
     * @brief Replace the migration catalog
     *
     * Defaults to the catalog built against config.migration_targets().
     * @return invalid_configuration, leaving the current list in place, when
     *         thresholds are not strictly ascending
     */
    [[nodiscard]] auto set_migration_steps(std::vector<storage::migration_step> steps)
        -> VoidResult;

    /**
     * @brief Handle one life-cycle event
     * @param event Maintainer-script event name, e.g. "configure"
     * @param prior_version Previously configured version, empty on first install
     */
    [[nodiscard]] auto run(std::string_view event, std::string_view prior_version)
        -> provisioning_outcome;

private:
    void fresh_install(provisioning_outcome& outcome);
    void upgrade(std::string_view prior_version, provisioning_outcome& outcome);

    [[nodiscard]] auto create_admin() -> VoidResult;
    void import_legacy_users(provisioning_outcome& outcome);

    const provisioning_config& config_;
    storage::connection_factory& factory_;
    credential_source& credentials_;
    std::vector<storage::migration_step> steps_;
};

}  // namespace ampsetup::provision
