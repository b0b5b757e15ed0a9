/**
 * @file provisioning_orchestrator.cpp
 * @brief Implementation of the life-cycle entry point
 */

#include <ampsetup/provision/provisioning_orchestrator.hpp>

#include <ampsetup/compat/format.hpp>
#include <ampsetup/core/version_compare.hpp>
#include <ampsetup/integration/logger_adapter.hpp>
#include <ampsetup/security/password_hasher.hpp>
#include <ampsetup/storage/migration_catalog.hpp>
#include <ampsetup/storage/pg_user_store.hpp>

#include <utility>

namespace ampsetup::provision {

using integration::logger_adapter;
using integration::user_change;

// =============================================================================
// Event and state names
// =============================================================================

auto parse_lifecycle_event(std::string_view name) -> Result<lifecycle_event> {
    if (name == "configure") return lifecycle_event::configure;
    if (name == "reconfigure") return lifecycle_event::reconfigure;
    if (name == "abort-upgrade") return lifecycle_event::abort_upgrade;
    if (name == "abort-remove") return lifecycle_event::abort_remove;
    if (name == "abort-deconfigure") return lifecycle_event::abort_deconfigure;

    return make_error<lifecycle_event>(
        error_codes::unknown_lifecycle_event,
        compat::format("called with unknown argument '{}'", name),
        "provisioning_orchestrator");
}

auto to_string(lifecycle_event event) -> std::string_view {
    switch (event) {
        case lifecycle_event::configure: return "configure";
        case lifecycle_event::reconfigure: return "reconfigure";
        case lifecycle_event::abort_upgrade: return "abort-upgrade";
        case lifecycle_event::abort_remove: return "abort-remove";
        case lifecycle_event::abort_deconfigure: return "abort-deconfigure";
    }
    return "unknown";
}

auto to_string(terminal_state state) -> std::string_view {
    switch (state) {
        case terminal_state::fresh_install_complete: return "fresh_install_complete";
        case terminal_state::upgrade_complete: return "upgrade_complete";
        case terminal_state::aborted: return "aborted";
        case terminal_state::failed: return "failed";
    }
    return "unknown";
}

// =============================================================================
// provisioning_orchestrator
// =============================================================================

provisioning_orchestrator::provisioning_orchestrator(
    const provisioning_config& config, storage::connection_factory& factory,
    credential_source& credentials)
    : config_(config),
      factory_(factory),
      credentials_(credentials),
      steps_(storage::migration_catalog::steps(config.migration_targets())) {}

auto provisioning_orchestrator::set_migration_steps(
    std::vector<storage::migration_step> steps) -> VoidResult {
    if (!storage::migration_catalog::is_ordered(steps)) {
        return ampsetup_void_error(error_codes::invalid_configuration,
                                   "migration thresholds must be strictly ascending",
                                   "provisioning_orchestrator");
    }
    steps_ = std::move(steps);
    return ok();
}

auto provisioning_orchestrator::run(std::string_view event,
                                    std::string_view prior_version)
    -> provisioning_outcome {
    provisioning_outcome outcome;

    auto parsed = parse_lifecycle_event(event);
    if (parsed.is_err()) {
        outcome.state = terminal_state::failed;
        outcome.message = parsed.error().message;
        logger_adapter::error("{}", outcome.message);
    } else {
        switch (parsed.value()) {
            case lifecycle_event::configure:
            case lifecycle_event::reconfigure:
                if (prior_version.empty()) {
                    fresh_install(outcome);
                } else {
                    upgrade(prior_version, outcome);
                }
                break;

            case lifecycle_event::abort_upgrade:
            case lifecycle_event::abort_remove:
            case lifecycle_event::abort_deconfigure:
                outcome.state = terminal_state::aborted;
                break;
        }
    }

    logger_adapter::log_lifecycle_transition(std::string(event),
                                             std::string(prior_version),
                                             to_string(outcome.state));
    return outcome;
}

void provisioning_orchestrator::fresh_install(provisioning_outcome& outcome) {
    logger_adapter::info("Fresh install: provisioning roles and databases");

    auto admin = factory_.connect("");
    if (admin.is_err()) {
        outcome.state = terminal_state::failed;
        outcome.message = admin.error().message;
        logger_adapter::error("Cannot reach the database cluster: {}", outcome.message);
        return;
    }

    role_provisioner roles(*admin.value());
    for (const auto& role : config_.roles) {
        outcome.roles.push_back(roles.ensure_role(role));
    }

    database_provisioner databases(*admin.value(), factory_);
    for (const auto& spec : config_.databases) {
        outcome.databases.push_back(databases.ensure_database(spec));
    }

    auto created = create_admin();
    if (created.is_ok()) {
        outcome.admin_created = true;
    } else if (created.error().code == error_codes::missing_credentials) {
        logger_adapter::warn("Administrator not created: {}", created.error().message);
    } else {
        logger_adapter::error("Administrator not created: {}", created.error().message);
    }

    outcome.state = terminal_state::fresh_install_complete;
}

void provisioning_orchestrator::upgrade(std::string_view prior_version,
                                        provisioning_outcome& outcome) {
    logger_adapter::info("Upgrade from {}: applying migrations", prior_version);

    storage::migration_sequencer sequencer(factory_);
    auto report = sequencer.apply_migrations(prior_version, steps_,
                                             config_.migration_policy);
    auto stopped = report.stopped;
    outcome.migrations = std::move(report);

    if (stopped) {
        outcome.state = terminal_state::failed;
        outcome.message = "migration stopped at the first failed statement";
        return;
    }

    if (core::version_less(prior_version, config_.legacy_import_threshold)) {
        import_legacy_users(outcome);
    }

    outcome.state = terminal_state::upgrade_complete;
}

auto provisioning_orchestrator::create_admin() -> VoidResult {
    auto credentials = credentials_.admin();
    if (credentials.is_err()) {
        return ampsetup_void_error(credentials.error().code,
                                   credentials.error().message,
                                   "provisioning_orchestrator");
    }

    security::password_hasher hasher(config_.hash_rounds);
    auto hashed = hasher.hash(credentials.value().password);
    if (hashed.is_err()) {
        return ampsetup_void_error(hashed.error().code, hashed.error().message,
                                   "provisioning_orchestrator");
    }

    auto conn = factory_.connect(config_.user_database);
    if (conn.is_err()) {
        return ampsetup_void_error(conn.error().code, conn.error().message,
                                   "provisioning_orchestrator");
    }

    security::User user;
    user.username = credentials.value().username;
    user.longname = credentials.value().username;
    user.roles = security::administrator_capabilities();
    user.enabled = true;
    user.password_hash = std::move(hashed.value());

    storage::pg_user_store store(*conn.value());
    auto stored = store.upsert_user(user);
    if (stored.is_err()) {
        return stored;
    }

    logger_adapter::log_user_change(user_change::admin_created, user.username);
    return ok();
}

void provisioning_orchestrator::import_legacy_users(provisioning_outcome& outcome) {
    auto conn = factory_.connect(config_.user_database);
    if (conn.is_err()) {
        logger_adapter::error("Legacy users not imported: {}", conn.error().message);
        return;
    }

    storage::pg_user_store store(*conn.value());
    security::password_hasher hasher(config_.hash_rounds);
    legacy_credential_importer importer(store, hasher);

    auto imported = importer.import_from(config_.legacy_users_file);
    if (imported.is_err()) {
        // No legacy file simply means there is nothing to migrate
        logger_adapter::info("Legacy users not imported: {}", imported.error().message);
        return;
    }

    logger_adapter::info("Imported {} legacy users, elevated {}",
                         imported.value().imported, imported.value().elevated);
    outcome.legacy_import = std::move(imported.value());
}

}  // namespace ampsetup::provision
