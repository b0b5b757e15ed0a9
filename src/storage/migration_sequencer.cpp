/**
 * @file migration_sequencer.cpp
 * @brief Implementation of the version-gated migration sequencer
 */

#include <ampsetup/storage/migration_sequencer.hpp>

#include <ampsetup/core/version_compare.hpp>
#include <ampsetup/integration/logger_adapter.hpp>

#include <algorithm>

namespace ampsetup::storage {

using integration::logger_adapter;

// ============================================================================
// Report
// ============================================================================

auto migration_report::applied_count() const -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(
        executed, [](const auto& step) { return step.succeeded(); }));
}

auto migration_report::failed_count() const -> std::size_t {
    return executed.size() - applied_count();
}

// ============================================================================
// Construction
// ============================================================================

migration_sequencer::migration_sequencer(connection_factory& factory)
    : factory_(factory) {}

// ============================================================================
// Migration Operations
// ============================================================================

auto migration_sequencer::is_pending(std::string_view from_version,
                                     const migration_step& step) -> bool {
    return core::version_less_or_equal(from_version, step.threshold);
}

auto migration_sequencer::apply_migrations(std::string_view from_version,
                                           const std::vector<migration_step>& steps,
                                           core::error_policy policy)
    -> migration_report {
    migration_report report;

    if (from_version.empty()) {
        logger_adapter::debug("No prior version; schema migrations skipped");
        return report;
    }

    logger_adapter::info("Applying schema migrations from version {} ({})",
                         from_version, core::to_string(policy));

    for (const auto& step : steps) {
        if (!is_pending(from_version, step)) {
            report.skipped.push_back(step.threshold);
            continue;
        }

        auto result = apply_step(step, policy);
        bool succeeded = result.succeeded();
        logger_adapter::log_migration_step(step.threshold, step.description,
                                           succeeded);
        report.executed.push_back(std::move(result));

        if (!succeeded && policy == core::error_policy::fail_fast) {
            report.stopped = true;
            break;
        }
    }

    logger_adapter::info("Schema migrations finished: {} applied, {} incomplete, {} skipped",
                         report.applied_count(), report.failed_count(),
                         report.skipped.size());
    return report;
}

// ============================================================================
// Internal Implementation
// ============================================================================

auto migration_sequencer::apply_step(const migration_step& step,
                                     core::error_policy policy)
    -> migration_step_result {
    migration_step_result result;
    result.threshold = step.threshold;
    result.description = step.description;

    auto conn = connection_for(step.database);
    if (conn.is_err()) {
        logger_adapter::warn("Migration {}: {}", step.threshold,
                             conn.error().message);
        result.statements_failed = step.statements.size();
        return result;
    }

    for (const auto& statement : step.statements) {
        auto executed = conn.value()->execute(statement);
        if (executed.is_ok()) {
            ++result.statements_applied;
            continue;
        }

        ++result.statements_failed;
        logger_adapter::warn("Migration {} on {}: {}", step.threshold,
                             step.database, executed.error().message);

        if (policy == core::error_policy::fail_fast) {
            break;
        }
    }

    return result;
}

auto migration_sequencer::connection_for(const std::string& database)
    -> Result<sql_connection*> {
    if (auto it = connections_.find(database); it != connections_.end()) {
        return it->second.get();
    }

    auto opened = factory_.connect(database);
    if (opened.is_err()) {
        return make_error<sql_connection*>(opened.error().code,
                                           opened.error().message, "storage");
    }

    auto* conn = opened.value().get();
    connections_.emplace(database, std::move(opened.value()));
    return conn;
}

}  // namespace ampsetup::storage
