/**
 * @file migration_sequencer.hpp
 * @brief Applies version-gated migration steps on upgrade
 */

#pragma once

#include "migration_step.hpp"
#include "sql_connection.hpp"

#include <ampsetup/core/error_policy.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ampsetup::storage {

/**
 * @brief Summary of a sequencer run
 */
struct migration_report {
    /// Steps that ran, in the order they ran
    std::vector<migration_step_result> executed;

    /// Thresholds skipped because the prior version is already past them
    std::vector<std::string> skipped;

    /// True when a fail_fast run stopped early
    bool stopped{false};

    [[nodiscard]] auto applied_count() const -> std::size_t;
    [[nodiscard]] auto failed_count() const -> std::size_t;

    [[nodiscard]] auto succeeded() const -> bool { return failed_count() == 0; }
};

/**
 * @brief Runs migration steps against the databases they target
 *
 * A step runs when version_less_or_equal(from_version, step.threshold).
 * Steps run in list order, which must be ascending by threshold, and each
 * step runs at most once per call. Connections are opened once per target
 * database and reused for the run. There is no transaction around a step;
 * guarded statements make re-runs safe instead.
 *
 * Thread Safety: not thread-safe.
 *
 * @example
 * @code
 * pg_connection_factory factory(conninfo);
 * migration_sequencer sequencer(factory);
 * auto report = sequencer.apply_migrations("2.5-1", migration_catalog::steps());
 * @endcode
 */
class migration_sequencer {
public:
    explicit migration_sequencer(connection_factory& factory);

    migration_sequencer(const migration_sequencer&) = delete;
    auto operator=(const migration_sequencer&) -> migration_sequencer& = delete;

    /**
     * @brief Apply every step whose threshold is at or after from_version
     *
     * @param from_version Previously installed version; empty means a fresh
     *        install and nothing runs
     * @param steps Ascending list of steps
     * @param policy continue_on_error logs a failed statement and carries on;
     *        fail_fast stops the run at the first failure
     */
    [[nodiscard]] auto apply_migrations(std::string_view from_version,
                                        const std::vector<migration_step>& steps,
                                        core::error_policy policy =
                                            core::error_policy::continue_on_error)
        -> migration_report;

    /**
     * @brief Whether a step applies to an upgrade from from_version
     */
    [[nodiscard]] static auto is_pending(std::string_view from_version,
                                         const migration_step& step) -> bool;

private:
    [[nodiscard]] auto apply_step(const migration_step& step,
                                  core::error_policy policy)
        -> migration_step_result;

    [[nodiscard]] auto connection_for(const std::string& database)
        -> Result<sql_connection*>;

    connection_factory& factory_;
    std::map<std::string, std::unique_ptr<sql_connection>> connections_;
};

}  // namespace ampsetup::storage
