/**
 * @file migration_step.hpp
 * @brief Version-gated schema change
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ampsetup::storage {

/**
 * @brief A schema change introduced by a released package version
 *
 * The step applies to upgrades whose previously installed version is at or
 * before threshold. Every statement must be idempotent on its own
 * (IF NOT EXISTS, IF EXISTS, CREATE OR REPLACE) so a step can be re-run
 * after a partial failure.
 */
struct migration_step {
    std::string threshold;                ///< Debian version gate
    std::string description;              ///< Human-readable summary
    std::string database;                 ///< Target database name
    std::vector<std::string> statements;  ///< Guarded SQL, run in order
};

/**
 * @brief Outcome of one step in a sequencer run
 */
struct migration_step_result {
    std::string threshold;
    std::string description;
    std::size_t statements_applied{0};
    std::size_t statements_failed{0};

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return statements_failed == 0;
    }
};

}  // namespace ampsetup::storage
