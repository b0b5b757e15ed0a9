/**
 * @file migration_catalog.hpp
 * @brief Static list of schema changes shipped with each release
 */

#pragma once

#include "migration_step.hpp"

#include <string>
#include <vector>

namespace ampsetup::storage {

/**
 * @brief Names the catalog's statements refer to
 *
 * Defaults match the stock deployment.
 */
struct catalog_targets {
    std::string web_database{"ampweb"};    ///< Holds users and event filters
    std::string meta_database{"ampmeta"};  ///< Holds sites, meshes and schedules
    std::string web_role{"cuz"};           ///< Granted access to the users table
};

/**
 * @brief The schema changes of every released version
 *
 * Add a step here when a release changes the schema of an existing table.
 * Fresh installs never see these steps: the shipped dumps already contain
 * the latest schema.
 */
class migration_catalog {
public:
    /**
     * @brief All steps for the stock deployment, ascending by threshold
     */
    [[nodiscard]] static auto steps() -> const std::vector<migration_step>&;

    /**
     * @brief All steps against the given databases and role
     */
    [[nodiscard]] static auto steps(const catalog_targets& targets)
        -> std::vector<migration_step>;

    /**
     * @brief True when thresholds are in strictly ascending Debian order
     */
    [[nodiscard]] static auto is_ordered(const std::vector<migration_step>& steps)
        -> bool;
};

}  // namespace ampsetup::storage
