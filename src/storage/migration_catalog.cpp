/**
 * @file migration_catalog.cpp
 * @brief Schema changes of released versions
 */

#include <ampsetup/storage/migration_catalog.hpp>

#include <ampsetup/compat/format.hpp>
#include <ampsetup/core/version_compare.hpp>
#include <ampsetup/storage/sql_connection.hpp>

namespace ampsetup::storage {

namespace {

auto build_catalog(const catalog_targets& targets) -> std::vector<migration_step> {
    const auto& web = targets.web_database;
    const auto& meta = targets.meta_database;

    std::vector<migration_step> steps;

    steps.push_back({"2.1-1", "Track schedule changes per site", meta,
                     {R"(ALTER TABLE site
                           ADD COLUMN IF NOT EXISTS last_schedule_update
                           INTEGER NOT NULL DEFAULT 0)"}});

    steps.push_back({"2.3-1", "Email alerting for event filters", web,
                     {"ALTER TABLE userfilters ADD COLUMN IF NOT EXISTS email TEXT",
                      R"(CREATE INDEX IF NOT EXISTS userfilters_user_idx
                           ON userfilters (user_id))"}});

    steps.push_back({"2.6-1", "Relational user accounts", web,
                     {R"(CREATE TABLE IF NOT EXISTS users (
                             username TEXT PRIMARY KEY,
                             longname TEXT,
                             email TEXT,
                             roles TEXT[],
                             enabled BOOLEAN NOT NULL DEFAULT true,
                             password TEXT
                         ))",
                      compat::format("GRANT ALL ON TABLE users TO {}",
                                     quote_identifier(targets.web_role))}});

    steps.push_back({"2.7-1", "Per-test enable flag and mesh summary view", meta,
                     {R"(ALTER TABLE schedule
                           ADD COLUMN IF NOT EXISTS schedule_enabled
                           BOOLEAN NOT NULL DEFAULT true)",
                      R"(CREATE OR REPLACE VIEW full_mesh_details AS
                           SELECT mesh.meshname, mesh_longname, mesh_description,
                                  mesh_is_src, mesh_is_dst, mesh_active,
                                  ampname AS site_ampname
                           FROM mesh JOIN member ON mesh.meshname = member.meshname)"}});

    steps.push_back({"2.13-1", "Public meshes and cascading endpoint removal", meta,
                     {R"(ALTER TABLE mesh
                           ADD COLUMN IF NOT EXISTS mesh_public
                           BOOLEAN NOT NULL DEFAULT false)",
                      R"(ALTER TABLE endpoint
                           DROP CONSTRAINT IF EXISTS endpoint_schedule_id_fkey)",
                      R"(ALTER TABLE endpoint
                           ADD CONSTRAINT endpoint_schedule_id_fkey
                           FOREIGN KEY (endpoint_schedule_id)
                           REFERENCES schedule (schedule_id) ON DELETE CASCADE)"}});

    return steps;
}

}  // namespace

auto migration_catalog::steps() -> const std::vector<migration_step>& {
    static const std::vector<migration_step> catalog = build_catalog(catalog_targets{});
    return catalog;
}

auto migration_catalog::steps(const catalog_targets& targets)
    -> std::vector<migration_step> {
    return build_catalog(targets);
}

auto migration_catalog::is_ordered(const std::vector<migration_step>& steps) -> bool {
    for (std::size_t i = 1; i < steps.size(); ++i) {
        if (core::compare_versions(steps[i - 1].threshold, steps[i].threshold) !=
            core::version_order::less) {
            return false;
        }
    }
    return true;
}

}  // namespace ampsetup::storage
