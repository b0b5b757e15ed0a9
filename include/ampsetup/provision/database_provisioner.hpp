/**
 * @file database_provisioner.hpp
 * @brief Idempotent creation of databases from schema dumps
 */

#pragma once

#include "provision_status.hpp"

#include <ampsetup/storage/schema_source.hpp>
#include <ampsetup/storage/sql_connection.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace ampsetup::provision {

/**
 * @brief A database the application needs
 */
struct database_spec {
    std::string name;
    std::string owner;
    std::filesystem::path schema_dump;  ///< Empty: create the database empty
};

/**
 * @brief Result of ensure_database()
 */
struct database_provision_result {
    std::string name;
    provision_status status{provision_status::failed};
    std::size_t statements_applied{0};
    std::size_t statements_failed{0};
    std::string message;  ///< Error text when creation or loading failed
};

/**
 * @brief Ensures databases exist, loading the schema dump on creation only
 *
 * An existing database is never touched: its schema is brought forward by
 * the migration sequencer, not by re-loading a dump. Loading is not wrapped
 * in a transaction; a statement that fails is logged and loading continues,
 * so a broken dump can leave a partially initialised database.
 */
class database_provisioner {
public:
    /**
     * @param admin Connection to the cluster's administrative database
     * @param factory Used to connect to a database after creating it
     */
    database_provisioner(storage::sql_connection& admin,
                         storage::connection_factory& factory);

    /**
     * @brief Create the database from the dump named in spec if absent
     */
    [[nodiscard]] auto ensure_database(const database_spec& spec)
        -> database_provision_result;

    /**
     * @brief Create the database from the given source if absent
     * @param source Dump to load; nullptr creates an empty database. The
     *        source is only read when the database is created.
     */
    [[nodiscard]] auto ensure_database(const database_spec& spec,
                                       storage::schema_source* source)
        -> database_provision_result;

    /**
     * @brief Names of all databases in the cluster
     */
    [[nodiscard]] auto list_databases() -> Result<std::vector<std::string>>;

private:
    void load_schema(const database_spec& spec, storage::schema_source& source,
                     database_provision_result& outcome);

    storage::sql_connection& admin_;
    storage::connection_factory& factory_;
};

}  // namespace ampsetup::provision
