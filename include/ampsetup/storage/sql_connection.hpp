/**
 * @file sql_connection.hpp
 * @brief Abstract administrative database connection
 *
 * Provisioning talks to the cluster through this interface only. The
 * production implementation is pg_connection (libpq); unit tests use a
 * scripted in-memory connection.
 */

#pragma once

#include <ampsetup/core/result.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ampsetup::storage {

/// Result type alias for operations returning a value
template <typename T>
using Result = ampsetup::Result<T>;

/// Result type alias for void operations
using VoidResult = ampsetup::VoidResult;

/**
 * @brief Database row type alias
 *
 * Column name to text value. SQL NULL is reported as an empty string.
 */
using database_row = std::map<std::string, std::string>;

/**
 * @brief Query result structure
 */
struct database_result {
    /// Result rows from SELECT queries
    std::vector<database_row> rows;

    /// Number of rows affected by INSERT/UPDATE/DELETE
    std::size_t affected_rows{0};

    [[nodiscard]] auto empty() const noexcept -> bool { return rows.empty(); }

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return rows.size();
    }

    [[nodiscard]] auto operator[](std::size_t index) const
        -> const database_row& {
        return rows.at(index);
    }

    [[nodiscard]] auto begin() const { return rows.begin(); }
    [[nodiscard]] auto end() const { return rows.end(); }
};

/**
 * @brief One open connection to a single database
 *
 * Statements run in autocommit mode; there is no transaction spanning
 * calls. Thread Safety: not thread-safe.
 */
class sql_connection {
public:
    virtual ~sql_connection() = default;

    /**
     * @brief Name of the database this connection is attached to
     */
    [[nodiscard]] virtual auto database() const -> const std::string& = 0;

    /**
     * @brief Execute one or more statements without parameters
     *
     * Used for guarded DDL and for statements read from schema dumps.
     */
    [[nodiscard]] virtual auto execute(std::string_view sql) -> VoidResult = 0;

    /**
     * @brief Execute a statement with positional text parameters ($1, $2...)
     * @return Result set (possibly empty) and affected row count
     */
    [[nodiscard]] virtual auto query(std::string_view sql,
                                     const std::vector<std::string>& params = {})
        -> Result<database_result> = 0;

    /**
     * @brief Run a COPY ... FROM STDIN statement and stream its data
     * @param copy_statement The COPY statement
     * @param data Rows in COPY text format, one per line, without the
     *        terminating "\." line
     */
    [[nodiscard]] virtual auto copy_in(std::string_view copy_statement,
                                       std::string_view data) -> VoidResult = 0;

protected:
    sql_connection() = default;
    sql_connection(const sql_connection&) = delete;
    sql_connection& operator=(const sql_connection&) = delete;
};

/**
 * @brief Opens connections to named databases of one cluster
 */
class connection_factory {
public:
    virtual ~connection_factory() = default;

    /**
     * @brief Connect to a database of the cluster
     * @param database Database name; empty selects the administrative
     *        database of the configured connection
     */
    [[nodiscard]] virtual auto connect(std::string_view database)
        -> Result<std::unique_ptr<sql_connection>> = 0;

protected:
    connection_factory() = default;
    connection_factory(const connection_factory&) = delete;
    connection_factory& operator=(const connection_factory&) = delete;
};

/**
 * @brief Quote an SQL identifier ("name"), doubling embedded quotes
 */
[[nodiscard]] auto quote_identifier(std::string_view name) -> std::string;

}  // namespace ampsetup::storage
