/**
 * @file pg_connection.hpp
 * @brief libpq implementation of the administrative connection
 */

#pragma once

#include <ampsetup/storage/sql_connection.hpp>

#include <memory>
#include <string>
#include <string_view>

// Forward declaration of the libpq connection handle
struct pg_conn;
typedef struct pg_conn PGconn;

namespace ampsetup::storage {

/**
 * @brief Connection to one PostgreSQL database through libpq
 *
 * Notices raised by guarded DDL ("relation already exists, skipping") are
 * forwarded to the debug log instead of stderr.
 */
class pg_connection final : public sql_connection {
public:
    /**
     * @brief Open a connection
     * @param conninfo Base libpq connection string (may be empty)
     * @param database Database to attach to; empty keeps the database of
     *        the connection string
     * @return Open connection or connection_failed error
     */
    [[nodiscard]] static auto open(const std::string& conninfo,
                                   std::string_view database)
        -> Result<std::unique_ptr<pg_connection>>;

    ~pg_connection() override;

    [[nodiscard]] auto database() const -> const std::string& override;

    [[nodiscard]] auto execute(std::string_view sql) -> VoidResult override;

    [[nodiscard]] auto query(std::string_view sql,
                             const std::vector<std::string>& params = {})
        -> Result<database_result> override;

    [[nodiscard]] auto copy_in(std::string_view copy_statement,
                               std::string_view data) -> VoidResult override;

private:
    pg_connection(PGconn* conn, std::string database);

    [[nodiscard]] auto ensure_connected() -> VoidResult;
    [[nodiscard]] auto last_error() const -> std::string;

    PGconn* conn_{nullptr};
    std::string database_;
};

/**
 * @brief Opens pg_connection instances from one base connection string
 *
 * @example
 * @code
 * pg_connection_factory factory("host=/var/run/postgresql user=postgres");
 * auto conn = factory.connect("ampweb");
 * if (conn.is_ok()) {
 *     (void)conn.value()->execute("SELECT 1");
 * }
 * @endcode
 */
class pg_connection_factory final : public connection_factory {
public:
    explicit pg_connection_factory(std::string conninfo);

    [[nodiscard]] auto connect(std::string_view database)
        -> Result<std::unique_ptr<sql_connection>> override;

    [[nodiscard]] auto conninfo() const noexcept -> const std::string& {
        return conninfo_;
    }

private:
    std::string conninfo_;
};

}  // namespace ampsetup::storage
