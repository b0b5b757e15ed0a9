/**
 * @file pg_connection.cpp
 * @brief Implementation of the libpq connection
 */

#include <ampsetup/storage/pg_connection.hpp>

#include <ampsetup/compat/format.hpp>
#include <ampsetup/integration/logger_adapter.hpp>

#include <libpq-fe.h>

#include <cstdlib>

namespace ampsetup::storage {

using integration::logger_adapter;

namespace {

/**
 * @brief RAII wrapper for PGresult
 */
struct pg_result_deleter {
    void operator()(PGresult* result) const {
        if (result) PQclear(result);
    }
};
using pg_result_ptr = std::unique_ptr<PGresult, pg_result_deleter>;

void forward_notice(void* /*arg*/, const char* message) {
    std::string text = message ? message : "";
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    logger_adapter::debug("postgres: {}", text);
}

auto trim_message(std::string message) -> std::string {
    while (!message.empty() &&
           (message.back() == '\n' || message.back() == '\r' || message.back() == ' ')) {
        message.pop_back();
    }
    return message;
}

auto convert_result(PGresult* result) -> database_result {
    database_result converted;

    int num_rows = PQntuples(result);
    int num_cols = PQnfields(result);

    std::vector<std::string> column_names;
    column_names.reserve(static_cast<std::size_t>(num_cols));
    for (int i = 0; i < num_cols; ++i) {
        column_names.emplace_back(PQfname(result, i));
    }

    for (int row = 0; row < num_rows; ++row) {
        database_row row_data;
        for (int col = 0; col < num_cols; ++col) {
            if (!PQgetisnull(result, row, col)) {
                row_data[column_names[col]] = PQgetvalue(result, row, col);
            } else {
                row_data[column_names[col]] = "";
            }
        }
        converted.rows.push_back(std::move(row_data));
    }

    const char* affected = PQcmdTuples(result);
    if (affected && *affected) {
        converted.affected_rows = std::strtoull(affected, nullptr, 10);
    }

    return converted;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

pg_connection::pg_connection(PGconn* conn, std::string database)
    : conn_(conn), database_(std::move(database)) {
    PQsetNoticeProcessor(conn_, forward_notice, nullptr);
}

pg_connection::~pg_connection() {
    if (conn_ != nullptr) {
        PQfinish(conn_);
    }
}

auto pg_connection::open(const std::string& conninfo, std::string_view database)
    -> Result<std::unique_ptr<pg_connection>> {
    // The first "dbname" is expanded as a full connection string; the second
    // plain dbname overrides the database it names.
    std::string database_name(database);
    const char* keywords[] = {"dbname", "dbname", nullptr};
    const char* values[] = {conninfo.c_str(),
                            database_name.empty() ? nullptr : database_name.c_str(),
                            nullptr};
    if (database_name.empty()) {
        keywords[1] = nullptr;
    }

    PGconn* conn = PQconnectdbParams(keywords, values, 1);
    if (conn == nullptr) {
        return make_error<std::unique_ptr<pg_connection>>(
            error_codes::connection_failed,
            "Out of memory allocating PostgreSQL connection", "storage");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        auto message = trim_message(PQerrorMessage(conn));
        PQfinish(conn);
        return make_error<std::unique_ptr<pg_connection>>(
            error_codes::connection_failed,
            compat::format("Cannot connect to database '{}': {}",
                           database_name.empty() ? "(default)" : database_name,
                           message),
            "storage");
    }

    std::string attached = PQdb(conn) ? PQdb(conn) : database_name;
    logger_adapter::debug("Connected to database {}", attached);

    return std::unique_ptr<pg_connection>(new pg_connection(conn, std::move(attached)));
}

// ============================================================================
// Statement Execution
// ============================================================================

auto pg_connection::database() const -> const std::string& {
    return database_;
}

auto pg_connection::execute(std::string_view sql) -> VoidResult {
    auto connected = ensure_connected();
    if (connected.is_err()) {
        return connected;
    }

    std::string statement(sql);
    pg_result_ptr result(PQexec(conn_, statement.c_str()));
    if (!result) {
        return make_error<std::monostate>(
            error_codes::statement_failed,
            compat::format("Statement execution failed: {}", last_error()),
            "storage");
    }

    auto status = PQresultStatus(result.get());
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK &&
        status != PGRES_EMPTY_QUERY) {
        return make_error<std::monostate>(
            error_codes::statement_failed,
            trim_message(PQresultErrorMessage(result.get())), "storage");
    }

    return ok();
}

auto pg_connection::query(std::string_view sql,
                          const std::vector<std::string>& params)
    -> Result<database_result> {
    auto connected = ensure_connected();
    if (connected.is_err()) {
        return make_error<database_result>(connected.error().code,
                                           connected.error().message, "storage");
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param.c_str());
    }

    std::string statement(sql);
    pg_result_ptr result(PQexecParams(conn_, statement.c_str(),
                                      static_cast<int>(values.size()), nullptr,
                                      values.empty() ? nullptr : values.data(),
                                      nullptr, nullptr, 0));
    if (!result) {
        return make_error<database_result>(
            error_codes::statement_failed,
            compat::format("Query execution failed: {}", last_error()),
            "storage");
    }

    auto status = PQresultStatus(result.get());
    if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
        return make_error<database_result>(
            error_codes::statement_failed,
            trim_message(PQresultErrorMessage(result.get())), "storage");
    }

    return convert_result(result.get());
}

auto pg_connection::copy_in(std::string_view copy_statement, std::string_view data)
    -> VoidResult {
    auto connected = ensure_connected();
    if (connected.is_err()) {
        return connected;
    }

    std::string statement(copy_statement);
    pg_result_ptr start(PQexec(conn_, statement.c_str()));
    if (!start || PQresultStatus(start.get()) != PGRES_COPY_IN) {
        auto message = start ? trim_message(PQresultErrorMessage(start.get()))
                             : last_error();
        return make_error<std::monostate>(error_codes::copy_failed, message,
                                          "storage");
    }

    if (!data.empty() &&
        PQputCopyData(conn_, data.data(), static_cast<int>(data.size())) != 1) {
        auto message = last_error();
        (void)PQputCopyEnd(conn_, "copy data rejected");
        pg_result_ptr drain(PQgetResult(conn_));
        while (drain) {
            drain.reset(PQgetResult(conn_));
        }
        return make_error<std::monostate>(error_codes::copy_failed, message,
                                          "storage");
    }

    if (PQputCopyEnd(conn_, nullptr) != 1) {
        return make_error<std::monostate>(error_codes::copy_failed, last_error(),
                                          "storage");
    }

    VoidResult outcome = ok();
    for (pg_result_ptr result(PQgetResult(conn_)); result;
         result.reset(PQgetResult(conn_))) {
        if (PQresultStatus(result.get()) != PGRES_COMMAND_OK && outcome.is_ok()) {
            outcome = make_error<std::monostate>(
                error_codes::copy_failed,
                trim_message(PQresultErrorMessage(result.get())), "storage");
        }
    }

    return outcome;
}

// ============================================================================
// Internal Implementation
// ============================================================================

auto pg_connection::ensure_connected() -> VoidResult {
    if (PQstatus(conn_) == CONNECTION_OK) {
        return ok();
    }

    logger_adapter::warn("Connection to {} lost, resetting", database_);
    PQreset(conn_);

    if (PQstatus(conn_) != CONNECTION_OK) {
        return make_error<std::monostate>(
            error_codes::connection_lost,
            compat::format("Connection to {} lost: {}", database_, last_error()),
            "storage");
    }
    return ok();
}

auto pg_connection::last_error() const -> std::string {
    return trim_message(PQerrorMessage(conn_));
}

// ============================================================================
// Factory
// ============================================================================

pg_connection_factory::pg_connection_factory(std::string conninfo)
    : conninfo_(std::move(conninfo)) {}

auto pg_connection_factory::connect(std::string_view database)
    -> Result<std::unique_ptr<sql_connection>> {
    auto opened = pg_connection::open(conninfo_, database);
    if (opened.is_err()) {
        return make_error<std::unique_ptr<sql_connection>>(
            opened.error().code, opened.error().message, "storage");
    }
    return std::unique_ptr<sql_connection>(std::move(opened.value()));
}

}  // namespace ampsetup::storage
