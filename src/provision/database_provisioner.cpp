/**
 * @file database_provisioner.cpp
 * @brief Implementation of idempotent database creation
 */

#include <ampsetup/provision/database_provisioner.hpp>

#include <ampsetup/compat/format.hpp>
#include <ampsetup/integration/logger_adapter.hpp>
#include <ampsetup/storage/sql_script.hpp>

#include <algorithm>

namespace ampsetup::provision {

using integration::logger_adapter;

database_provisioner::database_provisioner(storage::sql_connection& admin,
                                           storage::connection_factory& factory)
    : admin_(admin), factory_(factory) {}

auto database_provisioner::list_databases() -> Result<std::vector<std::string>> {
    auto result = admin_.query(
        "SELECT datname FROM pg_database WHERE NOT datistemplate ORDER BY datname");
    if (result.is_err()) {
        return make_error<std::vector<std::string>>(
            result.error().code, result.error().message, "database_provisioner");
    }

    std::vector<std::string> names;
    for (const auto& row : result.value()) {
        names.push_back(row.at("datname"));
    }
    return names;
}

auto database_provisioner::ensure_database(const database_spec& spec)
    -> database_provision_result {
    auto source = storage::make_schema_source(spec.schema_dump);
    return ensure_database(spec, source.get());
}

auto database_provisioner::ensure_database(const database_spec& spec,
                                           storage::schema_source* source)
    -> database_provision_result {
    database_provision_result outcome;
    outcome.name = spec.name;

    auto finish = [&]() {
        logger_adapter::log_database_provisioned(
            spec.name, spec.owner, to_string(outcome.status),
            outcome.statements_applied, outcome.statements_failed);
        return outcome;
    };

    auto existing = list_databases();
    if (existing.is_err()) {
        outcome.message = existing.error().message;
        return finish();
    }

    if (std::ranges::find(existing.value(), spec.name) != existing.value().end()) {
        outcome.status = provision_status::exists;
        return finish();
    }

    auto created = admin_.execute(compat::format(
        "CREATE DATABASE {} OWNER {}", storage::quote_identifier(spec.name),
        storage::quote_identifier(spec.owner)));
    if (created.is_err()) {
        if (created.error().message.find("already exists") != std::string::npos) {
            outcome.status = provision_status::exists;
        } else {
            outcome.message = created.error().message;
        }
        return finish();
    }

    outcome.status = provision_status::created;

    if (source != nullptr) {
        load_schema(spec, *source, outcome);
    } else {
        logger_adapter::info("Database {} created without a schema dump", spec.name);
    }

    return finish();
}

void database_provisioner::load_schema(const database_spec& spec,
                                       storage::schema_source& source,
                                       database_provision_result& outcome) {
    auto sql = source.read();
    if (sql.is_err()) {
        outcome.message = sql.error().message;
        logger_adapter::error("Database {} created but schema not loaded: {}",
                              spec.name, outcome.message);
        return;
    }

    auto conn = factory_.connect(spec.name);
    if (conn.is_err()) {
        outcome.message = conn.error().message;
        logger_adapter::error("Database {} created but schema not loaded: {}",
                              spec.name, outcome.message);
        return;
    }

    auto statements = storage::split_sql_script(sql.value());
    logger_adapter::info("Loading {} statements from {} into {}",
                         statements.size(), source.name(), spec.name);

    auto& target = *conn.value();
    for (const auto& statement : statements) {
        auto executed = statement.is_copy
                            ? target.copy_in(statement.text, statement.copy_data)
                            : target.execute(statement.text);
        if (executed.is_ok()) {
            ++outcome.statements_applied;
            continue;
        }

        ++outcome.statements_failed;
        logger_adapter::warn("{}:{}: {}", source.name(), statement.line,
                             executed.error().message);
        if (outcome.message.empty()) {
            outcome.message = executed.error().message;
        }
    }
}

}  // namespace ampsetup::provision
