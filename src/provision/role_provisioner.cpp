/**
 * @file role_provisioner.cpp
 * @brief Implementation of idempotent role creation
 */

#include <ampsetup/provision/role_provisioner.hpp>

#include <ampsetup/compat/format.hpp>
#include <ampsetup/integration/logger_adapter.hpp>

namespace ampsetup::provision {

using integration::logger_adapter;

namespace {

auto is_duplicate_error(const std::string& message) -> bool {
    return message.find("already exists") != std::string::npos;
}

}  // namespace

role_provisioner::role_provisioner(storage::sql_connection& admin)
    : admin_(admin) {}

auto role_provisioner::role_exists(std::string_view name) -> Result<bool> {
    auto result = admin_.query("SELECT 1 FROM pg_roles WHERE rolname = $1",
                               {std::string(name)});
    if (result.is_err()) {
        return make_error<bool>(result.error().code, result.error().message,
                                "role_provisioner");
    }
    return !result.value().empty();
}

auto role_provisioner::ensure_role(std::string_view name) -> role_provision_result {
    role_provision_result outcome;
    outcome.name = std::string(name);

    auto exists = role_exists(name);
    if (exists.is_err()) {
        outcome.message = exists.error().message;
        logger_adapter::warn("Cannot check role {}: {}", outcome.name, outcome.message);
    } else if (exists.value()) {
        outcome.status = provision_status::exists;
        logger_adapter::log_role_provisioned(outcome.name, to_string(outcome.status));
        return outcome;
    }

    auto created = admin_.execute(compat::format(
        "CREATE ROLE {} LOGIN NOSUPERUSER NOCREATEDB NOCREATEROLE",
        storage::quote_identifier(name)));

    if (created.is_ok()) {
        outcome.status = provision_status::created;
        outcome.message.clear();
    } else if (is_duplicate_error(created.error().message)) {
        outcome.status = provision_status::exists;
        outcome.message.clear();
    } else {
        outcome.status = provision_status::failed;
        outcome.message = created.error().message;
        logger_adapter::warn("Cannot create role {}: {}", outcome.name, outcome.message);
    }

    logger_adapter::log_role_provisioned(outcome.name, to_string(outcome.status));
    return outcome;
}

}  // namespace ampsetup::provision
