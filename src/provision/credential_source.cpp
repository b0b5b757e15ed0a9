/**
 * @file credential_source.cpp
 * @brief Config-backed administrator credentials
 */

#include <ampsetup/provision/credential_source.hpp>

namespace ampsetup::provision {

config_credential_source::config_credential_source(const provisioning_config& config)
    : config_(config) {}

auto config_credential_source::admin() -> Result<admin_credentials> {
    if (!config_.admin_username || config_.admin_username->empty()) {
        return make_error<admin_credentials>(error_codes::missing_credentials,
                                             "No administrator username configured",
                                             "credential_source");
    }
    if (!config_.admin_password || config_.admin_password->empty()) {
        return make_error<admin_credentials>(
            error_codes::missing_credentials,
            "No password configured for administrator " + *config_.admin_username,
            "credential_source");
    }
    return admin_credentials{*config_.admin_username, *config_.admin_password};
}

}  // namespace ampsetup::provision
