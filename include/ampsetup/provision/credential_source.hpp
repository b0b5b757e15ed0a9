/**
 * @file credential_source.hpp
 * @brief Where the initial administrator credentials come from
 */

#pragma once

#include "provisioning_config.hpp"

#include <ampsetup/core/result.hpp>

#include <string>

namespace ampsetup::provision {

/**
 * @brief Username and plaintext password for the first administrator
 */
struct admin_credentials {
    std::string username;
    std::string password;
};

/**
 * @brief Abstract source of administrator credentials
 */
class credential_source {
public:
    virtual ~credential_source() = default;

    /**
     * @return missing_credentials when no complete pair is available
     */
    [[nodiscard]] virtual auto admin() -> Result<admin_credentials> = 0;
};

/**
 * @brief Reads the administrator from provisioning_config
 *
 * The config has already absorbed AMPSETUP_ADMIN_USERNAME and
 * AMPSETUP_ADMIN_PASSWORD when loaded from the environment.
 */
class config_credential_source final : public credential_source {
public:
    explicit config_credential_source(const provisioning_config& config);

    [[nodiscard]] auto admin() -> Result<admin_credentials> override;

private:
    const provisioning_config& config_;
};

}  // namespace ampsetup::provision
