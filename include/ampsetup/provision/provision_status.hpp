/**
 * @file provision_status.hpp
 * @brief Outcome values returned by the provisioners
 */

#pragma once

#include <string_view>

namespace ampsetup::provision {

/**
 * @brief State of a target after a provisioning call
 */
enum class provision_status {
    exists,   ///< Already present; nothing was changed
    created,  ///< Created by this call
    failed    ///< Could not be checked or created; provisioning continued
};

constexpr std::string_view to_string(provision_status status) {
    switch (status) {
        case provision_status::exists: return "exists";
        case provision_status::created: return "created";
        case provision_status::failed: return "failed";
    }
    return "unknown";
}

}  // namespace ampsetup::provision
