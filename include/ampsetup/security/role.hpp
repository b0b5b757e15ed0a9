/**
 * @file role.hpp
 * @brief Capability tags stored in the web application's users table
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ampsetup::security {

/**
 * @brief Capabilities a web application user can hold
 */
enum class Capability {
    ViewData,    ///< View measurement graphs and matrices
    ViewConfig,  ///< View the mesh and schedule configuration
    EditConfig,  ///< Change the mesh and schedule configuration
    EditUsers    ///< Manage user accounts
};

/**
 * @brief Convert Capability to the tag stored in the database
 */
constexpr std::string_view to_string(Capability capability) {
    switch (capability) {
        case Capability::ViewData: return "viewdata";
        case Capability::ViewConfig: return "viewconfig";
        case Capability::EditConfig: return "editconfig";
        case Capability::EditUsers: return "editusers";
    }
    return "unknown";
}

/**
 * @brief Parse a stored capability tag
 */
inline std::optional<Capability> parse_capability(std::string_view tag) {
    if (tag == "viewdata") return Capability::ViewData;
    if (tag == "viewconfig") return Capability::ViewConfig;
    if (tag == "editconfig") return Capability::EditConfig;
    if (tag == "editusers") return Capability::EditUsers;
    return std::nullopt;
}

/**
 * @brief Capabilities granted to ordinary users imported from legacy files
 */
inline std::vector<Capability> baseline_capabilities() {
    return {Capability::ViewData};
}

/**
 * @brief Capabilities granted to administrators
 *
 * Always a superset of baseline_capabilities().
 */
inline std::vector<Capability> administrator_capabilities() {
    return {Capability::ViewData, Capability::ViewConfig, Capability::EditConfig,
            Capability::EditUsers};
}

} // namespace ampsetup::security
