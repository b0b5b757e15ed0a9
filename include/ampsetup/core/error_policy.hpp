/**
 * @file error_policy.hpp
 * @brief Named error policies for provisioning operations
 */

#pragma once

#include <string_view>

namespace ampsetup::core {

/**
 * @brief How a multi-step operation reacts to a failed step
 *
 * Migrations use continue_on_error: a failed guarded statement is logged and
 * the run moves on. Control input (life-cycle events) uses fail_fast.
 */
enum class error_policy {
    continue_on_error,  ///< Log the failure and proceed with the next step
    fail_fast           ///< Stop at the first failure and report it
};

constexpr std::string_view to_string(error_policy policy) {
    switch (policy) {
        case error_policy::continue_on_error: return "continue_on_error";
        case error_policy::fail_fast: return "fail_fast";
    }
    return "unknown";
}

}  // namespace ampsetup::core
