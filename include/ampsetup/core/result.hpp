/**
 * @file result.hpp
 * @brief Result<T> type aliases and error codes for ampsetup
 *
 * Integrates with common_system's Result pattern. Every fallible operation
 * in ampsetup returns Result<T> or VoidResult; exceptions do not cross
 * module boundaries.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/error/error_codes.h>
#include <kcenon/common/patterns/result.h>

#include <string>
#include <variant>

namespace ampsetup {

/**
 * @brief Result type alias for ampsetup operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief ampsetup-specific error codes
 *
 * Error code range: -900 to -949
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int ampsetup_base = -900;

    // Connection errors (-900 to -909)
    constexpr int connection_failed = ampsetup_base - 0;
    constexpr int connection_lost = ampsetup_base - 1;

    // Statement errors (-910 to -919)
    constexpr int statement_failed = ampsetup_base - 10;
    constexpr int copy_failed = ampsetup_base - 11;

    // Provisioning errors (-920 to -929)
    constexpr int schema_read_failed = ampsetup_base - 22;

    // Credential errors (-930 to -939)
    constexpr int file_not_found = ampsetup_base - 30;
    constexpr int file_read_error = ampsetup_base - 31;
    constexpr int user_not_found = ampsetup_base - 32;
    constexpr int user_store_error = ampsetup_base - 33;
    constexpr int hashing_failed = ampsetup_base - 34;
    constexpr int missing_credentials = ampsetup_base - 35;

    // Control errors (-940 to -949)
    constexpr int unknown_lifecycle_event = ampsetup_base - 40;
    constexpr int invalid_configuration = ampsetup_base - 41;
    constexpr int invalid_argument = ampsetup_base - 42;
} // namespace error_codes

using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create an ampsetup void error result
 */
inline VoidResult ampsetup_void_error(int code, const std::string& message,
                                      const std::string& module = "ampsetup") {
    return VoidResult(error_info{code, message, module});
}

} // namespace ampsetup
