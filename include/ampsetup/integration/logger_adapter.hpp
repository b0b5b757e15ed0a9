/**
 * @file logger_adapter.hpp
 * @brief Logging and provisioning audit trail using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with ampsetup. It supports standard logging and an append-only audit trail
 * of every change the provisioning engine makes to the database cluster
 * (roles, databases, migration steps and user records).
 */

#pragma once

#include <ampsetup/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace ampsetup::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @enum user_change
 * @brief Kinds of user record changes recorded in the audit trail
 */
enum class user_change {
    imported,       ///< Created or refreshed from the legacy credential file
    elevated,       ///< Granted the administrator capability set
    admin_created   ///< Initial administrator created on a fresh install
};

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"/var/log/ampsetup"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable the JSON audit trail of provisioning changes
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{10};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Static logging facade used throughout ampsetup
 *
 * Until initialize() is called every logging call is a no-op, so library
 * code and unit tests can log without setting anything up.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/ampsetup";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Provisioning {} databases", 2);
 * logger_adapter::log_role_provisioned("cuz", "created");
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Sets up console and rotating file writers and the audit trail path.
     * Calling it again without shutdown() has no effect.
     *
     * @param config Configuration options
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the writers
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void debug(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     * @param level Log severity level
     * @param message The message to log
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     * @param level The level to check
     * @return true if messages at this level will be logged
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) -> bool;

    // ─────────────────────────────────────────────────────
    // Provisioning Audit Trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record the outcome of ensuring a database role
     * @param role Role name
     * @param outcome "exists", "created" or "failed"
     */
    static void log_role_provisioned(const std::string& role,
                                     std::string_view outcome);

    /**
     * @brief Record the outcome of ensuring a database
     * @param database Database name
     * @param owner Owning role
     * @param outcome "exists", "created" or "failed"
     * @param statements_applied Dump statements that succeeded
     * @param statements_failed Dump statements that failed
     */
    static void log_database_provisioned(const std::string& database,
                                         const std::string& owner,
                                         std::string_view outcome,
                                         std::size_t statements_applied,
                                         std::size_t statements_failed);

    /**
     * @brief Record a migration step that was attempted
     * @param threshold Version threshold of the step
     * @param description Human-readable description of the step
     * @param succeeded Whether every guarded statement succeeded
     */
    static void log_migration_step(const std::string& threshold,
                                   const std::string& description,
                                   bool succeeded);

    /**
     * @brief Record a change to a user record
     */
    static void log_user_change(user_change change, const std::string& username);

    /**
     * @brief Record the terminal state of a life-cycle transition
     */
    static void log_lifecycle_transition(const std::string& event,
                                         const std::string& prior_version,
                                         std::string_view terminal_state);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    /**
     * @brief Parse a level name ("debug", "info", ...) case-insensitively
     * @return The level, or log_level::info for unknown names
     */
    [[nodiscard]] static auto parse_log_level(std::string_view name) -> log_level;

private:
    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace ampsetup::integration
