/**
 * @file logger_adapter.cpp
 * @brief Implementation of the logging and provisioning audit adapter
 */

#include <ampsetup/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <nlohmann/json.hpp>

#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <system_error>

using json = nlohmann::json;

namespace ampsetup::integration {

namespace {

// Maintainer scripts are short lived; every message is written before exit
constexpr bool async_logging = false;
constexpr std::size_t logger_buffer_size = 8192;

auto to_kcenon(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::trace: return kcenon::logger::log_level::trace;
        case log_level::debug: return kcenon::logger::log_level::debug;
        case log_level::info: return kcenon::logger::log_level::info;
        case log_level::warn: return kcenon::logger::log_level::warn;
        case log_level::error: return kcenon::logger::log_level::error;
        case log_level::fatal: return kcenon::logger::log_level::fatal;
        case log_level::off: break;
    }
    return kcenon::logger::log_level::off;
}

auto local_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << millis << std::put_time(&local, "%z");
    return oss.str();
}

}  // namespace

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);
        if (logger_) {
            return;
        }

        bool file_output = config.enable_file;
        bool audit_output = config.enable_audit_log;
        if (file_output || audit_output) {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
            if (ec) {
                // Fall back to console only
                file_output = false;
                audit_output = false;
            }
        }

        auto logger = std::make_unique<kcenon::logger::logger>(async_logging,
                                                               logger_buffer_size);
        logger->set_min_level(to_kcenon(config.min_level));
        if (config.enable_console) {
            logger->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (file_output) {
            logger->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                (config.log_directory / "ampsetup.log").string(),
                config.max_file_size_mb * 1024 * 1024, config.max_files));
        }
        logger->start();

        min_level_ = config.min_level;
        audit_path_ = audit_output ? config.log_directory / "audit.json"
                                   : std::filesystem::path{};
        logger_ = std::move(logger);
    }

    void shutdown() {
        std::lock_guard lock(mutex_);
        if (!logger_) {
            return;
        }
        logger_->flush();
        logger_->stop();
        logger_.reset();
        audit_path_.clear();
    }

    [[nodiscard]] auto is_initialized() const -> bool {
        std::lock_guard lock(mutex_);
        return logger_ != nullptr;
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const -> bool {
        std::lock_guard lock(mutex_);
        return logger_ && level != log_level::off &&
               static_cast<int>(level) >= static_cast<int>(min_level_);
    }

    void log(log_level level, const std::string& message) {
        std::lock_guard lock(mutex_);
        if (logger_ && static_cast<int>(level) >= static_cast<int>(min_level_)) {
            logger_->log(to_kcenon(level), message);
        }
    }

    /// Appends one JSON object per line; a no-op while the trail is disabled
    void append_audit(json entry) {
        std::lock_guard lock(mutex_);
        if (!logger_ || audit_path_.empty()) {
            return;
        }

        std::ofstream file(audit_path_, std::ios::app);
        if (!file) {
            logger_->log(kcenon::logger::log_level::warn,
                         "Cannot append to audit trail " + audit_path_.string());
            return;
        }

        entry["timestamp"] = local_timestamp();
        file << entry.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    }

private:
    mutable std::mutex mutex_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    log_level min_level_{log_level::info};
    std::filesystem::path audit_path_;
};

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Lifetime and plain logging
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() -> bool { return pimpl_->is_initialized(); }

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) -> bool {
    return pimpl_->is_level_enabled(level);
}

auto logger_adapter::parse_log_level(std::string_view name) -> log_level {
    std::string lowered;
    lowered.reserve(name.size());
    for (char c : name) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lowered == "trace") return log_level::trace;
    if (lowered == "debug") return log_level::debug;
    if (lowered == "info") return log_level::info;
    if (lowered == "warn" || lowered == "warning") return log_level::warn;
    if (lowered == "error") return log_level::error;
    if (lowered == "fatal") return log_level::fatal;
    if (lowered == "off") return log_level::off;
    return log_level::info;
}

// =============================================================================
// Provisioning Audit Trail
// =============================================================================

void logger_adapter::log_role_provisioned(const std::string& role,
                                          std::string_view outcome) {
    if (outcome == "failed") {
        warn("Role {} could not be provisioned", role);
    } else {
        info("Role {}: {}", role, outcome);
    }

    pimpl_->append_audit({{"event_type", "ROLE"}, {"outcome", std::string(outcome)}, {"role", role}});
}

void logger_adapter::log_database_provisioned(const std::string& database,
                                              const std::string& owner,
                                              std::string_view outcome,
                                              std::size_t statements_applied,
                                              std::size_t statements_failed) {
    if (outcome == "failed") {
        warn("Database {} could not be provisioned", database);
    } else if (statements_failed > 0) {
        warn("Database {} {} with {} of {} schema statements failing",
             database, outcome, statements_failed,
             statements_applied + statements_failed);
    } else {
        info("Database {} (owner {}): {}", database, owner, outcome);
    }

    pimpl_->append_audit({{"event_type", "DATABASE"},
                          {"outcome", std::string(outcome)},
                          {"database", database},
                          {"owner", owner},
                          {"statements_applied", statements_applied},
                          {"statements_failed", statements_failed}});
}

void logger_adapter::log_migration_step(const std::string& threshold,
                                        const std::string& description,
                                        bool succeeded) {
    if (succeeded) {
        info("Migration {} applied: {}", threshold, description);
    } else {
        warn("Migration {} incomplete: {}", threshold, description);
    }

    pimpl_->append_audit({{"event_type", "MIGRATION"},
                          {"outcome", succeeded ? "success" : "failure"},
                          {"threshold", threshold},
                          {"description", description}});
}

void logger_adapter::log_user_change(user_change change, const std::string& username) {
    std::string_view kind = "unknown";
    switch (change) {
        case user_change::imported: kind = "imported"; break;
        case user_change::elevated: kind = "elevated"; break;
        case user_change::admin_created: kind = "admin_created"; break;
    }

    info("User {}: {}", username, kind);
    pimpl_->append_audit({{"event_type", "USER"}, {"outcome", std::string(kind)}, {"username", username}});
}

void logger_adapter::log_lifecycle_transition(const std::string& event,
                                              const std::string& prior_version,
                                              std::string_view terminal_state) {
    if (terminal_state == "failed") {
        error("Life-cycle event '{}' failed", event);
    } else {
        info("Life-cycle event '{}' finished: {}", event, terminal_state);
    }

    json entry{{"event_type", "LIFECYCLE"}, {"outcome", std::string(terminal_state)}, {"event", event}};
    if (!prior_version.empty()) {
        entry["prior_version"] = prior_version;
    }
    pimpl_->append_audit(std::move(entry));
}

}  // namespace ampsetup::integration
