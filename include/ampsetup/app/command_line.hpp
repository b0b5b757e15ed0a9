/**
 * @file command_line.hpp
 * @brief Command line of the ampsetup maintainer-script helper
 *
 * Usage:
 *   ampsetup [--config <file>] [--log-dir <dir>] [--verbose] [--no-file-log]
 *            <event> [<prior-version>]
 */

#pragma once

#include <ampsetup/core/result.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ampsetup::app {

/**
 * @brief Parsed command line options
 */
struct options {
    std::optional<std::filesystem::path> config_file;
    std::optional<std::filesystem::path> log_directory;
    bool verbose{false};
    bool file_log{true};
    bool help{false};

    std::string event;
    std::string prior_version;  ///< Empty on first install
};

/**
 * @brief Parse arguments, excluding the program name
 * @return invalid_argument for an unknown option, a missing option value,
 *         a missing event or too many positional arguments
 */
[[nodiscard]] auto parse_arguments(const std::vector<std::string>& args) -> Result<options>;

/**
 * @brief Whether the run needs configuration, logging and a cluster
 *
 * False for --help and for abort events, which finish with exit status 0
 * before any configuration is read. Unknown events return true so that
 * they are reported and audited like any other failed run.
 */
[[nodiscard]] auto needs_provisioning(const options& opts) -> bool;

/**
 * @brief Usage text for --help and argument errors
 */
[[nodiscard]] auto usage(const std::string& program_name) -> std::string;

}  // namespace ampsetup::app
