/**
 * @file command_line.cpp
 * @brief Command line parsing for ampsetup
 */

#include <ampsetup/app/command_line.hpp>

#include <ampsetup/compat/format.hpp>
#include <ampsetup/provision/provisioning_orchestrator.hpp>

namespace ampsetup::app {

namespace {

auto argument_error(const std::string& message) -> Result<options> {
    return make_error<options>(error_codes::invalid_argument, message, "command_line");
}

}  // namespace

auto parse_arguments(const std::vector<std::string>& args) -> Result<options> {
    options opts;
    std::vector<std::string> positional;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
            return opts;
        }
        if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--no-file-log") {
            opts.file_log = false;
        } else if (arg == "--config" || arg == "--log-dir") {
            if (i + 1 >= args.size()) {
                return argument_error(compat::format("Option '{}' needs a value", arg));
            }
            if (arg == "--config") {
                opts.config_file = args[++i];
            } else {
                opts.log_directory = args[++i];
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            return argument_error(compat::format("Unknown option '{}'", arg));
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        return argument_error("Missing life-cycle event");
    }
    if (positional.size() > 2) {
        return argument_error(
            compat::format("Unexpected argument '{}'", positional[2]));
    }

    opts.event = positional[0];
    if (positional.size() == 2) {
        opts.prior_version = positional[1];
    }
    return opts;
}

auto needs_provisioning(const options& opts) -> bool {
    if (opts.help) {
        return false;
    }
    auto event = provision::parse_lifecycle_event(opts.event);
    return event.is_err() || !provision::is_abort(event.value());
}

auto usage(const std::string& program_name) -> std::string {
    return compat::format(R"(
Usage: {0} [options] <event> [<prior-version>]

Provisions the AMP web database cluster from a package maintainer script.

Events:
  configure, reconfigure     Fresh install when <prior-version> is empty,
                             otherwise upgrade from <prior-version>
  abort-upgrade, abort-remove, abort-deconfigure
                             Do nothing

Options:
  --config <file>     JSON configuration file
  --log-dir <dir>     Directory for ampsetup.log and audit.json
  --verbose, -v       Log debug messages
  --no-file-log       Log to the console only
  --help, -h          Show this help message

Environment:
  AMPSETUP_CONNECTION, AMPSETUP_ADMIN_USERNAME, AMPSETUP_ADMIN_PASSWORD,
  AMPSETUP_LEGACY_USERS_FILE, AMPSETUP_LOG_DIR, AMPSETUP_LOG_LEVEL

Examples:
  {0} configure
  {0} configure 2.5-1
  {0} abort-upgrade 2.13-1

Exit Codes:
  0  Install, upgrade or abort completed
  1  Provisioning failed or invalid arguments
)", program_name);
}

}  // namespace ampsetup::app
