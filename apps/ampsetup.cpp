/**
 * @file ampsetup.cpp
 * @brief Maintainer-script entry point for AMP web database provisioning
 *
 * Called from the package's postinst as
 *
 *   ampsetup configure "$2"
 *
 * so that a first install creates roles, databases and the administrator,
 * and an upgrade applies the migrations for every release since "$2".
 */

#include <ampsetup/app/command_line.hpp>
#include <ampsetup/integration/logger_adapter.hpp>
#include <ampsetup/provision/credential_source.hpp>
#include <ampsetup/provision/provisioning_config.hpp>
#include <ampsetup/provision/provisioning_orchestrator.hpp>
#include <ampsetup/storage/pg_connection.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace ampsetup;

int main(int argc, char* argv[]) {
    const std::string program_name = argc > 0 ? argv[0] : "ampsetup";
    std::vector<std::string> args(argv + 1, argv + argc);

    auto parsed = app::parse_arguments(args);
    if (parsed.is_err()) {
        std::cerr << "Error: " << parsed.error().message << "\n";
        std::cerr << app::usage(program_name);
        return 1;
    }

    const auto& opts = parsed.value();
    if (opts.help) {
        std::cout << app::usage(program_name);
        return 0;
    }
    if (!app::needs_provisioning(opts)) {
        return 0;
    }

    provision::provisioning_config config;
    if (opts.config_file) {
        auto loaded = config.load_from_file(*opts.config_file);
        if (loaded.is_err()) {
            std::cerr << "Error: " << loaded.error().message << "\n";
            return 1;
        }
    }

    auto env = config.load_from_environment();
    if (env.is_err()) {
        std::cerr << "Error: " << env.error().message << "\n";
        return 1;
    }

    if (opts.log_directory) {
        config.log_directory = *opts.log_directory;
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        std::cerr << "Error: " << valid.error().message << "\n";
        return 1;
    }

    integration::logger_config log_config;
    log_config.log_directory = config.log_directory;
    log_config.min_level = opts.verbose
                               ? integration::log_level::debug
                               : integration::logger_adapter::parse_log_level(config.log_level);
    log_config.enable_file = opts.file_log;
    log_config.enable_audit_log = opts.file_log;
    integration::logger_adapter::initialize(log_config);

    storage::pg_connection_factory factory(config.connection);
    provision::config_credential_source credentials(config);
    provision::provisioning_orchestrator orchestrator(config, factory, credentials);

    auto outcome = orchestrator.run(opts.event, opts.prior_version);
    if (outcome.state == provision::terminal_state::failed) {
        integration::logger_adapter::error("{} failed: {}", opts.event, outcome.message);
        std::cerr << program_name << ": " << outcome.message << "\n";
    } else {
        integration::logger_adapter::info("{} finished: {}", opts.event,
                                          provision::to_string(outcome.state));
    }

    integration::logger_adapter::shutdown();
    return provision::exit_code(outcome.state);
}
