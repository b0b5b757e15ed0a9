/**
 * @file provisioning_config.cpp
 * @brief Loading of provisioning settings from JSON and the environment
 */

#include <ampsetup/provision/provisioning_config.hpp>

#include <ampsetup/compat/format.hpp>
#include <ampsetup/core/version_compare.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace ampsetup::provision {

namespace {

auto config_error(const std::string& message) -> VoidResult {
    return ampsetup_void_error(error_codes::invalid_configuration, message,
                               "provisioning_config");
}

auto get_env(const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

}  // namespace

auto parse_error_policy(const std::string& name) -> std::optional<core::error_policy> {
    if (name == "continue_on_error") return core::error_policy::continue_on_error;
    if (name == "fail_fast") return core::error_policy::fail_fast;
    return std::nullopt;
}

auto provisioning_config::load_from_file(const std::filesystem::path& path) -> VoidResult {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return ampsetup_void_error(
            error_codes::file_not_found,
            compat::format("Configuration file does not exist: {}", path.string()),
            "provisioning_config");
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return ampsetup_void_error(
            error_codes::file_read_error,
            compat::format("Failed to open configuration file: {}", path.string()),
            "provisioning_config");
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

auto provisioning_config::load_from_string(const std::string& text) -> VoidResult {
    try {
        auto config_json = json::parse(text);
        if (!config_json.is_object()) {
            return config_error("Configuration root must be an object");
        }

        if (config_json.contains("connection")) {
            connection = config_json["connection"].get<std::string>();
        }

        if (config_json.contains("roles")) {
            roles = config_json["roles"].get<std::vector<std::string>>();
        }

        if (config_json.contains("databases")) {
            std::vector<database_spec> parsed;
            for (const auto& item : config_json["databases"]) {
                database_spec spec;
                spec.name = item.at("name").get<std::string>();
                spec.owner = item.at("owner").get<std::string>();
                if (item.contains("schema_dump")) {
                    spec.schema_dump = item["schema_dump"].get<std::string>();
                }
                parsed.push_back(std::move(spec));
            }
            databases = std::move(parsed);
        }

        if (config_json.contains("user_database")) {
            user_database = config_json["user_database"].get<std::string>();
        }

        if (config_json.contains("meta_database")) {
            meta_database = config_json["meta_database"].get<std::string>();
        }

        if (config_json.contains("application_role")) {
            application_role = config_json["application_role"].get<std::string>();
        }

        if (config_json.contains("admin")) {
            auto& admin = config_json["admin"];
            if (admin.contains("username")) {
                admin_username = admin["username"].get<std::string>();
            }
            if (admin.contains("password")) {
                admin_password = admin["password"].get<std::string>();
            }
        }

        if (config_json.contains("legacy")) {
            auto& legacy = config_json["legacy"];
            if (legacy.contains("users_file")) {
                legacy_users_file = legacy["users_file"].get<std::string>();
            }
            if (legacy.contains("import_before")) {
                legacy_import_threshold = legacy["import_before"].get<std::string>();
            }
        }

        if (config_json.contains("migration_policy")) {
            auto name = config_json["migration_policy"].get<std::string>();
            auto policy = parse_error_policy(name);
            if (!policy) {
                return config_error(compat::format("Unknown migration_policy: {}", name));
            }
            migration_policy = *policy;
        }

        if (config_json.contains("hash_rounds")) {
            hash_rounds = config_json["hash_rounds"].get<std::uint32_t>();
        }

        if (config_json.contains("logging")) {
            auto& logging = config_json["logging"];
            if (logging.contains("directory")) {
                log_directory = logging["directory"].get<std::string>();
            }
            if (logging.contains("level")) {
                log_level = logging["level"].get<std::string>();
            }
        }

        return ok();
    } catch (const json::exception& ex) {
        return config_error(compat::format("Invalid configuration: {}", ex.what()));
    }
}

auto provisioning_config::load_from_environment(const std::string& prefix) -> VoidResult {
    if (auto value = get_env(prefix + "CONNECTION")) {
        connection = *value;
    }
    if (auto value = get_env(prefix + "ADMIN_USERNAME")) {
        admin_username = *value;
    }
    if (auto value = get_env(prefix + "ADMIN_PASSWORD")) {
        admin_password = *value;
    }
    if (auto value = get_env(prefix + "LEGACY_USERS_FILE")) {
        legacy_users_file = *value;
    }
    if (auto value = get_env(prefix + "LOG_DIR")) {
        log_directory = *value;
    }
    if (auto value = get_env(prefix + "LOG_LEVEL")) {
        log_level = *value;
    }
    return ok();
}

auto provisioning_config::validate() const -> VoidResult {
    if (connection.empty()) {
        return config_error("connection must not be empty");
    }

    for (const auto& spec : databases) {
        if (spec.name.empty() || spec.owner.empty()) {
            return config_error("every database needs a name and an owner");
        }
    }

    auto provisioned = [this](const std::string& name) {
        return std::ranges::any_of(databases, [&name](const database_spec& spec) {
            return spec.name == name;
        });
    };

    if (!provisioned(user_database)) {
        return config_error(compat::format(
            "user_database {} is not one of the configured databases", user_database));
    }

    if (!provisioned(meta_database)) {
        return config_error(compat::format(
            "meta_database {} is not one of the configured databases", meta_database));
    }

    if (std::ranges::find(roles, application_role) == roles.end()) {
        return config_error(compat::format(
            "application_role {} is not one of the configured roles", application_role));
    }

    if (core::parse_debian_version(legacy_import_threshold).upstream.empty()) {
        return config_error(compat::format("legacy import_before is not a version: '{}'",
                                           legacy_import_threshold));
    }

    if (hash_rounds == 0) {
        return config_error("hash_rounds must be positive");
    }

    return ok();
}

auto provisioning_config::migration_targets() const -> storage::catalog_targets {
    return storage::catalog_targets{user_database, meta_database, application_role};
}

}  // namespace ampsetup::provision
