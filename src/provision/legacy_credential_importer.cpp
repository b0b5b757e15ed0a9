/**
 * @file legacy_credential_importer.cpp
 * @brief Implementation of the legacy credential import
 */

#include <ampsetup/provision/legacy_credential_importer.hpp>

#include <ampsetup/integration/logger_adapter.hpp>

#include <utility>

namespace ampsetup::provision {

using integration::logger_adapter;
using integration::user_change;

legacy_credential_importer::legacy_credential_importer(
    security::user_store_interface& store, const security::password_hasher& hasher)
    : store_(store), hasher_(hasher) {}

auto legacy_credential_importer::import_from(const std::filesystem::path& path)
    -> Result<import_report> {
    auto parsed = parse_legacy_credentials_file(path);
    if (parsed.is_err()) {
        return make_error<import_report>(parsed.error().code,
                                         parsed.error().message,
                                         "legacy_credential_importer");
    }

    logger_adapter::info("Importing {} users and {} administrators from {}",
                         parsed.value().users.size(),
                         parsed.value().administrators.size(), path.string());
    return import_records(parsed.value());
}

auto legacy_credential_importer::import_records(const legacy_credentials& credentials)
    -> import_report {
    import_report report;
    report.skipped_lines = credentials.skipped_lines;
    if (credentials.skipped_lines > 0) {
        logger_adapter::warn("Skipped {} malformed legacy credential lines",
                             credentials.skipped_lines);
    }

    for (const auto& record : credentials.users) {
        auto hashed = hasher_.hash(record.password);
        if (hashed.is_err()) {
            ++report.failed;
            logger_adapter::error("Cannot hash password for {}: {}", record.username,
                                  hashed.error().message);
            continue;
        }

        security::User user;
        user.username = record.username;
        user.longname = record.username;
        user.roles = security::baseline_capabilities();
        user.enabled = true;
        user.password_hash = std::move(hashed.value());

        auto stored = store_.upsert_user(user);
        if (stored.is_err()) {
            ++report.failed;
            logger_adapter::error("Cannot import user {}: {}", record.username,
                                  stored.error().message);
            continue;
        }

        ++report.imported;
        logger_adapter::log_user_change(user_change::imported, record.username);
    }

    for (const auto& username : credentials.administrators) {
        auto updated = store_.set_roles(username, security::administrator_capabilities());
        if (updated.is_ok()) {
            ++report.elevated;
            logger_adapter::log_user_change(user_change::elevated, username);
            continue;
        }

        if (updated.error().code == error_codes::user_not_found) {
            report.missing_admins.push_back(username);
            logger_adapter::warn("Administrator {} has no user entry, not elevated",
                                 username);
        } else {
            ++report.failed;
            logger_adapter::error("Cannot elevate {}: {}", username,
                                  updated.error().message);
        }
    }

    return report;
}

}  // namespace ampsetup::provision
