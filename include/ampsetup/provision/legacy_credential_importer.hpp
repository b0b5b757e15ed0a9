/**
 * @file legacy_credential_importer.hpp
 * @brief Moves credentials from the legacy users file into the users table
 */

#pragma once

#include "legacy_credential_parser.hpp"

#include <ampsetup/core/result.hpp>
#include <ampsetup/security/password_hasher.hpp>
#include <ampsetup/security/user_store_interface.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace ampsetup::provision {

/**
 * @brief Counts reported by an import run
 */
struct import_report {
    std::size_t imported{0};           ///< Users written with baseline roles
    std::size_t elevated{0};           ///< Users given administrator roles
    std::size_t failed{0};             ///< Users the store rejected
    std::size_t skipped_lines{0};      ///< Malformed lines in the file
    std::vector<std::string> missing_admins;  ///< GROUP names with no user
};

/**
 * @brief Imports legacy credentials with salted hashes
 *
 * Every USERS entry is upserted (an existing user's password, display name
 * and roles are replaced); GROUP entries are then elevated to the
 * administrator role set. Plaintext passwords are never stored.
 */
class legacy_credential_importer {
public:
    legacy_credential_importer(security::user_store_interface& store,
                               const security::password_hasher& hasher);

    /**
     * @brief Parse the file at path and import it
     * @return file_not_found or file_read_error when the file is unusable;
     *         otherwise the report, even when individual users failed
     */
    [[nodiscard]] auto import_from(const std::filesystem::path& path)
        -> Result<import_report>;

    /**
     * @brief Import already parsed credentials
     */
    [[nodiscard]] auto import_records(const legacy_credentials& credentials)
        -> import_report;

private:
    security::user_store_interface& store_;
    const security::password_hasher& hasher_;
};

}  // namespace ampsetup::provision
