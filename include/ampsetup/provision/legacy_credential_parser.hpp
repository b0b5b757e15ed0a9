/**
 * @file legacy_credential_parser.hpp
 * @brief Parser for the pre-database users file
 *
 * Older releases kept web credentials in an ini-like text file:
 *
 * @code
 * USERS
 * alice:secret
 * bob:hunter2
 * GROUP
 * alice
 * [other-section]
 * @endcode
 *
 * Entries under USERS are "username:password"; entries under GROUP are bare
 * usernames that get administrator rights.
 */

#pragma once

#include <ampsetup/core/result.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ampsetup::provision {

/**
 * @brief Section the parser is currently reading
 */
enum class parser_state { none, in_users, in_group };

/**
 * @brief A username and plaintext password from the USERS section
 */
struct legacy_user_record {
    std::string username;
    std::string password;
};

/**
 * @brief Everything recovered from a legacy users file
 */
struct legacy_credentials {
    std::vector<legacy_user_record> users;
    std::vector<std::string> administrators;  ///< GROUP section, file order
    std::size_t skipped_lines{0};             ///< Malformed entries
};

/**
 * @brief Parse the text of a legacy users file
 *
 * Never fails; malformed entries are skipped and counted.
 */
[[nodiscard]] auto parse_legacy_credentials(std::string_view text) -> legacy_credentials;

/**
 * @brief Read and parse a legacy users file
 * @return file_not_found when the file does not exist, file_read_error when
 *         it cannot be read
 */
[[nodiscard]] auto parse_legacy_credentials_file(const std::filesystem::path& path)
    -> Result<legacy_credentials>;

}  // namespace ampsetup::provision
