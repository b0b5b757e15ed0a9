/**
 * @file legacy_credential_parser.cpp
 * @brief Implementation of the legacy users file parser
 */

#include <ampsetup/provision/legacy_credential_parser.hpp>

#include <ampsetup/compat/format.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace ampsetup::provision {

namespace {

auto trim(std::string_view s) -> std::string_view {
    const auto* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string_view::npos) return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

auto strip_quotes_and_commas(std::string_view s) -> std::string {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != '"' && c != '\'' && c != ',') out.push_back(c);
    }
    return out;
}

auto has_whitespace(std::string_view s) -> bool {
    return std::ranges::any_of(s, [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

auto parse_legacy_credentials(std::string_view text) -> legacy_credentials {
    legacy_credentials result;
    auto state = parser_state::none;

    std::size_t pos = 0;
    while (pos <= text.size()) {
        auto eol = text.find('\n', pos);
        if (eol == std::string_view::npos) eol = text.size();
        auto line = trim(text.substr(pos, eol - pos));
        pos = eol + 1;

        if (line.empty() || line.front() == '#') continue;

        if (line == "USERS") {
            state = parser_state::in_users;
            continue;
        }
        if (line == "GROUP") {
            state = parser_state::in_group;
            continue;
        }
        if (line.front() == '[') {
            state = parser_state::none;
            continue;
        }

        auto entry = strip_quotes_and_commas(line);
        auto cleaned = trim(entry);

        switch (state) {
            case parser_state::none:
                break;

            case parser_state::in_users: {
                auto colon = cleaned.find(':');
                if (colon == std::string_view::npos) {
                    ++result.skipped_lines;
                    break;
                }
                auto username = trim(cleaned.substr(0, colon));
                auto rest = cleaned.substr(colon + 1);
                auto password = trim(rest.substr(0, rest.find(':')));
                if (username.empty() || password.empty()) {
                    ++result.skipped_lines;
                    break;
                }
                result.users.push_back({std::string(username), std::string(password)});
                break;
            }

            case parser_state::in_group:
                if (cleaned.empty() || cleaned.find(':') != std::string_view::npos ||
                    has_whitespace(cleaned)) {
                    ++result.skipped_lines;
                    break;
                }
                result.administrators.emplace_back(cleaned);
                break;
        }
    }

    return result;
}

auto parse_legacy_credentials_file(const std::filesystem::path& path)
    -> Result<legacy_credentials> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return make_error<legacy_credentials>(
            error_codes::file_not_found,
            compat::format("Legacy users file not found: {}", path.string()),
            "legacy_credentials");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return make_error<legacy_credentials>(
            error_codes::file_read_error,
            compat::format("Cannot open legacy users file: {}", path.string()),
            "legacy_credentials");
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return make_error<legacy_credentials>(
            error_codes::file_read_error,
            compat::format("Error reading legacy users file: {}", path.string()),
            "legacy_credentials");
    }

    return parse_legacy_credentials(buffer.str());
}

}  // namespace ampsetup::provision
