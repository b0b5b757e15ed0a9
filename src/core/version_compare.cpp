/**
 * @file version_compare.cpp
 * @brief Implementation of Debian package version ordering
 */

#include <ampsetup/core/version_compare.hpp>

#include <cctype>

namespace ampsetup::core {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

auto is_digit(char c) -> bool {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/// Sort weight of a character inside a non-digit run ('\0' is end of run)
auto order(char c) -> int {
    if (is_digit(c)) {
        return 0;
    }
    if (std::isalpha(static_cast<unsigned char>(c))) {
        return static_cast<unsigned char>(c);
    }
    if (c == '~') {
        return -1;
    }
    if (c != '\0') {
        return static_cast<unsigned char>(c) + 256;
    }
    return 0;
}

/// Compare one version part (upstream or revision); <0, 0 or >0
auto compare_part(std::string_view a, std::string_view b) -> int {
    std::size_t i = 0;
    std::size_t j = 0;

    auto at = [](std::string_view s, std::size_t pos) -> char {
        return pos < s.size() ? s[pos] : '\0';
    };

    while (i < a.size() || j < b.size()) {
        int first_diff = 0;

        while ((i < a.size() && !is_digit(a[i])) ||
               (j < b.size() && !is_digit(b[j]))) {
            int ac = order(at(a, i));
            int bc = order(at(b, j));
            if (ac != bc) {
                return ac - bc;
            }
            ++i;
            ++j;
        }

        while (at(a, i) == '0') {
            ++i;
        }
        while (at(b, j) == '0') {
            ++j;
        }

        while (is_digit(at(a, i)) && is_digit(at(b, j))) {
            if (first_diff == 0) {
                first_diff = at(a, i) - at(b, j);
            }
            ++i;
            ++j;
        }

        if (is_digit(at(a, i))) {
            return 1;
        }
        if (is_digit(at(b, j))) {
            return -1;
        }
        if (first_diff != 0) {
            return first_diff;
        }
    }

    return 0;
}

}  // namespace

auto parse_debian_version(std::string_view version) -> debian_version {
    debian_version parsed;
    auto text = trim(version);

    if (auto colon = text.find(':'); colon != std::string_view::npos) {
        auto epoch_text = text.substr(0, colon);
        bool numeric = !epoch_text.empty();
        unsigned long epoch = 0;
        for (char c : epoch_text) {
            if (!is_digit(c)) {
                numeric = false;
                break;
            }
            epoch = epoch * 10 + static_cast<unsigned long>(c - '0');
        }
        if (numeric) {
            parsed.epoch = epoch;
            text.remove_prefix(colon + 1);
        }
    }

    if (auto hyphen = text.rfind('-'); hyphen != std::string_view::npos) {
        parsed.upstream = std::string(text.substr(0, hyphen));
        parsed.revision = std::string(text.substr(hyphen + 1));
    } else {
        parsed.upstream = std::string(text);
    }

    return parsed;
}

auto compare_versions(std::string_view a, std::string_view b) -> version_order {
    auto lhs = parse_debian_version(a);
    auto rhs = parse_debian_version(b);

    if (lhs.epoch != rhs.epoch) {
        return lhs.epoch < rhs.epoch ? version_order::less
                                     : version_order::greater;
    }

    int result = compare_part(lhs.upstream, rhs.upstream);
    if (result == 0) {
        result = compare_part(lhs.revision, rhs.revision);
    }

    if (result < 0) {
        return version_order::less;
    }
    if (result > 0) {
        return version_order::greater;
    }
    return version_order::equal;
}

auto version_less_or_equal(std::string_view version, std::string_view threshold)
    -> bool {
    return compare_versions(version, threshold) != version_order::greater;
}

auto version_less(std::string_view version, std::string_view threshold) -> bool {
    return compare_versions(version, threshold) == version_order::less;
}

}  // namespace ampsetup::core
