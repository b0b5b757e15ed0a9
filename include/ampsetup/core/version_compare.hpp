/**
 * @file version_compare.hpp
 * @brief Debian package version ordering
 *
 * Migration steps are gated on the version of the package that was installed
 * before the upgrade. The maintainer scripts receive that version from dpkg,
 * so comparisons here follow dpkg's ordering exactly:
 *
 *   [epoch:]upstream_version[-debian_revision]
 *
 * Each part is compared as alternating runs of non-digits and digits.
 * Non-digit runs compare character by character where '~' sorts before
 * anything (even the end of the part) and letters sort before other
 * characters. Digit runs compare numerically. A missing run compares as
 * empty or zero.
 */

#pragma once

#include <string>
#include <string_view>

namespace ampsetup::core {

/**
 * @brief Result of comparing two versions
 */
enum class version_order {
    less,
    equal,
    greater
};

/**
 * @brief Parsed form of a Debian version string
 */
struct debian_version {
    unsigned long epoch{0};
    std::string upstream;
    std::string revision;
};

/**
 * @brief Split a version string into epoch, upstream and revision
 *
 * The epoch is everything before the first ':' when it is all digits; the
 * revision is everything after the last '-'. Surrounding whitespace is
 * ignored.
 */
[[nodiscard]] auto parse_debian_version(std::string_view version)
    -> debian_version;

/**
 * @brief Compare two version strings using Debian ordering
 * @return version_order::less when a sorts before b
 */
[[nodiscard]] auto compare_versions(std::string_view a, std::string_view b)
    -> version_order;

/**
 * @brief True when version sorts at or before threshold
 *
 * This is the gate used for migration steps: a step applies when the
 * previously installed version is at or before the step's threshold.
 */
[[nodiscard]] auto version_less_or_equal(std::string_view version,
                                         std::string_view threshold) -> bool;

/**
 * @brief True when version sorts strictly before threshold
 */
[[nodiscard]] auto version_less(std::string_view version,
                                std::string_view threshold) -> bool;

[[nodiscard]] constexpr auto to_string(version_order order) -> std::string_view {
    switch (order) {
        case version_order::less: return "less";
        case version_order::equal: return "equal";
        case version_order::greater: return "greater";
    }
    return "unknown";
}

}  // namespace ampsetup::core
