/**
 * @file version_compare_test.cpp
 * @brief Unit tests for Debian version ordering
 */

#include <ampsetup/core/version_compare.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace ampsetup::core;

TEST_CASE("parse_debian_version splits epoch, upstream and revision", "[version]") {
    SECTION("full version") {
        auto v = parse_debian_version("1:2.6-1");
        CHECK(v.epoch == 1);
        CHECK(v.upstream == "2.6");
        CHECK(v.revision == "1");
    }

    SECTION("no epoch or revision") {
        auto v = parse_debian_version("2.13");
        CHECK(v.epoch == 0);
        CHECK(v.upstream == "2.13");
        CHECK(v.revision.empty());
    }

    SECTION("revision is taken after the last hyphen") {
        auto v = parse_debian_version("1.0-beta-3");
        CHECK(v.upstream == "1.0-beta");
        CHECK(v.revision == "3");
    }

    SECTION("surrounding whitespace is ignored") {
        auto v = parse_debian_version("  2.5-1\n");
        CHECK(v.upstream == "2.5");
        CHECK(v.revision == "1");
    }
}

TEST_CASE("compare_versions uses Debian ordering", "[version]") {
    SECTION("numeric parts compare as numbers") {
        CHECK(compare_versions("2.13-1", "2.6-1") == version_order::greater);
        CHECK(compare_versions("2.6-1", "2.13-1") == version_order::less);
        CHECK(compare_versions("2.10", "2.9") == version_order::greater);
    }

    SECTION("equal versions") {
        CHECK(compare_versions("2.6-1", "2.6-1") == version_order::equal);
        CHECK(compare_versions("0:2.6-1", "2.6-1") == version_order::equal);
        CHECK(compare_versions("2.06", "2.6") == version_order::equal);
    }

    SECTION("revision decides when upstream is equal") {
        CHECK(compare_versions("2.6-1", "2.6-2") == version_order::less);
        CHECK(compare_versions("2.6-10", "2.6-9") == version_order::greater);
    }

    SECTION("epoch dominates") {
        CHECK(compare_versions("1:1.0", "9.9-9") == version_order::greater);
        CHECK(compare_versions("9.9", "1:0.1") == version_order::less);
    }

    SECTION("tilde sorts before everything, even the end of the string") {
        CHECK(compare_versions("2.6~rc1-1", "2.6-1") == version_order::less);
        CHECK(compare_versions("2.6~~", "2.6~") == version_order::less);
        CHECK(compare_versions("2.6~rc1", "2.6~rc2") == version_order::less);
    }

    SECTION("letters sort before non-letters") {
        CHECK(compare_versions("1.0a", "1.0+") == version_order::less);
        CHECK(compare_versions("1.0", "1.0a") == version_order::less);
        CHECK(compare_versions("1.0a", "1.0b") == version_order::less);
    }
}

TEST_CASE("version_less_or_equal gates migration steps", "[version]") {
    CHECK(version_less_or_equal("2.5-1", "2.6-1"));
    CHECK(version_less_or_equal("2.6-1", "2.6-1"));
    CHECK_FALSE(version_less_or_equal("2.7-1", "2.6-1"));
    CHECK_FALSE(version_less_or_equal("2.13-1", "2.6-1"));
}

TEST_CASE("version_less is strict", "[version]") {
    CHECK(version_less("2.5-1", "2.6-1"));
    CHECK_FALSE(version_less("2.6-1", "2.6-1"));
    CHECK_FALSE(version_less("2.8-1", "2.6-1"));
}

TEST_CASE("version_order names", "[version]") {
    CHECK(to_string(version_order::less) == "less");
    CHECK(to_string(version_order::equal) == "equal");
    CHECK(to_string(version_order::greater) == "greater");
}
