/**
 * @file command_line_test.cpp
 * @brief Unit tests for ampsetup argument parsing
 */

#include <ampsetup/app/command_line.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace ampsetup;
using namespace ampsetup::app;

TEST_CASE("parse_arguments reads the maintainer-script form", "[cli]") {
    SECTION("event only") {
        auto opts = parse_arguments({"configure"});
        REQUIRE(opts.is_ok());
        CHECK(opts.value().event == "configure");
        CHECK(opts.value().prior_version.empty());
        CHECK(opts.value().file_log);
        CHECK_FALSE(opts.value().verbose);
    }

    SECTION("event and prior version") {
        auto opts = parse_arguments({"configure", "2.5-1"});
        REQUIRE(opts.is_ok());
        CHECK(opts.value().prior_version == "2.5-1");
    }

    SECTION("options before the event") {
        auto opts = parse_arguments({"--config", "/etc/ampsetup.json", "--log-dir",
                                     "/tmp/logs", "-v", "--no-file-log", "abort-upgrade",
                                     "2.13-1"});
        REQUIRE(opts.is_ok());
        REQUIRE(opts.value().config_file.has_value());
        CHECK(opts.value().config_file->string() == "/etc/ampsetup.json");
        CHECK(opts.value().log_directory->string() == "/tmp/logs");
        CHECK(opts.value().verbose);
        CHECK_FALSE(opts.value().file_log);
        CHECK(opts.value().event == "abort-upgrade");
    }

    SECTION("help") {
        auto opts = parse_arguments({"--help"});
        REQUIRE(opts.is_ok());
        CHECK(opts.value().help);
    }
}

TEST_CASE("parse_arguments rejects bad command lines", "[cli]") {
    SECTION("no event") {
        auto opts = parse_arguments({});
        REQUIRE(opts.is_err());
        CHECK(opts.error().code == error_codes::invalid_argument);
    }

    SECTION("unknown option") {
        CHECK(parse_arguments({"--force", "configure"}).is_err());
    }

    SECTION("option without value") {
        CHECK(parse_arguments({"configure", "--config"}).is_err());
    }

    SECTION("too many positional arguments") {
        CHECK(parse_arguments({"configure", "2.5-1", "extra"}).is_err());
    }
}

TEST_CASE("usage names the program and the events", "[cli]") {
    auto text = usage("ampsetup");
    CHECK(text.find("Usage: ampsetup") != std::string::npos);
    CHECK(text.find("abort-upgrade") != std::string::npos);
}

TEST_CASE("needs_provisioning", "[cli]") {
    auto needs = [](std::vector<std::string> args) {
        auto opts = parse_arguments(args);
        REQUIRE(opts.is_ok());
        return needs_provisioning(opts.value());
    };

    SECTION("abort events finish before configuration is read") {
        options opts;
        opts.config_file = "/nonexistent/ampsetup.json";
        opts.event = "abort-upgrade";
        opts.prior_version = "2.13-1";
        CHECK_FALSE(needs_provisioning(opts));

        CHECK_FALSE(needs({"abort-remove"}));
        CHECK_FALSE(needs({"--config", "/nonexistent/ampsetup.json", "abort-deconfigure"}));
    }

    SECTION("help") {
        CHECK_FALSE(needs({"--help"}));
    }

    SECTION("install, upgrade and unknown events run the orchestrator") {
        CHECK(needs({"configure"}));
        CHECK(needs({"reconfigure", "2.5-1"}));
        CHECK(needs({"remove"}));
    }
}
