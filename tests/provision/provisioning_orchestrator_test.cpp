/**
 * @file provisioning_orchestrator_test.cpp
 * @brief Unit tests for life-cycle event handling
 */

#include <ampsetup/provision/provisioning_orchestrator.hpp>
#include <ampsetup/storage/migration_catalog.hpp>
#include <ampsetup/storage/pg_user_store.hpp>

#include "../mocks/mock_connection.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <filesystem>
#include <fstream>

using namespace ampsetup;
using namespace ampsetup::provision;
using Catch::Generators::as;
using ampsetup::testing::mock_cluster;
using ampsetup::testing::mock_connection_factory;

namespace {

auto test_config() -> provisioning_config {
    provisioning_config config;
    config.databases = {{"ampweb", "cuz", {}}, {"ampmeta", "cuz", {}}};
    config.legacy_users_file = "/nonexistent/amp-web/users";
    config.hash_rounds = 1000;
    return config;
}

auto upgraded_cluster() -> mock_cluster {
    mock_cluster cluster;
    cluster.roles.insert("cuz");
    cluster.databases.insert("ampweb");
    cluster.databases.insert("ampmeta");
    return cluster;
}

auto executed_thresholds(const provisioning_outcome& outcome) -> std::vector<std::string> {
    std::vector<std::string> thresholds;
    if (outcome.migrations) {
        for (const auto& step : outcome.migrations->executed) {
            thresholds.push_back(step.threshold);
        }
    }
    return thresholds;
}

/**
 * @brief Legacy users file removed when the test ends
 */
class legacy_users_file {
public:
    explicit legacy_users_file(const std::string& content)
        : path_(std::filesystem::temp_directory_path() / "ampsetup_orchestrator_users") {
        std::ofstream out(path_);
        out << content;
    }

    ~legacy_users_file() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    legacy_users_file(const legacy_users_file&) = delete;
    legacy_users_file& operator=(const legacy_users_file&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace

TEST_CASE("fresh install provisions roles, databases and the administrator",
          "[orchestrator]") {
    mock_cluster cluster;
    mock_connection_factory factory(cluster);
    auto config = test_config();
    config.admin_username = "admin";
    config.admin_password = "changeme";
    config_credential_source credentials(config);
    provisioning_orchestrator orchestrator(config, factory, credentials);

    auto outcome = orchestrator.run("configure", "");

    CHECK(outcome.state == terminal_state::fresh_install_complete);
    CHECK(exit_code(outcome.state) == 0);

    REQUIRE(outcome.roles.size() == 1);
    CHECK(outcome.roles[0].status == provision_status::created);
    REQUIRE(outcome.databases.size() == 2);
    CHECK(outcome.databases[0].status == provision_status::created);
    CHECK(outcome.databases[1].status == provision_status::created);

    CHECK(outcome.admin_created);
    REQUIRE(cluster.users.contains("admin"));
    CHECK(cluster.users["admin"]["roles"] == "{viewdata,viewconfig,editconfig,editusers}");
    CHECK(cluster.users["admin"]["password"] != "changeme");
    CHECK(security::password_hasher().verify("changeme", cluster.users["admin"]["password"]));

    SECTION("neither migrations nor the legacy import run") {
        CHECK_FALSE(outcome.migrations.has_value());
        CHECK_FALSE(outcome.legacy_import.has_value());
        CHECK(cluster.count_containing("ALTER TABLE") == 0);
        CHECK(cluster.connects["ampmeta"] == 0);
        CHECK(cluster.connects["ampweb"] == 1);
    }
}

TEST_CASE("fresh install is idempotent", "[orchestrator]") {
    mock_cluster cluster;
    mock_connection_factory factory(cluster);
    auto config = test_config();
    config_credential_source credentials(config);
    provisioning_orchestrator orchestrator(config, factory, credentials);

    REQUIRE(orchestrator.run("configure", "").state == terminal_state::fresh_install_complete);
    auto again = orchestrator.run("configure", "");

    CHECK(again.state == terminal_state::fresh_install_complete);
    CHECK(again.roles[0].status == provision_status::exists);
    CHECK(again.databases[0].status == provision_status::exists);
    CHECK(cluster.count_containing("CREATE ROLE") == 1);
    CHECK(cluster.count_containing("CREATE DATABASE") == 2);
}

TEST_CASE("fresh install without administrator credentials still completes",
          "[orchestrator]") {
    mock_cluster cluster;
    mock_connection_factory factory(cluster);
    auto config = test_config();
    config_credential_source credentials(config);
    provisioning_orchestrator orchestrator(config, factory, credentials);

    auto outcome = orchestrator.run("configure", "");

    CHECK(outcome.state == terminal_state::fresh_install_complete);
    CHECK_FALSE(outcome.admin_created);
    CHECK(cluster.users.empty());
}

TEST_CASE("fresh install fails when the cluster is unreachable", "[orchestrator]") {
    mock_cluster cluster;
    cluster.unreachable.insert("postgres");
    mock_connection_factory factory(cluster);
    auto config = test_config();
    config_credential_source credentials(config);
    provisioning_orchestrator orchestrator(config, factory, credentials);

    auto outcome = orchestrator.run("configure", "");

    CHECK(outcome.state == terminal_state::failed);
    CHECK(exit_code(outcome.state) == 1);
    CHECK_FALSE(outcome.message.empty());
}

TEST_CASE("upgrade applies pending migrations and imports legacy users", "[orchestrator]") {
    auto cluster = upgraded_cluster();
    mock_connection_factory factory(cluster);
    legacy_users_file users("USERS\nalice:pw1\nbob:pw2\nGROUP\nalice\n");
    auto config = test_config();
    config.legacy_users_file = users.path();
    config_credential_source credentials(config);
    provisioning_orchestrator orchestrator(config, factory, credentials);

    SECTION("from before the users table existed") {
        auto outcome = orchestrator.run("configure", "2.5-1");

        CHECK(outcome.state == terminal_state::upgrade_complete);
        CHECK(executed_thresholds(outcome) ==
              std::vector<std::string>{"2.6-1", "2.7-1", "2.13-1"});

        REQUIRE(outcome.legacy_import.has_value());
        CHECK(outcome.legacy_import->imported == 2);
        CHECK(outcome.legacy_import->elevated == 1);
        CHECK(cluster.users["alice"]["roles"] ==
              storage::format_role_array(security::administrator_capabilities()));
        CHECK(cluster.users["bob"]["roles"] == "{viewdata}");
        CHECK(cluster.users["bob"]["password"] != "pw2");
        CHECK(cluster.count_containing("CREATE ROLE") == 0);
        CHECK(cluster.count_containing("CREATE DATABASE") == 0);
    }

    SECTION("reconfigure behaves like configure") {
        auto outcome = orchestrator.run("reconfigure", "2.5-1");
        CHECK(outcome.state == terminal_state::upgrade_complete);
        CHECK(outcome.legacy_import.has_value());
    }

    SECTION("at the threshold the legacy file is not imported") {
        auto outcome = orchestrator.run("configure", "2.6-1");
        CHECK(outcome.state == terminal_state::upgrade_complete);
        CHECK_FALSE(outcome.legacy_import.has_value());
        CHECK(cluster.users.empty());
    }

    SECTION("from a recent version only later steps run") {
        auto outcome = orchestrator.run("configure", "2.8-1");
        CHECK(outcome.state == terminal_state::upgrade_complete);
        CHECK(executed_thresholds(outcome) == std::vector<std::string>{"2.13-1"});
        CHECK_FALSE(outcome.legacy_import.has_value());
        CHECK(cluster.connects["ampweb"] == 0);
    }
}

TEST_CASE("upgrade tolerates a missing legacy file", "[orchestrator]") {
    auto cluster = upgraded_cluster();
    mock_connection_factory factory(cluster);
    auto config = test_config();
    config_credential_source credentials(config);
    provisioning_orchestrator orchestrator(config, factory, credentials);

    auto outcome = orchestrator.run("configure", "2.0-1");

    CHECK(outcome.state == terminal_state::upgrade_complete);
    CHECK_FALSE(outcome.legacy_import.has_value());
    CHECK(outcome.migrations->executed.size() == storage::migration_catalog::steps().size());
}

TEST_CASE("upgrade migration failures follow the configured policy", "[orchestrator]") {
    auto cluster = upgraded_cluster();
    cluster.fail_on("mesh_public");
    mock_connection_factory factory(cluster);
    auto config = test_config();
    config_credential_source credentials(config);

    SECTION("continue_on_error completes the upgrade") {
        provisioning_orchestrator orchestrator(config, factory, credentials);
        auto outcome = orchestrator.run("configure", "2.8-1");

        CHECK(outcome.state == terminal_state::upgrade_complete);
        REQUIRE(outcome.migrations.has_value());
        CHECK(outcome.migrations->failed_count() == 1);
        CHECK(cluster.count_containing("endpoint_schedule_id_fkey") == 2);
    }

    SECTION("fail_fast fails the upgrade") {
        config.migration_policy = core::error_policy::fail_fast;
        provisioning_orchestrator orchestrator(config, factory, credentials);
        auto outcome = orchestrator.run("configure", "2.8-1");

        CHECK(outcome.state == terminal_state::failed);
        CHECK(exit_code(outcome.state) == 1);
    }
}

TEST_CASE("upgrade uses an injected migration list", "[orchestrator]") {
    auto cluster = upgraded_cluster();
    mock_connection_factory factory(cluster);
    auto config = test_config();
    config_credential_source credentials(config);
    provisioning_orchestrator orchestrator(config, factory, credentials);
    REQUIRE(orchestrator
                .set_migration_steps({{"3.0-1", "custom", "ampweb",
                                       {"ALTER TABLE custom ADD COLUMN IF NOT EXISTS c INT"}}})
                .is_ok());

    auto outcome = orchestrator.run("configure", "2.13-1");

    CHECK(executed_thresholds(outcome) == std::vector<std::string>{"3.0-1"});
    CHECK(cluster.count_containing("ALTER TABLE custom") == 1);
}

TEST_CASE("migration lists out of threshold order are refused", "[orchestrator]") {
    auto cluster = upgraded_cluster();
    mock_connection_factory factory(cluster);
    auto config = test_config();
    config_credential_source credentials(config);
    provisioning_orchestrator orchestrator(config, factory, credentials);

    auto replaced = orchestrator.set_migration_steps(
        {{"3.1-1", "later", "ampweb", {"ALTER TABLE later ADD COLUMN IF NOT EXISTS l INT"}},
         {"3.0-1", "earlier", "ampweb", {"ALTER TABLE earlier ADD COLUMN IF NOT EXISTS e INT"}}});

    REQUIRE(replaced.is_err());
    CHECK(replaced.error().code == error_codes::invalid_configuration);

    auto outcome = orchestrator.run("configure", "2.8-1");

    CHECK(executed_thresholds(outcome) == std::vector<std::string>{"2.13-1"});
    CHECK(cluster.count_containing("ALTER TABLE later") == 0);
    CHECK(cluster.count_containing("ALTER TABLE earlier") == 0);
}

TEST_CASE("upgrade migrates the configured databases and role", "[orchestrator]") {
    mock_cluster cluster;
    cluster.roles.insert("webapp");
    cluster.databases.insert("web");
    cluster.databases.insert("meta");
    mock_connection_factory factory(cluster);

    auto config = test_config();
    config.roles = {"webapp"};
    config.databases = {{"web", "webapp", {}}, {"meta", "webapp", {}}};
    config.user_database = "web";
    config.meta_database = "meta";
    config.application_role = "webapp";
    REQUIRE(config.validate().is_ok());

    config_credential_source credentials(config);
    provisioning_orchestrator orchestrator(config, factory, credentials);

    auto outcome = orchestrator.run("configure", "2.0-1");

    CHECK(outcome.state == terminal_state::upgrade_complete);
    REQUIRE(outcome.migrations.has_value());
    CHECK(outcome.migrations->failed_count() == 0);
    CHECK(cluster.connects["web"] > 0);
    CHECK(cluster.connects["meta"] > 0);
    CHECK(cluster.connects["ampweb"] == 0);
    CHECK(cluster.connects["ampmeta"] == 0);
    CHECK(cluster.count_containing("GRANT ALL ON TABLE users TO \"webapp\"") == 1);
    CHECK(cluster.count_containing("TO cuz") == 0);
}

TEST_CASE("abort events change nothing", "[orchestrator]") {
    auto event = GENERATE(as<std::string>{}, "abort-upgrade", "abort-remove",
                          "abort-deconfigure");

    auto cluster = upgraded_cluster();
    mock_connection_factory factory(cluster);
    auto config = test_config();
    config_credential_source credentials(config);
    provisioning_orchestrator orchestrator(config, factory, credentials);

    auto outcome = orchestrator.run(event, "2.5-1");

    CHECK(outcome.state == terminal_state::aborted);
    CHECK(exit_code(outcome.state) == 0);
    CHECK(cluster.log.empty());
    CHECK(cluster.connects.empty());
}

TEST_CASE("unknown events fail without touching the cluster", "[orchestrator]") {
    auto cluster = upgraded_cluster();
    mock_connection_factory factory(cluster);
    auto config = test_config();
    config_credential_source credentials(config);
    provisioning_orchestrator orchestrator(config, factory, credentials);

    auto outcome = orchestrator.run("install", "");

    CHECK(outcome.state == terminal_state::failed);
    CHECK(exit_code(outcome.state) != 0);
    CHECK(outcome.message.find("install") != std::string::npos);
    CHECK(cluster.log.empty());
}

TEST_CASE("life-cycle event names", "[orchestrator]") {
    CHECK(parse_lifecycle_event("configure").value() == lifecycle_event::configure);
    CHECK(parse_lifecycle_event("abort-remove").value() == lifecycle_event::abort_remove);
    CHECK(parse_lifecycle_event("Configure").is_err());
    CHECK(parse_lifecycle_event("").is_err());
    CHECK(to_string(lifecycle_event::abort_deconfigure) == "abort-deconfigure");
    CHECK(to_string(terminal_state::upgrade_complete) == "upgrade_complete");
}
