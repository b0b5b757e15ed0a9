/**
 * @file migration_sequencer_test.cpp
 * @brief Unit tests for version-gated migration steps
 */

#include <ampsetup/storage/migration_catalog.hpp>
#include <ampsetup/storage/migration_sequencer.hpp>

#include "../mocks/mock_connection.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace ampsetup;
using namespace ampsetup::storage;
using ampsetup::testing::mock_cluster;
using ampsetup::testing::mock_connection_factory;

namespace {

auto three_steps() -> std::vector<migration_step> {
    return {
        {"2.1-1", "A", "ampmeta", {"ALTER TABLE a ADD COLUMN IF NOT EXISTS x INT"}},
        {"2.6-1", "B", "ampweb",
         {"ALTER TABLE b ADD COLUMN IF NOT EXISTS y INT",
          "ALTER TABLE b ADD COLUMN IF NOT EXISTS z INT"}},
        {"2.13-1", "C", "ampmeta", {"ALTER TABLE c ADD COLUMN IF NOT EXISTS w INT"}},
    };
}

auto executed_thresholds(const migration_report& report) -> std::vector<std::string> {
    std::vector<std::string> thresholds;
    for (const auto& step : report.executed) {
        thresholds.push_back(step.threshold);
    }
    return thresholds;
}

auto make_cluster() -> mock_cluster {
    mock_cluster cluster;
    cluster.databases.insert("ampweb");
    cluster.databases.insert("ampmeta");
    return cluster;
}

}  // namespace

TEST_CASE("apply_migrations runs pending steps in ascending order", "[migration]") {
    auto cluster = make_cluster();
    mock_connection_factory factory(cluster);
    migration_sequencer sequencer(factory);

    SECTION("from an old version every later step runs once") {
        auto report = sequencer.apply_migrations("2.0-1", three_steps());

        CHECK(executed_thresholds(report) ==
              std::vector<std::string>{"2.1-1", "2.6-1", "2.13-1"});
        CHECK(report.skipped.empty());
        CHECK(report.applied_count() == 3);
        CHECK(report.succeeded());
        CHECK(cluster.log.size() == 4);
        CHECK(cluster.log[0].sql.find("TABLE a") != std::string::npos);
        CHECK(cluster.log[3].sql.find("TABLE c") != std::string::npos);
    }

    SECTION("a step at exactly the prior version still runs") {
        auto report = sequencer.apply_migrations("2.6-1", three_steps());
        CHECK(executed_thresholds(report) == std::vector<std::string>{"2.6-1", "2.13-1"});
        CHECK(report.skipped == std::vector<std::string>{"2.1-1"});
    }

    SECTION("from a recent version only later steps run") {
        auto report = sequencer.apply_migrations("2.8-1", three_steps());
        CHECK(executed_thresholds(report) == std::vector<std::string>{"2.13-1"});
        CHECK(report.skipped == std::vector<std::string>{"2.1-1", "2.6-1"});
    }

    SECTION("from a version past every step nothing runs") {
        auto report = sequencer.apply_migrations("3.0-1", three_steps());
        CHECK(report.executed.empty());
        CHECK(report.skipped.size() == 3);
        CHECK(cluster.log.empty());
    }

    SECTION("an empty prior version runs nothing") {
        auto report = sequencer.apply_migrations("", three_steps());
        CHECK(report.executed.empty());
        CHECK(report.skipped.empty());
        CHECK(cluster.log.empty());
    }
}

TEST_CASE("apply_migrations reuses one connection per database", "[migration]") {
    auto cluster = make_cluster();
    mock_connection_factory factory(cluster);
    migration_sequencer sequencer(factory);

    auto report = sequencer.apply_migrations("2.0-1", three_steps());
    REQUIRE(report.succeeded());
    CHECK(cluster.connects["ampmeta"] == 1);
    CHECK(cluster.connects["ampweb"] == 1);
    CHECK(cluster.statements_on("ampmeta").size() == 2);
    CHECK(cluster.statements_on("ampweb").size() == 2);
}

TEST_CASE("apply_migrations error policies", "[migration]") {
    auto cluster = make_cluster();
    cluster.fail_on("COLUMN IF NOT EXISTS y");
    mock_connection_factory factory(cluster);
    migration_sequencer sequencer(factory);

    SECTION("continue_on_error runs the rest of the step and later steps") {
        auto report = sequencer.apply_migrations("2.0-1", three_steps(),
                                                 core::error_policy::continue_on_error);

        REQUIRE(report.executed.size() == 3);
        CHECK_FALSE(report.stopped);
        CHECK(report.executed[1].statements_failed == 1);
        CHECK(report.executed[1].statements_applied == 1);
        CHECK_FALSE(report.executed[1].succeeded());
        CHECK(report.executed[2].succeeded());
        CHECK(report.failed_count() == 1);
        CHECK_FALSE(report.succeeded());
    }

    SECTION("fail_fast stops at the first failure") {
        auto report = sequencer.apply_migrations("2.0-1", three_steps(),
                                                 core::error_policy::fail_fast);

        REQUIRE(report.executed.size() == 2);
        CHECK(report.stopped);
        CHECK(report.executed[1].statements_applied == 0);
        CHECK(cluster.count_containing("TABLE c") == 0);
        CHECK(cluster.count_containing("COLUMN IF NOT EXISTS z") == 0);
    }
}

TEST_CASE("apply_migrations counts an unreachable database as failed", "[migration]") {
    auto cluster = make_cluster();
    cluster.unreachable.insert("ampweb");
    mock_connection_factory factory(cluster);
    migration_sequencer sequencer(factory);

    auto report = sequencer.apply_migrations("2.0-1", three_steps());

    REQUIRE(report.executed.size() == 3);
    CHECK(report.executed[1].statements_failed == 2);
    CHECK(report.executed[0].succeeded());
    CHECK(report.executed[2].succeeded());
}

TEST_CASE("migration_catalog", "[migration]") {
    const auto& steps = migration_catalog::steps();

    SECTION("steps are in strictly ascending threshold order") {
        REQUIRE_FALSE(steps.empty());
        CHECK(migration_catalog::is_ordered(steps));
    }

    SECTION("every step targets a known database and has statements") {
        for (const auto& step : steps) {
            CHECK((step.database == "ampweb" || step.database == "ampmeta"));
            CHECK_FALSE(step.statements.empty());
            CHECK_FALSE(step.description.empty());
        }
    }

    SECTION("is_ordered rejects out-of-order and duplicate thresholds") {
        std::vector<migration_step> unordered{{"2.13-1", "", "ampweb", {}},
                                              {"2.6-1", "", "ampweb", {}}};
        CHECK_FALSE(migration_catalog::is_ordered(unordered));

        std::vector<migration_step> duplicate{{"2.6-1", "", "ampweb", {}},
                                              {"2.6-1", "", "ampweb", {}}};
        CHECK_FALSE(migration_catalog::is_ordered(duplicate));
    }

    SECTION("statements name the given databases and role") {
        catalog_targets targets{"web", "meta", "webapp"};
        auto custom = migration_catalog::steps(targets);

        REQUIRE(custom.size() == steps.size());
        CHECK(migration_catalog::is_ordered(custom));
        for (std::size_t i = 0; i < custom.size(); ++i) {
            CHECK(custom[i].database == (steps[i].database == "ampweb" ? "web" : "meta"));
        }

        auto users_step = std::ranges::find_if(custom, [](const migration_step& step) {
            return step.threshold == "2.6-1";
        });
        REQUIRE(users_step != custom.end());
        CHECK(users_step->statements.back() == R"(GRANT ALL ON TABLE users TO "webapp")");
    }

        SECTION("the users table exists before any legacy import") {
        auto users_step = std::ranges::find_if(steps, [](const migration_step& step) {
            return step.threshold == "2.6-1";
        });
        REQUIRE(users_step != steps.end());
        CHECK(users_step->statements[0].find("CREATE TABLE IF NOT EXISTS users") !=
              std::string::npos);
    }
}
