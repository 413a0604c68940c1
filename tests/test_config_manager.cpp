#include <gtest/gtest.h>
#include "utils/config_manager.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include "test_utils.hpp"

namespace {

const char* kValidConfig = R"({
    "app": {"name": "hunter", "log_level": "DEBUG", "simulate": false},
    "store": {"path": "/tmp/seen.db", "write_attempts": 4},
    "notifier": {"app_token": "app", "user_token": "user", "max_attempts": 5, "base_delay_ms": 1000},
    "messages": {"title": "{source}: {title}"},
    "sources": {
        "kleinanzeigen": {
            "adapter": "html_regex",
            "poll_interval_sec": 600,
            "jitter_sec": 30,
            "params": {"url": "https://example.com/search", "pattern": "<a href=\"([^\"]+)\">"}
        },
        "bikes": {"adapter": "json_feed", "enabled": false}
    }
})";

const std::vector<std::string> kKinds = {"json_feed", "html_regex"};

} // namespace

TEST(ConfigManagerTest, LoadsAllSections) {
    webhunter::ConfigManager config;
    ASSERT_TRUE(config.load_from_string(kValidConfig));

    EXPECT_EQ(config.get_app_config().name, "hunter");
    EXPECT_EQ(config.get_app_config().log_level, "DEBUG");
    EXPECT_EQ(config.get_store_config().path, "/tmp/seen.db");
    EXPECT_EQ(config.get_store_config().write_attempts, 4);
    EXPECT_EQ(config.get_notifier_config().max_attempts, 5);
    EXPECT_EQ(config.get_notifier_config().base_delay_ms, 1000);
    // Untouched keys keep their defaults
    EXPECT_EQ(config.get_notifier_config().max_delay_ms, 60000);
    EXPECT_EQ(config.get_messages_config().title, "{source}: {title}");
    EXPECT_EQ(config.get_messages_config().body, "{title}\n{price}");

    auto& sources = config.get_source_configs();
    ASSERT_EQ(sources.size(), 2u);
    const auto& source = sources.at("kleinanzeigen");
    EXPECT_EQ(source.name, "kleinanzeigen");
    EXPECT_EQ(source.adapter, "html_regex");
    EXPECT_EQ(source.poll_interval_sec, 600);
    EXPECT_EQ(source.jitter_sec, 30);
    EXPECT_EQ(source.params.at("url"), "https://example.com/search");

    EXPECT_TRUE(config.validate(kKinds).empty());
}

TEST(ConfigManagerTest, EnabledSourcesAreSortedByName) {
    webhunter::ConfigManager config;
    ASSERT_TRUE(config.load_from_string(R"({"sources": {
        "zeta": {"adapter": "json_feed"},
        "alpha": {"adapter": "json_feed"},
        "off": {"adapter": "json_feed", "enabled": false}
    }})"));

    auto enabled = config.get_enabled_sources();
    ASSERT_EQ(enabled.size(), 2u);
    EXPECT_EQ(enabled[0].name, "alpha");
    EXPECT_EQ(enabled[1].name, "zeta");
    EXPECT_EQ(enabled[0].poll_interval_sec, 300);
    EXPECT_EQ(enabled[0].jitter_sec, 60);
}

TEST(ConfigManagerTest, RejectsMalformedJson) {
    webhunter::ConfigManager config;
    EXPECT_FALSE(config.load_from_string("{ not json"));
    EXPECT_FALSE(config.load_from_string("[1, 2]"));
}

TEST(ConfigManagerTest, RejectsWrongValueTypes) {
    webhunter::ConfigManager config;
    EXPECT_FALSE(config.load_from_string(R"({"sources": {"a": {"adapter": "json_feed", "poll_interval_sec": "often"}}})"));
}

TEST(ConfigManagerTest, MissingFileFails) {
    webhunter::ConfigManager config;
    EXPECT_FALSE(config.load("/nonexistent/webhunter.json"));
}

TEST(ConfigManagerTest, LoadsFromFile) {
    std::string path = webhunter::testing::temp_db_path("config") + ".json";
    {
        std::ofstream file(path);
        file << kValidConfig;
    }
    webhunter::ConfigManager config;
    EXPECT_TRUE(config.load(path));
    EXPECT_EQ(config.get_app_config().name, "hunter");
    std::remove(path.c_str());
}

TEST(ConfigManagerTest, ValidateReportsEveryProblem) {
    webhunter::ConfigManager config;
    ASSERT_TRUE(config.load_from_string(R"({
        "notifier": {"app_token": "app", "user_token": "user", "max_attempts": 0},
        "sources": {
            "a": {"adapter": "carrier_pigeon"},
            "b": {"adapter": "json_feed", "poll_interval_sec": 0, "jitter_sec": -1}
        }
    })"));

    auto problems = config.validate(kKinds);
    ASSERT_EQ(problems.size(), 4u);
    EXPECT_NE(problems[0].find("max_attempts"), std::string::npos);
    EXPECT_NE(problems[1].find("carrier_pigeon"), std::string::npos);
    EXPECT_NE(problems[2].find("poll_interval_sec"), std::string::npos);
    EXPECT_NE(problems[3].find("jitter_sec"), std::string::npos);
}

TEST(ConfigManagerTest, ValidateRequiresTokensUnlessSimulating) {
    ::unsetenv("WEBHUNTER_APP_TOKEN");
    ::unsetenv("WEBHUNTER_USER_TOKEN");

    webhunter::ConfigManager live;
    ASSERT_TRUE(live.load_from_string(R"({"sources": {"a": {"adapter": "json_feed"}}})"));
    auto problems = live.validate(kKinds);
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_NE(problems[0].find("token"), std::string::npos);

    webhunter::ConfigManager simulated;
    ASSERT_TRUE(simulated.load_from_string(R"({"app": {"simulate": true}, "sources": {"a": {"adapter": "json_feed"}}})"));
    EXPECT_TRUE(simulated.validate(kKinds).empty());
}

TEST(ConfigManagerTest, TokensFallBackToEnvironment) {
    ::setenv("WEBHUNTER_APP_TOKEN", "env-app", 1);
    ::setenv("WEBHUNTER_USER_TOKEN", "env-user", 1);

    webhunter::ConfigManager config;
    ASSERT_TRUE(config.load_from_string(R"({"notifier": {"user_token": "file-user"}})"));
    EXPECT_EQ(config.get_notifier_config().app_token, "env-app");
    EXPECT_EQ(config.get_notifier_config().user_token, "file-user");

    ::unsetenv("WEBHUNTER_APP_TOKEN");
    ::unsetenv("WEBHUNTER_USER_TOKEN");
}

TEST(ConfigManagerTest, NoEnabledSourcesIsAProblem) {
    webhunter::ConfigManager config;
    ASSERT_TRUE(config.load_from_string(R"({"app": {"simulate": true}})"));
    auto problems = config.validate(kKinds);
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_NE(problems[0].find("no enabled sources"), std::string::npos);
}
