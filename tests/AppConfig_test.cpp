#include <gtest/gtest.h>
#include "capturepush/constants.hpp"
#include "capturepush/models/adapter_descriptor.hpp"
#include "capturepush/models/app_config.hpp"

TEST(AppConfigTest, EmptyConfigUsesDefaults) {
    AppConfig config;
    EXPECT_TRUE(config.valid());
    EXPECT_TRUE(config.accounts.empty());
    EXPECT_EQ(config.jitter, DEFAULT_POLL_JITTER);
    EXPECT_EQ(config.maxRetries, DEFAULT_MAX_RETRIES);
    EXPECT_EQ(config.dispatchTimeout, DEFAULT_DISPATCH_TIMEOUT);
    EXPECT_EQ(config.pluginIndexUrl, DEFAULT_PLUGIN_INDEX_URL);
    EXPECT_FALSE(config.autoUpdatePlugins);
    EXPECT_EQ(config.semesterWeeks, DEFAULT_SEMESTER_WEEKS);
}

TEST(AppConfigTest, ParsesAccountsAndChannels) {
    nlohmann::json json = {
        {"accounts", {
            {{"school_code", 10001}, {"username", "2023001"}, {"password", "pw"}, {"grades", {{"interval", 600}}}, {"schedule", {{"enabled", false}}}},
        }},
        {"channels", {
            {{"name", "feishu"}, {"parameters", {{"webhook_url", "https://open.feishu.cn/hook/x"}, {"secret", "s"}}}},
            {{"name", "mail"}, {"enabled", false}, {"parameters", {{"type", "email"}, {"smtp_port", 465}}}},
        }},
        {"scheduler", {{"jitter", 5}, {"max_retries", 1}}},
        {"plugins", {{"auto_update", true}}},
        {"semester", {{"first_monday", "2025-09-01"}, {"weeks", 18}}},
    };

    AppConfig config(json);
    ASSERT_TRUE(config.valid());
    ASSERT_EQ(config.accounts.size(), 1u);
    EXPECT_EQ(config.accounts[0].schoolCode, "10001");
    EXPECT_EQ(config.accounts[0].accountKey(), "10001-2023001");
    EXPECT_EQ(config.accounts[0].id, "10001-2023001");
    EXPECT_TRUE(config.accounts[0].grades.enabled);
    EXPECT_EQ(config.accounts[0].grades.interval, 600);
    EXPECT_FALSE(config.accounts[0].schedule.enabled);
    EXPECT_EQ(config.accounts[0].schedule.interval, DEFAULT_POLL_INTERVAL);

    ASSERT_EQ(config.channels.size(), 2u);
    EXPECT_EQ(config.channels[0].type(), "feishu");
    EXPECT_EQ(config.channels[0].parameter("secret"), "s");
    EXPECT_FALSE(config.channels[1].enabled);
    EXPECT_EQ(config.channels[1].type(), "email");
    EXPECT_EQ(config.channels[1].parameter("smtp_port"), "465");

    EXPECT_EQ(config.jitter, 5);
    EXPECT_EQ(config.maxRetries, 1);
    EXPECT_TRUE(config.autoUpdatePlugins);
    EXPECT_EQ(config.firstMonday, "2025-09-01");
    EXPECT_EQ(config.semesterWeeks, 18);
}

TEST(AppConfigTest, CollectsEveryProblem) {
    nlohmann::json json = {
        {"accounts", {
            {{"school_code", "10001"}},
            {{"school_code", "10001"}, {"username", "a"}},
            {{"school_code", "10001"}, {"username", "a"}},
        }},
        {"scheduler", {{"jitter", -1}, {"backoff_base", 10}, {"backoff_max", 5}}},
        {"semester", {{"first_monday", "2025-13-01"}}},
    };

    AppConfig config(json);
    EXPECT_FALSE(config.valid());
    auto errors = config.errors();
    auto mentions = [&](std::string needle) {
        for (const auto & e : errors) {
            if (e.find(needle) != std::string::npos) return true;
        }
        return false;
    };
    EXPECT_TRUE(mentions("accounts[0].username"));
    EXPECT_TRUE(mentions("duplicates account 10001-a"));
    EXPECT_TRUE(mentions("scheduler.jitter"));
    EXPECT_TRUE(mentions("backoff_max"));
    EXPECT_TRUE(mentions("first_monday"));
}

TEST(AppConfigTest, RejectsNonObjects) {
    EXPECT_FALSE(AppConfig(nlohmann::json::array()).valid());
    nlohmann::json nameless = {{"parameters", nlohmann::json::object()}};
    nlohmann::json badChannel = {{"channels", nlohmann::json::array({nameless})}};
    EXPECT_FALSE(AppConfig(badChannel).valid());
}

TEST(AppConfigTest, SerializationOmitsPasswords) {
    nlohmann::json json = {
        {"accounts", {
            {{"school_code", "10001"}, {"username", "alice"}, {"password", "hunter2"}},
        }},
    };
    std::string dumped = AppConfig(json).toJSON().dump();
    EXPECT_EQ(dumped.find("hunter2"), std::string::npos);
    EXPECT_NE(dumped.find("alice"), std::string::npos);
}

TEST(AdapterDescriptorTest, AcceptsLegacyIndexKeys) {
    nlohmann::json entry = {
        {"school_name", "Sample Institute"},
        {"plugin_version", "20250101_000000"},
        {"url", "https://plugins.test/a.so"},
        {"content_hash", "ABCDEF"},
    };
    AdapterDescriptor d = AdapterDescriptor::FromIndexEntry("12345", entry);
    EXPECT_EQ(d.code, "12345");
    EXPECT_EQ(d.displayName, "Sample Institute");
    EXPECT_EQ(d.version, "20250101_000000");
    EXPECT_EQ(d.downloadUrl, "https://plugins.test/a.so");
    EXPECT_EQ(d.contentHash, "abcdef");

    AdapterDescriptor copy = AdapterDescriptor::FromJSON(d.toJSON());
    EXPECT_EQ(copy.code, "12345");
    EXPECT_EQ(copy.version, d.version);
}
