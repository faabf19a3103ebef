#include <gtest/gtest.h>
#include <map>
#include "utils/Config.hpp"
#include "utils/TimeUtil.hpp"

namespace {

AppConfig::EnvLookup env(const std::map<std::string, std::string>& values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) return std::nullopt;
        return it->second;
    };
}

} // namespace

TEST(ConfigTest, Defaults) {
    AppConfig config = AppConfig::fromLookup(env({}));
    EXPECT_EQ(config.data_dir, ".");
    EXPECT_EQ(config.log_file, "wordwise.log");
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.session_cap, 10u);
    EXPECT_FALSE(config.syncEnabled());
    EXPECT_EQ(config.sync_timeout.count(), 5000);
    EXPECT_EQ(config.sync_attempts, 3);
}

TEST(ConfigTest, EnvironmentOverrides) {
    AppConfig config = AppConfig::fromLookup(env({
        { "WORDWISE_DATA_DIR", "/var/lib/wordwise" },
        { "WORDWISE_LOG_LEVEL", "debug" },
        { "WORDWISE_SESSION_CAP", "25" },
        { "WORDWISE_REMOTE_DIR", "/mnt/shared" },
        { "WORDWISE_SYNC_TIMEOUT_MS", "1500" },
        { "WORDWISE_SYNC_ATTEMPTS", "1" },
    }));
    EXPECT_EQ(config.data_dir, "/var/lib/wordwise");
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.session_cap, 25u);
    EXPECT_TRUE(config.syncEnabled());
    EXPECT_EQ(config.sync_timeout.count(), 1500);
    EXPECT_EQ(config.sync_attempts, 1);
}

TEST(ConfigTest, InvalidValuesKeepDefaults) {
    AppConfig config = AppConfig::fromLookup(env({
        { "WORDWISE_LOG_LEVEL", "loud" },
        { "WORDWISE_SESSION_CAP", "0" },
        { "WORDWISE_SYNC_TIMEOUT_MS", "soon" },
        { "WORDWISE_SYNC_ATTEMPTS", "3x" },
    }));
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.session_cap, 10u);
    EXPECT_EQ(config.sync_timeout.count(), 5000);
    EXPECT_EQ(config.sync_attempts, 3);
}

TEST(TimeUtilTest, Rfc3339) {
    std::time_t t = 0;
    ASSERT_TRUE(TimeUtil::parseTimestamp("2024-05-01T10:00:00Z", t));
    EXPECT_EQ(t, 1714557600);
    ASSERT_TRUE(TimeUtil::parseTimestamp("2024-05-01 12:30:00.5+02:30", t));
    EXPECT_EQ(t, 1714557600);
    EXPECT_FALSE(TimeUtil::parseTimestamp("2024-05-01", t));
    EXPECT_FALSE(TimeUtil::parseTimestamp("2024-05-01T10:00:00+2", t));
    EXPECT_EQ(TimeUtil::formatTimestamp(1714557600), "2024-05-01T10:00:00Z");
    EXPECT_EQ(TimeUtil::addDays(1714557600, 0.5), 1714557600 + 43200);
}
