#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "printmon/config.hpp"
#include "printmon/errors.hpp"

using namespace printmon;

namespace {

AppConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "print_monitor");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

bool mentions(const std::vector<std::string>& problems, const std::string& what) {
    for (const auto& p : problems) {
        if (p.find(what) != std::string::npos) return true;
    }
    return false;
}

}  // namespace

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* key : {"RTSP_STREAM_URL", "MQTT_BROKER_HOST", "DETECTION_THRESHOLD",
                                "STANDBY_MODE_ENABLED", "STANDBY_AUTO_TIMEOUT", "IDLE_TIMEOUT"}) {
            unsetenv(key);
        }
    }
    void TearDown() override { SetUp(); }
};

TEST_F(ConfigTest, DefaultsAreValid) {
    AppConfig cfg = parse({});
    EXPECT_TRUE(config_problems(cfg).empty());
    EXPECT_EQ(cfg.standby_auto_timeout_sec, 300);
    EXPECT_EQ(cfg.check_interval_sec, 10);
    EXPECT_FLOAT_EQ(cfg.detection_threshold, 0.6f);
    EXPECT_TRUE(cfg.standby_enabled);
}

TEST_F(ConfigTest, EnvironmentThenFlags) {
    setenv("RTSP_STREAM_URL", "rtsp://cam.local/live", 1);
    setenv("DETECTION_THRESHOLD", "0.75", 1);
    setenv("STANDBY_MODE_ENABLED", "false", 1);

    AppConfig cfg = parse({"--threshold", "0.5", "--standby-timeout", "120"});
    EXPECT_EQ(cfg.rtsp_url, "rtsp://cam.local/live");
    EXPECT_FLOAT_EQ(cfg.detection_threshold, 0.5f);
    EXPECT_FALSE(cfg.standby_enabled);
    EXPECT_EQ(cfg.standby_auto_timeout_sec, 120);
}

TEST_F(ConfigTest, StandbyFlagsToggle) {
    setenv("STANDBY_MODE_ENABLED", "false", 1);
    EXPECT_TRUE(parse({"--standby"}).standby_enabled);
    EXPECT_FALSE(parse({"--no-standby"}).standby_enabled);
}

TEST_F(ConfigTest, ReportsEveryProblem) {
    AppConfig cfg = parse({"--threshold", "1.5", "--check-interval", "0", "--motion-blur", "4"});
    auto problems = config_problems(cfg);
    EXPECT_TRUE(mentions(problems, "DETECTION_THRESHOLD"));
    EXPECT_TRUE(mentions(problems, "CHECK_INTERVAL_SECONDS"));
    EXPECT_TRUE(mentions(problems, "MOTION_BLUR_KERNEL"));
    EXPECT_THROW(validate_config(cfg), ConfigError);
}

TEST_F(ConfigTest, RetryBoundsMustBeOrdered) {
    AppConfig cfg = parse({"--stream-retry-min", "10", "--stream-retry-max", "5"});
    EXPECT_TRUE(mentions(config_problems(cfg), "STREAM_RETRY_MAX"));
}

TEST_F(ConfigTest, EmptyMqttHostSkipsTopicChecks) {
    AppConfig cfg = parse({"--mqtt-host", "", "--topic-failure", ""});
    EXPECT_TRUE(config_problems(cfg).empty());
    EXPECT_TRUE(mentions(config_warnings(cfg), "MQTT_BROKER_HOST is empty"));
}

TEST_F(ConfigTest, WarnsAboutPlaceholderDefaults) {
    auto warnings = config_warnings(parse({}));
    EXPECT_TRUE(mentions(warnings, "RTSP_STREAM_URL"));
    EXPECT_TRUE(mentions(warnings, "MQTT_BROKER_HOST"));
}
