#include <gtest/gtest.h>

#include "printmon/control_api.hpp"
#include "printmon/server_app.hpp"

using namespace printmon;

TEST(ParseControlCommand, AcceptsBothCommandsCaseInsensitive) {
    EXPECT_TRUE(parse_control_command(R"({"command": "standby"})") == ControlCommand::Standby);
    EXPECT_TRUE(parse_control_command(R"({"command": "STANDBY"})") == ControlCommand::Standby);
    EXPECT_TRUE(parse_control_command(R"({"command": "active"})") == ControlCommand::Active);
    EXPECT_TRUE(parse_control_command(R"({"command": "Active", "source": "ha"})") == ControlCommand::Active);
}

TEST(ParseControlCommand, RejectsEverythingElse) {
    EXPECT_FALSE(parse_control_command("standby").has_value());
    EXPECT_FALSE(parse_control_command("").has_value());
    EXPECT_FALSE(parse_control_command(R"({"command": "reboot"})").has_value());
    EXPECT_FALSE(parse_control_command(R"({"cmd": "standby"})").has_value());
    EXPECT_FALSE(parse_control_command(R"({"command": 1})").has_value());
    EXPECT_FALSE(parse_control_command(R"(["standby"])").has_value());
}

TEST(HttpStatusFor, MapsOutcomes) {
    EXPECT_EQ(http_status_for(OutcomeCode::Succeeded), 200);
    EXPECT_EQ(http_status_for(OutcomeCode::Already), 200);
    EXPECT_EQ(http_status_for(OutcomeCode::Disabled), 400);
    EXPECT_EQ(http_status_for(OutcomeCode::Busy), 409);
    EXPECT_EQ(http_status_for(OutcomeCode::Failed), 500);
    EXPECT_EQ(http_status_for(OutcomeCode::TimedOut), 500);
}
