// ═══════════════════════════════════════════════════════════════════
//  test_console.cpp - Tests for leveled console logging
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <bizgraph/console.h>
#include <sstream>

using namespace bizgraph;

class ConsoleTest : public ::testing::Test {
protected:
    std::ostringstream out;
    std::ostringstream err;

    void SetUp() override {
        console::setSink(&out, &err);
        console::setColor(false);
        console::setLevel(console::Level::Debug);
    }

    void TearDown() override {
        console::setSink(nullptr);
        console::setColor(true);
        console::setLevel(console::Level::Info);
    }
};

TEST_F(ConsoleTest, JoinsArgumentsWithSpaces) {
    console::log("loaded", 3, "businesses", true);
    EXPECT_NE(out.str().find("loaded 3 businesses true"), std::string::npos);
}

TEST_F(ConsoleTest, WarnAndErrorGoToErrorStream) {
    console::info("to out");
    console::warn("to err");
    console::error("also err");
    EXPECT_NE(out.str().find("to out"), std::string::npos);
    EXPECT_EQ(out.str().find("to err"), std::string::npos);
    EXPECT_NE(err.str().find("to err"), std::string::npos);
    EXPECT_NE(err.str().find("also err"), std::string::npos);
}

TEST_F(ConsoleTest, LevelThresholdDropsLowerMessages) {
    console::setLevel(console::Level::Warn);
    console::debug("hidden debug");
    console::info("hidden info");
    console::warn("visible warn");
    EXPECT_EQ(out.str().find("hidden"), std::string::npos);
    EXPECT_NE(err.str().find("visible warn"), std::string::npos);
}

TEST_F(ConsoleTest, SilentDropsEverything) {
    console::setLevel(console::Level::Silent);
    console::error("nothing");
    EXPECT_TRUE(out.str().empty());
    EXPECT_TRUE(err.str().empty());
}

TEST_F(ConsoleTest, NoColorCodesWhenDisabled) {
    console::info("plain");
    EXPECT_EQ(out.str().find("\033["), std::string::npos);
}

TEST_F(ConsoleTest, JsonArgumentsAreDumped) {
    console::log(nlohmann::json{{"k", 1}});
    EXPECT_NE(out.str().find("{\"k\":1}"), std::string::npos);
}

TEST_F(ConsoleTest, TimerReportsElapsed) {
    console::time("lookup");
    console::timeEnd("lookup");
    EXPECT_NE(out.str().find("lookup:"), std::string::npos);
    EXPECT_NE(out.str().find("ms"), std::string::npos);
}

TEST_F(ConsoleTest, UnknownTimerWarns) {
    console::timeEnd("never-started");
    EXPECT_NE(err.str().find("never-started"), std::string::npos);
}

TEST_F(ConsoleTest, LinesCarryLevelTag) {
    console::debug("probe");
    console::success("stored");
    console::error("broken");
    EXPECT_NE(out.str().find("DEBUG probe"), std::string::npos);
    EXPECT_NE(out.str().find("OK    stored"), std::string::npos);
    EXPECT_NE(err.str().find("ERROR broken"), std::string::npos);
}

TEST_F(ConsoleTest, SingleSinkTakesBothStreams) {
    std::ostringstream both;
    console::setSink(&both);
    console::info("one");
    console::warn("two");
    EXPECT_NE(both.str().find("one"), std::string::npos);
    EXPECT_NE(both.str().find("two"), std::string::npos);
}

TEST(ConsoleLevelTest, ParseLevel) {
    EXPECT_EQ(console::parseLevel("debug"), console::Level::Debug);
    EXPECT_EQ(console::parseLevel("silent"), console::Level::Silent);
    EXPECT_EQ(console::parseLevel("loud", console::Level::Warn), console::Level::Warn);
}
