#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "commands/commands_core.hpp"
#include "orchestrator/orchestrator.hpp"
#include "bootstrap_config.hpp"
#include "error_manager.hpp"

namespace {

class CommandsTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorManager::loadFromJson(bootstrap_config::defaultErrors());

        Follow::FollowSettings s;
        s.cooldownMs = 0;
        s.minWords = 2;
        orch_ = std::make_unique<App::Orchestrator>(loop_, s, Net::ReconnectPolicy{ false, 1, 1, 1 });
        orch_->setSlides({
            { "a", "Amazing grace how sweet the sound", 0 },
            { "b", "That saved a wretch like me", 1 },
            { "c", "I once was lost but now am found", 2 },
        });

        g_commandContext = CommandContext{};
        g_commandContext.orchestrator = orch_.get();
    }

    void TearDown() override {
        g_commandContext = CommandContext{};
    }

    App::EventLoop loop_;
    std::unique_ptr<App::Orchestrator> orch_;
};

} // namespace

TEST(CommandParsing, SplitsFirstWord) {
    auto [cmd, arg] = parseInput("  goto   v2  ");
    EXPECT_EQ(cmd, "goto");
    EXPECT_EQ(arg, "v2");

    auto [only, none] = parseInput("status");
    EXPECT_EQ(only, "status");
    EXPECT_EQ(none, "");

    auto [say, text] = parseInput("say in the beginning");
    EXPECT_EQ(say, "say");
    EXPECT_EQ(text, "in the beginning");
}

TEST(CommandParsing, FuzzyMatchCorrectsOneEdit) {
    EXPECT_EQ(fuzzyMatch("nxt"), "next");
    EXPECT_EQ(fuzzyMatch("pre"), "prev");
    EXPECT_EQ(fuzzyMatch("stat"), "start");
    EXPECT_EQ(fuzzyMatch("xyzzy"), "xyzzy");
}

TEST_F(CommandsTest, UnknownCommand) {
    auto r = handleCommand("xyzzy");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorCode, "ERR_CORE_UNKNOWN_COMMAND");
    EXPECT_NE(r.message.find(": xyzzy"), std::string::npos);
}

TEST_F(CommandsTest, EmptyLineIsNoOp) {
    auto r = handleCommand("   ");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.errorCode, "ERR_NONE");
}

TEST_F(CommandsTest, NotReadyWithoutOrchestrator) {
    g_commandContext.orchestrator = nullptr;
    auto r = handleCommand("next");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorCode, "ERR_CORE_NOT_READY");
}

TEST_F(CommandsTest, GotoIsCaseInsensitiveOnTheCommand) {
    auto r = handleCommand("GOTO b");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(orch_->liveSlideId(), std::optional<std::string>("b"));

    r = handleCommand("goto");
    EXPECT_EQ(r.errorCode, "ERR_SLIDE_MISSING_ID");

    r = handleCommand("goto zz");
    EXPECT_EQ(r.errorCode, "ERR_SLIDE_NOT_FOUND");
    EXPECT_EQ(orch_->liveSlideId(), std::optional<std::string>("b"));
}

TEST_F(CommandsTest, NextAndPrev) {
    EXPECT_TRUE(handleCommand("next").success);
    EXPECT_EQ(orch_->liveSlideId(), std::optional<std::string>("a"));

    handleCommand("next");
    handleCommand("next");
    auto r = handleCommand("next");
    EXPECT_TRUE(r.success);
    EXPECT_NE(r.message.find("last slide"), std::string::npos);

    handleCommand("prev");
    EXPECT_EQ(orch_->liveSlideId(), std::optional<std::string>("b"));
}

TEST_F(CommandsTest, SayFeedsTheFollowEngine) {
    auto r = handleCommand("say that saved a wretch like me");
    EXPECT_TRUE(r.success);
    EXPECT_NE(r.message.find("Live: b"), std::string::npos);

    r = handleCommand("say");
    EXPECT_EQ(r.errorCode, "ERR_SAY_NO_TEXT");
}

TEST_F(CommandsTest, PauseStopsAdvancing) {
    handleCommand("pause");
    auto r = handleCommand("say that saved a wretch like me");
    EXPECT_NE(r.message.find("No change"), std::string::npos);
    EXPECT_FALSE(orch_->liveSlideId().has_value());

    handleCommand("resume");
    EXPECT_TRUE(orch_->allowMatch());
}

TEST_F(CommandsTest, ResetForgetsLiveSlide) {
    handleCommand("goto c");
    handleCommand("reset");
    EXPECT_FALSE(orch_->liveSlideId().has_value());
}

TEST_F(CommandsTest, StartWithoutBackendFails) {
    auto r = handleCommand("start");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorCode, "ERR_RECOGNITION_START");
}

TEST_F(CommandsTest, StatusAndSlidesListing) {
    handleCommand("goto a");
    auto status = handleCommand("status");
    EXPECT_TRUE(status.success);
    EXPECT_NE(status.message.find("live slide:   a"), std::string::npos);
    EXPECT_NE(status.message.find("sync:         off"), std::string::npos);

    auto slides = handleCommand("slides");
    EXPECT_NE(slides.message.find(" > a"), std::string::npos);

    auto bad = handleCommand("slides /nonexistent/slides.json");
    EXPECT_EQ(bad.errorCode, "ERR_SLIDES_LOAD");
}

TEST_F(CommandsTest, ScheduleAlignsSlideFirstLines) {
    orch_->setSlides({
        { "s1", "Opening Prayer\nLord we gather", 0 },
        { "s2", "Closing song", 1 },
        { "s3", "Untitled thoughts", 2 },
    });
    const std::string path = testing::TempDir() + "slidefollow_schedule_test.json";
    { std::ofstream(path) << R"(["Opening prayer", "Sermon", "Closing song"])"; }

    auto r = handleCommand("schedule " + path);
    std::remove(path.c_str());

    EXPECT_TRUE(r.success);
    EXPECT_NE(r.message.find("2 of 3 slides aligned with 3 sessions"), std::string::npos);
    EXPECT_NE(r.message.find("s1  -> Opening prayer"), std::string::npos);
    EXPECT_NE(r.message.find("s3  -> (no session)"), std::string::npos);

    EXPECT_EQ(handleCommand("schedule").errorCode, "ERR_SCHEDULE_MISSING_FILE");
    EXPECT_EQ(handleCommand("schedule /nonexistent/x.json").errorCode, "ERR_SCHEDULE_LOAD");
}

TEST_F(CommandsTest, QuitRequestsExit) {
    EXPECT_TRUE(handleCommand("quit").success);
    EXPECT_TRUE(g_commandContext.quitRequested);
}
