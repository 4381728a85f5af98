#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <cmath>

#include "voice/whisper_session.hpp"
#include "test_fakes.hpp"

using namespace Voice;

TEST(WhisperConfig, ReadsSection) {
    auto c = whisperConfigFromJson(nlohmann::json{ {"model", "ggml-tiny.bin"}, {"silence_timeout_ms", 800} });
    EXPECT_EQ(c.model, "ggml-tiny.bin");
    EXPECT_EQ(c.silenceTimeoutMs, 800);
    EXPECT_EQ(c.language, "en");
    EXPECT_EQ(c.maxUtteranceMs, 30000);

    EXPECT_EQ(whisperConfigFromJson(nlohmann::json{ {"max_utterance_ms", 15000} }).maxUtteranceMs, 15000);
}

TEST(WhisperUtterance, ClosesAfterSilence) {
    WhisperConfig c;
    c.silenceTimeoutMs = 1200;

    EXPECT_FALSE(utteranceComplete(0, 5000, c));
    EXPECT_FALSE(utteranceComplete(16000, 1200, c));
    EXPECT_TRUE(utteranceComplete(16000, 1201, c));
}

TEST(WhisperUtterance, ContinuousSpeechIsCappedAtTheWhisperWindow) {
    WhisperConfig c;
    EXPECT_EQ(maxUtteranceSamples(c), 16000u * 30);

    // Never silent, still finalized once full
    EXPECT_FALSE(utteranceComplete(16000 * 30 - 1, 0, c));
    EXPECT_TRUE(utteranceComplete(16000 * 30, 0, c));

    c.maxUtteranceMs = 10000;
    EXPECT_EQ(maxUtteranceSamples(c), 160000u);
    EXPECT_TRUE(utteranceComplete(160000, 0, c));

    // Longer settings cannot exceed what one decode can see
    c.maxUtteranceMs = 120000;
    EXPECT_EQ(maxUtteranceSamples(c), 16000u * 30);
}

TEST(RmsLevel, Basics) {
    EXPECT_DOUBLE_EQ(rmsLevel({}), 0.0);
    EXPECT_DOUBLE_EQ(rmsLevel({ 0.5f, -0.5f, 0.5f, -0.5f }), 0.5);
    EXPECT_NEAR(rmsLevel({ 1.0f, 0.0f }), std::sqrt(0.5), 1e-9);
}

TEST(WhisperSession, MissingModelFailsBeforeMicrophone) {
    auto audio = std::make_unique<TestFakes::FakeAudioSource>();
    auto* mic = audio.get();

    WhisperSession session(WhisperConfig{}, "/nonexistent/models/ggml-none.bin",
                           Audio::CaptureFormat{}, std::move(audio));
    EXPECT_EQ(session.name(), "whisper");

    std::vector<SessionError> errors;
    auto sub = session.subscribe({ nullptr, nullptr,
                                   [&errors](const SessionError& e) { errors.push_back(e); },
                                   nullptr });

    StartResult r = session.start().get();
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error.code, "ERR_WHISPER_MODEL");
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_EQ(mic->opens.load(), 0);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, SessionErrorKind::Connection);
}
