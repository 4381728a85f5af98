#include "follow_settings.hpp"

#include <nlohmann/json.hpp>

namespace Follow {

static bool inUnitRange(double v) {
    return v >= 0.0 && v <= 1.0;
}

bool validateFollowSettings(const FollowSettings& s, std::string* err) {
    auto fail = [err](const std::string& msg) {
        if (err) *err = msg;
        return false;
    };

    if (!inUnitRange(s.matchThreshold))
        return fail("match_threshold must be within [0,1]");
    if (!inUnitRange(s.endTriggerThreshold))
        return fail("end_trigger_threshold must be within [0,1]");
    if (s.endTriggerTailWords < 0)
        return fail("end_trigger_tail_words must be >= 0");
    if (s.minWords < 0)
        return fail("min_words must be >= 0");
    if (s.cooldownMs < 0)
        return fail("cooldown_ms must be >= 0");
    if (s.maxLookahead < 0)
        return fail("max_lookahead must be >= 0");
    if (s.transcriptWindowWords <= 0)
        return fail("transcript_window_words must be > 0");
    return true;
}

bool followSettingsFromJson(const nlohmann::json& section,
                            FollowSettings& out,
                            std::string* err) {
    if (!section.is_object()) {
        if (err) *err = "follow section is not an object";
        return false;
    }

    FollowSettings s = out;
    try {
        s.enabled               = section.value("enabled", s.enabled);
        s.matchThreshold        = section.value("match_threshold", s.matchThreshold);
        s.endTriggerThreshold   = section.value("end_trigger_threshold", s.endTriggerThreshold);
        s.endTriggerTailWords   = section.value("end_trigger_tail_words", s.endTriggerTailWords);
        s.enableEndAdvance      = section.value("enable_end_advance", s.enableEndAdvance);
        s.minWords              = section.value("min_words", s.minWords);
        s.cooldownMs            = section.value("cooldown_ms", s.cooldownMs);
        s.maxLookahead          = section.value("max_lookahead", s.maxLookahead);
        s.transcriptWindowWords = section.value("transcript_window_words", s.transcriptWindowWords);
    } catch (const nlohmann::json::exception& e) {
        if (err) *err = std::string("follow section has a mistyped value: ") + e.what();
        return false;
    }

    if (!validateFollowSettings(s, err)) {
        return false;
    }

    out = s;
    return true;
}

nlohmann::json followSettingsToJson(const FollowSettings& s) {
    return {
        {"enabled", s.enabled},
        {"match_threshold", s.matchThreshold},
        {"end_trigger_threshold", s.endTriggerThreshold},
        {"end_trigger_tail_words", s.endTriggerTailWords},
        {"enable_end_advance", s.enableEndAdvance},
        {"min_words", s.minWords},
        {"cooldown_ms", s.cooldownMs},
        {"max_lookahead", s.maxLookahead},
        {"transcript_window_words", s.transcriptWindowWords}
    };
}

} // namespace Follow
