#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>

#include "slide.hpp"
#include "follow_settings.hpp"

// ------------------------------------------------------------
// Slide follow engine
//
// Decides from one finalized transcript chunk whether the live slide
// should change. applyFollow is pure: same inputs, same outcome, no
// hidden clock and no global state.
// ------------------------------------------------------------
namespace Follow {

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

enum class MatchReason {
    Sequential,
    Fallback,
    End
};

const char* toString(MatchReason reason);

struct MatchResult {
    std::string slideId;
    double score = 0.0;     // [0,1]
    MatchReason reason = MatchReason::Sequential;
};

struct FollowState {
    std::optional<std::string> currentSlideId;  // lookup only, never owns the slide
    std::optional<TimePoint> lastAdvanceAt;     // empty until the first accepted match
    std::vector<std::string> transcriptTokens;  // oldest first, bounded by the window
};

struct FollowOutcome {
    std::optional<MatchResult> match;
    FollowState nextState;
};

// ---------------- Scoring primitives ----------------

// Lowercase, keep [a-z0-9'], everything else separates words
std::vector<std::string> normalizeTokens(const std::string& text);

// Fraction of target matched in order by one left-to-right pass over source
double orderedMatchRatio(const std::vector<std::string>& source,
                         const std::vector<std::string>& target);

// Fraction of the target's distinct tokens present anywhere in source
double overlapRatio(const std::vector<std::string>& source,
                    const std::vector<std::string>& target);

// 0.65 * overlap + 0.35 * ordered
double scoreSlideMatch(const std::vector<std::string>& chunkTokens,
                       const std::vector<std::string>& slideTokens);

// ---------------- Engine ----------------

FollowOutcome applyFollow(const std::string& chunk,
                          const std::vector<Slide>& slides,
                          const FollowState& state,
                          const FollowSettings& settings,
                          bool allowMatch,
                          TimePoint now);

// State after the caller accepts a match: new current slide, cooldown restarted
FollowState acceptMatch(const FollowState& state, const MatchResult& match, TimePoint now);

} // namespace Follow
