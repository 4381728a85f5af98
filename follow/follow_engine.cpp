#include "follow_engine.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace Follow {

// Weights of the two partial scores
constexpr double OVERLAP_WEIGHT = 0.65;
constexpr double ORDERED_WEIGHT = 0.35;

const char* toString(MatchReason reason) {
    switch (reason) {
        case MatchReason::Sequential: return "sequential";
        case MatchReason::Fallback:   return "fallback";
        case MatchReason::End:        return "end";
    }
    return "unknown";
}

// ============================================================
// Scoring primitives
// ============================================================
std::vector<std::string> normalizeTokens(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    for (unsigned char c : text) {
        char lower = static_cast<char>(std::tolower(c));
        bool keep = (lower >= 'a' && lower <= 'z') ||
                    (lower >= '0' && lower <= '9') ||
                    lower == '\'';
        if (keep) {
            current.push_back(lower);
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

double orderedMatchRatio(const std::vector<std::string>& source,
                         const std::vector<std::string>& target) {
    if (target.empty()) return 0.0;

    size_t matched = 0;
    for (const auto& token : source) {
        if (token == target[matched]) {
            if (++matched >= target.size()) break;
        }
    }
    return static_cast<double>(matched) / static_cast<double>(target.size());
}

double overlapRatio(const std::vector<std::string>& source,
                    const std::vector<std::string>& target) {
    if (target.empty()) return 0.0;

    std::unordered_set<std::string> sourceSet(source.begin(), source.end());
    std::unordered_set<std::string> targetSet(target.begin(), target.end());

    size_t overlap = 0;
    for (const auto& token : targetSet) {
        if (sourceSet.count(token)) ++overlap;
    }
    return static_cast<double>(overlap) / static_cast<double>(targetSet.size());
}

double scoreSlideMatch(const std::vector<std::string>& chunkTokens,
                       const std::vector<std::string>& slideTokens) {
    if (slideTokens.empty()) return 0.0;
    return overlapRatio(chunkTokens, slideTokens) * OVERLAP_WEIGHT +
           orderedMatchRatio(chunkTokens, slideTokens) * ORDERED_WEIGHT;
}

// ============================================================
// Helpers
// ============================================================
namespace {

struct Candidate {
    const Slide* slide;
    std::vector<std::string> tokens;
    bool eligible;
};

std::vector<Candidate> buildCandidates(const std::vector<Slide>& ordered) {
    std::vector<Candidate> out;
    out.reserve(ordered.size());
    for (const auto& slide : ordered) {
        bool eligible = isEligible(slide);
        out.push_back({ &slide,
                        eligible ? normalizeTokens(slide.text) : std::vector<std::string>{},
                        eligible });
    }
    return out;
}

std::vector<std::string> appendToWindow(const std::vector<std::string>& window,
                                        const std::vector<std::string>& tokens,
                                        int windowWords) {
    std::vector<std::string> out;
    out.reserve(window.size() + tokens.size());
    out.insert(out.end(), window.begin(), window.end());
    out.insert(out.end(), tokens.begin(), tokens.end());

    size_t limit = windowWords > 0 ? static_cast<size_t>(windowWords) : 0;
    if (out.size() > limit) {
        out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return out;
}

bool reachedEndOfSlide(const std::vector<std::string>& slideTokens,
                       const std::vector<std::string>& window,
                       const FollowSettings& settings) {
    if (!settings.enableEndAdvance) return false;
    if (settings.endTriggerTailWords <= 0) return false;

    size_t tailLen = std::min(slideTokens.size(),
                              static_cast<size_t>(settings.endTriggerTailWords));
    if (tailLen == 0) return false;

    std::vector<std::string> tail(slideTokens.end() - static_cast<std::ptrdiff_t>(tailLen),
                                  slideTokens.end());

    size_t recentLen = std::max(static_cast<size_t>(settings.endTriggerTailWords) * 4, tailLen);
    recentLen = std::min(recentLen, window.size());
    std::vector<std::string> recent(window.end() - static_cast<std::ptrdiff_t>(recentLen),
                                    window.end());

    return orderedMatchRatio(recent, tail) >= settings.endTriggerThreshold;
}

// Highest score in [first, last]; strict comparison keeps the earliest on ties
std::optional<MatchResult> bestInRange(const std::vector<Candidate>& candidates,
                                       const std::vector<std::string>& chunkTokens,
                                       size_t first, size_t last,
                                       MatchReason reason) {
    std::optional<MatchResult> best;
    for (size_t i = first; i <= last && i < candidates.size(); ++i) {
        const auto& c = candidates[i];
        if (!c.eligible) continue;
        double score = scoreSlideMatch(chunkTokens, c.tokens);
        if (!best || score > best->score) {
            best = MatchResult{ c.slide->id, score, reason };
        }
    }
    return best;
}

bool accepts(const std::optional<MatchResult>& best,
             const FollowState& state,
             const FollowSettings& settings) {
    return best &&
           best->score >= settings.matchThreshold &&
           (!state.currentSlideId || best->slideId != *state.currentSlideId);
}

} // namespace

// ============================================================
// Engine
// ============================================================
FollowOutcome applyFollow(const std::string& chunk,
                          const std::vector<Slide>& slides,
                          const FollowState& state,
                          const FollowSettings& settings,
                          bool allowMatch,
                          TimePoint now) {
    const std::vector<std::string> chunkTokens = normalizeTokens(chunk);

    FollowOutcome outcome;
    outcome.nextState = state;
    outcome.nextState.transcriptTokens =
        appendToWindow(state.transcriptTokens, chunkTokens, settings.transcriptWindowWords);

    if (!settings.enabled || !allowMatch) {
        return outcome;
    }
    if (chunkTokens.empty() || chunkTokens.size() < static_cast<size_t>(std::max(settings.minWords, 0))) {
        return outcome;
    }
    if (state.lastAdvanceAt) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - *state.lastAdvanceAt);
        if (elapsed.count() < settings.cooldownMs) {
            return outcome;
        }
    }

    const std::vector<Slide> ordered = orderedSlides(slides);
    if (ordered.empty()) {
        return outcome;
    }
    const std::vector<Candidate> candidates = buildCandidates(ordered);

    std::optional<size_t> currentIndex;
    if (state.currentSlideId) {
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (candidates[i].slide->id == *state.currentSlideId) {
                currentIndex = i;
                break;
            }
        }
    }

    if (currentIndex) {
        const Candidate& current = candidates[*currentIndex];

        // End of the current slide: hand over to the next eligible one
        if (current.eligible &&
            reachedEndOfSlide(current.tokens, outcome.nextState.transcriptTokens, settings)) {
            for (size_t i = *currentIndex + 1; i < candidates.size(); ++i) {
                if (candidates[i].eligible) {
                    outcome.match = MatchResult{ candidates[i].slide->id, 1.0, MatchReason::End };
                    return outcome;
                }
            }
        }

        // Lookahead window starting at the current slide
        size_t last = *currentIndex + static_cast<size_t>(std::max(settings.maxLookahead, 0));
        auto sequential = bestInRange(candidates, chunkTokens, *currentIndex, last,
                                      MatchReason::Sequential);
        if (accepts(sequential, state, settings)) {
            outcome.match = sequential;
            return outcome;
        }
    }

    // Full scan: recovers when the speaker jumps away from the tracked slide
    auto fallback = bestInRange(candidates, chunkTokens, 0, candidates.size() - 1,
                                MatchReason::Fallback);
    if (accepts(fallback, state, settings)) {
        outcome.match = fallback;
    }
    return outcome;
}

FollowState acceptMatch(const FollowState& state, const MatchResult& match, TimePoint now) {
    FollowState next = state;
    next.currentSlideId = match.slideId;
    next.lastAdvanceAt = now;
    return next;
}

} // namespace Follow
