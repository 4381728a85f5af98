#pragma once
#include <string>
#include <vector>
#include <optional>

// Aligns a slide's first line with an entry of the event schedule
// (e.g. "Opening Prayer" slide -> "Opening prayer" session).
namespace Follow {

struct ScheduleMatchOptions {
    double matchThreshold   = 0.5;
    double containmentScore = 0.9;   // score when one text contains the other, clamped to [0,1]
};

// First line of the slide text, trimmed and lowercased
std::string firstLine(const std::string& text);

// Word similarity: words equal or containing each other, over the larger word count
double scheduleSimilarity(const std::string& a, const std::string& b);

// Index of the best matching session, if any scores >= threshold.
// An exact normalized match wins immediately.
std::optional<size_t> findMatchingSession(const std::string& slideFirstLine,
                                          const std::vector<std::string>& sessions,
                                          const ScheduleMatchOptions& options = {});

// Session titles from [ "title", ... ] or [ {"title": ...}, ... ],
// optionally wrapped as { "sessions": [ ... ] }
bool loadSessionTitlesFromJson(const std::string& jsonText,
                               std::vector<std::string>& out,
                               std::string* err = nullptr);

bool loadSessionTitlesFromFile(const std::string& path,
                               std::vector<std::string>& out,
                               std::string* err = nullptr);

} // namespace Follow
