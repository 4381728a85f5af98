#include "schedule_matcher.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace Follow {

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Lowercase, punctuation to spaces, collapse whitespace
static std::string normalizeForComparison(const std::string& text) {
    static const std::string PUNCT = ".,!?;:'\"()-";

    std::string spaced;
    spaced.reserve(text.size());
    for (unsigned char c : text) {
        if (PUNCT.find(static_cast<char>(c)) != std::string::npos || std::isspace(c)) {
            spaced.push_back(' ');
        } else {
            spaced.push_back(static_cast<char>(std::tolower(c)));
        }
    }

    std::istringstream iss(spaced);
    std::string word, out;
    while (iss >> word) {
        if (!out.empty()) out.push_back(' ');
        out += word;
    }
    return out;
}

static std::vector<std::string> words(const std::string& normalized) {
    std::istringstream iss(normalized);
    std::vector<std::string> out;
    std::string w;
    while (iss >> w) out.push_back(w);
    return out;
}

std::string firstLine(const std::string& text) {
    std::string line = text.substr(0, text.find('\n'));
    line = trim(line);
    std::transform(line.begin(), line.end(), line.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return line;
}

double scheduleSimilarity(const std::string& a, const std::string& b) {
    auto wordsA = words(normalizeForComparison(a));
    auto wordsB = words(normalizeForComparison(b));
    if (wordsA.empty() || wordsB.empty()) return 0.0;

    size_t matches = 0;
    for (const auto& wa : wordsA) {
        for (const auto& wb : wordsB) {
            if (wa == wb ||
                wa.find(wb) != std::string::npos ||
                wb.find(wa) != std::string::npos) {
                ++matches;
                break;
            }
        }
    }
    return static_cast<double>(matches) /
           static_cast<double>(std::max(wordsA.size(), wordsB.size()));
}

std::optional<size_t> findMatchingSession(const std::string& slideFirstLine,
                                          const std::vector<std::string>& sessions,
                                          const ScheduleMatchOptions& options) {
    if (trim(slideFirstLine).empty() || sessions.empty()) {
        return std::nullopt;
    }

    const double containment = std::clamp(options.containmentScore, 0.0, 1.0);
    const std::string slide = normalizeForComparison(slideFirstLine);

    std::optional<size_t> bestIndex;
    double bestScore = 0.0;

    for (size_t i = 0; i < sessions.size(); ++i) {
        const std::string session = normalizeForComparison(sessions[i]);
        if (session.empty()) continue;

        if (slide == session) {
            return i;
        }

        double score;
        if (slide.find(session) != std::string::npos || session.find(slide) != std::string::npos) {
            score = containment;
        } else {
            score = scheduleSimilarity(slideFirstLine, sessions[i]);
        }

        if (score >= options.matchThreshold && (!bestIndex || score > bestScore)) {
            bestIndex = i;
            bestScore = score;
        }
    }
    return bestIndex;
}

// ------------------------------------------------------------
// Schedule loading
// ------------------------------------------------------------
bool loadSessionTitlesFromJson(const std::string& jsonText,
                               std::vector<std::string>& out,
                               std::string* err) {
    try {
        nlohmann::json j = nlohmann::json::parse(jsonText);
        const nlohmann::json& list = (j.is_object() && j.contains("sessions")) ? j["sessions"] : j;

        if (!list.is_array()) {
            if (err) *err = "Expected an array of sessions";
            return false;
        }

        std::vector<std::string> titles;
        for (const auto& entry : list) {
            if (entry.is_string()) {
                titles.push_back(entry.get<std::string>());
            } else if (entry.is_object() && entry.contains("title") && entry["title"].is_string()) {
                titles.push_back(entry["title"].get<std::string>());
            } else {
                if (err) *err = "Session at position " + std::to_string(titles.size()) + " has no title";
                return false;
            }
        }

        out = std::move(titles);
        return true;
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }
}

bool loadSessionTitlesFromFile(const std::string& path,
                               std::vector<std::string>& out,
                               std::string* err) {
    std::ifstream f(path);
    if (!f) {
        if (err) *err = "Could not open file: " + path;
        return false;
    }

    std::stringstream buffer;
    buffer << f.rdbuf();
    return loadSessionTitlesFromJson(buffer.str(), out, err);
}

} // namespace Follow
