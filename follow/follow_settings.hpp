#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace Follow {

struct FollowSettings {
    bool    enabled               = true;
    double  matchThreshold        = 0.55;  // [0,1]
    double  endTriggerThreshold   = 0.8;   // [0,1]
    int     endTriggerTailWords   = 4;
    bool    enableEndAdvance      = true;
    int     minWords              = 3;
    int64_t cooldownMs            = 2500;
    int     maxLookahead          = 2;
    int     transcriptWindowWords = 60;    // > 0
};

// Range check. On failure err receives the first offending field.
bool validateFollowSettings(const FollowSettings& settings, std::string* err = nullptr);

// Reads the "follow" config section on top of defaults.
// Returns false (and leaves out untouched) if a value is mistyped or out of range.
bool followSettingsFromJson(const nlohmann::json& section,
                            FollowSettings& out,
                            std::string* err = nullptr);

nlohmann::json followSettingsToJson(const FollowSettings& settings);

} // namespace Follow
