#include "reconnect_policy.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace Net {

bool ReconnectPolicy::shouldRetry(int attempt) const {
    return enabled && attempt >= 1 && attempt <= maxAttempts;
}

std::chrono::milliseconds ReconnectPolicy::nextDelay(int attempt) const {
    int64_t delay = std::max<int64_t>(0, baseDelayMs);
    int64_t cap = std::max<int64_t>(0, maxDelayMs);

    // Doubling stops at the cap so large attempt numbers cannot overflow
    for (int i = 0; i < attempt && delay < cap; ++i) {
        delay *= 2;
        if (delay == 0) break;
    }
    return std::chrono::milliseconds(std::min(delay, cap));
}

ReconnectPolicy reconnectPolicyFromJson(const nlohmann::json& section,
                                        const ReconnectPolicy& defaults) {
    ReconnectPolicy p = defaults;
    if (!section.is_object()) return p;

    p.enabled     = section.value("enabled", p.enabled);
    p.maxAttempts = section.value("max_attempts", p.maxAttempts);
    p.baseDelayMs = section.value("base_delay_ms", p.baseDelayMs);
    p.maxDelayMs  = section.value("max_delay_ms", p.maxDelayMs);
    return p;
}

} // namespace Net
