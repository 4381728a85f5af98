#pragma once
#include <chrono>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace Net {

// Exponential backoff: attempt n (1-based) waits min(base * 2^n, max)
struct ReconnectPolicy {
    bool enabled = true;
    int maxAttempts = 10;
    int64_t baseDelayMs = 1000;
    int64_t maxDelayMs = 30000;

    bool shouldRetry(int attempt) const;
    std::chrono::milliseconds nextDelay(int attempt) const;
};

// Missing keys keep the values of `defaults`
ReconnectPolicy reconnectPolicyFromJson(const nlohmann::json& section,
                                        const ReconnectPolicy& defaults);

} // namespace Net
