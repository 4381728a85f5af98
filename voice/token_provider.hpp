#pragma once
#include <string>
#include <atomic>
#include <nlohmann/json_fwd.hpp>

#include "recognition_events.hpp"

namespace Voice {

// Exchanges the long-lived API key for a short-lived streaming token.
// Returns promptly with a Connection error once `cancelled` is set.
class TokenProvider {
public:
    virtual ~TokenProvider() = default;
    virtual bool fetchToken(std::string& token, SessionError* err,
                            const std::atomic<bool>& cancelled) = 0;
};

struct TokenConfig {
    std::string apiKey;
    std::string tokenUrl = "https://api.assemblyai.com/v2/realtime/token";
    int expiresInSeconds = 3600;
    int timeoutMs = 10000;
};

class HttpTokenProvider : public TokenProvider {
public:
    explicit HttpTokenProvider(TokenConfig config);
    bool fetchToken(std::string& token, SessionError* err,
                    const std::atomic<bool>& cancelled) override;

private:
    TokenConfig config_;
};

// Reads the token endpoint out of the "recognition" config section
TokenConfig tokenConfigFromJson(const nlohmann::json& section);

} // namespace Voice
