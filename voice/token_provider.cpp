#include "token_provider.hpp"
#include "logger.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <cstdint>

namespace Voice {

static bool authError(SessionError* err, const std::string& code, const std::string& detail) {
    if (err) {
        err->kind = SessionErrorKind::Auth;
        err->code = code;
        err->detail = detail;
    }
    return false;
}

TokenConfig tokenConfigFromJson(const nlohmann::json& section) {
    TokenConfig c;
    if (!section.is_object()) return c;

    c.apiKey           = section.value("api_key", c.apiKey);
    c.tokenUrl         = section.value("token_url", c.tokenUrl);
    c.expiresInSeconds = section.value("token_expires_in", c.expiresInSeconds);
    c.timeoutMs        = section.value("connect_timeout_ms", c.timeoutMs);
    return c;
}

HttpTokenProvider::HttpTokenProvider(TokenConfig config)
    : config_(std::move(config)) {}

static bool tokenCancelled(SessionError* err) {
    if (err) {
        err->kind = SessionErrorKind::Connection;
        err->code = "ERR_CONN_CLOSED";
        err->detail = "Token request cancelled";
    }
    return false;
}

bool HttpTokenProvider::fetchToken(std::string& token, SessionError* err,
                                   const std::atomic<bool>& cancelled) {
    if (cancelled) return tokenCancelled(err);
    if (config_.apiKey.empty()) {
        return authError(err, "ERR_AUTH_TOKEN", "API key not configured");
    }

    LOG_DEBUG("Token", "Requesting streaming token from " + config_.tokenUrl);

    auto r = cpr::Post(
        cpr::Url{ config_.tokenUrl },
        cpr::Header{ {"Authorization", config_.apiKey},
                     {"Content-Type", "application/json"} },
        cpr::Body{ nlohmann::json{{"expires_in", config_.expiresInSeconds}}.dump() },
        cpr::Timeout{ config_.timeoutMs },
        // Returning false aborts the transfer
        cpr::ProgressCallback{ [&cancelled](auto, auto, auto, auto, intptr_t) {
            return !cancelled.load();
        } });

    if (cancelled) return tokenCancelled(err);
    if (r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        if (err) {
            err->kind = SessionErrorKind::Connection;
            err->code = "ERR_CONN_TIMEOUT";
            err->detail = "Token request timed out: " + r.error.message;
        }
        return false;
    }
    if (r.error) {
        return authError(err, "ERR_AUTH_TOKEN", "Token request failed: " + r.error.message);
    }
    if (r.status_code == 401 || r.status_code == 403) {
        return authError(err, "ERR_AUTH_REJECTED",
                         "HTTP " + std::to_string(r.status_code) + " " + r.text);
    }
    if (r.status_code != 200) {
        return authError(err, "ERR_AUTH_TOKEN",
                         "HTTP " + std::to_string(r.status_code) + " " + r.text);
    }

    try {
        auto j = nlohmann::json::parse(r.text);
        std::string t = j.value("token", "");
        if (t.empty()) {
            return authError(err, "ERR_AUTH_TOKEN", "Token response missing `token`");
        }
        token = std::move(t);
        return true;
    } catch (const std::exception& e) {
        return authError(err, "ERR_AUTH_TOKEN", std::string("Bad token response: ") + e.what());
    }
}

} // namespace Voice
