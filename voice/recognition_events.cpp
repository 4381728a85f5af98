#include "recognition_events.hpp"

#include <nlohmann/json.hpp>

namespace Voice {

const char* toString(SessionErrorKind kind) {
    switch (kind) {
        case SessionErrorKind::Permission: return "permission";
        case SessionErrorKind::Auth:       return "auth";
        case SessionErrorKind::Connection: return "connection";
        case SessionErrorKind::Protocol:   return "protocol";
    }
    return "unknown";
}

static bool protocolError(SessionError* err, const std::string& detail) {
    if (err) {
        err->kind = SessionErrorKind::Protocol;
        err->code = "ERR_PROTOCOL_MALFORMED";
        err->detail = detail;
    }
    return false;
}

// ------------------------------------------------------------
// Parse one server message
// ------------------------------------------------------------
bool parseServerEvent(const std::string& text, ServerEvent& out, SessionError* err) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return protocolError(err, std::string("Invalid JSON: ") + e.what());
    }

    if (!j.is_object()) {
        return protocolError(err, "Event is not an object");
    }

    // Errors arrive without a message_type
    if (j.contains("error")) {
        if (!j["error"].is_string()) {
            return protocolError(err, "error field is not a string");
        }
        out = ServerError{ j["error"].get<std::string>() };
        return true;
    }

    if (!j.contains("message_type") || !j["message_type"].is_string()) {
        return protocolError(err, "Missing message_type");
    }

    const std::string type = j["message_type"].get<std::string>();

    try {
        if (type == "SessionBegins") {
            out = SessionBegins{ j.value("session_id", "") };
            return true;
        }
        if (type == "SessionTerminated") {
            out = SessionTerminated{};
            return true;
        }
        if (type == "PartialTranscript" || type == "FinalTranscript") {
            if (!j.contains("text") || !j["text"].is_string()) {
                return protocolError(err, type + " without text");
            }
            int64_t audioStart = j.value("audio_start", int64_t{0});
            std::string body = j["text"].get<std::string>();

            if (type == "PartialTranscript") {
                out = PartialTranscript{ audioStart, std::move(body) };
            } else {
                out = FinalTranscript{ audioStart, std::move(body) };
            }
            return true;
        }
    } catch (const nlohmann::json::exception& e) {
        return protocolError(err, type + " has a mistyped field: " + e.what());
    }

    return protocolError(err, "Unknown message_type: " + type);
}

std::string terminateMessage() {
    return nlohmann::json{{"terminate_session", true}}.dump();
}

// ------------------------------------------------------------
// InterimCoalescer
// ------------------------------------------------------------
std::string InterimCoalescer::update(int64_t audioStart, const std::string& text) {
    parts_[audioStart] = text;
    return combined();
}

void InterimCoalescer::erase(int64_t audioStart) {
    parts_.erase(audioStart);
}

void InterimCoalescer::clear() {
    parts_.clear();
}

std::string InterimCoalescer::combined() const {
    std::string out;
    for (const auto& [offset, text] : parts_) {
        (void)offset;
        if (text.empty()) continue;
        if (!out.empty()) out.push_back(' ');
        out += text;
    }

    size_t b = out.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = out.find_last_not_of(" \t\r\n");
    return out.substr(b, e - b + 1);
}

} // namespace Voice
