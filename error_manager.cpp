#include "error_manager.hpp"
#include "logger.hpp"

#include <fstream>
#include <filesystem>

// ------------------------------------------------------------
// ErrorManager implementation
// ------------------------------------------------------------
nlohmann::json ErrorManager::errors;
nlohmann::json ErrorManager::root;

void ErrorManager::loadFromJson(const nlohmann::json& table) {
    errors = table;
    if (errors.contains("errors") && errors["errors"].is_object()) {
        root = errors["errors"];
    } else {
        root = errors;
    }
}

bool ErrorManager::load(const std::string& path) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("ErrorManager", "Could not open " + path);
        return false;
    }

    try {
        nlohmann::json table;
        in >> table;
        loadFromJson(table);

        LOG_DEBUG("ErrorManager", "Loaded " + std::to_string(root.size()) +
                                  " error codes from: " + fs::absolute(path).string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("ErrorManager", "Failed to parse " + path + " -> " + e.what());
        return false;
    }
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    if (root.contains(code) && root[code].contains("user")) {
        return root[code]["user"].get<std::string>();
    }
    return "[Error] Unknown error code: " + code;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    if (root.contains(code) && root[code].contains("debug")) {
        return root[code]["debug"].get<std::string>();
    }
    return "[Debug] No debug message for code: " + code;
}

CommandResult ErrorManager::report(const std::string& code, const std::string& detail) {
    CommandResult result;
    result.success   = false;
    result.message   = getUserMessage(code);
    result.errorCode = code;

    std::string debugMsg = getDebugMessage(code);
    if (!detail.empty()) {
        debugMsg += " (" + detail + ")";
    }
    LOG_ERROR("ErrorManager", code + " -> " + debugMsg);
    return result;
}
