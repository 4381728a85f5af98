#pragma once

#include <string>
#include <nlohmann/json.hpp>

// Undefine Windows ERROR macro if it leaks in
#ifdef ERROR
#undef ERROR
#endif

#include "commands/commands_core.hpp"

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
namespace ErrorManager {
    // Load error codes from JSON (errors.json)
    bool load(const std::string& path);

    // Replace the table directly (bootstrap defaults, tests)
    void loadFromJson(const nlohmann::json& table);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Report an error (returns CommandResult).
    // detail is appended to the debug line, never shown to the user.
    CommandResult report(const std::string& code, const std::string& detail = "");

    // Internal storage
    extern nlohmann::json errors;
    extern nlohmann::json root;
}
