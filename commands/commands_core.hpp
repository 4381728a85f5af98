#pragma once
#include <string>
#include <unordered_map>
#include <memory>
#include <utility>

namespace App { class Orchestrator; }
namespace Net { class SyncClient; }

// ------------------------------------------------------------
// CommandResult: unified return type for all commands
// ------------------------------------------------------------
struct CommandResult {
    std::string message;    // user-facing text
    bool success = false;   // true if command succeeded
    std::string errorCode;  // optional error code for ErrorManager/Logger
};

// ------------------------------------------------------------
// What commands operate on (set once by main)
// ------------------------------------------------------------
struct CommandContext {
    App::Orchestrator* orchestrator = nullptr;
    Net::SyncClient* sync = nullptr;       // null when sync is off
    bool quitRequested = false;
};

// ------------------------------------------------------------
// Function pointer type for commands
// ------------------------------------------------------------
using CommandFunc = CommandResult(*)(const std::string& arg);

// ------------------------------------------------------------
// Globals (declared here, defined in commands_core.cpp)
// ------------------------------------------------------------
extern std::unordered_map<std::string, CommandFunc> commandMap;
extern CommandContext g_commandContext;

// ------------------------------------------------------------
// Public API
// ------------------------------------------------------------
std::pair<std::string, std::string> parseInput(const std::string& input);
std::string fuzzyMatch(const std::string& input);
CommandResult dispatchCommand(const std::string& cmd, const std::string& arg);

// Parses, dispatches and prints one REPL line
CommandResult handleCommand(const std::string& line);

#include "commands_follow.hpp"
