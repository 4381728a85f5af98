#include "commands_core.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <vector>

// ------------------------------------------------------------
// Globals
// ------------------------------------------------------------
std::unordered_map<std::string, CommandFunc> commandMap;
CommandContext g_commandContext;

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
static int levenshteinDistance(const std::string& s1, const std::string& s2) {
    const size_t m = s1.size(), n = s2.size();
    std::vector<int> prev(n + 1), curr(n + 1);

    for (size_t j = 0; j <= n; j++) prev[j] = static_cast<int>(j);

    for (size_t i = 1; i <= m; i++) {
        curr[0] = static_cast<int>(i);
        for (size_t j = 1; j <= n; j++) {
            int cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;
            curr[j] = std::min({ prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost });
        }
        prev.swap(curr);
    }
    return prev[n];
}

// ------------------------------------------------------------
// Command Registration
// ------------------------------------------------------------
static void initCommands() {
    if (!commandMap.empty()) return; // already initialized

    commandMap = {
        // --- Recognition ---
        {"start",   cmdStart},
        {"stop",    cmdStop},
        {"status",  cmdStatus},

        // --- Slides ---
        {"slides",  cmdSlides},
        {"goto",    cmdGoto},
        {"next",    cmdNext},
        {"prev",    cmdPrev},
        {"schedule", cmdSchedule},

        // --- Follow ---
        {"pause",   cmdPause},
        {"resume",  cmdResume},
        {"reset",   cmdReset},
        {"say",     cmdSay},

        // --- Interface ---
        {"help",    cmdShowHelp},
        {"quit",    cmdQuit}
    };
}

std::string fuzzyMatch(const std::string& input) {
    initCommands();

    std::string best = input;
    int bestDist = 2; // only allow corrections within distance < 2

    // Ties go to the alphabetically first command so the result is stable
    std::vector<std::string> keys;
    for (const auto& [key, _] : commandMap) keys.push_back(key);
    std::sort(keys.begin(), keys.end());

    for (const auto& key : keys) {
        int dist = levenshteinDistance(input, key);
        if (dist < bestDist) {
            bestDist = dist;
            best = key;
        }
    }
    return best;
}

// ------------------------------------------------------------
// Core Dispatch
// ------------------------------------------------------------
std::pair<std::string, std::string> parseInput(const std::string& input) {
    std::string line = input;
    line.erase(0, std::min(line.find_first_not_of(" \t\r\n"), line.size()));
    auto last = line.find_last_not_of(" \t\r\n");
    line.erase(last == std::string::npos ? 0 : last + 1);

    auto pos = line.find(' ');
    if (pos == std::string::npos) {
        return {line, ""};
    }
    std::string arg = line.substr(pos + 1);
    arg.erase(0, std::min(arg.find_first_not_of(' '), arg.size()));
    return {line.substr(0, pos), arg};
}

CommandResult dispatchCommand(const std::string& cmd, const std::string& arg) {
    initCommands();

    auto it = commandMap.find(cmd);
    if (it != commandMap.end()) {
        LOG_TRACE("Commands", "Found handler for cmd=\"" + cmd + "\" arg=\"" + arg + "\"");
        try {
            return it->second(arg);
        } catch (const std::exception& e) {
            return ErrorManager::report("ERR_CMD_EXCEPTION", cmd + ": " + e.what());
        }
    }

    LOG_DEBUG("Commands", "Unknown command: \"" + cmd + "\"");
    CommandResult r = ErrorManager::report("ERR_CORE_UNKNOWN_COMMAND", cmd);
    r.message += ": " + cmd;
    return r;
}

// ------------------------------------------------------------
// handleCommand: one REPL line in, one result out
// ------------------------------------------------------------
CommandResult handleCommand(const std::string& line) {
    initCommands();

    auto [cmdRaw, arg] = parseInput(line);
    if (cmdRaw.empty()) return { "", true, "ERR_NONE" };

    std::string cmd = cmdRaw;
    std::transform(cmd.begin(), cmd.end(), cmd.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    // 🔹 Fuzzy match only when there is no direct hit
    if (commandMap.find(cmd) == commandMap.end()) {
        std::string corrected = fuzzyMatch(cmd);
        if (corrected != cmd) {
            LOG_DEBUG("Commands", "Corrected \"" + cmd + "\" -> \"" + corrected + "\"");
            cmd = corrected;
        }
    }

    CommandResult result = dispatchCommand(cmd, arg);

    // 🔹 Unified output block
    if (result.message.empty()) {
        result.message = "[no response configured]";
    }
    if (result.errorCode.empty()) result.errorCode = "ERR_NONE";

    (result.success ? std::cout : std::cerr) << result.message << std::endl;
    return result;
}
