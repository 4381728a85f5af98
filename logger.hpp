#pragma once
#include <string>
#include <chrono>

// =====================================================
// Build Mode Enum
// =====================================================
enum class BuildMode {
    Debug,
    Release
};

// Global build mode (auto-detect from compiler flags)
extern BuildMode g_buildMode;

// =====================================================
// Verbosity
// =====================================================
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Error = 2,
    Off   = 3
};

// Lines below this level are dropped. Phase lines are always written.
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// "trace" | "debug" | "error" | "off"; unknown names keep the current level
bool setLogLevelByName(const std::string& name);

// Mirror every line to stderr (on by default)
void setLogEcho(bool enabled);

// =====================================================
// Thread labels
// =====================================================
// Short name printed on every line logged from the calling thread
// ("loop", "pump", "decode", "sync"). Empty clears it.
void setThreadLabel(const std::string& label);
const std::string& threadLabel();

// =====================================================
// Phase Info Struct (Release mode)
// =====================================================
struct PhaseInfo {
    std::chrono::system_clock::time_point timestamp; // when entered
    std::string fileName;    // file containing this phase
    std::string phaseName;   // descriptive phase string
    std::string thread;      // label of the thread that logged it
    bool success;            // true = success, false = failure
};

// Global storage for most recent phase
extern PhaseInfo g_phaseInfo;

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename);
void shutdownLogger();

// =====================================================
// Core Logging Functions
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success);

void logDebug(const std::string& tag, const std::string& msg);
void logTrace(const std::string& tag, const std::string& msg);
void logError(const std::string& tag, const std::string& msg);

// =====================================================
// Phase Group Controls (buffered block logging)
// =====================================================
void beginPhaseGroup();
void endPhaseGroup();

// =====================================================
// Macros for convenience
// =====================================================
#define LOG_PHASE(phase, success) logPhaseInternal(__FILE__, phase, success)
#define LOG_DEBUG(tag, msg) logDebug(tag, msg)
#define LOG_TRACE(tag, msg) logTrace(tag, msg)
#define LOG_ERROR(tag, msg) logError(tag, msg)
