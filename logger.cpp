#include "logger.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <mutex>
#include <vector>
#include <filesystem>
#include <chrono>
#include <atomic>

// =====================================================
// Globals
// =====================================================
#if defined(_DEBUG)
BuildMode g_buildMode = BuildMode::Debug;
#else
BuildMode g_buildMode = BuildMode::Release;
#endif

PhaseInfo g_phaseInfo{};
static std::mutex g_logMutex;

static std::atomic<LogLevel> g_logLevel{
    g_buildMode == BuildMode::Debug ? LogLevel::Trace : LogLevel::Debug };
static std::atomic<bool> g_logEcho{true};

// 🔹 Buffer for grouped phase logging
static bool g_buffering = false;
static std::vector<std::string> g_phaseBuffer;

// 🔹 File output stream
static std::ofstream g_logFile;

static thread_local std::string t_threadLabel;

// =====================================================
// Helpers
// =====================================================
static std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

static std::string nowTimestamp() {
    return formatTimestamp(std::chrono::system_clock::now());
}

static std::string basename(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return (pos == std::string::npos) ? path : path.substr(pos + 1);
}

// "[2024-01-01 10:00:00][DEBUG][pump][Recognition] "
static std::string linePrefix(const char* level, const std::string& tag) {
    std::string out = "[" + nowTimestamp() + "][" + level + "]";
    if (!t_threadLabel.empty()) {
        out += "[" + t_threadLabel + "]";
    }
    return out + "[" + tag + "] ";
}

static bool enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(g_logLevel.load());
}

// Caller holds g_logMutex
static void writeLine(const std::string& line) {
    if (g_logFile.is_open()) {
        g_logFile << line << std::endl;
    }

    if (g_logEcho.load()) {
        std::cerr << line << std::endl;
    }
}

// =====================================================
// Verbosity controls
// =====================================================
void setLogLevel(LogLevel level) {
    g_logLevel.store(level);
}

LogLevel getLogLevel() {
    return g_logLevel.load();
}

bool setLogLevelByName(const std::string& name) {
    if (name == "trace")      setLogLevel(LogLevel::Trace);
    else if (name == "debug") setLogLevel(LogLevel::Debug);
    else if (name == "error") setLogLevel(LogLevel::Error);
    else if (name == "off")   setLogLevel(LogLevel::Off);
    else return false;
    return true;
}

void setLogEcho(bool on) {
    g_logEcho.store(on);
}

void setThreadLabel(const std::string& label) {
    t_threadLabel = label;
}

const std::string& threadLabel() {
    return t_threadLabel;
}

// =====================================================
// Buffering controls
// =====================================================
void beginPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_buffering = true;
    g_phaseBuffer.clear();
}

void endPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    for (auto& line : g_phaseBuffer) {
        writeLine(line);
    }
    g_phaseBuffer.clear();
    g_buffering = false;
}

// =====================================================
// Phase Logging
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success)
{
    std::lock_guard<std::mutex> lock(g_logMutex);

    g_phaseInfo.timestamp = std::chrono::system_clock::now();
    g_phaseInfo.fileName  = basename(file);
    g_phaseInfo.phaseName = phase;
    g_phaseInfo.thread    = t_threadLabel.empty() ? "main" : t_threadLabel;
    g_phaseInfo.success   = success;

    std::ostringstream oss;
    oss << "| " << formatTimestamp(g_phaseInfo.timestamp)
        << " | " << g_phaseInfo.thread
        << " | " << g_phaseInfo.fileName
        << " | " << g_phaseInfo.phaseName
        << " | " << (g_phaseInfo.success ? "true" : "false")
        << " |";

    std::string entry = oss.str();

    if (g_buffering) {
        g_phaseBuffer.push_back(entry);
    } else {
        writeLine(entry);
    }
}

// =====================================================
// Debug / Trace / Error Logging
// =====================================================
void logDebug(const std::string& tag, const std::string& msg) {
    if (!enabled(LogLevel::Debug)) return;
    std::lock_guard<std::mutex> lock(g_logMutex);
    writeLine(linePrefix("DEBUG", tag) + msg);
}

void logTrace(const std::string& tag, const std::string& msg) {
    if (!enabled(LogLevel::Trace)) return;
    std::lock_guard<std::mutex> lock(g_logMutex);
    writeLine(linePrefix("TRACE", tag) + msg);
}

void logError(const std::string& tag, const std::string& msg) {
    if (!enabled(LogLevel::Error)) return;
    std::lock_guard<std::mutex> lock(g_logMutex);
    writeLine(linePrefix("ERROR", tag) + msg);
}

// =====================================================
// Lifecycle
// =====================================================
namespace fs = std::filesystem;

void initLogger(const std::string& filename) {
    std::lock_guard<std::mutex> lock(g_logMutex);

    if (g_logFile.is_open()) {
        g_logFile.close();
    }

    fs::path logPath = fs::absolute(filename);
    g_logFile.open(logPath, std::ios::out | std::ios::app);

    if (g_logFile.is_open()) {
        g_logFile << "==== SlideFollow Log Started ====" << std::endl;

        std::string msg = "[" + nowTimestamp() + "][Logger] Writing logs to: " + logPath.string();
        std::cerr << msg << std::endl;
        g_logFile << msg << std::endl;
    } else {
        std::cerr << "[Logger] ERROR: Could not open log file: "
                  << logPath.string() << std::endl;
    }
}

void shutdownLogger() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logFile.is_open()) {
        g_logFile << "==== SlideFollow Log Ended ====" << std::endl;
        g_logFile.close();
    }
}
