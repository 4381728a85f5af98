#include "resources.hpp"
#include "logger.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

#if defined(__APPLE__)
    #include <mach-o/dyld.h>
#elif defined(__linux__)
    #include <unistd.h>
    #include <climits>
#endif

namespace fs = std::filesystem;

// -------------------------------------------------------------
// Global state definitions
// -------------------------------------------------------------
nlohmann::json appConfig;

// -------------------------------------------------------------
// Locate resource root (prefer repo/resources over build/resources)
// -------------------------------------------------------------
std::string getResourcePath() {
#if defined(SLIDEFOLLOW_PORTABLE_ONLY)
    fs::path exePath;
  #if defined(__APPLE__)
    char buffer[1024];
    uint32_t size = sizeof(buffer);
    if (_NSGetExecutablePath(buffer, &size) == 0) {
        exePath = fs::path(buffer).parent_path();
    } else {
        exePath = fs::current_path();
    }
  #elif defined(__linux__)
    char buffer[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len > 0) {
        buffer[len] = '\0';
        exePath = fs::path(buffer).parent_path();
    } else {
        exePath = fs::current_path();
    }
  #else
    exePath = fs::current_path();
  #endif

    fs::path portablePath = exePath / "resources";
    if (fs::exists(portablePath)) {
        LOG_DEBUG("Resources", "Using portable resource path: " + portablePath.string());
        return portablePath.string();
    }
    return exePath.string();
#else
    fs::path buildPath   = fs::current_path() / "resources";
    fs::path projectPath = fs::current_path().parent_path() / "resources";

    // 🔹 Prefer project resources first
    if (fs::exists(projectPath)) {
        LOG_DEBUG("Resources", "Using resource path: " + projectPath.string());
        return projectPath.string();
    }
    if (fs::exists(buildPath)) {
        LOG_DEBUG("Resources", "Using fallback resource path: " + buildPath.string());
        return buildPath.string();
    }

    // Last resort: current working directory
    LOG_DEBUG("Resources", "Falling back to cwd: " + fs::current_path().string());
    return fs::current_path().string();
#endif
}
