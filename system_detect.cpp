#include "system_detect.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cstdint>
#include <thread>

// =========================================================
// Platform headers
// =========================================================
#if defined(__APPLE__)
    #include <sys/types.h>
    #include <sys/sysctl.h>
    #include <sys/utsname.h>
#elif defined(__linux__)
    #include <sys/sysinfo.h>
    #include <sys/utsname.h>
    #include <unistd.h>
#endif

// =========================================================
// Helpers
// =========================================================
static void detectPlatform(SystemInfo& info) {
#if defined(__APPLE__) || defined(__linux__)
    struct utsname u;
    if (uname(&u) == 0) {
        info.osName = std::string(u.sysname) + " " + u.release;
        info.arch   = u.machine;
        return;
    }
#endif
    info.osName = "Unknown";
    info.arch   = "Unknown";
}

static int onlineCores() {
#if defined(__linux__)
    long n = sysconf(_SC_NPROCESSORS_ONLN);
    if (n > 0) return static_cast<int>(n);
#endif
    return static_cast<int>(std::thread::hardware_concurrency());
}

static long totalRamMB() {
#if defined(__APPLE__)
    int64_t mem = 0;
    size_t len = sizeof(mem);
    if (sysctlbyname("hw.memsize", &mem, &len, nullptr, 0) == 0) {
        return static_cast<long>(mem / (1024 * 1024));
    }
#elif defined(__linux__)
    struct sysinfo sys;
    if (sysinfo(&sys) == 0) {
        return static_cast<long>((static_cast<uint64_t>(sys.totalram) * sys.mem_unit) / (1024 * 1024));
    }
#endif
    return 0;
}

// =========================================================
// Main detection entry
// =========================================================
SystemInfo detectSystem() {
    SystemInfo info;
    detectPlatform(info);
    info.cpuCores = onlineCores();
    info.ramMB    = totalRamMB();

    info.suggestedModel   = chooseWhisperModel(info);
    info.suggestedThreads = recommendedThreads(info.cpuCores);
    return info;
}

void logSystemInfo(const SystemInfo& info) {
    LOG_DEBUG("SystemDetect", info.osName + " (" + info.arch + "), " +
                              std::to_string(info.cpuCores) + " cores, " +
                              std::to_string(info.ramMB) + " MB RAM");
    LOG_DEBUG("SystemDetect", "Suggested model: " + info.suggestedModel +
                              ", decode threads: " + std::to_string(info.suggestedThreads));
    LOG_PHASE("System detection", true);
}

// Unknown RAM (0) falls back to the smaller model
std::string chooseWhisperModel(const SystemInfo& info) {
    return info.ramMB > 8000 ? "small" : "base";
}

int recommendedThreads(int cpuCores) {
    return std::max(2, cpuCores - 2);
}
