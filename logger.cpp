#include "logger.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

// =====================================================
// State
// =====================================================
namespace {

struct LoggerState {
    std::mutex mtx;
    std::ofstream file;
    LogLevel threshold = LogLevel::Debug;
    bool console = true;

    // Session clock: every line carries the offset since initLogger()
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

    // Short stable names for threads ("T1" = first thread that logged)
    std::map<std::thread::id, int> threadIds;

    bool grouping = false;
    std::vector<std::string> group;
};

LoggerState& state() {
    static LoggerState s;
    return s;
}

// Caller holds the mutex.
std::string prefix(LoggerState& s, LogLevel level) {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - s.start).count();

    auto id = std::this_thread::get_id();
    auto it = s.threadIds.find(id);
    if (it == s.threadIds.end()) {
        it = s.threadIds.emplace(id, static_cast<int>(s.threadIds.size()) + 1).first;
    }

    char buf[96];
    std::snprintf(buf, sizeof(buf), "[%02d:%02d:%02d.%03d][+%.3fs][T%d][%s]",
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms),
                  elapsed, it->second, toString(level));
    return buf;
}

// Caller holds the mutex.
void emit(LoggerState& s, const std::string& line, bool forceConsole) {
    if (s.file.is_open()) {
        s.file << line << '\n';
        s.file.flush();
    }
    if (forceConsole || s.console) {
        // Fresh line first so the live transcript row is left intact
        std::cerr << "\n" << line << std::endl;
    }
}

void write(LogLevel level, const std::string& tag, const std::string& msg) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (level < s.threshold) return;
    emit(s, prefix(s, level) + "[" + tag + "] " + msg, level == LogLevel::Error);
}

std::string baseName(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return (pos == std::string::npos) ? path : path.substr(pos + 1);
}

} // namespace

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Phase: return "PHASE";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);

    if (s.file.is_open()) {
        s.file.close();
    }
    s.start = std::chrono::steady_clock::now();

    fs::path logPath = fs::absolute(filename);
    s.file.open(logPath, std::ios::out | std::ios::app);
    if (!s.file.is_open()) {
        std::cerr << "[Logger] ERROR: Could not open log file: " << logPath.string() << std::endl;
        return;
    }
    s.file << "==== LiveScribe Log Started ====\n";
    emit(s, prefix(s, LogLevel::Debug) + "[Logger] Writing logs to: " + logPath.string(), false);
}

void shutdownLogger() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.grouping) {
        for (const auto& line : s.group) emit(s, line, false);
        s.group.clear();
        s.grouping = false;
    }
    if (s.file.is_open()) {
        s.file << "==== LiveScribe Log Ended ====" << std::endl;
        s.file.close();
    }
}

void setLogLevel(LogLevel level) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.threshold = level;
}

LogLevel logLevel() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    return s.threshold;
}

void setConsoleLogging(bool enabled) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.console = enabled;
}

bool consoleLoggingEnabled() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    return s.console;
}

// =====================================================
// Phase groups
// =====================================================
void beginPhaseGroup() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.grouping = true;
    s.group.clear();
}

void endPhaseGroup() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    for (const auto& line : s.group) {
        emit(s, line, false);
    }
    s.group.clear();
    s.grouping = false;
}

// =====================================================
// Phase / Debug / Trace / Error
// =====================================================
void logPhaseInternal(const std::string& file, const std::string& phase, bool success) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (success && LogLevel::Phase < s.threshold) return;

    std::string entry = prefix(s, LogLevel::Phase) + "[" + baseName(file) + "] " +
                        phase + (success ? " ok" : " FAILED");

    if (s.grouping && success) {
        s.group.push_back(entry);
    } else {
        emit(s, entry, !success);
    }
}

void logDebug(const std::string& tag, const std::string& msg) {
    write(LogLevel::Debug, tag, msg);
}

void logTrace(const std::string& tag, const std::string& msg) {
    write(LogLevel::Trace, tag, msg);
}

void logError(const std::string& tag, const std::string& msg) {
    write(LogLevel::Error, tag, msg);
}
