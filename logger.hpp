#pragma once
#include <string>

// =====================================================
// Levels (ordered: a threshold drops everything below it)
// =====================================================
enum class LogLevel {
    Trace,
    Debug,
    Phase,
    Error
};

const char* toString(LogLevel level);

// =====================================================
// Lifecycle
// =====================================================
// Opens (appends to) the log file and restarts the session clock.
// Lines logged before initLogger() only reach the console.
void initLogger(const std::string& filename);
void shutdownLogger();

// Lines below the threshold are dropped everywhere. Default: Debug.
void setLogLevel(LogLevel level);
LogLevel logLevel();

// DEBUG/TRACE/PHASE lines are echoed to stderr only while console logging
// is on. ERROR lines and failed phases always reach stderr.
void setConsoleLogging(bool enabled);
bool consoleLoggingEnabled();

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
// Successful phases inside a group are held back and written as one block
// at endPhaseGroup(); a failed phase is written immediately.
void beginPhaseGroup();
void endPhaseGroup();

// =====================================================
// Macros for convenience
// =====================================================
#define LOG_PHASE(phase, success) logPhaseInternal(__FILE__, phase, success)
#define LOG_DEBUG(tag, msg) logDebug(tag, msg)
#define LOG_TRACE(tag, msg) logTrace(tag, msg)
#define LOG_ERROR(tag, msg) logError(tag, msg)
