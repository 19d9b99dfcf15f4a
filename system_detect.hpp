#pragma once
#include <string>

// =========================================================
// System information structure
// =========================================================
struct SystemInfo {
    std::string osName;
    std::string arch;

    int cpuCores = 0;
    long ramMB = 0;

    std::string suggestedModel;
    int suggestedThreads = 2;
};

// =========================================================
// Functions
// =========================================================
SystemInfo detectSystem();
void logSystemInfo(const SystemInfo& info);
std::string chooseWhisperModel(const SystemInfo& info);

// Leave two cores for capture and the rest of the desktop, never below 2
int recommendedThreads(int cpuCores);
