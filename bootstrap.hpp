#pragma once
#include <filesystem>

#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "system_detect.hpp"

// Everything main() needs before the first sample is captured
struct BootstrapResult {
    SessionResult status;
    Settings settings;
    SystemInfo system;
    std::filesystem::path modelPath;
};

// Config file, error catalogue, CLI overrides, system detection and model
// resolution, in that order. status.success is false on the first fatal step.
BootstrapResult runBootstrapChecks(const CliOptions& cli);
