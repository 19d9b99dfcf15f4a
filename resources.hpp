#pragma once
#include <string>
#include <filesystem>

// ------------------------------------------------------------
// Resource loading
// ------------------------------------------------------------

// Resource root: $LIVESCRIBE_RESOURCES, <cwd>/../resources, <cwd>/resources,
// <exe dir>/resources, then cwd
std::string getResourcePath();

// <resource root>/models
std::filesystem::path getModelsPath();

// Resolve a model setting to a ggml file on disk.
// - an existing file path is used as-is
// - a size name ("tiny", "base", "small", ...) is looked up under
//   modelsDir as ggml-<name>.en-q8_0.bin, ggml-<name>.en.bin,
//   ggml-<name>-q8_0.bin, ggml-<name>.bin (first hit wins)
// Returns an empty path when nothing matches.
std::filesystem::path resolveModelPath(const std::string& model,
                                       const std::filesystem::path& modelsDir);
