#include "resources.hpp"
#include "logger.hpp"

#include <cstdlib>
#include <vector>

#if defined(__APPLE__)
    #include <mach-o/dyld.h>
#elif defined(__linux__)
    #include <unistd.h>
    #include <climits>
#endif

namespace fs = std::filesystem;

// Directory holding the running binary (cwd if it cannot be determined)
static fs::path executableDir() {
#if defined(__APPLE__)
    char buffer[1024];
    uint32_t size = sizeof(buffer);
    if (_NSGetExecutablePath(buffer, &size) == 0) {
        return fs::path(buffer).parent_path();
    }
#elif defined(__linux__)
    char buffer[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len > 0) {
        buffer[len] = '\0';
        return fs::path(buffer).parent_path();
    }
#endif
    return fs::current_path();
}

// -------------------------------------------------------------
// Resource root
//   LIVESCRIBE_RESOURCES env var, then
//   portable build: <exe dir>/resources only
//   otherwise:      <cwd>/../resources, <cwd>/resources, <exe dir>/resources
// -------------------------------------------------------------
std::string getResourcePath() {
    std::error_code ec;

    if (const char* env = std::getenv("LIVESCRIBE_RESOURCES")) {
        if (fs::is_directory(env, ec)) {
            return env;
        }
        LOG_DEBUG("Resources", std::string("LIVESCRIBE_RESOURCES is not a directory: ") + env);
    }

#if defined(LIVESCRIBE_PORTABLE_ONLY)
    const std::vector<fs::path> candidates = { executableDir() / "resources" };
#else
    const std::vector<fs::path> candidates = {
        fs::current_path().parent_path() / "resources",
        fs::current_path() / "resources",
        executableDir() / "resources"
    };
#endif

    for (const auto& dir : candidates) {
        if (fs::is_directory(dir, ec)) {
            LOG_TRACE("Resources", "Using resource path: " + dir.string());
            return dir.string();
        }
    }

    LOG_DEBUG("Resources", "No resources directory found, using cwd");
    return fs::current_path().string();
}

fs::path getModelsPath() {
    return fs::path(getResourcePath()) / "models";
}

fs::path resolveModelPath(const std::string& model, const fs::path& modelsDir) {
    if (model.empty()) return {};

    std::error_code ec;
    fs::path direct(model);
    if (fs::is_regular_file(direct, ec)) {
        return direct;
    }

    const std::vector<std::string> candidates = {
        "ggml-" + model + ".en-q8_0.bin",
        "ggml-" + model + ".en.bin",
        "ggml-" + model + "-q8_0.bin",
        "ggml-" + model + ".bin"
    };

    for (const auto& name : candidates) {
        fs::path p = modelsDir / name;
        LOG_TRACE("Resources", "Looking for model at: " + p.string());
        if (fs::is_regular_file(p, ec)) {
            return p;
        }
    }
    return {};
}
