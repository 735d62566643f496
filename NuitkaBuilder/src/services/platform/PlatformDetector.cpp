#include "PlatformDetector.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>

#include <unistd.h>

namespace nkb::platform {

namespace {

bool isExecutableFile(const std::filesystem::path& candidate) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(candidate, ec) || ec) {
        return false;
    }
    return ::access(candidate.c_str(), X_OK) == 0;
}

} // namespace

const char* currentPlatform() noexcept {
#if defined(_WIN32)
    return "windows";
#elif defined(__APPLE__)
    return "macos";
#else
    return "linux";
#endif
}

std::optional<std::string> findExecutable(std::string_view name) {
    const char* path = std::getenv("PATH");
    return findExecutable(name, path ? std::string_view(path) : std::string_view("/usr/bin:/bin"));
}

std::optional<std::string> findExecutable(std::string_view name, std::string_view pathEnv) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string_view::npos) {
        std::filesystem::path direct{std::string(name)};
        if (isExecutableFile(direct)) {
            return direct.string();
        }
        return std::nullopt;
    }
    std::size_t start = 0;
    while (start <= pathEnv.size()) {
        std::size_t sep = pathEnv.find(':', start);
        if (sep == std::string_view::npos) {
            sep = pathEnv.size();
        }
        std::string_view dir = pathEnv.substr(start, sep - start);
        // An empty PATH entry means the working directory.
        std::filesystem::path candidate = dir.empty() ? std::filesystem::path(".") : std::filesystem::path(std::string(dir));
        candidate /= std::string(name);
        if (isExecutableFile(candidate)) {
            return candidate.string();
        }
        start = sep + 1;
    }
    return std::nullopt;
}

ToolLocator defaultToolLocator() {
    return [](std::string_view name) { return findExecutable(name); };
}

std::vector<std::string> availableCompilers(const ToolLocator& locator) {
    std::vector<std::string> compilers{"auto"};
    const std::string_view platform = currentPlatform();
    if (platform == "windows") {
        if (locator("cl")) {
            compilers.emplace_back("msvc");
        }
        // Nuitka downloads these on demand
        compilers.emplace_back("mingw64");
        compilers.emplace_back("clang");
    }
    if (locator("zig")) {
        compilers.emplace_back("zig");
    }
    if (platform != "windows" && locator("clang")) {
        if (std::find(compilers.begin(), compilers.end(), "clang") == compilers.end()) {
            compilers.emplace_back("clang");
        }
    }
    return compilers;
}

std::string defaultCompiler(const ToolLocator& locator) {
    if (std::string_view(currentPlatform()) == "windows") {
        return locator("cl") ? "msvc" : "mingw64";
    }
    return "auto";
}

}
