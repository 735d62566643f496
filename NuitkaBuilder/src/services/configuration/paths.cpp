#include "paths.h"
#include <string>
#include <cstdlib>
#include <filesystem>
#include <optional>

namespace nkb::paths {
namespace {
#ifdef NKB_INTERNAL_TESTING
	static std::string g_test_path;
#endif

constexpr int kSearchDepth = 6; // working directory plus five parents

std::filesystem::path workingDirectory() {
	std::error_code ec;
	std::filesystem::path cwd = std::filesystem::current_path(ec);
	if (ec) {
		cwd = std::filesystem::path(".");
	}
	return cwd;
}

// First existing <dir>/<relative>, trying the working directory and then
// each parent up to kSearchDepth levels.
std::optional<std::string> searchUpwards(const std::filesystem::path& relative) {
	std::filesystem::path dir = workingDirectory();
	for (int depth = 0; depth < kSearchDepth; ++depth) {
		const std::filesystem::path candidate = dir / relative;
		std::error_code ec;
		if (std::filesystem::is_regular_file(candidate, ec)) {
			std::filesystem::path absPath = std::filesystem::absolute(candidate, ec);
			return (ec ? candidate : absPath).string();
		}
		if (!dir.has_parent_path() || dir.parent_path() == dir) break;
		dir = dir.parent_path();
	}
	return std::nullopt;
}
}

#ifdef NKB_INTERNAL_TESTING
void nkb_set_config_path_for_tests(const std::string& p) { g_test_path = p; }
#endif

std::string schemaFilePath() {
	if (const char* path = std::getenv("NKB_SCHEMA_PATH"); path && *path) {
		return path;
	}
	const std::filesystem::path relative = std::filesystem::path("configs") / "setting_definitions.json";
	if (auto found = searchUpwards(relative)) {
		return *found;
	}
	return (workingDirectory() / relative).string();
}

std::string buildConfigFilePath() {
#ifdef NKB_INTERNAL_TESTING
	if (!g_test_path.empty()) return g_test_path;
#endif
	if (const char* dir = std::getenv("NKB_CONFIG_DIR"); dir && *dir) {
		return (std::filesystem::path(dir) / "nuitka_build.json").string();
	}
	if (auto found = searchUpwards("nuitka_build.json")) {
		return *found;
	}
	return (workingDirectory() / "nuitka_build.json").string();
}
}
