#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nkb::platform {

// Resolves an executable name to a full path, or nullopt when not found.
using ToolLocator = std::function<std::optional<std::string>(std::string_view name)>;

// "windows", "macos" or "linux"; matches the platform names used by setting
// definitions.
[[nodiscard]] const char* currentPlatform() noexcept;

// Names containing a '/' are checked directly, anything else is searched in
// the directories of PATH (or pathEnv when given).
[[nodiscard]] std::optional<std::string> findExecutable(std::string_view name);
[[nodiscard]] std::optional<std::string> findExecutable(std::string_view name, std::string_view pathEnv);

[[nodiscard]] ToolLocator defaultToolLocator();

// Compiler choices usable on this host, "auto" first.
[[nodiscard]] std::vector<std::string> availableCompilers(const ToolLocator& locator);
[[nodiscard]] std::string defaultCompiler(const ToolLocator& locator);

}
