#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "SettingSchema.h"

namespace nkb {

class SchemaLoadError : public std::runtime_error {
public:
    enum class Kind {
        Unreadable,
        Malformed,
    };

    SchemaLoadError(Kind kind, std::string origin, const std::string& detail);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& origin() const noexcept { return origin_; }

private:
    Kind kind_;
    std::string origin_;
};

// Builds a SettingRegistry from the declarative schema document. Every
// definition is checked structurally before the registry is handed out; the
// first violation aborts the load with SchemaLoadError.
class SettingSchemaLoader {
public:
    static SettingRegistry loadFile(const std::string& path);
    static SettingRegistry loadString(std::string_view text, const std::string& origin = "<memory>");
    static SettingRegistry loadJson(const nlohmann::json& document, const std::string& origin = "<memory>");

    // Flag templates: start with '-', no whitespace, at most one "{value}"
    // placeholder and no other braces.
    [[nodiscard]] static bool isValidFlagTemplate(std::string_view flag) noexcept;
    [[nodiscard]] static std::size_t placeholderCount(std::string_view flag) noexcept;
};

inline constexpr std::string_view kValuePlaceholder = "{value}";

} // namespace nkb
