#pragma once

#include "services/schema/SettingSchema.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace nkb {

class ConfigLoadError : public std::runtime_error {
public:
    enum class Kind {
        NotFound,
        Malformed,
    };

    ConfigLoadError(Kind kind, const std::string& message);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

enum class ConfigIoStatus {
    Ok,
    NotFound,
    Unreadable,
    Malformed,
    TooLarge,
    WriteFailed,
};

[[nodiscard]] const char* to_string(ConfigIoStatus status) noexcept;

struct ConfigIoResult {
    ConfigIoStatus status{ConfigIoStatus::Ok};
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return status == ConfigIoStatus::Ok; }
};

// Mutable dotted-path view of one build configuration. Keys declared by the
// schema always hold a value (their default until set); anything else lands in
// a separate JSON document that is preserved verbatim across load/save.
class ConfigurationStore {
public:
    using ChangeCallback = std::function<void(const std::string& path)>;
    using SubscriptionId = std::size_t;

    explicit ConfigurationStore(const SettingRegistry& registry);

    [[nodiscard]] ConfigValue get(std::string_view path, const ConfigValue& fallback = {}) const;
    [[nodiscard]] std::optional<ConfigValue> find(std::string_view path) const;
    // False for malformed paths and for unknown paths nested under or above a
    // known setting.
    bool set(std::string_view path, ConfigValue value);
    bool reset(std::string_view path);
    void reset();

    [[nodiscard]] bool isRecognized(std::string_view path) const noexcept;
    [[nodiscard]] std::vector<std::string> unrecognizedKeys() const;
    [[nodiscard]] const nlohmann::json& unrecognizedEntries() const noexcept { return unknown_; }

    [[nodiscard]] nlohmann::json toSerializable() const;
    void fromSerializable(const nlohmann::json& document);

    // Reads a configuration document without touching any store. Throws
    // ConfigLoadError: NotFound for a missing file, Malformed otherwise.
    static nlohmann::json readDocument(const std::string& path);

    ConfigIoResult load(const std::string& path);
    ConfigIoResult save(const std::string& path);
    [[nodiscard]] const std::string& filePath() const noexcept { return filePath_; }

    [[nodiscard]] bool isDirty() const;
    void markClean();

    // Callback receives the changed path; an empty path means the whole store
    // was replaced (load, full reset).
    SubscriptionId subscribe(ChangeCallback callback);
    bool unsubscribe(SubscriptionId id);

    [[nodiscard]] const SettingRegistry& registry() const noexcept { return registry_; }

private:
    void notify(const std::string& path) const;

    const SettingRegistry& registry_;
    std::unordered_map<std::string, ConfigValue> values_;
    nlohmann::json unknown_ = nlohmann::json::object();
    nlohmann::json baseline_;
    std::string filePath_;
    std::vector<std::pair<SubscriptionId, ChangeCallback>> subscribers_;
    SubscriptionId nextSubscription_{1};
};

namespace jsonpath {
// Helpers for dotted paths inside nested JSON objects.
nlohmann::json& ensure(nlohmann::json& target, std::string_view path);
const nlohmann::json* find(const nlohmann::json& target, std::string_view path);
bool erase(nlohmann::json& target, std::string_view path);
void collectLeafPaths(const nlohmann::json& value, const std::string& prefix, std::vector<std::string>& out);
}

} // namespace nkb
