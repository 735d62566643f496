#include "ConfigurationStore.h"

#include "json_io.h"
#include "validate.h"
#include "services/logger/LogManager.h"

#include <algorithm>
#include <utility>

namespace nkb {

using nlohmann::json;

namespace jsonpath {

json& ensure(json& target, std::string_view path) {
    if (!target.is_object()) {
        target = json::object();
    }

    json* current = &target;
    std::size_t start = 0;
    while (start < path.size()) {
        const std::size_t dot = path.find('.', start);
        const std::size_t length = dot == std::string_view::npos ? path.size() - start : dot - start;
        std::string key(path.substr(start, length));
        if (!current->is_object()) {
            *current = json::object();
        }
        current = &((*current)[key]);
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return *current;
}

const json* find(const json& target, std::string_view path) {
    const json* current = &target;
    std::size_t start = 0;
    while (start <= path.size()) {
        const std::size_t dot = path.find('.', start);
        const std::size_t length = dot == std::string_view::npos ? path.size() - start : dot - start;
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(std::string(path.substr(start, length)));
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
        if (dot == std::string_view::npos) {
            return current;
        }
        start = dot + 1;
    }
    return nullptr;
}

// Removes the leaf and any parent objects the removal leaves empty.
bool erase(json& target, std::string_view path) {
    if (!target.is_object() || path.empty()) {
        return false;
    }

    json* current = &target;
    std::vector<std::pair<json*, std::string>> stack;
    std::size_t start = 0;
    while (start < path.size()) {
        const std::size_t dot = path.find('.', start);
        const std::size_t length = dot == std::string_view::npos ? path.size() - start : dot - start;
        std::string key(path.substr(start, length));
        if (!current->is_object()) {
            return false;
        }
        auto it = current->find(key);
        if (it == current->end()) {
            return false;
        }
        stack.emplace_back(current, key);
        current = &(*it);
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }

    if (stack.empty()) {
        return false;
    }

    auto& [leafParent, leafKey] = stack.back();
    leafParent->erase(leafKey);
    stack.pop_back();

    for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
        json* parent = it->first;
        auto childIt = parent->find(it->second);
        if (childIt != parent->end() && childIt->is_object() && childIt->empty()) {
            parent->erase(childIt);
        }
    }
    return true;
}

void collectLeafPaths(const json& value, const std::string& prefix, std::vector<std::string>& out) {
    if (!value.is_object() || value.empty()) {
        if (!prefix.empty()) {
            out.push_back(prefix);
        }
        return;
    }
    for (auto it = value.begin(); it != value.end(); ++it) {
        collectLeafPaths(it.value(), prefix.empty() ? it.key() : prefix + "." + it.key(), out);
    }
}

} // namespace jsonpath

namespace {

// A setting whose key nests under `path` or holds `path` below it. Such a
// path cannot share the nested document with that setting.
const SettingDefinition* overlappingSetting(const SettingRegistry& registry, std::string_view path) {
    for (const auto& def : registry.definitions()) {
        const std::string_view key(def.key);
        const std::string_view shorter = key.size() < path.size() ? key : path;
        const std::string_view longer = key.size() < path.size() ? path : key;
        if (shorter.size() < longer.size() && longer.substr(0, shorter.size()) == shorter
            && longer[shorter.size()] == '.') {
            return &def;
        }
    }
    return nullptr;
}

json buildUnknownEntries(const json& document, const SettingRegistry& registry) {
    json unknown = document.is_object() ? document : json::object();
    registry.forEachDefinition([&](const SettingDefinition& def) {
        (void)jsonpath::erase(unknown, def.key);
    });
    std::vector<std::string> leaves;
    jsonpath::collectLeafPaths(unknown, {}, leaves);
    for (const auto& leaf : leaves) {
        if (const auto* def = overlappingSetting(registry, leaf)) {
            logging::LogManager::warn("Ignoring configuration entry '{}': it overlaps setting '{}'", leaf, def->key);
            (void)jsonpath::erase(unknown, leaf);
        }
    }
    return unknown;
}

ConfigIoStatus fromReadStatus(jsonio::ReadStatus status) {
    switch (status) {
    case jsonio::ReadStatus::Ok: return ConfigIoStatus::Ok;
    case jsonio::ReadStatus::NotFound: return ConfigIoStatus::NotFound;
    case jsonio::ReadStatus::Unreadable: return ConfigIoStatus::Unreadable;
    case jsonio::ReadStatus::TooLarge: return ConfigIoStatus::TooLarge;
    case jsonio::ReadStatus::Malformed: return ConfigIoStatus::Malformed;
    }
    return ConfigIoStatus::Unreadable;
}

} // namespace

ConfigLoadError::ConfigLoadError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

const char* to_string(ConfigIoStatus status) noexcept {
    switch (status) {
    case ConfigIoStatus::Ok: return "ok";
    case ConfigIoStatus::NotFound: return "not found";
    case ConfigIoStatus::Unreadable: return "unreadable";
    case ConfigIoStatus::Malformed: return "malformed";
    case ConfigIoStatus::TooLarge: return "too large";
    case ConfigIoStatus::WriteFailed: return "write failed";
    }
    return "unknown";
}

ConfigurationStore::ConfigurationStore(const SettingRegistry& registry)
    : registry_(registry) {
    registry_.forEachDefinition([&](const SettingDefinition& def) {
        values_.emplace(def.key, def.defaultValue);
    });
    baseline_ = toSerializable();
}

ConfigValue ConfigurationStore::get(std::string_view path, const ConfigValue& fallback) const {
    if (auto value = find(path)) {
        return *value;
    }
    return fallback;
}

std::optional<ConfigValue> ConfigurationStore::find(std::string_view path) const {
    if (auto it = values_.find(std::string(path)); it != values_.end()) {
        return it->second;
    }
    if (const json* node = jsonpath::find(unknown_, path)) {
        return cfgvalidate::fromJson(*node);
    }
    return std::nullopt;
}

bool ConfigurationStore::set(std::string_view path, ConfigValue value) {
    if (!cfgvalidate::isValidKey(path)) {
        return false;
    }
    const std::string key(path);
    if (auto it = values_.find(key); it != values_.end()) {
        if (it->second == value) {
            return true;
        }
        it->second = std::move(value);
    } else {
        if (const auto* def = overlappingSetting(registry_, path)) {
            logging::LogManager::warn("Rejected setting '{}': it overlaps setting '{}'", key, def->key);
            return false;
        }
        json& slot = jsonpath::ensure(unknown_, path);
        json encoded = cfgvalidate::toJson(value);
        if (slot == encoded) {
            return true;
        }
        slot = std::move(encoded);
        logging::LogManager::debug("Stored unrecognized setting '{}'", key);
    }
    notify(key);
    return true;
}

bool ConfigurationStore::reset(std::string_view path) {
    if (!cfgvalidate::isValidKey(path)) {
        return false;
    }
    const std::string key(path);
    if (auto it = values_.find(key); it != values_.end()) {
        const auto& def = registry_.at(key);
        if (it->second != def.defaultValue) {
            it->second = def.defaultValue;
            notify(key);
        }
        return true;
    }
    if (jsonpath::erase(unknown_, path)) {
        notify(key);
    }
    return true;
}

void ConfigurationStore::reset() {
    registry_.forEachDefinition([&](const SettingDefinition& def) {
        values_[def.key] = def.defaultValue;
    });
    unknown_ = json::object();
    notify({});
}

bool ConfigurationStore::isRecognized(std::string_view path) const noexcept {
    return registry_.contains(path);
}

std::vector<std::string> ConfigurationStore::unrecognizedKeys() const {
    std::vector<std::string> keys;
    if (!unknown_.empty()) {
        jsonpath::collectLeafPaths(unknown_, {}, keys);
    }
    return keys;
}

json ConfigurationStore::toSerializable() const {
    json document = unknown_.is_object() ? unknown_ : json::object();
    registry_.forEachDefinition([&](const SettingDefinition& def) {
        auto it = values_.find(def.key);
        jsonpath::ensure(document, def.key) = cfgvalidate::toJson(it != values_.end() ? it->second : def.defaultValue);
    });
    return document;
}

void ConfigurationStore::fromSerializable(const json& document) {
    if (!document.is_object()) {
        throw ConfigLoadError(ConfigLoadError::Kind::Malformed,
                              std::string("Configuration root must be a JSON object, got ") + document.type_name());
    }
    std::unordered_map<std::string, ConfigValue> values;
    values.reserve(registry_.size());
    registry_.forEachDefinition([&](const SettingDefinition& def) {
        if (const json* node = jsonpath::find(document, def.key)) {
            values.emplace(def.key, cfgvalidate::fromJson(*node));
        } else {
            values.emplace(def.key, def.defaultValue);
        }
    });
    values_ = std::move(values);
    unknown_ = buildUnknownEntries(document, registry_);
    notify({});
}

json ConfigurationStore::readDocument(const std::string& path) {
    auto read = jsonio::readJson(path);
    if (read.status == jsonio::ReadStatus::NotFound) {
        throw ConfigLoadError(ConfigLoadError::Kind::NotFound, read.message);
    }
    if (!read.ok()) {
        throw ConfigLoadError(ConfigLoadError::Kind::Malformed, read.message);
    }
    if (!read.document.is_object()) {
        throw ConfigLoadError(ConfigLoadError::Kind::Malformed, "Configuration root must be a JSON object in " + path);
    }
    return std::move(read.document);
}

ConfigIoResult ConfigurationStore::load(const std::string& path) {
    ConfigIoResult result;
    auto read = jsonio::readJson(path);
    if (!read.ok()) {
        result.status = fromReadStatus(read.status);
        result.message = read.message;
        logging::LogManager::warn("Configuration load failed ({}): {}", jsonio::to_string(read.status), read.message);
        return result;
    }
    try {
        fromSerializable(read.document);
    } catch (const ConfigLoadError& e) {
        result.status = ConfigIoStatus::Malformed;
        result.message = std::string(e.what()) + " in " + path;
        logging::LogManager::warn("Configuration load failed: {}", result.message);
        return result;
    }
    filePath_ = path;
    baseline_ = toSerializable();
    const auto unknown = unrecognizedKeys();
    if (!unknown.empty()) {
        logging::LogManager::warn("Configuration {} contains {} unrecognized key(s)", path, unknown.size());
    }
    logging::LogManager::info("Configuration loaded from {}", path);
    return result;
}

ConfigIoResult ConfigurationStore::save(const std::string& path) {
    ConfigIoResult result;
    const json document = toSerializable();
    auto written = jsonio::writeJsonAtomic(path, document);
    if (!written.ok) {
        result.status = ConfigIoStatus::WriteFailed;
        result.message = written.message;
        logging::LogManager::error("Configuration save failed: {}", written.message);
        return result;
    }
    filePath_ = path;
    baseline_ = document;
    logging::LogManager::info("Configuration saved to {}", path);
    return result;
}

bool ConfigurationStore::isDirty() const {
    return toSerializable() != baseline_;
}

void ConfigurationStore::markClean() {
    baseline_ = toSerializable();
}

ConfigurationStore::SubscriptionId ConfigurationStore::subscribe(ChangeCallback callback) {
    const SubscriptionId id = nextSubscription_++;
    subscribers_.emplace_back(id, std::move(callback));
    return id;
}

bool ConfigurationStore::unsubscribe(SubscriptionId id) {
    auto it = std::find_if(subscribers_.begin(), subscribers_.end(), [id](const auto& entry) { return entry.first == id; });
    if (it == subscribers_.end()) {
        return false;
    }
    subscribers_.erase(it);
    return true;
}

void ConfigurationStore::notify(const std::string& path) const {
    // Copy so callbacks may unsubscribe while being notified.
    const auto subscribers = subscribers_;
    for (const auto& [id, callback] : subscribers) {
        if (callback) {
            callback(path);
        }
    }
}

} // namespace nkb
