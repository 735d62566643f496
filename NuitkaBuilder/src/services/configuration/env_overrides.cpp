#include "env_overrides.h"
#include "ConfigurationStore.h"
#include "services/logger/LogManager.h"
#include <cctype>
#include <cerrno>
#include <cstdlib>

extern "C" char **environ;

namespace nkb::envoverrides {
namespace {
	std::string to_lower(std::string s) {
		for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
		return s;
	}

	std::string trim(std::string_view v) {
		size_t b = 0, e = v.size();
		while (b < e && std::isspace(static_cast<unsigned char>(v[b]))) ++b;
		while (e > b && std::isspace(static_cast<unsigned char>(v[e - 1]))) --e;
		return std::string(v.substr(b, e - b));
	}

	bool parse_bool(std::string v, bool& out) {
		v = to_lower(std::move(v));
		if (v == "true" || v == "1" || v == "yes" || v == "on") { out = true; return true; }
		if (v == "false" || v == "0" || v == "no" || v == "off") { out = false; return true; }
		return false;
	}

	bool parse_int(const std::string& v, std::int64_t& out) {
		if (v.empty()) return false;
		errno = 0;
		char* end = nullptr;
		const long long parsed = std::strtoll(v.c_str(), &end, 10);
		if (errno == ERANGE || end != v.c_str() + v.size()) return false;
		out = static_cast<std::int64_t>(parsed);
		return true;
	}

	bool parse_double(const std::string& v, double& out) {
		if (v.empty()) return false;
		errno = 0;
		char* end = nullptr;
		const double parsed = std::strtod(v.c_str(), &end);
		if (errno == ERANGE || end != v.c_str() + v.size()) return false;
		out = parsed;
		return true;
	}

	std::vector<std::string> split_list(std::string_view v) {
		std::vector<std::string> out;
		size_t start = 0;
		while (start <= v.size()) {
			size_t comma = v.find(',', start);
			if (comma == std::string_view::npos) comma = v.size();
			std::string item = trim(v.substr(start, comma - start));
			if (!item.empty()) out.push_back(std::move(item));
			start = comma + 1;
		}
		return out;
	}

	ConfigValue parse_untyped(const std::string& v) {
		bool b;
		if (parse_bool(v, b)) return b;
		std::int64_t i;
		if (parse_int(v, i)) return i;
		double d;
		if (parse_double(v, d)) return d;
		return v;
	}
}

std::string mapEnvKeyToConfigKey(std::string_view key) {
	std::string out;
	out.reserve(key.size());
	for (size_t i = 0; i < key.size(); ++i) {
		if (key[i] == '_' && i + 1 < key.size() && key[i + 1] == '_') {
			out.push_back('.');
			++i; // skip next '_'
		} else {
			out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(key[i]))));
		}
	}
	return out;
}

ConfigValue parseEnvValue(const SettingDefinition* definition, const std::string& raw) {
	if (!definition) return parse_untyped(raw);
	switch (definition->type) {
	case SettingType::Boolean: {
		bool b;
		if (parse_bool(raw, b)) return b;
		break;
	}
	case SettingType::Integer: {
		std::int64_t i;
		if (parse_int(trim(raw), i)) return i;
		break;
	}
	case SettingType::StringList:
		return split_list(raw);
	case SettingType::String:
	case SettingType::PathFile:
	case SettingType::PathDirectory:
	case SettingType::Enum:
		return raw;
	}
	// Unparseable for the declared type: keep the text so validation reports it.
	return raw;
}

size_t apply(ConfigurationStore& store) {
	char** envp = environ;
	if (!envp) return 0;
	size_t count = 0;
	for (char** e = envp; *e; ++e) {
		std::string_view entry(*e);
		size_t eq = entry.find('=');
		if (eq == std::string_view::npos) continue;
		std::string_view name = entry.substr(0, eq);
		std::string_view value = entry.substr(eq + 1);
		if (name.substr(0, kPrefix.size()) != kPrefix) continue;
		std::string_view suffix = name.substr(kPrefix.size());
		// Hierarchical keys only; NKB_CONFIG_DIR and friends are control variables.
		if (suffix.find("__") == std::string_view::npos) continue;
		std::string key = mapEnvKeyToConfigKey(suffix);
		ConfigValue parsed = parseEnvValue(store.registry().find(key), std::string(value));
		if (!store.set(key, std::move(parsed))) {
			logging::LogManager::warn("Ignoring environment override {}: '{}' is not a valid setting key", name, key);
			continue;
		}
		logging::LogManager::info("Environment override {} -> {}", name, key);
		++count;
	}
	return count;
}
}
