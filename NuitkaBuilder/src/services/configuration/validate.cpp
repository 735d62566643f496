#include "validate.h"
#include <cmath>
using nlohmann::json;

namespace nkb::cfgvalidate {
bool isValidKey(std::string_view key) {
	if (key.empty()) return false;
	if (key.front() == '.' || key.back() == '.') return false;
	bool prevDot = false;
	for (size_t i = 0; i < key.size(); ++i) {
		char c = key[i];
		if (c == '.') {
			if (prevDot) return false; // no consecutive dots
			prevDot = true;
			continue;
		}
		prevDot = false;
		if (!(c == '_' || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'))) return false;
	}
	return true;
}

ConfigValue fromJson(const json& j) {
	if (j.is_null()) return std::monostate{};
	if (j.is_boolean()) return j.get<bool>();
	if (j.is_number_integer()) return j.get<std::int64_t>();
	if (j.is_number_float()) return j.get<double>();
	if (j.is_string()) return j.get<std::string>();
	if (j.is_array()) {
		std::vector<std::string> v;
		v.reserve(j.size());
		for (const auto& e : j) {
			if (!e.is_string()) return ConfigValue{std::in_place_type<json>, j};
			v.push_back(e.get<std::string>());
		}
		return v;
	}
	return ConfigValue{std::in_place_type<json>, j};
}

namespace {
struct ConfigValueToJson {
	json operator()(std::monostate) const { return json(nullptr); }
	json operator()(bool value) const { return json(value); }
	json operator()(std::int64_t value) const { return json(value); }
	json operator()(double value) const { return json(value); }
	json operator()(const std::string& value) const { return json(value); }
	json operator()(const std::vector<std::string>& value) const { return json(value); }
	json operator()(const json& value) const { return value; }
};
}

json toJson(const ConfigValue& v) {
	return std::visit(ConfigValueToJson{}, v);
}

bool valuesEqual(const ConfigValue& lhs, const ConfigValue& rhs) {
	if (lhs.index() != rhs.index()) {
		// 3 and 3.0 compare equal, everything else must share an alternative.
		const auto* li = std::get_if<std::int64_t>(&lhs);
		const auto* rd = std::get_if<double>(&rhs);
		if (li && rd) return static_cast<double>(*li) == *rd;
		const auto* ld = std::get_if<double>(&lhs);
		const auto* ri = std::get_if<std::int64_t>(&rhs);
		if (ld && ri) return *ld == static_cast<double>(*ri);
		return false;
	}
	return lhs == rhs;
}

bool isEmptyValue(const ConfigValue& v) noexcept {
	if (std::holds_alternative<std::monostate>(v)) return true;
	if (const auto* s = std::get_if<std::string>(&v)) return s->empty();
	if (const auto* l = std::get_if<std::vector<std::string>>(&v)) return l->empty();
	if (const auto* j = std::get_if<json>(&v)) return j->is_null() || (j->is_structured() && j->empty());
	return false;
}

std::string describe(const ConfigValue& v) {
	return toJson(v).dump();
}
}
