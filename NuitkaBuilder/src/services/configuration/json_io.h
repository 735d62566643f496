#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace nkb::jsonio {

// Maximum allowed size for a JSON file read (bytes). Files larger than this
// are treated as unreadable.
inline constexpr std::uintmax_t kMaxJsonBytes = 1u * 1024u * 1024u; // 1 MiB

enum class ReadStatus { Ok, NotFound, Unreadable, TooLarge, Malformed };

struct ReadResult {
	ReadStatus status{ReadStatus::Ok};
	nlohmann::json document;
	std::string message;

	[[nodiscard]] bool ok() const noexcept { return status == ReadStatus::Ok; }
};

struct WriteResult {
	bool ok{false};
	std::string message;
};

const char* to_string(ReadStatus status) noexcept;

ReadResult readJson(const std::string& path);
WriteResult writeJsonAtomic(const std::string& path, const nlohmann::json& j);
}
