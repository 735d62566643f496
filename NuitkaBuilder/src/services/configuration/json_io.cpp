#include "json_io.h"
#include <filesystem>
#include <fstream>
#include <chrono>
#include <cerrno>
#include <cstring>

namespace nkb::jsonio {

const char* to_string(ReadStatus status) noexcept {
	switch (status) {
	case ReadStatus::Ok: return "ok";
	case ReadStatus::NotFound: return "not found";
	case ReadStatus::Unreadable: return "unreadable";
	case ReadStatus::TooLarge: return "too large";
	case ReadStatus::Malformed: return "malformed";
	}
	return "unknown";
}

ReadResult readJson(const std::string& path) {
	namespace fs = std::filesystem;
	ReadResult result;
	std::error_code ec;
	if (!fs::exists(path, ec)) {
		result.status = ReadStatus::NotFound;
		result.message = "File not found: " + path;
		return result;
	}
	const auto size = fs::file_size(path, ec);
	if (!ec && size > kMaxJsonBytes) {
		result.status = ReadStatus::TooLarge;
		result.message = "File exceeds " + std::to_string(kMaxJsonBytes) + " bytes: " + path;
		return result;
	}
	std::ifstream ifs(path, std::ios::binary);
	if (!ifs) {
		result.status = ReadStatus::Unreadable;
		result.message = "Cannot open " + path + ": " + std::strerror(errno);
		return result;
	}
	try {
		ifs >> result.document;
	} catch (const nlohmann::json::parse_error& e) {
		result.status = ReadStatus::Malformed;
		result.document = nlohmann::json();
		result.message = "Invalid JSON in " + path + ": " + e.what();
	}
	return result;
}

WriteResult writeJsonAtomic(const std::string& path, const nlohmann::json& j) {
	namespace fs = std::filesystem;
	WriteResult result;
	fs::path target(path);
	fs::path dir = target.parent_path();
	if (!dir.empty()) {
		std::error_code ec;
		fs::create_directories(dir, ec);
		if (ec) {
			result.message = "Cannot create directory " + dir.string() + ": " + ec.message();
			return result;
		}
	}
	// Use a unique temp name to avoid collisions
	fs::path tmp = target;
	tmp += ".tmp";
	tmp += std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
	{
		std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
		if (!ofs) {
			result.message = "Cannot write " + tmp.string() + ": " + std::strerror(errno);
			return result;
		}
		ofs << j.dump(2);
		ofs.flush();
		if (!ofs) {
			result.message = "Write failed for " + tmp.string();
			ofs.close();
			std::error_code ec;
			fs::remove(tmp, ec);
			return result;
		}
	}
	std::error_code ec;
	fs::rename(tmp, target, ec);
	if (ec) {
		result.message = "Cannot replace " + path + ": " + ec.message();
		std::error_code cleanup;
		fs::remove(tmp, cleanup);
		return result;
	}
	result.ok = true;
	return result;
}
}
