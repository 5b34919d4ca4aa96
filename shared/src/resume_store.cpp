#include "resume_store.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <stdexcept>

#include "file_ops.hpp"
#include "logger.hpp"

using json = nlohmann::json;

namespace
{
	constexpr const char* RECORD_EXT = ".resume";

	void sync_dir(const std::filesystem::path& dir)
	{
		int dir_fd = open(dir.c_str(), O_DIRECTORY | O_RDONLY);
		if (dir_fd >= 0) {
			fsync(dir_fd);
			close(dir_fd);
		}
	}
}

void to_json(json& j, const ResumeRecord& record)
{
	j = json{
		{"file_path", record.file_path},
		{"file_name", record.file_name},
		{"total_size", record.total_size},
		{"bytes_transferred", record.bytes_transferred},
		{"content_hash", record.content_hash},
		{"use_compression", record.use_compression},
		{"algorithm", static_cast<int32_t>(record.algorithm)},
		{"use_encryption", record.use_encryption},
		{"resume_enabled", record.resume_enabled},
		{"host", record.host},
		{"port", record.port},
		{"directory_name", record.directory_name},
		{"relative_path", record.relative_path},
		{"is_multi_file", record.is_multi_file},
		{"staged_path", record.staged_path},
		{"processed_size", record.processed_size},
		{"timestamp", record.timestamp}
	};
}

void from_json(const json& j, ResumeRecord& record)
{
	j.at("file_path").get_to(record.file_path);
	j.at("file_name").get_to(record.file_name);
	j.at("total_size").get_to(record.total_size);
	j.at("bytes_transferred").get_to(record.bytes_transferred);
	j.at("content_hash").get_to(record.content_hash);
	j.at("use_compression").get_to(record.use_compression);
	record.algorithm = algorithm_from_int(j.at("algorithm").get<int32_t>());
	j.at("use_encryption").get_to(record.use_encryption);
	j.at("resume_enabled").get_to(record.resume_enabled);
	j.at("host").get_to(record.host);
	j.at("port").get_to(record.port);

	// optional fields
	record.directory_name = j.value("directory_name", "");
	record.relative_path = j.value("relative_path", "");
	record.is_multi_file = j.value("is_multi_file", false);
	record.staged_path = j.value("staged_path", "");
	record.processed_size = j.value("processed_size", int64_t{0});
	record.timestamp = j.value("timestamp", uint64_t{0});

	if (record.total_size < 0 || record.bytes_transferred < 0 || record.bytes_transferred > record.total_size) {
		throw std::runtime_error("Resume record offsets out of range");
	}
}

ResumeStore::ResumeStore(const std::filesystem::path& dir)
	: dir(dir)
{
	std::filesystem::create_directories(dir);
}

uint64_t ResumeStore::unix_timestamp_ms()
{
	using namespace std::chrono;
	return duration_cast<milliseconds>(
		system_clock::now().time_since_epoch()
	).count();
}

std::filesystem::path ResumeStore::record_path(const std::string& file_path) const
{
	return dir / (sha256_string(file_path) + RECORD_EXT);
}

ResumeRecord ResumeStore::make_record(const FileDescriptor& descriptor, const TransferParameters& params)
{
	ResumeRecord record;
	record.file_path = descriptor.absolute_path.string();
	record.file_name = descriptor.absolute_path.filename().string();
	record.total_size = descriptor.original_size;
	record.content_hash = descriptor.content_hash;

	record.use_compression = params.use_compression;
	record.algorithm = params.algorithm;
	record.use_encryption = params.use_encryption;
	record.resume_enabled = params.resume_enabled;
	record.host = params.host;
	record.port = params.port;

	return record;
}

bool ResumeStore::matches(const ResumeRecord& record, const FileDescriptor& descriptor, const TransferParameters& params)
{
	if (record.use_compression != params.use_compression) return false;
	if (params.use_compression && record.algorithm != params.algorithm) return false;
	if (record.use_encryption != params.use_encryption) return false;
	if (record.host != params.host || record.port != params.port) return false;
	if (record.total_size != descriptor.original_size) return false;

	return hash_equals(record.content_hash, descriptor.content_hash);
}

void ResumeStore::write_atomic(const ResumeRecord& record)
{
	std::filesystem::path path = record_path(record.file_path);
	std::filesystem::path tmp_path = path;
	tmp_path += ".tmp";

	{
		std::ofstream out(tmp_path, std::ios::trunc);
		if (!out.is_open()) {
			throw std::runtime_error("Failed to open " + tmp_path.string());
		}

		out << json(record).dump();
		out.flush();
		if (!out) {
			throw std::runtime_error("Failed to write " + tmp_path.string());
		}
	}

	std::filesystem::rename(tmp_path, path);
	sync_dir(dir);
}

void ResumeStore::create(ResumeRecord& record)
{
	record.timestamp = unix_timestamp_ms();
	write_atomic(record);
}

void ResumeStore::update(ResumeRecord& record)
{
	record.timestamp = unix_timestamp_ms();
	write_atomic(record);
}

std::optional<ResumeRecord> ResumeStore::load(const std::string& file_path)
{
	std::filesystem::path path = record_path(file_path);
	if (!std::filesystem::exists(path)) return std::nullopt;

	try {
		std::ifstream in(path);
		ResumeRecord record = json::parse(in).get<ResumeRecord>();

		// guards against a hash collision between paths
		if (record.file_path != file_path) return std::nullopt;

		return record;
	}
	catch (const std::exception& e) {
		Logger::get().log_event(Logger::LogEvent::RESUME_CORRUPT, {
			{"path", path.string()},
			{"error", e.what()}
		});
		return std::nullopt;
	}
}

void ResumeStore::remove(const std::string& file_path)
{
	remove_temp_file(record_path(file_path));
}

void ResumeStore::discard(const ResumeRecord& record)
{
	if (!record.staged_path.empty()) {
		remove_temp_file(record.staged_path);
	}
	remove(record.file_path);
}

std::vector<ResumeRecord> ResumeStore::list_all()
{
	std::vector<ResumeRecord> records;

	std::error_code ec;
	for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
		if (!entry.is_regular_file() || entry.path().extension() != RECORD_EXT) continue;

		try {
			std::ifstream in(entry.path());
			records.push_back(json::parse(in).get<ResumeRecord>());
		}
		catch (const std::exception& e) {
			Logger::get().log_event(Logger::LogEvent::RESUME_CORRUPT, {
				{"path", entry.path().string()},
				{"error", e.what()}
			});
		}
	}

	if (ec) {
		throw std::filesystem::filesystem_error("Cannot list resume records", dir, ec);
	}

	std::stable_sort(records.begin(), records.end(), [](const ResumeRecord& a, const ResumeRecord& b) {
		return a.timestamp > b.timestamp;
	});

	return records;
}
