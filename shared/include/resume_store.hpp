#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "transfer_types.hpp"

#pragma once

struct ResumeRecord {
	std::string file_path;
	std::string file_name;
	int64_t total_size = 0;

	// offset in the original byte stream
	int64_t bytes_transferred = 0;
	std::string content_hash;

	// parameter snapshot, the password is never stored
	bool use_compression = false;
	CompressionAlgorithm algorithm = CompressionAlgorithm::GZIP;
	bool use_encryption = false;
	bool resume_enabled = true;
	std::string host;
	uint16_t port = DEFAULT_PORT;

	// set for files sent as part of a directory job
	std::string directory_name;
	std::string relative_path;

	bool is_multi_file = false;

	// staged artifact kept across an interruption
	std::string staged_path;
	int64_t processed_size = 0;

	uint64_t timestamp = 0;
};

void to_json(nlohmann::json& j, const ResumeRecord& record);
void from_json(const nlohmann::json& j, ResumeRecord& record);

/*
 *	One JSON sidecar per source file:
 *	<dir>/<sha256(file_path)>.resume
 */
class ResumeStore
{
	public:
		explicit ResumeStore(const std::filesystem::path& dir);

		// new record for a first attempt, not yet persisted
		static ResumeRecord make_record(const FileDescriptor& descriptor, const TransferParameters& params);

		// true when the record can be honored for this attempt
		static bool matches(const ResumeRecord& record, const FileDescriptor& descriptor, const TransferParameters& params);

		void create(ResumeRecord& record);
		std::optional<ResumeRecord> load(const std::string& file_path);
		void update(ResumeRecord& record);
		void remove(const std::string& file_path);

		// deletes the record and the staged artifact it points at
		void discard(const ResumeRecord& record);

		// newest first, unreadable sidecars are skipped
		std::vector<ResumeRecord> list_all();

		const std::filesystem::path& directory() const { return dir; }

	private:
		std::filesystem::path dir;

		std::filesystem::path record_path(const std::string& file_path) const;
		void write_atomic(const ResumeRecord& record);

		static uint64_t unix_timestamp_ms();
};
