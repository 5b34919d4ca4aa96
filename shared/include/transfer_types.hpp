#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#pragma once

constexpr uint16_t DEFAULT_PORT = 9876;

// receivers cap SO_RCVBUF so a dropped connection loses a bounded amount of data
constexpr int RECEIVE_BUFFER_BYTES = 256 * 1024;

// bytes a sender holds back from its resume offset: the doubled receive buffer plus a read chunk
constexpr int64_t RESUME_MARGIN_BYTES = 2 * static_cast<int64_t>(RECEIVE_BUFFER_BYTES) + 64 * 1024;

// values are part of the wire format
enum class CompressionAlgorithm : int32_t {
	GZIP = 0,
	BROTLI = 1
};

const char* algorithm_to_string(CompressionAlgorithm algorithm);
CompressionAlgorithm algorithm_from_int(int32_t value);

struct TransferParameters {
	bool use_compression = false;
	CompressionAlgorithm algorithm = CompressionAlgorithm::GZIP;

	bool use_encryption = false;
	std::optional<std::string> password;

	bool resume_enabled = false;

	std::string host = "127.0.0.1";
	uint16_t port = DEFAULT_PORT;

	// 0 means no cap
	uint64_t rate_limit_bytes_per_sec = 0;
};

struct FileDescriptor {
	std::filesystem::path absolute_path;

	// file name for single / multi-file jobs, path relative to the root for directory jobs
	std::string logical_name;

	int64_t original_size = 0;
	std::string content_hash;
};

struct StagedArtifact {
	std::filesystem::path path;
	int64_t processed_size = 0;
};
