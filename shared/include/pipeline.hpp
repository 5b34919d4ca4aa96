#include <filesystem>
#include <optional>
#include <string>

#include "transfer_types.hpp"

#pragma once

// outcome of undoing the pipeline on a received artifact
struct ReverseResult {
	enum class Status {
		OK,			// every stage succeeded
		DEGRADED,	// a stage failed and its input was passed through, output is unverified
		FATAL		// no output could be produced
	};

	Status status = Status::OK;
	std::string detail;

	bool ok() const { return status == Status::OK; }
};

const char* reverse_status_to_string(ReverseResult::Status status);

/*
 *	Fixed stage order: compress, then encrypt.
 *	Reversal: decrypt, then decompress.
 */
class Pipeline
{
	public:
		// runs the enabled stages over the file into a fresh file in tmp_dir
		static StagedArtifact stage(const FileDescriptor& descriptor, const TransferParameters& params, const std::filesystem::path& tmp_dir);

		// undoes the enabled stages on the staged file, writing dest
		static ReverseResult reverse(const std::filesystem::path& staged, const std::filesystem::path& dest,
			bool use_compression, CompressionAlgorithm algorithm, bool use_encryption,
			const std::optional<std::string>& password, const std::filesystem::path& tmp_dir);

		// unique path for a temporary file in dir
		static std::filesystem::path make_temp_path(const std::filesystem::path& dir, const std::string& suffix);
};
