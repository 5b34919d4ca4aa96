#include "pipeline.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <unistd.h>

#include "compression.hpp"
#include "crypto.hpp"
#include "file_ops.hpp"
#include "logger.hpp"

const char* reverse_status_to_string(ReverseResult::Status status)
{
	switch (status) {
		case ReverseResult::Status::OK: return "ok";
		case ReverseResult::Status::DEGRADED: return "degraded";
		case ReverseResult::Status::FATAL: return "fatal";
	}
	return "unknown";
}

std::filesystem::path Pipeline::make_temp_path(const std::filesystem::path& dir, const std::string& suffix)
{
	static std::atomic<uint64_t> counter{0};

	auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
	std::string name = "courier-" + std::to_string(::getpid()) + "-" + std::to_string(stamp) + "-"
		+ std::to_string(counter.fetch_add(1)) + suffix;

	return dir / name;
}

StagedArtifact Pipeline::stage(const FileDescriptor& descriptor, const TransferParameters& params, const std::filesystem::path& tmp_dir)
{
	if (params.use_encryption && (!params.password || params.password->empty())) {
		throw std::invalid_argument("Encryption requested without a password");
	}

	std::filesystem::create_directories(tmp_dir);

	std::filesystem::path current = descriptor.absolute_path;
	std::filesystem::path compressed;

	try {
		if (params.use_compression) {
			compressed = make_temp_path(tmp_dir, ".z");
			Compression::compress_file(current, compressed, params.algorithm);
			current = compressed;
		}

		std::filesystem::path staged = make_temp_path(tmp_dir, ".staged");
		if (params.use_encryption) {
			CryptoAtRest::encrypt_file(current, staged, *params.password);
		}
		else {
			copy_file_contents(current, staged);
		}

		remove_temp_file(compressed);

		StagedArtifact artifact;
		artifact.path = staged;
		artifact.processed_size = static_cast<int64_t>(std::filesystem::file_size(staged));
		return artifact;
	}
	catch (const std::exception&) {
		remove_temp_file(compressed);
		throw;
	}
}

ReverseResult Pipeline::reverse(const std::filesystem::path& staged, const std::filesystem::path& dest,
	bool use_compression, CompressionAlgorithm algorithm, bool use_encryption,
	const std::optional<std::string>& password, const std::filesystem::path& tmp_dir)
{
	ReverseResult result;
	std::filesystem::path current = staged;
	std::filesystem::path decrypted;

	try {
		if (dest.has_parent_path()) {
			std::filesystem::create_directories(dest.parent_path());
		}

		if (use_encryption) {
			if (!password) {
				result.status = ReverseResult::Status::FATAL;
				result.detail = "no password configured for encrypted data";
				return result;
			}

			decrypted = use_compression ? make_temp_path(tmp_dir, ".dec") : dest;
			if (!CryptoAtRest::decrypt_file(current, decrypted, *password)) {
				Logger::get().log_event(Logger::LogEvent::DECRYPT_FAILURE, {
					{"file", dest.string()}
				});
				result.status = ReverseResult::Status::DEGRADED;
				result.detail = "decryption failed, the password may be incorrect";
			}
			current = decrypted;
		}

		if (use_compression) {
			try {
				Compression::decompress_file(current, dest, algorithm);
			}
			catch (const std::runtime_error& e) {
				// keep the bytes we have, the hash check decides
				Logger::get().log_event(Logger::LogEvent::DECOMPRESS_DEGRADED, {
					{"file", dest.string()},
					{"error", e.what()}
				});
				copy_file_contents(current, dest);
				result.status = ReverseResult::Status::DEGRADED;
				if (!result.detail.empty()) result.detail += "; ";
				result.detail += std::string("decompression failed (") + e.what() + "), raw data kept";
			}
		}
		else if (!use_encryption) {
			copy_file_contents(current, dest);
		}
	}
	catch (const std::exception& e) {
		if (decrypted != dest) remove_temp_file(decrypted);
		result.status = ReverseResult::Status::FATAL;
		result.detail = e.what();
		return result;
	}

	if (decrypted != dest) remove_temp_file(decrypted);
	return result;
}
