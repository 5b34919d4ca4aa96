#include "client_storage_manager.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "file_ops.hpp"
#include "pipeline.hpp"

ClientStorageManager::ClientStorageManager(const StorageConfig& config)
{
	this->config = config;
	std::filesystem::create_directories(this->config.tmp_dir);
}

StagedArtifact ClientStorageManager::stage(const FileDescriptor& descriptor, const TransferParameters& params)
{
	return Pipeline::stage(descriptor, params, config.tmp_dir);
}

std::optional<StagedArtifact> ClientStorageManager::reuse_staged(const ResumeRecord& record)
{
	if (record.staged_path.empty()) return std::nullopt;

	std::error_code ec;
	auto size = std::filesystem::file_size(record.staged_path, ec);
	if (ec || static_cast<int64_t>(size) != record.processed_size) {
		return std::nullopt;
	}

	StagedArtifact artifact;
	artifact.path = record.staged_path;
	artifact.processed_size = record.processed_size;
	return artifact;
}

void ClientStorageManager::release(const StagedArtifact& artifact)
{
	remove_temp_file(artifact.path);
}

void ClientStorageManager::stream_file(const StagedArtifact& artifact, int64_t offset, StreamWriter& writer, const ChunkCallback& on_chunk)
{
	int fd = open(artifact.path.c_str(), O_RDONLY);
	if (fd < 0) {
		throw std::runtime_error("Failed to open " + artifact.path.string() + ": " + std::strerror(errno));
	}

	// read in chunks
	constexpr size_t CHUNK = 8 * 1024;
	uint8_t buffer[CHUNK];

	// streaming loop
	int64_t total = offset;
	try {
		while (total < artifact.processed_size) {
			ssize_t n = pread(fd, buffer, CHUNK, total);
			if (n < 0 && errno == EINTR) continue;
			if (n < 0) throw std::runtime_error(std::string("Read error on staged data: ") + std::strerror(errno));
			if (n == 0) throw std::runtime_error("Staged data ended early: " + artifact.path.string());

			writer.write(buffer, static_cast<size_t>(n));
			total += n;

			if (on_chunk) on_chunk(total);
		}

		writer.flush();
	}
	catch (const std::exception&) {
		close(fd);
		throw;
	}

	close(fd);
}
