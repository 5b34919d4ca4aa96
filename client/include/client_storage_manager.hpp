#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

#include "resume_store.hpp"
#include "byte_stream.hpp"
#include "transfer_types.hpp"

#pragma once

// owns the staged artifacts a client sends
class ClientStorageManager
{
	public:
		struct StorageConfig {
			std::filesystem::path tmp_dir;
		};

		// called after every chunk with the staged offset reached so far
		using ChunkCallback = std::function<void(int64_t)>;

		explicit ClientStorageManager(const StorageConfig& config);

		StagedArtifact stage(const FileDescriptor& descriptor, const TransferParameters& params);

		// the artifact retained by an interrupted attempt, if it is still intact
		std::optional<StagedArtifact> reuse_staged(const ResumeRecord& record);

		void release(const StagedArtifact& artifact);

		void stream_file(const StagedArtifact& artifact, int64_t offset, StreamWriter& writer, const ChunkCallback& on_chunk);

	private:
		StorageConfig config;
};
