#include <filesystem>
#include <fstream>
#include <iostream>
#include <algorithm>
#include <memory>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

#pragma once

/*
 *	LAYOUT under the downloads directory:
 *	<relative>                           finished files
 *	.courier/incoming/<unique>           staged bytes of the file being received
 *	.courier/partial/<relative>.part     staged bytes kept from an interrupted receive
 */
class ServerStorageManager
{
	public:
		struct StorageConfig {
			std::filesystem::path downloads_dir;
			std::filesystem::path tmp_dir;
		};

		struct ReceiveHandle {
			ReceiveHandle() = default;

			int fd = -1;

			std::filesystem::path tmp_path;
			std::filesystem::path final_path;
			std::filesystem::path partial_path;

			// staged (processed) size announced by the sender
			int64_t expected_size = 0;

			// includes any prefix carried over from a partial
			int64_t bytes_written = 0;

			bool active = false;

			// the saved partial held fewer bytes than the sender skips, the file cannot be rebuilt
			bool resume_gap = false;
			int64_t partial_bytes = 0;

			// non-moveable and non-copyable
			ReceiveHandle(const ReceiveHandle&) = delete;
			ReceiveHandle& operator=(const ReceiveHandle&) = delete;
			ReceiveHandle(ReceiveHandle&&) = delete;
			ReceiveHandle& operator=(ReceiveHandle&&) = delete;
		};

		explicit ServerStorageManager(const StorageConfig& cfg);

		// strips control and reserved characters, drops ".." and root components
		static std::string sanitize_relative_path(const std::string& name);

		std::unique_ptr<ReceiveHandle> start_receive(const std::string& relative_path, int64_t expected_size, int64_t resume_offset);
		void write_chunk(ReceiveHandle& handle, const uint8_t* data, size_t len);

		// returns the path of the complete staged data, owned by the caller
		std::filesystem::path commit_receive(ReceiveHandle& handle);

		// keep_partial saves what arrived for a later resume
		void abort_receive(ReceiveHandle& handle, bool keep_partial);

	private:
		StorageConfig config;

		std::filesystem::path incoming_dir() const;
		std::filesystem::path partial_dir() const;

		static std::string sanitize_filename(std::string name);
};
