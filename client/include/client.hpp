#include <sys/socket.h>
#include <sys/ioctl.h>
#include <linux/sockios.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "client_storage_manager.hpp"
#include "config.hpp"
#include "resume_store.hpp"
#include "transfer_types.hpp"
#include "wire.hpp"

#pragma once

struct SendResult {
	// connection lost with resume enabled, progress was saved
	bool interrupted = false;

	int files_sent = 0;
	int64_t original_bytes = 0;
	int64_t processed_bytes = 0;

	std::string error;
};

// one entry of list_resumable_transfers()
struct ResumableTransfer {
	enum class Kind {
		SINGLE,
		DIRECTORY,
		MULTI
	};

	Kind kind = Kind::SINGLE;
	std::string host;
	uint16_t port = DEFAULT_PORT;
	std::string directory_name;
	bool use_encryption = false;

	int64_t total_size = 0;
	int64_t bytes_transferred = 0;

	std::vector<ResumeRecord> records;

	std::string describe() const;
};

class Client
{
	public:
		// file name, original bytes done, original total
		using ProgressHandler = std::function<void(const std::string&, int64_t, int64_t)>;

		Client(const TransferParameters& params, const ClientConfig& config);

		// throws std::filesystem::filesystem_error before connecting if a source is missing
		SendResult send_file(const std::filesystem::path& path);
		SendResult send_directory(const std::filesystem::path& path);
		SendResult send_multiple_files(const std::vector<std::filesystem::path>& paths);

		std::vector<ResumableTransfer> list_resumable_transfers();

		// index is 1-based as listed, the password is required for encrypted groups
		SendResult resume_transfer(size_t index, const std::optional<std::string>& password);

		void on_progress(ProgressHandler handler) { progress_handler = std::move(handler); }
		void set_console_progress(bool enabled) { console_progress = enabled; }

	private:
		static constexpr int64_t RESUME_SAVE_INTERVAL_MS = 1000;
		static constexpr int64_t PROGRESS_INTERVAL_MS = 100;

		enum class JobKind {
			SINGLE,
			DIRECTORY,
			MULTI
		};

		struct PendingFile {
			FileDescriptor descriptor;

			// relative path (directory jobs) or file name
			std::string wire_name;

			std::optional<ResumeRecord> record;
			int64_t resume_offset = 0;
		};

		TransferParameters params;
		ClientConfig config;
		ResumeStore store;
		ClientStorageManager storage;

		ProgressHandler progress_handler;
		bool console_progress = false;

		SendResult send_job(JobKind kind, const std::string& dir_name, std::vector<PendingFile>& files);

		// loads, validates or creates the resume record of a file
		void prepare_resume(PendingFile& file, JobKind kind, const std::string& dir_name);

		// returns false when the connection was lost and progress was saved
		bool send_one(int sock, WireWriter& writer, JobKind kind, PendingFile& file, SendResult& result);

		// staged offset the receiver can be counted on to hold, never more than position
		static int64_t confirmed_position(int sock, int64_t position);

		static int connect_to(const std::string& host, uint16_t port);
		static std::string directory_name_of(const std::filesystem::path& path);

		// floor(value * num / den) without overflow, 0 when den is 0
		static int64_t scale_offset(int64_t value, int64_t num, int64_t den);
};
