#include <sys/statvfs.h>
#include <fcntl.h>
#include <unistd.h>

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <initializer_list>
#include <mutex>
#include <string>
#include <unordered_map>

#pragma once

class Logger
{
	public:
		enum class LogFieldType {
    		STRING,
    		INT64,
    		UINT64,
    		BOOL
		};

		struct LogField {
    		const char* key;

    		LogFieldType type;
    		union {
        		const char* str;
        		int64_t i64;
        		uint64_t u64;
        		bool b;
    		};

    		LogField(const char* k, const char* v)
        		: key(k), type(LogFieldType::STRING), str(v) {}

			// the string must outlive the log_event call
    		LogField(const char* k, const std::string& v)
        		: key(k), type(LogFieldType::STRING), str(v.c_str()) {}

    		LogField(const char* k, int v)
        		: key(k), type(LogFieldType::INT64), i64(v) {}

    		LogField(const char* k, int64_t v)
        		: key(k), type(LogFieldType::INT64), i64(v) {}

    		LogField(const char* k, uint64_t v)
        		: key(k), type(LogFieldType::UINT64), u64(v) {}

    		LogField(const char* k, bool v)
        		: key(k), type(LogFieldType::BOOL), b(v) {}
		};

		enum class LogEvent {
			SERVICE_START,					// INFO
			SERVICE_STOP,					// INFO
			CLIENT_CONNECT,					// INFO
			CLIENT_DISCONNECT,				// INFO
			TRANSFER_START,					// INFO
			TRANSFER_COMPLETE,				// INFO
			TRANSFER_FAILURE,				// ERROR
			TRANSFER_INTERRUPTED,			// WARN
			RECEIVE_START,					// INFO
			RECEIVE_COMPLETE,				// INFO
			RECEIVE_FAILURE,				// ERROR
			RECEIVE_INTERRUPTED,			// WARN
			HASH_MISMATCH,					// WARN
			DECRYPT_FAILURE,				// WARN
			DECOMPRESS_DEGRADED,			// WARN
			MISSING_PASSWORD,				// ERROR
			RESUME_LOADED,					// INFO
			RESUME_DISCARDED,				// INFO
			RESUME_CORRUPT,					// WARN
			RESUME_GAP,						// ERROR
			QUEUE_START,					// INFO
			QUEUE_STOP,						// INFO
			QUEUE_JOB_COMPLETE,				// INFO
			QUEUE_JOB_FAILURE,				// ERROR
			QUEUE_DRAINED,					// INFO
			TEMP_CLEANUP_FAILURE,			// WARN
			DISK_FULL						// ERROR
		};

		static Logger& get();

		// send log lines to a file instead of stderr, rotating at max_bytes
		bool open(const std::filesystem::path& path, size_t max_bytes);
		void close();

		void log_event(LogEvent event, std::initializer_list<LogField> fields = {});

		static const char* event_to_string(LogEvent event);

		Logger(const Logger&) = delete;
		Logger& operator=(const Logger&) = delete;

	private:
		Logger();
		~Logger();

		std::unordered_map<LogEvent, const char*> level_map;

		std::mutex mutex;

		std::string log_path_;
		int logfd_ = -1;
		size_t log_max_bytes_ = 0;
		size_t log_cur_bytes_ = 0;

		bool logs_enabled = true;

		unsigned long long get_avail_storage();
		void log_rotate();
};
