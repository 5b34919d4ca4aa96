#include "logger.hpp"

Logger::Logger()
{
	level_map[LogEvent::SERVICE_START] = "INFO";
	level_map[LogEvent::SERVICE_STOP] = "INFO";
	level_map[LogEvent::CLIENT_CONNECT] = "INFO";
	level_map[LogEvent::CLIENT_DISCONNECT] = "INFO";
	level_map[LogEvent::TRANSFER_START] = "INFO";
	level_map[LogEvent::TRANSFER_COMPLETE] = "INFO";
	level_map[LogEvent::TRANSFER_FAILURE] = "ERROR";
	level_map[LogEvent::TRANSFER_INTERRUPTED] = "WARN";
	level_map[LogEvent::RECEIVE_START] = "INFO";
	level_map[LogEvent::RECEIVE_COMPLETE] = "INFO";
	level_map[LogEvent::RECEIVE_FAILURE] = "ERROR";
	level_map[LogEvent::RECEIVE_INTERRUPTED] = "WARN";
	level_map[LogEvent::HASH_MISMATCH] = "WARN";
	level_map[LogEvent::DECRYPT_FAILURE] = "WARN";
	level_map[LogEvent::DECOMPRESS_DEGRADED] = "WARN";
	level_map[LogEvent::MISSING_PASSWORD] = "ERROR";
	level_map[LogEvent::RESUME_LOADED] = "INFO";
	level_map[LogEvent::RESUME_DISCARDED] = "INFO";
	level_map[LogEvent::RESUME_CORRUPT] = "WARN";
	level_map[LogEvent::RESUME_GAP] = "ERROR";
	level_map[LogEvent::QUEUE_START] = "INFO";
	level_map[LogEvent::QUEUE_STOP] = "INFO";
	level_map[LogEvent::QUEUE_JOB_COMPLETE] = "INFO";
	level_map[LogEvent::QUEUE_JOB_FAILURE] = "ERROR";
	level_map[LogEvent::QUEUE_DRAINED] = "INFO";
	level_map[LogEvent::TEMP_CLEANUP_FAILURE] = "WARN";
	level_map[LogEvent::DISK_FULL] = "ERROR";
}

Logger::~Logger()
{
	close();
}

Logger& Logger::get()
{
	static Logger instance;
	return instance;
}

bool Logger::open(const std::filesystem::path& path, size_t max_bytes)
{
	std::lock_guard<std::mutex> lock(mutex);

	if (logfd_ >= 0) {
		::close(logfd_);
		logfd_ = -1;
	}

	std::error_code ec;
	if (path.has_parent_path()) {
		std::filesystem::create_directories(path.parent_path(), ec);
	}

	log_path_ = path.string();
	log_max_bytes_ = max_bytes;

	logfd_ = ::open(
        log_path_.c_str(),
        O_WRONLY | O_CREAT | O_APPEND,
        0644
    );
	if (logfd_ == -1) {
		perror("Failed to open log file");
		return false;
	}

	// statvfs is used to check available disk space
	// if we can't check disk space then logging to the file is disabled
	struct statvfs st;
	if (statvfs(log_path_.c_str(), &st) != 0) {
		perror("Failed to initialize statvfs. Logging will be disabled.");
		logs_enabled = false;
	}
	else {
		logs_enabled = true;
	}

	auto size = std::filesystem::file_size(path, ec);
	log_cur_bytes_ = ec ? 0 : static_cast<size_t>(size);

	return true;
}

void Logger::close()
{
	std::lock_guard<std::mutex> lock(mutex);

	if (logfd_ >= 0) {
		::close(logfd_);
		logfd_ = -1;
	}
	log_path_.clear();
	logs_enabled = true;
}

const char* Logger::event_to_string(LogEvent event)
{
	switch (event) {
		case LogEvent::SERVICE_START: return "SERVICE_START";
		case LogEvent::SERVICE_STOP: return "SERVICE_STOP";
		case LogEvent::CLIENT_CONNECT: return "CLIENT_CONNECT";
		case LogEvent::CLIENT_DISCONNECT: return "CLIENT_DISCONNECT";
		case LogEvent::TRANSFER_START: return "TRANSFER_START";
		case LogEvent::TRANSFER_COMPLETE: return "TRANSFER_COMPLETE";
		case LogEvent::TRANSFER_FAILURE: return "TRANSFER_FAILURE";
		case LogEvent::TRANSFER_INTERRUPTED: return "TRANSFER_INTERRUPTED";
		case LogEvent::RECEIVE_START: return "RECEIVE_START";
		case LogEvent::RECEIVE_COMPLETE: return "RECEIVE_COMPLETE";
		case LogEvent::RECEIVE_FAILURE: return "RECEIVE_FAILURE";
		case LogEvent::RECEIVE_INTERRUPTED: return "RECEIVE_INTERRUPTED";
		case LogEvent::HASH_MISMATCH: return "HASH_MISMATCH";
		case LogEvent::DECRYPT_FAILURE: return "DECRYPT_FAILURE";
		case LogEvent::DECOMPRESS_DEGRADED: return "DECOMPRESS_DEGRADED";
		case LogEvent::MISSING_PASSWORD: return "MISSING_PASSWORD";
		case LogEvent::RESUME_LOADED: return "RESUME_LOADED";
		case LogEvent::RESUME_DISCARDED: return "RESUME_DISCARDED";
		case LogEvent::RESUME_CORRUPT: return "RESUME_CORRUPT";
		case LogEvent::RESUME_GAP: return "RESUME_GAP";
		case LogEvent::QUEUE_START: return "QUEUE_START";
		case LogEvent::QUEUE_STOP: return "QUEUE_STOP";
		case LogEvent::QUEUE_JOB_COMPLETE: return "QUEUE_JOB_COMPLETE";
		case LogEvent::QUEUE_JOB_FAILURE: return "QUEUE_JOB_FAILURE";
		case LogEvent::QUEUE_DRAINED: return "QUEUE_DRAINED";
		case LogEvent::TEMP_CLEANUP_FAILURE: return "TEMP_CLEANUP_FAILURE";
		case LogEvent::DISK_FULL: return "DISK_FULL";
	}
	return "UNKNOWN";
}

unsigned long long Logger::get_avail_storage()
{
	struct statvfs st;
	if (statvfs(log_path_.c_str(), &st) != 0) return 0;

	unsigned long long available = st.f_bavail * st.f_frsize;
	return available;
}

void Logger::log_rotate()
{
	if (log_path_.empty() || log_max_bytes_ == 0) return;
    if (log_cur_bytes_ < log_max_bytes_) return;

    ::close(logfd_);

    std::string rotated = log_path_ + ".1";
    ::rename(log_path_.c_str(), rotated.c_str());

    logfd_ = ::open(
        log_path_.c_str(),
        O_WRONLY | O_CREAT | O_TRUNC,
        0644
    );

    log_cur_bytes_ = 0;
}

void Logger::log_event(Logger::LogEvent event, std::initializer_list<LogField> fields)
{
	std::lock_guard<std::mutex> lock(mutex);

	const char* level = level_map[event];
	const char* event_str = event_to_string(event);

	std::string line = "[" + std::to_string(time(nullptr)) + "] " + level + " " + event_str;

	for (const LogField& field : fields) {
		line += " ";
		line += field.key;
		line += "=";

		switch (field.type) {
			case LogFieldType::STRING:
				line += field.str ? field.str : "";
				break;
			case LogFieldType::INT64:
				line += std::to_string(field.i64);
				break;
			case LogFieldType::UINT64:
				line += std::to_string(field.u64);
				break;
			case LogFieldType::BOOL:
				line += field.b ? "true" : "false";
				break;
		}
	}
	line += "\n";

	// no log file configured
	if (logfd_ < 0) {
		fputs(line.c_str(), stderr);
		return;
	}

	if (logs_enabled == false) return;

	log_rotate();
	if (logfd_ < 0) return;

	if (static_cast<unsigned long long>(line.size()) > get_avail_storage()) return;

	ssize_t written = ::write(logfd_, line.data(), line.size());
	if (written > 0) {
		log_cur_bytes_ += (size_t)written;
	}
}
