#include "server_storage_manager.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "file_ops.hpp"
#include "logger.hpp"
#include "pipeline.hpp"

ServerStorageManager::ServerStorageManager(const StorageConfig& cfg)
	: config(cfg)
{
	std::filesystem::create_directories(config.downloads_dir);
	std::filesystem::create_directories(config.tmp_dir);
	std::filesystem::create_directories(incoming_dir());
	std::filesystem::create_directories(partial_dir());
}

std::filesystem::path ServerStorageManager::incoming_dir() const
{
	return config.downloads_dir / ".courier" / "incoming";
}

std::filesystem::path ServerStorageManager::partial_dir() const
{
	return config.downloads_dir / ".courier" / "partial";
}

std::string ServerStorageManager::sanitize_filename(std::string name)
{
	const std::string invalid_chars = R"literal(<>:"\|?*)literal";
	for (char c : invalid_chars) {
		std::replace(name.begin(), name.end(), c, '_');
	}

	name.erase(std::remove_if(name.begin(), name.end(), [](unsigned char x) {
		return std::iscntrl(x);
	}), name.end());

	return name;
}

std::string ServerStorageManager::sanitize_relative_path(const std::string& name)
{
	// windows peers may send backslash separators
	std::string normalized = name;
	std::replace(normalized.begin(), normalized.end(), '\\', '/');

	std::filesystem::path result;
	for (const auto& part : std::filesystem::path(normalized)) {
		std::string component = sanitize_filename(part.string());
		if (component.empty() || component == "." || component == ".." || component == "/") continue;

		result /= component;
	}

	if (result.empty()) {
		throw std::runtime_error("Invalid file name received: '" + name + "'");
	}

	return result.string();
}

std::unique_ptr<ServerStorageManager::ReceiveHandle> ServerStorageManager::start_receive(const std::string& relative_path, int64_t expected_size, int64_t resume_offset)
{
	auto handle = std::make_unique<ReceiveHandle>();

	handle->final_path = config.downloads_dir / relative_path;
	handle->partial_path = partial_dir() / (relative_path + ".part");
	handle->tmp_path = Pipeline::make_temp_path(incoming_dir(), ".incoming");
	handle->expected_size = expected_size;

	if (resume_offset > 0) {
		std::error_code ec;
		uintmax_t held = std::filesystem::file_size(handle->partial_path, ec);
		handle->partial_bytes = ec ? 0 : static_cast<int64_t>(held);

		if (handle->partial_bytes < resume_offset) {
			handle->resume_gap = true;
			remove_temp_file(handle->partial_path);
		}
		else {
			copy_file_contents(handle->partial_path, handle->tmp_path);
		}
	}
	else {
		// a fresh transfer supersedes any saved partial
		remove_temp_file(handle->partial_path);
	}

	handle->fd = open(handle->tmp_path.c_str(),
						O_CREAT | O_WRONLY,
						0600);
	if (handle->fd < 0) {
		throw std::runtime_error("Failed to open " + handle->tmp_path.string() + ": " + std::strerror(errno));
	}

	if (resume_offset > 0 && !handle->resume_gap) {
		// drop whatever the partial holds past the sender's offset
		if (ftruncate(handle->fd, resume_offset) != 0 || lseek(handle->fd, resume_offset, SEEK_SET) < 0) {
			int err = errno;
			close(handle->fd);
			unlink(handle->tmp_path.c_str());
			throw std::runtime_error("Failed to position " + handle->tmp_path.string() + ": " + std::strerror(err));
		}
		handle->bytes_written = resume_offset;
	}
	handle->active = true;

	return handle;
}

void ServerStorageManager::write_chunk(ReceiveHandle& handle, const uint8_t* data, size_t len)
{
	if (!handle.active) throw std::logic_error("Receive not active");
	if (handle.resume_gap) throw std::logic_error("Receive cannot be completed, resume data is missing");

	size_t total = 0;
	while (total < len) {
		ssize_t n = write(handle.fd, data + total, len - total);
		if (n < 0 && errno == EINTR) continue;
		if (n < 0) {
			if (errno == ENOSPC) {
				Logger::get().log_event(Logger::LogEvent::DISK_FULL, {
					{"path", handle.tmp_path.string()}
				});
			}
			throw std::runtime_error("Write to " + handle.tmp_path.string() + " failed: " + std::strerror(errno));
		}

		total += n;
	}

	handle.bytes_written += len;
}

std::filesystem::path ServerStorageManager::commit_receive(ReceiveHandle& handle)
{
	if (handle.bytes_written != handle.expected_size) {
		throw std::runtime_error("File size mismatch");
	}

	fsync(handle.fd);
	close(handle.fd);
	handle.fd = -1;
	handle.active = false;

	remove_temp_file(handle.partial_path);

	return handle.tmp_path;
}

void ServerStorageManager::abort_receive(ReceiveHandle& handle, bool keep_partial)
{
	if (!handle.active) return;

	close(handle.fd);
	handle.fd = -1;
	handle.active = false;

	if (keep_partial && !handle.resume_gap) {
		std::error_code ec;
		std::filesystem::create_directories(handle.partial_path.parent_path(), ec);
		std::filesystem::rename(handle.tmp_path, handle.partial_path, ec);
		if (!ec) return;

		std::cerr << "Failed to keep partial data for " << handle.final_path << ": " << ec.message() << std::endl;
	}

	remove_temp_file(handle.tmp_path);
}
