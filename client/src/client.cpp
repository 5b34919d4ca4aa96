#include "client.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

#include "connection_error.hpp"
#include "file_ops.hpp"
#include "logger.hpp"
#include "socket_stream_writer.hpp"
#include "throttled_stream_writer.hpp"

namespace
{
	struct SocketGuard {
		int fd;
		~SocketGuard() { if (fd >= 0) close(fd); }
	};
}

std::string ResumableTransfer::describe() const
{
	std::ostringstream out;

	switch (kind) {
		case Kind::SINGLE:
			out << records.front().file_name;
			break;
		case Kind::DIRECTORY:
			out << directory_name << "/ (" << records.size() << (records.size() == 1 ? " file)" : " files)");
			break;
		case Kind::MULTI:
			out << records.size() << (records.size() == 1 ? " file" : " files");
			break;
	}

	int64_t percent = total_size > 0 ? bytes_transferred * 100 / total_size : 0;
	out << " -> " << host << ":" << port << ", " << percent << "% done";
	if (use_encryption) out << " [encrypted]";

	return out.str();
}

Client::Client(const TransferParameters& params, const ClientConfig& config)
	: params(params), config(config), store(config.resume_dir),
	  storage(ClientStorageManager::StorageConfig{config.tmp_dir})
{
	if (params.use_encryption && (!params.password || params.password->empty())) {
		throw std::invalid_argument("Encryption requires a password");
	}
}

int64_t Client::scale_offset(int64_t value, int64_t num, int64_t den)
{
	if (den <= 0) return 0;

	__int128 scaled = static_cast<__int128>(value) * num / den;
	return static_cast<int64_t>(scaled);
}

std::string Client::directory_name_of(const std::filesystem::path& path)
{
	std::filesystem::path normalized = std::filesystem::absolute(path).lexically_normal();

	// "dir/" normalizes to a path with an empty file name
	if (normalized.filename().empty()) {
		normalized = normalized.parent_path();
	}

	return normalized.filename().string();
}

int Client::connect_to(const std::string& host, uint16_t port)
{
	addrinfo hints{};
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;

	addrinfo* res = nullptr;
	int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
	if (rc != 0) {
		throw std::runtime_error("Cannot resolve " + host + ": " + gai_strerror(rc));
	}
	std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard(res, &freeaddrinfo);

	int last_err = 0;
	for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
		int sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
		if (sock < 0) {
			last_err = errno;
			continue;
		}

		if (connect(sock, ai->ai_addr, ai->ai_addrlen) == 0) {
			return sock;
		}

		last_err = errno;
		close(sock);
	}

	throw std::runtime_error("Connection to " + host + ":" + std::to_string(port) + " failed: " + std::strerror(last_err));
}

SendResult Client::send_file(const std::filesystem::path& path)
{
	PendingFile file;
	file.descriptor = describe_file(path, path.filename().string());
	file.wire_name = file.descriptor.logical_name;

	std::vector<PendingFile> files;
	files.push_back(std::move(file));

	return send_job(JobKind::SINGLE, "", files);
}

SendResult Client::send_directory(const std::filesystem::path& path)
{
	if (!std::filesystem::is_directory(path)) {
		throw std::filesystem::filesystem_error(
			"Directory not found",
			path,
			std::make_error_code(std::errc::no_such_file_or_directory));
	}

	std::string dir_name = directory_name_of(path);

	std::vector<PendingFile> files;
	for (const auto& relative : list_files_recursive(path)) {
		PendingFile file;
		file.wire_name = relative.generic_string();
		file.descriptor = describe_file(path / relative, file.wire_name);
		files.push_back(std::move(file));
	}

	return send_job(JobKind::DIRECTORY, dir_name, files);
}

SendResult Client::send_multiple_files(const std::vector<std::filesystem::path>& paths)
{
	if (paths.empty()) {
		throw std::invalid_argument("No files to send");
	}

	std::vector<PendingFile> files;
	for (const auto& path : paths) {
		PendingFile file;
		file.descriptor = describe_file(path, path.filename().string());
		file.wire_name = file.descriptor.logical_name;
		files.push_back(std::move(file));
	}

	return send_job(JobKind::MULTI, "", files);
}

void Client::prepare_resume(PendingFile& file, JobKind kind, const std::string& dir_name)
{
	const FileDescriptor& descriptor = file.descriptor;
	std::string key = descriptor.absolute_path.string();

	std::optional<ResumeRecord> existing = store.load(key);
	bool resumed = existing && ResumeStore::matches(*existing, descriptor, params);
	if (resumed) {
		file.record = existing;
		file.resume_offset = existing->bytes_transferred;

		Logger::get().log_event(Logger::LogEvent::RESUME_LOADED, {
			{"file", key},
			{"offset", file.resume_offset},
			{"size", descriptor.original_size}
		});
	}
	else {
		if (existing) {
			Logger::get().log_event(Logger::LogEvent::RESUME_DISCARDED, {
				{"file", key},
				{"reason", "parameters or content changed"}
			});
			store.discard(*existing);
		}

		file.record = ResumeStore::make_record(descriptor, params);
		file.resume_offset = 0;
	}

	file.record->directory_name = kind == JobKind::DIRECTORY ? dir_name : "";
	file.record->relative_path = kind == JobKind::DIRECTORY ? file.wire_name : "";
	file.record->is_multi_file = kind == JobKind::MULTI;

	if (resumed) {
		store.update(*file.record);
	}
	else {
		store.create(*file.record);
	}
}

SendResult Client::send_job(JobKind kind, const std::string& dir_name, std::vector<PendingFile>& files)
{
	if (params.resume_enabled) {
		for (auto& file : files) {
			prepare_resume(file, kind, dir_name);
		}
	}

	SendResult result;

	int sock = connect_to(params.host, params.port);
	SocketGuard guard{sock};

	SocketStreamWriter socket_writer(sock);
	std::unique_ptr<ThrottledStreamWriter> throttled;
	if (params.rate_limit_bytes_per_sec > 0) {
		throttled = std::make_unique<ThrottledStreamWriter>(socket_writer, params.rate_limit_bytes_per_sec);
	}

	StreamWriter& out = throttled ? static_cast<StreamWriter&>(*throttled) : socket_writer;
	WireWriter writer(out);

	Logger::get().log_event(Logger::LogEvent::TRANSFER_START, {
		{"host", params.host},
		{"port", static_cast<int>(params.port)},
		{"files", static_cast<int64_t>(files.size())},
		{"compression", params.use_compression},
		{"encryption", params.use_encryption},
		{"resume", params.resume_enabled}
	});

	/* PROTOCOL: discriminator, flags, then the job header */
	try {
		switch (kind) {
			case JobKind::SINGLE:
				writer.write_string(files.front().wire_name);
				break;
			case JobKind::DIRECTORY:
				writer.write_string(wire::DIR_MARKER);
				break;
			case JobKind::MULTI:
				writer.write_string(wire::MULTI_MARKER);
				break;
		}

		writer.write_bool(params.use_compression);
		writer.write_bool(params.use_encryption);
		writer.write_bool(params.resume_enabled);
		if (params.use_compression) {
			writer.write_int32(static_cast<int32_t>(params.algorithm));
		}

		if (kind == JobKind::DIRECTORY) {
			writer.write_string(dir_name);
			writer.write_int32(static_cast<int32_t>(files.size()));
		}
		else if (kind == JobKind::MULTI) {
			writer.write_int32(static_cast<int32_t>(files.size()));
		}
	}
	catch (const ConnectionError& e) {
		if (!params.resume_enabled) throw;

		Logger::get().log_event(Logger::LogEvent::TRANSFER_INTERRUPTED, {
			{"host", params.host},
			{"error", e.what()}
		});
		result.interrupted = true;
		result.error = e.what();
		return result;
	}

	for (auto& file : files) {
		if (!send_one(sock, writer, kind, file, result)) {
			result.interrupted = true;
			return result;
		}
	}

	Logger::get().log_event(Logger::LogEvent::TRANSFER_COMPLETE, {
		{"host", params.host},
		{"files", static_cast<int64_t>(result.files_sent)},
		{"original_bytes", result.original_bytes},
		{"processed_bytes", result.processed_bytes}
	});

	return result;
}

int64_t Client::confirmed_position(int sock, int64_t position)
{
	// SIOCOUTQ counts bytes not yet acknowledged by the peer
	int queued = 0;
	if (ioctl(sock, SIOCOUTQ, &queued) != 0) return 0;

	int64_t confirmed = position - queued - RESUME_MARGIN_BYTES;
	return confirmed > 0 ? confirmed : 0;
}

bool Client::send_one(int sock, WireWriter& writer, JobKind kind, PendingFile& file, SendResult& result)
{
	using namespace std::chrono;

	const FileDescriptor& descriptor = file.descriptor;

	std::optional<StagedArtifact> staged;
	if (file.record) {
		staged = storage.reuse_staged(*file.record);
	}

	if (!staged) {
		if (file.resume_offset > 0 && params.use_encryption) {
			// a fresh encryption header shifts every byte, the old offset is meaningless
			Logger::get().log_event(Logger::LogEvent::RESUME_DISCARDED, {
				{"file", descriptor.absolute_path.string()},
				{"reason", "staged data missing"}
			});
			file.resume_offset = 0;
		}

		staged = storage.stage(descriptor, params);
	}

	int64_t processed_offset = scale_offset(staged->processed_size, file.resume_offset, descriptor.original_size);

	if (file.record) {
		file.record->staged_path = staged->path.string();
		file.record->processed_size = staged->processed_size;
		file.record->bytes_transferred = file.resume_offset;
		store.update(*file.record);
	}

	int64_t sent = processed_offset;

	// the resume record only ever advances to this, a reset connection purges the send queue
	int64_t confirmed = processed_offset;

	ProgressMeter meter(descriptor.original_size, file.resume_offset);
	auto last_progress = steady_clock::now();
	auto last_save = last_progress;

	auto report = [&](int64_t original_done) {
		if (progress_handler) progress_handler(descriptor.logical_name, original_done, descriptor.original_size);
		if (console_progress) meter.update(original_done);
	};

	try {
		if (kind != JobKind::SINGLE) {
			writer.write_string(file.wire_name);
		}
		writer.write_int64(descriptor.original_size);
		writer.write_string(descriptor.content_hash);
		if (params.resume_enabled) {
			writer.write_int64(file.resume_offset);
		}

		writer.write_int64(staged->processed_size);
		if (params.resume_enabled) {
			writer.write_int64(processed_offset);
		}

		report(file.resume_offset);

		storage.stream_file(*staged, processed_offset, writer.stream(), [&](int64_t position) {
			sent = position;
			if (file.record) {
				confirmed = std::max(confirmed, confirmed_position(sock, position));
			}

			auto now = steady_clock::now();

			if (duration_cast<milliseconds>(now - last_progress).count() >= PROGRESS_INTERVAL_MS) {
				report(scale_offset(position, descriptor.original_size, staged->processed_size));
				last_progress = now;
			}

			if (file.record && duration_cast<milliseconds>(now - last_save).count() >= RESUME_SAVE_INTERVAL_MS) {
				file.record->bytes_transferred = scale_offset(confirmed, descriptor.original_size, staged->processed_size);
				store.update(*file.record);
				last_save = now;
			}
		});
	}
	catch (const ConnectionError& e) {
		if (console_progress) meter.finish();

		if (!file.record) {
			storage.release(*staged);
			Logger::get().log_event(Logger::LogEvent::TRANSFER_FAILURE, {
				{"file", descriptor.logical_name},
				{"error", e.what()}
			});
			throw;
		}

		file.record->bytes_transferred = scale_offset(confirmed, descriptor.original_size, staged->processed_size);
		store.update(*file.record);

		Logger::get().log_event(Logger::LogEvent::TRANSFER_INTERRUPTED, {
			{"file", descriptor.logical_name},
			{"sent", sent},
			{"confirmed", confirmed},
			{"processed_size", staged->processed_size},
			{"resume_offset", file.record->bytes_transferred}
		});

		std::cerr << "Connection lost while sending " << descriptor.logical_name
				  << ", progress saved for resume" << std::endl;

		result.error = e.what();
		return false;
	}
	catch (const std::exception& e) {
		if (console_progress) meter.finish();

		// the retained artifact stays with the record for a later attempt
		if (!file.record) storage.release(*staged);

		Logger::get().log_event(Logger::LogEvent::TRANSFER_FAILURE, {
			{"file", descriptor.logical_name},
			{"error", e.what()}
		});
		throw;
	}

	report(descriptor.original_size);
	if (console_progress) meter.finish();

	if (file.record) {
		store.discard(*file.record);
	}
	else {
		storage.release(*staged);
	}

	result.files_sent++;
	result.original_bytes += descriptor.original_size;
	result.processed_bytes += staged->processed_size;

	if (console_progress) {
		std::cout << "Sent " << descriptor.logical_name << " (" << descriptor.original_size << " bytes";
		if (params.use_compression) {
			std::cout << ", " << std::fixed << std::setprecision(1)
					  << compression_ratio(descriptor.original_size, staged->processed_size) << "% saved by "
					  << algorithm_to_string(params.algorithm);
		}
		std::cout << ")" << std::endl;
	}

	return true;
}

std::vector<ResumableTransfer> Client::list_resumable_transfers()
{
	std::vector<ResumableTransfer> groups;

	for (const auto& record : store.list_all()) {
		ResumableTransfer::Kind kind = ResumableTransfer::Kind::SINGLE;
		if (!record.directory_name.empty()) {
			kind = ResumableTransfer::Kind::DIRECTORY;
		}
		else if (record.is_multi_file) {
			kind = ResumableTransfer::Kind::MULTI;
		}

		auto it = groups.end();
		if (kind != ResumableTransfer::Kind::SINGLE) {
			it = std::find_if(groups.begin(), groups.end(), [&](const ResumableTransfer& group) {
				return group.kind == kind
					&& group.host == record.host
					&& group.port == record.port
					&& group.directory_name == record.directory_name;
			});
		}

		if (it == groups.end()) {
			ResumableTransfer group;
			group.kind = kind;
			group.host = record.host;
			group.port = record.port;
			group.directory_name = record.directory_name;
			groups.push_back(group);
			it = std::prev(groups.end());
		}

		it->records.push_back(record);
		it->total_size += record.total_size;
		it->bytes_transferred += record.bytes_transferred;
		it->use_encryption = it->use_encryption || record.use_encryption;
	}

	for (auto& group : groups) {
		if (group.kind == ResumableTransfer::Kind::DIRECTORY) {
			std::sort(group.records.begin(), group.records.end(), [](const ResumeRecord& a, const ResumeRecord& b) {
				return a.relative_path < b.relative_path;
			});
		}
	}

	return groups;
}

SendResult Client::resume_transfer(size_t index, const std::optional<std::string>& password)
{
	std::vector<ResumableTransfer> groups = list_resumable_transfers();
	if (index == 0 || index > groups.size()) {
		throw std::out_of_range("No resumable transfer #" + std::to_string(index));
	}

	const ResumableTransfer& group = groups[index - 1];
	const ResumeRecord& first = group.records.front();

	TransferParameters resumed;
	resumed.use_compression = first.use_compression;
	resumed.algorithm = first.algorithm;
	resumed.use_encryption = group.use_encryption;
	resumed.resume_enabled = true;
	resumed.host = group.host;
	resumed.port = group.port;
	resumed.rate_limit_bytes_per_sec = params.rate_limit_bytes_per_sec;

	if (resumed.use_encryption) {
		if (!password || password->empty()) {
			throw std::invalid_argument("A password is required to resume an encrypted transfer");
		}
		resumed.password = password;
	}

	Client client(resumed, config);
	client.progress_handler = progress_handler;
	client.console_progress = console_progress;

	switch (group.kind) {
		case ResumableTransfer::Kind::SINGLE:
			return client.send_file(first.file_path);

		case ResumableTransfer::Kind::MULTI: {
			std::vector<std::filesystem::path> paths;
			for (const auto& record : group.records) {
				paths.emplace_back(record.file_path);
			}
			return client.send_multiple_files(paths);
		}

		case ResumableTransfer::Kind::DIRECTORY: {
			// only the files still pending
			std::vector<PendingFile> files;
			for (const auto& record : group.records) {
				PendingFile file;
				file.wire_name = record.relative_path;
				file.descriptor = describe_file(record.file_path, record.relative_path);
				files.push_back(std::move(file));
			}
			return client.send_job(JobKind::DIRECTORY, group.directory_name, files);
		}
	}

	throw std::logic_error("Unknown resumable transfer kind");
}
