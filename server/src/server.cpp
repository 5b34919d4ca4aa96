#include "server.hpp"

#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <stdexcept>

#include "file_ops.hpp"
#include "logger.hpp"
#include "pipeline.hpp"
#include "socket_stream_reader.hpp"

namespace
{
	ServerStorageManager::StorageConfig storage_config_for(const ServerConfig& cfg)
	{
		ServerStorageManager::StorageConfig storage_cfg;
		storage_cfg.downloads_dir = cfg.downloads_dir;
		storage_cfg.tmp_dir = cfg.tmp_dir;
		return storage_cfg;
	}
}

Server::Server(const ServerConfig& cfg)
	: config(cfg), storage(storage_config_for(cfg))
{
}

Server::~Server()
{
	stop();
}

void Server::on_file_received(FileReceivedHandler handler)
{
	std::lock_guard<std::mutex> lock(handlers_mutex);
	handlers.push_back(std::move(handler));
}

void Server::notify(const ReceivedFile& file)
{
	std::vector<FileReceivedHandler> snapshot;
	{
		std::lock_guard<std::mutex> lock(handlers_mutex);
		snapshot = handlers;
	}

	for (auto& handler : snapshot) {
		handler(file);
	}
}

void Server::start()
{
	if (running) return;

	// create a socket
	int sockfd = socket(AF_INET, SOCK_STREAM, 0);
	if (sockfd < 0) {
		throw std::runtime_error(std::string("Failed to create socket: ") + std::strerror(errno));
	}

	// bind the address and port to the socket
	sockaddr_in addr{};
	addr.sin_family = AF_INET;
	addr.sin_port = htons(config.port);
	addr.sin_addr.s_addr = INADDR_ANY;

	int opt = 1;
	setsockopt(sockfd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

	// inherited by accepted sockets, must be set before listen()
	int rcvbuf = RECEIVE_BUFFER_BYTES;
	if (setsockopt(sockfd, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf)) < 0) {
		perror("Failed to cap receive buffer");
	}

	if (bind(sockfd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
		int err = errno;
		close(sockfd);
		throw std::runtime_error("Failed to bind port " + std::to_string(config.port) + ": " + std::strerror(err));
	}

	if (listen(sockfd, 8) < 0) {
		int err = errno;
		close(sockfd);
		throw std::runtime_error(std::string("Listening failed: ") + std::strerror(err));
	}

	sockaddr_in bound{};
	socklen_t bound_len = sizeof(bound);
	if (getsockname(sockfd, (struct sockaddr*)&bound, &bound_len) == 0) {
		bound_port = ntohs(bound.sin_port);
	}
	else {
		bound_port = config.port;
	}

	listenfd = sockfd;
	stop_requested = false;
	running = true;

	Logger::get().log_event(Logger::LogEvent::SERVICE_START, {
		{"port", static_cast<int>(bound_port)},
		{"dir", config.downloads_dir.string()},
		{"encryption", config.password.has_value()}
	});

	std::cout << "[INFO] Server is listening on port " << bound_port << std::endl;

	listener = std::thread(&Server::accept_loop, this);
}

void Server::run()
{
	start();

	std::unique_lock<std::mutex> lock(state_mutex);
	stopped_cv.wait(lock, [this] { return !running; });
}

void Server::stop()
{
	stop_requested = true;

	if (listener.joinable()) {
		listener.join();
	}

	// workers notice stop_requested between files, a read in progress is never cut short
	std::list<Worker> remaining;
	{
		std::lock_guard<std::mutex> lock(workers_mutex);
		remaining.swap(workers);
	}

	for (auto& worker : remaining) {
		if (worker.thread.joinable()) worker.thread.join();
		close(worker.fd);
	}

	if (listenfd >= 0) {
		close(listenfd);
		listenfd = -1;
	}

	if (running) {
		Logger::get().log_event(Logger::LogEvent::SERVICE_STOP, {
			{"port", static_cast<int>(bound_port)}
		});
	}

	{
		std::lock_guard<std::mutex> lock(state_mutex);
		running = false;
	}
	stopped_cv.notify_all();
}

void Server::reap_workers()
{
	std::lock_guard<std::mutex> lock(workers_mutex);

	for (auto it = workers.begin(); it != workers.end();) {
		if (*it->done) {
			if (it->thread.joinable()) it->thread.join();
			close(it->fd);
			it = workers.erase(it);
		}
		else {
			++it;
		}
	}
}

void Server::accept_loop()
{
	while (!stop_requested) {
		reap_workers();

		pollfd pfd{};
		pfd.fd = listenfd;
		pfd.events = POLLIN;

		int ready = poll(&pfd, 1, POLL_INTERVAL_MS);
		if (ready < 0) {
			if (errno == EINTR) continue;
			perror("poll failed");
			break;
		}
		if (ready == 0) continue;

		sockaddr_in client_addr{};
		socklen_t client_size = sizeof(client_addr);
		int clientfd = accept(listenfd, (struct sockaddr*)&client_addr, &client_size);
		if (clientfd < 0) {
			perror("Failed to accept connection.");
			continue;
		}

		char ip[INET_ADDRSTRLEN];
		inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
		std::string client_ip = ip;

		Logger::get().log_event(Logger::LogEvent::CLIENT_CONNECT, {
			{"ip", client_ip},
			{"port", static_cast<int>(ntohs(client_addr.sin_port))}
		});

		auto done = std::make_shared<std::atomic<bool>>(false);

		std::lock_guard<std::mutex> lock(workers_mutex);
		workers.push_back(Worker{
			std::thread([this, clientfd, client_ip, done] {
				handle_client(clientfd, client_ip);
				*done = true;
			}),
			clientfd,
			done
		});
	}
}

void Server::handle_client(int clientfd, const std::string& ip)
{
	SocketStreamReader socket_reader(clientfd);
	WireReader reader(socket_reader);

	try {
		std::string discriminator = reader.read_string();

		JobHeader header;
		header.use_compression = reader.read_bool();
		header.use_encryption = reader.read_bool();
		header.resume_enabled = reader.read_bool();
		if (header.use_compression) {
			header.algorithm = algorithm_from_int(reader.read_int32());
		}

		if (header.use_encryption && !config.password) {
			Logger::get().log_event(Logger::LogEvent::MISSING_PASSWORD, {
				{"ip", ip}
			});
			std::cerr << "[ERROR] " << ip << " sent encrypted data but no password is configured, dropping connection" << std::endl;
			return;
		}

		if (discriminator == wire::DIR_MARKER) {
			std::string dir_name = reader.read_string();
			int32_t count = reader.read_int32();

			std::cout << "[INFO] Receiving directory " << dir_name << " (" << count << " files) from " << ip << std::endl;

			for (int32_t i = 0; i < count && !stop_requested; ++i) {
				std::string relative = reader.read_string();
				if (!receive_file(reader, header, dir_name + "/" + relative, ip)) break;
			}
		}
		else if (discriminator == wire::MULTI_MARKER) {
			int32_t count = reader.read_int32();

			std::cout << "[INFO] Receiving " << count << " files from " << ip << std::endl;

			for (int32_t i = 0; i < count && !stop_requested; ++i) {
				std::string name = reader.read_string();
				if (!receive_file(reader, header, name, ip)) break;
			}
		}
		else {
			receive_file(reader, header, discriminator, ip);
		}
	}
	catch (const ConnectionError& e) {
		Logger::get().log_event(Logger::LogEvent::CLIENT_DISCONNECT, {
			{"ip", ip},
			{"reason", e.what()}
		});
		return;
	}
	catch (const std::exception& e) {
		Logger::get().log_event(Logger::LogEvent::RECEIVE_FAILURE, {
			{"ip", ip},
			{"error", e.what()}
		});
		std::cerr << "[ERROR] Transfer from " << ip << " failed: " << e.what() << std::endl;
		return;
	}

	Logger::get().log_event(Logger::LogEvent::CLIENT_DISCONNECT, {
		{"ip", ip}
	});
}

bool Server::receive_file(WireReader& reader, const JobHeader& header, const std::string& name, const std::string& ip)
{
	int64_t original_size = reader.read_int64();
	std::string expected_hash = reader.read_string();
	int64_t resume_offset = header.resume_enabled ? reader.read_int64() : 0;

	int64_t processed_size = reader.read_int64();
	int64_t processed_offset = header.resume_enabled ? reader.read_int64() : 0;

	if (original_size < 0 || processed_size < 0 || processed_offset < 0 || processed_offset > processed_size) {
		throw std::runtime_error("Invalid size fields for " + name);
	}

	std::string relative = ServerStorageManager::sanitize_relative_path(name);

	Logger::get().log_event(Logger::LogEvent::RECEIVE_START, {
		{"file", relative},
		{"ip", ip},
		{"size", original_size},
		{"processed", processed_size},
		{"resume_offset", resume_offset}
	});

	auto handle = storage.start_receive(relative, processed_size, processed_offset);

	if (handle->resume_gap) {
		Logger::get().log_event(Logger::LogEvent::RESUME_GAP, {
			{"file", relative},
			{"ip", ip},
			{"held", handle->partial_bytes},
			{"offset", processed_offset}
		});
		std::cerr << "[ERROR] Cannot resume " << relative << ": only " << handle->partial_bytes
				  << " of " << processed_offset << " bytes were kept, discarding the transfer" << std::endl;
	}

	uint8_t buf[CHUNK_SIZE];
	int64_t remaining = processed_size - processed_offset;

	while (remaining > 0) {
		size_t want = static_cast<size_t>(std::min<int64_t>(remaining, sizeof(buf)));

		size_t n = 0;
		try {
			n = reader.stream().read_some(buf, want);
		}
		catch (const ConnectionError&) {
			n = 0;
		}

		if (n == 0) {
			bool keep = header.resume_enabled && !handle->resume_gap;
			storage.abort_receive(*handle, keep);
			Logger::get().log_event(Logger::LogEvent::RECEIVE_INTERRUPTED, {
				{"file", relative},
				{"ip", ip},
				{"received", handle->bytes_written},
				{"expected", processed_size},
				{"partial_kept", keep}
			});
			std::cerr << "[WARN] Connection lost while receiving " << relative << std::endl;
			return false;
		}

		remaining -= static_cast<int64_t>(n);

		// the payload is still read so the next file stays in frame
		if (handle->resume_gap) continue;

		try {
			storage.write_chunk(*handle, buf, n);
		}
		catch (const std::exception&) {
			storage.abort_receive(*handle, false);
			throw;
		}
	}

	if (handle->resume_gap) {
		storage.abort_receive(*handle, false);
		return true;
	}

	std::filesystem::path staged;
	try {
		staged = storage.commit_receive(*handle);
	}
	catch (const std::exception&) {
		storage.abort_receive(*handle, false);
		throw;
	}

	ReverseResult result = Pipeline::reverse(staged, handle->final_path,
		header.use_compression, header.algorithm, header.use_encryption,
		config.password, config.tmp_dir);
	remove_temp_file(staged);

	if (result.status == ReverseResult::Status::FATAL) {
		Logger::get().log_event(Logger::LogEvent::RECEIVE_FAILURE, {
			{"file", relative},
			{"ip", ip},
			{"error", result.detail}
		});
		std::cerr << "[ERROR] Could not write " << relative << ": " << result.detail << std::endl;
		return true;
	}

	std::string actual_hash = sha256_file(handle->final_path);
	bool verified = hash_equals(actual_hash, expected_hash);

	if (!verified) {
		Logger::get().log_event(Logger::LogEvent::HASH_MISMATCH, {
			{"file", relative},
			{"expected", expected_hash},
			{"actual", actual_hash}
		});
		std::cerr << "[WARN] Hash mismatch for " << relative << " (expected " << expected_hash
				  << ", got " << actual_hash << "), file kept" << std::endl;
	}
	else {
		Logger::get().log_event(Logger::LogEvent::RECEIVE_COMPLETE, {
			{"file", relative},
			{"ip", ip},
			{"size", original_size},
			{"status", reverse_status_to_string(result.status)}
		});

		std::cout << "[INFO] Received " << relative << " (" << original_size << " bytes";
		if (header.use_compression) {
			std::cout << ", " << std::fixed << std::setprecision(1)
					  << compression_ratio(original_size, processed_size) << "% smaller on the wire";
		}
		std::cout << ")" << std::endl;
	}

	ReceivedFile received;
	received.path = handle->final_path;
	received.sender_ip = ip;
	received.original_size = original_size;
	received.verified = verified;
	notify(received);

	return true;
}
