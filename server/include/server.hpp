#include <sys/socket.h>   // socket(), bind(), listen(), accept()
#include <netinet/in.h>   // sockaddr_in, INADDR_ANY, htons()
#include <arpa/inet.h>    // inet_ntop()
#include <unistd.h>       // close()

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "config.hpp"
#include "server_storage_manager.hpp"
#include "transfer_types.hpp"
#include "wire.hpp"

#pragma once

struct ReceivedFile {
	std::filesystem::path path;
	std::string sender_ip;
	int64_t original_size = 0;

	// content hash matched the sender's
	bool verified = false;
};

class Server
{
	public:
		using FileReceivedHandler = std::function<void(const ReceivedFile&)>;

		explicit Server(const ServerConfig& cfg);
		~Server();

		Server(const Server&) = delete;
		Server& operator=(const Server&) = delete;

		// handlers run on connection worker threads
		void on_file_received(FileReceivedHandler handler);

		// binds and spawns the listener thread, returns once listening
		void start();

		// start() then block until stop() is called from another thread
		void run();

		// stops accepting and joins every thread once its current file is done.
		// a peer that stalls mid-file keeps this blocking
		void stop();

		bool is_running() const { return running; }

		// the bound port, useful when configured with port 0
		uint16_t port() const { return bound_port; }

	private:
		static constexpr int POLL_INTERVAL_MS = 100;
		static constexpr size_t CHUNK_SIZE = 8 * 1024;

		/* PROTOCOL: per-job header, after the discriminator */
		struct JobHeader {
			bool use_compression = false;
			bool use_encryption = false;
			bool resume_enabled = false;
			CompressionAlgorithm algorithm = CompressionAlgorithm::GZIP;
		};

		struct Worker {
			std::thread thread;
			int fd;
			std::shared_ptr<std::atomic<bool>> done;
		};

		ServerConfig config;
		ServerStorageManager storage;

		int listenfd = -1;
		uint16_t bound_port = 0;

		std::atomic<bool> running{false};
		std::atomic<bool> stop_requested{false};
		std::thread listener;

		std::mutex workers_mutex;
		std::list<Worker> workers;

		std::mutex handlers_mutex;
		std::vector<FileReceivedHandler> handlers;

		std::mutex state_mutex;
		std::condition_variable stopped_cv;

		void accept_loop();
		void reap_workers();

		void handle_client(int clientfd, const std::string& ip);
		bool receive_file(WireReader& reader, const JobHeader& header, const std::string& name, const std::string& ip);

		void notify(const ReceivedFile& file);
};
