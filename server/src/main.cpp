#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

#include "config.hpp"
#include "logger.hpp"
#include "paths.hpp"
#include "server.hpp"

namespace
{
	volatile std::sig_atomic_t quit = 0;

	void handle_signal(int)
	{
		quit = 1;
	}

	void usage()
	{
		std::cerr << "usage: courier-server [--config file] [--port n] [--dir path] [--password pw] [--log file]" << std::endl;
	}

	uint16_t parse_port(const std::string& value)
	{
		int port = std::stoi(value);
		if (port < 0 || port > 65535) {
			throw std::out_of_range("port out of range: " + value);
		}
		return static_cast<uint16_t>(port);
	}
}

int main(int argc, char** argv)
{
	ServerConfig config;

	try {
		// the config file is the base, flags override it
		std::string config_path;
		for (int i = 1; i < argc - 1; ++i) {
			if (std::strcmp(argv[i], "--config") == 0) config_path = argv[i + 1];
		}

		if (!config_path.empty()) {
			config = ServerConfig::load(config_path);
		}
		else {
			if (!PathMgr::mkdirs()) return 1;
			config = ServerConfig::defaults();
		}

		for (int i = 1; i < argc; ++i) {
			std::string arg = argv[i];
			bool has_value = i + 1 < argc;

			if (arg == "--config" && has_value) {
				++i;
			}
			else if (arg == "--port" && has_value) {
				config.port = parse_port(argv[++i]);
			}
			else if (arg == "--dir" && has_value) {
				config.downloads_dir = argv[++i];
			}
			else if (arg == "--password" && has_value) {
				config.password = std::string(argv[++i]);
			}
			else if (arg == "--log" && has_value) {
				config.log_path = argv[++i];
			}
			else if (arg == "--help" || arg == "-h") {
				usage();
				return 0;
			}
			else {
				usage();
				return 2;
			}
		}
	}
	catch (const std::exception& e) {
		std::cerr << "Invalid arguments: " << e.what() << std::endl;
		usage();
		return 2;
	}

	if (!Logger::get().open(config.log_path, config.log_max_bytes)) {
		std::cerr << "Logging to stderr, cannot open " << config.log_path << std::endl;
	}

	signal(SIGPIPE, SIG_IGN);
	signal(SIGINT, handle_signal);
	signal(SIGTERM, handle_signal);

	try {
		Server server(config);
		server.on_file_received([](const ReceivedFile& file) {
			std::cout << "[INFO] " << file.path.string() << " from " << file.sender_ip
					  << (file.verified ? " verified" : " NOT verified") << std::endl;
		});

		server.start();

		std::cout << "Saving files to " << config.downloads_dir.string() << ", press Ctrl+C to stop" << std::endl;
		if (!config.password) {
			std::cout << "No password configured, encrypted transfers will be refused" << std::endl;
		}

		while (!quit) {
			std::this_thread::sleep_for(std::chrono::milliseconds(200));
		}

		std::cout << "\nShutting down" << std::endl;
		server.stop();
	}
	catch (const std::exception& e) {
		std::cerr << "Server error: " << e.what() << std::endl;
		return 1;
	}

	Logger::get().close();
	return 0;
}
