#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "client.hpp"
#include "config.hpp"
#include "file_ops.hpp"
#include "logger.hpp"
#include "paths.hpp"
#include "transfer_queue.hpp"

namespace
{
	void usage()
	{
		std::cerr << "usage:\n"
				  << "  courier send <host> <path...> [--port n] [--gzip|--compress|--brotli]\n"
				  << "                [--encrypt pw] [--resume] [--limit KBps] [--queue]\n"
				  << "  courier list-resume\n"
				  << "  courier resume <index> [--password pw] [--limit KBps]\n"
				  << "options: [--config file] [--log file]" << std::endl;
	}

	uint16_t parse_port(const std::string& value)
	{
		int port = std::stoi(value);
		if (port <= 0 || port > 65535) {
			throw std::out_of_range("port out of range: " + value);
		}
		return static_cast<uint16_t>(port);
	}

	struct Options {
		std::string command;
		std::vector<std::string> positional;

		TransferParameters params;
		bool port_set = false;
		bool use_queue = false;

		std::optional<std::string> password;
		std::string config_path;
		std::string log_path;
	};

	Options parse_args(int argc, char** argv)
	{
		Options opts;
		if (argc < 2) throw std::invalid_argument("missing command");

		opts.command = argv[1];
		for (int i = 2; i < argc; ++i) {
			std::string arg = argv[i];
			bool has_value = i + 1 < argc;

			if (arg == "--port" && has_value) {
				opts.params.port = parse_port(argv[++i]);
				opts.port_set = true;
			}
			else if (arg == "--gzip" || arg == "--compress") {
				opts.params.use_compression = true;
				opts.params.algorithm = CompressionAlgorithm::GZIP;
			}
			else if (arg == "--brotli") {
				opts.params.use_compression = true;
				opts.params.algorithm = CompressionAlgorithm::BROTLI;
			}
			else if (arg == "--encrypt" && has_value) {
				opts.params.use_encryption = true;
				opts.params.password = std::string(argv[++i]);
			}
			else if (arg == "--password" && has_value) {
				opts.password = std::string(argv[++i]);
			}
			else if (arg == "--resume") {
				opts.params.resume_enabled = true;
			}
			else if (arg == "--limit" && has_value) {
				long long kbps = std::stoll(argv[++i]);
				if (kbps <= 0) throw std::invalid_argument("--limit must be positive");
				opts.params.rate_limit_bytes_per_sec = static_cast<uint64_t>(kbps) * 1024;
			}
			else if (arg == "--queue") {
				opts.use_queue = true;
			}
			else if (arg == "--config" && has_value) {
				opts.config_path = argv[++i];
			}
			else if (arg == "--log" && has_value) {
				opts.log_path = argv[++i];
			}
			else if (arg.rfind("--", 0) == 0) {
				throw std::invalid_argument("unknown option " + arg);
			}
			else {
				opts.positional.push_back(arg);
			}
		}

		return opts;
	}

	void print_result(const SendResult& result, bool compressed)
	{
		if (result.interrupted) {
			std::cerr << "Transfer interrupted (" << result.error << "). Run 'courier list-resume' to continue it." << std::endl;
			return;
		}

		std::cout << "Sent " << result.files_sent << (result.files_sent == 1 ? " file, " : " files, ")
				  << result.original_bytes << " bytes";
		if (compressed) {
			std::cout << " (" << std::fixed << std::setprecision(1)
					  << compression_ratio(result.original_bytes, result.processed_bytes) << "% compression)";
		}
		std::cout << std::endl;
	}

	int run_send(const Options& opts, const ClientConfig& config)
	{
		if (opts.positional.size() < 2) {
			usage();
			return 2;
		}

		TransferParameters params = opts.params;
		params.host = opts.positional[0];
		if (!opts.port_set) params.port = config.default_port;

		std::vector<std::filesystem::path> paths(opts.positional.begin() + 1, opts.positional.end());

		if (opts.use_queue) {
			TransferQueue queue(config);
			int failures = 0;

			queue.on_transfer_completed([&](const QueuedJob& job, bool success, const std::string& error) {
				if (success) {
					std::cout << "Done: " << job.describe() << std::endl;
				}
				else {
					std::cerr << "Failed: " << job.describe() << ": " << error << std::endl;
					++failures;
				}
			});
			queue.on_all_completed([] {
				std::cout << "All transfers completed" << std::endl;
			});

			for (const auto& path : paths) {
				QueuedJob job;
				if (std::filesystem::is_directory(path)) {
					job.target = DirectoryJob{path};
				}
				else {
					job.target = SingleFileJob{path};
				}
				job.params = params;
				queue.enqueue(std::move(job));
			}

			for (const auto& line : queue.pending()) {
				std::cout << "Queued " << line << std::endl;
			}

			queue.start();
			queue.wait_idle();
			return failures == 0 ? 0 : 1;
		}

		Client client(params, config);
		client.set_console_progress(true);

		SendResult result;
		if (paths.size() > 1) {
			result = client.send_multiple_files(paths);
		}
		else if (std::filesystem::is_directory(paths.front())) {
			result = client.send_directory(paths.front());
		}
		else {
			result = client.send_file(paths.front());
		}

		print_result(result, params.use_compression);
		return result.interrupted ? 3 : 0;
	}

	int run_list_resume(const ClientConfig& config)
	{
		Client client(TransferParameters{}, config);
		auto transfers = client.list_resumable_transfers();

		if (transfers.empty()) {
			std::cout << "No interrupted transfers" << std::endl;
			return 0;
		}

		for (size_t i = 0; i < transfers.size(); ++i) {
			std::cout << "  " << (i + 1) << ". " << transfers[i].describe() << std::endl;
		}
		return 0;
	}

	int run_resume(const Options& opts, const ClientConfig& config)
	{
		if (opts.positional.size() != 1) {
			usage();
			return 2;
		}

		size_t index = static_cast<size_t>(std::stoul(opts.positional[0]));

		TransferParameters params;
		params.rate_limit_bytes_per_sec = opts.params.rate_limit_bytes_per_sec;

		Client client(params, config);
		client.set_console_progress(true);

		SendResult result = client.resume_transfer(index, opts.password);
		print_result(result, false);
		return result.interrupted ? 3 : 0;
	}
}

int main(int argc, char** argv)
{
	Options opts;
	ClientConfig config;

	try {
		opts = parse_args(argc, argv);

		if (!opts.config_path.empty()) {
			config = ClientConfig::load(opts.config_path);
		}
		else {
			if (!PathMgr::mkdirs()) return 1;
			config = ClientConfig::defaults();
		}

		if (!opts.log_path.empty()) config.log_path = opts.log_path;
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

	int rc = 0;
	try {
		if (opts.command == "send") {
			rc = run_send(opts, config);
		}
		else if (opts.command == "list-resume") {
			rc = run_list_resume(config);
		}
		else if (opts.command == "resume") {
			rc = run_resume(opts, config);
		}
		else {
			usage();
			rc = 2;
		}
	}
	catch (const std::filesystem::filesystem_error& e) {
		std::cerr << "File error: " << e.what() << std::endl;
		rc = 1;
	}
	catch (const std::exception& e) {
		std::cerr << "Error: " << e.what() << std::endl;
		rc = 1;
	}

	Logger::get().close();
	return rc;
}
