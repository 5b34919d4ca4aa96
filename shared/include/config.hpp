#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "transfer_types.hpp"

#pragma once

struct ServerConfig {
	std::filesystem::path downloads_dir;
	uint16_t port = DEFAULT_PORT;

	// required to receive encrypted transfers
	std::optional<std::string> password;

	std::filesystem::path tmp_dir;
	std::filesystem::path log_path;
	size_t log_max_bytes = 10 * 1024 * 1024;

	static ServerConfig defaults();

	// overlays the keys present in a JSON file on top of the defaults
	static ServerConfig load(const std::filesystem::path& path);
};

struct ClientConfig {
	std::filesystem::path resume_dir;
	std::filesystem::path tmp_dir;
	std::filesystem::path log_path;
	size_t log_max_bytes = 10 * 1024 * 1024;

	uint16_t default_port = DEFAULT_PORT;

	static ClientConfig defaults();
	static ClientConfig load(const std::filesystem::path& path);
};
