#include "config.hpp"

#include <fstream>
#include <stdexcept>

#include "paths.hpp"

using json = nlohmann::json;

namespace
{
	json read_json(const std::filesystem::path& path)
	{
		std::ifstream in(path);
		if (!in.is_open()) {
			throw std::runtime_error("Failed to open config " + path.string());
		}

		try {
			return json::parse(in);
		}
		catch (const json::parse_error& e) {
			throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
		}
	}

	uint16_t read_port(const json& j, uint16_t fallback)
	{
		if (!j.contains("port")) return fallback;

		int port = j.at("port").get<int>();
		if (port <= 0 || port > 65535) {
			throw std::runtime_error("Config port out of range: " + std::to_string(port));
		}
		return static_cast<uint16_t>(port);
	}
}

ServerConfig ServerConfig::defaults()
{
	ServerConfig cfg;
	cfg.downloads_dir = PathMgr::downloads_dir();
	cfg.tmp_dir = PathMgr::tmp_dir();
	cfg.log_path = PathMgr::server_log_path();
	return cfg;
}

ServerConfig ServerConfig::load(const std::filesystem::path& path)
{
	ServerConfig cfg = defaults();
	json j = read_json(path);

	try {
		if (j.contains("downloads_dir")) cfg.downloads_dir = j.at("downloads_dir").get<std::string>();
		if (j.contains("tmp_dir")) cfg.tmp_dir = j.at("tmp_dir").get<std::string>();
		if (j.contains("log_path")) cfg.log_path = j.at("log_path").get<std::string>();
		if (j.contains("log_max_bytes")) cfg.log_max_bytes = j.at("log_max_bytes").get<size_t>();
		if (j.contains("password")) cfg.password = j.at("password").get<std::string>();
		cfg.port = read_port(j, cfg.port);
	}
	catch (const json::type_error& e) {
		throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
	}

	return cfg;
}

ClientConfig ClientConfig::defaults()
{
	ClientConfig cfg;
	cfg.resume_dir = PathMgr::resume_dir();
	cfg.tmp_dir = PathMgr::tmp_dir();
	cfg.log_path = PathMgr::client_log_path();
	return cfg;
}

ClientConfig ClientConfig::load(const std::filesystem::path& path)
{
	ClientConfig cfg = defaults();
	json j = read_json(path);

	try {
		if (j.contains("resume_dir")) cfg.resume_dir = j.at("resume_dir").get<std::string>();
		if (j.contains("tmp_dir")) cfg.tmp_dir = j.at("tmp_dir").get<std::string>();
		if (j.contains("log_path")) cfg.log_path = j.at("log_path").get<std::string>();
		if (j.contains("log_max_bytes")) cfg.log_max_bytes = j.at("log_max_bytes").get<size_t>();
		cfg.default_port = read_port(j, cfg.default_port);
	}
	catch (const json::type_error& e) {
		throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
	}

	return cfg;
}
