#include "paths.hpp"

#include <cstdlib>

std::filesystem::path PathMgr::data_root()
{
	const char* xdg = std::getenv("XDG_DATA_HOME");
	if (xdg && *xdg) {
		return std::filesystem::path(xdg) / "courier";
	}

	const char* home = std::getenv("HOME");
	if (home && *home) {
		return std::filesystem::path(home) / ".local" / "share" / "courier";
	}

	// no home directory, e.g. a system service
	return std::filesystem::temp_directory_path() / "courier";
}

std::filesystem::path PathMgr::downloads_dir()
{
	return data_root() / "downloads";
}

std::filesystem::path PathMgr::resume_dir()
{
	return data_root() / "resume";
}

std::filesystem::path PathMgr::tmp_dir()
{
	return data_root() / "tmp";
}

std::filesystem::path PathMgr::log_dir()
{
	return data_root() / "logs";
}

std::filesystem::path PathMgr::server_log_path()
{
	return log_dir() / "courier-server.log";
}

std::filesystem::path PathMgr::client_log_path()
{
	return log_dir() / "courier.log";
}

bool PathMgr::mkdirs()
{
	try {
		std::filesystem::create_directories(data_root());
		std::filesystem::create_directory(downloads_dir());
		std::filesystem::create_directory(resume_dir());
		std::filesystem::create_directory(tmp_dir());
		std::filesystem::create_directory(log_dir());
	}
	catch (const std::filesystem::filesystem_error& e) {
		std::cerr << "Filesystem error: " << e.what() << std::endl;
		return false;
	}

	return true;
}
