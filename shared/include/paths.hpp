#include <filesystem>
#include <iostream>

#pragma once

class PathMgr
{
	public:
		// $XDG_DATA_HOME/courier, or ~/.local/share/courier
		static std::filesystem::path data_root();

		static std::filesystem::path downloads_dir();
		static std::filesystem::path resume_dir();
		static std::filesystem::path tmp_dir();
		static std::filesystem::path log_dir();

		static std::filesystem::path server_log_path();
		static std::filesystem::path client_log_path();

		static bool mkdirs();
};
