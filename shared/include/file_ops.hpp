#include <openssl/evp.h>
#include <openssl/crypto.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "transfer_types.hpp"

#pragma once

std::string to_hex(const uint8_t* data, size_t len);

// lower-case hex SHA-256 of the file contents
std::string sha256_file(const std::filesystem::path& path);
std::string sha256_string(const std::string& data);

// constant-time compare of two hex digests
bool hash_equals(const std::string& a, const std::string& b);

// throws std::filesystem::filesystem_error (ENOENT) if the file does not exist
FileDescriptor describe_file(const std::filesystem::path& path, const std::string& logical_name);

// files under root in a stable order, paths relative to root
std::vector<std::filesystem::path> list_files_recursive(const std::filesystem::path& root);

// streaming file copy, truncating dest
void copy_file_contents(const std::filesystem::path& source, const std::filesystem::path& dest);

// best-effort delete, failures are logged and swallowed
void remove_temp_file(const std::filesystem::path& path);

double compression_ratio(int64_t original_size, int64_t processed_size);

void print_progress(int64_t current, int64_t total, int64_t bytes_per_second);

// rate limited console progress with throughput
class ProgressMeter
{
	public:
		explicit ProgressMeter(int64_t total, int64_t start = 0);

		void update(int64_t current);
		void finish();

	private:
		int64_t total;
		int64_t last_bytes;
		std::chrono::steady_clock::time_point last_update;
		bool printed = false;
};
