#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "byte_stream.hpp"

#pragma once

namespace test
{
	// fresh directory under the system temp dir, removed on destruction
	class TempDir
	{
		public:
			TempDir()
			{
				std::string pattern = (std::filesystem::temp_directory_path() / "courier-test-XXXXXX").string();
				std::vector<char> buf(pattern.begin(), pattern.end());
				buf.push_back('\0');

				if (mkdtemp(buf.data()) == nullptr) {
					throw std::runtime_error("mkdtemp failed");
				}
				root = buf.data();
			}

			~TempDir()
			{
				std::error_code ec;
				std::filesystem::remove_all(root, ec);
			}

			TempDir(const TempDir&) = delete;
			TempDir& operator=(const TempDir&) = delete;

			const std::filesystem::path& path() const { return root; }
			std::filesystem::path operator/(const std::string& name) const { return root / name; }

		private:
			std::filesystem::path root;
	};

	inline void write_file(const std::filesystem::path& path, const std::string& content)
	{
		if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

		std::ofstream out(path, std::ios::binary | std::ios::trunc);
		out.write(content.data(), static_cast<std::streamsize>(content.size()));
	}

	inline std::string read_file(const std::filesystem::path& path)
	{
		std::ifstream in(path, std::ios::binary);
		return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
	}

	inline std::string random_bytes(size_t len, uint32_t seed = 42)
	{
		std::mt19937 rng(seed);
		std::uniform_int_distribution<int> dist(0, 255);

		std::string out(len, '\0');
		for (auto& c : out) c = static_cast<char>(dist(rng));
		return out;
	}

	class MemoryStreamWriter : public StreamWriter {
		public:
			void write(const uint8_t* data, size_t len) override {
				bytes.insert(bytes.end(), data, data + len);
			}

			void flush() override {}

			std::vector<uint8_t> bytes;
	};

	class MemoryStreamReader : public StreamReader {
		public:
			explicit MemoryStreamReader(std::vector<uint8_t> data)
				: bytes(std::move(data)) {}

			size_t read_some(uint8_t* data, size_t len) override {
				size_t n = std::min(len, bytes.size() - pos);
				std::memcpy(data, bytes.data() + pos, n);
				pos += n;
				return n;
			}

			void read_exact(uint8_t* data, size_t len) override {
				if (bytes.size() - pos < len) {
					throw std::runtime_error("Unexpected end of stream");
				}
				read_some(data, len);
			}

		private:
			std::vector<uint8_t> bytes;
			size_t pos = 0;
	};

	// collects values pushed from other threads
	template <class T>
	class Collector
	{
		public:
			void push(const T& value)
			{
				{
					std::lock_guard<std::mutex> lock(mutex);
					items.push_back(value);
				}
				cv.notify_all();
			}

			bool wait_for(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(20))
			{
				std::unique_lock<std::mutex> lock(mutex);
				return cv.wait_for(lock, timeout, [&] { return items.size() >= count; });
			}

			std::vector<T> snapshot()
			{
				std::lock_guard<std::mutex> lock(mutex);
				return items;
			}

		private:
			std::mutex mutex;
			std::condition_variable cv;
			std::vector<T> items;
	};
}
