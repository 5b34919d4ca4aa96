#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "byte_stream.hpp"

#pragma once

// caps the average write rate of another writer
class ThrottledStreamWriter : public StreamWriter {
	public:
		ThrottledStreamWriter(StreamWriter& inner, uint64_t bytes_per_second)
			: inner(inner), rate(bytes_per_second), start(std::chrono::steady_clock::now())
		{
			if (bytes_per_second == 0) {
				throw std::invalid_argument("Bytes per second must be greater than zero");
			}
		}

		void write(const uint8_t* data, size_t len) override {
			constexpr size_t SLICE = 8 * 1024;

			size_t offset = 0;
			while (offset < len) {
				size_t n = std::min(SLICE, len - offset);
				throttle(n);
				inner.write(data + offset, n);
				total += n;
				offset += n;
			}
		}

		void flush() override { inner.flush(); }

	private:
		StreamWriter& inner;
		uint64_t rate;
		uint64_t total = 0;
		std::chrono::steady_clock::time_point start;

		void throttle(size_t next) {
			using namespace std::chrono;

			// time at which total + next bytes are allowed to have left
			auto due = start + microseconds((total + next) * 1000000ULL / rate);
			auto now = steady_clock::now();
			if (due > now) {
				std::this_thread::sleep_for(due - now);
			}
		}
};
