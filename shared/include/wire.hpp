#include <endian.h>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "byte_stream.hpp"

#pragma once

/*
 *	WIRE PRIMITIVES:
 *	bool    1 byte, 0 or 1
 *	int32   4 bytes little-endian
 *	int64   8 bytes little-endian
 *	string  7-bit encoded byte length, then UTF-8 bytes
 *
 *	Same encoding as .NET BinaryWriter so mixed peers interoperate.
 */

namespace wire
{
	constexpr const char* DIR_MARKER = "DIR:";
	constexpr const char* MULTI_MARKER = "MULTI:";

	// refuse absurd string lengths from a confused peer
	constexpr uint32_t MAX_STRING_BYTES = 64 * 1024;
}

class WireWriter
{
	public:
		explicit WireWriter(StreamWriter& writer)
			: out(writer) {}

		void write_bool(bool value);
		void write_int32(int32_t value);
		void write_int64(int64_t value);
		void write_string(const std::string& value);
		void write_bytes(const uint8_t* data, size_t len);

		StreamWriter& stream() { return out; }

	private:
		StreamWriter& out;
};

class WireReader
{
	public:
		explicit WireReader(StreamReader& reader)
			: in(reader) {}

		bool read_bool();
		int32_t read_int32();
		int64_t read_int64();
		std::string read_string();

		StreamReader& stream() { return in; }

	private:
		StreamReader& in;
};
