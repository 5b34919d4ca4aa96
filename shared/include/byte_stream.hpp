#include <cstddef>
#include <cstdint>

#pragma once

/*
 *	Byte sinks and sources the wire codec runs over. Sockets implement both
 *	in production, tests swap in memory buffers.
 */
class StreamWriter
{
	public:
		virtual ~StreamWriter() = default;

		// throws ConnectionError when the peer is gone
		virtual void write(const uint8_t* data, size_t len) = 0;
		virtual void flush() = 0;
};

class StreamReader
{
	public:
		virtual ~StreamReader() = default;

		// returns the number of bytes read, 0 at end of stream
		virtual size_t read_some(uint8_t* data, size_t len) = 0;

		// throws if the stream ends before len bytes arrive
		virtual void read_exact(uint8_t* data, size_t len) = 0;
};
