#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#include "connection_error.hpp"
#include "byte_stream.hpp"

#pragma once

class SocketStreamWriter : public StreamWriter {
	public:
		explicit SocketStreamWriter(int sock)
			: fd(sock) {}
		
		void write(const uint8_t* data, size_t len) override {
			size_t total = 0;
			while (total < len) {
				ssize_t sent = ::send(fd, data + total, len - total, MSG_NOSIGNAL);
				if (sent < 0 && errno == EINTR) continue;
				if (sent <= 0) {
					throw ConnectionError(std::string("Socket write failed: ") + std::strerror(errno));
				}

				total += sent;
			}
		}

		void flush() override {}

	private:
		int fd;
};
