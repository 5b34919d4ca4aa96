#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#include "connection_error.hpp"
#include "byte_stream.hpp"

#pragma once

class SocketStreamReader : public StreamReader {
	public:
		explicit SocketStreamReader(int sock)
			: fd(sock) {}

		size_t read_some(uint8_t* data, size_t len) override {
			while (true) {
				ssize_t n = ::recv(fd, data, len, 0);
				if (n < 0 && errno == EINTR) continue;
				if (n < 0) {
					throw ConnectionError(std::string("Socket read failed: ") + std::strerror(errno));
				}
				return static_cast<size_t>(n);
			}
		}

		void read_exact(uint8_t* data, size_t len) override {
			size_t total = 0;
			while (total < len) {
				size_t n = read_some(data + total, len - total);
				if (n == 0) {
					throw ConnectionError("Connection closed by remote peer");
				}

				total += n;
			}
		}

	private:
		int fd;
};
