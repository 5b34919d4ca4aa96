#include <stdexcept>
#include <string>

#pragma once

// the peer went away or the socket failed mid-transfer
class ConnectionError : public std::runtime_error {
	public:
		explicit ConnectionError(const std::string& what)
			: std::runtime_error(what) {}
};
