#include "wire.hpp"

void WireWriter::write_bool(bool value)
{
	uint8_t b = value ? 1 : 0;
	out.write(&b, 1);
}

void WireWriter::write_int32(int32_t value)
{
	uint32_t le = htole32(static_cast<uint32_t>(value));
	out.write(reinterpret_cast<const uint8_t*>(&le), sizeof(le));
}

void WireWriter::write_int64(int64_t value)
{
	uint64_t le = htole64(static_cast<uint64_t>(value));
	out.write(reinterpret_cast<const uint8_t*>(&le), sizeof(le));
}

void WireWriter::write_string(const std::string& value)
{
	if (value.size() > wire::MAX_STRING_BYTES) {
		throw std::length_error("String too long for wire encoding");
	}

	uint8_t prefix[5];
	size_t prefix_len = 0;

	uint32_t len = static_cast<uint32_t>(value.size());
	while (len >= 0x80) {
		prefix[prefix_len++] = static_cast<uint8_t>(len | 0x80);
		len >>= 7;
	}
	prefix[prefix_len++] = static_cast<uint8_t>(len);

	out.write(prefix, prefix_len);
	out.write(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

void WireWriter::write_bytes(const uint8_t* data, size_t len)
{
	out.write(data, len);
}

bool WireReader::read_bool()
{
	uint8_t b = 0;
	in.read_exact(&b, 1);
	return b != 0;
}

int32_t WireReader::read_int32()
{
	uint32_t le = 0;
	in.read_exact(reinterpret_cast<uint8_t*>(&le), sizeof(le));
	return static_cast<int32_t>(le32toh(le));
}

int64_t WireReader::read_int64()
{
	uint64_t le = 0;
	in.read_exact(reinterpret_cast<uint8_t*>(&le), sizeof(le));
	return static_cast<int64_t>(le64toh(le));
}

std::string WireReader::read_string()
{
	uint32_t len = 0;
	int shift = 0;

	while (true) {
		if (shift > 28) {
			throw std::runtime_error("Malformed string length prefix");
		}

		uint8_t b = 0;
		in.read_exact(&b, 1);
		len |= static_cast<uint32_t>(b & 0x7F) << shift;
		if ((b & 0x80) == 0) break;
		shift += 7;
	}

	if (len > wire::MAX_STRING_BYTES) {
		throw std::runtime_error("String length " + std::to_string(len) + " exceeds protocol limit");
	}

	std::string value(len, '\0');
	if (len > 0) {
		in.read_exact(reinterpret_cast<uint8_t*>(value.data()), len);
	}
	return value;
}
