#include <zlib.h>
#include <brotli/decode.h>
#include <brotli/encode.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

#include "transfer_types.hpp"

#pragma once

class Compression
{
	public:
		constexpr static size_t CHUNK_SIZE = 64 * 1024;

		constexpr static int GZIP_LEVEL = Z_DEFAULT_COMPRESSION;
		constexpr static int BROTLI_QUALITY = 5;
		constexpr static int BROTLI_WINDOW = 22;

		static void compress(std::istream& in, std::ostream& out, CompressionAlgorithm algorithm);

		// throws std::runtime_error on a corrupted or foreign stream
		static void decompress(std::istream& in, std::ostream& out, CompressionAlgorithm algorithm);

		static void compress_file(const std::filesystem::path& source, const std::filesystem::path& dest, CompressionAlgorithm algorithm);
		static void decompress_file(const std::filesystem::path& source, const std::filesystem::path& dest, CompressionAlgorithm algorithm);

	private:
		static void gzip_compress(std::istream& in, std::ostream& out);
		static void gzip_decompress(std::istream& in, std::ostream& out);
		static void brotli_compress(std::istream& in, std::ostream& out);
		static void brotli_decompress(std::istream& in, std::ostream& out);
};
