#include "compression.hpp"

#include <memory>
#include <string>

namespace
{
	// gzip container rather than a raw zlib stream
	constexpr int GZIP_WINDOW_BITS = 15 + 16;

	struct DeflateGuard {
		z_stream* strm;
		~DeflateGuard() { deflateEnd(strm); }
	};

	struct InflateGuard {
		z_stream* strm;
		~InflateGuard() { inflateEnd(strm); }
	};

	using BrotliEncoderPtr = std::unique_ptr<BrotliEncoderState, decltype(&BrotliEncoderDestroyInstance)>;
	using BrotliDecoderPtr = std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)>;

	size_t read_chunk(std::istream& in, std::vector<uint8_t>& buf)
	{
		in.read(reinterpret_cast<char*>(buf.data()), buf.size());
		if (in.bad()) {
			throw std::runtime_error("Read error while streaming compression input");
		}
		return static_cast<size_t>(in.gcount());
	}

	void write_chunk(std::ostream& out, const uint8_t* data, size_t len)
	{
		if (len == 0) return;

		out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
		if (!out) {
			throw std::runtime_error("Write error while streaming compression output");
		}
	}
}

void Compression::compress(std::istream& in, std::ostream& out, CompressionAlgorithm algorithm)
{
	switch (algorithm) {
		case CompressionAlgorithm::GZIP:
			gzip_compress(in, out);
			return;
		case CompressionAlgorithm::BROTLI:
			brotli_compress(in, out);
			return;
	}
	throw std::invalid_argument("Unknown compression algorithm");
}

void Compression::decompress(std::istream& in, std::ostream& out, CompressionAlgorithm algorithm)
{
	switch (algorithm) {
		case CompressionAlgorithm::GZIP:
			gzip_decompress(in, out);
			return;
		case CompressionAlgorithm::BROTLI:
			brotli_decompress(in, out);
			return;
	}
	throw std::invalid_argument("Unknown compression algorithm");
}

void Compression::compress_file(const std::filesystem::path& source, const std::filesystem::path& dest, CompressionAlgorithm algorithm)
{
	std::ifstream in(source, std::ios::binary);
	if (!in) throw std::runtime_error("Failed to open " + source.string());

	std::ofstream out(dest, std::ios::binary | std::ios::trunc);
	if (!out) throw std::runtime_error("Failed to open " + dest.string());

	compress(in, out, algorithm);
	out.flush();
}

void Compression::decompress_file(const std::filesystem::path& source, const std::filesystem::path& dest, CompressionAlgorithm algorithm)
{
	std::ifstream in(source, std::ios::binary);
	if (!in) throw std::runtime_error("Failed to open " + source.string());

	std::ofstream out(dest, std::ios::binary | std::ios::trunc);
	if (!out) throw std::runtime_error("Failed to open " + dest.string());

	decompress(in, out, algorithm);
	out.flush();
}

void Compression::gzip_compress(std::istream& in, std::ostream& out)
{
	z_stream strm{};
	if (deflateInit2(&strm, GZIP_LEVEL, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
		throw std::runtime_error("deflateInit2 failed");
	}
	DeflateGuard guard{&strm};

	std::vector<uint8_t> inbuf(CHUNK_SIZE);
	std::vector<uint8_t> outbuf(CHUNK_SIZE);

	int flush = Z_NO_FLUSH;
	do {
		size_t got = read_chunk(in, inbuf);
		flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;

		strm.next_in = inbuf.data();
		strm.avail_in = static_cast<uInt>(got);

		do {
			strm.next_out = outbuf.data();
			strm.avail_out = static_cast<uInt>(outbuf.size());

			if (deflate(&strm, flush) == Z_STREAM_ERROR) {
				throw std::runtime_error("deflate failed");
			}

			write_chunk(out, outbuf.data(), outbuf.size() - strm.avail_out);
		} while (strm.avail_out == 0);
	} while (flush != Z_FINISH);
}

void Compression::gzip_decompress(std::istream& in, std::ostream& out)
{
	z_stream strm{};
	if (inflateInit2(&strm, GZIP_WINDOW_BITS) != Z_OK) {
		throw std::runtime_error("inflateInit2 failed");
	}
	InflateGuard guard{&strm};

	std::vector<uint8_t> inbuf(CHUNK_SIZE);
	std::vector<uint8_t> outbuf(CHUNK_SIZE);

	int ret = Z_OK;
	while (ret != Z_STREAM_END) {
		size_t got = read_chunk(in, inbuf);
		if (got == 0) {
			throw std::runtime_error("gzip stream is truncated");
		}

		strm.next_in = inbuf.data();
		strm.avail_in = static_cast<uInt>(got);

		do {
			strm.next_out = outbuf.data();
			strm.avail_out = static_cast<uInt>(outbuf.size());

			ret = inflate(&strm, Z_NO_FLUSH);
			if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR) {
				std::string msg = strm.msg ? strm.msg : "inflate failed";
				throw std::runtime_error("gzip: " + msg);
			}

			write_chunk(out, outbuf.data(), outbuf.size() - strm.avail_out);
		} while (strm.avail_out == 0 && ret != Z_STREAM_END);
	}
}

void Compression::brotli_compress(std::istream& in, std::ostream& out)
{
	BrotliEncoderPtr state(BrotliEncoderCreateInstance(nullptr, nullptr, nullptr), &BrotliEncoderDestroyInstance);
	if (!state) throw std::runtime_error("BrotliEncoderCreateInstance failed");

	BrotliEncoderSetParameter(state.get(), BROTLI_PARAM_QUALITY, BROTLI_QUALITY);
	BrotliEncoderSetParameter(state.get(), BROTLI_PARAM_LGWIN, BROTLI_WINDOW);

	std::vector<uint8_t> inbuf(CHUNK_SIZE);
	std::vector<uint8_t> outbuf(CHUNK_SIZE);

	size_t available_in = 0;
	const uint8_t* next_in = nullptr;
	bool eof = false;

	while (true) {
		if (available_in == 0 && !eof) {
			available_in = read_chunk(in, inbuf);
			next_in = inbuf.data();
			eof = in.eof();
		}

		size_t available_out = outbuf.size();
		uint8_t* next_out = outbuf.data();

		BrotliEncoderOperation op = eof ? BROTLI_OPERATION_FINISH : BROTLI_OPERATION_PROCESS;
		if (!BrotliEncoderCompressStream(state.get(), op, &available_in, &next_in, &available_out, &next_out, nullptr)) {
			throw std::runtime_error("Brotli compression failed");
		}

		write_chunk(out, outbuf.data(), outbuf.size() - available_out);

		if (BrotliEncoderIsFinished(state.get())) break;
	}
}

void Compression::brotli_decompress(std::istream& in, std::ostream& out)
{
	BrotliDecoderPtr state(BrotliDecoderCreateInstance(nullptr, nullptr, nullptr), &BrotliDecoderDestroyInstance);
	if (!state) throw std::runtime_error("BrotliDecoderCreateInstance failed");

	std::vector<uint8_t> inbuf(CHUNK_SIZE);
	std::vector<uint8_t> outbuf(CHUNK_SIZE);

	size_t available_in = 0;
	const uint8_t* next_in = nullptr;

	BrotliDecoderResult result = BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT;
	while (true) {
		if (result == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT) {
			available_in = read_chunk(in, inbuf);
			next_in = inbuf.data();
			if (available_in == 0) {
				throw std::runtime_error("brotli stream is truncated");
			}
		}

		size_t available_out = outbuf.size();
		uint8_t* next_out = outbuf.data();

		result = BrotliDecoderDecompressStream(state.get(), &available_in, &next_in, &available_out, &next_out, nullptr);

		write_chunk(out, outbuf.data(), outbuf.size() - available_out);

		if (result == BROTLI_DECODER_RESULT_SUCCESS) break;
		if (result == BROTLI_DECODER_RESULT_ERROR) {
			throw std::runtime_error(std::string("brotli: ") +
				BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state.get())));
		}
	}
}
