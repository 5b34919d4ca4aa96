#include <gtest/gtest.h>

#include <sstream>

#include "compression.hpp"
#include "file_ops.hpp"
#include "test_util.hpp"

namespace
{
	std::string compress_string(const std::string& input, CompressionAlgorithm algorithm)
	{
		std::istringstream in(input);
		std::ostringstream out;
		Compression::compress(in, out, algorithm);
		return out.str();
	}

	std::string decompress_string(const std::string& input, CompressionAlgorithm algorithm)
	{
		std::istringstream in(input);
		std::ostringstream out;
		Compression::decompress(in, out, algorithm);
		return out.str();
	}
}

TEST(Compression, GzipRoundTripShrinksRepetitiveData)
{
	std::string input(1024 * 1024, 'X');

	std::string packed = compress_string(input, CompressionAlgorithm::GZIP);
	EXPECT_LT(packed.size(), input.size() / 100);
	EXPECT_EQ(decompress_string(packed, CompressionAlgorithm::GZIP), input);
}

TEST(Compression, GzipWritesGzipContainer)
{
	std::string packed = compress_string("hello", CompressionAlgorithm::GZIP);

	ASSERT_GE(packed.size(), 2u);
	EXPECT_EQ(static_cast<uint8_t>(packed[0]), 0x1F);
	EXPECT_EQ(static_cast<uint8_t>(packed[1]), 0x8B);
}

TEST(Compression, BrotliRoundTripOfMixedData)
{
	std::string input = test::random_bytes(200 * 1024) + std::string(300 * 1024, 'a');

	std::string packed = compress_string(input, CompressionAlgorithm::BROTLI);
	EXPECT_LT(packed.size(), input.size());
	EXPECT_EQ(decompress_string(packed, CompressionAlgorithm::BROTLI), input);
}

TEST(Compression, EmptyInputRoundTrips)
{
	for (auto algorithm : {CompressionAlgorithm::GZIP, CompressionAlgorithm::BROTLI}) {
		std::string packed = compress_string("", algorithm);
		EXPECT_FALSE(packed.empty());
		EXPECT_EQ(decompress_string(packed, algorithm), "");
	}
}

TEST(Compression, CorruptGzipThrows)
{
	EXPECT_THROW(decompress_string("definitely not gzip data", CompressionAlgorithm::GZIP), std::runtime_error);
}

TEST(Compression, TruncatedStreamsThrow)
{
	std::string input = test::random_bytes(64 * 1024);

	for (auto algorithm : {CompressionAlgorithm::GZIP, CompressionAlgorithm::BROTLI}) {
		std::string packed = compress_string(input, algorithm);
		packed.resize(packed.size() / 2);
		EXPECT_THROW(decompress_string(packed, algorithm), std::runtime_error) << algorithm_to_string(algorithm);
	}
}

TEST(Compression, FileHelpers)
{
	test::TempDir dir;
	std::string content = "line of text\n";
	for (int i = 0; i < 12; ++i) content += content;

	test::write_file(dir / "plain.txt", content);
	Compression::compress_file(dir / "plain.txt", dir / "plain.txt.gz", CompressionAlgorithm::GZIP);
	Compression::decompress_file(dir / "plain.txt.gz", dir / "restored.txt", CompressionAlgorithm::GZIP);

	EXPECT_EQ(test::read_file(dir / "restored.txt"), content);
	EXPECT_EQ(sha256_file(dir / "restored.txt"), sha256_file(dir / "plain.txt"));
}

TEST(Compression, RatioFormula)
{
	EXPECT_DOUBLE_EQ(compression_ratio(1000, 250), 75.0);
	EXPECT_DOUBLE_EQ(compression_ratio(0, 10), 0.0);
	EXPECT_LT(compression_ratio(100, 120), 0.0);
}

TEST(Compression, AlgorithmValuesMatchWire)
{
	EXPECT_EQ(algorithm_from_int(0), CompressionAlgorithm::GZIP);
	EXPECT_EQ(algorithm_from_int(1), CompressionAlgorithm::BROTLI);
	EXPECT_THROW(algorithm_from_int(7), std::runtime_error);
}
