#include <gtest/gtest.h>

#include <chrono>

#include "test_util.hpp"
#include "throttled_stream_writer.hpp"
#include "wire.hpp"

TEST(WireWriter, IntegersAreLittleEndian)
{
	test::MemoryStreamWriter out;
	WireWriter writer(out);

	writer.write_int32(0x01020304);
	writer.write_int64(-2);

	std::vector<uint8_t> expected = {
		0x04, 0x03, 0x02, 0x01,
		0xFE, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF
	};
	EXPECT_EQ(out.bytes, expected);
}

TEST(WireWriter, BoolIsOneByte)
{
	test::MemoryStreamWriter out;
	WireWriter writer(out);

	writer.write_bool(true);
	writer.write_bool(false);

	EXPECT_EQ(out.bytes, (std::vector<uint8_t>{1, 0}));
}

TEST(WireWriter, StringUsesSevenBitLengthPrefix)
{
	test::MemoryStreamWriter out;
	WireWriter writer(out);

	writer.write_string("DIR:");
	ASSERT_EQ(out.bytes.size(), 5u);
	EXPECT_EQ(out.bytes[0], 4);

	out.bytes.clear();
	writer.write_string(std::string(300, 'a'));

	// 300 = 0b10_0101100
	ASSERT_EQ(out.bytes.size(), 302u);
	EXPECT_EQ(out.bytes[0], 0xAC);
	EXPECT_EQ(out.bytes[1], 0x02);
	EXPECT_EQ(out.bytes[2], 'a');
}

TEST(WireReader, ReadsWhatWriterWrote)
{
	test::MemoryStreamWriter out;
	WireWriter writer(out);

	writer.write_string("report.pdf");
	writer.write_bool(true);
	writer.write_bool(false);
	writer.write_int32(1);
	writer.write_int64(1LL << 40);
	writer.write_string("");
	writer.write_string("caf\xC3\xA9");

	test::MemoryStreamReader in(out.bytes);
	WireReader reader(in);

	EXPECT_EQ(reader.read_string(), "report.pdf");
	EXPECT_TRUE(reader.read_bool());
	EXPECT_FALSE(reader.read_bool());
	EXPECT_EQ(reader.read_int32(), 1);
	EXPECT_EQ(reader.read_int64(), 1LL << 40);
	EXPECT_EQ(reader.read_string(), "");
	EXPECT_EQ(reader.read_string(), "caf\xC3\xA9");
}

TEST(WireReader, TruncatedStringThrows)
{
	std::vector<uint8_t> bytes = {10, 'a', 'b'};
	test::MemoryStreamReader in(bytes);
	WireReader reader(in);

	EXPECT_THROW(reader.read_string(), std::runtime_error);
}

TEST(WireReader, RejectsOversizedString)
{
	// 0x7FFFFFFF encoded as a 5 byte prefix
	std::vector<uint8_t> bytes = {0xFF, 0xFF, 0xFF, 0xFF, 0x07};
	test::MemoryStreamReader in(bytes);
	WireReader reader(in);

	EXPECT_THROW(reader.read_string(), std::runtime_error);
}

TEST(WireReader, RejectsOverlongPrefix)
{
	std::vector<uint8_t> bytes = {0x80, 0x80, 0x80, 0x80, 0x80, 0x01};
	test::MemoryStreamReader in(bytes);
	WireReader reader(in);

	EXPECT_THROW(reader.read_string(), std::runtime_error);
}

TEST(ThrottledStreamWriter, RejectsZeroRate)
{
	test::MemoryStreamWriter out;
	EXPECT_THROW(ThrottledStreamWriter(out, 0), std::invalid_argument);
}

TEST(ThrottledStreamWriter, CapsAverageRate)
{
	test::MemoryStreamWriter out;
	ThrottledStreamWriter throttled(out, 256 * 1024);

	std::vector<uint8_t> data(128 * 1024, 0x5A);

	auto start = std::chrono::steady_clock::now();
	throttled.write(data.data(), data.size());
	auto elapsed = std::chrono::steady_clock::now() - start;

	EXPECT_EQ(out.bytes.size(), data.size());
	EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 450);
}
