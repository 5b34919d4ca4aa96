#include <gtest/gtest.h>

#include "compression.hpp"
#include "file_ops.hpp"
#include "pipeline.hpp"
#include "test_util.hpp"

namespace
{
	struct StageCase {
		bool compress;
		CompressionAlgorithm algorithm;
		bool encrypt;
	};

	class PipelineRoundTrip : public ::testing::TestWithParam<StageCase> {};
}

TEST_P(PipelineRoundTrip, ReverseRestoresOriginal)
{
	const StageCase& c = GetParam();
	test::TempDir dir;

	std::string content = test::random_bytes(40000) + std::string(90000, 'q');
	test::write_file(dir / "source.bin", content);
	FileDescriptor descriptor = describe_file(dir / "source.bin", "source.bin");

	TransferParameters params;
	params.use_compression = c.compress;
	params.algorithm = c.algorithm;
	params.use_encryption = c.encrypt;
	if (c.encrypt) params.password = "correct horse";

	StagedArtifact staged = Pipeline::stage(descriptor, params, dir / "tmp");
	ASSERT_TRUE(std::filesystem::exists(staged.path));
	EXPECT_EQ(staged.processed_size, static_cast<int64_t>(std::filesystem::file_size(staged.path)));
	if (c.compress && !c.encrypt) {
		EXPECT_LT(staged.processed_size, descriptor.original_size);
	}

	ReverseResult result = Pipeline::reverse(staged.path, dir / "out" / "source.bin",
		c.compress, c.algorithm, c.encrypt, params.password, dir / "tmp");

	EXPECT_EQ(result.status, ReverseResult::Status::OK) << result.detail;
	EXPECT_TRUE(hash_equals(sha256_file(dir / "out" / "source.bin"), descriptor.content_hash));

	// intermediate files are cleaned up, only the staged artifact remains
	size_t leftovers = 0;
	for (const auto& entry : std::filesystem::directory_iterator(dir / "tmp")) {
		if (entry.path() != staged.path) ++leftovers;
	}
	EXPECT_EQ(leftovers, 0u);
}

INSTANTIATE_TEST_SUITE_P(AllStageCombinations, PipelineRoundTrip, ::testing::Values(
	StageCase{false, CompressionAlgorithm::GZIP, false},
	StageCase{true, CompressionAlgorithm::GZIP, false},
	StageCase{false, CompressionAlgorithm::GZIP, true},
	StageCase{true, CompressionAlgorithm::BROTLI, true}
));

TEST(Pipeline, StageRequiresPasswordForEncryption)
{
	test::TempDir dir;
	test::write_file(dir / "a.txt", "abc");
	FileDescriptor descriptor = describe_file(dir / "a.txt", "a.txt");

	TransferParameters params;
	params.use_encryption = true;

	EXPECT_THROW(Pipeline::stage(descriptor, params, dir / "tmp"), std::invalid_argument);
}

TEST(Pipeline, UndecompressableDataIsKeptRaw)
{
	test::TempDir dir;
	test::write_file(dir / "staged", "this was never compressed");

	ReverseResult result = Pipeline::reverse(dir / "staged", dir / "out.txt",
		true, CompressionAlgorithm::GZIP, false, std::nullopt, dir.path());

	EXPECT_EQ(result.status, ReverseResult::Status::DEGRADED);
	EXPECT_FALSE(result.detail.empty());
	EXPECT_EQ(test::read_file(dir / "out.txt"), "this was never compressed");
}

TEST(Pipeline, WrongPasswordDegrades)
{
	test::TempDir dir;
	test::write_file(dir / "a.txt", std::string(5000, 'z'));
	FileDescriptor descriptor = describe_file(dir / "a.txt", "a.txt");

	TransferParameters params;
	params.use_compression = true;
	params.use_encryption = true;
	params.password = "sender";

	StagedArtifact staged = Pipeline::stage(descriptor, params, dir / "tmp");

	ReverseResult result = Pipeline::reverse(staged.path, dir / "out.txt",
		true, CompressionAlgorithm::GZIP, true, std::string("receiver"), dir / "tmp");

	EXPECT_EQ(result.status, ReverseResult::Status::DEGRADED);
	EXPECT_TRUE(std::filesystem::exists(dir / "out.txt"));
	EXPECT_FALSE(hash_equals(sha256_file(dir / "out.txt"), descriptor.content_hash));
}

TEST(Pipeline, EncryptedWithoutPasswordIsFatal)
{
	test::TempDir dir;
	test::write_file(dir / "staged", "opaque");

	ReverseResult result = Pipeline::reverse(dir / "staged", dir / "out.txt",
		false, CompressionAlgorithm::GZIP, true, std::nullopt, dir.path());

	EXPECT_EQ(result.status, ReverseResult::Status::FATAL);
	EXPECT_FALSE(std::filesystem::exists(dir / "out.txt"));
}

TEST(Pipeline, MissingStagedFileIsFatal)
{
	test::TempDir dir;

	ReverseResult result = Pipeline::reverse(dir / "nope", dir / "out.txt",
		false, CompressionAlgorithm::GZIP, false, std::nullopt, dir.path());

	EXPECT_EQ(result.status, ReverseResult::Status::FATAL);
}

TEST(Pipeline, TempPathsAreUnique)
{
	test::TempDir dir;

	auto a = Pipeline::make_temp_path(dir.path(), ".x");
	auto b = Pipeline::make_temp_path(dir.path(), ".x");

	EXPECT_NE(a.string(), b.string());
	EXPECT_EQ(a.parent_path().string(), dir.path().string());
	EXPECT_EQ(a.extension().string(), ".x");
}
