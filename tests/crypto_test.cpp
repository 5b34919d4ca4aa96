#include <gtest/gtest.h>

#include <sstream>

#include "crypto.hpp"
#include "test_util.hpp"

namespace
{
	std::string encrypt_string(const std::string& input, const std::string& password)
	{
		std::istringstream in(input);
		std::ostringstream out;
		CryptoAtRest::encrypt(in, out, password);
		return out.str();
	}

	bool decrypt_string(const std::string& input, const std::string& password, std::string& plaintext)
	{
		std::istringstream in(input);
		std::ostringstream out;
		bool ok = CryptoAtRest::decrypt(in, out, password);
		plaintext = out.str();
		return ok;
	}
}

TEST(CryptoAtRest, RoundTripAcrossChunks)
{
	std::string input = test::random_bytes(CryptoAtRest::CHUNK_SIZE * 3 + 123);

	std::string sealed = encrypt_string(input, "hunter2");
	EXPECT_GT(sealed.size(), input.size() + CryptoAtRest::HEADER_SIZE);

	std::string plaintext;
	ASSERT_TRUE(decrypt_string(sealed, "hunter2", plaintext));
	EXPECT_EQ(plaintext, input);
}

TEST(CryptoAtRest, EmptyInputRoundTrips)
{
	std::string sealed = encrypt_string("", "pw");

	std::string plaintext = "stale";
	ASSERT_TRUE(decrypt_string(sealed, "pw", plaintext));
	EXPECT_TRUE(plaintext.empty());
}

TEST(CryptoAtRest, FreshHeaderPerEncryption)
{
	std::string a = encrypt_string("same input", "pw");
	std::string b = encrypt_string("same input", "pw");

	EXPECT_NE(a.substr(0, CryptoAtRest::HEADER_SIZE), b.substr(0, CryptoAtRest::HEADER_SIZE));
	EXPECT_NE(a, b);
}

TEST(CryptoAtRest, WrongPasswordReturnsFalse)
{
	std::string sealed = encrypt_string("secret contents", "right");

	std::string plaintext;
	EXPECT_FALSE(decrypt_string(sealed, "wrong", plaintext));
	EXPECT_TRUE(plaintext.empty());
}

TEST(CryptoAtRest, TruncatedStreamReturnsFalse)
{
	std::string input = test::random_bytes(CryptoAtRest::CHUNK_SIZE * 2);
	std::string sealed = encrypt_string(input, "pw");

	// drop the final chunk entirely
	std::string cut = sealed.substr(0, CryptoAtRest::HEADER_SIZE + CryptoAtRest::CHUNK_SIZE + crypto_secretstream_xchacha20poly1305_ABYTES);

	std::string plaintext;
	EXPECT_FALSE(decrypt_string(cut, "pw", plaintext));
	EXPECT_EQ(plaintext, input.substr(0, CryptoAtRest::CHUNK_SIZE));

	std::string header_only = sealed.substr(0, 10);
	EXPECT_FALSE(decrypt_string(header_only, "pw", plaintext));
}

TEST(CryptoAtRest, TamperedCiphertextReturnsFalse)
{
	std::string sealed = encrypt_string("do not touch", "pw");
	sealed[CryptoAtRest::HEADER_SIZE + 2] ^= 0x01;

	std::string plaintext;
	EXPECT_FALSE(decrypt_string(sealed, "pw", plaintext));
}

TEST(CryptoAtRest, FileHelpers)
{
	test::TempDir dir;
	std::string content = test::random_bytes(50000, 7);
	test::write_file(dir / "in.bin", content);

	CryptoAtRest::encrypt_file(dir / "in.bin", dir / "in.bin.enc", "pw");
	EXPECT_NE(test::read_file(dir / "in.bin.enc"), content);

	ASSERT_TRUE(CryptoAtRest::decrypt_file(dir / "in.bin.enc", dir / "out.bin", "pw"));
	EXPECT_EQ(test::read_file(dir / "out.bin"), content);

	EXPECT_FALSE(CryptoAtRest::decrypt_file(dir / "missing.enc", dir / "out2.bin", "pw"));
}
