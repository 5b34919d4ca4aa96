#include <gtest/gtest.h>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

#include <atomic>
#include <thread>

#include "file_ops.hpp"
#include "server.hpp"
#include "socket_stream_writer.hpp"
#include "test_util.hpp"
#include "wire.hpp"

namespace
{
	int connect_local(uint16_t port)
	{
		int sock = socket(AF_INET, SOCK_STREAM, 0);
		if (sock < 0) throw std::runtime_error("socket failed");

		sockaddr_in addr{};
		addr.sin_family = AF_INET;
		addr.sin_port = htons(port);
		inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

		if (connect(sock, (sockaddr*)&addr, sizeof(addr)) < 0) {
			close(sock);
			throw std::runtime_error("connect failed");
		}
		return sock;
	}

	// true when the peer closed the connection within the timeout
	bool wait_for_close(int sock, int timeout_ms)
	{
		timeval tv{};
		tv.tv_sec = timeout_ms / 1000;
		tv.tv_usec = (timeout_ms % 1000) * 1000;
		setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

		char c;
		ssize_t n = recv(sock, &c, 1, 0);
		return n == 0 || (n < 0 && errno == ECONNRESET);
	}

	class ServerTest : public ::testing::Test {
		protected:
			test::TempDir dir;
			ServerConfig config;

			void SetUp() override
			{
				config.downloads_dir = dir / "downloads";
				config.tmp_dir = dir / "tmp";
				config.port = 0;
			}
	};
}

TEST(SanitizeRelativePath, KeepsOrdinaryPaths)
{
	EXPECT_EQ(ServerStorageManager::sanitize_relative_path("report.pdf"), "report.pdf");
	EXPECT_EQ(ServerStorageManager::sanitize_relative_path("photos/2024/img.jpg"), "photos/2024/img.jpg");
}

TEST(SanitizeRelativePath, CannotEscapeTheDownloadsDirectory)
{
	EXPECT_EQ(ServerStorageManager::sanitize_relative_path("../../etc/passwd"), "etc/passwd");
	EXPECT_EQ(ServerStorageManager::sanitize_relative_path("/etc/passwd"), "etc/passwd");
	EXPECT_EQ(ServerStorageManager::sanitize_relative_path("a/./b/../c"), "a/b/c");
	EXPECT_EQ(ServerStorageManager::sanitize_relative_path("dir\\sub\\file.txt"), "dir/sub/file.txt");
}

TEST(SanitizeRelativePath, StripsReservedAndControlCharacters)
{
	EXPECT_EQ(ServerStorageManager::sanitize_relative_path("what?.txt"), "what_.txt");
	EXPECT_EQ(ServerStorageManager::sanitize_relative_path("bell\a.txt"), "bell.txt");
	EXPECT_THROW(ServerStorageManager::sanitize_relative_path("../.."), std::runtime_error);
	EXPECT_THROW(ServerStorageManager::sanitize_relative_path(""), std::runtime_error);
}

TEST_F(ServerTest, BindsEphemeralPort)
{
	Server server(config);
	server.start();

	EXPECT_TRUE(server.is_running());
	EXPECT_NE(server.port(), 0);

	server.stop();
	EXPECT_FALSE(server.is_running());
}

TEST_F(ServerTest, RunBlocksUntilStop)
{
	Server server(config);

	std::atomic<bool> returned{false};
	std::thread runner([&] {
		server.run();
		returned = true;
	});

	for (int i = 0; i < 100 && !server.is_running(); ++i) {
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}
	ASSERT_TRUE(server.is_running());
	EXPECT_FALSE(returned);

	server.stop();
	runner.join();
	EXPECT_TRUE(returned);
}

TEST_F(ServerTest, StopWaitsForTheFileInFlight)
{
	Server server(config);

	test::Collector<ReceivedFile> received;
	server.on_file_received([&](const ReceivedFile& file) { received.push(file); });
	server.start();

	std::string content(64 * 1024, 'z');
	const uint8_t* bytes = reinterpret_cast<const uint8_t*>(content.data());
	size_t half = content.size() / 2;

	int sock = connect_local(server.port());
	SocketStreamWriter socket_writer(sock);
	WireWriter writer(socket_writer);

	writer.write_string(wire::DIR_MARKER);
	writer.write_bool(false);
	writer.write_bool(false);
	writer.write_bool(false);
	writer.write_string("batch");
	writer.write_int32(2);

	writer.write_string("first.txt");
	writer.write_int64(static_cast<int64_t>(content.size()));
	writer.write_string(sha256_string(content));
	writer.write_int64(static_cast<int64_t>(content.size()));
	writer.write_bytes(bytes, half);

	std::this_thread::sleep_for(std::chrono::milliseconds(100));

	std::atomic<bool> stopped{false};
	std::thread stopper([&] {
		server.stop();
		stopped = true;
	});

	// the worker is mid-file, stop() has to wait for it
	std::this_thread::sleep_for(std::chrono::milliseconds(300));
	EXPECT_FALSE(stopped);

	writer.write_bytes(bytes + half, content.size() - half);

	// the second file is never sent, the worker ends after the first
	stopper.join();
	EXPECT_TRUE(stopped);
	EXPECT_FALSE(server.is_running());

	auto files = received.snapshot();
	ASSERT_EQ(files.size(), 1u);
	EXPECT_TRUE(files[0].verified);
	EXPECT_EQ(test::read_file(dir / "downloads" / "batch" / "first.txt"), content);

	close(sock);
}

TEST_F(ServerTest, ResumeWithoutSavedDataDropsOnlyThatFile)
{
	Server server(config);

	test::Collector<ReceivedFile> received;
	server.on_file_received([&](const ReceivedFile& file) { received.push(file); });
	server.start();

	std::string lost(100, 'l');
	std::string kept = "still framed correctly";

	int sock = connect_local(server.port());
	{
		SocketStreamWriter socket_writer(sock);
		WireWriter writer(socket_writer);

		writer.write_string(wire::MULTI_MARKER);
		writer.write_bool(false);
		writer.write_bool(false);
		writer.write_bool(true);
		writer.write_int32(2);

		// claims the server already holds the first half, it holds nothing
		writer.write_string("lost.bin");
		writer.write_int64(static_cast<int64_t>(lost.size()));
		writer.write_string(sha256_string(lost));
		writer.write_int64(50);
		writer.write_int64(static_cast<int64_t>(lost.size()));
		writer.write_int64(50);
		writer.write_bytes(reinterpret_cast<const uint8_t*>(lost.data()) + 50, lost.size() - 50);

		writer.write_string("kept.txt");
		writer.write_int64(static_cast<int64_t>(kept.size()));
		writer.write_string(sha256_string(kept));
		writer.write_int64(0);
		writer.write_int64(static_cast<int64_t>(kept.size()));
		writer.write_int64(0);
		writer.write_bytes(reinterpret_cast<const uint8_t*>(kept.data()), kept.size());
	}
	close(sock);

	ASSERT_TRUE(received.wait_for(1));
	EXPECT_FALSE(received.wait_for(2, std::chrono::milliseconds(200)));

	auto files = received.snapshot();
	EXPECT_TRUE(files[0].verified);
	EXPECT_EQ(files[0].path.string(), (dir / "downloads" / "kept.txt").string());

	EXPECT_FALSE(std::filesystem::exists(dir / "downloads" / "lost.bin"));
	EXPECT_FALSE(std::filesystem::exists(dir / "downloads" / ".courier" / "partial" / "lost.bin.part"));

	server.stop();
}

TEST_F(ServerTest, EncryptedJobWithoutPasswordIsDropped)
{
	Server server(config);

	test::Collector<ReceivedFile> received;
	server.on_file_received([&](const ReceivedFile& file) { received.push(file); });
	server.start();

	int sock = connect_local(server.port());
	SocketStreamWriter socket_writer(sock);
	WireWriter writer(socket_writer);

	writer.write_string("secret.txt");
	writer.write_bool(false);
	writer.write_bool(true);
	writer.write_bool(false);

	// the server hangs up right after the flags, without reading a size
	EXPECT_TRUE(wait_for_close(sock, 2000));
	close(sock);

	EXPECT_FALSE(received.wait_for(1, std::chrono::milliseconds(200)));
	EXPECT_FALSE(std::filesystem::exists(dir / "downloads" / "secret.txt"));

	server.stop();
}

TEST_F(ServerTest, ReceivesHandFramedFile)
{
	Server server(config);

	test::Collector<ReceivedFile> received;
	server.on_file_received([&](const ReceivedFile& file) { received.push(file); });
	server.start();

	std::string content = "framed by hand\n";
	test::write_file(dir / "src.txt", content);
	std::string hash = sha256_file(dir / "src.txt");

	int sock = connect_local(server.port());
	{
		SocketStreamWriter socket_writer(sock);
		WireWriter writer(socket_writer);

		writer.write_string("../outside.txt");
		writer.write_bool(false);
		writer.write_bool(false);
		writer.write_bool(false);
		writer.write_int64(static_cast<int64_t>(content.size()));
		writer.write_string(hash);
		writer.write_int64(static_cast<int64_t>(content.size()));
		writer.write_bytes(reinterpret_cast<const uint8_t*>(content.data()), content.size());
	}
	close(sock);

	ASSERT_TRUE(received.wait_for(1));
	auto files = received.snapshot();

	EXPECT_TRUE(files[0].verified);
	EXPECT_EQ(files[0].sender_ip, "127.0.0.1");
	EXPECT_EQ(files[0].original_size, static_cast<int64_t>(content.size()));
	EXPECT_EQ(files[0].path.string(), (dir / "downloads" / "outside.txt").string());
	EXPECT_EQ(test::read_file(dir / "downloads" / "outside.txt"), content);
	EXPECT_FALSE(std::filesystem::exists(dir / "outside.txt"));

	server.stop();
}

TEST_F(ServerTest, HashMismatchKeepsFile)
{
	Server server(config);

	test::Collector<ReceivedFile> received;
	server.on_file_received([&](const ReceivedFile& file) { received.push(file); });
	server.start();

	std::string content = "payload";

	int sock = connect_local(server.port());
	{
		SocketStreamWriter socket_writer(sock);
		WireWriter writer(socket_writer);

		writer.write_string("wrong.txt");
		writer.write_bool(false);
		writer.write_bool(false);
		writer.write_bool(false);
		writer.write_int64(static_cast<int64_t>(content.size()));
		writer.write_string(std::string(64, '0'));
		writer.write_int64(static_cast<int64_t>(content.size()));
		writer.write_bytes(reinterpret_cast<const uint8_t*>(content.data()), content.size());
	}
	close(sock);

	ASSERT_TRUE(received.wait_for(1));
	EXPECT_FALSE(received.snapshot()[0].verified);
	EXPECT_EQ(test::read_file(dir / "downloads" / "wrong.txt"), content);

	server.stop();
}
