#include "file_ops.hpp"

#include <algorithm>
#include <cstdio>
#include <memory>
#include <stdexcept>

#include "logger.hpp"

const char* algorithm_to_string(CompressionAlgorithm algorithm)
{
	switch (algorithm) {
		case CompressionAlgorithm::GZIP: return "gzip";
		case CompressionAlgorithm::BROTLI: return "brotli";
	}
	return "unknown";
}

CompressionAlgorithm algorithm_from_int(int32_t value)
{
	switch (value) {
		case 0: return CompressionAlgorithm::GZIP;
		case 1: return CompressionAlgorithm::BROTLI;
	}
	throw std::runtime_error("Unknown compression algorithm " + std::to_string(value));
}

std::string to_hex(const uint8_t* data, size_t len)
{
	static const char digits[] = "0123456789abcdef";

	std::string out;
	out.reserve(len * 2);
	for (size_t i = 0; i < len; ++i) {
		out.push_back(digits[data[i] >> 4]);
		out.push_back(digits[data[i] & 0x0F]);
	}
	return out;
}

std::string sha256_file(const std::filesystem::path& path)
{
	std::ifstream in(path, std::ios::binary);
	if (!in) {
		throw std::runtime_error("sha256_file: cannot open " + path.string());
	}

	std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
	if (!ctx) throw std::runtime_error("sha256_file: ctx new failed");

	if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
		throw std::runtime_error("sha256_file: init failed");
	}

	std::vector<char> buf(64 * 1024);
	while (in) {
		in.read(buf.data(), buf.size());
		std::streamsize got = in.gcount();
		if (got > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(got)) != 1) {
			throw std::runtime_error("sha256_file: update failed");
		}
	}
	if (in.bad()) {
		throw std::runtime_error("sha256_file: read error on " + path.string());
	}

	unsigned char digest[EVP_MAX_MD_SIZE];
	unsigned int digest_len = 0;
	if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
		throw std::runtime_error("sha256_file: final failed");
	}

	return to_hex(digest, digest_len);
}

std::string sha256_string(const std::string& data)
{
	unsigned char digest[EVP_MAX_MD_SIZE];
	unsigned int digest_len = 0;
	if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
		throw std::runtime_error("sha256_string: digest failed");
	}

	return to_hex(digest, digest_len);
}

bool hash_equals(const std::string& a, const std::string& b)
{
	if (a.size() != b.size()) return false;
	return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

FileDescriptor describe_file(const std::filesystem::path& path, const std::string& logical_name)
{
	if (!std::filesystem::is_regular_file(path)) {
		throw std::filesystem::filesystem_error(
			"File not found",
			path,
			std::make_error_code(std::errc::no_such_file_or_directory));
	}

	FileDescriptor descriptor;
	descriptor.absolute_path = std::filesystem::absolute(path).lexically_normal();
	descriptor.logical_name = logical_name;
	descriptor.original_size = static_cast<int64_t>(std::filesystem::file_size(path));
	descriptor.content_hash = sha256_file(path);
	return descriptor;
}

std::vector<std::filesystem::path> list_files_recursive(const std::filesystem::path& root)
{
	std::vector<std::filesystem::path> files;

	for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
		if (entry.is_regular_file()) {
			files.push_back(entry.path().lexically_relative(root));
		}
	}

	std::sort(files.begin(), files.end());
	return files;
}

void copy_file_contents(const std::filesystem::path& source, const std::filesystem::path& dest)
{
	std::ifstream in(source, std::ios::binary);
	if (!in) {
		throw std::runtime_error("Failed to open " + source.string());
	}

	std::ofstream out(dest, std::ios::binary | std::ios::trunc);
	if (!out) {
		throw std::runtime_error("Failed to open " + dest.string());
	}

	std::vector<char> buf(64 * 1024);
	while (in.read(buf.data(), buf.size()) || in.gcount() > 0) {
		out.write(buf.data(), in.gcount());
	}

	out.flush();
	if (!out) {
		throw std::runtime_error("Failed to write " + dest.string());
	}
}

void remove_temp_file(const std::filesystem::path& path)
{
	if (path.empty()) return;

	std::error_code ec;
	std::filesystem::remove(path, ec);
	if (ec) {
		Logger::get().log_event(Logger::LogEvent::TEMP_CLEANUP_FAILURE, {
			{"path", path.string()},
			{"error", ec.message()}
		});
	}
}

double compression_ratio(int64_t original_size, int64_t processed_size)
{
	if (original_size == 0) return 0.0;

	return 100.0 * (1.0 - static_cast<double>(processed_size) / static_cast<double>(original_size));
}

void print_progress(int64_t current, int64_t total, int64_t bytes_per_second)
{
	int64_t percentage = total > 0 ? current * 100 / total : 100;
	double mbps = bytes_per_second / 1024.0 / 1024.0;

	std::printf("\rProgress: %lld/%lld bytes (%lld%%) - %.2f MB/s",
		static_cast<long long>(current),
		static_cast<long long>(total),
		static_cast<long long>(percentage),
		mbps);
	std::fflush(stdout);
}

ProgressMeter::ProgressMeter(int64_t total, int64_t start)
	: total(total), last_bytes(start), last_update(std::chrono::steady_clock::now())
{
}

void ProgressMeter::update(int64_t current)
{
	using namespace std::chrono;

	auto now = steady_clock::now();
	auto elapsed = duration_cast<milliseconds>(now - last_update).count();
	if (elapsed < 100) return;

	int64_t bytes_per_second = (current - last_bytes) * 1000 / elapsed;
	print_progress(current, total, bytes_per_second);

	last_update = now;
	last_bytes = current;
	printed = true;
}

void ProgressMeter::finish()
{
	if (printed) {
		std::cout << std::endl;
		printed = false;
	}
}
