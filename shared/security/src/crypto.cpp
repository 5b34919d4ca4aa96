#include "crypto.hpp"

#include <cstring>
#include <mutex>
#include <stdexcept>

void CryptoAtRest::init()
{
    static std::once_flag once;
    std::call_once(once, [] {
        if (sodium_init() < 0) {
            throw std::runtime_error("sodium_init failed");
        }
    });
}

void CryptoAtRest::derive_key(const std::string& password, SecureKey& key)
{
    init();

    static_assert(SecureKey::size() == crypto_secretstream_xchacha20poly1305_KEYBYTES);

    uint8_t salt[crypto_pwhash_SALTBYTES];
    std::memcpy(salt, KDF_SALT, sizeof(salt));

    if (crypto_pwhash(key.data(), SecureKey::size(),
                        password.c_str(), password.size(),
                        salt,
                        KDF_OPSLIMIT,
                        KDF_MEMLIMIT,
                        crypto_pwhash_ALG_ARGON2ID13) != 0) {
        throw std::runtime_error("KDF derivation failed");
    }
}

void CryptoAtRest::encrypt(std::istream& in, std::ostream& out, const std::string& password)
{
    SecureKey key;
    derive_key(password, key);

    SecureSecretstreamState state;
    uint8_t header[HEADER_SIZE];

    // fresh random header per file
    crypto_secretstream_xchacha20poly1305_init_push(state.state(), header, key.data());

    out.write(reinterpret_cast<const char*>(header), sizeof(header));

    std::vector<uint8_t> plaintext(CHUNK_SIZE);
    std::vector<uint8_t> ciphertext(CHUNK_SIZE + crypto_secretstream_xchacha20poly1305_ABYTES);

    bool final_chunk = false;
    do {
        in.read(reinterpret_cast<char*>(plaintext.data()), plaintext.size());
        if (in.bad()) {
            throw std::runtime_error("Read error while encrypting");
        }

        size_t plaintext_len = static_cast<size_t>(in.gcount());
        final_chunk = in.eof();

        const uint8_t tag = final_chunk
            ? crypto_secretstream_xchacha20poly1305_TAG_FINAL
            : 0;

        unsigned long long ciphertext_len = 0;
        if (crypto_secretstream_xchacha20poly1305_push(
                state.state(),
                ciphertext.data(),
                &ciphertext_len,
                plaintext.data(),
                plaintext_len,
                nullptr,
                0,
                tag
            ) != 0) {
            sodium_memzero(plaintext.data(), plaintext.size());
            throw std::runtime_error("Sodium encrypt error");
        }

        out.write(reinterpret_cast<const char*>(ciphertext.data()), static_cast<std::streamsize>(ciphertext_len));
        if (!out) {
            sodium_memzero(plaintext.data(), plaintext.size());
            throw std::runtime_error("Write error while encrypting");
        }
    } while (!final_chunk);

    sodium_memzero(plaintext.data(), plaintext.size());
}

bool CryptoAtRest::decrypt(std::istream& in, std::ostream& out, const std::string& password)
{
    uint8_t header[HEADER_SIZE];
    in.read(reinterpret_cast<char*>(header), sizeof(header));
    if (static_cast<size_t>(in.gcount()) < sizeof(header)) {
        std::cerr << "Encrypted data is too short or corrupted" << std::endl;
        return false;
    }

    SecureKey key;
    derive_key(password, key);

    SecureSecretstreamState state;
    if (crypto_secretstream_xchacha20poly1305_init_pull(state.state(), header, key.data()) != 0) {
        std::cerr << "Failed to initialize secretstream pull" << std::endl;
        return false;
    }

    constexpr size_t CIPHERTEXT_LEN = CHUNK_SIZE + crypto_secretstream_xchacha20poly1305_ABYTES;
    std::vector<uint8_t> ciphertext(CIPHERTEXT_LEN);
    std::vector<uint8_t> plaintext(CHUNK_SIZE);

    while (true) {
        in.read(reinterpret_cast<char*>(ciphertext.data()), ciphertext.size());
        size_t n = static_cast<size_t>(in.gcount());
        if (n == 0) {
            // stream ended without a final chunk
            std::cerr << "Encrypted data is truncated" << std::endl;
            return false;
        }

        unsigned long long plaintext_len = 0;
        uint8_t tag = 0;
        if (crypto_secretstream_xchacha20poly1305_pull(
                    state.state(),
                    plaintext.data(),
                    &plaintext_len,
                    &tag,
                    ciphertext.data(),
                    n,
                    nullptr,
                    0
                ) != 0) {
            std::cerr << "Decryption failed. The password may be incorrect." << std::endl;
            return false;
        }

        out.write(reinterpret_cast<const char*>(plaintext.data()), static_cast<std::streamsize>(plaintext_len));
        sodium_memzero(plaintext.data(), plaintext.size());
        if (!out) {
            std::cerr << "Write error while decrypting" << std::endl;
            return false;
        }

        if (tag == crypto_secretstream_xchacha20poly1305_TAG_FINAL) {
            break;
        }
    }

    // trailing bytes after the final chunk mean the stream was tampered with
    if (in.peek() != std::char_traits<char>::eof()) {
        std::cerr << "Unexpected data after final encrypted chunk" << std::endl;
        return false;
    }

    return true;
}

void CryptoAtRest::encrypt_file(const std::filesystem::path& source, const std::filesystem::path& dest, const std::string& password)
{
    std::ifstream in(source, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open " + source.string());

    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open " + dest.string());

    encrypt(in, out, password);
    out.flush();
}

bool CryptoAtRest::decrypt_file(const std::filesystem::path& source, const std::filesystem::path& dest, const std::string& password)
{
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        std::cerr << "Failed to open " << source << std::endl;
        return false;
    }

    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cerr << "Failed to open " << dest << std::endl;
        return false;
    }

    bool ok = decrypt(in, out, password);
    out.flush();
    return ok;
}
