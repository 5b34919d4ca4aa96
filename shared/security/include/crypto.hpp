#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <sodium.h>

#include "secure_mem.hpp"

#pragma once

/*
 *	ENCRYPTED FILE LAYOUT:
 *	[secretstream header (24 bytes, random per file)]
 *	[chunk: ciphertext of up to CHUNK_SIZE plaintext bytes + 17 byte auth tag] ...
 *	last chunk carries TAG_FINAL
 */

class CryptoAtRest
{
    public:
        constexpr static size_t CHUNK_SIZE = 16 * 1024;
        constexpr static size_t HEADER_SIZE = crypto_secretstream_xchacha20poly1305_HEADERBYTES;

        // key derivation is fixed so both peers derive the same key from the same password
        constexpr static const char* KDF_SALT = "courier-salt-v1!";
        constexpr static unsigned long long KDF_OPSLIMIT = crypto_pwhash_OPSLIMIT_INTERACTIVE;
        constexpr static size_t KDF_MEMLIMIT = crypto_pwhash_MEMLIMIT_INTERACTIVE;

        // must be called before any other sodium use, safe to call repeatedly
        static void init();

        static void derive_key(const std::string& password, SecureKey& key);

        static void encrypt(std::istream& in, std::ostream& out, const std::string& password);

        // false on wrong password, tampering or truncation; out keeps whatever was decrypted
        static bool decrypt(std::istream& in, std::ostream& out, const std::string& password);

        static void encrypt_file(const std::filesystem::path& source, const std::filesystem::path& dest, const std::string& password);
        static bool decrypt_file(const std::filesystem::path& source, const std::filesystem::path& dest, const std::string& password);
};
