#include <sodium.h>
#include <stdexcept>

#pragma once

// locked in RAM while alive and wiped on destruction
template <class T>
class LockedSecret
{
    public:
        LockedSecret() {
            if (sodium_mlock(&secret, sizeof(secret)) != 0) {
                throw std::runtime_error("sodium_mlock failed");
            }
        }

        ~LockedSecret() {
            sodium_memzero(&secret, sizeof(secret));
            sodium_munlock(&secret, sizeof(secret));
        }

        LockedSecret(const LockedSecret&) = delete;
        LockedSecret& operator=(const LockedSecret&) = delete;
        LockedSecret(LockedSecret&&) = delete;
        LockedSecret& operator=(LockedSecret&&) = delete;

        T* get() { return &secret; }
        static constexpr size_t size() { return sizeof(T); }

    private:
        T secret;
};

struct StreamKeyBytes {
    unsigned char bytes[crypto_secretstream_xchacha20poly1305_KEYBYTES];
};

// password derived key for the content stream
class SecureKey : public LockedSecret<StreamKeyBytes>
{
    public:
        unsigned char* data() { return get()->bytes; }
};

class SecureSecretstreamState : public LockedSecret<crypto_secretstream_xchacha20poly1305_state>
{
    public:
        crypto_secretstream_xchacha20poly1305_state* state() { return get(); }
};
