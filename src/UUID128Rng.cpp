#include "UUID128Rng.h"

#include <string.h>

#include <openssl/crypto.h>
#include <openssl/rand.h>

static void free_cipher_ctx(EVP_CIPHER_CTX* ctx) {
    EVP_CIPHER_CTX_free(ctx);
}

UUID128Rng::UUID128Rng() noexcept
    : _ctx(nullptr, &free_cipher_ctx), _pos(UUID128_RNG_BUFFER_SIZE)
{
    memset(_buf, 0, sizeof(_buf));
    uint8_t seed[32];
    if (RAND_bytes(seed, sizeof(seed)) == 1) {
        init(seed);
    }
    OPENSSL_cleanse(seed, sizeof(seed));
}

UUID128Rng::UUID128Rng(const uint8_t seed[32]) noexcept
    : _ctx(nullptr, &free_cipher_ctx), _pos(UUID128_RNG_BUFFER_SIZE)
{
    memset(_buf, 0, sizeof(_buf));
    if (seed) {
        init(seed);
    }
}

void UUID128Rng::init(const uint8_t seed[32]) noexcept {
    // 16-byte IV: 32-bit block counter followed by the 96-bit nonce, all zero.
    static const uint8_t iv[16] = {0};

    _ctx.reset(EVP_CIPHER_CTX_new());
    if (!_ctx) return;
    if (EVP_EncryptInit_ex(_ctx.get(), EVP_chacha20(), nullptr, seed, iv) != 1) {
        _ctx.reset();
    }
}

bool UUID128Rng::refill() noexcept {
    // Keystream = ChaCha20(zeros), encrypted in place.
    memset(_buf, 0, sizeof(_buf));
    int outl = 0;
    if (EVP_EncryptUpdate(_ctx.get(), _buf, &outl, _buf, (int)sizeof(_buf)) != 1 ||
        outl != (int)sizeof(_buf)) {
        _ctx.reset();
        return false;
    }
    _pos = 0;
    return true;
}

bool UUID128Rng::fillBytes(uint8_t* dest, size_t len) noexcept {
    if (!_ctx) return false;
    if (!dest && len > 0) return false;

    while (len > 0) {
        if (_pos == sizeof(_buf) && !refill()) return false;

        size_t n = sizeof(_buf) - _pos;
        if (n > len) n = len;
        memcpy(dest, _buf + _pos, n);
        _pos += n;
        dest += n;
        len -= n;
    }
    return true;
}

void UUID128Rng::fillCallback(uint8_t* dest, size_t len, void* ctx) noexcept {
    UUID128Rng* rng = static_cast<UUID128Rng*>(ctx);
    if ((!rng || !rng->fillBytes(dest, len)) && dest) {
        memset(dest, 0, len);
    }
}
