#pragma once

#include <stdint.h>
#include <stddef.h>

#include <memory>

#include <openssl/evp.h>

// Keystream bytes produced per cipher call. One ChaCha20 block by default.
#ifndef UUID128_RNG_BUFFER_SIZE
    #define UUID128_RNG_BUFFER_SIZE 64
#endif

/**
 * Reusable CSPRNG for generating many UUIDs quickly.
 *
 * ChaCha20 keystream (OpenSSL EVP_chacha20, zero IV) keyed by a 32-byte seed.
 * Seeding happens once, at construction, so the per-UUID cost is a buffer copy.
 *
 * Not thread safe: one owner advances it at a time.
 */
class UUID128Rng {
public:
    /**
     * @brief Seed a fresh generator from the OS CSPRNG (RAND_bytes).
     * Check isValid() if the entropy source may be unavailable.
     */
    UUID128Rng() noexcept;

    /**
     * @brief Seed deterministically, for reproducible test vectors.
     *
     * Providing a good seed is left to the caller. A bad seed gives UUIDs
     * that are not sufficiently random or unique.
     * @param seed 32-byte ChaCha20 key.
     */
    explicit UUID128Rng(const uint8_t seed[32]) noexcept;

    UUID128Rng(UUID128Rng&& other) noexcept = default;
    UUID128Rng& operator=(UUID128Rng&& other) noexcept = default;

    // Disable copying
    UUID128Rng(const UUID128Rng&) = delete;
    UUID128Rng& operator=(const UUID128Rng&) = delete;

    /** @brief True if seeding and cipher setup succeeded. */
    bool isValid() const noexcept { return _ctx != nullptr; }

    /**
     * @brief Fill dest with the next len keystream bytes.
     * @return false if the generator is not usable.
     */
    bool fillBytes(uint8_t* dest, size_t len) noexcept;

    /**
     * @brief UUID128::fill_random_fn adapter; ctx must be a UUID128Rng*.
     * Zero-fills dest on failure.
     */
    static void fillCallback(uint8_t* dest, size_t len, void* ctx) noexcept;

private:
    std::unique_ptr<EVP_CIPHER_CTX, void (*)(EVP_CIPHER_CTX*)> _ctx;
    uint8_t _buf[UUID128_RNG_BUFFER_SIZE];
    size_t _pos;

    void init(const uint8_t seed[32]) noexcept;
    bool refill() noexcept;
};
