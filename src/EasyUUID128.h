#pragma once

#include <string>
#include <cstring>

#include "UUID128.h"
#include "UUID128Rng.h"

/*
 * EasyUUID128 - High-Level Wrapper for UUID128
 *
 * FEATURES:
 * - std::string conversion.
 * - Internal buffer caching (toCharArray() returns stable pointer).
 * - Owns a seeded UUID128Rng, so repeated generate() calls skip reseeding.
 * - Auto-retry on a failed RNG health check.
 *
 * COST:
 * - 37 bytes of cache plus one ChaCha20 context per instance.
 * - std::string returns allocate.
 */
class EasyUUID128 final {
private:
    UUID128 _value;
    UUID128Rng _rng;
    char _cacheBuffer[UUID128_STR_LENGTH + 1]; // Internal cache for char* access

    void refreshCache() noexcept {
        _value.toString(_cacheBuffer, sizeof(_cacheBuffer));
    }

public:
    EasyUUID128() : _value(), _rng() {
        memset(_cacheBuffer, 0, sizeof(_cacheBuffer));
    }

    /**
     * @brief Generates a new v4 UUID.
     * Retries until the draw passes the RNG health check.
     * Automatically updates the internal string cache.
     * @return false only if the generator could not be seeded.
     */
    bool generate() {
        if (!_rng.isValid()) return false;
        while (!UUID128::newV4(_value, _rng)) {
            if (!_rng.isValid()) return false;
        }
        refreshCache();
        return true;
    }

    /**
     * @brief Parse any accepted UUID grammar and update cache.
     * @return false if str is not a UUID; the current value is kept.
     */
    bool parse(const std::string& str) {
        if (!UUID128::parse(str, _value)) return false;
        refreshCache();
        return true;
    }

    /**
     * @brief Import 16 raw bytes and update cache.
     * @param bytes Source 16-byte array.
     */
    void fromBytes(const uint8_t bytes[16]) noexcept {
        _value = UUID128::fromBytes(bytes);
        refreshCache();
    }

    const UUID128& value() const noexcept { return _value; }

    /**
     * @brief Returns pointer to internal char buffer.
     * Compatible with legacy C-style APIs.
     */
    const char* toCharArray() {
        // Lazy generation if buffer is empty
        if (_cacheBuffer[0] == 0) {
            generate();
        }
        return _cacheBuffer;
    }

    /**
     * @brief Returns std::string with optional formatting.
     * @param uppercase If true, uses UPPERCASE hex.
     * @param dashes If false, omits hyphens.
     */
    std::string toString(bool uppercase = false, bool dashes = true) const {
        char buf[UUID128_STR_LENGTH + 1];
        _value.toString(buf, sizeof(buf), uppercase, dashes);
        return std::string(buf);
    }

    /** @brief Returns the urn:uuid: form. */
    std::string toURN(bool uppercase = false) const {
        char buf[UUID128_URN_LENGTH];
        if (uppercase) {
            _value.toURNUpper(buf);
        } else {
            _value.toURN(buf);
        }
        return std::string(buf, sizeof(buf));
    }

    // --- CONVENIENCE OPERATORS ---

    // Allows: std::string s = uuid;
    operator std::string() const {
        return toString();
    }

    // Allows: const char* s = uuid;
    operator const char*() {
        return toCharArray();
    }
};
