#pragma once

#define UUID128_LIB_VERSION "1.0.0"

#include <stdint.h>
#include <stddef.h>
#include <string.h>

#include <functional>
#include <ostream>
#include <string>

// Text lengths of the accepted grammars (no NUL terminator).
#define UUID128_STR_LENGTH    36
#define UUID128_URN_LENGTH    45
#define UUID128_BRACED_LENGTH 38
#define UUID128_SIMPLE_LENGTH 32
#define UUID128_URN_PREFIX    "urn:uuid:"
#define UUID128_URN_PREFIX_LENGTH 9

enum UUIDVariant {
    UUID_VARIANT_NCS,        // 0xx, NCS backward compatibility
    UUID_VARIANT_RFC4122,    // 10x
    UUID_VARIANT_MICROSOFT,  // 110, legacy Microsoft GUIDs
    UUID_VARIANT_RESERVED    // 111
};

enum UUIDVersion {
    UUID_VERSION_NIL = 0,
    UUID_VERSION_1 = 1,
    UUID_VERSION_2 = 2,
    UUID_VERSION_3 = 3,
    UUID_VERSION_4 = 4,
    UUID_VERSION_5 = 5,
    UUID_VERSION_6 = 6,
    UUID_VERSION_7 = 7,
    UUID_VERSION_8 = 8,
    UUID_VERSION_RESERVED = 9, // Bit patterns 9-15

    UUID_VERSION_TIME = UUID_VERSION_1,
    UUID_VERSION_DCE = UUID_VERSION_2,
    UUID_VERSION_MD5 = UUID_VERSION_3,
    UUID_VERSION_RANDOM = UUID_VERSION_4,
    UUID_VERSION_SHA1 = UUID_VERSION_5,
    UUID_VERSION_DATABASE = UUID_VERSION_6,
    UUID_VERSION_UNIX_TIME = UUID_VERSION_7,
    UUID_VERSION_VENDOR = UUID_VERSION_8
};

/** @brief Display name of a variant ("Ncs", "Rfc4122", "Microsoft", "Reserved"). */
const char* uuidVariantName(UUIDVariant v) noexcept;

/** @brief Display name of a version ("Nil", "Time", ... "Vendor", "Reserved"). */
const char* uuidVersionName(UUIDVersion v) noexcept;

class UUID128Rng;

/**
 * 128-bit UUID value (RFC 4122 and the v6/v7/v8 drafts).
 *
 * The 16 bytes are always held Most Significant Byte first. Mixed-endian
 * conversions are explicit (fromBytesME / toBytesME / swapEndian).
 * Any 16-byte pattern is a valid value; variant() and version() only read bits.
 */
class UUID128 {
public:
    typedef void (*fill_random_fn)(uint8_t* dest, size_t len, void* ctx);

    /** @brief Nil UUID. */
    constexpr UUID128() noexcept : _b{} {}

    /** @brief Construct from 16 big-endian bytes. Usable in constant expressions. */
    constexpr UUID128(uint8_t b0, uint8_t b1, uint8_t b2, uint8_t b3,
                      uint8_t b4, uint8_t b5, uint8_t b6, uint8_t b7,
                      uint8_t b8, uint8_t b9, uint8_t b10, uint8_t b11,
                      uint8_t b12, uint8_t b13, uint8_t b14, uint8_t b15) noexcept
        : _b{b0, b1, b2, b3, b4, b5, b6, b7, b8, b9, b10, b11, b12, b13, b14, b15} {}

    // --- Binary Model ---

    /** @brief The special Nil UUID, all bits zero. */
    static UUID128 nil() noexcept { return UUID128(); }

    /** @brief The special Max UUID, all bits one. */
    static UUID128 max() noexcept;

    /**
     * @brief Import 16 raw bytes.
     * @param bytes Source 16-byte array, big-endian.
     */
    static UUID128 fromBytes(const uint8_t bytes[16]) noexcept {
        UUID128 u;
        memcpy(u._b, bytes, 16);
        return u;
    }

    /**
     * @brief Import 16 mixed-endian bytes.
     *
     * time_low, time_mid and time_hi_and_version are read little-endian,
     * the clock sequence and node big-endian. Found in Microsoft GUIDs and
     * some partition tables.
     */
    static UUID128 fromBytesME(const uint8_t bytes[16]) noexcept {
        return fromBytes(bytes).swapEndian();
    }

    /** @brief Copy the 16 big-endian bytes out. */
    void toBytes(uint8_t out[16]) const noexcept { memcpy(out, _b, 16); }

    /** @brief Copy the value out as mixed-endian bytes. See fromBytesME(). */
    void toBytesME(uint8_t out[16]) const noexcept { swapEndian().toBytes(out); }

    /**
     * @brief Access raw 16 bytes.
     * @return Pointer to internal byte array.
     */
    const uint8_t* data() const noexcept { return _b; }

    /**
     * @brief Reverse the byte order of time_low, time_mid and
     * time_hi_and_version, leaving the clock sequence and node alone.
     */
    UUID128 swapEndian() const noexcept;

    /** @brief True if all 128 bits are zero. */
    bool isNil() const noexcept;

    /**
     * @brief The variant, from the top 3 bits of byte 8.
     *
     * Many UUIDs in the wild are generated incorrectly, so this can't be
     * relied upon.
     */
    UUIDVariant variant() const noexcept;

    /**
     * @brief The version, from the top 4 bits of byte 6.
     *
     * Only meaningful for UUID_VARIANT_RFC4122. Patterns 9-15 report
     * UUID_VERSION_RESERVED.
     */
    UUIDVersion version() const noexcept;

    /**
     * @brief The 60-bit Gregorian timestamp (100ns ticks since 1582-10-15).
     *
     * Meaningful only for v1 and v6. v6 values are read in their reordered
     * layout, every other version in the v1 layout.
     */
    uint64_t timestamp() const noexcept;

    /** @brief The 14-bit clock sequence, variant bits masked out. */
    uint16_t clockSequence() const noexcept;

    /**
     * @brief The 48-bit node identifier.
     * @param out Destination 6-byte array.
     */
    void node(uint8_t out[6]) const noexcept { memcpy(out, _b + 10, 6); }

    // --- Generators ---

    /**
     * @brief Version 4 UUID from the OS CSPRNG.
     *
     * If generating a lot of UUIDs, prefer the UUID128Rng overload.
     * @param out Receives the UUID. Untouched on failure.
     * @return false if the entropy source failed (error or all-zero draw).
     */
    static bool newV4(UUID128& out) noexcept;

    /**
     * @brief Version 4 UUID from a caller-owned seeded generator.
     * @return false if the generator is unusable or produced all zeros.
     */
    static bool newV4(UUID128& out, UUID128Rng& rng) noexcept;

    /**
     * @brief Version 4 UUID from an injected random source.
     * @param rng Fills dest with len random bytes (nullptr for default).
     * @param ctx User context for rng.
     * @return false if the draw was all zeros (RNG health check).
     */
    static bool newV4(UUID128& out, fill_random_fn rng, void* ctx) noexcept;

    /**
     * @brief Version 3 UUID, MD5 of namespace bytes followed by name.
     *
     * MD5 is obsolete, newV5 should be preferred.
     * @return false if the hash backend failed.
     */
    static bool newV3(UUID128& out, const UUID128& ns, const void* name, size_t len) noexcept;
    static bool newV3(UUID128& out, const UUID128& ns, const char* name) noexcept;

    /**
     * @brief Version 5 UUID, first 16 bytes of SHA-1 of namespace bytes
     * followed by name.
     * @return false if the hash backend failed.
     */
    static bool newV5(UUID128& out, const UUID128& ns, const void* name, size_t len) noexcept;
    static bool newV5(UUID128& out, const UUID128& ns, const char* name) noexcept;

    /**
     * @brief Version 1 UUID from a 60-bit timestamp, 14-bit counter and node.
     *
     * The 4 high bits of timestamp and 2 high bits of counter are ignored.
     * @param node MAC address or random substitute, 6 bytes.
     */
    static UUID128 newV1(uint64_t timestamp, uint16_t counter, const uint8_t node[6]) noexcept;

    /**
     * @brief Version 6 UUID, v1 with the timestamp reordered high bits first
     * for DB locality.
     */
    static UUID128 newV6(uint64_t timestamp, uint16_t counter, const uint8_t node[6]) noexcept;

    /**
     * @brief Version 7 UUID.
     * @param unixTsMs Milliseconds since the UNIX epoch, low 48 bits used.
     * @param randA 12 random bits (high 4 ignored).
     * @param randB 62 random bits (high 2 ignored).
     */
    static UUID128 newV7(uint64_t unixTsMs, uint16_t randA, uint64_t randB) noexcept;

    /** @brief Version 8 UUID. Only the version and variant bits are overwritten. */
    static UUID128 newV8(const uint8_t bytes[16]) noexcept;

    /** @brief Default entropy source, OpenSSL RAND_bytes. Zero-fills on failure. */
    static void default_fill_random(uint8_t* dest, size_t len, void* ctx) noexcept;

    // --- Text Codec ---

    /** @brief Lowercase hyphenated form, exactly 36 chars, no terminator. */
    void toStr(char (&buf)[UUID128_STR_LENGTH]) const noexcept;

    /** @brief Uppercase hyphenated form, exactly 36 chars, no terminator. */
    void toStrUpper(char (&buf)[UUID128_STR_LENGTH]) const noexcept;

    /** @brief "urn:uuid:" + lowercase form, exactly 45 chars, no terminator. */
    void toURN(char (&buf)[UUID128_URN_LENGTH]) const noexcept;

    /** @brief "urn:uuid:" + uppercase form, exactly 45 chars, no terminator. */
    void toURNUpper(char (&buf)[UUID128_URN_LENGTH]) const noexcept;

    /**
     * @brief Format UUID as a NUL-terminated string.
     * @param out Destination buffer (must be >= 37 bytes for dashed, >= 33 for simple).
     * @param buflen Length of destination buffer.
     * @param uppercase If true, uses UPPERCASE hex.
     * @param dashes If false, omits hyphens (32-char simple form).
     * @return true if successful, false if buffer is too small.
     */
    bool toString(char* out, size_t buflen, bool uppercase = false, bool dashes = true) const noexcept;

    /**
     * @brief Parse a UUID string.
     *
     * Case insensitive. Accepts:
     * - hyphenated  662aa7c7-7598-4d56-8bcc-a72c30f998a2
     * - simple      662aa7c775984d568bcca72c30f998a2
     * - braced      {662aa7c7-7598-4d56-8bcc-a72c30f998a2}
     * - URN         urn:uuid:662aa7c7-7598-4d56-8bcc-a72c30f998a2
     *
     * @param str Source characters (need not be NUL-terminated).
     * @param len Number of characters.
     * @param out Destination. Only written on success.
     * @return true if str is valid and parsed, false otherwise.
     */
    static bool parse(const char* str, size_t len, UUID128& out) noexcept;
    static bool parse(const char* str, UUID128& out) noexcept;
    static bool parse(const std::string& str, UUID128& out) noexcept {
        return parse(str.data(), str.size(), out);
    }

    /**
     * @brief Parse a UUID string that was displayed in mixed-endian.
     *
     * These UUIDs are being displayed wrong, but still need to be read
     * correctly. See fromBytesME().
     */
    static bool parseME(const char* str, size_t len, UUID128& out) noexcept;
    static bool parseME(const char* str, UUID128& out) noexcept;

    /**
     * @brief Debug rendering: UUID128(XXXXXXXX-...). With alternate, the
     * version and variant follow on their own lines.
     */
    void printDebug(std::ostream& os, bool alternate = false) const;

    // --- Comparison and Logic Operators ---

    /** @brief Check if two UUIDs are identical. */
    bool operator==(const UUID128& other) const { return memcmp(_b, other._b, 16) == 0; }

    /** @brief Check if two UUIDs are different. */
    bool operator!=(const UUID128& other) const { return !(*this == other); }

    /** @brief Lexicographical byte comparison for sorting. */
    bool operator< (const UUID128& other) const { return memcmp(_b, other._b, 16) < 0; }
    bool operator> (const UUID128& other) const { return other < *this; }
    bool operator<=(const UUID128& other) const { return !(other < *this); }
    bool operator>=(const UUID128& other) const { return !(*this < other); }

    /**
     * @brief Uppercase hyphenated form. With std::showbase set on the
     * stream, the urn:uuid: prefix is written first.
     */
    friend std::ostream& operator<<(std::ostream& os, const UUID128& uuid);

private:
    uint8_t _b[16];

    void setVersion(UUIDVersion v) noexcept;
    void setVariant(UUIDVariant v) noexcept;
    void encode(char* dst, const char* hex) const noexcept;

    static bool parseInto(const char* str, size_t len, uint8_t out[16]) noexcept;
    static bool hashName(UUID128& out, const UUID128& ns, const void* name, size_t len,
                         bool sha1) noexcept;
};

// Predefined namespaces, RFC 4122 Appendix C.
constexpr UUID128 UUID128_NAMESPACE_DNS(0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
                                        0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8);
constexpr UUID128 UUID128_NAMESPACE_URL(0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1,
                                        0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8);
constexpr UUID128 UUID128_NAMESPACE_OID(0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1,
                                        0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8);
constexpr UUID128 UUID128_NAMESPACE_X500(0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1,
                                         0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8);

namespace std {
template <>
struct hash<UUID128> {
    size_t operator()(const UUID128& u) const noexcept {
        // FNV-1a over the raw bytes
        uint64_t h = 14695981039346656037ULL;
        const uint8_t* p = u.data();
        for (int i = 0; i < 16; i++) {
            h ^= p[i];
            h *= 1099511628211ULL;
        }
        return (size_t)h;
    }
};
}
