#include "UUID128.h"
#include "UUID128Rng.h"

#include <limits.h>
#include <string.h>

#include <memory>

#include <openssl/evp.h>
#include <openssl/rand.h>

// --- INTERNAL HELPERS ---

static const char hexLower[] = "0123456789abcdef";
static const char hexUpper[] = "0123456789ABCDEF";

static inline int hexval(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + c - 'a';
    if (c >= 'A' && c <= 'F') return 10 + c - 'A';
    return -1;
}

// Top 3 bits of byte 8
static const UUIDVariant variantTable[8] = {
    UUID_VARIANT_NCS, UUID_VARIANT_NCS, UUID_VARIANT_NCS, UUID_VARIANT_NCS,
    UUID_VARIANT_RFC4122, UUID_VARIANT_RFC4122,
    UUID_VARIANT_MICROSOFT,
    UUID_VARIANT_RESERVED
};

// Top 4 bits of byte 6
static const UUIDVersion versionTable[16] = {
    UUID_VERSION_NIL, UUID_VERSION_1, UUID_VERSION_2, UUID_VERSION_3,
    UUID_VERSION_4, UUID_VERSION_5, UUID_VERSION_6, UUID_VERSION_7,
    UUID_VERSION_8, UUID_VERSION_RESERVED, UUID_VERSION_RESERVED, UUID_VERSION_RESERVED,
    UUID_VERSION_RESERVED, UUID_VERSION_RESERVED, UUID_VERSION_RESERVED, UUID_VERSION_RESERVED
};

static bool isAllZero(const uint8_t* b, size_t len) {
    uint8_t sum = 0;
    for (size_t i = 0; i < len; i++) sum |= b[i];
    return sum == 0;
}

const char* uuidVariantName(UUIDVariant v) noexcept {
    switch (v) {
        case UUID_VARIANT_NCS: return "Ncs";
        case UUID_VARIANT_RFC4122: return "Rfc4122";
        case UUID_VARIANT_MICROSOFT: return "Microsoft";
        default: return "Reserved";
    }
}

const char* uuidVersionName(UUIDVersion v) noexcept {
    switch (v) {
        case UUID_VERSION_NIL: return "Nil";
        case UUID_VERSION_1: return "Time";
        case UUID_VERSION_2: return "Dce";
        case UUID_VERSION_3: return "Md5";
        case UUID_VERSION_4: return "Random";
        case UUID_VERSION_5: return "Sha1";
        case UUID_VERSION_6: return "Database";
        case UUID_VERSION_7: return "UnixTime";
        case UUID_VERSION_8: return "Vendor";
        default: return "Reserved";
    }
}

// --- BINARY MODEL ---

UUID128 UUID128::max() noexcept {
    UUID128 u;
    memset(u._b, 0xFF, sizeof(u._b));
    return u;
}

UUID128 UUID128::swapEndian() const noexcept {
    UUID128 u = *this;
    // time_low
    u._b[0] = _b[3];
    u._b[1] = _b[2];
    u._b[2] = _b[1];
    u._b[3] = _b[0];
    // time_mid
    u._b[4] = _b[5];
    u._b[5] = _b[4];
    // time_hi_and_version
    u._b[6] = _b[7];
    u._b[7] = _b[6];
    return u;
}

bool UUID128::isNil() const noexcept {
    // Nil is nil regardless of byte order, so compare native words.
    uint64_t hi, lo;
    memcpy(&hi, _b, 8);
    memcpy(&lo, _b + 8, 8);
    return (hi | lo) == 0;
}

UUIDVariant UUID128::variant() const noexcept {
    return variantTable[_b[8] >> 5];
}

UUIDVersion UUID128::version() const noexcept {
    return versionTable[_b[6] >> 4];
}

uint64_t UUID128::timestamp() const noexcept {
    if (version() == UUID_VERSION_6) {
        // time_high | time_mid | time_low (version bits cleared)
        return ((uint64_t)_b[0] << 52) | ((uint64_t)_b[1] << 44) |
               ((uint64_t)_b[2] << 36) | ((uint64_t)_b[3] << 28) |
               ((uint64_t)_b[4] << 20) | ((uint64_t)_b[5] << 12) |
               ((uint64_t)(_b[6] & 0x0F) << 8) | (uint64_t)_b[7];
    }
    // time_hi (version bits cleared) | time_mid | time_low
    return ((uint64_t)(_b[6] & 0x0F) << 56) | ((uint64_t)_b[7] << 48) |
           ((uint64_t)_b[4] << 40) | ((uint64_t)_b[5] << 32) |
           ((uint64_t)_b[0] << 24) | ((uint64_t)_b[1] << 16) |
           ((uint64_t)_b[2] << 8) | (uint64_t)_b[3];
}

uint16_t UUID128::clockSequence() const noexcept {
    // Only the two RFC variant bits are cleared.
    return (uint16_t)(((_b[8] & 0x3F) << 8) | _b[9]);
}

void UUID128::setVersion(UUIDVersion v) noexcept {
    _b[6] = (_b[6] & 0x0F) | (uint8_t)((uint8_t)v << 4);
}

void UUID128::setVariant(UUIDVariant v) noexcept {
    // Only the bits owned by the variant are touched, so legacy values
    // can be re-tagged losslessly.
    uint8_t byte = _b[8];
    switch (v) {
        case UUID_VARIANT_NCS:       _b[8] = byte & 0x7F; break;          // 0xx
        case UUID_VARIANT_RFC4122:   _b[8] = (byte & 0x3F) | 0x80; break; // 10x
        case UUID_VARIANT_MICROSOFT: _b[8] = (byte & 0x1F) | 0xC0; break; // 110
        case UUID_VARIANT_RESERVED:  _b[8] = byte | 0xE0; break;          // 111
    }
}

// --- GENERATORS ---

void UUID128::default_fill_random(uint8_t* dest, size_t len, void* ctx) noexcept {
    (void)ctx;
    size_t done = 0;
    while (done < len) {
        size_t chunk = len - done;
        if (chunk > (size_t)INT_MAX) chunk = (size_t)INT_MAX;
        if (RAND_bytes(dest + done, (int)chunk) != 1) {
            // Zero output fails the caller's health check.
            memset(dest, 0, len);
            return;
        }
        done += chunk;
    }
}

bool UUID128::newV4(UUID128& out) noexcept {
    return newV4(out, &UUID128::default_fill_random, nullptr);
}

bool UUID128::newV4(UUID128& out, fill_random_fn rng, void* ctx) noexcept {
    if (!rng) rng = &UUID128::default_fill_random;

    UUID128 u;
    rng(u._b, sizeof(u._b), ctx);
    if (isAllZero(u._b, sizeof(u._b))) return false;

    u.setVariant(UUID_VARIANT_RFC4122);
    u.setVersion(UUID_VERSION_RANDOM);
    out = u;
    return true;
}

bool UUID128::newV4(UUID128& out, UUID128Rng& rng) noexcept {
    UUID128 u;
    if (!rng.fillBytes(u._b, sizeof(u._b))) return false;
    if (isAllZero(u._b, sizeof(u._b))) return false;

    u.setVariant(UUID_VARIANT_RFC4122);
    u.setVersion(UUID_VERSION_RANDOM);
    out = u;
    return true;
}

bool UUID128::hashName(UUID128& out, const UUID128& ns, const void* name, size_t len,
                       bool sha1) noexcept {
    if (!name && len > 0) return false;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) return false;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_DigestInit_ex(ctx.get(), sha1 ? EVP_sha1() : EVP_md5(), nullptr) != 1) return false;
    if (EVP_DigestUpdate(ctx.get(), ns._b, sizeof(ns._b)) != 1) return false;
    if (len > 0 && EVP_DigestUpdate(ctx.get(), name, len) != 1) return false;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) return false;
    if (digestLen < 16) return false;

    // SHA-1 is truncated to its first 16 bytes
    UUID128 u = fromBytes(digest);
    u.setVersion(sha1 ? UUID_VERSION_SHA1 : UUID_VERSION_MD5);
    u.setVariant(UUID_VARIANT_RFC4122);
    out = u;
    return true;
}

bool UUID128::newV3(UUID128& out, const UUID128& ns, const void* name, size_t len) noexcept {
    return hashName(out, ns, name, len, false);
}

bool UUID128::newV3(UUID128& out, const UUID128& ns, const char* name) noexcept {
    if (!name) return false;
    return hashName(out, ns, name, strlen(name), false);
}

bool UUID128::newV5(UUID128& out, const UUID128& ns, const void* name, size_t len) noexcept {
    return hashName(out, ns, name, len, true);
}

bool UUID128::newV5(UUID128& out, const UUID128& ns, const char* name) noexcept {
    if (!name) return false;
    return hashName(out, ns, name, strlen(name), true);
}

UUID128 UUID128::newV1(uint64_t timestamp, uint16_t counter, const uint8_t node[6]) noexcept {
    UUID128 u;
    // time_low
    u._b[0] = (uint8_t)(timestamp >> 24);
    u._b[1] = (uint8_t)(timestamp >> 16);
    u._b[2] = (uint8_t)(timestamp >> 8);
    u._b[3] = (uint8_t)timestamp;
    // time_mid
    u._b[4] = (uint8_t)(timestamp >> 40);
    u._b[5] = (uint8_t)(timestamp >> 32);
    // time_hi_and_version, highest 4 bits of the timestamp dropped
    u._b[6] = (uint8_t)((timestamp >> 56) & 0x0F) | 0x10;
    u._b[7] = (uint8_t)(timestamp >> 48);
    // clock_seq_hi_and_reserved, highest 2 bits of the counter dropped
    u._b[8] = (uint8_t)((counter >> 8) & 0x3F) | 0x80;
    u._b[9] = (uint8_t)counter;
    memcpy(u._b + 10, node, 6);
    return u;
}

UUID128 UUID128::newV6(uint64_t timestamp, uint16_t counter, const uint8_t node[6]) noexcept {
    UUID128 u;
    uint64_t ts = timestamp & 0x0FFFFFFFFFFFFFFFULL;
    uint64_t high = ts >> 12;
    // time_high, time_mid
    for (int i = 5; i >= 0; i--) {
        u._b[i] = (uint8_t)(high & 0xFF);
        high >>= 8;
    }
    // time_low_and_version
    u._b[6] = (uint8_t)((ts >> 8) & 0x0F) | 0x60;
    u._b[7] = (uint8_t)ts;
    u._b[8] = (uint8_t)((counter >> 8) & 0x3F) | 0x80;
    u._b[9] = (uint8_t)counter;
    memcpy(u._b + 10, node, 6);
    return u;
}

UUID128 UUID128::newV7(uint64_t unixTsMs, uint16_t randA, uint64_t randB) noexcept {
    UUID128 u;
    uint64_t ts = unixTsMs & 0x0000FFFFFFFFFFFFULL;
    for (int i = 5; i >= 0; i--) {
        u._b[i] = (uint8_t)(ts & 0xFF);
        ts >>= 8;
    }
    u._b[6] = (uint8_t)((randA >> 8) & 0x0F) | 0x70;
    u._b[7] = (uint8_t)randA;
    u._b[8] = (uint8_t)((randB >> 56) & 0x3F) | 0x80;
    for (int i = 15; i >= 9; i--) {
        u._b[i] = (uint8_t)(randB & 0xFF);
        randB >>= 8;
    }
    return u;
}

UUID128 UUID128::newV8(const uint8_t bytes[16]) noexcept {
    UUID128 u = fromBytes(bytes);
    u.setVariant(UUID_VARIANT_RFC4122);
    u.setVersion(UUID_VERSION_VENDOR);
    return u;
}

// --- TEXT CODEC ---

void UUID128::encode(char* dst, const char* hex) const noexcept {
    const uint8_t* p = _b;
    for (int i = 0; i < 16; i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            *dst++ = '-';
        }
        *dst++ = hex[(*p >> 4) & 0x0F];
        *dst++ = hex[*p++ & 0x0F];
    }
}

void UUID128::toStr(char (&buf)[UUID128_STR_LENGTH]) const noexcept {
    encode(buf, hexLower);
}

void UUID128::toStrUpper(char (&buf)[UUID128_STR_LENGTH]) const noexcept {
    encode(buf, hexUpper);
}

void UUID128::toURN(char (&buf)[UUID128_URN_LENGTH]) const noexcept {
    memcpy(buf, UUID128_URN_PREFIX, UUID128_URN_PREFIX_LENGTH);
    encode(buf + UUID128_URN_PREFIX_LENGTH, hexLower);
}

void UUID128::toURNUpper(char (&buf)[UUID128_URN_LENGTH]) const noexcept {
    memcpy(buf, UUID128_URN_PREFIX, UUID128_URN_PREFIX_LENGTH);
    encode(buf + UUID128_URN_PREFIX_LENGTH, hexUpper);
}

bool UUID128::toString(char* out, size_t buflen, bool uppercase, bool dashes) const noexcept {
    size_t required = dashes ? UUID128_STR_LENGTH + 1 : UUID128_SIMPLE_LENGTH + 1;
    if (!out || buflen < required) return false;

    const char* hex = uppercase ? hexUpper : hexLower;
    if (dashes) {
        encode(out, hex);
        out[UUID128_STR_LENGTH] = '\0';
        return true;
    }

    char* s = out;
    for (int i = 0; i < 16; i++) {
        *s++ = hex[(_b[i] >> 4) & 0x0F];
        *s++ = hex[_b[i] & 0x0F];
    }
    *s = '\0';
    return true;
}

bool UUID128::parseInto(const char* str, size_t len, uint8_t out[16]) noexcept {
    if (!str) return false;

    for (size_t i = 0; i < len; i++) {
        if ((unsigned char)str[i] > 0x7F) return false; // ASCII only
    }

    const char* p = str;
    switch (len) {
        case UUID128_URN_LENGTH:
            if (memcmp(str, UUID128_URN_PREFIX, UUID128_URN_PREFIX_LENGTH) != 0) return false;
            p = str + UUID128_URN_PREFIX_LENGTH;
            break;
        case UUID128_BRACED_LENGTH:
            if (str[0] != '{' || str[UUID128_BRACED_LENGTH - 1] != '}') return false;
            p = str + 1;
            break;
        case UUID128_STR_LENGTH:
            break;
        case UUID128_SIMPLE_LENGTH:
            for (int i = 0; i < 16; i++) {
                int hi = hexval(*p++);
                int lo = hexval(*p++);
                if (hi < 0 || lo < 0) return false;
                out[i] = (uint8_t)((hi << 4) | lo);
            }
            return true;
        default:
            return false; // Invalid length
    }

    // UUID structure: 4-2-2-2-6 bytes, hyphens before bytes 4, 6, 8 and 10
    for (int i = 0; i < 16; i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            if (*p != '-') return false;
            p++;
        }

        int hi = hexval(*p++);
        int lo = hexval(*p++);
        if (hi < 0 || lo < 0) return false; // Invalid char or misplaced hyphen

        out[i] = (uint8_t)((hi << 4) | lo);
    }
    return true;
}

bool UUID128::parse(const char* str, size_t len, UUID128& out) noexcept {
    uint8_t tmp[16];
    if (!parseInto(str, len, tmp)) return false;
    out = fromBytes(tmp);
    return true;
}

bool UUID128::parse(const char* str, UUID128& out) noexcept {
    if (!str) return false;
    return parse(str, strlen(str), out);
}

bool UUID128::parseME(const char* str, size_t len, UUID128& out) noexcept {
    uint8_t tmp[16];
    if (!parseInto(str, len, tmp)) return false;
    out = fromBytesME(tmp);
    return true;
}

bool UUID128::parseME(const char* str, UUID128& out) noexcept {
    if (!str) return false;
    return parseME(str, strlen(str), out);
}

void UUID128::printDebug(std::ostream& os, bool alternate) const {
    char buf[UUID128_STR_LENGTH];
    toStrUpper(buf);
    os << "UUID128(";
    os.write(buf, sizeof(buf));
    os << ")";
    if (alternate) {
        UUIDVersion ver = version();
        UUIDVariant var = variant();
        os << " {\n"
           << "    Version: " << uuidVersionName(ver) << "(" << (int)ver << "),\n"
           << "    Variant: " << uuidVariantName(var) << "(" << (int)var << "),\n"
           << "}";
    }
}

std::ostream& operator<<(std::ostream& os, const UUID128& uuid) {
    if (os.flags() & std::ios_base::showbase) {
        os << UUID128_URN_PREFIX;
    }
    char buf[UUID128_STR_LENGTH];
    uuid.toStrUpper(buf);
    os.write(buf, sizeof(buf));
    return os;
}
