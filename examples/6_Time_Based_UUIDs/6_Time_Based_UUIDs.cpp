/*
 * EXAMPLE 6: Time-Based UUIDs (v1 / v6 / v7)
 *
 * The library only packs the fields; the caller supplies the clock,
 * counter and node. This example wires them to the system clock and
 * the default entropy source.
 *
 * - v1: 60-bit count of 100ns ticks since 1582-10-15, low bits first.
 * - v6: Same timestamp, reordered so byte order sorts by time.
 * - v7: 48-bit Unix milliseconds plus random bits. Preferred for new keys.
 */

#include <stdio.h>

#include <chrono>

#include "UUID128.h"

// 100ns intervals between 1582-10-15 and 1970-01-01
static const uint64_t GREGORIAN_OFFSET = 0x01B21DD213814000ULL;

static void print_uuid(const char* label, const UUID128& u) {
    char buf[37];
    u.toString(buf, sizeof(buf));
    printf("%-4s %s  (%s)\n", label, buf, uuidVersionName(u.version()));
}

int main() {
    printf("\n--- Time-Based UUIDs ---\n");

    using namespace std::chrono;
    uint64_t nowNs = (uint64_t)duration_cast<nanoseconds>(
        system_clock::now().time_since_epoch()).count();
    uint64_t ticks = nowNs / 100 + GREGORIAN_OFFSET;
    uint64_t unixMs = nowNs / 1000000;

    // Random node with the multicast bit set, so it can't clash with a MAC
    uint8_t rnd[16];
    UUID128::default_fill_random(rnd, sizeof(rnd), nullptr);
    uint8_t node[6];
    for (int i = 0; i < 6; i++) node[i] = rnd[i];
    node[0] |= 0x01;
    uint16_t counter = (uint16_t)((rnd[6] << 8) | rnd[7]);

    UUID128 v1 = UUID128::newV1(ticks, counter, node);
    UUID128 v6 = UUID128::newV6(ticks, counter, node);
    print_uuid("v1:", v1);
    print_uuid("v6:", v6);
    printf("     same timestamp: %s\n", v1.timestamp() == v6.timestamp() ? "yes" : "NO");

    uint64_t randB = 0;
    for (int i = 8; i < 16; i++) randB = (randB << 8) | rnd[i];
    UUID128 v7 = UUID128::newV7(unixMs, counter, randB);
    print_uuid("v7:", v7);

    // Later v7 sorts after earlier v7
    UUID128 later = UUID128::newV7(unixMs + 1, 0, 0);
    printf("     sorts by time: %s\n", v7 < later ? "yes" : "NO");
    return 0;
}
