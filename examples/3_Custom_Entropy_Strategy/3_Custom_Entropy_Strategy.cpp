/*
 * EXAMPLE 3: Custom Entropy Strategy (Dependency Injection)
 *
 * PROBLEM:
 * The default source is the OpenSSL CSPRNG. Some deployments need a
 * different one: a hardware TRNG, an HSM, or a reproducible stream for tests.
 *
 * SOLUTION:
 * Inject a custom RNG function. This example shows three sources:
 * 1. A /dev/urandom reader.
 * 2. A seeded UUID128Rng (deterministic, for test fixtures).
 * 3. A broken source, to show the health check at work.
 */

#include <stdio.h>

#include "UUID128.h"
#include "UUID128Rng.h"

// --- CUSTOM RNG IMPLEMENTATION ---
// This function must fill 'dest' with 'len' random bytes.
// On failure it leaves zeros, which the health check rejects.
static void urandom_rng(uint8_t* dest, size_t len, void* ctx) {
    FILE* f = static_cast<FILE*>(ctx);
    if (!f || fread(dest, 1, len, f) != len) {
        for (size_t i = 0; i < len; i++) dest[i] = 0;
    }
}

static void broken_rng(uint8_t* dest, size_t len, void* ctx) {
    (void)ctx;
    for (size_t i = 0; i < len; i++) dest[i] = 0;
}

static void report(const char* label, bool ok, const UUID128& u) {
    if (ok) {
        char buf[37];
        u.toString(buf, sizeof(buf));
        printf("%-12s %s\n", label, buf);
    } else {
        printf("%-12s Error: RNG Health Check Failed!\n", label);
    }
}

int main() {
    printf("\n--- UUID128 Custom Entropy ---\n");
    UUID128 u;

    FILE* f = fopen("/dev/urandom", "rb");
    report("urandom:", UUID128::newV4(u, urandom_rng, f), u);
    if (f) fclose(f);

    // Same seed, same sequence
    uint8_t seed[32] = {0};
    UUID128Rng fixture(seed);
    report("seeded #1:", UUID128::newV4(u, &UUID128Rng::fillCallback, &fixture), u);
    report("seeded #2:", UUID128::newV4(u, &UUID128Rng::fillCallback, &fixture), u);

    report("broken:", UUID128::newV4(u, broken_rng, nullptr), u);
    return 0;
}
