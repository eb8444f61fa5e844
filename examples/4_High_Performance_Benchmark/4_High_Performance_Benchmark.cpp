/*
 * EXAMPLE 4: High Performance Benchmark
 *
 * Demonstrates:
 * 1. Generating UUIDs in a tight loop.
 * 2. Throughput measurement (UUIDs per second).
 * 3. The cost of per-call entropy vs a reusable seeded generator.
 */

#include <stdio.h>

#include <chrono>

#include "UUID128.h"
#include "UUID128Rng.h"

typedef bool (*bench_fn)(UUID128& out, void* ctx);

static void run_benchmark(const char* name, bench_fn fn, void* ctx) {
    printf("Benchmarking: %s\n", name);

    typedef std::chrono::steady_clock steady;
    const std::chrono::milliseconds duration(1000); // 1 second test
    steady::time_point start = steady::now();
    uint32_t count = 0;
    uint32_t failures = 0;
    UUID128 u;

    while (steady::now() - start < duration) {
        for (int i = 0; i < 256; i++) {
            if (fn(u, ctx)) {
                count++;
            } else {
                failures++;
            }
        }
    }

    double rate = (double)count;
    printf("Result: %u UUIDs/sec (%u failures)\n", count, failures);
    printf("Time per UUID: %.3f us\n", 1000000.0 / rate);
    printf("-----------------------------\n");
}

static bool bench_v4_default(UUID128& out, void* ctx) {
    (void)ctx;
    return UUID128::newV4(out);
}

static bool bench_v4_seeded(UUID128& out, void* ctx) {
    return UUID128::newV4(out, *static_cast<UUID128Rng*>(ctx));
}

static bool bench_v5(UUID128& out, void* ctx) {
    (void)ctx;
    return UUID128::newV5(out, UUID128_NAMESPACE_DNS, "www.example.com");
}

static bool bench_format_parse(UUID128& out, void* ctx) {
    const UUID128* src = static_cast<const UUID128*>(ctx);
    char buf[UUID128_STR_LENGTH];
    src->toStr(buf);
    return UUID128::parse(buf, sizeof(buf), out);
}

int main() {
    printf("\n--- UUID128 Performance Benchmark ---\n");

    // TEST 1: One RAND_bytes call per UUID
    run_benchmark("v4, OS entropy per call", bench_v4_default, nullptr);

    // TEST 2: Seed once, then ChaCha20 keystream
    UUID128Rng rng;
    if (rng.isValid()) {
        run_benchmark("v4, seeded UUID128Rng", bench_v4_seeded, &rng);
    }

    // TEST 3: SHA-1 per UUID
    run_benchmark("v5, DNS namespace", bench_v5, nullptr);

    // TEST 4: Text codec
    UUID128 sample;
    if (UUID128::newV4(sample)) {
        run_benchmark("toStr + parse", bench_format_parse, &sample);
    }
    return 0;
}
