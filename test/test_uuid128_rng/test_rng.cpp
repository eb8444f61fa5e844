#ifdef STANDALONE_TEST
    #include <assert.h>
    #include <stdio.h>
    #include <string.h>
    #define TEST_ASSERT_TRUE(cond) assert(cond)
    #define TEST_ASSERT_FALSE(cond) assert(!(cond))
    #define TEST_ASSERT_EQUAL_INT(expected, actual) assert((expected) == (actual))
    #define TEST_ASSERT_EQUAL_MEMORY(expected, actual, len) assert(memcmp(expected, actual, len) == 0)
    #define RUN_TEST(func) do { printf("Running %s...", #func); func(); printf(" OK\n"); } while(0)
    #define UNITY_BEGIN() printf("Starting Standalone Tests...\n")
    #define UNITY_END() (printf("All tests passed!\n"), 0)
#else
    #include <unity.h>
    #include <string.h>
    void setUp(void) {}
    void tearDown(void) {}
#endif

#include <utility>

#include "UUID128.h"
#include "UUID128Rng.h"

static const uint8_t ZERO_SEED[32] = {0};

// ChaCha20 keystream, all-zero key, nonce and counter
static const uint8_t ZERO_KEYSTREAM[80] = {
    0x76, 0xb8, 0xe0, 0xad, 0xa0, 0xf1, 0x3d, 0x90, 0x40, 0x5d, 0x6a, 0xe5, 0x53, 0x86, 0xbd, 0x28,
    0xbd, 0xd2, 0x19, 0xb8, 0xa0, 0x8d, 0xed, 0x1a, 0xa8, 0x36, 0xef, 0xcc, 0x8b, 0x77, 0x0d, 0xc7,
    0xda, 0x41, 0x59, 0x7c, 0x51, 0x57, 0x48, 0x8d, 0x77, 0x24, 0xe0, 0x3f, 0xb8, 0xd8, 0x4a, 0x37,
    0x6a, 0x43, 0xb8, 0xf4, 0x15, 0x18, 0xa1, 0x1c, 0xc3, 0x87, 0xb6, 0x69, 0xb2, 0xee, 0x65, 0x86,
    0x9f, 0x07, 0xe7, 0xbe, 0x55, 0x51, 0x38, 0x7a, 0x98, 0xba, 0x97, 0x7c, 0x73, 0x2d, 0x08, 0x0d
};

static void assert_uuid_str(const UUID128& u, const char* expected) {
    char buf[UUID128_STR_LENGTH];
    u.toStr(buf);
    TEST_ASSERT_EQUAL_MEMORY(expected, buf, UUID128_STR_LENGTH);
}

void test_zero_seed_keystream() {
    UUID128Rng rng(ZERO_SEED);
    TEST_ASSERT_TRUE(rng.isValid());

    uint8_t out[80];
    TEST_ASSERT_TRUE(rng.fillBytes(out, sizeof(out)));
    TEST_ASSERT_EQUAL_MEMORY(ZERO_KEYSTREAM, out, sizeof(out));
}

void test_counting_seed_keystream() {
    uint8_t seed[32];
    for (int i = 0; i < 32; i++) seed[i] = (uint8_t)i;

    static const uint8_t expected[32] = {
        0x39, 0xfd, 0x2b, 0x7d, 0xd9, 0xc5, 0x19, 0x6a, 0x8d, 0xbd, 0x03, 0x77, 0xb8, 0xdc, 0x4a, 0x49,
        0x8a, 0x35, 0xd8, 0x6f, 0xbc, 0xde, 0x6a, 0xcc, 0xb2, 0xcc, 0x7d, 0x4c, 0xd8, 0xea, 0x24, 0x92
    };

    UUID128Rng rng(seed);
    uint8_t out[32];
    TEST_ASSERT_TRUE(rng.fillBytes(out, sizeof(out)));
    TEST_ASSERT_EQUAL_MEMORY(expected, out, sizeof(out));
}

void test_chunking_is_independent() {
    UUID128Rng a(ZERO_SEED);
    uint8_t out[80];
    // Odd-sized draws straddling the block boundary
    TEST_ASSERT_TRUE(a.fillBytes(out, 7));
    TEST_ASSERT_TRUE(a.fillBytes(out + 7, 50));
    TEST_ASSERT_TRUE(a.fillBytes(out + 57, 0));
    TEST_ASSERT_TRUE(a.fillBytes(out + 57, 23));
    TEST_ASSERT_EQUAL_MEMORY(ZERO_KEYSTREAM, out, sizeof(out));
}

void test_seeded_uuid_sequence() {
    UUID128Rng rng(ZERO_SEED);
    UUID128 u;

    TEST_ASSERT_TRUE(UUID128::newV4(u, rng));
    assert_uuid_str(u, "76b8e0ad-a0f1-4d90-805d-6ae55386bd28");
    TEST_ASSERT_TRUE(u.version() == UUID_VERSION_RANDOM);
    TEST_ASSERT_TRUE(u.variant() == UUID_VARIANT_RFC4122);

    TEST_ASSERT_TRUE(UUID128::newV4(u, rng));
    assert_uuid_str(u, "bdd219b8-a08d-4d1a-a836-efcc8b770dc7");

    TEST_ASSERT_TRUE(UUID128::newV4(u, rng));
    TEST_ASSERT_TRUE(UUID128::newV4(u, rng));

    // Fifth draw comes from the second keystream block
    TEST_ASSERT_TRUE(UUID128::newV4(u, rng));
    assert_uuid_str(u, "9f07e7be-5551-487a-98ba-977c732d080d");
}

void test_same_seed_reproduces() {
    uint8_t seed[32];
    for (int i = 0; i < 32; i++) seed[i] = (uint8_t)(0xA5 ^ i);

    UUID128Rng a(seed);
    UUID128Rng b(seed);
    for (int i = 0; i < 100; i++) {
        UUID128 x, y;
        TEST_ASSERT_TRUE(UUID128::newV4(x, a));
        TEST_ASSERT_TRUE(UUID128::newV4(y, b));
        TEST_ASSERT_TRUE(x == y);
    }

    UUID128Rng c(ZERO_SEED);
    UUID128 x, z;
    TEST_ASSERT_TRUE(UUID128::newV4(x, a));
    TEST_ASSERT_TRUE(UUID128::newV4(z, c));
    TEST_ASSERT_TRUE(x != z);
}

void test_fill_callback_adapter() {
    UUID128Rng rng(ZERO_SEED);
    UUID128 u;
    TEST_ASSERT_TRUE(UUID128::newV4(u, &UUID128Rng::fillCallback, &rng));
    assert_uuid_str(u, "76b8e0ad-a0f1-4d90-805d-6ae55386bd28");

    // No generator behind the callback: zero bytes, rejected by the health check
    UUID128 v = UUID128::max();
    TEST_ASSERT_FALSE(UUID128::newV4(v, &UUID128Rng::fillCallback, nullptr));
    TEST_ASSERT_TRUE(v == UUID128::max());
}

void test_default_seeding() {
    UUID128Rng a;
    UUID128Rng b;
    TEST_ASSERT_TRUE(a.isValid());
    TEST_ASSERT_TRUE(b.isValid());

    UUID128 x, y;
    TEST_ASSERT_TRUE(UUID128::newV4(x, a));
    TEST_ASSERT_TRUE(UUID128::newV4(y, b));
    TEST_ASSERT_TRUE(x != y);
}

void test_move_transfers_state() {
    UUID128Rng a(ZERO_SEED);
    UUID128 u;
    TEST_ASSERT_TRUE(UUID128::newV4(u, a));

    UUID128Rng b(std::move(a));
    TEST_ASSERT_FALSE(a.isValid());
    TEST_ASSERT_TRUE(b.isValid());

    // The stream continues where the moved-from generator stopped
    TEST_ASSERT_TRUE(UUID128::newV4(u, b));
    assert_uuid_str(u, "bdd219b8-a08d-4d1a-a836-efcc8b770dc7");

    uint8_t buf[4];
    TEST_ASSERT_FALSE(a.fillBytes(buf, sizeof(buf)));
    UUID128 v = UUID128::max();
    TEST_ASSERT_FALSE(UUID128::newV4(v, a));
    TEST_ASSERT_TRUE(v == UUID128::max());
}

void test_null_arguments() {
    UUID128Rng nullSeed((const uint8_t*)nullptr);
    TEST_ASSERT_FALSE(nullSeed.isValid());

    UUID128Rng rng(ZERO_SEED);
    TEST_ASSERT_FALSE(rng.fillBytes(nullptr, 16));
    TEST_ASSERT_TRUE(rng.fillBytes(nullptr, 0));
}

int run_tests() {
    UNITY_BEGIN();
    RUN_TEST(test_zero_seed_keystream);
    RUN_TEST(test_counting_seed_keystream);
    RUN_TEST(test_chunking_is_independent);
    RUN_TEST(test_seeded_uuid_sequence);
    RUN_TEST(test_same_seed_reproduces);
    RUN_TEST(test_fill_callback_adapter);
    RUN_TEST(test_default_seeding);
    RUN_TEST(test_move_transfers_state);
    RUN_TEST(test_null_arguments);
    return UNITY_END();
}

int main(int argc, char **argv) {
    (void)argc; (void)argv;
    return run_tests();
}
