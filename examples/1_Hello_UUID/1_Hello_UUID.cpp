/*
 * EXAMPLE 1: Hello UUID (Production Basics)
 *
 * Demonstrates:
 * 1. Basic generation of a random (v4) UUID.
 * 2. Error handling (RNG health check).
 * 3. Text conversion and parsing.
 * 4. Comparison operators.
 */

#include <stdio.h>
#include <iostream>

#include "UUID128.h"

int main() {
    printf("\n--- UUID128 Production Basics ---\n");

    // 1. GENERATION WITH ERROR HANDLING
    // Always check the return value! Generation fails if the
    // entropy source is unavailable (returns all zeros).
    UUID128 uuid;
    if (!UUID128::newV4(uuid)) {
        printf("CRITICAL: Failed to generate UUID (RNG Error)!\n");
        return 1;
    }

    // 2. CONVERSION TO STRING
    // Buffer must be >= 37 bytes (36 chars + null terminator).
    char uuidStr[37];
    uuid.toString(uuidStr, sizeof(uuidStr));
    printf("Generated UUID: %s\n", uuidStr);

    // 3. ACCESSING RAW BYTES (Zero-Copy)
    const uint8_t* raw = uuid.data();
    printf("Raw Bytes: ");
    for (int i = 0; i < 16; i++) {
        printf("%02X", raw[i]);
    }
    printf("\n");
    printf("Version: %s, Variant: %s\n",
           uuidVersionName(uuid.version()), uuidVariantName(uuid.variant()));

    // 4. PARSING BACK (Validation)
    UUID128 parsed;
    if (UUID128::parse(uuidStr, parsed) && parsed == uuid) {
        printf("Parsing: OK\n");
    }

    // Any of the four accepted forms, any case
    UUID128 braced;
    if (UUID128::parse("{67E55044-10B1-426F-9247-BB680E5FE0C8}", braced)) {
        char buf[UUID128_URN_LENGTH];
        braced.toURN(buf);
        printf("Braced -> URN: %.*s\n", (int)sizeof(buf), buf);
    }

    // 5. ADVANCED FORMATTING
    char custom[37];
    uuid.toString(custom, sizeof(custom), true, true); // UPPERCASE
    printf("Uppercase: %s\n", custom);

    uuid.toString(custom, sizeof(custom), false, false); // RAW (no dashes)
    printf("Raw Hex:   %s\n", custom);

    std::cout << "Stream:    " << uuid << "\n";
    std::cout << "Debug:     ";
    uuid.printDebug(std::cout, true);
    std::cout << "\n";

    // 6. ORDERING
    // Operator < compares the 128-bit values as big-endian integers
    UUID128 other;
    if (UUID128::newV4(other)) {
        printf("Ordering: %s\n", uuid < other ? "uuid < other" : "uuid >= other");
    }
    return 0;
}
