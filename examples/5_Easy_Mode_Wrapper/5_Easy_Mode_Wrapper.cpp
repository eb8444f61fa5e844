/*
 * EXAMPLE 5: Easy Mode Wrapper
 *
 * Demonstrates the use of "EasyUUID128" class which provides:
 * - Integration with std::string.
 * - toCharArray() method similar to other libraries.
 * - Simplified generation (auto-retry).
 *
 * TRADE-OFF:
 * EasyUUID128 carries a 37-byte string cache and a ChaCha20 context per
 * instance. Use the plain UUID128 value type when storing many UUIDs.
 */

#include <stdio.h>

#include <iostream>
#include <string>

#include "EasyUUID128.h" // Include the wrapper

int main() {
    EasyUUID128 uuid;
    printf("\n--- UUID128 Easy Mode ---\n");

    // 1. Simple Generation (retries automatically)
    if (!uuid.generate()) {
        printf("Generator could not be seeded.\n");
        return 1;
    }

    // 2. Access as char* (C-style string)
    // The pointer is valid as long as the object exists.
    printf("As char*: %s\n", uuid.toCharArray());

    // 3. Access as std::string
    std::string myID = uuid.toString();
    printf("As string: %s\n", myID.c_str());

    // 4. String Concatenation
    std::string url = "https://api.example.com/v1/devices/" + uuid.toString();
    printf("URL: %s\n", url.c_str());
    printf("URN: %s\n", uuid.toURN().c_str());

    // 5. Direct stream output of the underlying value
    std::cout << "Direct: " << uuid.value() << "\n";

    // Generate a few more
    for (int i = 0; i < 3; i++) {
        uuid.generate();
        printf("%s\n", uuid.toCharArray());
    }
    return 0;
}
