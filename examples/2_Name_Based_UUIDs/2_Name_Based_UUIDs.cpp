/*
 * EXAMPLE 2: Name-Based UUIDs (v3 / v5)
 *
 * WHY THIS MATTERS:
 * Random UUIDs differ on every run. When the same entity must always map
 * to the same identifier (a hostname, a URL, a database key), derive the
 * UUID from a namespace and a name instead.
 *
 * - v5 hashes with SHA-1 (preferred).
 * - v3 hashes with MD5 (legacy compatibility).
 */

#include <stdio.h>
#include <string.h>

#include "UUID128.h"

static void print_uuid(const char* label, const UUID128& u) {
    char buf[37];
    u.toString(buf, sizeof(buf));
    printf("%-28s %s\n", label, buf);
}

int main() {
    printf("\n--- Name-Based UUIDs ---\n");

    UUID128 u;
    if (UUID128::newV5(u, UUID128_NAMESPACE_DNS, "python.org")) {
        print_uuid("v5(DNS, python.org):", u);
    }
    if (UUID128::newV3(u, UUID128_NAMESPACE_DNS, "python.org")) {
        print_uuid("v3(DNS, python.org):", u);
    }
    if (UUID128::newV5(u, UUID128_NAMESPACE_URL, "https://example.com/")) {
        print_uuid("v5(URL, https://...):", u);
    }

    // Names are raw bytes, not just text
    const uint8_t key[] = {0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0x01};
    if (UUID128::newV5(u, UUID128_NAMESPACE_OID, key, sizeof(key))) {
        print_uuid("v5(OID, binary key):", u);
    }

    // Custom namespace: any UUID works, e.g. one per application
    UUID128 appNs;
    if (UUID128::parse("6ba7b814-9dad-11d1-80b4-00c04fd430c8", appNs)) {
        UUID128 a, b;
        if (UUID128::newV5(a, appNs, "user:42") && UUID128::newV5(b, appNs, "user:42")) {
            print_uuid("v5(app, user:42):", a);
            printf("Deterministic: %s\n", a == b ? "yes" : "NO");
        }
    }
    return 0;
}
