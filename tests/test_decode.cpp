#include "clienthello/decode.hpp"

#include "hello_builder.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <span>
#include <string>
#include <variant>

// Top-level record and handshake decoding tests.

namespace {

using testutil::Buffer;
using testutil::make_bytes;

const clienthello::ClientHello* get_hello_if_success(const clienthello::DecodeResult& r) {
    return std::get_if<clienthello::ClientHello>(&r);
}

const clienthello::DecodeError* get_error_if_failure(const clienthello::DecodeResult& r) {
    return std::get_if<clienthello::DecodeError>(&r);
}

bool is_error(const clienthello::DecodeResult& r, const clienthello::DecodeError& expected) {
    const auto* e = get_error_if_failure(r);
    return e != nullptr && *e == expected;
}

bool is_truncated(const clienthello::DecodeResult& r) {
    const auto* e = get_error_if_failure(r);
    return e != nullptr && e->kind == clienthello::ErrorKind::Truncated;
}

bool all_zero(std::span<const std::byte> bytes) {
    for (std::byte b : bytes) {
        if (b != std::byte{0}) {
            return false;
        }
    }
    return true;
}

} // namespace

int main() {
    using clienthello::DecodeError;

    // =========================================================================
    // Success path tests
    // =========================================================================

    // Test 1: minimal bare handshake, no extensions block
    {
        const Buffer data = testutil::minimal_handshake();
        auto r = clienthello::decode(data);
        const auto* h = get_hello_if_success(r);
        if (h == nullptr) {
            std::printf("Minimal handshake test failed: expected success\n");
            return EXIT_FAILURE;
        }
        if (h->legacy_version != 0x0303) {
            std::printf("Minimal handshake test failed: wrong legacy_version\n");
            return EXIT_FAILURE;
        }
        if (h->random.size() != 32 || !all_zero(h->random)) {
            std::printf("Minimal handshake test failed: wrong random\n");
            return EXIT_FAILURE;
        }
        if (!h->session_id.empty()) {
            std::printf("Minimal handshake test failed: expected empty session id\n");
            return EXIT_FAILURE;
        }
        if (h->cipher_suites.size() != 1 || h->cipher_suites[0] != 0x1301) {
            std::printf("Minimal handshake test failed: wrong cipher suites\n");
            return EXIT_FAILURE;
        }
        if (h->compression_methods.size() != 1 || h->compression_methods[0] != std::byte{0x00}) {
            std::printf("Minimal handshake test failed: wrong compression methods\n");
            return EXIT_FAILURE;
        }
        if (!h->extensions.empty() || h->has_grease) {
            std::printf("Minimal handshake test failed: expected no extensions, no GREASE\n");
            return EXIT_FAILURE;
        }
        // 4-byte handshake header + 2-byte version
        if (h->random.data() != data.data() + 6) {
            std::printf("Minimal handshake test failed: random is not a view into input\n");
            return EXIT_FAILURE;
        }
    }

    // Test 2: GREASE cipher suite is dropped and flagged
    {
        const Buffer data = testutil::wrap_handshake(testutil::hello_body({0x0A0A, 0x1301}));
        auto r = clienthello::decode(data);
        const auto* h = get_hello_if_success(r);
        if (h == nullptr || h->cipher_suites.size() != 1 || h->cipher_suites[0] != 0x1301) {
            std::printf("GREASE cipher suite test failed: expected [0x1301]\n");
            return EXIT_FAILURE;
        }
        if (!h->has_grease) {
            std::printf("GREASE cipher suite test failed: has_grease not set\n");
            return EXIT_FAILURE;
        }
    }

    // Test 3: record-wrapped minimal message
    {
        const Buffer data = testutil::wrap_record(testutil::minimal_handshake());
        auto r = clienthello::decode_record(data);
        const auto* h = get_hello_if_success(r);
        if (h == nullptr || h->legacy_version != 0x0303 ||
            h->cipher_suites.size() != 1 || h->cipher_suites[0] != 0x1301) {
            std::printf("Record-wrapped test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 4: full message, record-wrapped and bare agree
    {
        const Buffer raw = testutil::full_handshake();
        const Buffer rec = testutil::wrap_record(raw);
        auto r1 = clienthello::decode(raw);
        auto r2 = clienthello::decode_record(rec);
        const auto* h1 = get_hello_if_success(r1);
        const auto* h2 = get_hello_if_success(r2);
        if (h1 == nullptr || h2 == nullptr) {
            std::printf("Full message test failed: expected success\n");
            return EXIT_FAILURE;
        }
        if (h1->cipher_suites != h2->cipher_suites || h1->cipher_suites.size() != 3 ||
            h1->cipher_suites[0] != 0x1301 || h1->cipher_suites[2] != 0x1303) {
            std::printf("Full message test failed: wrong cipher suites\n");
            return EXIT_FAILURE;
        }
        if (h1->session_id.size() != 32 || h1->session_id[0] != std::byte{0xCD}) {
            std::printf("Full message test failed: wrong session id\n");
            return EXIT_FAILURE;
        }
        if (h1->extensions.size() != 9 || h2->extensions.size() != 9) {
            std::printf("Full message test failed: expected 9 extensions, got %zu\n",
                        h1->extensions.size());
            return EXIT_FAILURE;
        }
        if (!h1->has_grease || !h2->has_grease) {
            std::printf("Full message test failed: has_grease not set\n");
            return EXIT_FAILURE;
        }
    }

    // Test 5: extensions keep wire order
    {
        const Buffer raw = testutil::full_handshake();
        auto r = clienthello::decode(raw);
        const auto* h = get_hello_if_success(r);
        const std::uint16_t order[] = {0x0000, 0x0010, 0x002b, 0x000a, 0x000d,
                                       0x0033, 0x002d, 0xff01, 0x0042};
        if (h == nullptr) {
            std::printf("Wire order test failed: expected success\n");
            return EXIT_FAILURE;
        }
        for (std::size_t i = 0; i < h->extensions.size(); ++i) {
            if (clienthello::extension_type(h->extensions[i]) != order[i]) {
                std::printf("Wire order test failed at index %zu\n", i);
                return EXIT_FAILURE;
            }
        }
    }

    // Test 6: a single trailing byte after compression methods is not an
    // extensions block
    {
        Buffer body = testutil::hello_body({0x1301});
        testutil::push_u8(body, 0x00);
        auto r = clienthello::decode(testutil::wrap_handshake(body));
        const auto* h = get_hello_if_success(r);
        if (h == nullptr || !h->extensions.empty()) {
            std::printf("Trailing byte test failed: expected success with no extensions\n");
            return EXIT_FAILURE;
        }
    }

    // Test 7: empty extensions block
    {
        auto r = clienthello::decode(testutil::wrap_handshake(testutil::hello_body({0x1301}, {}, true)));
        const auto* h = get_hello_if_success(r);
        if (h == nullptr || !h->extensions.empty()) {
            std::printf("Empty extensions block test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 8: odd cipher suite length ignores the dangling byte
    {
        Buffer body;
        testutil::push_u16(body, 0x0303);
        testutil::push_repeat(body, 0x00, 32);
        testutil::push_u8(body, 0x00);
        testutil::push_u16(body, 3);
        testutil::push_bytes(body, {0x13, 0x01, 0x13});
        testutil::push_bytes(body, {0x01, 0x00});
        auto r = clienthello::decode(testutil::wrap_handshake(body));
        const auto* h = get_hello_if_success(r);
        if (h == nullptr || h->cipher_suites.size() != 1 || h->cipher_suites[0] != 0x1301) {
            std::printf("Odd cipher suite length test failed\n");
            return EXIT_FAILURE;
        }
        if (h->compression_methods.size() != 1) {
            std::printf("Odd cipher suite length test failed: compression misaligned\n");
            return EXIT_FAILURE;
        }
    }

    // Test 9: trailing extension bytes shorter than a header are ignored
    {
        Buffer exts;
        testutil::push_extension(exts, 0x0042, make_bytes({0x01}));
        testutil::push_bytes(exts, {0x00, 0x10, 0x00});
        auto r = clienthello::decode(testutil::wrap_handshake(testutil::hello_body({0x1301}, exts, true)));
        const auto* h = get_hello_if_success(r);
        if (h == nullptr || h->extensions.size() != 1) {
            std::printf("Short extension tail test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 10: GREASE extension type alone sets has_grease
    {
        Buffer exts;
        testutil::push_extension(exts, 0xBABA, Buffer{});
        auto r = clienthello::decode(testutil::wrap_handshake(testutil::hello_body({0x1301}, exts, true)));
        const auto* h = get_hello_if_success(r);
        if (h == nullptr || !h->has_grease || h->extensions.size() != 1) {
            std::printf("GREASE extension type test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 11: string_view overloads
    {
        const Buffer raw = testutil::wrap_record(testutil::minimal_handshake());
        const std::string text(reinterpret_cast<const char*>(raw.data()), raw.size());
        auto r = clienthello::decode_record(std::string_view(text));
        if (get_hello_if_success(r) == nullptr) {
            std::printf("string_view overload test failed\n");
            return EXIT_FAILURE;
        }
    }

    // =========================================================================
    // Error path tests
    // =========================================================================

    // Test 12: empty input -> InputTooShort{1, 0}
    {
        if (!is_error(clienthello::decode(std::span<const std::byte>{}), DecodeError::input_too_short(1, 0))) {
            std::printf("Empty input test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 13: short record -> InputTooShort{5, N}
    {
        if (!is_error(clienthello::decode_record(make_bytes({0x16, 0x03})),
                      DecodeError::input_too_short(5, 2))) {
            std::printf("Short record test failed\n");
            return EXIT_FAILURE;
        }
        if (!is_error(clienthello::decode_record(std::span<const std::byte>{}),
                      DecodeError::input_too_short(5, 0))) {
            std::printf("Empty record test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 14: handshake type 0x02 -> UnexpectedHandshakeType(0x02)
    {
        Buffer data = testutil::minimal_handshake();
        data[0] = std::byte{0x02};
        if (!is_error(clienthello::decode(data), DecodeError::unexpected_handshake_type(0x02))) {
            std::printf("Handshake type test failed\n");
            return EXIT_FAILURE;
        }
        // Nothing after the type byte is looked at
        if (!is_error(clienthello::decode(make_bytes({0x02})), DecodeError::unexpected_handshake_type(0x02))) {
            std::printf("Handshake type test failed: lone type byte\n");
            return EXIT_FAILURE;
        }
    }

    // Test 15: content type 0x17 -> UnexpectedContentType(0x17)
    {
        Buffer data = testutil::wrap_record(testutil::minimal_handshake());
        data[0] = std::byte{0x17};
        if (!is_error(clienthello::decode_record(data), DecodeError::unexpected_content_type(0x17))) {
            std::printf("Content type test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 16: record length beyond input -> Truncated{record payload}
    {
        Buffer data = testutil::wrap_record(testutil::minimal_handshake());
        data.pop_back();
        if (!is_error(clienthello::decode_record(data), DecodeError::truncated("record payload"))) {
            std::printf("Record payload truncation test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 17: handshake length beyond input -> Truncated{handshake body}
    {
        if (!is_error(clienthello::decode(make_bytes({0x01, 0x00, 0x00, 0xFF, 0x03, 0x03})),
                      DecodeError::truncated("handshake body"))) {
            std::printf("Handshake body truncation test failed\n");
            return EXIT_FAILURE;
        }
        if (!is_error(clienthello::decode(make_bytes({0x01, 0x00})),
                      DecodeError::truncated("handshake length"))) {
            std::printf("Handshake length truncation test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 18: body too short for the random -> Truncated{client random}
    {
        Buffer body;
        testutil::push_u16(body, 0x0303);
        testutil::push_repeat(body, 0x00, 31);
        if (!is_error(clienthello::decode(testutil::wrap_handshake(body)),
                      DecodeError::truncated("client random"))) {
            std::printf("Random truncation test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 19: a malformed extension fails the whole decode
    {
        Buffer exts;
        testutil::push_extension(exts, 0x0000, make_bytes({0x00, 0x09}));
        auto r = clienthello::decode(testutil::wrap_handshake(testutil::hello_body({0x1301}, exts, true)));
        if (!is_error(r, DecodeError::truncated("SNI list data"))) {
            std::printf("Malformed extension test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 20: extension body length beyond block -> Truncated{extension body}
    {
        Buffer exts;
        testutil::push_u16(exts, 0x0042);
        testutil::push_u16(exts, 8);
        testutil::push_bytes(exts, {0x01, 0x02});
        auto r = clienthello::decode(testutil::wrap_handshake(testutil::hello_body({0x1301}, exts, true)));
        if (!is_error(r, DecodeError::truncated("extension body"))) {
            std::printf("Extension body truncation test failed\n");
            return EXIT_FAILURE;
        }
    }

    // =========================================================================
    // Properties
    // =========================================================================

    // Test 21: every strict prefix of a valid message fails cleanly
    {
        const Buffer raw = testutil::full_handshake();
        const Buffer rec = testutil::wrap_record(raw);

        for (std::size_t n = 0; n < raw.size(); ++n) {
            auto r = clienthello::decode(std::span<const std::byte>(raw).first(n));
            const bool ok = (n == 0) ? is_error(r, DecodeError::input_too_short(1, 0)) : is_truncated(r);
            if (!ok) {
                std::printf("Prefix test failed (bare) at length %zu\n", n);
                return EXIT_FAILURE;
            }
        }

        for (std::size_t n = 0; n < rec.size(); ++n) {
            auto r = clienthello::decode_record(std::span<const std::byte>(rec).first(n));
            const bool ok = (n < 5) ? is_error(r, DecodeError::input_too_short(5, n)) : is_truncated(r);
            if (!ok) {
                std::printf("Prefix test failed (record) at length %zu\n", n);
                return EXIT_FAILURE;
            }
        }
    }

    // Test 22: decoding is deterministic
    {
        const Buffer raw = testutil::full_handshake();
        auto r1 = clienthello::decode(raw);
        auto r2 = clienthello::decode(raw);
        const auto* h1 = get_hello_if_success(r1);
        const auto* h2 = get_hello_if_success(r2);
        if (h1 == nullptr || h2 == nullptr ||
            h1->legacy_version != h2->legacy_version ||
            h1->cipher_suites != h2->cipher_suites ||
            h1->has_grease != h2->has_grease ||
            h1->extensions.size() != h2->extensions.size() ||
            h1->random.data() != h2->random.data()) {
            std::printf("Determinism test failed\n");
            return EXIT_FAILURE;
        }

        Buffer bad = raw;
        bad.resize(40);
        auto e1 = clienthello::decode(bad);
        auto e2 = clienthello::decode(bad);
        const auto* err1 = get_error_if_failure(e1);
        const auto* err2 = get_error_if_failure(e2);
        if (err1 == nullptr || err2 == nullptr || !(*err1 == *err2)) {
            std::printf("Determinism test failed: errors differ\n");
            return EXIT_FAILURE;
        }
    }

    std::printf("All decode tests passed\n");

    return EXIT_SUCCESS;
}
