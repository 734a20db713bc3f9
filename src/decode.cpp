#include "clienthello/decode.hpp"

#include "clienthello/cursor.hpp"
#include "clienthello/extension.hpp"
#include "clienthello/wire.hpp"

#include <optional>
#include <utility>

namespace clienthello {

namespace {

using Bytes = std::span<const std::byte>;

Bytes to_bytes(std::string_view input) noexcept {
    return Bytes(reinterpret_cast<const std::byte*>(input.data()), input.size());
}

// Cipher suites: 2-byte length, 2-byte entries, GREASE dropped.
// A dangling odd byte inside the declared length is ignored.
std::optional<DecodeError> read_cipher_suites(Cursor& r, bool& has_grease,
                                              std::vector<std::uint16_t>& out) {
    std::uint16_t len = 0;
    Bytes data;
    if (auto err = r.read_u16("cipher suites length", len)) {
        return err;
    }
    if (auto err = r.read_bytes(len, "cipher suites data", data)) {
        return err;
    }

    Cursor inner(data);
    while (inner.remaining() >= 2) {
        std::uint16_t suite = 0;
        if (auto err = inner.read_u16("cipher suite", suite)) {
            return err;
        }
        if (is_grease(suite)) {
            has_grease = true;
        } else {
            out.push_back(suite);
        }
    }
    return std::nullopt;
}

// Extensions block: 2-byte length, then type/length/body entries while at
// least a full entry header remains.
std::optional<DecodeError> read_extensions(Cursor& r, bool& has_grease,
                                           std::vector<Extension>& out) {
    std::uint16_t len = 0;
    Bytes data;
    if (auto err = r.read_u16("extensions length", len)) {
        return err;
    }
    if (auto err = r.read_bytes(len, "extensions data", data)) {
        return err;
    }

    Cursor inner(data);
    while (inner.remaining() >= WireLimits::kExtensionHeaderBytes) {
        std::uint16_t type_id = 0;
        std::uint16_t ext_len = 0;
        Bytes body;
        if (auto err = inner.read_u16("extension type", type_id)) {
            return err;
        }
        if (auto err = inner.read_u16("extension length", ext_len)) {
            return err;
        }
        if (auto err = inner.read_bytes(ext_len, "extension body", body)) {
            return err;
        }

        Extension ext;
        if (auto err = decode_extension(type_id, body, has_grease, ext)) {
            return err;
        }
        out.push_back(std::move(ext));
    }
    return std::nullopt;
}

DecodeResult decode_body(Bytes body) {
    Cursor r(body);
    ClientHello hello;

    if (auto err = r.read_u16("legacy version", hello.legacy_version)) {
        return *err;
    }
    if (auto err = r.read_bytes(WireLimits::kRandomBytes, "client random", hello.random)) {
        return *err;
    }

    std::uint8_t sid_len = 0;
    if (auto err = r.read_u8("session ID length", sid_len)) {
        return *err;
    }
    if (auto err = r.read_bytes(sid_len, "session ID", hello.session_id)) {
        return *err;
    }

    if (auto err = read_cipher_suites(r, hello.has_grease, hello.cipher_suites)) {
        return *err;
    }

    std::uint8_t comp_len = 0;
    if (auto err = r.read_u8("compression methods length", comp_len)) {
        return *err;
    }
    if (auto err = r.read_bytes(comp_len, "compression methods", hello.compression_methods)) {
        return *err;
    }

    // Extensions are optional: fewer than 2 bytes left means none.
    if (r.remaining() >= 2) {
        if (auto err = read_extensions(r, hello.has_grease, hello.extensions)) {
            return *err;
        }
    }

    return hello;
}

}  // namespace

DecodeResult decode(Bytes input) {
    if (input.empty()) {
        return DecodeError::input_too_short(1, 0);
    }

    Cursor r(input);
    std::uint8_t hs_type = 0;
    if (auto err = r.read_u8("handshake type", hs_type)) {
        return *err;
    }
    if (hs_type != kHandshakeTypeClientHello) {
        return DecodeError::unexpected_handshake_type(hs_type);
    }

    std::uint32_t body_len = 0;
    Bytes body;
    if (auto err = r.read_u24("handshake length", body_len)) {
        return *err;
    }
    if (auto err = r.read_bytes(body_len, "handshake body", body)) {
        return *err;
    }

    return decode_body(body);
}

DecodeResult decode(std::string_view input) {
    return decode(to_bytes(input));
}

DecodeResult decode_record(Bytes input) {
    if (input.size() < WireLimits::kRecordHeaderBytes) {
        return DecodeError::input_too_short(WireLimits::kRecordHeaderBytes, input.size());
    }

    Cursor r(input);
    std::uint8_t content_type = 0;
    if (auto err = r.read_u8("record content type", content_type)) {
        return *err;
    }
    if (content_type != kContentTypeHandshake) {
        return DecodeError::unexpected_content_type(content_type);
    }

    std::uint16_t version = 0;  // ignored
    std::uint16_t record_len = 0;
    Bytes payload;
    if (auto err = r.read_u16("record protocol version", version)) {
        return *err;
    }
    if (auto err = r.read_u16("record length", record_len)) {
        return *err;
    }
    if (auto err = r.read_bytes(record_len, "record payload", payload)) {
        return *err;
    }

    return decode(payload);
}

DecodeResult decode_record(std::string_view input) {
    return decode_record(to_bytes(input));
}

}  // namespace clienthello
