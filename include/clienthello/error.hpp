#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace clienthello {

// Decode failure kinds (flat, non-overlapping).
enum class ErrorKind : std::uint8_t {
    InputTooShort,            // below the absolute minimum for the entry point
    UnexpectedContentType,    // record content type is not Handshake (0x16)
    UnexpectedHandshakeType,  // handshake type is not ClientHello (0x01)
    Truncated                 // a field could not be fully read
};

// A decode failure. Only the members relevant to `kind` are populated:
// - InputTooShort:           need, have
// - UnexpectedContentType:   actual
// - UnexpectedHandshakeType: actual
// - Truncated:               field (static label, never dangles)
struct DecodeError {
    ErrorKind kind = ErrorKind::Truncated;
    std::size_t need = 0;
    std::size_t have = 0;
    std::uint8_t actual = 0;
    std::string_view field;

    static constexpr DecodeError input_too_short(std::size_t need, std::size_t have) noexcept {
        return DecodeError{ErrorKind::InputTooShort, need, have, 0, {}};
    }

    static constexpr DecodeError unexpected_content_type(std::uint8_t actual) noexcept {
        return DecodeError{ErrorKind::UnexpectedContentType, 0, 0, actual, {}};
    }

    static constexpr DecodeError unexpected_handshake_type(std::uint8_t actual) noexcept {
        return DecodeError{ErrorKind::UnexpectedHandshakeType, 0, 0, actual, {}};
    }

    static constexpr DecodeError truncated(std::string_view field) noexcept {
        return DecodeError{ErrorKind::Truncated, 0, 0, 0, field};
    }

    friend bool operator==(const DecodeError&, const DecodeError&) = default;
};

constexpr std::string_view error_kind_to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InputTooShort:           return "input_too_short";
        case ErrorKind::UnexpectedContentType:   return "unexpected_content_type";
        case ErrorKind::UnexpectedHandshakeType: return "unexpected_handshake_type";
        case ErrorKind::Truncated:               return "truncated";
    }
    return "unknown";
}

// Human-readable message, e.g. "truncated client random" or
// "buffer too short: need 5 bytes, have 2".
std::string describe(const DecodeError& error);

}  // namespace clienthello
