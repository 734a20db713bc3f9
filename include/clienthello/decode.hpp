#pragma once

#include "clienthello/client_hello.hpp"
#include "clienthello/error.hpp"
#include "clienthello/grease.hpp"

#include <cstddef>
#include <span>
#include <string_view>
#include <variant>

namespace clienthello {

// Result is either a complete ClientHello or the first failure.
using DecodeResult = std::variant<ClientHello, DecodeError>;

// Decode a bare handshake message (no record layer), e.g. the contents of
// QUIC CRYPTO frames.
//
// Contract:
// - Empty input -> InputTooShort{need=1, have=0}
// - First byte must be 0x01 (ClientHello), else UnexpectedHandshakeType
// - 3-byte length, then that many bytes of body
// - Any shortfall afterwards -> Truncated{field}
// - Never reads past the input; no partial result on failure
// - Returns views into input (caller must keep input alive and unmodified)
DecodeResult decode(std::span<const std::byte> input);

// Convenience overload for string_view
DecodeResult decode(std::string_view input);

// Decode a TLS record carrying a ClientHello.
//
// Contract:
// - Fewer than 5 bytes -> InputTooShort{need=5, have=N}
// - First byte must be 0x16 (Handshake), else UnexpectedContentType
// - Record version is ignored
// - Record payload (2-byte length) is handed to decode()
DecodeResult decode_record(std::span<const std::byte> input);

// Convenience overload for string_view
DecodeResult decode_record(std::string_view input);

}  // namespace clienthello
