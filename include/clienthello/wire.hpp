#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace clienthello {

// ============================================================================
// Wire constants for the TLS record layer and the ClientHello message.
//
// All values are fixed by RFC 8446 / RFC 5246; nothing here is tunable.
// ============================================================================

struct WireLimits {
    static constexpr std::size_t kRecordHeaderBytes = 5;     // type(1) + version(2) + length(2)
    static constexpr std::size_t kHandshakeHeaderBytes = 4;  // type(1) + length(3)
    static constexpr std::size_t kRandomBytes = 32;
    static constexpr std::size_t kExtensionHeaderBytes = 4;  // type(2) + length(2)
    static constexpr std::size_t kKeyShareEntryHeaderBytes = 4;  // group(2) + key_len(2)
};

inline constexpr std::uint8_t kContentTypeHandshake = 0x16;
inline constexpr std::uint8_t kHandshakeTypeClientHello = 0x01;

// SNI name_type for a DNS hostname
inline constexpr std::uint8_t kServerNameTypeHostName = 0x00;

// Extension identifiers that get a structured decode.
// Anything else is kept as an UnknownExtension.
enum class ExtensionType : std::uint16_t {
    ServerName = 0x0000,
    SupportedGroups = 0x000a,
    SignatureAlgorithms = 0x000d,
    Alpn = 0x0010,
    SupportedVersions = 0x002b,
    PskExchangeModes = 0x002d,
    KeyShare = 0x0033,
    RenegotiationInfo = 0xff01,
};

constexpr std::string_view extension_type_to_string(std::uint16_t type_id) noexcept {
    switch (static_cast<ExtensionType>(type_id)) {
        case ExtensionType::ServerName:          return "server_name";
        case ExtensionType::SupportedGroups:     return "supported_groups";
        case ExtensionType::SignatureAlgorithms: return "signature_algorithms";
        case ExtensionType::Alpn:                return "application_layer_protocol_negotiation";
        case ExtensionType::SupportedVersions:   return "supported_versions";
        case ExtensionType::PskExchangeModes:    return "psk_key_exchange_modes";
        case ExtensionType::KeyShare:            return "key_share";
        case ExtensionType::RenegotiationInfo:   return "renegotiation_info";
    }
    return "unknown";
}

}  // namespace clienthello
