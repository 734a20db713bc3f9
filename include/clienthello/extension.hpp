#pragma once

#include "clienthello/error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include <vector>

namespace clienthello {

// ============================================================================
// ClientHello extensions.
//
// Each dispatched extension type decodes into its own payload struct; all
// other types (including GREASE type identifiers) become UnknownExtension
// with the raw body kept.
//
// Views (std::span) point into the caller's input buffer. Vectors are
// allocated only where GREASE filtering or copying requires it.
// ============================================================================

// Single SNI entry (name is a view into original input)
struct ServerName {
    std::uint8_t name_type;
    std::span<const std::byte> name;
};

// server_name (0x0000)
struct ServerNameList {
    std::vector<ServerName> names;
};

// application_layer_protocol_negotiation (0x0010)
struct AlpnProtocols {
    std::vector<std::span<const std::byte>> protocols;
};

// supported_versions (0x002b), GREASE removed
struct SupportedVersions {
    std::vector<std::uint16_t> versions;
};

// supported_groups (0x000a), GREASE removed
struct SupportedGroups {
    std::vector<std::uint16_t> groups;
};

// signature_algorithms (0x000d), kept verbatim (GREASE-shaped values included)
struct SignatureAlgorithms {
    std::vector<std::uint16_t> algorithms;
};

// key_share (0x0033): group identifiers only, GREASE removed.
// Key exchange bytes are skipped.
struct KeyShareGroups {
    std::vector<std::uint16_t> groups;
};

// psk_key_exchange_modes (0x002d). Owned copy, unlike every other variant.
struct PskExchangeModes {
    std::vector<std::byte> modes;
};

// renegotiation_info (0xff01): the whole extension body, inner length
// prefix included.
struct RenegotiationInfo {
    std::span<const std::byte> data;
};

// Any type not decoded above
struct UnknownExtension {
    std::uint16_t type_id;
    std::span<const std::byte> data;
};

using Extension = std::variant<
    ServerNameList,
    AlpnProtocols,
    SupportedVersions,
    SupportedGroups,
    SignatureAlgorithms,
    KeyShareGroups,
    PskExchangeModes,
    RenegotiationInfo,
    UnknownExtension>;

// Wire type identifier an extension was decoded from.
std::uint16_t extension_type(const Extension& ext) noexcept;

// Decode one extension body.
//
// Contract:
// - GREASE type identifiers set has_grease and yield UnknownExtension
//   without further decoding
// - GREASE values inside supported_versions, supported_groups and
//   key_share are dropped and set has_grease
// - 2-byte entry lists stop at the last complete entry; a dangling odd
//   byte is ignored
// - Any shortfall inside the body returns Truncated naming the field;
//   `out` is left untouched in that case
std::optional<DecodeError> decode_extension(
    std::uint16_t type_id,
    std::span<const std::byte> body,
    bool& has_grease,
    Extension& out);

}  // namespace clienthello
