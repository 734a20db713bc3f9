#pragma once

#include "clienthello/extension.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace clienthello {

// Decoded ClientHello.
//
// Lifetime: every std::span member (and the spans held by extensions)
// points into the buffer passed to decode()/decode_record(). That buffer
// must outlive this object and must not be modified while it is in use.
// Copies of a ClientHello borrow from the same buffer.
//
// Only cipher_suites, the numeric extension lists and the PSK modes copy
// are allocated; everything else is a view.
struct ClientHello {
    std::uint16_t legacy_version = 0;
    std::span<const std::byte> random;               // exactly 32 bytes
    std::span<const std::byte> session_id;           // 0-32 bytes by convention
    std::vector<std::uint16_t> cipher_suites;        // GREASE removed
    std::span<const std::byte> compression_methods;
    std::vector<Extension> extensions;               // wire order, duplicates kept
    bool has_grease = false;                         // any GREASE value seen

    // First SNI entry with name_type host_name, if it is valid UTF-8.
    [[nodiscard]] std::optional<std::string_view> server_name() const noexcept;

    // Lists from the first matching extension; empty if absent.
    [[nodiscard]] std::span<const std::span<const std::byte>> alpn_protocols() const noexcept;
    [[nodiscard]] std::span<const std::uint16_t> supported_versions() const noexcept;
    [[nodiscard]] std::span<const std::uint16_t> supported_groups() const noexcept;
    [[nodiscard]] std::span<const std::uint16_t> signature_algorithms() const noexcept;
    [[nodiscard]] std::span<const std::uint16_t> key_share_groups() const noexcept;
    [[nodiscard]] std::span<const std::byte> psk_exchange_modes() const noexcept;

    [[nodiscard]] bool has_renegotiation_info() const noexcept;

    // Raw body of a renegotiation_info extension (type 0xff01) or of an
    // UnknownExtension with a matching identifier. Types decoded into a
    // structured variant are only reachable through their accessor and
    // return nullopt here.
    [[nodiscard]] std::optional<std::span<const std::byte>> find_extension(std::uint16_t type_id) const noexcept;
};

// Strict UTF-8 well-formedness check (no overlongs, no surrogates,
// nothing above U+10FFFF).
bool is_valid_utf8(std::span<const std::byte> bytes) noexcept;

}  // namespace clienthello
