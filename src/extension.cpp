#include "clienthello/extension.hpp"

#include "clienthello/cursor.hpp"
#include "clienthello/grease.hpp"
#include "clienthello/wire.hpp"

#include <utility>

namespace clienthello {

namespace {

using Bytes = std::span<const std::byte>;

// Reads a length prefix and returns a view of the list it bounds.
std::optional<DecodeError> open_u16_list(Bytes body, std::string_view len_field,
                                         std::string_view data_field, Bytes& list) noexcept {
    Cursor r(body);
    std::uint16_t list_len = 0;
    if (auto err = r.read_u16(len_field, list_len)) {
        return err;
    }
    return r.read_bytes(list_len, data_field, list);
}

std::optional<DecodeError> open_u8_list(Bytes body, std::string_view len_field,
                                        std::string_view data_field, Bytes& list) noexcept {
    Cursor r(body);
    std::uint8_t list_len = 0;
    if (auto err = r.read_u8(len_field, list_len)) {
        return err;
    }
    return r.read_bytes(list_len, data_field, list);
}

// Consumes 2-byte entries while at least 2 bytes remain.
// With filter_grease, GREASE entries are dropped and flagged.
std::optional<DecodeError> read_u16_entries(Bytes list, std::string_view entry_field,
                                            bool filter_grease, bool& has_grease,
                                            std::vector<std::uint16_t>& out) {
    Cursor inner(list);
    while (inner.remaining() >= 2) {
        std::uint16_t value = 0;
        if (auto err = inner.read_u16(entry_field, value)) {
            return err;
        }
        if (filter_grease && is_grease(value)) {
            has_grease = true;
        } else {
            out.push_back(value);
        }
    }
    return std::nullopt;
}

std::optional<DecodeError> decode_server_name(Bytes body, Extension& out) {
    Bytes list;
    if (auto err = open_u16_list(body, "SNI list length", "SNI list data", list)) {
        return err;
    }

    ServerNameList result;
    Cursor inner(list);
    while (inner.remaining() > 0) {
        ServerName entry{};
        std::uint16_t name_len = 0;
        if (auto err = inner.read_u8("SNI name type", entry.name_type)) {
            return err;
        }
        if (auto err = inner.read_u16("SNI name length", name_len)) {
            return err;
        }
        if (auto err = inner.read_bytes(name_len, "SNI name", entry.name)) {
            return err;
        }
        result.names.push_back(entry);
    }

    out = std::move(result);
    return std::nullopt;
}

std::optional<DecodeError> decode_alpn(Bytes body, Extension& out) {
    Bytes list;
    if (auto err = open_u16_list(body, "ALPN list length", "ALPN list data", list)) {
        return err;
    }

    AlpnProtocols result;
    Cursor inner(list);
    while (inner.remaining() > 0) {
        std::uint8_t proto_len = 0;
        Bytes proto;
        if (auto err = inner.read_u8("ALPN protocol length", proto_len)) {
            return err;
        }
        if (auto err = inner.read_bytes(proto_len, "ALPN protocol", proto)) {
            return err;
        }
        result.protocols.push_back(proto);
    }

    out = std::move(result);
    return std::nullopt;
}

std::optional<DecodeError> decode_supported_groups(Bytes body, bool& has_grease, Extension& out) {
    Bytes list;
    if (auto err = open_u16_list(body, "supported groups length", "supported groups data", list)) {
        return err;
    }

    SupportedGroups result;
    if (auto err = read_u16_entries(list, "supported group", true, has_grease, result.groups)) {
        return err;
    }
    out = std::move(result);
    return std::nullopt;
}

std::optional<DecodeError> decode_signature_algorithms(Bytes body, Extension& out) {
    Bytes list;
    if (auto err = open_u16_list(body, "signature algorithms length",
                                 "signature algorithms data", list)) {
        return err;
    }

    // Not GREASE-filtered: values are kept exactly as sent.
    bool unused = false;
    SignatureAlgorithms result;
    if (auto err = read_u16_entries(list, "signature algorithm", false, unused, result.algorithms)) {
        return err;
    }
    out = std::move(result);
    return std::nullopt;
}

// 1-byte list length, 2-byte entries.
std::optional<DecodeError> decode_supported_versions(Bytes body, bool& has_grease, Extension& out) {
    Bytes list;
    if (auto err = open_u8_list(body, "supported versions length", "supported versions data", list)) {
        return err;
    }

    SupportedVersions result;
    if (auto err = read_u16_entries(list, "supported version", true, has_grease, result.versions)) {
        return err;
    }
    out = std::move(result);
    return std::nullopt;
}

std::optional<DecodeError> decode_psk_modes(Bytes body, Extension& out) {
    Bytes list;
    if (auto err = open_u8_list(body, "PSK modes length", "PSK modes data", list)) {
        return err;
    }

    out = PskExchangeModes{std::vector<std::byte>(list.begin(), list.end())};
    return std::nullopt;
}

std::optional<DecodeError> decode_key_share(Bytes body, bool& has_grease, Extension& out) {
    Bytes list;
    if (auto err = open_u16_list(body, "key share list length", "key share list data", list)) {
        return err;
    }

    KeyShareGroups result;
    Cursor inner(list);
    while (inner.remaining() >= WireLimits::kKeyShareEntryHeaderBytes) {
        std::uint16_t group = 0;
        std::uint16_t key_len = 0;
        Bytes key;
        if (auto err = inner.read_u16("key share group", group)) {
            return err;
        }
        if (auto err = inner.read_u16("key share key length", key_len)) {
            return err;
        }
        if (auto err = inner.read_bytes(key_len, "key share key data", key)) {
            return err;
        }
        if (is_grease(group)) {
            has_grease = true;
        } else {
            result.groups.push_back(group);
        }
    }

    out = std::move(result);
    return std::nullopt;
}

}  // namespace

std::uint16_t extension_type(const Extension& ext) noexcept {
    struct TypeOf {
        std::uint16_t operator()(const ServerNameList&) const noexcept {
            return static_cast<std::uint16_t>(ExtensionType::ServerName);
        }
        std::uint16_t operator()(const AlpnProtocols&) const noexcept {
            return static_cast<std::uint16_t>(ExtensionType::Alpn);
        }
        std::uint16_t operator()(const SupportedVersions&) const noexcept {
            return static_cast<std::uint16_t>(ExtensionType::SupportedVersions);
        }
        std::uint16_t operator()(const SupportedGroups&) const noexcept {
            return static_cast<std::uint16_t>(ExtensionType::SupportedGroups);
        }
        std::uint16_t operator()(const SignatureAlgorithms&) const noexcept {
            return static_cast<std::uint16_t>(ExtensionType::SignatureAlgorithms);
        }
        std::uint16_t operator()(const KeyShareGroups&) const noexcept {
            return static_cast<std::uint16_t>(ExtensionType::KeyShare);
        }
        std::uint16_t operator()(const PskExchangeModes&) const noexcept {
            return static_cast<std::uint16_t>(ExtensionType::PskExchangeModes);
        }
        std::uint16_t operator()(const RenegotiationInfo&) const noexcept {
            return static_cast<std::uint16_t>(ExtensionType::RenegotiationInfo);
        }
        std::uint16_t operator()(const UnknownExtension& u) const noexcept {
            return u.type_id;
        }
    };
    return std::visit(TypeOf{}, ext);
}

std::optional<DecodeError> decode_extension(
    std::uint16_t type_id,
    Bytes body,
    bool& has_grease,
    Extension& out) {
    // GREASE type identifiers are never decoded further
    if (is_grease(type_id)) {
        has_grease = true;
        out = UnknownExtension{type_id, body};
        return std::nullopt;
    }

    // Sub-decoders write GREASE sightings to a local flag so a failed
    // decode leaves the caller's flag alone.
    bool grease = false;
    std::optional<DecodeError> err;

    switch (static_cast<ExtensionType>(type_id)) {
        case ExtensionType::ServerName:
            err = decode_server_name(body, out);
            break;
        case ExtensionType::SupportedGroups:
            err = decode_supported_groups(body, grease, out);
            break;
        case ExtensionType::SignatureAlgorithms:
            err = decode_signature_algorithms(body, out);
            break;
        case ExtensionType::Alpn:
            err = decode_alpn(body, out);
            break;
        case ExtensionType::SupportedVersions:
            err = decode_supported_versions(body, grease, out);
            break;
        case ExtensionType::PskExchangeModes:
            err = decode_psk_modes(body, out);
            break;
        case ExtensionType::KeyShare:
            err = decode_key_share(body, grease, out);
            break;
        case ExtensionType::RenegotiationInfo:
            out = RenegotiationInfo{body};
            break;
        default:
            out = UnknownExtension{type_id, body};
            break;
    }

    if (err) {
        return err;
    }
    if (grease) {
        has_grease = true;
    }
    return std::nullopt;
}

}  // namespace clienthello
