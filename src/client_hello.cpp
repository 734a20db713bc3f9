#include "clienthello/client_hello.hpp"

#include "clienthello/wire.hpp"

#include <variant>

namespace clienthello {

namespace {

// First extension holding alternative T, or nullptr.
template <typename T>
const T* first_of(const std::vector<Extension>& extensions) noexcept {
    for (const auto& ext : extensions) {
        if (const auto* v = std::get_if<T>(&ext)) {
            return v;
        }
    }
    return nullptr;
}

}  // namespace

bool is_valid_utf8(std::span<const std::byte> bytes) noexcept {
    std::size_t i = 0;
    const std::size_t n = bytes.size();

    while (i < n) {
        const auto c = std::to_integer<std::uint8_t>(bytes[i]);

        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        std::uint8_t lo = 0x80;  // allowed range for the second byte
        std::uint8_t hi = 0xBF;

        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;  // overlong
            if (c == 0xED) hi = 0x9F;  // surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;  // overlong
            if (c == 0xF4) hi = 0x8F;  // > U+10FFFF
        } else {
            return false;
        }

        if (n - i < len) {
            return false;
        }

        const auto c1 = std::to_integer<std::uint8_t>(bytes[i + 1]);
        if (c1 < lo || c1 > hi) {
            return false;
        }
        for (std::size_t k = 2; k < len; ++k) {
            const auto ck = std::to_integer<std::uint8_t>(bytes[i + k]);
            if (ck < 0x80 || ck > 0xBF) {
                return false;
            }
        }
        i += len;
    }

    return true;
}

std::optional<std::string_view> ClientHello::server_name() const noexcept {
    for (const auto& ext : extensions) {
        const auto* sni = std::get_if<ServerNameList>(&ext);
        if (sni == nullptr) {
            continue;
        }
        for (const auto& entry : sni->names) {
            if (entry.name_type != kServerNameTypeHostName) {
                continue;
            }
            if (!is_valid_utf8(entry.name)) {
                return std::nullopt;
            }
            return std::string_view(reinterpret_cast<const char*>(entry.name.data()),
                                    entry.name.size());
        }
    }
    return std::nullopt;
}

std::span<const std::span<const std::byte>> ClientHello::alpn_protocols() const noexcept {
    if (const auto* alpn = first_of<AlpnProtocols>(extensions)) {
        return alpn->protocols;
    }
    return {};
}

std::span<const std::uint16_t> ClientHello::supported_versions() const noexcept {
    if (const auto* v = first_of<SupportedVersions>(extensions)) {
        return v->versions;
    }
    return {};
}

std::span<const std::uint16_t> ClientHello::supported_groups() const noexcept {
    if (const auto* g = first_of<SupportedGroups>(extensions)) {
        return g->groups;
    }
    return {};
}

std::span<const std::uint16_t> ClientHello::signature_algorithms() const noexcept {
    if (const auto* s = first_of<SignatureAlgorithms>(extensions)) {
        return s->algorithms;
    }
    return {};
}

std::span<const std::uint16_t> ClientHello::key_share_groups() const noexcept {
    if (const auto* k = first_of<KeyShareGroups>(extensions)) {
        return k->groups;
    }
    return {};
}

std::span<const std::byte> ClientHello::psk_exchange_modes() const noexcept {
    if (const auto* p = first_of<PskExchangeModes>(extensions)) {
        return p->modes;
    }
    return {};
}

bool ClientHello::has_renegotiation_info() const noexcept {
    return first_of<RenegotiationInfo>(extensions) != nullptr;
}

std::optional<std::span<const std::byte>> ClientHello::find_extension(std::uint16_t type_id) const noexcept {
    const bool reneg = type_id == static_cast<std::uint16_t>(ExtensionType::RenegotiationInfo);

    for (const auto& ext : extensions) {
        if (const auto* r = std::get_if<RenegotiationInfo>(&ext); r != nullptr && reneg) {
            return r->data;
        }
        if (const auto* u = std::get_if<UnknownExtension>(&ext); u != nullptr && u->type_id == type_id) {
            return u->data;
        }
    }
    return std::nullopt;
}

}  // namespace clienthello
