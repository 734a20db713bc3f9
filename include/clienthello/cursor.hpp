#pragma once

#include "clienthello/error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace clienthello {

// Bounds-checked sequential reader over a borrowed byte range.
//
// Contract:
// - All multi-byte reads are big-endian
// - A read that needs more bytes than remain returns Truncated{field}
//   and leaves the position unchanged
// - Reads return std::nullopt on success (value in the out-parameter)
// - No peek, no backtracking; nested structures get a fresh Cursor over
//   a sub-range obtained from read_bytes()
//
// `field` must be a string literal (it is stored in the error as a view).
class Cursor {
public:
    explicit Cursor(std::span<const std::byte> data) noexcept
        : data_(data), pos_(0) {}

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

    std::optional<DecodeError> read_u8(std::string_view field, std::uint8_t& out) noexcept {
        if (remaining() < 1) {
            return DecodeError::truncated(field);
        }
        out = std::to_integer<std::uint8_t>(data_[pos_]);
        pos_ += 1;
        return std::nullopt;
    }

    std::optional<DecodeError> read_u16(std::string_view field, std::uint16_t& out) noexcept {
        if (remaining() < 2) {
            return DecodeError::truncated(field);
        }
        const auto b0 = std::to_integer<std::uint16_t>(data_[pos_]);
        const auto b1 = std::to_integer<std::uint16_t>(data_[pos_ + 1]);
        out = static_cast<std::uint16_t>((b0 << 8) | b1);
        pos_ += 2;
        return std::nullopt;
    }

    // 24-bit big-endian read; top byte of `out` is always zero.
    std::optional<DecodeError> read_u24(std::string_view field, std::uint32_t& out) noexcept {
        if (remaining() < 3) {
            return DecodeError::truncated(field);
        }
        const auto b0 = std::to_integer<std::uint32_t>(data_[pos_]);
        const auto b1 = std::to_integer<std::uint32_t>(data_[pos_ + 1]);
        const auto b2 = std::to_integer<std::uint32_t>(data_[pos_ + 2]);
        out = (b0 << 16) | (b1 << 8) | b2;
        pos_ += 3;
        return std::nullopt;
    }

    // Borrowed view of the next n bytes.
    std::optional<DecodeError> read_bytes(std::size_t n, std::string_view field,
                                          std::span<const std::byte>& out) noexcept {
        if (remaining() < n) {
            return DecodeError::truncated(field);
        }
        out = data_.subspan(pos_, n);
        pos_ += n;
        return std::nullopt;
    }

private:
    std::span<const std::byte> data_;
    std::size_t pos_;  // index of next unread byte
};

}  // namespace clienthello
