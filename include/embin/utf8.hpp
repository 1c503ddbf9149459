#pragma once

// UTF-8 helpers: leading-byte width table, single scalar encoding, and
// well-formedness checks.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace embin {

// =============================================================================
// Width table
// =============================================================================

// Total width (1-4) of the UTF-8 sequence starting with this byte, or 0 if the
// byte cannot start a sequence (continuation bytes, 0xC0, 0xC1, 0xF5-0xFF).
auto utf8_char_width(std::uint8_t lead) -> std::size_t;

// =============================================================================
// Encoding
// =============================================================================

struct utf8_char_t {
    std::array<std::uint8_t, 4> bytes{};
    std::size_t size = 0;

    auto as_span() const -> std::span<const std::uint8_t> {
        return {bytes.data(), size};
    }
};

auto is_scalar_value(char32_t c) -> bool;

// UTF-8 form of a single scalar; size is 0 when c is not a scalar value
auto encode_utf8(char32_t c) -> utf8_char_t;

// =============================================================================
// Decoding / validation
// =============================================================================

// Decode one complete sequence whose width was taken from utf8_char_width
auto decode_utf8(std::span<const std::uint8_t> seq) -> std::optional<char32_t>;

struct utf8_check_t {
    bool valid = true;
    std::size_t valid_up_to = 0;  // length of the well-formed prefix
};

auto validate_utf8(std::span<const std::uint8_t> bytes) -> utf8_check_t;

inline auto validate_utf8(std::string_view text) -> utf8_check_t {
    return validate_utf8(std::span<const std::uint8_t>{
        reinterpret_cast<const std::uint8_t*>(text.data()), text.size()});
}

} // namespace embin
