#include "embin/utf8.hpp"

namespace embin {

namespace {

// clang-format off
constexpr std::uint8_t UTF8_CHAR_WIDTH[256] = {
    1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, // 0x1F
    1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, // 0x3F
    1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, // 0x5F
    1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, // 0x7F
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 0x9F
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 0xBF
    0, 0, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, // 0xDF
    3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3,                                                 // 0xEF
    4, 4, 4, 4, 4, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,                                                 // 0xFF
};
// clang-format on

constexpr std::uint8_t TAG_CONT = 0b1000'0000;
constexpr std::uint8_t TAG_TWO_B = 0b1100'0000;
constexpr std::uint8_t TAG_THREE_B = 0b1110'0000;
constexpr std::uint8_t TAG_FOUR_B = 0b1111'0000;

constexpr char32_t MAX_ONE_B = 0x80;
constexpr char32_t MAX_TWO_B = 0x800;
constexpr char32_t MAX_THREE_B = 0x10000;

auto in_range(std::uint8_t b, std::uint8_t lo, std::uint8_t hi) -> bool {
    return b >= lo && b <= hi;
}

// Second byte bounds exclude overlong forms, surrogates and code points
// above U+10FFFF.
auto sequence_ok(const std::uint8_t* p, std::size_t width) -> bool {
    auto lead = p[0];
    switch (width) {
        case 1:
            return true;
        case 2:
            return in_range(p[1], 0x80, 0xBF);
        case 3: {
            auto lo = std::uint8_t{0x80};
            auto hi = std::uint8_t{0xBF};
            if (lead == 0xE0) lo = 0xA0;
            if (lead == 0xED) hi = 0x9F;
            return in_range(p[1], lo, hi) && in_range(p[2], 0x80, 0xBF);
        }
        case 4: {
            auto lo = std::uint8_t{0x80};
            auto hi = std::uint8_t{0xBF};
            if (lead == 0xF0) lo = 0x90;
            if (lead == 0xF4) hi = 0x8F;
            return in_range(p[1], lo, hi) &&
                   in_range(p[2], 0x80, 0xBF) &&
                   in_range(p[3], 0x80, 0xBF);
        }
        default:
            return false;
    }
}

} // anonymous namespace

auto utf8_char_width(std::uint8_t lead) -> std::size_t {
    return UTF8_CHAR_WIDTH[lead];
}

auto is_scalar_value(char32_t c) -> bool {
    return c < 0xD800 || (c > 0xDFFF && c <= 0x10FFFF);
}

auto encode_utf8(char32_t c) -> utf8_char_t {
    auto out = utf8_char_t{};
    if (!is_scalar_value(c)) {
        return out;
    }
    auto& b = out.bytes;
    if (c < MAX_ONE_B) {
        b[0] = static_cast<std::uint8_t>(c);
        out.size = 1;
    } else if (c < MAX_TWO_B) {
        b[0] = static_cast<std::uint8_t>((c >> 6) & 0x1F) | TAG_TWO_B;
        b[1] = static_cast<std::uint8_t>(c & 0x3F) | TAG_CONT;
        out.size = 2;
    } else if (c < MAX_THREE_B) {
        b[0] = static_cast<std::uint8_t>((c >> 12) & 0x0F) | TAG_THREE_B;
        b[1] = static_cast<std::uint8_t>((c >> 6) & 0x3F) | TAG_CONT;
        b[2] = static_cast<std::uint8_t>(c & 0x3F) | TAG_CONT;
        out.size = 3;
    } else {
        b[0] = static_cast<std::uint8_t>((c >> 18) & 0x07) | TAG_FOUR_B;
        b[1] = static_cast<std::uint8_t>((c >> 12) & 0x3F) | TAG_CONT;
        b[2] = static_cast<std::uint8_t>((c >> 6) & 0x3F) | TAG_CONT;
        b[3] = static_cast<std::uint8_t>(c & 0x3F) | TAG_CONT;
        out.size = 4;
    }
    return out;
}

auto decode_utf8(std::span<const std::uint8_t> seq) -> std::optional<char32_t> {
    if (seq.empty() || utf8_char_width(seq[0]) != seq.size() || !sequence_ok(seq.data(), seq.size())) {
        return std::nullopt;
    }
    switch (seq.size()) {
        case 1:
            return static_cast<char32_t>(seq[0]);
        case 2:
            return (static_cast<char32_t>(seq[0] & 0x1Fu) << 6) | static_cast<char32_t>(seq[1] & 0x3Fu);
        case 3:
            return (static_cast<char32_t>(seq[0] & 0x0Fu) << 12) |
                   (static_cast<char32_t>(seq[1] & 0x3Fu) << 6) |
                   static_cast<char32_t>(seq[2] & 0x3Fu);
        default:
            return (static_cast<char32_t>(seq[0] & 0x07u) << 18) |
                   (static_cast<char32_t>(seq[1] & 0x3Fu) << 12) |
                   (static_cast<char32_t>(seq[2] & 0x3Fu) << 6) |
                   static_cast<char32_t>(seq[3] & 0x3Fu);
    }
}

auto validate_utf8(std::span<const std::uint8_t> bytes) -> utf8_check_t {
    auto i = std::size_t{0};
    while (i < bytes.size()) {
        auto width = utf8_char_width(bytes[i]);
        if (width == 0 || bytes.size() - i < width || !sequence_ok(bytes.data() + i, width)) {
            return {false, i};
        }
        i += width;
    }
    return {true, i};
}

} // namespace embin
