#include <cassert>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <span>
#include <string_view>
#include <vector>
#include "embin/utf8.hpp"

using namespace embin;

// =============================================================================
// Helpers
// =============================================================================

auto bytes(std::initializer_list<std::uint8_t> init) -> std::vector<std::uint8_t> {
    return std::vector<std::uint8_t>(init);
}

auto decode_one(const std::vector<std::uint8_t>& seq) -> std::optional<char32_t> {
    return decode_utf8(std::span<const std::uint8_t>{seq.data(), seq.size()});
}

// =============================================================================
// Width table
// =============================================================================

void test_width_table() {
    std::cout << "Testing leading-byte width table... ";

    assert(utf8_char_width(0x00) == 1);
    assert(utf8_char_width('a') == 1);
    assert(utf8_char_width(0x7F) == 1);

    // continuation bytes cannot start a sequence
    assert(utf8_char_width(0x80) == 0);
    assert(utf8_char_width(0xBF) == 0);

    // 0xC0 and 0xC1 would only start overlong forms
    assert(utf8_char_width(0xC0) == 0);
    assert(utf8_char_width(0xC1) == 0);
    assert(utf8_char_width(0xC2) == 2);
    assert(utf8_char_width(0xDF) == 2);

    assert(utf8_char_width(0xE0) == 3);
    assert(utf8_char_width(0xEF) == 3);

    assert(utf8_char_width(0xF0) == 4);
    assert(utf8_char_width(0xF4) == 4);
    assert(utf8_char_width(0xF5) == 0);
    assert(utf8_char_width(0xFF) == 0);

    std::cout << "PASSED\n";
}

// =============================================================================
// Encoding
// =============================================================================

void test_encode_widths() {
    std::cout << "Testing scalar encoding widths... ";

    auto a = encode_utf8(U'A');
    assert(a.size == 1);
    assert(a.bytes[0] == 0x41);

    auto e = encode_utf8(U'\u00E9');
    assert(e.size == 2);
    assert(e.bytes[0] == 0xC3 && e.bytes[1] == 0xA9);

    auto euro = encode_utf8(U'\u20AC');
    assert(euro.size == 3);
    assert(euro.bytes[0] == 0xE2 && euro.bytes[1] == 0x82 && euro.bytes[2] == 0xAC);

    auto emoji = encode_utf8(U'\U0001F600');
    assert(emoji.size == 4);
    assert(emoji.bytes[0] == 0xF0 && emoji.bytes[1] == 0x9F);
    assert(emoji.bytes[2] == 0x98 && emoji.bytes[3] == 0x80);

    assert(encode_utf8(U'\U0010FFFF').size == 4);

    std::cout << "PASSED\n";
}

void test_encode_rejects_non_scalars() {
    std::cout << "Testing non-scalar code points are rejected... ";

    assert(!is_scalar_value(0xD800));
    assert(!is_scalar_value(0xDFFF));
    assert(!is_scalar_value(0x110000));
    assert(is_scalar_value(0xD7FF));
    assert(is_scalar_value(0xE000));

    assert(encode_utf8(static_cast<char32_t>(0xD800)).size == 0);
    assert(encode_utf8(static_cast<char32_t>(0x110000)).size == 0);

    std::cout << "PASSED\n";
}

// =============================================================================
// Decoding
// =============================================================================

void test_decode_sequences() {
    std::cout << "Testing single sequence decoding... ";

    assert(decode_one(bytes({0x41})) == U'A');
    assert(decode_one(bytes({0xC3, 0xA9})) == U'\u00E9');
    assert(decode_one(bytes({0xE2, 0x82, 0xAC})) == U'\u20AC');
    assert(decode_one(bytes({0xF0, 0x9F, 0x98, 0x80})) == U'\U0001F600');

    // bad continuation
    assert(!decode_one(bytes({0xC3, 0x41})));
    // overlong three-byte form of '/'
    assert(!decode_one(bytes({0xE0, 0x80, 0xAF})));
    // encoded surrogate U+D800
    assert(!decode_one(bytes({0xED, 0xA0, 0x80})));
    // above U+10FFFF
    assert(!decode_one(bytes({0xF4, 0x90, 0x80, 0x80})));

    std::cout << "PASSED\n";
}

void test_validate() {
    std::cout << "Testing string validation... ";

    auto ok = validate_utf8(std::string_view{"caf\xC3\xA9 \xE2\x82\xAC"});
    assert(ok.valid);
    assert(ok.valid_up_to == 9);

    assert(validate_utf8(std::string_view{}).valid);

    auto truncated = validate_utf8(std::string_view{"ab\xE2\x82"});
    assert(!truncated.valid);
    assert(truncated.valid_up_to == 2);

    auto stray = bytes({'x', 'y', 0x80, 'z'});
    auto check = validate_utf8(std::span<const std::uint8_t>{stray.data(), stray.size()});
    assert(!check.valid);
    assert(check.valid_up_to == 2);

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Width Table ===\n\n";
    test_width_table();

    std::cout << "\n=== Encoding ===\n\n";
    test_encode_widths();
    test_encode_rejects_non_scalars();

    std::cout << "\n=== Decoding ===\n\n";
    test_decode_sequences();
    test_validate();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
