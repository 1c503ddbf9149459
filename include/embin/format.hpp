#pragma once

// Wire format constants for the embin encoding.
//
// Changing any of the length types below is a format-breaking change; the
// encoder and decoder both read them from here.

#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>

#if defined(__SIZEOF_INT128__)
#define EMBIN_HAS_INT128 1
#endif

namespace embin {

// =============================================================================
// Byte order
// =============================================================================

enum class byte_order { big, little };

inline constexpr byte_order network_order = byte_order::big;
inline constexpr byte_order native_order =
    std::endian::native == std::endian::little ? byte_order::little : byte_order::big;

// =============================================================================
// Wire format (length widths, discriminants)
// =============================================================================

namespace wire_format {

using seq_len_t = std::uint16_t;       // sequence element count
using str_len_t = std::uint16_t;       // string length in bytes
using bytes_len_t = std::uint16_t;     // byte string length
using map_len_t = std::uint8_t;        // map pair count
using variant_index_t = std::uint8_t;  // enum discriminant (unit, tuple, struct)

constexpr std::uint8_t BOOL_FALSE = 0x00;
constexpr std::uint8_t BOOL_TRUE = 0x01;

constexpr std::uint8_t OPTION_NONE = 0x00;
constexpr std::uint8_t OPTION_SOME = 0x01;

template<typename L>
constexpr auto max_length() -> std::size_t {
    return std::numeric_limits<L>::max();
}

} // namespace wire_format

// =============================================================================
// Fixed-width integer support
// =============================================================================

#ifdef EMBIN_HAS_INT128
using int128_t = __int128;
using uint128_t = unsigned __int128;
#endif

template<typename T>
struct is_int128 : std::false_type {};

#ifdef EMBIN_HAS_INT128
template<> struct is_int128<int128_t> : std::true_type {};
template<> struct is_int128<uint128_t> : std::true_type {};
#endif

template<typename T>
inline constexpr bool is_int128_v = is_int128<T>::value;

// Integers encoded as raw fixed-width two's complement. char is one raw
// byte; bool and the wide character types have their own shapes.
template<typename T>
concept FixedInteger =
    is_int128_v<T> ||
    (std::is_integral_v<T> &&
     !std::is_same_v<T, bool> &&
     !std::is_same_v<T, char32_t> &&
     !std::is_same_v<T, char16_t> &&
     !std::is_same_v<T, char8_t> &&
     !std::is_same_v<T, wchar_t>);

template<typename T>
struct unsigned_bits {
    using type = std::make_unsigned_t<T>;
};

#ifdef EMBIN_HAS_INT128
template<> struct unsigned_bits<int128_t> { using type = uint128_t; };
template<> struct unsigned_bits<uint128_t> { using type = uint128_t; };
#endif

template<typename T>
using unsigned_bits_t = typename unsigned_bits<T>::type;

// =============================================================================
// Byte order conversion
// =============================================================================

template<typename U>
constexpr void store_bits(U bits, byte_order order, std::uint8_t* out) {
    constexpr auto n = sizeof(U);
    for (std::size_t i = 0; i < n; ++i) {
        auto byte = static_cast<std::uint8_t>(bits >> (8 * i));
        out[order == byte_order::little ? i : n - 1 - i] = byte;
    }
}

template<typename U>
constexpr auto load_bits(const std::uint8_t* in, byte_order order) -> U {
    constexpr auto n = sizeof(U);
    auto bits = U{0};
    for (std::size_t i = 0; i < n; ++i) {
        auto byte = in[order == byte_order::little ? i : n - 1 - i];
        bits |= static_cast<U>(static_cast<U>(byte) << (8 * i));
    }
    return bits;
}

template<FixedInteger T>
constexpr void store_int(T value, byte_order order, std::uint8_t* out) {
    store_bits(static_cast<unsigned_bits_t<T>>(value), order, out);
}

template<FixedInteger T>
constexpr auto load_int(const std::uint8_t* in, byte_order order) -> T {
    return static_cast<T>(load_bits<unsigned_bits_t<T>>(in, order));
}

} // namespace embin
