#pragma once

// Encode and decode error taxonomies.

#include <cstddef>
#include <cstdint>
#include <ostream>

namespace embin {

// =============================================================================
// Error kinds
// =============================================================================

enum class encode_errc {
    sink,             // the sink refused a write (see sink_error)
    length_unknown,   // sequence or map without a length when encoding started
    length_overflow,  // count, byte length or variant index wider than its prefix
    invalid_scalar,   // char32_t outside the Unicode scalar values
    invalid_utf8,     // text is not well-formed UTF-8
    invalid_variant,  // enum value outside its variant_count
};

enum class decode_errc {
    source,             // the source could not supply the bytes (see source_error)
    invalid_bool,       // bool byte other than 0x00 / 0x01
    invalid_option,     // Option discriminant other than 0x00 / 0x01
    invalid_utf8,       // bad leading byte or malformed UTF-8 sequence
    invalid_variant,    // enum discriminant outside the variant list
    capacity_exceeded,  // wire count larger than the fixed-capacity target
};

auto to_string(encode_errc kind) -> const char*;
auto to_string(decode_errc kind) -> const char*;

auto operator<<(std::ostream& os, encode_errc kind) -> std::ostream&;
auto operator<<(std::ostream& os, decode_errc kind) -> std::ostream&;

// =============================================================================
// Error values
// =============================================================================

template<typename SinkError>
struct encode_error {
    encode_errc kind = encode_errc::sink;
    SinkError sink_error{};    // valid when kind == encode_errc::sink
    std::size_t length = 0;    // offending count for length_overflow, index for invalid_variant
};

template<typename SourceError>
struct decode_error {
    decode_errc kind = decode_errc::source;
    std::uint8_t byte = 0;      // offending byte, where there is one
    std::size_t position = 0;   // source offset of the failing item
    SourceError source_error{}; // valid when kind == decode_errc::source
};

template<typename E>
auto operator<<(std::ostream& os, const encode_error<E>& e) -> std::ostream& {
    os << "encode error: " << e.kind;
    if (e.kind == encode_errc::sink) {
        if constexpr (requires { os << e.sink_error; }) {
            os << " (" << e.sink_error << ")";
        }
    } else if (e.kind == encode_errc::length_overflow) {
        os << " (" << e.length << ")";
    }
    return os;
}

template<typename E>
auto operator<<(std::ostream& os, const decode_error<E>& e) -> std::ostream& {
    os << "decode error: " << e.kind << " at offset " << e.position;
    if (e.kind == decode_errc::source) {
        if constexpr (requires { os << e.source_error; }) {
            os << " (" << e.source_error << ")";
        }
    } else if (e.kind != decode_errc::capacity_exceeded) {
        os << " (byte 0x" << std::hex << static_cast<unsigned>(e.byte) << std::dec << ")";
    }
    return os;
}

} // namespace embin
