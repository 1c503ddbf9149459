#pragma once

// Value model: how each C++ shape is written to and read from the wire.
//
// Every shape is an overload of write(encoder, value) and
// read(decoder, value). Composite overloads call back into write/read for
// their members, so a user type joins in either by providing ADL fields()
// (encoded as a struct) or by adding its own write/read overloads in its
// namespace.

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ranges>
#include <span>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "config.hpp"
#include "containers.hpp"
#include "decoder.hpp"
#include "encoder.hpp"

namespace embin {

// ============================================================================
// Field helper - returns std::pair<const char*, T&>
// ============================================================================

template<typename T>
constexpr auto field(const char* name, T& value) {
    return std::pair<const char*, T&>{name, value};
}

template<typename T>
constexpr auto field(const char* name, const T& value) {
    return std::pair<const char*, const T&>{name, value};
}

// ============================================================================
// Shape concepts
// ============================================================================

// ADL free function fields(t) returning a tuple of field(name, member)
template<typename T>
concept HasFields = requires(T& t) {
    { fields(t) };
};

template<typename T>
concept HasConstFields = requires(const T& t) {
    { fields(t) };
};

// C++ enums encoded as a bare variant index; variant_count bounds decoding
template<typename E>
concept UnitEnum = std::is_enum_v<E> && requires {
    { variant_count(std::type_identity<E>{}) } -> std::convertible_to<std::size_t>;
};

template<typename T>
concept Scalar =
    std::same_as<T, bool> ||
    FixedInteger<T> ||
    std::same_as<T, float> ||
    std::same_as<T, double> ||
    std::same_as<T, char32_t>;

template<typename T>
concept StringLike = !Scalar<T> && std::is_convertible_v<const T&, std::string_view>;

template<typename T>
concept ByteString = std::same_as<T, std::span<const std::uint8_t>>;

template<typename T>
struct is_tuple_like : std::false_type {};

template<typename... Ts>
struct is_tuple_like<std::tuple<Ts...>> : std::true_type {};

template<typename A, typename B>
struct is_tuple_like<std::pair<A, B>> : std::true_type {};

template<typename T, std::size_t N>
struct is_tuple_like<std::array<T, N>> : std::true_type {};

template<typename T>
concept TupleLike = is_tuple_like<T>::value;

template<typename T>
concept MapLike = std::ranges::input_range<const T> && requires {
    typename T::key_type;
    typename T::mapped_type;
};

template<typename T>
concept Sequence =
    std::ranges::input_range<const T> &&
    !StringLike<T> &&
    !ByteString<T> &&
    !MapLike<T> &&
    !TupleLike<T> &&
    !HasConstFields<T>;

// ============================================================================
// Write declarations
// ============================================================================

template<typename Sink, typename T>
    requires Scalar<T>
auto write(encoder_t<Sink>& enc, const T& value) -> encode_status_t<Sink>;

template<typename Sink, typename T>
    requires StringLike<T>
auto write(encoder_t<Sink>& enc, const T& value) -> encode_status_t<Sink>;

template<typename Sink>
auto write(encoder_t<Sink>& enc, const std::span<const std::uint8_t>& value) -> encode_status_t<Sink>;

template<typename Sink, typename T>
auto write(encoder_t<Sink>& enc, const std::optional<T>& value) -> encode_status_t<Sink>;

template<typename Sink>
auto write(encoder_t<Sink>& enc, const std::monostate& value) -> encode_status_t<Sink>;

template<typename Sink, typename... Ts>
auto write(encoder_t<Sink>& enc, const std::tuple<Ts...>& value) -> encode_status_t<Sink>;

template<typename Sink, typename A, typename B>
auto write(encoder_t<Sink>& enc, const std::pair<A, B>& value) -> encode_status_t<Sink>;

template<typename Sink, typename T, std::size_t N>
auto write(encoder_t<Sink>& enc, const std::array<T, N>& value) -> encode_status_t<Sink>;

template<typename Sink, typename T>
    requires Sequence<T>
auto write(encoder_t<Sink>& enc, const T& value) -> encode_status_t<Sink>;

template<typename Sink, typename T>
    requires MapLike<T>
auto write(encoder_t<Sink>& enc, const T& value) -> encode_status_t<Sink>;

template<typename Sink, typename T>
    requires HasConstFields<T>
auto write(encoder_t<Sink>& enc, const T& value) -> encode_status_t<Sink>;

template<typename Sink, typename... Ts>
auto write(encoder_t<Sink>& enc, const std::variant<Ts...>& value) -> encode_status_t<Sink>;

template<typename Sink, typename E>
    requires UnitEnum<E>
auto write(encoder_t<Sink>& enc, const E& value) -> encode_status_t<Sink>;

// ============================================================================
// Read declarations
// ============================================================================

template<typename Source, typename T>
    requires Scalar<T>
auto read(decoder_t<Source>& dec, T& value) -> decode_status_t<Source>;

template<typename Source>
auto read(decoder_t<Source>& dec, std::string_view& value) -> decode_status_t<Source>;

template<typename Source>
auto read(decoder_t<Source>& dec, std::span<const std::uint8_t>& value) -> decode_status_t<Source>;

template<typename Source, typename T>
auto read(decoder_t<Source>& dec, std::optional<T>& value) -> decode_status_t<Source>;

template<typename Source>
auto read(decoder_t<Source>& dec, std::monostate& value) -> decode_status_t<Source>;

template<typename Source, typename... Ts>
auto read(decoder_t<Source>& dec, std::tuple<Ts...>& value) -> decode_status_t<Source>;

template<typename Source, typename A, typename B>
auto read(decoder_t<Source>& dec, std::pair<A, B>& value) -> decode_status_t<Source>;

template<typename Source, typename T, std::size_t N>
auto read(decoder_t<Source>& dec, std::array<T, N>& value) -> decode_status_t<Source>;

template<typename Source, typename T, std::size_t N>
auto read(decoder_t<Source>& dec, inline_vec_t<T, N>& value) -> decode_status_t<Source>;

template<typename Source, typename K, typename V, std::size_t N>
auto read(decoder_t<Source>& dec, inline_map_t<K, V, N>& value) -> decode_status_t<Source>;

template<typename Source, typename T>
    requires HasFields<T>
auto read(decoder_t<Source>& dec, T& value) -> decode_status_t<Source>;

template<typename Source, typename... Ts>
auto read(decoder_t<Source>& dec, std::variant<Ts...>& value) -> decode_status_t<Source>;

template<typename Source, typename E>
    requires UnitEnum<E>
auto read(decoder_t<Source>& dec, E& value) -> decode_status_t<Source>;

// ============================================================================
// Write implementations
// ============================================================================

// bool, integers, floats, char32_t
template<typename Sink, typename T>
    requires Scalar<T>
auto write(encoder_t<Sink>& enc, const T& value) -> encode_status_t<Sink> {
    if constexpr (std::is_same_v<T, bool>) {
        return enc.write_bool(value);
    } else if constexpr (std::is_same_v<T, float>) {
        return enc.write_f32(value);
    } else if constexpr (std::is_same_v<T, double>) {
        return enc.write_f64(value);
    } else if constexpr (std::is_same_v<T, char32_t>) {
        return enc.write_char(value);
    } else {
        return enc.write_int(value);
    }
}

// std::string_view, std::string, const char*
template<typename Sink, typename T>
    requires StringLike<T>
auto write(encoder_t<Sink>& enc, const T& value) -> encode_status_t<Sink> {
    return enc.write_str(std::string_view{value});
}

template<typename Sink>
auto write(encoder_t<Sink>& enc, const std::span<const std::uint8_t>& value) -> encode_status_t<Sink> {
    return enc.write_bytes(value);
}

template<typename Sink, typename T>
auto write(encoder_t<Sink>& enc, const std::optional<T>& value) -> encode_status_t<Sink> {
    if (!value) {
        return enc.write_none();
    }
    EMBIN_TRY(enc.begin_some());
    return write(enc, *value);
}

template<typename Sink>
auto write(encoder_t<Sink>& enc, const std::monostate&) -> encode_status_t<Sink> {
    return enc.write_unit();
}

template<typename Sink, typename... Ts>
auto write(encoder_t<Sink>& enc, const std::tuple<Ts...>& value) -> encode_status_t<Sink> {
    EMBIN_TRY(enc.begin_tuple(sizeof...(Ts)));
    auto st = encode_status_t<Sink>{};
    std::apply([&](const auto&... elems) {
        ((st = write(enc, elems), static_cast<bool>(st)) && ...);
    }, value);
    enc.end_tuple();
    return st;
}

template<typename Sink, typename A, typename B>
auto write(encoder_t<Sink>& enc, const std::pair<A, B>& value) -> encode_status_t<Sink> {
    EMBIN_TRY(enc.begin_tuple(2));
    auto st = write(enc, value.first);
    if (st) {
        st = write(enc, value.second);
    }
    enc.end_tuple();
    return st;
}

// Fixed-size arrays are tuples: no length prefix
template<typename Sink, typename T, std::size_t N>
auto write(encoder_t<Sink>& enc, const std::array<T, N>& value) -> encode_status_t<Sink> {
    EMBIN_TRY(enc.begin_tuple(N));
    for (const auto& elem : value) {
        EMBIN_TRY(write(enc, elem));
    }
    enc.end_tuple();
    return {};
}

// Any other range; the element count must be known before the first element
template<typename Sink, typename T>
    requires Sequence<T>
auto write(encoder_t<Sink>& enc, const T& value) -> encode_status_t<Sink> {
    auto len = std::optional<std::size_t>{};
    if constexpr (std::ranges::sized_range<const T>) {
        len = static_cast<std::size_t>(std::ranges::size(value));
    }
    EMBIN_TRY(enc.begin_seq(len));
    for (const auto& elem : value) {
        EMBIN_TRY(write(enc, elem));
    }
    enc.end_seq();
    return {};
}

// Pairs in iteration order
template<typename Sink, typename T>
    requires MapLike<T>
auto write(encoder_t<Sink>& enc, const T& value) -> encode_status_t<Sink> {
    auto len = std::optional<std::size_t>{};
    if constexpr (std::ranges::sized_range<const T>) {
        len = static_cast<std::size_t>(std::ranges::size(value));
    }
    EMBIN_TRY(enc.begin_map(len));
    for (const auto& [key, val] : value) {
        EMBIN_TRY(write(enc, key));
        EMBIN_TRY(write(enc, val));
    }
    enc.end_map();
    return {};
}

// Compound types with fields(): positional, names stay off the wire
template<typename Sink, typename T>
    requires HasConstFields<T>
auto write(encoder_t<Sink>& enc, const T& value) -> encode_status_t<Sink> {
    auto members = fields(value);
    EMBIN_TRY(enc.begin_struct(std::tuple_size_v<decltype(members)>));
    auto st = encode_status_t<Sink>{};
    std::apply([&](const auto&... f) {
        ((enc.begin_named(f.first), st = write(enc, f.second), static_cast<bool>(st)) && ...);
    }, members);
    enc.end_struct();
    return st;
}

// Tagged union: variant index, then the alternative's own encoding
template<typename Sink, typename... Ts>
auto write(encoder_t<Sink>& enc, const std::variant<Ts...>& value) -> encode_status_t<Sink> {
    static_assert(sizeof...(Ts) <= wire_format::max_length<wire_format::variant_index_t>() + 1,
                  "too many variants for the discriminant width");
    EMBIN_TRY(enc.write_variant_index(value.index()));
    return std::visit([&enc](const auto& alt) -> encode_status_t<Sink> {
        return write(enc, alt);
    }, value);
}

template<typename Sink, typename E>
    requires UnitEnum<E>
auto write(encoder_t<Sink>& enc, const E& value) -> encode_status_t<Sink> {
    auto index = static_cast<std::underlying_type_t<E>>(value);
    if constexpr (std::is_signed_v<std::underlying_type_t<E>>) {
        if (index < 0) {
            return enc.reject(encode_errc::invalid_variant);
        }
    }
    auto n = static_cast<std::size_t>(index);
    if (n >= static_cast<std::size_t>(variant_count(std::type_identity<E>{}))) {
        return enc.reject(encode_errc::invalid_variant, n);
    }
    return enc.write_variant_index(n);
}

// ============================================================================
// Read implementations
// ============================================================================

namespace detail {

// Pull one element through a tuple/sequence cursor, keeping the first error
template<typename Access, typename Status, typename T>
auto next_element(Access& access, Status& st, T& elem) -> bool {
    auto more = access.next(elem);
    if (!more) {
        st = fail(std::move(more).error());
        return false;
    }
    return true;
}

} // namespace detail

template<typename Source, typename T>
    requires Scalar<T>
auto read(decoder_t<Source>& dec, T& value) -> decode_status_t<Source> {
    auto r = [&dec] {
        if constexpr (std::is_same_v<T, bool>) {
            return dec.read_bool();
        } else if constexpr (std::is_same_v<T, float>) {
            return dec.read_f32();
        } else if constexpr (std::is_same_v<T, double>) {
            return dec.read_f64();
        } else if constexpr (std::is_same_v<T, char32_t>) {
            return dec.read_char();
        } else {
            return dec.template read_int<T>();
        }
    }();
    if (!r) {
        return fail(std::move(r).error());
    }
    value = *r;
    return {};
}

// Borrowed from the source buffer
template<typename Source>
auto read(decoder_t<Source>& dec, std::string_view& value) -> decode_status_t<Source> {
    auto r = dec.read_str();
    if (!r) {
        return fail(std::move(r).error());
    }
    value = *r;
    return {};
}

// Borrowed from the source buffer
template<typename Source>
auto read(decoder_t<Source>& dec, std::span<const std::uint8_t>& value) -> decode_status_t<Source> {
    auto r = dec.read_bytes();
    if (!r) {
        return fail(std::move(r).error());
    }
    value = *r;
    return {};
}

template<typename Source, typename T>
auto read(decoder_t<Source>& dec, std::optional<T>& value) -> decode_status_t<Source> {
    auto some = dec.read_option();
    if (!some) {
        return fail(std::move(some).error());
    }
    if (!*some) {
        value.reset();
        return {};
    }
    value.emplace();
    return read(dec, *value);
}

template<typename Source>
auto read(decoder_t<Source>&, std::monostate&) -> decode_status_t<Source> {
    return {};
}

template<typename Source, typename... Ts>
auto read(decoder_t<Source>& dec, std::tuple<Ts...>& value) -> decode_status_t<Source> {
    auto access = dec.begin_tuple(sizeof...(Ts));
    auto st = decode_status_t<Source>{};
    std::apply([&](auto&... elems) {
        (detail::next_element(access, st, elems) && ...);
    }, value);
    access.end();
    return st;
}

template<typename Source, typename A, typename B>
auto read(decoder_t<Source>& dec, std::pair<A, B>& value) -> decode_status_t<Source> {
    auto access = dec.begin_tuple(2);
    auto st = decode_status_t<Source>{};
    if (detail::next_element(access, st, value.first)) {
        detail::next_element(access, st, value.second);
    }
    access.end();
    return st;
}

template<typename Source, typename T, std::size_t N>
auto read(decoder_t<Source>& dec, std::array<T, N>& value) -> decode_status_t<Source> {
    auto access = dec.begin_tuple(N);
    auto st = decode_status_t<Source>{};
    for (auto& elem : value) {
        if (!detail::next_element(access, st, elem)) break;
    }
    access.end();
    return st;
}

template<typename Source, typename T, std::size_t N>
auto read(decoder_t<Source>& dec, inline_vec_t<T, N>& value) -> decode_status_t<Source> {
    auto access = dec.begin_seq(N);
    if (!access) {
        return fail(std::move(access).error());
    }
    value.clear();
    while (true) {
        auto elem = T{};
        auto more = access->next(elem);
        if (!more) {
            return fail(std::move(more).error());
        }
        if (!*more) {
            break;
        }
        if (!value.push_back(std::move(elem))) {
            return dec.reject(decode_errc::capacity_exceeded, 0, dec.position());
        }
    }
    access->end();
    return {};
}

template<typename Source, typename K, typename V, std::size_t N>
auto read(decoder_t<Source>& dec, inline_map_t<K, V, N>& value) -> decode_status_t<Source> {
    auto access = dec.begin_map(N);
    if (!access) {
        return fail(std::move(access).error());
    }
    value.clear();
    while (true) {
        auto key = K{};
        auto val = V{};
        auto more = access->next(key, val);
        if (!more) {
            return fail(std::move(more).error());
        }
        if (!*more) {
            break;
        }
        if (!value.insert_or_assign(std::move(key), std::move(val))) {
            return dec.reject(decode_errc::capacity_exceeded, 0, dec.position());
        }
    }
    access->end();
    return {};
}

// Compound types with fields(), filled in declaration order
template<typename Source, typename T>
    requires HasFields<T>
auto read(decoder_t<Source>& dec, T& value) -> decode_status_t<Source> {
    auto members = fields(value);
    dec.begin_struct(std::tuple_size_v<decltype(members)>);
    auto st = decode_status_t<Source>{};
    std::apply([&](auto&... f) {
        ((dec.begin_named(f.first), st = read(dec, f.second), static_cast<bool>(st)) && ...);
    }, members);
    dec.end_scope();
    return st;
}

namespace detail {

template<typename Source, typename Variant, std::size_t I = 0>
auto read_variant_by_index(decoder_t<Source>& dec, Variant& value, std::size_t index) -> decode_status_t<Source> {
    if constexpr (I >= std::variant_size_v<Variant>) {
        return dec.reject(decode_errc::invalid_variant, static_cast<std::uint8_t>(index), dec.position());
    } else {
        if (I == index) {
            return read(dec, value.template emplace<I>());
        }
        return read_variant_by_index<Source, Variant, I + 1>(dec, value, index);
    }
}

} // namespace detail

template<typename Source, typename... Ts>
auto read(decoder_t<Source>& dec, std::variant<Ts...>& value) -> decode_status_t<Source> {
    auto index = dec.read_variant_index(sizeof...(Ts));
    if (!index) {
        return fail(std::move(index).error());
    }
    return detail::read_variant_by_index(dec, value, *index);
}

template<typename Source, typename E>
    requires UnitEnum<E>
auto read(decoder_t<Source>& dec, E& value) -> decode_status_t<Source> {
    auto index = dec.read_variant_index(variant_count(std::type_identity<E>{}));
    if (!index) {
        return fail(std::move(index).error());
    }
    value = static_cast<E>(*index);
    return {};
}

// ============================================================================
// Entry points
// ============================================================================

/**
 * Encode a value into a sink, then flush the sink.
 *
 * The byte order is not recorded on the wire; the decoding side must use
 * the same one.
 */
template<typename T, ByteSink Sink>
auto encode(const T& value, Sink& sink, const options_t& options) -> encode_status_t<Sink> {
    auto enc = encoder_t<Sink>{sink, options};
    EMBIN_TRY(write(enc, value));
    return enc.flush();
}

template<typename T, ByteSink Sink>
auto encode(const T& value, Sink& sink, byte_order order = byte_order::big) -> encode_status_t<Sink> {
    return encode(value, sink, options_t{order, nullptr});
}

/**
 * Decode a T from a source.
 *
 * Strings and byte strings inside the result point into the buffer behind
 * the source; that buffer must outlive the result. Bytes after the value
 * are left unread.
 */
template<typename T, ByteSource Source>
auto decode(Source& source, const options_t& options) -> result_t<T, decode_error<typename Source::error_type>> {
    auto dec = decoder_t<Source>{source, options};
    auto value = T{};
    EMBIN_TRY(read(dec, value));
    return value;
}

template<typename T, ByteSource Source>
auto decode(Source& source, byte_order order = byte_order::big) -> result_t<T, decode_error<typename Source::error_type>> {
    return decode<T>(source, options_t{order, nullptr});
}

} // namespace embin
