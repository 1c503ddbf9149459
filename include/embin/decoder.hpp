#pragma once

// Shape-driven decoder. Nothing on the wire says what comes next; the caller's
// static type decides which primitive to read. Strings and byte strings are
// returned as views into the source's buffer.

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>

#include "config.hpp"
#include "error.hpp"
#include "format.hpp"
#include "result.hpp"
#include "source.hpp"
#include "trace.hpp"
#include "utf8.hpp"

namespace embin {

template<typename Decoder>
class seq_access_t;

template<typename Decoder>
class map_access_t;

template<ByteSource Source>
class decoder_t {
public:
    using source_type = Source;
    using error_type = decode_error<typename Source::error_type>;
    using status = status_t<error_type>;

    template<typename T>
    using result = result_t<T, error_type>;

    static constexpr auto unbounded = std::numeric_limits<std::size_t>::max();

    explicit decoder_t(Source& source, const options_t& options = {})
        : source_(source), order_(options.order), trace_(options.log) {}

    decoder_t(Source& source, byte_order order) : source_(source), order_(order), trace_(nullptr) {}

    auto order() const -> byte_order { return order_; }

    // Bytes consumed through this decoder
    auto position() const -> std::size_t { return consumed_; }

    // =========================================================================
    // Scalars
    // =========================================================================

    auto read_bool() -> result<bool> {
        auto at = consumed_;
        auto byte = take_byte();
        if (!byte) return fail(std::move(byte).error());
        if (*byte == wire_format::BOOL_TRUE) return trace_value("bool ", true);
        if (*byte == wire_format::BOOL_FALSE) return trace_value("bool ", false);
        return reject(decode_errc::invalid_bool, *byte, at);
    }

    template<FixedInteger T>
    auto read_int() -> result<T> {
        auto value = take_int<T>();
        if (!value) return fail(std::move(value).error());
        trace_.log(sizeof(T) * 8, "-bit int ", *value);
        return *value;
    }

    auto read_f32() -> result<float> {
        auto bits = take_int<std::uint32_t>();
        if (!bits) return fail(std::move(bits).error());
        return trace_value("f32 ", std::bit_cast<float>(*bits));
    }

    auto read_f64() -> result<double> {
        auto bits = take_int<std::uint64_t>();
        if (!bits) return fail(std::move(bits).error());
        return trace_value("f64 ", std::bit_cast<double>(*bits));
    }

    // The leading byte gives the width, the rest of the sequence is then
    // read in one piece and validated as a whole
    auto read_char() -> result<char32_t> {
        auto at = consumed_;
        auto lead = take_byte();
        if (!lead) return fail(std::move(lead).error());

        auto width = utf8_char_width(*lead);
        if (width == 0) {
            return reject(decode_errc::invalid_utf8, *lead, at);
        }
        auto buf = std::array<std::uint8_t, 4>{*lead};
        if (width > 1) {
            auto rest = take(width - 1);
            if (!rest) return fail(std::move(rest).error());
            std::copy(rest->begin(), rest->end(), buf.begin() + 1);
        }
        auto c = decode_utf8(std::span<const std::uint8_t>{buf.data(), width});
        if (!c) {
            return reject(decode_errc::invalid_utf8, *lead, at);
        }
        return trace_value("char ", *c);
    }

    // =========================================================================
    // Length-prefixed payloads (borrowed)
    // =========================================================================

    auto read_str() -> result<std::string_view> {
        auto len = take_length<wire_format::str_len_t>();
        if (!len) return fail(std::move(len).error());
        auto at = consumed_;
        auto bytes = take(*len);
        if (!bytes) return fail(std::move(bytes).error());

        auto check = validate_utf8(*bytes);
        if (!check.valid) {
            return reject(decode_errc::invalid_utf8, (*bytes)[check.valid_up_to], at + check.valid_up_to);
        }
        trace_.log("str len ", *len);
        return std::string_view{reinterpret_cast<const char*>(bytes->data()), bytes->size()};
    }

    auto read_bytes() -> result<std::span<const std::uint8_t>> {
        auto len = take_length<wire_format::bytes_len_t>();
        if (!len) return fail(std::move(len).error());
        auto bytes = take(*len);
        if (!bytes) return fail(std::move(bytes).error());
        trace_.log("bytes len ", *len);
        return *bytes;
    }

    // =========================================================================
    // Option and enum discriminants
    // =========================================================================

    // true when a value follows
    auto read_option() -> result<bool> {
        auto at = consumed_;
        auto tag = take_byte();
        if (!tag) return fail(std::move(tag).error());
        if (*tag == wire_format::OPTION_SOME) {
            trace_.log("some");
            return true;
        }
        if (*tag == wire_format::OPTION_NONE) {
            trace_.log("none");
            return false;
        }
        return reject(decode_errc::invalid_option, *tag, at);
    }

    auto read_variant_index(std::size_t variant_count) -> result<std::size_t> {
        auto at = consumed_;
        auto index = take_int<wire_format::variant_index_t>();
        if (!index) return fail(std::move(index).error());
        if (*index >= variant_count) {
            return reject(decode_errc::invalid_variant, static_cast<std::uint8_t>(*index), at);
        }
        trace_.log("variant ", static_cast<std::size_t>(*index));
        return static_cast<std::size_t>(*index);
    }

    // =========================================================================
    // Compound scopes
    // =========================================================================

    // Reads the element count, then hands out elements as a tuple of that
    // dynamic arity. Fails before reading any element if the count exceeds
    // capacity.
    auto begin_seq(std::size_t capacity = unbounded) -> result<seq_access_t<decoder_t>> {
        auto at = consumed_;
        auto len = take_length<wire_format::seq_len_t>();
        if (!len) return fail(std::move(len).error());
        if (*len > capacity) {
            return reject(decode_errc::capacity_exceeded, 0, at);
        }
        trace_.log("begin seq ", *len);
        return begin_tuple(*len);
    }

    auto begin_tuple(std::size_t arity) -> seq_access_t<decoder_t> {
        trace_.push();
        return seq_access_t<decoder_t>{*this, arity};
    }

    auto begin_map(std::size_t capacity = unbounded) -> result<map_access_t<decoder_t>> {
        auto at = consumed_;
        auto len = take_length<wire_format::map_len_t>();
        if (!len) return fail(std::move(len).error());
        if (*len > capacity) {
            return reject(decode_errc::capacity_exceeded, 0, at);
        }
        trace_.log("begin map ", *len);
        trace_.push();
        return map_access_t<decoder_t>{*this, *len};
    }

    void begin_struct(std::size_t field_count) {
        trace_.log("begin struct ", field_count);
        trace_.push();
    }

    void begin_named(const char* name) { trace_.log(".", name); }

    // Closes any scope opened above
    void end_scope() { trace_.pop(); }

    auto reject(decode_errc kind, std::uint8_t byte, std::size_t at) -> failure_t<error_type> {
        trace_.log("error: ", kind, " at ", at);
        auto e = error_type{};
        e.kind = kind;
        e.byte = byte;
        e.position = at;
        return fail(std::move(e));
    }

private:
    Source& source_;
    byte_order order_;
    trace_t trace_;
    std::size_t consumed_ = 0;

    template<typename T>
    auto trace_value(const char* what, T value) -> T {
        trace_.log(what, value);
        return value;
    }

    auto source_failure(typename Source::error_type cause, std::size_t at) -> failure_t<error_type> {
        trace_.log("error: ", decode_errc::source, " at ", at);
        auto e = error_type{};
        e.kind = decode_errc::source;
        e.position = at;
        e.source_error = std::move(cause);
        return fail(std::move(e));
    }

    auto take(std::size_t n) -> result<std::span<const std::uint8_t>> {
        auto bytes = source_.read_exact(n);
        if (!bytes) {
            return source_failure(std::move(bytes).error(), consumed_);
        }
        consumed_ += n;
        return *bytes;
    }

    auto take_byte() -> result<std::uint8_t> {
        auto byte = embin::read_byte(source_);
        if (!byte) {
            return source_failure(std::move(byte).error(), consumed_);
        }
        ++consumed_;
        return *byte;
    }

    template<FixedInteger T>
    auto take_int() -> result<T> {
        auto bytes = take(sizeof(T));
        if (!bytes) return fail(std::move(bytes).error());
        return load_int<T>(bytes->data(), order_);
    }

    template<typename L>
    auto take_length() -> result<std::size_t> {
        auto len = take_int<L>();
        if (!len) return fail(std::move(len).error());
        return static_cast<std::size_t>(*len);
    }
};

// =============================================================================
// seq_access_t - element cursor for sequences, tuples and arrays
// =============================================================================

template<typename Decoder>
class seq_access_t {
public:
    seq_access_t(Decoder& decoder, std::size_t count) : dec(&decoder), left(count) {}

    auto remaining() const -> std::size_t { return left; }

    // Decodes the next element into out; false once the count is used up,
    // whatever is left in the buffer
    template<typename T>
    auto next(T& out) -> typename Decoder::template result<bool> {
        if (left == 0) {
            return false;
        }
        EMBIN_TRY(read(*dec, out));
        --left;
        return true;
    }

    void end() { dec->end_scope(); }

private:
    Decoder* dec;
    std::size_t left;
};

// =============================================================================
// map_access_t - key/value cursor for maps
// =============================================================================

template<typename Decoder>
class map_access_t {
public:
    map_access_t(Decoder& decoder, std::size_t count) : dec(&decoder), left(count) {}

    auto remaining() const -> std::size_t { return left; }

    template<typename K, typename V>
    auto next(K& key, V& value) -> typename Decoder::template result<bool> {
        if (left == 0) {
            return false;
        }
        EMBIN_TRY(read(*dec, key));
        EMBIN_TRY(read(*dec, value));
        --left;
        return true;
    }

    void end() { dec->end_scope(); }

private:
    Decoder* dec;
    std::size_t left;
};

template<ByteSource Source>
using decode_status_t = status_t<decode_error<typename Source::error_type>>;

} // namespace embin
