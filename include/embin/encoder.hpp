#pragma once

// Streaming encoder: one primitive per wire shape, written straight to a
// ByteSink. Compound scopes write their prefix (if any) when opened and
// nothing when closed, so every count must be known up front.

#include <bit>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "config.hpp"
#include "error.hpp"
#include "format.hpp"
#include "result.hpp"
#include "sink.hpp"
#include "trace.hpp"
#include "utf8.hpp"

namespace embin {

template<ByteSink Sink>
class encoder_t {
public:
    using sink_type = Sink;
    using error_type = encode_error<typename Sink::error_type>;
    using status = status_t<error_type>;

    explicit encoder_t(Sink& sink, const options_t& options = {})
        : sink_(sink), order_(options.order), trace_(options.log) {}

    encoder_t(Sink& sink, byte_order order) : sink_(sink), order_(order), trace_(nullptr) {}

    auto order() const -> byte_order { return order_; }

    // Bytes written through this encoder
    auto position() const -> std::size_t { return written_; }

    // =========================================================================
    // Scalars
    // =========================================================================

    auto write_bool(bool value) -> status {
        trace_.log("bool ", value);
        return put_byte(value ? wire_format::BOOL_TRUE : wire_format::BOOL_FALSE);
    }

    template<FixedInteger T>
    auto write_int(T value) -> status {
        trace_.log(sizeof(T) * 8, "-bit int ", value);
        return put_int(value);
    }

    auto write_f32(float value) -> status {
        trace_.log("f32 ", value);
        return put_int(std::bit_cast<std::uint32_t>(value));
    }

    auto write_f64(double value) -> status {
        trace_.log("f64 ", value);
        return put_int(std::bit_cast<std::uint64_t>(value));
    }

    auto write_char(char32_t value) -> status {
        trace_.log("char ", value);
        auto encoded = encode_utf8(value);
        if (encoded.size == 0) {
            return reject(encode_errc::invalid_scalar, static_cast<std::size_t>(value));
        }
        return put(encoded.as_span());
    }

    // =========================================================================
    // Length-prefixed payloads
    // =========================================================================

    auto write_str(std::string_view value) -> status {
        trace_.log("str len ", value.size());
        if (!validate_utf8(value).valid) {
            return reject(encode_errc::invalid_utf8);
        }
        EMBIN_TRY(put_length<wire_format::str_len_t>(value.size()));
        return put({reinterpret_cast<const std::uint8_t*>(value.data()), value.size()});
    }

    auto write_bytes(std::span<const std::uint8_t> value) -> status {
        trace_.log("bytes len ", value.size());
        EMBIN_TRY(put_length<wire_format::bytes_len_t>(value.size()));
        return put(value);
    }

    // =========================================================================
    // Option and unit
    // =========================================================================

    auto write_none() -> status {
        trace_.log("none");
        return put_byte(wire_format::OPTION_NONE);
    }

    // Followed by exactly one encoded value
    auto begin_some() -> status {
        trace_.log("some");
        return put_byte(wire_format::OPTION_SOME);
    }

    auto write_unit() -> status {
        trace_.log("unit");
        return {};
    }

    // =========================================================================
    // Compound scopes
    // =========================================================================

    auto begin_seq(std::optional<std::size_t> len) -> status {
        if (!len) {
            return reject(encode_errc::length_unknown);
        }
        trace_.log("begin seq ", *len);
        EMBIN_TRY(put_length<wire_format::seq_len_t>(*len));
        trace_.push();
        return {};
    }

    void end_seq() { trace_.pop(); }

    auto begin_tuple(std::size_t arity) -> status {
        trace_.log("begin tuple ", arity);
        trace_.push();
        return {};
    }

    void end_tuple() { trace_.pop(); }

    auto begin_struct(std::size_t field_count) -> status {
        trace_.log("begin struct ", field_count);
        trace_.push();
        return {};
    }

    // Names the next struct field in the trace; never written to the wire
    void begin_named(const char* name) { trace_.log(".", name); }

    void end_struct() { trace_.pop(); }

    auto begin_map(std::optional<std::size_t> len) -> status {
        if (!len) {
            return reject(encode_errc::length_unknown);
        }
        trace_.log("begin map ", *len);
        EMBIN_TRY(put_length<wire_format::map_len_t>(*len));
        trace_.push();
        return {};
    }

    void end_map() { trace_.pop(); }

    // Enum discriminant; the variant payload (if any) follows
    auto write_variant_index(std::size_t index) -> status {
        trace_.log("variant ", index);
        return put_length<wire_format::variant_index_t>(index);
    }

    auto flush() -> status {
        if (auto st = embin::flush(sink_); !st) {
            return sink_failure(std::move(st).error());
        }
        return {};
    }

    auto reject(encode_errc kind, std::size_t length = 0) -> failure_t<error_type> {
        trace_.log("error: ", kind);
        auto e = error_type{};
        e.kind = kind;
        e.length = length;
        return fail(std::move(e));
    }

private:
    Sink& sink_;
    byte_order order_;
    trace_t trace_;
    std::size_t written_ = 0;

    auto sink_failure(typename Sink::error_type cause) -> failure_t<error_type> {
        trace_.log("error: ", encode_errc::sink);
        auto e = error_type{};
        e.kind = encode_errc::sink;
        e.sink_error = std::move(cause);
        return fail(std::move(e));
    }

    auto put(std::span<const std::uint8_t> bytes) -> status {
        if (auto st = embin::write_slice(sink_, bytes); !st) {
            return sink_failure(std::move(st).error());
        }
        written_ += bytes.size();
        return {};
    }

    auto put_byte(std::uint8_t value) -> status {
        if (auto st = sink_.write_byte(value); !st) {
            return sink_failure(std::move(st).error());
        }
        ++written_;
        return {};
    }

    template<FixedInteger T>
    auto put_int(T value) -> status {
        std::uint8_t buf[sizeof(T)];
        store_int(value, order_, buf);
        return put({buf, sizeof(T)});
    }

    template<typename L>
    auto put_length(std::size_t n) -> status {
        if (n > wire_format::max_length<L>()) {
            return reject(encode_errc::length_overflow, n);
        }
        return put_int(static_cast<L>(n));
    }
};

template<ByteSink Sink>
using encode_status_t = status_t<encode_error<typename Sink::error_type>>;

} // namespace embin
