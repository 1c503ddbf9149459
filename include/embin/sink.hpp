#pragma once

// Byte sinks: the output side of the codec.
// Provides the ByteSink concept, buffer_writer_t and stream_sink_t.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <ios>
#include <ostream>
#include <span>

#include "result.hpp"

namespace embin {

// =============================================================================
// ByteSink concept
// =============================================================================

template<typename S>
concept ByteSink = requires(S& s, std::uint8_t b) {
    typename S::error_type;
    { s.write_byte(b) } -> std::same_as<status_t<typename S::error_type>>;
};

// Bulk write; sinks without their own write_slice get a byte loop that stops
// at the first failure.
template<ByteSink S>
auto write_slice(S& sink, std::span<const std::uint8_t> bytes) -> status_t<typename S::error_type> {
    if constexpr (requires { sink.write_slice(bytes); }) {
        return sink.write_slice(bytes);
    } else {
        for (auto b : bytes) {
            EMBIN_TRY(sink.write_byte(b));
        }
        return {};
    }
}

template<ByteSink S>
auto flush(S& sink) -> status_t<typename S::error_type> {
    if constexpr (requires { sink.flush(); }) {
        return sink.flush();
    } else {
        return {};
    }
}

// =============================================================================
// buffer_writer_t - fixed-capacity region, never grows
// =============================================================================

struct capacity_error {
    std::size_t requested = 0;
    std::size_t available = 0;
};

auto operator<<(std::ostream& os, const capacity_error& e) -> std::ostream&;

class buffer_writer_t {
public:
    using error_type = capacity_error;

    explicit buffer_writer_t(std::span<std::uint8_t> buffer) : buffer_(buffer) {}

    auto write_byte(std::uint8_t value) -> status_t<error_type>;

    // All or nothing: on failure no byte of the slice has been written
    auto write_slice(std::span<const std::uint8_t> bytes) -> status_t<error_type>;

    auto size() const -> std::size_t { return index_; }
    auto capacity() const -> std::size_t { return buffer_.size(); }
    auto remaining() const -> std::size_t { return buffer_.size() - index_; }
    auto written() const -> std::span<const std::uint8_t> { return buffer_.first(index_); }

    void clear() { index_ = 0; }

private:
    std::span<std::uint8_t> buffer_;
    std::size_t index_ = 0;
};

// =============================================================================
// stream_sink_t - writes through to a std::ostream
// =============================================================================

struct stream_error {
    std::ios_base::iostate state = std::ios_base::goodbit;
};

auto operator<<(std::ostream& os, const stream_error& e) -> std::ostream&;

class stream_sink_t {
public:
    using error_type = stream_error;

    explicit stream_sink_t(std::ostream& stream) : os(stream) {}

    auto write_byte(std::uint8_t value) -> status_t<error_type>;
    auto write_slice(std::span<const std::uint8_t> bytes) -> status_t<error_type>;
    auto flush() -> status_t<error_type>;

    auto size() const -> std::size_t { return count; }

private:
    std::ostream& os;
    std::size_t count = 0;

    auto check() const -> status_t<error_type>;
};

} // namespace embin
