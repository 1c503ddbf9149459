#pragma once

// Byte sources: the input side of the codec.
// Provides the ByteSource concept and slice_source_t.
//
// Lifetime contract: every span a source hands out points into the caller's
// buffer, never into the source object. Values decoded from a source (string
// views, byte spans) are valid exactly as long as that buffer is.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "result.hpp"

namespace embin {

// =============================================================================
// ByteSource concept
// =============================================================================

template<typename S>
concept ByteSource = requires(S& s, std::size_t n) {
    typename S::error_type;
    // exactly n bytes or an error, never a shorter span
    { s.read_exact(n) } -> std::same_as<result_t<std::span<const std::uint8_t>, typename S::error_type>>;
};

// Single byte; sources without their own read_byte go through read_exact(1)
template<ByteSource S>
auto read_byte(S& source) -> result_t<std::uint8_t, typename S::error_type> {
    if constexpr (requires { { source.read_byte() } -> std::same_as<result_t<std::uint8_t, typename S::error_type>>; }) {
        return source.read_byte();
    } else {
        auto bytes = source.read_exact(1);
        if (!bytes) {
            return fail(std::move(bytes).error());
        }
        return bytes.value()[0];
    }
}

// =============================================================================
// slice_source_t - borrowed view over a caller-owned buffer
// =============================================================================

struct exhausted_error {
    std::size_t requested = 0;
    std::size_t available = 0;
};

auto operator<<(std::ostream& os, const exhausted_error& e) -> std::ostream&;

class slice_source_t {
public:
    using error_type = exhausted_error;

    explicit slice_source_t(std::span<const std::uint8_t> bytes) : remaining_(bytes) {}

    // A temporary buffer would be destroyed while decoded views still
    // point into it
    explicit slice_source_t(std::vector<std::uint8_t>&&) = delete;
    explicit slice_source_t(std::string&&) = delete;

    // Splits off the first n bytes and advances past them
    auto read_exact(std::size_t n) -> result_t<std::span<const std::uint8_t>, error_type>;
    auto read_byte() -> result_t<std::uint8_t, error_type>;

    auto remaining() const -> std::span<const std::uint8_t> { return remaining_; }
    auto position() const -> std::size_t { return consumed_; }
    auto empty() const -> bool { return remaining_.empty(); }

private:
    std::span<const std::uint8_t> remaining_;
    std::size_t consumed_ = 0;
};

} // namespace embin
