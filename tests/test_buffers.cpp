#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "embin/sink.hpp"
#include "embin/source.hpp"

using namespace embin;

// =============================================================================
// A minimal sink with only write_byte, to exercise the generic fallbacks
// =============================================================================

struct byte_only_sink_t {
    using error_type = int;

    std::vector<std::uint8_t> bytes;
    std::size_t limit = 0;

    auto write_byte(std::uint8_t b) -> status_t<int> {
        if (bytes.size() == limit) {
            return fail(-1);
        }
        bytes.push_back(b);
        return {};
    }
};

static_assert(ByteSink<byte_only_sink_t>);
static_assert(ByteSink<buffer_writer_t>);
static_assert(ByteSink<stream_sink_t>);
static_assert(ByteSource<slice_source_t>);

// =============================================================================
// buffer_writer_t
// =============================================================================

void test_buffer_writer_bytes() {
    std::cout << "Testing buffer writer byte writes... ";

    auto storage = std::array<std::uint8_t, 2>{};
    auto w = buffer_writer_t(storage);

    assert(w.capacity() == 2);
    assert(w.write_byte(0xAA));
    assert(w.write_byte(0xBB));
    assert(w.size() == 2);
    assert(w.remaining() == 0);

    auto st = w.write_byte(0xCC);
    assert(!st);
    assert(st.error().requested == 1);
    assert(st.error().available == 0);
    assert(storage[0] == 0xAA && storage[1] == 0xBB);

    std::cout << "PASSED\n";
}

void test_buffer_writer_slice_all_or_nothing() {
    std::cout << "Testing buffer writer slices are all or nothing... ";

    auto storage = std::array<std::uint8_t, 4>{};
    auto w = buffer_writer_t(storage);
    const auto abc = std::array<std::uint8_t, 3>{1, 2, 3};

    assert(w.write_slice(abc));
    assert(w.size() == 3);

    auto st = w.write_slice(abc);
    assert(!st);
    assert(st.error().requested == 3);
    assert(st.error().available == 1);
    assert(w.size() == 3);
    assert(storage[3] == 0);

    auto written = w.written();
    assert(written.size() == 3);
    assert(written[0] == 1 && written[2] == 3);

    w.clear();
    assert(w.size() == 0);
    assert(w.remaining() == 4);

    std::cout << "PASSED\n";
}

// =============================================================================
// stream_sink_t
// =============================================================================

void test_stream_sink() {
    std::cout << "Testing stream sink... ";

    auto ss = std::ostringstream{};
    auto sink = stream_sink_t(ss);
    const auto hi = std::array<std::uint8_t, 2>{'h', 'i'};

    assert(sink.write_byte('>'));
    assert(sink.write_slice(hi));
    assert(sink.flush());
    assert(sink.size() == 3);
    assert(ss.str() == ">hi");

    ss.setstate(std::ios_base::badbit);
    auto st = sink.write_byte('x');
    assert(!st);
    assert(st.error().state & std::ios_base::badbit);
    assert(sink.size() == 3);

    std::cout << "PASSED\n";
}

// =============================================================================
// Generic sink helpers
// =============================================================================

void test_write_slice_fallback() {
    std::cout << "Testing write_slice fallback stops at first failure... ";

    auto sink = byte_only_sink_t{};
    sink.limit = 2;
    const auto data = std::array<std::uint8_t, 3>{7, 8, 9};

    auto st = write_slice(sink, data);
    assert(!st);
    assert(st.error() == -1);
    assert(sink.bytes.size() == 2);
    assert(sink.bytes[1] == 8);

    // sinks without flush() flush trivially
    assert(flush(sink));

    std::cout << "PASSED\n";
}

// =============================================================================
// slice_source_t
// =============================================================================

void test_slice_source() {
    std::cout << "Testing slice source reads... ";

    const auto data = std::array<std::uint8_t, 5>{10, 20, 30, 40, 50};
    auto src = slice_source_t(data);

    auto b = src.read_byte();
    assert(b && *b == 10);
    assert(src.position() == 1);

    auto three = src.read_exact(3);
    assert(three);
    assert(three->size() == 3);
    assert((*three)[0] == 20 && (*three)[2] == 40);

    // borrowed, not copied
    assert(three->data() == data.data() + 1);

    auto zero = src.read_exact(0);
    assert(zero && zero->empty());

    auto too_many = src.read_exact(2);
    assert(!too_many);
    assert(too_many.error().requested == 2);
    assert(too_many.error().available == 1);

    // a failed read consumes nothing
    assert(src.remaining().size() == 1);
    auto last = read_byte(src);
    assert(last && *last == 50);
    assert(src.empty());

    auto past_end = src.read_byte();
    assert(!past_end);
    assert(src.position() == 5);

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Sinks ===\n\n";
    test_buffer_writer_bytes();
    test_buffer_writer_slice_all_or_nothing();
    test_stream_sink();
    test_write_slice_fallback();

    std::cout << "\n=== Sources ===\n\n";
    test_slice_source();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
