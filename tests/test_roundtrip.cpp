#include <algorithm>
#include <array>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>
#include "embin/embin.hpp"

using namespace embin;

// =============================================================================
// Test structures
// =============================================================================

struct vec3_t {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    friend bool operator==(const vec3_t&, const vec3_t&) = default;
};

auto fields(vec3_t& v) {
    return std::make_tuple(
        embin::field("x", v.x),
        embin::field("y", v.y),
        embin::field("z", v.z)
    );
}

auto fields(const vec3_t& v) {
    return std::make_tuple(
        embin::field("x", v.x),
        embin::field("y", v.y),
        embin::field("z", v.z)
    );
}

enum class flight_mode_t : std::uint8_t { idle, armed, flight };

constexpr auto variant_count(std::type_identity<flight_mode_t>) -> std::size_t {
    return 3;
}

// Tuple-like, struct-like and unit variants of one message type
struct ping_t {
    friend bool operator==(const ping_t&, const ping_t&) = default;
};

auto fields(ping_t&) { return std::make_tuple(); }
auto fields(const ping_t&) { return std::make_tuple(); }

using command_t = std::variant<ping_t, std::tuple<std::uint8_t, bool>, vec3_t>;

struct telemetry_t {
    std::uint32_t sequence = 0;
    flight_mode_t mode = flight_mode_t::idle;
    vec3_t position;
    std::optional<vec3_t> target;
    std::string_view callsign;
    std::span<const std::uint8_t> payload;
    inline_vec_t<std::int16_t, 8> samples;
    inline_map_t<std::string_view, double, 4> gauges;
    command_t last_command;
    char32_t marker = U'?';
};

auto fields(telemetry_t& t) {
    return std::make_tuple(
        embin::field("sequence", t.sequence),
        embin::field("mode", t.mode),
        embin::field("position", t.position),
        embin::field("target", t.target),
        embin::field("callsign", t.callsign),
        embin::field("payload", t.payload),
        embin::field("samples", t.samples),
        embin::field("gauges", t.gauges),
        embin::field("last_command", t.last_command),
        embin::field("marker", t.marker)
    );
}

auto fields(const telemetry_t& t) {
    return std::make_tuple(
        embin::field("sequence", t.sequence),
        embin::field("mode", t.mode),
        embin::field("position", t.position),
        embin::field("target", t.target),
        embin::field("callsign", t.callsign),
        embin::field("payload", t.payload),
        embin::field("samples", t.samples),
        embin::field("gauges", t.gauges),
        embin::field("last_command", t.last_command),
        embin::field("marker", t.marker)
    );
}

auto equal(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) -> bool {
    return std::equal(a.begin(), a.end(), b.begin(), b.end());
}

auto equal(const telemetry_t& a, const telemetry_t& b) -> bool {
    return a.sequence == b.sequence &&
           a.mode == b.mode &&
           a.position == b.position &&
           a.target == b.target &&
           a.callsign == b.callsign &&
           equal(a.payload, b.payload) &&
           a.samples == b.samples &&
           a.gauges == b.gauges &&
           a.last_command == b.last_command &&
           a.marker == b.marker;
}

// =============================================================================
// Round trip helper
// =============================================================================

// Encodes into storage and decodes back; decoded views point into storage
template<typename T>
auto round_trip(const T& value, std::span<std::uint8_t> storage, byte_order order) -> T {
    auto sink = buffer_writer_t(storage);
    auto st = encode(value, sink, order);
    assert(st);

    auto src = slice_source_t(sink.written());
    auto r = decode<T>(src, order);
    assert(r);
    assert(src.empty());
    return *r;
}

template<typename T>
void test_round_trip(const char* name, const T& value) {
    std::cout << "Testing " << name << "... ";

    for (auto order : {byte_order::big, byte_order::little}) {
        auto storage = std::array<std::uint8_t, 1024>{};
        auto decoded = round_trip(value, storage, order);
        assert(decoded == value);
    }

    std::cout << "PASSED\n";
}

// =============================================================================
// Tests
// =============================================================================

void test_extreme_integers() {
    test_round_trip("int8 min", std::numeric_limits<std::int8_t>::min());
    test_round_trip("int16 min", std::numeric_limits<std::int16_t>::min());
    test_round_trip("int32 max", std::numeric_limits<std::int32_t>::max());
    test_round_trip("int64 min", std::numeric_limits<std::int64_t>::min());
    test_round_trip("uint64 max", std::numeric_limits<std::uint64_t>::max());
#ifdef EMBIN_HAS_INT128
    test_round_trip("int128 min", static_cast<int128_t>(uint128_t{1} << 127));
    test_round_trip("uint128 max", ~uint128_t{0});
#endif
}

void test_float_bit_patterns() {
    std::cout << "Testing float bit patterns... ";

    auto storage = std::array<std::uint8_t, 16>{};
    auto nan = round_trip(std::numeric_limits<double>::quiet_NaN(), storage, byte_order::little);
    assert(std::isnan(nan));

    auto neg_zero = round_trip(-0.0f, storage, byte_order::big);
    assert(neg_zero == 0.0f && std::signbit(neg_zero));

    auto inf = round_trip(std::numeric_limits<float>::infinity(), storage, byte_order::big);
    assert(std::isinf(inf));

    std::cout << "PASSED\n";
}

void test_composites() {
    test_round_trip("char outside the BMP", U'\U0001F680');
    test_round_trip("string view", std::string_view{"na\xC3\xAFve"});
    test_round_trip("nested option", std::optional<std::optional<std::uint16_t>>{std::in_place});
    test_round_trip("pair", std::make_pair(std::int16_t{-5}, std::string_view{"x"}));
    test_round_trip("array of structs", std::array<vec3_t, 2>{{{1, 2, 3}, {4, 5, 6}}});
    test_round_trip("enum", flight_mode_t::flight);
    test_round_trip("unit variant", command_t{ping_t{}});
    test_round_trip("tuple variant", command_t{std::make_tuple(std::uint8_t{9}, true)});
    test_round_trip("struct variant", command_t{vec3_t{0.5f, -1.0f, 2.0f}});
    test_round_trip("inline vec", inline_vec_t<std::uint32_t, 4>{1, 2, 3});
    test_round_trip("inline map", inline_map_t<std::uint8_t, std::string_view, 4>{{1, "one"}, {2, "two"}});
}

void test_owned_encode_borrowed_decode() {
    std::cout << "Testing owned containers decode into borrowed ones... ";

    auto names = std::vector<std::string>{"alpha", "beta"};
    auto table = std::map<std::string, std::int32_t>{{"a", -1}, {"b", 2}};

    auto storage = std::array<std::uint8_t, 128>{};
    auto sink = buffer_writer_t(storage);
    assert(encode(std::make_tuple(names, table), sink));

    auto src = slice_source_t(sink.written());
    auto r = decode<std::tuple<inline_vec_t<std::string_view, 4>, inline_map_t<std::string_view, std::int32_t, 4>>>(src);
    assert(r);

    auto& [decoded_names, decoded_table] = *r;
    assert(decoded_names.size() == 2);
    assert(decoded_names[0] == "alpha" && decoded_names[1] == "beta");
    assert(decoded_table.find("a")->second == -1);
    assert(decoded_table.find("b")->second == 2);

    std::cout << "PASSED\n";
}

void test_telemetry() {
    std::cout << "Testing telemetry frame... ";

    const std::uint8_t payload[] = {0x00, 0xFF, 0x10};

    auto t = telemetry_t{};
    t.sequence = 123456;
    t.mode = flight_mode_t::armed;
    t.position = {1.0f, 2.0f, 3.0f};
    t.target = vec3_t{4.0f, 5.0f, 6.0f};
    t.callsign = "EMB-1";
    t.payload = payload;
    t.samples = {-3, 0, 3};
    t.gauges = {{"temp", 21.5}, {"volts", 3.3}};
    t.last_command = std::make_tuple(std::uint8_t{2}, false);
    t.marker = U'\u00B5';

    for (auto order : {byte_order::big, byte_order::little}) {
        auto storage = std::array<std::uint8_t, 256>{};
        auto decoded = round_trip(t, storage, order);
        assert(equal(decoded, t));

        // borrowed from storage, not from the original
        assert(decoded.callsign.data() != t.callsign.data());
        assert(decoded.payload.data() >= storage.data());
        assert(decoded.payload.data() < storage.data() + storage.size());
    }

    std::cout << "PASSED\n";
}

void test_deterministic() {
    std::cout << "Testing repeated encodes are byte-identical... ";

    auto t = telemetry_t{};
    t.callsign = "EMB-2";
    t.samples = {1, 2};
    t.gauges = {{"temp", -4.0}};

    auto first = std::array<std::uint8_t, 256>{};
    auto second = std::array<std::uint8_t, 256>{};
    auto a = buffer_writer_t(first);
    auto b = buffer_writer_t(second);
    assert(encode(t, a, byte_order::little));
    assert(encode(t, b, byte_order::little));
    assert(a.size() == b.size());
    assert(equal(a.written(), b.written()));

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Scalar Types ===\n\n";
    test_extreme_integers();
    test_float_bit_patterns();

    std::cout << "\n=== Compound Types ===\n\n";
    test_composites();
    test_owned_encode_borrowed_decode();

    std::cout << "\n=== Telemetry Frame ===\n\n";
    test_telemetry();
    test_deterministic();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
