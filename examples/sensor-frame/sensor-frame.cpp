#include <array>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string_view>
#include "embin/embin.hpp"

using namespace embin;

// =============================================================================
// Sensor status enum, encoded as a bare variant index
// =============================================================================

enum class sensor_status { ok, degraded, failed };

inline auto variant_count(std::type_identity<sensor_status>) -> std::size_t {
    return 3;
}

inline const char* to_string(sensor_status s) {
    switch (s) {
        case sensor_status::ok: return "ok";
        case sensor_status::degraded: return "degraded";
        case sensor_status::failed: return "failed";
    }
    return "unknown";
}

// =============================================================================
// Frame structures
// =============================================================================

struct reading_t {
    std::uint16_t channel = 0;
    float value = 0.0f;
    std::string_view unit;
};

inline auto fields(const reading_t& r) {
    return std::make_tuple(field("channel", r.channel), field("value", r.value), field("unit", r.unit));
}

inline auto fields(reading_t& r) {
    return std::make_tuple(field("channel", r.channel), field("value", r.value), field("unit", r.unit));
}

struct sensor_frame_t {
    std::uint32_t sequence = 0;
    std::uint64_t timestamp_us = 0;
    std::string_view station;
    sensor_status status = sensor_status::ok;
    std::optional<double> battery_volts;
    inline_vec_t<reading_t, 8> readings;
};

inline auto fields(const sensor_frame_t& f) {
    return std::make_tuple(
        field("sequence", f.sequence),
        field("timestamp_us", f.timestamp_us),
        field("station", f.station),
        field("status", f.status),
        field("battery_volts", f.battery_volts),
        field("readings", f.readings)
    );
}

inline auto fields(sensor_frame_t& f) {
    return std::make_tuple(
        field("sequence", f.sequence),
        field("timestamp_us", f.timestamp_us),
        field("station", f.station),
        field("status", f.status),
        field("battery_volts", f.battery_volts),
        field("readings", f.readings)
    );
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [options_file]\n";
        return 1;
    }

    auto options = options_t{};

    if (argc == 2) {
        std::ifstream file(argv[1]);
        if (!file) {
            std::cerr << "Error: cannot open file '" << argv[1] << "'\n";
            return 1;
        }
        try {
            options = read_options(file);
        } catch (const std::exception& e) {
            std::cerr << "Error parsing options: " << e.what() << "\n";
            return 1;
        }
    }

    auto frame = sensor_frame_t{};
    frame.sequence = 1042;
    frame.timestamp_us = 1'700'000'000'123'456;
    frame.station = "ridge-north";
    frame.status = sensor_status::degraded;
    frame.battery_volts = 3.71;
    frame.readings = {
        {1, 21.5f, "degC"},
        {2, 101.3f, "kPa"},
        {7, 0.42f, "m/s"},
    };

    // Encode into a fixed buffer, no allocation
    std::uint8_t buffer[256];
    auto sink = buffer_writer_t(buffer);

    if (auto st = encode(frame, sink, options); !st) {
        std::cerr << st.error() << "\n";
        return 1;
    }

    std::cout << "Encoded " << sink.size() << " bytes (" << options.order << "-endian):\n";
    auto column = 0;
    for (auto b : sink.written()) {
        std::printf("%02x%s", b, ++column % 16 == 0 ? "\n" : " ");
    }
    std::cout << "\n\n";

    // Decode; strings in the result point into buffer
    auto source = slice_source_t(sink.written());
    auto decoded = decode<sensor_frame_t>(source, options);

    if (!decoded) {
        std::cerr << decoded.error() << "\n";
        return 1;
    }

    std::cout << "sequence:      " << decoded->sequence << "\n";
    std::cout << "timestamp_us:  " << decoded->timestamp_us << "\n";
    std::cout << "station:       " << decoded->station << "\n";
    std::cout << "status:        " << to_string(decoded->status) << "\n";
    if (decoded->battery_volts) {
        std::cout << "battery_volts: " << *decoded->battery_volts << "\n";
    }
    for (const auto& r : decoded->readings) {
        std::cout << "  ch " << r.channel << ": " << r.value << " " << r.unit << "\n";
    }

    auto borrowed = reinterpret_cast<const std::uint8_t*>(decoded->station.data());
    std::cout << "\nstation borrowed from buffer: "
              << (borrowed >= buffer && borrowed < buffer + sizeof(buffer) ? "yes" : "no") << "\n";

    return 0;
}
