#pragma once

// Opt-in event log shared by the encoder and decoder.

#include <ostream>
#include <type_traits>

#include "format.hpp"

namespace embin {

class trace_t {
public:
    explicit trace_t(std::ostream* stream) : os(stream) {}

    auto enabled() const -> bool { return os != nullptr; }

    template<typename... Args>
    void log(const Args&... args) {
        if (!os) {
            return;
        }
        *os << "embin: ";
        for (int i = 0; i < depth; ++i) {
            *os << "  ";
        }
        (print(args), ...);
        *os << "\n";
        os->flush();
    }

    void push() { ++depth; }
    void pop() {
        if (depth > 0) --depth;
    }

private:
    std::ostream* os;
    int depth = 0;

    template<typename T>
    void print(const T& value) {
        if constexpr (is_int128_v<T>) {
            *os << "<128-bit>";
        } else if constexpr (std::is_same_v<T, char32_t>) {
            *os << "U+" << std::hex << static_cast<unsigned long>(value) << std::dec;
        } else if constexpr (std::is_integral_v<T> && sizeof(T) == 1 && !std::is_same_v<T, bool>) {
            *os << static_cast<int>(value);
        } else if constexpr (std::is_same_v<T, bool>) {
            *os << (value ? "true" : "false");
        } else {
            *os << value;
        }
    }
};

} // namespace embin
