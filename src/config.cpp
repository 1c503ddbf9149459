#include "embin/config.hpp"

#include <cctype>
#include <stdexcept>

namespace embin {

auto to_string(byte_order order) -> const char* {
    switch (order) {
        case byte_order::big: return "big";
        case byte_order::little: return "little";
    }
    return "unknown";
}

auto from_string(std::type_identity<byte_order>, std::string_view s) -> byte_order {
    if (s == "big" || s == "network") return byte_order::big;
    if (s == "little") return byte_order::little;
    if (s == "native") return native_order;
    throw std::runtime_error("invalid byte_order: " + std::string(s));
}

auto operator<<(std::ostream& os, byte_order order) -> std::ostream& {
    return os << to_string(order);
}

void set(options_t& options, const std::string& key, const std::string& value) {
    if (key == "byte_order") {
        options.order = from_string(std::type_identity<byte_order>{}, value);
    } else {
        throw std::runtime_error("unknown option: " + key);
    }
}

namespace {

auto trim(const std::string& s) -> std::string {
    auto begin = std::size_t{0};
    auto end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

} // anonymous namespace

auto read_options(std::istream& is) -> options_t {
    auto options = options_t{};
    auto line = std::string{};
    auto line_number = 0;

    while (std::getline(is, line)) {
        ++line_number;
        auto hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error("expected 'key = value' on line " + std::to_string(line_number));
        }
        auto key = trim(line.substr(0, eq));
        auto value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        set(options, key, value);
    }
    return options;
}

} // namespace embin
