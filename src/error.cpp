#include "embin/error.hpp"

namespace embin {

auto to_string(encode_errc kind) -> const char* {
    switch (kind) {
        case encode_errc::sink: return "sink failure";
        case encode_errc::length_unknown: return "sequence length unknown";
        case encode_errc::length_overflow: return "length exceeds prefix width";
        case encode_errc::invalid_scalar: return "invalid unicode scalar";
        case encode_errc::invalid_utf8: return "invalid utf-8";
        case encode_errc::invalid_variant: return "enum value outside its variants";
    }
    return "unknown";
}

auto to_string(decode_errc kind) -> const char* {
    switch (kind) {
        case decode_errc::source: return "source failure";
        case decode_errc::invalid_bool: return "invalid bool value";
        case decode_errc::invalid_option: return "invalid option discriminant";
        case decode_errc::invalid_utf8: return "invalid utf-8";
        case decode_errc::invalid_variant: return "invalid variant index";
        case decode_errc::capacity_exceeded: return "capacity exceeded";
    }
    return "unknown";
}

auto operator<<(std::ostream& os, encode_errc kind) -> std::ostream& {
    return os << to_string(kind);
}

auto operator<<(std::ostream& os, decode_errc kind) -> std::ostream& {
    return os << to_string(kind);
}

} // namespace embin
