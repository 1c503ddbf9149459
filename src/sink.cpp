#include "embin/sink.hpp"

#include <algorithm>

namespace embin {

// =============================================================================
// buffer_writer_t
// =============================================================================

auto operator<<(std::ostream& os, const capacity_error& e) -> std::ostream& {
    return os << "buffer full: " << e.requested << " bytes requested, " << e.available << " available";
}

auto buffer_writer_t::write_byte(std::uint8_t value) -> status_t<error_type> {
    if (index_ >= buffer_.size()) {
        return fail(capacity_error{1, 0});
    }
    buffer_[index_++] = value;
    return {};
}

auto buffer_writer_t::write_slice(std::span<const std::uint8_t> bytes) -> status_t<error_type> {
    if (bytes.size() > remaining()) {
        return fail(capacity_error{bytes.size(), remaining()});
    }
    std::copy(bytes.begin(), bytes.end(), buffer_.begin() + static_cast<std::ptrdiff_t>(index_));
    index_ += bytes.size();
    return {};
}

// =============================================================================
// stream_sink_t
// =============================================================================

auto operator<<(std::ostream& os, const stream_error& e) -> std::ostream& {
    os << "stream failure:";
    if (e.state & std::ios_base::badbit) os << " bad";
    if (e.state & std::ios_base::failbit) os << " fail";
    if (e.state & std::ios_base::eofbit) os << " eof";
    return os;
}

auto stream_sink_t::check() const -> status_t<error_type> {
    if (!os) {
        return fail(stream_error{os.rdstate()});
    }
    return {};
}

auto stream_sink_t::write_byte(std::uint8_t value) -> status_t<error_type> {
    EMBIN_TRY(check());
    os.put(static_cast<char>(value));
    EMBIN_TRY(check());
    ++count;
    return {};
}

auto stream_sink_t::write_slice(std::span<const std::uint8_t> bytes) -> status_t<error_type> {
    EMBIN_TRY(check());
    os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    EMBIN_TRY(check());
    count += bytes.size();
    return {};
}

auto stream_sink_t::flush() -> status_t<error_type> {
    os.flush();
    return check();
}

} // namespace embin
