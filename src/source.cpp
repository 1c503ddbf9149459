#include "embin/source.hpp"

namespace embin {

auto operator<<(std::ostream& os, const exhausted_error& e) -> std::ostream& {
    return os << "unexpected end of input: " << e.requested << " bytes requested, " << e.available << " available";
}

auto slice_source_t::read_exact(std::size_t n) -> result_t<std::span<const std::uint8_t>, error_type> {
    if (n > remaining_.size()) {
        return fail(exhausted_error{n, remaining_.size()});
    }
    auto head = remaining_.first(n);
    remaining_ = remaining_.subspan(n);
    consumed_ += n;
    return head;
}

auto slice_source_t::read_byte() -> result_t<std::uint8_t, error_type> {
    if (remaining_.empty()) {
        return fail(exhausted_error{1, 0});
    }
    auto value = remaining_[0];
    remaining_ = remaining_.subspan(1);
    ++consumed_;
    return value;
}

} // namespace embin
