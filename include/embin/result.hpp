#pragma once

// Value-or-error return type used by every codec operation.

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace embin {

// =============================================================================
// failure_t - tagged error, converts into any result_t with the same error
// =============================================================================

template<typename E>
struct failure_t {
    E error;
};

template<typename E>
auto fail(E error) -> failure_t<std::decay_t<E>> {
    return {std::move(error)};
}

// =============================================================================
// result_t<T, E>
// =============================================================================

template<typename T, typename E>
class result_t {
public:
    using value_type = T;
    using error_type = E;

    result_t(T value) : storage_(std::in_place_index<0>, std::move(value)) {}

    template<typename F>
        requires std::is_convertible_v<F, E>
    result_t(failure_t<F> f) : storage_(std::in_place_index<1>, std::move(f.error)) {}

    auto has_value() const -> bool { return storage_.index() == 0; }
    explicit operator bool() const { return has_value(); }

    auto value() & -> T& { return std::get<0>(storage_); }
    auto value() const& -> const T& { return std::get<0>(storage_); }
    auto value() && -> T&& { return std::get<0>(std::move(storage_)); }

    auto operator*() & -> T& { return value(); }
    auto operator*() const& -> const T& { return value(); }
    auto operator->() -> T* { return &value(); }
    auto operator->() const -> const T* { return &value(); }

    auto error() & -> E& { return std::get<1>(storage_); }
    auto error() const& -> const E& { return std::get<1>(storage_); }
    auto error() && -> E&& { return std::get<1>(std::move(storage_)); }

private:
    std::variant<T, E> storage_;
};

// Success carries nothing
template<typename E>
class result_t<void, E> {
public:
    using value_type = void;
    using error_type = E;

    result_t() = default;

    template<typename F>
        requires std::is_convertible_v<F, E>
    result_t(failure_t<F> f) : error_(std::move(f.error)) {}

    auto has_value() const -> bool { return !error_.has_value(); }
    explicit operator bool() const { return has_value(); }

    auto error() & -> E& { return *error_; }
    auto error() const& -> const E& { return *error_; }
    auto error() && -> E&& { return std::move(*error_); }

private:
    std::optional<E> error_;
};

template<typename E>
using status_t = result_t<void, E>;

} // namespace embin

// Return the error of a failed status or result from the enclosing function
#define EMBIN_TRY(expr)                                                      \
    do {                                                                     \
        if (auto embin_try_result_ = (expr); !embin_try_result_) {           \
            return ::embin::fail(std::move(embin_try_result_).error());      \
        }                                                                    \
    } while (0)
