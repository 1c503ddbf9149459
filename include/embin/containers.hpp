#pragma once

// Fixed-capacity containers used as decode targets for sequences and maps.
// Storage is inline; nothing here touches the heap.

#include <algorithm>
#include <array>
#include <cstddef>
#include <initializer_list>
#include <utility>

namespace embin {

// =============================================================================
// inline_vec_t<T, N>
// =============================================================================

template<typename T, std::size_t N>
class inline_vec_t {
public:
    using value_type = T;
    using iterator = T*;
    using const_iterator = const T*;

    inline_vec_t() = default;

    inline_vec_t(std::initializer_list<T> init) {
        for (const auto& v : init) {
            if (!push_back(v)) break;
        }
    }

    // false (and no change) when full
    auto push_back(T value) -> bool {
        if (count == N) {
            return false;
        }
        items[count++] = std::move(value);
        return true;
    }

    void clear() { count = 0; }

    auto size() const -> std::size_t { return count; }
    auto empty() const -> bool { return count == 0; }
    static constexpr auto capacity() -> std::size_t { return N; }

    auto operator[](std::size_t i) -> T& { return items[i]; }
    auto operator[](std::size_t i) const -> const T& { return items[i]; }

    auto data() -> T* { return items.data(); }
    auto data() const -> const T* { return items.data(); }

    auto begin() -> iterator { return items.data(); }
    auto end() -> iterator { return items.data() + count; }
    auto begin() const -> const_iterator { return items.data(); }
    auto end() const -> const_iterator { return items.data() + count; }

    friend auto operator==(const inline_vec_t& a, const inline_vec_t& b) -> bool {
        return std::equal(a.begin(), a.end(), b.begin(), b.end());
    }

private:
    std::array<T, N> items{};
    std::size_t count = 0;
};

// =============================================================================
// inline_map_t<K, V, N> - insertion-ordered, linear lookup
// =============================================================================

template<typename K, typename V, std::size_t N>
class inline_map_t {
public:
    using key_type = K;
    using mapped_type = V;
    using value_type = std::pair<K, V>;
    using iterator = typename inline_vec_t<value_type, N>::iterator;
    using const_iterator = typename inline_vec_t<value_type, N>::const_iterator;

    inline_map_t() = default;

    inline_map_t(std::initializer_list<value_type> init) {
        for (const auto& [k, v] : init) {
            if (!insert_or_assign(k, v)) break;
        }
    }

    // Replaces the value of an existing key in place; false when a new key
    // does not fit
    auto insert_or_assign(K key, V value) -> bool {
        if (auto it = find(key); it != end()) {
            it->second = std::move(value);
            return true;
        }
        return entries.push_back(value_type{std::move(key), std::move(value)});
    }

    auto find(const K& key) -> iterator {
        return std::find_if(begin(), end(), [&key](const value_type& e) { return e.first == key; });
    }

    auto find(const K& key) const -> const_iterator {
        return std::find_if(begin(), end(), [&key](const value_type& e) { return e.first == key; });
    }

    auto contains(const K& key) const -> bool { return find(key) != end(); }

    void clear() { entries.clear(); }

    auto size() const -> std::size_t { return entries.size(); }
    auto empty() const -> bool { return entries.empty(); }
    static constexpr auto capacity() -> std::size_t { return N; }

    auto begin() -> iterator { return entries.begin(); }
    auto end() -> iterator { return entries.end(); }
    auto begin() const -> const_iterator { return entries.begin(); }
    auto end() const -> const_iterator { return entries.end(); }

    friend auto operator==(const inline_map_t& a, const inline_map_t& b) -> bool {
        return a.entries == b.entries;
    }

private:
    inline_vec_t<value_type, N> entries;
};

} // namespace embin
