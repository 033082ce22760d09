//! # Insertion-Ordered Map
//!
//! A string-keyed associative container that iterates in insertion order.
//! Both JSON objects and runtime mappings use it, so field order survives
//! a round trip and `sort_keys` is an explicit output choice.
//!
//! Re-assigning an existing key keeps its original position. Erasing a key
//! shifts later entries down.

#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace unijson {

template <typename V> class OrderedMap {
public:
    using key_type = std::string;
    using mapped_type = V;
    using value_type = std::pair<std::string, V>;
    using iterator = typename std::vector<value_type>::iterator;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    OrderedMap() = default;

    OrderedMap(std::initializer_list<value_type> init) {
        for (const auto& entry : init) {
            insert_or_assign(entry.first, entry.second);
        }
    }

    [[nodiscard]] auto begin() -> iterator {
        return entries_.begin();
    }
    [[nodiscard]] auto end() -> iterator {
        return entries_.end();
    }
    [[nodiscard]] auto begin() const -> const_iterator {
        return entries_.begin();
    }
    [[nodiscard]] auto end() const -> const_iterator {
        return entries_.end();
    }

    [[nodiscard]] auto size() const -> size_t {
        return entries_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return entries_.empty();
    }

    [[nodiscard]] auto find(std::string_view key) -> iterator {
        auto it = index_.find(std::string(key));
        return it == index_.end() ? entries_.end() : entries_.begin() + it->second;
    }

    [[nodiscard]] auto find(std::string_view key) const -> const_iterator {
        auto it = index_.find(std::string(key));
        return it == index_.end() ? entries_.end() : entries_.begin() + it->second;
    }

    [[nodiscard]] auto contains(std::string_view key) const -> bool {
        return index_.find(std::string(key)) != index_.end();
    }

    /// Returns the value for `key`.
    ///
    /// # Panics
    ///
    /// Throws `std::out_of_range` if the key is absent.
    [[nodiscard]] auto at(std::string_view key) -> V& {
        auto it = find(key);
        if (it == entries_.end()) {
            throw std::out_of_range("OrderedMap: no key '" + std::string(key) + "'");
        }
        return it->second;
    }

    [[nodiscard]] auto at(std::string_view key) const -> const V& {
        auto it = find(key);
        if (it == entries_.end()) {
            throw std::out_of_range("OrderedMap: no key '" + std::string(key) + "'");
        }
        return it->second;
    }

    /// Returns the value for `key`, appending a default-constructed one if absent.
    auto operator[](const std::string& key) -> V& {
        auto it = index_.find(key);
        if (it != index_.end()) {
            return entries_[it->second].second;
        }
        index_.emplace(key, entries_.size());
        entries_.emplace_back(key, V{});
        return entries_.back().second;
    }

    /// Inserts or replaces the value for `key`.
    ///
    /// # Returns
    ///
    /// `true` if a new entry was appended, `false` if an existing one was replaced.
    auto insert_or_assign(const std::string& key, V value) -> bool {
        auto it = index_.find(key);
        if (it != index_.end()) {
            entries_[it->second].second = std::move(value);
            return false;
        }
        index_.emplace(key, entries_.size());
        entries_.emplace_back(key, std::move(value));
        return true;
    }

    /// Removes `key` if present and returns the number of removed entries.
    auto erase(std::string_view key) -> size_t {
        auto it = index_.find(std::string(key));
        if (it == index_.end()) {
            return 0;
        }
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(it->second));
        reindex();
        return 1;
    }

    void clear() {
        entries_.clear();
        index_.clear();
    }

    void reserve(size_t n) {
        entries_.reserve(n);
        index_.reserve(n);
    }

    /// Returns the keys in iteration order.
    [[nodiscard]] auto keys() const -> std::vector<std::string> {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& [key, _] : entries_) {
            out.push_back(key);
        }
        return out;
    }

    /// Returns the keys in lexicographic order.
    [[nodiscard]] auto sorted_keys() const -> std::vector<std::string> {
        auto out = keys();
        std::sort(out.begin(), out.end());
        return out;
    }

    /// Compares contents regardless of insertion order.
    [[nodiscard]] auto operator==(const OrderedMap& other) const -> bool {
        if (size() != other.size()) {
            return false;
        }
        for (const auto& [key, value] : entries_) {
            auto it = other.find(key);
            if (it == other.end() || !(it->second == value)) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] auto operator!=(const OrderedMap& other) const -> bool {
        return !(*this == other);
    }

private:
    std::vector<value_type> entries_;
    std::unordered_map<std::string, size_t> index_;

    void reindex() {
        index_.clear();
        for (size_t i = 0; i < entries_.size(); ++i) {
            index_.emplace(entries_[i].first, i);
        }
    }
};

} // namespace unijson
