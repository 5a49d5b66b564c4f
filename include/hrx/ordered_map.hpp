#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace hrx {

// Insertion-ordered map with unique keys
// Iteration follows insertion order; lookups go through a hash index into
// the backing list, so they are O(1) on average.
//
// insert() never overwrites: inserting an existing key leaves the map
// untouched and reports the entry already there.
//
// Thread-safety: NOT thread-safe. Caller must provide synchronization.
//
template<typename Key, typename Value,
         typename Hash = std::hash<Key>,
         typename Equal = std::equal_to<Key>>
class OrderedMap {
public:
    using value_type = std::pair<const Key, Value>;
    using iterator = typename std::list<value_type>::iterator;
    using const_iterator = typename std::list<value_type>::const_iterator;

    OrderedMap() = default;

    // The index points into items_, so copies rebuild it
    OrderedMap(const OrderedMap& other) : items_(other.items_) {
        rebuildIndex();
    }

    OrderedMap& operator=(const OrderedMap& other) {
        // Keys are const, so the list can't assign element-wise
        if (this != &other) {
            OrderedMap copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    // std::list keeps its nodes on move, so index iterators stay valid
    OrderedMap(OrderedMap&&) = default;
    OrderedMap& operator=(OrderedMap&&) = default;

    // Append key at the end unless it is already present
    // Returns the entry for key and whether it was inserted
    std::pair<iterator, bool> insert(const Key& key, Value value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            return {it->second, false};
        }

        items_.emplace_back(key, std::move(value));
        auto last = std::prev(items_.end());
        index_.emplace(key, last);
        return {last, true};
    }

    // Pointer to the value for key, or nullptr
    Value* find(const Key& key) {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &(it->second->second);
    }

    const Value* find(const Key& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &(it->second->second);
    }

    // Remove a key, keeping the order of the others
    // Returns the removed value if found
    std::optional<Value> remove(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }

        Value value = std::move(it->second->second);
        items_.erase(it->second);
        index_.erase(it);
        return value;
    }

    [[nodiscard]] bool contains(const Key& key) const {
        return index_.contains(key);
    }

    [[nodiscard]] size_t size() const { return items_.size(); }
    [[nodiscard]] bool empty() const { return items_.empty(); }

    void clear() {
        items_.clear();
        index_.clear();
    }

    // First and last inserted entries (map must not be empty)
    [[nodiscard]] const value_type& front() const { return items_.front(); }
    [[nodiscard]] const value_type& back() const { return items_.back(); }

    iterator begin() { return items_.begin(); }
    iterator end() { return items_.end(); }
    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

    // Equal when both hold the same pairs in the same order
    bool operator==(const OrderedMap& other) const {
        return items_.size() == other.items_.size() &&
               std::equal(items_.begin(), items_.end(), other.items_.begin());
    }

private:
    void rebuildIndex() {
        index_.clear();
        index_.reserve(items_.size());
        for (auto it = items_.begin(); it != items_.end(); ++it) {
            index_.emplace(it->first, it);
        }
    }

    std::list<value_type> items_;  // Insertion order
    std::unordered_map<Key, iterator, Hash, Equal> index_;
};

}  // namespace hrx
