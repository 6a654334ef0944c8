/**
 * @file typed_store.hpp
 * @brief Insertion ordered map accepting keys of any runtime type
 *
 * Keys are compared by strict equality: 1, "1", 1.0 and true are four distinct
 * keys, two arrays are the same key if they are structurally identical, and two
 * objects are the same key only if they are the same instance.
 *
 * To look keys up in O(1) every key is first canonicalized into a CanonicalKey:
 * a byte string that encodes the key's kind and content (the "exact" token),
 * plus the hash of that string (the "bucket"). Two keys are equal if and only
 * if their exact tokens are equal.
 *
 * Usage example:
 *   Store store;
 *   store.set(1, "a");
 *   store.set("1", "b");
 *   store.set(true, "c");
 *   store.get(1);                // "a"
 *
 *   for (auto const& [key, value] : store)
 *       std::cout << key << " => " << value << "\n";
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "typed_value.hpp"

namespace typed
{

/**
 * @brief Comparison-ready surrogate of a value
 *
 * The exact token starts with the Kind of the value so that values of
 * different kinds never compare equal, even if their payload bytes coincide.
 */
struct CanonicalKey
{
    std::size_t bucket = 0;
    std::string exact;

    friend bool operator==(CanonicalKey const& a, CanonicalKey const& b) noexcept
    {
        return a.bucket == b.bucket && a.exact == b.exact;
    }

    struct Hash
    {
        std::size_t operator()(CanonicalKey const& key) const noexcept { return key.bucket; }
    };
};

/**
 * @brief Canonicalizes a value for use as a store key
 *
 * Encoding of the exact token after the kind byte:
 *   - bool:   one byte
 *   - int:    the 8 integer bytes
 *   - float:  the 8 bytes of the double, with -0.0 folded into 0.0 and all NaNs into one
 *   - string: 8 byte length followed by the characters
 *   - array:  8 byte element count followed by each key and value, recursively
 *   - object: the instance address
 */
CanonicalKey canonicalize(Value const& value);

/**
 * @brief Insertion ordered, arbitrary-key associative container
 *
 * Entries are kept in a vector in insertion order; an unordered index maps the
 * canonical form of each key to the position of its entry.
 *
 * Guarantees:
 *   - Setting a new key appends it at the end.
 *   - Setting an existing key replaces its entry at the same position.
 *   - Removing a key shifts all later entries up by one, keeping their order.
 *
 * Iterators and references are invalidated by any mutation.
 */
class Store
{
public:
    struct Entry
    {
        Value key;
        Value value;
    };

    using const_iterator = std::vector<Entry>::const_iterator;

    /// @throws KeyNotFound if key is absent
    Value const& get(Value const& key) const;

    /// Returns a pointer to the value stored under key, or nullptr
    Value const* find(Value const& key) const;

    /**
     * @brief Inserts or overwrites the value stored under key
     *
     * @return The previous value if key was already present
     */
    std::optional<Value> set(Value key, Value value);

    /**
     * @brief Removes key and returns the value it was mapped to
     *
     * @throws KeyNotFound if key is absent
     */
    Value remove(Value const& key);

    bool exists(Value const& key) const;

    /// Returns the position of key in iteration order, or std::nullopt
    std::optional<std::size_t> position(Value const& key) const;

    std::size_t size() const noexcept { return entries.size(); }
    bool empty() const noexcept { return entries.empty(); }
    void clear() noexcept;

    /// Returns the entry at a position in iteration order
    Entry const& at(std::size_t pos) const;

    const_iterator begin() const noexcept { return entries.begin(); }
    const_iterator end() const noexcept { return entries.end(); }

    /**
     * @brief Stable sort of the entries
     *
     * @param less Strict weak ordering on Entry const&
     */
    template <typename Less>
    void sort(Less && less);

private:
    void reindex();

    std::vector<Entry> entries;
    std::unordered_map<CanonicalKey, std::size_t, CanonicalKey::Hash> index;
};

//=============================================================================
// Store implementations
//=============================================================================
template <typename Less>
void Store::sort(Less && less)
{
    std::stable_sort(entries.begin(), entries.end(), std::forward<Less>(less));
    reindex();
}

} // namespace typed
