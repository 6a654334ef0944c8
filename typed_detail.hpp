#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace typed
{

// Forward declarations needed by detail namespace
class Value;
class Object;

//=============================================================================
// Implementation details - not part of the public API
//=============================================================================
namespace detail
{

/// True if T can be turned into a Value without an explicit cast
template <typename T>
concept ValueConvertible = std::is_convertible_v<T, Value>;

/// Any input range whose elements convert to Value (std::vector<Value>, std::vector<int>, Array, ...)
template <typename R>
concept ValueRange = std::ranges::input_range<R> && ValueConvertible<std::ranges::range_reference_t<R>>;

/// A tuple-like (key, value) element such as std::pair or std::tuple
template <typename E>
concept TupleEntry = requires (E element)
{
    { std::get<0>(element) } -> ValueConvertible;
    { std::get<1>(element) } -> ValueConvertible;
};

/// An element with key and value members such as Store::Entry
template <typename E>
concept MemberEntry = requires (E element)
{
    { element.key } -> ValueConvertible;
    { element.value } -> ValueConvertible;
};

/// An input range of (key, value) elements, e.g. std::vector<std::pair<Value, Value>>, a Store or a Dictionary
template <typename R>
concept PairRange = std::ranges::input_range<R>
    && (TupleEntry<std::ranges::range_reference_t<R>> || MemberEntry<std::ranges::range_reference_t<R>>);

/// Returns the key of a PairRange element
template <typename E>
decltype(auto) entryKey(E const& element)
{
    if constexpr (MemberEntry<E const&>)
        return (element.key);
    else
        return std::get<0>(element);
}

/// Returns the value of a PairRange element
template <typename E>
decltype(auto) entryValue(E const& element)
{
    if constexpr (MemberEntry<E const&>)
        return (element.value);
    else
        return std::get<1>(element);
}

/**
 * @brief Collects the elements of a ValueRange into a vector of Values
 *
 * Used by every entry point that accepts an arbitrary source iterable so that
 * the collections only ever deal with one container type internally.
 */
template <ValueRange R>
std::vector<Value> toValues(R && range)
{
    std::vector<Value> result;

    if constexpr (std::ranges::sized_range<R>)
        result.reserve(std::ranges::size(range));

    for (auto && element : range)
        result.emplace_back(std::forward<decltype(element)>(element));

    return result;
}

/// Packs a parameter pack of value-convertible arguments into a vector
template <ValueConvertible... Args>
std::vector<Value> packValues(Args && ...args)
{
    std::vector<Value> result;
    result.reserve(sizeof...(Args));
    (result.emplace_back(std::forward<Args>(args)), ...);
    return result;
}

/// Mixes a hash into a running seed (boost::hash_combine recipe)
inline void hashCombine(std::size_t& seed, std::size_t value) noexcept
{
    seed ^= value + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
}

/// Removes surrounding whitespace and one leading namespace separator from a type name
inline std::string_view normalizeTypeName(std::string_view name) noexcept
{
    auto const isSpace = [] (char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };

    while (! name.empty() && isSpace(name.front()))
        name.remove_prefix(1);

    while (! name.empty() && isSpace(name.back()))
        name.remove_suffix(1);

    if (! name.empty() && name.front() == '\\')
        name.remove_prefix(1);

    return name;
}

} // namespace detail

} // namespace typed
