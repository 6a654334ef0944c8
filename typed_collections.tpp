#pragma once

#include <algorithm>
#include <numeric>
#include <ranges>

namespace typed
{

//=============================================================================
// Sequence implementations
//=============================================================================
template <detail::ValueRange R> requires (! std::is_same_v<std::remove_cvref_t<R>, std::vector<Value>>)
Sequence::Sequence(Constraint constraint, std::optional<Value> defaultValue_, R && source)
    : Sequence(std::move(constraint), std::move(defaultValue_), detail::toValues(std::forward<R>(source)))
{}

template <typename Predicate>
std::optional<Value> Sequence::find(Predicate && predicate) const
{
    if (auto it = std::ranges::find_if(items, predicate); it != items.end())
        return *it;

    return std::nullopt;
}

template <typename Less>
Sequence Sequence::sortBy(Less && less) const
{
    auto sorted = items;
    std::ranges::stable_sort(sorted, std::forward<Less>(less));
    return fromSubset(std::move(sorted));
}

template <typename Predicate>
Sequence Sequence::filter(Predicate && predicate) const
{
    std::vector<Value> kept;

    for (auto const& value : items)
    {
        if (predicate(value))
            kept.push_back(value);
    }

    return fromSubset(std::move(kept));
}

template <typename Fn>
Sequence Sequence::map(Fn && fn) const
{
    std::vector<Value> mapped;
    mapped.reserve(items.size());

    for (auto const& value : items)
        mapped.emplace_back(fn(value));

    return Sequence(Constraint::infer(), std::nullopt, std::move(mapped));
}

template <typename Fn>
Value Sequence::reduce(Fn && fn, Value init) const
{
    for (auto const& value : items)
        init = fn(std::move(init), value);

    return init;
}

template <std::uniform_random_bit_generator Rng>
std::vector<std::size_t> Sequence::chooseRandomIndexes(std::size_t count, Rng& rng) const
{
    checkRandomCount(count);

    std::vector<std::size_t> indexes;
    indexes.reserve(count);
    std::ranges::sample(std::views::iota(std::size_t { 0 }, items.size()), std::back_inserter(indexes),
                        static_cast<std::ptrdiff_t>(count), rng);
    return indexes;
}

template <std::uniform_random_bit_generator Rng>
std::vector<Value> Sequence::chooseRandom(std::size_t count, Rng& rng) const
{
    std::vector<Value> chosen;

    for (auto index : chooseRandomIndexes(count, rng))
        chosen.push_back(items[index]);

    return chosen;
}

template <std::uniform_random_bit_generator Rng>
std::vector<Value> Sequence::removeRandom(std::size_t count, Rng& rng)
{
    auto const indexes = chooseRandomIndexes(count, rng);

    std::vector<Value> removed;
    removed.reserve(indexes.size());

    for (auto index : indexes)
        removed.push_back(items[index]);

    // indexes are ascending, erase from the back so earlier positions stay valid
    for (auto index : indexes | std::views::reverse)
        items.erase(items.begin() + static_cast<std::ptrdiff_t>(index));

    return removed;
}

//=============================================================================
// Dictionary implementations
//=============================================================================
template <detail::PairRange R> requires (! std::is_same_v<std::remove_cvref_t<R>, std::vector<std::pair<Value, Value>>>)
Dictionary::Dictionary(Constraint keyConstraint, Constraint valueConstraint, R && source)
    : Dictionary(std::move(keyConstraint), std::move(valueConstraint), [&source]
    {
        std::vector<std::pair<Value, Value>> entries;

        for (auto && element : source)
            entries.emplace_back(Value(detail::entryKey(element)), Value(detail::entryValue(element)));

        return entries;
    }())
{}

template <detail::PairRange R>
Dictionary& Dictionary::import(R && entries)
{
    for (auto && element : entries)
        set(Value(detail::entryKey(element)), Value(detail::entryValue(element)));

    return *this;
}

template <typename Less>
Dictionary Dictionary::sort(Less && less) const
{
    auto result = *this;
    result.store.sort(std::forward<Less>(less));
    return result;
}

template <typename Predicate>
Dictionary Dictionary::filter(Predicate && predicate) const
{
    Dictionary result(keyTypeSet, types);

    for (auto const& [key, value] : store)
    {
        if (predicate(key, value))
            result.store.set(key, value);
    }

    return result;
}

//=============================================================================
// Set implementations
//=============================================================================
template <detail::ValueRange R> requires (! std::is_same_v<std::remove_cvref_t<R>, std::vector<Value>>)
Set::Set(Constraint constraint, R && source)
    : Set(std::move(constraint), detail::toValues(std::forward<R>(source)))
{}

template <typename Predicate>
Set Set::filter(Predicate && predicate) const
{
    Set result(types);

    for (auto const& member : *this)
    {
        if (predicate(member))
            result.members.set(member, nullptr);
    }

    return result;
}

} // namespace typed
