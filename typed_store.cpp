#include "typed_store.hpp"

#include <bit>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>

namespace typed
{

//=============================================================================
// Canonicalization
//=============================================================================
namespace
{
void appendWord(std::string& out, std::uint64_t word)
{
    for (auto i = 0; i < 8; ++i)
        out.push_back(static_cast<char>((word >> (8 * i)) & 0xff));
}

void encode(std::string& out, Value const& value);

void encodeKey(std::string& out, ArrayKey const& key)
{
    std::visit([&out] (auto const& k) { encode(out, Value(k)); }, key);
}

void encode(std::string& out, Value const& value)
{
    out.push_back(static_cast<char>(value.kind()));

    value.visit(cxxutils::multilambda(
        [] (std::nullptr_t) {},
        [&out] (bool b)
        {
            out.push_back(b ? '\1' : '\0');
        },
        [&out] (std::int64_t i)
        {
            appendWord(out, static_cast<std::uint64_t>(i));
        },
        [&out] (double d)
        {
            if (std::isnan(d))
                d = std::numeric_limits<double>::quiet_NaN();
            else if (d == 0.0)
                d = 0.0;

            appendWord(out, std::bit_cast<std::uint64_t>(d));
        },
        [&out] (std::string const& s)
        {
            appendWord(out, s.size());
            out.append(s);
        },
        [&out] (Array const& array)
        {
            appendWord(out, array.size());

            for (auto const& [key, element] : array)
            {
                encodeKey(out, key);
                encode(out, element);
            }
        },
        [&out] (Value::ObjectPtr const& object)
        {
            appendWord(out, std::bit_cast<std::uintptr_t>(object.get()));
        }
    ));
}
} // namespace

CanonicalKey canonicalize(Value const& value)
{
    CanonicalKey result;
    encode(result.exact, value);
    result.bucket = std::hash<std::string>{}(result.exact);
    return result;
}

//=============================================================================
// Store implementations
//=============================================================================
Value const& Store::get(Value const& key) const
{
    if (auto const* value = find(key))
        return *value;

    throw KeyNotFound(std::format("Key not found: {}.", abbreviate(key)));
}

Value const* Store::find(Value const& key) const
{
    if (auto const pos = position(key))
        return &entries[*pos].value;

    return nullptr;
}

std::optional<Value> Store::set(Value key, Value value)
{
    auto canonical = canonicalize(key);

    if (auto it = index.find(canonical); it != index.end())
    {
        auto previous = std::exchange(entries[it->second], Entry { std::move(key), std::move(value) });
        return std::move(previous.value);
    }

    index.emplace(std::move(canonical), entries.size());
    entries.push_back({ std::move(key), std::move(value) });
    return std::nullopt;
}

Value Store::remove(Value const& key)
{
    auto it = index.find(canonicalize(key));

    if (it == index.end())
        throw KeyNotFound(std::format("Key not found: {}.", abbreviate(key)));

    auto const removedAt = it->second;
    index.erase(it);

    auto removed = std::move(entries[removedAt].value);
    entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(removedAt));

    for (auto& [canonical, pos] : index)
    {
        if (pos > removedAt)
            --pos;
    }

    return removed;
}

bool Store::exists(Value const& key) const
{
    return index.contains(canonicalize(key));
}

std::optional<std::size_t> Store::position(Value const& key) const
{
    if (auto it = index.find(canonicalize(key)); it != index.end())
        return it->second;

    return std::nullopt;
}

void Store::clear() noexcept
{
    entries.clear();
    index.clear();
}

Store::Entry const& Store::at(std::size_t pos) const
{
    if (pos >= entries.size())
        throw IndexOutOfRange(std::format("Position {} is out of range (size {}).", pos, entries.size()));

    return entries[pos];
}

void Store::reindex()
{
    index.clear();

    for (std::size_t i = 0; i < entries.size(); ++i)
        index.emplace(canonicalize(entries[i].key), i);
}

} // namespace typed
