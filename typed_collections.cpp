#include "typed_collections.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <sstream>

namespace typed
{

//=============================================================================
// Constraint implementations
//=============================================================================
TypeSet Constraint::resolve(std::span<Value const> samples) const
{
    if (types)
        return *types;

    return TypeSet::infer(samples);
}

//=============================================================================
// Sequence implementations
//=============================================================================
Sequence::Sequence() : Sequence(Constraint::infer()) {}

Sequence::Sequence(Constraint constraint, std::optional<Value> defaultValue_, std::vector<Value> source)
    : Collection(constraint.resolve(source))
{
    if (defaultValue_)
    {
        types.validate(*defaultValue_, "default value");
        defaultVal = std::move(*defaultValue_);
    }
    else
    {
        defaultVal = types.deriveDefault();
    }

    import(source);
}

Sequence Sequence::range(Value const& start, Value const& end, Value const& step)
{
    auto const s = start.toNumber();
    auto const e = end.toNumber();
    auto const d = step.toNumber();

    if (! std::isfinite(s) || ! std::isfinite(e) || ! std::isfinite(d))
        throw InvalidArgument("Range bounds and step size must be finite numbers.");

    if (d == 0)
        throw InvalidArgument("The step size cannot be zero.");

    if (s < e && d < 0)
        throw InvalidArgument("The step size must be positive for an increasing range.");

    if (s > e && d > 0)
        throw InvalidArgument("The step size must be negative for a decreasing range.");

    if (start.isInt() && end.isInt() && step.isInt())
    {
        Sequence result("int");

        auto const first = start.asInt();
        auto const last = end.asInt();
        auto const increment = step.asInt();

        for (auto i = first; increment > 0 ? i <= last : i >= last; i += increment)
        {
            result.items.emplace_back(i);

            // distances in unsigned arithmetic, exact for any pair of int64 values
            auto const remaining = increment > 0 ? static_cast<std::uint64_t>(last) - static_cast<std::uint64_t>(i)
                                                 : static_cast<std::uint64_t>(i) - static_cast<std::uint64_t>(last);
            auto const stride = increment > 0 ? static_cast<std::uint64_t>(increment)
                                              : std::uint64_t { 0 } - static_cast<std::uint64_t>(increment);

            // stop before the next increment would pass last (or overflow)
            if (remaining < stride)
                break;
        }

        return result;
    }

    Sequence result("float");

    // multiply instead of accumulating so that rounding errors don't add up
    for (std::int64_t n = 0;; ++n)
    {
        auto const x = s + static_cast<double>(n) * d;

        if (d > 0 ? x > e : x < e)
            break;

        result.items.emplace_back(x);
    }

    return result;
}

Sequence& Sequence::prependValues(std::vector<Value> values)
{
    for (auto& value : values | std::views::reverse)
    {
        types.validate(value);
        items.insert(items.begin(), std::move(value));
    }

    return *this;
}

Sequence& Sequence::insert(std::int64_t index, Value value)
{
    types.validate(value);

    auto const pos = checkIndex(index, false);

    if (pos >= items.size())
    {
        set(index, std::move(value));
        return *this;
    }

    items.insert(items.begin() + static_cast<std::ptrdiff_t>(pos), std::move(value));
    return *this;
}

Sequence& Sequence::import(std::span<Value const> values)
{
    // values may point into items (s.import(s)), which push_back can reallocate
    auto const* const data = items.data();
    auto const before = std::less<Value const*>();

    if (! values.empty() && ! before(values.data(), data) && before(values.data(), data + items.size()))
    {
        std::vector<Value> const snapshot(values.begin(), values.end());
        return import(std::span<Value const>(snapshot));
    }

    for (auto const& value : values)
    {
        types.validate(value);
        items.push_back(value);
    }

    return *this;
}

void Sequence::set(std::int64_t index, Value value)
{
    types.validate(value);

    auto const pos = checkIndex(index, false);

    if (pos < items.size())
    {
        items[pos] = std::move(value);
        return;
    }

    items.reserve(pos + 1);

    while (items.size() < pos)
        items.push_back(defaultVal.clone());

    items.push_back(std::move(value));
}

void Sequence::unset(std::int64_t index)
{
    items[checkIndex(index)] = defaultVal.clone();
}

Sequence& Sequence::fill(std::int64_t start, std::int64_t count, Value const& value)
{
    for (std::int64_t i = 0; i < count; ++i)
        set(start + i, value);

    return *this;
}

Value Sequence::removeByIndex(std::int64_t index)
{
    auto const pos = checkIndex(index);
    auto removed = std::move(items[pos]);
    items.erase(items.begin() + static_cast<std::ptrdiff_t>(pos));
    return removed;
}

std::size_t Sequence::removeByValue(Value const& value)
{
    return std::erase(items, value);
}

Value Sequence::removeFirst()
{
    if (items.empty())
        throw Underflow("No items in the Sequence.");

    auto removed = std::move(items.front());
    items.erase(items.begin());
    return removed;
}

Value Sequence::removeLast()
{
    if (items.empty())
        throw Underflow("No items in the Sequence.");

    auto removed = std::move(items.back());
    items.pop_back();
    return removed;
}

Value const& Sequence::get(std::int64_t index) const
{
    return items[checkIndex(index)];
}

Value const& Sequence::first() const
{
    if (items.empty())
        throw IndexOutOfRange("Cannot get the first item of an empty Sequence.");

    return items.front();
}

Value const& Sequence::last() const
{
    if (items.empty())
        throw IndexOutOfRange("Cannot get the last item of an empty Sequence.");

    return items.back();
}

bool Sequence::indexExists(std::int64_t index) const noexcept
{
    return index >= 0 && static_cast<std::size_t>(index) < items.size();
}

std::optional<std::size_t> Sequence::search(Value const& value) const
{
    if (auto it = std::ranges::find(items, value); it != items.end())
        return static_cast<std::size_t>(it - items.begin());

    return std::nullopt;
}

Sequence Sequence::slice(std::int64_t index, std::optional<std::int64_t> length) const
{
    auto const n = static_cast<std::int64_t>(items.size());

    auto const from = std::clamp(index < 0 ? n + index : index, std::int64_t { 0 }, n);
    auto to = n;

    if (length)
        to = *length < 0 ? n + *length : from + *length;

    to = std::clamp(to, from, n);

    return fromSubset(std::vector<Value>(items.begin() + from, items.begin() + to));
}

Sequence Sequence::sort() const
{
    return sortBy([] (Value const& a, Value const& b) { return compare(a, b) < 0; });
}

Sequence Sequence::sortReverse() const
{
    return sortBy([] (Value const& a, Value const& b) { return compare(a, b) > 0; });
}

Sequence Sequence::reverse() const
{
    return fromSubset(std::vector<Value>(items.rbegin(), items.rend()));
}

Sequence Sequence::unique() const
{
    Store seen;
    std::vector<Value> kept;

    for (auto const& value : items)
    {
        if (! seen.set(value, nullptr))
            kept.push_back(value);
    }

    return fromSubset(std::move(kept));
}

Sequence Sequence::merge(Sequence const& other) const
{
    auto merged = items;
    merged.insert(merged.end(), other.items.begin(), other.items.end());
    return fromSubset(std::move(merged));
}

std::vector<Sequence> Sequence::chunk(std::size_t size) const
{
    if (size == 0)
        throw InvalidArgument("The chunk size must be greater than zero.");

    std::vector<Sequence> chunks;

    for (std::size_t start = 0; start < items.size(); start += size)
    {
        auto const stop = std::min(start + size, items.size());
        chunks.push_back(fromSubset(std::vector<Value>(items.begin() + static_cast<std::ptrdiff_t>(start),
                                                       items.begin() + static_cast<std::ptrdiff_t>(stop))));
    }

    return chunks;
}

namespace
{
void requireNumber(Value const& value, std::string_view operation)
{
    if (! value.isNumber())
        throw TypeMismatch(std::format("Cannot {} a {} value ({}).", operation, typeName(value), abbreviate(value)));
}

template <typename IntOp, typename FloatOp>
Value accumulateNumbers(std::vector<Value> const& items, Value init, std::string_view operation, IntOp intOp, FloatOp floatOp)
{
    for (auto const& value : items)
    {
        requireNumber(value, operation);

        if (init.isInt() && value.isInt())
            init = intOp(init.asInt(), value.asInt());
        else
            init = floatOp(init.toNumber(), value.toNumber());
    }

    return init;
}
} // namespace

Value Sequence::sum() const
{
    return accumulateNumbers(items, 0, "sum", std::plus<std::int64_t>(), std::plus<double>());
}

Value Sequence::product() const
{
    return accumulateNumbers(items, 1, "multiply", std::multiplies<std::int64_t>(), std::multiplies<double>());
}

Value Sequence::min() const
{
    if (items.empty())
        throw Underflow("Cannot find the minimum value of an empty Sequence.");

    return *std::ranges::min_element(items, [] (Value const& a, Value const& b) { return compare(a, b) < 0; });
}

Value Sequence::max() const
{
    if (items.empty())
        throw Underflow("Cannot find the maximum value of an empty Sequence.");

    return *std::ranges::max_element(items, [] (Value const& a, Value const& b) { return compare(a, b) < 0; });
}

double Sequence::average() const
{
    if (items.empty())
        throw Underflow("Cannot calculate the average value of an empty Sequence.");

    return sum().toNumber() / static_cast<double>(items.size());
}

std::string Sequence::join(std::string_view glue) const
{
    std::string result;

    for (std::size_t i = 0; i < items.size(); ++i)
    {
        auto const& value = items[i];

        if (! value.isScalar() && ! value.isNull())
            throw TypeMismatch(std::format("Cannot join a {} value.", typeName(value)));

        if (i > 0)
            result += glue;

        if (value.isString())
            result += value.asString();
        else if (! value.isNull())
            result += typed::toString(value);
    }

    return result;
}

void Sequence::checkRandomCount(std::size_t count) const
{
    if (items.empty())
        throw IndexOutOfRange("Cannot choose items from an empty Sequence.");

    if (count == 0 || count > items.size())
        throw IndexOutOfRange(std::format("Cannot choose {} items from a Sequence with {} items.", count, items.size()));
}

Dictionary Sequence::countValues() const
{
    Dictionary counts(types, "uint");

    for (auto const& value : items)
    {
        auto const* current = counts.find(value);
        counts.set(value, current != nullptr ? current->asInt() + 1 : 1);
    }

    return counts;
}

Dictionary Sequence::toDictionary() const
{
    Dictionary result("int", types);

    for (std::size_t i = 0; i < items.size(); ++i)
        result.set(i, items[i]);

    return result;
}

Set Sequence::toSet() const
{
    return Set(types, items);
}

bool Sequence::contains(Value const& value) const
{
    return std::ranges::find(items, value) != items.end();
}

bool Sequence::equals(Collection const& other) const
{
    auto const* sequence = dynamic_cast<Sequence const*>(&other);
    return sequence != nullptr && items == sequence->items;
}

std::string Sequence::toString() const
{
    std::ostringstream ss;
    ss << "Sequence<" << types << "> [";

    for (std::size_t i = 0; i < items.size(); ++i)
        ss << (i > 0 ? ", " : "") << items[i];

    ss << "]";
    return ss.str();
}

bool Sequence::anyValue(std::function<bool(Value const&)> const& predicate) const
{
    return std::ranges::any_of(items, predicate);
}

std::size_t Sequence::checkIndex(std::int64_t index, bool checkUpperBound) const
{
    if (index < 0)
        throw IndexOutOfRange(std::format("Index {} cannot be negative.", index));

    auto const pos = static_cast<std::size_t>(index);

    if (checkUpperBound && pos >= items.size())
        throw IndexOutOfRange(std::format("Index {} is out of range (size {}).", index, items.size()));

    return pos;
}

Sequence Sequence::fromSubset(std::vector<Value> values) const
{
    return Sequence(types, defaultVal, std::move(values));
}

//=============================================================================
// Dictionary implementations
//=============================================================================
Dictionary::Dictionary() : Dictionary(Constraint::infer(), Constraint::infer()) {}

Dictionary::Dictionary(Constraint keyConstraint, Constraint valueConstraint, std::vector<std::pair<Value, Value>> source)
    : Collection(TypeSet::any())
{
    std::vector<Value> sampleKeys;
    std::vector<Value> sampleValues;

    if (keyConstraint.inferred() || valueConstraint.inferred())
    {
        for (auto const& [key, value] : source)
        {
            sampleKeys.push_back(key);
            sampleValues.push_back(value);
        }
    }

    keyTypeSet = keyConstraint.resolve(sampleKeys);
    types = valueConstraint.resolve(sampleValues);

    for (auto& [key, value] : source)
        set(std::move(key), std::move(value));
}

Dictionary::Dictionary(TypeSet keyTypes_, TypeSet valueTypes_)
    : Collection(std::move(valueTypes_)), keyTypeSet(std::move(keyTypes_))
{}

Dictionary Dictionary::combine(std::span<Value const> keys, std::span<Value const> values, bool inferTypes)
{
    if (keys.size() != values.size())
        throw InvalidArgument(std::format("Cannot combine: keys count ({}) does not match values count ({}).", keys.size(), values.size()));

    Store seen;
    std::vector<std::pair<Value, Value>> entries;
    entries.reserve(keys.size());

    for (std::size_t i = 0; i < keys.size(); ++i)
    {
        if (seen.set(keys[i], nullptr))
            throw InvalidArgument(std::format("Cannot combine: key {} is not unique.", abbreviate(keys[i])));

        entries.emplace_back(keys[i], values[i]);
    }

    if (inferTypes)
        return Dictionary(Constraint::infer(), Constraint::infer(), std::move(entries));

    return Dictionary(Constraint::any(), Constraint::any(), std::move(entries));
}

Dictionary& Dictionary::addArguments(std::vector<Value> args)
{
    if (args.size() == 2)
    {
        set(std::move(args[0]), std::move(args[1]));
        return *this;
    }

    if (args.size() != 1)
        throw ArgumentArityMismatch(std::format("add() takes 1 or 2 arguments, got {}.", args.size()));

    auto const pair = args.front().as<Pair>();

    if (pair == nullptr)
        throw TypeMismatch(std::format("Invalid key-value pair: {}.", abbreviate(args.front())));

    set(pair->key(), pair->value());
    return *this;
}

void Dictionary::set(Value key, Value value)
{
    keyTypeSet.validate(key, "key");
    types.validate(value, "value");
    store.set(std::move(key), std::move(value));
}

Dictionary& Dictionary::import(std::span<std::pair<Value, Value> const> entries)
{
    for (auto const& [key, value] : entries)
        set(key, value);

    return *this;
}

Value Dictionary::removeByKey(Value const& key)
{
    keyTypeSet.validate(key, "key");
    return store.remove(key);
}

std::size_t Dictionary::removeByValue(Value const& value)
{
    types.validate(value, "value");

    std::vector<Value> matchingKeys;

    for (auto const& [key, stored] : store)
    {
        if (stored == value)
            matchingKeys.push_back(key);
    }

    for (auto const& key : matchingKeys)
        store.remove(key);

    return matchingKeys.size();
}

Value const& Dictionary::get(Value const& key) const
{
    keyTypeSet.validate(key, "key");
    return store.get(key);
}

std::vector<Value> Dictionary::keys() const
{
    std::vector<Value> result;
    result.reserve(store.size());

    for (auto const& [key, value] : store)
        result.push_back(key);

    return result;
}

std::vector<Value> Dictionary::values() const
{
    std::vector<Value> result;
    result.reserve(store.size());

    for (auto const& [key, value] : store)
        result.push_back(value);

    return result;
}

Dictionary Dictionary::sortByKey() const
{
    return sort([] (Store::Entry const& a, Store::Entry const& b) { return compare(a.key, b.key) < 0; });
}

Dictionary Dictionary::sortByValue() const
{
    return sort([] (Store::Entry const& a, Store::Entry const& b) { return compare(a.value, b.value) < 0; });
}

Dictionary Dictionary::flip() const
{
    Dictionary result(types, keyTypeSet);

    for (auto const& [key, value] : store)
    {
        if (result.store.exists(value))
            throw InvalidArgument(std::format("Cannot flip Dictionary: value {} is not unique.", abbreviate(value)));

        result.store.set(value, key);
    }

    return result;
}

Dictionary Dictionary::merge(Dictionary const& other) const
{
    Dictionary result(keyTypeSet.unite(other.keyTypeSet), types.unite(other.types));

    for (auto const& [key, value] : store)
        result.store.set(key, value);

    for (auto const& [key, value] : other.store)
        result.store.set(key, value);

    return result;
}

Sequence Dictionary::toSequence() const
{
    std::vector<Value> pairs;
    pairs.reserve(store.size());

    for (auto const& [key, value] : store)
        pairs.push_back(makeObject<Pair>(key, value));

    return Sequence("?Pair", std::nullopt, std::move(pairs));
}

Array Dictionary::toArray() const
{
    Array result;

    for (auto const& [key, value] : store)
    {
        if (key.isInt())
            result.set(key.asInt(), value);
        else if (key.isString())
            result.set(key.asString(), value);
        else
            throw TypeMismatch(std::format("Cannot export a {} key ({}) to an array.", typeName(key), abbreviate(key)));
    }

    return result;
}

bool Dictionary::contains(Value const& value) const
{
    return std::ranges::any_of(store, [&value] (Store::Entry const& e) { return e.value == value; });
}

bool Dictionary::equals(Collection const& other) const
{
    auto const* dictionary = dynamic_cast<Dictionary const*>(&other);

    if (dictionary == nullptr || dictionary->size() != size())
        return false;

    return std::ranges::equal(store, dictionary->store, [] (Store::Entry const& a, Store::Entry const& b)
    {
        return a.key == b.key && a.value == b.value;
    });
}

std::string Dictionary::toString() const
{
    std::ostringstream ss;
    ss << "Dictionary<" << keyTypeSet << ", " << types << "> {";

    auto first = true;
    for (auto const& [key, value] : store)
        ss << (std::exchange(first, false) ? "" : ", ") << key << " => " << value;

    ss << "}";
    return ss.str();
}

bool Dictionary::anyValue(std::function<bool(Value const&)> const& predicate) const
{
    return std::ranges::any_of(store, [&predicate] (Store::Entry const& e) { return predicate(e.value); });
}

//=============================================================================
// Set implementations
//=============================================================================
Set::Set() : Set(Constraint::infer()) {}

Set::Set(Constraint constraint, std::vector<Value> source)
    : Collection(constraint.resolve(source))
{
    import(source);
}

Set& Set::import(std::span<Value const> values)
{
    for (auto const& value : values)
    {
        types.validate(value);

        if (! members.exists(value))
            members.set(value, nullptr);
    }

    return *this;
}

bool Set::remove(Value const& value)
{
    if (! members.exists(value))
        return false;

    members.remove(value);
    return true;
}

Set Set::unite(Set const& other) const
{
    Set result(types.unite(other.types));
    result.members = members;

    for (auto const& member : other)
    {
        if (! result.members.exists(member))
            result.members.set(member, nullptr);
    }

    return result;
}

Set Set::intersect(Set const& other) const
{
    return filter([&other] (Value const& member) { return other.contains(member); });
}

Set Set::diff(Set const& other) const
{
    return filter([&other] (Value const& member) { return ! other.contains(member); });
}

bool Set::isSubsetOf(Set const& other) const
{
    return std::ranges::all_of(*this, [&other] (Value const& member) { return other.contains(member); });
}

bool Set::isProperSubsetOf(Set const& other) const
{
    return size() < other.size() && isSubsetOf(other);
}

bool Set::isSupersetOf(Set const& other) const
{
    return other.isSubsetOf(*this);
}

bool Set::isProperSupersetOf(Set const& other) const
{
    return other.isProperSubsetOf(*this);
}

bool Set::isDisjointFrom(Set const& other) const
{
    return std::ranges::none_of(*this, [&other] (Value const& member) { return other.contains(member); });
}

Dictionary Set::toDictionary() const
{
    Dictionary result("uint", types);

    std::int64_t key = 0;
    for (auto const& member : *this)
        result.set(key++, member);

    return result;
}

Sequence Set::toSequence(std::optional<Value> defaultValue) const
{
    return Sequence(types, std::move(defaultValue), *this);
}

bool Set::equals(Collection const& other) const
{
    auto const* set = dynamic_cast<Set const*>(&other);
    return set != nullptr && set->size() == size() && isSubsetOf(*set);
}

std::string Set::toString() const
{
    std::ostringstream ss;
    ss << "Set<" << types << "> {";

    auto first = true;
    for (auto const& member : *this)
        ss << (std::exchange(first, false) ? "" : ", ") << member;

    ss << "}";
    return ss.str();
}

bool Set::anyValue(std::function<bool(Value const&)> const& predicate) const
{
    return std::ranges::any_of(*this, predicate);
}

//=============================================================================
// Stream operators implementations
//=============================================================================
std::ostream& operator<<(std::ostream& o, Collection const& collection)
{
    return o << collection.toString();
}

} // namespace typed
