/**
 * @file typed_collections.hpp
 * @brief Type constrained Sequence, Dictionary and Set collections
 *
 * All three collections hold Values and own a TypeSet that every written value
 * is validated against. The TypeSet is fixed at construction: it is either
 * parsed from a constraint expression, given explicitly, or inferred from the
 * initial contents.
 *
 *   - Sequence:   dense, index addressed list with a default value used to fill gaps
 *   - Dictionary: insertion ordered map whose keys can be values of any kind
 *   - Set:        insertion ordered collection of unique values
 *
 * Transformations (filter, sort, merge, ...) never modify the collection they
 * are called on; they return a new collection.
 *
 * Usage example:
 *   Sequence numbers("int");
 *   numbers.append(1, 2, 3);
 *   numbers.set(5, 6);                  // [1, 2, 3, 0, 0, 6]
 *   numbers.append("four");             // throws TypeMismatch
 *
 *   Dictionary ages("string", "uint");
 *   ages.add("alice", 31);
 *   ages["alice"];                      // 31
 *
 *   Set tags(Constraint::infer(), { "a", "b", "a" });   // {"a", "b"}
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ostream>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "typed_store.hpp"
#include "typed_typeset.hpp"

namespace typed
{

class Sequence;
class Dictionary;
class Set;

//=============================================================================
// Constraint
//=============================================================================

/**
 * @brief Describes how a collection obtains its TypeSet
 *
 * A constraint is one of
 *   - Constraint::infer(): derive the TypeSet from the initial contents
 *   - nullptr or Constraint::any(): no restriction
 *   - a constraint expression such as "int|string"
 *   - a ready made TypeSet
 *
 * Expressions are parsed immediately, so a malformed expression throws
 * ConstraintSyntaxError where the Constraint is created.
 */
class Constraint
{
public:
    static Constraint infer() noexcept { return Constraint(); }
    static Constraint any() { return Constraint(TypeSet::any()); }

    Constraint(std::nullptr_t) : types(TypeSet::any()) {}
    Constraint(char const* expression) : types(TypeSet::parse(expression)) {}
    Constraint(std::string_view expression) : types(TypeSet::parse(expression)) {}
    Constraint(std::string const& expression) : types(TypeSet::parse(expression)) {}
    Constraint(TypeSet types_) : types(std::move(types_)) {}

    bool inferred() const noexcept { return ! types.has_value(); }

    /// Returns the TypeSet, inferring it from samples if this is an infer() constraint
    TypeSet resolve(std::span<Value const> samples) const;

private:
    Constraint() noexcept = default;

    std::optional<TypeSet> types;
};

//=============================================================================
// Collection
//=============================================================================

/**
 * @brief Common base of Sequence, Dictionary and Set
 *
 * Provides the operations shared by all collections. equals() compares
 * contents only: TypeSets and default values are ignored, and collections of
 * different classes are never equal.
 *
 * Iterating a collection is restartable and finite. Modifying a collection
 * while iterating over it invalidates the iterators.
 */
class Collection
{
public:
    virtual ~Collection() = default;

    /// Returns the TypeSet that values are validated against
    TypeSet const& valueTypes() const noexcept { return types; }

    virtual std::size_t size() const noexcept = 0;
    std::size_t count() const noexcept { return size(); }
    bool empty() const noexcept { return size() == 0; }

    /// Removes all elements, keeps the TypeSet
    virtual void clear() noexcept = 0;

    /// True if the collection holds a value strictly equal to value
    virtual bool contains(Value const& value) const = 0;

    virtual bool equals(Collection const& other) const = 0;

    /// True if predicate holds for every value (vacuously true when empty)
    template <typename Predicate>
    bool all(Predicate && predicate) const
    {
        return ! anyValue([&predicate] (Value const& v) { return ! static_cast<bool>(predicate(v)); });
    }

    /// True if predicate holds for at least one value
    template <typename Predicate>
    bool any(Predicate && predicate) const
    {
        return anyValue([&predicate] (Value const& v) { return static_cast<bool>(predicate(v)); });
    }

    virtual std::string toString() const = 0;

protected:
    explicit Collection(TypeSet types_) : types(std::move(types_)) {}

    Collection(Collection const&) = default;
    Collection(Collection&&) noexcept = default;
    Collection& operator=(Collection const&) = default;
    Collection& operator=(Collection&&) noexcept = default;

    virtual bool anyValue(std::function<bool(Value const&)> const& predicate) const = 0;

    TypeSet types;
};

//=============================================================================
// Sequence
//=============================================================================

/**
 * @brief Type constrained, index addressed list of values
 *
 * Indices are dense: 0..size()-1. Writing past the end fills the gap with the
 * Sequence's default value, which is fixed at construction:
 *   - an explicitly given default (validated against the TypeSet), else
 *   - the zero value of a single primitive or pseudotype token, else
 *   - null if the TypeSet admits null, else construction throws Unrepresentable.
 *
 * An object default is cloned every time it is written into the Sequence so
 * that no two slots share an instance.
 *
 * @code
 * Sequence s("?int");
 * s.append(5);
 * s.set(2, 7);      // [5, null, 7]
 * @endcode
 */
class Sequence : public Collection
{
public:
    using const_iterator = std::vector<Value>::const_iterator;

    /// Default constructor - unrestricted, empty, default null
    Sequence();

    explicit Sequence(Constraint constraint, std::optional<Value> defaultValue_ = std::nullopt, std::vector<Value> source = {});

    template <detail::ValueRange R> requires (! std::is_same_v<std::remove_cvref_t<R>, std::vector<Value>>)
    Sequence(Constraint constraint, std::optional<Value> defaultValue_, R && source);

    /**
     * @brief Creates a Sequence of numbers from start to end (inclusive) in increments of step
     *
     * The Sequence is constrained to float if any argument is a float, else to int.
     *
     * @throws TypeMismatch if an argument is not a number
     * @throws InvalidArgument if an argument is not finite, or step is zero or points away from end
     */
    static Sequence range(Value const& start, Value const& end, Value const& step = 1);

    //=============================================================================
    // Adding and replacing values
    //=============================================================================

    /// Appends values in order. Stops at the first invalid value; earlier values stay appended.
    template <detail::ValueConvertible... Args>
    Sequence& append(Args && ...values) { return import(detail::packValues(std::forward<Args>(values)...)); }

    /// Prepends values keeping their order, validating from the last to the first
    template <detail::ValueConvertible... Args>
    Sequence& prepend(Args && ...values) { return prependValues(detail::packValues(std::forward<Args>(values)...)); }

    /// Inserts a value before index, shifting later values. Past the end, behaves like set().
    Sequence& insert(std::int64_t index, Value value);

    /// Appends all values of a range
    Sequence& import(std::span<Value const> values);

    template <detail::ValueRange R> requires (! std::is_convertible_v<R, std::span<Value const>>)
    Sequence& import(R && values) { auto const v = detail::toValues(std::forward<R>(values)); return import(std::span<Value const>(v)); }

    /// Replaces the value at index, filling any gap before it with the default value
    void set(std::int64_t index, Value value);

    /// Resets the value at index to the default value
    void unset(std::int64_t index);

    /// Sets count consecutive positions starting at start to value
    Sequence& fill(std::int64_t start, std::int64_t count, Value const& value);

    //=============================================================================
    // Removing values
    //=============================================================================
    Value removeByIndex(std::int64_t index);

    /// Removes all values equal to value, returns the number removed
    std::size_t removeByValue(Value const& value);

    /// @throws Underflow if the Sequence is empty
    Value removeFirst();

    /// @throws Underflow if the Sequence is empty
    Value removeLast();

    void clear() noexcept override { items.clear(); }

    //=============================================================================
    // Access
    //=============================================================================

    /// @throws IndexOutOfRange
    Value const& get(std::int64_t index) const;
    Value const& operator[](std::int64_t index) const { return get(index); }

    Value const& first() const;
    Value const& last() const;

    bool indexExists(std::int64_t index) const noexcept;

    /// Returns the index of the first value equal to value
    std::optional<std::size_t> search(Value const& value) const;

    /// Returns the first value for which predicate holds
    template <typename Predicate>
    std::optional<Value> find(Predicate && predicate) const;

    /**
     * @brief Returns a part of the Sequence
     *
     * A negative index counts from the end. Without a length the slice extends to
     * the end; a negative length stops that many values before the end.
     */
    Sequence slice(std::int64_t index, std::optional<std::int64_t> length = std::nullopt) const;

    /// Returns the default value used to fill gaps
    Value const& defaultValue() const noexcept { return defaultVal; }

    //=============================================================================
    // Transformations
    //=============================================================================

    /// Stable ascending sort using typed::compare
    Sequence sort() const;
    Sequence sortReverse() const;

    /// Stable sort using a strict weak ordering on Value const&
    template <typename Less>
    Sequence sortBy(Less && less) const;

    template <typename Predicate>
    Sequence filter(Predicate && predicate) const;

    Sequence reverse() const;

    /// Keeps the first occurrence of every value
    Sequence unique() const;

    /// Returns this Sequence followed by other, validated against this TypeSet
    Sequence merge(Sequence const& other) const;

    /// @throws InvalidArgument if size is zero
    std::vector<Sequence> chunk(std::size_t size) const;

    /// Returns a new Sequence with the results of fn, with an inferred TypeSet
    template <typename Fn>
    Sequence map(Fn && fn) const;

    //=============================================================================
    // Aggregation
    //=============================================================================
    template <typename Fn>
    Value reduce(Fn && fn, Value init) const;

    /// Sum of all values. int if all values are ints, else float. @throws TypeMismatch for non-numbers
    Value sum() const;

    /// Product of all values. int if all values are ints, else float. @throws TypeMismatch for non-numbers
    Value product() const;

    /// @throws Underflow if empty
    Value min() const;

    /// @throws Underflow if empty
    Value max() const;

    /// @throws Underflow if empty
    double average() const;

    /// Concatenates scalars and nulls with glue in between. Strings are not quoted, null is empty.
    std::string join(std::string_view glue = "") const;

    //=============================================================================
    // Random selection
    //=============================================================================

    /// Returns count distinct values picked at random, in Sequence order
    template <std::uniform_random_bit_generator Rng>
    std::vector<Value> chooseRandom(std::size_t count, Rng& rng) const;

    /// Removes count values picked at random and returns them, in former Sequence order
    template <std::uniform_random_bit_generator Rng>
    std::vector<Value> removeRandom(std::size_t count, Rng& rng);

    //=============================================================================
    // Conversion
    //=============================================================================

    /// Maps each distinct value to the number of times it occurs
    Dictionary countValues() const;

    /// Returns a Dictionary keyed by index
    Dictionary toDictionary() const;

    Set toSet() const;

    //=============================================================================
    // Collection interface
    //=============================================================================
    std::size_t size() const noexcept override { return items.size(); }
    bool contains(Value const& value) const override;
    bool equals(Collection const& other) const override;
    std::string toString() const override;

    const_iterator begin() const noexcept { return items.begin(); }
    const_iterator end() const noexcept { return items.end(); }

protected:
    bool anyValue(std::function<bool(Value const&)> const& predicate) const override;

private:
    Sequence& prependValues(std::vector<Value> values);

    /// Returns index as position, @throws IndexOutOfRange
    std::size_t checkIndex(std::int64_t index, bool checkUpperBound = true) const;

    /// @throws IndexOutOfRange unless 1 <= count <= size()
    void checkRandomCount(std::size_t count) const;

    template <std::uniform_random_bit_generator Rng>
    std::vector<std::size_t> chooseRandomIndexes(std::size_t count, Rng& rng) const;

    /// New Sequence with the same TypeSet and default value
    Sequence fromSubset(std::vector<Value> values) const;

    std::vector<Value> items;
    Value defaultVal;
};

//=============================================================================
// Dictionary
//=============================================================================

/**
 * @brief Type constrained map from values of any kind to values
 *
 * Keys and values are validated against separate TypeSets. Keys are compared by
 * strict equality, so 1, "1" and true are three different keys. Iteration
 * yields Store::Entry elements in insertion order:
 *
 * @code
 * for (auto const& [key, value] : dictionary)
 *     ...
 * @endcode
 */
class Dictionary : public Collection
{
public:
    using const_iterator = Store::const_iterator;

    /// Default constructor - unrestricted keys and values
    Dictionary();

    explicit Dictionary(Constraint keyConstraint, Constraint valueConstraint = Constraint::infer(),
                        std::vector<std::pair<Value, Value>> source = {});

    template <detail::PairRange R> requires (! std::is_same_v<std::remove_cvref_t<R>, std::vector<std::pair<Value, Value>>>)
    Dictionary(Constraint keyConstraint, Constraint valueConstraint, R && source);

    /**
     * @brief Creates a Dictionary from a range of keys and a range of values
     *
     * @param inferTypes Infer the key and value TypeSets, otherwise they are unrestricted
     * @throws InvalidArgument if the counts differ or the keys are not unique
     */
    static Dictionary combine(std::span<Value const> keys, std::span<Value const> values, bool inferTypes = true);

    /// Returns the TypeSet that keys are validated against
    TypeSet const& keyTypes() const noexcept { return keyTypeSet; }

    //=============================================================================
    // Adding and removing entries
    //=============================================================================

    /**
     * @brief Adds an entry, given either as key and value or as a single Pair object
     *
     * @throws ArgumentArityMismatch for any other number of arguments
     * @throws TypeMismatch if a single argument is not a Pair, or the key or value is disallowed
     */
    template <detail::ValueConvertible... Args>
    Dictionary& add(Args && ...args) { return addArguments(detail::packValues(std::forward<Args>(args)...)); }

    /// Inserts or overwrites an entry. Overwritten entries keep their position.
    void set(Value key, Value value);

    Dictionary& import(std::span<std::pair<Value, Value> const> entries);

    template <detail::PairRange R>
    Dictionary& import(R && entries);

    /// @throws KeyNotFound
    Value removeByKey(Value const& key);

    /// Removes all entries whose value equals value, returns the number removed
    std::size_t removeByValue(Value const& value);

    /// @throws KeyNotFound
    void unset(Value const& key) { removeByKey(key); }

    void clear() noexcept override { store.clear(); }

    //=============================================================================
    // Access
    //=============================================================================

    /// @throws TypeMismatch for a disallowed key type, KeyNotFound for an absent key
    Value const& get(Value const& key) const;
    Value const& operator[](Value const& key) const { return get(key); }

    /// Returns a pointer to the value stored under key, or nullptr
    Value const* find(Value const& key) const { return store.find(key); }

    bool keyExists(Value const& key) const { return store.exists(key); }

    std::vector<Value> keys() const;
    std::vector<Value> values() const;

    //=============================================================================
    // Transformations
    //=============================================================================

    /// Stable sort using a strict weak ordering on Store::Entry const&
    template <typename Less>
    Dictionary sort(Less && less) const;

    Dictionary sortByKey() const;
    Dictionary sortByValue() const;

    /// Swaps keys and values. @throws InvalidArgument if values are not unique
    Dictionary flip() const;

    /// Entries of this then other, later entries overwrite earlier ones. TypeSets are united.
    Dictionary merge(Dictionary const& other) const;

    /// Keeps the entries for which predicate(key, value) holds
    template <typename Predicate>
    Dictionary filter(Predicate && predicate) const;

    //=============================================================================
    // Conversion
    //=============================================================================

    /// Returns a Sequence of Pair objects
    Sequence toSequence() const;

    /// Exports to an Array. @throws TypeMismatch for keys that are neither int nor string
    Array toArray() const;

    //=============================================================================
    // Collection interface
    //=============================================================================
    std::size_t size() const noexcept override { return store.size(); }
    bool contains(Value const& value) const override;
    bool equals(Collection const& other) const override;
    std::string toString() const override;

    const_iterator begin() const noexcept { return store.begin(); }
    const_iterator end() const noexcept { return store.end(); }

protected:
    bool anyValue(std::function<bool(Value const&)> const& predicate) const override;

private:
    Dictionary(TypeSet keyTypes_, TypeSet valueTypes_);

    Dictionary& addArguments(std::vector<Value> args);

    TypeSet keyTypeSet;
    Store store;
};

//=============================================================================
// Set
//=============================================================================

/**
 * @brief Type constrained collection of unique values
 *
 * Values are kept in first-seen order; adding a value that is already present
 * is a no-op. equals() ignores order.
 */
class Set : public Collection
{
public:
    /// Iterates the members of a Set
    class const_iterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = Value;
        using difference_type   = std::ptrdiff_t;
        using pointer           = Value const*;
        using reference         = Value const&;

        const_iterator() = default;
        explicit const_iterator(Store::const_iterator it_) : it(it_) {}

        reference operator*() const  { return it->key; }
        pointer   operator->() const { return &it->key; }

        const_iterator& operator++()   { ++it; return *this; }
        const_iterator  operator++(int) { auto copy = *this; ++it; return copy; }

        friend bool operator==(const_iterator const& a, const_iterator const& b) { return a.it == b.it; }

    private:
        Store::const_iterator it;
    };

    /// Default constructor - unrestricted, empty
    Set();

    explicit Set(Constraint constraint, std::vector<Value> source = {});

    template <detail::ValueRange R> requires (! std::is_same_v<std::remove_cvref_t<R>, std::vector<Value>>)
    Set(Constraint constraint, R && source);

    /// Adds values in order, ignoring duplicates. Stops at the first invalid value.
    template <detail::ValueConvertible... Args>
    Set& add(Args && ...values) { return import(detail::packValues(std::forward<Args>(values)...)); }

    Set& import(std::span<Value const> values);

    template <detail::ValueRange R> requires (! std::is_convertible_v<R, std::span<Value const>>)
    Set& import(R && values) { auto const v = detail::toValues(std::forward<R>(values)); return import(std::span<Value const>(v)); }

    /// Returns false if value was not a member
    bool remove(Value const& value);

    void clear() noexcept override { members.clear(); }

    //=============================================================================
    // Set algebra
    //=============================================================================

    /// Members of this or other. The TypeSets are united.
    Set unite(Set const& other) const;

    /// Members of this that are also in other
    Set intersect(Set const& other) const;

    /// Members of this that are not in other
    Set diff(Set const& other) const;

    bool isSubsetOf(Set const& other) const;
    bool isProperSubsetOf(Set const& other) const;
    bool isSupersetOf(Set const& other) const;
    bool isProperSupersetOf(Set const& other) const;
    bool isDisjointFrom(Set const& other) const;

    template <typename Predicate>
    Set filter(Predicate && predicate) const;

    //=============================================================================
    // Conversion
    //=============================================================================

    /// Returns a Dictionary keyed 0..size()-1
    Dictionary toDictionary() const;

    /**
     * @brief Returns the members as a Sequence with the same TypeSet
     *
     * @throws Unrepresentable if no default is given and none can be derived
     */
    Sequence toSequence(std::optional<Value> defaultValue = std::nullopt) const;

    //=============================================================================
    // Collection interface
    //=============================================================================
    std::size_t size() const noexcept override { return members.size(); }
    bool contains(Value const& value) const override { return members.exists(value); }
    bool equals(Collection const& other) const override;
    std::string toString() const override;

    const_iterator begin() const noexcept { return const_iterator(members.begin()); }
    const_iterator end() const noexcept { return const_iterator(members.end()); }

protected:
    bool anyValue(std::function<bool(Value const&)> const& predicate) const override;

private:
    Store members;
};

std::ostream& operator<<(std::ostream& o, Collection const& collection);

} // namespace typed

// std::formatter specializations
template <>
struct std::formatter<typed::Sequence> : std::formatter<std::string>
{
    auto format(typed::Sequence const& s, format_context& ctx) const
    {
        return std::formatter<std::string>::format(s.toString(), ctx);
    }
};

template <>
struct std::formatter<typed::Dictionary> : std::formatter<std::string>
{
    auto format(typed::Dictionary const& d, format_context& ctx) const
    {
        return std::formatter<std::string>::format(d.toString(), ctx);
    }
};

template <>
struct std::formatter<typed::Set> : std::formatter<std::string>
{
    auto format(typed::Set const& s, format_context& ctx) const
    {
        return std::formatter<std::string>::format(s.toString(), ctx);
    }
};

// Include template implementations
#include "typed_collections.tpp"
