/**
 * @file typed_value.hpp
 * @brief Dynamically typed values with strict equality
 *
 * Value is the element type of every collection in this library. It is a closed,
 * tagged union of the runtime kinds null, bool, int, float, string, array and
 * object. Everything that needs to know "what is this value" (validation,
 * canonicalization, equality, printing) switches on the Kind tag instead of
 * probing types ad hoc.
 *
 * Objects are reference values: a Value holds a shared pointer to an Object and
 * two Values are equal only if they point to the same instance. Each object
 * class is described by a MetaClass, which knows the nominal supertypes of the
 * class (parent classes, interfaces and traits).
 *
 * Usage example:
 *   struct Point { int x; int y; };
 *   using Shape  = Interface<"Shape">;
 *   using PointObject = Record<Point, "Point", Shape>;
 *
 *   Value a = 42;
 *   Value b = "hello";
 *   Value c = Array { 1, 2, 3 };
 *   Value d = makeObject<PointObject>(1, 2);
 *   d.asObject()->metaClass().satisfies("Shape");   // true
 */

#pragma once

#ifndef TYPED_ABBREVIATE_LENGTH
 #define TYPED_ABBREVIATE_LENGTH 20
#endif

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <initializer_list>
#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <fixed_string.hpp>
#include "typed_detail.hpp"
#include "typed_errors.hpp"

namespace typed
{

class Value;
class Array;
class Object;

/**
 * @brief Runtime type tag of a Value
 *
 * The order of the enumerators is also the order in which values of different
 * kinds are bucketed by the key canonicalizer, so new kinds must be appended.
 */
enum class Kind : std::uint8_t
{
    null,
    boolean,
    integer,
    floating,
    string,
    array,
    object
};

/// Returns the type name used in constraint expressions for a kind ("int", "float", ...)
std::string_view kindName(Kind kind) noexcept;

//=============================================================================
// Nominal types
//=============================================================================

/**
 * @brief Describes a nominal (named) object type
 *
 * A MetaClass has a name, a category (class, interface or trait) and a list of
 * direct supertypes. The full set of names a class satisfies (itself, all
 * ancestors, all interfaces and traits reachable from it) is computed the first
 * time it is needed and cached for the lifetime of the MetaClass.
 *
 * MetaClass instances are normally function-local statics created by
 * Record<>::meta(), Interface<>::meta() and Trait<>::meta(), but can also be
 * created directly for classes that derive from Object by hand.
 */
class MetaClass
{
public:
    enum class Category
    {
        classType,
        interfaceType,
        traitType
    };

    MetaClass(std::string_view name_, Category category_, std::vector<MetaClass const*> supertypes_ = {});

    MetaClass(MetaClass const&) = delete;
    MetaClass& operator=(MetaClass const&) = delete;

    /// Returns the name of the type, without a leading namespace separator
    std::string_view name() const noexcept { return className; }

    Category category() const noexcept { return typeCategory; }

    /// Returns the direct supertypes in declaration order
    std::span<MetaClass const* const> supertypes() const noexcept { return directSupertypes; }

    /**
     * @brief Checks whether this type is, derives from, implements or uses the named type
     *
     * @param typeName A class, interface or trait name. A leading "\" is ignored.
     */
    bool satisfies(std::string_view typeName) const;

    /// Returns the cached closure of all type names this type satisfies (including itself)
    std::set<std::string, std::less<>> const& closure() const;

private:
    std::string className;
    Category typeCategory;
    std::vector<MetaClass const*> directSupertypes;
    mutable std::optional<std::set<std::string, std::less<>>> cachedClosure;
};

/**
 * @brief Abstract base class of all reference values
 *
 * Objects are always held by std::shared_ptr inside a Value. Identity, not
 * content, determines equality between two object values.
 */
class Object
{
public:
    virtual ~Object() = default;

    /// Returns the nominal type of this object
    virtual MetaClass const& metaClass() const = 0;

    /**
     * @brief Returns a deep copy of this object
     *
     * Used whenever an object value has to be materialized more than once,
     * e.g. when a Sequence fills a gap with its default value.
     */
    virtual std::shared_ptr<Object> clone() const = 0;

    /// Writes a human readable description (default: "<ClassName>")
    virtual void describe(std::ostream& o) const;

protected:
    Object() = default;
    Object(Object const&) = default;
    Object& operator=(Object const&) = default;
};

//=============================================================================
// Value
//=============================================================================

/**
 * @brief A dynamically typed value
 *
 * Values have value semantics except for objects, which are shared by
 * reference. Arrays are immutable once wrapped in a Value, so copying a Value
 * never copies array contents.
 *
 * Equality (operator==) is strict: both the kind and the content must be
 * identical, so 1, 1.0, "1" and true are four different values.
 */
class Value
{
public:
    using ObjectPtr = std::shared_ptr<Object>;

    /// Default constructor - creates null
    Value() noexcept = default;

    /// Construct null
    Value(std::nullptr_t) noexcept {}

    Value(bool b) noexcept : storage(b) {}

    template <std::integral T> requires (! std::is_same_v<T, bool>)
    Value(T i) noexcept : storage(static_cast<std::int64_t>(i)) {}

    template <std::floating_point T>
    Value(T f) noexcept : storage(static_cast<double>(f)) {}

    Value(std::string s) : storage(std::move(s)) {}
    Value(std::string_view s) : storage(std::string(s)) {}
    Value(char const* s) : storage(std::string(s)) {}

    Value(Array a);

    /// Construct an object value. A null pointer yields a null value.
    template <std::derived_from<Object> T>
    Value(std::shared_ptr<T> object);

    /// Returns the runtime type tag
    Kind kind() const noexcept { return static_cast<Kind>(storage.index()); }

    bool isNull() const noexcept   { return kind() == Kind::null; }
    bool isBool() const noexcept   { return kind() == Kind::boolean; }
    bool isInt() const noexcept    { return kind() == Kind::integer; }
    bool isFloat() const noexcept  { return kind() == Kind::floating; }
    bool isString() const noexcept { return kind() == Kind::string; }
    bool isArray() const noexcept  { return kind() == Kind::array; }
    bool isObject() const noexcept { return kind() == Kind::object; }

    /// True for int and float values
    bool isNumber() const noexcept { return isInt() || isFloat(); }

    /// True for bool, int, float and string values
    bool isScalar() const noexcept { return isBool() || isNumber() || isString(); }

    /// Accessors - throw TypeMismatch if the value has a different kind
    bool asBool() const;
    std::int64_t asInt() const;
    double asFloat() const;
    std::string const& asString() const;
    Array const& asArray() const;
    ObjectPtr const& asObject() const;

    /// Returns the value of an int or float as double
    double toNumber() const;

    /// Returns the object downcast to T, or nullptr if this is not a T
    template <std::derived_from<Object> T>
    std::shared_ptr<T> as() const;

    /**
     * @brief Returns a copy that shares no object instance with this value
     *
     * Objects are deep-cloned via Object::clone(). All other kinds are plain
     * copies, which is already sufficient since they have value semantics.
     */
    Value clone() const;

    /**
     * @brief Visit the underlying value with a type-safe lambda
     *
     * The lambda receives one of: std::nullptr_t, bool, std::int64_t, double,
     * std::string const&, Array const&, ObjectPtr const&.
     *
     * @code
     * value.visit(cxxutils::multilambda(
     *     [] (std::int64_t i) { ... },
     *     [] (auto const&)    { ... }));
     * @endcode
     */
    template <typename Lambda>
    decltype(auto) visit(Lambda && lambda) const;

    /// Strict equality, see class description
    friend bool operator==(Value const& a, Value const& b);

private:
    // The alternative order must match Kind
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, std::shared_ptr<Array const>, ObjectPtr>;

    Storage storage;
};

//=============================================================================
// Array
//=============================================================================

/// Keys of an Array are either integers or strings
using ArrayKey = std::variant<std::int64_t, std::string>;

/**
 * @brief Insertion ordered list of key/value elements
 *
 * Array is the composite value kind. An array constructed from a plain list of
 * values is keyed 0..n-1. Setting an existing key replaces the element in place;
 * appending uses one past the largest integer key seen so far.
 *
 * Two arrays are equal if they hold the same keys in the same order with
 * strictly equal values.
 */
class Array
{
public:
    struct Element
    {
        ArrayKey key;
        Value value;
    };

    using const_iterator = std::vector<Element>::const_iterator;

    Array() = default;

    /// Construct a list keyed 0..n-1
    Array(std::initializer_list<Value> values);

    /// Construct a list keyed 0..n-1 from any range of value-convertible elements
    template <detail::ValueRange R> requires (! std::is_same_v<std::remove_cvref_t<R>, Array>)
    explicit Array(R && values);

    /// Append a value with the next integer key
    void append(Value value);

    /// Insert or overwrite the element with the given key
    void set(ArrayKey key, Value value);

    /// Returns a pointer to the value stored under key, or nullptr
    Value const* find(ArrayKey const& key) const;

    bool contains(ArrayKey const& key) const { return find(key) != nullptr; }

    std::size_t size() const noexcept { return elements.size(); }
    bool empty() const noexcept { return elements.empty(); }

    const_iterator begin() const noexcept { return elements.begin(); }
    const_iterator end() const noexcept { return elements.end(); }

    friend bool operator==(Array const& a, Array const& b);

private:
    std::vector<Element> elements;
    std::int64_t nextIndex = 0;
};

//=============================================================================
// Built-in and user defined object classes
//=============================================================================

/**
 * @brief Object holding a single key/value association
 *
 * Pairs are what a Dictionary exposes when it is converted to a Sequence, and
 * what Dictionary::add accepts in its single argument form.
 */
class Pair : public Object
{
public:
    Pair(Value key_, Value value_) : pairKey(std::move(key_)), pairValue(std::move(value_)) {}

    /// Returns the MetaClass for Pair (static, no instance needed)
    static MetaClass const& meta();

    MetaClass const& metaClass() const override { return meta(); }
    std::shared_ptr<Object> clone() const override;
    void describe(std::ostream& o) const override;

    Value const& key() const noexcept { return pairKey; }
    Value const& value() const noexcept { return pairValue; }

private:
    Value pairKey;
    Value pairValue;
};

/**
 * @brief Declares an interface type that Records can implement
 *
 * Interfaces have no instances; they only exist to be named in constraints and
 * as supertypes of Records.
 *
 * @tparam Name The interface name
 * @tparam Supertypes Other Interface<> types this one extends
 *
 * @code
 * using Stringable = Interface<"Stringable">;
 * using Named      = Interface<"Named", Stringable>;
 * @endcode
 */
template <fixstr::fixed_string Name, typename... Supertypes>
struct Interface
{
    static MetaClass const& meta();
};

/// Declares a trait type; behaves like an interface but is reported as a trait
template <fixstr::fixed_string Name, typename... Supertypes>
struct Trait
{
    static MetaClass const& meta();
};

/**
 * @brief Object class wrapping a plain aggregate struct
 *
 * Record turns any aggregate struct into an object class with a nominal name
 * and optional supertypes (other Records as parent classes, Interface<> and
 * Trait<> types). The struct's fields are discovered by reflection for
 * printing, so a Record describes itself as "Name { field0, field1, ... }".
 *
 * @tparam T An aggregate struct
 * @tparam Name The class name used in constraint expressions
 * @tparam Supertypes Record, Interface or Trait types this class derives from
 *
 * @code
 * struct Date { int year; int month; int day; };
 * using DateTime = Record<Date, "DateTime">;
 * using Birthday = Record<Date, "Birthday", DateTime>;   // Birthday satisfies "DateTime"
 *
 * Value v = makeObject<Birthday>(1990, 4, 1);
 * @endcode
 */
template <typename T, fixstr::fixed_string Name, typename... Supertypes>
class Record : public Object
{
public:
    static_assert(std::is_aggregate_v<T>, "Record<T> requires an aggregate struct");

    using UnderlyingType = T;

    /// Default constructor - value-initializes the underlying struct
    Record() = default;

    /// Construct from underlying struct value
    explicit Record(T underlying_) : underlying(std::move(underlying_)) {}

    /// Returns the MetaClass for this Record type (static, no instance needed)
    static MetaClass const& meta();

    MetaClass const& metaClass() const override { return meta(); }
    std::shared_ptr<Object> clone() const override;
    void describe(std::ostream& o) const override;

    /// Returns the underlying struct (read-only access)
    T const& operator()() const { return underlying; }

    T*       operator->()       { return &underlying; }
    T const* operator->() const { return &underlying; }

private:
    T underlying {};
};

/**
 * @brief Create a new object value of class R
 *
 * The arguments are used to aggregate-initialize the Record's struct, or are
 * passed to R's constructor for other Object subclasses.
 */
template <std::derived_from<Object> R, typename... Args>
Value makeObject(Args && ...args);

//=============================================================================
// Free functions
//=============================================================================

/**
 * @brief Returns the runtime type name of a value
 *
 * One of "null", "bool", "int", "float", "string", "array", or the class name
 * of an object. This is the token type inference records for the value.
 */
std::string_view typeName(Value const& value);

/**
 * @brief Converts any value into a unique, literal-like string
 *
 * Strings are quoted and escaped, floats always carry a decimal point, arrays
 * are rendered as "[key => value, ...]" and objects via Object::describe.
 */
std::string toString(Value const& value);

/// Returns toString(value), shortened with "..." to at most maxLength characters
std::string abbreviate(Value const& value, std::size_t maxLength = TYPED_ABBREVIATE_LENGTH);

/**
 * @brief Three-way comparison used for sorting, min and max
 *
 * Numbers compare numerically across int and float, strings lexicographically,
 * bools as false < true, arrays by size and then element-wise.
 *
 * @throws TypeMismatch if the two values cannot be ordered against each other
 */
std::partial_ordering compare(Value const& a, Value const& b);

// Stream output operators
std::ostream& operator<<(std::ostream& o, Value const& value);
std::ostream& operator<<(std::ostream& o, Array const& array);
std::ostream& operator<<(std::ostream& o, ArrayKey const& key);

} // namespace typed

// std::formatter specializations
template <>
struct std::formatter<typed::Value> : std::formatter<std::string>
{
    auto format(typed::Value const& v, format_context& ctx) const
    {
        return std::formatter<std::string>::format(typed::toString(v), ctx);
    }
};

template <>
struct std::formatter<typed::Array> : std::formatter<typed::Value>
{
    auto format(typed::Array const& a, format_context& ctx) const
    {
        return std::formatter<typed::Value>::format(typed::Value(a), ctx);
    }
};

// Include template implementations
#include "typed_value.tpp"
