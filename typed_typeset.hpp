/**
 * @file typed_typeset.hpp
 * @brief Runtime type constraints: parsing, validation, inference and defaults
 *
 * A TypeSet is the resolved form of a constraint expression such as
 * "int|string", "?DateTime" or "uint". Every collection owns exactly one
 * TypeSet and validates each value against it before the value is stored.
 *
 * Constraint expressions are "|" separated tokens. A token is one of
 *   - a primitive:  null, bool, int, float, string, array, object
 *   - a pseudotype: scalar, number, uint, mixed
 *   - a nominal type name (class, interface or trait), optionally namespaced
 *     with "\" (a leading "\" is ignored)
 * and can be prefixed with "?" to also admit null.
 *
 * Usage example:
 *   auto types = TypeSet::parse("?int|string");
 *   types.match(42);                 // true
 *   types.match(nullptr);            // true
 *   types.match(1.5);                // false
 *   types.validate(1.5, "value");    // throws TypeMismatch
 *
 *   auto inferred = TypeSet::infer(std::vector<Value> { 1, "x", nullptr });
 *   inferred.containsOnly("int", "string", "null");   // true
 */

#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "typed_value.hpp"

namespace typed
{

/**
 * @brief A single admissible runtime type within a TypeSet
 *
 * Tokens are either built-in (primitives and pseudotypes) or nominal. Nominal
 * tokens match objects whose MetaClass satisfies the name.
 */
class TypeToken
{
public:
    enum class Builtin : std::uint8_t
    {
        // primitives
        null,
        boolean,
        integer,
        floating,
        string,
        array,
        object,

        // pseudotypes
        scalar,
        number,
        uint,
        mixed,

        // a class, interface or trait name
        nominal
    };

    /**
     * @brief Creates a token from a single, already trimmed type name
     *
     * @throws ConstraintSyntaxError if the name is empty, a reserved keyword
     *         or not a valid type name
     */
    static TypeToken fromName(std::string_view name);

    /// Returns the token recorded by type inference for a value (its runtime type)
    static TypeToken ofValue(Value const& value);

    Builtin builtin() const noexcept { return kind; }

    /// Returns the name as written in constraint expressions
    std::string_view name() const noexcept;

    bool isPrimitive() const noexcept  { return kind <= Builtin::object; }
    bool isPseudotype() const noexcept { return kind >= Builtin::scalar && kind <= Builtin::mixed; }
    bool isNominal() const noexcept    { return kind == Builtin::nominal; }

    /// True if value is an instance of this type
    bool matches(Value const& value) const;

    /// True if every value matched by other is also matched by this token (and the two differ)
    bool subsumes(TypeToken const& other) const noexcept;

    /// Returns the canonical zero value of a primitive or pseudotype, if it has one
    std::optional<Value> zeroValue() const;

    friend bool operator==(TypeToken const& a, TypeToken const& b) noexcept
    {
        return a.kind == b.kind && a.nominalName == b.nominalName;
    }

private:
    TypeToken(Builtin kind_, std::string nominalName_ = {}) : kind(kind_), nominalName(std::move(nominalName_)) {}

    Builtin kind;
    std::string nominalName;
};

/**
 * @brief Resolved, queryable union of TypeTokens
 *
 * Invariants:
 *   - A TypeSet is never an empty restriction. "No restriction" is the
 *     distinguished anyOk() state, which is also what "mixed" resolves to.
 *   - Nullability is the presence of the null token. "?int" is exactly {int, null}.
 *   - No token is subsumed by another token of the same set ("int|number"
 *     resolves to {number}).
 *
 * A TypeSet is immutable once built. All queries are pure.
 */
class TypeSet
{
public:
    using const_iterator = std::vector<TypeToken>::const_iterator;

    /// Default constructor - the unrestricted TypeSet, same as any()
    TypeSet() = default;

    /// The unrestricted TypeSet (anyOk)
    static TypeSet any() { return {}; }

    /**
     * @brief Parses a constraint expression
     *
     * @throws ConstraintSyntaxError for an empty expression or token, a
     *         duplicate token, a reserved keyword, "?null", "?mixed" or an
     *         invalid type name
     */
    static TypeSet parse(std::string_view expression);

    /**
     * @brief Infers a TypeSet from sample values
     *
     * Records the distinct runtime types in first-seen order, without folding
     * them into pseudotypes. Objects contribute their class name. An empty
     * input yields the unrestricted TypeSet.
     */
    static TypeSet infer(std::span<Value const> values);

    template <detail::ValueRange R>
    static TypeSet infer(R && values) { auto const v = detail::toValues(std::forward<R>(values)); return infer(std::span<Value const>(v)); }

    /// True if the value satisfies at least one token (always true for anyOk)
    bool match(Value const& value) const;

    /**
     * @brief Checks a value, throwing if it is not admitted
     *
     * @param label Names the role of the value in the error message ("value", "key", ...)
     * @throws TypeMismatch if match(value) is false
     */
    void validate(Value const& value, std::string_view label = "value") const;

    /// True if the set has no restriction
    bool anyOk() const noexcept { return unrestricted; }

    /// True if null values are admitted
    bool nullOk() const noexcept;

    /// True if the named token is a member ("mixed" is a member of the unrestricted set)
    bool contains(std::string_view name) const;

    template <std::convertible_to<std::string_view>... Names>
    bool containsAll(Names const&... names) const { return containsAllOf({ std::string_view(names)... }); }

    template <std::convertible_to<std::string_view>... Names>
    bool containsAny(Names const&... names) const { return containsAnyOf({ std::string_view(names)... }); }

    /// True if the members are exactly the named tokens, in any order
    template <std::convertible_to<std::string_view>... Names>
    bool containsOnly(Names const&... names) const { return containsOnlyOf({ std::string_view(names)... }); }

    bool containsAllOf(std::initializer_list<std::string_view> names) const;
    bool containsAnyOf(std::initializer_list<std::string_view> names) const;
    bool containsOnlyOf(std::initializer_list<std::string_view> names) const;

    /// Returns the number of tokens (0 for the unrestricted set)
    std::size_t size() const noexcept { return tokens.size(); }

    const_iterator begin() const noexcept { return tokens.begin(); }
    const_iterator end() const noexcept { return tokens.end(); }

    /**
     * @brief Derives a default value for this set
     *
     * A single primitive or pseudotype token yields that token's zero value
     * (0, 0.0, "", false, []). Otherwise null is used if the set admits it.
     *
     * @throws Unrepresentable if neither rule applies
     */
    Value deriveDefault() const;

    /// Same as deriveDefault() but returns std::nullopt instead of throwing
    std::optional<Value> tryDeriveDefault() const;

    /// Returns the union of two sets
    TypeSet unite(TypeSet const& other) const;

    /// Returns the tokens joined with "|", or "mixed" for the unrestricted set
    std::string toString() const;

    /// Two sets are equal if they have the same tokens, in any order
    friend bool operator==(TypeSet const& a, TypeSet const& b);

private:
    explicit TypeSet(std::vector<TypeToken> tokens_);

    std::vector<TypeToken> tokens;
    bool unrestricted = true;
};

std::ostream& operator<<(std::ostream& o, TypeToken const& token);
std::ostream& operator<<(std::ostream& o, TypeSet const& types);

} // namespace typed

template <>
struct std::formatter<typed::TypeSet> : std::formatter<std::string>
{
    auto format(typed::TypeSet const& t, format_context& ctx) const
    {
        return std::formatter<std::string>::format(t.toString(), ctx);
    }
};
