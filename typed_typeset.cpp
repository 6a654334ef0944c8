#include "typed_typeset.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <sstream>

namespace typed
{

namespace
{
struct BuiltinName
{
    std::string_view name;
    TypeToken::Builtin builtin;
};

constexpr std::array<BuiltinName, 11> kBuiltinNames =
{{
    { "null",   TypeToken::Builtin::null },
    { "bool",   TypeToken::Builtin::boolean },
    { "int",    TypeToken::Builtin::integer },
    { "float",  TypeToken::Builtin::floating },
    { "string", TypeToken::Builtin::string },
    { "array",  TypeToken::Builtin::array },
    { "object", TypeToken::Builtin::object },
    { "scalar", TypeToken::Builtin::scalar },
    { "number", TypeToken::Builtin::number },
    { "uint",   TypeToken::Builtin::uint },
    { "mixed",  TypeToken::Builtin::mixed }
}};

// Type names of the host language family that are not accepted as constraint tokens
constexpr std::array<std::string_view, 13> kReservedKeywords =
{
    "void", "never", "false", "true", "self", "static", "parent",
    "callable", "iterable", "resource", "integer", "double", "boolean"
};

bool isNameStart(char c) noexcept
{
    auto const u = static_cast<unsigned char>(c);
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || u >= 0x80;
}

bool isNameChar(char c) noexcept
{
    return isNameStart(c) || (c >= '0' && c <= '9');
}

// One or more identifiers separated by single "\"
bool isValidTypeName(std::string_view name) noexcept
{
    auto atSegmentStart = true;

    for (auto c : name)
    {
        if (c == '\\')
        {
            if (atSegmentStart)
                return false;

            atSegmentStart = true;
        }
        else if (atSegmentStart)
        {
            if (! isNameStart(c))
                return false;

            atSegmentStart = false;
        }
        else if (! isNameChar(c))
        {
            return false;
        }
    }

    return ! atSegmentStart;
}

std::string_view trim(std::string_view s) noexcept
{
    auto const first = s.find_first_not_of(" \t\n\r");

    if (first == std::string_view::npos)
        return {};

    auto const last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}
} // namespace

//=============================================================================
// TypeToken implementations
//=============================================================================
TypeToken TypeToken::fromName(std::string_view name)
{
    auto const normalized = detail::normalizeTypeName(name);

    if (normalized.empty())
        throw ConstraintSyntaxError("Empty type token.");

    if (auto it = std::ranges::find(kBuiltinNames, normalized, &BuiltinName::name); it != kBuiltinNames.end())
        return TypeToken(it->builtin);

    if (std::ranges::find(kReservedKeywords, normalized) != kReservedKeywords.end())
        throw ConstraintSyntaxError(std::format("Unsupported type keyword: {}.", normalized));

    if (! isValidTypeName(normalized))
        throw ConstraintSyntaxError(std::format("Invalid type name: {}.", normalized));

    return TypeToken(Builtin::nominal, std::string(normalized));
}

TypeToken TypeToken::ofValue(Value const& value)
{
    switch (value.kind())
    {
        case Kind::null:     return TypeToken(Builtin::null);
        case Kind::boolean:  return TypeToken(Builtin::boolean);
        case Kind::integer:  return TypeToken(Builtin::integer);
        case Kind::floating: return TypeToken(Builtin::floating);
        case Kind::string:   return TypeToken(Builtin::string);
        case Kind::array:    return TypeToken(Builtin::array);
        case Kind::object:   return TypeToken(Builtin::nominal, std::string(typeName(value)));
    }

    assert(false);
    return TypeToken(Builtin::mixed);
}

std::string_view TypeToken::name() const noexcept
{
    if (kind == Builtin::nominal)
        return nominalName;

    return kBuiltinNames[static_cast<std::size_t>(kind)].name;
}

bool TypeToken::matches(Value const& value) const
{
    switch (kind)
    {
        case Builtin::null:     return value.isNull();
        case Builtin::boolean:  return value.isBool();
        case Builtin::integer:  return value.isInt();
        case Builtin::floating: return value.isFloat();
        case Builtin::string:   return value.isString();
        case Builtin::array:    return value.isArray();
        case Builtin::object:   return value.isObject();
        case Builtin::scalar:   return value.isScalar();
        case Builtin::number:   return value.isNumber();
        case Builtin::uint:     return value.isInt() && value.asInt() >= 0;
        case Builtin::mixed:    return true;
        case Builtin::nominal:  return value.isObject() && value.asObject()->metaClass().satisfies(nominalName);
    }

    return false;
}

bool TypeToken::subsumes(TypeToken const& other) const noexcept
{
    if (*this == other)
        return false;

    switch (kind)
    {
        case Builtin::mixed:
            return true;
        case Builtin::scalar:
            return other.kind == Builtin::boolean || other.kind == Builtin::integer || other.kind == Builtin::floating
                || other.kind == Builtin::string  || other.kind == Builtin::number  || other.kind == Builtin::uint;
        case Builtin::number:
            return other.kind == Builtin::integer || other.kind == Builtin::floating || other.kind == Builtin::uint;
        case Builtin::integer:
            return other.kind == Builtin::uint;
        case Builtin::object:
            return other.kind == Builtin::nominal;
        default:
            return false;
    }
}

std::optional<Value> TypeToken::zeroValue() const
{
    switch (kind)
    {
        case Builtin::null:     return Value();
        case Builtin::boolean:  return Value(false);
        case Builtin::integer:
        case Builtin::uint:
        case Builtin::number:
        case Builtin::scalar:   return Value(0);
        case Builtin::floating: return Value(0.0);
        case Builtin::string:   return Value("");
        case Builtin::array:    return Value(Array());
        default:                return std::nullopt;
    }
}

//=============================================================================
// TypeSet implementations
//=============================================================================
TypeSet::TypeSet(std::vector<TypeToken> tokens_) : unrestricted(false)
{
    // mixed swallows everything
    if (tokens_.empty() || std::ranges::any_of(tokens_, [] (auto const& t) { return t.builtin() == TypeToken::Builtin::mixed; }))
    {
        unrestricted = true;
        return;
    }

    // drop tokens subsumed by another member, keep the order of the survivors
    for (auto const& candidate : tokens_)
    {
        auto const subsumed = std::ranges::any_of(tokens_, [&candidate] (auto const& t) { return t.subsumes(candidate); });
        auto const duplicate = std::ranges::find(tokens, candidate) != tokens.end();

        if (! subsumed && ! duplicate)
            tokens.push_back(candidate);
    }
}

TypeSet TypeSet::parse(std::string_view expression)
{
    if (trim(expression).empty())
        throw ConstraintSyntaxError("Empty constraint expression.");

    std::vector<TypeToken> explicitTokens;
    auto nullableShorthand = false;

    auto const addToken = [&explicitTokens, expression] (TypeToken token)
    {
        if (std::ranges::find(explicitTokens, token) != explicitTokens.end())
            throw ConstraintSyntaxError(std::format("Duplicate type {} in \"{}\".", token.name(), expression));

        explicitTokens.push_back(std::move(token));
    };

    for (std::size_t start = 0;;)
    {
        auto const separator = expression.find('|', start);
        auto const part = trim(expression.substr(start, separator == std::string_view::npos ? std::string_view::npos : separator - start));

        if (part.empty())
            throw ConstraintSyntaxError(std::format("Empty type token in \"{}\".", expression));

        if (part.front() == '?')
        {
            auto token = TypeToken::fromName(trim(part.substr(1)));

            if (token.builtin() == TypeToken::Builtin::null || token.builtin() == TypeToken::Builtin::mixed)
                throw ConstraintSyntaxError(std::format("Type {} cannot be made nullable.", token.name()));

            addToken(std::move(token));
            nullableShorthand = true;
        }
        else
        {
            addToken(TypeToken::fromName(part));
        }

        if (separator == std::string_view::npos)
            break;

        start = separator + 1;
    }

    if (nullableShorthand)
        addToken(TypeToken::fromName("null"));

    return TypeSet(std::move(explicitTokens));
}

TypeSet TypeSet::infer(std::span<Value const> values)
{
    std::vector<TypeToken> observed;

    for (auto const& value : values)
    {
        auto token = TypeToken::ofValue(value);

        if (std::ranges::find(observed, token) == observed.end())
            observed.push_back(std::move(token));
    }

    return TypeSet(std::move(observed));
}

bool TypeSet::match(Value const& value) const
{
    return unrestricted || std::ranges::any_of(tokens, [&value] (auto const& t) { return t.matches(value); });
}

void TypeSet::validate(Value const& value, std::string_view label) const
{
    if (! match(value))
        throw TypeMismatch(std::format("Disallowed {} type: {} ({}), expected {}.", label, typeName(value), abbreviate(value), toString()));
}

bool TypeSet::nullOk() const noexcept
{
    return unrestricted || std::ranges::any_of(tokens, [] (auto const& t) { return t.builtin() == TypeToken::Builtin::null; });
}

bool TypeSet::contains(std::string_view name) const
{
    auto const normalized = detail::normalizeTypeName(name);

    if (unrestricted)
        return normalized == "mixed";

    return std::ranges::any_of(tokens, [normalized] (auto const& t) { return t.name() == normalized; });
}

bool TypeSet::containsAllOf(std::initializer_list<std::string_view> names) const
{
    return std::ranges::all_of(names, [this] (auto name) { return contains(name); });
}

bool TypeSet::containsAnyOf(std::initializer_list<std::string_view> names) const
{
    return std::ranges::any_of(names, [this] (auto name) { return contains(name); });
}

bool TypeSet::containsOnlyOf(std::initializer_list<std::string_view> names) const
{
    if (! containsAllOf(names))
        return false;

    // every member must be named
    std::vector<std::string_view> members;

    if (unrestricted)
        members.push_back("mixed");

    for (auto const& token : tokens)
        members.push_back(token.name());

    return std::ranges::all_of(members, [&names] (auto member)
    {
        return std::ranges::any_of(names, [member] (auto name) { return detail::normalizeTypeName(name) == member; });
    });
}

Value TypeSet::deriveDefault() const
{
    if (auto result = tryDeriveDefault())
        return std::move(*result);

    throw Unrepresentable(std::format("No default value can be derived for {}.", toString()));
}

std::optional<Value> TypeSet::tryDeriveDefault() const
{
    if (tokens.size() == 1 && ! tokens.front().isNominal())
    {
        if (auto zero = tokens.front().zeroValue())
            return zero;
    }

    if (nullOk())
        return Value();

    return std::nullopt;
}

TypeSet TypeSet::unite(TypeSet const& other) const
{
    if (unrestricted || other.unrestricted)
        return any();

    auto combined = tokens;
    combined.insert(combined.end(), other.tokens.begin(), other.tokens.end());
    return TypeSet(std::move(combined));
}

std::string TypeSet::toString() const
{
    std::ostringstream ss;
    ss << *this;
    return ss.str();
}

bool operator==(TypeSet const& a, TypeSet const& b)
{
    if (a.unrestricted || b.unrestricted)
        return a.unrestricted == b.unrestricted;

    return a.tokens.size() == b.tokens.size()
        && std::ranges::all_of(a.tokens, [&b] (auto const& t) { return std::ranges::find(b.tokens, t) != b.tokens.end(); });
}

//=============================================================================
// Stream operators implementations
//=============================================================================
std::ostream& operator<<(std::ostream& o, TypeToken const& token)
{
    return o << token.name();
}

std::ostream& operator<<(std::ostream& o, TypeSet const& types)
{
    if (types.anyOk())
        return o << "mixed";

    auto first = true;
    for (auto const& token : types)
        o << (std::exchange(first, false) ? "" : "|") << token;

    return o;
}

} // namespace typed
