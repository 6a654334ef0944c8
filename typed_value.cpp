#include "typed_value.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <sstream>

namespace typed
{

std::string_view kindName(Kind kind) noexcept
{
    switch (kind)
    {
        case Kind::null:     return "null";
        case Kind::boolean:  return "bool";
        case Kind::integer:  return "int";
        case Kind::floating: return "float";
        case Kind::string:   return "string";
        case Kind::array:    return "array";
        case Kind::object:   return "object";
    }

    return "unknown";
}

//=============================================================================
// MetaClass implementations
//=============================================================================
MetaClass::MetaClass(std::string_view name_, Category category_, std::vector<MetaClass const*> supertypes_)
    : className(detail::normalizeTypeName(name_)), typeCategory(category_), directSupertypes(std::move(supertypes_))
{
    assert(! className.empty());
    assert(std::none_of(directSupertypes.begin(), directSupertypes.end(), [] (auto* s) { return s == nullptr; }));
}

bool MetaClass::satisfies(std::string_view typeName) const
{
    return closure().contains(detail::normalizeTypeName(typeName));
}

std::set<std::string, std::less<>> const& MetaClass::closure() const
{
    if (! cachedClosure)
    {
        std::set<std::string, std::less<>> names;
        std::vector<MetaClass const*> pending = { this };

        while (! pending.empty())
        {
            auto const* current = pending.back();
            pending.pop_back();

            // already visited via another path (diamond)
            if (! names.emplace(current->className).second)
                continue;

            pending.insert(pending.end(), current->directSupertypes.begin(), current->directSupertypes.end());
        }

        cachedClosure = std::move(names);
    }

    return *cachedClosure;
}

//=============================================================================
// Object implementations
//=============================================================================
void Object::describe(std::ostream& o) const
{
    o << "<" << metaClass().name() << ">";
}

//=============================================================================
// Value implementations
//=============================================================================
namespace
{
[[noreturn]] void throwWrongKind(Kind expected, Value const& actual)
{
    throw TypeMismatch(std::format("Expected {} value, got {}.", kindName(expected), typeName(actual)));
}

bool identicalFloats(double a, double b) noexcept
{
    return a == b || (std::isnan(a) && std::isnan(b));
}
} // namespace

Value::Value(Array a) : storage(std::shared_ptr<Array const>(std::make_shared<Array>(std::move(a)))) {}

bool Value::asBool() const
{
    if (! isBool())
        throwWrongKind(Kind::boolean, *this);

    return std::get<bool>(storage);
}

std::int64_t Value::asInt() const
{
    if (! isInt())
        throwWrongKind(Kind::integer, *this);

    return std::get<std::int64_t>(storage);
}

double Value::asFloat() const
{
    if (! isFloat())
        throwWrongKind(Kind::floating, *this);

    return std::get<double>(storage);
}

std::string const& Value::asString() const
{
    if (! isString())
        throwWrongKind(Kind::string, *this);

    return std::get<std::string>(storage);
}

Array const& Value::asArray() const
{
    if (! isArray())
        throwWrongKind(Kind::array, *this);

    return *std::get<std::shared_ptr<Array const>>(storage);
}

Value::ObjectPtr const& Value::asObject() const
{
    if (! isObject())
        throwWrongKind(Kind::object, *this);

    return std::get<ObjectPtr>(storage);
}

double Value::toNumber() const
{
    if (isInt())
        return static_cast<double>(std::get<std::int64_t>(storage));

    if (isFloat())
        return std::get<double>(storage);

    throw TypeMismatch(std::format("Expected int or float value, got {}.", typeName(*this)));
}

Value Value::clone() const
{
    if (isObject())
        return Value(std::get<ObjectPtr>(storage)->clone());

    return *this;
}

bool operator==(Value const& a, Value const& b)
{
    if (a.kind() != b.kind())
        return false;

    switch (a.kind())
    {
        case Kind::null:     return true;
        case Kind::boolean:  return std::get<bool>(a.storage) == std::get<bool>(b.storage);
        case Kind::integer:  return std::get<std::int64_t>(a.storage) == std::get<std::int64_t>(b.storage);
        case Kind::floating: return identicalFloats(std::get<double>(a.storage), std::get<double>(b.storage));
        case Kind::string:   return std::get<std::string>(a.storage) == std::get<std::string>(b.storage);
        case Kind::array:
        {
            auto const& aa = std::get<std::shared_ptr<Array const>>(a.storage);
            auto const& ba = std::get<std::shared_ptr<Array const>>(b.storage);
            return aa == ba || *aa == *ba;
        }
        case Kind::object:   return std::get<Value::ObjectPtr>(a.storage) == std::get<Value::ObjectPtr>(b.storage);
    }

    return false;
}

//=============================================================================
// Array implementations
//=============================================================================
Array::Array(std::initializer_list<Value> values)
{
    elements.reserve(values.size());

    for (auto const& value : values)
        append(value);
}

void Array::append(Value value)
{
    elements.push_back({ ArrayKey(nextIndex), std::move(value) });
    ++nextIndex;
}

void Array::set(ArrayKey key, Value value)
{
    if (auto it = std::find_if(elements.begin(), elements.end(), [&key] (Element const& e) { return e.key == key; }); it != elements.end())
    {
        it->value = std::move(value);
        return;
    }

    if (auto const* index = std::get_if<std::int64_t>(&key); index != nullptr && *index >= nextIndex)
        nextIndex = *index + 1;

    elements.push_back({ std::move(key), std::move(value) });
}

Value const* Array::find(ArrayKey const& key) const
{
    auto it = std::find_if(elements.begin(), elements.end(), [&key] (Element const& e) { return e.key == key; });
    return it != elements.end() ? &it->value : nullptr;
}

bool operator==(Array const& a, Array const& b)
{
    auto const n = a.elements.size();

    if (n != b.elements.size())
        return false;

    for (std::size_t i = 0; i < n; ++i)
    {
        if (a.elements[i].key != b.elements[i].key)
            return false;

        if (! (a.elements[i].value == b.elements[i].value))
            return false;
    }

    return true;
}

//=============================================================================
// Pair implementations
//=============================================================================
MetaClass const& Pair::meta()
{
    static MetaClass const instance("Pair", MetaClass::Category::classType);
    return instance;
}

std::shared_ptr<Object> Pair::clone() const
{
    return std::make_shared<Pair>(pairKey.clone(), pairValue.clone());
}

void Pair::describe(std::ostream& o) const
{
    o << "Pair { " << toString(pairKey) << " => " << toString(pairValue) << " }";
}

//=============================================================================
// Free functions
//=============================================================================
std::string_view typeName(Value const& value)
{
    if (value.isObject())
        return value.asObject()->metaClass().name();

    return kindName(value.kind());
}

namespace
{
std::string floatToString(double d)
{
    if (std::isnan(d))
        return "NAN";

    if (std::isinf(d))
        return d > 0 ? "INF" : "-INF";

    auto result = std::format("{}", d);

    // make sure a float never reads like an int
    if (result.find_first_of(".e") == std::string::npos)
        result += ".0";

    return result;
}

std::string quote(std::string_view s)
{
    std::string result;
    result.reserve(s.size() + 2);
    result += '"';

    for (auto c : s)
    {
        if (c == '"' || c == '\\')
            result += '\\';

        result += c;
    }

    result += '"';
    return result;
}
} // namespace

std::string toString(Value const& value)
{
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

std::string abbreviate(Value const& value, std::size_t maxLength)
{
    auto result = toString(value);

    if (maxLength > 4 && result.size() > maxLength)
        result = result.substr(0, maxLength - 3) + "...";

    return result;
}

std::partial_ordering compare(Value const& a, Value const& b)
{
    if (a.isNumber() && b.isNumber())
    {
        if (a.isInt() && b.isInt())
            return a.asInt() <=> b.asInt();

        return a.toNumber() <=> b.toNumber();
    }

    if (a.kind() == b.kind())
    {
        switch (a.kind())
        {
            case Kind::null:    return std::partial_ordering::equivalent;
            case Kind::boolean: return a.asBool() <=> b.asBool();
            case Kind::string:  return a.asString() <=> b.asString();
            case Kind::array:
            {
                auto const& aa = a.asArray();
                auto const& ba = b.asArray();

                if (aa.size() != ba.size())
                    return aa.size() <=> ba.size();

                for (auto ait = aa.begin(), bit = ba.begin(); ait != aa.end(); ++ait, ++bit)
                {
                    if (auto const order = compare(ait->value, bit->value); order != 0)
                        return order;
                }

                return std::partial_ordering::equivalent;
            }
            default:
                break;
        }
    }

    throw TypeMismatch(std::format("Cannot compare {} with {}.", typeName(a), typeName(b)));
}

//=============================================================================
// Stream operators implementations
//=============================================================================
std::ostream& operator<<(std::ostream& o, ArrayKey const& key)
{
    std::visit(cxxutils::multilambda(
        [&o] (std::int64_t index)      { o << index; },
        [&o] (std::string const& name) { o << quote(name); }
    ), key);

    return o;
}

std::ostream& operator<<(std::ostream& o, Array const& array)
{
    o << "[";

    auto first = true;
    for (auto const& [key, value] : array)
    {
        if (! std::exchange(first, false))
            o << ", ";

        o << key << " => " << value;
    }

    o << "]";
    return o;
}

std::ostream& operator<<(std::ostream& o, Value const& value)
{
    value.visit(cxxutils::multilambda(
        [&o] (std::nullptr_t)               { o << "null"; },
        [&o] (bool b)                       { o << (b ? "true" : "false"); },
        [&o] (std::int64_t i)               { o << i; },
        [&o] (double d)                     { o << floatToString(d); },
        [&o] (std::string const& s)         { o << quote(s); },
        [&o] (Array const& a)               { o << a; },
        [&o] (Value::ObjectPtr const& obj)  { obj->describe(o); }
    ));

    return o;
}

} // namespace typed
