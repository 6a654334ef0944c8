#pragma once

#include <array>
#include <limits>
#include <boost/pfr.hpp>
#include <CxxUtilities.hpp>

namespace typed
{

//=============================================================================
// Value implementations
//=============================================================================
template <std::derived_from<Object> T>
Value::Value(std::shared_ptr<T> object)
{
    if (object != nullptr)
        storage = ObjectPtr(std::move(object));
}

template <std::derived_from<Object> T>
std::shared_ptr<T> Value::as() const
{
    if (! isObject())
        return nullptr;

    return std::dynamic_pointer_cast<T>(std::get<ObjectPtr>(storage));
}

template <typename Lambda>
decltype(auto) Value::visit(Lambda && lambda) const
{
    return std::visit(cxxutils::multilambda(
        [&lambda] (std::monostate) -> decltype(auto)
        {
            return lambda(nullptr);
        },
        [&lambda] (std::shared_ptr<Array const> const& array) -> decltype(auto)
        {
            return lambda(*array);
        },
        [&lambda] (auto const& underlying) -> decltype(auto)
        {
            return lambda(underlying);
        }
    ), storage);
}

//=============================================================================
// Array implementations
//=============================================================================
template <detail::ValueRange R> requires (! std::is_same_v<std::remove_cvref_t<R>, Array>)
Array::Array(R && values)
{
    for (auto && value : values)
        append(Value(std::forward<decltype(value)>(value)));
}

//=============================================================================
// Interface and Trait implementations
//=============================================================================
template <fixstr::fixed_string Name, typename... Supertypes>
MetaClass const& Interface<Name, Supertypes...>::meta()
{
    static MetaClass const instance(std::string_view(Name), MetaClass::Category::interfaceType, { &Supertypes::meta()... });
    return instance;
}

template <fixstr::fixed_string Name, typename... Supertypes>
MetaClass const& Trait<Name, Supertypes...>::meta()
{
    static MetaClass const instance(std::string_view(Name), MetaClass::Category::traitType, { &Supertypes::meta()... });
    return instance;
}

//=============================================================================
// Record implementations
//=============================================================================
template <typename T, fixstr::fixed_string Name, typename... Supertypes>
MetaClass const& Record<T, Name, Supertypes...>::meta()
{
    static MetaClass const instance(std::string_view(Name), MetaClass::Category::classType, { &Supertypes::meta()... });
    return instance;
}

template <typename T, fixstr::fixed_string Name, typename... Supertypes>
std::shared_ptr<Object> Record<T, Name, Supertypes...>::clone() const
{
    return std::make_shared<Record>(*this);
}

template <typename T, fixstr::fixed_string Name, typename... Supertypes>
void Record<T, Name, Supertypes...>::describe(std::ostream& o) const
{
    o << meta().name() << " {";

    auto first = true;
    boost::pfr::for_each_field(underlying, [&o, &first] (auto const& field)
    {
        using FieldType = std::remove_cvref_t<decltype(field)>;

        o << (std::exchange(first, false) ? " " : ", ");

        if constexpr (std::is_convertible_v<FieldType const&, Value>)
            o << toString(Value(field));
        else if constexpr (requires { o << field; })
            o << field;
        else
            o << "...";
    });

    o << (first ? "}" : " }");
}

//=============================================================================
// Factory
//=============================================================================
template <std::derived_from<Object> R, typename... Args>
Value makeObject(Args && ...args)
{
    if constexpr (std::is_constructible_v<R, Args...>)
        return Value(std::make_shared<R>(std::forward<Args>(args)...));
    else
        return Value(std::make_shared<R>(typename R::UnderlyingType { std::forward<Args>(args)... }));
}

} // namespace typed
