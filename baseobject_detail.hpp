#pragma once

#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <tuple>
#include <utility>
#include <concepts>
#include <functional>
#include <boost/pfr.hpp>
#include <boost/core/demangle.hpp>
#include <fixed_string.hpp>

namespace baseobject
{

// Forward declarations needed by detail namespace
template <typename T, fixstr::fixed_string Name> struct Field;
class Value;

//=============================================================================
// Implementation details - not part of the public API
//=============================================================================
namespace detail
{
/**
 * @brief Filters a tuple, keeping only elements that satisfy the Predicate
 *
 * @tparam Predicate A template that provides a ::value bool for each type
 * @param tp The tuple to filter
 * @return A new tuple containing only elements where Predicate<T>::value is true
 */
template <template<typename> class Predicate, typename Tuple>
auto filter_tuple(Tuple&& tp)
{
    return std::apply([]<typename... Ts>(Ts&&... args) {
        // Helper that returns either a single-element tuple or empty tuple
        auto maybe_keep = []<typename T>(T&& arg) {
            if constexpr (Predicate<T>::value)
                return std::tuple<T>(std::forward<T>(arg));
            else
                return std::tuple<>();
        };
        return std::tuple_cat(maybe_keep(std::forward<Ts>(args))...);
    }, std::forward<Tuple>(tp));
}

/**
 * @brief Trait to check if a lambda can be invoked with a given type
 *
 * Provides a nested Predicate template that evaluates to true_type if
 * Lambda can be called with an argument of type T.
 */
template <typename Lambda>
struct DoesLambdaSupportType
{
    template <typename T>
    struct Predicate : std::bool_constant<requires { std::declval<Lambda>()(std::declval<T>()); }> {};
};

//-----------------------------------------------------------------------------
// Field type detection
//-----------------------------------------------------------------------------

template <typename T> struct is_field_helper : std::false_type {};
template <typename T, fixstr::fixed_string Name> struct is_field_helper<Field<T, Name>> : std::true_type {};

/// Predicate that is true if T is a Field<> specialization
template <typename T> struct is_field { static constexpr auto value = is_field_helper<std::decay_t<T>>::value; };

/// Helper to decay all types in a tuple
template <typename T> struct decay_tuple;
template <typename... Types> struct decay_tuple<std::tuple<Types...>>
{
    using type = std::tuple<std::decay_t<Types>...>;
};

//-----------------------------------------------------------------------------
// Compile-time field lookup by name
//-----------------------------------------------------------------------------

/**
 * @brief Finds the position of a field by compile-time name in a tuple of Field<> types
 *
 * eval() returns the index of the first field called FieldName, or the size of
 * the tuple if the schema has no such field.
 */
template <fixstr::fixed_string FieldName, typename Tuple>
struct FindFieldHelper;

template <fixstr::fixed_string FieldName, typename... Fields>
struct FindFieldHelper<FieldName, std::tuple<Fields...>>
{
    static constexpr std::size_t eval()
    {
        std::size_t index = 0;
        (void) ((Fields::kName == std::string_view(FieldName) ? true : (++index, false)) || ...);
        return index;
    }
};

//-----------------------------------------------------------------------------
// Storage type normalisation
//-----------------------------------------------------------------------------

/**
 * @brief Maps a C++ type onto the type a Value stores it as
 *
 * bool stays bool, every other integral type becomes std::int64_t, floating
 * point types become double and anything convertible to a string_view becomes
 * std::string. Value subclasses map onto themselves.
 */
template <typename T>
auto storageType()
{
    using Type = std::remove_cvref_t<T>;

    if constexpr (std::is_base_of_v<Value, Type>)
        return std::type_identity<Type>();
    else if constexpr (std::is_same_v<Type, bool>)
        return std::type_identity<bool>();
    else if constexpr (std::is_integral_v<Type>)
        return std::type_identity<std::int64_t>();
    else if constexpr (std::is_floating_point_v<Type>)
        return std::type_identity<double>();
    else if constexpr (std::is_convertible_v<T, std::string_view>)
        return std::type_identity<std::string>();
    else
        return std::type_identity<Type>();
}

template <typename T>
using storage_t = typename decltype(storageType<T>())::type;

template <typename T> struct is_value_pointer_helper : std::false_type {};
template <typename T> struct is_value_pointer_helper<std::shared_ptr<T>> : std::is_base_of<Value, T> {};

/// True if T is a std::shared_ptr to Value or one of its subclasses
template <typename T> inline constexpr bool is_value_pointer = is_value_pointer_helper<std::remove_cvref_t<T>>::value;

template <typename> inline constexpr bool dependent_false = false;

//-----------------------------------------------------------------------------
// Numeric comparison
//-----------------------------------------------------------------------------

/// Three-way comparison of two numbers. NaN ranks after every other number and equals only NaN
inline int compareNumbers(double lhs, double rhs)
{
    if (std::isnan(lhs) || std::isnan(rhs))
        return static_cast<int>(std::isnan(lhs)) - static_cast<int>(std::isnan(rhs));

    return lhs < rhs ? -1 : (rhs < lhs ? 1 : 0);
}

inline int compareNumbers(std::int64_t lhs, std::int64_t rhs)
{
    return lhs < rhs ? -1 : (rhs < lhs ? 1 : 0);
}

/// Exact comparison of an integer with a double, the integer is never rounded
inline int compareNumbers(std::int64_t lhs, double rhs)
{
    // 2^63, the first double above the int64_t range
    constexpr double kLimit = 9223372036854775808.0;

    if (std::isnan(rhs) || rhs >= kLimit)
        return -1;

    if (rhs < -kLimit)
        return 1;

    auto const whole = std::trunc(rhs);
    auto const truncated = static_cast<std::int64_t>(whole);

    if (lhs != truncated)
        return lhs < truncated ? -1 : 1;

    return whole < rhs ? -1 : (rhs < whole ? 1 : 0);
}

inline int compareNumbers(double lhs, std::int64_t rhs)
{
    return -compareNumbers(rhs, lhs);
}

//-----------------------------------------------------------------------------
// Schema names
//-----------------------------------------------------------------------------

/**
 * @brief Returns the human readable name of a schema struct
 *
 * Uses Schema::kName if the schema declares one, otherwise the demangled C++
 * name without its namespace qualification.
 */
template <typename Schema>
std::string schemaName()
{
    if constexpr (requires { { Schema::kName } -> std::convertible_to<std::string_view>; })
    {
        return std::string(std::string_view(Schema::kName));
    }
    else
    {
        auto name = boost::core::demangle(typeid(Schema).name());

        if (name.find('<') == std::string::npos)
        {
            if (auto pos = name.rfind("::"); pos != std::string::npos)
                name.erase(0, pos + 2);
        }

        return name;
    }
}

//-----------------------------------------------------------------------------
// Tuple/variant helpers used by Value::visit
//-----------------------------------------------------------------------------

template<template<typename, typename> class Cls, typename T>
struct BindFirst
{
    template <typename U>
    struct Result
    {
        using type = Cls<T, U>;
    };
};

/// Helper to transform tuple element types
template <typename Tuple, template<typename> class Transform>
struct transform_tuple;

template <typename... Ts, template<typename> class Transform>
struct transform_tuple<std::tuple<Ts...>, Transform> {
    using type = std::tuple<typename Transform<Ts>::type...>;
};

// Helper class to transform a tuple to a variant
template <template<typename...> class Transform, typename Tuple>
struct apply_tuple;

template <template<typename...> class Transform, typename... Ts>
struct apply_tuple<Transform, std::tuple<Ts...>> {
    using type = Transform<Ts...>;
};

template <typename T> struct add_const_lvalue_ref { using type = T const&; };
template <typename T> struct add_const_reference_wrapper { using type = std::reference_wrapper<T const>; };
} // namespace detail

} // namespace baseobject
