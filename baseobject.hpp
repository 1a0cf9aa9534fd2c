/**
 * @file baseobject.hpp
 * @brief Dynamic attribute containers with runtime type enforcement and field locking
 *
 * This file implements a dynamic record system: objects that hold an
 * insertion-ordered set of named, type-erased values. Two variants exist:
 *   - MutableObject: fields can be added, overwritten and removed at any time
 *   - ImmutableObject: every field supplied at construction is locked, and
 *     individual fields can be locked or unlocked afterwards
 *
 * A concrete record type can declare its fields up front by wrapping each
 * member of a schema struct in a Field<T, Name> template. The declared types
 * are checked, and coerced where possible, when an instance is constructed.
 *
 * Usage example:
 *   struct PersonFields {
 *       Field<std::string, "name"> name;
 *       Field<std::int64_t, "age"> age;
 *   };
 *   using Person = Record<PersonFields>;
 *
 *   Person person({{"name", "Alice"}, {"age", "30"}});
 *   *person("age"_fld) == 30;               // coerced from the string "30"
 *   person.set("age", 31);
 */

#pragma once

#ifndef BASEOBJECT_RESERVED_PREFIX
 #define BASEOBJECT_RESERVED_PREFIX "_"
#endif

#include <array>
#include <cstdint>
#include <format>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>
#include "baseobject_detail.hpp"

namespace baseobject
{

/// Field names starting with this prefix are reserved for internal bookkeeping
inline constexpr std::string_view kReservedPrefix = BASEOBJECT_RESERVED_PREFIX;

/// Returns true if name is a reserved (bookkeeping) field name
inline bool isReserved(std::string_view name) { return name.starts_with(kReservedPrefix); }

/**
 * @brief Compile-time string wrapper for use with the "_fld" literal
 *
 * This struct holds a compile-time fixed string and is used as a tag type
 * for accessing declared fields by name. Created via the "_fld" user-defined literal.
 *
 * @tparam S The compile-time fixed string representing the field name
 *
 * @see operator""_fld
 */
template <fixstr::fixed_string S>
struct CompileTimeString { static constexpr auto value = S; };

// Forward declarations
template <typename T> class Fundamental;
class Value;
class Invalid;
class Null;
class List;
class Tuple;
class Set;
class Dict;
class MutableObject;
class ImmutableObject;
class MetaType;
class ObjectType;

/// Shared handle to a type-erased value. Copying the handle shares the value.
using ValuePtr = std::shared_ptr<Value>;

//=============================================================================
// Errors
//=============================================================================

/// Base class of every error thrown by this library
class Error : public std::runtime_error
{
public:
    Error(std::string const& message, std::string field_ = {});

    /// Name of the field the error is about (empty if it concerns the whole object)
    std::string const& field() const noexcept { return fieldName; }

private:
    std::string fieldName;
};

/// A construction value could not be coerced to the declared type of its field
class TypeMismatch : public Error
{
public:
    TypeMismatch(std::string field_, std::string expected_, std::string actual_);

    std::string const& expected() const noexcept { return expectedType; }
    std::string const& actual() const noexcept { return actualType; }

private:
    std::string expectedType, actualType;
};

/// A construction value was supplied for a name that has no declared type
class UnexpectedField : public Error
{
public:
    explicit UnexpectedField(std::string field_);
};

/// A field that does not exist was read or removed through the indexed surface
class NotFound : public Error
{
public:
    NotFound(std::string field_, std::string_view typeName);
};

/// A locked field, or a sealed object, was written to
class Immutable : public Error
{
public:
    /// An empty field name reports the whole object as immutable
    Immutable(std::string field_, std::string_view typeName);
};

/// lock()/unlock() was called for a field that is not in the lock table
class NotRegistered : public Error
{
public:
    explicit NotRegistered(std::string field_);
};

/// lock()/unlock() was called for a reserved field
class PrivateField : public Error
{
public:
    PrivateField(std::string field_, std::string_view operation);
};

/// lock() was asked to introduce a new field without a value
class MissingValue : public Error
{
public:
    explicit MissingValue(std::string field_);
};

/// Text passed to fromText() is not a valid serialized object
class ParseError : public Error
{
public:
    explicit ParseError(std::string const& message);
};

//=============================================================================
// Type metadata
//=============================================================================

/**
 * @brief Describes a single declared field of a Record's schema
 *
 * Provides the field name and a function pointer to lazily obtain the
 * MetaType of the field's declared type, avoiding static initialization
 * order issues with nested record types.
 */
struct FieldDescriptor
{
    std::string_view fieldname;
    MetaType const& (*metaType)();
};

/**
 * @brief Abstract base class for type metadata
 *
 * A MetaType describes a type that values can be checked against and
 * converted into. Every Value reports its MetaType, and every declared field
 * of a Record carries the MetaType of its declared type:
 *   - The underlying C++ type (via typeInfo())
 *   - A short, human readable name used in error messages (via name())
 *   - Whether it's an opaque fundamental or a record type
 *   - For records: declared field names and their MetaTypes (via fields())
 *   - An instance test (via isInstance()) and a best-effort conversion (via convert())
 *
 * @code
 * auto const& meta = Person::meta();
 * for (auto const& field : meta.fields())
 *     std::cout << field.fieldname << ": " << field.metaType().name() << std::endl;
 * @endcode
 */
class MetaType
{
public:
    virtual ~MetaType() = default;

    /// Returns the std::type_info for the underlying type
    virtual std::type_info const& typeInfo() const = 0;

    /// Returns the name of the type as it appears in error messages ("int", "Person", ...)
    virtual std::string name() const = 0;

    /// Returns true if this is an opaque fundamental type (bool, int, float or str)
    virtual bool isOpaque() const = 0;

    /// Returns true if this is a record type (MutableObject or one of its subclasses)
    virtual bool isRecord() const { return false; }

    /**
     * @brief Returns the declared fields of a record type
     *
     * Empty for non-record types and for records without a schema.
     */
    virtual std::span<FieldDescriptor const> fields() const { return {}; }

    /// Returns true if value already is an instance of this type
    virtual bool isInstance(Value const& value) const = 0;

    /**
     * @brief Best-effort conversion of value into this type
     *
     * @return The converted value, or nullptr if value cannot be converted
     */
    virtual ValuePtr convert(Value const& value) const = 0;
};

/**
 * @brief Lazily populated set of field names known to a concrete record type
 *
 * Each concrete record type owns exactly one registry. A public field name is
 * registered the first time any instance of that type stores it, after which
 * the name stays known for the lifetime of the program.
 */
class AccessorRegistry
{
public:
    /// Registers name, returns true if it was not known before
    bool materialize(std::string_view name);

    /// Returns true if name has been registered
    bool contains(std::string_view name) const;

    /// All registered names in registration order
    std::vector<std::string> const& names() const { return known; }

private:
    std::vector<std::string> known;
};

/// Attribute type of a record: a named value
struct Attribute;
using Attributes = std::vector<Attribute>;

/**
 * @brief MetaType of record types
 *
 * In addition to the MetaType interface, an ObjectType can create instances
 * of its type from a set of attributes, runs the type's post-construction hook
 * and owns the type's AccessorRegistry.
 */
class ObjectType : public MetaType
{
public:
    bool isOpaque() const override { return false; }
    bool isRecord() const override { return true; }

    /// Converts a Dict or another record into this type (nullptr for anything else)
    ValuePtr convert(Value const& value) const override;

    /// Creates a new instance of this type through normal construction
    virtual std::shared_ptr<MutableObject> create(Attributes const& attributes) const = 0;

    /// Creates a new instance from the entries of mapping, reserved keys are dropped
    std::shared_ptr<MutableObject> fromMapping(Dict const& mapping) const;

    /// Invoked at the end of construction of every instance of this type
    virtual void postConstruct(MutableObject&) const {}

    /// Returns the accessor registry shared by all instances of this type
    AccessorRegistry& accessors() const { return registry; }

private:
    mutable AccessorRegistry registry;
};

/**
 * @brief Get the MetaType for a given C++ type T
 *
 * Maps any supported type to its MetaType singleton:
 *   - bool, integral, floating point and string types → their fundamental MetaType
 *   - List, Tuple, Set, Dict, Null and Value (any) → their container MetaType
 *   - MutableObject, ImmutableObject and Record<> types → their ObjectType
 *
 * @tparam T The type to get metadata for
 * @return Reference to the MetaType singleton for T
 */
template <typename T>
MetaType const& metaTypeOf();

//=============================================================================
// Public API classes
//=============================================================================

/**
 * @brief Abstract base class for type-erased values
 *
 * Value provides a common interface for values of unknown type at runtime.
 * It supports:
 *   - Type identification via type(), kind(), metaType() and typeName()
 *   - Validity checking via isValid() and operator bool()
 *   - Deep copies via clone(), structural comparison via equals() and compare()
 *   - Typed read access via as<T>()
 *   - Type-safe visitation via visit() with lambda overloads
 *
 * Derived classes include:
 *   - Invalid: Sentinel for missing fields
 *   - Null: The null value
 *   - Fundamental<T>: bool, integer, floating point and string values
 *   - List, Tuple, Set, Dict: containers of values
 *   - MutableObject: records, including ImmutableObject and Record<>
 *
 * @note The visitor pattern allows safe access to the underlying value without
 *       knowing its type at compile time. The lambda will be called with the
 *       actual type only if it supports that type.
 */
class Value
{
public:
    /// Global singleton representing a missing value
    static Invalid& kInvalid;

    /// Kinds of values in the order in which compare() ranks them, booleans rank as numbers
    enum class Kind
    {
        invalid,
        null,
        boolean,
        number,
        string,
        tuple,
        list,
        set,
        dict,
        object
    };

    virtual ~Value() = default;

    /// Returns the std::type_info for the underlying value type
    virtual std::type_info const& type() const = 0;

    /// Returns the MetaType descriptor for this value's type
    virtual MetaType const& metaType() const = 0;

    /// Returns the kind of this value
    virtual Kind kind() const = 0;

    /// Returns true if this value is valid (not Invalid)
    virtual bool isValid() const { return true; }

    /// Returns true if this value is the null value
    bool isNull() const { return kind() == Kind::null; }

    /// Converts to bool based on validity (same as isValid())
    explicit operator bool() const { return isValid(); }

    /// Returns the name of this value's type ("int", "list", "Person", ...)
    std::string typeName() const { return metaType().name(); }

    /// Returns a deep copy of this value that shares nothing with it
    virtual ValuePtr clone() const = 0;

    /// Structural equality
    virtual bool equals(Value const& other) const { return compare(other) == 0; }

    /**
     * @brief Three-way comparison defining a total order over all values
     *
     * Values of different kinds are ordered by their kind. Integers and
     * floating point numbers compare numerically with each other.
     *
     * @return A negative number, zero or a positive number
     */
    virtual int compare(Value const& other) const = 0;

    /// Returns a developer readable representation ('text', [1, 2], <Person (...)>)
    std::string repr() const;

    /// Returns the plain text form of this value (strings are not quoted)
    virtual std::string str() const { return repr(); }

    /**
     * @brief Typed read access
     *
     * For fundamental types returns a pointer to the underlying C++ value, for
     * Value subclasses a pointer to this value. Returns nullptr if this value is
     * not of the requested type.
     *
     * @code
     * if (auto age = value.as<std::int64_t>())
     *     std::cout << *age;
     * @endcode
     */
    template <typename T>
    detail::storage_t<T> const* as() const;

    /**
     * @brief Visit the underlying value with a type-safe lambda
     *
     * The lambda will be called with the underlying value if it supports
     * that type. The lambda can accept any subset of the visitable types:
     * Invalid, Null, bool, std::int64_t, double, std::string, Tuple, List,
     * Set, Dict and MutableObject. If it does not support the actual type,
     * a default constructed result is returned.
     *
     * @code
     * value.visit([](auto const& v) { std::cout << v; });  // Generic visitor
     * value.visit([](std::int64_t i) { return i * 2; });   // int-only visitor
     * @endcode
     */
    template <typename Lambda>
    auto visit(Lambda && lambda) const -> decltype(auto);

protected:
    friend class Invalid;
    friend class MutableObject;
    template <typename T> friend class Fundamental;

    using VisitableTypes = std::tuple<
        Invalid, Null,
        bool, std::int64_t, double, std::string,
        Tuple, List, Set, Dict,
        MutableObject
    >;

    using ConstTypesVariant = detail::apply_tuple<std::variant, detail::transform_tuple<VisitableTypes, detail::add_const_reference_wrapper>::type>::type;

    virtual ConstTypesVariant visit_helper() const = 0;

    /// Orders values of different kinds, returns 0 if both are of the same kind
    int compareKinds(Value const& other) const;

    constexpr Value() = default;
    Value(Value const&) = default;
    Value& operator=(Value const&) = default;
};

/**
 * @brief Sentinel type representing a missing field
 *
 * Invalid is returned when a field lookup fails (e.g., reading a
 * non-existent field name). It always returns false for isValid() and
 * can be used in boolean context to check for lookup failures. It is
 * never stored in a record.
 *
 * @code
 * auto const& field = person("nonexistent");
 * if (! field) {
 *     std::cout << "Field not found!" << std::endl;
 * }
 * @endcode
 */
class Invalid : public Value
{
public:
    constexpr Invalid() = default;

    std::type_info const& type() const override { return typeid(void); }
    MetaType const& metaType() const override;
    Kind kind() const override { return Kind::invalid; }
    bool isValid() const override { return false; }
    ValuePtr clone() const override;
    int compare(Value const& other) const override;

protected:
    ConstTypesVariant visit_helper() const override;
};

/**
 * @brief The null value
 *
 * Stored for declared fields that were not supplied at construction and for
 * explicit nulls. Null passes every declared type check unchanged.
 */
class Null : public Value
{
public:
    Null() = default;

    /// Shared null instance
    static std::shared_ptr<Null> const& instance();

    std::type_info const& type() const override { return typeid(std::nullptr_t); }
    MetaType const& metaType() const override;
    Kind kind() const override { return Kind::null; }
    ValuePtr clone() const override;
    int compare(Value const& other) const override;

protected:
    ConstTypesVariant visit_helper() const override;
};

/**
 * @brief Concrete wrapper for a fundamental value of type T
 *
 * Fundamental<T> holds one of the supported fundamental types: bool,
 * std::int64_t, double or std::string. Fundamental values are immutable
 * once constructed, so sharing them between records is always safe.
 *
 * @tparam T The underlying value type
 */
template <typename T>
class Fundamental : public Value
{
public:
    using SupportedFundamentalTypes = std::tuple<bool, std::int64_t, double, std::string>;

    // T must be one of SupportedFundamentalTypes
    static_assert(
        std::invoke(
            [] <typename... Type> (std::type_identity<std::tuple<Type...>>)
            {
                return (std::is_same_v<T, Type> || ...);
            },
            std::type_identity<SupportedFundamentalTypes>()
        )
    );

    /// Default constructor - creates a Fundamental with default-initialized value
    Fundamental();

    /// Construct from underlying value
    Fundamental(T underlying_);

    /// Returns the type_info for the underlying type T
    std::type_info const& type() const override { return typeid(T); }

    /// Returns the MetaType for the underlying type T
    MetaType const& metaType() const override;

    Kind kind() const override;

    /// Returns the underlying value (read-only access)
    T const& operator()() const { return underlying; }

    /// Implicit conversion to the underlying type
    operator T() const { return underlying; }

    ValuePtr clone() const override;
    int compare(Value const& other) const override;
    std::string str() const override;

protected:
    ConstTypesVariant visit_helper() const override;

    T underlying;
};

/**
 * @brief Builds a ValuePtr from a C++ value
 *
 * bool → Fundamental<bool>, other integral types → Fundamental<std::int64_t>,
 * floating point → Fundamental<double>, anything convertible to a string_view
 * → Fundamental<std::string>, nullptr → Null. A shared_ptr to a Value subclass
 * is returned as is (an empty one becomes Null), a Value passed by reference
 * is cloned.
 */
template <typename T>
ValuePtr make(T && value);

/**
 * @brief A named value, the building block of construction arguments and mappings
 *
 * @code
 * Attributes attributes = {{"name", "Alice"}, {"age", 30}, {"tags", List::of("a", "b")}};
 * @endcode
 */
struct Attribute
{
    template <typename T>
    Attribute(std::string name_, T && value_) : name(std::move(name_)), value(make(std::forward<T>(value_))) {}

    std::string name;
    ValuePtr value;
};

//=============================================================================
// Containers
//=============================================================================

/**
 * @brief Common base of the element containers List, Tuple and Set
 *
 * Holds its elements as shared value handles. Copying a handle shares the
 * element; clone() copies the elements too.
 */
class Collection : public Value
{
public:
    using const_iterator = std::vector<ValuePtr>::const_iterator;

    /// Returns the number of elements
    std::size_t size() const { return items.size(); }

    /// Returns true if the container has no elements
    bool empty() const { return items.empty(); }

    /// Element access by index (asserts on out of range in debug builds)
    ValuePtr const& operator[](std::size_t idx) const;

    /// Element access by index, throws std::out_of_range
    ValuePtr const& at(std::size_t idx) const { return items.at(idx); }

    /// Returns true if an element equal to item exists
    virtual bool contains(Value const& item) const;

    /// All elements in order
    std::vector<ValuePtr> const& elements() const { return items; }

    const_iterator begin() const { return items.cbegin(); }
    const_iterator end() const { return items.cend(); }

    int compare(Value const& other) const override;

protected:
    Collection() = default;
    explicit Collection(std::vector<ValuePtr> elements_);

    std::vector<ValuePtr> items;
};

/// Ordered, mutable sequence of values
class List : public Collection
{
public:
    List() = default;
    explicit List(std::vector<ValuePtr> elements_);

    /// Creates a list from C++ values (see make())
    template <typename... Ts>
    static std::shared_ptr<List> of(Ts &&... values);

    std::type_info const& type() const override { return typeid(List); }
    MetaType const& metaType() const override;
    Kind kind() const override { return Kind::list; }
    ValuePtr clone() const override;

    /// Add an element to the end of the list
    void append(ValuePtr element);

    template <typename T>
    void append(T && element) { append(make(std::forward<T>(element))); }

    /// Replace the element at idx, throws std::out_of_range
    void replace(std::size_t idx, ValuePtr element);

    /// Remove the element at idx, throws std::out_of_range
    void removeAt(std::size_t idx);

    /// Remove all elements
    void clear() { items.clear(); }

protected:
    ConstTypesVariant visit_helper() const override;
};

/// Ordered, fixed sequence of values (tuples and pairs)
class Tuple : public Collection
{
public:
    Tuple() = default;
    explicit Tuple(std::vector<ValuePtr> elements_);

    /// Creates a tuple from C++ values (see make())
    template <typename... Ts>
    static std::shared_ptr<Tuple> of(Ts &&... values);

    std::type_info const& type() const override { return typeid(Tuple); }
    MetaType const& metaType() const override;
    Kind kind() const override { return Kind::tuple; }
    ValuePtr clone() const override;

protected:
    ConstTypesVariant visit_helper() const override;
};

/**
 * @brief Set of unique values
 *
 * Elements are kept sorted by Value::compare(), so iteration order is
 * deterministic. Elements must not be mutated while they are in a set.
 */
class Set : public Collection
{
public:
    Set() = default;
    explicit Set(std::vector<ValuePtr> elements_);

    /// Creates a set from C++ values (see make())
    template <typename... Ts>
    static std::shared_ptr<Set> of(Ts &&... values);

    std::type_info const& type() const override { return typeid(Set); }
    MetaType const& metaType() const override;
    Kind kind() const override { return Kind::set; }
    ValuePtr clone() const override;
    bool contains(Value const& item) const override;

    /// Add an element, returns false if an equal element was already present
    bool insert(ValuePtr element);

    template <typename T>
    bool insert(T && element) { return insert(make(std::forward<T>(element))); }

    /// Remove the element equal to item, returns false if there was none
    bool erase(Value const& item);

protected:
    ConstTypesVariant visit_helper() const override;

private:
    std::vector<ValuePtr>::const_iterator lowerBound(Value const& item) const;
};

/**
 * @brief Insertion-ordered mapping from string keys to values
 *
 * Setting an existing key replaces its value in place, new keys are
 * appended.
 */
class Dict : public Value
{
public:
    using const_iterator = Attributes::const_iterator;

    Dict() = default;
    explicit Dict(Attributes entries_);

    /// Creates a dict from attributes
    static std::shared_ptr<Dict> of(Attributes entries_);

    std::type_info const& type() const override { return typeid(Dict); }
    MetaType const& metaType() const override;
    Kind kind() const override { return Kind::dict; }
    ValuePtr clone() const override;
    bool equals(Value const& other) const override;
    int compare(Value const& other) const override;

    /// Returns the number of entries
    std::size_t size() const { return entries.size(); }

    /// Returns true if the dict has no entries
    bool empty() const { return entries.empty(); }

    /// Returns true if the dict contains an entry with the given key
    bool contains(std::string_view key) const;

    /// Returns the value stored for key, or nullptr if there is none
    ValuePtr get(std::string_view key) const;

    /// Returns the value stored for key, throws NotFound
    ValuePtr const& at(std::string_view key) const;

    /// Add or replace an entry
    void set(std::string_view key, ValuePtr value);

    template <typename T>
    void set(std::string_view key, T && value) { set(key, make(std::forward<T>(value))); }

    /// Remove the entry for key, returns false if the key didn't exist
    bool remove(std::string_view key);

    /// Keys in insertion order
    std::vector<std::string> keys() const;

    /// Entries in insertion order
    Attributes const& items() const { return entries; }

    const_iterator begin() const { return entries.cbegin(); }
    const_iterator end() const { return entries.cend(); }

protected:
    ConstTypesVariant visit_helper() const override;

private:
    Attributes entries;
};

//=============================================================================
// Type coercion
//=============================================================================

/**
 * @brief Conversion table entry for a declarable field type
 *
 * Specialize Converter<T> to make T usable as the declared type of a field.
 * A specialization provides:
 *   - kName: the type's name as it appears in error messages
 *   - isInstance(Value const&): true if a value already satisfies T
 *   - convert(Value const&): the converted value, or nullptr if the value
 *     cannot be converted
 *
 * Record types don't need a Converter; their ObjectType converts mappings.
 */
template <typename T>
struct Converter;

/// True if T has an entry in the conversion table
template <typename T>
concept Convertible = requires (Value const& v)
{
    { Converter<T>::kName } -> std::convertible_to<std::string_view>;
    { Converter<T>::isInstance(v) } -> std::same_as<bool>;
    { Converter<T>::convert(v) } -> std::same_as<ValuePtr>;
};

/// True if T is a record type that describes itself through an ObjectType
template <typename T>
concept HasObjectType = requires { { T::meta() } -> std::convertible_to<ObjectType const&>; };

template <> struct Converter<bool>
{
    static constexpr std::string_view kName = "bool";
    static bool isInstance(Value const& value);
    static ValuePtr convert(Value const& value);
};

template <> struct Converter<std::int64_t>
{
    static constexpr std::string_view kName = "int";
    static bool isInstance(Value const& value);
    static ValuePtr convert(Value const& value);
};

template <> struct Converter<double>
{
    static constexpr std::string_view kName = "float";
    static bool isInstance(Value const& value);
    static ValuePtr convert(Value const& value);
};

template <> struct Converter<std::string>
{
    static constexpr std::string_view kName = "str";
    static bool isInstance(Value const& value);
    static ValuePtr convert(Value const& value);
};

template <> struct Converter<Null>
{
    static constexpr std::string_view kName = "NoneType";
    static bool isInstance(Value const& value);
    static ValuePtr convert(Value const& value);
};

template <> struct Converter<List>
{
    static constexpr std::string_view kName = "list";
    static bool isInstance(Value const& value);
    static ValuePtr convert(Value const& value);
};

template <> struct Converter<Tuple>
{
    static constexpr std::string_view kName = "tuple";
    static bool isInstance(Value const& value);
    static ValuePtr convert(Value const& value);
};

template <> struct Converter<Set>
{
    static constexpr std::string_view kName = "set";
    static bool isInstance(Value const& value);
    static ValuePtr convert(Value const& value);
};

template <> struct Converter<Dict>
{
    static constexpr std::string_view kName = "dict";
    static bool isInstance(Value const& value);
    static ValuePtr convert(Value const& value);
};

/// Declaring a field as Value accepts values of any type
template <> struct Converter<Value>
{
    static constexpr std::string_view kName = "Any";
    static bool isInstance(Value const&) { return true; }
    static ValuePtr convert(Value const& value) { return value.clone(); }
};

/// MetaType backed by a Converter<T> table entry
template <Convertible T>
class ConvertibleMeta : public MetaType
{
public:
    std::type_info const& typeInfo() const override { return typeid(T); }
    std::string name() const override { return std::string(Converter<T>::kName); }
    bool isOpaque() const override { return ! std::is_base_of_v<Value, T>; }
    bool isInstance(Value const& value) const override { return Converter<T>::isInstance(value); }
    ValuePtr convert(Value const& value) const override { return Converter<T>::convert(value); }
};

/**
 * @brief Checks and, if needed, converts a construction value for a declared field
 *
 * Null values and fields without an expected type pass through unchanged, as
 * do values that already are instances of the expected type. Anything else is
 * converted with expected->convert().
 *
 * @throws TypeMismatch if the conversion fails
 */
ValuePtr coerce(std::string_view name, ValuePtr value, MetaType const* expected);

//=============================================================================
// Records
//=============================================================================

/// Sort order for MutableObject::toMapping()
enum class SortOrder
{
    none,        ///< Insertion order
    ascending,   ///< By field name, A to Z
    descending   ///< By field name, Z to A
};

/**
 * @brief A record of named values that can be read and written freely
 *
 * MutableObject stores its fields in insertion order. Fields whose names
 * start with kReservedPrefix are bookkeeping fields: they can be read and
 * written, but they are kept apart from the public fields and take no part
 * in enumeration, equality, locking or serialization.
 *
 * Types that declare their fields (see Record<>) check and coerce each
 * construction value against the declared type. Later writes are not type
 * checked.
 *
 * @code
 * auto object = std::make_shared<MutableObject>(Attributes {{"name", "Alice"}, {"age", 30}});
 * object->set("age", 31);
 * object->get("age")->as<std::int64_t>();   // 31
 * object->get("missing");                   // nullptr
 * @endcode
 */
class MutableObject : public Value
{
public:
    using const_iterator = Attributes::const_iterator;

    /// Creates an empty object
    MutableObject();

    /// Creates an object holding the given attributes
    explicit MutableObject(Attributes const& attributes);

    MutableObject(MutableObject const&) = delete;
    MutableObject& operator=(MutableObject const&) = delete;

    ~MutableObject() override = default;

    /// Returns the ObjectType of MutableObject
    static ObjectType const& meta();

    /// Creates an object from a mapping, reserved keys are dropped
    static std::shared_ptr<MutableObject> fromMapping(Dict const& mapping);

    /// Creates an object from its JSON text form, throws ParseError
    static std::shared_ptr<MutableObject> fromText(std::string const& text);

    // overridden base methods
    std::type_info const& type() const override { return typeid(*this); }
    MetaType const& metaType() const override { return objectMeta; }
    Kind kind() const override { return Kind::object; }
    ValuePtr clone() const override;
    bool equals(Value const& other) const override;
    int compare(Value const& other) const override;

    //=========================================================================
    // Attribute access
    //=========================================================================

    /**
     * @brief Access a field by name at runtime
     *
     * @param name The name of the field to access
     * @return Reference to the field's value, or kInvalid if not found
     */
    Value const& operator()(std::string_view name) const;

    /// Returns the field's value, or defaultValue if there is no such field
    ValuePtr get(std::string_view name, ValuePtr defaultValue = nullptr) const;

    /// Same as get() with a mandatory default
    ValuePtr getOrDefault(std::string_view name, ValuePtr defaultValue) const;

    /// Typed read access, nullptr if the field is missing or of another type
    template <typename T>
    detail::storage_t<T> const* getAs(std::string_view name) const { return (*this)(name).template as<T>(); }

    /// Returns the field's value, throws NotFound if there is no such field
    ValuePtr at(std::string_view name) const;

    /**
     * @brief Set a field, creating it if it doesn't exist
     *
     * @throws Immutable if the object rejects writes to this field
     */
    void set(std::string_view name, ValuePtr value);

    /// @overload Set from a C++ value (see make())
    template <typename T>
    void set(std::string_view name, T && value) { set(name, make(std::forward<T>(value))); }

    /**
     * @brief Remove a field
     *
     * @throws NotFound if there is no such field
     * @throws Immutable if the object rejects writes to this field
     */
    virtual void remove(std::string_view name);

    /// Set every given attribute
    virtual void update(Attributes const& attributes);

    /// Set only the attributes that don't exist yet
    void updateDefaults(Attributes const& defaults);

    /**
     * @brief Presence test across the whole field set
     *
     * True if a field called name exists, or if a field holding a value equal
     * to value exists. If both are given, both must be present, though not
     * necessarily on the same field. Returns false if neither is given.
     */
    bool has(std::optional<std::string_view> name, ValuePtr value = nullptr) const;

    /// True if item is a string naming a field, or equals one of the field values
    bool contains(Value const& item) const;

    //=========================================================================
    // Enumeration (public fields, insertion order)
    //=========================================================================

    /// Returns the number of public fields
    std::size_t size() const { return fields.size(); }

    /// Returns true if the object has no public fields
    bool empty() const { return fields.empty(); }

    Attributes items() const { return fields; }
    std::vector<std::string> keys() const;
    std::vector<ValuePtr> values() const;
    std::vector<std::pair<std::size_t, Attribute>> enumerate() const;

    /// Returns the ObjectType of the most derived type
    ObjectType const& objectType() const { return objectMeta; }

    const_iterator begin() const { return fields.cbegin(); }
    const_iterator end() const { return fields.cend(); }

    //=========================================================================
    // Structural operations
    //=========================================================================

    /// True if every named field is equal in both objects, missing fields compare as kInvalid
    bool equals(MutableObject const& other, std::vector<std::string> const& keysToCompare) const;

    /// Returns the fields whose value is an instance of T
    template <typename T>
    Dict filterByType() const;

    /// Returns the fields named in keys (all if empty) whose value is an instance of type (any if null)
    Dict toFilteredMapping(std::vector<std::string> const& keysToKeep, MetaType const* type = nullptr) const;

    /**
     * @brief Shallow copy, the copy shares its field values with this object
     *
     * @param asMutable Create a plain MutableObject instead of an object of the same type
     */
    std::shared_ptr<MutableObject> copy(bool asMutable = false) const;

    /**
     * @brief Deep copy that shares no containers or records with this object
     *
     * Nested records are deep copied through their own deepClone(), containers
     * are rebuilt element by element and everything else is cloned. The copy
     * is constructed normally, so lock state is derived anew.
     *
     * @param asMutable Create plain MutableObjects (for the whole tree) instead
     *        of objects of the same types
     */
    std::shared_ptr<MutableObject> deepClone(bool asMutable = false) const;

    //=========================================================================
    // Projection
    //=========================================================================

    /// Returns the fields as a mapping, without the excluded names
    Dict toMapping(std::vector<std::string> const& exclude = {},
                   SortOrder sort = SortOrder::none,
                   bool includeReserved = false) const;

    /// Returns the JSON text form of the public fields, without the excluded names
    std::string toText(std::vector<std::string> const& exclude = {}, bool sortKeys = false) const;

protected:
    /// Construction with the ObjectType of the most derived type
    MutableObject(ObjectType const& meta, Attributes const& attributes);

    /// Throws if a write to name is not allowed (MutableObject allows everything)
    virtual void checkWrite(std::string_view name) const;

    /// Write bypassing checkWrite(), registers new public names with the accessor registry
    void store(std::string_view name, ValuePtr value);

    /// Removal bypassing checkWrite(), returns false if there was no such field
    bool erase(std::string_view name);

    ConstTypesVariant visit_helper() const override;

private:
    void construct(Attributes const& attributes);
    Attribute const* find(std::string_view name) const;

    ObjectType const& objectMeta;
    Attributes fields;
    Attributes reserved;
};

/**
 * @brief A record whose fields are locked against writes
 *
 * Every field supplied at construction is locked once construction is
 * complete. Writes and removals of locked fields throw Immutable. Fields can
 * be unlocked and locked again individually with unlock()/lock(), and new
 * fields can be introduced with lock(name, true, value).
 *
 * The first explicit lock() seals the object: from then on it only accepts
 * writes to fields in its lock table. freeze() locks every field and seals
 * the object.
 *
 * @code
 * ImmutableObject point({{"x", 10}, {"y", 20}});
 * point.set("x", 15);                  // throws Immutable
 * point.unlock("x");
 * point.set("x", 15);                  // fine
 * point.lock("z", true, 30);           // new locked field
 * @endcode
 */
class ImmutableObject : public MutableObject
{
public:
    /// Creates an empty object
    ImmutableObject();

    /// Creates an object holding the given attributes, all of them locked
    explicit ImmutableObject(Attributes const& attributes);

    /// Returns the ObjectType of ImmutableObject
    static ObjectType const& meta();

    /// Creates an object from a mapping, reserved keys are dropped
    static std::shared_ptr<ImmutableObject> fromMapping(Dict const& mapping);

    /// Creates an object from its JSON text form, throws ParseError
    static std::shared_ptr<ImmutableObject> fromText(std::string const& text);

    /// Returns true if the field is currently locked
    bool isLocked(std::string_view name) const;

    /// Returns true if the object only accepts writes to fields in its lock table
    bool isSealed() const { return sealed; }

    /**
     * @brief Lock a field, optionally writing a value to it first
     *
     * @param name The field to lock
     * @param allowNew Allow locking a field that is not in the lock table yet
     * @param value If not null, stored before locking (bypasses the lock)
     *
     * @throws NotRegistered if name is not in the lock table and allowNew is false
     * @throws PrivateField if name is a reserved name
     * @throws MissingValue if allowNew is true, the field doesn't exist and no value was given
     */
    void lock(std::string_view name, bool allowNew = false, ValuePtr value = nullptr);

    /// @overload Lock with a C++ value (see make())
    template <typename T>
        requires (! std::is_same_v<std::remove_cvref_t<T>, std::nullptr_t>)
    void lock(std::string_view name, bool allowNew, T && value) { lock(name, allowNew, make(std::forward<T>(value))); }

    /**
     * @brief Unlock a field
     *
     * @throws NotRegistered if name is not in the lock table
     * @throws PrivateField if name is a reserved name
     */
    void unlock(std::string_view name);

    /// Lock every public field and seal the object
    void freeze();

    // overridden base methods
    void remove(std::string_view name) override;

    /// Checks every attribute before writing any of them, then locks the new ones
    void update(Attributes const& attributes) override;

protected:
    /// Construction with the ObjectType of the most derived type
    ImmutableObject(ObjectType const& meta, Attributes const& attributes);

    void checkWrite(std::string_view name) const override;

private:
    std::map<std::string, bool, std::less<>> locks;
    bool constructed = false;
    bool sealed = false;
};

/**
 * @brief Declared field of a record schema
 *
 * Each member of a schema struct is wrapped in Field<Type, "name"> to declare
 * the field's name and type. Record<> reflects over these members at compile
 * time; the members themselves hold no data.
 *
 * Type may be bool, any integral or floating point type, std::string, List,
 * Tuple, Set, Dict, Value (any type) or another record type.
 *
 * @tparam T The declared type of the field
 * @tparam Name Compile-time string literal for the field name
 *
 * @code
 * struct PointFields {
 *     Field<double, "x"> x;
 *     Field<double, "y"> y;
 * };
 * @endcode
 */
template <typename T, fixstr::fixed_string Name>
struct Field
{
    /// The declared type, normalised (int → std::int64_t, char const* → std::string, ...)
    using type = detail::storage_t<T>;

    static_assert(Convertible<type> || HasObjectType<type>, "Field type has no entry in the conversion table");

    /// The field name as specified in the template parameter
    static constexpr std::string_view kName = std::string_view(Name);
};

/**
 * @brief User-defined literal for creating compile-time field name tags
 *
 * Use this literal to create CompileTimeString objects for type-safe access
 * to declared fields. The syntax "fieldname"_fld creates a tag that can be
 * passed to Record::operator() for compile-time verified field access.
 *
 * @code
 * person("age"_fld);           // std::int64_t const*
 * person.set("age"_fld, 31);
 * @endcode
 *
 * @return CompileTimeString containing the field name
 */
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr CompileTimeString<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_fld();
#pragma GCC diagnostic pop

/**
 * @brief A record type with declared fields
 *
 * Record extends MutableObject (or ImmutableObject) with a schema:
 *   - Every declared field exists in every instance, Null if it wasn't supplied
 *   - Construction values are checked and coerced against the declared types
 *   - Supplying an undeclared name at construction throws UnexpectedField
 *   - Typed access to declared fields via operator()(CompileTimeString) using "_fld" literal
 *   - Static kFieldNames array containing all declared field names
 *
 * If Schema declares `static void postInit(MutableObject&)`, it is invoked at
 * the end of each construction, before an immutable record gets locked.
 * Schema may also declare `static constexpr std::string_view kName` for use
 * in error messages and representations.
 *
 * @tparam Schema A struct where all members are wrapped in Field<Type, "name">
 * @tparam Base MutableObject or ImmutableObject
 *
 * @code
 * struct PersonFields {
 *     Field<std::string, "name"> name;
 *     Field<std::int64_t, "age"> age;
 * };
 * using Person = Record<PersonFields>;
 * using FrozenPerson = Record<PersonFields, ImmutableObject>;
 * @endcode
 */
template <typename Schema, typename Base = MutableObject>
class Record : public Base
{
    static_assert(std::is_base_of_v<MutableObject, Base>);

private:
    using ReferenceTuple = decltype(detail::filter_tuple<detail::is_field>(boost::pfr::structure_tie(std::declval<Schema&>())));

public:
    /// Tuple of all declared Field<> types in declaration order
    using FieldsAsTuple = typename detail::decay_tuple<ReferenceTuple>::type;
    static_assert(std::tuple_size_v<FieldsAsTuple> >= 1);

    /// Compile-time array of all declared field names in declaration order
    static constexpr std::array<std::string_view const, std::tuple_size_v<FieldsAsTuple>> kFieldNames =
        std::invoke([] <typename... Types> (std::type_identity<std::tuple<Types...>>)
        {
            std::array<std::string_view const, std::tuple_size_v<FieldsAsTuple>> returnValue = {{
                Types::kName...
            }};

            return returnValue;
        }, std::type_identity<FieldsAsTuple>());

    /// Creates a record with every declared field set to Null
    Record();

    /// Creates a record from construction values, throws TypeMismatch or UnexpectedField
    explicit Record(Attributes const& attributes);

    /// Returns the ObjectType describing this record type and its declared fields
    static ObjectType const& meta();

    /// Creates a record from a mapping, reserved keys are dropped
    static std::shared_ptr<Record> fromMapping(Dict const& mapping);

    /// Creates a record from its JSON text form, throws ParseError
    static std::shared_ptr<Record> fromText(std::string const& text);

    using Base::operator();
    using Base::set;

    /**
     * @brief Typed access to a declared field using "_fld" literal
     *
     * @tparam FieldName Compile-time string from "_fld" literal
     * @return Pointer to the value in its declared type, or nullptr if the
     *         field holds Null or a value of another type
     */
    template <fixstr::fixed_string FieldName>
    auto operator()(CompileTimeString<FieldName>) const;

    /// Write a declared field using "_fld" literal
    template <fixstr::fixed_string FieldName, typename U>
    void set(CompileTimeString<FieldName>, U && value);

    /**
     * @brief Visit all declared fields with a lambda
     *
     * @param lambda Callable taking (std::string_view name, Value const& value)
     */
    template <typename Lambda>
    void visitFields(Lambda && lambda) const;
};

/**
 * @brief Base class for builders configured through an immutable object
 *
 * A Builder is an ImmutableObject with a single locked field, "configuration",
 * holding a Dict. The configuration itself stays writable through
 * configure()/removeOption() and is what build() turns into a product.
 *
 * Copies and deep clones of a builder are new default constructed instances
 * of Derived carrying the copied configuration.
 *
 * @code
 * class GreetingBuilder : public Builder<GreetingBuilder, Greeting> { ... };
 * @endcode
 *
 * @tparam Derived The concrete, default constructible builder class
 * @tparam Product The type of object the builder produces
 */
template <typename Derived, typename Product>
class Builder : public ImmutableObject
{
public:
    Builder();

    static ObjectType const& meta();

    /// The configuration collected so far
    Dict const& configuration() const;

    /// Set a configuration option
    void configure(std::string_view key, ValuePtr value);

    template <typename T>
    void configure(std::string_view key, T && value) { configure(key, make(std::forward<T>(value))); }

    /// Returns a configuration option, throws NotFound
    ValuePtr option(std::string_view key) const;

    /// Removes a configuration option, throws NotFound
    void removeOption(std::string_view key);

    /// Returns true if the option is configured
    bool hasOption(std::string_view key) const;

    /// The plain text form of the configuration
    std::string str() const override;

    /// Builds the product from the configuration
    virtual std::shared_ptr<Product> build() const = 0;

private:
    explicit Builder(std::shared_ptr<Dict> config_);

    std::shared_ptr<Dict> config;
};

//=============================================================================
// Operators
//=============================================================================

/// Structural equality of two values
bool operator==(Value const& lhs, Value const& rhs);

/// Total order of values, see Value::compare()
bool operator<(Value const& lhs, Value const& rhs);
bool operator>(Value const& lhs, Value const& rhs);

/**
 * @brief Union of two records
 *
 * @return A new record of lhs's type holding the fields of both, rhs's values
 *         winning on name collisions, or nullptr if rhs is not of lhs's type
 */
std::shared_ptr<MutableObject> operator+(MutableObject const& lhs, MutableObject const& rhs);

/// Returns a new record of lhs's type with the fields of lhs whose names rhs doesn't have
std::shared_ptr<MutableObject> operator-(MutableObject const& lhs, MutableObject const& rhs);

/// Parses the JSON text form of an object into a mapping, throws ParseError
Dict parseText(std::string const& text);

// Stream output operators
std::ostream& operator<<(std::ostream& o, Value const& x);

} // namespace baseobject

//=============================================================================
// std::formatter specializations
//=============================================================================
template <>
struct std::formatter<baseobject::Value> : std::formatter<std::string>
{
    auto format(baseobject::Value const& v, format_context& ctx) const
    {
        return std::formatter<std::string>::format(v.repr(), ctx);
    }
};

template <typename T>
    requires (std::is_base_of_v<baseobject::Value, T> && ! std::is_same_v<T, baseobject::Value>)
struct std::formatter<T> : std::formatter<baseobject::Value> {};

// Include template implementations
#include "baseobject.tpp"
