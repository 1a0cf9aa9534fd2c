#pragma once

namespace baseobject
{

//=============================================================================
// Value implementations
//=============================================================================
template <typename Lambda>
auto Value::visit(Lambda && lambda) const -> decltype(auto)
{
    using AllArgumentRefs = detail::transform_tuple<VisitableTypes, detail::add_const_lvalue_ref>::type;
    using SupportedArgumentsByLambda = decltype(detail::filter_tuple<detail::DoesLambdaSupportType<Lambda>::template Predicate>(std::declval<AllArgumentRefs>()));
    static_assert(std::tuple_size_v<SupportedArgumentsByLambda> >= 1, "Your lambda must be callable with at least one of the types in VisitableTypes");

    using LambdaReturnTypes = detail::transform_tuple<SupportedArgumentsByLambda, detail::BindFirst<std::invoke_result_t, Lambda>::template Result>::type;
    using LambdaReturnType = detail::apply_tuple<std::common_type, LambdaReturnTypes>::type::type;

    return std::visit([&lambda] <typename T> (std::reference_wrapper<T> v) -> LambdaReturnType
    {
        if constexpr (std::is_invocable_v<Lambda, T&>)
            return lambda(v.get());
        else if constexpr (! std::is_void_v<LambdaReturnType>)
            return LambdaReturnType{};
    }, visit_helper());
}

template <typename T>
detail::storage_t<T> const* Value::as() const
{
    using Storage = detail::storage_t<T>;

    if constexpr (std::is_base_of_v<Value, Storage>)
    {
        return dynamic_cast<Storage const*>(this);
    }
    else
    {
        if (auto const* fundamental = dynamic_cast<Fundamental<Storage> const*>(this))
            return &(*fundamental)();

        return nullptr;
    }
}

//=============================================================================
// Fundamental implementations
//=============================================================================
template <typename T>
Fundamental<T>::Fundamental() : underlying()
{}

template <typename T>
Fundamental<T>::Fundamental(T underlying_) : underlying(std::move(underlying_))
{}

template <typename T>
MetaType const& Fundamental<T>::metaType() const
{
    return metaTypeOf<T>();
}

template <typename T>
Value::Kind Fundamental<T>::kind() const
{
    if constexpr (std::is_same_v<T, bool>)
        return Kind::boolean;
    else if constexpr (std::is_same_v<T, std::string>)
        return Kind::string;
    else
        return Kind::number;
}

template <typename T>
ValuePtr Fundamental<T>::clone() const
{
    return std::make_shared<Fundamental<T>>(underlying);
}

template <typename T>
int Fundamental<T>::compare(Value const& other) const
{
    if (auto result = compareKinds(other); result != 0)
        return result;

    if constexpr (std::is_same_v<T, std::string>)
    {
        auto const& rhs = static_cast<Fundamental<std::string> const&>(other).underlying;
        return underlying < rhs ? -1 : (rhs < underlying ? 1 : 0);
    }
    else
    {
        // booleans, integers and floating point numbers share one rank
        auto const lhs = [this]
        {
            if constexpr (std::is_same_v<T, bool>)
                return static_cast<std::int64_t>(underlying);
            else
                return underlying;
        }();

        if (auto const* rhs = other.as<double>())
            return detail::compareNumbers(lhs, *rhs);

        if (auto const* rhs = other.as<bool>())
            return detail::compareNumbers(lhs, static_cast<std::int64_t>(*rhs));

        return detail::compareNumbers(lhs, *other.as<std::int64_t>());
    }
}

template <typename T>
std::string Fundamental<T>::str() const
{
    if constexpr (std::is_same_v<T, std::string>)
        return underlying;
    else
        return repr();
}

template <typename T>
typename Value::ConstTypesVariant Fundamental<T>::visit_helper() const
{
    return ConstTypesVariant(std::in_place_type<std::reference_wrapper<T const>>, underlying);
}

//=============================================================================
// make implementation
//=============================================================================
template <typename T>
ValuePtr make(T && value)
{
    using Type = std::remove_cvref_t<T>;

    if constexpr (std::is_same_v<Type, std::nullptr_t>)
    {
        return Null::instance();
    }
    else if constexpr (detail::is_value_pointer<T>)
    {
        if (value == nullptr)
            return Null::instance();

        return ValuePtr(std::forward<T>(value));
    }
    else if constexpr (std::is_same_v<Type, bool>)
    {
        return std::make_shared<Fundamental<bool>>(value);
    }
    else if constexpr (std::is_integral_v<Type>)
    {
        return std::make_shared<Fundamental<std::int64_t>>(static_cast<std::int64_t>(value));
    }
    else if constexpr (std::is_floating_point_v<Type>)
    {
        return std::make_shared<Fundamental<double>>(static_cast<double>(value));
    }
    else if constexpr (std::is_convertible_v<T, std::string_view>)
    {
        return std::make_shared<Fundamental<std::string>>(std::string(std::string_view(value)));
    }
    else if constexpr (std::is_base_of_v<Value, Type>)
    {
        // a value passed by reference is copied, ownership stays with the caller
        return value.clone();
    }
    else
    {
        static_assert(detail::dependent_false<T>, "make() does not support this type");
    }
}

//=============================================================================
// Container implementations
//=============================================================================
template <typename... Ts>
std::shared_ptr<List> List::of(Ts &&... values)
{
    return std::make_shared<List>(std::vector<ValuePtr> { make(std::forward<Ts>(values))... });
}

template <typename... Ts>
std::shared_ptr<Tuple> Tuple::of(Ts &&... values)
{
    return std::make_shared<Tuple>(std::vector<ValuePtr> { make(std::forward<Ts>(values))... });
}

template <typename... Ts>
std::shared_ptr<Set> Set::of(Ts &&... values)
{
    return std::make_shared<Set>(std::vector<ValuePtr> { make(std::forward<Ts>(values))... });
}

//=============================================================================
// MetaType implementations
//=============================================================================
template <typename T>
MetaType const& metaTypeOf()
{
    using Type = detail::storage_t<T>;

    if constexpr (HasObjectType<Type>)
    {
        return Type::meta();
    }
    else
    {
        static_assert(Convertible<Type>, "Type has no entry in the conversion table");

        static ConvertibleMeta<Type> instance;
        return instance;
    }
}

/**
 * @brief ObjectType of a Record<Schema, Base>
 *
 * Describes the declared fields of Schema and creates instances of the
 * record type.
 */
template <typename Schema, typename Base>
class RecordMeta : public ObjectType
{
public:
    using RecordType = Record<Schema, Base>;

    std::type_info const& typeInfo() const override { return typeid(RecordType); }
    std::string name() const override { return detail::schemaName<Schema>(); }

    std::span<FieldDescriptor const> fields() const override
    {
        static auto const descriptors = std::invoke([] <typename... Fields> (std::type_identity<std::tuple<Fields...>>)
        {
            return std::array<FieldDescriptor, sizeof...(Fields)> {{
                FieldDescriptor { Fields::kName, &metaTypeOf<typename Fields::type> }...
            }};
        }, std::type_identity<typename RecordType::FieldsAsTuple>());

        return descriptors;
    }

    bool isInstance(Value const& value) const override
    {
        return dynamic_cast<RecordType const*>(&value) != nullptr;
    }

    std::shared_ptr<MutableObject> create(Attributes const& attributes) const override
    {
        return std::make_shared<RecordType>(attributes);
    }

    void postConstruct(MutableObject& object) const override
    {
        if constexpr (requires { Schema::postInit(object); })
            Schema::postInit(object);
    }
};

//=============================================================================
// MutableObject implementations
//=============================================================================
template <typename T>
Dict MutableObject::filterByType() const
{
    return toFilteredMapping({}, &metaTypeOf<T>());
}

//=============================================================================
// operator""_fld implementation
//=============================================================================
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr CompileTimeString<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_fld()
{
    return { };
}
#pragma GCC diagnostic pop

//=============================================================================
// Record implementations
//=============================================================================
template <typename Schema, typename Base>
Record<Schema, Base>::Record() : Base(meta(), Attributes {})
{}

template <typename Schema, typename Base>
Record<Schema, Base>::Record(Attributes const& attributes) : Base(meta(), attributes)
{}

template <typename Schema, typename Base>
ObjectType const& Record<Schema, Base>::meta()
{
    static RecordMeta<Schema, Base> instance;
    return instance;
}

template <typename Schema, typename Base>
std::shared_ptr<Record<Schema, Base>> Record<Schema, Base>::fromMapping(Dict const& mapping)
{
    return std::static_pointer_cast<Record>(meta().fromMapping(mapping));
}

template <typename Schema, typename Base>
std::shared_ptr<Record<Schema, Base>> Record<Schema, Base>::fromText(std::string const& text)
{
    return fromMapping(parseText(text));
}

template <typename Schema, typename Base>
template <fixstr::fixed_string FieldName>
auto Record<Schema, Base>::operator()(CompileTimeString<FieldName>) const
{
    static constexpr auto kIndex = detail::FindFieldHelper<FieldName, FieldsAsTuple>::eval();
    static_assert(kIndex < std::tuple_size_v<FieldsAsTuple>, "Record has no field with this name");

    using FieldType = typename std::tuple_element_t<kIndex, FieldsAsTuple>::type;
    return (*this)(std::string_view(FieldName)).template as<FieldType>();
}

template <typename Schema, typename Base>
template <fixstr::fixed_string FieldName, typename U>
void Record<Schema, Base>::set(CompileTimeString<FieldName>, U && value)
{
    static_assert(detail::FindFieldHelper<FieldName, FieldsAsTuple>::eval() < std::tuple_size_v<FieldsAsTuple>,
                  "Record has no field with this name");

    Base::set(std::string_view(FieldName), std::forward<U>(value));
}

template <typename Schema, typename Base>
template <typename Lambda>
void Record<Schema, Base>::visitFields(Lambda && lambda) const
{
    std::invoke([this, &lambda] <typename... Fields> (std::type_identity<std::tuple<Fields...>>)
    {
        (lambda(Fields::kName, (*this)(Fields::kName)), ...);
    }, std::type_identity<FieldsAsTuple>());
}

//=============================================================================
// Builder implementations
//=============================================================================

/// ObjectType of a concrete builder, creates Derived instances from a configuration
template <typename Derived, typename Product>
class BuilderMeta : public ObjectType
{
public:
    std::type_info const& typeInfo() const override { return typeid(Derived); }
    std::string name() const override { return detail::schemaName<Derived>(); }

    bool isInstance(Value const& value) const override
    {
        return dynamic_cast<Derived const*>(&value) != nullptr;
    }

    std::shared_ptr<MutableObject> create(Attributes const& attributes) const override
    {
        auto builder = std::make_shared<Derived>();

        for (auto const& attribute : attributes)
        {
            if (attribute.name != "configuration")
            {
                builder->set(attribute.name, attribute.value);
                continue;
            }

            auto const* entries = attribute.value->template as<Dict>();
            if (entries == nullptr)
                throw TypeMismatch(attribute.name, "dict", attribute.value->typeName());

            for (auto const& entry : *entries)
                builder->configure(entry.name, entry.value);
        }

        return builder;
    }
};

template <typename Derived, typename Product>
Builder<Derived, Product>::Builder() : Builder(std::make_shared<Dict>())
{}

template <typename Derived, typename Product>
Builder<Derived, Product>::Builder(std::shared_ptr<Dict> config_)
    : ImmutableObject(meta(), Attributes { { "configuration", config_ } }), config(std::move(config_))
{}

template <typename Derived, typename Product>
ObjectType const& Builder<Derived, Product>::meta()
{
    static BuilderMeta<Derived, Product> instance;
    return instance;
}

template <typename Derived, typename Product>
Dict const& Builder<Derived, Product>::configuration() const
{
    return *config;
}

template <typename Derived, typename Product>
void Builder<Derived, Product>::configure(std::string_view key, ValuePtr value)
{
    config->set(key, std::move(value));
}

template <typename Derived, typename Product>
ValuePtr Builder<Derived, Product>::option(std::string_view key) const
{
    return config->at(key);
}

template <typename Derived, typename Product>
void Builder<Derived, Product>::removeOption(std::string_view key)
{
    if (! config->remove(key))
        throw NotFound(std::string(key), "configuration");
}

template <typename Derived, typename Product>
bool Builder<Derived, Product>::hasOption(std::string_view key) const
{
    return config->contains(key);
}

template <typename Derived, typename Product>
std::string Builder<Derived, Product>::str() const
{
    return config->repr();
}

} // namespace baseobject
