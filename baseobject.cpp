#include "baseobject.hpp"

#include <algorithm>
#include <cassert>
#include <charconv>
#include <cmath>
#include <sstream>

namespace baseobject
{
namespace
{
int threeWay(auto const& a, auto const& b)
{
    return a < b ? -1 : (b < a ? 1 : 0);
}

std::string_view trim(std::string_view str)
{
    auto const first = str.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string_view::npos)
        return {};

    auto const last = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(first, last - first + 1);
}

/// Strips whitespace and a single leading '+', nullopt if nothing numeric remains
std::optional<std::string_view> numericLiteral(std::string_view str)
{
    auto text = trim(str);

    if (text.starts_with('+'))
    {
        text.remove_prefix(1);

        if (text.starts_with('-'))
            return std::nullopt;
    }

    if (text.empty())
        return std::nullopt;

    return text;
}

std::string formatFloat(double value)
{
    std::array<char, 64> buffer {};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    std::string result(buffer.data(), ec == std::errc() ? end : buffer.data());

    // integral values keep a fractional part so that they read back as floats
    if (std::isfinite(value) && result.find_first_of(".e") == std::string::npos)
        result += ".0";

    return result;
}

std::string quote(std::string const& str)
{
    auto const delimiter = (str.find('\'') != std::string::npos && str.find('"') == std::string::npos) ? '"' : '\'';
    std::string result(1, delimiter);

    for (auto c : str)
    {
        switch (c)
        {
        case '\\': result += "\\\\"; break;
        case '\n': result += "\\n";  break;
        case '\r': result += "\\r";  break;
        case '\t': result += "\\t";  break;
        default:
            if (c == delimiter)
                result += '\\';

            result += c;
        }
    }

    result += delimiter;
    return result;
}

std::string join(std::vector<ValuePtr> const& elements)
{
    std::string result;
    auto first = true;

    for (auto const& element : elements)
    {
        if (! std::exchange(first, false))
            result += ", ";

        result += element->repr();
    }

    return result;
}

bool contains(std::vector<std::string> const& names, std::string_view name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

ValuePtr orNull(ValuePtr value)
{
    return value != nullptr ? std::move(value) : ValuePtr(Null::instance());
}

/// Recursive deep copy used by MutableObject::deepClone()
ValuePtr deepCopy(ValuePtr const& value, bool asMutable)
{
    return value->visit([&value, asMutable] <typename T> (T const& v) -> ValuePtr
    {
        if constexpr (std::is_same_v<T, MutableObject>)
        {
            return v.deepClone(asMutable);
        }
        else if constexpr (std::is_same_v<T, List> || std::is_same_v<T, Tuple> || std::is_same_v<T, Set>)
        {
            std::vector<ValuePtr> elements;
            elements.reserve(v.size());

            for (auto const& element : v)
                elements.push_back(deepCopy(element, asMutable));

            return std::make_shared<T>(std::move(elements));
        }
        else if constexpr (std::is_same_v<T, Dict>)
        {
            Attributes entries;
            entries.reserve(v.size());

            for (auto const& entry : v)
                entries.emplace_back(entry.name, deepCopy(entry.value, asMutable));

            return std::make_shared<Dict>(std::move(entries));
        }
        else
        {
            return value->clone();
        }
    });
}

/// The elements a value contributes when converted into a sequence
std::optional<std::vector<ValuePtr>> elementsOf(Value const& value)
{
    return value.visit([] <typename T> (T const& v) -> std::optional<std::vector<ValuePtr>>
    {
        if constexpr (std::is_same_v<T, List> || std::is_same_v<T, Tuple> || std::is_same_v<T, Set>)
        {
            return v.elements();
        }
        else if constexpr (std::is_same_v<T, Dict>)
        {
            std::vector<ValuePtr> keys;
            for (auto const& entry : v)
                keys.push_back(make(entry.name));

            return keys;
        }
        else if constexpr (std::is_same_v<T, std::string>)
        {
            std::vector<ValuePtr> characters;
            for (auto c : v)
                characters.push_back(make(std::string(1, c)));

            return characters;
        }
        else if constexpr (std::is_same_v<T, MutableObject>)
        {
            std::vector<ValuePtr> pairs;
            for (auto const& field : v)
                pairs.push_back(Tuple::of(field.name, field.value));

            return pairs;
        }
        else
        {
            return std::nullopt;
        }
    });
}

bool truthy(Value const& value)
{
    return value.visit([] <typename T> (T const& v) -> bool
    {
        if constexpr (std::is_same_v<T, Invalid> || std::is_same_v<T, Null>)
            return false;
        else if constexpr (std::is_same_v<T, bool>)
            return v;
        else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>)
            return v != 0;
        else
            return ! v.empty();
    });
}

class InvalidMeta : public MetaType
{
public:
    std::type_info const& typeInfo() const override { return typeid(void); }
    std::string name() const override { return "Invalid"; }
    bool isOpaque() const override { return true; }
    bool isInstance(Value const& value) const override { return ! value.isValid(); }
    ValuePtr convert(Value const&) const override { return nullptr; }
};

/// ObjectType of the ad-hoc object types MutableObject and ImmutableObject
template <typename T>
class ObjectMeta : public ObjectType
{
public:
    explicit ObjectMeta(std::string_view name_) : typeName(name_) {}

    std::type_info const& typeInfo() const override { return typeid(T); }
    std::string name() const override { return typeName; }
    bool isInstance(Value const& value) const override { return dynamic_cast<T const*>(&value) != nullptr; }

    std::shared_ptr<MutableObject> create(Attributes const& attributes) const override
    {
        return std::make_shared<T>(attributes);
    }

private:
    std::string typeName;
};
} // namespace

//=============================================================================
// Error implementations
//=============================================================================
Error::Error(std::string const& message, std::string field_)
    : std::runtime_error(message), fieldName(std::move(field_))
{}

TypeMismatch::TypeMismatch(std::string field_, std::string expected_, std::string actual_)
    : Error(std::format("Invalid type for field '{}': expected {}, got {}", field_, expected_, actual_), field_),
      expectedType(std::move(expected_)), actualType(std::move(actual_))
{}

UnexpectedField::UnexpectedField(std::string field_)
    : Error(std::format("Unexpected argument: '{}'", field_), field_)
{}

NotFound::NotFound(std::string field_, std::string_view typeName)
    : Error(std::format("'{}' not found in {}", field_, typeName), field_)
{}

Immutable::Immutable(std::string field_, std::string_view typeName)
    : Error(field_.empty() ? std::format("Cannot modify immutable object {}", typeName)
                           : std::format("Cannot modify immutable field '{}' of object {}", field_, typeName),
            field_)
{}

NotRegistered::NotRegistered(std::string field_)
    : Error(std::format("Attribute '{}' has not been registered", field_), field_)
{}

PrivateField::PrivateField(std::string field_, std::string_view operation)
    : Error(std::format("Cannot {} private attribute '{}'", operation, field_), field_)
{}

MissingValue::MissingValue(std::string field_)
    : Error(std::format("New attribute '{}' must have a value when locking", field_), field_)
{}

ParseError::ParseError(std::string const& message)
    : Error(message)
{}

//=============================================================================
// Value implementations
//=============================================================================

// Initialize the global invalid value singleton
Invalid& Value::kInvalid = std::invoke([] () -> auto&&
{
    static Invalid invld;
    return invld;
});

std::string Value::repr() const
{
    return visit([] <typename T> (T const& v) -> std::string
    {
        if constexpr (std::is_same_v<T, Invalid>)
        {
            return "<invalid>";
        }
        else if constexpr (std::is_same_v<T, Null>)
        {
            return "None";
        }
        else if constexpr (std::is_same_v<T, bool>)
        {
            return v ? "True" : "False";
        }
        else if constexpr (std::is_same_v<T, std::int64_t>)
        {
            return std::to_string(v);
        }
        else if constexpr (std::is_same_v<T, double>)
        {
            return formatFloat(v);
        }
        else if constexpr (std::is_same_v<T, std::string>)
        {
            return quote(v);
        }
        else if constexpr (std::is_same_v<T, Tuple>)
        {
            return "(" + join(v.elements()) + (v.size() == 1 ? ",)" : ")");
        }
        else if constexpr (std::is_same_v<T, List>)
        {
            return "[" + join(v.elements()) + "]";
        }
        else if constexpr (std::is_same_v<T, Set>)
        {
            return v.empty() ? std::string("set()") : "{" + join(v.elements()) + "}";
        }
        else if constexpr (std::is_same_v<T, Dict>)
        {
            std::string result = "{";
            auto first = true;

            for (auto const& entry : v)
            {
                if (! std::exchange(first, false))
                    result += ", ";

                result += quote(entry.name) + ": " + entry.value->repr();
            }

            return result + "}";
        }
        else
        {
            std::string result = "<" + v.typeName() + " (";
            auto first = true;

            for (auto const& field : v)
            {
                if (! std::exchange(first, false))
                    result += ", ";

                result += field.name + "=" + field.value->repr();
            }

            return result + ")>";
        }
    });
}

int Value::compareKinds(Value const& other) const
{
    auto rank = [] (Kind k) { return static_cast<int>(k == Kind::boolean ? Kind::number : k); };
    return threeWay(rank(kind()), rank(other.kind()));
}

//=============================================================================
// Invalid and Null implementations
//=============================================================================
MetaType const& Invalid::metaType() const
{
    static InvalidMeta instance;
    return instance;
}

ValuePtr Invalid::clone() const
{
    return std::make_shared<Invalid>();
}

int Invalid::compare(Value const& other) const
{
    return compareKinds(other);
}

typename Value::ConstTypesVariant Invalid::visit_helper() const
{
    return ConstTypesVariant(std::in_place_type<std::reference_wrapper<Invalid const>>, *this);
}

std::shared_ptr<Null> const& Null::instance()
{
    static auto const null = std::make_shared<Null>();
    return null;
}

MetaType const& Null::metaType() const
{
    return metaTypeOf<Null>();
}

ValuePtr Null::clone() const
{
    return instance();
}

int Null::compare(Value const& other) const
{
    return compareKinds(other);
}

typename Value::ConstTypesVariant Null::visit_helper() const
{
    return ConstTypesVariant(std::in_place_type<std::reference_wrapper<Null const>>, *this);
}

//=============================================================================
// Container implementations
//=============================================================================
Collection::Collection(std::vector<ValuePtr> elements_) : items(std::move(elements_))
{
    for (auto& item : items)
        item = orNull(std::move(item));
}

ValuePtr const& Collection::operator[](std::size_t idx) const
{
    assert(idx < items.size());
    return items[idx];
}

bool Collection::contains(Value const& item) const
{
    return std::any_of(items.begin(), items.end(), [&item] (auto const& element) { return element->equals(item); });
}

int Collection::compare(Value const& other) const
{
    if (auto result = compareKinds(other); result != 0)
        return result;

    auto const& rhs = static_cast<Collection const&>(other).items;

    for (std::size_t i = 0; i < std::min(items.size(), rhs.size()); ++i)
    {
        if (auto result = items[i]->compare(*rhs[i]); result != 0)
            return result;
    }

    return threeWay(items.size(), rhs.size());
}

List::List(std::vector<ValuePtr> elements_) : Collection(std::move(elements_))
{}

MetaType const& List::metaType() const
{
    return metaTypeOf<List>();
}

ValuePtr List::clone() const
{
    std::vector<ValuePtr> copies;
    for (auto const& item : items)
        copies.push_back(item->clone());

    return std::make_shared<List>(std::move(copies));
}

void List::append(ValuePtr element)
{
    items.push_back(orNull(std::move(element)));
}

void List::replace(std::size_t idx, ValuePtr element)
{
    items.at(idx) = orNull(std::move(element));
}

void List::removeAt(std::size_t idx)
{
    if (idx >= items.size())
        throw std::out_of_range(std::format("list index {} out of range", idx));

    items.erase(items.begin() + static_cast<std::ptrdiff_t>(idx));
}

typename Value::ConstTypesVariant List::visit_helper() const
{
    return ConstTypesVariant(std::in_place_type<std::reference_wrapper<List const>>, *this);
}

Tuple::Tuple(std::vector<ValuePtr> elements_) : Collection(std::move(elements_))
{}

MetaType const& Tuple::metaType() const
{
    return metaTypeOf<Tuple>();
}

ValuePtr Tuple::clone() const
{
    std::vector<ValuePtr> copies;
    for (auto const& item : items)
        copies.push_back(item->clone());

    return std::make_shared<Tuple>(std::move(copies));
}

typename Value::ConstTypesVariant Tuple::visit_helper() const
{
    return ConstTypesVariant(std::in_place_type<std::reference_wrapper<Tuple const>>, *this);
}

Set::Set(std::vector<ValuePtr> elements_) : Collection(std::move(elements_))
{
    std::stable_sort(items.begin(), items.end(), [] (auto const& a, auto const& b) { return a->compare(*b) < 0; });
    items.erase(std::unique(items.begin(), items.end(), [] (auto const& a, auto const& b) { return a->compare(*b) == 0; }), items.end());
}

MetaType const& Set::metaType() const
{
    return metaTypeOf<Set>();
}

ValuePtr Set::clone() const
{
    std::vector<ValuePtr> copies;
    for (auto const& item : items)
        copies.push_back(item->clone());

    return std::make_shared<Set>(std::move(copies));
}

bool Set::contains(Value const& item) const
{
    auto it = lowerBound(item);
    return it != items.end() && (*it)->compare(item) == 0;
}

bool Set::insert(ValuePtr element)
{
    element = orNull(std::move(element));
    auto it = lowerBound(*element);

    if (it != items.end() && (*it)->compare(*element) == 0)
        return false;

    items.insert(it, std::move(element));
    return true;
}

bool Set::erase(Value const& item)
{
    auto it = lowerBound(item);

    if (it == items.end() || (*it)->compare(item) != 0)
        return false;

    items.erase(it);
    return true;
}

std::vector<ValuePtr>::const_iterator Set::lowerBound(Value const& item) const
{
    return std::lower_bound(items.begin(), items.end(), item, [] (auto const& element, Value const& x) { return element->compare(x) < 0; });
}

typename Value::ConstTypesVariant Set::visit_helper() const
{
    return ConstTypesVariant(std::in_place_type<std::reference_wrapper<Set const>>, *this);
}

Dict::Dict(Attributes entries_)
{
    for (auto& entry : entries_)
        set(entry.name, std::move(entry.value));
}

std::shared_ptr<Dict> Dict::of(Attributes entries_)
{
    return std::make_shared<Dict>(std::move(entries_));
}

MetaType const& Dict::metaType() const
{
    return metaTypeOf<Dict>();
}

ValuePtr Dict::clone() const
{
    Attributes copies;
    for (auto const& entry : entries)
        copies.emplace_back(entry.name, entry.value->clone());

    return std::make_shared<Dict>(std::move(copies));
}

bool Dict::equals(Value const& other) const
{
    auto const* rhs = other.as<Dict>();

    if (rhs == nullptr || rhs->size() != size())
        return false;

    return std::all_of(entries.begin(), entries.end(), [rhs] (auto const& entry)
    {
        auto value = rhs->get(entry.name);
        return value != nullptr && value->equals(*entry.value);
    });
}

int Dict::compare(Value const& other) const
{
    if (auto result = compareKinds(other); result != 0)
        return result;

    auto sorted = [] (Attributes attributes)
    {
        std::ranges::sort(attributes, {}, &Attribute::name);
        return attributes;
    };

    auto const lhs = sorted(entries);
    auto const rhs = sorted(static_cast<Dict const&>(other).entries);

    for (std::size_t i = 0; i < std::min(lhs.size(), rhs.size()); ++i)
    {
        if (auto result = threeWay(lhs[i].name, rhs[i].name); result != 0)
            return result;

        if (auto result = lhs[i].value->compare(*rhs[i].value); result != 0)
            return result;
    }

    return threeWay(lhs.size(), rhs.size());
}

bool Dict::contains(std::string_view key) const
{
    return get(key) != nullptr;
}

ValuePtr Dict::get(std::string_view key) const
{
    auto it = std::find_if(entries.begin(), entries.end(), [key] (auto const& entry) { return entry.name == key; });
    return it != entries.end() ? it->value : nullptr;
}

ValuePtr const& Dict::at(std::string_view key) const
{
    auto it = std::find_if(entries.begin(), entries.end(), [key] (auto const& entry) { return entry.name == key; });

    if (it == entries.end())
        throw NotFound(std::string(key), "dict");

    return it->value;
}

void Dict::set(std::string_view key, ValuePtr value)
{
    value = orNull(std::move(value));

    for (auto& entry : entries)
    {
        if (entry.name == key)
        {
            entry.value = std::move(value);
            return;
        }
    }

    entries.emplace_back(std::string(key), std::move(value));
}

bool Dict::remove(std::string_view key)
{
    auto it = std::find_if(entries.begin(), entries.end(), [key] (auto const& entry) { return entry.name == key; });

    if (it == entries.end())
        return false;

    entries.erase(it);
    return true;
}

std::vector<std::string> Dict::keys() const
{
    std::vector<std::string> result;
    for (auto const& entry : entries)
        result.push_back(entry.name);

    return result;
}

typename Value::ConstTypesVariant Dict::visit_helper() const
{
    return ConstTypesVariant(std::in_place_type<std::reference_wrapper<Dict const>>, *this);
}

//=============================================================================
// Converter implementations
//=============================================================================
bool Converter<bool>::isInstance(Value const& value)
{
    return value.kind() == Value::Kind::boolean;
}

ValuePtr Converter<bool>::convert(Value const& value)
{
    return make(truthy(value));
}

bool Converter<std::int64_t>::isInstance(Value const& value)
{
    return value.as<std::int64_t>() != nullptr;
}

ValuePtr Converter<std::int64_t>::convert(Value const& value)
{
    if (auto const* b = value.as<bool>())
        return make(static_cast<std::int64_t>(*b));

    if (auto const* d = value.as<double>())
    {
        // 2^63 is exactly representable, everything below it truncates into range
        if (! std::isfinite(*d) || *d < -9223372036854775808.0 || *d >= 9223372036854775808.0)
            return nullptr;

        return make(static_cast<std::int64_t>(std::trunc(*d)));
    }

    if (auto const* str = value.as<std::string>())
    {
        auto text = numericLiteral(*str);
        if (! text)
            return nullptr;

        std::int64_t result = 0;
        auto [end, ec] = std::from_chars(text->data(), text->data() + text->size(), result);

        if (ec != std::errc() || end != text->data() + text->size())
            return nullptr;

        return make(result);
    }

    return nullptr;
}

bool Converter<double>::isInstance(Value const& value)
{
    return value.as<double>() != nullptr;
}

ValuePtr Converter<double>::convert(Value const& value)
{
    if (auto const* b = value.as<bool>())
        return make(*b ? 1.0 : 0.0);

    if (auto const* i = value.as<std::int64_t>())
        return make(static_cast<double>(*i));

    if (auto const* str = value.as<std::string>())
    {
        auto text = numericLiteral(*str);
        if (! text)
            return nullptr;

        double result = 0.0;
        auto [end, ec] = std::from_chars(text->data(), text->data() + text->size(), result);

        if (ec != std::errc() || end != text->data() + text->size())
            return nullptr;

        return make(result);
    }

    return nullptr;
}

bool Converter<std::string>::isInstance(Value const& value)
{
    return value.as<std::string>() != nullptr;
}

ValuePtr Converter<std::string>::convert(Value const& value)
{
    return make(value.str());
}

bool Converter<Null>::isInstance(Value const& value)
{
    return value.isNull();
}

ValuePtr Converter<Null>::convert(Value const&)
{
    return nullptr;
}

bool Converter<List>::isInstance(Value const& value)
{
    return value.kind() == Value::Kind::list;
}

ValuePtr Converter<List>::convert(Value const& value)
{
    auto elements = elementsOf(value);
    return elements ? std::make_shared<List>(std::move(*elements)) : nullptr;
}

bool Converter<Tuple>::isInstance(Value const& value)
{
    return value.kind() == Value::Kind::tuple;
}

ValuePtr Converter<Tuple>::convert(Value const& value)
{
    auto elements = elementsOf(value);
    return elements ? std::make_shared<Tuple>(std::move(*elements)) : nullptr;
}

bool Converter<Set>::isInstance(Value const& value)
{
    return value.kind() == Value::Kind::set;
}

ValuePtr Converter<Set>::convert(Value const& value)
{
    auto elements = elementsOf(value);
    return elements ? std::make_shared<Set>(std::move(*elements)) : nullptr;
}

bool Converter<Dict>::isInstance(Value const& value)
{
    return value.kind() == Value::Kind::dict;
}

ValuePtr Converter<Dict>::convert(Value const& value)
{
    if (auto const* object = value.as<MutableObject>())
        return std::make_shared<Dict>(object->toMapping());

    auto const* collection = dynamic_cast<Collection const*>(&value);
    if (collection == nullptr)
        return nullptr;

    Attributes entries;
    for (auto const& element : *collection)
    {
        auto const* pair = dynamic_cast<Collection const*>(element.get());

        if (pair == nullptr || pair->kind() == Value::Kind::set || pair->size() != 2)
            return nullptr;

        auto const* key = pair->at(0)->as<std::string>();
        if (key == nullptr)
            return nullptr;

        entries.emplace_back(*key, pair->at(1));
    }

    return std::make_shared<Dict>(std::move(entries));
}

ValuePtr coerce(std::string_view name, ValuePtr value, MetaType const* expected)
{
    if (value == nullptr || value->isNull() || expected == nullptr || expected->isInstance(*value))
        return orNull(std::move(value));

    ValuePtr converted;

    try
    {
        converted = expected->convert(*value);
    }
    catch (std::exception const&)
    {
        // user converters may throw anything derived from std::exception
        converted = nullptr;
    }

    if (converted == nullptr)
        throw TypeMismatch(std::string(name), expected->name(), value->typeName());

    return converted;
}

//=============================================================================
// AccessorRegistry and ObjectType implementations
//=============================================================================
bool AccessorRegistry::materialize(std::string_view name)
{
    if (contains(name))
        return false;

    known.emplace_back(name);
    return true;
}

bool AccessorRegistry::contains(std::string_view name) const
{
    return std::find(known.begin(), known.end(), name) != known.end();
}

ValuePtr ObjectType::convert(Value const& value) const
{
    if (auto const* mapping = value.as<Dict>())
        return fromMapping(*mapping);

    if (auto const* object = value.as<MutableObject>())
        return create(object->items());

    return nullptr;
}

std::shared_ptr<MutableObject> ObjectType::fromMapping(Dict const& mapping) const
{
    Attributes attributes;

    for (auto const& entry : mapping)
    {
        if (! isReserved(entry.name))
            attributes.push_back(entry);
    }

    return create(attributes);
}

//=============================================================================
// MutableObject implementations
//=============================================================================
MutableObject::MutableObject() : MutableObject(meta(), Attributes {})
{}

MutableObject::MutableObject(Attributes const& attributes) : MutableObject(meta(), attributes)
{}

MutableObject::MutableObject(ObjectType const& objectType_, Attributes const& attributes)
    : objectMeta(objectType_)
{
    construct(attributes);
}

ObjectType const& MutableObject::meta()
{
    static ObjectMeta<MutableObject> instance("MutableObject");
    return instance;
}

std::shared_ptr<MutableObject> MutableObject::fromMapping(Dict const& mapping)
{
    return meta().fromMapping(mapping);
}

void MutableObject::construct(Attributes const& attributes)
{
    auto const declared = objectMeta.fields();

    if (declared.empty())
    {
        for (auto const& attribute : attributes)
            store(attribute.name, attribute.value);
    }
    else
    {
        auto supplied = [&attributes] (std::string_view name) -> ValuePtr
        {
            auto it = std::find_if(attributes.rbegin(), attributes.rend(), [name] (auto const& attribute) { return attribute.name == name; });
            return it != attributes.rend() ? it->value : nullptr;
        };

        for (auto const& field : declared)
            store(field.fieldname, coerce(field.fieldname, supplied(field.fieldname), &field.metaType()));

        for (auto const& attribute : attributes)
        {
            if (isReserved(attribute.name))
            {
                store(attribute.name, attribute.value);
                continue;
            }

            auto isDeclared = std::any_of(declared.begin(), declared.end(), [&attribute] (auto const& field) { return field.fieldname == attribute.name; });

            if (! isDeclared)
                throw UnexpectedField(attribute.name);
        }
    }

    objectMeta.postConstruct(*this);
}

Attribute const* MutableObject::find(std::string_view name) const
{
    auto const& target = isReserved(name) ? reserved : fields;
    auto it = std::find_if(target.begin(), target.end(), [name] (auto const& attribute) { return attribute.name == name; });
    return it != target.end() ? &*it : nullptr;
}

ValuePtr MutableObject::clone() const
{
    return deepClone(false);
}

bool MutableObject::equals(Value const& other) const
{
    auto const* rhs = other.as<MutableObject>();

    if (rhs == nullptr || rhs->size() != size())
        return false;

    return std::all_of(fields.begin(), fields.end(), [rhs] (auto const& field)
    {
        auto const* match = rhs->find(field.name);
        return match != nullptr && match->value->equals(*field.value);
    });
}

int MutableObject::compare(Value const& other) const
{
    if (auto result = compareKinds(other); result != 0)
        return result;

    auto sorted = [] (Attributes attributes)
    {
        std::ranges::sort(attributes, {}, &Attribute::name);
        return attributes;
    };

    auto const lhs = sorted(fields);
    auto const rhs = sorted(static_cast<MutableObject const&>(other).fields);

    for (std::size_t i = 0; i < std::min(lhs.size(), rhs.size()); ++i)
    {
        if (auto result = threeWay(lhs[i].name, rhs[i].name); result != 0)
            return result;

        if (auto result = lhs[i].value->compare(*rhs[i].value); result != 0)
            return result;
    }

    return threeWay(lhs.size(), rhs.size());
}

Value const& MutableObject::operator()(std::string_view name) const
{
    if (auto const* attribute = find(name))
        return *attribute->value;

    return kInvalid;
}

ValuePtr MutableObject::get(std::string_view name, ValuePtr defaultValue) const
{
    if (auto const* attribute = find(name))
        return attribute->value;

    return defaultValue;
}

ValuePtr MutableObject::getOrDefault(std::string_view name, ValuePtr defaultValue) const
{
    return get(name, std::move(defaultValue));
}

ValuePtr MutableObject::at(std::string_view name) const
{
    if (auto const* attribute = find(name))
        return attribute->value;

    throw NotFound(std::string(name), objectMeta.name());
}

void MutableObject::set(std::string_view name, ValuePtr value)
{
    checkWrite(name);
    store(name, std::move(value));
}

void MutableObject::remove(std::string_view name)
{
    if (find(name) == nullptr)
        throw NotFound(std::string(name), objectMeta.name());

    checkWrite(name);
    erase(name);
}

void MutableObject::update(Attributes const& attributes)
{
    for (auto const& attribute : attributes)
        set(attribute.name, attribute.value);
}

void MutableObject::updateDefaults(Attributes const& defaults)
{
    Attributes missing;

    for (auto const& attribute : defaults)
    {
        auto alreadyMissing = std::any_of(missing.begin(), missing.end(), [&attribute] (auto const& m) { return m.name == attribute.name; });

        if (find(attribute.name) == nullptr && ! alreadyMissing)
            missing.push_back(attribute);
    }

    for (auto const& attribute : missing)
        checkWrite(attribute.name);

    for (auto const& attribute : missing)
        store(attribute.name, attribute.value);
}

bool MutableObject::has(std::optional<std::string_view> name, ValuePtr value) const
{
    if (! name.has_value() && value == nullptr)
        return false;

    auto const hasName = ! name.has_value() || find(*name) != nullptr;
    auto const hasValue = value == nullptr
        || std::any_of(fields.begin(), fields.end(), [&value] (auto const& field) { return field.value->equals(*value); });

    return hasName && hasValue;
}

bool MutableObject::contains(Value const& item) const
{
    if (auto const* name = item.as<std::string>())
    {
        if (! isReserved(*name) && find(*name) != nullptr)
            return true;
    }

    return std::any_of(fields.begin(), fields.end(), [&item] (auto const& field) { return field.value->equals(item); });
}

std::vector<std::string> MutableObject::keys() const
{
    std::vector<std::string> result;
    for (auto const& field : fields)
        result.push_back(field.name);

    return result;
}

std::vector<ValuePtr> MutableObject::values() const
{
    std::vector<ValuePtr> result;
    for (auto const& field : fields)
        result.push_back(field.value);

    return result;
}

std::vector<std::pair<std::size_t, Attribute>> MutableObject::enumerate() const
{
    std::vector<std::pair<std::size_t, Attribute>> result;
    for (std::size_t i = 0; i < fields.size(); ++i)
        result.emplace_back(i, fields[i]);

    return result;
}

bool MutableObject::equals(MutableObject const& other, std::vector<std::string> const& keysToCompare) const
{
    return std::all_of(keysToCompare.begin(), keysToCompare.end(), [this, &other] (auto const& key)
    {
        return (*this)(key).equals(other(key));
    });
}

Dict MutableObject::toFilteredMapping(std::vector<std::string> const& keysToKeep, MetaType const* type) const
{
    Dict result;

    for (auto const& field : fields)
    {
        if (! keysToKeep.empty() && ! baseobject::contains(keysToKeep, field.name))
            continue;

        if (type != nullptr && ! type->isInstance(*field.value))
            continue;

        result.set(field.name, field.value);
    }

    return result;
}

std::shared_ptr<MutableObject> MutableObject::copy(bool asMutable) const
{
    if (asMutable)
        return std::make_shared<MutableObject>(fields);

    return objectMeta.create(fields);
}

std::shared_ptr<MutableObject> MutableObject::deepClone(bool asMutable) const
{
    Attributes copies;
    copies.reserve(fields.size());

    for (auto const& field : fields)
        copies.emplace_back(field.name, deepCopy(field.value, asMutable));

    if (asMutable)
        return std::make_shared<MutableObject>(copies);

    return objectMeta.create(copies);
}

Dict MutableObject::toMapping(std::vector<std::string> const& exclude, SortOrder sort, bool includeReserved) const
{
    Attributes entries;

    for (auto const* source : { &fields, &reserved })
    {
        if (source == &reserved && ! includeReserved)
            continue;

        for (auto const& field : *source)
        {
            if (! baseobject::contains(exclude, field.name))
                entries.push_back(field);
        }
    }

    if (sort == SortOrder::ascending)
        std::ranges::stable_sort(entries, std::less<> {}, &Attribute::name);
    else if (sort == SortOrder::descending)
        std::ranges::stable_sort(entries, std::greater<> {}, &Attribute::name);

    return Dict(std::move(entries));
}

void MutableObject::checkWrite(std::string_view) const
{}

void MutableObject::store(std::string_view name, ValuePtr value)
{
    value = orNull(std::move(value));
    auto& target = isReserved(name) ? reserved : fields;

    for (auto& attribute : target)
    {
        if (attribute.name == name)
        {
            attribute.value = std::move(value);
            return;
        }
    }

    if (! isReserved(name))
        objectMeta.accessors().materialize(name);

    target.emplace_back(std::string(name), std::move(value));
}

bool MutableObject::erase(std::string_view name)
{
    auto& target = isReserved(name) ? reserved : fields;
    auto it = std::find_if(target.begin(), target.end(), [name] (auto const& attribute) { return attribute.name == name; });

    if (it == target.end())
        return false;

    target.erase(it);
    return true;
}

typename Value::ConstTypesVariant MutableObject::visit_helper() const
{
    return ConstTypesVariant(std::in_place_type<std::reference_wrapper<MutableObject const>>, *this);
}

//=============================================================================
// ImmutableObject implementations
//=============================================================================
ImmutableObject::ImmutableObject() : ImmutableObject(meta(), Attributes {})
{}

ImmutableObject::ImmutableObject(Attributes const& attributes) : ImmutableObject(meta(), attributes)
{}

ImmutableObject::ImmutableObject(ObjectType const& objectType_, Attributes const& attributes)
    : MutableObject(objectType_, attributes)
{
    for (auto const& attribute : attributes)
    {
        if (! isReserved(attribute.name))
            locks.insert_or_assign(attribute.name, true);
    }

    constructed = true;
}

ObjectType const& ImmutableObject::meta()
{
    static ObjectMeta<ImmutableObject> instance("ImmutableObject");
    return instance;
}

std::shared_ptr<ImmutableObject> ImmutableObject::fromMapping(Dict const& mapping)
{
    return std::static_pointer_cast<ImmutableObject>(meta().fromMapping(mapping));
}

bool ImmutableObject::isLocked(std::string_view name) const
{
    auto it = locks.find(name);
    return it != locks.end() && it->second;
}

void ImmutableObject::lock(std::string_view name, bool allowNew, ValuePtr value)
{
    if (! allowNew && locks.find(name) == locks.end())
        throw NotRegistered(std::string(name));

    if (isReserved(name))
        throw PrivateField(std::string(name), "lock");

    if (value != nullptr)
        store(name, std::move(value));
    else if (allowNew && ! (*this)(name).isValid())
        throw MissingValue(std::string(name));

    locks.insert_or_assign(std::string(name), true);
    sealed = true;
}

void ImmutableObject::unlock(std::string_view name)
{
    auto it = locks.find(name);

    if (it == locks.end())
        throw NotRegistered(std::string(name));

    if (isReserved(name))
        throw PrivateField(std::string(name), "unlock");

    it->second = false;
}

void ImmutableObject::freeze()
{
    for (auto const& field : *this)
        locks.insert_or_assign(field.name, true);

    sealed = true;
}

void ImmutableObject::remove(std::string_view name)
{
    MutableObject::remove(name);

    if (auto it = locks.find(name); it != locks.end())
        locks.erase(it);
}

void ImmutableObject::update(Attributes const& attributes)
{
    for (auto const& attribute : attributes)
        checkWrite(attribute.name);

    for (auto const& attribute : attributes)
        store(attribute.name, attribute.value);

    for (auto const& attribute : attributes)
    {
        if (! isReserved(attribute.name) && locks.find(attribute.name) == locks.end())
            locks.emplace(attribute.name, true);
    }
}

void ImmutableObject::checkWrite(std::string_view name) const
{
    if (isReserved(name) || ! constructed)
        return;

    if (auto it = locks.find(name); it != locks.end())
    {
        if (it->second)
            throw Immutable(std::string(name), objectType().name());

        return;
    }

    if (sealed)
        throw Immutable({}, objectType().name());
}

//=============================================================================
// Operators
//=============================================================================
bool operator==(Value const& lhs, Value const& rhs)
{
    return lhs.equals(rhs);
}

bool operator<(Value const& lhs, Value const& rhs)
{
    return lhs.compare(rhs) < 0;
}

bool operator>(Value const& lhs, Value const& rhs)
{
    return lhs.compare(rhs) > 0;
}

std::shared_ptr<MutableObject> operator+(MutableObject const& lhs, MutableObject const& rhs)
{
    if (! lhs.objectType().isInstance(rhs))
        return nullptr;

    auto merged = lhs.toMapping();
    for (auto const& field : rhs)
        merged.set(field.name, field.value);

    return lhs.objectType().create(merged.items());
}

std::shared_ptr<MutableObject> operator-(MutableObject const& lhs, MutableObject const& rhs)
{
    Attributes remaining;

    for (auto const& field : lhs)
    {
        if (! rhs(field.name).isValid())
            remaining.push_back(field);
    }

    return lhs.objectType().create(remaining);
}

std::ostream& operator<<(std::ostream& o, Value const& x)
{
    return o << x.repr();
}

} // namespace baseobject
