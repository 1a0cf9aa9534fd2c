#include "baseobject_json.hpp"

#include <algorithm>
#include <limits>

namespace baseobject
{
namespace
{
nlohmann::ordered_json objectToJson(Attributes const& entries, bool sortKeys)
{
    std::vector<Attribute const*> ordered;
    for (auto const& entry : entries)
        ordered.push_back(&entry);

    if (sortKeys)
        std::ranges::stable_sort(ordered, {}, [] (Attribute const* entry) -> std::string const& { return entry->name; });

    auto result = nlohmann::ordered_json::object();
    for (auto const* entry : ordered)
        result[entry->name] = toJson(*entry->value, sortKeys);

    return result;
}
} // namespace

nlohmann::ordered_json toJson(Value const& value, bool sortKeys)
{
    return value.visit([sortKeys] <typename T> (T const& v) -> nlohmann::ordered_json
    {
        if constexpr (std::is_same_v<T, Invalid> || std::is_same_v<T, Null>)
        {
            return nullptr;
        }
        else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::int64_t>
                        || std::is_same_v<T, double> || std::is_same_v<T, std::string>)
        {
            return v;
        }
        else if constexpr (std::is_same_v<T, List> || std::is_same_v<T, Tuple> || std::is_same_v<T, Set>)
        {
            auto result = nlohmann::ordered_json::array();
            for (auto const& element : v)
                result.push_back(toJson(*element, sortKeys));

            return result;
        }
        else
        {
            // Dict and records
            return objectToJson(v.items(), sortKeys);
        }
    });
}

ValuePtr fromJson(nlohmann::ordered_json const& json)
{
    switch (json.type())
    {
    case nlohmann::ordered_json::value_t::null:
        return Null::instance();
    case nlohmann::ordered_json::value_t::boolean:
        return make(json.get<bool>());
    case nlohmann::ordered_json::value_t::number_integer:
        return make(json.get<std::int64_t>());
    case nlohmann::ordered_json::value_t::number_unsigned:
    {
        auto const number = json.get<std::uint64_t>();

        if (number > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            return make(static_cast<double>(number));

        return make(static_cast<std::int64_t>(number));
    }
    case nlohmann::ordered_json::value_t::number_float:
        return make(json.get<double>());
    case nlohmann::ordered_json::value_t::string:
        return make(json.get<std::string>());
    case nlohmann::ordered_json::value_t::array:
    {
        auto list = std::make_shared<List>();
        for (auto const& element : json)
            list->append(fromJson(element));

        return list;
    }
    case nlohmann::ordered_json::value_t::object:
    {
        auto dict = std::make_shared<Dict>();
        for (auto const& item : json.items())
            dict->set(item.key(), fromJson(item.value()));

        return dict;
    }
    case nlohmann::ordered_json::value_t::binary:
    case nlohmann::ordered_json::value_t::discarded:
        break;
    }

    throw ParseError(std::format("Unsupported JSON value of type {}", json.type_name()));
}

Dict parseText(std::string const& text)
{
    nlohmann::ordered_json json;

    try
    {
        json = nlohmann::ordered_json::parse(text);
    }
    catch (nlohmann::ordered_json::parse_error const& e)
    {
        throw ParseError(std::format("Invalid JSON: {}", e.what()));
    }

    if (! json.is_object())
        throw ParseError(std::format("Expected a JSON object, got {}", json.type_name()));

    return std::move(*std::static_pointer_cast<Dict>(fromJson(json)));
}

std::string MutableObject::toText(std::vector<std::string> const& exclude, bool sortKeys) const
{
    return toJson(toMapping(exclude), sortKeys).dump();
}

std::shared_ptr<MutableObject> MutableObject::fromText(std::string const& text)
{
    return fromMapping(parseText(text));
}

std::shared_ptr<ImmutableObject> ImmutableObject::fromText(std::string const& text)
{
    return fromMapping(parseText(text));
}

} // namespace baseobject
