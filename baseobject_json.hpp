/**
 * @file baseobject_json.hpp
 * @brief Conversion between values and nlohmann::ordered_json
 *
 * The text form of an object (MutableObject::toText() and the fromText()
 * constructors) is built on these two functions. They are exposed for callers
 * that embed objects in larger JSON documents.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "baseobject.hpp"

namespace baseobject
{

/**
 * @brief Converts a value to JSON
 *
 * Null → null, fundamentals → booleans, numbers and strings, List, Tuple and
 * Set → arrays, Dict and records → objects. Reserved fields of records are
 * not part of the output.
 *
 * @param value The value to convert
 * @param sortKeys Emit the keys of every object, at any depth, in ascending order
 */
nlohmann::ordered_json toJson(Value const& value, bool sortKeys = false);

/**
 * @brief Converts JSON to a value
 *
 * Integral numbers become std::int64_t, other numbers double, arrays List and
 * objects Dict. Unsigned numbers beyond the range of std::int64_t become double.
 */
ValuePtr fromJson(nlohmann::ordered_json const& json);

} // namespace baseobject
