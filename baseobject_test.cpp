#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "baseobject.hpp"
#include <cmath>
#include <format>
#include <limits>
#include <sstream>
#include <stdexcept>

using namespace baseobject;

//=============================================================================
// Test struct definitions
//=============================================================================

struct PersonFields {
    static constexpr std::string_view kName = "Person";

    Field<std::string,  "name"> name;
    Field<std::int64_t, "age">  age;
};

using Person = Record<PersonFields>;
using FrozenPerson = Record<PersonFields, ImmutableObject>;

struct MeasurementFields {
    static constexpr std::string_view kName = "Measurement";

    Field<double,      "ratio">   ratio;
    Field<bool,        "valid">   valid;
    Field<std::string, "label">   label;
    Field<List,        "samples"> samples;
    Field<Set,         "tags">    tags;
    Field<Dict,        "extra">   extra;
    Field<Value,       "payload"> payload;
};

using Measurement = Record<MeasurementFields>;

struct AddressFields {
    static constexpr std::string_view kName = "Address";

    Field<std::string, "city"> city;
    Field<List,        "tags"> tags;
};

using Address = Record<AddressFields>;

struct CustomerFields {
    static constexpr std::string_view kName = "Customer";

    Field<std::string, "name">    name;
    Field<Address,     "address"> address;
};

using Customer = Record<CustomerFields>;

struct Port {};

namespace baseobject
{
template <> struct Converter<Port>
{
    static constexpr std::string_view kName = "port";

    static bool isInstance(Value const& value)
    {
        auto const* number = value.as<std::int64_t>();
        return number != nullptr && *number > 0 && *number < 65536;
    }

    static ValuePtr convert(Value const& value)
    {
        auto const* text = value.as<std::string>();
        if (text == nullptr)
            return nullptr;

        auto const port = std::stoi(*text);
        if (port <= 0 || port >= 65536)
            throw std::out_of_range("port " + *text + " out of range");

        return make(port);
    }
};
} // namespace baseobject

struct ServerFields {
    static constexpr std::string_view kName = "Server";

    Field<std::string, "host"> host;
    Field<Port,        "port"> port;
};

using Server = Record<ServerFields>;

struct CounterFields {
    Field<std::int64_t, "count"> count;

    static void postInit(MutableObject& object)
    {
        if (object("count").isNull())
            object.set("count", 0);

        object.set("_initialised", true);
    }
};

using Counter = Record<CounterFields, ImmutableObject>;

struct Greeting {
    std::string text;
};

class GreetingBuilder : public Builder<GreetingBuilder, Greeting>
{
public:
    std::shared_ptr<Greeting> build() const override
    {
        auto const* name = option("name")->as<std::string>();
        return std::make_shared<Greeting>(Greeting { "Hello, " + (name != nullptr ? *name : std::string("nobody")) });
    }
};

//=============================================================================
// Value tests
//=============================================================================

TEST_SUITE("Value") {

TEST_CASE("make normalises C++ values") {
    CHECK(make(42)->as<std::int64_t>() != nullptr);
    CHECK(*make(std::uint8_t(7))->as<std::int64_t>() == 7);
    CHECK(*make(2.5f)->as<double>() == doctest::Approx(2.5));
    CHECK(*make(true)->as<bool>() == true);
    CHECK(*make("text")->as<std::string>() == "text");
    CHECK(*make(std::string_view("view"))->as<std::string>() == "view");
    CHECK(make(nullptr)->isNull());
    CHECK(make(ValuePtr())->isNull());

    auto list = List::of(1, 2);
    CHECK(make(list) == list);
}

TEST_CASE("type names") {
    CHECK(make(1)->typeName() == "int");
    CHECK(make(1.0)->typeName() == "float");
    CHECK(make("a")->typeName() == "str");
    CHECK(make(false)->typeName() == "bool");
    CHECK(make(nullptr)->typeName() == "NoneType");
    CHECK(List::of()->typeName() == "list");
    CHECK(Tuple::of()->typeName() == "tuple");
    CHECK(Set::of()->typeName() == "set");
    CHECK(Dict::of({})->typeName() == "dict");
}

TEST_CASE("as returns nullptr for other types") {
    auto value = make(3);
    CHECK(value->as<double>() == nullptr);
    CHECK(value->as<std::string>() == nullptr);
    CHECK(value->as<List>() == nullptr);
}

TEST_CASE("invalid sentinel") {
    CHECK_FALSE(Value::kInvalid.isValid());
    CHECK_FALSE(static_cast<bool>(Value::kInvalid));
    CHECK(Value::kInvalid.kind() == Value::Kind::invalid);
}

TEST_CASE("repr") {
    CHECK(make(30)->repr() == "30");
    CHECK(make(1.0)->repr() == "1.0");
    CHECK(make(0.25)->repr() == "0.25");
    CHECK(make(true)->repr() == "True");
    CHECK(make(nullptr)->repr() == "None");
    CHECK(make("Alice")->repr() == "'Alice'");
    CHECK(make("it's")->repr() == "\"it's\"");
    CHECK(make("Alice")->str() == "Alice");
    CHECK(List::of(1, "a", nullptr, true)->repr() == "[1, 'a', None, True]");
    CHECK(Tuple::of(1)->repr() == "(1,)");
    CHECK(Tuple::of(1, 2)->repr() == "(1, 2)");
    CHECK(Set::of()->repr() == "set()");
    CHECK(Set::of(2, 1)->repr() == "{1, 2}");
    CHECK(Dict::of({{"a", 1}, {"b", "x"}})->repr() == "{'a': 1, 'b': 'x'}");
}

TEST_CASE("integers and floats compare numerically") {
    CHECK(*make(1) == *make(1.0));
    CHECK(*make(2) > *make(1.5));
    CHECK(*make(-3.5) < *make(-3));
}

TEST_CASE("booleans compare as numbers") {
    CHECK(*make(true) == *make(1));
    CHECK(*make(false) == *make(0.0));
    CHECK(*make(true) > *make(0.5));
    CHECK(Set::of(true, 1, 1.0)->size() == 1);

    MutableObject flags(Attributes {{"f", true}});
    CHECK(flags == MutableObject(Attributes {{"f", 1}}));
    CHECK(flags.has(std::nullopt, make(1)));
}

TEST_CASE("integers compare exactly with large floats") {
    auto const big = (std::int64_t(1) << 53) + 1;
    CHECK_FALSE(*make(big) == *make(9007199254740992.0));
    CHECK(*make(big) > *make(9007199254740992.0));
    CHECK(*make(std::numeric_limits<std::int64_t>::max()) < *make(9223372036854775808.0));
    CHECK(*make(std::numeric_limits<std::int64_t>::min()) == *make(-9223372036854775808.0));
    CHECK(*make(-3) > *make(-3.5));
    CHECK(*make(5) < *make(std::numeric_limits<double>::infinity()));
    CHECK(*make(5) > *make(-std::numeric_limits<double>::infinity()));
}

TEST_CASE("NaN equals only NaN and sorts after every number") {
    auto const nan = std::numeric_limits<double>::quiet_NaN();
    CHECK_FALSE(*make(nan) == *make(5));
    CHECK_FALSE(*make(nan) == *make(5.0));
    CHECK(*make(nan) == *make(nan));
    CHECK(*make(nan) > *make(std::numeric_limits<double>::infinity()));
    CHECK(*make(nan) < *make("a"));

    MutableObject withNan(Attributes {{"x", nan}});
    CHECK_FALSE(withNan == MutableObject(Attributes {{"x", 5}}));
    CHECK_FALSE(withNan.has(std::nullopt, make(5)));

    auto set = Set::of(1.0, nan, 2.0, nan);
    REQUIRE(set->size() == 3);
    CHECK(std::isnan(*set->at(2)->as<double>()));
    CHECK(set->contains(*make(nan)));
    CHECK(set->insert(1.5));
    CHECK(*set->at(2)->as<double>() == 2.0);
}

TEST_CASE("values of different kinds order by kind") {
    CHECK(*make(nullptr) < *make(false));
    CHECK(*make(false) < *make("a"));
    CHECK(*make(100) < *make("a"));
    CHECK(*Tuple::of(1) < *List::of(0));
    CHECK(*List::of(9) < *Set::of(0));
    CHECK(*Set::of(9) < *Dict::of({}));
    CHECK(*Dict::of({}) < MutableObject());
    CHECK_FALSE(*make("a") == *make(1));
}

TEST_CASE("clone copies containers deeply") {
    auto inner = List::of(1, 2);
    auto outer = List::of(inner);
    auto copy = outer->clone();

    inner->append(3);
    CHECK(copy->as<List>()->at(0)->as<List>()->size() == 2);
    CHECK(*copy != *outer);
}

} // TEST_SUITE("Value")

//=============================================================================
// Visitor tests
//=============================================================================

TEST_SUITE("Visitor") {

TEST_CASE("visit with matching type") {
    auto value = make("hello");
    bool visited = false;
    value->visit([&visited](std::string const& s) {
        CHECK(s == "hello");
        visited = true;
    });
    CHECK(visited);
}

TEST_CASE("visit with auto lambda") {
    auto value = make(3.25);
    std::string result;
    value->visit([&result](auto const& v) {
        result = std::string(typeid(v).name());
    });
    CHECK(result == typeid(double).name());
}

TEST_CASE("visit returns default for unsupported types") {
    auto value = make(12);
    auto length = value->visit([](std::string const& s) { return s.size(); });
    CHECK(length == 0);
}

TEST_CASE("visit on records") {
    Person person(Attributes {{"name", "Alice"}, {"age", 30}});
    Value const& ref = person;
    auto count = ref.visit([](MutableObject const& object) { return object.size(); });
    CHECK(count == 2);
}

} // TEST_SUITE("Visitor")

//=============================================================================
// Container tests
//=============================================================================

TEST_SUITE("Containers") {

TEST_CASE("list append and remove") {
    List list;
    list.append(1);
    list.append("two");
    list.append(ValuePtr());
    CHECK(list.size() == 3);
    CHECK(list[2]->isNull());

    list.removeAt(0);
    CHECK(*list[0]->as<std::string>() == "two");
    CHECK_THROWS_AS(list.removeAt(5), std::out_of_range);

    list.replace(0, make(5));
    CHECK(list.contains(*make(5)));

    list.clear();
    CHECK(list.empty());
}

TEST_CASE("set keeps unique sorted elements") {
    auto set = Set::of(3, 1, 2, 1);
    CHECK(set->size() == 3);
    CHECK(*set->at(0)->as<std::int64_t>() == 1);
    CHECK(*set->at(2)->as<std::int64_t>() == 3);

    CHECK_FALSE(set->insert(2));
    CHECK(set->insert(0));
    CHECK(*set->at(0)->as<std::int64_t>() == 0);
    CHECK(set->contains(*make(2.0)));

    CHECK(set->erase(*make(2)));
    CHECK_FALSE(set->erase(*make(2)));
    CHECK(set->size() == 3);
}

TEST_CASE("dict preserves insertion order") {
    Dict dict;
    dict.set("b", 1);
    dict.set("a", 2);
    dict.set("b", 3);

    CHECK(dict.keys() == std::vector<std::string> { "b", "a" });
    CHECK(*dict.get("b")->as<std::int64_t>() == 3);
    CHECK(dict.get("missing") == nullptr);
    CHECK_THROWS_AS(dict.at("missing"), NotFound);

    CHECK(dict.remove("b"));
    CHECK_FALSE(dict.remove("b"));
    CHECK(dict.size() == 1);
}

TEST_CASE("dict equality ignores order") {
    auto a = Dict::of({{"x", 1}, {"y", 2}});
    auto b = Dict::of({{"y", 2}, {"x", 1}});
    CHECK(*a == *b);

    b->set("x", 5);
    CHECK_FALSE(*a == *b);
}

} // TEST_SUITE("Containers")

//=============================================================================
// Coercion tests
//=============================================================================

TEST_SUITE("Coercion") {

TEST_CASE("construction values are coerced to the declared type") {
    Person person(Attributes {{"name", "Alice"}, {"age", "30"}});
    REQUIRE(person("age"_fld) != nullptr);
    CHECK(*person("age"_fld) == 30);
    CHECK(*person("name"_fld) == "Alice");
}

TEST_CASE("failed coercion reports the field and both types") {
    try
    {
        Person person(Attributes {{"name", "Alice"}, {"age", "thirty"}});
        FAIL("construction should have failed");
    }
    catch (TypeMismatch const& e)
    {
        CHECK(std::string(e.what()) == "Invalid type for field 'age': expected int, got str");
        CHECK(e.field() == "age");
        CHECK(e.expected() == "int");
        CHECK(e.actual() == "str");
    }
}

TEST_CASE("integer conversions") {
    auto age = [] (ValuePtr value) { return *Person(Attributes {{"age", std::move(value)}})("age"_fld); };

    CHECK(age(make(3.9)) == 3);
    CHECK(age(make(-3.9)) == -3);
    CHECK(age(make(true)) == 1);
    CHECK(age(make(" +7 ")) == 7);
    CHECK(age(make("-12")) == -12);

    CHECK_THROWS_AS(Person(Attributes {{"age", "+-7"}}), TypeMismatch);
    CHECK_THROWS_AS(Person(Attributes {{"age", "1.5"}}), TypeMismatch);
    CHECK_THROWS_AS(Person(Attributes {{"age", ""}}), TypeMismatch);
    CHECK_THROWS_AS(Person(Attributes {{"age", std::numeric_limits<double>::infinity()}}), TypeMismatch);
    CHECK_THROWS_AS(Person(Attributes {{"age", List::of(1)}}), TypeMismatch);
}

TEST_CASE("float, bool and string conversions") {
    Measurement m(Attributes {{"ratio", "1e3"}, {"valid", 0}, {"label", 42}});
    CHECK(*m("ratio"_fld) == doctest::Approx(1000.0));
    CHECK(*m("valid"_fld) == false);
    CHECK(*m("label"_fld) == "42");

    Measurement n(Attributes {{"ratio", 2}, {"valid", "x"}, {"label", 1.5}});
    CHECK(*n("ratio"_fld) == doctest::Approx(2.0));
    CHECK(*n("valid"_fld) == true);
    CHECK(*n("label"_fld) == "1.5");

    CHECK_THROWS_AS(Measurement(Attributes {{"ratio", "abc"}}), TypeMismatch);
}

TEST_CASE("container conversions") {
    Measurement m(Attributes {
        {"samples", Tuple::of(1, 2)},
        {"tags", List::of("b", "a", "b")},
        {"extra", List::of(Tuple::of("k", 1), List::of("j", 2))}
    });

    CHECK(m("samples"_fld)->size() == 2);
    CHECK(m("tags"_fld)->size() == 2);
    CHECK(m("extra"_fld)->keys() == std::vector<std::string> { "k", "j" });

    Measurement chars(Attributes {{"samples", "ab"}});
    CHECK(*chars("samples"_fld) == *List::of("a", "b"));

    CHECK_THROWS_WITH_AS(Measurement(Attributes {{"extra", List::of(1, 2)}}),
                         "Invalid type for field 'extra': expected dict, got list", TypeMismatch);
}

TEST_CASE("any-typed fields accept everything") {
    Measurement m(Attributes {{"payload", Set::of(1)}});
    CHECK(m("payload").kind() == Value::Kind::set);
}

TEST_CASE("null passes every declared type and fills missing fields") {
    Person person(Attributes {{"name", nullptr}});
    CHECK(person("name").isNull());
    CHECK(person("age").isNull());
    CHECK(person("age"_fld) == nullptr);
    CHECK(person.keys() == std::vector<std::string> { "name", "age" });
}

TEST_CASE("undeclared names are rejected") {
    CHECK_THROWS_WITH_AS(Person(Attributes {{"name", "Alice"}, {"nickname", "Al"}}),
                         "Unexpected argument: 'nickname'", UnexpectedField);
}

TEST_CASE("reserved names bypass the declared types") {
    Person person(Attributes {{"name", "Alice"}, {"_source", "import"}});
    CHECK(person.size() == 2);
    REQUIRE(person.get("_source") != nullptr);
    CHECK(*person.getAs<std::string>("_source") == "import");
}

TEST_CASE("later writes are not coerced") {
    Person person(Attributes {{"name", "Alice"}, {"age", 30}});
    person.set("age", "old");
    CHECK(person("age"_fld) == nullptr);
    CHECK(*person.getAs<std::string>("age") == "old");
}

TEST_CASE("nested records are built from mappings") {
    Customer customer(Attributes {
        {"name", "ACME"},
        {"address", Dict::of({{"city", "Paris"}, {"tags", List::of("hq")}})}
    });

    auto const* address = customer("address"_fld);
    REQUIRE(address != nullptr);
    CHECK(*(*address)("city"_fld) == "Paris");
    CHECK((*address)("tags"_fld)->size() == 1);
}

TEST_CASE("nested coercion failures surface on the outer field") {
    CHECK_THROWS_WITH_AS(Customer(Attributes {{"address", Dict::of({{"tags", 5}})}}),
                         "Invalid type for field 'address': expected Address, got dict", TypeMismatch);
}

TEST_CASE("exceptions thrown by custom converters become type mismatches") {
    Server server(Attributes {{"host", "localhost"}, {"port", "8080"}});
    CHECK(*server.getAs<std::int64_t>("port") == 8080);

    CHECK_THROWS_WITH_AS(Server(Attributes {{"port", "http"}}),
                         "Invalid type for field 'port': expected port, got str", TypeMismatch);
    CHECK_THROWS_AS(Server(Attributes {{"port", "70000"}}), TypeMismatch);
    CHECK_THROWS_AS(Server(Attributes {{"port", 70000}}), TypeMismatch);
}

TEST_CASE("coerce passes instances through unchanged") {
    auto value = make(5);
    CHECK(coerce("x", value, &metaTypeOf<int>()) == value);
    CHECK(coerce("x", value, nullptr) == value);
    CHECK(*coerce("x", value, &metaTypeOf<std::string>())->as<std::string>() == "5");
}

} // TEST_SUITE("Coercion")

//=============================================================================
// MutableObject tests
//=============================================================================

TEST_SUITE("MutableObject") {

TEST_CASE("set then get") {
    Person person(Attributes {{"name", "Alice"}, {"age", 30}});
    person.set("age", 31);
    CHECK(*person.get("age")->as<std::int64_t>() == 31);

    person.set("email", "alice@example.com");
    CHECK(person.size() == 3);
}

TEST_CASE("reads of missing fields") {
    MutableObject object(Attributes {{"a", 1}});
    CHECK(object.get("missing") == nullptr);
    CHECK(*object.get("missing", make(7))->as<std::int64_t>() == 7);
    CHECK(*object.getOrDefault("a", make(7))->as<std::int64_t>() == 1);
    CHECK_FALSE(object("missing").isValid());
    CHECK(object.getAs<std::int64_t>("missing") == nullptr);
    CHECK_THROWS_WITH_AS(object.at("missing"), "'missing' not found in MutableObject", NotFound);
}

TEST_CASE("remove") {
    Person person(Attributes {{"name", "Alice"}, {"age", 30}});
    person.remove("age");
    CHECK_FALSE(person.has("age"));
    CHECK_THROWS_WITH_AS(person.remove("age"), "'age' not found in Person", NotFound);
}

TEST_CASE("has") {
    Person person(Attributes {{"name", "Alice"}, {"age", 30}});
    CHECK(person.has("name"));
    CHECK(person.has(std::nullopt, make(30)));
    CHECK(person.has(std::nullopt, make("Alice")));
    CHECK(person.has("age", make(30)));
    CHECK(person.has("name", make(30)));
    CHECK_FALSE(person.has("age", make(99)));
    CHECK_FALSE(person.has("email"));
    CHECK_FALSE(person.has(std::nullopt));

    person.set("_token", 1);
    CHECK(person.has("_token"));
}

TEST_CASE("contains") {
    Person person(Attributes {{"name", "Alice"}, {"age", 30}});
    CHECK(person.contains(*make("name")));
    CHECK(person.contains(*make("Alice")));
    CHECK(person.contains(*make(30.0)));
    CHECK_FALSE(person.contains(*make("email")));
}

TEST_CASE("update and updateDefaults") {
    MutableObject object(Attributes {{"a", 1}});
    object.update(Attributes {{"a", 2}, {"b", 3}});
    CHECK(*object.getAs<std::int64_t>("a") == 2);
    CHECK(*object.getAs<std::int64_t>("b") == 3);

    object.updateDefaults(Attributes {{"a", 10}, {"c", 4}});
    CHECK(*object.getAs<std::int64_t>("a") == 2);
    CHECK(*object.getAs<std::int64_t>("c") == 4);
}

TEST_CASE("enumeration follows insertion order and skips reserved fields") {
    MutableObject object(Attributes {{"z", 1}, {"a", 2}});
    object.set("_meta", "hidden");
    object.set("m", 3);

    CHECK(object.size() == 3);
    CHECK(object.keys() == std::vector<std::string> { "z", "a", "m" });
    CHECK(*object.values()[1]->as<std::int64_t>() == 2);

    auto entries = object.enumerate();
    CHECK(entries[2].first == 2);
    CHECK(entries[2].second.name == "m");

    std::vector<std::string> visited;
    for (auto const& field : object)
        visited.push_back(field.name);
    CHECK(visited == object.keys());
}

TEST_CASE("accessors are registered per type") {
    MutableObject object;
    object.set("registeredOnce", 1);
    object.set("_notRegistered", 1);
    CHECK(MutableObject::meta().accessors().contains("registeredOnce"));
    CHECK_FALSE(MutableObject::meta().accessors().contains("_notRegistered"));

    Person person(Attributes {{"name", "Alice"}});
    CHECK(Person::meta().accessors().contains("age"));
    CHECK_FALSE(Person::meta().accessors().contains("registeredOnce"));
}

TEST_CASE("equality ignores order and concrete type") {
    Person person(Attributes {{"name", "Alice"}, {"age", 30}});
    MutableObject object(Attributes {{"age", 30.0}, {"name", "Alice"}});
    CHECK(person == object);

    object.set("_internal", 1);
    CHECK(person == object);

    object.set("age", 31);
    CHECK_FALSE(person == object);
}

TEST_CASE("equals on a subset of keys") {
    MutableObject a(Attributes {{"x", 1}, {"y", 2}});
    MutableObject b(Attributes {{"x", 1}, {"y", 3}});
    CHECK(a.equals(b, {"x"}));
    CHECK_FALSE(a.equals(b, {"x", "y"}));
    CHECK(a.equals(b, {"missing"}));
}

TEST_CASE("ordering") {
    MutableObject a(Attributes {{"a", 1}});
    MutableObject b(Attributes {{"a", 2}});
    MutableObject c(Attributes {{"b", 0}});
    CHECK(a < b);
    CHECK(b > a);
    CHECK(a < c);
    CHECK(a < MutableObject(Attributes {{"a", 1}, {"b", 1}}));
}

TEST_CASE("union, right side wins") {
    MutableObject lhs(Attributes {{"x", 1}, {"y", 2}});
    MutableObject rhs(Attributes {{"x", 5}, {"z", 9}});

    auto merged = lhs + rhs;
    REQUIRE(merged != nullptr);
    CHECK(merged->keys() == std::vector<std::string> { "x", "y", "z" });
    CHECK(*merged->getAs<std::int64_t>("x") == 5);
    CHECK(*merged->getAs<std::int64_t>("y") == 2);
    CHECK(*merged->getAs<std::int64_t>("z") == 9);
    CHECK(lhs.size() == 2);
}

TEST_CASE("union is not applicable across types") {
    Person person(Attributes {{"name", "Alice"}});
    MutableObject object(Attributes {{"age", 5}});

    CHECK((person + object) == nullptr);

    auto merged = object + person;
    REQUIRE(merged != nullptr);
    CHECK(typeid(*merged) == typeid(MutableObject));

    auto people = person + Person(Attributes {{"age", 40}});
    REQUIRE(people != nullptr);
    CHECK(typeid(*people) == typeid(Person));
    CHECK(people->get("name")->isNull());
    CHECK(*people->getAs<std::int64_t>("age") == 40);
}

TEST_CASE("difference") {
    MutableObject lhs(Attributes {{"x", 1}, {"y", 2}, {"z", 3}});
    MutableObject rhs(Attributes {{"y", 0}});

    auto remaining = lhs - rhs;
    CHECK(remaining->keys() == std::vector<std::string> { "x", "z" });
}

TEST_CASE("filtering by value type") {
    MutableObject object(Attributes {{"a", 1}, {"b", "x"}, {"c", 2}, {"d", List::of()}});
    CHECK(object.filterByType<std::int64_t>().keys() == std::vector<std::string> { "a", "c" });
    CHECK(object.filterByType<List>().keys() == std::vector<std::string> { "d" });
    CHECK(object.toFilteredMapping({"a", "b"}).keys() == std::vector<std::string> { "a", "b" });
    CHECK(object.toFilteredMapping({"a", "b"}, &metaTypeOf<std::string>()).keys() == std::vector<std::string> { "b" });
}

TEST_CASE("toMapping") {
    MutableObject object(Attributes {{"b", 1}, {"a", 2}, {"c", 3}});
    object.set("_hidden", 0);

    CHECK(object.toMapping().keys() == std::vector<std::string> { "b", "a", "c" });
    CHECK(object.toMapping({"c"}).keys() == std::vector<std::string> { "b", "a" });
    CHECK(object.toMapping({}, SortOrder::ascending).keys() == std::vector<std::string> { "a", "b", "c" });
    CHECK(object.toMapping({}, SortOrder::descending).keys() == std::vector<std::string> { "c", "b", "a" });
    CHECK(object.toMapping({}, SortOrder::none, true).contains("_hidden"));
}

TEST_CASE("mapping round trip") {
    MutableObject object(Attributes {{"name", "Alice"}, {"tags", List::of("a")}});
    auto mapping = object.toMapping();
    mapping.set("_dropped", 1);

    auto restored = MutableObject::fromMapping(mapping);
    CHECK(*restored == object);
    CHECK(restored->get("_dropped") == nullptr);

    auto person = Person::fromMapping(Person(Attributes {{"name", "Bob"}, {"age", 4}}).toMapping());
    CHECK(*person->getAs<std::int64_t>("age") == 4);
}

TEST_CASE("copy shares values") {
    MutableObject object(Attributes {{"tags", List::of("a")}});
    auto copy = object.copy();
    CHECK(copy->get("tags") == object.get("tags"));

    Person person(Attributes {{"name", "Alice"}});
    auto typed = person.copy();
    CHECK(dynamic_cast<Person const*>(typed.get()) != nullptr);
    CHECK(*typed == person);

    auto plain = person.copy(true);
    CHECK(dynamic_cast<Person const*>(plain.get()) == nullptr);
    CHECK(*plain == person);
}

TEST_CASE("copying a record with undeclared fields fails") {
    Person person(Attributes {{"name", "Alice"}});
    person.set("nickname", "Al");
    CHECK_THROWS_AS(person.copy(), UnexpectedField);
    CHECK(person.copy(true)->size() == 3);
}

TEST_CASE("deep clone isolates nested structures") {
    auto inner = std::make_shared<MutableObject>(Attributes {{"values", List::of(1, 2)}});
    MutableObject source(Attributes {
        {"child", inner},
        {"mapping", Dict::of({{"list", List::of(Set::of(1), Tuple::of(List::of(2)))}})}
    });

    auto clone = source.deepClone();
    CHECK(*clone == source);

    auto cloneChild = clone->get("child")->as<MutableObject>();
    REQUIRE(cloneChild != nullptr);
    CHECK(cloneChild != inner.get());

    const_cast<List*>(cloneChild->getAs<List>("values"))->append(3);
    CHECK(inner->getAs<List>("values")->size() == 2);

    auto const* cloneMapping = clone->getAs<Dict>("mapping");
    auto const* sourceMapping = source.getAs<Dict>("mapping");
    CHECK(cloneMapping != sourceMapping);
    CHECK(cloneMapping->get("list") != sourceMapping->get("list"));

    auto const* cloneTuple = cloneMapping->get("list")->as<List>()->at(1)->as<Tuple>();
    auto const* sourceTuple = sourceMapping->get("list")->as<List>()->at(1)->as<Tuple>();
    CHECK(cloneTuple->at(0) != sourceTuple->at(0));
}

TEST_CASE("deep clone as mutable converts the whole tree") {
    FrozenPerson person(Attributes {{"name", "Alice"}, {"age", 30}});
    MutableObject holder(Attributes {{"person", FrozenPerson::fromMapping(person.toMapping())}});

    auto clone = holder.deepClone(true);
    auto const* nested = clone->getAs<MutableObject>("person");
    REQUIRE(nested != nullptr);
    CHECK(typeid(*nested) == typeid(MutableObject));

    auto same = holder.deepClone();
    CHECK(typeid(*same->getAs<MutableObject>("person")) == typeid(FrozenPerson));
}

TEST_CASE("repr and format") {
    Person person(Attributes {{"name", "Alice"}, {"age", 30}});
    CHECK(person.repr() == "<Person (name='Alice', age=30)>");
    CHECK(std::format("{}", person) == "<Person (name='Alice', age=30)>");

    std::ostringstream ss;
    ss << MutableObject();
    CHECK(ss.str() == "<MutableObject ()>");
}

} // TEST_SUITE("MutableObject")

//=============================================================================
// ImmutableObject tests
//=============================================================================

TEST_SUITE("ImmutableObject") {

TEST_CASE("supplied fields are locked") {
    FrozenPerson person(Attributes {{"name", "Alice"}, {"age", 30}});
    CHECK(person.isLocked("age"));
    CHECK_THROWS_WITH_AS(person.set("age", 31), "Cannot modify immutable field 'age' of object Person", Immutable);
    CHECK_THROWS_AS(person.remove("name"), Immutable);
    CHECK(*person("age"_fld) == 30);
}

TEST_CASE("fields not supplied stay writable") {
    FrozenPerson person(Attributes {{"name", "Alice"}});
    CHECK_FALSE(person.isLocked("age"));
    person.set("age", 1);
    CHECK(*person("age"_fld) == 1);
}

TEST_CASE("new fields are accepted until the object is sealed") {
    ImmutableObject point(Attributes {{"x", 10}, {"y", 20}});
    CHECK_FALSE(point.isSealed());
    point.set("z", 30);
    CHECK(*point.getAs<std::int64_t>("z") == 30);
}

TEST_CASE("locking a new field with a value") {
    ImmutableObject object(Attributes {{"name", "Alice"}});
    object.lock("age", true, 40);

    CHECK(*object.getAs<std::int64_t>("age") == 40);
    CHECK(object.isLocked("age"));
    CHECK(object.isSealed());
    CHECK_THROWS_AS(object.set("age", 41), Immutable);
}

TEST_CASE("lock errors") {
    ImmutableObject object(Attributes {{"name", "Alice"}});
    CHECK_THROWS_WITH_AS(object.lock("age"), "Attribute 'age' has not been registered", NotRegistered);
    CHECK_THROWS_AS(object.lock("_secret", true, 1), PrivateField);
    CHECK_THROWS_WITH_AS(object.lock("age", true), "New attribute 'age' must have a value when locking", MissingValue);
    CHECK_THROWS_AS(object.unlock("age"), NotRegistered);
    CHECK_FALSE(object.isSealed());
}

TEST_CASE("unlock and lock again") {
    ImmutableObject object(Attributes {{"x", 1}});
    object.unlock("x");
    CHECK_FALSE(object.isLocked("x"));
    object.set("x", 2);

    object.lock("x");
    CHECK_THROWS_AS(object.set("x", 3), Immutable);
    CHECK(*object.getAs<std::int64_t>("x") == 2);
}

TEST_CASE("sealed objects reject unknown fields") {
    ImmutableObject object(Attributes {{"x", 1}});
    object.lock("x");

    try
    {
        object.set("y", 1);
        FAIL("write should have failed");
    }
    catch (Immutable const& e)
    {
        CHECK(e.field().empty());
        CHECK(std::string(e.what()) == "Cannot modify immutable object ImmutableObject");
    }
}

TEST_CASE("freeze locks every field") {
    ImmutableObject object(Attributes {{"x", 1}});
    object.set("y", 2);
    object.freeze();

    CHECK(object.isLocked("y"));
    CHECK(object.isSealed());
    CHECK_THROWS_AS(object.set("y", 3), Immutable);
    CHECK_THROWS_AS(object.set("w", 3), Immutable);
}

TEST_CASE("reserved fields are always writable") {
    ImmutableObject object(Attributes {{"x", 1}});
    object.freeze();
    object.set("_cache", 1);
    object.remove("_cache");
    CHECK_FALSE(object.has("_cache"));
}

TEST_CASE("update checks every name before writing") {
    ImmutableObject object(Attributes {{"x", 1}});
    CHECK_THROWS_AS(object.update(Attributes {{"y", 2}, {"x", 3}}), Immutable);
    CHECK_FALSE(object.has("y"));

    object.update(Attributes {{"y", 2}});
    CHECK(object.isLocked("y"));
}

TEST_CASE("updateDefaults goes through the guard") {
    ImmutableObject object(Attributes {{"x", 1}});
    object.updateDefaults(Attributes {{"x", 5}, {"w", 1}});
    CHECK(*object.getAs<std::int64_t>("x") == 1);
    CHECK(*object.getAs<std::int64_t>("w") == 1);

    object.freeze();
    CHECK_THROWS_AS(object.updateDefaults(Attributes {{"v", 1}}), Immutable);
}

TEST_CASE("removing an unlocked field drops its lock entry") {
    ImmutableObject object(Attributes {{"x", 1}});
    object.unlock("x");
    object.remove("x");
    CHECK_FALSE(object.has("x"));
    CHECK_THROWS_AS(object.lock("x"), NotRegistered);
}

TEST_CASE("copies derive their lock state anew") {
    FrozenPerson person(Attributes {{"name", "Alice"}, {"age", 30}});

    auto copy = person.copy();
    CHECK_THROWS_AS(copy->set("age", 1), Immutable);

    auto deep = person.deepClone();
    CHECK_THROWS_AS(deep->set("age", 1), Immutable);

    auto writable = person.deepClone(true);
    writable->set("age", 1);
    CHECK(*writable->getAs<std::int64_t>("age") == 1);
    CHECK(*person("age"_fld) == 30);
}

TEST_CASE("post-construction hook runs before locking") {
    Counter counter;
    CHECK(*counter("count"_fld) == 0);
    CHECK(*counter.getAs<bool>("_initialised") == true);
    counter.set("count", 5);

    Counter supplied(Attributes {{"count", 3}});
    CHECK(*supplied("count"_fld) == 3);
    CHECK_THROWS_AS(supplied.set("count", 4), Immutable);
}

} // TEST_SUITE("ImmutableObject")

//=============================================================================
// Record tests
//=============================================================================

TEST_SUITE("Record") {

TEST_CASE("field names") {
    CHECK(Person::kFieldNames.size() == 2);
    CHECK(Person::kFieldNames[0] == "name");
    CHECK(Person::kFieldNames[1] == "age");
}

TEST_CASE("record meta") {
    auto const& meta = Customer::meta();
    CHECK(meta.isRecord());
    CHECK_FALSE(meta.isOpaque());
    CHECK(meta.name() == "Customer");
    CHECK(meta.typeInfo() == typeid(Customer));

    auto fields = meta.fields();
    REQUIRE(fields.size() == 2);
    CHECK(fields[0].fieldname == "name");
    CHECK(fields[0].metaType().name() == "str");
    CHECK(fields[1].fieldname == "address");
    CHECK(fields[1].metaType().isRecord());
    CHECK(fields[1].metaType().fields().size() == 2);
}

TEST_CASE("fundamental meta") {
    CHECK(metaTypeOf<int>().isOpaque());
    CHECK(metaTypeOf<int>().typeInfo() == typeid(std::int64_t));
    CHECK(metaTypeOf<float>().name() == "float");
    CHECK(metaTypeOf<List>().name() == "list");
    CHECK_FALSE(metaTypeOf<List>().isOpaque());
    CHECK(metaTypeOf<Value>().name() == "Any");
    CHECK(metaTypeOf<MutableObject>().isRecord());
    CHECK(metaTypeOf<MutableObject>().fields().empty());
}

TEST_CASE("schema name falls back to the C++ type name") {
    CHECK(Counter::meta().name() == "CounterFields");
}

TEST_CASE("typed set") {
    Person person(Attributes {{"name", "Alice"}});
    person.set("age"_fld, 41);
    CHECK(*person("age"_fld) == 41);
}

TEST_CASE("visitFields") {
    Person person(Attributes {{"name", "Alice"}, {"age", 30}});
    person.set("extra", 1);

    std::vector<std::string> names;
    person.visitFields([&names] (std::string_view name, Value const& value) {
        names.emplace_back(name);
        CHECK(value.isValid());
    });
    CHECK(names == std::vector<std::string> { "name", "age" });
}

TEST_CASE("default construction fills every declared field with null") {
    Person person;
    CHECK(person.size() == 2);
    CHECK(person("name").isNull());
}

} // TEST_SUITE("Record")

//=============================================================================
// JSON tests
//=============================================================================

TEST_SUITE("JSON") {

TEST_CASE("toText") {
    Person person(Attributes {{"name", "Alice"}, {"age", 30}});
    person.set("_hidden", 1);
    CHECK(person.toText() == R"({"name":"Alice","age":30})");
    CHECK(person.toText({"age"}) == R"({"name":"Alice"})");
}

TEST_CASE("sorted keys apply at every depth") {
    MutableObject object(Attributes {{"b", 1}, {"a", Dict::of({{"d", 1}, {"c", List::of(1.5, nullptr, true)}})}});
    CHECK(object.toText({}, true) == R"({"a":{"c":[1.5,null,true],"d":1},"b":1})");
    CHECK(object.toText() == R"({"b":1,"a":{"d":1,"c":[1.5,null,true]}})");
}

TEST_CASE("fromText") {
    auto object = MutableObject::fromText(R"({"i": 2, "f": 2.0, "l": [1, "x"], "d": {"k": null}, "_skip": 1})");
    CHECK(object->keys() == std::vector<std::string> { "i", "f", "l", "d" });
    CHECK(object->getAs<std::int64_t>("i") != nullptr);
    CHECK(object->getAs<double>("f") != nullptr);
    CHECK(object->getAs<List>("l")->size() == 2);
    CHECK(object->getAs<Dict>("d")->get("k")->isNull());
}

TEST_CASE("round trip with nested records") {
    Customer customer(Attributes {
        {"name", "ACME"},
        {"address", Dict::of({{"city", "Paris"}, {"tags", List::of("hq", "eu")}})}
    });

    auto restored = Customer::fromText(customer.toText());
    CHECK(*restored == customer);
    CHECK((*restored)("address"_fld) != nullptr);

    auto frozen = ImmutableObject::fromText(R"({"x": 1})");
    CHECK_THROWS_AS(frozen->set("x", 2), Immutable);
}

TEST_CASE("malformed text") {
    CHECK_THROWS_AS(MutableObject::fromText("not json"), ParseError);
    CHECK_THROWS_WITH_AS(MutableObject::fromText("[1, 2]"), "Expected a JSON object, got array", ParseError);
    CHECK_THROWS_AS(Person::fromText(R"({"age": "x"})"), TypeMismatch);
}

} // TEST_SUITE("JSON")

//=============================================================================
// Builder tests
//=============================================================================

TEST_SUITE("Builder") {

TEST_CASE("configure and build") {
    GreetingBuilder builder;
    CHECK_FALSE(builder.hasOption("name"));

    builder.configure("name", "World");
    CHECK(builder.hasOption("name"));
    CHECK(*builder.option("name")->as<std::string>() == "World");
    CHECK(builder.build()->text == "Hello, World");
    CHECK(builder.str() == "{'name': 'World'}");
    CHECK(builder.configuration().size() == 1);
}

TEST_CASE("missing options") {
    GreetingBuilder builder;
    CHECK_THROWS_AS(builder.option("name"), NotFound);
    CHECK_THROWS_AS(builder.removeOption("name"), NotFound);

    builder.configure("name", "x");
    builder.removeOption("name");
    CHECK_FALSE(builder.hasOption("name"));
}

TEST_CASE("the configuration field itself is locked") {
    GreetingBuilder builder;
    CHECK(builder.isLocked("configuration"));
    CHECK_THROWS_AS(builder.set("configuration", Dict::of({})), Immutable);
}

TEST_CASE("copies are builders of the same type") {
    GreetingBuilder builder;
    builder.configure("name", "World");
    CHECK(GreetingBuilder::meta().name() == "GreetingBuilder");
    CHECK(builder.repr() == "<GreetingBuilder (configuration={'name': 'World'})>");

    auto copy = builder.copy();
    auto const* typed = dynamic_cast<GreetingBuilder const*>(copy.get());
    REQUIRE(typed != nullptr);
    CHECK(typed->isLocked("configuration"));
    CHECK(typed->build()->text == "Hello, World");

    builder.configure("name", "Alice");
    CHECK(typed->build()->text == "Hello, World");

    auto clone = builder.deepClone();
    REQUIRE(dynamic_cast<GreetingBuilder const*>(clone.get()) != nullptr);
    CHECK(*clone == builder);
}

} // TEST_SUITE("Builder")
