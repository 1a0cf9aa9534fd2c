#include <cstdlib>
#include <iostream>
#include <memory>
#include "baseobject.hpp"
#include "logger.hpp"

// Example usage
using namespace baseobject;

struct PersonFields
{
    static constexpr std::string_view kName = "Person";

    Field<std::string,  "name"> name;
    Field<std::int64_t, "age">  age;
};

struct PointFields
{
    static constexpr std::string_view kName = "Point";

    Field<std::int64_t, "x"> x;
    Field<std::int64_t, "y"> y;
};

using Person = Record<PersonFields>;
using Point  = Record<PointFields, ImmutableObject>;

struct Application
{
    explicit Application(log::Level level) : logger("baseobject", level) {}

    void runMutable()
    {
        logger.info("=== MutableObject demo ===");

        Person person(Attributes {{"name", "Alice"}, {"age", 30}});
        BASEOBJECT_LOG_INFO(logger, "Initial: " << person);
        List keys;
        for (auto const& key : person.keys())
            keys.append(key);

        BASEOBJECT_LOG_INFO(logger, "Keys: " << keys);
        BASEOBJECT_LOG_INFO(logger, "Values: " << List(person.values()));
        BASEOBJECT_LOG_INFO(logger, "Has 'name'? " << std::boolalpha << person.has("name"));
        BASEOBJECT_LOG_INFO(logger, "Has value 30? " << person.has(std::nullopt, make(30)));
        BASEOBJECT_LOG_INFO(logger, "Has value 'Alice'? " << person.has(std::nullopt, make("Alice")));
        BASEOBJECT_LOG_INFO(logger, "Is 30 years old? " << person.has("age", make(30)));

        person.set("age", 31);
        person.set("name", "Bob");
        person.update(Attributes {{"age", 32}});
        BASEOBJECT_LOG_INFO(logger, "After updates: " << person);

        if (auto age = person("age"_fld))
            BASEOBJECT_LOG_DEBUG(logger, "Typed age: " << *age);

        BASEOBJECT_LOG_INFO(logger, "Copy: " << *person.copy());
        BASEOBJECT_LOG_INFO(logger, "Deep copy: " << *person.deepClone());
        BASEOBJECT_LOG_INFO(logger, "Deep copy (mutable): " << *person.deepClone(true));

        logger.info("Iterating over attributes:");
        for (auto const& [idx, field] : person.enumerate())
            BASEOBJECT_LOG_INFO(logger, " " << idx << ": " << field.name << " = " << *field.value);

        auto const json = person.toText();
        BASEOBJECT_LOG_INFO(logger, "JSON: " << json);
        BASEOBJECT_LOG_INFO(logger, "From JSON: " << *Person::fromText(json));
    }

    void runImmutable()
    {
        logger.info("=== ImmutableObject demo ===");

        Point point(Attributes {{"x", 10}, {"y", 20}});
        BASEOBJECT_LOG_INFO(logger, "Initial: " << point);

        for (auto name : { "x", "y" })
        {
            try
            {
                point.set(name, 15);
            }
            catch (Immutable const& e)
            {
                BASEOBJECT_LOG_WARNING(logger, "Cannot modify: " << e.what());
            }
        }

        auto mutableCopy = point.copy(true);
        mutableCopy->set("x", 15);
        BASEOBJECT_LOG_INFO(logger, "Modified mutable copy: " << *mutableCopy);

        BASEOBJECT_LOG_INFO(logger, "Deep copy: " << *point.deepClone());

        auto deepMutable = point.deepClone(true);
        deepMutable->set("y", 30);
        BASEOBJECT_LOG_INFO(logger, "Modified deep mutable copy: " << *deepMutable);

        point.unlock("x");
        point.set("x", 11);
        point.lock("x");
        point.lock("z", true, 30);
        BASEOBJECT_LOG_INFO(logger, "After relocking: " << point << ", sealed: " << std::boolalpha << point.isSealed());

        BASEOBJECT_LOG_INFO(logger, "Has key 'x'? " << point.has("x"));
        BASEOBJECT_LOG_INFO(logger, "Has value 20? " << point.has(std::nullopt, make(20)));
    }

    void run()
    {
        runMutable();
        runImmutable();
    }

    log::Logger logger;
};

int main()
{
    auto const* levelName = std::getenv("BASEOBJECT_LOG_LEVEL");
    Application app(log::parseLevel(levelName != nullptr ? levelName : "info"));

    try
    {
        app.run();
    }
    catch (Error const& e)
    {
        app.logger.critical(e.what());
        return 1;
    }

    return 0;
}
