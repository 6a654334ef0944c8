#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "typed.hpp"
#include <cmath>
#include <format>
#include <limits>
#include <random>
#include <sstream>

using namespace typed;

//=============================================================================
// Test type definitions
//=============================================================================

struct Date {
    int year;
    int month;
    int day;
};

struct Point {
    double x;
    double y;
};

using Stringable = Interface<"Stringable">;
using Comparable = Interface<"Comparable">;
using Named      = Interface<"Named", Stringable>;
using Loggable   = Trait<"Loggable">;

using DateTime   = Record<Date, "DateTime", Stringable, Comparable>;
using Birthday   = Record<Date, "Birthday", DateTime, Loggable>;
using Location   = Record<Point, "Geo\\Location", Named>;

//=============================================================================
// Value tests
//=============================================================================

TEST_SUITE("Value") {

TEST_CASE("kinds") {
    CHECK(Value().isNull());
    CHECK(Value(nullptr).isNull());
    CHECK(Value(true).isBool());
    CHECK(Value(42).isInt());
    CHECK(Value(std::uint8_t(7)).isInt());
    CHECK(Value(1.5).isFloat());
    CHECK(Value(1.5f).isFloat());
    CHECK(Value("text").isString());
    CHECK(Value(std::string("text")).isString());
    CHECK(Value(Array { 1, 2 }).isArray());
    CHECK(makeObject<DateTime>(2024, 1, 1).isObject());
    CHECK(Value(std::shared_ptr<Pair>()).isNull());
}

TEST_CASE("type names") {
    CHECK(typeName(nullptr) == "null");
    CHECK(typeName(false) == "bool");
    CHECK(typeName(1) == "int");
    CHECK(typeName(1.0) == "float");
    CHECK(typeName("x") == "string");
    CHECK(typeName(Array {}) == "array");
    CHECK(typeName(makeObject<Birthday>(1990, 4, 1)) == "Birthday");
    CHECK(typeName(makeObject<Location>(1.0, 2.0)) == "Geo\\Location");
}

TEST_CASE("strict equality") {
    CHECK(Value(1) == Value(1));
    CHECK_FALSE(Value(1) == Value("1"));
    CHECK_FALSE(Value(1) == Value(true));
    CHECK_FALSE(Value(1) == Value(1.0));
    CHECK_FALSE(Value(0) == Value(nullptr));
    CHECK(Value(0.0) == Value(-0.0));
    CHECK(Value(std::nan("")) == Value(std::nan("")));
    CHECK(Value(Array { 1, "a" }) == Value(Array { 1, "a" }));
    CHECK_FALSE(Value(Array { 1, "a" }) == Value(Array { "a", 1 }));
}

TEST_CASE("objects compare by identity") {
    auto a = makeObject<DateTime>(2024, 1, 1);
    auto b = makeObject<DateTime>(2024, 1, 1);
    auto copy = a;

    CHECK(a == copy);
    CHECK_FALSE(a == b);
    CHECK_FALSE(a == a.clone());
}

TEST_CASE("accessors throw on wrong kind") {
    CHECK(Value(5).asInt() == 5);
    CHECK(Value("x").asString() == "x");
    CHECK_THROWS_AS(Value(5).asString(), TypeMismatch);
    CHECK_THROWS_AS(Value("x").asInt(), TypeMismatch);
    CHECK_THROWS_AS(Value(nullptr).asArray(), TypeMismatch);
    CHECK_THROWS_AS(Value(true).toNumber(), TypeMismatch);
    CHECK(Value(3).toNumber() == 3.0);
}

TEST_CASE("downcast to record") {
    auto value = makeObject<Birthday>(1990, 4, 1);
    auto birthday = value.as<Birthday>();

    REQUIRE(birthday != nullptr);
    CHECK((*birthday)().year == 1990);
    CHECK((*birthday)->month == 4);
    CHECK(value.as<DateTime>() == nullptr);
    CHECK(Value(1).as<Pair>() == nullptr);
}

TEST_CASE("toString") {
    CHECK(toString(nullptr) == "null");
    CHECK(toString(true) == "true");
    CHECK(toString(-12) == "-12");
    CHECK(toString(1.0) == "1.0");
    CHECK(toString(0.5) == "0.5");
    CHECK(toString("say \"hi\"") == "\"say \\\"hi\\\"\"");
    CHECK(toString(Array { 1, "a" }) == "[0 => 1, 1 => \"a\"]");
    CHECK(toString(makeObject<DateTime>(2024, 1, 2)) == "DateTime { 2024, 1, 2 }");
    CHECK(toString(makeObject<Pair>("k", 1)) == "Pair { \"k\" => 1 }");
}

TEST_CASE("abbreviate") {
    CHECK(abbreviate("short") == "\"short\"");
    CHECK(abbreviate("a rather long string value", 10) == "\"a rath...");
    CHECK(abbreviate("a rather long string value", 10).size() == 10);
}

TEST_CASE("formatter and stream") {
    std::stringstream ss;
    ss << Value(Array { true });
    CHECK(ss.str() == "[0 => true]");
    CHECK(std::format("{}", Value(2.5)) == "2.5");
}

TEST_CASE("compare") {
    CHECK((compare(1, 2) < 0));
    CHECK((compare(2.5, 2) > 0));
    CHECK((compare("b", "a") > 0));
    CHECK((compare(false, true) < 0));
    CHECK((compare(nullptr, nullptr) == 0));
    CHECK((compare(Array { 1, 2 }, Array { 1, 3 }) < 0));
    CHECK_THROWS_AS(compare(1, "1"), TypeMismatch);
    CHECK_THROWS_AS(compare(makeObject<DateTime>(), makeObject<DateTime>()), TypeMismatch);
}

} // TEST_SUITE("Value")

//=============================================================================
// Array tests
//=============================================================================

TEST_SUITE("Array") {

TEST_CASE("list keys") {
    Array a { "x", "y" };
    CHECK(a.size() == 2);
    REQUIRE(a.find(std::int64_t(1)) != nullptr);
    CHECK(*a.find(std::int64_t(1)) == Value("y"));
    CHECK_FALSE(a.contains(std::int64_t(2)));
}

TEST_CASE("set overwrites in place and append continues after largest key") {
    Array a;
    a.set(std::int64_t(5), "five");
    a.set(std::string("name"), "n");
    a.append("six");
    a.set(std::int64_t(5), "FIVE");

    std::vector<ArrayKey> keys;
    for (auto const& element : a)
        keys.push_back(element.key);

    CHECK(keys == std::vector<ArrayKey> { std::int64_t(5), std::string("name"), std::int64_t(6) });
    CHECK(*a.find(std::int64_t(5)) == Value("FIVE"));
}

TEST_CASE("construct from range") {
    std::vector<int> source { 1, 2, 3 };
    Array a(source);
    CHECK(a == Array { 1, 2, 3 });
}

} // TEST_SUITE("Array")

//=============================================================================
// MetaClass tests
//=============================================================================

TEST_SUITE("MetaClass") {

TEST_CASE("closure contains ancestors, interfaces and traits") {
    auto const& meta = Birthday::meta();

    CHECK(meta.name() == "Birthday");
    CHECK(meta.category() == MetaClass::Category::classType);
    CHECK(meta.satisfies("Birthday"));
    CHECK(meta.satisfies("DateTime"));
    CHECK(meta.satisfies("Stringable"));
    CHECK(meta.satisfies("Comparable"));
    CHECK(meta.satisfies("Loggable"));
    CHECK(meta.satisfies("\\DateTime"));
    CHECK_FALSE(meta.satisfies("Named"));
    CHECK(meta.closure().size() == 5);
}

TEST_CASE("parents do not satisfy children") {
    CHECK_FALSE(DateTime::meta().satisfies("Birthday"));
    CHECK(DateTime::meta().satisfies("Stringable"));
}

TEST_CASE("interface inheritance") {
    CHECK(Named::meta().category() == MetaClass::Category::interfaceType);
    CHECK(Loggable::meta().category() == MetaClass::Category::traitType);
    CHECK(Location::meta().satisfies("Stringable"));
    CHECK(Location::meta().satisfies("Geo\\Location"));
}

TEST_CASE("meta is a singleton") {
    CHECK(&DateTime::meta() == &makeObject<DateTime>().asObject()->metaClass());
}

} // TEST_SUITE("MetaClass")

//=============================================================================
// TypeSet tests
//=============================================================================

TEST_SUITE("TypeSet") {

TEST_CASE("parse union") {
    auto types = TypeSet::parse("int|string");
    CHECK(types.size() == 2);
    CHECK(types.containsOnly("int", "string"));
    CHECK_FALSE(types.anyOk());
    CHECK_FALSE(types.nullOk());
}

TEST_CASE("whitespace is ignored") {
    CHECK(TypeSet::parse(" int | string ").containsOnly("string", "int"));
}

TEST_CASE("nullable shorthand") {
    auto types = TypeSet::parse("?int");
    CHECK(types.containsOnly("int", "null"));
    CHECK(types.nullOk());
    CHECK(types == TypeSet::parse("int|null"));
    CHECK(TypeSet::parse("?int|?string").containsOnly("int", "string", "null"));
}

TEST_CASE("leading backslash is stripped") {
    auto types = TypeSet::parse("\\Geo\\Location");
    CHECK(types.contains("Geo\\Location"));
    CHECK(types.contains("\\Geo\\Location"));
}

TEST_CASE("syntax errors") {
    CHECK_THROWS_AS(TypeSet::parse(""), ConstraintSyntaxError);
    CHECK_THROWS_AS(TypeSet::parse("   "), ConstraintSyntaxError);
    CHECK_THROWS_AS(TypeSet::parse("int|"), ConstraintSyntaxError);
    CHECK_THROWS_AS(TypeSet::parse("|int"), ConstraintSyntaxError);
    CHECK_THROWS_AS(TypeSet::parse("int||string"), ConstraintSyntaxError);
    CHECK_THROWS_AS(TypeSet::parse("?"), ConstraintSyntaxError);
    CHECK_THROWS_AS(TypeSet::parse("int|int"), ConstraintSyntaxError);
    CHECK_THROWS_AS(TypeSet::parse("?int|null"), ConstraintSyntaxError);
    CHECK_THROWS_AS(TypeSet::parse("DateTime|\\DateTime"), ConstraintSyntaxError);
    CHECK_THROWS_AS(TypeSet::parse("?null"), ConstraintSyntaxError);
    CHECK_THROWS_AS(TypeSet::parse("?mixed"), ConstraintSyntaxError);
    CHECK_THROWS_AS(TypeSet::parse("1abc"), ConstraintSyntaxError);
    CHECK_THROWS_AS(TypeSet::parse("Foo\\\\Bar"), ConstraintSyntaxError);
    CHECK_THROWS_AS(TypeSet::parse("Foo\\"), ConstraintSyntaxError);
    CHECK_THROWS_AS(TypeSet::parse("int-ish"), ConstraintSyntaxError);
}

TEST_CASE("reserved keywords") {
    for (auto keyword : { "void", "never", "false", "true", "self", "static", "parent",
                          "callable", "iterable", "resource", "integer", "double", "boolean" })
    {
        CAPTURE(keyword);
        CHECK_THROWS_AS(TypeSet::parse(keyword), ConstraintSyntaxError);
    }
}

TEST_CASE("subsumed tokens are dropped") {
    CHECK(TypeSet::parse("int|scalar").containsOnly("scalar"));
    CHECK(TypeSet::parse("number|float|uint").containsOnly("number"));
    CHECK(TypeSet::parse("uint|int").containsOnly("int"));
    CHECK(TypeSet::parse("DateTime|object").containsOnly("object"));
    CHECK(TypeSet::parse("?scalar|bool").containsOnly("scalar", "null"));
    CHECK(TypeSet::parse("array|int|mixed").anyOk());
    CHECK(TypeSet::parse("mixed").anyOk());
    CHECK(TypeSet::parse("mixed").contains("mixed"));
}

TEST_CASE("the unrestricted set") {
    auto types = TypeSet::any();
    CHECK(types.anyOk());
    CHECK(types.nullOk());
    CHECK(types.size() == 0);
    CHECK(types.containsOnly("mixed"));
    CHECK(types.match(nullptr));
    CHECK(types.match(makeObject<Pair>(1, 2)));
    CHECK(types.toString() == "mixed");
    CHECK_FALSE(TypeSet::parse("null").anyOk());
}

TEST_CASE("match primitives") {
    auto types = TypeSet::parse("bool|float|array");
    CHECK(types.match(true));
    CHECK(types.match(2.5));
    CHECK(types.match(Array { 1 }));
    CHECK_FALSE(types.match(1));
    CHECK_FALSE(types.match("1"));
    CHECK_FALSE(types.match(nullptr));
}

TEST_CASE("match pseudotypes") {
    auto scalar = TypeSet::parse("scalar");
    CHECK(scalar.match(true));
    CHECK(scalar.match(1));
    CHECK(scalar.match(1.5));
    CHECK(scalar.match("s"));
    CHECK_FALSE(scalar.match(nullptr));
    CHECK_FALSE(scalar.match(Array {}));

    auto number = TypeSet::parse("number");
    CHECK(number.match(1));
    CHECK(number.match(1.5));
    CHECK_FALSE(number.match("1"));

    auto uint = TypeSet::parse("uint");
    CHECK(uint.match(0));
    CHECK(uint.match(7));
    CHECK_FALSE(uint.match(-1));
    CHECK_FALSE(uint.match(1.0));
}

TEST_CASE("match nominal types") {
    auto dates = TypeSet::parse("DateTime");
    CHECK(dates.match(makeObject<DateTime>(2024, 1, 1)));
    CHECK(dates.match(makeObject<Birthday>(1990, 4, 1)));
    CHECK_FALSE(dates.match(makeObject<Location>(0.0, 0.0)));
    CHECK_FALSE(dates.match("DateTime"));

    CHECK(TypeSet::parse("Loggable").match(makeObject<Birthday>()));
    CHECK(TypeSet::parse("Stringable").match(makeObject<Location>()));
    CHECK(TypeSet::parse("object").match(makeObject<Location>()));
    CHECK_FALSE(TypeSet::parse("object").match(Array {}));
}

TEST_CASE("validate") {
    auto types = TypeSet::parse("int");
    CHECK_NOTHROW(types.validate(1));
    CHECK_THROWS_AS(types.validate("one"), TypeMismatch);
    CHECK_THROWS_WITH_AS(types.validate(1.5, "key"), doctest::Contains("key"), TypeMismatch);
}

TEST_CASE("validate is deterministic") {
    auto types = TypeSet::parse("?uint|string");
    for (auto const& value : { Value(1), Value(-1), Value("x"), Value(nullptr), Value(1.5) })
        CHECK(types.match(value) == types.match(value));

    CHECK(types.toString() == "uint|string|null");
}

TEST_CASE("infer") {
    auto types = TypeSet::infer(std::vector<Value> { 1, "x", nullptr });
    CHECK(types.containsOnly("int", "string", "null"));
    CHECK(types.nullOk());

    CHECK(TypeSet::infer(std::vector<Value> {}).anyOk());
    CHECK(TypeSet::infer(std::vector<int> { 1, 2, 3 }).containsOnly("int"));
    CHECK(TypeSet::infer(std::vector<Value> { 1, 2.0 }).containsOnly("int", "float"));
    CHECK(TypeSet::infer(std::vector<Value> { makeObject<Birthday>() }).containsOnly("Birthday"));
}

TEST_CASE("contains queries") {
    auto types = TypeSet::parse("int|string|null");
    CHECK(types.contains("int"));
    CHECK_FALSE(types.contains("float"));
    CHECK(types.containsAll("int", "null"));
    CHECK_FALSE(types.containsAll("int", "float"));
    CHECK(types.containsAny("float", "string"));
    CHECK_FALSE(types.containsAny("float", "bool"));
    CHECK_FALSE(types.containsOnly("int", "string"));
    CHECK_FALSE(types.containsOnly("int", "string", "null", "bool"));
}

TEST_CASE("default of a single token is its zero value") {
    CHECK(TypeSet::parse("int").deriveDefault() == Value(0));
    CHECK(TypeSet::parse("uint").deriveDefault() == Value(0));
    CHECK(TypeSet::parse("number").deriveDefault() == Value(0));
    CHECK(TypeSet::parse("scalar").deriveDefault() == Value(0));
    CHECK(TypeSet::parse("float").deriveDefault() == Value(0.0));
    CHECK(TypeSet::parse("string").deriveDefault() == Value(""));
    CHECK(TypeSet::parse("bool").deriveDefault() == Value(false));
    CHECK(TypeSet::parse("array").deriveDefault() == Value(Array {}));
    CHECK(TypeSet::parse("null").deriveDefault() == Value(nullptr));

    for (auto token : { "int", "uint", "number", "scalar", "float", "string", "bool", "array", "null" })
    {
        CAPTURE(token);
        auto types = TypeSet::parse(token);
        CHECK(types.match(types.deriveDefault()));
    }
}

TEST_CASE("default falls back to null") {
    CHECK(TypeSet::parse("?int").deriveDefault() == Value(nullptr));
    CHECK(TypeSet::parse("?DateTime").deriveDefault() == Value(nullptr));
    CHECK(TypeSet::any().deriveDefault() == Value(nullptr));
}

TEST_CASE("unrepresentable default") {
    CHECK_THROWS_AS(TypeSet::parse("int|string").deriveDefault(), Unrepresentable);
    CHECK_THROWS_AS(TypeSet::parse("DateTime").deriveDefault(), Unrepresentable);
    CHECK_THROWS_AS(TypeSet::parse("object").deriveDefault(), Unrepresentable);
    CHECK_FALSE(TypeSet::parse("int|string").tryDeriveDefault().has_value());
}

TEST_CASE("unite") {
    auto united = TypeSet::parse("int").unite(TypeSet::parse("?string"));
    CHECK(united.containsOnly("int", "string", "null"));
    CHECK(TypeSet::parse("int").unite(TypeSet::parse("number")).containsOnly("number"));
    CHECK(TypeSet::parse("int").unite(TypeSet::any()).anyOk());
}

} // TEST_SUITE("TypeSet")

//=============================================================================
// Canonicalization tests
//=============================================================================

TEST_SUITE("Canonicalization") {

TEST_CASE("different kinds never collide") {
    auto const i = canonicalize(1);
    auto const s = canonicalize("1");
    auto const b = canonicalize(true);
    auto const f = canonicalize(1.0);

    CHECK(i != s);
    CHECK(s != b);
    CHECK(i != b);
    CHECK(i != f);
    CHECK(canonicalize(0) != canonicalize(false));
    CHECK(canonicalize(0) != canonicalize(nullptr));
    CHECK(canonicalize("") != canonicalize(nullptr));
}

TEST_CASE("equal values canonicalize equal") {
    CHECK(canonicalize(42) == canonicalize(42));
    CHECK(canonicalize("abc") == canonicalize(std::string("abc")));
    CHECK(canonicalize(0.0) == canonicalize(-0.0));
    CHECK(canonicalize(std::nan("1")) == canonicalize(std::nan("2")));
}

TEST_CASE("arrays canonicalize structurally") {
    CHECK(canonicalize(Array { 1, "a", Array { true } }) == canonicalize(Array { 1, "a", Array { true } }));
    CHECK(canonicalize(Array { 1, 2 }) != canonicalize(Array { 2, 1 }));
    CHECK(canonicalize(Array { 1 }) != canonicalize(Array { 1.0 }));
    CHECK(canonicalize(Array { "ab" }) != canonicalize(Array { "a", "b" }));
}

TEST_CASE("objects canonicalize by identity") {
    auto a = makeObject<DateTime>(2024, 1, 1);
    auto b = makeObject<DateTime>(2024, 1, 1);

    CHECK(canonicalize(a) == canonicalize(a));
    CHECK(canonicalize(a) != canonicalize(b));
}

} // TEST_SUITE("Canonicalization")

//=============================================================================
// Store tests
//=============================================================================

TEST_SUITE("Store") {

TEST_CASE("keys of different kinds are distinct") {
    Store store;
    store.set(1, "a");
    store.set("1", "b");
    store.set(true, "c");

    CHECK(store.size() == 3);
    CHECK(store.get(1) == Value("a"));
    CHECK(store.get("1") == Value("b"));
    CHECK(store.get(true) == Value("c"));
    CHECK_FALSE(store.exists(1.0));
}

TEST_CASE("overwrite keeps position and returns previous value") {
    Store store;
    CHECK_FALSE(store.set("x", 1).has_value());
    store.set("y", 2);

    auto previous = store.set("x", 3);
    REQUIRE(previous.has_value());
    CHECK(*previous == Value(1));

    CHECK(store.at(0).key == Value("x"));
    CHECK(store.at(0).value == Value(3));
    CHECK(store.at(1).key == Value("y"));
}

TEST_CASE("remove shifts later entries") {
    Store store;
    for (auto i = 0; i < 5; ++i)
        store.set(i, i * 10);

    CHECK(store.remove(1) == Value(10));
    CHECK(store.size() == 4);
    CHECK(store.position(2) == 1u);
    CHECK(store.position(4) == 3u);
    CHECK_FALSE(store.position(1).has_value());
    CHECK(store.get(4) == Value(40));
}

TEST_CASE("missing keys") {
    Store store;
    CHECK_THROWS_AS(store.get("nope"), KeyNotFound);
    CHECK_THROWS_AS(store.remove("nope"), KeyNotFound);
    CHECK(store.find("nope") == nullptr);
    CHECK_THROWS_AS(store.at(0), IndexOutOfRange);
}

TEST_CASE("exists agrees with iteration") {
    Store store;
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> pick(0, 9);

    for (auto step = 0; step < 200; ++step)
    {
        auto const key = pick(rng);

        auto const removing = step % 3 == 0 && store.exists(key);

        if (removing)
            store.remove(key);
        else
            store.set(key, step);

        CHECK(store.exists(key) == ! removing);

        for (auto k = 0; k < 10; ++k)
        {
            auto const inIteration = std::ranges::any_of(store, [k] (Store::Entry const& e) { return e.key == Value(k); });
            CHECK(store.exists(k) == inIteration);
        }
    }
}

TEST_CASE("composite and object keys") {
    Store store;
    auto object = makeObject<DateTime>(2024, 1, 1);

    store.set(Array { 1, 2 }, "array");
    store.set(object, "object");

    CHECK(store.get(Array { 1, 2 }) == Value("array"));
    CHECK(store.get(object) == Value("object"));
    CHECK_FALSE(store.exists(makeObject<DateTime>(2024, 1, 1)));
    CHECK_FALSE(store.exists(Array { 2, 1 }));
}

TEST_CASE("structured bindings and sort") {
    Store store;
    store.set("b", 2);
    store.set("c", 3);
    store.set("a", 1);

    store.sort([] (Store::Entry const& x, Store::Entry const& y) { return compare(x.key, y.key) < 0; });

    std::string order;
    for (auto const& [key, value] : store)
        order += key.asString();

    CHECK(order == "abc");
    CHECK(store.get("a") == Value(1));
    CHECK(store.position("c") == 2u);
}

TEST_CASE("clear") {
    Store store;
    store.set(1, 1);
    store.clear();
    CHECK(store.empty());
    CHECK_FALSE(store.exists(1));
}

} // TEST_SUITE("Store")

//=============================================================================
// Sequence tests
//=============================================================================

TEST_SUITE("Sequence") {

TEST_CASE("default construction") {
    Sequence s;
    CHECK(s.empty());
    CHECK(s.valueTypes().anyOk());
    CHECK(s.defaultValue() == Value(nullptr));
}

TEST_CASE("nullable int gap fill") {
    Sequence s("?int");
    CHECK(s.defaultValue() == Value(nullptr));

    s.append(5);
    s.set(2, nullptr);

    CHECK(s.size() == 3);
    CHECK(s[0] == Value(5));
    CHECK(s[1] == Value(nullptr));
    CHECK(s[2] == Value(nullptr));
}

TEST_CASE("inferred int default and gap fill") {
    Sequence s(Constraint::infer(), std::nullopt, { 1, 2 });
    CHECK(s.valueTypes().containsOnly("int"));
    CHECK(s.defaultValue() == Value(0));

    s.set(5, 9);

    CHECK(s.size() == 6);
    CHECK(s[2] == Value(0));
    CHECK(s[3] == Value(0));
    CHECK(s[4] == Value(0));
    CHECK(s[5] == Value(9));
}

TEST_CASE("inferred from three ints") {
    Sequence s(Constraint::infer(), std::nullopt, std::vector<int> { 1, 2, 3 });
    CHECK(s.valueTypes().containsOnly("int"));
    CHECK(s.defaultValue() == Value(0));
}

TEST_CASE("batched append stops at first invalid value") {
    Sequence s("int");
    CHECK_THROWS_AS(s.append(3, 4, "invalid", 5), TypeMismatch);
    CHECK(s.size() == 2);
    CHECK(s[0] == Value(3));
    CHECK(s[1] == Value(4));
}

TEST_CASE("batched import stops at first invalid value") {
    Sequence s("int");
    CHECK_THROWS_AS(s.import(std::vector<Value> { 3, 4, "invalid", 5 }), TypeMismatch);
    CHECK(s.size() == 2);
}

TEST_CASE("import from itself doubles the contents") {
    Sequence s("int", std::nullopt, { 1, 2, 3 });
    s.import(s);
    CHECK(s.equals(Sequence("int", std::nullopt, { 1, 2, 3, 1, 2, 3 })));

    Sequence single("int", std::nullopt, { 7 });
    single.import(single).import(single);
    CHECK(single.equals(Sequence("int", std::nullopt, { 7, 7, 7, 7 })));
}

TEST_CASE("explicit default") {
    Sequence s("int", 7);
    s.set(2, 1);
    CHECK(s[0] == Value(7));

    CHECK_THROWS_AS(Sequence("int", "seven"), TypeMismatch);
    CHECK_THROWS_AS(Sequence("int|string"), Unrepresentable);
    CHECK_NOTHROW(Sequence("int|string", ""));
    CHECK_THROWS_AS(Sequence("in t"), ConstraintSyntaxError);
}

TEST_CASE("object defaults are cloned") {
    auto defaultDate = makeObject<DateTime>(2000, 1, 1);
    Sequence s("DateTime", defaultDate);

    s.set(2, makeObject<DateTime>(2024, 1, 1));

    CHECK(s[0].isObject());
    CHECK_FALSE(s[0] == s[1]);
    CHECK_FALSE(s[0] == defaultDate);
    CHECK(s[0].as<DateTime>()->operator()().year == 2000);

    s.unset(2);
    CHECK_FALSE(s[2] == defaultDate);
    CHECK(s[2].as<DateTime>()->operator()().year == 2000);
}

TEST_CASE("nominal constraint accepts subclasses") {
    Sequence s("DateTime", makeObject<DateTime>());
    CHECK_NOTHROW(s.append(makeObject<Birthday>(1990, 4, 1)));
    CHECK_THROWS_AS(s.append(makeObject<Location>()), TypeMismatch);
}

TEST_CASE("range") {
    auto ints = Sequence::range(1, 5);
    CHECK(ints.valueTypes().containsOnly("int"));
    CHECK(ints.equals(Sequence("int", std::nullopt, { 1, 2, 3, 4, 5 })));

    CHECK(Sequence::range(10, 1, -3).equals(Sequence("int", std::nullopt, { 10, 7, 4, 1 })));
    CHECK(Sequence::range(3, 3).size() == 1);

    auto floats = Sequence::range(0, 1, 0.25);
    CHECK(floats.valueTypes().containsOnly("float"));
    CHECK(floats.size() == 5);
    CHECK(floats.last() == Value(1.0));

    CHECK_THROWS_AS(Sequence::range(1, 5, 0), InvalidArgument);
    CHECK_THROWS_AS(Sequence::range(1, 5, -1), InvalidArgument);
    CHECK_THROWS_AS(Sequence::range(5, 1, 1), InvalidArgument);
    CHECK_THROWS_AS(Sequence::range("a", 5), TypeMismatch);
}

TEST_CASE("range rejects non-finite arguments") {
    auto const nan = std::numeric_limits<double>::quiet_NaN();
    auto const inf = std::numeric_limits<double>::infinity();

    CHECK_THROWS_AS(Sequence::range(0.0, 1.0, nan), InvalidArgument);
    CHECK_THROWS_AS(Sequence::range(nan, 1.0), InvalidArgument);
    CHECK_THROWS_AS(Sequence::range(0.0, nan), InvalidArgument);
    CHECK_THROWS_AS(Sequence::range(0.0, 1.0, inf), InvalidArgument);
    CHECK_THROWS_AS(Sequence::range(0.0, inf), InvalidArgument);
    CHECK_THROWS_AS(Sequence::range(-inf, 0.0), InvalidArgument);

    auto const single = Sequence::range(0.5, 0.75, 1.0);
    CHECK(single.equals(Sequence("float", std::nullopt, { 0.5 })));
}

TEST_CASE("range at the limits of int") {
    auto const min = std::numeric_limits<std::int64_t>::min();
    auto const max = std::numeric_limits<std::int64_t>::max();

    CHECK(Sequence::range(max - 2, max, 2).equals(Sequence("int", std::nullopt, { max - 2, max })));
    CHECK(Sequence::range(min, min + 1, max).equals(Sequence("int", std::nullopt, { min })));
    CHECK(Sequence::range(max, max - 1, -2).equals(Sequence("int", std::nullopt, { max })));
    CHECK(Sequence::range(min + 2, min, -2).equals(Sequence("int", std::nullopt, { min + 2, min })));
    CHECK(Sequence::range(min, max, max).equals(Sequence("int", std::nullopt, { min, std::int64_t { -1 }, max - 1 })));
}

TEST_CASE("prepend and insert") {
    Sequence s("int", std::nullopt, { 3 });
    s.prepend(1, 2);
    CHECK(s.equals(Sequence("int", std::nullopt, { 1, 2, 3 })));

    s.insert(1, 9);
    CHECK(s.equals(Sequence("int", std::nullopt, { 1, 9, 2, 3 })));

    s.insert(6, 7);
    CHECK(s.equals(Sequence("int", std::nullopt, { 1, 9, 2, 3, 0, 0, 7 })));

    CHECK_THROWS_AS(s.insert(-1, 1), IndexOutOfRange);
    CHECK_THROWS_AS(s.insert(0, "x"), TypeMismatch);
}

TEST_CASE("fill") {
    Sequence s("string");
    s.fill(1, 2, "x");
    CHECK(s.equals(Sequence("string", std::nullopt, { "", "x", "x" })));
}

TEST_CASE("removal") {
    Sequence s("int", std::nullopt, { 1, 2, 1, 3, 1 });

    CHECK(s.removeByValue(1) == 3);
    CHECK(s.equals(Sequence("int", std::nullopt, { 2, 3 })));

    s.append(4, 5);
    CHECK(s.removeByIndex(1) == Value(3));
    CHECK(s.removeFirst() == Value(2));
    CHECK(s.removeLast() == Value(5));
    CHECK(s.size() == 1);

    CHECK_THROWS_AS(s.removeByIndex(1), IndexOutOfRange);
    s.clear();
    CHECK_THROWS_AS(s.removeFirst(), Underflow);
    CHECK_THROWS_AS(s.removeLast(), Underflow);
}

TEST_CASE("access") {
    Sequence s("int", std::nullopt, { 10, 20, 30 });

    CHECK(s.first() == Value(10));
    CHECK(s.last() == Value(30));
    CHECK(s.get(1) == Value(20));
    CHECK(s.indexExists(2));
    CHECK_FALSE(s.indexExists(3));
    CHECK_FALSE(s.indexExists(-1));
    CHECK_THROWS_AS(s[3], IndexOutOfRange);
    CHECK_THROWS_AS(s[-1], IndexOutOfRange);

    CHECK(s.search(20) == 1u);
    CHECK_FALSE(s.search(20.0).has_value());
    CHECK(s.contains(30));
    CHECK_FALSE(s.contains("30"));

    auto found = s.find([] (Value const& v) { return v.asInt() > 15; });
    REQUIRE(found.has_value());
    CHECK(*found == Value(20));

    CHECK_THROWS_AS(Sequence("int").first(), IndexOutOfRange);
}

TEST_CASE("slice") {
    Sequence s("int", std::nullopt, { 0, 1, 2, 3, 4 });

    CHECK(s.slice(1, 2).equals(Sequence("int", std::nullopt, { 1, 2 })));
    CHECK(s.slice(3).equals(Sequence("int", std::nullopt, { 3, 4 })));
    CHECK(s.slice(-2).equals(Sequence("int", std::nullopt, { 3, 4 })));
    CHECK(s.slice(1, -1).equals(Sequence("int", std::nullopt, { 1, 2, 3 })));
    CHECK(s.slice(10).empty());
}

TEST_CASE("sorting") {
    Sequence s("number", std::nullopt, { 3, 1.5, 2 });

    CHECK(s.sort().equals(Sequence("number", std::nullopt, { 1.5, 2, 3 })));
    CHECK(s.sortReverse().equals(Sequence("number", std::nullopt, { 3, 2, 1.5 })));
    CHECK(s.equals(Sequence("number", std::nullopt, { 3, 1.5, 2 })));

    auto byDistance = s.sortBy([] (Value const& a, Value const& b) { return std::abs(a.toNumber() - 2) < std::abs(b.toNumber() - 2); });
    CHECK(byDistance.first() == Value(2));

    CHECK_THROWS_AS(Sequence(nullptr, std::nullopt, { 1, "a" }).sort(), TypeMismatch);
}

TEST_CASE("transformations keep TypeSet and default") {
    Sequence s("int", -1, { 1, 2, 3, 2, 1 });

    auto odd = s.filter([] (Value const& v) { return v.asInt() % 2 == 1; });
    CHECK(odd.equals(Sequence("int", std::nullopt, { 1, 3, 1 })));
    CHECK(odd.defaultValue() == Value(-1));
    CHECK(odd.valueTypes() == s.valueTypes());

    CHECK(s.reverse().equals(Sequence("int", std::nullopt, { 1, 2, 3, 2, 1 })));
    CHECK(s.unique().equals(Sequence("int", std::nullopt, { 1, 2, 3 })));
    CHECK(s.merge(Sequence("int", std::nullopt, { 9 })).size() == 6);
    CHECK_THROWS_AS(s.merge(Sequence(nullptr, std::nullopt, { "x" })), TypeMismatch);

    auto chunks = s.chunk(2);
    REQUIRE(chunks.size() == 3);
    CHECK(chunks[2].equals(Sequence("int", std::nullopt, { 1 })));
    CHECK_THROWS_AS(s.chunk(0), InvalidArgument);
}

TEST_CASE("map infers a new TypeSet") {
    Sequence s("int", std::nullopt, { 1, 2 });
    auto strings = s.map([] (Value const& v) { return Value(std::to_string(v.asInt())); });

    CHECK(strings.valueTypes().containsOnly("string"));
    CHECK(strings.equals(Sequence("string", std::nullopt, { "1", "2" })));
}

TEST_CASE("aggregation") {
    Sequence ints("int", std::nullopt, { 1, 2, 3, 4 });
    CHECK(ints.sum() == Value(10));
    CHECK(ints.product() == Value(24));
    CHECK(ints.min() == Value(1));
    CHECK(ints.max() == Value(4));
    CHECK(ints.average() == doctest::Approx(2.5));
    CHECK(ints.reduce([] (Value acc, Value const& v) { return Value(acc.asInt() * 10 + v.asInt()); }, 0) == Value(1234));

    Sequence mixed("number", std::nullopt, { 1, 0.5 });
    CHECK(mixed.sum() == Value(1.5));
    CHECK(mixed.product() == Value(0.5));

    Sequence empty("int");
    CHECK(empty.sum() == Value(0));
    CHECK(empty.product() == Value(1));
    CHECK_THROWS_AS(empty.min(), Underflow);
    CHECK_THROWS_AS(empty.max(), Underflow);
    CHECK_THROWS_AS(empty.average(), Underflow);

    CHECK_THROWS_AS(Sequence("string", std::nullopt, { "a" }).sum(), TypeMismatch);
}

TEST_CASE("join") {
    CHECK(Sequence(nullptr, std::nullopt, { "a", 1, nullptr, 2.5, true }).join(",") == "a,1,,2.5,true");
    CHECK(Sequence("int", std::nullopt, { 1, 2, 3 }).join() == "123");
    CHECK_THROWS_AS(Sequence(nullptr, std::nullopt, { Array {} }).join(), TypeMismatch);
}

TEST_CASE("random selection") {
    std::mt19937 rng(1234);
    Sequence s("int", std::nullopt, { 1, 2, 3, 4, 5 });

    auto chosen = s.chooseRandom(3, rng);
    CHECK(chosen.size() == 3);
    CHECK(std::ranges::all_of(chosen, [&s] (Value const& v) { return s.contains(v); }));
    CHECK(s.size() == 5);

    auto removed = s.removeRandom(2, rng);
    CHECK(removed.size() == 2);
    CHECK(s.size() == 3);
    CHECK(std::ranges::none_of(removed, [&s] (Value const& v) { return s.contains(v); }));

    CHECK_THROWS_AS(s.chooseRandom(0, rng), IndexOutOfRange);
    CHECK_THROWS_AS(s.chooseRandom(4, rng), IndexOutOfRange);
    CHECK_THROWS_AS(Sequence("int").removeRandom(1, rng), IndexOutOfRange);
}

TEST_CASE("conversion") {
    Sequence s("string", std::nullopt, { "a", "b", "a" });

    auto counts = s.countValues();
    CHECK(counts.size() == 2);
    CHECK(counts["a"] == Value(2));
    CHECK(counts["b"] == Value(1));
    CHECK(counts.valueTypes().containsOnly("uint"));

    auto dictionary = s.toDictionary();
    CHECK(dictionary.size() == 3);
    CHECK(dictionary[2] == Value("a"));
    CHECK(dictionary.keyTypes().containsOnly("int"));

    auto set = s.toSet();
    CHECK(set.size() == 2);
    CHECK(set.valueTypes().containsOnly("string"));
}

TEST_CASE("equality ignores TypeSet and default") {
    Sequence a("int", 0, { 1, 2 });
    Sequence b(nullptr, std::nullopt, { 1, 2 });

    CHECK(a.equals(b));
    CHECK_FALSE(a.equals(Sequence("int", std::nullopt, { 2, 1 })));
    CHECK_FALSE(a.equals(Set("int", { 1, 2 })));
}

TEST_CASE("collection base") {
    Sequence s("int", std::nullopt, { 2, 4, 6 });

    CHECK(s.count() == 3);
    CHECK(s.all([] (Value const& v) { return v.asInt() % 2 == 0; }));
    CHECK(s.any([] (Value const& v) { return v.asInt() > 5; }));
    CHECK_FALSE(s.any([] (Value const& v) { return v.asInt() > 6; }));
    CHECK(Sequence("int").all([] (Value const&) { return false; }));
    CHECK(s.toString() == "Sequence<int> [2, 4, 6]");
    CHECK(std::format("{}", s) == "Sequence<int> [2, 4, 6]");

    std::int64_t total = 0;
    for (auto const& value : s)
        total += value.asInt();

    CHECK(total == 12);
}

} // TEST_SUITE("Sequence")

//=============================================================================
// Dictionary tests
//=============================================================================

TEST_SUITE("Dictionary") {

TEST_CASE("keys of different kinds stay distinct") {
    Dictionary d;
    d.add(1, "a");
    d.add("1", "b");
    d.add(true, "c");

    CHECK(d.size() == 3);
    CHECK(d[1] == Value("a"));
    CHECK(d["1"] == Value("b"));
    CHECK(d[true] == Value("c"));
    CHECK_FALSE(d.keyExists(1.0));
}

TEST_CASE("construct from pairs") {
    Dictionary d(Constraint::infer(), Constraint::infer(), { { "x", 1 }, { "y", 2.5 } });

    CHECK(d.keyTypes().containsOnly("string"));
    CHECK(d.valueTypes().containsOnly("int", "float"));
    CHECK(d["y"] == Value(2.5));

    std::vector<std::pair<std::string, int>> source { { "a", 1 } };
    Dictionary fromRange("string", "int", source);
    CHECK(fromRange["a"] == Value(1));

    CHECK_THROWS_AS(Dictionary("string", "int", { { 1, 1 } }), TypeMismatch);
}

TEST_CASE("construct and import from another dictionary") {
    Dictionary source(nullptr, nullptr, { { 1, "a" }, { "1", "b" }, { true, "c" } });

    Dictionary copy(Constraint::infer(), Constraint::infer(), source);
    CHECK(copy.equals(source));
    CHECK(copy.keyTypes().containsOnly("int", "string", "bool"));
    CHECK(copy.valueTypes().containsOnly("string"));

    Dictionary target("scalar", "string", { { "x", "first" }, { 1, "overwritten" } });
    target.import(source);

    CHECK(target.keys() == std::vector<Value> { "x", 1, "1", true });
    CHECK(target[1] == Value("a"));
    CHECK(target[true] == Value("c"));

    target.import(target);
    CHECK(target.size() == 4);

    Dictionary strict("string", "string");
    CHECK_THROWS_AS(strict.import(source), TypeMismatch);
    CHECK(strict.empty());
}

TEST_CASE("add with a pair object") {
    Dictionary d("string", "int");
    d.add(makeObject<Pair>("k", 5));
    CHECK(d["k"] == Value(5));

    CHECK_THROWS_AS(d.add("just a key"), TypeMismatch);
}

TEST_CASE("add arity") {
    Dictionary d;
    CHECK_THROWS_AS(d.add(), ArgumentArityMismatch);
    CHECK_THROWS_AS(d.add(1, 2, 3), ArgumentArityMismatch);
    CHECK(d.empty());
}

TEST_CASE("key and value validation") {
    Dictionary d("int", "string");
    CHECK_THROWS_AS(d.add("1", "x"), TypeMismatch);
    CHECK_THROWS_AS(d.add(1, 1), TypeMismatch);
    CHECK_THROWS_AS(d.get("1"), TypeMismatch);
    CHECK_THROWS_AS(d.get(1), KeyNotFound);
    CHECK(d.empty());
}

TEST_CASE("overwrite keeps insertion position") {
    Dictionary d;
    d.set("a", 1);
    d.set("b", 2);
    d.set("a", 3);

    CHECK(d.keys() == std::vector<Value> { "a", "b" });
    CHECK(d.values() == std::vector<Value> { 3, 2 });
}

TEST_CASE("removal") {
    Dictionary d(nullptr, "int", { { "a", 1 }, { "b", 2 }, { "c", 1 } });

    CHECK(d.removeByKey("b") == Value(2));
    CHECK_THROWS_AS(d.removeByKey("b"), KeyNotFound);
    CHECK(d.removeByValue(1) == 2);
    CHECK(d.empty());

    d.set("x", 1);
    d.unset("x");
    CHECK_FALSE(d.keyExists("x"));
    CHECK_THROWS_AS(d.unset("x"), KeyNotFound);
    CHECK_THROWS_AS(d.removeByValue("1"), TypeMismatch);
}

TEST_CASE("find and contains") {
    Dictionary d(nullptr, nullptr, { { Array { 1 }, "array" } });

    REQUIRE(d.find(Array { 1 }) != nullptr);
    CHECK(*d.find(Array { 1 }) == Value("array"));
    CHECK(d.find(Array { 2 }) == nullptr);
    CHECK(d.contains("array"));
    CHECK_FALSE(d.contains(Array { 1 }));
}

TEST_CASE("combine") {
    auto d = Dictionary::combine(std::vector<Value> { "a", "b" }, std::vector<Value> { 1, 2 });
    CHECK(d["b"] == Value(2));
    CHECK(d.keyTypes().containsOnly("string"));

    auto untyped = Dictionary::combine(std::vector<Value> { 1 }, std::vector<Value> { 1 }, false);
    CHECK(untyped.keyTypes().anyOk());

    CHECK_THROWS_AS(Dictionary::combine(std::vector<Value> { 1 }, std::vector<Value> {}), InvalidArgument);
    CHECK_THROWS_AS(Dictionary::combine(std::vector<Value> { 1, 1 }, std::vector<Value> { 1, 2 }), InvalidArgument);
}

TEST_CASE("sorting returns a new dictionary") {
    Dictionary d("string", "int", { { "b", 1 }, { "c", 3 }, { "a", 2 } });

    CHECK(d.sortByKey().keys() == std::vector<Value> { "a", "b", "c" });
    CHECK(d.sortByValue().keys() == std::vector<Value> { "b", "a", "c" });
    CHECK(d.keys() == std::vector<Value> { "b", "c", "a" });

    auto descending = d.sort([] (Store::Entry const& x, Store::Entry const& y) { return compare(x.value, y.value) > 0; });
    CHECK(descending.keys() == std::vector<Value> { "c", "a", "b" });
    CHECK(descending["a"] == Value(2));
}

TEST_CASE("flip") {
    Dictionary d("string", "int", { { "a", 1 }, { "b", 2 } });
    auto flipped = d.flip();

    CHECK(flipped[1] == Value("a"));
    CHECK(flipped.keyTypes().containsOnly("int"));
    CHECK(flipped.valueTypes().containsOnly("string"));

    d.set("c", 1);
    CHECK_THROWS_AS(d.flip(), InvalidArgument);
}

TEST_CASE("merge") {
    Dictionary a("string", "int", { { "x", 1 }, { "y", 2 } });
    Dictionary b("int", "string", { { 1, "one" } });
    Dictionary c("string", "int", { { "y", 20 } });

    auto merged = a.merge(b);
    CHECK(merged.size() == 3);
    CHECK(merged.keyTypes().containsOnly("string", "int"));
    CHECK(merged.valueTypes().containsOnly("int", "string"));

    auto overwritten = a.merge(c);
    CHECK(overwritten.keys() == std::vector<Value> { "x", "y" });
    CHECK(overwritten["y"] == Value(20));
}

TEST_CASE("filter") {
    Dictionary d("string", "int", { { "a", 1 }, { "b", 2 }, { "c", 3 } });
    auto filtered = d.filter([] (Value const& key, Value const& value) { return key.asString() != "a" && value.asInt() < 3; });

    CHECK(filtered.keys() == std::vector<Value> { "b" });
    CHECK(filtered.keyTypes() == d.keyTypes());
}

TEST_CASE("toSequence yields pairs") {
    Dictionary d("string", "int", { { "a", 1 } });
    auto pairs = d.toSequence();

    REQUIRE(pairs.size() == 1);
    auto pair = pairs[0].as<Pair>();
    REQUIRE(pair != nullptr);
    CHECK(pair->key() == Value("a"));
    CHECK(pair->value() == Value(1));
    CHECK(pairs.valueTypes().containsOnly("Pair", "null"));
}

TEST_CASE("toArray") {
    Dictionary d(nullptr, nullptr, { { 3, "three" }, { "k", "kay" } });
    auto array = d.toArray();

    CHECK(array.size() == 2);
    CHECK(*array.find(std::int64_t(3)) == Value("three"));
    CHECK(*array.find(std::string("k")) == Value("kay"));

    d.set(1.5, "float key");
    CHECK_THROWS_AS(d.toArray(), TypeMismatch);

    Dictionary objects(nullptr, nullptr, { { makeObject<DateTime>(), 1 } });
    CHECK_THROWS_AS(objects.toArray(), TypeMismatch);
}

TEST_CASE("equality is order sensitive") {
    Dictionary a(nullptr, nullptr, { { "a", 1 }, { "b", 2 } });
    Dictionary b("string", "int", { { "a", 1 }, { "b", 2 } });
    Dictionary c(nullptr, nullptr, { { "b", 2 }, { "a", 1 } });

    CHECK(a.equals(b));
    CHECK_FALSE(a.equals(c));
    CHECK_FALSE(a.equals(Sequence(nullptr, std::nullopt, { 1, 2 })));
}

TEST_CASE("iteration") {
    Dictionary d(nullptr, nullptr, { { 1, "a" }, { "1", "b" } });

    std::vector<Value> keys;
    for (auto const& [key, value] : d)
        keys.push_back(key);

    CHECK(keys == std::vector<Value> { 1, "1" });
    CHECK(d.all([] (Value const& v) { return v.isString(); }));
    CHECK(d.toString() == "Dictionary<mixed, mixed> {1 => \"a\", \"1\" => \"b\"}");
}

} // TEST_SUITE("Dictionary")

//=============================================================================
// Set tests
//=============================================================================

TEST_SUITE("Set") {

TEST_CASE("duplicates are ignored in first-seen order") {
    Set s(Constraint::infer(), { 1, 2, 2, 3, 3, 3 });

    CHECK(s.size() == 3);
    CHECK(std::vector<Value>(s.begin(), s.end()) == std::vector<Value> { 1, 2, 3 });
    CHECK(s.valueTypes().containsOnly("int"));
}

TEST_CASE("strict membership") {
    Set s(nullptr, { 1, "1", true, 1.0 });
    CHECK(s.size() == 4);
    CHECK(s.contains(1));
    CHECK(s.contains("1"));
    CHECK_FALSE(s.contains(2));
}

TEST_CASE("add validates") {
    Set s("int");
    CHECK_THROWS_AS(s.add(1, 2, "x", 3), TypeMismatch);
    CHECK(s.size() == 2);
}

TEST_CASE("remove") {
    Set s("int", { 1, 2 });
    CHECK(s.remove(1));
    CHECK_FALSE(s.remove(1));
    CHECK(s.size() == 1);
}

TEST_CASE("algebra") {
    Set a("int", { 1, 2, 3 });
    Set b("?int", { 3, 4, nullptr });

    auto united = a.unite(b);
    CHECK(std::vector<Value>(united.begin(), united.end()) == std::vector<Value> { 1, 2, 3, 4, nullptr });
    CHECK(united.valueTypes().containsOnly("int", "null"));

    auto common = a.intersect(b);
    CHECK(std::vector<Value>(common.begin(), common.end()) == std::vector<Value> { 3 });

    auto difference = a.diff(b);
    CHECK(std::vector<Value>(difference.begin(), difference.end()) == std::vector<Value> { 1, 2 });
}

TEST_CASE("predicates") {
    Set small("int", { 1, 2 });
    Set big("int", { 2, 1, 3 });
    Set other("int", { 7 });

    CHECK(small.isSubsetOf(big));
    CHECK(small.isProperSubsetOf(big));
    CHECK(big.isSupersetOf(small));
    CHECK(big.isProperSupersetOf(small));
    CHECK(small.isSubsetOf(small));
    CHECK_FALSE(small.isProperSubsetOf(small));
    CHECK(small.isDisjointFrom(other));
    CHECK_FALSE(small.isDisjointFrom(big));
}

TEST_CASE("equality ignores order") {
    CHECK(Set("int", { 1, 2, 3 }).equals(Set(nullptr, { 3, 1, 2 })));
    CHECK_FALSE(Set("int", { 1, 2 }).equals(Set("int", { 1, 2, 3 })));
    CHECK_FALSE(Set("int", { 1 }).equals(Sequence("int", std::nullopt, { 1 })));
}

TEST_CASE("filter and conversion") {
    Set s("int", { 5, 6, 7 });

    auto even = s.filter([] (Value const& v) { return v.asInt() % 2 == 0; });
    CHECK(even.size() == 1);
    CHECK(even.contains(6));

    auto dictionary = s.toDictionary();
    CHECK(dictionary.keyTypes().containsOnly("uint"));
    CHECK(dictionary[2] == Value(7));

    auto sequence = s.toSequence();
    CHECK(sequence.equals(Sequence("int", std::nullopt, { 5, 6, 7 })));
    CHECK_THROWS_AS(Set("int|string", { 1 }).toSequence(), Unrepresentable);
    CHECK(Set("int|string", { 1 }).toSequence("").size() == 1);
}

TEST_CASE("clear and string form") {
    Set s("int", { 1, 2 });
    CHECK(s.toString() == "Set<int> {1, 2}");

    s.clear();
    CHECK(s.empty());
    CHECK(s.valueTypes().containsOnly("int"));
}

} // TEST_SUITE("Set")
