#include <catch2/catch.hpp>
#include <packmeta/value.hpp>

using namespace packmeta;

TEST_CASE("default value is an empty table", "[value]") {
    Value v;
    REQUIRE(v.is_table());
    REQUIRE(v.as_table()->empty());
    REQUIRE(v.kind() == Value::Kind::Table);
}

TEST_CASE("constructors pick the matching kind", "[value]") {
    REQUIRE(Value("x").is_string());
    REQUIRE(Value(std::string("x")).is_string());
    REQUIRE(Value(3).is_integer());
    REQUIRE(Value(int64_t{3}).is_integer());
    REQUIRE(Value(2.5).is_float());
    REQUIRE(Value(true).is_boolean());
    REQUIRE(Value(Array{}).is_array());
    REQUIRE(Value(Datetime{}).is_datetime());
    REQUIRE(Value("x").is_scalar());
    REQUIRE_FALSE(Value(Array{}).is_scalar());
}

TEST_CASE("kind names", "[value]") {
    REQUIRE(std::string(Value(1).kind_name()) == "integer");
    REQUIRE(std::string(Value::kind_name(Value::Kind::Datetime)) == "datetime");
    REQUIRE(std::string(Value(Array{}).kind_name()) == "array");
}

TEST_CASE("typed accessors return null for other kinds", "[value]") {
    Value v("text");
    REQUIRE(v.as_string() != nullptr);
    REQUIRE(*v.as_string() == "text");
    REQUIRE(v.as_integer() == nullptr);
    REQUIRE(v.as_table() == nullptr);
    REQUIRE(v.as_array() == nullptr);
}

TEST_CASE("table keys stay unique", "[value]") {
    Table t;
    t.insert_or_assign("a", Value(1));
    t.insert_or_assign("b", Value(2));
    t.insert_or_assign("a", Value("replaced"));

    REQUIRE(t.size() == 2);
    REQUIRE(t.contains("a"));
    REQUIRE(*t.find("a")->as_string() == "replaced");
    REQUIRE(t.find("zzz") == nullptr);
}

TEST_CASE("table remove moves the entry out", "[value]") {
    Table t;
    t.insert_or_assign("keep", Value(1));
    t.insert_or_assign("take", Value::make_array({Value("x"), Value("y")}));

    auto taken = t.remove("take");
    REQUIRE(taken.has_value());
    REQUIRE(taken->as_array()->size() == 2);
    REQUIRE(t.size() == 1);
    REQUIRE_FALSE(t.contains("take"));
    REQUIRE_FALSE(t.remove("take").has_value());
}

TEST_CASE("table equality ignores key order", "[value]") {
    Value a = Value::make_table({{"x", Value(1)}, {"y", Value("two")}});
    Value b = Value::make_table({{"y", Value("two")}, {"x", Value(1)}});
    Value c = Value::make_table({{"x", Value(1)}});
    REQUIRE(a == b);
    REQUIRE(a != c);
}

TEST_CASE("values of different kinds are unequal", "[value]") {
    REQUIRE(Value(1) != Value(1.0));
    REQUIRE(Value("1") != Value(1));
    REQUIRE(Value::make_array({Value(1)}) == Value::make_array({Value(1)}));
}

TEST_CASE("dump renders inline TOML", "[value]") {
    Value v = Value::make_table({
        {"files", Value::make_array({Value("README.md"), Value("LICENSE")})},
        {"count", Value(2)},
        {"ratio", Value(0.5)},
        {"on", Value(true)},
        {"odd key", Value("a\"b")},
    });
    REQUIRE(v.dump() ==
        "{ files = [\"README.md\", \"LICENSE\"], count = 2, ratio = 0.5, on = true, "
        "\"odd key\" = \"a\\\"b\" }");
    REQUIRE(Value().dump() == "{}");
    REQUIRE(Value(3.0).dump() == "3.0");
}

TEST_CASE("datetime formatting covers all four flavours", "[value]") {
    Datetime date;
    date.date = Datetime::Date{2024, 3, 9};
    REQUIRE(date.to_string() == "2024-03-09");

    Datetime time;
    time.time = Datetime::Time{7, 5, 0, 500000000};
    REQUIRE(time.to_string() == "07:05:00.5");

    Datetime local = date;
    local.time = Datetime::Time{23, 59, 58, 0};
    REQUIRE(local.to_string() == "2024-03-09T23:59:58");

    Datetime utc = local;
    utc.offset_minutes = 0;
    REQUIRE(utc.to_string() == "2024-03-09T23:59:58Z");

    Datetime offset = local;
    offset.offset_minutes = -330;
    REQUIRE(offset.to_string() == "2024-03-09T23:59:58-05:30");

    REQUIRE(utc != offset);
    REQUIRE(utc == utc);
}
