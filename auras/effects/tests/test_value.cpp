#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <auras/effects/value.hpp>
#include <stdexcept>

using namespace auras::effects;
using Catch::Matchers::WithinAbs;

TEST_CASE("Value types", "[effects][value]") {
    REQUIRE(Value().is_null());
    REQUIRE(Value(true).is_bool());
    REQUIRE(Value(3).is_int());
    REQUIRE(Value(2.5).is_float());
    REQUIRE(Value(2.5f).is_float());
    REQUIRE(Value("slow").is_string());
    REQUIRE(Value(FieldMap{{"a", Value(1)}}).is_map());

    SECTION("Int and Float are both numeric") {
        REQUIRE(Value(3).is_numeric());
        REQUIRE(Value(2.5).is_numeric());
        REQUIRE_FALSE(Value(true).is_numeric());
        REQUIRE_FALSE(Value("3").is_numeric());
    }

    SECTION("Type names") {
        REQUIRE(std::string(Value::type_name(Value::Type::Null)) == "null");
        REQUIRE(std::string(Value::type_name(Value(1).type())) == "int");
        REQUIRE(std::string(Value::type_name(Value(FieldMap{}).type())) == "map");
    }
}

TEST_CASE("Value accessors", "[effects][value]") {
    SECTION("Strict accessors throw on type mismatch") {
        REQUIRE(Value(true).as_bool());
        REQUIRE(Value(7).as_int() == 7);
        REQUIRE(Value("x").as_string() == "x");

        REQUIRE_THROWS_AS(Value(1).as_bool(), std::runtime_error);
        REQUIRE_THROWS_AS(Value(1.5).as_int(), std::runtime_error);
        REQUIRE_THROWS_AS(Value("1").as_float(), std::runtime_error);
        REQUIRE_THROWS_AS(Value().as_map(), std::runtime_error);
    }

    SECTION("as_float accepts Int") {
        REQUIRE_THAT(Value(4).as_float(), WithinAbs(4.0, 1e-9));
        REQUIRE_THAT(Value(0.25).as_float(), WithinAbs(0.25, 1e-9));
    }

    SECTION("Lenient getters fall back to the default") {
        REQUIRE(Value().get_bool(true));
        REQUIRE(Value(2.0).get_int(9) == 9);
        REQUIRE_THAT(Value(3).get_float(), WithinAbs(3.0, 1e-9));
        REQUIRE_THAT(Value("x").get_float(1.5), WithinAbs(1.5, 1e-9));
        REQUIRE(Value(1).get_string("none") == "none");
    }
}

TEST_CASE("Value equality and printing", "[effects][value]") {
    REQUIRE(Value(1) == Value(1));
    REQUIRE(Value(1) != Value(1.0));
    REQUIRE(Value("a") != Value("b"));
    REQUIRE(Value() == Value());

    FieldMap a{{"x", Value(1)}, {"y", Value("z")}};
    FieldMap b{{"x", Value(1)}, {"y", Value("z")}};
    REQUIRE(Value(a) == Value(b));

    b.set("x", Value(2));
    REQUIRE(Value(a) != Value(b));

    REQUIRE(Value(true).to_string() == "true");
    REQUIRE(Value(12).to_string() == "12");
    REQUIRE(Value("hi").to_string() == "\"hi\"");
    REQUIRE(Value(a).to_string() == "{x: 1, y: \"z\"}");
}

TEST_CASE("FieldMap", "[effects][value]") {
    FieldMap map;
    REQUIRE(map.empty());

    SECTION("Insertion order is kept") {
        map.set("c", Value(1));
        map.set("a", Value(2));
        map.set("b", Value(3));

        std::vector<std::string> keys;
        for (const auto& [key, value] : map) {
            keys.push_back(key);
        }
        REQUIRE(keys == std::vector<std::string>{"c", "a", "b"});
    }

    SECTION("Setting an existing key replaces in place") {
        map.set("a", Value(1));
        map.set("b", Value(2));
        map.set("a", Value(10));

        REQUIRE(map.size() == 2);
        REQUIRE(map.begin()->first == "a");
        REQUIRE(map.get("a").as_int() == 10);
    }

    SECTION("Missing keys") {
        REQUIRE(map.find("missing") == nullptr);
        REQUIRE(map.get("missing").is_null());
        REQUIRE_FALSE(map.get_bool("missing"));
        REQUIRE_THAT(map.get_float("missing", 2.0), WithinAbs(2.0, 1e-9));
        REQUIRE(map.get_string("missing", "d") == "d");
        REQUIRE_FALSE(map.erase("missing"));
    }

    SECTION("Erase") {
        map.set("a", Value(1));
        REQUIRE(map.erase("a"));
        REQUIRE_FALSE(map.contains("a"));
    }

    SECTION("merge_missing keeps existing values") {
        FieldMap local{{"Duration", Value(2.0)}, {"Power", Value(3)}};
        FieldMap shared{{"Duration", Value(5.0)}, {"Source", Value("trap")}};

        local.merge_missing(shared);
        REQUIRE(local.size() == 3);
        REQUIRE_THAT(local.get_float("Duration"), WithinAbs(2.0, 1e-9));
        REQUIRE(local.get_string("Source") == "trap");
    }

    SECTION("merge_overwrite replaces existing values") {
        FieldMap base{{"Duration", Value(2.0)}};
        base.merge_overwrite(FieldMap{{"Duration", Value(4.0)}, {"Tick", Value(1.0)}});

        REQUIRE_THAT(base.get_float("Duration"), WithinAbs(4.0, 1e-9));
        REQUIRE(base.contains("Tick"));
    }
}
