#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <auras/effects/effect_calculator.hpp>
#include <entt/entity/registry.hpp>
#include <stdexcept>

using namespace auras;
using namespace auras::effects;
using Catch::Matchers::WithinAbs;

namespace {

EffectInstance make_instance(const std::string& tag, double amount) {
    EffectInstance instance;
    instance.effect_id = "Trail";
    instance.fields.set("Tag", Value(tag));
    instance.fields.set("Amount", Value(amount));
    return instance;
}

// Concatenates tags, so the result exposes the fold order
EffectDefinition trail_effect() {
    return effect()
        .id("Trail")
        .default_value(Value(""))
        .reduce([](const Value& acc, const EffectInstance& instance) {
            return Value(acc.get_string() + instance.get_string("Tag"));
        })
        .build();
}

} // anonymous namespace

TEST_CASE("EffectCalculator fold", "[effects][calculator]") {
    EffectDefinition trail = trail_effect();

    EffectInstance a = make_instance("A", 1.0);
    EffectInstance b = make_instance("B", 2.0);
    EffectInstance c = make_instance("C", 4.0);
    EffectCalculator::InstanceList instances{&a, &b, &c};

    SECTION("Empty list yields the default") {
        REQUIRE(EffectCalculator::fold(trail, {}) == Value(""));
    }

    SECTION("Instances fold in list order") {
        REQUIRE(EffectCalculator::fold(trail, instances) == Value("ABC"));
    }

    SECTION("Excluded instances are skipped") {
        EffectCalculator::ExcludedSet excluded{&b};
        REQUIRE(EffectCalculator::fold(trail, instances, &excluded) == Value("AC"));
        REQUIRE(EffectCalculator::count_contributing(instances, &excluded) == 2);
    }

    SECTION("Excluding everything yields the default") {
        EffectCalculator::ExcludedSet excluded{&a, &b, &c};
        REQUIRE(EffectCalculator::fold(trail, instances, &excluded) == Value(""));
        REQUIRE(EffectCalculator::count_contributing(instances, &excluded) == 0);
    }

    SECTION("Stock sum reducer") {
        EffectDefinition total = effect().id("Total").default_value(Value(0.0))
            .reduce(reducers::sum("Amount")).build();
        REQUIRE_THAT(EffectCalculator::fold(total, instances).as_float(), WithinAbs(7.0, 1e-9));
    }
}

TEST_CASE("EffectCalculator recompute", "[effects][calculator]") {
    entt::registry world;
    ObjectHandle object = world.create();

    EffectInstance a = make_instance("A", 1.0);
    EffectInstance b = make_instance("B", 2.0);

    SECTION("Applier is called once with the folded value") {
        std::vector<std::pair<ObjectHandle, Value>> calls;
        EffectDefinition trail = trail_effect();
        trail.applier = make_applier([&calls](ObjectHandle target, const Value& value) {
            calls.emplace_back(target, value);
        });

        Value result = EffectCalculator::recompute(object, trail, {&a, &b});

        REQUIRE(result == Value("AB"));
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0].first == object);
        REQUIRE(calls[0].second == Value("AB"));
    }

    SECTION("Query-only effects compute without applying") {
        EffectDefinition trail = trail_effect();
        REQUIRE(EffectCalculator::recompute(object, trail, {&a}) == Value("A"));
    }

    SECTION("Reducer exceptions propagate") {
        EffectDefinition broken = effect().id("Broken")
            .reduce([](const Value&, const EffectInstance&) -> Value {
                throw std::logic_error("bad reducer");
            })
            .build();

        REQUIRE_THROWS_AS(EffectCalculator::recompute(object, broken, {&a}), std::logic_error);
    }
}
