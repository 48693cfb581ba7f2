#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <auras/effects/effect_definition.hpp>
#include <auras/effects/errors.hpp>

using namespace auras::effects;
using Catch::Matchers::WithinAbs;

namespace {

EffectInstance make_instance(FieldMap fields) {
    EffectInstance instance;
    instance.effect_id = "test";
    instance.fields = std::move(fields);
    return instance;
}

} // anonymous namespace

TEST_CASE("EffectRegistry registration", "[effects][registry]") {
    EffectRegistry registry;

    effect().id("Stunned").default_value(Value(false)).reduce(reducers::any()).register_effect(registry);

    SECTION("Lookup") {
        REQUIRE(registry.exists("Stunned"));
        REQUIRE(registry.size() == 1);

        const EffectDefinition& def = registry.get("Stunned");
        REQUIRE(def.effect_id == "Stunned");
        REQUIRE(def.default_value == Value(false));
        REQUIRE(def.reducer != nullptr);
        REQUIRE(def.applier == nullptr);

        REQUIRE(registry.find("Stunned") == &def);
    }

    SECTION("Duplicate id") {
        REQUIRE_THROWS_AS(
            effect().id("Stunned").reduce(reducers::any()).register_effect(registry),
            DuplicateRegistrationError);
        REQUIRE(registry.size() == 1);
    }

    SECTION("Unknown id") {
        REQUIRE_FALSE(registry.exists("Rooted"));
        REQUIRE(registry.find("Rooted") == nullptr);
        REQUIRE_THROWS_AS(registry.get("Rooted"), UnknownEffectError);
        REQUIRE_THROWS_AS(registry.get("Rooted"), NotFoundError);

        try {
            registry.get("Rooted");
        } catch (const UnknownEffectError& e) {
            REQUIRE(e.id() == "Rooted");
        }
    }

    SECTION("Incomplete definitions are rejected") {
        REQUIRE_THROWS_AS(effect().reduce(reducers::any()).register_effect(registry), AuraError);
        REQUIRE_THROWS_AS(effect().id("NoReducer").register_effect(registry), AuraError);
        REQUIRE_FALSE(registry.exists("NoReducer"));
    }

    SECTION("Ids are listed sorted") {
        effect().id("Burning").reduce(reducers::any()).register_effect(registry);
        effect().id("Slowed").reduce(reducers::any()).register_effect(registry);

        REQUIRE(registry.get_all_effect_ids() == std::vector<std::string>{"Burning", "Slowed", "Stunned"});
    }
}

TEST_CASE("EffectBuilder", "[effects][registry]") {
    int applied = 0;
    EffectDefinition def = effect()
        .id("Speed")
        .default_value(Value(1.0))
        .reduce([](const Value& acc, const EffectInstance& instance) {
            return Value(acc.get_float() * instance.get_float("Multiplier", 1.0));
        })
        .apply([&applied](auras::ObjectHandle, const Value&) { applied++; })
        .build();

    REQUIRE(def.effect_id == "Speed");
    REQUIRE(def.applier != nullptr);

    Value result = def.reducer->reduce(def.default_value, make_instance({{"Multiplier", Value(1.5)}}));
    REQUIRE_THAT(result.as_float(), WithinAbs(1.5, 1e-9));

    def.applier->apply(auras::NullObject, result);
    REQUIRE(applied == 1);
}

TEST_CASE("Stock reducers", "[effects][registry]") {
    auto a = make_instance({{"Amount", Value(3)}, {"Tag", Value("fire")}});
    auto b = make_instance({{"Amount", Value(5.5)}});
    auto c = make_instance({{"Tag", Value("ice")}});

    auto fold = [&](const std::shared_ptr<const Reducer>& reducer, Value seed) {
        for (const EffectInstance* instance : {&a, &b, &c}) {
            seed = reducer->reduce(seed, *instance);
        }
        return seed;
    };

    SECTION("any") {
        REQUIRE(fold(reducers::any(), Value(false)) == Value(true));
    }

    SECTION("sum treats a missing field as zero") {
        REQUIRE_THAT(fold(reducers::sum("Amount"), Value(0)).as_float(), WithinAbs(8.5, 1e-9));
    }

    SECTION("sum from a null seed starts at the first instance") {
        REQUIRE_THAT(fold(reducers::sum("Amount"), Value()).as_float(), WithinAbs(8.5, 1e-9));
    }

    SECTION("max and min") {
        REQUIRE_THAT(fold(reducers::max("Amount"), Value()).as_float(), WithinAbs(5.5, 1e-9));
        REQUIRE_THAT(fold(reducers::min("Amount"), Value()).as_float(), WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(fold(reducers::max("Amount"), Value(10)).as_float(), WithinAbs(10.0, 1e-9));
    }

    SECTION("count") {
        REQUIRE(fold(reducers::count(), Value(0)) == Value(int64_t{3}));
    }

    SECTION("last keeps the latest instance carrying the field") {
        REQUIRE(fold(reducers::last("Tag"), Value("none")) == Value("ice"));
        REQUIRE(fold(reducers::last("Missing"), Value("none")) == Value("none"));
    }
}
