#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <auras/effects/lifecycle_scheduler.hpp>
#include <auras/core/timer.hpp>
#include <entt/entity/registry.hpp>
#include <stdexcept>

using namespace auras;
using namespace auras::effects;
using Catch::Matchers::WithinAbs;

namespace {

AuraInstance make_aura(ObjectHandle object, std::vector<std::pair<std::string, FieldMap>> effects) {
    AuraInstance aura;
    aura.id = core::UUID::generate();
    aura.aura_id = "Test";
    aura.object = object;

    for (auto& [effect_id, fields] : effects) {
        EffectInstance instance;
        instance.aura_instance_id = aura.id;
        instance.effect_id = effect_id;
        instance.fields = std::move(fields);
        aura.effect_instances.push_back(std::move(instance));
    }
    return aura;
}

} // anonymous namespace

TEST_CASE("LifecycleScheduler arming", "[effects][lifecycle]") {
    entt::registry world;
    ObjectHandle object = world.create();
    core::TimerManager timers;
    LifecycleScheduler lifecycle(timers, 0.25f);

    SECTION("One entry per positive Duration and Tick") {
        AuraInstance aura = make_aura(object, {
            {"Stunned", {{"Duration", Value(1.0)}}},
            {"Burning", {{"Duration", Value(2.0)}, {"Tick", Value(0.5)}}},
            {"Marked", {}}
        });

        REQUIRE(lifecycle.arm(aura) == 3);
        REQUIRE(lifecycle.entry_count() == 3);
        REQUIRE(lifecycle.armed_count() == 3);
        REQUIRE(timers.active_count() == 3);

        auto entries = lifecycle.entries_for(aura.id);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].kind == TimerKind::Duration);
        REQUIRE(entries[0].effect_id == "Stunned");
        REQUIRE(entries[2].kind == TimerKind::Tick);
        REQUIRE(entries[2].state == TimerState::Armed);
    }

    SECTION("Non-positive values arm nothing") {
        AuraInstance aura = make_aura(object, {
            {"Stunned", {{"Duration", Value(0.0)}, {"Tick", Value(-1.0)}}}
        });

        REQUIRE(lifecycle.arm(aura) == 0);
        REQUIRE(timers.active_count() == 0);
    }

    SECTION("Short ticks are clamped") {
        AuraInstance aura = make_aura(object, {{"Burning", {{"Tick", Value(0.001)}}}});
        lifecycle.arm(aura);

        auto entries = lifecycle.entries_for(aura.id);
        REQUIRE(entries.size() == 1);
        REQUIRE_THAT(entries[0].seconds, WithinAbs(0.25f, 1e-6));
    }
}

TEST_CASE("LifecycleScheduler firing", "[effects][lifecycle]") {
    entt::registry world;
    ObjectHandle object = world.create();
    core::TimerManager timers;
    LifecycleScheduler lifecycle(timers, 0.01f);

    std::vector<core::UUID> expired;
    std::vector<std::string> ticked;
    lifecycle.set_on_expire([&](ObjectHandle target, const core::UUID& id) {
        REQUIRE(target == object);
        expired.push_back(id);
    });
    lifecycle.set_on_tick([&](ObjectHandle, const core::UUID&, const std::string& effect_id) {
        ticked.push_back(effect_id);
    });

    SECTION("Duration fires once and the entry ends") {
        AuraInstance aura = make_aura(object, {{"Stunned", {{"Duration", Value(1.0)}}}});
        lifecycle.arm(aura);

        timers.update(0.5f);
        REQUIRE(expired.empty());

        timers.update(0.5f);
        REQUIRE(expired == std::vector<core::UUID>{aura.id});
        REQUIRE(lifecycle.entry_count() == 0);

        timers.update(5.0f);
        REQUIRE(expired.size() == 1);
    }

    SECTION("Tick repeats and returns to Armed") {
        AuraInstance aura = make_aura(object, {{"Burning", {{"Tick", Value(0.5)}}}});
        lifecycle.arm(aura);

        for (int i = 0; i < 4; ++i) {
            timers.update(0.25f);
        }

        REQUIRE(ticked.size() == 2);
        auto entries = lifecycle.entries_for(aura.id);
        REQUIRE(entries[0].state == TimerState::Armed);
        REQUIRE(entries[0].fire_count == 2);
    }

    SECTION("Cancel stops every timer of the aura") {
        AuraInstance aura = make_aura(object, {
            {"Stunned", {{"Duration", Value(1.0)}}},
            {"Burning", {{"Tick", Value(0.5)}}}
        });
        lifecycle.arm(aura);

        REQUIRE(lifecycle.cancel(aura.id) == 2);
        REQUIRE(lifecycle.entry_count() == 0);
        REQUIRE(timers.active_count() == 0);

        timers.update(5.0f);
        REQUIRE(expired.empty());
        REQUIRE(ticked.empty());

        REQUIRE(lifecycle.cancel(aura.id) == 0);
    }

    SECTION("Cancel from a handler suppresses timers due in the same frame") {
        AuraInstance aura = make_aura(object, {
            {"Stunned", {{"Duration", Value(1.0)}}},
            {"Rooted", {{"Duration", Value(1.0)}}}
        });
        lifecycle.set_on_expire([&](ObjectHandle, const core::UUID& id) {
            expired.push_back(id);
            lifecycle.cancel(id);
        });
        lifecycle.arm(aura);

        timers.update(1.0f);
        REQUIRE(expired.size() == 1);
    }

    SECTION("Other auras keep their timers") {
        AuraInstance first = make_aura(object, {{"Stunned", {{"Duration", Value(1.0)}}}});
        AuraInstance second = make_aura(object, {{"Stunned", {{"Duration", Value(2.0)}}}});
        lifecycle.arm(first);
        lifecycle.arm(second);

        lifecycle.cancel(first.id);
        timers.update(2.0f);
        REQUIRE(expired == std::vector<core::UUID>{second.id});
    }

    SECTION("A throwing handler still settles its entry") {
        lifecycle.set_on_expire([](ObjectHandle, const core::UUID&) {
            throw std::runtime_error("expire failed");
        });
        lifecycle.set_on_tick([](ObjectHandle, const core::UUID&, const std::string&) {
            throw std::runtime_error("tick failed");
        });

        AuraInstance timed = make_aura(object, {{"Stunned", {{"Duration", Value(1.0)}}}});
        AuraInstance ticking = make_aura(object, {{"Burning", {{"Tick", Value(0.5)}}}});
        lifecycle.arm(timed);
        lifecycle.arm(ticking);

        REQUIRE_THROWS(timers.update(1.0f));

        REQUIRE(lifecycle.entries_for(timed.id).empty());
        auto entries = lifecycle.entries_for(ticking.id);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].state == TimerState::Armed);
        REQUIRE(entries[0].fire_count == 2);
        REQUIRE(lifecycle.armed_count() == 1);
    }

    SECTION("Destruction cancels outstanding timers") {
        int fired = 0;
        {
            LifecycleScheduler scoped(timers);
            scoped.set_on_expire([&](ObjectHandle, const core::UUID&) { fired++; });
            scoped.arm(make_aura(object, {{"Stunned", {{"Duration", Value(1.0)}}}}));
            REQUIRE(timers.active_count() == 1);
        }

        REQUIRE(timers.active_count() == 0);
        timers.update(2.0f);
        REQUIRE(fired == 0);
    }
}
