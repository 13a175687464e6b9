#include <doctest/doctest.h>

#include "chronicle/core/Rng.hpp"
#include "chronicle/rules/EffectEngine.hpp"

#include "test_support/fixtures.hpp"

#include <string>
#include <vector>

using namespace chronicle;
using namespace chronicle::rules;

namespace {

EffectDefinition fx(EffectTarget target, std::string property, EffectOperation op, EffectValue value,
                    bool permanent = false)
{
    EffectDefinition e{};
    e.target = target;
    e.property = std::move(property);
    e.operation = op;
    e.value = std::move(value);
    e.permanent = permanent;
    return e;
}

Action targeted(std::string type, std::string player, std::string target, double range = 1.0)
{
    Action a{};
    a.type = std::move(type);
    a.player = std::move(player);
    a.payload.emplace(std::string(payload_key::kTargetUnit), std::move(target));
    a.payload.emplace(std::string(payload_key::kRange), range);
    return a;
}

struct Arena {
    world::UnitRoster roster;
    Rng rng{7};
    EffectEngine engine{rng};

    Arena()
    {
        roster.add(test::make_unit("a", "A", 0, 0, 80.0, "wardens"));
        roster.add(test::make_unit("t", "A", 1, 0, 70.0, "raiders"));
        roster.add(test::make_unit("far", "A", 6, 0, 50.0, "raiders"));
        roster.add(test::make_unit("elsewhere", "B", 0, 0, 50.0, "raiders"));
    }

    world::Unit& unit(const char* id) { return roster.require(id); }
    std::vector<world::Unit*> units() { return roster.units(); }
};

} // namespace

TEST_CASE("EffectEngine: static subtract on the target")
{
    Arena arena;
    Action attack = targeted("attack", "a", "t");
    attack.effects.push_back(fx(EffectTarget::Target, "health", EffectOperation::Subtract, EffectValue::fixed(15)));

    const EffectResult r = arena.engine.execute_action_effect(attack, arena.units());
    CHECK(r.success);
    CHECK(arena.unit("t").number("health") == 55.0);
    CHECK(arena.unit("a").number("health") == 80.0);
}

TEST_CASE("EffectEngine: health and mana clamp to [0, 100], other stats floor at 0")
{
    Arena arena;
    Action a = targeted("surge", "a", "t");
    a.effects.push_back(fx(EffectTarget::Self, "health", EffectOperation::Add, EffectValue::fixed(50)));
    a.effects.push_back(fx(EffectTarget::Self, "mana", EffectOperation::Subtract, EffectValue::fixed(500)));
    a.effects.push_back(fx(EffectTarget::Self, "gold", EffectOperation::Subtract, EffectValue::fixed(3)));
    a.effects.push_back(fx(EffectTarget::Self, "experience", EffectOperation::Add, EffectValue::fixed(250)));

    REQUIRE(arena.engine.execute_action_effect(a, arena.units()).success);
    const world::Unit& self = arena.unit("a");
    CHECK(self.number("health") == 100.0);
    CHECK(self.number("mana") == 0.0);
    CHECK(self.number("gold") == 0.0);        // missing stats start at 1
    CHECK(self.number("experience") == 250.0);
}

TEST_CASE("EffectEngine: lethal damage marks the unit dead")
{
    Arena arena;
    Action a = targeted("smite", "a", "t");
    a.effects.push_back(fx(EffectTarget::Target, "health", EffectOperation::Subtract, EffectValue::fixed(90)));

    REQUIRE(arena.engine.execute_action_effect(a, arena.units()).success);
    CHECK(arena.unit("t").number("health") == 0.0);
    CHECK(arena.unit("t").text("status") == std::string("dead"));
    CHECK_FALSE(world::is_alive(arena.unit("t")));
}

TEST_CASE("EffectEngine: multiply and divide round to whole values")
{
    Arena arena;
    arena.unit("a").set("gold", 5.0);
    Action a = targeted("invest", "a", "t");
    a.effects.push_back(fx(EffectTarget::Self, "gold", EffectOperation::Multiply, EffectValue::fixed(1.5)));
    a.effects.push_back(fx(EffectTarget::Self, "wood", EffectOperation::Set, EffectValue::fixed(9)));
    a.effects.push_back(fx(EffectTarget::Self, "wood", EffectOperation::Divide, EffectValue::fixed(4)));

    REQUIRE(arena.engine.execute_action_effect(a, arena.units()).success);
    CHECK(arena.unit("a").number("gold") == 8.0);
    CHECK(arena.unit("a").number("wood") == 2.0);
}

TEST_CASE("EffectEngine: division by zero aborts the rest of the batch")
{
    Arena arena;
    Action a = targeted("broken", "a", "t");
    a.effects.push_back(fx(EffectTarget::Self, "mana", EffectOperation::Subtract, EffectValue::fixed(10)));
    a.effects.push_back(fx(EffectTarget::Self, "health", EffectOperation::Divide, EffectValue::fixed(0)));
    a.effects.push_back(fx(EffectTarget::Target, "health", EffectOperation::Subtract, EffectValue::fixed(10)));

    const EffectResult r = arena.engine.execute_action_effect(a, arena.units());
    CHECK_FALSE(r.success);
    CHECK(r.failure == FailureKind::Effect);
    CHECK_FALSE(r.errorMessage.empty());

    CHECK(arena.unit("a").number("mana") == 90.0);     // applied before the failure
    CHECK(arena.unit("a").number("health") == 80.0);
    CHECK(arena.unit("t").number("health") == 70.0);   // never reached
}

TEST_CASE("EffectEngine: readonly properties are skipped")
{
    Arena arena;
    arena.unit("t").define("armor", 5.0, true);
    Action a = targeted("sunder", "a", "t");
    a.effects.push_back(fx(EffectTarget::Target, "armor", EffectOperation::Subtract, EffectValue::fixed(5)));
    a.effects.push_back(fx(EffectTarget::Target, "health", EffectOperation::Subtract, EffectValue::fixed(5)));

    REQUIRE(arena.engine.execute_action_effect(a, arena.units()).success);
    CHECK(arena.unit("t").number("armor") == 5.0);
    CHECK(arena.unit("t").number("health") == 65.0);
}

TEST_CASE("EffectEngine: permanent effects rewrite the base value")
{
    Arena arena;
    arena.unit("a").set_base("attack", 10.0);
    arena.unit("a").add_modifier("attack", world::Modifier{"banner", 2.0, 0});

    Action a = targeted("train", "a", "t");
    a.effects.push_back(fx(EffectTarget::Self, "attack", EffectOperation::Add, EffectValue::fixed(3), true));
    REQUIRE(arena.engine.execute_action_effect(a, arena.units()).success);

    const world::PropertyRecord* r = arena.unit("a").record("attack");
    REQUIRE(r != nullptr);
    CHECK(std::get<double>(r->baseValue) == 15.0);
    CHECK(arena.unit("a").number("attack") == 17.0);
}

TEST_CASE("EffectEngine: range validation blocks out-of-range and cross-map targets")
{
    Arena arena;
    Action far = targeted("attack", "a", "far");
    far.effects.push_back(fx(EffectTarget::Target, "health", EffectOperation::Subtract, EffectValue::fixed(10)));

    const EffectResult r = arena.engine.execute_action_effect(far, arena.units());
    CHECK_FALSE(r.success);
    CHECK(r.failure == FailureKind::Range);
    CHECK(r.errorMessage.find("out of range") != std::string::npos);
    CHECK(arena.unit("far").number("health") == 50.0);

    Action away = targeted("attack", "a", "elsewhere", 100.0);
    away.effects = far.effects;
    CHECK(arena.engine.validate_range(away, arena.units()).errorMessage.find("different maps") != std::string::npos);

    Action ghost = targeted("attack", "a", "ghost");
    CHECK_FALSE(arena.engine.validate_range(ghost, arena.units()).valid);

    Action wide = targeted("attack", "a", "far", 6.0);
    CHECK(arena.engine.validate_range(wide, arena.units()).valid);
}

TEST_CASE("EffectEngine: value kinds")
{
    Arena arena;
    Action a = targeted("mixed", "a", "t");
    a.payload.emplace("damage", 12.0);
    const world::Unit& t = arena.unit("t");

    CHECK(arena.engine.resolve_value(EffectValue::fixed(4), a, t) == 4.0);
    CHECK(arena.engine.resolve_value(EffectValue::from_variable("damage"), a, t) == 12.0);
    CHECK(arena.engine.resolve_value(EffectValue::from_variable("health"), a, t) == 70.0);
    CHECK(arena.engine.resolve_value(EffectValue::from_variable("nothing"), a, t) == 0.0);

    EffectValue calc{};
    calc.kind = ValueKind::Calculation;
    calc.value = 6.0;
    calc.expression = "attack * 100";
    CHECK(arena.engine.resolve_value(calc, a, t) == 6.0);

    const double rolled = arena.engine.resolve_value(EffectValue::random(3, 5), a, t);
    CHECK(rolled >= 3.0);
    CHECK(rolled <= 5.0);

    EffectValue open{};
    open.kind = ValueKind::Random;
    open.min = 3;
    CHECK(arena.engine.resolve_value(open, a, t) == 0.0);
}

TEST_CASE("EffectEngine: target kinds")
{
    Arena arena;

    SUBCASE("ally touches the actor and the explicit target") {
        Action a = targeted("rally", "a", "t");
        a.effects.push_back(fx(EffectTarget::Ally, "morale", EffectOperation::Add, EffectValue::fixed(2)));
        REQUIRE(arena.engine.apply(a, {}, arena.units()).success);
        CHECK(arena.unit("a").number("morale") == 3.0);
        CHECK(arena.unit("t").number("morale") == 3.0);
        CHECK_FALSE(arena.unit("far").has("morale"));
    }

    SUBCASE("all touches every unit") {
        Action a{};
        a.type = "quake";
        a.player = "a";
        a.effects.push_back(fx(EffectTarget::All, "health", EffectOperation::Subtract, EffectValue::fixed(5)));
        REQUIRE(arena.engine.apply(a, {}, arena.units()).success);
        CHECK(arena.unit("a").number("health") == 75.0);
        CHECK(arena.unit("elsewhere").number("health") == 45.0);
    }

    SUBCASE("enemy without an explicit target picks the first other unit") {
        Action a{};
        a.type = "curse";
        a.player = "a";
        a.effects.push_back(fx(EffectTarget::Enemy, "health", EffectOperation::Subtract, EffectValue::fixed(5)));
        REQUIRE(arena.engine.apply(a, {}, arena.units()).success);
        CHECK(arena.unit("t").number("health") == 65.0);
        CHECK(arena.unit("far").number("health") == 50.0);
    }

    SUBCASE("unresolvable targets skip the effect only") {
        Action a{};
        a.type = "orphan";
        a.player = "nobody";
        a.effects.push_back(fx(EffectTarget::Self, "health", EffectOperation::Add, EffectValue::fixed(5)));
        a.effects.push_back(fx(EffectTarget::All, "mana", EffectOperation::Subtract, EffectValue::fixed(1)));
        REQUIRE(arena.engine.apply(a, {}, arena.units()).success);
        CHECK(arena.unit("a").number("health") == 80.0);
        CHECK(arena.unit("a").number("mana") == 99.0);
    }
}

TEST_CASE("EffectEngine: catalog definitions take precedence")
{
    Arena arena;
    ActionCatalog catalog;
    Action def{};
    def.type = "poke";
    def.effects.push_back(fx(EffectTarget::Target, "health", EffectOperation::Subtract, EffectValue::fixed(1)));
    catalog.add(def);
    arena.engine.set_catalog(&catalog);

    Action a = targeted("poke", "a", "t");
    a.effects.push_back(fx(EffectTarget::Target, "health", EffectOperation::Subtract, EffectValue::fixed(40)));
    REQUIRE(arena.engine.execute_action_effect(a, arena.units()).success);
    CHECK(arena.unit("t").number("health") == 69.0);

    Action bare = targeted("chat", "a", "t");
    CHECK(arena.engine.execute_action_effect(bare, arena.units()).success);
}
