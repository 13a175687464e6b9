#include <doctest/doctest.h>

#include "chronicle/core/Errors.hpp"
#include "chronicle/sim/TurnScheduler.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace chronicle;
using namespace chronicle::sim;

namespace {

rules::Action act(std::string type, std::string player)
{
    rules::Action a{};
    a.type = std::move(type);
    a.player = std::move(player);
    return a;
}

} // namespace

TEST_CASE("TurnScheduler/RejectsEmptyAndOverlappingRounds")
{
    TurnScheduler s;
    CHECK_THROWS_AS(s.start_new_round({}, 1), SchedulerError);
    CHECK_FALSE(s.round_active());

    s.start_new_round({"a", "b"}, 1);
    CHECK_THROWS_AS(s.start_new_round({"c"}, 2), SchedulerError);
    CHECK(s.current_round() == 1);
    CHECK(s.current_actor_id() == std::string("a"));
}

TEST_CASE("TurnScheduler/EveryActorActsExactlyOncePerRound")
{
    TurnScheduler s;
    const std::vector<std::string> order{"a", "b", "c"};
    s.start_new_round(order);
    CHECK(s.current_round() == 1);

    std::vector<std::string> seen;
    while (const auto actor = s.current_actor_id()) {
        seen.push_back(*actor);
        s.end_turn();
    }
    CHECK(seen == order);
    CHECK(s.current_turn() == 3);
    CHECK_FALSE(s.round_active());
    CHECK_FALSE(s.has_pending_turns());
    CHECK(s.turn_order().empty());
    CHECK(s.turn_index_in_round() == 0);

    s.start_new_round({"c", "a"});
    CHECK(s.current_round() == 2);
    CHECK(s.current_actor_id() == std::string("c"));
}

TEST_CASE("TurnScheduler/SkipDoesNotConsumeAGlobalTurn")
{
    TurnScheduler s;
    s.start_new_round({"a", "b", "c"}, 4);

    s.skip_turn();
    CHECK(s.current_turn() == 0);
    CHECK(s.current_actor_id() == std::string("b"));
    CHECK(s.turn_index_in_round() == 1);

    s.end_turn();
    s.skip_turn();
    CHECK(s.current_turn() == 1);
    CHECK_FALSE(s.round_active());

    // Idle transitions are no-ops.
    s.skip_turn();
    CHECK(s.current_turn() == 1);
    CHECK_FALSE(s.current_actor_id().has_value());
}

TEST_CASE("TurnScheduler/ProcessActionBuildsHistory")
{
    TurnScheduler s;
    s.start_new_round({"a", "b"}, 1);

    s.process_action(act("rest", "a"));
    s.process_action(act("patrol", "a"));
    s.end_turn();

    TurnContext ctx{};
    ctx.actorId = "b";
    ctx.turnInRound = 2;
    s.process_action(act("attack", "b"), ctx);
    s.end_turn();

    const auto& history = s.history();
    REQUIRE(history.size() == 2);
    CHECK(history[0].number == 0);
    CHECK(history[0].turnInRound == 1);
    CHECK(history[0].actions.size() == 2);
    CHECK(history[0].turnOrder == std::vector<std::string>{"a", "b"});
    CHECK(history[1].number == 1);
    CHECK(history[1].actorId == "b");
    CHECK(history[1].turnInRound == 2);

    CHECK_THROWS_AS(s.process_action(act("", "a")), std::invalid_argument);
    CHECK_THROWS_AS(s.process_action(act("rest", "")), std::invalid_argument);

    s.reset();
    CHECK(s.history().empty());
    CHECK(s.current_turn() == 0);
    CHECK(s.current_round() == 0);
}

TEST_CASE("TurnScheduler/RestoreNormalizesExhaustedRounds")
{
    SchedulerState saved{};
    saved.turn = 12;
    saved.round = 3;
    saved.phase = RoundActive{{"a", "b"}, 1};

    TurnScheduler s(saved);
    CHECK(s.current_turn() == 12);
    CHECK(s.current_actor_id() == std::string("b"));
    CHECK(s.state().active());

    saved.phase = RoundActive{{"a", "b"}, 2};
    s.restore(saved);
    CHECK_FALSE(s.round_active());
    CHECK(std::holds_alternative<Idle>(s.state().phase));

    s.start_new_round({"x"});
    CHECK(s.current_round() == 4);
}
