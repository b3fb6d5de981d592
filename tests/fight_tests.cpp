#include "CampaignJson.hpp"
#include "FightStateMachine.hpp"
#include "TestSupport.hpp"

#include <iostream>
#include <string>
#include <vector>

using test::expect;
using test::expect_error;

namespace {

Combatant party(const std::string& id) {
    Combatant c = test::fighter(id);
    c.displayName = id;
    return c;
}

Combatant monster(const std::string& id) {
    Combatant c = test::goblin(id);
    c.displayName = id;
    return c;
}

std::vector<std::string> order_of(const Fight& f) {
    std::vector<std::string> ids;
    for (const auto& c : f.combatants)
        ids.push_back(c.id);
    return ids;
}

void test_form_fight_validation() {
    expect_error(ErrorKind::VALIDATION_ERROR, [] {
        form_fight("keep/hall", {}, "", 0);
    }, "empty encounter");
    expect_error(ErrorKind::VALIDATION_ERROR, [] {
        form_fight("keep/hall", {monster("g"), monster("g")}, "", 0);
    }, "duplicate combatant ids");
    expect_error(ErrorKind::VALIDATION_ERROR, [] {
        Combatant dead = monster("g");
        dead.hitPoints = 0;
        form_fight("keep/hall", {dead}, "", 0);
    }, "combatants enter with positive hit points");
    expect_error(ErrorKind::VALIDATION_ERROR, [] {
        form_fight("keep/hall", {monster("g")}, "", -5);
    }, "negative treasure");
    expect_error(ErrorKind::VALIDATION_ERROR, [] {
        Combatant idle = monster("g");
        idle.stats.attacksPerRound = 0;
        form_fight("keep/hall", {idle}, "", 0);
    }, "every combatant gets at least one attack");
    expect_error(ErrorKind::VALIDATION_ERROR, [] {
        Combatant cursed = monster("g");
        cursed.stats.xpValue = -10;
        form_fight("keep/hall", {cursed}, "", 0);
    }, "negative XP value");

    Combatant stale = monster("g");
    stale.flags.fled = true;
    stale.initiative = 9;
    stale.displayName.clear();
    Fight f = form_fight("keep/hall", {stale}, "party", 12);
    expect(f.state == FightState::FORMING, "new fight is FORMING");
    expect(!f.combatants[0].flags.fled && f.combatants[0].initiative == 0, "status and initiative reset on attach");
    expect(f.combatants[0].displayName == "g", "display name falls back to the id");
    expect(f.treasureValue == 12 && f.partyId == "party", "treasure and party kept");
}

void test_cancel_only_while_forming() {
    Fight f = form_fight("keep/hall", {monster("g")}, "", 0);
    cancel_fight(f);
    expect(f.state == FightState::EMPTY, "FORMING -> EMPTY on cancel");

    Fight g = form_fight("keep/hall", {party("p"), monster("g")}, "", 0);
    RollTape init({3, 3});
    start_fight(g, init);
    expect_error(ErrorKind::ILLEGAL_ACTION, [&] { cancel_fight(g); }, "cannot cancel a started fight");
}

void test_start_needs_every_roll() {
    Fight f = form_fight("keep/hall", {party("p"), monster("a"), monster("b")}, "", 0);
    const std::string before = nlohmann::json(f).dump();

    RollTape shortTape({6, 6});
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { start_fight(f, shortTape); }, "three combatants need three rolls");
    expect(nlohmann::json(f).dump() == before, "short tape leaves the fight FORMING and untouched");

    RollTape badDie({7, 1, 1});
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { start_fight(f, badDie); }, "7 is not a d6 result");

    Combatant quick = party("q");
    quick.stats.initiativeModifier = 2;
    Fight g = form_fight("keep/hall", {quick, monster("a")}, "", 0);
    RollTape init({3, 4});
    start_fight(g, init);
    expect(g.state == FightState::ACTIVE_INITIATIVE, "start moves to ACTIVE_INITIATIVE");
    expect(g.find("q")->initiative == 5 && g.find("a")->initiative == 4, "1d6 + modifier");
}

void test_initiative_order() {
    Fight f = form_fight("keep/hall", {party("a"), monster("b"), party("c"), monster("d")}, "", 0);
    RollTape init({3, 3, 5, 3});
    start_fight(f, init);
    begin_round(f);

    expect(f.state == FightState::ACTIVE_ROUND && f.round == 1, "round 1 starts");
    expect(order_of(f) == std::vector<std::string>({"c", "b", "d", "a"}),
           "highest first, monsters win ties, then attach order");
    expect(current_actor(f)->id == "c", "first in order acts first");

    expect_error(ErrorKind::ILLEGAL_ACTION, [&] { begin_round(f); }, "order is fixed once");
}

void test_set_initiative() {
    Fight f = form_fight("keep/hall", {party("a"), monster("b")}, "", 0);
    RollTape init({1, 6});
    start_fight(f, init);

    expect_error(ErrorKind::NOT_FOUND, [&] { set_initiative(f, {{"a", 9}, {"ogre", 2}}); }, "unknown combatant");
    expect(f.find("a")->initiative == 1, "failed override changes nothing");

    set_initiative(f, {{"a", 9}});
    begin_round(f);
    expect(current_actor(f)->id == "a", "DM initiative decides the order");

    expect_error(ErrorKind::ILLEGAL_ACTION, [&] { set_initiative(f, {{"a", 1}}); }, "initiative is fixed after round 1 starts");
}

void test_turns_and_rounds() {
    Fight f = form_fight("keep/hall", {party("a"), monster("b"), party("c")}, "", 0);
    RollTape init({6, 4, 2});
    start_fight(f, init);
    begin_round(f);

    advance_turn(f);
    expect(current_actor(f)->id == "b" && f.round == 1, "a -> b");

    f.find("c")->flags.fled = true;
    advance_turn(f);
    expect(current_actor(f)->id == "a" && f.round == 2, "fled c is skipped, wrap starts round 2");

    f.find("b")->hitPoints = 0;
    f.find("b")->flags.mortallyWounded = true;
    advance_turn(f);
    expect(current_actor(f)->id == "a" && f.round == 3, "only a can act");

    f.find("a")->attacksMade = 1;
    f.find("a")->moved = true;
    advance_turn(f);
    expect(f.find("a")->attacksMade == 0 && !f.find("a")->moved, "a new turn starts with a clean slate");
}

void test_termination() {
    Fight f = form_fight("keep/hall", {party("a"), monster("b"), monster("c")}, "", 0);
    RollTape init({6, 4, 2});
    start_fight(f, init);
    begin_round(f);

    f.find("b")->flags.dead = true;
    expect(!check_termination(f) && f.state == FightState::ACTIVE_ROUND, "one goblin left");

    f.find("c")->flags.surrendered = true;
    expect(side_defeated(f, Side::MONSTERS), "surrendered counts as out");
    expect(check_termination(f) && f.state == FightState::RESOLVED, "monsters out, fight resolved");
    expect(!check_termination(f), "transition reported once");

    Fight g = form_fight("keep/hall", {party("a"), monster("b")}, "", 0);
    expect_error(ErrorKind::ILLEGAL_ACTION, [&] { force_resolve(g); }, "a forming fight is cancelled, not resolved");
    expect(g.state == FightState::FORMING, "refused resolve leaves the fight forming");

    RollTape gInit({3, 3});
    start_fight(g, gInit);
    force_resolve(g);
    expect(g.state == FightState::RESOLVED, "DM may resolve while initiative is open");
    expect_error(ErrorKind::ILLEGAL_ACTION, [&] { force_resolve(g); }, "nothing to resolve twice");
}

void test_fight_json_round_trip() {
    Fight f = form_fight("keep/hall", {party("a"), monster("b")}, "party", 7);
    RollTape init({2, 5});
    start_fight(f, init);
    begin_round(f);
    PendingAction p;
    p.requestId = "req-1";
    p.username = "ann";
    p.action.type = ActionType::PASS;
    p.action.actorId = "a";
    f.pendingActions.push_back(p);

    const nlohmann::json j = f;
    const Fight back = j.get<Fight>();
    expect(nlohmann::json(back).dump() == j.dump(), "fight survives JSON");
    expect(back.pendingActions.size() == 1 && back.pendingActions[0].requestId == "req-1", "pending queue kept");
    expect(order_of(back) == order_of(f), "initiative order kept");
}

void test_unknown_enum_names_rejected() {
    nlohmann::json action = {{"type", "BOGUS"}, {"actorId", "a"}};
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { action.get<CombatAction>(); }, "unknown action type");

    action = {{"type", "SAVING_THROW"}, {"actorId", "a"}, {"saveType", "SUNBURN"}};
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { action.get<CombatAction>(); }, "unknown save type");

    action = {{"type", "MOVE"}, {"actorId", "a"}, {"move", "TELEPORT"}};
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { action.get<CombatAction>(); }, "unknown movement");

    action = {{"type", "MORALE_CHECK"}, {"actorId", "a"}, {"groupSide", "NEUTRAL"}};
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { action.get<CombatAction>(); }, "unknown side");

    action = {{"type", 0}, {"actorId", "a"}};
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { action.get<CombatAction>(); }, "enum values are names, not numbers");

    nlohmann::json combatant = {{"id", "g"}, {"stats", {{"hitDie", "D7"}}}};
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { combatant.get<Combatant>(); }, "unknown hit die");

    nlohmann::json fight = {{"id", "keep/hall"}, {"state", "PAUSED"}};
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { fight.get<Fight>(); }, "unknown fight state");

    nlohmann::json good = {{"type", "MOVE"}, {"actorId", "a"}, {"move", "FULL_RETREAT"}};
    const CombatAction parsed = good.get<CombatAction>();
    expect(parsed.type == ActionType::MOVE && parsed.move == MoveKind::FULL_RETREAT, "known names still parse");
}

} // namespace

int main() {
    std::cout << "Running fight state tests...\n";

    test_form_fight_validation();
    test_cancel_only_while_forming();
    test_start_needs_every_roll();
    test_initiative_order();
    test_set_initiative();
    test_turns_and_rounds();
    test_termination();
    test_fight_json_round_trip();
    test_unknown_enum_names_rejected();

    return test::finish("fight state tests");
}
