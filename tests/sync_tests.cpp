#include "CampaignJson.hpp"
#include "FightStateMachine.hpp"
#include "MemoryStores.hpp"
#include "SessionSynchronizer.hpp"
#include "TestSupport.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using test::expect;
using test::expect_error;
using json = nlohmann::json;

namespace {

const std::string FIGHT = "keep/hall";

struct SyncFixture {
    MemoryMapRepository maps;
    MapRegistry registry{maps};
    MemoryCharacterStore store;
    test::FlakyCharacterStore flaky{store};
    MemoryPartyRepository parties;
    PartyLedger ledger{parties, flaky, 0.5};
    CombatEngine engine;
    DiceRoller roller{42};
    SessionSynchronizer sync;

    std::shared_ptr<test::RecordingChannel> dmChannel = std::make_shared<test::RecordingChannel>("dm");
    std::shared_ptr<test::RecordingChannel> playerChannel = std::make_shared<test::RecordingChannel>("anna");
    uint64_t dm = 0;
    uint64_t player = 0;

    explicit SyncFixture(bool requireApproval = false)
        : sync(registry, flaky, ledger, engine, roller, requireApproval) {
        store.put_character(test::character("ann", "anna"));
        registry.put_map(test::two_room_map());
        ledger.create_party("party", "The Company");
        ledger.add_member("party", "ann");

        dm = sync.open_session(dmChannel, DmRole{"dm"});
        player = sync.open_session(playerChannel, PlayerRole{"anna", {"ann"}});
        sync.get_map_snapshot(dm, "keep");
        sync.get_map_snapshot(player, "keep");
    }

    // ann against one goblin; goblin wins initiative and acts first
    void start_goblin_fight() {
        Combatant ann;
        ann.id = "ann";
        ann.characterId = "ann";
        sync.attach_encounter(dm, "keep", "hall", {ann, test::goblin()}, "party", 0);
        sync.start_fight(dm, FIGHT, {2, 5}, false);
    }

    Fight fight() { return *registry.get_room("keep", "hall").fight; }
    std::string fight_json() { return json(registry.get_room("keep", "hall")).dump(); }
    uint64_t version() { return registry.get_map("keep")->version; }
    int hit_points(const std::string& id) { return store.get_character(id)->hitPoints; }
};

CombatAction attack(const std::string& actor, const std::string& target, std::vector<int> rolls = {}) {
    CombatAction a;
    a.type = ActionType::ATTACK;
    a.actorId = actor;
    a.targetId = target;
    a.rolls = std::move(rolls);
    return a;
}

CombatAction pass(const std::string& actor) {
    CombatAction a;
    a.type = ActionType::PASS;
    a.actorId = actor;
    return a;
}

std::vector<std::string> room_ids(const json& mapView) {
    std::vector<std::string> ids;
    for (const auto& room : mapView.at("rooms"))
        ids.push_back(room.at("id").get<std::string>());
    return ids;
}

void test_goblin_fight_end_to_end() {
    SyncFixture fx;
    fx.start_goblin_fight();

    Fight f = fx.fight();
    expect(f.state == FightState::ACTIVE_ROUND && current_actor(f)->id == "goblin", "goblin acts first");
    expect(f.find("ann")->stats.attackThrow == 10 && f.find("ann")->displayName == "ann",
           "character stats come from the sheet");

    // 16 + 8 - 4 = 20 hits, 4 damage
    SubmitOutcome hit = fx.sync.submit_action(fx.dm, FIGHT, attack("goblin", "ann", {16, 4}));
    expect(hit.result && hit.result->attack && hit.result->attack->damage == 4, "goblin hits for 4");
    expect(fx.hit_points("ann") == 6, "damage written back to the character sheet");
    expect(current_actor(fx.fight())->id == "ann", "turn passes to ann");

    // 16 + 10 - 6 = 20 hits, 8 damage kills the goblin outright
    SubmitOutcome kill = fx.sync.submit_action(fx.dm, FIGHT, attack("ann", "goblin", {16, 8}));
    expect(kill.result && kill.result->fightResolved && kill.result->xpAwarded == 5, "fight resolved for 5 XP");
    expect(fx.fight().state == FightState::RESOLVED && fx.fight().xpAwarded, "XP marked as awarded");
    expect(fx.ledger.get_party("party").pendingXp == 5, "party pool credited once");

    fx.sync.clear_fight(fx.dm, FIGHT);
    expect(!fx.registry.get_room("keep", "hall").fight, "resolved fight cleared");
    expect(fx.ledger.get_party("party").pendingXp == 5, "clearing awards nothing more");

    auto deltas = fx.dmChannel->with_prefix("SERVER:ROOM_DELTA:");
    expect(!deltas.empty(), "DM receives room deltas");
    bool sawResolution = false;
    for (const auto& d : deltas) {
        json j = json::parse(d);
        if (j.contains("result") && j["result"].value("fightResolved", false)) sawResolution = true;
    }
    expect(sawResolution, "resolution broadcast with its result");
}

void test_player_view_is_filtered() {
    SyncFixture fx;
    expect(fx.sync.list_maps(fx.player).empty(), "nothing discovered yet");
    json before = fx.sync.get_map_snapshot(fx.player, "keep");
    expect(room_ids(before).empty(), "player sees no rooms before exploring");

    fx.start_goblin_fight();
    expect(fx.sync.list_maps(fx.player) == std::vector<std::string>({"keep"}), "attached room revealed to the party");

    json view = fx.sync.get_map_snapshot(fx.player, "keep");
    expect(room_ids(view) == std::vector<std::string>({"hall"}), "hall visible, gatehouse still hidden");
    expect(view.dump().find("Gatehouse") == std::string::npos, "hidden room never leaks");

    json hall = view.at("rooms").at(0);
    for (const auto& c : hall.at("fight").at("combatants")) {
        if (c.at("id") == "goblin")
            expect(!c.contains("hitPoints"), "monster hit points hidden from players");
        else
            expect(c.at("hitPoints") == 10, "own hit points visible");
    }

    uint64_t last = 0;
    bool ordered = true;
    for (const auto& d : fx.playerChannel->with_prefix("SERVER:ROOM_DELTA:")) {
        uint64_t v = json::parse(d).at("version").get<uint64_t>();
        if (v <= last) ordered = false;
        last = v;
    }
    expect(ordered && last > 0, "player deltas arrive in version order");

    expect(!fx.playerChannel->with_prefix("SERVER:PARTY_UPDATE:").empty(), "player told about the reveal");
    expect(fx.sync.get_party(fx.player, "party").at("pendingXp") == 0, "player reads own party");
}

void test_illegal_player_actions() {
    SyncFixture fx;
    fx.start_goblin_fight();
    const std::string before = fx.fight_json();
    const uint64_t version = fx.version();

    // goblin's turn, not ann's
    expect_error(ErrorKind::ILLEGAL_ACTION, [&] { fx.sync.submit_action(fx.player, FIGHT, pass("ann")); }, "out of turn");
    expect_error(ErrorKind::ILLEGAL_ACTION, [&] { fx.sync.submit_action(fx.player, FIGHT, pass("goblin")); },
                 "players cannot move monsters");
    expect(fx.fight_json() == before && fx.version() == version, "rejections change nothing");

    auto rejected = fx.dmChannel->with_prefix("SERVER:ACTION_REJECTED:");
    expect(rejected.size() == 2, "DM told about both rejections");
    expect(fx.playerChannel->with_prefix("SERVER:ACTION_REJECTED:").empty(), "players do not see rejections");

    const std::string requestId = json::parse(rejected.at(0)).at("requestId").get<std::string>();
    ResolutionResult forced = fx.sync.force_apply(fx.dm, requestId, {});
    expect(forced.dmOverride && forced.actorId == "ann", "DM pushes the rejected request through");
    expect(current_actor(fx.fight())->id == "goblin", "an off-turn pass does not take the goblin's turn");
    expect_error(ErrorKind::NOT_FOUND, [&] { fx.sync.force_apply(fx.dm, requestId, {}); }, "request used up");
}

void test_approval_queue() {
    SyncFixture fx(true);
    fx.start_goblin_fight();
    fx.sync.submit_action(fx.dm, FIGHT, pass("goblin"));

    SubmitOutcome first = fx.sync.submit_action(fx.player, FIGHT, pass("ann"));
    expect(first.queued && !first.result, "request waits for the DM");
    expect(fx.fight().pendingActions.size() == 1, "request stored with the fight");
    expect(fx.dmChannel->with_prefix("SERVER:APPROVAL_REQUEST:").size() == 1, "DM asked to approve");
    expect_error(ErrorKind::ILLEGAL_ACTION, [&] { fx.sync.submit_action(fx.player, FIGHT, pass("ann")); },
                 "one waiting request per combatant");

    ResolutionResult approved = fx.sync.approve_action(fx.dm, FIGHT, first.requestId, {});
    expect(approved.actorId == "ann" && !approved.dmOverride, "approved request runs under the normal rules");
    expect(fx.fight().pendingActions.empty() && current_actor(fx.fight())->id == "goblin", "turn moved on");

    fx.sync.submit_action(fx.dm, FIGHT, pass("goblin"));
    SubmitOutcome second = fx.sync.submit_action(fx.player, FIGHT, pass("ann"));
    fx.sync.deny_action(fx.dm, FIGHT, second.requestId);
    expect(fx.fight().pendingActions.empty(), "denied request dropped");
    expect(fx.playerChannel->with_prefix("SERVER:ACTION_DENIED:") == std::vector<std::string>({second.requestId}),
           "player told about the denial");
    expect(current_actor(fx.fight())->id == "ann", "still ann's turn after a denial");
    expect_error(ErrorKind::NOT_FOUND, [&] { fx.sync.approve_action(fx.dm, FIGHT, second.requestId, {}); },
                 "denied request cannot be approved");
}

void test_failed_approval_leaves_the_queue() {
    SyncFixture fx(true);
    fx.start_goblin_fight();
    fx.sync.submit_action(fx.dm, FIGHT, pass("goblin"));

    SubmitOutcome request = fx.sync.submit_action(fx.player, FIGHT, attack("ann", "goblin"));
    expect(request.queued, "attack waits for the DM");

    DmOverride skip;
    skip.kind = OverrideKind::ADVANCE_TURN;
    fx.sync.dm_override(fx.dm, FIGHT, skip);
    expect(current_actor(fx.fight())->id == "goblin", "DM skipped ann");

    expect_error(ErrorKind::ILLEGAL_ACTION, [&] { fx.sync.approve_action(fx.dm, FIGHT, request.requestId, {}); },
                 "the attack is no longer legal");
    expect(fx.fight().pendingActions.empty(), "failed request leaves the queue");
    expect(fx.playerChannel->with_prefix("SERVER:ACTION_DENIED:") == std::vector<std::string>({request.requestId}),
           "player told the request is gone");

    fx.sync.submit_action(fx.dm, FIGHT, pass("goblin"));
    SubmitOutcome again = fx.sync.submit_action(fx.player, FIGHT, attack("ann", "goblin"));
    expect(again.queued && fx.fight().pendingActions.size() == 1, "ann may ask again");

    ResolutionResult forced = fx.sync.force_apply(fx.dm, request.requestId, {16, 3});
    expect(forced.dmOverride && forced.attack && forced.attack->hit, "DM can still force the failed request");
}

void test_player_turn_steps() {
    SyncFixture fx;
    fx.start_goblin_fight();
    fx.sync.submit_action(fx.dm, FIGHT, pass("goblin"));

    CombatAction step;
    step.type = ActionType::MOVE;
    step.actorId = "ann";
    fx.sync.submit_action(fx.player, FIGHT, step);
    expect(current_actor(fx.fight())->id == "ann" && fx.fight().find("ann")->moved, "ann moved and may still act");
    expect_error(ErrorKind::ILLEGAL_ACTION, [&] { fx.sync.submit_action(fx.player, FIGHT, step); }, "one move per turn");

    CombatAction save;
    save.type = ActionType::SAVING_THROW;
    save.actorId = "ann";
    save.saveType = SavingThrowType::SPELLS;
    SubmitOutcome saved = fx.sync.submit_action(fx.player, FIGHT, save);
    expect(saved.result && saved.result->save, "save resolved");
    expect(current_actor(fx.fight())->id == "goblin", "the save used up ann's turn");
    expect_error(ErrorKind::ILLEGAL_ACTION, [&] { fx.sync.submit_action(fx.player, FIGHT, save); },
                 "no rerolling a failed save");
}

void test_override_payloads() {
    expect_error(ErrorKind::VALIDATION_ERROR, [] { parse_dm_override(json{{"kind", "SMITE"}}); },
                 "unknown override kind");
    expect_error(ErrorKind::VALIDATION_ERROR, [] {
        parse_dm_override(json{{"kind", "SET_HIT_POINTS"}, {"combatantId", "ann"}, {"wound", {{"timing", "NEXT_WEEK"}}}});
    }, "unknown treatment timing");
    expect_error(ErrorKind::VALIDATION_ERROR, [] {
        parse_dm_override(json{{"kind", "APPLY_ACTION"}, {"action", {{"type", "SMITE"}, {"actorId", "ann"}}}});
    }, "unknown action inside an override");

    const DmOverride parsed = parse_dm_override(json{
        {"kind", "SET_HIT_POINTS"}, {"combatantId", "ann"}, {"hitPoints", -2},
        {"wound", {{"timing", "ONE_ROUND"}, {"horsetail", true}}}});
    expect(parsed.kind == OverrideKind::SET_HIT_POINTS && parsed.hitPoints == -2, "override read");
    expect(parsed.wound.timing == TreatmentTiming::ONE_ROUND && parsed.wound.horsetail, "wound modifiers read");
}

void test_concurrent_overrides_serialize() {
    SyncFixture fx;
    fx.start_goblin_fight();
    const std::size_t history = fx.fight().history.size();
    const uint64_t version = fx.version();

    const int threads = 4;
    const int perThread = 10;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&fx] {
            DmOverride skip;
            skip.kind = OverrideKind::ADVANCE_TURN;
            for (int i = 0; i < perThread; ++i)
                fx.sync.dm_override(fx.dm, FIGHT, skip);
        });
    }
    for (auto& w : workers)
        w.join();

    expect(fx.fight().history.size() == history + threads * perThread, "every override logged exactly once");
    expect(fx.version() == version + threads * perThread, "one map version per override");
    expect(fx.fight().round == 21, "40 skips over two combatants is 20 more rounds");
}

void test_failed_write_back_rolls_back() {
    SyncFixture fx;
    fx.start_goblin_fight();
    const std::string before = fx.fight_json();

    fx.flaky.fail_on_update(1);
    expect_error(ErrorKind::PERSISTENCE_FAILURE, [&] {
        fx.sync.submit_action(fx.dm, FIGHT, attack("goblin", "ann", {16, 4}));
    }, "character store down");
    fx.flaky.fail_on_update(-1);

    expect(fx.fight_json() == before, "room fight restored");
    expect(fx.hit_points("ann") == 10, "character untouched");

    fx.sync.submit_action(fx.dm, FIGHT, attack("goblin", "ann", {16, 4}));
    expect(fx.hit_points("ann") == 6, "same action goes through once the store is back");
}

void test_dm_only_operations() {
    SyncFixture fx;
    expect_error(ErrorKind::ILLEGAL_ACTION, [&] {
        fx.sync.attach_encounter(fx.player, "keep", "hall", {test::goblin()}, "", 0);
    }, "players cannot attach encounters");
    expect_error(ErrorKind::ILLEGAL_ACTION, [&] { fx.sync.put_map(fx.player, test::two_room_map()); },
                 "players cannot edit maps");
    expect_error(ErrorKind::ILLEGAL_ACTION, [&] { fx.sync.create_party(fx.player, "mine", "Mine"); },
                 "players cannot create parties");

    fx.start_goblin_fight();
    expect_error(ErrorKind::ILLEGAL_ACTION, [&] {
        DmOverride resolve;
        resolve.kind = OverrideKind::FORCE_RESOLVE;
        fx.sync.dm_override(fx.player, FIGHT, resolve);
    }, "players cannot override");
    expect_error(ErrorKind::ILLEGAL_ACTION, [&] { fx.sync.clear_fight(fx.dm, FIGHT); }, "fight still running");
    expect_error(ErrorKind::ILLEGAL_ACTION, [&] {
        fx.sync.attach_encounter(fx.dm, "keep", "hall", {test::goblin("second")}, "", 0);
    }, "one fight per room");
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { fx.sync.start_fight(fx.dm, "keep", {}, false); }, "malformed fight id");
}

} // namespace

int main() {
    std::cout << "Running session synchronizer tests...\n";

    test_goblin_fight_end_to_end();
    test_player_view_is_filtered();
    test_illegal_player_actions();
    test_approval_queue();
    test_failed_approval_leaves_the_queue();
    test_player_turn_steps();
    test_override_payloads();
    test_concurrent_overrides_serialize();
    test_failed_write_back_rolls_back();
    test_dm_only_operations();

    return test::finish("session synchronizer tests");
}
