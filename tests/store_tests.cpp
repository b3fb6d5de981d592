#include "CampaignJson.hpp"
#include "FightStateMachine.hpp"
#include "MapRegistry.hpp"
#include "MemoryStores.hpp"
#include "ServerConfig.hpp"
#include "TestSupport.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

using test::expect;
using test::expect_error;

namespace {

Map map_with_fight() {
    Map m = test::two_room_map();
    Fight f = form_fight("keep/hall", {test::fighter(), test::goblin()}, "party", 4);
    RollTape init({5, 2});
    start_fight(f, init);
    begin_round(f);
    m.rooms["hall"].fight = f;
    return m;
}

void test_map_round_trip() {
    MemoryMapRepository repo;
    Map m = map_with_fight();
    m.version = 1;
    repo.save_map(m);

    std::optional<Map> loaded = repo.load_map("keep");
    expect(loaded.has_value(), "saved map loads");
    if (loaded) {
        expect(nlohmann::json(*loaded).dump() == nlohmann::json(m).dump(), "map survives storage unchanged");
        expect(loaded->rooms.at("hall").fight->state == FightState::ACTIVE_ROUND, "embedded fight kept");
        expect(loaded->connections.at("gate->hall").description == "A rotten oak door", "connections kept");
    }
    expect(!repo.load_map("nowhere").has_value(), "unknown map is empty");

    expect_error(ErrorKind::CONCURRENCY_CONFLICT, [&] { repo.save_map(m); }, "same version twice conflicts");
    m.version = 2;
    repo.save_map(m);
    expect(repo.list_maps() == std::vector<std::string>({"keep"}), "one map listed");
}

void test_registry_reads_and_writes() {
    MemoryMapRepository repo;
    MapRegistry registry(repo);

    expect_error(ErrorKind::NOT_FOUND, [&] { registry.get_map("keep"); }, "missing map");
    expect(!registry.is_loaded("keep"), "failed load leaves nothing behind");

    std::shared_ptr<const Map> v1 = registry.put_map(test::two_room_map());
    expect(v1->version == 1, "first save is version 1");
    expect(repo.load_map("keep").has_value(), "put_map persists");

    Room cellar;
    cellar.id = "cellar";
    cellar.name = "Cellar";
    std::shared_ptr<const Map> v2 = registry.put_room("keep", cellar);
    expect(v2->version == 2 && v2->rooms.count("cellar"), "room added");
    expect(v1->rooms.count("cellar") == 0, "old snapshot never changes");

    RoomConnection stairs;
    stairs.from = "hall";
    stairs.to = "cellar";
    stairs.oneWay = true;
    std::shared_ptr<const Map> v3 = registry.connect_rooms("keep", stairs);
    expect(v3->connections.count("hall->cellar") == 1, "connection id generated");
    expect(v3->rooms.at("cellar").connections.count("hall->cellar") == 1, "both rooms list the connection");

    expect_error(ErrorKind::VALIDATION_ERROR, [&] {
        RoomConnection loop;
        loop.from = "hall";
        loop.to = "hall";
        registry.connect_rooms("keep", loop);
    }, "a room cannot lead to itself");
    expect_error(ErrorKind::NOT_FOUND, [&] {
        RoomConnection nowhere;
        nowhere.from = "hall";
        nowhere.to = "attic";
        registry.connect_rooms("keep", nowhere);
    }, "connection to a missing room");

    std::shared_ptr<const Map> v4 = registry.delete_room("keep", "cellar");
    expect(!v4->rooms.count("cellar") && !v4->connections.count("hall->cellar"), "room and its connections removed");
    expect(!v4->rooms.at("hall").connections.count("hall->cellar"), "hall forgets the stairs");

    expect_error(ErrorKind::VALIDATION_ERROR, [&] {
        registry.update_map("keep", [](Map& m) { m.rooms["hall"].connections.insert("ghost-door"); });
    }, "graph must stay consistent");
    expect(registry.get_map("keep")->version == 4, "failed update publishes nothing");
    expect(repo.load_map("keep")->version == 4, "failed update stores nothing");
}

void test_registry_protects_fights() {
    MemoryMapRepository repo;
    MapRegistry registry(repo);
    Map m = map_with_fight();
    m.version = 1;
    repo.save_map(m);

    expect_error(ErrorKind::ILLEGAL_ACTION, [&] { registry.delete_room("keep", "hall"); }, "fight in progress");

    Map edited = test::two_room_map();
    edited.rooms["hall"].name = "Burnt Hall";
    std::shared_ptr<const Map> after = registry.put_map(edited);
    expect(after->rooms.at("hall").name == "Burnt Hall", "map edit applied");
    expect(after->rooms.at("hall").fight.has_value(), "map edit keeps the live fight");

    Map forged = test::two_room_map();
    forged.rooms["hall"].fight = map_with_fight().rooms["hall"].fight;
    forged.rooms["hall"].fight->treasureValue = 9999;
    forged.rooms["gate"].fight = forged.rooms["hall"].fight;
    after = registry.put_map(forged);
    expect(after->rooms.at("hall").fight->treasureValue == 4, "client copy of a live fight is ignored");
    expect(!after->rooms.at("gate").fight, "client cannot plant a fight in an existing map");

    Map without = test::two_room_map();
    without.rooms.erase("hall");
    without.connections.clear();
    without.rooms["gate"].connections.clear();
    expect_error(ErrorKind::ILLEGAL_ACTION, [&] { registry.put_map(without); }, "cannot drop a room mid-fight");
}

void test_new_map_arrives_without_fights() {
    MemoryMapRepository repo;
    MapRegistry registry(repo);

    Map sneaky = map_with_fight();
    sneaky.rooms["hall"].fight->id = "elsewhere/room";
    sneaky.rooms["hall"].fight->state = FightState::RESOLVED;
    sneaky.rooms["hall"].fight->xpAmount = 500;
    std::shared_ptr<const Map> stored = registry.put_map(sneaky);
    expect(!stored->rooms.at("hall").fight, "fights only come in through an encounter");
    expect(!repo.load_map("keep")->rooms.at("hall").fight, "and none is persisted");

    Map crypt = map_with_fight();
    crypt.id = "crypt";
    registry.create_map(crypt);
    expect(!registry.get_map("crypt")->rooms.at("hall").fight, "create_map drops them too");
}

void test_registry_conflict_and_flush() {
    MemoryMapRepository repo;
    MapRegistry registry(repo);
    registry.put_map(test::two_room_map());

    // Another writer got there first
    Map other = *repo.load_map("keep");
    other.name = "Someone else's keep";
    other.version = 2;
    repo.save_map(other);

    expect_error(ErrorKind::CONCURRENCY_CONFLICT, [&] {
        registry.update_map("keep", [](Map& m) { m.summary = "mine"; });
    }, "stale writer conflicts");
    expect(registry.get_map("keep")->name == "Someone else's keep", "registry picks up the stored copy");
    registry.update_map("keep", [](Map& m) { m.summary = "mine"; });
    expect(repo.load_map("keep")->summary == "mine", "retry succeeds");

    Map fresh = test::two_room_map("crypt");
    registry.create_map(fresh);
    expect(!repo.load_map("crypt").has_value(), "created map lives in memory only");
    expect(registry.flush_all() == 1, "flush saves the one unsaved map");
    expect(repo.load_map("crypt").has_value(), "flushed map persisted");
    expect(registry.flush_all() == 0, "nothing left to flush");
}

void test_character_mutations() {
    MemoryCharacterStore store;
    store.put_character(test::character("ann", "anna"));

    CharacterMutation hurt;
    hurt.hitPoints = 3;
    CharacterRecord r = store.update_character("ann", hurt);
    expect(r.hitPoints == 3 && r.bankedXp == 0, "only hit points change");

    CharacterMutation overdraw;
    overdraw.bankedXpDelta = -1;
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { store.update_character("ann", overdraw); }, "banked XP never negative");
    expect(store.get_character("ann")->hitPoints == 3, "rejected mutation changes nothing");
    expect_error(ErrorKind::NOT_FOUND, [&] { store.update_character("bob", hurt); }, "unknown character");
    expect(store.list_characters_for_owner("anna").size() == 1, "owner lookup");
}

void test_accounts() {
    MemoryAccountRepository accounts;
    Account a;
    a.username = "anna";
    a.passwordHash = "$argon2id$stub";
    expect(accounts.create_account(a), "first registration succeeds");
    expect(!accounts.create_account(a), "username taken");
    expect(accounts.find_account("anna")->passwordHash == a.passwordHash, "hash stored");
    expect(!accounts.find_account("bob").has_value(), "unknown account");
}

void test_config() {
    ServerConfig defaults = load_server_config("no_such_config.json");
    expect(defaults.port == 8080 && defaults.uses_memory_storage(), "missing file gives defaults");
    expect(defaults.henchmanXpShare == 0.5, "default henchman share");

    const std::string path = "store_tests_config.json";
    {
        std::ofstream out(path);
        out << R"({"port": 9001, "storage": "memory", "dm_accounts": ["gm"], "require_dm_approval": true,
                   "henchman_xp_share": 0.25, "rng_seed": 42})";
    }
    ServerConfig c = load_server_config(path);
    expect(c.port == 9001 && c.dmAccounts.count("gm") == 1, "values read from the file");
    expect(c.requireDmApproval && c.henchmanXpShare == 0.25 && c.rngSeed == 42u, "rule settings read");

    {
        std::ofstream out(path);
        out << R"({"storage": "floppy"})";
    }
    bool threw = false;
    try {
        load_server_config(path);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect(threw, "unknown storage backend rejected");
    std::remove(path.c_str());
}

} // namespace

int main() {
    std::cout << "Running storage tests...\n";

    test_map_round_trip();
    test_registry_reads_and_writes();
    test_registry_protects_fights();
    test_new_map_arrives_without_fights();
    test_registry_conflict_and_flush();
    test_character_mutations();
    test_accounts();
    test_config();

    return test::finish("storage tests");
}
