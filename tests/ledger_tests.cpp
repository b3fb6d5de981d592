#include "MemoryStores.hpp"
#include "PartyLedger.hpp"
#include "TestSupport.hpp"

#include <iostream>
#include <limits>
#include <string>

using test::expect;
using test::expect_error;

namespace {

struct LedgerFixture {
    MemoryPartyRepository parties;
    MemoryCharacterStore store;
    test::FlakyCharacterStore flaky{store};
    PartyLedger ledger{parties, flaky, 0.5};

    LedgerFixture() {
        store.put_character(test::character("ann", "anna"));
        store.put_character(test::character("bob", "bobby"));
        store.put_character(test::character("hench", "anna"));
        store.put_character(test::character("loner", "lou"));
        ledger.create_party("party", "The Company");
        ledger.add_member("party", "ann");
        ledger.add_member("party", "bob");
        ledger.add_henchman("party", "hench", "ann");
    }

    int banked(const std::string& id) { return store.get_character(id)->bankedXp; }
};

void test_membership() {
    LedgerFixture fx;
    Party p = fx.ledger.get_party("party");
    expect(p.members.size() == 2 && p.henchmen.size() == 1, "two members and a henchman");
    expect(p.henchmen.at("hench") == "ann", "henchman works for ann");

    expect_error(ErrorKind::VALIDATION_ERROR, [&] { fx.ledger.create_party("party", "again"); }, "duplicate party");
    expect_error(ErrorKind::NOT_FOUND, [&] { fx.ledger.add_member("party", "ghost"); }, "unknown character");
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { fx.ledger.add_member("party", "ann"); }, "already a member");
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { fx.ledger.add_henchman("party", "loner", "lou"); },
                 "employer must be a member");
    expect_error(ErrorKind::NOT_FOUND, [&] { fx.ledger.get_party("nobody"); }, "unknown party");

    Party after = fx.ledger.remove_member("party", "ann");
    expect(!after.members.count("ann") && after.henchmen.empty(), "henchmen leave with their employer");

    expect(fx.ledger.parties_for_characters({"bob"}).size() == 1, "bob's party found");
    expect(fx.ledger.parties_for_characters({"loner"}).empty(), "loner has no party");
}

void test_pending_xp() {
    LedgerFixture fx;
    fx.ledger.track_pending_xp("party", 40);
    Party p = fx.ledger.track_pending_xp("party", 60);
    expect(p.pendingXp == 100, "pool accumulates");
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { fx.ledger.track_pending_xp("party", -1); }, "pool never shrinks by tracking");

    fx.ledger.revert_pending_xp("party", 60);
    expect(fx.ledger.get_party("party").pendingXp == 40, "revert takes back exactly one award");

    const int most = std::numeric_limits<int>::max();
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { fx.ledger.track_pending_xp("party", most); }, "pool cannot overflow");
    expect(fx.ledger.get_party("party").pendingXp == 40, "overflowing award changes nothing");
    fx.ledger.track_pending_xp("party", most - 40);
    expect(fx.ledger.get_party("party").pendingXp == most, "pool may fill right up");
    fx.ledger.revert_pending_xp("party", most - 40);

    CharacterMutation windfall;
    windfall.bankedXpDelta = most;
    fx.store.update_character("ann", windfall);
    CharacterMutation more;
    more.bankedXpDelta = 1;
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { fx.store.update_character("ann", more); }, "banked XP cannot overflow");
    expect(fx.banked("ann") == most, "overflowing credit changes nothing");

    Party revealed = fx.ledger.reveal_room("party", "keep", "hall");
    expect(revealed.discoveredRooms["keep"].count("hall") == 1, "room revealed");
}

void test_allocate() {
    LedgerFixture fx;
    fx.ledger.track_pending_xp("party", 200);

    Party p = fx.ledger.allocate("party", {{"ann", 100}, {"hench", 50}});
    expect(p.pendingXp == 50, "pool drops by the total");
    expect(fx.banked("ann") == 100 && fx.banked("hench") == 50 && fx.banked("bob") == 0, "shares banked");

    expect_error(ErrorKind::VALIDATION_ERROR, [&] { fx.ledger.allocate("party", {{"bob", 51}}); }, "more than the pool");
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { fx.ledger.allocate("party", {{"loner", 10}}); }, "outsiders get nothing");
    expect_error(ErrorKind::VALIDATION_ERROR, [&] { fx.ledger.allocate("party", {{"bob", 0}}); }, "shares are positive");
    expect(fx.banked("bob") == 0 && fx.ledger.get_party("party").pendingXp == 50, "rejected allocations change nothing");
}

void test_allocate_is_atomic() {
    LedgerFixture fx;
    fx.ledger.track_pending_xp("party", 300);

    // ann and bob are credited, hench fails
    fx.flaky.fail_on_update(3);
    expect_error(ErrorKind::PERSISTENCE_FAILURE, [&] {
        fx.ledger.allocate("party", {{"ann", 100}, {"bob", 100}, {"hench", 50}});
    }, "third credit fails");
    fx.flaky.fail_on_update(-1);

    expect(fx.banked("ann") == 0 && fx.banked("bob") == 0 && fx.banked("hench") == 0, "every credit reverted");
    expect(fx.ledger.get_party("party").pendingXp == 300, "pool untouched");

    Party p = fx.ledger.allocate("party", {{"ann", 100}, {"bob", 100}, {"hench", 50}});
    expect(p.pendingXp == 50 && fx.banked("hench") == 50, "same allocation succeeds once the store recovers");
}

void test_even_distribution() {
    LedgerFixture fx;
    // 2 members + 0.5 henchman = 2.5 shares
    XpDistribution d = fx.ledger.even_distribution("party", 250);
    expect(d["ann"] == 100 && d["bob"] == 100 && d["hench"] == 50, "100 / 100 / 50");

    XpDistribution odd = fx.ledger.even_distribution("party", 101);
    expect(odd["ann"] == 40 && odd["hench"] == 20, "shares round down, the rest stays in the pool");

    expect_error(ErrorKind::VALIDATION_ERROR, [&] { fx.ledger.even_distribution("party", 0); }, "nothing to split");
}

} // namespace

int main() {
    std::cout << "Running party ledger tests...\n";

    test_membership();
    test_pending_xp();
    test_allocate();
    test_allocate_is_atomic();
    test_even_distribution();

    return test::finish("party ledger tests");
}
