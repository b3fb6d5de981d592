#include "FightStateMachine.hpp"
#include "CampaignError.hpp"
#include <algorithm>
#include <set>

namespace {

	void require_state(const Fight& fight, FightState expected, const char* operation)
	{
		if (fight.state != expected) {
			throw_illegal(std::string("Cannot ") + operation + " fight " + fight.id + " in state " +
				fight_state_name(fight.state) + ".");
		}
	}

	int first_able_from(const Fight& fight, int start)
	{
		const int count = static_cast<int>(fight.combatants.size());
		for (int i = start; i < count; ++i)
			if (fight.combatants[i].canAct()) return i;
		return -1;
	}

	void clear_turn_counters(Fight& fight)
	{
		for (auto& c : fight.combatants) {
			c.attacksMade = 0;
			c.moved = false;
		}
	}

}

Fight form_fight(const std::string& fightId, std::vector<Combatant> combatants,
	const std::string& partyId, int treasureValue)
{
	if (combatants.empty())
		throw_invalid("An encounter needs at least one combatant.");
	if (treasureValue < 0)
		throw_invalid("Treasure value cannot be negative.");

	std::set<std::string> ids;
	for (auto& c : combatants) {
		if (c.id.empty())
			throw_invalid("Every combatant needs an id.");
		if (!ids.insert(c.id).second)
			throw_invalid("Duplicate combatant id " + c.id + ".");
		if (c.hitPoints <= 0)
			throw_invalid("Combatant " + c.id + " must enter the fight with positive hit points.");
		if (c.maxHitPoints < c.hitPoints)
			c.maxHitPoints = c.hitPoints;
		if (c.stats.attacksPerRound < 1)
			throw_invalid("Combatant " + c.id + " needs at least one attack per round.");
		if (c.stats.xpValue < 0)
			throw_invalid("Combatant " + c.id + " cannot be worth negative XP.");
		if (c.displayName.empty())
			c.displayName = c.id;
		c.initiative = 0;
		c.flags = StatusFlags{};
		c.mortalWound = MortalWoundCondition::NONE;
		c.woundOutcome = MortalWoundOutcome::NONE;
		c.attacksMade = 0;
		c.moved = false;
	}

	Fight fight;
	fight.id = fightId;
	fight.state = FightState::FORMING;
	fight.combatants = std::move(combatants);
	fight.partyId = partyId;
	fight.treasureValue = treasureValue;
	return fight;
}

void cancel_fight(Fight& fight)
{
	require_state(fight, FightState::FORMING, "cancel");
	fight.state = FightState::EMPTY;
}

void start_fight(Fight& fight, RollTape& rolls)
{
	require_state(fight, FightState::FORMING, "start");

	// Roll into a scratch list so a short tape leaves the fight alone
	std::vector<int> initiative;
	initiative.reserve(fight.combatants.size());
	for (const auto& c : fight.combatants)
		initiative.push_back(rolls.next(INITIATIVE_DIE) + c.stats.initiativeModifier);

	for (std::size_t i = 0; i < fight.combatants.size(); ++i)
		fight.combatants[i].initiative = initiative[i];

	fight.state = FightState::ACTIVE_INITIATIVE;
}

void set_initiative(Fight& fight, const std::map<std::string, int>& values)
{
	require_state(fight, FightState::ACTIVE_INITIATIVE, "set initiative for");
	for (const auto& [id, value] : values)
		if (!fight.find(id))
			throw_not_found("Combatant " + id + " is not in fight " + fight.id + ".");

	for (const auto& [id, value] : values)
		fight.find(id)->initiative = value;
}

void begin_round(Fight& fight)
{
	require_state(fight, FightState::ACTIVE_INITIATIVE, "begin the first round of");

	std::stable_sort(fight.combatants.begin(), fight.combatants.end(),
		[](const Combatant& a, const Combatant& b) {
			if (a.initiative != b.initiative)
				return a.initiative > b.initiative;
			return a.side == Side::MONSTERS && b.side == Side::PARTY;
		});

	clear_turn_counters(fight);
	fight.state = FightState::ACTIVE_ROUND;
	fight.round = 1;
	fight.currentTurn = std::max(0, first_able_from(fight, 0));
}

void advance_turn(Fight& fight)
{
	require_state(fight, FightState::ACTIVE_ROUND, "advance the turn of");

	int next = first_able_from(fight, fight.currentTurn + 1);
	if (next < 0) {
		// Wrapped: new round
		next = first_able_from(fight, 0);
		if (next < 0)
			return; // nobody can act; termination decides what happens
		++fight.round;
	}
	clear_turn_counters(fight);
	fight.currentTurn = next;
}

bool side_defeated(const Fight& fight, Side side)
{
	for (const auto& c : fight.combatants)
		if (c.side == side && !c.isOut())
			return false;
	return true;
}

bool check_termination(Fight& fight)
{
	if (!fight_is_active(fight))
		return false;

	if (side_defeated(fight, Side::PARTY) || side_defeated(fight, Side::MONSTERS)) {
		fight.state = FightState::RESOLVED;
		return true;
	}
	return false;
}

void force_resolve(Fight& fight)
{
	if (fight.state == FightState::FORMING)
		throw_illegal("Fight " + fight.id + " has not started; cancel it instead.");
	if (!fight_is_active(fight))
		throw_illegal(std::string("Fight ") + fight.id + " is " + fight_state_name(fight.state) + ", nothing to resolve.");
	fight.state = FightState::RESOLVED;
}

bool fight_is_active(const Fight& fight)
{
	return fight.state == FightState::ACTIVE_INITIATIVE || fight.state == FightState::ACTIVE_ROUND;
}

const Combatant* current_actor(const Fight& fight)
{
	if (fight.state != FightState::ACTIVE_ROUND)
		return nullptr;
	if (fight.currentTurn < 0 || fight.currentTurn >= static_cast<int>(fight.combatants.size()))
		return nullptr;
	return &fight.combatants[fight.currentTurn];
}
