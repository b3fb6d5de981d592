#include "CombatEngine.hpp"
#include "FightStateMachine.hpp"
#include "CampaignError.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

CombatEngine::CombatEngine(int moraleThreshold)
	: morale_threshold_(moraleThreshold)
{
}

// --- Tables ---

MortalWoundCondition CombatEngine::wound_condition(int total)
{
	if (total >= 26) return MortalWoundCondition::DAZED;
	if (total >= 21) return MortalWoundCondition::KNOCKED_OUT;
	if (total >= 16) return MortalWoundCondition::IN_SHOCK;
	if (total >= 11) return MortalWoundCondition::CRITICALLY_WOUNDED;
	if (total >= 6)  return MortalWoundCondition::GRIEVOUSLY_WOUNDED;
	if (total >= 1)  return MortalWoundCondition::MORTALLY_WOUNDED;
	return MortalWoundCondition::INSTANT_DEATH;
}

MortalWoundOutcome CombatEngine::wound_outcome(MortalWoundCondition condition)
{
	switch (condition) {
	case MortalWoundCondition::DAZED:
	case MortalWoundCondition::KNOCKED_OUT:
	case MortalWoundCondition::IN_SHOCK:
		return MortalWoundOutcome::STABLE;
	case MortalWoundCondition::CRITICALLY_WOUNDED:
	case MortalWoundCondition::GRIEVOUSLY_WOUNDED:
	case MortalWoundCondition::MORTALLY_WOUNDED:
		return MortalWoundOutcome::MAIMED_BUT_STABLE;
	case MortalWoundCondition::INSTANT_DEATH:
		return MortalWoundOutcome::DIES;
	case MortalWoundCondition::NONE:
		break;
	}
	return MortalWoundOutcome::NONE;
}

int CombatEngine::hit_die_bonus(HitDie die)
{
	switch (die) {
	case HitDie::D4:  return 0;
	case HitDie::D6:  return 2;
	case HitDie::D8:  return 4;
	case HitDie::D10: return 6;
	case HitDie::D12: return 8;
	}
	return 0;
}

int CombatEngine::hit_point_ratio_modifier(int hitPoints, int maxHitPoints)
{
	const double ratio = static_cast<double>(hitPoints) / static_cast<double>(std::max(1, maxHitPoints));
	if (ratio >= -0.25) return 5;
	if (ratio >= -0.5)  return -2;
	if (ratio >= -1.0)  return -5;
	if (ratio >= -2.0)  return -10;
	return -20;
}

int CombatEngine::treatment_modifier(TreatmentTiming timing)
{
	switch (timing) {
	case TreatmentTiming::NONE:         return 0;
	case TreatmentTiming::ONE_ROUND:    return 2;
	case TreatmentTiming::ONE_TURN:     return -3;
	case TreatmentTiming::ONE_HOUR:     return -5;
	case TreatmentTiming::ONE_DAY:      return -8;
	case TreatmentTiming::OVER_ONE_DAY: return -10;
	}
	return 0;
}

// --- Single rules ---

AttackResult CombatEngine::resolve_attack(const Combatant& attacker, Combatant& target, const DamageRoll& weapon,
	int modifier, RollTape& rolls) const
{
	if (weapon.amount < 1 || weapon.sides < 1)
		throw_invalid("Weapon damage must roll at least one die.");

	AttackResult result;
	result.roll = rolls.next(20);

	if (result.roll == 1) {
		result.criticalMiss = true;
		result.total = 1 + attacker.stats.attackThrow + modifier - target.stats.armorClass;
		result.targetHitPoints = target.hitPoints;
		return result;
	}

	// The d20 explodes on a natural 20
	int d20 = result.roll;
	int last = result.roll;
	while (last == 20) {
		last = rolls.next(20);
		d20 += last;
	}

	result.total = d20 + attacker.stats.attackThrow + modifier - target.stats.armorClass;
	result.hit = result.total >= ATTACK_TARGET;
	result.critical = result.total >= CRITICAL_HIT_TARGET;

	if (result.hit) {
		// A critical doubles the rolled total, not the number of dice
		const int rolled = rolls.sum(weapon.amount, weapon.sides) + weapon.modifier;
		result.damage = std::max(1, result.critical ? rolled * 2 : rolled);
		target.hitPoints -= result.damage;
		if (target.hitPoints <= 0 && !target.flags.dead && !target.flags.mortallyWounded)
			result.wound = resolve_mortal_wound(target, rolls);
	}

	result.targetHitPoints = target.hitPoints;
	return result;
}

MortalWoundResult CombatEngine::resolve_mortal_wound(Combatant& combatant, RollTape& rolls,
	const WoundModifiers& modifiers) const
{
	MortalWoundResult result;

	if (!combatant.stats.usesMortalWounds) {
		result.condition = MortalWoundCondition::INSTANT_DEATH;
		result.outcome = MortalWoundOutcome::DIES;
	}
	else {
		result.roll = rolls.next(20);
		result.total = result.roll
			+ combatant.stats.constitutionModifier
			+ hit_die_bonus(combatant.stats.hitDie)
			+ hit_point_ratio_modifier(combatant.hitPoints, combatant.maxHitPoints)
			+ modifiers.healingMagic
			+ modifiers.healingProficiency
			+ (modifiers.horsetail ? 2 : 0)
			+ treatment_modifier(modifiers.timing)
			+ modifiers.other;
		result.condition = wound_condition(result.total);
		result.outcome = wound_outcome(result.condition);
	}

	combatant.mortalWound = result.condition;
	combatant.woundOutcome = result.outcome;
	if (result.outcome == MortalWoundOutcome::DIES) {
		combatant.flags.dead = true;
		combatant.flags.mortallyWounded = false;
	}
	else {
		// Alive but down for the rest of the fight
		combatant.hitPoints = 0;
		combatant.flags.mortallyWounded = true;
	}
	return result;
}

MoraleResult CombatEngine::resolve_morale_check(const std::vector<Combatant*>& group, int modifier, bool surrender,
	RollTape& rolls) const
{
	if (group.empty())
		throw_invalid("Nobody is left to check morale.");

	MoraleResult result;
	result.roll = rolls.sum(2, 6);

	for (Combatant* c : group) {
		MoraleEntry entry;
		entry.combatantId = c->id;
		entry.total = result.roll + c->stats.morale + modifier;
		entry.passed = entry.total >= morale_threshold_;
		if (!entry.passed) {
			if (surrender) c->flags.surrendered = true;
			else c->flags.fled = true;
		}
		result.entries.push_back(entry);
	}
	return result;
}

SaveResult CombatEngine::resolve_saving_throw(const Combatant& combatant, SavingThrowType type, int modifier,
	RollTape& rolls) const
{
	SaveResult result;
	result.roll = rolls.next(20);
	result.total = result.roll + combatant.stats.saves.get(type) + modifier;
	result.passed = result.roll == 20 || result.total >= SAVING_THROW_TARGET;
	return result;
}

// --- XP ---

std::vector<Combatant> CombatEngine::defeated_monsters(const Fight& fight)
{
	std::vector<Combatant> defeated;
	for (const auto& c : fight.combatants)
		if (c.side == Side::MONSTERS && c.isOut())
			defeated.push_back(c);
	return defeated;
}

int CombatEngine::compute_xp(const std::vector<Combatant>& defeated, int treasureValue)
{
	long long xp = treasureValue;
	for (const auto& c : defeated)
		xp += c.stats.xpValue;
	if (xp < 0 || xp > std::numeric_limits<int>::max())
		throw_invalid("XP award of " + std::to_string(xp) + " is out of range.");
	return static_cast<int>(xp);
}

int CombatEngine::fight_xp(const Fight& fight)
{
	// A beaten party carries no treasure home
	const int treasure = side_defeated(fight, Side::PARTY) ? 0 : fight.treasureValue;
	return compute_xp(defeated_monsters(fight), treasure);
}

// --- Whole actions ---

namespace {

	std::string wound_text(const Combatant& c)
	{
		switch (c.woundOutcome) {
		case MortalWoundOutcome::DIES:              return c.displayName + " dies";
		case MortalWoundOutcome::MAIMED_BUT_STABLE: return c.displayName + " is down, maimed but stable";
		case MortalWoundOutcome::STABLE:            return c.displayName + " is down but stable";
		case MortalWoundOutcome::NONE:              break;
		}
		return c.displayName + " is down";
	}

	const char* save_name(SavingThrowType type)
	{
		switch (type) {
		case SavingThrowType::PETRIFICATION_PARALYSIS: return "petrification & paralysis";
		case SavingThrowType::POISON_DEATH:            return "poison & death";
		case SavingThrowType::BLAST_BREATH:            return "blast & breath";
		case SavingThrowType::STAFFS_WANDS:            return "staffs & wands";
		case SavingThrowType::SPELLS:                  return "spells";
		}
		return "unknown";
	}

	const char* move_text(MoveKind kind)
	{
		switch (kind) {
		case MoveKind::MOVE:                return "moves";
		case MoveKind::RUN:                 return "runs";
		case MoveKind::CHARGE:              return "charges";
		case MoveKind::FIGHTING_WITHDRAWAL: return "makes a fighting withdrawal";
		case MoveKind::FULL_RETREAT:        return "makes a full retreat";
		case MoveKind::SIMPLE_ACTION:       return "performs a simple action";
		}
		return "moves";
	}

	// MOVE and SIMPLE_ACTION leave the attack step of the turn open
	bool move_ends_turn(MoveKind kind)
	{
		return kind != MoveKind::MOVE && kind != MoveKind::SIMPLE_ACTION;
	}

	Combatant& require_combatant(Fight& fight, const std::string& id)
	{
		Combatant* c = fight.find(id);
		if (!c)
			throw_not_found("Combatant " + id + " is not in fight " + fight.id + ".");
		return *c;
	}

}

ResolutionResult CombatEngine::apply_action(Fight& fight, const CombatAction& action, RollTape& rolls, bool dmOverride) const
{
	if (fight.combatants.empty() || fight.state == FightState::EMPTY)
		throw_illegal("Fight " + fight.id + " has no encounter.");

	// Validate against the live fight, resolve on a copy
	Fight next = fight;
	Combatant& actor = require_combatant(next, action.actorId);

	if (!dmOverride) {
		if (!fight_is_active(next))
			throw_illegal(std::string("Fight is ") + fight_state_name(next.state) + ", no actions are accepted.");
		if (!actor.canAct())
			throw_illegal(actor.displayName + " is out of the fight.");

		const Combatant* turn = current_actor(next);
		if (!turn)
			throw_illegal("Turn order is not fixed yet.");
		if (turn->id != actor.id)
			throw_illegal("It is not " + actor.displayName + "'s turn.");

		if (action.type == ActionType::MOVE) {
			if (actor.moved)
				throw_illegal(actor.displayName + " has already moved this turn.");
			if (actor.attacksMade > 0)
				throw_illegal(actor.displayName + " cannot move after attacking.");
		}
	}

	const bool actorsTurn = current_actor(next) && current_actor(next)->id == actor.id;
	bool endsTurn = false;

	ResolutionResult result;
	result.fightId = next.id;
	result.type = action.type;
	result.actorId = actor.id;
	result.dmOverride = dmOverride;

	std::ostringstream summary;

	switch (action.type) {
	case ActionType::ATTACK: {
		Combatant& target = require_combatant(next, action.targetId);
		if (target.id == actor.id)
			throw_invalid("A combatant cannot attack itself.");
		if (!dmOverride && target.isOut())
			throw_illegal(target.displayName + " is already out of the fight.");

		result.targetId = target.id;
		const DamageRoll weapon = action.weapon ? *action.weapon : actor.stats.damage;
		AttackResult attack = resolve_attack(actor, target, weapon, action.modifier, rolls);

		if (attack.criticalMiss)
			summary << actor.displayName << " fumbles against " << target.displayName;
		else if (!attack.hit)
			summary << actor.displayName << " misses " << target.displayName << " (" << attack.total << ")";
		else
			summary << actor.displayName << (attack.critical ? " critically hits " : " hits ")
			<< target.displayName << " for " << attack.damage;
		if (attack.wound)
			summary << "; " << wound_text(target);

		if (actorsTurn) {
			++actor.attacksMade;
			endsTurn = actor.attacksMade >= actor.stats.attacksPerRound;
			if (!endsTurn)
				summary << " (attack " << actor.attacksMade << " of " << actor.stats.attacksPerRound << ")";
		}

		result.attack = attack;
		break;
	}
	case ActionType::MORALE_CHECK: {
		std::vector<Combatant*> group;
		if (action.groupSide) {
			for (auto& c : next.combatants)
				if (c.side == *action.groupSide && c.canAct())
					group.push_back(&c);
		}
		else {
			group.push_back(&actor);
		}

		MoraleResult morale = resolve_morale_check(group, action.modifier, action.surrender, rolls);
		summary << "Morale " << morale.roll << ":";
		for (const auto& e : morale.entries) {
			summary << " " << require_combatant(next, e.combatantId).displayName
				<< (e.passed ? " holds" : (action.surrender ? " surrenders" : " flees"));
		}
		result.morale = morale;
		endsTurn = actorsTurn && !dmOverride;
		break;
	}
	case ActionType::SAVING_THROW: {
		SaveResult save = resolve_saving_throw(actor, action.saveType, action.modifier, rolls);
		summary << actor.displayName << (save.passed ? " saves" : " fails a save")
			<< " vs " << save_name(action.saveType) << " (" << save.total << ")";
		result.save = save;
		// One save per turn when the player asks for it
		endsTurn = actorsTurn && !dmOverride;
		break;
	}
	case ActionType::MOVE:
		summary << actor.displayName << " " << move_text(action.move);
		if (actorsTurn) {
			actor.moved = true;
			endsTurn = move_ends_turn(action.move);
		}
		break;
	case ActionType::PASS:
		summary << actor.displayName << " ends the turn";
		endsTurn = actorsTurn;
		break;
	}

	result.summary = summary.str();
	result.rolls = rolls.used();

	finish(next, result, endsTurn);

	fight = std::move(next);
	return result;
}

ResolutionResult CombatEngine::roll_initiative(Fight& fight, RollTape& rolls, bool holdOrder) const
{
	Fight next = fight;
	start_fight(next, rolls);

	std::ostringstream summary;
	summary << "Initiative:";
	for (const auto& c : next.combatants)
		summary << " " << c.displayName << " " << c.initiative;

	ResolutionResult result;
	result.fightId = next.id;
	result.summary = summary.str();
	result.rolls = rolls.used();

	if (!holdOrder)
		begin_round(next);

	finish(next, result, false);
	fight = std::move(next);
	return result;
}

ResolutionResult CombatEngine::override_initiative(Fight& fight, const std::map<std::string, int>& values) const
{
	Fight next = fight;
	set_initiative(next, values);

	ResolutionResult result;
	result.fightId = next.id;
	result.dmOverride = true;
	result.summary = "DM adjusts initiative";
	finish(next, result, false);

	fight = std::move(next);
	return result;
}

ResolutionResult CombatEngine::begin_first_round(Fight& fight) const
{
	Fight next = fight;
	begin_round(next);

	ResolutionResult result;
	result.fightId = next.id;
	const Combatant* first = current_actor(next);
	result.summary = first ? "Round 1 begins with " + first->displayName : "Round 1 begins";
	finish(next, result, false);

	fight = std::move(next);
	return result;
}

ResolutionResult CombatEngine::set_hit_points(Fight& fight, const std::string& combatantId, int hitPoints,
	RollTape& rolls, const WoundModifiers& modifiers) const
{
	Fight next = fight;
	Combatant& c = require_combatant(next, combatantId);

	ResolutionResult result;
	result.fightId = next.id;
	result.actorId = c.id;
	result.dmOverride = true;

	std::ostringstream summary;
	summary << "DM sets " << c.displayName << " to " << hitPoints << " hp";

	c.hitPoints = hitPoints;
	if (hitPoints > c.maxHitPoints)
		c.maxHitPoints = hitPoints;

	if (hitPoints <= 0 && !c.flags.dead && !c.flags.mortallyWounded) {
		result.wound = resolve_mortal_wound(c, rolls, modifiers);
		summary << "; " << wound_text(c);
	}
	else if (hitPoints > 0 && c.flags.mortallyWounded && !c.flags.dead) {
		// Healed back up
		c.flags.mortallyWounded = false;
		c.mortalWound = MortalWoundCondition::NONE;
		c.woundOutcome = MortalWoundOutcome::NONE;
		summary << "; " << c.displayName << " is back on their feet";
	}

	result.summary = summary.str();
	result.rolls = rolls.used();
	finish(next, result, false);

	fight = std::move(next);
	return result;
}

ResolutionResult CombatEngine::set_status(Fight& fight, const std::string& combatantId, const StatusFlags& flags) const
{
	Fight next = fight;
	Combatant& c = require_combatant(next, combatantId);

	if (c.hitPoints <= 0 && !flags.dead && !flags.mortallyWounded)
		throw_invalid(c.displayName + " is at " + std::to_string(c.hitPoints) + " hp and needs a dead or mortally wounded status.");

	c.flags = flags;

	ResolutionResult result;
	result.fightId = next.id;
	result.actorId = c.id;
	result.dmOverride = true;
	result.summary = "DM sets the status of " + c.displayName;
	finish(next, result, false);

	fight = std::move(next);
	return result;
}

ResolutionResult CombatEngine::force_advance(Fight& fight) const
{
	Fight next = fight;
	const Combatant* turn = current_actor(next);
	if (!turn)
		throw_illegal("Fight " + next.id + " has no turn to advance.");

	ResolutionResult result;
	result.fightId = next.id;
	result.actorId = turn->id;
	result.dmOverride = true;
	result.summary = "DM skips " + turn->displayName;
	finish(next, result, true);

	fight = std::move(next);
	return result;
}

ResolutionResult CombatEngine::force_resolution(Fight& fight) const
{
	Fight next = fight;
	force_resolve(next);
	next.xpAmount = fight_xp(next);

	ResolutionResult result;
	result.fightId = next.id;
	result.dmOverride = true;
	result.summary = "DM ends the fight";
	result.fightResolved = true;
	result.xpAwarded = next.xpAmount;

	ActionLogEntry entry;
	entry.round = next.round;
	entry.summary = result.summary;
	entry.dmOverride = true;
	next.history.push_back(entry);

	fight = std::move(next);
	return result;
}

void CombatEngine::finish(Fight& fight, ResolutionResult& result, bool advance) const
{
	ActionLogEntry entry;
	entry.round = fight.round;
	entry.actorId = result.actorId;
	entry.type = result.type;
	entry.summary = result.summary;
	entry.rolls = result.rolls;
	entry.dmOverride = result.dmOverride;
	fight.history.push_back(entry);

	if (fight.state == FightState::ACTIVE_ROUND) {
		const Combatant* turn = current_actor(fight);
		if (advance || (turn && !turn->canAct()))
			advance_turn(fight);
	}

	if (check_termination(fight)) {
		fight.xpAmount = fight_xp(fight);
		result.fightResolved = true;
		result.xpAwarded = fight.xpAmount;
	}
}
