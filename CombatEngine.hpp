// File: CombatEngine.hpp
// Description: The rules. Attack throws, damage, mortal wounds, morale and
// saving throws, applied to a Fight with die results taken from a RollTape.
// The engine never rolls on its own and never touches storage; it mutates
// the Fight it is handed and reports what happened.
#pragma once

#include "CampaignData.hpp"
#include "Dice.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

// How long it took to get help to a downed character
enum class TreatmentTiming : int {
	NONE = 0,      // checked on the spot, no treatment yet
	ONE_ROUND,
	ONE_TURN,
	ONE_HOUR,
	ONE_DAY,
	OVER_ONE_DAY
};

// Situational modifiers for the mortal wounds roll
struct WoundModifiers {
	int healingMagic = 0;
	int healingProficiency = 0;
	bool horsetail = false;
	TreatmentTiming timing = TreatmentTiming::NONE;
	int other = 0;
};

struct MortalWoundResult {
	int roll = 0;    // natural d20, 0 when the table was not used
	int total = 0;
	MortalWoundCondition condition = MortalWoundCondition::NONE;
	MortalWoundOutcome outcome = MortalWoundOutcome::NONE;
};

struct AttackResult {
	int roll = 0;          // natural d20 (first die)
	int total = 0;         // exploded d20 + throw + modifier - AC
	bool hit = false;
	bool critical = false;
	bool criticalMiss = false;
	int damage = 0;
	int targetHitPoints = 0;
	std::optional<MortalWoundResult> wound;
};

struct MoraleEntry {
	std::string combatantId;
	int total = 0;
	bool passed = true;
};

struct MoraleResult {
	int roll = 0; // 2d6, rolled once for the whole group
	std::vector<MoraleEntry> entries;
};

struct SaveResult {
	int roll = 0;
	int total = 0;
	bool passed = false;
};

/**
 * @struct ResolutionResult
 * @brief What one action did. Sent back to the submitter and broadcast with
 * the room delta.
 */
struct ResolutionResult {
	std::string fightId;
	ActionType type = ActionType::PASS;
	std::string actorId;
	std::string targetId;
	std::string summary;
	std::vector<int> rolls;
	bool dmOverride = false;
	bool fightResolved = false;  // this action ended the fight
	int xpAwarded = 0;
	std::optional<AttackResult> attack;
	std::optional<MoraleResult> morale;
	std::optional<SaveResult> save;
	std::optional<MortalWoundResult> wound; // override paths (SET_HIT_POINTS)
};

class CombatEngine
{
	int morale_threshold_;

public:
	explicit CombatEngine(int moraleThreshold = DEFAULT_MORALE_THRESHOLD);

	int morale_threshold() const { return morale_threshold_; }

	// --- Single rules ---

	/**
	 * @brief Attack throw and damage. A hit that takes the target to 0 hp or
	 * below runs the mortal wounds check straight away.
	 */
	AttackResult resolve_attack(const Combatant& attacker, Combatant& target, const DamageRoll& weapon,
		int modifier, RollTape& rolls) const;

	/**
	 * @brief Rolls on the mortal wounds table and records the outcome.
	 * Combatants that do not use the table (most monsters) die outright
	 * without a roll.
	 */
	MortalWoundResult resolve_mortal_wound(Combatant& combatant, RollTape& rolls,
		const WoundModifiers& modifiers = WoundModifiers{}) const;

	// 2d6 once for the group; each member adds its own morale score
	MoraleResult resolve_morale_check(const std::vector<Combatant*>& group, int modifier, bool surrender,
		RollTape& rolls) const;

	SaveResult resolve_saving_throw(const Combatant& combatant, SavingThrowType type, int modifier,
		RollTape& rolls) const;

	// --- Whole actions against a fight ---

	/**
	 * @brief Validates and applies one action. Without dmOverride the fight
	 * must be active, the actor able to act, and ATTACK/PASS must come from
	 * the combatant whose turn it is. Throws before any change; on success
	 * the action is logged, the turn advanced and termination checked.
	 */
	ResolutionResult apply_action(Fight& fight, const CombatAction& action, RollTape& rolls, bool dmOverride) const;

	// Fight start-up, logged like any other action
	ResolutionResult roll_initiative(Fight& fight, RollTape& rolls, bool holdOrder) const;
	ResolutionResult override_initiative(Fight& fight, const std::map<std::string, int>& values) const;
	ResolutionResult begin_first_round(Fight& fight) const;

	// DM overrides that bypass the rules but share the logging and termination path
	ResolutionResult set_hit_points(Fight& fight, const std::string& combatantId, int hitPoints,
		RollTape& rolls, const WoundModifiers& modifiers = WoundModifiers{}) const;
	ResolutionResult set_status(Fight& fight, const std::string& combatantId, const StatusFlags& flags) const;
	ResolutionResult force_advance(Fight& fight) const;
	ResolutionResult force_resolution(Fight& fight) const;

	// --- Pure helpers ---

	static MortalWoundCondition wound_condition(int total);
	static MortalWoundOutcome wound_outcome(MortalWoundCondition condition);
	static int hit_die_bonus(HitDie die);
	static int hit_point_ratio_modifier(int hitPoints, int maxHitPoints);
	static int treatment_modifier(TreatmentTiming timing);

	// Monsters-side combatants that are out of the fight
	static std::vector<Combatant> defeated_monsters(const Fight& fight);

	/**
	 * @brief XP for a resolved fight: the XP value of every defeated monster
	 * plus the treasure value. Same inputs, same answer.
	 */
	static int compute_xp(const std::vector<Combatant>& defeated, int treasureValue);

	// compute_xp for a finished fight; the treasure only counts when the party is still standing
	static int fight_xp(const Fight& fight);

private:
	void finish(Fight& fight, ResolutionResult& result, bool advance) const;
};
