// File: CampaignData.hpp
// Description: Defines all core campaign data structures and constants.
// Maps own rooms, rooms own their fight, fights own their combatants.
// Nothing in here points at anything else; references are ids.
#pragma once

#include <string>
#include <vector>
#include <deque>
#include <map>
#include <set>
#include <optional>
#include <cstdint>

// --- Rule Constants ---
static const int ATTACK_TARGET = 20;           // d20 + throw - AC must reach this
static const int CRITICAL_HIT_TARGET = 30;     // ...and this for double damage
static const int SAVING_THROW_TARGET = 20;
static const int DEFAULT_MORALE_THRESHOLD = 7; // 2d6 + morale below this fails
static const int INITIATIVE_DIE = 6;

enum class FightState : int {
	EMPTY = 0,
	FORMING,
	ACTIVE_INITIATIVE,
	ACTIVE_ROUND,
	RESOLVED
};

enum class Side : int {
	PARTY = 0,
	MONSTERS = 1
};

enum class SavingThrowType : int {
	PETRIFICATION_PARALYSIS = 0,
	POISON_DEATH,
	BLAST_BREATH,
	STAFFS_WANDS,
	SPELLS
};

enum class HitDie : int {
	D4 = 4,
	D6 = 6,
	D8 = 8,
	D10 = 10,
	D12 = 12
};

// Rows of the mortal wounds table, best to worst
enum class MortalWoundCondition : int {
	NONE = 0,
	DAZED,
	KNOCKED_OUT,
	IN_SHOCK,
	CRITICALLY_WOUNDED,
	GRIEVOUSLY_WOUNDED,
	MORTALLY_WOUNDED,
	INSTANT_DEATH
};

enum class MortalWoundOutcome : int {
	NONE = 0,
	STABLE,
	MAIMED_BUT_STABLE,
	DIES
};

/**
 * @struct SavingThrows
 * @brief Target-20 saving throw modifiers (d20 + modifier >= 20 passes).
 */
struct SavingThrows {
	int petrificationParalysis = 0;
	int poisonDeath = 0;
	int blastBreath = 0;
	int staffsWands = 0;
	int spells = 0;

	int get(SavingThrowType type) const {
		switch (type) {
		case SavingThrowType::PETRIFICATION_PARALYSIS: return petrificationParalysis;
		case SavingThrowType::POISON_DEATH:            return poisonDeath;
		case SavingThrowType::BLAST_BREATH:            return blastBreath;
		case SavingThrowType::STAFFS_WANDS:            return staffsWands;
		case SavingThrowType::SPELLS:                  return spells;
		}
		return 0;
	}
};

// e.g. 1d8+1, melee or missile
struct DamageRoll {
	int amount = 1;
	int sides = 6;
	int modifier = 0;
	bool missile = false;
};

struct StatusFlags {
	bool fled = false;
	bool surrendered = false;
	bool mortallyWounded = false;
	bool dead = false;

	bool operator==(const StatusFlags& other) const {
		return fled == other.fled && surrendered == other.surrendered &&
			mortallyWounded == other.mortallyWounded && dead == other.dead;
	}
	bool operator!=(const StatusFlags& other) const { return !(*this == other); }
};

// Everything the engine needs to roll for a combatant. Characters carry a
// copy of this in their record, NPCs get it inline from the encounter.
struct CombatStats {
	int attackThrow = 10;
	int armorClass = 0;
	DamageRoll damage;
	SavingThrows saves;
	int morale = 0;
	int initiativeModifier = 0;
	int constitutionModifier = 0;
	HitDie hitDie = HitDie::D8;
	int xpValue = 0;
	bool usesMortalWounds = false; // monsters normally just die at 0 hp
	int attacksPerRound = 1;       // attack routine, e.g. claw/claw/bite is 3
};

struct Combatant {
	std::string id;            // unique inside the fight
	Side side = Side::MONSTERS;
	std::string characterId;   // set for player characters and henchmen
	std::string templateName;  // set for NPCs, e.g. "GOBLIN"
	std::string displayName;
	CombatStats stats;
	int hitPoints = 1;
	int maxHitPoints = 1;
	int initiative = 0;
	StatusFlags flags;
	MortalWoundCondition mortalWound = MortalWoundCondition::NONE;
	MortalWoundOutcome woundOutcome = MortalWoundOutcome::NONE;

	// What this combatant has done in its current turn
	int attacksMade = 0;
	bool moved = false;

	bool isCharacter() const { return !characterId.empty(); }

	// Out of the fight for good (for termination and turn order)
	bool isOut() const {
		return flags.dead || flags.fled || flags.surrendered || flags.mortallyWounded;
	}

	bool canAct() const { return !isOut() && hitPoints > 0; }
};

enum class ActionType : int {
	ATTACK = 0,
	MORALE_CHECK,
	SAVING_THROW,
	PASS,
	MOVE
};

// Movement step of a turn. MOVE and SIMPLE_ACTION still allow attacks
// afterwards, the others use up the whole turn.
enum class MoveKind : int {
	MOVE = 0,
	RUN,
	CHARGE,
	FIGHTING_WITHDRAWAL,
	FULL_RETREAT,
	SIMPLE_ACTION
};

/**
 * @struct CombatAction
 * @brief One request against a fight. `rolls` is the explicit random input;
 * when it runs out the server's roller fills in and the values used are
 * written to the history so the action can be replayed.
 */
struct CombatAction {
	ActionType type = ActionType::PASS;
	std::string actorId;
	std::string targetId;                 // ATTACK
	int modifier = 0;                     // situational bonus/penalty
	std::optional<DamageRoll> weapon;     // ATTACK, defaults to the actor's damage
	SavingThrowType saveType = SavingThrowType::POISON_DEATH;
	std::optional<Side> groupSide;        // MORALE_CHECK for a whole side
	bool surrender = false;               // MORALE_CHECK failure surrenders instead of fleeing
	MoveKind move = MoveKind::MOVE;       // MOVE
	std::vector<int> rolls;
};

// Player requests waiting for the DM when approval is switched on
struct PendingAction {
	std::string requestId;
	std::string username;
	CombatAction action;
};

struct ActionLogEntry {
	int round = 0;
	std::string actorId;
	ActionType type = ActionType::PASS;
	std::string summary;
	std::vector<int> rolls;
	bool dmOverride = false;
};

struct Fight {
	std::string id;
	FightState state = FightState::EMPTY;
	std::vector<Combatant> combatants;   // initiative order once the round starts
	int round = 0;
	int currentTurn = 0;                 // index into combatants
	std::deque<PendingAction> pendingActions;
	int treasureValue = 0;
	std::string partyId;
	bool xpAwarded = false;
	int xpAmount = 0;
	std::vector<ActionLogEntry> history;

	Combatant* find(const std::string& combatantId) {
		for (auto& c : combatants)
			if (c.id == combatantId) return &c;
		return nullptr;
	}
	const Combatant* find(const std::string& combatantId) const {
		for (const auto& c : combatants)
			if (c.id == combatantId) return &c;
		return nullptr;
	}
};

struct RoomConnection {
	std::string id;
	std::string from;
	std::string to;
	bool oneWay = false;
	std::string description;
	bool passable = true;
	bool locked = false;
};

struct Room {
	std::string id;
	std::string name;
	std::string description;             // DM notes
	std::set<std::string> connections;   // RoomConnection ids
	std::optional<Fight> fight;
};

/**
 * @struct Map
 * @brief A dungeon/town as a graph of rooms. Not a grid, there is no
 * notion of spatial position. Saved and loaded as one document.
 */
struct Map {
	std::string id;
	std::string name;
	std::string summary;
	std::map<std::string, Room> rooms;
	std::map<std::string, RoomConnection> connections;
	uint64_t version = 0;
};

// --- Records owned by the outside stores ---

struct CharacterRecord {
	std::string id;
	std::string owner;      // account username
	std::string name;
	int level = 1;
	int hitPoints = 1;
	int maxHitPoints = 1;
	CombatStats stats;
	int bankedXp = 0;
	StatusFlags flags;
};

// The only way the core changes a character
struct CharacterMutation {
	std::optional<int> hitPoints;
	std::optional<StatusFlags> flags;
	int bankedXpDelta = 0;
};

struct Party {
	std::string id;
	std::string name;
	std::set<std::string> members;                  // character ids
	int pendingXp = 0;
	std::map<std::string, std::string> henchmen;    // henchman id -> employer id
	std::map<std::string, std::set<std::string>> discoveredRooms; // map id -> room ids
	uint64_t version = 0;
};

struct Account {
	std::string username;
	std::string passwordHash;
	bool isDm = false;
};

// --- Helpers ---

inline std::string make_fight_id(const std::string& mapId, const std::string& roomId)
{
	return mapId + "/" + roomId;
}

const char* fight_state_name(FightState state);
const char* action_type_name(ActionType type);
const char* wound_outcome_name(MortalWoundOutcome outcome);
