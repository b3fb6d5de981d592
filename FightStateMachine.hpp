// File: FightStateMachine.hpp
// Description: Lifecycle of the encounter embedded in a room.
//
//   EMPTY -> FORMING             attach_encounter
//   FORMING -> EMPTY             cancel (the room's fight slot is cleared)
//   FORMING -> ACTIVE_INITIATIVE start_fight (rolls initiative)
//   ACTIVE_INITIATIVE -> ACTIVE_ROUND   begin_round (order fixed, round 1)
//   ACTIVE_ROUND -> ACTIVE_ROUND        advance_turn
//   ACTIVE_* -> RESOLVED         check_termination / force_resolve
//
// Every function either completes the transition or throws before touching
// the fight. Callers work on a copy anyway.
#pragma once

#include "CampaignData.hpp"
#include "Dice.hpp"
#include <map>
#include <string>
#include <vector>

/**
 * @brief Builds a FORMING fight from the DM's combatant list.
 * Ids must be unique and non-empty, hit points positive.
 */
Fight form_fight(const std::string& fightId, std::vector<Combatant> combatants,
	const std::string& partyId, int treasureValue);

// FORMING only. The caller clears the room's fight slot afterwards.
void cancel_fight(Fight& fight);

/**
 * @brief FORMING -> ACTIVE_INITIATIVE. Rolls 1d6 + initiative modifier for
 * every combatant from the tape.
 */
void start_fight(Fight& fight, RollTape& rolls);

// ACTIVE_INITIATIVE only: the DM replaces individual initiative values
void set_initiative(Fight& fight, const std::map<std::string, int>& values);

/**
 * @brief ACTIVE_INITIATIVE -> ACTIVE_ROUND. Sorts by initiative (highest
 * first, Monsters before Party on a tie, then attach order), sets round 1
 * and points the turn at the first combatant able to act. Termination is
 * left to the caller.
 */
void begin_round(Fight& fight);

/**
 * @brief Moves the turn to the next combatant that can act. Wrapping past
 * the end of the order starts a new round.
 */
void advance_turn(Fight& fight);

// True when every combatant of the side is dead, fled, surrendered or down
bool side_defeated(const Fight& fight, Side side);

/**
 * @brief Moves an active fight to RESOLVED if one side is out.
 * Returns true when the transition happened on this call.
 */
bool check_termination(Fight& fight);

// DM forced termination, from any active state
void force_resolve(Fight& fight);

bool fight_is_active(const Fight& fight);

// Combatant whose turn it is, or nullptr outside ACTIVE_ROUND
const Combatant* current_actor(const Fight& fight);
