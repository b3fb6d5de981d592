// File: CampaignJson.hpp
// Description: nlohmann::json conversions for every campaign structure.
// Used both for persistence (one JSON document per map/character/party)
// and for the payloads sent to clients.
#pragma once

#include "CampaignData.hpp"
#include "CampaignError.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

// Enum <-> name tables. Unlike NLOHMANN_JSON_SERIALIZE_ENUM an unknown
// name is a ValidationError instead of quietly becoming the first value.
#define CAMPAIGN_JSON_ENUM(ENUM_TYPE, ...) \
	inline void to_json(nlohmann::json& j, const ENUM_TYPE& e) \
	{ \
		static const std::pair<ENUM_TYPE, const char*> names[] = __VA_ARGS__; \
		j = nullptr; \
		for (const auto& n : names) \
			if (n.first == e) { j = n.second; return; } \
	} \
	inline void from_json(const nlohmann::json& j, ENUM_TYPE& e) \
	{ \
		static const std::pair<ENUM_TYPE, const char*> names[] = __VA_ARGS__; \
		if (j.is_string()) { \
			const std::string& text = j.get_ref<const std::string&>(); \
			for (const auto& n : names) \
				if (text == n.second) { e = n.first; return; } \
		} \
		throw_invalid("Unknown " #ENUM_TYPE " value " + j.dump() + "."); \
	}

CAMPAIGN_JSON_ENUM(FightState, {
	{FightState::EMPTY, "EMPTY"},
	{FightState::FORMING, "FORMING"},
	{FightState::ACTIVE_INITIATIVE, "ACTIVE_INITIATIVE"},
	{FightState::ACTIVE_ROUND, "ACTIVE_ROUND"},
	{FightState::RESOLVED, "RESOLVED"},
})

CAMPAIGN_JSON_ENUM(Side, {
	{Side::PARTY, "PARTY"},
	{Side::MONSTERS, "MONSTERS"},
})

CAMPAIGN_JSON_ENUM(SavingThrowType, {
	{SavingThrowType::PETRIFICATION_PARALYSIS, "PETRIFICATION_PARALYSIS"},
	{SavingThrowType::POISON_DEATH, "POISON_DEATH"},
	{SavingThrowType::BLAST_BREATH, "BLAST_BREATH"},
	{SavingThrowType::STAFFS_WANDS, "STAFFS_WANDS"},
	{SavingThrowType::SPELLS, "SPELLS"},
})

CAMPAIGN_JSON_ENUM(HitDie, {
	{HitDie::D4, "D4"},
	{HitDie::D6, "D6"},
	{HitDie::D8, "D8"},
	{HitDie::D10, "D10"},
	{HitDie::D12, "D12"},
})

CAMPAIGN_JSON_ENUM(MortalWoundCondition, {
	{MortalWoundCondition::NONE, "NONE"},
	{MortalWoundCondition::DAZED, "DAZED"},
	{MortalWoundCondition::KNOCKED_OUT, "KNOCKED_OUT"},
	{MortalWoundCondition::IN_SHOCK, "IN_SHOCK"},
	{MortalWoundCondition::CRITICALLY_WOUNDED, "CRITICALLY_WOUNDED"},
	{MortalWoundCondition::GRIEVOUSLY_WOUNDED, "GRIEVOUSLY_WOUNDED"},
	{MortalWoundCondition::MORTALLY_WOUNDED, "MORTALLY_WOUNDED"},
	{MortalWoundCondition::INSTANT_DEATH, "INSTANT_DEATH"},
})

CAMPAIGN_JSON_ENUM(MortalWoundOutcome, {
	{MortalWoundOutcome::NONE, "NONE"},
	{MortalWoundOutcome::STABLE, "STABLE"},
	{MortalWoundOutcome::MAIMED_BUT_STABLE, "MAIMED_BUT_STABLE"},
	{MortalWoundOutcome::DIES, "DIES"},
})

CAMPAIGN_JSON_ENUM(ActionType, {
	{ActionType::ATTACK, "ATTACK"},
	{ActionType::MORALE_CHECK, "MORALE_CHECK"},
	{ActionType::SAVING_THROW, "SAVING_THROW"},
	{ActionType::PASS, "PASS"},
	{ActionType::MOVE, "MOVE"},
})

CAMPAIGN_JSON_ENUM(MoveKind, {
	{MoveKind::MOVE, "MOVE"},
	{MoveKind::RUN, "RUN"},
	{MoveKind::CHARGE, "CHARGE"},
	{MoveKind::FIGHTING_WITHDRAWAL, "FIGHTING_WITHDRAWAL"},
	{MoveKind::FULL_RETREAT, "FULL_RETREAT"},
	{MoveKind::SIMPLE_ACTION, "SIMPLE_ACTION"},
})

void to_json(nlohmann::json& j, const SavingThrows& s);
void from_json(const nlohmann::json& j, SavingThrows& s);
void to_json(nlohmann::json& j, const DamageRoll& d);
void from_json(const nlohmann::json& j, DamageRoll& d);
void to_json(nlohmann::json& j, const StatusFlags& f);
void from_json(const nlohmann::json& j, StatusFlags& f);
void to_json(nlohmann::json& j, const CombatStats& s);
void from_json(const nlohmann::json& j, CombatStats& s);
void to_json(nlohmann::json& j, const Combatant& c);
void from_json(const nlohmann::json& j, Combatant& c);
void to_json(nlohmann::json& j, const CombatAction& a);
void from_json(const nlohmann::json& j, CombatAction& a);
void to_json(nlohmann::json& j, const PendingAction& p);
void from_json(const nlohmann::json& j, PendingAction& p);
void to_json(nlohmann::json& j, const ActionLogEntry& e);
void from_json(const nlohmann::json& j, ActionLogEntry& e);
void to_json(nlohmann::json& j, const Fight& f);
void from_json(const nlohmann::json& j, Fight& f);
void to_json(nlohmann::json& j, const RoomConnection& c);
void from_json(const nlohmann::json& j, RoomConnection& c);
void to_json(nlohmann::json& j, const Room& r);
void from_json(const nlohmann::json& j, Room& r);
void to_json(nlohmann::json& j, const Map& m);
void from_json(const nlohmann::json& j, Map& m);
void to_json(nlohmann::json& j, const CharacterRecord& c);
void from_json(const nlohmann::json& j, CharacterRecord& c);
void to_json(nlohmann::json& j, const Party& p);
void from_json(const nlohmann::json& j, Party& p);

/**
 * @brief Parses a client payload, turning json errors into ValidationError.
 */
nlohmann::json parse_payload(const std::string& text);
