#include "SessionSynchronizer.hpp"
#include "CampaignJson.hpp"
#include "CampaignError.hpp"
#include "FightStateMachine.hpp"
#include <algorithm>
#include <iostream>
#include <set>

using json = nlohmann::json;

static const std::size_t MAX_REMEMBERED_REJECTIONS = 64;

CAMPAIGN_JSON_ENUM(OverrideKind, {
	{OverrideKind::APPLY_ACTION, "APPLY_ACTION"},
	{OverrideKind::SET_HIT_POINTS, "SET_HIT_POINTS"},
	{OverrideKind::SET_STATUS, "SET_STATUS"},
	{OverrideKind::SET_INITIATIVE, "SET_INITIATIVE"},
	{OverrideKind::ADVANCE_TURN, "ADVANCE_TURN"},
	{OverrideKind::FORCE_RESOLVE, "FORCE_RESOLVE"},
})

CAMPAIGN_JSON_ENUM(TreatmentTiming, {
	{TreatmentTiming::NONE, "NONE"},
	{TreatmentTiming::ONE_ROUND, "ONE_ROUND"},
	{TreatmentTiming::ONE_TURN, "ONE_TURN"},
	{TreatmentTiming::ONE_HOUR, "ONE_HOUR"},
	{TreatmentTiming::ONE_DAY, "ONE_DAY"},
	{TreatmentTiming::OVER_ONE_DAY, "OVER_ONE_DAY"},
})

std::pair<std::string, std::string> split_fight_id(const std::string& fightId)
{
	const auto slash = fightId.find('/');
	if (slash == std::string::npos || slash == 0 || slash + 1 >= fightId.size())
		throw_invalid("Malformed fight id '" + fightId + "', expected <mapId>/<roomId>.");
	return { fightId.substr(0, slash), fightId.substr(slash + 1) };
}

DmOverride parse_dm_override(const json& p)
{
	DmOverride forced;
	forced.kind = p.at("kind").get<OverrideKind>();
	if (p.contains("action"))
		forced.action = p.at("action").get<CombatAction>();
	forced.combatantId = p.value("combatantId", std::string());
	forced.hitPoints = p.value("hitPoints", 0);
	if (p.contains("flags"))
		forced.flags = p.at("flags").get<StatusFlags>();
	if (p.contains("wound")) {
		const json& w = p.at("wound");
		forced.wound.healingMagic = w.value("healingMagic", 0);
		forced.wound.healingProficiency = w.value("healingProficiency", 0);
		forced.wound.horsetail = w.value("horsetail", false);
		forced.wound.timing = w.value("timing", TreatmentTiming::NONE);
		forced.wound.other = w.value("other", 0);
	}
	if (p.contains("initiative"))
		forced.initiative = p.at("initiative").get<std::map<std::string, int>>();
	forced.rolls = p.value("rolls", std::vector<int>());
	return forced;
}

json resolution_to_json(const ResolutionResult& result)
{
	json j = {
		{"fightId", result.fightId},
		{"type", result.type},
		{"actorId", result.actorId},
		{"targetId", result.targetId},
		{"summary", result.summary},
		{"rolls", result.rolls},
		{"dmOverride", result.dmOverride},
		{"fightResolved", result.fightResolved},
		{"xpAwarded", result.xpAwarded}
	};

	auto wound_json = [](const MortalWoundResult& w) {
		return json{ {"roll", w.roll}, {"total", w.total}, {"condition", w.condition}, {"outcome", w.outcome} };
		};

	if (result.attack) {
		const AttackResult& a = *result.attack;
		json attack = {
			{"roll", a.roll}, {"total", a.total}, {"hit", a.hit},
			{"critical", a.critical}, {"criticalMiss", a.criticalMiss}, {"damage", a.damage}
		};
		if (a.wound) attack["wound"] = wound_json(*a.wound);
		j["attack"] = attack;
	}
	if (result.morale) {
		json entries = json::array();
		for (const auto& e : result.morale->entries)
			entries.push_back({ {"combatantId", e.combatantId}, {"total", e.total}, {"passed", e.passed} });
		j["morale"] = { {"roll", result.morale->roll}, {"entries", entries} };
	}
	if (result.save)
		j["save"] = { {"roll", result.save->roll}, {"total", result.save->total}, {"passed", result.save->passed} };
	if (result.wound)
		j["wound"] = wound_json(*result.wound);
	return j;
}

namespace {

	Fight& require_fight(std::optional<Fight>& slot, const std::string& fightId)
	{
		if (!slot || slot->state == FightState::EMPTY)
			throw_not_found("No encounter in " + fightId + ".");
		return *slot;
	}

	// What a fight changed on the character records: hit points and the
	// statuses that outlive the fight. Fled/surrendered stay in the fight.
	struct CharacterWriteBack {
		std::string characterId;
		int hitPoints = 0;
		bool dead = false;
		bool mortallyWounded = false;
	};

	std::vector<CharacterWriteBack> character_write_backs(const std::optional<Fight>& before, const std::optional<Fight>& after)
	{
		std::vector<CharacterWriteBack> out;
		if (!before || !after)
			return out;

		for (const auto& c : after->combatants) {
			if (!c.isCharacter())
				continue;
			const Combatant* old = before->find(c.id);
			if (!old)
				continue; // fresh from the store
			if (old->hitPoints == c.hitPoints && old->flags == c.flags)
				continue;
			out.push_back({ c.characterId, c.hitPoints, c.flags.dead, c.flags.mortallyWounded });
		}
		return out;
	}

	void validate_player_action(const Fight& fight, const PlayerRole& player, const CombatAction& action)
	{
		const Combatant* actor = fight.find(action.actorId);
		if (!actor)
			throw_not_found("Combatant " + action.actorId + " is not in this fight.");
		if (!actor->isCharacter() || !player.characterIds.count(actor->characterId))
			throw_illegal("You do not control " + actor->displayName + ".");
		if (action.type == ActionType::MORALE_CHECK || action.groupSide)
			throw_illegal("Only the DM can call for morale checks.");
		if (fight.state != FightState::ACTIVE_ROUND)
			throw_illegal(std::string("Fight is ") + fight_state_name(fight.state) + ", no actions are accepted.");
		if (!actor->canAct())
			throw_illegal(actor->displayName + " is out of the fight.");

		const Combatant* turn = current_actor(fight);
		if (!turn || turn->id != actor->id)
			throw_illegal("It is not " + actor->displayName + "'s turn.");

		if (action.type == ActionType::ATTACK) {
			const Combatant* target = fight.find(action.targetId);
			if (!target)
				throw_not_found("Combatant " + action.targetId + " is not in this fight.");
			if (target->isOut())
				throw_illegal(target->displayName + " is already out of the fight.");
		}

		for (const auto& pending : fight.pendingActions)
			if (pending.action.actorId == actor->id)
				throw_illegal(actor->displayName + " already has a request waiting for the DM.");
	}

	json request_json(const std::string& fightId, const PendingAction& request)
	{
		return json{
			{"requestId", request.requestId},
			{"fightId", fightId},
			{"username", request.username},
			{"action", request.action}
		};
	}

}

SessionSynchronizer::SessionSynchronizer(MapRegistry& registry, CharacterStore& characters, PartyLedger& ledger,
	const CombatEngine& engine, DiceRoller& roller, bool requireDmApproval)
	: registry_(registry)
	, characters_(characters)
	, ledger_(ledger)
	, engine_(engine)
	, roller_(roller)
	, require_dm_approval_(requireDmApproval)
{
}

// --- Sessions ---

std::shared_ptr<const ViewFilter> SessionSynchronizer::build_filter(const SessionRole& role)
{
	std::vector<Party> parties;
	if (const PlayerRole* player = std::get_if<PlayerRole>(&role)) {
		std::vector<std::string> ids(player->characterIds.begin(), player->characterIds.end());
		parties = ledger_.parties_for_characters(ids);
	}
	return std::shared_ptr<const ViewFilter>(make_view_filter(role, parties));
}

uint64_t SessionSynchronizer::open_session(std::shared_ptr<ClientChannel> channel, SessionRole role)
{
	auto filter = build_filter(role);
	const uint64_t id = next_session_id_++;

	std::cout << "[Sync] Session " << id << " opened for " << role_username(role)
		<< (is_dm(role) ? " (DM)" : " (player)") << " on " << channel->describe() << std::endl;

	std::lock_guard<std::mutex> lock(sessions_mutex_);
	SyncSession session;
	session.channel = std::move(channel);
	session.role = std::move(role);
	session.filter = std::move(filter);
	sessions_.emplace(id, std::move(session));
	return id;
}

void SessionSynchronizer::close_session(uint64_t sessionId)
{
	std::lock_guard<std::mutex> lock(sessions_mutex_);
	if (sessions_.erase(sessionId))
		std::cout << "[Sync] Session " << sessionId << " closed." << std::endl;
}

std::size_t SessionSynchronizer::session_count()
{
	std::lock_guard<std::mutex> lock(sessions_mutex_);
	return sessions_.size();
}

bool SessionSynchronizer::session_is_dm(uint64_t sessionId)
{
	return is_dm(role_of(sessionId));
}

SessionRole SessionSynchronizer::role_of(uint64_t sessionId)
{
	std::lock_guard<std::mutex> lock(sessions_mutex_);
	auto it = sessions_.find(sessionId);
	if (it == sessions_.end())
		throw_not_found("Session " + std::to_string(sessionId) + " is not open.");
	return it->second.role;
}

void SessionSynchronizer::require_dm(uint64_t sessionId, const char* operation)
{
	if (!is_dm(role_of(sessionId)))
		throw_illegal(std::string("Only the DM can ") + operation + ".");
}

RollTape SessionSynchronizer::tape_for(uint64_t sessionId, const std::vector<int>& supplied)
{
	// Players never choose their own dice
	if (is_dm(role_of(sessionId)))
		return RollTape(supplied, &roller_);
	return RollTape({}, &roller_);
}

std::shared_ptr<std::mutex> SessionSynchronizer::fight_lock(const std::string& fightId)
{
	std::lock_guard<std::mutex> lock(fight_locks_mutex_);
	auto& slot = fight_locks_[fightId];
	if (!slot)
		slot = std::make_shared<std::mutex>();
	return slot;
}

// --- The fight transaction ---

ResolutionResult SessionSynchronizer::run_fight_transaction(const std::string& fightId, const FightStep& step,
	const std::string& revealForParty)
{
	const auto ids = split_fight_id(fightId);
	const std::string mapId = ids.first;
	const std::string roomId = ids.second;

	auto mutex = fight_lock(fightId);
	std::lock_guard<std::mutex> lock(*mutex);

	// 1. validate + resolve on a copy of the room's fight
	const Room before = registry_.get_room(mapId, roomId);
	std::optional<Fight> slot = before.fight;
	ResolutionResult result = step(slot);
	result.fightId = fightId;

	std::string xpParty;
	int xp = 0;
	if (slot && slot->state == FightState::RESOLVED && !slot->xpAwarded) {
		slot->xpAwarded = true;
		if (!slot->partyId.empty()) {
			xpParty = slot->partyId;
			xp = slot->xpAmount;
		}
	}

	const auto writeBacks = character_write_backs(before.fight, slot);

	// 2. persist the room as part of its map
	std::shared_ptr<const Map> committed = registry_.update_map(mapId, [&](Map& m) {
		require_room(m, roomId).fight = slot;
		});

	// 3. characters and ledger; undo everything if any of it fails
	std::vector<std::pair<std::string, CharacterMutation>> undo;
	bool xpTracked = false;
	try {
		for (const auto& wb : writeBacks) {
			std::optional<CharacterRecord> previous = characters_.get_character(wb.characterId);
			if (!previous)
				throw_not_found("Character " + wb.characterId + " vanished from the store.");

			CharacterMutation mutation;
			mutation.hitPoints = wb.hitPoints;
			StatusFlags flags = previous->flags;
			flags.dead = wb.dead;
			flags.mortallyWounded = wb.mortallyWounded;
			mutation.flags = flags;
			characters_.update_character(wb.characterId, mutation);

			CharacterMutation inverse;
			inverse.hitPoints = previous->hitPoints;
			inverse.flags = previous->flags;
			undo.emplace_back(wb.characterId, inverse);
		}

		if (!xpParty.empty() && xp > 0) {
			ledger_.track_pending_xp(xpParty, xp);
			xpTracked = true;
		}

		if (!revealForParty.empty())
			ledger_.reveal_room(revealForParty, mapId, roomId);
	}
	catch (const CampaignError& e) {
		std::cerr << "[Sync] Commit of " << fightId << " failed after the map save, rolling back: "
			<< e.what() << std::endl;

		for (auto it = undo.rbegin(); it != undo.rend(); ++it) {
			try {
				characters_.update_character(it->first, it->second);
			}
			catch (const CampaignError& revertError) {
				std::cerr << "[Sync] CRITICAL: could not restore character " << it->first << ": "
					<< revertError.what() << std::endl;
			}
		}

		if (xpTracked) {
			try {
				ledger_.revert_pending_xp(xpParty, xp);
			}
			catch (const CampaignError& revertError) {
				std::cerr << "[Sync] CRITICAL: could not take back " << xp << " XP from " << xpParty
					<< ": " << revertError.what() << std::endl;
			}
		}

		try {
			registry_.update_map(mapId, [&](Map& m) {
				require_room(m, roomId).fight = before.fight;
				});
		}
		catch (const CampaignError& revertError) {
			std::cerr << "[Sync] CRITICAL: could not restore room " << fightId << ": "
				<< revertError.what() << std::endl;
		}

		throw CampaignError(ErrorKind::PERSISTENCE_FAILURE,
			"Action on " + fightId + " was rolled back: " + e.what());
	}

	// 4. tell everyone who can see it
	broadcast_room(committed, roomId, &result);
	if (!xpParty.empty() && xp > 0)
		broadcast_party(xpParty);
	if (!revealForParty.empty() && revealForParty != xpParty)
		broadcast_party(revealForParty);

	return result;
}

void SessionSynchronizer::remember_rejection(RejectedRequest rejected)
{
	std::lock_guard<std::mutex> lock(rejected_mutex_);
	rejected_.push_back(std::move(rejected));
	while (rejected_.size() > MAX_REMEMBERED_REJECTIONS)
		rejected_.pop_front();
}

std::optional<RejectedRequest> SessionSynchronizer::take_rejection(const std::string& requestId)
{
	std::lock_guard<std::mutex> lock(rejected_mutex_);
	for (auto it = rejected_.begin(); it != rejected_.end(); ++it) {
		if (it->request.requestId == requestId) {
			RejectedRequest found = std::move(*it);
			rejected_.erase(it);
			return found;
		}
	}
	return std::nullopt;
}

// --- Fights ---

std::string SessionSynchronizer::attach_encounter(uint64_t sessionId, const std::string& mapId, const std::string& roomId,
	std::vector<Combatant> combatants, const std::string& partyId, int treasureValue)
{
	require_dm(sessionId, "attach encounters");
	if (!partyId.empty())
		ledger_.get_party(partyId);

	// Player characters and henchmen fight with their sheet
	for (auto& c : combatants) {
		if (!c.isCharacter())
			continue;
		std::optional<CharacterRecord> record = characters_.get_character(c.characterId);
		if (!record)
			throw_not_found("Character " + c.characterId + " not found.");
		if (record->flags.dead || record->hitPoints <= 0)
			throw_invalid(record->name + " is in no condition to fight.");

		c.side = Side::PARTY;
		c.stats = record->stats;
		c.stats.usesMortalWounds = true;
		c.hitPoints = record->hitPoints;
		c.maxHitPoints = record->maxHitPoints;
		if (c.displayName.empty() || c.displayName == c.id)
			c.displayName = record->name;
	}

	const std::string fightId = make_fight_id(mapId, roomId);
	run_fight_transaction(fightId, [&](std::optional<Fight>& slot) {
		if (slot && slot->state != FightState::EMPTY) {
			throw_illegal(std::string("Room already holds a ") + fight_state_name(slot->state) +
				" fight; clear it first.");
		}
		slot = form_fight(fightId, std::move(combatants), partyId, treasureValue);

		ResolutionResult result;
		result.summary = "Encounter attached (" + std::to_string(slot->combatants.size()) + " combatants)";
		result.dmOverride = true;
		return result;
		}, partyId);

	std::cout << "[Sync] Encounter attached to " << fightId << std::endl;
	return fightId;
}

ResolutionResult SessionSynchronizer::start_fight(uint64_t sessionId, const std::string& fightId,
	const std::vector<int>& rolls, bool holdInitiative)
{
	require_dm(sessionId, "start fights");
	RollTape tape = tape_for(sessionId, rolls);
	return run_fight_transaction(fightId, [&](std::optional<Fight>& slot) {
		return engine_.roll_initiative(require_fight(slot, fightId), tape, holdInitiative);
		});
}

ResolutionResult SessionSynchronizer::begin_round(uint64_t sessionId, const std::string& fightId)
{
	require_dm(sessionId, "begin rounds");
	return run_fight_transaction(fightId, [&](std::optional<Fight>& slot) {
		return engine_.begin_first_round(require_fight(slot, fightId));
		});
}

ResolutionResult SessionSynchronizer::cancel_fight(uint64_t sessionId, const std::string& fightId)
{
	require_dm(sessionId, "cancel fights");
	return run_fight_transaction(fightId, [&](std::optional<Fight>& slot) {
		::cancel_fight(require_fight(slot, fightId));
		slot.reset();
		ResolutionResult result;
		result.summary = "Encounter cancelled";
		result.dmOverride = true;
		return result;
		});
}

ResolutionResult SessionSynchronizer::clear_fight(uint64_t sessionId, const std::string& fightId)
{
	require_dm(sessionId, "clear fights");
	return run_fight_transaction(fightId, [&](std::optional<Fight>& slot) {
		if (!slot)
			throw_not_found("No encounter in " + fightId + ".");
		if (slot->state != FightState::RESOLVED && slot->state != FightState::EMPTY) {
			throw_illegal(std::string("Fight is ") + fight_state_name(slot->state) +
				"; only resolved fights can be cleared.");
		}
		slot.reset();
		ResolutionResult result;
		result.summary = "Encounter cleared";
		result.dmOverride = true;
		return result;
		});
}

SubmitOutcome SessionSynchronizer::submit_action(uint64_t sessionId, const std::string& fightId, CombatAction action)
{
	const SessionRole role = role_of(sessionId);
	SubmitOutcome outcome;

	if (is_dm(role)) {
		RollTape tape = tape_for(sessionId, action.rolls);
		outcome.result = run_fight_transaction(fightId, [&](std::optional<Fight>& slot) {
			return engine_.apply_action(require_fight(slot, fightId), action, tape, true);
			});
		return outcome;
	}

	const PlayerRole& player = std::get<PlayerRole>(role);
	action.rolls.clear();

	PendingAction request;
	request.requestId = "req-" + std::to_string(next_request_id_++);
	request.username = player.username;
	request.action = action;
	outcome.requestId = request.requestId;

	try {
		if (require_dm_approval_) {
			run_fight_transaction(fightId, [&](std::optional<Fight>& slot) {
				Fight& fight = require_fight(slot, fightId);
				validate_player_action(fight, player, action);
				fight.pendingActions.push_back(request);

				ResolutionResult result;
				result.type = action.type;
				result.actorId = action.actorId;
				result.summary = "Waiting for the DM";
				return result;
				});
			outcome.queued = true;
			notify_dms("SERVER:APPROVAL_REQUEST:" + request_json(fightId, request).dump());
			return outcome;
		}

		RollTape tape({}, &roller_);
		outcome.result = run_fight_transaction(fightId, [&](std::optional<Fight>& slot) {
			Fight& fight = require_fight(slot, fightId);
			validate_player_action(fight, player, action);
			return engine_.apply_action(fight, action, tape, false);
			});
		return outcome;
	}
	catch (const CampaignError& e) {
		if (e.kind() == ErrorKind::ILLEGAL_ACTION) {
			json notice = request_json(fightId, request);
			notice["reason"] = e.what();
			remember_rejection({ fightId, request, e.what() });
			notify_dms("SERVER:ACTION_REJECTED:" + notice.dump());
		}
		throw;
	}
}

ResolutionResult SessionSynchronizer::dm_override(uint64_t sessionId, const std::string& fightId, const DmOverride& forced)
{
	require_dm(sessionId, "override fights");
	RollTape tape = tape_for(sessionId, forced.rolls.empty() ? forced.action.rolls : forced.rolls);

	return run_fight_transaction(fightId, [&](std::optional<Fight>& slot) {
		Fight& fight = require_fight(slot, fightId);
		switch (forced.kind) {
		case OverrideKind::APPLY_ACTION:
			return engine_.apply_action(fight, forced.action, tape, true);
		case OverrideKind::SET_HIT_POINTS:
			return engine_.set_hit_points(fight, forced.combatantId, forced.hitPoints, tape, forced.wound);
		case OverrideKind::SET_STATUS:
			return engine_.set_status(fight, forced.combatantId, forced.flags);
		case OverrideKind::SET_INITIATIVE:
			return engine_.override_initiative(fight, forced.initiative);
		case OverrideKind::ADVANCE_TURN:
			return engine_.force_advance(fight);
		case OverrideKind::FORCE_RESOLVE:
			return engine_.force_resolution(fight);
		}
		throw_invalid("Unknown override.");
		});
}

ResolutionResult SessionSynchronizer::approve_action(uint64_t sessionId, const std::string& fightId,
	const std::string& requestId, const std::vector<int>& rolls)
{
	require_dm(sessionId, "approve requests");
	RollTape tape = tape_for(sessionId, rolls);
	std::optional<PendingAction> approved;

	try {
		ResolutionResult result = run_fight_transaction(fightId, [&](std::optional<Fight>& slot) {
			Fight& fight = require_fight(slot, fightId);
			auto it = std::find_if(fight.pendingActions.begin(), fight.pendingActions.end(),
				[&](const PendingAction& p) { return p.requestId == requestId; });
			if (it == fight.pendingActions.end())
				throw_not_found("Request " + requestId + " is not waiting in " + fightId + ".");

			approved = *it;
			fight.pendingActions.erase(it);
			return engine_.apply_action(fight, approved->action, tape, false);
			});
		return result;
	}
	catch (const CampaignError& e) {
		if (!approved)
			throw;
		if (e.kind() == ErrorKind::ILLEGAL_ACTION)
			remember_rejection({ fightId, *approved, e.what() });

		// The action itself was bad: take it out of the queue so the actor can ask again.
		// Storage trouble leaves it waiting for another approve.
		if (e.kind() != ErrorKind::PERSISTENCE_FAILURE && e.kind() != ErrorKind::CONCURRENCY_CONFLICT) {
			try {
				remove_request(fightId, requestId, "dropped");
				notify_user(approved->username, "SERVER:ACTION_DENIED:" + requestId);
			}
			catch (const CampaignError& removeError) {
				std::cerr << "[Sync] Could not drop failed request " << requestId << " from " << fightId
					<< ": " << removeError.what() << std::endl;
			}
		}
		throw;
	}
}

std::string SessionSynchronizer::remove_request(const std::string& fightId, const std::string& requestId,
	const char* verb)
{
	std::string username;
	run_fight_transaction(fightId, [&](std::optional<Fight>& slot) {
		Fight& fight = require_fight(slot, fightId);
		auto it = std::find_if(fight.pendingActions.begin(), fight.pendingActions.end(),
			[&](const PendingAction& p) { return p.requestId == requestId; });
		if (it == fight.pendingActions.end())
			throw_not_found("Request " + requestId + " is not waiting in " + fightId + ".");

		username = it->username;
		fight.pendingActions.erase(it);

		ResolutionResult result;
		result.summary = "Request " + requestId + " " + verb;
		result.dmOverride = true;
		return result;
		});
	return username;
}

void SessionSynchronizer::deny_action(uint64_t sessionId, const std::string& fightId, const std::string& requestId)
{
	require_dm(sessionId, "deny requests");
	const std::string username = remove_request(fightId, requestId, "denied");
	notify_user(username, "SERVER:ACTION_DENIED:" + requestId);
}

ResolutionResult SessionSynchronizer::force_apply(uint64_t sessionId, const std::string& requestId,
	const std::vector<int>& rolls)
{
	require_dm(sessionId, "force actions through");
	std::optional<RejectedRequest> rejected = take_rejection(requestId);
	if (!rejected)
		throw_not_found("No rejected request " + requestId + ".");

	CombatAction action = rejected->request.action;
	RollTape tape = tape_for(sessionId, rolls);
	try {
		return run_fight_transaction(rejected->fightId, [&](std::optional<Fight>& slot) {
			Fight& fight = require_fight(slot, rejected->fightId);
			auto it = std::find_if(fight.pendingActions.begin(), fight.pendingActions.end(),
				[&](const PendingAction& p) { return p.requestId == requestId; });
			if (it != fight.pendingActions.end())
				fight.pendingActions.erase(it);
			return engine_.apply_action(fight, action, tape, true);
			});
	}
	catch (const CampaignError&) {
		remember_rejection(*rejected);
		throw;
	}
}

// --- Maps ---

json SessionSynchronizer::get_map_snapshot(uint64_t sessionId, const std::string& mapId)
{
	std::shared_ptr<const Map> map = registry_.get_map(mapId);

	std::lock_guard<std::mutex> lock(sessions_mutex_);
	auto it = sessions_.find(sessionId);
	if (it == sessions_.end())
		throw_not_found("Session " + std::to_string(sessionId) + " is not open.");

	// Sent from here, under the lock, so no delta can overtake it
	send_snapshot_locked(it->second, *map);
	return it->second.filter->map_view(*map);
}

std::vector<std::string> SessionSynchronizer::list_maps(uint64_t sessionId)
{
	const SessionRole role = role_of(sessionId);
	std::vector<std::string> all = registry_.list_maps();
	if (is_dm(role))
		return all;

	const PlayerRole& player = std::get<PlayerRole>(role);
	std::set<std::string> known;
	for (const auto& party : ledger_.parties_for_characters(
		std::vector<std::string>(player.characterIds.begin(), player.characterIds.end()))) {
		for (const auto& [mapId, rooms] : party.discoveredRooms)
			if (!rooms.empty()) known.insert(mapId);
	}

	std::vector<std::string> out;
	for (const auto& id : all)
		if (known.count(id)) out.push_back(id);
	return out;
}

void SessionSynchronizer::put_map(uint64_t sessionId, Map map)
{
	require_dm(sessionId, "edit maps");
	if (map.id.find('/') != std::string::npos)
		throw_invalid("Map ids cannot contain '/'.");
	broadcast_map(registry_.put_map(std::move(map)));
}

void SessionSynchronizer::put_room(uint64_t sessionId, const std::string& mapId, Room room)
{
	require_dm(sessionId, "edit maps");
	const std::string roomId = room.id;
	broadcast_room(registry_.put_room(mapId, std::move(room)), roomId, nullptr);
}

void SessionSynchronizer::delete_room(uint64_t sessionId, const std::string& mapId, const std::string& roomId)
{
	require_dm(sessionId, "edit maps");
	auto mutex = fight_lock(make_fight_id(mapId, roomId));
	std::lock_guard<std::mutex> lock(*mutex);
	broadcast_map(registry_.delete_room(mapId, roomId));
}

void SessionSynchronizer::connect_rooms(uint64_t sessionId, const std::string& mapId, RoomConnection connection)
{
	require_dm(sessionId, "edit maps");
	broadcast_map(registry_.connect_rooms(mapId, std::move(connection)));
}

// --- Parties ---

Party SessionSynchronizer::create_party(uint64_t sessionId, const std::string& partyId, const std::string& name)
{
	require_dm(sessionId, "create parties");
	Party party = ledger_.create_party(partyId, name);
	broadcast_party(partyId);
	return party;
}

Party SessionSynchronizer::add_member(uint64_t sessionId, const std::string& partyId, const std::string& characterId)
{
	require_dm(sessionId, "change parties");
	Party party = ledger_.add_member(partyId, characterId);
	broadcast_party(partyId);
	return party;
}

Party SessionSynchronizer::remove_member(uint64_t sessionId, const std::string& partyId, const std::string& characterId)
{
	require_dm(sessionId, "change parties");
	Party party = ledger_.remove_member(partyId, characterId);
	broadcast_party(partyId);
	return party;
}

Party SessionSynchronizer::add_henchman(uint64_t sessionId, const std::string& partyId, const std::string& henchmanId,
	const std::string& employerId)
{
	require_dm(sessionId, "change parties");
	Party party = ledger_.add_henchman(partyId, henchmanId, employerId);
	broadcast_party(partyId);
	return party;
}

Party SessionSynchronizer::reveal_room(uint64_t sessionId, const std::string& partyId, const std::string& mapId,
	const std::string& roomId)
{
	require_dm(sessionId, "reveal rooms");
	registry_.get_room(mapId, roomId);
	Party party = ledger_.reveal_room(partyId, mapId, roomId);
	broadcast_party(partyId);
	return party;
}

json SessionSynchronizer::get_party(uint64_t sessionId, const std::string& partyId)
{
	const SessionRole role = role_of(sessionId);
	Party party = ledger_.get_party(partyId);
	auto filter = build_filter(role);
	if (!filter->can_see_party(party))
		throw_not_found("Party " + partyId + " not found.");
	return filter->party_view(party);
}

Party SessionSynchronizer::allocate_xp(uint64_t sessionId, const std::string& partyId, const XpDistribution& distribution)
{
	require_dm(sessionId, "allocate XP");
	Party party = ledger_.allocate(partyId, distribution);
	broadcast_party(partyId);
	return party;
}

Party SessionSynchronizer::allocate_even(uint64_t sessionId, const std::string& partyId, int amount)
{
	require_dm(sessionId, "allocate XP");
	Party party = ledger_.allocate(partyId, ledger_.even_distribution(partyId, amount));
	broadcast_party(partyId);
	return party;
}

// --- Broadcast ---

void SessionSynchronizer::send_snapshot_locked(SyncSession& session, const Map& map)
{
	json view = session.filter->map_view(map);
	view["version"] = map.version;
	session.channel->send("SERVER:MAP_SNAPSHOT:" + view.dump());
	session.mapVersions[map.id] = map.version;
}

void SessionSynchronizer::broadcast_room(const std::shared_ptr<const Map>& map, const std::string& roomId,
	const ResolutionResult* result)
{
	auto room = map->rooms.find(roomId);
	if (room == map->rooms.end()) {
		broadcast_map(map);
		return;
	}

	int sent = 0;
	std::lock_guard<std::mutex> lock(sessions_mutex_);
	for (auto& [id, session] : sessions_) {
		auto delivered = session.mapVersions.find(map->id);
		if (delivered == session.mapVersions.end())
			continue; // not watching this map
		if (delivered->second >= map->version)
			continue; // already has this state or newer

		if (delivered->second + 1 != map->version) {
			// Missed something in between
			send_snapshot_locked(session, *map);
			++sent;
			continue;
		}

		delivered->second = map->version;
		if (!session.filter->can_see_room(*map, room->second))
			continue;

		json delta = {
			{"mapId", map->id},
			{"version", map->version},
			{"room", session.filter->room_view(*map, room->second)}
		};
		if (result)
			delta["result"] = resolution_to_json(*result);
		session.channel->send("SERVER:ROOM_DELTA:" + delta.dump());
		++sent;
	}

	std::cout << "[Broadcast] " << map->id << "/" << roomId << " v" << map->version
		<< " sent to " << sent << " session(s)." << std::endl;
}

void SessionSynchronizer::broadcast_map(const std::shared_ptr<const Map>& map)
{
	std::lock_guard<std::mutex> lock(sessions_mutex_);
	for (auto& [id, session] : sessions_) {
		auto delivered = session.mapVersions.find(map->id);
		if (delivered == session.mapVersions.end() || delivered->second >= map->version)
			continue;
		send_snapshot_locked(session, *map);
	}
}

void SessionSynchronizer::broadcast_party(const std::string& partyId)
{
	std::optional<Party> party;
	try {
		party = ledger_.get_party(partyId);
	}
	catch (const CampaignError& e) {
		std::cerr << "[Broadcast] Party " << partyId << " unavailable: " << e.what() << std::endl;
		return;
	}

	// Players in this party may see different rooms now
	std::vector<std::pair<uint64_t, SessionRole>> affected;
	{
		std::lock_guard<std::mutex> lock(sessions_mutex_);
		for (const auto& [id, session] : sessions_) {
			const PlayerRole* player = std::get_if<PlayerRole>(&session.role);
			if (!player)
				continue;
			for (const auto& characterId : player->characterIds) {
				if (party->members.count(characterId) || party->henchmen.count(characterId)) {
					affected.emplace_back(id, session.role);
					break;
				}
			}
		}
	}

	std::map<uint64_t, std::shared_ptr<const ViewFilter>> rebuilt;
	std::set<std::string> watchedMaps;
	for (const auto& [id, role] : affected) {
		try {
			rebuilt[id] = build_filter(role);
		}
		catch (const CampaignError& e) {
			std::cerr << "[Broadcast] Could not refresh view of session " << id << ": " << e.what() << std::endl;
		}
	}
	{
		std::lock_guard<std::mutex> lock(sessions_mutex_);
		for (const auto& [id, filter] : rebuilt) {
			auto it = sessions_.find(id);
			if (it == sessions_.end())
				continue;
			for (const auto& [mapId, version] : it->second.mapVersions)
				watchedMaps.insert(mapId);
		}
	}

	std::vector<std::shared_ptr<const Map>> maps;
	for (const auto& mapId : watchedMaps) {
		try {
			maps.push_back(registry_.get_map(mapId));
		}
		catch (const CampaignError& e) {
			std::cerr << "[Broadcast] Map " << mapId << " unavailable: " << e.what() << std::endl;
		}
	}

	std::lock_guard<std::mutex> lock(sessions_mutex_);
	for (auto& [id, session] : sessions_) {
		auto filter = rebuilt.find(id);
		if (filter != rebuilt.end()) {
			session.filter = filter->second;
			for (const auto& map : maps)
				if (session.mapVersions.count(map->id))
					send_snapshot_locked(session, *map);
		}
		if (session.filter->can_see_party(*party))
			session.channel->send("SERVER:PARTY_UPDATE:" + session.filter->party_view(*party).dump());
	}
}

void SessionSynchronizer::notify_dms(const std::string& message)
{
	std::lock_guard<std::mutex> lock(sessions_mutex_);
	for (auto& [id, session] : sessions_)
		if (is_dm(session.role))
			session.channel->send(message);
}

void SessionSynchronizer::notify_user(const std::string& username, const std::string& message)
{
	std::lock_guard<std::mutex> lock(sessions_mutex_);
	for (auto& [id, session] : sessions_)
		if (role_username(session.role) == username)
			session.channel->send(message);
}
