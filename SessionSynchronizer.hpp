// File: SessionSynchronizer.hpp
// Description: The authoritative layer between connected clients and the
// campaign state. Checks who is asking, runs every fight mutation as one
// transaction (validate, resolve, persist, broadcast) under that fight's
// lock, and pushes filtered deltas to every session that can see the change.
#pragma once

#include "CampaignData.hpp"
#include "CombatEngine.hpp"
#include "Dice.hpp"
#include "MapRegistry.hpp"
#include "PartyLedger.hpp"
#include "Repositories.hpp"
#include "ViewFilter.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @class ClientChannel
 * @brief Ordered, reliable outbound message pipe to one client. The
 * WebSocket session implements it; tests record into a vector.
 * send() must not block.
 */
class ClientChannel
{
public:
	virtual ~ClientChannel() = default;
	virtual void send(std::string message) = 0;
	virtual std::string describe() const = 0;
};

enum class OverrideKind : int {
	APPLY_ACTION = 0,   // run an action with no turn or status checks
	SET_HIT_POINTS,     // <= 0 runs the mortal wounds check
	SET_STATUS,
	SET_INITIATIVE,
	ADVANCE_TURN,
	FORCE_RESOLVE
};

struct DmOverride {
	OverrideKind kind = OverrideKind::APPLY_ACTION;
	CombatAction action;                      // APPLY_ACTION
	std::string combatantId;                  // SET_HIT_POINTS, SET_STATUS
	int hitPoints = 0;
	StatusFlags flags;
	WoundModifiers wound;
	std::map<std::string, int> initiative;    // SET_INITIATIVE
	std::vector<int> rolls;
};

/**
 * @brief Reads a DM_OVERRIDE payload. Unknown kinds or treatment timings are
 * a ValidationError.
 */
DmOverride parse_dm_override(const nlohmann::json& payload);

// Answer to a SubmitAction: either resolved now or waiting for the DM
struct SubmitOutcome {
	bool queued = false;
	std::string requestId;
	std::optional<ResolutionResult> result;
};

// A player request that was refused, kept so the DM can force it through
struct RejectedRequest {
	std::string fightId;
	PendingAction request;
	std::string reason;
};

class SessionSynchronizer
{
	struct SyncSession {
		std::shared_ptr<ClientChannel> channel;
		SessionRole role;
		std::shared_ptr<const ViewFilter> filter;
		std::map<std::string, uint64_t> mapVersions; // last version delivered per subscribed map
	};

	MapRegistry& registry_;
	CharacterStore& characters_;
	PartyLedger& ledger_;
	const CombatEngine& engine_;
	DiceRoller& roller_;
	bool require_dm_approval_;

	std::mutex sessions_mutex_;
	std::map<uint64_t, SyncSession> sessions_;
	std::atomic<uint64_t> next_session_id_{ 1 };
	std::atomic<uint64_t> next_request_id_{ 1 };

	std::mutex fight_locks_mutex_;
	std::map<std::string, std::shared_ptr<std::mutex>> fight_locks_;

	std::mutex rejected_mutex_;
	std::deque<RejectedRequest> rejected_;

	// --- Internals ---
	std::shared_ptr<std::mutex> fight_lock(const std::string& fightId);
	SessionRole role_of(uint64_t sessionId);
	void require_dm(uint64_t sessionId, const char* operation);
	RollTape tape_for(uint64_t sessionId, const std::vector<int>& supplied);
	std::shared_ptr<const ViewFilter> build_filter(const SessionRole& role);

	using FightStep = std::function<ResolutionResult(std::optional<Fight>& slot)>;

	/**
	 * @brief One fight mutation: lock, copy, step, persist map, write back
	 * characters, award XP, broadcast. Anything failing after the map commit
	 * is reversed and reported as PERSISTENCE_FAILURE.
	 */
	ResolutionResult run_fight_transaction(const std::string& fightId, const FightStep& step,
		const std::string& revealForParty = "");

	void remember_rejection(RejectedRequest rejected);
	std::optional<RejectedRequest> take_rejection(const std::string& requestId);

	// Takes a waiting request out of the fight's queue, returns who sent it
	std::string remove_request(const std::string& fightId, const std::string& requestId, const char* verb);

	// --- Broadcast ---
	void broadcast_room(const std::shared_ptr<const Map>& map, const std::string& roomId,
		const ResolutionResult* result);
	void broadcast_map(const std::shared_ptr<const Map>& map);
	void broadcast_party(const std::string& partyId);
	void notify_dms(const std::string& message);
	void notify_user(const std::string& username, const std::string& message);
	void send_snapshot_locked(SyncSession& session, const Map& map);

public:
	SessionSynchronizer(MapRegistry& registry, CharacterStore& characters, PartyLedger& ledger,
		const CombatEngine& engine, DiceRoller& roller, bool requireDmApproval);

	// --- Sessions ---

	uint64_t open_session(std::shared_ptr<ClientChannel> channel, SessionRole role);
	void close_session(uint64_t sessionId);
	std::size_t session_count();
	bool session_is_dm(uint64_t sessionId);

	// --- Fights ---

	/**
	 * @brief DM attaches an encounter to an empty room (EMPTY -> FORMING).
	 * Party-side combatants that name a characterId take their stats and
	 * hit points from the Character Sheet Store. Returns the fight id.
	 */
	std::string attach_encounter(uint64_t sessionId, const std::string& mapId, const std::string& roomId,
		std::vector<Combatant> combatants, const std::string& partyId, int treasureValue);

	ResolutionResult start_fight(uint64_t sessionId, const std::string& fightId,
		const std::vector<int>& rolls, bool holdInitiative);
	ResolutionResult begin_round(uint64_t sessionId, const std::string& fightId);
	ResolutionResult cancel_fight(uint64_t sessionId, const std::string& fightId);
	ResolutionResult clear_fight(uint64_t sessionId, const std::string& fightId);

	/**
	 * @brief A player's request (validated, then resolved or queued for
	 * approval) or a DM action (no turn or status checks). Rejected player
	 * requests are reported to the DM with a request id for FORCE_APPLY.
	 */
	SubmitOutcome submit_action(uint64_t sessionId, const std::string& fightId, CombatAction action);

	ResolutionResult dm_override(uint64_t sessionId, const std::string& fightId, const DmOverride& forced);

	ResolutionResult approve_action(uint64_t sessionId, const std::string& fightId, const std::string& requestId,
		const std::vector<int>& rolls);
	void deny_action(uint64_t sessionId, const std::string& fightId, const std::string& requestId);
	ResolutionResult force_apply(uint64_t sessionId, const std::string& requestId, const std::vector<int>& rolls);

	// --- Maps ---

	nlohmann::json get_map_snapshot(uint64_t sessionId, const std::string& mapId);
	std::vector<std::string> list_maps(uint64_t sessionId);
	void put_map(uint64_t sessionId, Map map);
	void put_room(uint64_t sessionId, const std::string& mapId, Room room);
	void delete_room(uint64_t sessionId, const std::string& mapId, const std::string& roomId);
	void connect_rooms(uint64_t sessionId, const std::string& mapId, RoomConnection connection);

	// --- Parties ---

	Party create_party(uint64_t sessionId, const std::string& partyId, const std::string& name);
	Party add_member(uint64_t sessionId, const std::string& partyId, const std::string& characterId);
	Party remove_member(uint64_t sessionId, const std::string& partyId, const std::string& characterId);
	Party add_henchman(uint64_t sessionId, const std::string& partyId, const std::string& henchmanId,
		const std::string& employerId);
	Party reveal_room(uint64_t sessionId, const std::string& partyId, const std::string& mapId,
		const std::string& roomId);
	nlohmann::json get_party(uint64_t sessionId, const std::string& partyId);

	Party allocate_xp(uint64_t sessionId, const std::string& partyId, const XpDistribution& distribution);
	Party allocate_even(uint64_t sessionId, const std::string& partyId, int amount);
};

// "<mapId>/<roomId>"
std::pair<std::string, std::string> split_fight_id(const std::string& fightId);

nlohmann::json resolution_to_json(const ResolutionResult& result);
