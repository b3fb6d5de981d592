// File: PartyLedger.hpp
// Description: The shared XP pool of each party. Fights feed the pool,
// only the DM empties it, and only through allocate(), which either credits
// every listed member and debits the pool or leaves everything as it was.
#pragma once

#include "CampaignData.hpp"
#include "Repositories.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// character id -> XP to bank
using XpDistribution = std::map<std::string, int>;

class PartyLedger
{
	PartyRepository& parties_;
	CharacterStore& characters_;
	double henchman_share_;

	std::mutex locks_mutex_;
	std::map<std::string, std::shared_ptr<std::mutex>> party_locks_;

	std::shared_ptr<std::mutex> lock_for(const std::string& partyId);
	Party load(const std::string& partyId);
	void store(Party& party);

	// Load, mutate, version++, save under the party's lock
	template <typename Fn>
	Party modify(const std::string& partyId, Fn&& fn);

public:
	PartyLedger(PartyRepository& parties, CharacterStore& characters, double henchmanShare);

	double henchman_share() const { return henchman_share_; }

	// --- Membership (DM) ---

	Party create_party(const std::string& partyId, const std::string& name);
	Party get_party(const std::string& partyId);
	std::vector<Party> list_parties();
	Party add_member(const std::string& partyId, const std::string& characterId);
	Party remove_member(const std::string& partyId, const std::string& characterId);

	// Henchmen are characters in the store hired by a party member
	Party add_henchman(const std::string& partyId, const std::string& henchmanId, const std::string& employerId);

	Party reveal_room(const std::string& partyId, const std::string& mapId, const std::string& roomId);

	// Parties any of these characters belong to (as member or henchman)
	std::vector<Party> parties_for_characters(const std::vector<std::string>& characterIds);

	// --- XP ---

	/**
	 * @brief Adds XP to the pending pool. Amount must not be negative.
	 */
	Party track_pending_xp(const std::string& partyId, int amount);

	// Undo of track_pending_xp, for a fight commit that failed later on
	Party revert_pending_xp(const std::string& partyId, int amount);

	/**
	 * @brief Moves XP from the pool to members' banked XP, all or nothing.
	 * Every recipient must be a member or henchman, every share positive and
	 * the total no larger than the pool. If any character write fails the
	 * ones already written are reversed and PERSISTENCE_FAILURE is raised.
	 */
	Party allocate(const std::string& partyId, const XpDistribution& distribution);

	/**
	 * @brief Even split of `amount` between members, each henchman counting
	 * as henchman_share of a member. Integer shares; the remainder is simply
	 * not listed and stays in the pool.
	 */
	XpDistribution even_distribution(const std::string& partyId, int amount);
};
