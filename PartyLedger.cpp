#include "PartyLedger.hpp"
#include "CampaignError.hpp"
#include <cmath>
#include <iostream>
#include <limits>

PartyLedger::PartyLedger(PartyRepository& parties, CharacterStore& characters, double henchmanShare)
	: parties_(parties), characters_(characters), henchman_share_(henchmanShare)
{
	if (henchmanShare < 0.0 || henchmanShare > 1.0)
		throw_invalid("Henchman XP share must be between 0 and 1.");
}

std::shared_ptr<std::mutex> PartyLedger::lock_for(const std::string& partyId)
{
	std::lock_guard<std::mutex> lock(locks_mutex_);
	auto& slot = party_locks_[partyId];
	if (!slot)
		slot = std::make_shared<std::mutex>();
	return slot;
}

Party PartyLedger::load(const std::string& partyId)
{
	std::optional<Party> party = parties_.load_party(partyId);
	if (!party)
		throw_not_found("Party " + partyId + " not found.");
	return *party;
}

void PartyLedger::store(Party& party)
{
	++party.version;
	parties_.save_party(party);
}

template <typename Fn>
Party PartyLedger::modify(const std::string& partyId, Fn&& fn)
{
	auto mutex = lock_for(partyId);
	std::lock_guard<std::mutex> lock(*mutex);
	Party party = load(partyId);
	fn(party);
	store(party);
	return party;
}

// --- Membership ---

Party PartyLedger::create_party(const std::string& partyId, const std::string& name)
{
	if (partyId.empty())
		throw_invalid("Party id cannot be empty.");

	auto mutex = lock_for(partyId);
	std::lock_guard<std::mutex> lock(*mutex);
	if (parties_.load_party(partyId))
		throw_invalid("Party " + partyId + " already exists.");

	Party party;
	party.id = partyId;
	party.name = name.empty() ? partyId : name;
	store(party);
	std::cout << "[Ledger] Created party " << partyId << std::endl;
	return party;
}

Party PartyLedger::get_party(const std::string& partyId)
{
	return load(partyId);
}

std::vector<Party> PartyLedger::list_parties()
{
	return parties_.list_parties();
}

Party PartyLedger::add_member(const std::string& partyId, const std::string& characterId)
{
	if (!characters_.get_character(characterId))
		throw_not_found("Character " + characterId + " not found.");

	return modify(partyId, [&](Party& party) {
		if (party.henchmen.count(characterId))
			throw_invalid(characterId + " is already a henchman of this party.");
		if (!party.members.insert(characterId).second)
			throw_invalid(characterId + " is already a member.");
		});
}

Party PartyLedger::remove_member(const std::string& partyId, const std::string& characterId)
{
	return modify(partyId, [&](Party& party) {
		if (party.henchmen.erase(characterId))
			return;
		if (!party.members.erase(characterId))
			throw_not_found(characterId + " is not in party " + partyId + ".");
		// Henchmen leave with their employer
		for (auto it = party.henchmen.begin(); it != party.henchmen.end();) {
			if (it->second == characterId) it = party.henchmen.erase(it);
			else ++it;
		}
		});
}

Party PartyLedger::add_henchman(const std::string& partyId, const std::string& henchmanId, const std::string& employerId)
{
	if (!characters_.get_character(henchmanId))
		throw_not_found("Character " + henchmanId + " not found.");

	return modify(partyId, [&](Party& party) {
		if (!party.members.count(employerId))
			throw_invalid("Employer " + employerId + " is not a member of " + partyId + ".");
		if (party.members.count(henchmanId))
			throw_invalid(henchmanId + " is a full member already.");
		party.henchmen[henchmanId] = employerId;
		});
}

Party PartyLedger::reveal_room(const std::string& partyId, const std::string& mapId, const std::string& roomId)
{
	return modify(partyId, [&](Party& party) {
		party.discoveredRooms[mapId].insert(roomId);
		});
}

std::vector<Party> PartyLedger::parties_for_characters(const std::vector<std::string>& characterIds)
{
	std::vector<Party> out;
	for (auto& party : parties_.list_parties()) {
		for (const auto& id : characterIds) {
			if (party.members.count(id) || party.henchmen.count(id)) {
				out.push_back(std::move(party));
				break;
			}
		}
	}
	return out;
}

// --- XP ---

Party PartyLedger::track_pending_xp(const std::string& partyId, int amount)
{
	if (amount < 0)
		throw_invalid("Pending XP can only grow.");

	return modify(partyId, [amount](Party& party) {
		if (static_cast<long long>(party.pendingXp) + amount > std::numeric_limits<int>::max())
			throw_invalid("Pending XP pool of " + party.id + " would overflow.");
		party.pendingXp += amount;
		});
}

Party PartyLedger::revert_pending_xp(const std::string& partyId, int amount)
{
	return modify(partyId, [amount](Party& party) {
		if (party.pendingXp < amount)
			throw_invalid("Pool no longer holds the XP to revert.");
		party.pendingXp -= amount;
		});
}

Party PartyLedger::allocate(const std::string& partyId, const XpDistribution& distribution)
{
	if (distribution.empty())
		throw_invalid("Nothing to allocate.");

	auto mutex = lock_for(partyId);
	std::lock_guard<std::mutex> lock(*mutex);
	Party party = load(partyId);

	// --- Validate everything before the first write ---
	long long total = 0;
	for (const auto& [characterId, xp] : distribution) {
		if (xp <= 0)
			throw_invalid("Share for " + characterId + " must be positive.");
		if (!party.members.count(characterId) && !party.henchmen.count(characterId))
			throw_invalid(characterId + " is not in party " + partyId + ".");
		if (!characters_.get_character(characterId))
			throw_not_found("Character " + characterId + " not found.");
		total += xp;
	}
	if (total > party.pendingXp) {
		throw_invalid("Distribution of " + std::to_string(total) + " XP exceeds the pool of " +
			std::to_string(party.pendingXp) + ".");
	}

	// --- Apply, reversing on failure ---
	std::vector<std::pair<std::string, int>> applied;
	try {
		for (const auto& [characterId, xp] : distribution) {
			CharacterMutation credit;
			credit.bankedXpDelta = xp;
			characters_.update_character(characterId, credit);
			applied.emplace_back(characterId, xp);
		}

		party.pendingXp -= static_cast<int>(total);
		store(party);
	}
	catch (const CampaignError& e) {
		std::cerr << "[Ledger] Allocation for " << partyId << " failed, reverting " << applied.size()
			<< " credits: " << e.what() << std::endl;
		for (auto it = applied.rbegin(); it != applied.rend(); ++it) {
			CharacterMutation debit;
			debit.bankedXpDelta = -it->second;
			try {
				characters_.update_character(it->first, debit);
			}
			catch (const CampaignError& revertError) {
				std::cerr << "[Ledger] CRITICAL: could not revert " << it->second << " XP on "
					<< it->first << ": " << revertError.what() << std::endl;
			}
		}
		throw CampaignError(ErrorKind::PERSISTENCE_FAILURE,
			std::string("XP allocation rolled back: ") + e.what());
	}

	std::cout << "[Ledger] Allocated " << total << " XP from " << partyId
		<< " (" << party.pendingXp << " left in pool)." << std::endl;
	return party;
}

XpDistribution PartyLedger::even_distribution(const std::string& partyId, int amount)
{
	if (amount <= 0)
		throw_invalid("Amount to distribute must be positive.");

	Party party = load(partyId);
	if (party.members.empty())
		throw_invalid("Party " + partyId + " has no members.");

	const double shares = static_cast<double>(party.members.size()) +
		henchman_share_ * static_cast<double>(party.henchmen.size());
	const double unit = static_cast<double>(amount) / shares;

	XpDistribution distribution;
	const int memberShare = static_cast<int>(std::floor(unit + 1e-9));
	const int henchmanShare = static_cast<int>(std::floor(unit * henchman_share_ + 1e-9));
	for (const auto& id : party.members)
		if (memberShare > 0) distribution[id] = memberShare;
	for (const auto& [id, employer] : party.henchmen)
		if (henchmanShare > 0) distribution[id] = henchmanShare;
	return distribution;
}
