#include "MemoryStores.hpp"
#include "CampaignJson.hpp"
#include "CampaignError.hpp"
#include <limits>

void apply_character_mutation(CharacterRecord& record, const CharacterMutation& mutation)
{
	if (mutation.hitPoints) record.hitPoints = *mutation.hitPoints;
	if (mutation.flags) record.flags = *mutation.flags;
	const long long banked = static_cast<long long>(record.bankedXp) + mutation.bankedXpDelta;
	if (banked < 0)
		throw_invalid("Banked XP of " + record.id + " would drop below zero.");
	if (banked > std::numeric_limits<int>::max())
		throw_invalid("Banked XP of " + record.id + " would overflow.");
	record.bankedXp = static_cast<int>(banked);
}

// --- Maps ---

std::optional<Map> MemoryMapRepository::load_map(const std::string& mapId)
{
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = documents_.find(mapId);
	if (it == documents_.end())
		return std::nullopt;
	return nlohmann::json::parse(it->second).get<Map>();
}

void MemoryMapRepository::save_map(const Map& map)
{
	std::string document = nlohmann::json(map).dump();

	std::lock_guard<std::mutex> lock(mutex_);
	auto it = versions_.find(map.id);
	if (it != versions_.end() && it->second >= map.version) {
		throw CampaignError(ErrorKind::CONCURRENCY_CONFLICT,
			"Map " + map.id + " was modified concurrently (stored v" + std::to_string(it->second) +
			", saving v" + std::to_string(map.version) + ").");
	}
	documents_[map.id] = std::move(document);
	versions_[map.id] = map.version;
}

std::vector<std::string> MemoryMapRepository::list_maps()
{
	std::lock_guard<std::mutex> lock(mutex_);
	std::vector<std::string> ids;
	for (const auto& [id, doc] : documents_)
		ids.push_back(id);
	return ids;
}

// --- Characters ---

std::optional<CharacterRecord> MemoryCharacterStore::get_character(const std::string& characterId)
{
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = characters_.find(characterId);
	if (it == characters_.end())
		return std::nullopt;
	return it->second;
}

CharacterRecord MemoryCharacterStore::update_character(const std::string& characterId, const CharacterMutation& mutation)
{
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = characters_.find(characterId);
	if (it == characters_.end())
		throw_not_found("Character " + characterId + " not found.");

	// Work on a copy so a rejected mutation leaves the record alone
	CharacterRecord updated = it->second;
	apply_character_mutation(updated, mutation);
	it->second = updated;
	return updated;
}

void MemoryCharacterStore::put_character(const CharacterRecord& record)
{
	if (record.id.empty())
		throw_invalid("Character id cannot be empty.");
	std::lock_guard<std::mutex> lock(mutex_);
	characters_[record.id] = record;
}

std::vector<CharacterRecord> MemoryCharacterStore::list_characters_for_owner(const std::string& owner)
{
	std::lock_guard<std::mutex> lock(mutex_);
	std::vector<CharacterRecord> out;
	for (const auto& [id, record] : characters_)
		if (record.owner == owner)
			out.push_back(record);
	return out;
}

// --- Parties ---

std::optional<Party> MemoryPartyRepository::load_party(const std::string& partyId)
{
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = parties_.find(partyId);
	if (it == parties_.end())
		return std::nullopt;
	return it->second;
}

void MemoryPartyRepository::save_party(const Party& party)
{
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = parties_.find(party.id);
	if (it != parties_.end() && it->second.version >= party.version) {
		throw CampaignError(ErrorKind::CONCURRENCY_CONFLICT,
			"Party " + party.id + " was modified concurrently.");
	}
	parties_[party.id] = party;
}

std::vector<Party> MemoryPartyRepository::list_parties()
{
	std::lock_guard<std::mutex> lock(mutex_);
	std::vector<Party> out;
	for (const auto& [id, party] : parties_)
		out.push_back(party);
	return out;
}

// --- Accounts ---

std::optional<Account> MemoryAccountRepository::find_account(const std::string& username)
{
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = accounts_.find(username);
	if (it == accounts_.end())
		return std::nullopt;
	return it->second;
}

bool MemoryAccountRepository::create_account(const Account& account)
{
	std::lock_guard<std::mutex> lock(mutex_);
	return accounts_.emplace(account.username, account).second;
}
