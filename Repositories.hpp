// File: Repositories.hpp
// Description: Storage interfaces the campaign core talks to. Each record
// (map, character, party, account) is replaced as a whole inside one
// transaction, so a reader never sees half of a write.
// Implementations: MemoryStores.hpp (tests, storage = "memory") and
// PgStores.hpp (PostgreSQL through libpqxx).
#pragma once

#include "CampaignData.hpp"
#include <optional>
#include <string>
#include <vector>

class MapRepository
{
public:
	virtual ~MapRepository() = default;

	virtual std::optional<Map> load_map(const std::string& mapId) = 0;

	/**
	 * @brief Replaces the stored map document.
	 * Throws CONCURRENCY_CONFLICT when the stored version is not older than
	 * map.version, PERSISTENCE_FAILURE when the write itself fails.
	 */
	virtual void save_map(const Map& map) = 0;

	virtual std::vector<std::string> list_maps() = 0;
};

// The external Character Sheet Store. The core never writes a full record
// back, only CharacterMutation values.
class CharacterStore
{
public:
	virtual ~CharacterStore() = default;

	virtual std::optional<CharacterRecord> get_character(const std::string& characterId) = 0;

	// Throws NOT_FOUND or PERSISTENCE_FAILURE. Returns the updated record.
	virtual CharacterRecord update_character(const std::string& characterId, const CharacterMutation& mutation) = 0;

	// Character creation belongs to the sheet tooling; exposed for seeding and tests
	virtual void put_character(const CharacterRecord& record) = 0;

	virtual std::vector<CharacterRecord> list_characters_for_owner(const std::string& owner) = 0;
};

class PartyRepository
{
public:
	virtual ~PartyRepository() = default;

	virtual std::optional<Party> load_party(const std::string& partyId) = 0;

	// Same version rule as save_map
	virtual void save_party(const Party& party) = 0;

	virtual std::vector<Party> list_parties() = 0;
};

class AccountRepository
{
public:
	virtual ~AccountRepository() = default;

	virtual std::optional<Account> find_account(const std::string& username) = 0;

	// Returns false if the username is already taken
	virtual bool create_account(const Account& account) = 0;
};
