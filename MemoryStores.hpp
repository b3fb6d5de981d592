// File: MemoryStores.hpp
// Description: In-process implementations of the storage interfaces.
// Used by the test suite and by `"storage": "memory"` in the config.
// Records are kept as serialized JSON so a load always hands back a fresh
// copy, the same as reading it from the database.
#pragma once

#include "Repositories.hpp"
#include <map>
#include <mutex>

class MemoryMapRepository : public MapRepository
{
	std::mutex mutex_;
	std::map<std::string, std::string> documents_;
	std::map<std::string, uint64_t> versions_;

public:
	std::optional<Map> load_map(const std::string& mapId) override;
	void save_map(const Map& map) override;
	std::vector<std::string> list_maps() override;
};

class MemoryCharacterStore : public CharacterStore
{
	std::mutex mutex_;
	std::map<std::string, CharacterRecord> characters_;

public:
	std::optional<CharacterRecord> get_character(const std::string& characterId) override;
	CharacterRecord update_character(const std::string& characterId, const CharacterMutation& mutation) override;
	void put_character(const CharacterRecord& record) override;
	std::vector<CharacterRecord> list_characters_for_owner(const std::string& owner) override;
};

class MemoryPartyRepository : public PartyRepository
{
	std::mutex mutex_;
	std::map<std::string, Party> parties_;

public:
	std::optional<Party> load_party(const std::string& partyId) override;
	void save_party(const Party& party) override;
	std::vector<Party> list_parties() override;
};

class MemoryAccountRepository : public AccountRepository
{
	std::mutex mutex_;
	std::map<std::string, Account> accounts_;

public:
	std::optional<Account> find_account(const std::string& username) override;
	bool create_account(const Account& account) override;
};

// Applies a mutation to a record in place (shared with the PostgreSQL store)
void apply_character_mutation(CharacterRecord& record, const CharacterMutation& mutation);
