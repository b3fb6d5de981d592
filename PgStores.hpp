// File: PgStores.hpp
// Description: PostgreSQL implementations of the storage interfaces.
// Every record is one row holding a JSONB document (see CAMPAIGN_SCHEMA_SQL);
// a save is a single INSERT ... ON CONFLICT DO UPDATE inside a pqxx::work,
// so a crash leaves either the old or the new document, never a mix.
#pragma once

#include "Repositories.hpp"
#include "DatabaseManager.hpp"
#include <memory>

class PgMapRepository : public MapRepository
{
	std::shared_ptr<DatabaseManager> db_manager_;

public:
	explicit PgMapRepository(std::shared_ptr<DatabaseManager> db_manager);

	std::optional<Map> load_map(const std::string& mapId) override;
	void save_map(const Map& map) override;
	std::vector<std::string> list_maps() override;
};

class PgCharacterStore : public CharacterStore
{
	std::shared_ptr<DatabaseManager> db_manager_;

public:
	explicit PgCharacterStore(std::shared_ptr<DatabaseManager> db_manager);

	std::optional<CharacterRecord> get_character(const std::string& characterId) override;
	CharacterRecord update_character(const std::string& characterId, const CharacterMutation& mutation) override;
	void put_character(const CharacterRecord& record) override;
	std::vector<CharacterRecord> list_characters_for_owner(const std::string& owner) override;
};

class PgPartyRepository : public PartyRepository
{
	std::shared_ptr<DatabaseManager> db_manager_;

public:
	explicit PgPartyRepository(std::shared_ptr<DatabaseManager> db_manager);

	std::optional<Party> load_party(const std::string& partyId) override;
	void save_party(const Party& party) override;
	std::vector<Party> list_parties() override;
};

class PgAccountRepository : public AccountRepository
{
	std::shared_ptr<DatabaseManager> db_manager_;

public:
	explicit PgAccountRepository(std::shared_ptr<DatabaseManager> db_manager);

	std::optional<Account> find_account(const std::string& username) override;
	bool create_account(const Account& account) override;
};

// DDL for the four tables, run once at startup
extern const char* const CAMPAIGN_SCHEMA_SQL;
