#include "PgStores.hpp"
#include "MemoryStores.hpp"
#include "CampaignJson.hpp"
#include "CampaignError.hpp"
#include <iostream>

using json = nlohmann::json;

const char* const CAMPAIGN_SCHEMA_SQL = R"(
    CREATE TABLE IF NOT EXISTS maps (
        id        TEXT PRIMARY KEY,
        version   BIGINT NOT NULL,
        document  JSONB NOT NULL
    );
    CREATE TABLE IF NOT EXISTS characters (
        id        TEXT PRIMARY KEY,
        owner     TEXT NOT NULL,
        document  JSONB NOT NULL
    );
    CREATE INDEX IF NOT EXISTS characters_owner_idx ON characters (owner);
    CREATE TABLE IF NOT EXISTS parties (
        id        TEXT PRIMARY KEY,
        version   BIGINT NOT NULL,
        document  JSONB NOT NULL
    );
    CREATE TABLE IF NOT EXISTS accounts (
        username       TEXT PRIMARY KEY,
        password_hash  TEXT NOT NULL,
        is_dm          BOOLEAN NOT NULL DEFAULT FALSE
    );
)";

namespace {

	// Database and connection errors become PERSISTENCE_FAILURE; domain
	// errors raised inside the transaction pass through untouched.
	[[noreturn]] void raise_persistence(const std::string& what, const std::exception& e)
	{
		std::cerr << "[DB] " << what << " failed: " << e.what() << std::endl;
		throw CampaignError(ErrorKind::PERSISTENCE_FAILURE, what + " failed.");
	}

}

// --- Maps ---

PgMapRepository::PgMapRepository(std::shared_ptr<DatabaseManager> db_manager)
	: db_manager_(std::move(db_manager))
{
}

std::optional<Map> PgMapRepository::load_map(const std::string& mapId)
{
	try {
		pqxx::connection C = db_manager_->get_connection();
		pqxx::nontransaction N(C);
		pqxx::result R = N.exec(pqxx::zview("SELECT document FROM maps WHERE id = $1"), pqxx::params(mapId));
		if (R.empty())
			return std::nullopt;
		return json::parse(R[0]["document"].as<std::string>()).get<Map>();
	}
	catch (const CampaignError&) {
		throw;
	}
	catch (const std::exception& e) {
		raise_persistence("Loading map " + mapId, e);
	}
}

void PgMapRepository::save_map(const Map& map)
{
	const std::string document = json(map).dump();

	try {
		pqxx::connection C = db_manager_->get_connection();
		pqxx::work W(C);

		// Row lock so two servers saving the same map serialize here
		pqxx::result R = W.exec(pqxx::zview("SELECT version FROM maps WHERE id = $1 FOR UPDATE"), pqxx::params(map.id));
		if (!R.empty()) {
			long long stored = R[0]["version"].as<long long>();
			if (stored >= static_cast<long long>(map.version)) {
				throw CampaignError(ErrorKind::CONCURRENCY_CONFLICT,
					"Map " + map.id + " was modified concurrently (stored v" + std::to_string(stored) +
					", saving v" + std::to_string(map.version) + ").");
			}
		}

		std::string sql = R"(
            INSERT INTO maps (id, version, document) VALUES ($1, $2, $3::jsonb)
            ON CONFLICT (id) DO UPDATE SET version = EXCLUDED.version, document = EXCLUDED.document
        )";
		W.exec(pqxx::zview(sql), pqxx::params(map.id, static_cast<long long>(map.version), document));
		W.commit();
	}
	catch (const CampaignError&) {
		throw;
	}
	catch (const std::exception& e) {
		raise_persistence("Saving map " + map.id, e);
	}
}

std::vector<std::string> PgMapRepository::list_maps()
{
	try {
		pqxx::connection C = db_manager_->get_connection();
		pqxx::nontransaction N(C);
		pqxx::result R = N.exec("SELECT id FROM maps ORDER BY id");
		std::vector<std::string> ids;
		for (const auto& row : R)
			ids.push_back(row["id"].as<std::string>());
		return ids;
	}
	catch (const std::exception& e) {
		raise_persistence("Listing maps", e);
	}
}

// --- Characters ---

PgCharacterStore::PgCharacterStore(std::shared_ptr<DatabaseManager> db_manager)
	: db_manager_(std::move(db_manager))
{
}

std::optional<CharacterRecord> PgCharacterStore::get_character(const std::string& characterId)
{
	try {
		pqxx::connection C = db_manager_->get_connection();
		pqxx::nontransaction N(C);
		pqxx::result R = N.exec(pqxx::zview("SELECT document FROM characters WHERE id = $1"), pqxx::params(characterId));
		if (R.empty())
			return std::nullopt;
		return json::parse(R[0]["document"].as<std::string>()).get<CharacterRecord>();
	}
	catch (const CampaignError&) {
		throw;
	}
	catch (const std::exception& e) {
		raise_persistence("Loading character " + characterId, e);
	}
}

CharacterRecord PgCharacterStore::update_character(const std::string& characterId, const CharacterMutation& mutation)
{
	try {
		pqxx::connection C = db_manager_->get_connection();
		pqxx::work W(C);

		pqxx::result R = W.exec(pqxx::zview("SELECT document FROM characters WHERE id = $1 FOR UPDATE"), pqxx::params(characterId));
		if (R.empty())
			throw_not_found("Character " + characterId + " not found.");

		CharacterRecord record = json::parse(R[0]["document"].as<std::string>()).get<CharacterRecord>();
		apply_character_mutation(record, mutation);

		W.exec(pqxx::zview("UPDATE characters SET document = $1::jsonb WHERE id = $2"),
			pqxx::params(json(record).dump(), characterId));
		W.commit();
		return record;
	}
	catch (const CampaignError&) {
		throw;
	}
	catch (const std::exception& e) {
		raise_persistence("Updating character " + characterId, e);
	}
}

void PgCharacterStore::put_character(const CharacterRecord& record)
{
	if (record.id.empty())
		throw_invalid("Character id cannot be empty.");

	try {
		pqxx::connection C = db_manager_->get_connection();
		pqxx::work W(C);
		std::string sql = R"(
            INSERT INTO characters (id, owner, document) VALUES ($1, $2, $3::jsonb)
            ON CONFLICT (id) DO UPDATE SET owner = EXCLUDED.owner, document = EXCLUDED.document
        )";
		W.exec(pqxx::zview(sql), pqxx::params(record.id, record.owner, json(record).dump()));
		W.commit();
	}
	catch (const std::exception& e) {
		raise_persistence("Saving character " + record.id, e);
	}
}

std::vector<CharacterRecord> PgCharacterStore::list_characters_for_owner(const std::string& owner)
{
	try {
		pqxx::connection C = db_manager_->get_connection();
		pqxx::nontransaction N(C);
		pqxx::result R = N.exec(pqxx::zview("SELECT document FROM characters WHERE owner = $1 ORDER BY id"), pqxx::params(owner));
		std::vector<CharacterRecord> out;
		for (const auto& row : R)
			out.push_back(json::parse(row["document"].as<std::string>()).get<CharacterRecord>());
		return out;
	}
	catch (const std::exception& e) {
		raise_persistence("Listing characters for " + owner, e);
	}
}

// --- Parties ---

PgPartyRepository::PgPartyRepository(std::shared_ptr<DatabaseManager> db_manager)
	: db_manager_(std::move(db_manager))
{
}

std::optional<Party> PgPartyRepository::load_party(const std::string& partyId)
{
	try {
		pqxx::connection C = db_manager_->get_connection();
		pqxx::nontransaction N(C);
		pqxx::result R = N.exec(pqxx::zview("SELECT document FROM parties WHERE id = $1"), pqxx::params(partyId));
		if (R.empty())
			return std::nullopt;
		return json::parse(R[0]["document"].as<std::string>()).get<Party>();
	}
	catch (const CampaignError&) {
		throw;
	}
	catch (const std::exception& e) {
		raise_persistence("Loading party " + partyId, e);
	}
}

void PgPartyRepository::save_party(const Party& party)
{
	try {
		pqxx::connection C = db_manager_->get_connection();
		pqxx::work W(C);

		pqxx::result R = W.exec(pqxx::zview("SELECT version FROM parties WHERE id = $1 FOR UPDATE"), pqxx::params(party.id));
		if (!R.empty() && R[0]["version"].as<long long>() >= static_cast<long long>(party.version)) {
			throw CampaignError(ErrorKind::CONCURRENCY_CONFLICT,
				"Party " + party.id + " was modified concurrently.");
		}

		std::string sql = R"(
            INSERT INTO parties (id, version, document) VALUES ($1, $2, $3::jsonb)
            ON CONFLICT (id) DO UPDATE SET version = EXCLUDED.version, document = EXCLUDED.document
        )";
		W.exec(pqxx::zview(sql), pqxx::params(party.id, static_cast<long long>(party.version), json(party).dump()));
		W.commit();
	}
	catch (const CampaignError&) {
		throw;
	}
	catch (const std::exception& e) {
		raise_persistence("Saving party " + party.id, e);
	}
}

std::vector<Party> PgPartyRepository::list_parties()
{
	try {
		pqxx::connection C = db_manager_->get_connection();
		pqxx::nontransaction N(C);
		pqxx::result R = N.exec("SELECT document FROM parties ORDER BY id");
		std::vector<Party> out;
		for (const auto& row : R)
			out.push_back(json::parse(row["document"].as<std::string>()).get<Party>());
		return out;
	}
	catch (const std::exception& e) {
		raise_persistence("Listing parties", e);
	}
}

// --- Accounts ---

PgAccountRepository::PgAccountRepository(std::shared_ptr<DatabaseManager> db_manager)
	: db_manager_(std::move(db_manager))
{
}

std::optional<Account> PgAccountRepository::find_account(const std::string& username)
{
	try {
		pqxx::connection C = db_manager_->get_connection();
		pqxx::nontransaction N(C);
		pqxx::result R = N.exec(pqxx::zview("SELECT username, password_hash, is_dm FROM accounts WHERE username = $1"),
			pqxx::params(username));
		if (R.empty())
			return std::nullopt;

		Account account;
		account.username = R[0]["username"].as<std::string>();
		account.passwordHash = R[0]["password_hash"].as<std::string>();
		account.isDm = R[0]["is_dm"].as<bool>();
		return account;
	}
	catch (const std::exception& e) {
		raise_persistence("Loading account " + username, e);
	}
}

bool PgAccountRepository::create_account(const Account& account)
{
	try {
		pqxx::connection C = db_manager_->get_connection();
		pqxx::work W(C);
		W.exec(pqxx::zview("INSERT INTO accounts (username, password_hash, is_dm) VALUES ($1, $2, $3)"),
			pqxx::params(account.username, account.passwordHash, account.isDm));
		W.commit();
		return true;
	}
	catch (const pqxx::unique_violation& e) {
		std::cerr << "[DB] Registration rejected (unique_violation): " << e.what() << std::endl;
		return false;
	}
	catch (const std::exception& e) {
		raise_persistence("Creating account " + account.username, e);
	}
}
