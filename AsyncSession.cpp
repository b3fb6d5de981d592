#include "AsyncSession.hpp"
#include "CampaignError.hpp"
#include "CampaignJson.hpp"
#include <sodium.h>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace {

	std::string str(const json& p, const char* key)
	{
		return p.at(key).get<std::string>();
	}

	std::vector<int> rolls_of(const json& p)
	{
		return p.value("rolls", std::vector<int>());
	}

}

/**
 * @brief Constructs the session, moving the socket into the WebSocket stream.
 */
AsyncSession::AsyncSession(
	tcp::socket socket,
	std::shared_ptr<CampaignServices> services,
	std::shared_ptr<ThreadPool> db_pool
)
	: ws_(std::move(socket))
	, client_address_(ws_.next_layer().remote_endpoint().address().to_string())
	, services_(std::move(services))
	, db_pool_(std::move(db_pool))
{
	std::cout << "--- New Client Connected from: " << client_address_ << " ---" << std::endl;
}

AsyncSession::~AsyncSession() noexcept
{
	std::cout << "[" << client_address_ << "] Session released." << std::endl;
}

/**
 * @brief Starts the session by posting the on_run handler to the strand.
 */
void AsyncSession::run()
{
	net::dispatch(ws_.get_executor(),
		[self = shared_from_this()]()
		{
			self->on_run();
		});
}

/**
 * @brief Performs the WebSocket handshake.
 */
void AsyncSession::on_run()
{
	ws_.async_accept(
		net::bind_executor(ws_.get_executor(),
			[self = shared_from_this()](beast::error_code ec)
			{
				if (ec)
				{
					std::cerr << "[" << self->client_address_ << "] Handshake Error: " << ec.message() << "\n";
					return self->on_session_end();
				}

				std::cout << "[" << self->client_address_ << "] Handshake successful. Session started.\n";
				self->send("SERVER:WELCOME! Please log in or register.");
				self->do_read();
			}));
}

/**
 * @brief Posts an asynchronous read operation.
 */
void AsyncSession::do_read()
{
	ws_.async_read(buffer_,
		net::bind_executor(ws_.get_executor(),
			[self = shared_from_this()](beast::error_code ec, std::size_t bytes)
			{
				self->on_read(ec, bytes);
			}));
}

/**
 * @brief Callback for when a read completes.
 */
void AsyncSession::on_read(beast::error_code ec, std::size_t bytes_transferred)
{
	boost::ignore_unused(bytes_transferred);

	if (ec == websocket::error::closed || ec == net::error::eof || ec == net::error::operation_aborted)
		return on_session_end();

	if (ec)
	{
		std::cerr << "[" << client_address_ << "] Read Error: " << ec.message() << "\n";
		return on_session_end();
	}

	std::string message = beast::buffers_to_string(buffer_.data());
	buffer_.consume(buffer_.size());

	// Never echo credentials into the log
	if (message.rfind("LOGIN:", 0) == 0 || message.rfind("REGISTER:", 0) == 0)
		std::cout << "[" << client_address_ << "] Received: " << message.substr(0, message.find(':')) << "\n";
	else
		std::cout << "[" << client_address_ << "] Received: " << message << "\n";

	handle_message(message);
	do_read();
}

// --- ASYNC WRITE QUEUE ---

/**
 * @brief Public function to send a message.
 * Adds the message to the queue and starts the write loop if not running.
 */
void AsyncSession::send(std::string message)
{
	auto shared_msg = std::make_shared<std::string>(std::move(message));

	net::dispatch(ws_.get_executor(),
		[self = shared_from_this(), shared_msg]()
		{
			if (self->ended_)
				return;
			self->write_queue_.push(shared_msg);
			if (!self->is_writing_)
			{
				self->do_async_write();
			}
		});
}

/**
 * @brief The actual async write operation.
 * This is always called from within the session's strand.
 */
void AsyncSession::do_async_write()
{
	is_writing_ = true;
	auto msg = write_queue_.front();

	ws_.async_write(net::buffer(*msg),
		net::bind_executor(ws_.get_executor(),
			[self = shared_from_this(), msg](beast::error_code ec, std::size_t bytes)
			{
				self->on_write(ec, bytes);
			}));
}

/**
 * @brief Callback for when a write completes.
 */
void AsyncSession::on_write(beast::error_code ec, std::size_t bytes_transferred)
{
	boost::ignore_unused(bytes_transferred);

	if (ec == websocket::error::closed || ec == net::error::eof || ec == net::error::operation_aborted)
		return on_session_end();

	if (ec)
	{
		std::cerr << "[" << client_address_ << "] Write Error: " << ec.message() << "\n";
		return on_session_end();
	}

	if (ended_)
		return;

	write_queue_.pop();

	if (!write_queue_.empty())
	{
		do_async_write();
	}
	else
	{
		is_writing_ = false;
	}
}
// --- END ASYNC WRITE QUEUE ---

/**
 * @brief Cleans up the session on disconnect or error.
 * Fight state is left alone; the player's turn waits for them or the DM.
 */
void AsyncSession::on_session_end()
{
	if (ended_)
		return;
	ended_ = true;

	std::queue<std::shared_ptr<std::string>>().swap(write_queue_);
	std::queue<std::string>().swap(inbox_);

	if (is_authenticated_.exchange(false))
		services_->sync.close_session(sync_session_id_);

	std::cout << "[" << client_address_ << "] Client disconnected.\n";
}

/**
 * @brief Sends a non-blocking shutdown warning to the client.
 */
void AsyncSession::send_shutdown_warning(int seconds)
{
	send("SERVER:SHUTDOWN:" + std::to_string(seconds));
}

/**
 * @brief Posts a disconnect operation to the session's strand.
 */
void AsyncSession::disconnect()
{
	net::dispatch(ws_.get_executor(),
		[self = shared_from_this()]()
		{
			beast::error_code ec;
			self->ws_.close(websocket::close_code::service_restart, ec);
			if (ec)
				std::cerr << "[" << self->client_address_ << "] Close Error: " << ec.message() << "\n";
			self->on_session_end();
		});
}

// --- COMMAND QUEUE ---

void AsyncSession::handle_message(const std::string& message)
{
	inbox_.push(message);
	if (!command_running_)
		run_next_command();
}

void AsyncSession::run_next_command()
{
	if (ended_ || inbox_.empty())
	{
		command_running_ = false;
		return;
	}

	command_running_ = true;
	std::string message = std::move(inbox_.front());
	inbox_.pop();

	auto self = shared_from_this();

	// The work happens on the db_pool_, the strand only hands it over
	db_pool_->enqueue([self, message] {
		self->execute_command(message);

		net::post(self->ws_.get_executor(), [self] {
			// A login that finished after the client left
			if (self->ended_ && self->is_authenticated_.exchange(false))
				self->services_->sync.close_session(self->sync_session_id_);
			self->run_next_command();
			});
		});
}

void AsyncSession::execute_command(const std::string& message)
{
	const auto colon = message.find(':');
	const std::string command = message.substr(0, colon);
	const std::string payload = (colon == std::string::npos) ? "" : message.substr(colon + 1);

	try
	{
		if (command == "REGISTER")
			return handle_register(payload);
		if (command == "LOGIN")
			return handle_login(payload);

		if (!is_authenticated_)
			throw_illegal("You must be logged in to do that.");

		route_command(command, payload.empty() ? json::object() : parse_payload(payload));
	}
	catch (const CampaignError& e)
	{
		send(std::string("SERVER:ERROR:") + error_kind_name(e.kind()) + ":" + e.what());
	}
	catch (const json::exception& e)
	{
		send(std::string("SERVER:ERROR:VALIDATION_ERROR:Malformed ") + command + " payload: " + e.what());
	}
	catch (const std::exception& e)
	{
		std::cerr << "[" << client_address_ << "] " << command << " failed: " << e.what() << std::endl;
		send("SERVER:ERROR:INTERNAL:An internal error occurred.");
	}
}

// --- ACCOUNTS ---

void AsyncSession::handle_register(const std::string& credentials)
{
	std::string username, password;
	std::stringstream ss(credentials);
	if (!std::getline(ss, username, ':') || !std::getline(ss, password))
		throw_invalid("Invalid registration format.");
	if (username.length() < 3 || username.length() > 20)
		throw_invalid("Username must be 3-20 characters.");
	if (password.length() < 6)
		throw_invalid("Password must be at least 6 characters.");

	char hashed_password[crypto_pwhash_STRBYTES];
	if (crypto_pwhash_str(hashed_password, password.c_str(), password.length(),
		crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE) != 0) {
		throw std::runtime_error("Failed to hash password.");
	}

	Account account;
	account.username = username;
	account.passwordHash = hashed_password;
	account.isDm = services_->dmAccounts.count(username) > 0;

	if (!services_->accounts.create_account(account))
		throw_invalid("Username is already taken.");

	std::cout << "[" << client_address_ << "] Registered account " << username << "\n";
	send("SERVER:REGISTRATION_SUCCESS:Account created. Please log in.");
}

void AsyncSession::handle_login(const std::string& credentials)
{
	if (is_authenticated_)
		throw_illegal("Already logged in as " + username_ + ".");

	std::string username, password;
	std::stringstream ss(credentials);
	if (!std::getline(ss, username, ':') || !std::getline(ss, password))
		throw_invalid("Invalid login format.");

	std::optional<Account> account = services_->accounts.find_account(username);
	if (!account ||
		crypto_pwhash_str_verify(account->passwordHash.c_str(), password.c_str(), password.length()) != 0)
		throw_illegal("Invalid username or password.");

	SessionRole role;
	json characters = json::array();
	if (account->isDm || services_->dmAccounts.count(username))
	{
		role = DmRole{ username };
	}
	else
	{
		PlayerRole player;
		player.username = username;
		for (const auto& record : services_->characters.list_characters_for_owner(username))
		{
			player.characterIds.insert(record.id);
			characters.push_back(record);
		}
		role = std::move(player);
	}

	const bool dm = is_dm(role);
	sync_session_id_ = services_->sync.open_session(shared_from_this(), std::move(role));
	username_ = username;
	is_authenticated_ = true;

	json reply = {
		{"username", username},
		{"role", dm ? "DM" : "PLAYER"},
		{"characters", characters}
	};
	send("SERVER:LOGIN_SUCCESS:" + reply.dump());
}

// --- CAMPAIGN COMMANDS ---

void AsyncSession::route_command(const std::string& command, const json& p)
{
	SessionSynchronizer& sync = services_->sync;
	const uint64_t sid = sync_session_id_;

	auto send_result = [this](const ResolutionResult& result) {
		send("SERVER:RESULT:" + resolution_to_json(result).dump());
		};
	auto send_party = [this](const Party& party) {
		send("SERVER:PARTY:" + json(party).dump());
		};

	// --- Maps ---
	if (command == "LIST_MAPS") {
		send("SERVER:MAPS:" + json(sync.list_maps(sid)).dump());
	}
	else if (command == "GET_MAP" || command == "RESYNC") {
		// The snapshot itself is pushed by the synchronizer
		sync.get_map_snapshot(sid, str(p, "mapId"));
	}
	else if (command == "PUT_MAP") {
		sync.put_map(sid, p.at("map").get<Map>());
		send("SERVER:OK:PUT_MAP");
	}
	else if (command == "PUT_ROOM") {
		sync.put_room(sid, str(p, "mapId"), p.at("room").get<Room>());
		send("SERVER:OK:PUT_ROOM");
	}
	else if (command == "DELETE_ROOM") {
		sync.delete_room(sid, str(p, "mapId"), str(p, "roomId"));
		send("SERVER:OK:DELETE_ROOM");
	}
	else if (command == "CONNECT_ROOMS") {
		sync.connect_rooms(sid, str(p, "mapId"), p.at("connection").get<RoomConnection>());
		send("SERVER:OK:CONNECT_ROOMS");
	}

	// --- Fights ---
	else if (command == "ATTACH_ENCOUNTER") {
		const std::string fightId = sync.attach_encounter(sid, str(p, "mapId"), str(p, "roomId"),
			p.at("combatants").get<std::vector<Combatant>>(), p.value("partyId", std::string()),
			p.value("treasureValue", 0));
		send("SERVER:FIGHT_ATTACHED:" + json{ {"fightId", fightId} }.dump());
	}
	else if (command == "START_FIGHT") {
		send_result(sync.start_fight(sid, str(p, "fightId"), rolls_of(p), p.value("holdInitiative", false)));
	}
	else if (command == "BEGIN_ROUND") {
		send_result(sync.begin_round(sid, str(p, "fightId")));
	}
	else if (command == "CANCEL_FIGHT") {
		send_result(sync.cancel_fight(sid, str(p, "fightId")));
	}
	else if (command == "CLEAR_FIGHT") {
		send_result(sync.clear_fight(sid, str(p, "fightId")));
	}
	else if (command == "SUBMIT_ACTION") {
		SubmitOutcome outcome = sync.submit_action(sid, str(p, "fightId"), p.at("action").get<CombatAction>());
		if (outcome.queued)
			send("SERVER:QUEUED:" + json{ {"requestId", outcome.requestId} }.dump());
		else if (outcome.result)
			send_result(*outcome.result);
	}
	else if (command == "DM_OVERRIDE") {
		send_result(sync.dm_override(sid, str(p, "fightId"), parse_dm_override(p)));
	}
	else if (command == "SET_INITIATIVE") {
		DmOverride forced;
		forced.kind = OverrideKind::SET_INITIATIVE;
		forced.initiative = p.at("initiative").get<std::map<std::string, int>>();
		send_result(sync.dm_override(sid, str(p, "fightId"), forced));
	}
	else if (command == "APPROVE") {
		send_result(sync.approve_action(sid, str(p, "fightId"), str(p, "requestId"), rolls_of(p)));
	}
	else if (command == "DENY") {
		sync.deny_action(sid, str(p, "fightId"), str(p, "requestId"));
		send("SERVER:OK:DENY");
	}
	else if (command == "FORCE_APPLY") {
		send_result(sync.force_apply(sid, str(p, "requestId"), rolls_of(p)));
	}

	// --- Parties ---
	else if (command == "CREATE_PARTY") {
		send_party(sync.create_party(sid, str(p, "partyId"), p.value("name", std::string())));
	}
	else if (command == "ADD_MEMBER") {
		send_party(sync.add_member(sid, str(p, "partyId"), str(p, "characterId")));
	}
	else if (command == "REMOVE_MEMBER") {
		send_party(sync.remove_member(sid, str(p, "partyId"), str(p, "characterId")));
	}
	else if (command == "ADD_HENCHMAN") {
		send_party(sync.add_henchman(sid, str(p, "partyId"), str(p, "henchmanId"), str(p, "employerId")));
	}
	else if (command == "REVEAL_ROOM") {
		send_party(sync.reveal_room(sid, str(p, "partyId"), str(p, "mapId"), str(p, "roomId")));
	}
	else if (command == "GET_PARTY") {
		send("SERVER:PARTY:" + sync.get_party(sid, str(p, "partyId")).dump());
	}
	else if (command == "ALLOCATE_XP") {
		if (p.contains("even"))
			send_party(sync.allocate_even(sid, str(p, "partyId"), p.at("even").get<int>()));
		else
			send_party(sync.allocate_xp(sid, str(p, "partyId"), p.at("distribution").get<XpDistribution>()));
	}

	else {
		handle_character_command(command, p);
	}
}

void AsyncSession::handle_character_command(const std::string& command, const json& p)
{
	SessionSynchronizer& sync = services_->sync;
	const bool dm = sync.session_is_dm(sync_session_id_);

	if (command == "LIST_CHARACTERS") {
		const std::string owner = dm ? p.value("owner", username_) : username_;
		json out = json::array();
		for (const auto& record : services_->characters.list_characters_for_owner(owner))
			out.push_back(record);
		send("SERVER:CHARACTERS:" + out.dump());
	}
	else if (command == "PUT_CHARACTER") {
		// Sheets come from the DM's tooling; a new one reaches its owner's next login
		if (!dm)
			throw_illegal("Only the DM can edit character sheets.");
		CharacterRecord record = p.at("character").get<CharacterRecord>();
		if (record.id.empty() || record.owner.empty())
			throw_invalid("A character needs an id and an owner.");
		services_->characters.put_character(record);
		send("SERVER:OK:PUT_CHARACTER");
	}
	else {
		throw_invalid("Unknown command: " + command);
	}
}
