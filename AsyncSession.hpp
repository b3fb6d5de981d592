// File: AsyncSession.hpp
// Description: Manages a single client's WebSocket session: the async
// read loop, the strand-serialized write queue, login, and routing of
// "COMMAND:payload" frames to the Session Synchronizer.
#pragma once

#include "CampaignData.hpp"
#include "Repositories.hpp"
#include "SessionSynchronizer.hpp"
#include "ThreadPool.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <queue>
#include <set>
#include <string>
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// Everything a session needs from the server, created once in main
struct CampaignServices {
	SessionSynchronizer& sync;
	CharacterStore& characters;
	AccountRepository& accounts;
	std::set<std::string> dmAccounts;
};

//should manage a single ws connection async
class AsyncSession : public ClientChannel, public std::enable_shared_from_this<AsyncSession>
{
	// --- Networking Members ---
	websocket::stream<tcp::socket> ws_;       // The WebSocket stream
	beast::flat_buffer buffer_;               // Buffer for reading messages
	std::string client_address_;              // Client's IP for logging
	std::shared_ptr<CampaignServices> services_;
	std::shared_ptr<ThreadPool> db_pool_;

	// --- Write Queue (strand only) ---
	std::queue<std::shared_ptr<std::string>> write_queue_;
	bool is_writing_ = false;

	// --- Command Queue (strand only) ---
	// One command runs on the pool at a time so replies keep request order
	std::queue<std::string> inbox_;
	bool command_running_ = false;
	bool ended_ = false;

	// --- Login State ---
	std::atomic<bool> is_authenticated_{ false };
	std::atomic<uint64_t> sync_session_id_{ 0 };
	std::string username_;

public:
	// Take ownership of the socket
	AsyncSession(
		tcp::socket socket,
		std::shared_ptr<CampaignServices> services,
		std::shared_ptr<ThreadPool> db_pool
	);

	~AsyncSession() noexcept override;

	// Start the session's asynchronous operations
	void run();

	// ClientChannel: thread safe, never blocks
	void send(std::string message) override;
	std::string describe() const override { return client_address_; }

	void send_shutdown_warning(int seconds);
	void disconnect();

private:
	void on_run();
	void do_read();
	void on_read(beast::error_code ec, std::size_t bytes_transferred);
	void do_async_write();
	void on_write(beast::error_code ec, std::size_t bytes_transferred);
	void on_session_end();

	/**
	 * @brief Queues an incoming frame and starts it if nothing is running.
	 */
	void handle_message(const std::string& message);
	void run_next_command();

	/**
	 * @brief Runs one command on a pool thread. Every CampaignError becomes
	 * a "SERVER:ERROR:<KIND>:<message>" reply; nothing escapes.
	 */
	void execute_command(const std::string& message);

	void handle_register(const std::string& credentials);
	void handle_login(const std::string& credentials);

	// Authenticated commands; payload is JSON
	void route_command(const std::string& command, const nlohmann::json& payload);
	void handle_character_command(const std::string& command, const nlohmann::json& payload);
};
