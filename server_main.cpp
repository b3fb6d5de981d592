// ==========================================
// File: server_main.cpp
// Description: Entry point for the campaign server.
// Handles networking, storage setup, autosaving, and graceful shutdown.
// ==========================================

#include "AsyncSession.hpp"
#include "CombatEngine.hpp"
#include "DatabaseManager.hpp"
#include "Dice.hpp"
#include "MapRegistry.hpp"
#include "MemoryStores.hpp"
#include "PartyLedger.hpp"
#include "PgStores.hpp"
#include "ServerConfig.hpp"
#include "SessionSynchronizer.hpp"
#include "ThreadPool.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <algorithm>
#include <iostream>
#include <random>
#include <thread>
#include <vector>
#include <chrono>
#include <sodium.h>
namespace net = boost::asio;
using tcp = net::ip::tcp;
using namespace std::chrono_literals;

// ==========================================
// Listener Class
// ==========================================
class listener : public std::enable_shared_from_this<listener>
{
	net::io_context& ioc_;
	tcp::acceptor acceptor_;
	std::shared_ptr<CampaignServices> services_;
	std::shared_ptr<ThreadPool> db_pool_;

	// Every session accepted so far, for shutdown warnings
	std::mutex sessions_mutex_;
	std::vector<std::weak_ptr<AsyncSession>> sessions_;

public:
	listener(net::io_context& ioc, tcp::endpoint endpoint, std::shared_ptr<CampaignServices> services, std::shared_ptr<ThreadPool> db_pool)
		: ioc_(ioc), acceptor_(ioc), services_(std::move(services)), db_pool_(std::move(db_pool))
	{
		boost::system::error_code ec;

		acceptor_.open(endpoint.protocol(), ec);
		if (ec) throw std::runtime_error("Listener open: " + ec.message());

		acceptor_.set_option(net::socket_base::reuse_address(true), ec);
		if (ec) throw std::runtime_error("Listener set_option: " + ec.message());

		acceptor_.bind(endpoint, ec);
		if (ec) throw std::runtime_error("Listener bind: " + ec.message());

		acceptor_.listen(net::socket_base::max_listen_connections, ec);
		if (ec) throw std::runtime_error("Listener listen: " + ec.message());
	}

	void run() { do_accept(); }

	void stop()
	{
		net::dispatch(acceptor_.get_executor(), [self = shared_from_this()]() {
			boost::system::error_code ec;
			self->acceptor_.close(ec);
			});
	}

	std::vector<std::shared_ptr<AsyncSession>> live_sessions()
	{
		std::vector<std::shared_ptr<AsyncSession>> out;
		std::lock_guard<std::mutex> lock(sessions_mutex_);
		for (auto const& weak_session : sessions_)
			if (auto s = weak_session.lock())
				out.push_back(s);
		return out;
	}

private:
	void do_accept()
	{
		acceptor_.async_accept(
			net::make_strand(ioc_),
			[self = shared_from_this()](boost::system::error_code ec, tcp::socket socket)
			{
				if (ec == net::error::operation_aborted)
					return; // listener closed

				if (!ec)
				{
					try {
						auto session = std::make_shared<AsyncSession>(
							std::move(socket),
							self->services_,
							self->db_pool_
						);
						self->track(session);
						session->run();
					}
					catch (const std::exception& e) {
						// remote_endpoint() throws if the peer already left
						std::cerr << "[ACCEPT ERROR] " << e.what() << std::endl;
					}
				}
				else
				{
					std::cerr << "[ACCEPT ERROR] " << ec.message() << std::endl;
				}

				self->do_accept();
			});
	}

	void track(const std::shared_ptr<AsyncSession>& session)
	{
		std::lock_guard<std::mutex> lock(sessions_mutex_);
		sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
			[](const std::weak_ptr<AsyncSession>& w) { return w.expired(); }), sessions_.end());
		sessions_.push_back(session);
	}
};

// ==========================================
// Batch Save Timer (Auto-Save System)
// ==========================================
void run_batch_save_timer(net::steady_timer& timer, int interval_seconds, MapRegistry& registry,
	std::shared_ptr<ThreadPool> save_pool)
{
	timer.expires_after(std::chrono::seconds(interval_seconds));

	timer.async_wait([&timer, interval_seconds, &registry, save_pool](const boost::system::error_code& ec)
		{
			if (ec)
			{
				if (ec != net::error::operation_aborted)
					std::cerr << "[BATCH SAVE TIMER ERROR] " << ec.message() << std::endl;
				return;
			}

			// Flushing talks to the database, keep it off the io threads
			save_pool->enqueue([&registry] {
				auto start_time = std::chrono::steady_clock::now();
				std::cout << "\n--- [BATCH SAVE STARTED] ---" << std::endl;

				const std::size_t saved = registry.flush_all();

				auto end_time = std::chrono::steady_clock::now();
				auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
				std::cout << "[BATCH SAVE] Flushed " << saved << " map(s) in " << duration_ms << " ms." << std::endl;
				std::cout << "--- [BATCH SAVE END] ---\n" << std::endl;
				});

			// Re-arm timer
			run_batch_save_timer(timer, interval_seconds, registry, save_pool);
		});
}

// ==========================================
// Main Entry Point
// ==========================================
int main(int argc, char* argv[])
{
	const std::string config_path = (argc > 1) ? argv[1] : "server_config.json";

	try {
		const ServerConfig config = load_server_config(config_path);

		const auto address = net::ip::make_address(config.address);
		net::io_context ioc;
		net::steady_timer save_timer(ioc);
		auto db_pool = std::make_shared<ThreadPool>(config.workerThreads);
		auto save_pool = std::make_shared<ThreadPool>(1);

		// --- Crypto ---
		if (sodium_init() < 0)
			throw std::runtime_error("Libsodium failed to initialize!");
		std::cout << "Libsodium initialized successfully.\n";

		// --- Storage ---
		std::unique_ptr<MapRepository> maps;
		std::unique_ptr<CharacterStore> characters;
		std::unique_ptr<PartyRepository> parties;
		std::unique_ptr<AccountRepository> accounts;

		if (config.uses_memory_storage())
		{
			std::cout << "[Storage] Using in-memory storage; nothing survives a restart.\n";
			maps = std::make_unique<MemoryMapRepository>();
			characters = std::make_unique<MemoryCharacterStore>();
			parties = std::make_unique<MemoryPartyRepository>();
			accounts = std::make_unique<MemoryAccountRepository>();
		}
		else
		{
			auto db_manager = std::make_shared<DatabaseManager>(config.databaseUrl);
			db_manager->ensure_schema(CAMPAIGN_SCHEMA_SQL);
			std::cout << "Database connected successfully.\n";
			maps = std::make_unique<PgMapRepository>(db_manager);
			characters = std::make_unique<PgCharacterStore>(db_manager);
			parties = std::make_unique<PgPartyRepository>(db_manager);
			accounts = std::make_unique<PgAccountRepository>(db_manager);
		}

		// --- Campaign Systems ---
		const uint32_t seed = config.rngSeed != 0 ? config.rngSeed : std::random_device{}();
		MapRegistry registry(*maps);
		PartyLedger ledger(*parties, *characters, config.henchmanXpShare);
		CombatEngine engine(config.moraleThreshold);
		DiceRoller roller(seed);
		SessionSynchronizer sync(registry, *characters, ledger, engine, roller, config.requireDmApproval);

		auto services = std::make_shared<CampaignServices>(
			CampaignServices{ sync, *characters, *accounts, config.dmAccounts });

		// --- Listener ---
		auto listener_ptr = std::make_shared<listener>(
			ioc, tcp::endpoint{ address, config.port }, services, db_pool);
		listener_ptr->run();

		// --- Batch Auto-Save ---
		run_batch_save_timer(save_timer, config.autosaveSeconds, registry, save_pool);
		std::cout << "Server is listening on " << config.address << ":" << config.port << "...\n";
		std::cout << "Type 'exit' or 'shutdown' to stop the server.\n";

		// --- Console Command Thread ---
		std::thread console_thread([&ioc, &save_timer, listener_ptr]() {
			std::string command;
			while (std::getline(std::cin, command))
			{
				if (command == "exit" || command == "shutdown")
				{
					std::cout << "\n--- SHUTDOWN INITIATED ---" << std::endl;
					listener_ptr->stop();

					const int grace_period = 30;
					auto sessions = listener_ptr->live_sessions();
					std::cout << "Broadcasting shutdown warning to " << sessions.size() << " clients.\n";
					for (auto& session : sessions)
						session->send_shutdown_warning(grace_period);

					// Graceful shutdown timer
					auto shutdown_timer = std::make_shared<net::steady_timer>(ioc);
					shutdown_timer->expires_after(std::chrono::seconds(grace_period));

					shutdown_timer->async_wait([&ioc, &save_timer, listener_ptr, shutdown_timer](const boost::system::error_code& ec)
						{
							if (ec && ec != net::error::operation_aborted)
							{
								std::cerr << "[SHUTDOWN TIMER ERROR] " << ec.message() << std::endl;
								return;
							}

							std::cout << "--- Final disconnect phase ---" << std::endl;
							int count = 0;
							for (auto& s : listener_ptr->live_sessions())
							{
								s->disconnect();
								++count;
							}

							std::cout << "Finalized disconnects for " << count << " clients.\n";
							save_timer.cancel();
							ioc.stop();
						});

					break;
				}
			}
			});

		// --- Thread Pool ---
		const unsigned threads = config.ioThreads > 0
			? static_cast<unsigned>(config.ioThreads)
			: std::max<unsigned>(1, std::thread::hardware_concurrency());
		std::vector<std::thread> thread_pool;
		thread_pool.reserve(threads - 1);
		for (unsigned i = 1; i < threads; ++i)
			thread_pool.emplace_back([&ioc] { ioc.run(); });

		ioc.run(); // main thread

		for (auto& t : thread_pool) t.join();
		console_thread.join();

		// Drain the pools while everything they touch is still alive
		db_pool->shutdown();
		save_pool->shutdown();

		// --- Final save ---
		std::cout << "--- Final save phase ---" << std::endl;
		const std::size_t saved = registry.flush_all();
		std::cout << "Saved " << saved << " map(s).\n";
	}
	catch (const std::exception& e) {
		std::cerr << "FATAL ERROR: " << e.what() << std::endl;
		return 1;
	}

	std::cout << "Server shut down cleanly.\n";
	return 0;
}
