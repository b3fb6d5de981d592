#include "ServerConfig.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

ServerConfig load_server_config(const std::string& path)
{
	ServerConfig config;

	std::ifstream in(path);
	if (!in) {
		std::cout << "[Config] " << path << " not found, using defaults." << std::endl;
		return config;
	}

	json j;
	try {
		in >> j;
	}
	catch (const json::parse_error& e) {
		throw std::runtime_error("Config " + path + " is not valid JSON: " + e.what());
	}

	try {
		config.address = j.value("address", config.address);
		config.port = j.value("port", config.port);
		config.ioThreads = j.value("io_threads", config.ioThreads);
		config.workerThreads = j.value("worker_threads", config.workerThreads);
		config.storage = j.value("storage", config.storage);
		config.databaseUrl = j.value("database_url", config.databaseUrl);
		config.autosaveSeconds = j.value("autosave_seconds", config.autosaveSeconds);
		config.henchmanXpShare = j.value("henchman_xp_share", config.henchmanXpShare);
		config.requireDmApproval = j.value("require_dm_approval", config.requireDmApproval);
		config.moraleThreshold = j.value("morale_threshold", config.moraleThreshold);
		config.rngSeed = j.value("rng_seed", config.rngSeed);
		if (j.contains("dm_accounts"))
			config.dmAccounts = j.at("dm_accounts").get<std::set<std::string>>();
	}
	catch (const json::exception& e) {
		throw std::runtime_error("Config " + path + " has a bad value: " + e.what());
	}

	if (config.storage != "postgres" && config.storage != "memory")
		throw std::runtime_error("Config storage must be \"postgres\" or \"memory\", got \"" + config.storage + "\".");
	if (config.storage == "postgres" && config.databaseUrl.empty())
		throw std::runtime_error("Config database_url is required for postgres storage.");
	if (config.henchmanXpShare < 0.0 || config.henchmanXpShare > 1.0)
		throw std::runtime_error("Config henchman_xp_share must be between 0 and 1.");
	if (config.autosaveSeconds <= 0)
		throw std::runtime_error("Config autosave_seconds must be positive.");
	if (config.workerThreads <= 0)
		config.workerThreads = 1;

	std::cout << "[Config] Loaded " << path << " (storage: " << config.storage
		<< ", port " << config.port << ", " << config.dmAccounts.size() << " DM account(s))." << std::endl;
	return config;
}
