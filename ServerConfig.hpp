// File: ServerConfig.hpp
// Description: Runtime settings read from a JSON file at startup.
#pragma once

#include <cstdint>
#include <set>
#include <string>

struct ServerConfig {
	// --- Network ---
	std::string address = "0.0.0.0";
	unsigned short port = 8080;
	int ioThreads = 0;        // 0 = one per core
	int workerThreads = 4;

	// --- Storage ---
	std::string storage = "memory";   // "postgres" or "memory"
	std::string databaseUrl;
	int autosaveSeconds = 360;

	// --- Rules ---
	double henchmanXpShare = 0.5;
	bool requireDmApproval = false;
	int moraleThreshold = 7;
	uint32_t rngSeed = 0;     // 0 = seed from std::random_device

	std::set<std::string> dmAccounts;

	bool uses_memory_storage() const { return storage == "memory"; }
};

/**
 * @brief Reads the config file. A missing file gives the defaults; a file
 * that exists but does not parse, or holds a bad value, throws
 * std::runtime_error.
 */
ServerConfig load_server_config(const std::string& path);
