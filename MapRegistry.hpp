// File: MapRegistry.hpp
// Description: The Room Graph Store. Keeps every loaded map as an immutable
// snapshot; readers grab the current shared_ptr and never see a write in
// progress. Writers go through update_map, one at a time per map, which
// copies the snapshot, mutates the copy, persists it and only then swaps it
// in. A map that fails to persist is never published.
#pragma once

#include "CampaignData.hpp"
#include "Repositories.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class MapRegistry
{
	struct Entry {
		std::mutex writer;                 // one in-flight writer per map
		mutable std::mutex snapshotMutex;  // guards the pointer swap only
		std::shared_ptr<const Map> snapshot;
		uint64_t persistedVersion = 0;
		bool persisted = false;

		std::shared_ptr<const Map> current() const {
			std::lock_guard<std::mutex> lock(snapshotMutex);
			return snapshot;
		}
		void publish(std::shared_ptr<const Map> next) {
			std::lock_guard<std::mutex> lock(snapshotMutex);
			snapshot = std::move(next);
		}
	};

	MapRepository& repository_;
	std::mutex entries_mutex_;
	std::map<std::string, std::shared_ptr<Entry>> entries_;

	std::shared_ptr<Entry> acquire(const std::string& mapId);

public:
	explicit MapRegistry(MapRepository& repository);

	// --- Reads (snapshots) ---

	/**
	 * @brief Current snapshot of a map, loading it from storage on first use.
	 * Throws NOT_FOUND if the map exists nowhere.
	 */
	std::shared_ptr<const Map> get_map(const std::string& mapId);

	Room get_room(const std::string& mapId, const std::string& roomId);

	bool is_loaded(const std::string& mapId);

	std::vector<std::string> list_maps();

	// --- Writes ---

	/**
	 * @brief Copy, mutate, bump version, persist, publish.
	 * If the mutator or the save throws, the published snapshot is untouched
	 * and the error propagates.
	 */
	std::shared_ptr<const Map> update_map(const std::string& mapId, const std::function<void(Map&)>& mutate);

	// Registers a brand new map in memory only; it reaches storage on its
	// first update or on the next flush.
	void create_map(Map map);

	// Replaces an existing map (or stores a new one) and persists it.
	// Rooms that already exist keep their current fight.
	std::shared_ptr<const Map> put_map(Map map);

	// Room editing; the room's fight slot is kept as it is
	std::shared_ptr<const Map> put_room(const std::string& mapId, Room room);
	std::shared_ptr<const Map> delete_room(const std::string& mapId, const std::string& roomId);
	std::shared_ptr<const Map> connect_rooms(const std::string& mapId, RoomConnection connection);

	// Saves every loaded map whose persisted version lags. Returns the count.
	std::size_t flush_all();
};

// Lookup helpers shared by everything that edits a Map
Room& require_room(Map& map, const std::string& roomId);
const Room& require_room(const Map& map, const std::string& roomId);
