#include "MapRegistry.hpp"
#include "CampaignError.hpp"
#include <iostream>
#include <set>

Room& require_room(Map& map, const std::string& roomId)
{
	auto it = map.rooms.find(roomId);
	if (it == map.rooms.end())
		throw_not_found("Room " + roomId + " not found in map " + map.id + ".");
	return it->second;
}

const Room& require_room(const Map& map, const std::string& roomId)
{
	auto it = map.rooms.find(roomId);
	if (it == map.rooms.end())
		throw_not_found("Room " + roomId + " not found in map " + map.id + ".");
	return it->second;
}

namespace {

	// Fights only enter a map through attach_encounter
	void drop_client_fights(Map& map)
	{
		int dropped = 0;
		for (auto& [roomId, room] : map.rooms) {
			if (room.fight) {
				room.fight.reset();
				++dropped;
			}
		}
		if (dropped > 0)
			std::cerr << "[MapRegistry] Ignored " << dropped << " fight(s) sent with map " << map.id << std::endl;
	}

	// Graph integrity: keys match ids, every connection joins two existing
	// rooms and every room only lists connections that exist.
	void validate_map(const Map& map)
	{
		if (map.id.empty())
			throw_invalid("Map id cannot be empty.");

		for (const auto& [roomId, room] : map.rooms) {
			if (roomId.empty() || room.id != roomId)
				throw_invalid("Room key '" + roomId + "' does not match room id '" + room.id + "'.");
			for (const auto& connectionId : room.connections) {
				if (!map.connections.count(connectionId))
					throw_invalid("Room " + roomId + " lists unknown connection " + connectionId + ".");
			}
		}

		for (const auto& [connectionId, connection] : map.connections) {
			if (connection.id != connectionId)
				throw_invalid("Connection key '" + connectionId + "' does not match its id.");
			if (!map.rooms.count(connection.from) || !map.rooms.count(connection.to))
				throw_invalid("Connection " + connectionId + " points at a missing room.");
		}
	}

	bool fight_in_progress(const Room& room)
	{
		return room.fight && room.fight->state != FightState::RESOLVED && room.fight->state != FightState::EMPTY;
	}

}

MapRegistry::MapRegistry(MapRepository& repository)
	: repository_(repository)
{
}

std::shared_ptr<MapRegistry::Entry> MapRegistry::acquire(const std::string& mapId)
{
	std::shared_ptr<Entry> entry;
	{
		std::lock_guard<std::mutex> lock(entries_mutex_);
		auto it = entries_.find(mapId);
		if (it != entries_.end()) {
			entry = it->second;
		}
		else {
			entry = std::make_shared<Entry>();
			entries_[mapId] = entry;
		}
	}

	if (entry->current())
		return entry;

	// Load outside the registry lock so a slow read never blocks other maps
	std::lock_guard<std::mutex> writer(entry->writer);
	if (entry->current())
		return entry;

	std::optional<Map> loaded;
	try {
		loaded = repository_.load_map(mapId);
	}
	catch (const CampaignError&) {
		std::lock_guard<std::mutex> lock(entries_mutex_);
		entries_.erase(mapId);
		throw;
	}

	if (!loaded) {
		std::lock_guard<std::mutex> lock(entries_mutex_);
		entries_.erase(mapId);
		throw_not_found("Map " + mapId + " not found.");
	}

	std::cout << "[MapRegistry] Loaded map " << mapId << " (v" << loaded->version << ", "
		<< loaded->rooms.size() << " rooms)." << std::endl;
	entry->persisted = true;
	entry->persistedVersion = loaded->version;
	entry->publish(std::make_shared<const Map>(std::move(*loaded)));
	return entry;
}

std::shared_ptr<const Map> MapRegistry::get_map(const std::string& mapId)
{
	return acquire(mapId)->current();
}

Room MapRegistry::get_room(const std::string& mapId, const std::string& roomId)
{
	auto map = get_map(mapId);
	return require_room(*map, roomId);
}

bool MapRegistry::is_loaded(const std::string& mapId)
{
	std::lock_guard<std::mutex> lock(entries_mutex_);
	auto it = entries_.find(mapId);
	return it != entries_.end() && it->second->current() != nullptr;
}

std::vector<std::string> MapRegistry::list_maps()
{
	std::set<std::string> ids;
	for (const auto& id : repository_.list_maps())
		ids.insert(id);
	{
		std::lock_guard<std::mutex> lock(entries_mutex_);
		for (const auto& [id, entry] : entries_)
			if (entry->current())
				ids.insert(id);
	}
	return std::vector<std::string>(ids.begin(), ids.end());
}

std::shared_ptr<const Map> MapRegistry::update_map(const std::string& mapId, const std::function<void(Map&)>& mutate)
{
	auto entry = acquire(mapId);
	std::lock_guard<std::mutex> writer(entry->writer);

	std::shared_ptr<const Map> current = entry->current();
	Map next = *current;
	mutate(next);
	next.id = current->id;
	next.version = current->version + 1;
	validate_map(next);

	try {
		repository_.save_map(next);
	}
	catch (const CampaignError& e) {
		if (e.kind() == ErrorKind::CONCURRENCY_CONFLICT) {
			// Someone else wrote this map; pick up their copy for the next attempt
			std::cerr << "[MapRegistry] " << e.what() << " Reloading." << std::endl;
			std::optional<Map> stored = repository_.load_map(mapId);
			if (stored) {
				entry->persisted = true;
				entry->persistedVersion = stored->version;
				entry->publish(std::make_shared<const Map>(std::move(*stored)));
			}
		}
		throw;
	}

	auto published = std::make_shared<const Map>(std::move(next));
	entry->persisted = true;
	entry->persistedVersion = published->version;
	entry->publish(published);
	return published;
}

void MapRegistry::create_map(Map map)
{
	validate_map(map);
	drop_client_fights(map);
	if (repository_.load_map(map.id))
		throw_invalid("Map " + map.id + " already exists.");

	std::lock_guard<std::mutex> lock(entries_mutex_);
	auto& entry = entries_[map.id];
	if (entry && entry->current())
		throw_invalid("Map " + map.id + " already exists.");

	entry = std::make_shared<Entry>();
	map.version = 0;
	entry->persisted = false;
	entry->snapshot = std::make_shared<const Map>(std::move(map));
}

std::shared_ptr<const Map> MapRegistry::put_map(Map map)
{
	validate_map(map);
	drop_client_fights(map);

	bool exists = true;
	try {
		acquire(map.id);
	}
	catch (const CampaignError& e) {
		if (e.kind() != ErrorKind::NOT_FOUND)
			throw;
		exists = false;
	}
	if (!exists)
		create_map(map);

	return update_map(map.id, [&map](Map& m) {
		for (const auto& [roomId, room] : m.rooms) {
			if (fight_in_progress(room) && !map.rooms.count(roomId))
				throw_illegal("Room " + roomId + " has a fight in progress and cannot be removed.");
		}
		// Fights only change through the fight path; keep the live ones
		Map replaced = map;
		for (auto& [roomId, room] : replaced.rooms) {
			auto old = m.rooms.find(roomId);
			if (old != m.rooms.end())
				room.fight = old->second.fight;
		}
		m = std::move(replaced);
		});
}

std::shared_ptr<const Map> MapRegistry::put_room(const std::string& mapId, Room room)
{
	if (room.id.empty())
		throw_invalid("Room id cannot be empty.");

	return update_map(mapId, [&room](Map& m) {
		auto it = m.rooms.find(room.id);
		if (it == m.rooms.end()) {
			room.connections.clear();
			room.fight.reset();
			m.rooms[room.id] = std::move(room);
			return;
		}
		it->second.name = room.name;
		it->second.description = room.description;
		});
}

std::shared_ptr<const Map> MapRegistry::delete_room(const std::string& mapId, const std::string& roomId)
{
	return update_map(mapId, [&roomId](Map& m) {
		const Room& room = require_room(m, roomId);
		if (fight_in_progress(room))
			throw_illegal("Room " + roomId + " has a fight in progress.");

		for (auto it = m.connections.begin(); it != m.connections.end();) {
			const RoomConnection& c = it->second;
			if (c.from == roomId || c.to == roomId) {
				const std::string& other = (c.from == roomId) ? c.to : c.from;
				auto otherRoom = m.rooms.find(other);
				if (otherRoom != m.rooms.end())
					otherRoom->second.connections.erase(it->first);
				it = m.connections.erase(it);
			}
			else {
				++it;
			}
		}
		m.rooms.erase(roomId);
		});
}

std::shared_ptr<const Map> MapRegistry::connect_rooms(const std::string& mapId, RoomConnection connection)
{
	if (connection.from == connection.to)
		throw_invalid("A room cannot connect to itself.");
	if (connection.id.empty())
		connection.id = connection.from + "->" + connection.to;

	return update_map(mapId, [&connection](Map& m) {
		Room& from = require_room(m, connection.from);
		Room& to = require_room(m, connection.to);
		if (m.connections.count(connection.id))
			throw_invalid("Connection " + connection.id + " already exists.");

		from.connections.insert(connection.id);
		to.connections.insert(connection.id);
		m.connections[connection.id] = connection;
		});
}

std::size_t MapRegistry::flush_all()
{
	std::vector<std::shared_ptr<Entry>> entries;
	{
		std::lock_guard<std::mutex> lock(entries_mutex_);
		for (const auto& [id, entry] : entries_)
			entries.push_back(entry);
	}

	std::size_t saved = 0;
	for (auto& entry : entries) {
		std::lock_guard<std::mutex> writer(entry->writer);
		std::shared_ptr<const Map> snapshot = entry->current();
		if (!snapshot)
			continue;
		if (entry->persisted && entry->persistedVersion >= snapshot->version)
			continue;

		Map copy = *snapshot;
		// A never-saved map goes out as version 1
		if (copy.version == 0)
			copy.version = 1;

		try {
			repository_.save_map(copy);
			entry->persisted = true;
			entry->persistedVersion = copy.version;
			entry->publish(std::make_shared<const Map>(std::move(copy)));
			++saved;
		}
		catch (const CampaignError& e) {
			std::cerr << "[SAVE QUEUE] Failed to flush map " << snapshot->id << ": " << e.what() << std::endl;
		}
	}
	return saved;
}
