#include "ViewFilter.hpp"
#include "CampaignJson.hpp"

using json = nlohmann::json;

namespace {

	struct UsernameOf {
		std::string operator()(const PlayerRole& role) const { return role.username; }
		std::string operator()(const DmRole& role) const { return role.username; }
	};

	struct FilterFactory {
		const std::vector<Party>& parties;

		std::unique_ptr<ViewFilter> operator()(const PlayerRole& role) const {
			return std::make_unique<PlayerViewFilter>(role, parties);
		}
		std::unique_ptr<ViewFilter> operator()(const DmRole&) const {
			return std::make_unique<DmViewFilter>();
		}
	};

}

std::string role_username(const SessionRole& role)
{
	return std::visit(UsernameOf{}, role);
}

std::unique_ptr<ViewFilter> make_view_filter(const SessionRole& role, const std::vector<Party>& parties)
{
	return std::visit(FilterFactory{ parties }, role);
}

// --- DM ---

bool DmViewFilter::can_see_room(const Map&, const Room&) const
{
	return true;
}

bool DmViewFilter::can_see_party(const Party&) const
{
	return true;
}

json DmViewFilter::room_view(const Map& map, const Room& room) const
{
	json j = room;
	j["mapId"] = map.id;
	return j;
}

json DmViewFilter::map_view(const Map& map) const
{
	return map;
}

json DmViewFilter::party_view(const Party& party) const
{
	return party;
}

// --- Player ---

PlayerViewFilter::PlayerViewFilter(PlayerRole role, const std::vector<Party>& parties)
	: role_(std::move(role))
{
	for (const auto& party : parties) {
		parties_.insert(party.id);
		for (const auto& [mapId, rooms] : party.discoveredRooms)
			discovered_[mapId].insert(rooms.begin(), rooms.end());
	}
}

bool PlayerViewFilter::fights_here(const Room& room) const
{
	if (!room.fight)
		return false;
	for (const auto& c : room.fight->combatants)
		if (c.isCharacter() && role_.characterIds.count(c.characterId))
			return true;
	return false;
}

bool PlayerViewFilter::can_see_room(const Map& map, const Room& room) const
{
	auto it = discovered_.find(map.id);
	if (it != discovered_.end() && it->second.count(room.id))
		return true;
	return fights_here(room);
}

bool PlayerViewFilter::can_see_party(const Party& party) const
{
	return parties_.count(party.id) > 0;
}

json PlayerViewFilter::room_view(const Map& map, const Room& room) const
{
	json j;
	j["mapId"] = map.id;
	j["id"] = room.id;
	j["name"] = room.name;
	j["description"] = room.description;

	// Exits are visible; where they lead only once that room is known
	json exits = json::array();
	for (const auto& connectionId : room.connections) {
		auto c = map.connections.find(connectionId);
		if (c == map.connections.end())
			continue;
		const RoomConnection& connection = c->second;
		if (connection.oneWay && connection.to == room.id)
			continue;

		const std::string& other = (connection.from == room.id) ? connection.to : connection.from;
		auto otherRoom = map.rooms.find(other);
		json exit = {
			{"id", connection.id},
			{"description", connection.description},
			{"passable", connection.passable},
			{"locked", connection.locked}
		};
		exit["to"] = (otherRoom != map.rooms.end() && can_see_room(map, otherRoom->second)) ? json(other) : json(nullptr);
		exits.push_back(exit);
	}
	j["exits"] = exits;

	if (!room.fight) {
		j["fight"] = nullptr;
		return j;
	}

	const Fight& fight = *room.fight;
	json f;
	f["id"] = fight.id;
	f["state"] = fight.state;
	f["round"] = fight.round;
	f["currentTurn"] = fight.currentTurn;
	f["partyId"] = fight.partyId;
	if (fight.state == FightState::RESOLVED)
		f["xpAmount"] = fight.xpAmount;

	json combatants = json::array();
	for (const auto& c : fight.combatants) {
		json cj = {
			{"id", c.id},
			{"side", c.side},
			{"displayName", c.displayName},
			{"initiative", c.initiative},
			{"flags", c.flags}
		};
		if (c.side == Side::PARTY) {
			cj["characterId"] = c.characterId;
			cj["hitPoints"] = c.hitPoints;
			cj["maxHitPoints"] = c.maxHitPoints;
			cj["woundOutcome"] = c.woundOutcome;
			cj["mortalWound"] = c.mortalWound;
			cj["attacksPerRound"] = c.stats.attacksPerRound;
			cj["attacksMade"] = c.attacksMade;
			cj["moved"] = c.moved;
		}
		combatants.push_back(cj);
	}
	f["combatants"] = combatants;

	json history = json::array();
	for (const auto& entry : fight.history)
		history.push_back({ {"round", entry.round}, {"summary", entry.summary} });
	f["history"] = history;

	j["fight"] = f;
	return j;
}

json PlayerViewFilter::map_view(const Map& map) const
{
	json j;
	j["id"] = map.id;
	j["name"] = map.name;
	j["summary"] = map.summary;
	j["version"] = map.version;

	json rooms = json::array();
	for (const auto& [id, room] : map.rooms)
		if (can_see_room(map, room))
			rooms.push_back(room_view(map, room));
	j["rooms"] = rooms;
	return j;
}

json PlayerViewFilter::party_view(const Party& party) const
{
	json j;
	j["id"] = party.id;
	j["name"] = party.name;
	j["members"] = party.members;
	j["henchmen"] = party.henchmen;
	j["pendingXp"] = party.pendingXp;
	j["version"] = party.version;
	return j;
}
