#include "CampaignJson.hpp"
#include "CampaignError.hpp"

using json = nlohmann::json;

const char* fight_state_name(FightState state)
{
	switch (state) {
	case FightState::EMPTY:             return "EMPTY";
	case FightState::FORMING:           return "FORMING";
	case FightState::ACTIVE_INITIATIVE: return "ACTIVE_INITIATIVE";
	case FightState::ACTIVE_ROUND:      return "ACTIVE_ROUND";
	case FightState::RESOLVED:          return "RESOLVED";
	}
	return "UNKNOWN";
}

const char* action_type_name(ActionType type)
{
	switch (type) {
	case ActionType::ATTACK:       return "ATTACK";
	case ActionType::MORALE_CHECK: return "MORALE_CHECK";
	case ActionType::SAVING_THROW: return "SAVING_THROW";
	case ActionType::PASS:         return "PASS";
	case ActionType::MOVE:         return "MOVE";
	}
	return "UNKNOWN";
}

const char* wound_outcome_name(MortalWoundOutcome outcome)
{
	switch (outcome) {
	case MortalWoundOutcome::NONE:              return "NONE";
	case MortalWoundOutcome::STABLE:            return "STABLE";
	case MortalWoundOutcome::MAIMED_BUT_STABLE: return "MAIMED_BUT_STABLE";
	case MortalWoundOutcome::DIES:              return "DIES";
	}
	return "UNKNOWN";
}

// --- Stats ---

void to_json(json& j, const SavingThrows& s)
{
	j = json{
		{"petrificationParalysis", s.petrificationParalysis},
		{"poisonDeath", s.poisonDeath},
		{"blastBreath", s.blastBreath},
		{"staffsWands", s.staffsWands},
		{"spells", s.spells}
	};
}

void from_json(const json& j, SavingThrows& s)
{
	s.petrificationParalysis = j.value("petrificationParalysis", 0);
	s.poisonDeath = j.value("poisonDeath", 0);
	s.blastBreath = j.value("blastBreath", 0);
	s.staffsWands = j.value("staffsWands", 0);
	s.spells = j.value("spells", 0);
}

void to_json(json& j, const DamageRoll& d)
{
	j = json{ {"amount", d.amount}, {"sides", d.sides}, {"modifier", d.modifier}, {"missile", d.missile} };
}

void from_json(const json& j, DamageRoll& d)
{
	d.amount = j.value("amount", 1);
	d.sides = j.value("sides", 6);
	d.modifier = j.value("modifier", 0);
	d.missile = j.value("missile", false);
}

void to_json(json& j, const StatusFlags& f)
{
	j = json{
		{"fled", f.fled},
		{"surrendered", f.surrendered},
		{"mortallyWounded", f.mortallyWounded},
		{"dead", f.dead}
	};
}

void from_json(const json& j, StatusFlags& f)
{
	f.fled = j.value("fled", false);
	f.surrendered = j.value("surrendered", false);
	f.mortallyWounded = j.value("mortallyWounded", false);
	f.dead = j.value("dead", false);
}

void to_json(json& j, const CombatStats& s)
{
	j = json{
		{"attackThrow", s.attackThrow},
		{"armorClass", s.armorClass},
		{"damage", s.damage},
		{"saves", s.saves},
		{"morale", s.morale},
		{"initiativeModifier", s.initiativeModifier},
		{"constitutionModifier", s.constitutionModifier},
		{"hitDie", s.hitDie},
		{"xpValue", s.xpValue},
		{"usesMortalWounds", s.usesMortalWounds},
		{"attacksPerRound", s.attacksPerRound}
	};
}

void from_json(const json& j, CombatStats& s)
{
	s.attackThrow = j.value("attackThrow", 10);
	s.armorClass = j.value("armorClass", 0);
	s.damage = j.value("damage", DamageRoll{});
	s.saves = j.value("saves", SavingThrows{});
	s.morale = j.value("morale", 0);
	s.initiativeModifier = j.value("initiativeModifier", 0);
	s.constitutionModifier = j.value("constitutionModifier", 0);
	s.hitDie = j.value("hitDie", HitDie::D8);
	s.xpValue = j.value("xpValue", 0);
	s.usesMortalWounds = j.value("usesMortalWounds", false);
	s.attacksPerRound = j.value("attacksPerRound", 1);
}

void to_json(json& j, const Combatant& c)
{
	j = json{
		{"id", c.id},
		{"side", c.side},
		{"characterId", c.characterId},
		{"templateName", c.templateName},
		{"displayName", c.displayName},
		{"stats", c.stats},
		{"hitPoints", c.hitPoints},
		{"maxHitPoints", c.maxHitPoints},
		{"initiative", c.initiative},
		{"flags", c.flags},
		{"mortalWound", c.mortalWound},
		{"woundOutcome", c.woundOutcome},
		{"attacksMade", c.attacksMade},
		{"moved", c.moved}
	};
}

void from_json(const json& j, Combatant& c)
{
	c.id = j.at("id").get<std::string>();
	c.side = j.value("side", Side::MONSTERS);
	c.characterId = j.value("characterId", "");
	c.templateName = j.value("templateName", "");
	c.displayName = j.value("displayName", c.id);
	c.stats = j.value("stats", CombatStats{});
	c.hitPoints = j.value("hitPoints", 1);
	c.maxHitPoints = j.value("maxHitPoints", c.hitPoints);
	c.initiative = j.value("initiative", 0);
	c.flags = j.value("flags", StatusFlags{});
	c.mortalWound = j.value("mortalWound", MortalWoundCondition::NONE);
	c.woundOutcome = j.value("woundOutcome", MortalWoundOutcome::NONE);
	c.attacksMade = j.value("attacksMade", 0);
	c.moved = j.value("moved", false);
}

// --- Actions ---

void to_json(json& j, const CombatAction& a)
{
	j = json{
		{"type", a.type},
		{"actorId", a.actorId},
		{"targetId", a.targetId},
		{"modifier", a.modifier},
		{"saveType", a.saveType},
		{"surrender", a.surrender},
		{"move", a.move},
		{"rolls", a.rolls}
	};
	// std::optional has no adl_serializer here, write it by hand
	if (a.weapon) j["weapon"] = *a.weapon;
	if (a.groupSide) j["groupSide"] = *a.groupSide;
}

void from_json(const json& j, CombatAction& a)
{
	a.type = j.at("type").get<ActionType>();
	a.actorId = j.value("actorId", "");
	a.targetId = j.value("targetId", "");
	a.modifier = j.value("modifier", 0);
	a.saveType = j.value("saveType", SavingThrowType::POISON_DEATH);
	a.surrender = j.value("surrender", false);
	a.move = j.value("move", MoveKind::MOVE);
	a.rolls = j.value("rolls", std::vector<int>{});
	a.weapon.reset();
	a.groupSide.reset();
	if (j.contains("weapon") && !j["weapon"].is_null()) a.weapon = j["weapon"].get<DamageRoll>();
	if (j.contains("groupSide") && !j["groupSide"].is_null()) a.groupSide = j["groupSide"].get<Side>();
}

void to_json(json& j, const PendingAction& p)
{
	j = json{ {"requestId", p.requestId}, {"username", p.username}, {"action", p.action} };
}

void from_json(const json& j, PendingAction& p)
{
	p.requestId = j.at("requestId").get<std::string>();
	p.username = j.value("username", "");
	p.action = j.at("action").get<CombatAction>();
}

void to_json(json& j, const ActionLogEntry& e)
{
	j = json{
		{"round", e.round},
		{"actorId", e.actorId},
		{"type", e.type},
		{"summary", e.summary},
		{"rolls", e.rolls},
		{"dmOverride", e.dmOverride}
	};
}

void from_json(const json& j, ActionLogEntry& e)
{
	e.round = j.value("round", 0);
	e.actorId = j.value("actorId", "");
	e.type = j.value("type", ActionType::PASS);
	e.summary = j.value("summary", "");
	e.rolls = j.value("rolls", std::vector<int>{});
	e.dmOverride = j.value("dmOverride", false);
}

// --- Fight / Room / Map ---

void to_json(json& j, const Fight& f)
{
	j = json{
		{"id", f.id},
		{"state", f.state},
		{"combatants", f.combatants},
		{"round", f.round},
		{"currentTurn", f.currentTurn},
		{"pendingActions", f.pendingActions},
		{"treasureValue", f.treasureValue},
		{"partyId", f.partyId},
		{"xpAwarded", f.xpAwarded},
		{"xpAmount", f.xpAmount},
		{"history", f.history}
	};
}

void from_json(const json& j, Fight& f)
{
	f.id = j.value("id", "");
	f.state = j.value("state", FightState::EMPTY);
	f.combatants = j.value("combatants", std::vector<Combatant>{});
	f.round = j.value("round", 0);
	f.currentTurn = j.value("currentTurn", 0);
	f.pendingActions = j.value("pendingActions", std::deque<PendingAction>{});
	f.treasureValue = j.value("treasureValue", 0);
	f.partyId = j.value("partyId", "");
	f.xpAwarded = j.value("xpAwarded", false);
	f.xpAmount = j.value("xpAmount", 0);
	f.history = j.value("history", std::vector<ActionLogEntry>{});
}

void to_json(json& j, const RoomConnection& c)
{
	j = json{
		{"id", c.id},
		{"from", c.from},
		{"to", c.to},
		{"oneWay", c.oneWay},
		{"description", c.description},
		{"passable", c.passable},
		{"locked", c.locked}
	};
}

void from_json(const json& j, RoomConnection& c)
{
	c.id = j.at("id").get<std::string>();
	c.from = j.at("from").get<std::string>();
	c.to = j.at("to").get<std::string>();
	c.oneWay = j.value("oneWay", false);
	c.description = j.value("description", "");
	c.passable = j.value("passable", true);
	c.locked = j.value("locked", false);
}

void to_json(json& j, const Room& r)
{
	j = json{
		{"id", r.id},
		{"name", r.name},
		{"description", r.description},
		{"connections", r.connections},
		{"fight", nullptr}
	};
	if (r.fight) j["fight"] = *r.fight;
}

void from_json(const json& j, Room& r)
{
	r.id = j.at("id").get<std::string>();
	r.name = j.value("name", r.id);
	r.description = j.value("description", "");
	r.connections = j.value("connections", std::set<std::string>{});
	r.fight.reset();
	if (j.contains("fight") && !j["fight"].is_null()) r.fight = j["fight"].get<Fight>();
}

void to_json(json& j, const Map& m)
{
	// rooms go out as an array, ordered by id like the std::map
	json rooms = json::array();
	for (const auto& [id, room] : m.rooms)
		rooms.push_back(room);

	json connections = json::array();
	for (const auto& [id, connection] : m.connections)
		connections.push_back(connection);

	j = json{
		{"id", m.id},
		{"name", m.name},
		{"summary", m.summary},
		{"version", m.version},
		{"rooms", rooms},
		{"connections", connections}
	};
}

void from_json(const json& j, Map& m)
{
	m.id = j.at("id").get<std::string>();
	m.name = j.value("name", m.id);
	m.summary = j.value("summary", "");
	m.version = j.value("version", uint64_t{ 0 });
	m.rooms.clear();
	m.connections.clear();
	if (j.contains("rooms")) {
		for (const auto& r : j["rooms"]) {
			Room room = r.get<Room>();
			m.rooms[room.id] = std::move(room);
		}
	}
	if (j.contains("connections")) {
		for (const auto& c : j["connections"]) {
			RoomConnection connection = c.get<RoomConnection>();
			m.connections[connection.id] = std::move(connection);
		}
	}
}

// --- Characters / Parties ---

void to_json(json& j, const CharacterRecord& c)
{
	j = json{
		{"id", c.id},
		{"owner", c.owner},
		{"name", c.name},
		{"level", c.level},
		{"hitPoints", c.hitPoints},
		{"maxHitPoints", c.maxHitPoints},
		{"stats", c.stats},
		{"bankedXp", c.bankedXp},
		{"flags", c.flags}
	};
}

void from_json(const json& j, CharacterRecord& c)
{
	c.id = j.at("id").get<std::string>();
	c.owner = j.value("owner", "");
	c.name = j.value("name", c.id);
	c.level = j.value("level", 1);
	c.hitPoints = j.value("hitPoints", 1);
	c.maxHitPoints = j.value("maxHitPoints", c.hitPoints);
	c.stats = j.value("stats", CombatStats{});
	c.bankedXp = j.value("bankedXp", 0);
	c.flags = j.value("flags", StatusFlags{});
}

void to_json(json& j, const Party& p)
{
	j = json{
		{"id", p.id},
		{"name", p.name},
		{"members", p.members},
		{"pendingXp", p.pendingXp},
		{"henchmen", p.henchmen},
		{"discoveredRooms", p.discoveredRooms},
		{"version", p.version}
	};
}

void from_json(const json& j, Party& p)
{
	p.id = j.at("id").get<std::string>();
	p.name = j.value("name", p.id);
	p.members = j.value("members", std::set<std::string>{});
	p.pendingXp = j.value("pendingXp", 0);
	p.henchmen = j.value("henchmen", std::map<std::string, std::string>{});
	p.discoveredRooms = j.value("discoveredRooms", std::map<std::string, std::set<std::string>>{});
	p.version = j.value("version", uint64_t{ 0 });
}

json parse_payload(const std::string& text)
{
	try {
		return json::parse(text);
	}
	catch (const json::parse_error& e) {
		throw_invalid(std::string("Malformed payload: ") + e.what());
	}
}
