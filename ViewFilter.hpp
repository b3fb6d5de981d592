// File: ViewFilter.hpp
// Description: What a connected client is allowed to see. The role of a
// session picks one filter, and every snapshot or delta leaving the server
// goes through it. Nothing else in the server decides visibility.
#pragma once

#include "CampaignData.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <variant>
#include <vector>

struct PlayerRole {
	std::string username;
	std::set<std::string> characterIds; // characters this account owns
};

struct DmRole {
	std::string username;
};

using SessionRole = std::variant<PlayerRole, DmRole>;

inline bool is_dm(const SessionRole& role) { return std::holds_alternative<DmRole>(role); }
std::string role_username(const SessionRole& role);

class ViewFilter
{
public:
	virtual ~ViewFilter() = default;

	virtual bool can_see_room(const Map& map, const Room& room) const = 0;
	virtual bool can_see_party(const Party& party) const = 0;

	// Room as this viewer may see it (with its fight, filtered)
	virtual nlohmann::json room_view(const Map& map, const Room& room) const = 0;

	// The whole map: visible rooms only, plus the connections between them
	virtual nlohmann::json map_view(const Map& map) const = 0;

	virtual nlohmann::json party_view(const Party& party) const = 0;
};

// The DM sees everything as stored
class DmViewFilter : public ViewFilter
{
public:
	bool can_see_room(const Map& map, const Room& room) const override;
	bool can_see_party(const Party& party) const override;
	nlohmann::json room_view(const Map& map, const Room& room) const override;
	nlohmann::json map_view(const Map& map) const override;
	nlohmann::json party_view(const Party& party) const override;
};

/**
 * @class PlayerViewFilter
 * @brief Rooms discovered by any party the player's characters belong to,
 * plus any room where one of those characters is fighting. Monster stats
 * and hit points, DM notes on pending requests and treasure stay hidden.
 */
class PlayerViewFilter : public ViewFilter
{
	PlayerRole role_;
	std::map<std::string, std::set<std::string>> discovered_; // map id -> room ids
	std::set<std::string> parties_;

	bool fights_here(const Room& room) const;

public:
	PlayerViewFilter(PlayerRole role, const std::vector<Party>& parties);

	bool can_see_room(const Map& map, const Room& room) const override;
	bool can_see_party(const Party& party) const override;
	nlohmann::json room_view(const Map& map, const Room& room) const override;
	nlohmann::json map_view(const Map& map) const override;
	nlohmann::json party_view(const Party& party) const override;
};

// parties: the parties the player's characters belong to (ignored for the DM)
std::unique_ptr<ViewFilter> make_view_filter(const SessionRole& role, const std::vector<Party>& parties);
