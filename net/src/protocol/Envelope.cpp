/**
 * @file Envelope.cpp
 * @brief JSON envelope codec built on nlohmann::json.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/net/protocol/Envelope.hpp>
#include <pxv/world/Inventory.hpp>

#include <nlohmann/json.hpp>

#include <limits>

namespace pxv::net::protocol {

using json = nlohmann::json;

namespace {

[[nodiscard]] core::Expected<core::i32> readOffset(const json &params, const char *key)
{
    auto it = params.find(key);
    if (it == params.end() || it->is_null())
    {
        return 0;
    }
    if (!it->is_number_integer())
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               std::string{"move: '"} + key + "' must be an integer");
    }

    if (it->is_number_unsigned())
    {
        if (it->get<core::u64>() > static_cast<core::u64>(std::numeric_limits<core::i32>::max()))
        {
            return core::makeError(core::ErrorCode::kProtocolViolation,
                                   std::string{"move: '"} + key + "' is out of range");
        }
        return static_cast<core::i32>(it->get<core::u64>());
    }

    const auto value = it->get<core::i64>();
    if (value < std::numeric_limits<core::i32>::min() || value > std::numeric_limits<core::i32>::max())
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               std::string{"move: '"} + key + "' is out of range");
    }
    return static_cast<core::i32>(value);
}

[[nodiscard]] json inventoryToJson(const world::Inventory &inventory)
{
    json out = json::object();
    for (core::usize i = 0; i < world::kItemKindCount; ++i)
    {
        const auto kind = static_cast<world::ItemKind>(i);
        out[std::string{world::toString(kind)}] = inventory.count(kind);
    }
    return out;
}

} // anonymous namespace

core::Expected<sim::Action> decodeCommand(std::string_view text)
{
    json j = json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object())
    {
        return core::makeError(core::ErrorCode::kProtocolViolation, "Invalid JSON format");
    }

    auto action = j.find("action");
    if (action == j.end() || !action->is_string())
    {
        return core::makeError(core::ErrorCode::kProtocolViolation, "Missing action");
    }

    json params = j.value("params", json::object());
    if (params.is_null())
    {
        params = json::object();
    }
    if (!params.is_object())
    {
        return core::makeError(core::ErrorCode::kProtocolViolation, "params must be an object");
    }

    const auto name = action->get<std::string>();
    switch (sim::parseActionKind(name))
    {
    case sim::ActionKind::kMove:
    {
        const core::i32 dx = PXV_TRY(readOffset(params, "dx"));
        const core::i32 dy = PXV_TRY(readOffset(params, "dy"));
        return sim::Action::makeMove(dx, dy);
    }
    case sim::ActionKind::kHarvest:
        return sim::Action::makeHarvest();
    case sim::ActionKind::kCraft:
        return sim::Action::makeCraft();
    case sim::ActionKind::kUnknown:
        break;
    }
    return sim::Action::makeUnknown(name);
}

std::string encodeWelcome(world::EntityId agentId)
{
    json j;
    j["type"] = "connection_established";
    j["agent_id"] = agentId.toString();
    j["message"] = std::string{kWelcomeMessage};
    return j.dump();
}

std::string encodeError(std::string_view message)
{
    json j;
    j["type"] = "error";
    j["message"] = std::string{message};
    return j.dump();
}

std::string encodeActionResult(const sim::ActionOutcome &outcome)
{
    if (outcome.error == core::ErrorCode::kUnknownAction)
    {
        return encodeError("Unknown action: " + outcome.name);
    }

    json j;
    j["type"] = "action_confirmed";
    j["action"] = outcome.name;
    j["success"] = outcome.succeeded();
    return j.dump();
}

std::string encodeGameState(const session::AgentUpdate &update)
{
    json agent;
    agent["id"] = update.self.id.toString();
    agent["name"] = update.self.name;
    agent["x"] = update.self.position.x;
    agent["y"] = update.self.position.y;
    agent["inventory"] = inventoryToJson(update.self.inventory);

    json info;
    info["dimensions"] = json::array({update.world.width, update.world.height});
    info["total_agents"] = update.world.totalAgents;
    info["total_resources"] = update.world.totalResources;
    info["total_entities"] = update.world.totalEntities;

    json j;
    j["type"] = "game_state";
    j["tick"] = update.tick;
    j["agent_state"] = std::move(agent);
    j["world_info"] = std::move(info);
    return j.dump();
}

std::vector<std::string> encodeUpdate(const session::AgentUpdate &update)
{
    std::vector<std::string> messages;
    messages.reserve(2);
    if (update.self.lastAction)
    {
        messages.push_back(encodeActionResult(*update.self.lastAction));
    }
    messages.push_back(encodeGameState(update));
    return messages;
}

} // namespace pxv::net::protocol
