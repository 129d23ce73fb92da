/**
 * @file TestEnvelope.cpp
 * @brief JSON envelope decoding and encoding.
 */

#include <catch2/catch_test_macros.hpp>

#include <pxv/net/protocol/Envelope.hpp>

#include <nlohmann/json.hpp>

namespace pxv::net::protocol {

using json = nlohmann::json;

TEST_CASE("decodeCommand parses the three actions", "[net][envelope]")
{
    auto move = decodeCommand(R"({"action":"move","params":{"dx":1,"dy":-1}})");
    REQUIRE(move.has_value());
    REQUIRE(move->kind == sim::ActionKind::kMove);
    REQUIRE(move->move.dx == 1);
    REQUIRE(move->move.dy == -1);

    auto harvest = decodeCommand(R"({"action":"harvest","params":{}})");
    REQUIRE(harvest->kind == sim::ActionKind::kHarvest);

    auto craft = decodeCommand(R"({"action":"craft"})");
    REQUIRE(craft->kind == sim::ActionKind::kCraft);
}

TEST_CASE("decodeCommand defaults missing offsets to zero", "[net][envelope]")
{
    auto move = decodeCommand(R"({"action":"move","params":{"dx":-1}})");
    REQUIRE(move.has_value());
    REQUIRE(move->move.dx == -1);
    REQUIRE(move->move.dy == 0);
}

TEST_CASE("decodeCommand keeps unknown names for the engine to reject", "[net][envelope]")
{
    auto unknown = decodeCommand(R"({"action":"teleport","params":{"x":3}})");
    REQUIRE(unknown.has_value());
    REQUIRE(unknown->kind == sim::ActionKind::kUnknown);
    REQUIRE(unknown->name == "teleport");
}

TEST_CASE("decodeCommand rejects malformed input", "[net][envelope]")
{
    auto notJson = decodeCommand("move north");
    REQUIRE(notJson.error().code() == core::ErrorCode::kProtocolViolation);
    REQUIRE(notJson.error().message() == "Invalid JSON format");

    REQUIRE(decodeCommand("[1,2]").error().message() == "Invalid JSON format");
    REQUIRE(decodeCommand(R"({"params":{}})").error().message() == "Missing action");
    REQUIRE(decodeCommand(R"({"action":"move","params":{"dx":"1"}})").error().code()
            == core::ErrorCode::kProtocolViolation);
    REQUIRE(decodeCommand(R"({"action":"move","params":{"dx":1.5}})").error().code()
            == core::ErrorCode::kProtocolViolation);
    REQUIRE(decodeCommand(R"({"action":"move","params":[1]})").error().code()
            == core::ErrorCode::kProtocolViolation);
}

TEST_CASE("decodeCommand rejects offsets outside the 32-bit range", "[net][envelope]")
{
    auto huge = decodeCommand(R"({"action":"move","params":{"dx":18446744073709551615}})");
    REQUIRE_FALSE(huge.has_value());
    REQUIRE(huge.error().code() == core::ErrorCode::kProtocolViolation);

    REQUIRE_FALSE(decodeCommand(R"({"action":"move","params":{"dy":2147483648}})").has_value());
    REQUIRE_FALSE(decodeCommand(R"({"action":"move","params":{"dy":-2147483649}})").has_value());

    auto edge = decodeCommand(R"({"action":"move","params":{"dx":2147483647,"dy":-2147483648}})");
    REQUIRE(edge.has_value());
    REQUIRE(edge->move.dx == 2147483647);
    REQUIRE(edge->move.dy == -2147483647 - 1);
}

TEST_CASE("encodeGameState carries the agent and world info", "[net][envelope]")
{
    session::AgentUpdate update;
    update.tick = 12;
    update.self.id = world::EntityId{7};
    update.self.name = "RemoteAgent_1";
    update.self.position = {6, 5};
    REQUIRE(update.self.inventory.credit(world::ItemKind::kOre, 4).has_value());
    update.world.width = 20;
    update.world.height = 20;
    update.world.totalAgents = 2;
    update.world.totalResources = 15;
    update.world.totalEntities = 17;

    const json j = json::parse(encodeGameState(update));
    REQUIRE(j["type"] == "game_state");
    REQUIRE(j["tick"] == 12);
    REQUIRE(j["agent_state"]["id"] == "7");
    REQUIRE(j["agent_state"]["name"] == "RemoteAgent_1");
    REQUIRE(j["agent_state"]["x"] == 6);
    REQUIRE(j["agent_state"]["y"] == 5);
    REQUIRE(j["agent_state"]["inventory"]["ORE"] == 4);
    REQUIRE(j["agent_state"]["inventory"]["FUEL"] == 0);
    REQUIRE(j["agent_state"]["inventory"]["COMPONENTS"] == 0);
    REQUIRE(j["world_info"]["dimensions"] == json::array({20, 20}));
    REQUIRE(j["world_info"]["total_agents"] == 2);
    REQUIRE(j["world_info"]["total_resources"] == 15);
    REQUIRE(j["world_info"]["total_entities"] == 17);
}

TEST_CASE("encodeUpdate sends the action result before the state", "[net][envelope]")
{
    session::AgentUpdate update;
    update.tick = 3;
    update.self.id = world::EntityId{1};

    REQUIRE(encodeUpdate(update).size() == 1);

    sim::ActionOutcome outcome;
    outcome.kind = sim::ActionKind::kHarvest;
    outcome.name = "harvest";
    outcome.status = sim::ActionStatus::kNoOp;
    update.self.lastAction = outcome;

    auto messages = encodeUpdate(update);
    REQUIRE(messages.size() == 2);

    const json confirmed = json::parse(messages[0]);
    REQUIRE(confirmed["type"] == "action_confirmed");
    REQUIRE(confirmed["action"] == "harvest");
    REQUIRE(confirmed["success"] == false);
    REQUIRE(json::parse(messages[1])["type"] == "game_state");
}

TEST_CASE("Unknown actions are answered with an error", "[net][envelope]")
{
    sim::ActionOutcome outcome;
    outcome.name = "teleport";
    outcome.status = sim::ActionStatus::kRejected;
    outcome.error = core::ErrorCode::kUnknownAction;

    const json j = json::parse(encodeActionResult(outcome));
    REQUIRE(j["type"] == "error");
    REQUIRE(j["message"] == "Unknown action: teleport");
}

TEST_CASE("Welcome and error envelopes", "[net][envelope]")
{
    const json welcome = json::parse(encodeWelcome(world::EntityId{42}));
    REQUIRE(welcome["type"] == "connection_established");
    REQUIRE(welcome["agent_id"] == "42");
    REQUIRE(welcome["message"] == "Connected to Proxiverse server");

    const json error = json::parse(encodeError("Invalid JSON format"));
    REQUIRE(error["type"] == "error");
    REQUIRE(error["message"] == "Invalid JSON format");
}

} // namespace pxv::net::protocol
