/**
 * @file StatusPage.cpp
 * @brief Status summary rendering (JSON through nlohmann::json, HTML by hand).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/net/protocol/StatusPage.hpp>

#include <nlohmann/json.hpp>

namespace pxv::net::protocol {

using json = nlohmann::json;

namespace {

[[nodiscard]] std::string_view reasonPhrase(core::u16 code) noexcept
{
    switch (code)
    {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    default:  return "Internal Server Error";
    }
}

} // anonymous namespace

core::Expected<HttpRequestLine> parseRequestLine(std::string_view head)
{
    const auto eol = head.find("\r\n");
    std::string_view line = head.substr(0, eol);

    const auto firstSpace = line.find(' ');
    const auto lastSpace = line.rfind(' ');
    if (firstSpace == std::string_view::npos || lastSpace == firstSpace)
    {
        return core::makeError(core::ErrorCode::kProtocolViolation, "malformed request line");
    }

    const std::string_view version = line.substr(lastSpace + 1);
    if (!version.starts_with("HTTP/1."))
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               "unsupported protocol '" + std::string{version} + "'");
    }

    std::string_view target = line.substr(firstSpace + 1, lastSpace - firstSpace - 1);
    if (target.empty() || target.front() != '/')
    {
        return core::makeError(core::ErrorCode::kProtocolViolation, "request target must be a path");
    }
    if (const auto query = target.find('?'); query != std::string_view::npos)
    {
        target = target.substr(0, query);
    }

    return HttpRequestLine{std::string{line.substr(0, firstSpace)}, std::string{target}};
}

std::string encodeStatusJson(const ServerStatus &status)
{
    json j;
    j["status"] = "online";
    j["tick"] = status.tick;
    j["dimensions"] = json::array({status.width, status.height});
    j["total_agents"] = status.totalAgents;
    j["total_resources"] = status.totalResources;
    j["total_entities"] = status.totalEntities;
    j["connected_agents"] = status.connectedAgents;
    j["game_port"] = status.gamePort;
    return j.dump();
}

std::string renderStatusHtml(const ServerStatus &status)
{
    const std::string size = std::to_string(status.width) + "x" + std::to_string(status.height);

    std::string html;
    html += "<!DOCTYPE html>\n<html>\n<head><title>Proxiverse Server Status</title></head>\n<body>\n";
    html += "<h1>Proxiverse</h1>\n";
    html += "<h2>Server Status: Online</h2>\n<ul>\n";
    html += "<li><strong>Agent port:</strong> " + std::to_string(status.gamePort) + " (newline-delimited JSON over TCP)</li>\n";
    html += "<li><strong>Connected Agents:</strong> " + std::to_string(status.connectedAgents) + "</li>\n";
    html += "<li><strong>World Tick:</strong> " + std::to_string(status.tick) + "</li>\n";
    html += "<li><strong>World Size:</strong> " + size + "</li>\n";
    html += "<li><strong>Total Resources:</strong> " + std::to_string(status.totalResources) + "</li>\n";
    html += "</ul>\n<h3>Available Actions</h3>\n<ul>\n";
    html += "<li><code>{\"action\": \"move\", \"params\": {\"dx\": 1, \"dy\": 0}}</code></li>\n";
    html += "<li><code>{\"action\": \"harvest\", \"params\": {}}</code></li>\n";
    html += "<li><code>{\"action\": \"craft\", \"params\": {}}</code></li>\n";
    html += "</ul>\n<p>Machine-readable summary: <a href=\"/status\">/status</a></p>\n</body>\n</html>\n";
    return html;
}

std::string makeHttpResponse(core::u16 code, std::string_view contentType, std::string_view body)
{
    std::string response = "HTTP/1.1 " + std::to_string(code) + " " + std::string{reasonPhrase(code)} + "\r\n";
    response += "Content-Type: " + std::string{contentType} + "\r\n";
    response += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    if (code == 405)
    {
        response += "Allow: GET\r\n";
    }
    response += "Connection: close\r\n\r\n";
    response += body;
    return response;
}

} // namespace pxv::net::protocol
