/**
 * @file StatusPage.hpp
 * @brief Server status summary and its HTTP renderings.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_NET_PROTOCOL_STATUSPAGE_HPP
    #define PXV_NET_PROTOCOL_STATUSPAGE_HPP

#include <pxv/core/Types.hpp>
#include <pxv/core/Expected.hpp>

#include <string>
#include <string_view>

namespace pxv::net::protocol {

/**
 * @struct ServerStatus
 * @brief What the status page reports, taken from the last published tick.
 */
struct ServerStatus
{
    core::u64   tick{0};
    core::i32   width{0};
    core::i32   height{0};
    core::usize totalAgents{0};
    core::usize totalResources{0};
    core::usize totalEntities{0};
    core::u32   connectedAgents{0};
    core::u16   gamePort{0};
};

/**
 * @struct HttpRequestLine
 * @brief Method and path of an HTTP/1.x request, query string stripped.
 */
struct HttpRequestLine
{
    std::string method;
    std::string path;
};

/**
 * @brief Parses the first line of @p head ("GET /status HTTP/1.1").
 * @return ProtocolViolation when the line is not an HTTP/1.x request line.
 */
[[nodiscard]] core::Expected<HttpRequestLine> parseRequestLine(std::string_view head);

/** @brief {"status":"online","tick":...,"dimensions":[w,h],...} */
[[nodiscard]] std::string encodeStatusJson(const ServerStatus &status);

/** @brief Human-readable page served at "/". */
[[nodiscard]] std::string renderStatusHtml(const ServerStatus &status);

/** @brief Complete HTTP/1.1 response with Content-Length and Connection: close. */
[[nodiscard]] std::string makeHttpResponse(core::u16 code, std::string_view contentType, std::string_view body);

} // namespace pxv::net::protocol

#endif // PXV_NET_PROTOCOL_STATUSPAGE_HPP
