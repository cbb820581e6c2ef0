// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mcphost
{

/// @brief An http(s) URL split into the part the HTTP client connects to and the request path.
struct HttpUrl
{
    std::string origin; ///< scheme://host[:port]
    std::string path;   ///< Always starts with '/'.
    bool secure = false; ///< https
};

/// @brief Splits an http or https URL. Other schemes and empty hosts are rejected.
[[nodiscard]] auto parseHttpUrl(std::string_view url) -> Result<HttpUrl>;

/// @brief Tells whether the HTTP client was built with TLS, i.e. whether https URLs can be served.
[[nodiscard]] auto httpsSupported() noexcept -> bool;

/// @brief Parses @p url and rejects https when this build cannot speak TLS.
[[nodiscard]] auto parseReachableHttpUrl(std::string_view url) -> Result<HttpUrl>;

/// @brief Extracts the JSON payloads of all `data:` lines of a text/event-stream body.
/// Lines that are not valid JSON are skipped.
[[nodiscard]] auto parseEventStream(std::string_view body) -> std::vector<nlohmann::json>;

/// @brief Configuration for a streamable HTTP MCP endpoint.
struct HttpTransportConfig
{
    std::string url;
    std::map<std::string, std::string> headers;

    /// @brief Connect and write timeout.
    std::chrono::milliseconds timeout { 5000 };

    /// @brief Maximum time to wait for a response body (SSE streams may be slow).
    std::chrono::milliseconds readTimeout { 300000 };
};

/// @brief Transport speaking MCP "streamable HTTP": every message is POSTed to one endpoint.
///
/// Responses arrive either as a JSON body or as a text/event-stream body; both are queued
/// and handed out by receive(). The server-assigned Mcp-Session-Id is echoed on every
/// request and the session is terminated with DELETE on close().
class HttpTransport: public Transport
{
  public:
    explicit HttpTransport(HttpTransportConfig config);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    [[nodiscard]] auto start() -> VoidResult override;
    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Returns the session id assigned by the server (empty before the first response).
    [[nodiscard]] auto sessionId() const -> const std::string&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcphost
