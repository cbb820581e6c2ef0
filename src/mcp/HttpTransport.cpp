// SPDX-License-Identifier: Apache-2.0
#include "HttpTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <httplib.h>

#include <deque>
#include <format>

namespace mcphost
{

namespace
{
    constexpr auto SessionHeader = "Mcp-Session-Id";

    auto isEventStream(const httplib::Response& response) -> bool
    {
        return response.get_header_value("Content-Type").find("text/event-stream") != std::string::npos;
    }
} // namespace

auto parseHttpUrl(std::string_view url) -> Result<HttpUrl>
{
    auto const schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos)
        return makeError(ErrorCode::ConfigError, std::format("URL has no scheme: '{}'", url));

    auto const scheme = url.substr(0, schemeEnd);
    if (scheme != "http" && scheme != "https")
        return makeError(ErrorCode::ConfigError,
                         std::format("Unsupported URL scheme '{}' (only http and https are allowed)", scheme));

    auto const rest = url.substr(schemeEnd + 3);
    auto const pathStart = rest.find('/');
    auto const authority = rest.substr(0, pathStart);
    if (authority.empty())
        return makeError(ErrorCode::ConfigError, std::format("URL has no host: '{}'", url));

    return HttpUrl {
        .origin = std::format("{}://{}", scheme, authority),
        .path = pathStart == std::string_view::npos ? std::string("/") : std::string(rest.substr(pathStart)),
        .secure = scheme == "https",
    };
}

auto httpsSupported() noexcept -> bool
{
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    return true;
#else
    return false;
#endif
}

auto parseReachableHttpUrl(std::string_view url) -> Result<HttpUrl>
{
    return parseHttpUrl(url).and_then([](HttpUrl parsed) -> Result<HttpUrl> {
        if (parsed.secure && !httpsSupported())
            return makeError(ErrorCode::ConfigError,
                             std::format("https requires an HTTP client built with TLS support: '{}'",
                                         parsed.origin));
        return parsed;
    });
}

auto parseEventStream(std::string_view body) -> std::vector<nlohmann::json>
{
    auto messages = std::vector<nlohmann::json> {};
    auto data = std::string {};

    auto flush = [&] {
        if (data.empty())
            return;
        auto parsed = json::parse(data);
        if (parsed)
            messages.push_back(std::move(*parsed));
        else
            log::debug("Skipping malformed SSE event: {}", parsed.error().message);
        data.clear();
    };

    while (!body.empty())
    {
        auto const eol = body.find('\n');
        auto line = body.substr(0, eol);
        body = eol == std::string_view::npos ? std::string_view {} : body.substr(eol + 1);

        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        // An empty line terminates an event; multiple data lines are joined with '\n'.
        if (line.empty())
        {
            flush();
            continue;
        }
        if (!line.starts_with("data:"))
            continue;

        line.remove_prefix(5);
        if (line.starts_with(' '))
            line.remove_prefix(1);
        if (!data.empty())
            data += '\n';
        data.append(line);
    }
    flush();

    return messages;
}

struct HttpTransport::Impl
{
    HttpTransportConfig config;
    HttpUrl url;
    std::unique_ptr<httplib::Client> client;
    std::string sessionId;
    std::deque<nlohmann::json> pending;
    bool connected = false;

    [[nodiscard]] auto requestHeaders() const -> httplib::Headers
    {
        auto headers = httplib::Headers { { "Accept", "application/json, text/event-stream" } };
        for (const auto& [key, value]: config.headers)
            headers.emplace(key, value);
        if (!sessionId.empty())
            headers.emplace(SessionHeader, sessionId);
        return headers;
    }

    void enqueue(nlohmann::json message)
    {
        // JSON-RPC batches are flattened into individual messages.
        if (message.is_array())
        {
            for (auto& item: message)
                pending.push_back(std::move(item));
        }
        else
        {
            pending.push_back(std::move(message));
        }
    }
};

HttpTransport::HttpTransport(HttpTransportConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

HttpTransport::~HttpTransport()
{
    close();
}

auto HttpTransport::start() -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");

    auto url = parseReachableHttpUrl(_impl->config.url);
    if (!url)
        return std::unexpected(url.error());

    auto client = std::make_unique<httplib::Client>(url->origin);
    if (!client->is_valid())
        return makeError(ErrorCode::TransportError,
                         std::format("Cannot create HTTP client for '{}'", url->origin));

    client->set_connection_timeout(_impl->config.timeout);
    client->set_write_timeout(_impl->config.timeout);
    client->set_read_timeout(_impl->config.readTimeout);
    client->set_keep_alive(true);
    client->set_follow_location(true);

    _impl->url = std::move(*url);
    _impl->client = std::move(client);
    _impl->sessionId.clear();
    _impl->pending.clear();
    _impl->connected = true;
    log::debug("HTTP transport ready for {}{}", _impl->url.origin, _impl->url.path);
    return {};
}

auto HttpTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto res = _impl->client->Post(_impl->url.path, _impl->requestHeaders(), message.dump(), "application/json");
    if (!res)
        return makeError(ErrorCode::TransportError,
                         std::format("POST {}{} failed: {}",
                                     _impl->url.origin,
                                     _impl->url.path,
                                     httplib::to_string(res.error())));

    if (res->status == 404 && !_impl->sessionId.empty())
    {
        _impl->connected = false;
        return makeError(ErrorCode::TransportError, "MCP session expired (HTTP 404)");
    }
    if (res->status < 200 || res->status >= 300)
        return makeError(ErrorCode::TransportError, std::format("HTTP error {} from MCP endpoint", res->status));

    if (res->has_header(SessionHeader))
        _impl->sessionId = res->get_header_value(SessionHeader);

    // 202 Accepted / 204 No Content: notifications and responses carry no body.
    if (res->body.empty())
        return {};

    if (isEventStream(*res))
    {
        for (auto& msg: parseEventStream(res->body))
            _impl->enqueue(std::move(msg));
        return {};
    }

    auto parsed = json::parse(res->body);
    if (!parsed)
        return std::unexpected(parsed.error());
    _impl->enqueue(std::move(*parsed));
    return {};
}

auto HttpTransport::receive() -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    if (_impl->pending.empty())
        return makeError(ErrorCode::ProtocolError, "No pending message from MCP endpoint");

    auto message = std::move(_impl->pending.front());
    _impl->pending.pop_front();
    return message;
}

void HttpTransport::close()
{
    if (!_impl->client)
        return;

    if (_impl->connected && !_impl->sessionId.empty())
    {
        auto headers = httplib::Headers { { SessionHeader, _impl->sessionId } };
        for (const auto& [key, value]: _impl->config.headers)
            headers.emplace(key, value);

        auto res = _impl->client->Delete(_impl->url.path, headers);
        if (!res)
            log::debug("Terminating MCP session failed: {}", httplib::to_string(res.error()));
    }

    _impl->connected = false;
    _impl->pending.clear();
    _impl->sessionId.clear();
    _impl->client->stop();
    _impl->client.reset();
}

auto HttpTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto HttpTransport::sessionId() const -> const std::string&
{
    return _impl->sessionId;
}

} // namespace mcphost
