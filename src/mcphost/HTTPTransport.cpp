//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcphost/HTTPTransport.cpp
// Purpose: HTTP/HTTPS JSON-RPC tool transport using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <atomic>
#include <format>
#include <sstream>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcphost/HTTPTransport.hpp"
#include "mcphost/HandshakeNegotiator.h"
#include "mcphost/TransportError.h"

namespace mcphost {
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
constexpr int kMaxToolPages = 32;
constexpr std::size_t kRawLimit = 4096;
constexpr const char* kSessionHeader = "Mcp-Session-Id";

bool isStaleConnection(const boost::system::error_code& ec) {
    return ec == http::error::end_of_stream || ec == net::error::eof || ec == net::error::connection_reset ||
           ec == net::error::broken_pipe || ec == net::error::connection_aborted;
}
} // namespace

class HTTPTransport::Impl {
public:
    using Response = http::response<http::string_body>;
    using Request = http::request<http::string_body>;

    struct UrlParts {
        std::string scheme;
        std::string host;
        std::string port;
        std::string path;
    };

    ServerDescriptor descriptor;
    HostOptions options;
    UrlParts url;
    std::unique_ptr<ssl::context> sslCtx; // present when https
    bool caInitOk{true};
    std::string caError;

    std::unique_ptr<beast::tcp_stream> plain;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> secure;
    beast::flat_buffer buffer;

    std::string sessionId;
    std::atomic<int64_t> nextId{1};
    std::atomic<std::size_t> connections{0};
    std::string lastBody;

    Impl(ServerDescriptor d, HostOptions o) : descriptor(std::move(d)), options(std::move(o)) {
        url = parseUrl(descriptor.endpoint.url);
        if (url.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::ERR_clear_error();
            boost::system::error_code ec;
            if (!descriptor.endpoint.caFile.empty()) {
                sslCtx->load_verify_file(descriptor.endpoint.caFile, ec);
            }
            if (!ec && !descriptor.endpoint.caPath.empty()) {
                sslCtx->add_verify_path(descriptor.endpoint.caPath, ec);
            }
            if (descriptor.endpoint.caFile.empty() && descriptor.endpoint.caPath.empty()) {
                sslCtx->set_default_verify_paths(ec);
                if (ec) {
                    LOG_DEBUG("HTTPS: set_default_verify_paths failed: {}", ec.message());
                    ec.clear();
                }
            }
            if (ec) {
                caInitOk = false;
                caError = ec.message();
                LOG_ERROR("HTTPTransport[{}]: failed to load CA file/path: {}", descriptor.name, caError);
            }
            sslCtx->set_verify_mode(ssl::verify_peer);
        }
    }

    //======================================================================================================
    // URL parsing (adequate for http[s]://host[:port]/path)
    //======================================================================================================
    static UrlParts parseUrl(const std::string& text) {
        UrlParts parts;
        std::size_t pos = 0;
        std::size_t schemeEnd = text.find("://");
        if (schemeEnd != std::string::npos) {
            parts.scheme = text.substr(0, schemeEnd);
            pos = schemeEnd + 3;
        } else {
            parts.scheme = "http";
        }

        std::size_t slash = text.find('/', pos);
        std::string hostPort;
        if (slash == std::string::npos) {
            hostPort = text.substr(pos);
            parts.path = "/";
        } else {
            hostPort = text.substr(pos, slash - pos);
            parts.path = text.substr(slash);
        }

        std::size_t colon = hostPort.rfind(':');
        if (colon == std::string::npos || hostPort.find(']', colon) != std::string::npos) {
            parts.host = hostPort;
            parts.port = (parts.scheme == "https") ? "443" : "80";
        } else {
            parts.host = hostPort.substr(0, colon);
            parts.port = hostPort.substr(colon + 1);
        }
        if (parts.host.size() > 2 && parts.host.front() == '[' && parts.host.back() == ']') {
            parts.host = parts.host.substr(1, parts.host.size() - 2);
        }
        return parts;
    }

    bool isOpen() const {
        if (secure) {
            return beast::get_lowest_layer(*secure).socket().is_open();
        }
        return plain && plain->socket().is_open();
    }

    void resetConnection() {
        boost::system::error_code ec;
        if (secure) {
            beast::get_lowest_layer(*secure).socket().shutdown(tcp::socket::shutdown_both, ec);
            beast::get_lowest_layer(*secure).close();
        }
        if (plain) {
            plain->socket().shutdown(tcp::socket::shutdown_both, ec);
            plain->close();
        }
        secure.reset();
        plain.reset();
        buffer.clear();
    }

    net::awaitable<void> connect() {
        if (!caInitOk) {
            throw TransportError(ErrorKind::ConnectionFailed, "HTTPS: CA initialization failed: " + caError);
        }
        auto ex = co_await net::this_coro::executor;
        resetConnection();
        try {
            tcp::resolver resolver(ex);
            auto results = co_await resolver.async_resolve(url.host, url.port, net::use_awaitable);
            if (url.scheme == "https") {
                secure = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ex, *sslCtx);
                if (!::SSL_set_tlsext_host_name(secure->native_handle(), url.host.c_str())) {
                    LOG_WARN("HTTPS: failed to set SNI hostname {}", url.host);
                }
                if (!::SSL_set1_host(secure->native_handle(), url.host.c_str())) {
                    LOG_WARN("HTTPS: failed to set expected peer hostname {}", url.host);
                }
                beast::get_lowest_layer(*secure).expires_after(options.connectTimeout);
                co_await beast::get_lowest_layer(*secure).async_connect(results, net::use_awaitable);
                co_await secure->async_handshake(ssl::stream_base::client, net::use_awaitable);
            } else {
                plain = std::make_unique<beast::tcp_stream>(ex);
                plain->expires_after(options.connectTimeout);
                co_await plain->async_connect(results, net::use_awaitable);
            }
        } catch (const boost::system::system_error& e) {
            resetConnection();
            throw TransportError(ErrorKind::ConnectionFailed,
                                 std::format("cannot connect to {}:{}: {}", url.host, url.port, e.code().message()));
        }
        connections.fetch_add(1);
        LOG_DEBUG("HTTPTransport[{}]: connected to {}:{}", descriptor.name, url.host, url.port);
    }

    Request buildRequest(const std::string& body) const {
        Request req{http::verb::post, url.path, 11};
        req.set(http::field::host, url.host);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json, text/event-stream");
        req.set(http::field::user_agent, options.clientName);
        req.keep_alive(true);
        for (const auto& [name, value] : descriptor.endpoint.headers) {
            req.set(name, value);
        }
        if (descriptor.endpoint.bearerToken && !descriptor.endpoint.bearerToken->empty()) {
            req.set(http::field::authorization, "Bearer " + *descriptor.endpoint.bearerToken);
        }
        if (!sessionId.empty()) {
            req.set(kSessionHeader, sessionId);
        }
        req.body() = body;
        req.prepare_payload();
        return req;
    }

    template <typename Stream>
    net::awaitable<Response> roundTrip(Stream& stream, beast::tcp_stream& layer, Request& req,
                                       std::chrono::milliseconds timeout) {
        layer.expires_after(timeout);
        co_await http::async_write(stream, req, net::use_awaitable);
        Response res;
        co_await http::async_read(stream, buffer, res, net::use_awaitable);
        layer.expires_never();
        co_return res;
    }

    //======================================================================================================
    // post
    // Purpose: Sends one body over the kept-alive connection, reconnecting once when the server had
    //          silently closed an idle connection.
    //======================================================================================================
    net::awaitable<Response> post(const std::string& body, std::chrono::milliseconds timeout) {
        Request req = buildRequest(body);
        for (int attempt = 0; attempt < 2; ++attempt) {
            bool fresh = false;
            if (!isOpen()) {
                co_await connect();
                fresh = true;
            }
            boost::system::error_code ec;
            std::optional<Response> res;
            try {
                if (secure) {
                    res = co_await roundTrip(*secure, beast::get_lowest_layer(*secure), req, timeout);
                } else {
                    res = co_await roundTrip(*plain, *plain, req, timeout);
                }
            } catch (const boost::system::system_error& e) {
                ec = e.code();
            }
            if (res) {
                if (!res->keep_alive()) {
                    resetConnection();
                }
                co_return std::move(*res);
            }
            resetConnection();
            if (ec == beast::error::timeout) {
                throw TransportError(ErrorKind::Timeout,
                                     std::format("HTTP request to {} timed out after {} ms", descriptor.endpoint.url,
                                                 timeout.count()));
            }
            if (!fresh && isStaleConnection(ec)) {
                LOG_DEBUG("HTTPTransport[{}]: keep-alive connection closed by peer; reconnecting", descriptor.name);
                continue;
            }
            throw TransportError(ErrorKind::ConnectionFailed,
                                 std::format("HTTP request to {} failed: {}", descriptor.endpoint.url, ec.message()));
        }
        throw TransportError(ErrorKind::ConnectionFailed, "HTTP connection to " + descriptor.endpoint.url + " kept closing");
    }

    // Extracts the JSON payload from a text/event-stream body (last data: event)
    static std::string eventStreamPayload(const std::string& body) {
        std::istringstream in(body);
        std::string line;
        std::string current;
        std::string last;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                if (!current.empty()) {
                    last = current;
                    current.clear();
                }
                continue;
            }
            if (line.rfind("data:", 0) == 0) {
                std::string data = line.substr(5);
                if (!data.empty() && data.front() == ' ') {
                    data.erase(0, 1);
                }
                current += data;
            }
        }
        return current.empty() ? last : current;
    }

    void checkStatus(const Response& res) {
        const unsigned status = res.result_int();
        if (status < 200 || status >= 300) {
            TransportError err(ErrorKind::HttpStatus,
                               std::format("HTTP {} from {}", status, descriptor.endpoint.url));
            err.WithHttpStatus(static_cast<int>(status)).WithRawResponse(res.body().substr(0, kRawLimit));
            throw err;
        }
    }

    net::awaitable<JSONRPCResponse> rpc(JSONRPCRequest request, std::chrono::milliseconds timeout) {
        request.id = nextId.fetch_add(1);
        LOG_DEBUG("HTTPTransport[{}]: -> {} id={}", descriptor.name, request.method, IdToString(request.id));
        Response res = co_await post(request.Serialize(), timeout);
        checkStatus(res);
        if (auto sid = res.find(kSessionHeader); sid != res.end()) {
            sessionId = std::string(sid->value().data(), sid->value().size());
        }

        std::string body = res.body();
        if (auto ct = res.find(http::field::content_type);
            ct != res.end() && ct->value().find("text/event-stream") != beast::string_view::npos) {
            body = eventStreamPayload(body);
        }
        lastBody = body.substr(0, kRawLimit);

        JSONRPCResponse resp;
        bool parsed = false;
        try {
            parsed = resp.FromValue(ParseJSON(body));
        } catch (const std::runtime_error& e) {
            LOG_DEBUG("HTTPTransport[{}]: response parse error: {}", descriptor.name, e.what());
        }
        if (!parsed) {
            TransportError err(ErrorKind::DecodeError,
                               std::format("undecodable JSON-RPC response from {}", descriptor.endpoint.url));
            err.WithRawResponse(lastBody);
            throw err;
        }
        co_return resp;
    }

    // A successful response's result, or ProtocolError carrying the server's error
    JSONValue resultOf(const JSONRPCResponse& resp, const std::string& method) {
        if (resp.IsError()) {
            TransportError err(ErrorKind::ProtocolError, std::format("{} on '{}' failed: {} (code {})", method,
                                                                      descriptor.name, resp.ErrorMessage(),
                                                                      resp.ErrorCode()));
            err.WithRawResponse(resp.Serialize());
            throw err;
        }
        return resp.result.value_or(JSONValue(nullptr));
    }
};

HTTPTransport::HTTPTransport(ServerDescriptor descriptor, HostOptions options)
    : pImpl(std::make_unique<Impl>(std::move(descriptor), std::move(options))) {}

HTTPTransport::~HTTPTransport() = default;

net::awaitable<HandshakeResult> HTTPTransport::Initialize() {
    FUNC_SCOPE();
    HandshakeNegotiator negotiator(*this, HandshakeSettings::From(pImpl->descriptor, pImpl->options));
    co_return co_await negotiator.Negotiate(pImpl->descriptor.handshake);
}

net::awaitable<std::vector<ToolInfo>> HTTPTransport::ListTools() {
    FUNC_SCOPE();
    Impl* impl = pImpl.get();
    std::vector<ToolInfo> out;
    std::optional<JSONValue> params = JSONValue(JSONValue::Object{});
    for (int page = 0; page < kMaxToolPages; ++page) {
        JSONRPCResponse resp = co_await impl->rpc(JSONRPCRequest(static_cast<int64_t>(0), Methods::ListTools, params),
                                                  impl->options.listTimeout);
        if (resp.IsError() || !resp.result) {
            TransportError err(ErrorKind::DiscoveryFailure,
                               std::format("tools/list on '{}' failed: {}", impl->descriptor.name, resp.ErrorMessage()));
            err.WithRawResponse(resp.Serialize());
            throw err;
        }
        const JSONValue::Array* tools = GetArrayMember(*resp.result, "tools");
        if (!tools) {
            TransportError err(ErrorKind::DiscoveryFailure,
                               std::format("tools/list on '{}' returned no tools array", impl->descriptor.name));
            err.WithRawResponse(resp.Serialize());
            throw err;
        }
        for (auto& t : ToolInfosFromArray(*tools)) {
            out.push_back(std::move(t));
        }
        auto cursor = GetStringMember(*resp.result, "nextCursor");
        if (!cursor || cursor->empty()) {
            break;
        }
        params = MakeObject({{"cursor", JSONValue(*cursor)}});
    }
    LOG_INFO("HTTPTransport[{}]: discovered {} tool(s)", impl->descriptor.name, out.size());
    co_return out;
}

net::awaitable<JSONValue> HTTPTransport::CallTool(std::string name, JSONValue arguments,
                                                  std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    if (arguments.IsNull()) {
        arguments = JSONValue(JSONValue::Object{});
    }
    JSONRPCResponse resp = co_await pImpl->rpc(
        JSONRPCRequest(static_cast<int64_t>(0), Methods::CallTool,
                       MakeObject({{"name", JSONValue(name)}, {"arguments", std::move(arguments)}})),
        timeout);
    co_return pImpl->resultOf(resp, Methods::CallTool);
}

net::awaitable<void> HTTPTransport::Close() {
    FUNC_SCOPE();
    if (pImpl->isOpen()) {
        LOG_DEBUG("HTTPTransport[{}]: closing keep-alive connection", pImpl->descriptor.name);
    }
    pImpl->resetConnection();
    pImpl->sessionId.clear();
    co_return;
}

std::string HTTPTransport::DiagnosticText() const {
    return pImpl->lastBody;
}

net::awaitable<std::optional<JSONRPCResponse>> HTTPTransport::Exchange(std::vector<JSONRPCRequest> requests,
                                                                       std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::optional<JSONRPCResponse> lastError;
    for (auto& req : requests) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }
        bool timedOut = false;
        try {
            JSONRPCResponse resp = co_await pImpl->rpc(std::move(req), remaining);
            if (!resp.IsError()) {
                co_return resp;
            }
            lastError = std::move(resp);
        } catch (const TransportError& e) {
            if (e.Kind() != ErrorKind::Timeout) {
                throw;
            }
            timedOut = true;
        }
        if (timedOut) {
            break;
        }
    }
    co_return lastError;
}

net::awaitable<void> HTTPTransport::Notify(JSONRPCNotification notification) {
    LOG_DEBUG("HTTPTransport[{}]: -> {} (notification)", pImpl->descriptor.name, notification.method);
    Impl::Response res = co_await pImpl->post(notification.Serialize(), pImpl->options.initializeTimeout);
    const unsigned status = res.result_int();
    if (status < 200 || status >= 300) {
        LOG_WARN("HTTPTransport[{}]: notification {} answered with HTTP {}", pImpl->descriptor.name,
                 notification.method, status);
    }
}

std::size_t HTTPTransport::ConnectionCount() const {
    return pImpl->connections.load();
}

} // namespace mcphost
