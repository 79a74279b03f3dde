//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcphost/HttpStreamTransport.cpp
// Purpose: Streamable HTTP/HTTPS transport using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <deque>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <fmt/format.h>
#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcphost/HttpStreamTransport.hpp"
#include "mcphost/Protocol.h"
#include "mcphost/ProtocolServer.h"

namespace mcphost {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;
using Clock = std::chrono::steady_clock;

constexpr const char* kSessionHeader = "Mcp-Session-Id";
constexpr const char* kProtocolVersionHeader = "MCP-Protocol-Version";
constexpr const char* kLastEventIdHeader = "Last-Event-ID";
constexpr const char* kAllowedMethods = "GET, POST, DELETE, OPTIONS";
constexpr const char* kAllowedHeaders =
    "Content-Type, Accept, Authorization, Mcp-Session-Id, MCP-Protocol-Version, Last-Event-ID";
constexpr const char* kExposedHeaders = "Mcp-Session-Id, MCP-Protocol-Version, WWW-Authenticate";

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::string> header(const Request& req, boost::beast::string_view name) {
    auto it = req.find(name);
    if (it == req.end()) return std::nullopt;
    auto v = it->value();
    return std::string(v.data(), v.size());
}

std::optional<std::string> header(const Request& req, http::field name) {
    auto it = req.find(name);
    if (it == req.end()) return std::nullopt;
    auto v = it->value();
    return std::string(v.data(), v.size());
}

std::string targetPath(const Request& req) {
    std::string target(req.target().data(), req.target().size());
    auto q = target.find('?');
    return q == std::string::npos ? target : target.substr(0, q);
}

std::string errorBody(const std::string& message) {
    JSONValue::Object o;
    o["error"] = std::make_shared<JSONValue>(message);
    return serializeJSONValue(JSONValue(std::move(o)));
}

// Host part of an Origin value ("scheme://host[:port]").
std::string originHost(const std::string& origin) {
    std::string rest = origin;
    auto sep = rest.find("://");
    if (sep != std::string::npos) rest = rest.substr(sep + 3);
    if (!rest.empty() && rest.front() == '[') {
        auto rb = rest.find(']');
        return rb == std::string::npos ? rest : rest.substr(0, rb + 1);
    }
    auto end = rest.find_first_of(":/");
    return toLower(end == std::string::npos ? rest : rest.substr(0, end));
}

bool isLoopbackAddress(const std::string& address) {
    if (toLower(address) == "localhost") return true;
    boost::system::error_code ec;
    auto addr = net::ip::make_address(address, ec);
    return !ec && addr.is_loopback();
}

std::string newSessionId() {
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

} // namespace

class HttpStreamTransport::Impl {
public:
    //////////////////////////////////////////// State ////////////////////////////////////////////
    // Wake-up handle for one open GET stream. pending is only touched on the stream's strand.
    struct StreamSignal {
        explicit StreamSignal(const net::any_io_executor& ex) : timer(ex) {}
        net::steady_timer timer;
        bool pending{false};
        std::atomic<bool> closed{false};
    };

    struct StoredEvent {
        uint64_t id{0};
        std::string data;
        Clock::time_point at;
    };

    struct SessionState {
        Clock::time_point created;
        Clock::time_point lastActivity;
        std::deque<StoredEvent> history;
        uint64_t nextEventId{1};
        std::vector<std::shared_ptr<StreamSignal>> streams;
    };

    ProtocolServer& server;
    HttpStreamTransport::Options opts;
    const bool loopbackBind;
    std::atomic<bool> running{false};
    std::atomic<unsigned short> boundPort{0};

    // Declared before the io_context: coroutine frames destroyed with it still unregister their streams.
    mutable std::mutex sessionsMutex;
    std::unordered_map<std::string, SessionState> sessions;
    IServerTransport::ErrorHandler errorHandler;

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::vector<std::thread> ioThreads;
    net::thread_pool workers;

    Impl(ProtocolServer& s, HttpStreamTransport::Options o)
        : server(s), opts(std::move(o)), loopbackBind(isLoopbackAddress(opts.address)),
          workers(std::max<std::size_t>(1, opts.workerThreads)) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HttpStreamTransport: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
        server.SetNotificationSink([this](const std::string& sessionId, const JSONRPCNotification& n) {
            if (!publish(sessionId, n)) {
                LOG_DEBUG("Dropping {} for unknown session '{}'", n.method, sessionId);
            }
        });
    }

    ~Impl() {
        server.SetNotificationSink(nullptr);
        shutdown();
    }

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    void shutdown() {
        running.store(false);
        if (acceptor) {
            boost::system::error_code ec;
            acceptor->close(ec);
        }
        closeAllStreams();
        ioc.stop();
        for (auto& t : ioThreads) {
            if (t.joinable()) t.join();
        }
        ioThreads.clear();
        workers.stop();
        workers.join();
        // Stream timers must not outlive the io_context
        std::lock_guard<std::mutex> lk(sessionsMutex);
        for (auto& [id, st] : sessions) {
            st.streams.clear();
        }
    }

    //////////////////////////////////////////// Sessions ////////////////////////////////////////////
    static void wake(const std::shared_ptr<StreamSignal>& sig) {
        net::post(sig->timer.get_executor(), [sig]() {
            sig->pending = true;
            sig->timer.cancel();
        });
    }

    static void close(const std::shared_ptr<StreamSignal>& sig) {
        sig->closed.store(true);
        wake(sig);
    }

    void closeAllStreams() {
        std::vector<std::shared_ptr<StreamSignal>> all;
        {
            std::lock_guard<std::mutex> lk(sessionsMutex);
            for (auto& [id, st] : sessions) {
                all.insert(all.end(), st.streams.begin(), st.streams.end());
            }
        }
        for (auto& sig : all) close(sig);
    }

    std::string createSession() {
        std::string id = newSessionId();
        std::lock_guard<std::mutex> lk(sessionsMutex);
        auto& st = sessions[id];
        st.created = Clock::now();
        st.lastActivity = st.created;
        return id;
    }

    bool touch(const std::string& id) {
        std::lock_guard<std::mutex> lk(sessionsMutex);
        auto it = sessions.find(id);
        if (it == sessions.end()) return false;
        it->second.lastActivity = Clock::now();
        return true;
    }

    bool endSession(const std::string& id) {
        std::vector<std::shared_ptr<StreamSignal>> streams;
        {
            std::lock_guard<std::mutex> lk(sessionsMutex);
            auto it = sessions.find(id);
            if (it == sessions.end()) return false;
            streams = std::move(it->second.streams);
            sessions.erase(it);
        }
        server.EndConnection(id);
        for (auto& sig : streams) close(sig);
        return true;
    }

    std::size_t sweep() {
        std::vector<std::string> expired;
        const auto now = Clock::now();
        {
            std::lock_guard<std::mutex> lk(sessionsMutex);
            for (const auto& [id, st] : sessions) {
                if (now - st.lastActivity >= opts.sessionTtl) expired.push_back(id);
            }
        }
        std::size_t removed = 0;
        for (const auto& id : expired) {
            if (endSession(id)) {
                ++removed;
                LOG_INFO("Session {} expired", id);
            }
        }
        return removed;
    }

    void pruneHistory(SessionState& st, Clock::time_point now) {
        while (st.history.size() > opts.eventHistoryMax) st.history.pop_front();
        while (!st.history.empty() && now - st.history.front().at > opts.eventHistoryDuration) {
            st.history.pop_front();
        }
    }

    bool publish(const std::string& sessionId, const JSONRPCNotification& n) {
        std::vector<std::shared_ptr<StreamSignal>> streams;
        {
            std::lock_guard<std::mutex> lk(sessionsMutex);
            auto it = sessions.find(sessionId);
            if (it == sessions.end()) return false;
            auto& st = it->second;
            const auto now = Clock::now();
            st.history.push_back(StoredEvent{st.nextEventId++, n.Serialize(), now});
            pruneHistory(st, now);
            streams = st.streams;
        }
        for (auto& sig : streams) wake(sig);
        return true;
    }

    // Registers a stream and returns the id after which delivery starts; nullopt if the session is gone.
    std::optional<uint64_t> openStream(const std::string& sessionId, const std::optional<std::string>& lastEventId,
                                       const std::shared_ptr<StreamSignal>& sig) {
        std::lock_guard<std::mutex> lk(sessionsMutex);
        auto it = sessions.find(sessionId);
        if (it == sessions.end()) return std::nullopt;
        auto& st = it->second;
        st.streams.push_back(sig);
        pruneHistory(st, Clock::now());
        uint64_t start = st.nextEventId - 1;
        if (lastEventId.has_value()) {
            uint64_t requested = 0;
            std::istringstream is(*lastEventId);
            if (is >> requested) {
                for (const auto& ev : st.history) {
                    if (ev.id == requested) { start = requested; break; }
                }
            }
        }
        return start;
    }

    void closeStream(const std::string& sessionId, const std::shared_ptr<StreamSignal>& sig) {
        std::lock_guard<std::mutex> lk(sessionsMutex);
        auto it = sessions.find(sessionId);
        if (it == sessions.end()) return;
        auto& v = it->second.streams;
        v.erase(std::remove(v.begin(), v.end(), sig), v.end());
    }

    std::optional<std::vector<StoredEvent>> eventsAfter(const std::string& sessionId, uint64_t after) {
        std::lock_guard<std::mutex> lk(sessionsMutex);
        auto it = sessions.find(sessionId);
        if (it == sessions.end()) return std::nullopt;
        std::vector<StoredEvent> out;
        for (const auto& ev : it->second.history) {
            if (ev.id > after) out.push_back(ev);
        }
        return out;
    }

    //////////////////////////////////////////// Validation ////////////////////////////////////////////
    bool originAllowed(const std::string& origin) const {
        if (!opts.allowedOrigins.empty()) {
            const std::string lo = toLower(origin);
            // Exact match, or an allowed origin followed by a port
            return std::any_of(opts.allowedOrigins.begin(), opts.allowedOrigins.end(), [&](const std::string& a) {
                if (a == "*") return true;
                const std::string la = toLower(a);
                return lo == la || (lo.size() > la.size() && lo.compare(0, la.size(), la) == 0 && lo[la.size()] == ':');
            });
        }
        if (!loopbackBind) return false;
        const std::string host = originHost(origin);
        return host == "localhost" || host == "127.0.0.1" || host == "[::1]";
    }

    void applyCors(const Request& req, Response& res) const {
        auto origin = header(req, http::field::origin);
        if (origin.has_value() && originAllowed(*origin)) {
            res.set(http::field::access_control_allow_origin, *origin);
            res.set(http::field::vary, "Origin");
            res.set(http::field::access_control_expose_headers, kExposedHeaders);
        }
    }

    Response makeResponse(const Request& req, http::status status, std::string body,
                          const char* contentType = "application/json") const {
        Response res{status, req.version()};
        res.set(http::field::server, "mcphost");
        res.set(kProtocolVersionHeader, PROTOCOL_VERSION);
        if (!body.empty()) {
            res.set(http::field::content_type, contentType);
        }
        res.keep_alive(req.keep_alive());
        res.body() = std::move(body);
        res.prepare_payload();
        applyCors(req, res);
        return res;
    }

    //==========================================================================================================
    // checkAccess
    // Purpose: Origin, protocol version and bearer checks shared by every method on the endpoint.
    // Returns:
    //   The rejection response, or nullopt when the request may proceed (tokenOut set when authenticated).
    //==========================================================================================================
    std::optional<Response> checkAccess(const Request& req, std::optional<auth::TokenInfo>& tokenOut) const {
        if (auto origin = header(req, http::field::origin); origin.has_value() && !originAllowed(*origin)) {
            LOG_WARN("Rejecting request from disallowed origin '{}'", *origin);
            return makeResponse(req, http::status::forbidden, errorBody("Origin not allowed"));
        }
        if (auto version = header(req, kProtocolVersionHeader); version.has_value() && !isSupportedProtocolVersion(*version)) {
            LOG_WARN("Rejecting unsupported protocol version '{}'", *version);
            return makeResponse(req, http::status::bad_request, errorBody("Unsupported protocol version: " + *version));
        }
        if (opts.authGate) {
            auth::TokenInfo info;
            auto check = opts.authGate->Check(header(req, http::field::authorization).value_or(""), info);
            if (!check.ok) {
                auto res = makeResponse(req, static_cast<http::status>(check.httpStatus), errorBody(check.errorMessage));
                if (check.includeWWWAuthenticate) {
                    res.set(http::field::www_authenticate, opts.authGate->Challenge(check));
                }
                return res;
            }
            tokenOut = std::move(info);
        }
        return std::nullopt;
    }

    //////////////////////////////////////////// Handlers ////////////////////////////////////////////
    // Runs on a worker thread. Arguments are taken by value so they live in the coroutine frame.
    net::awaitable<std::unique_ptr<JSONRPCResponse>> runOnWorker(JSONValue message, ConnectionContext ctx,
                                                                 std::optional<auth::TokenInfo> token) {
        auth::TokenInfoScope scope(token.has_value() ? &token.value() : nullptr);
        try {
            co_return server.HandleMessage(message, ctx);
        } catch (const std::exception& e) {
            LOG_ERROR("HttpStreamTransport: dispatch failed: {}", e.what());
            co_return CreateErrorResponse(nullptr, JSONRPCErrorCodes::InternalError, e.what());
        } catch (...) {
            LOG_ERROR("HttpStreamTransport: dispatch failed: unknown exception");
            co_return CreateErrorResponse(nullptr, JSONRPCErrorCodes::InternalError, "Unknown error");
        }
    }

    net::awaitable<std::unique_ptr<JSONRPCResponse>> dispatch(JSONValue message, ConnectionContext ctx,
                                                              std::optional<auth::TokenInfo> token) {
        co_return co_await net::co_spawn(workers.get_executor(),
                                         runOnWorker(std::move(message), std::move(ctx), std::move(token)),
                                         net::use_awaitable);
    }

    net::awaitable<Response> handlePost(const Request& req) {
        std::optional<auth::TokenInfo> token;
        if (auto rejected = checkAccess(req, token)) co_return std::move(*rejected);

        if (auto ct = header(req, http::field::content_type);
            ct.has_value() && toLower(*ct).find("application/json") == std::string::npos) {
            co_return makeResponse(req, http::status::unsupported_media_type, errorBody("Content-Type must be application/json"));
        }
        auto sessionId = header(req, kSessionHeader);
        if (sessionId.has_value() && !touch(*sessionId)) {
            co_return makeResponse(req, http::status::not_found, errorBody("Session not found"));
        }

        JSONValue message;
        try {
            message = parseJSON(req.body());
        } catch (const JSONParseError& e) {
            LOG_WARN("HttpStreamTransport: unparseable body: {}", e.what());
            auto err = CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error");
            co_return makeResponse(req, http::status::bad_request, err->Serialize());
        }

        const bool isInitialize = message.isObject() && message.find("id") != nullptr &&
                                  getString(message, "method").value_or("") == Methods::Initialize;
        if (isInitialize) {
            sessionId = createSession();
            LOG_INFO("Minted session {}", *sessionId);
        } else if (!sessionId.has_value()) {
            co_return makeResponse(req, http::status::bad_request, errorBody("Missing Mcp-Session-Id header"));
        }

        ConnectionContext ctx{*sessionId};
        auto response = co_await dispatch(std::move(message), std::move(ctx), std::move(token));
        if (isInitialize && (!response || response->IsError())) {
            endSession(*sessionId);
            sessionId.reset();
        }
        if (!response) {
            co_return makeResponse(req, http::status::accepted, std::string());
        }

        Response res;
        const std::string payload = response->Serialize();
        const bool wantsStream = toLower(header(req, http::field::accept).value_or("")).find("text/event-stream") != std::string::npos;
        if (wantsStream) {
            res = makeResponse(req, http::status::ok, fmt::format("event: message\ndata: {}\n\n", payload), "text/event-stream");
            res.set(http::field::cache_control, "no-cache");
        } else {
            res = makeResponse(req, http::status::ok, payload);
        }
        if (sessionId.has_value()) {
            res.set(kSessionHeader, *sessionId);
            res.set(kProtocolVersionHeader, server.NegotiatedVersion(*sessionId).value_or(PROTOCOL_VERSION));
        }
        co_return res;
    }

    Response handleDelete(const Request& req) {
        std::optional<auth::TokenInfo> token;
        if (auto rejected = checkAccess(req, token)) return std::move(*rejected);
        if (!opts.allowClientTermination) {
            auto res = makeResponse(req, http::status::method_not_allowed, errorBody("Session termination not allowed"));
            res.set(http::field::allow, "GET, POST, OPTIONS");
            return res;
        }
        auto sessionId = header(req, kSessionHeader);
        if (!sessionId.has_value()) {
            return makeResponse(req, http::status::bad_request, errorBody("Missing Mcp-Session-Id header"));
        }
        if (!endSession(*sessionId)) {
            return makeResponse(req, http::status::not_found, errorBody("Session not found"));
        }
        LOG_INFO("Session {} terminated by client", *sessionId);
        return makeResponse(req, http::status::no_content, std::string());
    }

    Response handlePreflight(const Request& req) {
        if (auto origin = header(req, http::field::origin); origin.has_value() && !originAllowed(*origin)) {
            return makeResponse(req, http::status::forbidden, errorBody("Origin not allowed"));
        }
        auto res = makeResponse(req, http::status::no_content, std::string());
        res.set(http::field::access_control_allow_methods, kAllowedMethods);
        res.set(http::field::access_control_allow_headers, kAllowedHeaders);
        res.set(http::field::access_control_max_age, "86400");
        return res;
    }

    Response handleHealth(const Request& req) {
        std::size_t active = 0;
        {
            std::lock_guard<std::mutex> lk(sessionsMutex);
            active = sessions.size();
        }
        JSONValue::Object o;
        o["status"] = std::make_shared<JSONValue>("healthy");
        o["server"] = std::make_shared<JSONValue>(server.ServerInfo().name);
        o["version"] = std::make_shared<JSONValue>(server.ServerInfo().version);
        o["protocol_version"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
        o["active_sessions"] = std::make_shared<JSONValue>(static_cast<int64_t>(active));
        return makeResponse(req, http::status::ok, serializeJSONValue(JSONValue(std::move(o))));
    }

    Response handleIdentity(const Request& req) {
        JSONValue::Object o;
        o["message"] = std::make_shared<JSONValue>(fmt::format("{} MCP server", server.ServerInfo().name));
        o["mcp_endpoint"] = std::make_shared<JSONValue>(opts.endpoint);
        o["protocol_version"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
        return makeResponse(req, http::status::ok, serializeJSONValue(JSONValue(std::move(o))));
    }

    net::awaitable<Response> handle(const Request& req) {
        const std::string path = targetPath(req);
        if (path == "/health" && req.method() == http::verb::get) {
            co_return handleHealth(req);
        }
        if (path == opts.endpoint) {
            switch (req.method()) {
                case http::verb::post: co_return co_await handlePost(req);
                case http::verb::delete_: co_return handleDelete(req);
                case http::verb::options: co_return handlePreflight(req);
                default: {
                    auto res = makeResponse(req, http::status::method_not_allowed, errorBody("Method not allowed"));
                    res.set(http::field::allow, kAllowedMethods);
                    co_return res;
                }
            }
        }
        if (path == "/" && req.method() == http::verb::get) {
            co_return handleIdentity(req);
        }
        co_return makeResponse(req, http::status::not_found, errorBody("Not found"));
    }

    //==========================================================================================================
    // streamEvents
    // Purpose: Serve a GET stream: replay buffered events after Last-Event-ID, then live events with
    //          keep-alive comments until the client goes away or the session ends.
    //==========================================================================================================
    template <class Stream>
    net::awaitable<void> streamEvents(Stream& stream, const Request& req, const std::string& sessionId) {
        auto sig = std::make_shared<StreamSignal>(co_await net::this_coro::executor);
        auto start = openStream(sessionId, header(req, kLastEventIdHeader), sig);
        if (!start.has_value()) {
            auto res = makeResponse(req, http::status::not_found, errorBody("Session not found"));
            co_await http::async_write(stream, res, net::use_awaitable);
            co_return;
        }
        struct Unregister {
            Impl* self; const std::string& id; std::shared_ptr<StreamSignal> sig;
            ~Unregister() { self->closeStream(id, sig); }
        } unregister{this, sessionId, sig};

        http::response<http::empty_body> res{http::status::ok, req.version()};
        res.set(http::field::server, "mcphost");
        res.set(http::field::content_type, "text/event-stream");
        res.set(http::field::cache_control, "no-cache");
        res.set(kSessionHeader, sessionId);
        res.set(kProtocolVersionHeader, server.NegotiatedVersion(sessionId).value_or(PROTOCOL_VERSION));
        if (auto origin = header(req, http::field::origin); origin.has_value() && originAllowed(*origin)) {
            res.set(http::field::access_control_allow_origin, *origin);
        }
        res.keep_alive(false);
        http::response_serializer<http::empty_body> sr{res};
        co_await http::async_write_header(stream, sr, net::use_awaitable);
        LOG_DEBUG("SSE stream opened for session {} at event {}", sessionId, *start);

        uint64_t last = *start;
        while (running.load() && !sig->closed.load()) {
            auto events = eventsAfter(sessionId, last);
            if (!events.has_value()) break;
            for (const auto& ev : *events) {
                const std::string frame = fmt::format("id: {}\nevent: message\ndata: {}\n\n", ev.id, ev.data);
                co_await net::async_write(stream, net::buffer(frame), net::use_awaitable);
                last = ev.id;
            }
            if (sig->pending) {
                sig->pending = false;
                continue;
            }
            sig->timer.expires_after(opts.keepAliveInterval);
            boost::system::error_code ec;
            co_await sig->timer.async_wait(net::redirect_error(net::use_awaitable, ec));
            if (ec == net::error::operation_aborted) {
                sig->pending = false;
                continue;
            }
            if (!touch(sessionId)) break;
            static const std::string keepAlive = ":keepalive\n\n";
            co_await net::async_write(stream, net::buffer(keepAlive), net::use_awaitable);
        }
        LOG_DEBUG("SSE stream closed for session {}", sessionId);
    }

    template <class Stream>
    net::awaitable<bool> route(Stream& stream, Request& req) {
        if (targetPath(req) == opts.endpoint && req.method() == http::verb::get) {
            std::optional<auth::TokenInfo> token;
            std::optional<Response> rejected = checkAccess(req, token);
            auto sessionId = header(req, kSessionHeader);
            if (!rejected.has_value()) {
                if (!sessionId.has_value()) {
                    rejected = makeResponse(req, http::status::bad_request, errorBody("Missing Mcp-Session-Id header"));
                } else if (!touch(*sessionId)) {
                    rejected = makeResponse(req, http::status::not_found, errorBody("Session not found"));
                } else if (toLower(header(req, http::field::accept).value_or("")).find("text/event-stream") == std::string::npos) {
                    rejected = makeResponse(req, http::status::not_acceptable, errorBody("Accept must include text/event-stream"));
                }
            }
            if (rejected.has_value()) {
                co_await http::async_write(stream, *rejected, net::use_awaitable);
                co_return rejected->keep_alive();
            }
            co_await streamEvents(stream, req, *sessionId);
            co_return false;
        }
        Response res = co_await handle(req);
        co_await http::async_write(stream, res, net::use_awaitable);
        co_return res.keep_alive();
    }

    template <class Stream>
    net::awaitable<void> serve(Stream& stream) {
        boost::beast::flat_buffer buffer;
        while (running.load()) {
            http::request_parser<http::string_body> parser;
            parser.body_limit(opts.maxBodyBytes);
            boost::system::error_code ec;
            co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
            if (ec == http::error::end_of_stream) co_return;
            if (ec == http::error::body_limit) {
                Response res{http::status::payload_too_large, 11};
                res.set(http::field::content_type, "application/json");
                res.body() = errorBody("Request body too large");
                res.keep_alive(false);
                res.prepare_payload();
                co_await http::async_write(stream, res, net::use_awaitable);
                co_return;
            }
            if (ec) throw boost::system::system_error(ec);
            Request req = parser.release();
            if (!co_await route(stream, req)) break;
        }
    }

    void logSessionError(const char* kind, const std::exception& e) {
        if (!running.load()) {
            // Suppress shutdown-related errors; log at DEBUG only in debug builds
#ifdef _DEBUG
            LOG_DEBUG("HttpStreamTransport {} session suppressed during shutdown: {}", kind, e.what());
#endif
        } else {
            LOG_DEBUG("HttpStreamTransport {} connection ended: {}", kind, e.what());
        }
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            co_await serve(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            logSessionError("plain", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serve(tls);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            logSessionError("TLS", e);
        }
        co_return;
    }

    //////////////////////////////////////////// Loops ////////////////////////////////////////////
    void bind() {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty() ||
            !std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; }) ||
            opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
            throw std::invalid_argument("HttpStreamTransport invalid port: " + opts.port);
        }
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::make_strand(ioc), net::use_awaitable);
                auto ex = socket.get_executor();
                if (sslCtx) {
                    net::co_spawn(ex, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ex, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                // Suppress shutdown-related errors (e.g., operation_aborted when acceptor is closed)
#ifdef _DEBUG
                LOG_DEBUG("HttpStreamTransport accept suppressed during shutdown: {}", e.what());
#endif
            } else {
                setError(std::string("HttpStreamTransport accept error: ") + e.what());
            }
        }
        co_return;
    }

    net::awaitable<void> sweepLoop() {
        net::steady_timer timer(co_await net::this_coro::executor);
        const auto interval = std::clamp<std::chrono::milliseconds>(
            opts.sessionTtl / 4, std::chrono::milliseconds(250), std::chrono::milliseconds(60000));
        while (running.load()) {
            timer.expires_after(interval);
            boost::system::error_code ec;
            co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
            if (!running.load()) break;
            sweep();
        }
        co_return;
    }
};

///////////////////////////////////////// HttpStreamTransport ///////////////////////////////////////////
HttpStreamTransport::HttpStreamTransport(ProtocolServer& server, Options options)
    : pImpl(std::make_unique<Impl>(server, std::move(options))) {}

HttpStreamTransport::~HttpStreamTransport() = default;

std::future<void> HttpStreamTransport::Start() {
    std::promise<void> ready;
    auto fut = ready.get_future();
    try {
        pImpl->bind();
    } catch (const std::exception& e) {
        pImpl->setError(std::string("HttpStreamTransport bind failed: ") + e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->server.BeginServing();
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    net::co_spawn(pImpl->ioc, pImpl->sweepLoop(), net::detached);
    const std::size_t n = std::max<std::size_t>(1, pImpl->opts.ioThreads);
    for (std::size_t i = 0; i < n; ++i) {
        pImpl->ioThreads.emplace_back([this]() {
            try {
                pImpl->ioc.run();
            } catch (const std::exception& e) {
                pImpl->setError(std::string("HttpStreamTransport I/O thread error: ") + e.what());
            }
        });
    }
    LOG_INFO("HttpStreamTransport listening on {}://{}:{}{}", pImpl->opts.scheme, pImpl->opts.address,
             pImpl->boundPort.load(), pImpl->opts.endpoint);
    ready.set_value();
    return fut;
}

std::future<void> HttpStreamTransport::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    LOG_INFO("Stopping HttpStreamTransport");
    pImpl->shutdown();
    done.set_value();
    return fut;
}

void HttpStreamTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

unsigned short HttpStreamTransport::BoundPort() const {
    return pImpl->boundPort.load();
}

std::size_t HttpStreamTransport::SessionCount() const {
    std::lock_guard<std::mutex> lk(pImpl->sessionsMutex);
    return pImpl->sessions.size();
}

bool HttpStreamTransport::HasSession(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lk(pImpl->sessionsMutex);
    return pImpl->sessions.count(sessionId) != 0;
}

std::size_t HttpStreamTransport::SweepExpiredSessions() {
    return pImpl->sweep();
}

bool HttpStreamTransport::Publish(const std::string& sessionId, const JSONRPCNotification& notification) {
    return pImpl->publish(sessionId, notification);
}

bool HttpStreamTransport::IsOriginAllowed(const std::string& origin) const {
    return pImpl->originAllowed(origin);
}

HttpStreamTransport::Options HttpStreamTransport::Options::FromUri(const std::string& uri) {
    Options opts;
    std::string cfg = uri;
    // Trim leading/trailing spaces
    auto trim = [](std::string& s) {
        auto notSpace = [](unsigned char c) { return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx) { return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        opts.scheme = "http";
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    // Split query params
    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }

    std::string hostPort = hostPortPath;
    auto slash = hostPortPath.find('/');
    if (slash != std::string::npos) {
        hostPort = hostPortPath.substr(0, slash);
        std::string path = hostPortPath.substr(slash);
        if (path.size() > 1) {
            if (path.back() == '/') path.pop_back();
            opts.endpoint = path;
        }
    }
    trim(hostPort);

    // host[:port] including IPv6 in [addr]:port form
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(opts.port);
        if (opts.port.empty()) opts.port = "8080";
    }

    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") opts.certFile = val;
            else if (key == "key") opts.keyFile = val;
        }
    }
    return opts;
}

} // namespace mcphost
