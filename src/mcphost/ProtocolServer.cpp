//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolServer.cpp
// Purpose: MCP request dispatch, handshake state machine, result shaping and cancellation bookkeeping
//==========================================================================================================
#include <algorithm>
#include <atomic>
#include <cctype>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcphost/ProtocolServer.h"
#include "mcphost/errors/Errors.h"
#include "mcphost/version.h"

namespace mcphost {

namespace {

//==========================================================================================================
// InvalidParamsError
// Purpose: Thrown by parameter helpers; the dispatcher maps it to JSON-RPC InvalidParams.
//==========================================================================================================
class InvalidParamsError : public std::invalid_argument {
public:
    explicit InvalidParamsError(const std::string& what, std::optional<JSONValue> data = std::nullopt)
        : std::invalid_argument(what), data(std::move(data)) {}
    std::optional<JSONValue> data;
};

const JSONValue& paramsOf(const JSONRPCRequest& req) {
    static const JSONValue kEmpty{JSONValue::Object{}};
    if (req.params.has_value() && req.params->isObject()) {
        return req.params.value();
    }
    return kEmpty;
}

JSONValue paramData(const std::string& param) {
    JSONValue::Object o;
    o["param"] = std::make_shared<JSONValue>(param);
    return JSONValue(std::move(o));
}

std::string requireString(const JSONValue& params, const std::string& key) {
    auto v = getString(params, key);
    if (!v.has_value() || v->empty()) {
        throw InvalidParamsError("Missing required parameter: " + key, paramData(key));
    }
    return *v;
}

std::optional<std::string> optionalString(const JSONValue& params, const std::string& key) {
    const JSONValue* v = params.find(key);
    if (!v || v->isNull()) return std::nullopt;
    if (!v->isString()) {
        throw InvalidParamsError("Parameter must be a string: " + key, paramData(key));
    }
    return std::get<std::string>(v->value);
}

struct ListParams {
    std::optional<std::string> cursor;
    int64_t pageSize{kDefaultPageSize};
};

ListParams parseListParams(const JSONValue& params) {
    ListParams lp;
    lp.cursor = optionalString(params, "cursor");
    // "limit" is accepted as an alias for pageSize
    for (const char* key : {"pageSize", "limit"}) {
        const JSONValue* v = params.find(key);
        if (!v || v->isNull()) continue;
        auto n = getInt(params, key);
        if (!n.has_value()) {
            throw InvalidParamsError(std::string("Parameter must be an integer: ") + key, paramData(key));
        }
        lp.pageSize = *n;
        break;
    }
    return lp;
}

std::unique_ptr<JSONRPCResponse> makeResult(const JSONRPCId& id, JSONValue result) {
    auto resp = std::make_unique<JSONRPCResponse>();
    resp->id = id;
    resp->result = std::move(result);
    return resp;
}

JSONValue textBlock(const std::string& text) {
    JSONValue::Object t;
    t["type"] = std::make_shared<JSONValue>("text");
    t["text"] = std::make_shared<JSONValue>(text);
    return JSONValue(std::move(t));
}

// Text rendering of handler output: strings verbatim, structures as sorted 2-space JSON, scalars as JSON text.
std::string renderText(const JSONValue& v) {
    if (const auto* s = std::get_if<std::string>(&v.value)) {
        return *s;
    }
    if (v.isObject() || v.isArray()) {
        return serializeJSONValue(v, 2);
    }
    return serializeJSONValue(v);
}

JSONValue toolResult(const std::string& text, bool isError) {
    JSONValue::Object obj;
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(textBlock(text)));
    obj["content"] = std::make_shared<JSONValue>(std::move(content));
    obj["isError"] = std::make_shared<JSONValue>(isError);
    return JSONValue(std::move(obj));
}

JSONValue userMessage(const std::string& text) {
    JSONValue::Object m;
    m["role"] = std::make_shared<JSONValue>("user");
    m["content"] = std::make_shared<JSONValue>(textBlock(text));
    return JSONValue(std::move(m));
}

JSONValue makeToolObj(const Tool& tool) {
    JSONValue::Object o;
    o["name"] = std::make_shared<JSONValue>(tool.name);
    o["description"] = std::make_shared<JSONValue>(tool.description);
    o["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    if (tool.outputSchema.has_value()) {
        o["outputSchema"] = std::make_shared<JSONValue>(tool.outputSchema.value());
    }
    JSONValue::Object ann;
    ann["readOnlyHint"] = std::make_shared<JSONValue>(tool.annotations.readOnly);
    ann["destructiveHint"] = std::make_shared<JSONValue>(tool.annotations.destructive);
    ann["idempotentHint"] = std::make_shared<JSONValue>(tool.annotations.idempotent);
    ann["openWorldHint"] = std::make_shared<JSONValue>(tool.annotations.openWorld);
    o["annotations"] = std::make_shared<JSONValue>(std::move(ann));
    if (tool.category.has_value() || !tool.tags.empty()) {
        JSONValue::Object meta;
        if (tool.category.has_value()) {
            meta["category"] = std::make_shared<JSONValue>(tool.category.value());
        }
        if (!tool.tags.empty()) {
            JSONValue::Array tags;
            for (const auto& t : tool.tags) tags.push_back(std::make_shared<JSONValue>(t));
            meta["tags"] = std::make_shared<JSONValue>(std::move(tags));
        }
        o["_meta"] = std::make_shared<JSONValue>(std::move(meta));
    }
    return JSONValue(std::move(o));
}

JSONValue makeResourceObj(const Resource& r) {
    JSONValue::Object o;
    o["uri"] = std::make_shared<JSONValue>(r.uri);
    o["name"] = std::make_shared<JSONValue>(r.name);
    o["description"] = std::make_shared<JSONValue>(r.description);
    o["mimeType"] = std::make_shared<JSONValue>(r.mimeType);
    return JSONValue(std::move(o));
}

JSONValue makePromptObj(const Prompt& p) {
    JSONValue::Object o;
    o["name"] = std::make_shared<JSONValue>(p.name);
    o["description"] = std::make_shared<JSONValue>(p.description);
    if (p.arguments.has_value()) {
        o["arguments"] = std::make_shared<JSONValue>(p.arguments.value());
    }
    return JSONValue(std::move(o));
}

// MCP log levels (RFC 5424 names) onto the process logger.
LogLevel logLevelFromMcp(const std::string& level) {
    std::string s; s.reserve(level.size());
    for (char c : level) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (s == "debug") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "info" || s == "notice") return LogLevel::LOG_INFO_LEVEL;
    if (s == "warning") return LogLevel::LOG_WARN_LEVEL;
    if (s == "error" || s == "critical" || s == "alert" || s == "emergency") return LogLevel::LOG_ERROR_LEVEL;
    return LogLevel::LOG_INFO_LEVEL;
}

} // namespace

//==========================================================================================================
// ProtocolServer::Impl
//==========================================================================================================
class ProtocolServer::Impl {
public:
    explicit Impl(Options opts) : options(std::move(opts)), tasks(options.tasks) {
        if (options.serverInfo.version.empty()) {
            options.serverInfo.version = getVersionString();
        }
    }

    struct ConnectionState {
        bool initialized{false};
        bool ready{false};
        std::string protocolVersion;
        Implementation clientInfo;
    };

    Options options;
    ToolRegistry tools;
    ResourceRegistry resources;
    PromptRegistry prompts;

    std::mutex servingMutex;
    std::atomic<bool> serving{false};

    mutable std::mutex connectionsMutex;
    std::unordered_map<std::string, ConnectionState> connections;

    std::mutex sinkMutex;
    NotificationSink sink;

    // In-flight requests keyed by "<connectionId>|<requestId>"
    std::mutex cancelMutex;
    std::unordered_map<std::string, std::shared_ptr<std::stop_source>> inFlight;

    // Declared last: its destructor joins worker threads that call back into this object.
    TaskManager tasks;

    static std::string requestKey(const std::string& connectionId, const JSONRPCId& id) {
        return connectionId + "|" + idToString(id);
    }

    // RAII helper to register/unregister a std::stop_source for an in-flight request
    struct StopSourceGuard {
        Impl* self{nullptr};
        std::string key;
        std::shared_ptr<std::stop_source> src;
        StopSourceGuard(Impl* s, const std::string& connectionId, const JSONRPCId& id)
            : self(s), key(requestKey(connectionId, id)), src(std::make_shared<std::stop_source>()) {
            std::lock_guard<std::mutex> lk(self->cancelMutex);
            self->inFlight[key] = src;
        }
        ~StopSourceGuard() {
            std::lock_guard<std::mutex> lk(self->cancelMutex);
            auto it = self->inFlight.find(key);
            if (it != self->inFlight.end() && it->second == src) {
                self->inFlight.erase(it);
            }
        }
        StopSourceGuard(const StopSourceGuard&) = delete;
        StopSourceGuard& operator=(const StopSourceGuard&) = delete;
    };

    ///////////////////////////////////////// Notifications ///////////////////////////////////////////
    void sendNotification(const std::string& connectionId, const std::string& method, JSONValue params) {
        NotificationSink target;
        {
            std::lock_guard<std::mutex> lk(sinkMutex);
            target = sink;
        }
        if (!target) {
            LOG_DEBUG("No notification sink; dropping {}", method);
            return;
        }
        JSONRPCNotification n(method, std::move(params));
        try {
            target(connectionId, n);
        } catch (const std::exception& e) {
            LOG_WARN("Notification {} to connection '{}' failed: {}", method, connectionId, e.what());
        } catch (...) {
            LOG_WARN("Notification {} to connection '{}' failed: unknown exception", method, connectionId);
        }
    }

    void broadcastListChanged(const char* method) {
        std::vector<std::string> targets;
        {
            std::lock_guard<std::mutex> lk(connectionsMutex);
            for (const auto& [id, st] : connections) {
                if (st.initialized) targets.push_back(id);
            }
        }
        LOG_DEBUG("Broadcasting {} to {} connection(s)", method, targets.size());
        for (const auto& id : targets) {
            sendNotification(id, method, JSONValue(JSONValue::Object{}));
        }
    }

    void emitProgress(const std::string& connectionId, const JSONValue& token, double current,
                      const std::optional<double>& total, const std::optional<std::string>& message) {
        JSONValue::Object p;
        p["progressToken"] = std::make_shared<JSONValue>(token);
        p["progress"] = std::make_shared<JSONValue>(current);
        if (total.has_value()) p["total"] = std::make_shared<JSONValue>(total.value());
        if (message.has_value()) p["message"] = std::make_shared<JSONValue>(message.value());
        sendNotification(connectionId, Methods::Progress, JSONValue(std::move(p)));
    }

    bool hasPendingLoaders() const {
        return tools.HasPendingLoaders() || resources.HasPendingLoaders() || prompts.HasPendingLoaders();
    }

    void beginServing() {
        std::lock_guard<std::mutex> lk(servingMutex);
        if (serving.load()) {
            // loaders queued after the serve phase began
            const std::size_t late = tools.RunLoaders() + resources.RunLoaders() + prompts.RunLoaders();
            if (late > 0) LOG_INFO("Ran {} late loader(s)", late);
            return;
        }
        const std::size_t loaders = tools.RunLoaders() + resources.RunLoaders() + prompts.RunLoaders();
        tools.SetChangeListener([this]() { broadcastListChanged(Methods::ToolListChanged); });
        resources.SetChangeListener([this]() { broadcastListChanged(Methods::ResourceListChanged); });
        prompts.SetChangeListener([this]() { broadcastListChanged(Methods::PromptListChanged); });
        serving.store(true);
        LOG_INFO("Serving {} tool(s), {} resource(s), {} prompt(s) ({} loader(s) run)",
                 tools.Size(), resources.Size(), prompts.Size(), loaders);
    }

    bool isInitialized(const std::string& connectionId) const {
        std::lock_guard<std::mutex> lk(connectionsMutex);
        auto it = connections.find(connectionId);
        return it != connections.end() && it->second.initialized;
    }

    ///////////////////////////////////////// Dispatch ///////////////////////////////////////////
    std::unique_ptr<JSONRPCResponse> dispatchRequest(Method method, const JSONRPCRequest& req, const ConnectionContext& ctx) {
        switch (method) {
            case Method::Initialize: return handleInitialize(req, ctx);
            case Method::Ping: return makeResult(req.id, JSONValue(JSONValue::Object{}));
            case Method::ToolsList: return handleToolsList(req);
            case Method::ToolsCall: return handleToolsCall(req, ctx);
            case Method::ToolsSearch: return handleToolsSearch(req);
            case Method::ResourcesList: return handleResourcesList(req);
            case Method::ResourcesRead: return handleResourcesRead(req);
            case Method::PromptsList: return handlePromptsList(req);
            case Method::PromptsGet: return handlePromptsGet(req);
            case Method::LoggingSetLevel: return handleSetLevel(req);
            case Method::TasksGet: return handleTasksGet(req);
            case Method::TasksList: return handleTasksList(req, ctx);
            case Method::TasksCancel: return handleTasksCancel(req);
            case Method::TasksResult: return handleTasksResult(req);
        }
        errors::McpError e; e.code = JSONRPCErrorCodes::InternalError; e.message = "Unhandled method";
        return errors::makeErrorResponse(req.id, e);
    }

    JSONValue serializeServerCapabilities() const {
        JSONValue::Object caps;
        {
            JSONValue::Object t;
            t["listChanged"] = std::make_shared<JSONValue>(true);
            caps["tools"] = std::make_shared<JSONValue>(std::move(t));
        }
        {
            JSONValue::Object r;
            r["subscribe"] = std::make_shared<JSONValue>(false);
            r["listChanged"] = std::make_shared<JSONValue>(true);
            caps["resources"] = std::make_shared<JSONValue>(std::move(r));
        }
        {
            JSONValue::Object p;
            p["listChanged"] = std::make_shared<JSONValue>(true);
            caps["prompts"] = std::make_shared<JSONValue>(std::move(p));
        }
        caps["logging"] = std::make_shared<JSONValue>(JSONValue::Object{});
        {
            // tasks: { list:{}, cancel:{}, requests:{ tools:{ call:{} } } }
            JSONValue::Object call;
            call["call"] = std::make_shared<JSONValue>(JSONValue::Object{});
            JSONValue::Object requests;
            requests["tools"] = std::make_shared<JSONValue>(std::move(call));
            JSONValue::Object t;
            t["list"] = std::make_shared<JSONValue>(JSONValue::Object{});
            t["cancel"] = std::make_shared<JSONValue>(JSONValue::Object{});
            t["requests"] = std::make_shared<JSONValue>(std::move(requests));
            caps["tasks"] = std::make_shared<JSONValue>(std::move(t));
        }
        {
            JSONValue::Object search;
            search["method"] = std::make_shared<JSONValue>(Methods::SearchTools);
            search["optional"] = std::make_shared<JSONValue>(true);
            JSONValue::Object experimental;
            experimental["toolSearch"] = std::make_shared<JSONValue>(std::move(search));
            caps["experimental"] = std::make_shared<JSONValue>(std::move(experimental));
        }
        return JSONValue(std::move(caps));
    }

    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& req, const ConnectionContext& ctx) {
        const JSONValue& p = paramsOf(req);
        const auto requested = getString(p, "protocolVersion");
        const std::string negotiated = negotiateProtocolVersion(requested);

        Implementation client;
        if (const JSONValue* ci = p.find("clientInfo")) {
            client.name = getString(*ci, "name").value_or("");
            client.version = getString(*ci, "version").value_or("");
        }
        {
            std::lock_guard<std::mutex> lk(connectionsMutex);
            auto& st = connections[ctx.connectionId];
            st.initialized = true;
            st.protocolVersion = negotiated;
            st.clientInfo = client;
        }
        if (requested.has_value() && *requested != negotiated) {
            LOG_INFO("Client requested unsupported protocol version {}; offering {}", *requested, negotiated);
        }
        LOG_INFO("Initialized connection '{}' for client {} {} (protocol {})",
                 ctx.connectionId, client.name, client.version, negotiated);

        JSONValue::Object result;
        result["protocolVersion"] = std::make_shared<JSONValue>(negotiated);
        result["capabilities"] = std::make_shared<JSONValue>(serializeServerCapabilities());
        JSONValue::Object info;
        info["name"] = std::make_shared<JSONValue>(options.serverInfo.name);
        info["version"] = std::make_shared<JSONValue>(options.serverInfo.version);
        result["serverInfo"] = std::make_shared<JSONValue>(std::move(info));
        if (options.instructions.has_value() && !options.instructions->empty()) {
            result["instructions"] = std::make_shared<JSONValue>(options.instructions.value());
        }
        return makeResult(req.id, JSONValue(std::move(result)));
    }

    template <class Registry, class MakeObj>
    std::unique_ptr<JSONRPCResponse> listRegistry(const JSONRPCRequest& req, const Registry& registry,
                                                  const char* arrayKey, MakeObj makeObj) {
        const ListParams lp = parseListParams(paramsOf(req));
        auto page = registry.ListPaginated(lp.cursor, lp.pageSize);
        JSONValue::Array arr;
        for (const auto& def : page.items) {
            arr.push_back(std::make_shared<JSONValue>(makeObj(*def)));
        }
        JSONValue::Object resultObj;
        resultObj[arrayKey] = std::make_shared<JSONValue>(std::move(arr));
        if (page.nextCursor.has_value()) {
            resultObj["nextCursor"] = std::make_shared<JSONValue>(page.nextCursor.value());
        }
        return makeResult(req.id, JSONValue(std::move(resultObj)));
    }

    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling tools/list request");
        return listRegistry(req, tools, "tools", [](const ToolDefinition& d) { return makeToolObj(d.tool); });
    }

    std::unique_ptr<JSONRPCResponse> handleResourcesList(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling resources/list request");
        return listRegistry(req, resources, "resources", [](const ResourceDefinition& d) { return makeResourceObj(d.resource); });
    }

    std::unique_ptr<JSONRPCResponse> handlePromptsList(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling prompts/list request");
        return listRegistry(req, prompts, "prompts", [](const PromptDefinition& d) { return makePromptObj(d.prompt); });
    }

    std::unique_ptr<JSONRPCResponse> handleToolsSearch(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling tools/search request");
        const JSONValue& p = paramsOf(req);
        ToolSearchQuery q;
        q.query = optionalString(p, "query");
        q.category = optionalString(p, "category");
        if (const JSONValue* tags = p.find("tags"); tags && !tags->isNull()) {
            if (const auto* s = std::get_if<std::string>(&tags->value)) {
                q.tags.push_back(*s);
            } else if (const auto* arr = std::get_if<JSONValue::Array>(&tags->value)) {
                for (const auto& t : *arr) {
                    if (!t || !t->isString()) {
                        throw InvalidParamsError("Parameter must be an array of strings: tags", paramData("tags"));
                    }
                    q.tags.push_back(std::get<std::string>(t->value));
                }
            } else {
                throw InvalidParamsError("Parameter must be an array of strings: tags", paramData("tags"));
            }
        }
        if (const JSONValue* ro = p.find("readOnly"); ro && !ro->isNull()) {
            auto b = getBool(p, "readOnly");
            if (!b.has_value()) {
                throw InvalidParamsError("Parameter must be a boolean: readOnly", paramData("readOnly"));
            }
            q.readOnly = b;
        }
        const ListParams lp = parseListParams(p);
        auto page = tools.Search(q, lp.cursor, lp.pageSize);

        JSONValue::Array arr;
        for (const auto& def : page.items) {
            arr.push_back(std::make_shared<JSONValue>(makeToolObj(def->tool)));
        }
        JSONValue::Object resultObj;
        resultObj["tools"] = std::make_shared<JSONValue>(std::move(arr));
        resultObj["total"] = std::make_shared<JSONValue>(static_cast<int64_t>(page.total));
        if (page.nextCursor.has_value()) {
            resultObj["nextCursor"] = std::make_shared<JSONValue>(page.nextCursor.value());
        }
        return makeResult(req.id, JSONValue(std::move(resultObj)));
    }

    std::unique_ptr<JSONRPCResponse> handleToolsCall(const JSONRPCRequest& req, const ConnectionContext& ctx) {
        LOG_DEBUG("Handling tools/call request");
        const JSONValue& p = paramsOf(req);
        const std::string name = requireString(p, "name");
        JSONValue arguments{JSONValue::Object{}};
        if (const JSONValue* a = p.find("arguments"); a && !a->isNull()) {
            if (!a->isObject()) {
                throw InvalidParamsError("Parameter must be an object: arguments", paramData("arguments"));
            }
            arguments = *a;
        }

        auto def = tools.Get(name);
        if (!def) {
            LOG_WARN("tools/call for unknown tool '{}'", name);
            return makeResult(req.id, toolResult("Unknown tool: " + name, true));
        }

        std::optional<JSONValue> progressToken;
        if (const JSONValue* meta = p.find("_meta")) {
            if (const JSONValue* tok = meta->find("progressToken"); tok && !tok->isNull()) {
                progressToken = *tok;
            }
        }

        if (const JSONValue* task = p.find("task"); task && !task->isNull()) {
            return startToolTask(req, ctx, def, arguments, progressToken);
        }

        StopSourceGuard guard{this, ctx.connectionId, req.id};
        ToolCallContext tctx;
        tctx.stopToken = guard.src->get_token();
        tctx.connectionId = ctx.connectionId;
        if (progressToken.has_value()) {
            const std::string connId = ctx.connectionId;
            const JSONValue token = progressToken.value();
            tctx.progress = [this, connId, token](double c, std::optional<double> t, std::optional<std::string> m) {
                emitProgress(connId, token, c, t, m);
            };
        }

        JSONValue result;
        try {
            auto fut = def->handler(arguments, tctx);
            result = toolResult(renderText(fut.get()), false);
        } catch (const std::exception& e) {
            LOG_WARN("Tool '{}' failed: {}", name, e.what());
            result = toolResult(std::string("Error: ") + e.what(), true);
        } catch (...) {
            LOG_WARN("Tool '{}' failed with a non-standard exception", name);
            result = toolResult("Error: Unknown error", true);
        }

        if (guard.src->stop_requested()) {
            errors::McpError err; err.code = JSONRPCErrorCodes::InternalError; err.message = "Request cancelled";
            return errors::makeErrorResponse(req.id, err);
        }
        return makeResult(req.id, std::move(result));
    }

    std::unique_ptr<JSONRPCResponse> startToolTask(const JSONRPCRequest& req, const ConnectionContext& ctx,
                                                   const ToolRegistry::DefinitionPtr& def, const JSONValue& arguments,
                                                   const std::optional<JSONValue>& progressToken) {
        const std::string connId = ctx.connectionId;
        std::optional<std::string> owner;
        if (!connId.empty()) owner = connId;

        auto work = [this, def, arguments, connId, progressToken](const TaskContext& tc) -> JSONValue {
            ToolCallContext tctx;
            tctx.stopToken = tc.stopToken;
            tctx.connectionId = connId;
            tctx.progress = [this, tc, connId, progressToken](double c, std::optional<double> t, std::optional<std::string> m) {
                tc.ReportProgress(c, t, m);
                if (progressToken.has_value()) {
                    emitProgress(connId, progressToken.value(), c, t, m);
                }
            };
            auto fut = def->handler(arguments, tctx);
            return toolResult(renderText(fut.get()), false);
        };
        TaskRecord record = tasks.Submit(Methods::CallTool, paramsOf(req), std::move(work), owner);
        LOG_INFO("tools/call '{}' accepted as task {}", def->tool.name, record.id);

        JSONValue::Object resultObj;
        resultObj["task"] = std::make_shared<JSONValue>(record.toJSON());
        return makeResult(req.id, JSONValue(std::move(resultObj)));
    }

    std::unique_ptr<JSONRPCResponse> handleResourcesRead(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling resources/read request");
        const std::string uri = requireString(paramsOf(req), "uri");

        auto errorResult = [&](const std::string& text) {
            JSONValue::Object item;
            item["uri"] = std::make_shared<JSONValue>(uri);
            item["mimeType"] = std::make_shared<JSONValue>("text/plain");
            item["text"] = std::make_shared<JSONValue>(text);
            JSONValue::Array contents;
            contents.push_back(std::make_shared<JSONValue>(std::move(item)));
            JSONValue::Object obj;
            obj["contents"] = std::make_shared<JSONValue>(std::move(contents));
            obj["isError"] = std::make_shared<JSONValue>(true);
            return makeResult(req.id, JSONValue(std::move(obj)));
        };

        auto def = resources.Get(uri);
        if (!def) {
            LOG_WARN("resources/read for unknown resource '{}'", uri);
            return errorResult("Unknown resource: " + uri);
        }

        std::string text;
        try {
            text = renderText(def->handler());
        } catch (const std::exception& e) {
            LOG_WARN("Resource '{}' failed: {}", uri, e.what());
            return errorResult(std::string("Error: ") + e.what());
        } catch (...) {
            LOG_WARN("Resource '{}' failed with a non-standard exception", uri);
            return errorResult("Error: Unknown error");
        }

        JSONValue::Object item;
        item["uri"] = std::make_shared<JSONValue>(uri);
        item["mimeType"] = std::make_shared<JSONValue>(def->resource.mimeType);
        item["text"] = std::make_shared<JSONValue>(std::move(text));
        JSONValue::Array contents;
        contents.push_back(std::make_shared<JSONValue>(std::move(item)));
        JSONValue::Object obj;
        obj["contents"] = std::make_shared<JSONValue>(std::move(contents));
        return makeResult(req.id, JSONValue(std::move(obj)));
    }

    std::unique_ptr<JSONRPCResponse> handlePromptsGet(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling prompts/get request");
        const JSONValue& p = paramsOf(req);
        const std::string name = requireString(p, "name");
        JSONValue arguments{JSONValue::Object{}};
        if (const JSONValue* a = p.find("arguments"); a && !a->isNull()) {
            if (!a->isObject()) {
                throw InvalidParamsError("Parameter must be an object: arguments", paramData("arguments"));
            }
            arguments = *a;
        }

        auto errorResult = [&](const std::string& text) {
            JSONValue::Object obj;
            obj["description"] = std::make_shared<JSONValue>(text);
            obj["messages"] = std::make_shared<JSONValue>(JSONValue::Array{});
            obj["isError"] = std::make_shared<JSONValue>(true);
            return makeResult(req.id, JSONValue(std::move(obj)));
        };

        auto def = prompts.Get(name);
        if (!def) {
            LOG_WARN("prompts/get for unknown prompt '{}'", name);
            return errorResult("Unknown prompt: " + name);
        }

        JSONValue raw;
        try {
            raw = def->handler(arguments);
        } catch (const std::exception& e) {
            LOG_WARN("Prompt '{}' failed: {}", name, e.what());
            return errorResult(std::string("Error: ") + e.what());
        } catch (...) {
            LOG_WARN("Prompt '{}' failed with a non-standard exception", name);
            return errorResult("Error: Unknown error");
        }

        std::string description = def->prompt.description;
        JSONValue::Array messages;
        if (const auto* s = std::get_if<std::string>(&raw.value)) {
            messages.push_back(std::make_shared<JSONValue>(userMessage(*s)));
        } else if (const auto* arr = std::get_if<JSONValue::Array>(&raw.value)) {
            for (const auto& item : *arr) {
                if (item && item->isObject()) {
                    messages.push_back(item);
                } else {
                    messages.push_back(std::make_shared<JSONValue>(userMessage(item ? renderText(*item) : "null")));
                }
            }
        } else if (const JSONValue* msgs = raw.find("messages"); msgs && msgs->isArray()) {
            messages = std::get<JSONValue::Array>(msgs->value);
            if (auto d = getString(raw, "description")) description = *d;
        } else {
            messages.push_back(std::make_shared<JSONValue>(userMessage(renderText(raw))));
        }

        JSONValue::Object obj;
        obj["description"] = std::make_shared<JSONValue>(description);
        obj["messages"] = std::make_shared<JSONValue>(std::move(messages));
        return makeResult(req.id, JSONValue(std::move(obj)));
    }

    std::unique_ptr<JSONRPCResponse> handleSetLevel(const JSONRPCRequest& req) {
        const std::string level = getString(paramsOf(req), "level").value_or("info");
        Logger::setLogLevel(logLevelFromMcp(level));
        LOG_INFO("Log level set to '{}'", level);
        return makeResult(req.id, JSONValue(JSONValue::Object{}));
    }

    ///////////////////////////////////////// Tasks ///////////////////////////////////////////
    TaskRecord requireTask(const JSONValue& p) {
        const std::string taskId = requireString(p, "taskId");
        auto rec = tasks.Get(taskId);
        if (!rec.has_value()) {
            JSONValue::Object data;
            data["taskId"] = std::make_shared<JSONValue>(taskId);
            throw InvalidParamsError("Task not found: " + taskId, JSONValue(std::move(data)));
        }
        return *rec;
    }

    std::unique_ptr<JSONRPCResponse> handleTasksGet(const JSONRPCRequest& req) {
        return makeResult(req.id, requireTask(paramsOf(req)).toJSON());
    }

    std::unique_ptr<JSONRPCResponse> handleTasksList(const JSONRPCRequest& req, const ConnectionContext& ctx) {
        const JSONValue& p = paramsOf(req);
        std::optional<TaskState> state;
        if (auto s = optionalString(p, "state")) {
            state = taskStateFromString(*s);
            if (!state.has_value()) {
                throw InvalidParamsError("Unknown task state: " + *s, paramData("state"));
            }
        }
        std::optional<std::string> owner;
        if (!ctx.connectionId.empty()) owner = ctx.connectionId;

        const auto records = tasks.List(owner, state);
        const ListParams lp = parseListParams(p);
        const PageWindow w = resolvePage(records.size(), lp.cursor, lp.pageSize);

        JSONValue::Array arr;
        for (std::size_t i = w.begin; i < w.end; ++i) {
            arr.push_back(std::make_shared<JSONValue>(records[i].toJSON()));
        }
        JSONValue::Object resultObj;
        resultObj["tasks"] = std::make_shared<JSONValue>(std::move(arr));
        if (w.nextCursor.has_value()) {
            resultObj["nextCursor"] = std::make_shared<JSONValue>(w.nextCursor.value());
        }
        return makeResult(req.id, JSONValue(std::move(resultObj)));
    }

    std::unique_ptr<JSONRPCResponse> handleTasksCancel(const JSONRPCRequest& req) {
        const TaskRecord current = requireTask(paramsOf(req));
        auto rec = tasks.Cancel(current.id);
        return makeResult(req.id, rec.has_value() ? rec->toJSON() : current.toJSON());
    }

    std::unique_ptr<JSONRPCResponse> handleTasksResult(const JSONRPCRequest& req) {
        const TaskRecord rec = requireTask(paramsOf(req));
        if (rec.state == TaskState::Completed) {
            return makeResult(req.id, rec.result.value_or(JSONValue(JSONValue::Object{})));
        }
        if (rec.state == TaskState::Failed && rec.error.has_value()) {
            if (auto err = errors::mcpErrorFromErrorValue(rec.error.value())) {
                return errors::makeErrorResponse(req.id, *err);
            }
        }
        JSONValue::Object data;
        data["taskId"] = std::make_shared<JSONValue>(rec.id);
        data["status"] = std::make_shared<JSONValue>(toString(rec.state));
        errors::McpError e; e.code = JSONRPCErrorCodes::InvalidParams;
        e.message = std::string("Task has no result (status: ") + toString(rec.state) + ")";
        e.data = JSONValue(std::move(data));
        return errors::makeErrorResponse(req.id, e);
    }

    ///////////////////////////////////////// Cancellation ///////////////////////////////////////////
    void handleCancelled(const JSONRPCNotification& n, const ConnectionContext& ctx) {
        if (!n.params.has_value()) {
            LOG_DEBUG("notifications/cancelled without params");
            return;
        }
        const JSONValue* rid = n.params->find("requestId");
        if (!rid) {
            LOG_DEBUG("notifications/cancelled without requestId");
            return;
        }
        JSONRPCId id = nullptr;
        if (const auto* s = std::get_if<std::string>(&rid->value)) id = *s;
        else if (const auto* i = std::get_if<int64_t>(&rid->value)) id = *i;
        else return;

        const std::string idStr = idToString(id);
        const auto reason = getString(*n.params, "reason").value_or("");
        bool signalled = false;
        {
            std::lock_guard<std::mutex> lk(cancelMutex);
            auto it = inFlight.find(requestKey(ctx.connectionId, id));
            if (it != inFlight.end() && it->second) {
                it->second->request_stop();
                signalled = true;
            }
        }
        if (std::holds_alternative<std::string>(id) && tasks.Get(idStr).has_value()) {
            tasks.Cancel(idStr);
            signalled = true;
        }
        if (signalled) {
            LOG_INFO("Cancellation requested for {} {}", idStr, reason);
        } else {
            LOG_DEBUG("Cancellation for unknown request {} ignored", idStr);
        }
    }

    void endConnection(const std::string& connectionId) {
        {
            std::lock_guard<std::mutex> lk(connectionsMutex);
            connections.erase(connectionId);
        }
        const std::string prefix = connectionId + "|";
        std::lock_guard<std::mutex> lk(cancelMutex);
        for (auto& [key, src] : inFlight) {
            if (key.rfind(prefix, 0) == 0 && src) {
                src->request_stop();
            }
        }
    }
};

///////////////////////////////////////// ProtocolServer ///////////////////////////////////////////
ProtocolServer::ProtocolServer(const std::string& name)
    : ProtocolServer(Options{Implementation{name, getVersionString()}, std::nullopt, TaskManager::Options{}}) {}

ProtocolServer::ProtocolServer(Options options)
    : pImpl(std::make_unique<Impl>(std::move(options))) {}

ProtocolServer::~ProtocolServer() = default;

ToolRegistry& ProtocolServer::Tools() { return pImpl->tools; }
ResourceRegistry& ProtocolServer::Resources() { return pImpl->resources; }
PromptRegistry& ProtocolServer::Prompts() { return pImpl->prompts; }
TaskManager& ProtocolServer::Tasks() { return pImpl->tasks; }

void ProtocolServer::RegisterTool(const Tool& tool, ToolHandler handler) {
    pImpl->tools.Register(ToolDefinition{tool, std::move(handler)});
}

void ProtocolServer::RegisterResource(const Resource& resource, ResourceHandler handler) {
    pImpl->resources.Register(ResourceDefinition{resource, std::move(handler)});
}

void ProtocolServer::RegisterPrompt(const Prompt& prompt, PromptHandler handler) {
    pImpl->prompts.Register(PromptDefinition{prompt, std::move(handler)});
}

void ProtocolServer::BeginServing() {
    pImpl->beginServing();
}

bool ProtocolServer::IsServing() const {
    return pImpl->serving.load();
}

void ProtocolServer::SetNotificationSink(NotificationSink sink) {
    std::lock_guard<std::mutex> lk(pImpl->sinkMutex);
    pImpl->sink = std::move(sink);
}

std::unique_ptr<JSONRPCResponse> ProtocolServer::HandleMessage(const std::string& text, const ConnectionContext& ctx) {
    JSONValue message;
    try {
        message = parseJSON(text);
    } catch (const JSONParseError& e) {
        LOG_WARN("Rejecting unparseable message: {}", e.what());
        JSONValue::Object data;
        data["detail"] = std::make_shared<JSONValue>(e.what());
        return CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error", JSONValue(std::move(data)));
    }
    return HandleMessage(message, ctx);
}

std::unique_ptr<JSONRPCResponse> ProtocolServer::HandleMessage(const JSONValue& message, const ConnectionContext& ctx) {
    FUNC_SCOPE();
    if (!IsServing() || pImpl->hasPendingLoaders()) {
        BeginServing();
    }
    if (message.isArray()) {
        return CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Batch requests are not supported");
    }
    if (!message.isObject()) {
        return CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request: message must be an object");
    }

    // Echo a readable id in error envelopes
    JSONRPCId id = nullptr;
    const JSONValue* idVal = message.find("id");
    if (idVal) {
        if (const auto* s = std::get_if<std::string>(&idVal->value)) id = *s;
        else if (const auto* n = std::get_if<int64_t>(&idVal->value)) id = *n;
        else if (!idVal->isNull()) {
            return CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request: id must be a string, integer or null");
        }
    }

    if (getString(message, "jsonrpc").value_or("") != "2.0") {
        return CreateErrorResponse(id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request: jsonrpc must be \"2.0\"");
    }

    const JSONValue* methodVal = message.find("method");
    if (!methodVal) {
        if (message.find("result") || message.find("error")) {
            LOG_DEBUG("Ignoring client response for id {}", idToString(id));
            return nullptr;
        }
        return CreateErrorResponse(id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request: missing method");
    }
    if (!methodVal->isString()) {
        return CreateErrorResponse(id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request: method must be a string");
    }
    if (const JSONValue* params = message.find("params"); params && !params->isObject() && !params->isArray()) {
        return CreateErrorResponse(id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request: params must be an object or array");
    }

    if (idVal) {
        JSONRPCRequest req;
        if (!req.FromJSON(message)) {
            return CreateErrorResponse(id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
        }
        return HandleRequest(req, ctx);
    }

    JSONRPCNotification notification;
    if (notification.FromJSON(message)) {
        HandleNotification(notification, ctx);
    }
    return nullptr;
}

std::unique_ptr<JSONRPCResponse> ProtocolServer::HandleRequest(const JSONRPCRequest& request, const ConnectionContext& ctx) {
    const auto method = methodFromString(request.method);
    if (method != Method::Initialize && method != Method::Ping && !pImpl->isInitialized(ctx.connectionId)) {
        LOG_WARN("Rejecting {} before initialize on connection '{}'", request.method, ctx.connectionId);
        errors::McpError e; e.code = JSONRPCErrorCodes::InvalidRequest; e.message = "Server not initialized";
        return errors::makeErrorResponse(request.id, e);
    }
    if (!method.has_value()) {
        errors::McpError e; e.code = JSONRPCErrorCodes::MethodNotFound; e.message = "Method not found: " + request.method;
        return errors::makeErrorResponse(request.id, e);
    }

    try {
        return pImpl->dispatchRequest(*method, request, ctx);
    } catch (const errors::InvalidCursorError& ex) {
        LOG_DEBUG("{}: {}", request.method, ex.what());
        errors::McpError e; e.code = JSONRPCErrorCodes::InvalidParams;
        e.message = std::string("Invalid cursor: ") + ex.what(); e.data = ex.toData();
        return errors::makeErrorResponse(request.id, e);
    } catch (const InvalidParamsError& ex) {
        LOG_DEBUG("{}: {}", request.method, ex.what());
        errors::McpError e; e.code = JSONRPCErrorCodes::InvalidParams; e.message = ex.what(); e.data = ex.data;
        return errors::makeErrorResponse(request.id, e);
    } catch (const std::exception& ex) {
        LOG_ERROR("Internal error handling {}: {}", request.method, ex.what());
        errors::McpError e; e.code = JSONRPCErrorCodes::InternalError; e.message = std::string("Internal error: ") + ex.what();
        return errors::makeErrorResponse(request.id, e);
    } catch (...) {
        LOG_ERROR("Internal error handling {}: unknown exception", request.method);
        errors::McpError e; e.code = JSONRPCErrorCodes::InternalError; e.message = "Internal error: Unknown error";
        return errors::makeErrorResponse(request.id, e);
    }
}

void ProtocolServer::HandleNotification(const JSONRPCNotification& notification, const ConnectionContext& ctx) {
    const auto kind = notificationFromString(notification.method);
    if (!kind.has_value()) {
        LOG_DEBUG("Ignoring notification {}", notification.method);
        return;
    }
    switch (*kind) {
        case Notification::Initialized: {
            std::lock_guard<std::mutex> lk(pImpl->connectionsMutex);
            auto it = pImpl->connections.find(ctx.connectionId);
            if (it != pImpl->connections.end() && it->second.initialized) {
                it->second.ready = true;
                LOG_DEBUG("Connection '{}' ready", ctx.connectionId);
            } else {
                LOG_WARN("notifications/initialized before initialize on connection '{}'", ctx.connectionId);
            }
            return;
        }
        case Notification::Cancelled:
            pImpl->handleCancelled(notification, ctx);
            return;
    }
}

bool ProtocolServer::IsInitialized(const std::string& connectionId) const {
    return pImpl->isInitialized(connectionId);
}

std::optional<std::string> ProtocolServer::NegotiatedVersion(const std::string& connectionId) const {
    std::lock_guard<std::mutex> lk(pImpl->connectionsMutex);
    auto it = pImpl->connections.find(connectionId);
    if (it == pImpl->connections.end() || !it->second.initialized) return std::nullopt;
    return it->second.protocolVersion;
}

std::optional<Implementation> ProtocolServer::ClientInfo(const std::string& connectionId) const {
    std::lock_guard<std::mutex> lk(pImpl->connectionsMutex);
    auto it = pImpl->connections.find(connectionId);
    if (it == pImpl->connections.end() || !it->second.initialized) return std::nullopt;
    return it->second.clientInfo;
}

void ProtocolServer::EndConnection(const std::string& connectionId) {
    pImpl->endConnection(connectionId);
    LOG_DEBUG("Connection '{}' ended", connectionId);
}

const Implementation& ProtocolServer::ServerInfo() const {
    return pImpl->options.serverInfo;
}

} // namespace mcphost
