//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CapabilityRegistry.h
// Purpose: Thread-safe registries of tool, resource and prompt definitions with cursor pagination
//==========================================================================================================

#pragma once

#include <algorithm>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcphost/CursorCodec.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Protocol.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

///////////////////////////////////////// Handlers ///////////////////////////////////////////
//==========================================================================================================
// ToolCallContext
// Purpose: Per-invocation context handed to a tool handler.
// Fields:
//   stopToken: Signalled when the client cancels the request or its task. Advisory only.
//   connectionId: Logical connection (HTTP session id, empty for stdio).
//   progress: Reporter wired to notifications/progress and/or the task record; may be empty.
//==========================================================================================================
struct ToolCallContext {
    using ProgressFn = std::function<void(double current, std::optional<double> total, std::optional<std::string> message)>;

    std::stop_token stopToken;
    std::string connectionId;
    ProgressFn progress;

    void ReportProgress(double current, std::optional<double> total = std::nullopt,
                        std::optional<std::string> message = std::nullopt) const {
        if (progress) {
            progress(current, total, std::move(message));
        }
    }
};

// Tools return a future so synchronous and asynchronous implementations look the same to the dispatcher.
using ToolHandler = std::function<std::future<JSONValue>(const JSONValue& arguments, const ToolCallContext& ctx)>;
using ResourceHandler = std::function<JSONValue()>;
using PromptHandler = std::function<JSONValue(const JSONValue& arguments)>;

// Adapt a synchronous callable into a ToolHandler returning a ready future.
template <typename Fn>
ToolHandler makeSyncToolHandler(Fn fn) {
    return [fn = std::move(fn)](const JSONValue& args, const ToolCallContext& ctx) -> std::future<JSONValue> {
        std::promise<JSONValue> p;
        try {
            if constexpr (std::is_invocable_v<Fn, const JSONValue&, const ToolCallContext&>) {
                p.set_value(fn(args, ctx));
            } else {
                (void)ctx;
                p.set_value(fn(args));
            }
        } catch (...) {
            p.set_exception(std::current_exception());
        }
        return p.get_future();
    };
}

///////////////////////////////////////// Definitions ///////////////////////////////////////////
struct ToolDefinition {
    Tool tool;
    ToolHandler handler;

    const std::string& key() const { return tool.name; }
    // description "Tool: <name>", inputSchema {"type":"object","properties":{}}
    void ApplyDefaults();
};

struct ResourceDefinition {
    Resource resource;
    ResourceHandler handler;

    const std::string& key() const { return resource.uri; }
    // name defaults to the URI, description "Resource: <name>", mimeType "text/plain"
    void ApplyDefaults();
};

struct PromptDefinition {
    Prompt prompt;
    PromptHandler handler;

    const std::string& key() const { return prompt.name; }
    void ApplyDefaults();
};

// Empty object schema used when a definition declares none.
JSONValue defaultInputSchema();

///////////////////////////////////////// Pages ///////////////////////////////////////////
template <class T>
struct Page {
    std::vector<std::shared_ptr<const T>> items;
    std::optional<std::string> nextCursor;
};

template <class T>
struct SearchPage {
    std::vector<std::shared_ptr<const T>> items;
    std::optional<std::string> nextCursor;
    std::size_t total{0};
};

//==========================================================================================================
// CapabilityRegistry
// Purpose: Named definitions in registration order. Overwriting a name keeps its original position.
// Notes:
//   Definitions are normalized with ApplyDefaults() on registration; it never fails.
//   Every operation takes the registry mutex. Loaders and the change listener run outside the lock so they
//   may call back into the registry.
//==========================================================================================================
template <class Definition>
class CapabilityRegistry {
public:
    using DefinitionPtr = std::shared_ptr<const Definition>;
    using Loader = std::function<void(CapabilityRegistry&)>;
    using ChangeListener = std::function<void()>;

    virtual ~CapabilityRegistry() = default;

    void Register(Definition def) {
        ChangeListener listener;
        {
            std::lock_guard<std::mutex> lock(mutex);
            def.ApplyDefaults();
            auto ptr = std::make_shared<const Definition>(std::move(def));
            auto it = index.find(ptr->key());
            if (it != index.end()) {
                items[it->second] = ptr;
            } else {
                index.emplace(ptr->key(), items.size());
                items.push_back(ptr);
            }
            listener = changeListener;
        }
        if (listener) listener();
    }

    bool Unregister(const std::string& key) {
        ChangeListener listener;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = index.find(key);
            if (it == index.end()) return false;
            items.erase(items.begin() + static_cast<std::ptrdiff_t>(it->second));
            index.clear();
            for (std::size_t i = 0; i < items.size(); ++i) {
                index.emplace(items[i]->key(), i);
            }
            listener = changeListener;
        }
        if (listener) listener();
        return true;
    }

    // nullptr when absent; lookups never throw.
    DefinitionPtr Get(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = index.find(key);
        return it == index.end() ? nullptr : items[it->second];
    }

    std::vector<DefinitionPtr> ListAll() const {
        std::lock_guard<std::mutex> lock(mutex);
        return items;
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return items.size();
    }

    //======================================================================================================
    // ListPaginated
    // Purpose: Return the slice starting at the cursor's offset.
    // Args:
    //   cursor: Opaque cursor from a previous page; nullopt starts at offset 0.
    //   pageSize: Requested page size; non-positive uses kDefaultPageSize, larger than maxPageSize is clamped.
    // Returns:
    //   Page with items and nextCursor when more remain. Throws errors::InvalidCursorError when the cursor
    //   cannot be decoded or its offset is negative or not below the number of items.
    //======================================================================================================
    Page<Definition> ListPaginated(const std::optional<std::string>& cursor,
                                   int64_t pageSize = kDefaultPageSize,
                                   int64_t maxPageSize = kMaxPageSize) const {
        auto snapshot = ListAll();
        auto slice = Slice(snapshot, cursor, pageSize, maxPageSize, std::nullopt);
        Page<Definition> page;
        page.items = std::move(slice.items);
        page.nextCursor = std::move(slice.nextCursor);
        return page;
    }

    // Queue a deferred registration batch; executed once by RunLoaders().
    void AddLoader(Loader loader) {
        std::lock_guard<std::mutex> lock(mutex);
        pendingLoaders.push_back(std::move(loader));
    }

    bool HasPendingLoaders() const {
        std::lock_guard<std::mutex> lock(mutex);
        return !pendingLoaders.empty();
    }

    // Run pending loaders in the order they were added. Returns how many ran.
    std::size_t RunLoaders() {
        std::vector<Loader> toRun;
        {
            std::lock_guard<std::mutex> lock(mutex);
            toRun.swap(pendingLoaders);
        }
        for (auto& loader : toRun) {
            loader(*this);
        }
        return toRun.size();
    }

    // Invoked after each Register/Unregister. Pass an empty function to detach.
    void SetChangeListener(ChangeListener listener) {
        std::lock_guard<std::mutex> lock(mutex);
        changeListener = std::move(listener);
    }

protected:
    static SearchPage<Definition> Slice(const std::vector<DefinitionPtr>& all,
                                        const std::optional<std::string>& cursor,
                                        int64_t pageSize, int64_t maxPageSize,
                                        const std::optional<std::string>& snapshot) {
        const PageWindow w = resolvePage(all.size(), cursor, pageSize, maxPageSize, snapshot);
        SearchPage<Definition> page;
        page.total = all.size();
        page.items.assign(all.begin() + static_cast<std::ptrdiff_t>(w.begin),
                          all.begin() + static_cast<std::ptrdiff_t>(w.end));
        page.nextCursor = w.nextCursor;
        return page;
    }

    mutable std::mutex mutex;
    std::vector<DefinitionPtr> items;
    std::unordered_map<std::string, std::size_t> index;
    std::vector<Loader> pendingLoaders;
    ChangeListener changeListener;
};

//==========================================================================================================
// ToolSearchQuery
// Purpose: Filters for tools/search. All present filters must match.
// Fields:
//   query: Case-insensitive substring over name, description, tags and category.
//   category: Case-insensitive exact category match.
//   tags: Matches when any tag intersects the tool's tags.
//   readOnly: Matches the tool's readOnly annotation.
//==========================================================================================================
struct ToolSearchQuery {
    std::optional<std::string> query;
    std::optional<std::string> category;
    std::vector<std::string> tags;
    std::optional<bool> readOnly;

    bool Matches(const Tool& tool) const;

    // Stable fingerprint of the filter set, embedded in search cursors.
    std::string Fingerprint() const;
};

class ToolRegistry : public CapabilityRegistry<ToolDefinition> {
public:
    SearchPage<ToolDefinition> Search(const ToolSearchQuery& query,
                                      const std::optional<std::string>& cursor = std::nullopt,
                                      int64_t pageSize = kDefaultPageSize,
                                      int64_t maxPageSize = kMaxPageSize) const;
};

using ResourceRegistry = CapabilityRegistry<ResourceDefinition>;
using PromptRegistry = CapabilityRegistry<PromptDefinition>;

} // namespace mcphost
