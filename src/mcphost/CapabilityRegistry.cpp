//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CapabilityRegistry.cpp
// Purpose: Tool search filtering and default schemas
//==========================================================================================================

#include "mcphost/CapabilityRegistry.h"

#include <cctype>
#include <fmt/format.h>

namespace mcphost {

namespace {
std::string toLower(const std::string& s) {
    std::string out; out.reserve(s.size());
    for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

bool containsCi(const std::string& haystack, const std::string& lowerNeedle) {
    return toLower(haystack).find(lowerNeedle) != std::string::npos;
}

// 64-bit FNV-1a
uint64_t fnv1a(const std::string& s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}
} // namespace

JSONValue defaultInputSchema() {
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>("object");
    schema["properties"] = std::make_shared<JSONValue>(JSONValue::Object{});
    return JSONValue(std::move(schema));
}

void ToolDefinition::ApplyDefaults() {
    if (tool.description.empty()) {
        tool.description = "Tool: " + tool.name;
    }
    if (tool.inputSchema.isNull()) {
        tool.inputSchema = defaultInputSchema();
    }
}

void ResourceDefinition::ApplyDefaults() {
    if (resource.name.empty()) {
        resource.name = resource.uri;
    }
    if (resource.description.empty()) {
        resource.description = "Resource: " + resource.name;
    }
    if (resource.mimeType.empty()) {
        resource.mimeType = "text/plain";
    }
}

void PromptDefinition::ApplyDefaults() {
    if (prompt.description.empty()) {
        prompt.description = "Prompt: " + prompt.name;
    }
}

bool ToolSearchQuery::Matches(const Tool& tool) const {
    if (query.has_value() && !query->empty()) {
        const std::string needle = toLower(*query);
        bool hit = containsCi(tool.name, needle) || containsCi(tool.description, needle) ||
                   (tool.category.has_value() && containsCi(*tool.category, needle));
        for (const auto& t : tool.tags) {
            if (hit) break;
            hit = containsCi(t, needle);
        }
        if (!hit) return false;
    }
    if (category.has_value()) {
        if (!tool.category.has_value() || toLower(*tool.category) != toLower(*category)) return false;
    }
    if (!tags.empty()) {
        bool any = false;
        for (const auto& wanted : tags) {
            const std::string w = toLower(wanted);
            for (const auto& t : tool.tags) {
                if (toLower(t) == w) { any = true; break; }
            }
            if (any) break;
        }
        if (!any) return false;
    }
    if (readOnly.has_value() && tool.annotations.readOnly != *readOnly) {
        return false;
    }
    return true;
}

std::string ToolSearchQuery::Fingerprint() const {
    // Unit separators keep adjacent fields from aliasing.
    std::string canon = "q=" + (query ? toLower(*query) : std::string("\x1f")) +
                        "\x1e" "c=" + (category ? toLower(*category) : std::string("\x1f")) +
                        "\x1e" "r=" + (readOnly ? (*readOnly ? "1" : "0") : "-") + "\x1e" "t=";
    std::vector<std::string> sorted;
    for (const auto& t : tags) sorted.push_back(toLower(t));
    std::sort(sorted.begin(), sorted.end());
    for (const auto& t : sorted) canon += t + "\x1f";
    return fmt::format("{:016x}", fnv1a(canon));
}

SearchPage<ToolDefinition> ToolRegistry::Search(const ToolSearchQuery& query,
                                                const std::optional<std::string>& cursor,
                                                int64_t pageSize, int64_t maxPageSize) const {
    std::vector<DefinitionPtr> matches;
    for (const auto& def : ListAll()) {
        if (query.Matches(def->tool)) {
            matches.push_back(def);
        }
    }
    return Slice(matches, cursor, pageSize, maxPageSize, query.Fingerprint());
}

} // namespace mcphost
