//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read typed environment variables with defaults.
//==========================================================================================================
#pragma once
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// ParseEnvInt
// Purpose: Strict base-10 parse of an integer setting (optional sign, digits only, surrounding spaces ok).
// Returns:
//   The value, or nullopt when the text is empty, malformed or out of range.
//==========================================================================================================
inline std::optional<int64_t> ParseEnvInt(const std::string& text) {
    std::istringstream is(text);
    int64_t v = 0;
    if (!(is >> v)) {
        return std::nullopt;
    }
    is >> std::ws;
    if (!is.eof()) {
        return std::nullopt;
    }
    return v;
}

//==========================================================================================================
// ParseEnvBool
// Purpose: Accepts 1/0, true/false, yes/no, on/off (case-insensitive).
//==========================================================================================================
inline std::optional<bool> ParseEnvBool(const std::string& text) {
    std::string s;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return std::nullopt;
}

// Comma-separated list; items are trimmed and empty items dropped.
inline std::vector<std::string> SplitEnvList(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto notSpace = [](unsigned char c) { return !std::isspace(c); };
        item.erase(item.begin(), std::find_if(item.begin(), item.end(), notSpace));
        item.erase(std::find_if(item.rbegin(), item.rend(), notSpace).base(), item.end());
        if (!item.empty()) out.push_back(item);
    }
    return out;
}
