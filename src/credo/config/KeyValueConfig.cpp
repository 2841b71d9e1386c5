//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: KeyValueConfig.cpp
// Purpose: key=value configuration parsing shared by settings and client options
//==========================================================================================================

#include <cctype>
#include <stdexcept>

#include "credo/config/KeyValueConfig.h"
#include "logging/Logger.h"

namespace credo::config {

namespace {

std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) {
        ++b;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
        --e;
    }
    return s.substr(b, e - b);
}

std::string toLower(std::string s) {
    for (size_t i = 0; i < s.size(); ++i) {
        s[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
    }
    return s;
}

} // namespace

void forEachKeyValue(const std::string& config, const std::function<void(const std::string&, const std::string&)>& fn) {
    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) { sep = config.size(); }
        std::string kv = trim(config.substr(start, sep - start));
        if (!kv.empty()) {
            std::size_t eq = kv.find('=');
            if (eq != std::string::npos) {
                fn(trim(kv.substr(0, eq)), trim(kv.substr(eq + 1)));
            } else {
                LOG_WARN("config: ignoring entry without '=': {}", kv);
            }
        }
        start = sep + 1;
    }
}

void parseUnsignedInto(const std::string& key, const std::string& val, unsigned int& out) {
    if (val.empty() || val[0] == '-') {
        LOG_WARN("config: {} expects an unsigned integer, got '{}'", key, val);
        return;
    }
    try {
        out = static_cast<unsigned int>(std::stoul(val));
    } catch (const std::invalid_argument&) {
        LOG_WARN("config: {} expects an unsigned integer, got '{}'", key, val);
    } catch (const std::out_of_range&) {
        LOG_WARN("config: {} is out of range: '{}'", key, val);
    }
}

void parseBoolInto(const std::string& key, const std::string& val, bool& out) {
    const std::string v = toLower(val);
    if (v == "1" || v == "true" || v == "yes") {
        out = true;
    } else if (v == "0" || v == "false" || v == "no") {
        out = false;
    } else {
        LOG_WARN("config: {} expects a boolean, got '{}'", key, val);
    }
}

} // namespace credo::config
