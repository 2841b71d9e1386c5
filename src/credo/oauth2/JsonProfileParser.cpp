//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonProfileParser.cpp
// Purpose: Dotted-path profile extraction
//==========================================================================================================

#include <cmath>
#include <cstdlib>

#include "credo/errors/Errors.h"
#include "credo/oauth2/JsonProfileParser.h"

namespace credo::oauth2 {

namespace {

bool isIndex(const std::string& segment) {
    if (segment.empty()) return false;
    for (char c : segment) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

} // namespace

const JSONValue* lookupPath(const JSONValue& value, const std::string& path) {
    const JSONValue* current = &value;
    std::size_t start = 0;
    while (current != nullptr && start <= path.size()) {
        std::size_t dot = path.find('.', start);
        if (dot == std::string::npos) dot = path.size();
        const std::string segment = path.substr(start, dot - start);
        if (current->isArray() && isIndex(segment)) {
            const auto& arr = std::get<JSONValue::Array>(current->value);
            const std::size_t idx = static_cast<std::size_t>(std::strtoull(segment.c_str(), nullptr, 10));
            current = (idx < arr.size() && arr[idx]) ? arr[idx].get() : nullptr;
        } else {
            current = findMember(*current, segment);
        }
        start = dot + 1;
    }
    if (current != nullptr && current->isNull()) {
        return nullptr;
    }
    return current;
}

JsonProfileParser::JsonProfileParser(std::string providerId, JsonProfilePaths paths)
    : providerId(std::move(providerId)), paths(std::move(paths)) {
    if (this->paths.id.empty()) {
        errors::raise(errors::ConfigurationError("profile id path must not be empty"));
    }
}

std::optional<std::string> JsonProfileParser::optionalString(const JSONValue& document, const std::string& path) const {
    if (path.empty()) {
        return std::nullopt;
    }
    const JSONValue* v = lookupPath(document, path);
    if (v == nullptr || !v->isString()) {
        return std::nullopt;
    }
    return std::get<std::string>(v->value);
}

SocialProfile JsonProfileParser::operator()(const JSONValue& document, const OAuth2Info& info) const {
    const JSONValue* id = lookupPath(document, paths.id);
    std::string key;
    if (id != nullptr && id->isString()) {
        key = std::get<std::string>(id->value);
    } else if (id != nullptr && std::holds_alternative<int64_t>(id->value)) {
        key = std::to_string(std::get<int64_t>(id->value));
    } else if (id != nullptr && std::holds_alternative<double>(id->value)) {
        const double d = std::get<double>(id->value);
        if (std::floor(d) == d && std::fabs(d) < 9.0e15) {
            key = std::to_string(static_cast<int64_t>(d));
        }
    }
    if (key.empty()) {
        errors::raise(errors::ProfileFieldMissing(providerId, paths.id, serializeJSONValue(document)));
    }

    SocialProfile profile;
    profile.loginInfo = LoginInfo{providerId, key};
    profile.firstName = optionalString(document, paths.firstName);
    profile.lastName = optionalString(document, paths.lastName);
    profile.fullName = optionalString(document, paths.fullName);
    profile.email = optionalString(document, paths.email);
    if (!profile.email && !paths.emailParam.empty() && info.params) {
        auto it = info.params->find(paths.emailParam);
        if (it != info.params->end() && !it->second.empty()) {
            profile.email = it->second;
        }
    }
    profile.avatarUri = optionalString(document, paths.avatarUri);
    return profile;
}

} // namespace credo::oauth2
