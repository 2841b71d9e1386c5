//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonProfileParser.h
// Purpose: Profile parser configured by dotted JSON paths
//==========================================================================================================

#pragma once

#include <functional>
#include <string>

#include "credo/JSONValue.h"
#include "credo/oauth2/OAuth2Info.h"

namespace credo::oauth2 {

// Maps a raw profile document to a SocialProfile. Throws AuthException(ProfileFieldMissing) when the
// provider's user id cannot be extracted.
using ProfileParser = std::function<SocialProfile(const JSONValue& document, const OAuth2Info& info)>;

//==========================================================================================================
// lookupPath
// Purpose: Resolves "a.b.0.c" against value. Numeric segments index arrays; other segments select object
//          members. Returns nullptr when any segment is missing or the value is null.
//==========================================================================================================
const JSONValue* lookupPath(const JSONValue& value, const std::string& path);

//==========================================================================================================
// JsonProfilePaths
// Purpose: Where each profile attribute lives in the provider document. Empty paths are not mapped.
//==========================================================================================================
struct JsonProfilePaths {
    std::string id{"id"};
    std::string firstName;
    std::string lastName;
    std::string fullName{"name"};
    std::string email{"email"};
    std::string avatarUri;
    // Token-response param used when the document has no email (VK returns it beside the token).
    std::string emailParam;
};

//==========================================================================================================
// JsonProfileParser
// Notes:
//   - The id may be a string or an integral number (rendered in decimal).
//   - Optional attributes are taken only when they resolve to strings.
//   - emailParam is read from OAuth2Info::params only when the email path yields nothing.
//==========================================================================================================
class JsonProfileParser {
public:
    JsonProfileParser(std::string providerId, JsonProfilePaths paths);

    SocialProfile operator()(const JSONValue& document, const OAuth2Info& info) const;

private:
    std::optional<std::string> optionalString(const JSONValue& document, const std::string& path) const;

    std::string providerId;
    JsonProfilePaths paths;
};

} // namespace credo::oauth2
