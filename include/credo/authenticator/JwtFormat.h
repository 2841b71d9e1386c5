//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JwtFormat.h
// Purpose: Bidirectional mapping between Authenticator values and signed claims tokens
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "credo/async/Task.h"
#include "credo/authenticator/Authenticator.h"
#include "credo/authenticator/Claims.h"

namespace credo::authenticator {

// Which claim timestamp becomes Authenticator::Touched() on read.
enum class TouchedClaim {
    IssuedAt,
    NotBefore,
    Latest  // later of issuedAt and notBefore, whichever are present
};

//==========================================================================================================
// JwtFormatOptions
// Purpose: Claims written alongside the authenticator fields.
// Fields:
//   issuer: Written to the iss claim when non-empty.
//   audience: Written to the aud claim when non-empty.
//   touchedClaim: Source of the touched instant on read.
//==========================================================================================================
struct JwtFormatOptions {
    std::string issuer{"credo"};
    std::vector<std::string> audience;
    TouchedClaim touchedClaim{TouchedClaim::Latest};
};

//==========================================================================================================
// JwtFormat
// Purpose: Authenticator <-> token codec over injected claims reader/writer.
// Read failures:
//   - reader failure: propagated unchanged
//   - jwtID or subject absent: MissingMandatoryClaim
//   - subject not Base64 LoginInfo JSON: MalformedClaimValue ("Cannot parse Json: ...")
//   - tags/fingerprint/payload of the wrong kind: MalformedClaimValue ("Unexpected Json value: ...")
//==========================================================================================================
class JwtFormat {
public:
    using Options = JwtFormatOptions;
    using TouchedClaim = authenticator::TouchedClaim;

    JwtFormat(std::shared_ptr<IClaimsReader> reader, std::shared_ptr<IClaimsWriter> writer);
    JwtFormat(std::shared_ptr<IClaimsReader> reader, std::shared_ptr<IClaimsWriter> writer, Options opts);

    std::future<Authenticator> Read(const std::string& rawToken);
    std::future<std::string> Write(const Authenticator& authenticator);

    // Synchronous mapping steps used by Read/Write.
    static Authenticator ToAuthenticator(const Claims& claims, TouchedClaim touchedClaim);
    Claims ToClaims(const Authenticator& authenticator) const;

    const Options& options() const { return opts; }

private:
    async::Task<Authenticator> coRead(std::string rawToken);
    async::Task<std::string> coWrite(Authenticator authenticator);

    std::shared_ptr<IClaimsReader> reader;
    std::shared_ptr<IClaimsWriter> writer;
    Options opts;
};

// Base64(LoginInfo JSON), the subject encoding.
std::string encodeSubject(const LoginInfo& info);

// Throws AuthException(MalformedClaimValue) when subject does not decode to a LoginInfo.
LoginInfo decodeSubject(const std::string& subject);

} // namespace credo::authenticator
