//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NonceLedger.h
// Purpose: Record of consumed state identifiers enforcing single use
//==========================================================================================================

#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "credo/Clock.h"

namespace credo::state {

//==========================================================================================================
// INonceLedger
// Purpose: Marks an identifier as consumed until its own expiry.
// Returns (Consume): true the first time id is seen; false if it was already consumed and is still live.
//==========================================================================================================
class INonceLedger {
public:
    virtual ~INonceLedger() = default;
    virtual bool Consume(const std::string& id, Instant expiresAt, Instant now) = 0;
};

// Process-local ledger. Entries past their expiry are pruned on the next Consume call.
class InMemoryNonceLedger : public INonceLedger {
public:
    bool Consume(const std::string& id, Instant expiresAt, Instant now) override;
    std::size_t size() const;

private:
    void pruneLocked(Instant now);

    mutable std::mutex mtx;
    std::unordered_map<std::string, Instant> consumed;
};

} // namespace credo::state
