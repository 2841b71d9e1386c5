//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NonceLedger.cpp
// Purpose: In-memory consumed-state ledger
//==========================================================================================================

#include "credo/state/NonceLedger.h"

namespace credo::state {

bool InMemoryNonceLedger::Consume(const std::string& id, Instant expiresAt, Instant now) {
    std::lock_guard<std::mutex> lk(mtx);
    pruneLocked(now);
    auto inserted = consumed.emplace(id, expiresAt);
    return inserted.second;
}

std::size_t InMemoryNonceLedger::size() const {
    std::lock_guard<std::mutex> lk(mtx);
    return consumed.size();
}

void InMemoryNonceLedger::pruneLocked(Instant now) {
    for (auto it = consumed.begin(); it != consumed.end();) {
        if (it->second < now) {
            it = consumed.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace credo::state
