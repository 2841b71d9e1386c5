//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Clock.h
// Purpose: Injectable wall clock used by authenticator lifecycle, validators and state expiry
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>

namespace credo {

using Instant = std::chrono::system_clock::time_point;

//==========================================================================================================
// IClock
// Purpose: Source of the current wall-clock time.
//==========================================================================================================
class IClock {
public:
    virtual ~IClock() = default;
    virtual Instant Now() const = 0;
};

class SystemClock : public IClock {
public:
    Instant Now() const override { return std::chrono::system_clock::now(); }
};

//==========================================================================================================
// FixedClock
// Purpose: Clock pinned to a settable instant; Advance() moves it forward (or backward for negative values).
//==========================================================================================================
class FixedClock : public IClock {
public:
    explicit FixedClock(Instant start) : ticks(start.time_since_epoch().count()) {}

    Instant Now() const override {
        return Instant(Instant::duration(ticks.load()));
    }

    void Set(Instant t) { ticks.store(t.time_since_epoch().count()); }

    template <typename Rep, typename Period>
    void Advance(std::chrono::duration<Rep, Period> d) {
        ticks.fetch_add(std::chrono::duration_cast<Instant::duration>(d).count());
    }

private:
    std::atomic<Instant::rep> ticks;
};

} // namespace credo
