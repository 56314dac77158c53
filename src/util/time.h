// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2019-2022 The Zcash developers
// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ARENA_UTIL_TIME_H
#define ARENA_UTIL_TIME_H

#include <stdint.h>
#include <string>
#include <chrono>

#include "sync.h"

class CClock {
public:
    virtual ~CClock() {}
    /** Returns the current time in seconds since the POSIX epoch. */
    virtual int64_t GetTime() const = 0;
    /** Returns the current time in milliseconds since the POSIX epoch. */
    virtual int64_t GetTimeMillis() const = 0;
};

class SystemClock: public CClock {
private:
    SystemClock() {}
    ~SystemClock() {}
    SystemClock(SystemClock const&) = delete;
    SystemClock& operator=(const SystemClock&) = delete;
public:
    static SystemClock* Instance() {
        static SystemClock instance;
        return &instance;
    }

    int64_t GetTime() const;
    int64_t GetTimeMillis() const;
};

/**
 * A clock that only moves when told to. Engines read deadlines from whichever
 * clock they were constructed with, so tests hand them one of these.
 */
class FixedClock: public CClock {
private:
    mutable Mutex cs_fixed;
    std::chrono::seconds fixedSeconds;

public:
    explicit FixedClock(std::chrono::seconds fixedSeconds): fixedSeconds(fixedSeconds) {}

    void Set(std::chrono::seconds fixedSeconds);
    void Advance(std::chrono::seconds delta);
    int64_t GetTime() const;
    int64_t GetTimeMillis() const;
};

/** Wall-clock seconds since the epoch, independent of any injected clock. */
int64_t GetTime();
int64_t GetTimeMillis();

std::string DateTimeStrFormat(const char* pszFormat, int64_t nTime);

#endif // ARENA_UTIL_TIME_H
