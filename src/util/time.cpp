// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2016-2023 The Zcash developers
// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "util/time.h"

#include <locale>
#include <sstream>

#include <boost/date_time/posix_time/posix_time.hpp>

int64_t GetTime() {
    return SystemClock::Instance()->GetTime();
}

int64_t GetTimeMillis() {
    return SystemClock::Instance()->GetTimeMillis();
}

int64_t SystemClock::GetTime() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t SystemClock::GetTimeMillis() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
}

void FixedClock::Set(std::chrono::seconds fixedSeconds) {
    LOCK(cs_fixed);
    this->fixedSeconds = fixedSeconds;
}

void FixedClock::Advance(std::chrono::seconds delta) {
    LOCK(cs_fixed);
    this->fixedSeconds += delta;
}

int64_t FixedClock::GetTime() const {
    LOCK(cs_fixed);
    return fixedSeconds.count();
}

int64_t FixedClock::GetTimeMillis() const {
    LOCK(cs_fixed);
    return std::chrono::duration_cast<std::chrono::milliseconds>(fixedSeconds).count();
}

std::string DateTimeStrFormat(const char* pszFormat, int64_t nTime)
{
    static std::locale classic(std::locale::classic());
    // std::locale takes ownership of the pointer
    std::locale loc(classic, new boost::posix_time::time_facet(pszFormat));
    std::stringstream ss;
    ss.imbue(loc);
    ss << boost::posix_time::from_time_t(nTime);
    return ss.str();
}
