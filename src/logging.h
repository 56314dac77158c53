// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Copyright (c) 2018-2020 The Zcash developers
// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ARENA_LOGGING_H
#define ARENA_LOGGING_H

#include "fs.h"

#include <tinyformat.h>

#include <string>

#ifndef strprintf
#define strprintf tfm::format
#endif

static const bool DEFAULT_LOGTIMEMICROS = false;
static const bool DEFAULT_LOGTIMESTAMPS = true;
extern const char * const DEFAULT_DEBUGLOGFILE;

extern bool fPrintToConsole;
extern bool fPrintToDebugLog;

extern bool fLogTimestamps;
extern bool fLogTimeMicros;

/** Returns the filtering directive set by the -debug flags. */
std::string LogConfigFilter();

/** Return true if log accepts specified category */
bool LogAcceptCategory(const char* category);

/** Send a formatted line to the console and/or debug.log. Returns the number of characters written. */
int LogPrintStr(const std::string& level, const std::string& category, const std::string& str);

/** Print to debug.log with level INFO and category "main". */
#define LogPrintf(...) LogPrintInner("info", "main", __VA_ARGS__)

/** Print to debug.log with level DEBUG. */
#define LogPrint(category, ...) do {                       \
    if (LogAcceptCategory(category)) {                     \
        LogPrintInner("debug", category, __VA_ARGS__);     \
    }                                                      \
} while(0)

#define LogPrintInner(level, category, ...) do {           \
    std::string T_MSG = tfm::format(__VA_ARGS__);          \
    if (!T_MSG.empty() && T_MSG[T_MSG.size()-1] == '\n') { \
        T_MSG.erase(T_MSG.size()-1);                       \
    }                                                      \
    LogPrintStr(level, category, T_MSG);                   \
} while(0)

#define LogError(category, ...) ([&]() {          \
    std::string T_MSG = tfm::format(__VA_ARGS__); \
    LogPrintStr("error", category, T_MSG);        \
    return false;                                 \
}())

fs::path GetDebugLogPath();
void OpenDebugLog();
void ShrinkDebugFile();

/**
 * Apply -printtoconsole, -logtimestamps, -logtimemicros and -shrinkdebugfile,
 * then open the debug log.
 */
void InitLogging();

#endif // ARENA_LOGGING_H
