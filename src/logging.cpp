// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Copyright (c) 2018-2023 The Zcash developers
// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "logging.h"

#include "util/system.h"
#include "util/time.h"

#include <assert.h>
#include <list>
#include <set>
#include <vector>

#include <boost/thread/mutex.hpp>
#include <boost/thread/once.hpp>

using namespace std;

const char * const DEFAULT_DEBUGLOGFILE = "debug.log";

bool fPrintToConsole = false;
bool fPrintToDebugLog = true;

bool fLogTimestamps = DEFAULT_LOGTIMESTAMPS;
bool fLogTimeMicros = DEFAULT_LOGTIMEMICROS;

/**
 * fileout is opened lazily by OpenDebugLog(); until then lines are buffered
 * in vMsgsBeforeOpenLog so that nothing logged during startup is lost.
 */
static boost::once_flag debugPrintInitFlag = BOOST_ONCE_INIT;
static FILE* fileout = NULL;
static boost::mutex* mutexDebugLog = NULL;
static list<string>* vMsgsBeforeOpenLog;

static void DebugPrintInit()
{
    assert(mutexDebugLog == NULL);
    mutexDebugLog = new boost::mutex();
    vMsgsBeforeOpenLog = new list<string>;
}

static int FileWriteStr(const std::string &str, FILE *fp)
{
    return fwrite(str.data(), 1, str.size(), fp);
}

fs::path GetDebugLogPath()
{
    fs::path logfile(GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE));
    return AbsPathForConfigVal(logfile);
}

void OpenDebugLog()
{
    boost::call_once(&DebugPrintInit, debugPrintInitFlag);
    boost::mutex::scoped_lock scoped_lock(*mutexDebugLog);

    if (fileout != NULL) {
        fclose(fileout);
    }
    fs::path pathDebug = GetDebugLogPath();
    fileout = fsbridge::fopen(pathDebug, "a");
    if (fileout) {
        setbuf(fileout, NULL); // unbuffered
    }

    // dump buffered messages from before we opened the log
    if (vMsgsBeforeOpenLog == NULL)
        return;
    while (!vMsgsBeforeOpenLog->empty()) {
        if (fileout) {
            FileWriteStr(vMsgsBeforeOpenLog->front(), fileout);
        }
        vMsgsBeforeOpenLog->pop_front();
    }

    delete vMsgsBeforeOpenLog;
    vMsgsBeforeOpenLog = NULL;
}

std::string LogConfigFilter()
{
    // With no -debug flags, show errors and LogPrintf lines.
    std::string filter = "error,main=info";

    auto& categories = mapMultiArgs["-debug"];
    std::set<std::string> setCategories(categories.begin(), categories.end());
    if (setCategories.count(string("")) != 0 || setCategories.count(string("1")) != 0) {
        // Turn on the firehose!
        filter = "debug";
    } else {
        for (auto category : setCategories) {
            filter += "," + category + "=debug";
        }
    }

    return filter;
}

bool LogAcceptCategory(const char* category)
{
    if (category != NULL)
    {
        if (!fDebug)
            return false;

        const vector<string>& categories = mapMultiArgs["-debug"];
        set<string> setCategories(categories.begin(), categories.end());

        // if not debugging everything and not debugging specific category, LogPrint does nothing.
        if (setCategories.count(string("")) == 0 &&
            setCategories.count(string("1")) == 0 &&
            setCategories.count(string(category)) == 0)
            return false;
    }
    return true;
}

static std::string LogTimestampStr(const std::string &str)
{
    if (!fLogTimestamps)
        return str;

    int64_t nTimeMicros = GetTimeMillis() * 1000;
    std::string strStamped = DateTimeStrFormat("%Y-%m-%dT%H:%M:%SZ", nTimeMicros/1000000);
    if (fLogTimeMicros)
        strStamped += strprintf(".%06d", nTimeMicros%1000000);
    return strStamped + ' ' + str;
}

int LogPrintStr(const std::string& level, const std::string& category, const std::string& str)
{
    int ret = 0;
    std::string strLine = LogTimestampStr(strprintf("%5s %s: %s\n", level, category, str));

    if (fPrintToConsole)
    {
        ret = fwrite(strLine.data(), 1, strLine.size(), stdout);
        fflush(stdout);
    }
    if (fPrintToDebugLog)
    {
        boost::call_once(&DebugPrintInit, debugPrintInitFlag);
        boost::mutex::scoped_lock scoped_lock(*mutexDebugLog);

        // buffer if we haven't opened the log yet
        if (fileout == NULL) {
            if (vMsgsBeforeOpenLog) {
                ret = strLine.length();
                vMsgsBeforeOpenLog->push_back(strLine);
            }
        }
        else
        {
            ret = FileWriteStr(strLine, fileout);
        }
    }
    return ret;
}

void ShrinkDebugFile()
{
    // Scroll debug log if it's getting too big
    fs::path pathLog = GetDebugLogPath();
    FILE* file = fsbridge::fopen(pathLog, "r");
    if (file && fs::file_size(pathLog) > 10 * 1000000)
    {
        // Restart the file with some of the end
        std::vector <char> vch(200000,0);
        fseek(file, -((long)vch.size()), SEEK_END);
        int nBytes = fread(vch.data(), 1, vch.size(), file);
        fclose(file);

        file = fsbridge::fopen(pathLog, "w");
        if (file)
        {
            fwrite(vch.data(), 1, nBytes, file);
            fclose(file);
        }
    }
    else if (file != NULL)
        fclose(file);
}

void InitLogging()
{
    fPrintToConsole = GetBoolArg("-printtoconsole", false);
    fLogTimestamps = GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);
    fLogTimeMicros = GetBoolArg("-logtimemicros", DEFAULT_LOGTIMEMICROS);

    if (GetBoolArg("-shrinkdebugfile", !fDebug))
        ShrinkDebugFile();
    OpenDebugLog();

    LogPrintf("Logging to %s, filter %s\n", GetDebugLogPath().string(), LogConfigFilter());
}
