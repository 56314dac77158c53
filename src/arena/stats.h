// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ARENA_ARENA_STATS_H
#define ARENA_ARENA_STATS_H

#include "amount.h"
#include "arena/ledger.h"

#include <map>
#include <stdint.h>

namespace arena {

/** Cumulative per-participant counters. Never decrease. */
struct CPlayerStats
{
    uint64_t nGamesPlayed = 0;
    uint64_t nWins = 0;
    uint64_t nLosses = 0;
    CAmount nTotalWagered = 0;
    CAmount nTotalWon = 0;

    friend bool operator==(const CPlayerStats& a, const CPlayerStats& b)
    {
        return a.nGamesPlayed == b.nGamesPlayed && a.nWins == b.nWins && a.nLosses == b.nLosses &&
               a.nTotalWagered == b.nTotalWagered && a.nTotalWon == b.nTotalWon;
    }
};

/**
 * Derives participant stats from resolved matches. Refunds and cancellations
 * are not results and never reach it. Not thread safe; the owning engine
 * serialises access.
 */
class CStatsAggregator
{
private:
    std::map<CAccountID, CPlayerStats> mapStats;

public:
    void RecordResult(const CAccountID& winner, const CAccountID& loser, CAmount nWager, CAmount nPayout);

    /** Zeros for a participant with no resolved match. */
    CPlayerStats GetStats(const CAccountID& account) const;

    size_t GetPlayerCount() const { return mapStats.size(); }
};

} // namespace arena

#endif // ARENA_ARENA_STATS_H
