// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "arena/stats.h"

namespace arena {

void CStatsAggregator::RecordResult(const CAccountID& winner, const CAccountID& loser, CAmount nWager, CAmount nPayout)
{
    CPlayerStats& winnerStats = mapStats[winner];
    winnerStats.nGamesPlayed++;
    winnerStats.nWins++;
    winnerStats.nTotalWagered += nWager;
    winnerStats.nTotalWon += nPayout;

    CPlayerStats& loserStats = mapStats[loser];
    loserStats.nGamesPlayed++;
    loserStats.nLosses++;
    loserStats.nTotalWagered += nWager;
}

CPlayerStats CStatsAggregator::GetStats(const CAccountID& account) const
{
    auto it = mapStats.find(account);
    if (it == mapStats.end())
        return CPlayerStats();
    return it->second;
}

} // namespace arena
