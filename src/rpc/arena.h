// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ARENA_RPC_ARENA_H
#define ARENA_RPC_ARENA_H

#include "amount.h"
#include "arena/match.h"
#include "arena/stats.h"
#include "arena/tournament.h"

#include <univalue.h>

UniValue ValueFromAmount(const CAmount& amount);

UniValue MatchToJSON(const arena::CMatch& match);
UniValue StatsToJSON(const arena::CAccountID& account, const arena::CPlayerStats& stats);
UniValue TournamentToJSON(const arena::CTournament& tournament);
UniValue BracketMatchToJSON(const arena::CBracketMatch& bracketMatch, unsigned int nCapacity);

/**
 * Read-only views over the engines. Each takes the positional params of a
 * JSON-RPC request and throws a JSONRPCError object on bad input, or
 * std::runtime_error carrying the help text when fHelp is set.
 */
UniValue getmatch(const arena::CMatchEngine& matches, const UniValue& params, bool fHelp);
UniValue getplayerstats(const arena::CMatchEngine& matches, const UniValue& params, bool fHelp);
UniValue getplayermatches(const arena::CMatchEngine& matches, const UniValue& params, bool fHelp);
UniValue gettournament(const arena::CBracketEngine& brackets, const UniValue& params, bool fHelp);
UniValue gettournamentmatches(const arena::CBracketEngine& brackets, const UniValue& params, bool fHelp);
UniValue getarenainfo(const arena::CMatchEngine& matches, const arena::CBracketEngine& brackets,
                      const UniValue& params, bool fHelp);

#endif // ARENA_RPC_ARENA_H
