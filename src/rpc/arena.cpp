// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "rpc/arena.h"

#include "arenaparams.h"
#include "logging.h"
#include "rpc/protocol.h"
#include "util/strencodings.h"

#include <stdexcept>

using namespace arena;

UniValue ValueFromAmount(const CAmount& amount)
{
    bool sign = amount < 0;
    int64_t n_abs = (sign ? -amount : amount);
    int64_t quotient = n_abs / COIN;
    int64_t remainder = n_abs % COIN;
    return UniValue(UniValue::VNUM,
            strprintf("%s%d.%08d", sign ? "-" : "", quotient, remainder));
}

static uint64_t ParseIdV(const UniValue& v, const std::string& strName)
{
    if (!v.isNum())
        throw JSONRPCError(RPC_TYPE_ERROR, strName + " must be a number");
    int64_t n = v.get_int64();
    if (n < 0)
        throw JSONRPCError(RPC_INVALID_PARAMETER, strName + " must be non-negative");
    return (uint64_t)n;
}

static CAccountID ParseAccountV(const UniValue& v, const std::string& strName)
{
    if (!v.isStr() || v.get_str().empty())
        throw JSONRPCError(RPC_TYPE_ERROR, strName + " must be a non-empty string");
    return CAccountID(v.get_str());
}

UniValue MatchToJSON(const CMatch& match)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("id", (uint64_t)match.nId);
    result.pushKV("gametype", match.gameType);
    result.pushKV("creator", match.creator.ToString());
    if (!match.joiner.IsNull())
        result.pushKV("joiner", match.joiner.ToString());
    result.pushKV("wager", ValueFromAmount(match.nWager));
    result.pushKV("state", MatchStateName(match.state));
    if (!match.winner.IsNull())
        result.pushKV("winner", match.winner.ToString());
    result.pushKV("createdat", (int64_t)match.nCreatedAt);
    if (match.nJoinedAt != 0)
        result.pushKV("joinedat", (int64_t)match.nJoinedAt);
    result.pushKV("phasestart", (int64_t)match.nPhaseStart);
    if (match.nResolvedAt != 0)
        result.pushKV("resolvedat", (int64_t)match.nResolvedAt);
    if (!match.creatorCommitment.IsNull())
        result.pushKV("creatorcommitment", match.creatorCommitment.GetHex());
    if (!match.joinerCommitment.IsNull())
        result.pushKV("joinercommitment", match.joinerCommitment.GetHex());
    if (match.creatorMove)
        result.pushKV("creatormove", HexStr(*match.creatorMove));
    if (match.joinerMove)
        result.pushKV("joinermove", HexStr(*match.joinerMove));
    result.pushKV("payout", ValueFromAmount(match.nPayout));
    result.pushKV("escrow", ValueFromAmount(match.GetEscrow()));
    return result;
}

UniValue StatsToJSON(const CAccountID& account, const CPlayerStats& stats)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("account", account.ToString());
    result.pushKV("gamesplayed", (uint64_t)stats.nGamesPlayed);
    result.pushKV("wins", (uint64_t)stats.nWins);
    result.pushKV("losses", (uint64_t)stats.nLosses);
    result.pushKV("totalwagered", ValueFromAmount(stats.nTotalWagered));
    result.pushKV("totalwon", ValueFromAmount(stats.nTotalWon));
    return result;
}

UniValue TournamentToJSON(const CTournament& tournament)
{
    UniValue players(UniValue::VARR);
    for (const CAccountID& player : tournament.vPlayers)
        players.push_back(player.ToString());

    UniValue result(UniValue::VOBJ);
    result.pushKV("id", (uint64_t)tournament.nId);
    result.pushKV("name", tournament.strName);
    result.pushKV("gametype", tournament.gameType);
    result.pushKV("creator", tournament.creator.ToString());
    result.pushKV("entryfee", ValueFromAmount(tournament.nEntryFee));
    result.pushKV("capacity", (int)tournament.nCapacity);
    result.pushKV("players", players);
    result.pushKV("state", TournamentStateName(tournament.state));
    result.pushKV("currentround", (int)tournament.nCurrentRound);
    result.pushKV("prizepool", ValueFromAmount(tournament.nPrizePool));
    if (!tournament.winner.IsNull()) {
        result.pushKV("winner", tournament.winner.ToString());
        result.pushKV("prizepaid", ValueFromAmount(tournament.nPrizePaid));
    }
    result.pushKV("createdat", (int64_t)tournament.nCreatedAt);
    if (tournament.nCompletedAt != 0)
        result.pushKV("completedat", (int64_t)tournament.nCompletedAt);
    return result;
}

UniValue BracketMatchToJSON(const CBracketMatch& bracketMatch, unsigned int nCapacity)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("flatindex", (int)BracketFlatIndex(nCapacity, bracketMatch.nRound, bracketMatch.nIndex));
    result.pushKV("round", (int)bracketMatch.nRound);
    result.pushKV("index", (int)bracketMatch.nIndex);
    result.pushKV("player1", bracketMatch.player1.ToString());
    result.pushKV("player2", bracketMatch.player2.ToString());
    result.pushKV("completed", bracketMatch.fCompleted);
    if (bracketMatch.fCompleted)
        result.pushKV("winner", bracketMatch.winner.ToString());
    if (bracketMatch.contestId)
        result.pushKV("contest", (uint64_t)*bracketMatch.contestId);
    return result;
}

UniValue getmatch(const CMatchEngine& matches, const UniValue& params, bool fHelp)
{
    if (fHelp || params.size() != 1)
        throw std::runtime_error(
            "getmatch matchid\n"
            "\nReturns the escrow record of a match.\n"
            "\nArguments:\n"
            "1. matchid    (numeric, required) the match id\n"
            "\nResult:\n"
            "{\n"
            "  \"id\": n,                  (numeric) the match id\n"
            "  \"state\": \"xxx\",           (string) created, commit_phase, reveal_phase, resolved or cancelled\n"
            "  \"wager\": x.xxx,           (numeric) each side's wager in " + CURRENCY_UNIT + "\n"
            "  \"escrow\": x.xxx,          (numeric) funds the match currently holds\n"
            "  ...\n"
            "}\n");

    uint64_t nMatchId = ParseIdV(params[0], "matchid");
    std::optional<CMatch> match = matches.GetMatch(nMatchId);
    if (!match)
        throw JSONRPCError(RPC_MATCH_NOT_FOUND, strprintf("Match %d not found", nMatchId));
    return MatchToJSON(*match);
}

UniValue getplayerstats(const CMatchEngine& matches, const UniValue& params, bool fHelp)
{
    if (fHelp || params.size() != 1)
        throw std::runtime_error(
            "getplayerstats account\n"
            "\nReturns cumulative results of an account. Unknown accounts report zeros.\n"
            "\nArguments:\n"
            "1. account    (string, required) the participant identity\n");

    CAccountID account = ParseAccountV(params[0], "account");
    return StatsToJSON(account, matches.GetStats(account));
}

UniValue getplayermatches(const CMatchEngine& matches, const UniValue& params, bool fHelp)
{
    if (fHelp || params.size() != 1)
        throw std::runtime_error(
            "getplayermatches account\n"
            "\nReturns the ids of every match the account created or joined, oldest first.\n"
            "\nArguments:\n"
            "1. account    (string, required) the participant identity\n");

    CAccountID account = ParseAccountV(params[0], "account");
    UniValue result(UniValue::VARR);
    for (uint64_t nMatchId : matches.GetPlayerMatches(account))
        result.push_back((uint64_t)nMatchId);
    return result;
}

UniValue gettournament(const CBracketEngine& brackets, const UniValue& params, bool fHelp)
{
    if (fHelp || params.size() != 1)
        throw std::runtime_error(
            "gettournament tournamentid\n"
            "\nReturns a tournament record.\n"
            "\nArguments:\n"
            "1. tournamentid    (numeric, required) the tournament id\n");

    uint64_t nTournamentId = ParseIdV(params[0], "tournamentid");
    std::optional<CTournament> tournament = brackets.GetTournament(nTournamentId);
    if (!tournament)
        throw JSONRPCError(RPC_TOURNAMENT_NOT_FOUND, strprintf("Tournament %d not found", nTournamentId));
    return TournamentToJSON(*tournament);
}

UniValue gettournamentmatches(const CBracketEngine& brackets, const UniValue& params, bool fHelp)
{
    if (fHelp || params.size() != 1)
        throw std::runtime_error(
            "gettournamentmatches tournamentid\n"
            "\nReturns every bracket match generated so far, in flat index order.\n"
            "\nArguments:\n"
            "1. tournamentid    (numeric, required) the tournament id\n");

    uint64_t nTournamentId = ParseIdV(params[0], "tournamentid");
    std::optional<CTournament> tournament = brackets.GetTournament(nTournamentId);
    if (!tournament)
        throw JSONRPCError(RPC_TOURNAMENT_NOT_FOUND, strprintf("Tournament %d not found", nTournamentId));

    UniValue result(UniValue::VARR);
    for (const CBracketMatch& bracketMatch : brackets.GetTournamentMatches(nTournamentId))
        result.push_back(BracketMatchToJSON(bracketMatch, tournament->nCapacity));
    return result;
}

UniValue getarenainfo(const CMatchEngine& matches, const CBracketEngine& brackets,
                      const UniValue& params, bool fHelp)
{
    if (fHelp || params.size() != 0)
        throw std::runtime_error(
            "getarenainfo\n"
            "\nReturns ledger totals and the active parameters.\n");

    const CArenaParams& arenaParams = matches.GetParams();

    UniValue paramsObj(UniValue::VOBJ);
    paramsObj.pushKV("network", arenaParams.NetworkIDString());
    paramsObj.pushKV("minwager", ValueFromAmount(arenaParams.MinWager()));
    paramsObj.pushKV("maxwager", ValueFromAmount(arenaParams.MaxWager()));
    paramsObj.pushKV("committimeout", (int64_t)arenaParams.CommitTimeout());
    paramsObj.pushKV("revealtimeout", (int64_t)arenaParams.RevealTimeout());
    paramsObj.pushKV("platformfeebps", (int64_t)arenaParams.PlatformFee().GetBasisPoints());

    UniValue result(UniValue::VOBJ);
    result.pushKV("matchcount", (uint64_t)matches.GetMatchCount());
    result.pushKV("tournamentcount", (uint64_t)brackets.GetTournamentCount());
    result.pushKV("escrowbalance", ValueFromAmount(matches.GetEscrowBalance()));
    result.pushKV("prizepools", ValueFromAmount(brackets.GetPrizePoolTotal()));
    result.pushKV("matchfees", ValueFromAmount(matches.GetFeePool()));
    result.pushKV("tournamentfees", ValueFromAmount(brackets.GetFeePool()));
    result.pushKV("params", paramsObj);
    return result;
}
