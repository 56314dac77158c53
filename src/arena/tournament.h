// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ARENA_ARENA_TOURNAMENT_H
#define ARENA_ARENA_TOURNAMENT_H

#include "amount.h"
#include "arena/ledger.h"
#include "arena/match.h"
#include "arena/resolvers.h"
#include "arenaparams.h"
#include "sync.h"
#include "util/time.h"
#include "validation.h"

#include <map>
#include <optional>
#include <set>
#include <stdint.h>
#include <string>
#include <tuple>
#include <vector>

namespace arena {

/** Longest tournament name accepted, in bytes. */
static const size_t MAX_TOURNAMENT_NAME_SIZE = 64;

enum class TournamentState {
    REGISTRATION,
    ACTIVE,
    COMPLETED,
    CANCELLED,
};

std::string TournamentStateName(TournamentState state);

class CTournament
{
public:
    uint64_t nId = 0;
    std::string strName;
    std::string gameType;
    CAccountID creator;
    CAmount nEntryFee = 0;
    unsigned int nCapacity = 0;
    //! Registration order; round 1 pairs [0,1], [2,3], ...
    std::vector<CAccountID> vPlayers;
    CAccountID winner;
    TournamentState state = TournamentState::REGISTRATION;
    //! Entry fees collected. Zeroed by a refund, kept for audit after completion.
    CAmount nPrizePool = 0;
    //! Amount delivered to the winner, net of the platform fee.
    CAmount nPrizePaid = 0;
    int64_t nCreatedAt = 0;
    int64_t nCompletedAt = 0;
    //! Zero until the bracket is generated.
    unsigned int nCurrentRound = 0;

    bool IsRegistered(const CAccountID& account) const;
    /** log2(capacity): the round whose single match is the final. */
    unsigned int GetRoundCount() const;
};

/** One pairing of the bracket, identified by (tournament, round, index). */
class CBracketMatch
{
public:
    uint64_t nTournamentId = 0;
    unsigned int nRound = 0;
    unsigned int nIndex = 0;
    CAccountID player1;
    CAccountID player2;
    CAccountID winner;
    bool fCompleted = false;
    //! Match engine contest that decides this pairing, if one was attached.
    std::optional<uint64_t> contestId;

    bool IsContestant(const CAccountID& account) const;
};

/**
 * Position in a flattened bracket where round r (1-based) starts at
 * capacity - (capacity >> (r - 1)) and holds capacity >> r matches.
 */
unsigned int BracketFlatIndex(unsigned int nCapacity, unsigned int nRound, unsigned int nIndex);

/** Inverse of BracketFlatIndex. Returns false past the final. */
bool BracketPosition(unsigned int nCapacity, unsigned int nFlatIndex, unsigned int& nRoundOut, unsigned int& nIndexOut);

/**
 * Runs single-elimination tournaments over one funds gateway. Registration
 * fills a power-of-two field; the last registrant triggers round one, and
 * each completed round pairs its winners until one remains and is paid the
 * prize pool less the platform fee.
 *
 * Bracket matches are decided by a resolver, either directly or by settling
 * from a contest played on the match engine.
 */
class CBracketEngine
{
private:
    typedef std::tuple<uint64_t, unsigned int, unsigned int> BracketKey;

    mutable RecursiveMutex cs_arena;

    CFundsGateway& gateway;
    const CClock& clock;
    const CArenaParams params;
    const CResolverSet resolvers;
    const CMatchEngine& matches;

    CIdSequence tournamentIds;
    std::map<uint64_t, CTournament> mapTournaments;
    std::map<BracketKey, CBracketMatch> mapBracket;
    std::set<uint64_t> setAttachedContests;
    CAmount nPrizePoolTotal = 0;
    CAmount nFeePool = 0;

    /** Pair entrants in order as the next round of the tournament. */
    void GenerateRound(CTournament& tournament, const std::vector<CAccountID>& vEntrants);
    /** Find the bracket match at a flat index among the rounds generated so far. */
    CBracketMatch* LookupBracketMatch(const CTournament& tournament, unsigned int nFlatIndex);
    /** Shared tail of ResolveMatch and SettleFromContest; the winner is already known to be a contestant. */
    bool ApplyResult(CTournament& tournament, CBracketMatch& bracketMatch, const CAccountID& winner, CValidationState& state);
    bool TransferFailure(const std::string& context, CAmount nAmount, CValidationState& state);

public:
    CBracketEngine(CFundsGateway& gatewayIn, const CClock& clockIn, const CArenaParams& paramsIn,
                   const CResolverSet& resolversIn, const CMatchEngine& matchesIn);

    CBracketEngine(const CBracketEngine&) = delete;
    CBracketEngine& operator=(const CBracketEngine&) = delete;

    bool CreateTournament(const CAccountID& caller, const std::string& strName, const std::string& gameType,
                          CAmount nEntryFee, unsigned int nCapacity,
                          CValidationState& state, uint64_t& nTournamentIdOut);
    bool Register(const CAccountID& caller, uint64_t nTournamentId, CAmount nValue, CValidationState& state);
    bool ResolveMatch(const CAccountID& caller, uint64_t nTournamentId, unsigned int nFlatIndex,
                      const CAccountID& winner, CValidationState& state);
    bool CancelTournament(const CAccountID& caller, uint64_t nTournamentId, CValidationState& state);
    /** Resolver-only: bind a bracket match to a match engine contest between the same two players. */
    bool AttachContest(const CAccountID& caller, uint64_t nTournamentId, unsigned int nFlatIndex,
                       uint64_t nMatchId, CValidationState& state);
    /** Apply the winner of a resolved attached contest. Anyone may call. */
    bool SettleFromContest(const CAccountID& caller, uint64_t nTournamentId, unsigned int nFlatIndex,
                           CValidationState& state);
    bool WithdrawFees(const CAccountID& caller, const CAccountID& to, CValidationState& state);

    std::optional<CTournament> GetTournament(uint64_t nTournamentId) const;
    uint64_t GetTournamentCount() const;
    /** Every bracket match of a tournament ordered by round then index, i.e. in flat index order. */
    std::vector<CBracketMatch> GetTournamentMatches(uint64_t nTournamentId) const;
    std::vector<CBracketMatch> GetRoundMatches(uint64_t nTournamentId, unsigned int nRound) const;
    std::optional<CBracketMatch> GetBracketMatch(uint64_t nTournamentId, unsigned int nRound, unsigned int nIndex) const;
    /** Entry fees held for tournaments that have not paid out or refunded. */
    CAmount GetPrizePoolTotal() const;
    CAmount GetFeePool() const;
    const CArenaParams& GetParams() const { return params; }
};

} // namespace arena

#endif // ARENA_ARENA_TOURNAMENT_H
