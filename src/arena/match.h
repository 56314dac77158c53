// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ARENA_ARENA_MATCH_H
#define ARENA_ARENA_MATCH_H

#include "amount.h"
#include "arena/comparator.h"
#include "arena/ledger.h"
#include "arena/resolvers.h"
#include "arena/stats.h"
#include "arenaparams.h"
#include "sync.h"
#include "uint256.h"
#include "util/time.h"
#include "validation.h"

#include <map>
#include <memory>
#include <optional>
#include <stdint.h>
#include <string>
#include <vector>

namespace arena {

enum class MatchState {
    CREATED,
    COMMIT_PHASE,
    REVEAL_PHASE,
    RESOLVED,
    CANCELLED,
};

std::string MatchStateName(MatchState state);

/** How a successful ClaimTimeout ended the match. */
enum class TimeoutOutcome {
    FORFEIT_TO_CREATOR,
    FORFEIT_TO_JOINER,
    REFUNDED,
};

std::string TimeoutOutcomeName(TimeoutOutcome outcome);

/**
 * A two-party wagered match. Records are never erased; a terminal match keeps
 * its history but holds no escrow.
 */
class CMatch
{
public:
    uint64_t nId = 0;
    std::string gameType;
    CAccountID creator;
    //! Null until the match is joined.
    CAccountID joiner;
    CAmount nWager = 0;
    MatchState state = MatchState::CREATED;
    //! Null until resolved.
    CAccountID winner;
    int64_t nCreatedAt = 0;
    int64_t nJoinedAt = 0;
    //! When the current phase began; drives the timeout deadline.
    int64_t nPhaseStart = 0;
    int64_t nResolvedAt = 0;
    uint256 creatorCommitment;
    uint256 joinerCommitment;
    std::optional<std::vector<unsigned char>> creatorMove;
    std::optional<std::vector<unsigned char>> joinerMove;
    //! Amount delivered to the winner, net of the platform fee.
    CAmount nPayout = 0;

    bool IsPlayer(const CAccountID& account) const;
    bool IsTerminal() const { return state == MatchState::RESOLVED || state == MatchState::CANCELLED; }

    /** Funds this match currently holds in custody. */
    CAmount GetEscrow() const;

    /** Time at or after which ClaimTimeout is accepted. Zero for a terminal match. */
    int64_t GetDeadline(const CArenaParams& params) const;
};

/**
 * Owns every match of one ledger together with its escrow, fee pool and the
 * stats derived from resolutions.
 *
 * Each state-changing call either commits completely or leaves the engine as
 * it found it. A precondition failure is reported through
 * CValidationState::Invalid with one of the REJECT_* codes; a payout or refund
 * the gateway refuses is reported through CValidationState::Error and rolls
 * the whole call back.
 */
class CMatchEngine
{
private:
    mutable RecursiveMutex cs_arena;

    CFundsGateway& gateway;
    const CClock& clock;
    const CArenaParams params;
    const CResolverSet resolvers;
    CMoveComparatorRegistry comparators;

    CIdSequence matchIds;
    std::map<uint64_t, CMatch> mapMatches;
    std::map<CAccountID, std::vector<uint64_t>> mapPlayerMatches;
    CStatsAggregator stats;
    CAmount nEscrowBalance = 0;
    CAmount nFeePool = 0;

    /** Pay the pot less the fee to the winner, then mark the match resolved. */
    bool SettleWinner(CMatch& match, const CAccountID& winner, CValidationState& state);
    /** Return each side's wager in one batch, then mark the match cancelled. */
    bool RefundAndCancel(CMatch& match, const std::vector<CPayout>& vRefunds, CValidationState& state);
    bool TransferFailure(const std::string& context, CAmount nAmount, CValidationState& state);
    void NotifyResolved(const CMatch& match);

public:
    CMatchEngine(CFundsGateway& gatewayIn, const CClock& clockIn,
                 const CArenaParams& paramsIn, const CResolverSet& resolversIn);

    CMatchEngine(const CMatchEngine&) = delete;
    CMatchEngine& operator=(const CMatchEngine&) = delete;

    /** Decide commit-reveal matches of this game type with the given comparator. */
    void RegisterComparator(const std::string& gameType, std::shared_ptr<const CMoveComparator> comparator);

    bool CreateMatch(const CAccountID& caller, const std::string& gameType, CAmount nValue,
                     CValidationState& state, uint64_t& nMatchIdOut);
    bool JoinMatch(const CAccountID& caller, uint64_t nMatchId, CAmount nValue, CValidationState& state);
    bool CommitMove(const CAccountID& caller, uint64_t nMatchId, const uint256& commitment, CValidationState& state);
    /**
     * Reveal a committed move. The second reveal resolves the match with the
     * comparator for its game type; a tie goes to the creator.
     */
    bool RevealMove(const CAccountID& caller, uint64_t nMatchId,
                    const std::vector<unsigned char>& vchMove, const uint256& salt,
                    CValidationState& state);
    bool ResolveByResolver(const CAccountID& caller, uint64_t nMatchId, const CAccountID& winner, CValidationState& state);
    bool CancelMatch(const CAccountID& caller, uint64_t nMatchId, CValidationState& state);
    /**
     * After the phase deadline, a side that acted wins outright against one
     * that did not. When neither side acted, every deposit is refunded and the
     * match is cancelled.
     */
    bool ClaimTimeout(const CAccountID& caller, uint64_t nMatchId, TimeoutOutcome& outcome, CValidationState& state);
    /** Resolver-only: send the accumulated platform fees to an account. */
    bool WithdrawFees(const CAccountID& caller, const CAccountID& to, CValidationState& state);

    std::optional<CMatch> GetMatch(uint64_t nMatchId) const;
    uint64_t GetMatchCount() const;
    CAmount GetEscrowBalance() const;
    std::vector<uint64_t> GetPlayerMatches(const CAccountID& account) const;
    CAmount GetFeePool() const;
    CPlayerStats GetStats(const CAccountID& account) const;
    const CArenaParams& GetParams() const { return params; }
};

} // namespace arena

#endif // ARENA_ARENA_MATCH_H
