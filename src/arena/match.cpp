// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "arena/match.h"

#include "arena/signals.h"
#include "hash.h"
#include "logging.h"

#include <algorithm>

namespace arena {

std::string MatchStateName(MatchState state)
{
    switch (state) {
    case MatchState::CREATED:
        return "created";
    case MatchState::COMMIT_PHASE:
        return "commit_phase";
    case MatchState::REVEAL_PHASE:
        return "reveal_phase";
    case MatchState::RESOLVED:
        return "resolved";
    case MatchState::CANCELLED:
        return "cancelled";
    }
    return "unknown";
}

std::string TimeoutOutcomeName(TimeoutOutcome outcome)
{
    switch (outcome) {
    case TimeoutOutcome::FORFEIT_TO_CREATOR:
        return "forfeit_to_creator";
    case TimeoutOutcome::FORFEIT_TO_JOINER:
        return "forfeit_to_joiner";
    case TimeoutOutcome::REFUNDED:
        return "refunded";
    }
    return "unknown";
}

bool CMatch::IsPlayer(const CAccountID& account) const
{
    if (account.IsNull())
        return false;
    return account == creator || account == joiner;
}

CAmount CMatch::GetEscrow() const
{
    switch (state) {
    case MatchState::CREATED:
        return nWager;
    case MatchState::COMMIT_PHASE:
    case MatchState::REVEAL_PHASE:
        return 2 * nWager;
    default:
        return 0;
    }
}

int64_t CMatch::GetDeadline(const CArenaParams& params) const
{
    switch (state) {
    case MatchState::CREATED:
        return nCreatedAt + params.CommitTimeout();
    case MatchState::COMMIT_PHASE:
        return nPhaseStart + params.CommitTimeout();
    case MatchState::REVEAL_PHASE:
        return nPhaseStart + params.RevealTimeout();
    default:
        return 0;
    }
}

CMatchEngine::CMatchEngine(CFundsGateway& gatewayIn, const CClock& clockIn,
                           const CArenaParams& paramsIn, const CResolverSet& resolversIn)
    : gateway(gatewayIn), clock(clockIn), params(paramsIn), resolvers(resolversIn)
{
}

void CMatchEngine::RegisterComparator(const std::string& gameType, std::shared_ptr<const CMoveComparator> comparator)
{
    LOCK(cs_arena);
    comparators.Register(gameType, comparator);
}

bool CMatchEngine::TransferFailure(const std::string& context, CAmount nAmount, CValidationState& state)
{
    LogError("arena", "%s: transfer of %s %s failed, call rolled back\n", context, FormatMoney(nAmount), CURRENCY_UNIT);
    GetArenaSignals().TransferFailed(context, nAmount);
    return state.Error("transfer-failed");
}

bool CMatchEngine::SettleWinner(CMatch& match, const CAccountID& winner, CValidationState& state)
{
    CAmount nPot = 2 * match.nWager;
    CAmount nFee = params.PlatformFee().GetFee(nPot);
    CAmount nPayout = nPot - nFee;

    if (!gateway.Send({CPayout(winner, nPayout)})) {
        return TransferFailure(strprintf("match %d payout to %s", match.nId, winner.ToString()), nPayout, state);
    }

    match.state = MatchState::RESOLVED;
    match.winner = winner;
    match.nResolvedAt = clock.GetTime();
    match.nPayout = nPayout;

    const CAccountID& loser = (winner == match.creator) ? match.joiner : match.creator;
    stats.RecordResult(winner, loser, match.nWager, nPayout);
    nFeePool += nFee;
    nEscrowBalance -= nPot;

    LogPrint("arena", "match %d resolved: winner %s, payout %s, fee %s\n",
        match.nId, winner.ToString(), FormatMoney(nPayout), FormatMoney(nFee));
    return true;
}

bool CMatchEngine::RefundAndCancel(CMatch& match, const std::vector<CPayout>& vRefunds, CValidationState& state)
{
    CAmount nTotal = 0;
    for (const CPayout& refund : vRefunds)
        nTotal += refund.nAmount;

    if (!gateway.Send(vRefunds)) {
        return TransferFailure(strprintf("match %d refund", match.nId), nTotal, state);
    }

    match.state = MatchState::CANCELLED;
    match.nResolvedAt = clock.GetTime();
    nEscrowBalance -= nTotal;

    LogPrint("arena", "match %d cancelled, refunded %s to %u account(s)\n", match.nId, FormatMoney(nTotal), vRefunds.size());
    return true;
}

void CMatchEngine::NotifyResolved(const CMatch& match)
{
    GetArenaSignals().MatchResolved(match.nId, match.winner, match.nPayout);
}

bool CMatchEngine::CreateMatch(const CAccountID& caller, const std::string& gameType, CAmount nValue,
                               CValidationState& state, uint64_t& nMatchIdOut)
{
    LOCK(cs_arena);

    if (nValue < params.MinWager())
        return state.Invalid(false, REJECT_INVALID, "wager-too-low");
    if (nValue > params.MaxWager())
        return state.Invalid(false, REJECT_INVALID, "wager-too-high");
    if (!gateway.Collect(caller, nValue))
        return state.Invalid(false, REJECT_INVALID, "deposit-failed");

    CMatch match;
    match.nId = matchIds.Next();
    match.gameType = gameType;
    match.creator = caller;
    match.nWager = nValue;
    match.state = MatchState::CREATED;
    match.nCreatedAt = clock.GetTime();
    match.nPhaseStart = match.nCreatedAt;

    mapMatches.emplace(match.nId, match);
    mapPlayerMatches[caller].push_back(match.nId);
    nEscrowBalance += nValue;
    nMatchIdOut = match.nId;

    LogPrint("arena", "match %d created by %s: game %s, wager %s\n",
        match.nId, caller.ToString(), gameType, FormatMoney(nValue));
    GetArenaSignals().MatchCreated(match.nId, caller, gameType, nValue);
    return true;
}

bool CMatchEngine::JoinMatch(const CAccountID& caller, uint64_t nMatchId, CAmount nValue, CValidationState& state)
{
    LOCK(cs_arena);

    auto it = mapMatches.find(nMatchId);
    if (it == mapMatches.end())
        return state.Invalid(false, REJECT_NOT_FOUND, "match-not-found");
    CMatch& match = it->second;

    if (match.state != MatchState::CREATED)
        return state.Invalid(false, REJECT_STATE, "match-not-open");
    if (caller == match.creator)
        return state.Invalid(false, REJECT_UNAUTHORIZED, "cannot-join-own-match");
    if (nValue != match.nWager)
        return state.Invalid(false, REJECT_INVALID, "wager-mismatch");
    if (!gateway.Collect(caller, nValue))
        return state.Invalid(false, REJECT_INVALID, "deposit-failed");

    int64_t nNow = clock.GetTime();
    match.joiner = caller;
    match.state = MatchState::COMMIT_PHASE;
    match.nJoinedAt = nNow;
    match.nPhaseStart = nNow;
    mapPlayerMatches[caller].push_back(nMatchId);
    nEscrowBalance += nValue;

    LogPrint("arena", "match %d joined by %s, commit phase open\n", nMatchId, caller.ToString());
    GetArenaSignals().MatchJoined(nMatchId, caller);
    return true;
}

bool CMatchEngine::CommitMove(const CAccountID& caller, uint64_t nMatchId, const uint256& commitment, CValidationState& state)
{
    LOCK(cs_arena);

    auto it = mapMatches.find(nMatchId);
    if (it == mapMatches.end())
        return state.Invalid(false, REJECT_NOT_FOUND, "match-not-found");
    CMatch& match = it->second;

    if (match.state != MatchState::COMMIT_PHASE)
        return state.Invalid(false, REJECT_STATE, "match-not-in-commit-phase");
    if (!match.IsPlayer(caller))
        return state.Invalid(false, REJECT_UNAUTHORIZED, "not-a-player");
    if (commitment.IsNull())
        return state.Invalid(false, REJECT_INVALID, "empty-commitment");

    uint256& slot = (caller == match.creator) ? match.creatorCommitment : match.joinerCommitment;
    if (!slot.IsNull())
        return state.Invalid(false, REJECT_DUPLICATE, "already-committed");

    slot = commitment;
    LogPrint("arena", "match %d: %s committed\n", nMatchId, caller.ToString());

    if (!match.creatorCommitment.IsNull() && !match.joinerCommitment.IsNull()) {
        match.state = MatchState::REVEAL_PHASE;
        match.nPhaseStart = clock.GetTime();
        LogPrint("arena", "match %d: both commitments in, reveal phase open\n", nMatchId);
    }

    GetArenaSignals().MoveCommitted(nMatchId, caller);
    return true;
}

bool CMatchEngine::RevealMove(const CAccountID& caller, uint64_t nMatchId,
                              const std::vector<unsigned char>& vchMove, const uint256& salt,
                              CValidationState& state)
{
    LOCK(cs_arena);

    auto it = mapMatches.find(nMatchId);
    if (it == mapMatches.end())
        return state.Invalid(false, REJECT_NOT_FOUND, "match-not-found");
    CMatch& match = it->second;

    if (match.state != MatchState::REVEAL_PHASE)
        return state.Invalid(false, REJECT_STATE, "match-not-in-reveal-phase");
    if (!match.IsPlayer(caller))
        return state.Invalid(false, REJECT_UNAUTHORIZED, "not-a-player");

    bool fCreator = (caller == match.creator);
    if ((fCreator ? match.creatorMove : match.joinerMove).has_value())
        return state.Invalid(false, REJECT_DUPLICATE, "already-revealed");

    const uint256& commitment = fCreator ? match.creatorCommitment : match.joinerCommitment;
    if (CommitmentHash(vchMove, salt) != commitment)
        return state.Invalid(false, REJECT_INVALID, "commitment-mismatch");

    // Work on a copy so a refused payout leaves the reveal unrecorded.
    CMatch updated = match;
    (fCreator ? updated.creatorMove : updated.joinerMove) = vchMove;

    if (updated.creatorMove && updated.joinerMove) {
        const CMoveComparator& comparator = comparators.Get(updated.gameType);
        int nCmp = comparator.Compare(*updated.creatorMove, *updated.joinerMove);
        const CAccountID& winner = (nCmp >= 0) ? updated.creator : updated.joiner;
        LogPrint("arena", "match %d: both moves revealed, %s comparison favours %s\n",
            nMatchId, comparator.GetName(), winner.ToString());
        if (!SettleWinner(updated, winner, state))
            return false;
    }

    match = updated;
    GetArenaSignals().MoveRevealed(nMatchId, caller);
    if (match.state == MatchState::RESOLVED)
        NotifyResolved(match);
    return true;
}

bool CMatchEngine::ResolveByResolver(const CAccountID& caller, uint64_t nMatchId, const CAccountID& winner, CValidationState& state)
{
    LOCK(cs_arena);

    if (!resolvers.IsResolver(caller))
        return state.Invalid(false, REJECT_UNAUTHORIZED, "not-resolver");

    auto it = mapMatches.find(nMatchId);
    if (it == mapMatches.end())
        return state.Invalid(false, REJECT_NOT_FOUND, "match-not-found");
    CMatch& match = it->second;

    if (match.state != MatchState::COMMIT_PHASE && match.state != MatchState::REVEAL_PHASE)
        return state.Invalid(false, REJECT_STATE, "match-not-resolvable");
    if (!match.IsPlayer(winner))
        return state.Invalid(false, REJECT_INVALID, "winner-not-a-player");

    CMatch updated = match;
    if (!SettleWinner(updated, winner, state))
        return false;

    match = updated;
    LogPrint("arena", "match %d resolved by resolver %s\n", nMatchId, caller.ToString());
    NotifyResolved(match);
    return true;
}

bool CMatchEngine::CancelMatch(const CAccountID& caller, uint64_t nMatchId, CValidationState& state)
{
    LOCK(cs_arena);

    auto it = mapMatches.find(nMatchId);
    if (it == mapMatches.end())
        return state.Invalid(false, REJECT_NOT_FOUND, "match-not-found");
    CMatch& match = it->second;

    if (caller != match.creator)
        return state.Invalid(false, REJECT_UNAUTHORIZED, "not-match-creator");
    if (match.state != MatchState::CREATED)
        return state.Invalid(false, REJECT_STATE, "match-already-joined");

    CMatch updated = match;
    if (!RefundAndCancel(updated, {CPayout(match.creator, match.nWager)}, state))
        return false;

    match = updated;
    GetArenaSignals().MatchCancelled(nMatchId);
    return true;
}

bool CMatchEngine::ClaimTimeout(const CAccountID& caller, uint64_t nMatchId, TimeoutOutcome& outcome, CValidationState& state)
{
    LOCK(cs_arena);

    auto it = mapMatches.find(nMatchId);
    if (it == mapMatches.end())
        return state.Invalid(false, REJECT_NOT_FOUND, "match-not-found");
    CMatch& match = it->second;

    if (match.IsTerminal())
        return state.Invalid(false, REJECT_STATE, "match-not-active");
    if (!match.IsPlayer(caller))
        return state.Invalid(false, REJECT_UNAUTHORIZED, "not-a-player");
    if (clock.GetTime() < match.GetDeadline(params))
        return state.Invalid(false, REJECT_TOO_EARLY, "timeout-not-reached");

    bool fCreatorActed = false;
    bool fJoinerActed = false;
    if (match.state == MatchState::COMMIT_PHASE) {
        fCreatorActed = !match.creatorCommitment.IsNull();
        fJoinerActed = !match.joinerCommitment.IsNull();
    } else if (match.state == MatchState::REVEAL_PHASE) {
        fCreatorActed = match.creatorMove.has_value();
        fJoinerActed = match.joinerMove.has_value();
    }

    CMatch updated = match;
    if (match.state == MatchState::CREATED) {
        if (!RefundAndCancel(updated, {CPayout(match.creator, match.nWager)}, state))
            return false;
        outcome = TimeoutOutcome::REFUNDED;
    } else if (fCreatorActed && !fJoinerActed) {
        if (!SettleWinner(updated, match.creator, state))
            return false;
        outcome = TimeoutOutcome::FORFEIT_TO_CREATOR;
    } else if (fJoinerActed && !fCreatorActed) {
        if (!SettleWinner(updated, match.joiner, state))
            return false;
        outcome = TimeoutOutcome::FORFEIT_TO_JOINER;
    } else if (!fCreatorActed && !fJoinerActed) {
        std::vector<CPayout> vRefunds{CPayout(match.creator, match.nWager), CPayout(match.joiner, match.nWager)};
        if (!RefundAndCancel(updated, vRefunds, state))
            return false;
        outcome = TimeoutOutcome::REFUNDED;
    } else {
        // Both sides acted in this phase, so the phase would already have advanced.
        return state.Invalid(false, REJECT_STATE, "match-not-active");
    }

    match = updated;
    LogPrint("arena", "match %d: timeout claimed by %s, outcome %s\n",
        nMatchId, caller.ToString(), TimeoutOutcomeName(outcome));
    if (match.state == MatchState::RESOLVED)
        NotifyResolved(match);
    else
        GetArenaSignals().MatchCancelled(nMatchId);
    return true;
}

bool CMatchEngine::WithdrawFees(const CAccountID& caller, const CAccountID& to, CValidationState& state)
{
    LOCK(cs_arena);

    if (!resolvers.IsResolver(caller))
        return state.Invalid(false, REJECT_UNAUTHORIZED, "not-resolver");
    if (nFeePool == 0)
        return state.Invalid(false, REJECT_STATE, "no-fees");
    // One transfer carries at most MAX_MONEY; the remainder stays pooled.
    CAmount nAmount = std::min(nFeePool, MAX_MONEY);
    if (!gateway.Send({CPayout(to, nAmount)}))
        return TransferFailure(strprintf("match fee withdrawal to %s", to.ToString()), nAmount, state);

    nFeePool -= nAmount;
    LogPrint("escrow", "match engine: %s withdrew %s in fees to %s, %s left\n",
        caller.ToString(), FormatMoney(nAmount), to.ToString(), FormatMoney(nFeePool));
    return true;
}

std::optional<CMatch> CMatchEngine::GetMatch(uint64_t nMatchId) const
{
    LOCK(cs_arena);
    auto it = mapMatches.find(nMatchId);
    if (it == mapMatches.end())
        return std::nullopt;
    return it->second;
}

uint64_t CMatchEngine::GetMatchCount() const
{
    LOCK(cs_arena);
    return matchIds.Peek();
}

CAmount CMatchEngine::GetEscrowBalance() const
{
    LOCK(cs_arena);
    return nEscrowBalance;
}

std::vector<uint64_t> CMatchEngine::GetPlayerMatches(const CAccountID& account) const
{
    LOCK(cs_arena);
    auto it = mapPlayerMatches.find(account);
    if (it == mapPlayerMatches.end())
        return std::vector<uint64_t>();
    return it->second;
}

CAmount CMatchEngine::GetFeePool() const
{
    LOCK(cs_arena);
    return nFeePool;
}

CPlayerStats CMatchEngine::GetStats(const CAccountID& account) const
{
    LOCK(cs_arena);
    return stats.GetStats(account);
}

} // namespace arena
