// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "arena/tournament.h"

#include "arena/signals.h"
#include "logging.h"

#include <algorithm>

namespace arena {

std::string TournamentStateName(TournamentState state)
{
    switch (state) {
    case TournamentState::REGISTRATION:
        return "registration";
    case TournamentState::ACTIVE:
        return "active";
    case TournamentState::COMPLETED:
        return "completed";
    case TournamentState::CANCELLED:
        return "cancelled";
    }
    return "unknown";
}

bool CTournament::IsRegistered(const CAccountID& account) const
{
    return std::find(vPlayers.begin(), vPlayers.end(), account) != vPlayers.end();
}

unsigned int CTournament::GetRoundCount() const
{
    unsigned int nRounds = 0;
    while ((1u << nRounds) < nCapacity)
        nRounds++;
    return nRounds;
}

bool CBracketMatch::IsContestant(const CAccountID& account) const
{
    if (account.IsNull())
        return false;
    return account == player1 || account == player2;
}

unsigned int BracketFlatIndex(unsigned int nCapacity, unsigned int nRound, unsigned int nIndex)
{
    return nCapacity - (nCapacity >> (nRound - 1)) + nIndex;
}

bool BracketPosition(unsigned int nCapacity, unsigned int nFlatIndex, unsigned int& nRoundOut, unsigned int& nIndexOut)
{
    for (unsigned int nRound = 1; (nCapacity >> nRound) > 0; nRound++) {
        unsigned int nStart = nCapacity - (nCapacity >> (nRound - 1));
        unsigned int nCount = nCapacity >> nRound;
        if (nFlatIndex < nStart + nCount) {
            nRoundOut = nRound;
            nIndexOut = nFlatIndex - nStart;
            return true;
        }
    }
    return false;
}

CBracketEngine::CBracketEngine(CFundsGateway& gatewayIn, const CClock& clockIn, const CArenaParams& paramsIn,
                               const CResolverSet& resolversIn, const CMatchEngine& matchesIn)
    : gateway(gatewayIn), clock(clockIn), params(paramsIn), resolvers(resolversIn), matches(matchesIn)
{
}

bool CBracketEngine::TransferFailure(const std::string& context, CAmount nAmount, CValidationState& state)
{
    LogError("bracket", "%s: transfer of %s %s failed, call rolled back\n", context, FormatMoney(nAmount), CURRENCY_UNIT);
    GetArenaSignals().TransferFailed(context, nAmount);
    return state.Error("transfer-failed");
}

void CBracketEngine::GenerateRound(CTournament& tournament, const std::vector<CAccountID>& vEntrants)
{
    unsigned int nRound = tournament.nCurrentRound + 1;
    unsigned int nMatches = vEntrants.size() / 2;
    for (unsigned int i = 0; i < nMatches; i++) {
        CBracketMatch bracketMatch;
        bracketMatch.nTournamentId = tournament.nId;
        bracketMatch.nRound = nRound;
        bracketMatch.nIndex = i;
        bracketMatch.player1 = vEntrants[2 * i];
        bracketMatch.player2 = vEntrants[2 * i + 1];
        mapBracket.emplace(BracketKey(tournament.nId, nRound, i), bracketMatch);
    }
    tournament.nCurrentRound = nRound;

    LogPrint("bracket", "tournament %d: round %d paired, %d match(es)\n", tournament.nId, nRound, nMatches);
}

CBracketMatch* CBracketEngine::LookupBracketMatch(const CTournament& tournament, unsigned int nFlatIndex)
{
    unsigned int nRound, nIndex;
    if (!BracketPosition(tournament.nCapacity, nFlatIndex, nRound, nIndex))
        return nullptr;
    if (nRound > tournament.nCurrentRound)
        return nullptr;
    auto it = mapBracket.find(BracketKey(tournament.nId, nRound, nIndex));
    if (it == mapBracket.end())
        return nullptr;
    return &it->second;
}

bool CBracketEngine::ApplyResult(CTournament& tournament, CBracketMatch& bracketMatch, const CAccountID& winner, CValidationState& state)
{
    // Collect the round's winners as if this match were already decided.
    std::vector<CAccountID> vWinners;
    bool fRoundComplete = true;
    for (auto it = mapBracket.lower_bound(BracketKey(tournament.nId, bracketMatch.nRound, 0));
         it != mapBracket.end() && std::get<0>(it->first) == tournament.nId && std::get<1>(it->first) == bracketMatch.nRound;
         ++it) {
        const CBracketMatch& other = it->second;
        if (&other == &bracketMatch) {
            vWinners.push_back(winner);
        } else if (other.fCompleted) {
            vWinners.push_back(other.winner);
        } else {
            fRoundComplete = false;
        }
    }
    bool fFinal = fRoundComplete && vWinners.size() == 1;

    CAmount nFee = 0;
    CAmount nPrize = 0;
    if (fFinal) {
        nFee = params.PlatformFee().GetFee(tournament.nPrizePool);
        nPrize = tournament.nPrizePool - nFee;
        if (!gateway.Send({CPayout(winner, nPrize)})) {
            return TransferFailure(strprintf("tournament %d prize to %s", tournament.nId, winner.ToString()), nPrize, state);
        }
    }

    bracketMatch.winner = winner;
    bracketMatch.fCompleted = true;
    LogPrint("bracket", "tournament %d: round %d match %d won by %s\n",
        tournament.nId, bracketMatch.nRound, bracketMatch.nIndex, winner.ToString());

    if (fFinal) {
        tournament.state = TournamentState::COMPLETED;
        tournament.winner = winner;
        tournament.nPrizePaid = nPrize;
        tournament.nCompletedAt = clock.GetTime();
        nFeePool += nFee;
        nPrizePoolTotal -= tournament.nPrizePool;
        LogPrint("bracket", "tournament %d completed: %s wins %s, fee %s\n",
            tournament.nId, winner.ToString(), FormatMoney(nPrize), FormatMoney(nFee));
    } else if (fRoundComplete) {
        GenerateRound(tournament, vWinners);
    }

    // Listeners only ever see the committed result.
    const uint64_t nTournamentId = tournament.nId;
    const unsigned int nRound = bracketMatch.nRound;
    GetArenaSignals().BracketMatchResolved(nTournamentId, nRound, bracketMatch.nIndex, winner);
    if (fFinal)
        GetArenaSignals().TournamentCompleted(nTournamentId, winner, nPrize);
    else if (fRoundComplete)
        GetArenaSignals().RoundStarted(nTournamentId, nRound + 1, vWinners.size() / 2);
    return true;
}

bool CBracketEngine::CreateTournament(const CAccountID& caller, const std::string& strName, const std::string& gameType,
                                      CAmount nEntryFee, unsigned int nCapacity,
                                      CValidationState& state, uint64_t& nTournamentIdOut)
{
    LOCK(cs_arena);

    if (strName.empty() || strName.size() > MAX_TOURNAMENT_NAME_SIZE)
        return state.Invalid(false, REJECT_INVALID, "invalid-name");
    if (nEntryFee <= 0 || !MoneyRange(nEntryFee))
        return state.Invalid(false, REJECT_INVALID, "invalid-entry-fee");
    if (!params.IsValidTournamentCapacity(nCapacity))
        return state.Invalid(false, REJECT_INVALID, "invalid-capacity");
    // The prize pool is paid or refunded in one transfer, which must be a valid amount.
    if (nEntryFee > MAX_MONEY / nCapacity)
        return state.Invalid(false, REJECT_INVALID, "invalid-entry-fee");

    CTournament tournament;
    tournament.nId = tournamentIds.Next();
    tournament.strName = strName;
    tournament.gameType = gameType;
    tournament.creator = caller;
    tournament.nEntryFee = nEntryFee;
    tournament.nCapacity = nCapacity;
    tournament.nCreatedAt = clock.GetTime();
    mapTournaments.emplace(tournament.nId, tournament);
    nTournamentIdOut = tournament.nId;

    LogPrint("bracket", "tournament %d created by %s: '%s', %d players, entry %s\n",
        tournament.nId, caller.ToString(), strName, nCapacity, FormatMoney(nEntryFee));
    GetArenaSignals().TournamentCreated(tournament.nId, strName, nCapacity);
    return true;
}

bool CBracketEngine::Register(const CAccountID& caller, uint64_t nTournamentId, CAmount nValue, CValidationState& state)
{
    LOCK(cs_arena);

    auto it = mapTournaments.find(nTournamentId);
    if (it == mapTournaments.end())
        return state.Invalid(false, REJECT_NOT_FOUND, "tournament-not-found");
    CTournament& tournament = it->second;

    if (tournament.state != TournamentState::REGISTRATION)
        return state.Invalid(false, REJECT_STATE, "registration-closed");
    if (tournament.vPlayers.size() >= tournament.nCapacity)
        return state.Invalid(false, REJECT_STATE, "tournament-full");
    if (tournament.IsRegistered(caller))
        return state.Invalid(false, REJECT_DUPLICATE, "already-registered");
    if (nValue != tournament.nEntryFee)
        return state.Invalid(false, REJECT_INVALID, "entry-fee-mismatch");
    if (!gateway.Collect(caller, nValue))
        return state.Invalid(false, REJECT_INVALID, "deposit-failed");

    tournament.vPlayers.push_back(caller);
    tournament.nPrizePool += nValue;
    nPrizePoolTotal += nValue;

    LogPrint("bracket", "tournament %d: %s registered (%d/%d)\n",
        nTournamentId, caller.ToString(), tournament.vPlayers.size(), tournament.nCapacity);

    bool fStarted = tournament.vPlayers.size() == tournament.nCapacity;
    if (fStarted) {
        tournament.state = TournamentState::ACTIVE;
        GenerateRound(tournament, tournament.vPlayers);
    }

    GetArenaSignals().PlayerRegistered(nTournamentId, caller);
    if (fStarted)
        GetArenaSignals().RoundStarted(nTournamentId, 1, tournament.nCapacity / 2);
    return true;
}

bool CBracketEngine::ResolveMatch(const CAccountID& caller, uint64_t nTournamentId, unsigned int nFlatIndex,
                                  const CAccountID& winner, CValidationState& state)
{
    LOCK(cs_arena);

    if (!resolvers.IsResolver(caller))
        return state.Invalid(false, REJECT_UNAUTHORIZED, "not-resolver");

    auto it = mapTournaments.find(nTournamentId);
    if (it == mapTournaments.end())
        return state.Invalid(false, REJECT_NOT_FOUND, "tournament-not-found");
    CTournament& tournament = it->second;

    if (tournament.state != TournamentState::ACTIVE)
        return state.Invalid(false, REJECT_STATE, "tournament-not-active");

    CBracketMatch* pBracketMatch = LookupBracketMatch(tournament, nFlatIndex);
    if (pBracketMatch == nullptr)
        return state.Invalid(false, REJECT_NOT_FOUND, "bracket-match-not-found");
    if (pBracketMatch->fCompleted)
        return state.Invalid(false, REJECT_STATE, "bracket-match-completed");
    if (!pBracketMatch->IsContestant(winner))
        return state.Invalid(false, REJECT_INVALID, "winner-not-a-contestant");

    return ApplyResult(tournament, *pBracketMatch, winner, state);
}

bool CBracketEngine::CancelTournament(const CAccountID& caller, uint64_t nTournamentId, CValidationState& state)
{
    LOCK(cs_arena);

    if (!resolvers.IsResolver(caller))
        return state.Invalid(false, REJECT_UNAUTHORIZED, "not-resolver");

    auto it = mapTournaments.find(nTournamentId);
    if (it == mapTournaments.end())
        return state.Invalid(false, REJECT_NOT_FOUND, "tournament-not-found");
    CTournament& tournament = it->second;

    if (tournament.state != TournamentState::REGISTRATION && tournament.state != TournamentState::ACTIVE)
        return state.Invalid(false, REJECT_STATE, "tournament-not-cancellable");

    std::vector<CPayout> vRefunds;
    for (const CAccountID& player : tournament.vPlayers)
        vRefunds.push_back(CPayout(player, tournament.nEntryFee));

    if (!vRefunds.empty() && !gateway.Send(vRefunds)) {
        return TransferFailure(strprintf("tournament %d refund", nTournamentId), tournament.nPrizePool, state);
    }

    nPrizePoolTotal -= tournament.nPrizePool;
    tournament.nPrizePool = 0;
    tournament.state = TournamentState::CANCELLED;
    tournament.nCompletedAt = clock.GetTime();

    LogPrint("bracket", "tournament %d cancelled by %s, %d registrant(s) refunded\n",
        nTournamentId, caller.ToString(), vRefunds.size());
    GetArenaSignals().TournamentCancelled(nTournamentId);
    return true;
}

bool CBracketEngine::AttachContest(const CAccountID& caller, uint64_t nTournamentId, unsigned int nFlatIndex,
                                   uint64_t nMatchId, CValidationState& state)
{
    LOCK(cs_arena);

    if (!resolvers.IsResolver(caller))
        return state.Invalid(false, REJECT_UNAUTHORIZED, "not-resolver");

    auto it = mapTournaments.find(nTournamentId);
    if (it == mapTournaments.end())
        return state.Invalid(false, REJECT_NOT_FOUND, "tournament-not-found");
    CTournament& tournament = it->second;

    if (tournament.state != TournamentState::ACTIVE)
        return state.Invalid(false, REJECT_STATE, "tournament-not-active");

    CBracketMatch* pBracketMatch = LookupBracketMatch(tournament, nFlatIndex);
    if (pBracketMatch == nullptr)
        return state.Invalid(false, REJECT_NOT_FOUND, "bracket-match-not-found");
    if (pBracketMatch->fCompleted)
        return state.Invalid(false, REJECT_STATE, "bracket-match-completed");
    if (pBracketMatch->contestId.has_value() || setAttachedContests.count(nMatchId))
        return state.Invalid(false, REJECT_DUPLICATE, "contest-already-attached");

    std::optional<CMatch> contest = matches.GetMatch(nMatchId);
    if (!contest.has_value())
        return state.Invalid(false, REJECT_NOT_FOUND, "match-not-found");
    if (contest->joiner.IsNull())
        return state.Invalid(false, REJECT_STATE, "contest-not-joined");
    if (!pBracketMatch->IsContestant(contest->creator) || !pBracketMatch->IsContestant(contest->joiner) ||
        contest->creator == contest->joiner)
        return state.Invalid(false, REJECT_INVALID, "contest-mismatch");

    pBracketMatch->contestId = nMatchId;
    setAttachedContests.insert(nMatchId);
    LogPrint("bracket", "tournament %d: round %d match %d decided by match %d\n",
        nTournamentId, pBracketMatch->nRound, pBracketMatch->nIndex, nMatchId);
    return true;
}

bool CBracketEngine::SettleFromContest(const CAccountID& caller, uint64_t nTournamentId, unsigned int nFlatIndex,
                                       CValidationState& state)
{
    LOCK(cs_arena);

    auto it = mapTournaments.find(nTournamentId);
    if (it == mapTournaments.end())
        return state.Invalid(false, REJECT_NOT_FOUND, "tournament-not-found");
    CTournament& tournament = it->second;

    if (tournament.state != TournamentState::ACTIVE)
        return state.Invalid(false, REJECT_STATE, "tournament-not-active");

    CBracketMatch* pBracketMatch = LookupBracketMatch(tournament, nFlatIndex);
    if (pBracketMatch == nullptr)
        return state.Invalid(false, REJECT_NOT_FOUND, "bracket-match-not-found");
    if (pBracketMatch->fCompleted)
        return state.Invalid(false, REJECT_STATE, "bracket-match-completed");
    if (!pBracketMatch->contestId.has_value())
        return state.Invalid(false, REJECT_STATE, "contest-not-attached");

    std::optional<CMatch> contest = matches.GetMatch(*pBracketMatch->contestId);
    if (!contest.has_value() || contest->state != MatchState::RESOLVED)
        return state.Invalid(false, REJECT_STATE, "contest-unresolved");

    LogPrint("bracket", "tournament %d: settling from match %d on behalf of %s\n",
        nTournamentId, contest->nId, caller.ToString());
    return ApplyResult(tournament, *pBracketMatch, contest->winner, state);
}

bool CBracketEngine::WithdrawFees(const CAccountID& caller, const CAccountID& to, CValidationState& state)
{
    LOCK(cs_arena);

    if (!resolvers.IsResolver(caller))
        return state.Invalid(false, REJECT_UNAUTHORIZED, "not-resolver");
    if (nFeePool == 0)
        return state.Invalid(false, REJECT_STATE, "no-fees");
    // One transfer carries at most MAX_MONEY; the remainder stays pooled.
    CAmount nAmount = std::min(nFeePool, MAX_MONEY);
    if (!gateway.Send({CPayout(to, nAmount)}))
        return TransferFailure(strprintf("tournament fee withdrawal to %s", to.ToString()), nAmount, state);

    nFeePool -= nAmount;
    LogPrint("escrow", "bracket engine: %s withdrew %s in fees to %s, %s left\n",
        caller.ToString(), FormatMoney(nAmount), to.ToString(), FormatMoney(nFeePool));
    return true;
}

std::optional<CTournament> CBracketEngine::GetTournament(uint64_t nTournamentId) const
{
    LOCK(cs_arena);
    auto it = mapTournaments.find(nTournamentId);
    if (it == mapTournaments.end())
        return std::nullopt;
    return it->second;
}

uint64_t CBracketEngine::GetTournamentCount() const
{
    LOCK(cs_arena);
    return tournamentIds.Peek();
}

std::vector<CBracketMatch> CBracketEngine::GetTournamentMatches(uint64_t nTournamentId) const
{
    LOCK(cs_arena);
    std::vector<CBracketMatch> vMatches;
    for (auto it = mapBracket.lower_bound(BracketKey(nTournamentId, 0, 0));
         it != mapBracket.end() && std::get<0>(it->first) == nTournamentId; ++it) {
        vMatches.push_back(it->second);
    }
    return vMatches;
}

std::vector<CBracketMatch> CBracketEngine::GetRoundMatches(uint64_t nTournamentId, unsigned int nRound) const
{
    LOCK(cs_arena);
    std::vector<CBracketMatch> vMatches;
    for (auto it = mapBracket.lower_bound(BracketKey(nTournamentId, nRound, 0));
         it != mapBracket.end() && std::get<0>(it->first) == nTournamentId && std::get<1>(it->first) == nRound;
         ++it) {
        vMatches.push_back(it->second);
    }
    return vMatches;
}

std::optional<CBracketMatch> CBracketEngine::GetBracketMatch(uint64_t nTournamentId, unsigned int nRound, unsigned int nIndex) const
{
    LOCK(cs_arena);
    auto it = mapBracket.find(BracketKey(nTournamentId, nRound, nIndex));
    if (it == mapBracket.end())
        return std::nullopt;
    return it->second;
}

CAmount CBracketEngine::GetPrizePoolTotal() const
{
    LOCK(cs_arena);
    return nPrizePoolTotal;
}

CAmount CBracketEngine::GetFeePool() const
{
    LOCK(cs_arena);
    return nFeePool;
}

} // namespace arena
