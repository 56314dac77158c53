// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ARENA_ARENA_SIGNALS_H
#define ARENA_ARENA_SIGNALS_H

#include "amount.h"
#include "arena/ledger.h"

#include <boost/signals2/signal.hpp>

#include <stdint.h>
#include <string>

namespace arena {

class CArenaInterface;

// These functions dispatch to one or all registered listeners

/** Register a listener to receive engine events */
void RegisterArenaInterface(CArenaInterface* pListener);
/** Unregister a listener */
void UnregisterArenaInterface(CArenaInterface* pListener);
/** Unregister all listeners */
void UnregisterAllArenaInterfaces();

/**
 * Receives notifications after an engine has committed a state change.
 * Rejected calls never notify.
 */
class CArenaInterface {
protected:
    virtual void MatchCreated(uint64_t nMatchId, const CAccountID& creator, const std::string& gameType, CAmount nWager) {}
    virtual void MatchJoined(uint64_t nMatchId, const CAccountID& joiner) {}
    virtual void MoveCommitted(uint64_t nMatchId, const CAccountID& player) {}
    virtual void MoveRevealed(uint64_t nMatchId, const CAccountID& player) {}
    virtual void MatchResolved(uint64_t nMatchId, const CAccountID& winner, CAmount nPayout) {}
    virtual void MatchCancelled(uint64_t nMatchId) {}
    virtual void TournamentCreated(uint64_t nTournamentId, const std::string& name, unsigned int nCapacity) {}
    virtual void PlayerRegistered(uint64_t nTournamentId, const CAccountID& player) {}
    virtual void RoundStarted(uint64_t nTournamentId, unsigned int nRound, unsigned int nMatches) {}
    virtual void BracketMatchResolved(uint64_t nTournamentId, unsigned int nRound, unsigned int nIndex, const CAccountID& winner) {}
    virtual void TournamentCompleted(uint64_t nTournamentId, const CAccountID& winner, CAmount nPrize) {}
    virtual void TournamentCancelled(uint64_t nTournamentId) {}
    /** A payout or refund could not be delivered; an operator must intervene. */
    virtual void TransferFailed(const std::string& context, CAmount nAmount) {}
    friend void RegisterArenaInterface(CArenaInterface*);
    friend void UnregisterArenaInterface(CArenaInterface*);
    friend void UnregisterAllArenaInterfaces();
public:
    virtual ~CArenaInterface() {}
};

struct CArenaSignals {
    boost::signals2::signal<void (uint64_t, const CAccountID&, const std::string&, CAmount)> MatchCreated;
    boost::signals2::signal<void (uint64_t, const CAccountID&)> MatchJoined;
    boost::signals2::signal<void (uint64_t, const CAccountID&)> MoveCommitted;
    boost::signals2::signal<void (uint64_t, const CAccountID&)> MoveRevealed;
    boost::signals2::signal<void (uint64_t, const CAccountID&, CAmount)> MatchResolved;
    boost::signals2::signal<void (uint64_t)> MatchCancelled;
    boost::signals2::signal<void (uint64_t, const std::string&, unsigned int)> TournamentCreated;
    boost::signals2::signal<void (uint64_t, const CAccountID&)> PlayerRegistered;
    /** Notifies listeners that round N of a tournament has been paired */
    boost::signals2::signal<void (uint64_t, unsigned int, unsigned int)> RoundStarted;
    boost::signals2::signal<void (uint64_t, unsigned int, unsigned int, const CAccountID&)> BracketMatchResolved;
    boost::signals2::signal<void (uint64_t, const CAccountID&, CAmount)> TournamentCompleted;
    boost::signals2::signal<void (uint64_t)> TournamentCancelled;
    boost::signals2::signal<void (const std::string&, CAmount)> TransferFailed;
};

CArenaSignals& GetArenaSignals();

} // namespace arena

#endif // ARENA_ARENA_SIGNALS_H
