// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "arena/signals.h"

#include <boost/bind/bind.hpp>

using namespace boost::placeholders;

namespace arena {

static CArenaSignals g_signals;

CArenaSignals& GetArenaSignals()
{
    return g_signals;
}

void RegisterArenaInterface(CArenaInterface* pListener) {
    g_signals.MatchCreated.connect(boost::bind(&CArenaInterface::MatchCreated, pListener, _1, _2, _3, _4));
    g_signals.MatchJoined.connect(boost::bind(&CArenaInterface::MatchJoined, pListener, _1, _2));
    g_signals.MoveCommitted.connect(boost::bind(&CArenaInterface::MoveCommitted, pListener, _1, _2));
    g_signals.MoveRevealed.connect(boost::bind(&CArenaInterface::MoveRevealed, pListener, _1, _2));
    g_signals.MatchResolved.connect(boost::bind(&CArenaInterface::MatchResolved, pListener, _1, _2, _3));
    g_signals.MatchCancelled.connect(boost::bind(&CArenaInterface::MatchCancelled, pListener, _1));
    g_signals.TournamentCreated.connect(boost::bind(&CArenaInterface::TournamentCreated, pListener, _1, _2, _3));
    g_signals.PlayerRegistered.connect(boost::bind(&CArenaInterface::PlayerRegistered, pListener, _1, _2));
    g_signals.RoundStarted.connect(boost::bind(&CArenaInterface::RoundStarted, pListener, _1, _2, _3));
    g_signals.BracketMatchResolved.connect(boost::bind(&CArenaInterface::BracketMatchResolved, pListener, _1, _2, _3, _4));
    g_signals.TournamentCompleted.connect(boost::bind(&CArenaInterface::TournamentCompleted, pListener, _1, _2, _3));
    g_signals.TournamentCancelled.connect(boost::bind(&CArenaInterface::TournamentCancelled, pListener, _1));
    g_signals.TransferFailed.connect(boost::bind(&CArenaInterface::TransferFailed, pListener, _1, _2));
}

void UnregisterArenaInterface(CArenaInterface* pListener) {
    g_signals.TransferFailed.disconnect(boost::bind(&CArenaInterface::TransferFailed, pListener, _1, _2));
    g_signals.TournamentCancelled.disconnect(boost::bind(&CArenaInterface::TournamentCancelled, pListener, _1));
    g_signals.TournamentCompleted.disconnect(boost::bind(&CArenaInterface::TournamentCompleted, pListener, _1, _2, _3));
    g_signals.BracketMatchResolved.disconnect(boost::bind(&CArenaInterface::BracketMatchResolved, pListener, _1, _2, _3, _4));
    g_signals.RoundStarted.disconnect(boost::bind(&CArenaInterface::RoundStarted, pListener, _1, _2, _3));
    g_signals.PlayerRegistered.disconnect(boost::bind(&CArenaInterface::PlayerRegistered, pListener, _1, _2));
    g_signals.TournamentCreated.disconnect(boost::bind(&CArenaInterface::TournamentCreated, pListener, _1, _2, _3));
    g_signals.MatchCancelled.disconnect(boost::bind(&CArenaInterface::MatchCancelled, pListener, _1));
    g_signals.MatchResolved.disconnect(boost::bind(&CArenaInterface::MatchResolved, pListener, _1, _2, _3));
    g_signals.MoveRevealed.disconnect(boost::bind(&CArenaInterface::MoveRevealed, pListener, _1, _2));
    g_signals.MoveCommitted.disconnect(boost::bind(&CArenaInterface::MoveCommitted, pListener, _1, _2));
    g_signals.MatchJoined.disconnect(boost::bind(&CArenaInterface::MatchJoined, pListener, _1, _2));
    g_signals.MatchCreated.disconnect(boost::bind(&CArenaInterface::MatchCreated, pListener, _1, _2, _3, _4));
}

void UnregisterAllArenaInterfaces() {
    g_signals.TransferFailed.disconnect_all_slots();
    g_signals.TournamentCancelled.disconnect_all_slots();
    g_signals.TournamentCompleted.disconnect_all_slots();
    g_signals.BracketMatchResolved.disconnect_all_slots();
    g_signals.RoundStarted.disconnect_all_slots();
    g_signals.PlayerRegistered.disconnect_all_slots();
    g_signals.TournamentCreated.disconnect_all_slots();
    g_signals.MatchCancelled.disconnect_all_slots();
    g_signals.MatchResolved.disconnect_all_slots();
    g_signals.MoveRevealed.disconnect_all_slots();
    g_signals.MoveCommitted.disconnect_all_slots();
    g_signals.MatchJoined.disconnect_all_slots();
    g_signals.MatchCreated.disconnect_all_slots();
}

} // namespace arena
