// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ARENA_ARENAPARAMS_H
#define ARENA_ARENAPARAMS_H

#include "amount.h"

#include <tl/expected.hpp>

#include <stdint.h>
#include <string>

/** Largest wager any network may allow, so that a joined match's pot is itself a valid amount. */
static const CAmount MAX_WAGER = MAX_MONEY / 2;
/** Longest commit or reveal phase any network may configure: one year. */
static const int64_t MAX_PHASE_TIMEOUT = 365 * 24 * 60 * 60;

/**
 * CArenaParams defines the fixed economic and timing constants of an arena
 * ledger: wager bounds, phase timeouts, the platform fee and the permitted
 * tournament sizes. There are three: the main network where real value is
 * escrowed, a public test network with shorter timeouts, and a regression test
 * mode whose values can be overridden from the command line by test tooling.
 */
class CArenaParams
{
public:
    /** Smallest wager a match may be created with, inclusive. */
    CAmount MinWager() const { return nMinWager; }
    /** Largest wager a match may be created with, inclusive. */
    CAmount MaxWager() const { return nMaxWager; }
    /** Seconds a match may sit unjoined or in the commit phase before a timeout can be claimed. */
    int64_t CommitTimeout() const { return nCommitTimeout; }
    /** Seconds the reveal phase lasts before a timeout can be claimed. */
    int64_t RevealTimeout() const { return nRevealTimeout; }
    const CFeeRate& PlatformFee() const { return platformFee; }
    unsigned int MinTournamentCapacity() const { return nMinTournamentCapacity; }
    unsigned int MaxTournamentCapacity() const { return nMaxTournamentCapacity; }
    /** Return the network string (main, test or regtest) */
    std::string NetworkIDString() const { return strNetworkID; }

    /** True for a power of two within [MinTournamentCapacity, MaxTournamentCapacity]. */
    bool IsValidTournamentCapacity(unsigned int nCapacity) const;

protected:
    CArenaParams() {}

    CAmount nMinWager = 0;
    CAmount nMaxWager = 0;
    int64_t nCommitTimeout = 0;
    int64_t nRevealTimeout = 0;
    CFeeRate platformFee;
    unsigned int nMinTournamentCapacity = 2;
    unsigned int nMaxTournamentCapacity = 16;
    std::string strNetworkID;
};

/**
 * Return the currently selected parameters. This won't change after app
 * startup, except for unit tests.
 */
const CArenaParams &Params();

/** Return parameters for the given network name. */
tl::expected<const CArenaParams*, std::string> ParamsForNetwork(const std::string& network);

/** Sets the params returned by Params() to those for the given network. */
tl::expected<void, std::string> SelectParams(const std::string& network);

/**
 * Looks for -network and the regtest overrides (-minwager, -maxwager,
 * -committimeout, -revealtimeout, -platformfeebps) and applies them.
 * Overrides are refused on any network other than regtest.
 */
tl::expected<void, std::string> SelectParamsFromArgs();

/**
 * Allows modifying the regtest constants. Values are validated together;
 * on error the regtest parameters are left untouched.
 */
tl::expected<void, std::string> UpdateRegtestParameters(
    CAmount nMinWager, CAmount nMaxWager,
    int64_t nCommitTimeout, int64_t nRevealTimeout,
    int64_t nFeeBasisPoints);

/** Restore the compiled-in regtest constants. */
void ResetRegtestParameters();

#endif // ARENA_ARENAPARAMS_H
