// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "arenaparams.h"

#include "logging.h"
#include "util/strencodings.h"
#include "util/system.h"

#include <assert.h>

/**
 * Main network
 */
class CMainParams : public CArenaParams {
public:
    CMainParams() {
        strNetworkID = "main";
        nMinWager = COIN / 1000;
        nMaxWager = 100 * COIN;
        nCommitTimeout = 5 * 60;
        nRevealTimeout = 5 * 60;
        platformFee = CFeeRate(100);
    }
};
static CMainParams mainParams;

/**
 * Testnet
 */
class CTestNetParams : public CArenaParams {
public:
    CTestNetParams() {
        strNetworkID = "test";
        nMinWager = COIN / 1000;
        nMaxWager = 100 * COIN;
        nCommitTimeout = 2 * 60;
        nRevealTimeout = 2 * 60;
        platformFee = CFeeRate(100);
    }
};
static CTestNetParams testNetParams;

/**
 * Regression test
 */
class CRegTestParams : public CArenaParams {
public:
    CRegTestParams() {
        strNetworkID = "regtest";
        SetDefaults();
    }

    void SetDefaults()
    {
        nMinWager = 1;
        nMaxWager = MAX_WAGER;
        nCommitTimeout = 60;
        nRevealTimeout = 60;
        platformFee = CFeeRate(250);
    }

    void UpdateParameters(CAmount nMinWagerIn, CAmount nMaxWagerIn,
                          int64_t nCommitTimeoutIn, int64_t nRevealTimeoutIn,
                          int64_t nFeeBasisPointsIn)
    {
        nMinWager = nMinWagerIn;
        nMaxWager = nMaxWagerIn;
        nCommitTimeout = nCommitTimeoutIn;
        nRevealTimeout = nRevealTimeoutIn;
        platformFee = CFeeRate(nFeeBasisPointsIn);
    }
};
static CRegTestParams regTestParams;

static const CArenaParams *pCurrentParams = &mainParams;

bool CArenaParams::IsValidTournamentCapacity(unsigned int nCapacity) const
{
    if (nCapacity < nMinTournamentCapacity || nCapacity > nMaxTournamentCapacity)
        return false;
    return (nCapacity & (nCapacity - 1)) == 0;
}

const CArenaParams &Params() {
    assert(pCurrentParams);
    return *pCurrentParams;
}

tl::expected<const CArenaParams*, std::string> ParamsForNetwork(const std::string& network)
{
    if (network == "main")
        return &mainParams;
    if (network == "test")
        return &testNetParams;
    if (network == "regtest")
        return &regTestParams;
    return tl::make_unexpected(strprintf("unknown network '%s'", network));
}

tl::expected<void, std::string> SelectParams(const std::string& network)
{
    auto params = ParamsForNetwork(network);
    if (!params.has_value())
        return tl::make_unexpected(params.error());
    pCurrentParams = params.value();
    return {};
}

tl::expected<void, std::string> UpdateRegtestParameters(
    CAmount nMinWager, CAmount nMaxWager,
    int64_t nCommitTimeout, int64_t nRevealTimeout,
    int64_t nFeeBasisPoints)
{
    if (nMinWager <= 0 || !MoneyRange(nMinWager))
        return tl::make_unexpected(strprintf("-minwager must be within (0, %d]", MAX_MONEY));
    if (nMaxWager < nMinWager || nMaxWager > MAX_WAGER)
        return tl::make_unexpected(strprintf("-maxwager must be within [%d, %d]", nMinWager, MAX_WAGER));
    if (nCommitTimeout <= 0 || nCommitTimeout > MAX_PHASE_TIMEOUT)
        return tl::make_unexpected(strprintf("-committimeout must be within [1, %d]", MAX_PHASE_TIMEOUT));
    if (nRevealTimeout <= 0 || nRevealTimeout > MAX_PHASE_TIMEOUT)
        return tl::make_unexpected(strprintf("-revealtimeout must be within [1, %d]", MAX_PHASE_TIMEOUT));
    if (nFeeBasisPoints < 0 || nFeeBasisPoints > MAX_BASIS_POINTS)
        return tl::make_unexpected(strprintf("-platformfeebps must be within [0, %d]", MAX_BASIS_POINTS));

    regTestParams.UpdateParameters(nMinWager, nMaxWager, nCommitTimeout, nRevealTimeout, nFeeBasisPoints);
    return {};
}

void ResetRegtestParameters()
{
    regTestParams.SetDefaults();
}

static const char* const REGTEST_OVERRIDES[] = {
    "-minwager", "-maxwager", "-committimeout", "-revealtimeout", "-platformfeebps",
};

static tl::expected<int64_t, std::string> ParseIntegerArg(const std::string& strArg, int64_t nDefault)
{
    if (!IsArgSet(strArg))
        return nDefault;
    int64_t n;
    if (!ParseInt64(GetArg(strArg, ""), &n))
        return tl::make_unexpected(strprintf("invalid value for %s: '%s'", strArg, GetArg(strArg, "")));
    return n;
}

tl::expected<void, std::string> SelectParamsFromArgs()
{
    std::string network = GetArg("-network", "main");
    auto selected = SelectParams(network);
    if (!selected.has_value())
        return selected;

    bool fOverride = false;
    for (const char* strArg : REGTEST_OVERRIDES) {
        if (IsArgSet(strArg)) {
            if (network != "regtest")
                return tl::make_unexpected(strprintf("%s is only honoured on regtest", strArg));
            fOverride = true;
        }
    }
    if (!fOverride)
        return {};

    auto nMin = ParseIntegerArg("-minwager", regTestParams.MinWager());
    if (!nMin.has_value()) return tl::make_unexpected(nMin.error());
    auto nMax = ParseIntegerArg("-maxwager", regTestParams.MaxWager());
    if (!nMax.has_value()) return tl::make_unexpected(nMax.error());
    auto nCommit = ParseIntegerArg("-committimeout", regTestParams.CommitTimeout());
    if (!nCommit.has_value()) return tl::make_unexpected(nCommit.error());
    auto nReveal = ParseIntegerArg("-revealtimeout", regTestParams.RevealTimeout());
    if (!nReveal.has_value()) return tl::make_unexpected(nReveal.error());
    auto nFee = ParseIntegerArg("-platformfeebps", regTestParams.PlatformFee().GetBasisPoints());
    if (!nFee.has_value()) return tl::make_unexpected(nFee.error());

    auto updated = UpdateRegtestParameters(nMin.value(), nMax.value(), nCommit.value(), nReveal.value(), nFee.value());
    if (updated.has_value()) {
        LogPrintf("regtest arena parameters: wager [%s, %s], commit %ds, reveal %ds, fee %s\n",
            FormatMoney(regTestParams.MinWager()), FormatMoney(regTestParams.MaxWager()),
            regTestParams.CommitTimeout(), regTestParams.RevealTimeout(),
            regTestParams.PlatformFee().ToString());
    }
    return updated;
}
