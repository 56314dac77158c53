#ifndef ARENA_GTEST_UTILS_H
#define ARENA_GTEST_UTILS_H

#include "amount.h"
#include "arena/ledger.h"
#include "arena/match.h"
#include "arena/resolvers.h"
#include "arena/tournament.h"
#include "arenaparams.h"
#include "uint256.h"
#include "util/time.h"
#include "validation.h"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <string>
#include <vector>

static const int64_t TEST_START_TIME = 1700000000;
static const CAmount TEST_STARTING_BALANCE = 1000 * COIN;

static const arena::CAccountID ALICE("alice");
static const arena::CAccountID BOB("bob");
static const arena::CAccountID CAROL("carol");
static const arena::CAccountID DAVE("dave");
static const arena::CAccountID ORACLE("oracle");
static const arena::CAccountID TREASURY("treasury");

class MockFundsGateway : public arena::CFundsGateway {
public:
    MOCK_METHOD2(Collect, bool(const arena::CAccountID& from, CAmount nAmount));
    MOCK_METHOD1(Send, bool(const std::vector<arena::CPayout>& vPayouts));
};

class MockCValidationState : public CValidationState {
public:
    MOCK_METHOD3(Invalid, bool(bool ret,
                 unsigned char _chRejectCode, const std::string& _strRejectReason));
    MOCK_METHOD1(Error, bool(const std::string& strRejectReasonIn));
    MOCK_CONST_METHOD0(IsValid, bool());
    MOCK_CONST_METHOD0(IsInvalid, bool());
    MOCK_CONST_METHOD0(IsError, bool());
    MOCK_CONST_METHOD0(GetRejectCode, unsigned char());
    MOCK_CONST_METHOD0(GetRejectReason, std::string());
};

/** A deterministic 32-byte salt derived from a label. */
uint256 SaltFor(const std::string& label);
std::vector<unsigned char> MoveBytes(const std::string& move);
uint256 CommitFor(const std::string& move, const uint256& salt);

/** Clear process options, keeping debug logging on for the LogGrabber. */
void ResetTestArgs();

/**
 * Both engines over one in-memory ledger on the main network parameters,
 * with a fixed clock and a single resolver.
 */
class ArenaTest : public ::testing::Test {
protected:
    const CArenaParams& params = *ParamsForNetwork("main").value();
    FixedClock clock{std::chrono::seconds(TEST_START_TIME)};
    arena::CAccountLedger ledger;
    arena::CResolverSet resolvers{std::vector<arena::CAccountID>{ORACLE}};
    arena::CMatchEngine matches{ledger, clock, params, resolvers};
    arena::CBracketEngine brackets{ledger, clock, params, resolvers, matches};
    CAmount nSupply = 0;

    virtual void SetUp() {
        Fund(ALICE);
        Fund(BOB);
        Fund(CAROL);
        Fund(DAVE);
    }

    void Fund(const arena::CAccountID& account, CAmount nAmount = TEST_STARTING_BALANCE) {
        ledger.Credit(account, nAmount);
        nSupply += nAmount;
    }

    /** No value is created or destroyed, and custody matches what the engines account for. */
    void ExpectConserved() {
        EXPECT_EQ(nSupply, ledger.GetTotal());
        EXPECT_EQ(ledger.GetCustody(),
                  matches.GetEscrowBalance() + matches.GetFeePool() +
                  brackets.GetPrizePoolTotal() + brackets.GetFeePool());
    }

    uint64_t CreateMatch(const arena::CAccountID& creator, CAmount nWager, const std::string& gameType = "rps");
    uint64_t CreateJoinedMatch(CAmount nWager, const std::string& gameType = "rps");
    /** Alice and Bob commit to their moves; the match enters the reveal phase. */
    void CommitBoth(uint64_t nMatchId, const std::string& aliceMove, const std::string& bobMove);
    void Reveal(uint64_t nMatchId, const arena::CAccountID& player, const std::string& move);
};

#endif // ARENA_GTEST_UTILS_H
