#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "arena/tournament.h"
#include "gtest/utils.h"
#include "logging.h"

using namespace arena;
using ::testing::ElementsAre;
using ::testing::Return;
using ::testing::StrictMock;

class BracketEngineTest : public ArenaTest {
protected:
    uint64_t CreateTournament(unsigned int nCapacity, CAmount nEntryFee = COIN) {
        CValidationState state;
        uint64_t nTournamentId = 0;
        EXPECT_TRUE(brackets.CreateTournament(CAROL, "weekly", "rps", nEntryFee, nCapacity, state, nTournamentId))
            << FormatStateMessage(state);
        return nTournamentId;
    }

    void RegisterPlayer(uint64_t nTournamentId, const CAccountID& player, CAmount nEntryFee = COIN) {
        CValidationState state;
        EXPECT_TRUE(brackets.Register(player, nTournamentId, nEntryFee, state)) << FormatStateMessage(state);
    }

    /** A full four-player field: alice v bob, carol v dave. */
    uint64_t CreateActiveFour() {
        uint64_t nTournamentId = CreateTournament(4);
        RegisterPlayer(nTournamentId, ALICE);
        RegisterPlayer(nTournamentId, BOB);
        RegisterPlayer(nTournamentId, CAROL);
        RegisterPlayer(nTournamentId, DAVE);
        return nTournamentId;
    }

    void Resolve(uint64_t nTournamentId, unsigned int nFlatIndex, const CAccountID& winner) {
        CValidationState state;
        EXPECT_TRUE(brackets.ResolveMatch(ORACLE, nTournamentId, nFlatIndex, winner, state)) << FormatStateMessage(state);
    }

    std::vector<CAccountID> MakePlayers(unsigned int nCount) {
        std::vector<CAccountID> vPlayers;
        for (unsigned int i = 0; i < nCount; i++) {
            CAccountID player(strprintf("player%d", i));
            Fund(player, COIN);
            vPlayers.push_back(player);
        }
        return vPlayers;
    }
};

TEST(BracketIndexTest, FlatIndexLayout) {
    // Capacity 8: round 1 at 0-3, round 2 at 4-5, final at 6.
    EXPECT_EQ(0u, BracketFlatIndex(8, 1, 0));
    EXPECT_EQ(3u, BracketFlatIndex(8, 1, 3));
    EXPECT_EQ(4u, BracketFlatIndex(8, 2, 0));
    EXPECT_EQ(5u, BracketFlatIndex(8, 2, 1));
    EXPECT_EQ(6u, BracketFlatIndex(8, 3, 0));

    EXPECT_EQ(0u, BracketFlatIndex(2, 1, 0));
    EXPECT_EQ(2u, BracketFlatIndex(4, 2, 0));
    EXPECT_EQ(8u, BracketFlatIndex(16, 2, 0));
    EXPECT_EQ(12u, BracketFlatIndex(16, 3, 0));
    EXPECT_EQ(14u, BracketFlatIndex(16, 4, 0));
}

TEST(BracketIndexTest, PositionInvertsFlatIndex) {
    const unsigned int vCapacities[] = {2, 4, 8, 16};
    for (unsigned int nCapacity : vCapacities) {
        for (unsigned int nFlat = 0; nFlat < nCapacity - 1; nFlat++) {
            unsigned int nRound = 0, nIndex = 0;
            ASSERT_TRUE(BracketPosition(nCapacity, nFlat, nRound, nIndex));
            EXPECT_EQ(nFlat, BracketFlatIndex(nCapacity, nRound, nIndex));
        }
        unsigned int nRound, nIndex;
        EXPECT_FALSE(BracketPosition(nCapacity, nCapacity - 1, nRound, nIndex));
    }
}

TEST_F(BracketEngineTest, CreateRejections) {
    CValidationState state;
    uint64_t nTournamentId;

    EXPECT_FALSE(brackets.CreateTournament(CAROL, "", "rps", COIN, 4, state, nTournamentId));
    EXPECT_EQ(REJECT_INVALID, state.GetRejectCode());
    EXPECT_EQ("invalid-name", state.GetRejectReason());

    state = CValidationState();
    EXPECT_FALSE(brackets.CreateTournament(CAROL, std::string(MAX_TOURNAMENT_NAME_SIZE + 1, 'x'), "rps", COIN, 4, state, nTournamentId));
    EXPECT_EQ("invalid-name", state.GetRejectReason());

    state = CValidationState();
    EXPECT_FALSE(brackets.CreateTournament(CAROL, "weekly", "rps", 0, 4, state, nTournamentId));
    EXPECT_EQ("invalid-entry-fee", state.GetRejectReason());

    // The whole field's entry fees must fit in one transfer.
    state = CValidationState();
    EXPECT_FALSE(brackets.CreateTournament(CAROL, "weekly", "rps", MAX_MONEY / 16 + 1, 16, state, nTournamentId));
    EXPECT_EQ(REJECT_INVALID, state.GetRejectCode());
    EXPECT_EQ("invalid-entry-fee", state.GetRejectReason());

    state = CValidationState();
    EXPECT_FALSE(brackets.CreateTournament(CAROL, "weekly", "rps", MAX_MONEY / 2 + 1, 2, state, nTournamentId));
    EXPECT_EQ("invalid-entry-fee", state.GetRejectReason());

    const unsigned int vBadCapacities[] = {0, 1, 3, 6, 32};
    for (unsigned int nCapacity : vBadCapacities) {
        state = CValidationState();
        EXPECT_FALSE(brackets.CreateTournament(CAROL, "weekly", "rps", COIN, nCapacity, state, nTournamentId));
        EXPECT_EQ("invalid-capacity", state.GetRejectReason()) << nCapacity;
    }

    EXPECT_EQ(0, brackets.GetTournamentCount());
    EXPECT_TRUE(brackets.CreateTournament(CAROL, std::string(MAX_TOURNAMENT_NAME_SIZE, 'x'), "rps", COIN, 16, state, nTournamentId));
    EXPECT_EQ(0, nTournamentId);
}

TEST_F(BracketEngineTest, CreateRecordsTournament) {
    clock.Advance(std::chrono::seconds(3));
    uint64_t nTournamentId = CreateTournament(4);

    auto tournament = brackets.GetTournament(nTournamentId);
    ASSERT_TRUE(tournament.has_value());
    EXPECT_EQ("weekly", tournament->strName);
    EXPECT_EQ(CAROL, tournament->creator);
    EXPECT_EQ(COIN, tournament->nEntryFee);
    EXPECT_EQ(4u, tournament->nCapacity);
    EXPECT_EQ(2u, tournament->GetRoundCount());
    EXPECT_EQ(TournamentState::REGISTRATION, tournament->state);
    EXPECT_EQ(0u, tournament->nCurrentRound);
    EXPECT_EQ(TEST_START_TIME + 3, tournament->nCreatedAt);
    EXPECT_TRUE(brackets.GetTournamentMatches(nTournamentId).empty());
    EXPECT_FALSE(brackets.GetTournament(nTournamentId + 1).has_value());
}

TEST_F(BracketEngineTest, RegisterRejections) {
    CValidationState state;
    EXPECT_FALSE(brackets.Register(ALICE, 7, COIN, state));
    EXPECT_EQ(REJECT_NOT_FOUND, state.GetRejectCode());
    EXPECT_EQ("tournament-not-found", state.GetRejectReason());

    uint64_t nTournamentId = CreateTournament(2);

    state = CValidationState();
    EXPECT_FALSE(brackets.Register(ALICE, nTournamentId, COIN / 2, state));
    EXPECT_EQ(REJECT_INVALID, state.GetRejectCode());
    EXPECT_EQ("entry-fee-mismatch", state.GetRejectReason());

    state = CValidationState();
    EXPECT_FALSE(brackets.Register(CAccountID("pauper"), nTournamentId, COIN, state));
    EXPECT_EQ("deposit-failed", state.GetRejectReason());

    RegisterPlayer(nTournamentId, ALICE);

    state = CValidationState();
    EXPECT_FALSE(brackets.Register(ALICE, nTournamentId, COIN, state));
    EXPECT_EQ(REJECT_DUPLICATE, state.GetRejectCode());
    EXPECT_EQ("already-registered", state.GetRejectReason());

    RegisterPlayer(nTournamentId, BOB);

    state = CValidationState();
    EXPECT_FALSE(brackets.Register(CAROL, nTournamentId, COIN, state));
    EXPECT_EQ(REJECT_STATE, state.GetRejectCode());
    EXPECT_EQ("registration-closed", state.GetRejectReason());

    EXPECT_EQ(2 * COIN, brackets.GetPrizePoolTotal());
    ExpectConserved();
}

TEST_F(BracketEngineTest, FillingTheFieldStartsRoundOne) {
    uint64_t nTournamentId = CreateTournament(4);
    RegisterPlayer(nTournamentId, ALICE);
    RegisterPlayer(nTournamentId, BOB);
    RegisterPlayer(nTournamentId, CAROL);

    auto tournament = brackets.GetTournament(nTournamentId);
    EXPECT_EQ(TournamentState::REGISTRATION, tournament->state);
    EXPECT_TRUE(brackets.GetTournamentMatches(nTournamentId).empty());

    RegisterPlayer(nTournamentId, DAVE);
    tournament = brackets.GetTournament(nTournamentId);
    EXPECT_EQ(TournamentState::ACTIVE, tournament->state);
    EXPECT_EQ(1u, tournament->nCurrentRound);
    EXPECT_THAT(tournament->vPlayers, ElementsAre(ALICE, BOB, CAROL, DAVE));
    EXPECT_EQ(4 * COIN, tournament->nPrizePool);

    auto vRound = brackets.GetRoundMatches(nTournamentId, 1);
    ASSERT_EQ(2u, vRound.size());
    EXPECT_EQ(ALICE, vRound[0].player1);
    EXPECT_EQ(BOB, vRound[0].player2);
    EXPECT_EQ(CAROL, vRound[1].player1);
    EXPECT_EQ(DAVE, vRound[1].player2);
    EXPECT_FALSE(vRound[0].fCompleted);
    EXPECT_TRUE(brackets.GetRoundMatches(nTournamentId, 2).empty());
    ExpectConserved();
}

TEST_F(BracketEngineTest, FourPlayerTournamentPaysChampion) {
    uint64_t nTournamentId = CreateActiveFour();
    const CAmount nFee = params.PlatformFee().GetFee(4 * COIN);
    const CAmount nPrize = 4 * COIN - nFee;
    ASSERT_EQ(4000000, nFee);

    Resolve(nTournamentId, 0, ALICE);
    EXPECT_EQ(1u, brackets.GetTournament(nTournamentId)->nCurrentRound);

    Resolve(nTournamentId, 1, DAVE);
    auto tournament = brackets.GetTournament(nTournamentId);
    EXPECT_EQ(2u, tournament->nCurrentRound);

    auto finalMatch = brackets.GetBracketMatch(nTournamentId, 2, 0);
    ASSERT_TRUE(finalMatch.has_value());
    EXPECT_EQ(ALICE, finalMatch->player1);
    EXPECT_EQ(DAVE, finalMatch->player2);
    EXPECT_EQ(2u, BracketFlatIndex(4, finalMatch->nRound, finalMatch->nIndex));

    clock.Advance(std::chrono::seconds(60));
    Resolve(nTournamentId, 2, DAVE);

    tournament = brackets.GetTournament(nTournamentId);
    EXPECT_EQ(TournamentState::COMPLETED, tournament->state);
    EXPECT_EQ(DAVE, tournament->winner);
    EXPECT_EQ(nPrize, tournament->nPrizePaid);
    EXPECT_EQ(4 * COIN, tournament->nPrizePool);
    EXPECT_EQ(TEST_START_TIME + 60, tournament->nCompletedAt);

    EXPECT_EQ(TEST_STARTING_BALANCE - COIN + nPrize, ledger.GetBalance(DAVE));
    EXPECT_EQ(TEST_STARTING_BALANCE - COIN, ledger.GetBalance(ALICE));
    EXPECT_EQ(0, brackets.GetPrizePoolTotal());
    EXPECT_EQ(nFee, brackets.GetFeePool());
    EXPECT_EQ(3u, brackets.GetTournamentMatches(nTournamentId).size());

    // Bracket results are not match engine results.
    EXPECT_EQ(CPlayerStats(), matches.GetStats(DAVE));
    ExpectConserved();
}

TEST_F(BracketEngineTest, ResolveRejections) {
    CValidationState state;
    EXPECT_FALSE(brackets.ResolveMatch(ALICE, 0, 0, ALICE, state));
    EXPECT_EQ(REJECT_UNAUTHORIZED, state.GetRejectCode());
    EXPECT_EQ("not-resolver", state.GetRejectReason());

    state = CValidationState();
    EXPECT_FALSE(brackets.ResolveMatch(ORACLE, 0, 0, ALICE, state));
    EXPECT_EQ("tournament-not-found", state.GetRejectReason());

    uint64_t nOpen = CreateTournament(4);
    state = CValidationState();
    EXPECT_FALSE(brackets.ResolveMatch(ORACLE, nOpen, 0, ALICE, state));
    EXPECT_EQ(REJECT_STATE, state.GetRejectCode());
    EXPECT_EQ("tournament-not-active", state.GetRejectReason());

    uint64_t nTournamentId = CreateActiveFour();

    // The final exists in the layout but has not been paired yet.
    state = CValidationState();
    EXPECT_FALSE(brackets.ResolveMatch(ORACLE, nTournamentId, 2, ALICE, state));
    EXPECT_EQ(REJECT_NOT_FOUND, state.GetRejectCode());
    EXPECT_EQ("bracket-match-not-found", state.GetRejectReason());

    state = CValidationState();
    EXPECT_FALSE(brackets.ResolveMatch(ORACLE, nTournamentId, 3, ALICE, state));
    EXPECT_EQ("bracket-match-not-found", state.GetRejectReason());

    state = CValidationState();
    EXPECT_FALSE(brackets.ResolveMatch(ORACLE, nTournamentId, 0, CAROL, state));
    EXPECT_EQ(REJECT_INVALID, state.GetRejectCode());
    EXPECT_EQ("winner-not-a-contestant", state.GetRejectReason());

    Resolve(nTournamentId, 0, BOB);

    state = CValidationState();
    EXPECT_FALSE(brackets.ResolveMatch(ORACLE, nTournamentId, 0, ALICE, state));
    EXPECT_EQ(REJECT_STATE, state.GetRejectCode());
    EXPECT_EQ("bracket-match-completed", state.GetRejectReason());
    EXPECT_EQ(BOB, brackets.GetBracketMatch(nTournamentId, 1, 0)->winner);
}

TEST_F(BracketEngineTest, CompletedTournamentRejectsEverything) {
    uint64_t nTournamentId = CreateTournament(2);
    RegisterPlayer(nTournamentId, ALICE);
    RegisterPlayer(nTournamentId, BOB);
    Resolve(nTournamentId, 0, ALICE);

    CValidationState state;
    EXPECT_FALSE(brackets.ResolveMatch(ORACLE, nTournamentId, 0, BOB, state));
    EXPECT_EQ("tournament-not-active", state.GetRejectReason());

    state = CValidationState();
    EXPECT_FALSE(brackets.CancelTournament(ORACLE, nTournamentId, state));
    EXPECT_EQ("tournament-not-cancellable", state.GetRejectReason());

    state = CValidationState();
    EXPECT_FALSE(brackets.Register(CAROL, nTournamentId, COIN, state));
    EXPECT_EQ("registration-closed", state.GetRejectReason());
    ExpectConserved();
}

TEST_F(BracketEngineTest, EightPlayerBracketAdvancesRoundByRound) {
    std::vector<CAccountID> vPlayers = MakePlayers(8);
    uint64_t nTournamentId = CreateTournament(8);
    for (const CAccountID& player : vPlayers)
        RegisterPlayer(nTournamentId, player);

    // Player 2i+1 wins each first-round match.
    for (unsigned int i = 0; i < 4; i++)
        Resolve(nTournamentId, i, vPlayers[2 * i + 1]);
    auto vSemis = brackets.GetRoundMatches(nTournamentId, 2);
    ASSERT_EQ(2u, vSemis.size());
    EXPECT_EQ(vPlayers[1], vSemis[0].player1);
    EXPECT_EQ(vPlayers[3], vSemis[0].player2);
    EXPECT_EQ(vPlayers[5], vSemis[1].player1);
    EXPECT_EQ(vPlayers[7], vSemis[1].player2);

    // Out of order within the round.
    Resolve(nTournamentId, 5, vPlayers[5]);
    EXPECT_EQ(2u, brackets.GetTournament(nTournamentId)->nCurrentRound);
    Resolve(nTournamentId, 4, vPlayers[3]);
    EXPECT_EQ(3u, brackets.GetTournament(nTournamentId)->nCurrentRound);

    Resolve(nTournamentId, 6, vPlayers[3]);
    auto tournament = brackets.GetTournament(nTournamentId);
    EXPECT_EQ(TournamentState::COMPLETED, tournament->state);
    EXPECT_EQ(vPlayers[3], tournament->winner);
    EXPECT_EQ(8 * COIN - params.PlatformFee().GetFee(8 * COIN), ledger.GetBalance(vPlayers[3]));

    auto vAll = brackets.GetTournamentMatches(nTournamentId);
    ASSERT_EQ(7u, vAll.size());
    for (unsigned int nFlat = 0; nFlat < vAll.size(); nFlat++)
        EXPECT_EQ(nFlat, BracketFlatIndex(8, vAll[nFlat].nRound, vAll[nFlat].nIndex));
    ExpectConserved();
}

TEST_F(BracketEngineTest, SixteenPlayerFinalSitsAtIndexFourteen) {
    std::vector<CAccountID> vPlayers = MakePlayers(16);
    uint64_t nTournamentId = CreateTournament(16);
    for (const CAccountID& player : vPlayers)
        RegisterPlayer(nTournamentId, player);

    unsigned int nFlat = 0;
    for (unsigned int nRound = 1; nRound <= 4; nRound++) {
        for (const CBracketMatch& bracketMatch : brackets.GetRoundMatches(nTournamentId, nRound)) {
            EXPECT_EQ(nFlat, BracketFlatIndex(16, bracketMatch.nRound, bracketMatch.nIndex));
            Resolve(nTournamentId, nFlat, bracketMatch.player1);
            nFlat++;
        }
    }
    EXPECT_EQ(15u, nFlat);

    auto tournament = brackets.GetTournament(nTournamentId);
    EXPECT_EQ(TournamentState::COMPLETED, tournament->state);
    EXPECT_EQ(vPlayers[0], tournament->winner);
    EXPECT_EQ(4u, tournament->nCurrentRound);
    ExpectConserved();
}

TEST_F(BracketEngineTest, CancelRefundsRegistrants) {
    uint64_t nTournamentId = CreateTournament(4);
    RegisterPlayer(nTournamentId, ALICE);
    RegisterPlayer(nTournamentId, BOB);

    CValidationState state;
    EXPECT_FALSE(brackets.CancelTournament(CAROL, nTournamentId, state));
    EXPECT_EQ("not-resolver", state.GetRejectReason());

    clock.Advance(std::chrono::seconds(9));
    EXPECT_TRUE(brackets.CancelTournament(ORACLE, nTournamentId, state));

    auto tournament = brackets.GetTournament(nTournamentId);
    EXPECT_EQ(TournamentState::CANCELLED, tournament->state);
    EXPECT_EQ(0, tournament->nPrizePool);
    EXPECT_EQ(TEST_START_TIME + 9, tournament->nCompletedAt);
    EXPECT_EQ(TEST_STARTING_BALANCE, ledger.GetBalance(ALICE));
    EXPECT_EQ(TEST_STARTING_BALANCE, ledger.GetBalance(BOB));
    EXPECT_EQ(0, brackets.GetPrizePoolTotal());
    EXPECT_EQ(0, brackets.GetFeePool());

    state = CValidationState();
    EXPECT_FALSE(brackets.CancelTournament(ORACLE, nTournamentId, state));
    EXPECT_EQ("tournament-not-cancellable", state.GetRejectReason());
    ExpectConserved();
}

TEST_F(BracketEngineTest, CancelActiveTournamentRefundsEntryFees) {
    uint64_t nTournamentId = CreateActiveFour();
    Resolve(nTournamentId, 0, ALICE);

    CValidationState state;
    EXPECT_TRUE(brackets.CancelTournament(ORACLE, nTournamentId, state));
    for (const CAccountID& player : {ALICE, BOB, CAROL, DAVE})
        EXPECT_EQ(TEST_STARTING_BALANCE, ledger.GetBalance(player));

    state = CValidationState();
    EXPECT_FALSE(brackets.ResolveMatch(ORACLE, nTournamentId, 1, CAROL, state));
    EXPECT_EQ("tournament-not-active", state.GetRejectReason());
    ExpectConserved();
}

TEST_F(BracketEngineTest, CancelEmptyTournament) {
    uint64_t nTournamentId = CreateTournament(8);
    CValidationState state;
    EXPECT_TRUE(brackets.CancelTournament(ORACLE, nTournamentId, state));
    EXPECT_EQ(TournamentState::CANCELLED, brackets.GetTournament(nTournamentId)->state);
}

TEST_F(BracketEngineTest, RefusedPrizeRollsBackTheFinal) {
    uint64_t nTournamentId = CreateTournament(2);
    RegisterPlayer(nTournamentId, ALICE);
    RegisterPlayer(nTournamentId, BOB);

    ledger.SetRejecting(BOB, true);
    CValidationState state;
    EXPECT_FALSE(brackets.ResolveMatch(ORACLE, nTournamentId, 0, BOB, state));
    EXPECT_TRUE(state.IsError());
    EXPECT_EQ("transfer-failed", state.GetRejectReason());

    auto tournament = brackets.GetTournament(nTournamentId);
    EXPECT_EQ(TournamentState::ACTIVE, tournament->state);
    EXPECT_TRUE(tournament->winner.IsNull());
    EXPECT_FALSE(brackets.GetBracketMatch(nTournamentId, 1, 0)->fCompleted);
    EXPECT_EQ(2 * COIN, brackets.GetPrizePoolTotal());
    EXPECT_EQ(0, brackets.GetFeePool());
    ExpectConserved();

    ledger.SetRejecting(BOB, false);
    Resolve(nTournamentId, 0, BOB);
    EXPECT_EQ(BOB, brackets.GetTournament(nTournamentId)->winner);
    ExpectConserved();
}

TEST_F(BracketEngineTest, RefusedRefundLeavesTournamentCancellable) {
    uint64_t nTournamentId = CreateTournament(4);
    RegisterPlayer(nTournamentId, ALICE);
    RegisterPlayer(nTournamentId, BOB);

    ledger.SetRejecting(BOB, true);
    CValidationState state;
    EXPECT_FALSE(brackets.CancelTournament(ORACLE, nTournamentId, state));
    EXPECT_TRUE(state.IsError());
    // Alice's refund was in the same batch and must not have been delivered.
    EXPECT_EQ(TEST_STARTING_BALANCE - COIN, ledger.GetBalance(ALICE));
    EXPECT_EQ(TournamentState::REGISTRATION, brackets.GetTournament(nTournamentId)->state);
    ExpectConserved();
}

TEST_F(BracketEngineTest, ContestDecidesBracketMatch) {
    uint64_t nTournamentId = CreateTournament(2);
    RegisterPlayer(nTournamentId, ALICE);
    RegisterPlayer(nTournamentId, BOB);

    uint64_t nMatchId = CreateJoinedMatch(COIN);

    CValidationState state;
    EXPECT_FALSE(brackets.SettleFromContest(CAROL, nTournamentId, 0, state));
    EXPECT_EQ(REJECT_STATE, state.GetRejectCode());
    EXPECT_EQ("contest-not-attached", state.GetRejectReason());

    state = CValidationState();
    EXPECT_FALSE(brackets.AttachContest(ALICE, nTournamentId, 0, nMatchId, state));
    EXPECT_EQ("not-resolver", state.GetRejectReason());

    state = CValidationState();
    EXPECT_TRUE(brackets.AttachContest(ORACLE, nTournamentId, 0, nMatchId, state));
    EXPECT_EQ(nMatchId, *brackets.GetBracketMatch(nTournamentId, 1, 0)->contestId);

    state = CValidationState();
    EXPECT_FALSE(brackets.SettleFromContest(CAROL, nTournamentId, 0, state));
    EXPECT_EQ("contest-unresolved", state.GetRejectReason());

    CommitBoth(nMatchId, "a", "b");
    Reveal(nMatchId, ALICE, "a");
    Reveal(nMatchId, BOB, "b");
    ASSERT_EQ(BOB, matches.GetMatch(nMatchId)->winner);

    // Anyone may settle.
    state = CValidationState();
    EXPECT_TRUE(brackets.SettleFromContest(CAROL, nTournamentId, 0, state));
    auto tournament = brackets.GetTournament(nTournamentId);
    EXPECT_EQ(TournamentState::COMPLETED, tournament->state);
    EXPECT_EQ(BOB, tournament->winner);
    ExpectConserved();
}

TEST_F(BracketEngineTest, AttachContestRejections) {
    uint64_t nTournamentId = CreateActiveFour();
    uint64_t nAliceBob = CreateJoinedMatch(COIN);

    CValidationState state;
    EXPECT_FALSE(brackets.AttachContest(ORACLE, nTournamentId, 0, 99, state));
    EXPECT_EQ(REJECT_NOT_FOUND, state.GetRejectCode());
    EXPECT_EQ("match-not-found", state.GetRejectReason());

    // Alice and Bob do not meet at index 1.
    state = CValidationState();
    EXPECT_FALSE(brackets.AttachContest(ORACLE, nTournamentId, 1, nAliceBob, state));
    EXPECT_EQ(REJECT_INVALID, state.GetRejectCode());
    EXPECT_EQ("contest-mismatch", state.GetRejectReason());

    // An unjoined contest has only one side.
    uint64_t nOpen = CreateMatch(ALICE, COIN);
    state = CValidationState();
    EXPECT_FALSE(brackets.AttachContest(ORACLE, nTournamentId, 0, nOpen, state));
    EXPECT_EQ(REJECT_STATE, state.GetRejectCode());
    EXPECT_EQ("contest-not-joined", state.GetRejectReason());

    // Once joined it can be attached.
    state = CValidationState();
    ASSERT_TRUE(matches.JoinMatch(BOB, nOpen, COIN, state)) << FormatStateMessage(state);
    EXPECT_TRUE(brackets.AttachContest(ORACLE, nTournamentId, 0, nOpen, state)) << FormatStateMessage(state);
    nAliceBob = CreateJoinedMatch(COIN);

    state = CValidationState();
    EXPECT_FALSE(brackets.AttachContest(ORACLE, nTournamentId, 2, nAliceBob, state));
    EXPECT_EQ("bracket-match-not-found", state.GetRejectReason());

    state = CValidationState();
    EXPECT_FALSE(brackets.AttachContest(ORACLE, nTournamentId, 0, nAliceBob, state));
    EXPECT_EQ(REJECT_DUPLICATE, state.GetRejectCode());
    EXPECT_EQ("contest-already-attached", state.GetRejectReason());

    // A contest decides at most one bracket match across all tournaments.
    uint64_t nOther = CreateTournament(2);
    RegisterPlayer(nOther, ALICE);
    RegisterPlayer(nOther, BOB);
    state = CValidationState();
    EXPECT_FALSE(brackets.AttachContest(ORACLE, nOther, 0, nOpen, state));
    EXPECT_EQ("contest-already-attached", state.GetRejectReason());
    EXPECT_TRUE(brackets.AttachContest(ORACLE, nOther, 0, nAliceBob, state)) << FormatStateMessage(state);
}

TEST_F(BracketEngineTest, CancelledContestCannotSettle) {
    uint64_t nTournamentId = CreateTournament(2);
    RegisterPlayer(nTournamentId, ALICE);
    RegisterPlayer(nTournamentId, BOB);
    uint64_t nMatchId = CreateJoinedMatch(COIN);

    CValidationState state;
    ASSERT_TRUE(brackets.AttachContest(ORACLE, nTournamentId, 0, nMatchId, state));

    clock.Advance(std::chrono::seconds(params.CommitTimeout()));
    TimeoutOutcome outcome;
    ASSERT_TRUE(matches.ClaimTimeout(ALICE, nMatchId, outcome, state));
    ASSERT_EQ(TimeoutOutcome::REFUNDED, outcome);

    EXPECT_FALSE(brackets.SettleFromContest(ALICE, nTournamentId, 0, state));
    EXPECT_EQ("contest-unresolved", state.GetRejectReason());

    // The resolver can still decide the match directly.
    state = CValidationState();
    Resolve(nTournamentId, 0, ALICE);
    EXPECT_EQ(ALICE, brackets.GetTournament(nTournamentId)->winner);
}

TEST_F(BracketEngineTest, LargestFieldCanBeRefunded) {
    const CAmount nEntryFee = MAX_MONEY / 16;
    uint64_t nTournamentId = CreateTournament(16, nEntryFee);
    std::vector<CAccountID> vPlayers = MakePlayers(16);
    for (const CAccountID& player : vPlayers) {
        Fund(player, nEntryFee - COIN);
        RegisterPlayer(nTournamentId, player, nEntryFee);
    }
    ASSERT_EQ(TournamentState::ACTIVE, brackets.GetTournament(nTournamentId)->state);
    EXPECT_EQ(16 * nEntryFee, brackets.GetPrizePoolTotal());

    CValidationState state;
    ASSERT_TRUE(brackets.CancelTournament(ORACLE, nTournamentId, state)) << FormatStateMessage(state);
    for (const CAccountID& player : vPlayers)
        EXPECT_EQ(nEntryFee, ledger.GetBalance(player));
    ExpectConserved();
}

TEST_F(BracketEngineTest, LargestTwoPlayerPrizeIsPaid) {
    const CAmount nEntryFee = MAX_MONEY / 2;
    uint64_t nTournamentId = CreateTournament(2, nEntryFee);
    Fund(ALICE, nEntryFee);
    Fund(BOB, nEntryFee);
    RegisterPlayer(nTournamentId, ALICE, nEntryFee);
    RegisterPlayer(nTournamentId, BOB, nEntryFee);

    Resolve(nTournamentId, 0, ALICE);
    CAmount nPrize = MAX_MONEY - params.PlatformFee().GetFee(MAX_MONEY);
    EXPECT_EQ(TournamentState::COMPLETED, brackets.GetTournament(nTournamentId)->state);
    EXPECT_EQ(TEST_STARTING_BALANCE + nPrize, ledger.GetBalance(ALICE));
    ExpectConserved();
}

TEST_F(BracketEngineTest, WithdrawFees) {
    CValidationState state;
    EXPECT_FALSE(brackets.WithdrawFees(ORACLE, TREASURY, state));
    EXPECT_EQ("no-fees", state.GetRejectReason());

    uint64_t nTournamentId = CreateTournament(2);
    RegisterPlayer(nTournamentId, ALICE);
    RegisterPlayer(nTournamentId, BOB);
    Resolve(nTournamentId, 0, ALICE);

    state = CValidationState();
    EXPECT_FALSE(brackets.WithdrawFees(ALICE, ALICE, state));
    EXPECT_EQ("not-resolver", state.GetRejectReason());

    CAmount nFee = brackets.GetFeePool();
    EXPECT_EQ(params.PlatformFee().GetFee(2 * COIN), nFee);
    EXPECT_TRUE(brackets.WithdrawFees(ORACLE, TREASURY, state));
    EXPECT_EQ(nFee, ledger.GetBalance(TREASURY));
    EXPECT_EQ(0, brackets.GetFeePool());
    ExpectConserved();
}

class BracketEngineGatewayTest : public ::testing::Test {
protected:
    const CArenaParams& params = *ParamsForNetwork("main").value();
    FixedClock clock{std::chrono::seconds(TEST_START_TIME)};
    StrictMock<MockFundsGateway> gateway;
    CResolverSet resolvers{std::vector<CAccountID>{ORACLE}};
    CMatchEngine matches{gateway, clock, params, resolvers};
    CBracketEngine brackets{gateway, clock, params, resolvers, matches};
};

TEST_F(BracketEngineGatewayTest, OnlyTheFinalPays) {
    CValidationState state;
    uint64_t nTournamentId;
    ASSERT_TRUE(brackets.CreateTournament(CAROL, "cup", "rps", COIN, 4, state, nTournamentId));

    for (const CAccountID& player : {ALICE, BOB, CAROL, DAVE}) {
        EXPECT_CALL(gateway, Collect(player, COIN)).WillOnce(Return(true));
        ASSERT_TRUE(brackets.Register(player, nTournamentId, COIN, state));
    }

    ASSERT_TRUE(brackets.ResolveMatch(ORACLE, nTournamentId, 0, BOB, state));
    ASSERT_TRUE(brackets.ResolveMatch(ORACLE, nTournamentId, 1, CAROL, state));

    CAmount nPrize = 4 * COIN - params.PlatformFee().GetFee(4 * COIN);
    EXPECT_CALL(gateway, Send(ElementsAre(CPayout(CAROL, nPrize)))).WillOnce(Return(true));
    EXPECT_TRUE(brackets.ResolveMatch(ORACLE, nTournamentId, 2, CAROL, state));
}

TEST_F(BracketEngineGatewayTest, RefundIsOneBatchInRegistrationOrder) {
    CValidationState state;
    uint64_t nTournamentId;
    ASSERT_TRUE(brackets.CreateTournament(CAROL, "cup", "rps", COIN, 4, state, nTournamentId));

    EXPECT_CALL(gateway, Collect(BOB, COIN)).WillOnce(Return(true));
    EXPECT_CALL(gateway, Collect(ALICE, COIN)).WillOnce(Return(true));
    ASSERT_TRUE(brackets.Register(BOB, nTournamentId, COIN, state));
    ASSERT_TRUE(brackets.Register(ALICE, nTournamentId, COIN, state));

    EXPECT_CALL(gateway, Send(ElementsAre(CPayout(BOB, COIN), CPayout(ALICE, COIN)))).WillOnce(Return(true));
    EXPECT_TRUE(brackets.CancelTournament(ORACLE, nTournamentId, state));
}

class BracketEngineParamsTest : public ::testing::Test {
protected:
    virtual void TearDown() {
        ResetRegtestParameters();
    }
};

TEST_F(BracketEngineParamsTest, ParametersAreFixedAtConstruction) {
    FixedClock clock{std::chrono::seconds(TEST_START_TIME)};
    CAccountLedger ledger;
    CResolverSet resolvers{std::vector<CAccountID>{ORACLE}};
    const CArenaParams& regtest = *ParamsForNetwork("regtest").value();
    CMatchEngine matches(ledger, clock, regtest, resolvers);
    CBracketEngine brackets(ledger, clock, regtest, resolvers, matches);

    ASSERT_TRUE(UpdateRegtestParameters(1, COIN, 60, 60, 0).has_value());
    EXPECT_EQ(CFeeRate(250), brackets.GetParams().PlatformFee());

    ledger.Credit(ALICE, COIN);
    ledger.Credit(BOB, COIN);
    CValidationState state;
    uint64_t nTournamentId;
    ASSERT_TRUE(brackets.CreateTournament(CAROL, "duel", "rps", COIN, 2, state, nTournamentId));
    ASSERT_TRUE(brackets.Register(ALICE, nTournamentId, COIN, state));
    ASSERT_TRUE(brackets.Register(BOB, nTournamentId, COIN, state));
    ASSERT_TRUE(brackets.ResolveMatch(ORACLE, nTournamentId, 0, ALICE, state)) << FormatStateMessage(state);
    EXPECT_EQ(CFeeRate(250).GetFee(2 * COIN), brackets.GetFeePool());
}
