#include "gtest/utils.h"

#include "hash.h"
#include "logging.h"
#include "util/system.h"

using namespace arena;

static const unsigned char TEST_SALT_PERSONALIZATION[crypto_generichash_blake2b_PERSONALBYTES] =
    {'A','r','e','n','a','T','e','s','t','S','a','l','t','_','_','_'};

uint256 SaltFor(const std::string& label)
{
    return CBLAKE2bWriter(TEST_SALT_PERSONALIZATION)
        .write(reinterpret_cast<const unsigned char*>(label.data()), label.size())
        .GetHash();
}

std::vector<unsigned char> MoveBytes(const std::string& move)
{
    return std::vector<unsigned char>(move.begin(), move.end());
}

uint256 CommitFor(const std::string& move, const uint256& salt)
{
    return CommitmentHash(MoveBytes(move), salt);
}

void ResetTestArgs()
{
    std::string strLogFile = GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE);
    ClearArgs();
    SoftSetArg("-debuglogfile", strLogFile);
    SoftSetArg("-debug", "1");
    fDebug = true;
}

uint64_t ArenaTest::CreateMatch(const CAccountID& creator, CAmount nWager, const std::string& gameType)
{
    CValidationState state;
    uint64_t nMatchId = 0;
    EXPECT_TRUE(matches.CreateMatch(creator, gameType, nWager, state, nMatchId)) << FormatStateMessage(state);
    return nMatchId;
}

uint64_t ArenaTest::CreateJoinedMatch(CAmount nWager, const std::string& gameType)
{
    uint64_t nMatchId = CreateMatch(ALICE, nWager, gameType);
    CValidationState state;
    EXPECT_TRUE(matches.JoinMatch(BOB, nMatchId, nWager, state)) << FormatStateMessage(state);
    return nMatchId;
}

void ArenaTest::CommitBoth(uint64_t nMatchId, const std::string& aliceMove, const std::string& bobMove)
{
    CValidationState state;
    EXPECT_TRUE(matches.CommitMove(ALICE, nMatchId, CommitFor(aliceMove, SaltFor("alice")), state)) << FormatStateMessage(state);
    EXPECT_TRUE(matches.CommitMove(BOB, nMatchId, CommitFor(bobMove, SaltFor("bob")), state)) << FormatStateMessage(state);
}

void ArenaTest::Reveal(uint64_t nMatchId, const CAccountID& player, const std::string& move)
{
    CValidationState state;
    EXPECT_TRUE(matches.RevealMove(player, nMatchId, MoveBytes(move), SaltFor(player.ToString()), state)) << FormatStateMessage(state);
}
