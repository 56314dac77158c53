#include <gtest/gtest.h>

#include "arenaparams.h"
#include "gtest/utils.h"
#include "logging.h"
#include "util/system.h"

#include <limits>

class ArenaParamsTest : public ::testing::Test {
protected:
    virtual void TearDown() {
        ResetRegtestParameters();
        ASSERT_TRUE(SelectParams("main").has_value());
        ResetTestArgs();
    }

    void SetArgs(std::vector<const char*> vArgs) {
        vArgs.insert(vArgs.begin(), "arena-gtest");
        ParseParameters(vArgs.size(), vArgs.data());
    }
};

TEST_F(ArenaParamsTest, NetworkValues) {
    const CArenaParams& mainParams = *ParamsForNetwork("main").value();
    EXPECT_EQ("main", mainParams.NetworkIDString());
    EXPECT_EQ(COIN / 1000, mainParams.MinWager());
    EXPECT_EQ(100 * COIN, mainParams.MaxWager());
    EXPECT_EQ(300, mainParams.CommitTimeout());
    EXPECT_EQ(300, mainParams.RevealTimeout());
    EXPECT_EQ(CFeeRate(100), mainParams.PlatformFee());
    EXPECT_EQ(2u, mainParams.MinTournamentCapacity());
    EXPECT_EQ(16u, mainParams.MaxTournamentCapacity());

    const CArenaParams& test = *ParamsForNetwork("test").value();
    EXPECT_EQ("test", test.NetworkIDString());
    EXPECT_EQ(120, test.CommitTimeout());
    EXPECT_EQ(120, test.RevealTimeout());

    const CArenaParams& regtest = *ParamsForNetwork("regtest").value();
    EXPECT_EQ("regtest", regtest.NetworkIDString());
    EXPECT_EQ(1, regtest.MinWager());
    EXPECT_EQ(MAX_WAGER, regtest.MaxWager());
    EXPECT_EQ(60, regtest.CommitTimeout());
    EXPECT_EQ(CFeeRate(250), regtest.PlatformFee());
}

TEST_F(ArenaParamsTest, UnknownNetwork) {
    auto params = ParamsForNetwork("moon");
    ASSERT_FALSE(params.has_value());
    EXPECT_EQ("unknown network 'moon'", params.error());

    auto selected = SelectParams("moon");
    ASSERT_FALSE(selected.has_value());
    EXPECT_EQ("main", Params().NetworkIDString());
}

TEST_F(ArenaParamsTest, SelectParamsSwitchesGlobal) {
    ASSERT_TRUE(SelectParams("test").has_value());
    EXPECT_EQ("test", Params().NetworkIDString());
    EXPECT_EQ(120, Params().CommitTimeout());
}

TEST_F(ArenaParamsTest, TournamentCapacity) {
    const CArenaParams& params = Params();
    EXPECT_TRUE(params.IsValidTournamentCapacity(2));
    EXPECT_TRUE(params.IsValidTournamentCapacity(4));
    EXPECT_TRUE(params.IsValidTournamentCapacity(8));
    EXPECT_TRUE(params.IsValidTournamentCapacity(16));
    EXPECT_FALSE(params.IsValidTournamentCapacity(0));
    EXPECT_FALSE(params.IsValidTournamentCapacity(1));
    EXPECT_FALSE(params.IsValidTournamentCapacity(12));
    EXPECT_FALSE(params.IsValidTournamentCapacity(32));
}

TEST_F(ArenaParamsTest, DefaultsToMain) {
    SetArgs({});
    ASSERT_TRUE(SelectParamsFromArgs().has_value());
    EXPECT_EQ("main", Params().NetworkIDString());
}

TEST_F(ArenaParamsTest, RegtestHonoursOverrides) {
    SetArgs({"-network=regtest", "-minwager=5", "-committimeout=10", "-platformfeebps=300"});
    auto result = SelectParamsFromArgs();
    ASSERT_TRUE(result.has_value()) << result.error();

    EXPECT_EQ("regtest", Params().NetworkIDString());
    EXPECT_EQ(5, Params().MinWager());
    EXPECT_EQ(MAX_WAGER, Params().MaxWager());
    EXPECT_EQ(10, Params().CommitTimeout());
    EXPECT_EQ(60, Params().RevealTimeout());
    EXPECT_EQ(CFeeRate(300), Params().PlatformFee());

    ResetRegtestParameters();
    EXPECT_EQ(1, Params().MinWager());
}

TEST_F(ArenaParamsTest, OverridesRejectedOffRegtest) {
    SetArgs({"-network=main", "-revealtimeout=5"});
    auto result = SelectParamsFromArgs();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ("-revealtimeout is only honoured on regtest", result.error());
    EXPECT_EQ(300, ParamsForNetwork("main").value()->RevealTimeout());
}

TEST_F(ArenaParamsTest, UnparseableOverride) {
    SetArgs({"-network=regtest", "-maxwager=lots"});
    auto result = SelectParamsFromArgs();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ("invalid value for -maxwager: 'lots'", result.error());
}

TEST_F(ArenaParamsTest, UpdateRegtestParametersValidates) {
    EXPECT_FALSE(UpdateRegtestParameters(0, COIN, 60, 60, 100).has_value());
    EXPECT_FALSE(UpdateRegtestParameters(COIN, COIN - 1, 60, 60, 100).has_value());
    EXPECT_FALSE(UpdateRegtestParameters(1, MAX_MONEY + 1, 60, 60, 100).has_value());
    EXPECT_FALSE(UpdateRegtestParameters(1, COIN, 0, 60, 100).has_value());
    EXPECT_FALSE(UpdateRegtestParameters(1, COIN, 60, -1, 100).has_value());

    auto result = UpdateRegtestParameters(1, COIN, 60, 60, MAX_BASIS_POINTS + 1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ("-platformfeebps must be within [0, 10000]", result.error());

    // Rejected updates leave the parameters untouched.
    const CArenaParams& regtest = *ParamsForNetwork("regtest").value();
    EXPECT_EQ(MAX_WAGER, regtest.MaxWager());

    ASSERT_TRUE(UpdateRegtestParameters(COIN, COIN, 1, 2, 0).has_value());
    EXPECT_EQ(COIN, regtest.MinWager());
    EXPECT_EQ(COIN, regtest.MaxWager());
    EXPECT_EQ(2, regtest.RevealTimeout());
    EXPECT_EQ(0, regtest.PlatformFee().GetFee(COIN));
}

TEST_F(ArenaParamsTest, MaxWagerKeepsPotWithinMoneyRange) {
    auto result = UpdateRegtestParameters(1, MAX_WAGER + 1, 60, 60, 100);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(strprintf("-maxwager must be within [1, %d]", MAX_WAGER), result.error());
    EXPECT_FALSE(UpdateRegtestParameters(1, MAX_MONEY, 60, 60, 100).has_value());

    ASSERT_TRUE(UpdateRegtestParameters(1, MAX_WAGER, 60, 60, 100).has_value());
    EXPECT_TRUE(MoneyRange(2 * ParamsForNetwork("regtest").value()->MaxWager()));
}

TEST_F(ArenaParamsTest, PhaseTimeoutsAreBounded) {
    auto commit = UpdateRegtestParameters(1, COIN, MAX_PHASE_TIMEOUT + 1, 60, 100);
    ASSERT_FALSE(commit.has_value());
    EXPECT_EQ(strprintf("-committimeout must be within [1, %d]", MAX_PHASE_TIMEOUT), commit.error());

    auto reveal = UpdateRegtestParameters(1, COIN, 60, std::numeric_limits<int64_t>::max(), 100);
    ASSERT_FALSE(reveal.has_value());
    EXPECT_EQ(strprintf("-revealtimeout must be within [1, %d]", MAX_PHASE_TIMEOUT), reveal.error());
    EXPECT_EQ(60, ParamsForNetwork("regtest").value()->RevealTimeout());

    ASSERT_TRUE(UpdateRegtestParameters(1, COIN, MAX_PHASE_TIMEOUT, MAX_PHASE_TIMEOUT, 100).has_value());
    EXPECT_EQ(MAX_PHASE_TIMEOUT, ParamsForNetwork("regtest").value()->CommitTimeout());
}

TEST_F(ArenaParamsTest, OversizedTimeoutOverrideRejected) {
    SetArgs({"-network=regtest", "-committimeout=9223372036854775807"});
    auto result = SelectParamsFromArgs();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(strprintf("-committimeout must be within [1, %d]", MAX_PHASE_TIMEOUT), result.error());
    EXPECT_EQ(60, ParamsForNetwork("regtest").value()->CommitTimeout());
}
