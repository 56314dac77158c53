#include <gtest/gtest.h>

#include "amount.h"

TEST(AmountTests, MoneyRange) {
    EXPECT_TRUE(MoneyRange(0));
    EXPECT_TRUE(MoneyRange(MAX_MONEY));
    EXPECT_FALSE(MoneyRange(-1));
    EXPECT_FALSE(MoneyRange(MAX_MONEY + 1));
}

TEST(AmountTests, FeeRoundsDown) {
    CFeeRate rate(100);
    EXPECT_EQ(2000000, rate.GetFee(2 * COIN));
    EXPECT_EQ(123, rate.GetFee(12345));
    EXPECT_EQ(0, rate.GetFee(99));
    EXPECT_EQ(1, rate.GetFee(100));
    EXPECT_EQ(0, rate.GetFee(0));
    EXPECT_EQ(0, rate.GetFee(-COIN));

    EXPECT_EQ(0, CFeeRate().GetFee(COIN));
    EXPECT_EQ(COIN, CFeeRate(MAX_BASIS_POINTS).GetFee(COIN));
    EXPECT_EQ(2, CFeeRate(250).GetFee(99));
}

TEST(AmountTests, FeeDoesNotOverflowLargePots) {
    const CAmount nPot = 16 * MAX_MONEY;
    EXPECT_EQ(nPot / 100, CFeeRate(100).GetFee(nPot));
    EXPECT_EQ(nPot, CFeeRate(MAX_BASIS_POINTS).GetFee(nPot));
    EXPECT_EQ((nPot / 10000) * 9999 + (nPot % 10000) * 9999 / 10000, CFeeRate(9999).GetFee(nPot));
}

TEST(AmountTests, FeeRateToString) {
    EXPECT_EQ("1.00%", CFeeRate(100).ToString());
    EXPECT_EQ("2.50%", CFeeRate(250).ToString());
    EXPECT_EQ("0.05%", CFeeRate(5).ToString());
}

TEST(AmountTests, FormatMoney) {
    EXPECT_EQ("0.00000000", FormatMoney(0));
    EXPECT_EQ("1.00000001", FormatMoney(COIN + 1));
    EXPECT_EQ("-0.50000000", FormatMoney(-COIN / 2));
    EXPECT_EQ("21000000.00000000", FormatMoney(MAX_MONEY));
}
