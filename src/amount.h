// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ARENA_AMOUNT_H
#define ARENA_AMOUNT_H

#include <stdint.h>
#include <stdlib.h>
#include <string>

/** Amount in the smallest indivisible unit of the settlement currency. */
typedef int64_t CAmount;

static const CAmount COIN = 100000000;

extern const std::string CURRENCY_UNIT;

/** No amount larger than this is valid as a single wager, fee or payout. */
static const CAmount MAX_MONEY = 21000000 * COIN;
inline bool MoneyRange(const CAmount& nValue) { return (nValue >= 0 && nValue <= MAX_MONEY); }

/** Fees are expressed in basis points of the pot; 10000 bps is the whole pot. */
static const int64_t MAX_BASIS_POINTS = 10000;

/**
 * Proportional fee rate, in basis points of a pot.
 */
class CFeeRate
{
private:
    int64_t nBasisPoints;
public:
    CFeeRate() : nBasisPoints(0) { }
    explicit CFeeRate(int64_t _nBasisPoints): nBasisPoints(_nBasisPoints) { }

    /**
     * floor(nPot * bps / 10000). The pot is split into quotient and remainder
     * so the product never overflows for any pot up to 16 * MAX_MONEY.
     */
    CAmount GetFee(CAmount nPot) const;
    int64_t GetBasisPoints() const { return nBasisPoints; }

    friend bool operator==(const CFeeRate& a, const CFeeRate& b) { return a.nBasisPoints == b.nBasisPoints; }
    friend bool operator!=(const CFeeRate& a, const CFeeRate& b) { return a.nBasisPoints != b.nBasisPoints; }
    std::string ToString() const;
};

std::string FormatMoney(const CAmount& n);

#endif //  ARENA_AMOUNT_H
