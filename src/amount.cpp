// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "amount.h"

#include "logging.h"

const std::string CURRENCY_UNIT = "ARN";

CAmount CFeeRate::GetFee(CAmount nPot) const
{
    if (nPot <= 0 || nBasisPoints <= 0)
        return 0;
    CAmount nFee = (nPot / MAX_BASIS_POINTS) * nBasisPoints
                 + (nPot % MAX_BASIS_POINTS) * nBasisPoints / MAX_BASIS_POINTS;
    return nFee;
}

std::string CFeeRate::ToString() const
{
    return strprintf("%d.%02d%%", nBasisPoints / 100, nBasisPoints % 100);
}

std::string FormatMoney(const CAmount& n)
{
    // Note: not using straight sprintf here because we do NOT want
    // localized number formatting.
    int64_t n_abs = (n > 0 ? n : -n);
    int64_t quotient = n_abs/COIN;
    int64_t remainder = n_abs%COIN;
    std::string str = strprintf("%d.%08d", quotient, remainder);

    if (n < 0)
        str.insert((unsigned int)0, 1, '-');
    return str;
}
