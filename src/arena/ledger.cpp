// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "arena/ledger.h"

#include "logging.h"

namespace arena {

bool CAccountLedger::Collect(const CAccountID& from, CAmount nAmount)
{
    LOCK(cs_ledger);
    if (from.IsNull() || nAmount <= 0 || !MoneyRange(nAmount))
        return false;

    auto it = mapBalances.find(from);
    if (it == mapBalances.end() || it->second < nAmount) {
        LogPrint("escrow", "ledger: %s cannot cover a deposit of %s\n", from.ToString(), FormatMoney(nAmount));
        return false;
    }

    it->second -= nAmount;
    nCustody += nAmount;
    LogPrint("escrow", "ledger: collected %s from %s\n", FormatMoney(nAmount), from.ToString());
    return true;
}

bool CAccountLedger::Send(const std::vector<CPayout>& vPayouts)
{
    LOCK(cs_ledger);

    // Validate the whole batch before touching any balance.
    CAmount nTotal = 0;
    for (const CPayout& payout : vPayouts) {
        if (payout.to.IsNull() || !MoneyRange(payout.nAmount))
            return false;
        if (setRejecting.count(payout.to)) {
            LogPrint("escrow", "ledger: %s rejects incoming transfers\n", payout.to.ToString());
            return false;
        }
        nTotal += payout.nAmount;
        if (!MoneyRange(nTotal))
            return false;
    }
    if (nTotal > nCustody) {
        LogPrint("escrow", "ledger: custody %s cannot cover %s\n", FormatMoney(nCustody), FormatMoney(nTotal));
        return false;
    }

    for (const CPayout& payout : vPayouts) {
        mapBalances[payout.to] += payout.nAmount;
        LogPrint("escrow", "ledger: sent %s to %s\n", FormatMoney(payout.nAmount), payout.to.ToString());
    }
    nCustody -= nTotal;
    return true;
}

void CAccountLedger::Credit(const CAccountID& account, CAmount nAmount)
{
    LOCK(cs_ledger);
    mapBalances[account] += nAmount;
}

void CAccountLedger::SetRejecting(const CAccountID& account, bool fReject)
{
    LOCK(cs_ledger);
    if (fReject)
        setRejecting.insert(account);
    else
        setRejecting.erase(account);
}

CAmount CAccountLedger::GetBalance(const CAccountID& account) const
{
    LOCK(cs_ledger);
    auto it = mapBalances.find(account);
    return it == mapBalances.end() ? 0 : it->second;
}

CAmount CAccountLedger::GetCustody() const
{
    LOCK(cs_ledger);
    return nCustody;
}

CAmount CAccountLedger::GetTotal() const
{
    LOCK(cs_ledger);
    CAmount nTotal = nCustody;
    for (const auto& entry : mapBalances)
        nTotal += entry.second;
    return nTotal;
}

} // namespace arena
