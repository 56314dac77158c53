// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ARENA_ARENA_LEDGER_H
#define ARENA_ARENA_LEDGER_H

#include "amount.h"
#include "sync.h"

#include <map>
#include <set>
#include <stdint.h>
#include <string>
#include <vector>

namespace arena {

/** Opaque participant identity. The empty key is the null account. */
class CAccountID
{
private:
    std::string strKey;

public:
    CAccountID() {}
    explicit CAccountID(const std::string& strKeyIn) : strKey(strKeyIn) {}

    bool IsNull() const { return strKey.empty(); }
    void SetNull() { strKey.clear(); }
    const std::string& ToString() const { return strKey; }

    friend bool operator==(const CAccountID& a, const CAccountID& b) { return a.strKey == b.strKey; }
    friend bool operator!=(const CAccountID& a, const CAccountID& b) { return a.strKey != b.strKey; }
    friend bool operator<(const CAccountID& a, const CAccountID& b) { return a.strKey < b.strKey; }
};

/** A single outgoing transfer from custody. */
struct CPayout
{
    CAccountID to;
    CAmount nAmount;

    CPayout(const CAccountID& toIn, CAmount nAmountIn) : to(toIn), nAmount(nAmountIn) {}

    friend bool operator==(const CPayout& a, const CPayout& b) { return a.to == b.to && a.nAmount == b.nAmount; }
};

/**
 * Boundary through which the engines move value. Both calls are atomic: they
 * either fully succeed and return true, or change nothing and return false.
 */
class CFundsGateway
{
public:
    virtual ~CFundsGateway() {}

    /** Move a deposit of nAmount from a participant into custody. */
    virtual bool Collect(const CAccountID& from, CAmount nAmount) = 0;

    /** Deliver every payout in the batch out of custody, or none of them. */
    virtual bool Send(const std::vector<CPayout>& vPayouts) = 0;
};

/**
 * In-memory funds gateway. Participant balances plus the custody balance are
 * conserved by every successful call; failed calls leave both untouched.
 */
class CAccountLedger : public CFundsGateway
{
private:
    mutable Mutex cs_ledger;
    std::map<CAccountID, CAmount> mapBalances;
    std::set<CAccountID> setRejecting;
    CAmount nCustody = 0;

public:
    bool Collect(const CAccountID& from, CAmount nAmount) override;
    bool Send(const std::vector<CPayout>& vPayouts) override;

    /** Fund a participant from outside the system. */
    void Credit(const CAccountID& account, CAmount nAmount);

    /** While set, every Send that includes this recipient fails. */
    void SetRejecting(const CAccountID& account, bool fReject);

    CAmount GetBalance(const CAccountID& account) const;
    CAmount GetCustody() const;
    /** Sum of all participant balances and custody. */
    CAmount GetTotal() const;
};

/** Hands out 0, 1, 2, ... and never rewinds. */
class CIdSequence
{
private:
    uint64_t nNext = 0;

public:
    uint64_t Next() { return nNext++; }
    /** The id the next call to Next() returns. */
    uint64_t Peek() const { return nNext; }
};

} // namespace arena

#endif // ARENA_ARENA_LEDGER_H
