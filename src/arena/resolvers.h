// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ARENA_ARENA_RESOLVERS_H
#define ARENA_ARENA_RESOLVERS_H

#include "arena/ledger.h"

#include <set>
#include <vector>

namespace arena {

/**
 * The identities trusted to declare winners and to operate fee withdrawals
 * and tournament cancellation. Each engine holds its own copy.
 */
class CResolverSet
{
private:
    std::set<CAccountID> setResolvers;

public:
    CResolverSet() {}
    explicit CResolverSet(const std::vector<CAccountID>& vResolvers);

    void Add(const CAccountID& resolver);
    bool IsResolver(const CAccountID& account) const;
    bool IsEmpty() const { return setResolvers.empty(); }
    size_t Size() const { return setResolvers.size(); }
};

/** Build the resolver set from every -resolver=<id> option. */
CResolverSet ResolverSetFromArgs();

} // namespace arena

#endif // ARENA_ARENA_RESOLVERS_H
