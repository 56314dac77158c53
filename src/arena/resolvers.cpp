// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "arena/resolvers.h"

#include "logging.h"
#include "util/system.h"

namespace arena {

CResolverSet::CResolverSet(const std::vector<CAccountID>& vResolvers)
{
    for (const CAccountID& resolver : vResolvers)
        Add(resolver);
}

void CResolverSet::Add(const CAccountID& resolver)
{
    if (!resolver.IsNull())
        setResolvers.insert(resolver);
}

bool CResolverSet::IsResolver(const CAccountID& account) const
{
    return !account.IsNull() && setResolvers.count(account) > 0;
}

CResolverSet ResolverSetFromArgs()
{
    CResolverSet resolvers;
    auto it = mapMultiArgs.find("-resolver");
    if (it != mapMultiArgs.end()) {
        for (const std::string& strResolver : it->second)
            resolvers.Add(CAccountID(strResolver));
    }
    if (resolvers.IsEmpty())
        LogPrintf("No -resolver configured; resolver-only operations will be rejected\n");
    return resolvers;
}

} // namespace arena
