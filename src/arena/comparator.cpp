// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "arena/comparator.h"

#include <algorithm>

namespace arena {

int CLexicographicComparator::Compare(const std::vector<unsigned char>& a, const std::vector<unsigned char>& b) const
{
    size_t nCommon = std::min(a.size(), b.size());
    for (size_t i = 0; i < nCommon; i++) {
        if (a[i] != b[i])
            return a[i] < b[i] ? -1 : 1;
    }
    if (a.size() == b.size())
        return 0;
    return a.size() < b.size() ? -1 : 1;
}

int CNumericComparator::Compare(const std::vector<unsigned char>& a, const std::vector<unsigned char>& b) const
{
    // Skip leading zero bytes so widths don't matter.
    auto ita = std::find_if(a.begin(), a.end(), [](unsigned char c) { return c != 0; });
    auto itb = std::find_if(b.begin(), b.end(), [](unsigned char c) { return c != 0; });
    size_t nLenA = a.end() - ita;
    size_t nLenB = b.end() - itb;
    if (nLenA != nLenB)
        return nLenA < nLenB ? -1 : 1;
    for (; ita != a.end(); ++ita, ++itb) {
        if (*ita != *itb)
            return *ita < *itb ? -1 : 1;
    }
    return 0;
}

CMoveComparatorRegistry::CMoveComparatorRegistry()
    : fallback(std::make_shared<CLexicographicComparator>())
{
}

void CMoveComparatorRegistry::Register(const std::string& gameType, std::shared_ptr<const CMoveComparator> comparator)
{
    if (comparator)
        mapComparators[gameType] = comparator;
    else
        mapComparators.erase(gameType);
}

const CMoveComparator& CMoveComparatorRegistry::Get(const std::string& gameType) const
{
    auto it = mapComparators.find(gameType);
    if (it == mapComparators.end())
        return *fallback;
    return *it->second;
}

} // namespace arena
