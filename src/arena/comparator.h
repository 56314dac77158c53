// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ARENA_ARENA_COMPARATOR_H
#define ARENA_ARENA_COMPARATOR_H

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace arena {

/**
 * Decides a commit-reveal match from the two revealed payloads. Implementations
 * must be deterministic total orders; the engine awards ties to the creator.
 */
class CMoveComparator
{
public:
    virtual ~CMoveComparator() {}

    /** Negative if a loses to b, zero on a tie, positive if a beats b. */
    virtual int Compare(const std::vector<unsigned char>& a, const std::vector<unsigned char>& b) const = 0;

    virtual std::string GetName() const = 0;
};

/** Unsigned byte-wise order; on an equal prefix the longer payload wins. */
class CLexicographicComparator : public CMoveComparator
{
public:
    int Compare(const std::vector<unsigned char>& a, const std::vector<unsigned char>& b) const override;
    std::string GetName() const override { return "lexicographic"; }
};

/**
 * Payloads are big-endian unsigned integers of any width, so a sealed bid
 * encoded as bytes wins when it is numerically larger.
 */
class CNumericComparator : public CMoveComparator
{
public:
    int Compare(const std::vector<unsigned char>& a, const std::vector<unsigned char>& b) const override;
    std::string GetName() const override { return "numeric"; }
};

/** Comparator lookup by game-type tag, falling back to lexicographic order. */
class CMoveComparatorRegistry
{
private:
    std::map<std::string, std::shared_ptr<const CMoveComparator>> mapComparators;
    std::shared_ptr<const CMoveComparator> fallback;

public:
    CMoveComparatorRegistry();

    /** Install or replace the comparator for a game type. A null pointer removes it. */
    void Register(const std::string& gameType, std::shared_ptr<const CMoveComparator> comparator);

    const CMoveComparator& Get(const std::string& gameType) const;
};

} // namespace arena

#endif // ARENA_ARENA_COMPARATOR_H
