// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ARENA_HASH_H
#define ARENA_HASH_H

#include "uint256.h"

#include <sodium.h>

#include <stdexcept>
#include <vector>

/** BLAKE2b personalization for move commitments. Exactly crypto_generichash_blake2b_PERSONALBYTES long. */
static const unsigned char COMMITMENT_PERSONALIZATION[crypto_generichash_blake2b_PERSONALBYTES] =
    {'A','r','e','n','a','C','o','m','m','i','t','H','a','s','h','_'};

/** Incrementally computes a personalised 256-bit BLAKE2b hash. */
class CBLAKE2bWriter
{
private:
    crypto_generichash_blake2b_state state;

public:
    explicit CBLAKE2bWriter(const unsigned char* personal);

    CBLAKE2bWriter& write(const unsigned char* pch, size_t size);

    uint256 GetHash();
};

/**
 * Digest binding a revealed move to its earlier commitment:
 * BLAKE2b-256(personal = "ArenaCommitHash_", move || salt).
 * The salt is fixed-width, so the concatenation is unambiguous.
 */
uint256 CommitmentHash(const std::vector<unsigned char>& vchMove, const uint256& salt);

#endif // ARENA_HASH_H
