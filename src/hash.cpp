// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "hash.h"

static void EnsureSodium()
{
    static const int nInit = sodium_init();
    if (nInit < 0)
        throw std::runtime_error("sodium_init failed");
}

CBLAKE2bWriter::CBLAKE2bWriter(const unsigned char* personal)
{
    EnsureSodium();
    if (crypto_generichash_blake2b_init_salt_personal(
            &state,
            NULL, 0, // No key.
            32,
            NULL,    // No salt.
            personal) != 0) {
        throw std::runtime_error("CBLAKE2bWriter: BLAKE2b initialisation failed");
    }
}

CBLAKE2bWriter& CBLAKE2bWriter::write(const unsigned char* pch, size_t size)
{
    crypto_generichash_blake2b_update(&state, pch, size);
    return (*this);
}

uint256 CBLAKE2bWriter::GetHash()
{
    uint256 result;
    crypto_generichash_blake2b_final(&state, result.begin(), 32);
    return result;
}

uint256 CommitmentHash(const std::vector<unsigned char>& vchMove, const uint256& salt)
{
    CBLAKE2bWriter ss(COMMITMENT_PERSONALIZATION);
    ss.write(vchMove.data(), vchMove.size());
    ss.write(salt.begin(), salt.size());
    return ss.GetHash();
}
