// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ARENA_RPC_PROTOCOL_H
#define ARENA_RPC_PROTOCOL_H

#include <string>

#include <univalue.h>

//! Error codes carried by a thrown JSONRPCError object
enum RPCErrorCode
{
    //! General application defined errors
    RPC_MISC_ERROR                  = -1,  //!< std::exception thrown in command handling
    RPC_TYPE_ERROR                  = -3,  //!< Unexpected type was passed as parameter
    RPC_INVALID_PARAMETER           = -8,  //!< Invalid, missing or duplicate parameter

    //! Arena errors
    RPC_MATCH_NOT_FOUND             = -40, //!< No match with the given id
    RPC_TOURNAMENT_NOT_FOUND        = -41, //!< No tournament with the given id
};

UniValue JSONRPCError(int code, const std::string& message);

#endif // ARENA_RPC_PROTOCOL_H
