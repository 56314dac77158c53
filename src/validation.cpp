// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "validation.h"

#include "logging.h"

std::string FormatStateMessage(const CValidationState &state)
{
    if (state.IsError())
        return strprintf("%s (transfer failure)", state.GetRejectReason());
    return strprintf("%s (code %i)",
        state.GetRejectReason(),
        state.GetRejectCode());
}
