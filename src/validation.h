// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ARENA_VALIDATION_H
#define ARENA_VALIDATION_H

#include <string>

/** "reject" codes for arena operations */
static const unsigned char REJECT_INVALID = 0x10;
static const unsigned char REJECT_STATE = 0x11;
static const unsigned char REJECT_UNAUTHORIZED = 0x12;
static const unsigned char REJECT_DUPLICATE = 0x13;
static const unsigned char REJECT_NOT_FOUND = 0x14;
static const unsigned char REJECT_TOO_EARLY = 0x15;

/**
 * Capture information about the outcome of a single state-changing call.
 *
 * MODE_INVALID is a precondition violation: the caller supplied the wrong
 * amount, called in the wrong state or is not entitled to the action. Nothing
 * changed and the caller may retry with corrected input.
 *
 * MODE_ERROR is a transfer failure: the funds gateway refused a deposit or
 * payout, the whole operation was rolled back and an operator has to look at
 * it. Retrying blindly is unsafe.
 */
class CValidationState {
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< precondition violated
        MODE_ERROR,   //!< funds could not be moved
    } mode;
    unsigned char chRejectCode;
    std::string strRejectReason;
public:
    CValidationState() : mode(MODE_VALID), chRejectCode(0) {}
    virtual ~CValidationState() {}

    virtual bool Invalid(bool ret = false,
                         unsigned char _chRejectCode=0, const std::string& _strRejectReason="") {
        chRejectCode = _chRejectCode;
        strRejectReason = _strRejectReason;
        if (mode == MODE_ERROR)
            return ret;
        mode = MODE_INVALID;
        return ret;
    }
    virtual bool Error(const std::string& strRejectReasonIn) {
        if (mode == MODE_VALID)
            strRejectReason = strRejectReasonIn;
        mode = MODE_ERROR;
        return false;
    }
    virtual bool IsValid() const {
        return mode == MODE_VALID;
    }
    virtual bool IsInvalid() const {
        return mode == MODE_INVALID;
    }
    virtual bool IsError() const {
        return mode == MODE_ERROR;
    }
    virtual unsigned char GetRejectCode() const { return chRejectCode; }
    virtual std::string GetRejectReason() const { return strRejectReason; }
};

/** Convert CValidationState to a human-readable message for logging */
std::string FormatStateMessage(const CValidationState &state);

#endif // ARENA_VALIDATION_H
