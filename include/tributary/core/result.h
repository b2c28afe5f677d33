// TRIBUTARY - Operation Result Codes
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License
//
// Every mutating ledger, auction, stream and router operation reports its
// outcome as a ResultCode. A code other than Success means the call had no
// effect on any state.

#ifndef TRIBUTARY_CORE_RESULT_H
#define TRIBUTARY_CORE_RESULT_H

#include <cstdint>
#include <string>

namespace tributary {

// ============================================================================
// Result Codes
// ============================================================================

enum class ResultCode : uint8_t {
    Success = 0,

    // Input validation
    ArrayLengthMismatch,
    ZeroAddress,
    DuplicateTarget,
    InvalidAmount,
    InvalidParameter,
    UnknownStrategy,
    UnknownToken,
    RewardTokenAlreadyRegistered,
    RewardTokenNotRegistered,
    NotAuthorized,

    // Temporal guards
    DeadlineExpired,
    AlreadyVotedThisEpoch,
    AlreadyResetThisEpoch,
    AlreadyDead,

    // Economic guards
    EpochIdMismatch,
    MaxPaymentExceeded,
    EmptyAssets,
    ZeroWeightAfterNormalization,
    NoWeight,
    RewardTooSmall,

    // Asset ledger
    InsufficientBalance,
    InsufficientAllowance,
};

/// Error taxonomy used by callers to decide between fixing input and retrying
enum class ErrorCategory : uint8_t {
    None,
    InputValidation,
    TemporalGuard,
    EconomicGuard,
    Asset,
};

/// Convert result code to string
const char* ResultCodeToString(ResultCode code);

/// Convert error category to string
const char* ErrorCategoryToString(ErrorCategory category);

/// Category a result code belongs to (None for Success)
ErrorCategory GetErrorCategory(ResultCode code);

/**
 * Economic guards are the routine outcome of honest callers racing each
 * other; they are safe to retry against fresh state.
 */
inline bool IsRetryable(ResultCode code) {
    return GetErrorCategory(code) == ErrorCategory::EconomicGuard ||
           code == ResultCode::DeadlineExpired;
}

inline bool IsSuccess(ResultCode code) {
    return code == ResultCode::Success;
}

} // namespace tributary

#endif // TRIBUTARY_CORE_RESULT_H
