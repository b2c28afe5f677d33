// TRIBUTARY - Operation Result Codes Implementation
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include "tributary/core/result.h"

namespace tributary {

const char* ResultCodeToString(ResultCode code) {
    switch (code) {
        case ResultCode::Success: return "Success";
        case ResultCode::ArrayLengthMismatch: return "ArrayLengthMismatch";
        case ResultCode::ZeroAddress: return "ZeroAddress";
        case ResultCode::DuplicateTarget: return "DuplicateTarget";
        case ResultCode::InvalidAmount: return "InvalidAmount";
        case ResultCode::InvalidParameter: return "InvalidParameter";
        case ResultCode::UnknownStrategy: return "UnknownStrategy";
        case ResultCode::UnknownToken: return "UnknownToken";
        case ResultCode::RewardTokenAlreadyRegistered: return "RewardTokenAlreadyRegistered";
        case ResultCode::RewardTokenNotRegistered: return "RewardTokenNotRegistered";
        case ResultCode::NotAuthorized: return "NotAuthorized";
        case ResultCode::DeadlineExpired: return "DeadlineExpired";
        case ResultCode::AlreadyVotedThisEpoch: return "AlreadyVotedThisEpoch";
        case ResultCode::AlreadyResetThisEpoch: return "AlreadyResetThisEpoch";
        case ResultCode::AlreadyDead: return "AlreadyDead";
        case ResultCode::EpochIdMismatch: return "EpochIdMismatch";
        case ResultCode::MaxPaymentExceeded: return "MaxPaymentExceeded";
        case ResultCode::EmptyAssets: return "EmptyAssets";
        case ResultCode::ZeroWeightAfterNormalization: return "ZeroWeightAfterNormalization";
        case ResultCode::NoWeight: return "NoWeight";
        case ResultCode::RewardTooSmall: return "RewardTooSmall";
        case ResultCode::InsufficientBalance: return "InsufficientBalance";
        case ResultCode::InsufficientAllowance: return "InsufficientAllowance";
        default: return "Unknown";
    }
}

const char* ErrorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::InputValidation: return "InputValidation";
        case ErrorCategory::TemporalGuard: return "TemporalGuard";
        case ErrorCategory::EconomicGuard: return "EconomicGuard";
        case ErrorCategory::Asset: return "Asset";
        default: return "Unknown";
    }
}

ErrorCategory GetErrorCategory(ResultCode code) {
    switch (code) {
        case ResultCode::Success:
            return ErrorCategory::None;

        case ResultCode::ArrayLengthMismatch:
        case ResultCode::ZeroAddress:
        case ResultCode::DuplicateTarget:
        case ResultCode::InvalidAmount:
        case ResultCode::InvalidParameter:
        case ResultCode::UnknownStrategy:
        case ResultCode::UnknownToken:
        case ResultCode::RewardTokenAlreadyRegistered:
        case ResultCode::RewardTokenNotRegistered:
        case ResultCode::NotAuthorized:
            return ErrorCategory::InputValidation;

        case ResultCode::DeadlineExpired:
        case ResultCode::AlreadyVotedThisEpoch:
        case ResultCode::AlreadyResetThisEpoch:
        case ResultCode::AlreadyDead:
            return ErrorCategory::TemporalGuard;

        case ResultCode::EpochIdMismatch:
        case ResultCode::MaxPaymentExceeded:
        case ResultCode::EmptyAssets:
        case ResultCode::ZeroWeightAfterNormalization:
        case ResultCode::NoWeight:
        case ResultCode::RewardTooSmall:
            return ErrorCategory::EconomicGuard;

        case ResultCode::InsufficientBalance:
        case ResultCode::InsufficientAllowance:
            return ErrorCategory::Asset;
    }
    return ErrorCategory::None;
}

} // namespace tributary
