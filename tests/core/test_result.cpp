// TRIBUTARY - Result Code Tests
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include <gtest/gtest.h>

#include "tributary/core/result.h"

#include <string>

namespace tributary {
namespace {

TEST(ResultCodeTest, ToString) {
    EXPECT_STREQ(ResultCodeToString(ResultCode::Success), "Success");
    EXPECT_STREQ(ResultCodeToString(ResultCode::EpochIdMismatch), "EpochIdMismatch");
    EXPECT_STREQ(ResultCodeToString(ResultCode::ZeroWeightAfterNormalization),
                 "ZeroWeightAfterNormalization");
    EXPECT_STREQ(ResultCodeToString(ResultCode::InsufficientAllowance),
                 "InsufficientAllowance");
}

TEST(ResultCodeTest, Categories) {
    EXPECT_EQ(GetErrorCategory(ResultCode::Success), ErrorCategory::None);
    EXPECT_EQ(GetErrorCategory(ResultCode::ArrayLengthMismatch), ErrorCategory::InputValidation);
    EXPECT_EQ(GetErrorCategory(ResultCode::DuplicateTarget), ErrorCategory::InputValidation);
    EXPECT_EQ(GetErrorCategory(ResultCode::ZeroAddress), ErrorCategory::InputValidation);
    EXPECT_EQ(GetErrorCategory(ResultCode::DeadlineExpired), ErrorCategory::TemporalGuard);
    EXPECT_EQ(GetErrorCategory(ResultCode::AlreadyVotedThisEpoch), ErrorCategory::TemporalGuard);
    EXPECT_EQ(GetErrorCategory(ResultCode::AlreadyDead), ErrorCategory::TemporalGuard);
    EXPECT_EQ(GetErrorCategory(ResultCode::EpochIdMismatch), ErrorCategory::EconomicGuard);
    EXPECT_EQ(GetErrorCategory(ResultCode::MaxPaymentExceeded), ErrorCategory::EconomicGuard);
    EXPECT_EQ(GetErrorCategory(ResultCode::EmptyAssets), ErrorCategory::EconomicGuard);
    EXPECT_EQ(GetErrorCategory(ResultCode::ZeroWeightAfterNormalization),
              ErrorCategory::EconomicGuard);
    EXPECT_EQ(GetErrorCategory(ResultCode::InsufficientBalance), ErrorCategory::Asset);
}

TEST(ResultCodeTest, EveryCodeHasAName) {
    for (int i = 0; i <= static_cast<int>(ResultCode::InsufficientAllowance); ++i) {
        std::string name = ResultCodeToString(static_cast<ResultCode>(i));
        EXPECT_NE(name, "Unknown") << "code " << i;
    }
}

TEST(ResultCodeTest, RetryableCodes) {
    EXPECT_TRUE(IsRetryable(ResultCode::EpochIdMismatch));
    EXPECT_TRUE(IsRetryable(ResultCode::MaxPaymentExceeded));
    EXPECT_TRUE(IsRetryable(ResultCode::DeadlineExpired));
    EXPECT_FALSE(IsRetryable(ResultCode::DuplicateTarget));
    EXPECT_FALSE(IsRetryable(ResultCode::AlreadyDead));
    EXPECT_FALSE(IsRetryable(ResultCode::Success));
}

TEST(ResultCodeTest, CategoryNames) {
    EXPECT_STREQ(ErrorCategoryToString(ErrorCategory::EconomicGuard), "EconomicGuard");
    EXPECT_STREQ(ErrorCategoryToString(ErrorCategory::None), "None");
    EXPECT_TRUE(IsSuccess(ResultCode::Success));
    EXPECT_FALSE(IsSuccess(ResultCode::NoWeight));
}

} // namespace
} // namespace tributary
