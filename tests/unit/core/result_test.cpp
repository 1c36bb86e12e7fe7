/// @file result_test.cpp
/// @brief Unit tests for Result<T, E> as used across the engine.

#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

#include "tfe/tfe.hpp"

using tfe::Error;
using tfe::Result;
using tfe::foundation::EngineError;
using tfe::foundation::EngineResult;
using tfe::foundation::ErrorCode;
using tfe::foundation::PlayerId;

namespace {

EngineResult<PlayerId> positiveId(int64_t raw) {
    if (raw <= 0) {
        return EngineResult<PlayerId>::err(
            EngineError(ErrorCode::MalformedRecord, "non-positive id", std::string("row-7")));
    }
    return EngineResult<PlayerId>::ok(PlayerId{raw});
}

} // namespace

TEST(ResultTest, SuccessCarriesValue) {
    auto result = positiveId(104925);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), PlayerId{104925});
}

TEST(ResultTest, FailureCarriesEngineErrorAndContext) {
    auto result = positiveId(0);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::MalformedRecord);
    EXPECT_EQ(result.error().message(), "non-positive id");
    ASSERT_NE(result.error().context<std::string>(), nullptr);
    EXPECT_EQ(*result.error().context<std::string>(), "row-7");
    EXPECT_EQ(result.error().context<int>(), nullptr);
}

TEST(ResultTest, ValueOrFallsBackOnError) {
    EXPECT_EQ(positiveId(-3).valueOr(PlayerId{1}), PlayerId{1});
    EXPECT_EQ(positiveId(5).valueOr(PlayerId{1}), PlayerId{5});
}

TEST(ResultTest, WrongAlternativeThrows) {
    auto ok = Result<double>::ok(1516.0);
    auto bad = Result<double>::err(Error(7, "no rating"));
    EXPECT_THROW((void)ok.error(), std::bad_variant_access);
    EXPECT_THROW((void)bad.value(), std::bad_variant_access);
    EXPECT_EQ(bad.error().code, 7);
    EXPECT_EQ(bad.error().message, "no rating");
}

TEST(ResultTest, DefaultErrorCode) {
    EXPECT_EQ(Error("plain").code, -1);
    EXPECT_EQ(Error().code, 0);
}

TEST(ResultTest, MutableAndMovedValue) {
    auto result = Result<std::vector<std::string>>::ok({"m1"});
    result.value().push_back("m2");
    ASSERT_EQ(result.value().size(), 2u);

    std::vector<std::string> ids = std::move(result).value();
    EXPECT_EQ(ids, (std::vector<std::string>{"m1", "m2"}));
}

TEST(ResultVoidTest, SuccessAndFailure) {
    auto ok = EngineResult<void>::ok();
    EXPECT_TRUE(ok);
    EXPECT_TRUE(ok.hasValue());

    auto failed = EngineResult<void>::err(EngineError(ErrorCode::TableCommitFailed, "rename"));
    EXPECT_FALSE(failed);
    EXPECT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().code(), ErrorCode::TableCommitFailed);
    EXPECT_EQ(failed.error().subsystem(), "Persistence");
}
