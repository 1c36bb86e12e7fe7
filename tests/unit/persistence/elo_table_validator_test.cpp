/// @file elo_table_validator_test.cpp
/// @brief Unit tests for the external Elo table cross-check.

#include <gtest/gtest.h>

#include <sstream>

#include "tfe/persistence/elo_table_validator.hpp"

using namespace tfe::persistence;
using tfe::features::FeatureRow;
using tfe::foundation::ErrorCode;
using tfe::foundation::PlayerId;

namespace {

FeatureRow row(std::string id, int64_t p1, int64_t p2, double elo1, double elo2) {
    FeatureRow r;
    r.features.matchId = std::move(id);
    r.features.p1Id = PlayerId{p1};
    r.features.p2Id = PlayerId{p2};
    r.features.p1.elo = elo1;
    r.features.p2.elo = elo2;
    return r;
}

ExternalEloRecord external(std::string id, int64_t p1, int64_t p2, double elo1, double elo2) {
    return ExternalEloRecord{std::move(id), PlayerId{p1}, PlayerId{p2}, elo1, elo2};
}

} // namespace

class EloTableValidatorTest : public ::testing::Test {
protected:
    std::vector<FeatureRow> rows_ = {
        row("m1", 1, 2, 1500.0, 1500.0),
        row("m2", 1, 2, 1516.0, 1484.0),
        row("m3", 2, 3, 1468.2, 1500.0),
    };
};

TEST_F(EloTableValidatorTest, ConsistentTable) {
    auto report = EloTableValidator().validate(
        rows_, {external("m1", 1, 2, 1500.0, 1500.0), external("m2", 1, 2, 1516.0, 1484.0)});
    EXPECT_EQ(report.compared, 2u);
    EXPECT_TRUE(report.consistent());
}

TEST_F(EloTableValidatorTest, SwappedSidesAreMatched) {
    auto report = EloTableValidator().validate(rows_, {external("m2", 2, 1, 1484.0, 1516.0)});
    EXPECT_EQ(report.compared, 1u);
    EXPECT_TRUE(report.consistent());
}

TEST_F(EloTableValidatorTest, ReportsDifferences) {
    auto report = EloTableValidator().validate(
        rows_, {
                   external("m1", 1, 2, 1500.0, 1500.5),
                   external("m2", 1, 4, 1516.0, 1484.0),
                   external("m9", 1, 2, 1500.0, 1500.0),
                   external("m3", 2, 3, 1468.2, 1500.0),
                   external("m3", 2, 3, 1.0, 1.0),
               });

    EXPECT_FALSE(report.consistent());
    EXPECT_EQ(report.compared, 3u);
    EXPECT_EQ(report.mismatched, std::vector<std::string>{"m1"});
    EXPECT_EQ(report.mismatchedIds, std::vector<std::string>{"m2"});
    EXPECT_EQ(report.missing, std::vector<std::string>{"m9"});
    EXPECT_EQ(report.duplicates, std::vector<std::string>{"m3"});
}

TEST_F(EloTableValidatorTest, Tolerance) {
    auto loose = EloTableValidator(1.0).validate(rows_, {external("m1", 1, 2, 1500.5, 1499.5)});
    EXPECT_TRUE(loose.consistent());
    EXPECT_DOUBLE_EQ(EloTableValidator(1.0).tolerance(), 1.0);

    auto strict = EloTableValidator().validate(rows_, {external("m1", 1, 2, 1500.5, 1499.5)});
    EXPECT_FALSE(strict.consistent());
}

TEST(EloTableReaderTest, ReadsRows) {
    std::istringstream in(
        "p1_elo,match_id,p2_elo,p1_id,p2_id,extra\n"
        "1516,m2,1484.25,1,2,x\n"
        "\n");
    auto result = readEloTable(in);
    ASSERT_TRUE(result.hasValue());
    ASSERT_EQ(result.value().size(), 1u);
    const auto& rec = result.value()[0];
    EXPECT_EQ(rec.matchId, "m2");
    EXPECT_EQ(rec.p1Id, PlayerId{1});
    EXPECT_EQ(rec.p2Id, PlayerId{2});
    EXPECT_DOUBLE_EQ(rec.p1Elo, 1516.0);
    EXPECT_DOUBLE_EQ(rec.p2Elo, 1484.25);
}

TEST(EloTableReaderTest, AcceptsBomAndPaddedHeader) {
    std::istringstream in(
        "\xEF\xBB\xBFmatch_id, p1_id, p2_id ,p1_elo,p2_elo\n"
        "m1,1,2, 1500.5 ,1499.5\n");
    auto result = readEloTable(in);
    ASSERT_TRUE(result.hasValue());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].matchId, "m1");
    EXPECT_DOUBLE_EQ(result.value()[0].p1Elo, 1500.5);
    EXPECT_DOUBLE_EQ(result.value()[0].p2Elo, 1499.5);
}

TEST(EloTableReaderTest, ParsesShortestRoundTripDoubles) {
    std::istringstream in(
        "match_id,p1_id,p2_id,p1_elo,p2_elo\n"
        "m1,1,2,1515.9999999999998,1484.0000000000002\n");
    auto result = readEloTable(in);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value()[0].p1Elo, 1515.9999999999998);
    EXPECT_EQ(result.value()[0].p2Elo, 1484.0000000000002);
}

TEST(EloTableReaderTest, EmptyTable) {
    std::istringstream in("");
    auto result = readEloTable(in);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::MalformedRecord);
}

TEST(EloTableReaderTest, MissingColumn) {
    std::istringstream in("match_id,p1_id,p2_id,p1_elo\nm1,1,2,1500\n");
    auto result = readEloTable(in);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::MissingColumn);
}

TEST(EloTableReaderTest, BadRow) {
    std::istringstream in("match_id,p1_id,p2_id,p1_elo,p2_elo\nm1,1,2,abc,1500\n");
    auto result = readEloTable(in);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::MalformedRecord);

    std::istringstream trailing("match_id,p1_id,p2_id,p1_elo,p2_elo\nm1,1,2,1500x,1500\n");
    EXPECT_TRUE(readEloTable(trailing).hasError());
}

TEST(EloTableReaderTest, MissingFile) {
    auto result = loadEloTable("/nonexistent/tfe/elo.csv");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::FileOpenFailed);
}
