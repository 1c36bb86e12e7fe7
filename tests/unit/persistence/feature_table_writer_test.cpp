/// @file feature_table_writer_test.cpp
/// @brief Unit tests for FeatureTableWriter.

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "tfe/foundation/time_utils.hpp"
#include "tfe/ingest/csv_source.hpp"
#include "tfe/persistence/feature_table_writer.hpp"

using namespace tfe::persistence;
using tfe::features::FeatureRow;
using tfe::features::Handedness;
using tfe::foundation::ErrorCode;
using tfe::foundation::makeDate;
using tfe::foundation::PlayerId;
using tfe::ingest::splitCsvLine;
using tfe::rating::Surface;

namespace {

FeatureRow sampleRow() {
    FeatureRow row;
    auto& fv = row.features;
    fv.matchId = "2023-0339-300";
    fv.p1Id = PlayerId{104925};
    fv.p2Id = PlayerId{106421};
    fv.surface = Surface::Clay;
    fv.date = makeDate(2023, 5, 28);
    fv.p1.rank = 1;
    fv.p1.elo = 1612.5;
    fv.p1.winPerc = 0.75;
    fv.p1.restDays = 4;
    fv.p1.hand = Handedness::Right;
    fv.p2.rank = 7;
    fv.p2.elo = 1500.0;
    fv.p2.restDays = 30;
    fv.p2.hand = Handedness::Left;
    fv.rankDiff = -6;
    fv.eloDiff = 112.5;
    fv.restDiff = -26;
    row.winner = 1;
    return row;
}

std::size_t columnIndex(const std::string& name) {
    auto names = splitCsvLine(FeatureTableWriter::header());
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) {
            return i;
        }
    }
    ADD_FAILURE() << "no column " << name;
    return 0;
}

std::string readAll(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST(FeatureTableWriterTest, HeaderLayout) {
    auto names = splitCsvLine(FeatureTableWriter::header());
    ASSERT_EQ(names.size(), FeatureTableWriter::columnCount());
    EXPECT_EQ(names.size(), 48u);
    EXPECT_EQ(names.front(), "match_id");
    EXPECT_EQ(names[1], "date");
    EXPECT_EQ(names[5], "p1_rank");
    EXPECT_EQ(names[6], "p2_rank");
    EXPECT_EQ(names.back(), "winner");
}

TEST(FeatureTableWriterTest, FormatRowValues) {
    auto fields = splitCsvLine(FeatureTableWriter::formatRow(sampleRow()));
    ASSERT_EQ(fields.size(), FeatureTableWriter::columnCount());

    EXPECT_EQ(fields[columnIndex("match_id")], "2023-0339-300");
    EXPECT_EQ(fields[columnIndex("date")], "2023-05-28");
    EXPECT_EQ(fields[columnIndex("surface")], "Clay");
    EXPECT_EQ(fields[columnIndex("p1_id")], "104925");
    EXPECT_EQ(fields[columnIndex("p1_elo")], "1612.5");
    EXPECT_EQ(fields[columnIndex("p2_elo")], "1500");
    EXPECT_EQ(fields[columnIndex("p1_win_perc")], "0.75");
    EXPECT_EQ(fields[columnIndex("p2_win_perc")], "0");
    EXPECT_EQ(fields[columnIndex("p2_rest_days")], "30");
    EXPECT_EQ(fields[columnIndex("p1_hand")], "R");
    EXPECT_EQ(fields[columnIndex("p2_hand")], "L");
    EXPECT_EQ(fields[columnIndex("rank_diff")], "-6");
    EXPECT_EQ(fields[columnIndex("elo_diff")], "112.5");
    EXPECT_EQ(fields[columnIndex("rest_diff")], "-26");
    EXPECT_EQ(fields[columnIndex("winner")], "1");
}

TEST(FeatureTableWriterTest, QuotesMatchIdWithComma) {
    auto row = sampleRow();
    row.features.matchId = "Halle, R1";
    auto line = FeatureTableWriter::formatRow(row);
    EXPECT_EQ(line.rfind("\"Halle, R1\",", 0), 0u);
    EXPECT_EQ(splitCsvLine(line)[0], "Halle, R1");
}

TEST(FeatureTableWriterTest, WriteToStream) {
    std::ostringstream out;
    ASSERT_TRUE(FeatureTableWriter::write(out, {sampleRow(), sampleRow()}).hasValue());
    EXPECT_EQ(out.str(), FeatureTableWriter::header() + "\n" +
                             FeatureTableWriter::formatRow(sampleRow()) + "\n" +
                             FeatureTableWriter::formatRow(sampleRow()) + "\n");
}

class FeatureTableFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = std::filesystem::temp_directory_path() /
                  (std::string("tfe_writer_") + info->name());
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path tmpDir_;
};

TEST_F(FeatureTableFileTest, WriteCommitsAtomically) {
    auto path = tmpDir_ / "features.csv";
    {
        std::ofstream old(path);
        old << "stale\n";
    }

    ASSERT_TRUE(FeatureTableWriter::write(path, {sampleRow()}).hasValue());

    EXPECT_EQ(readAll(path), FeatureTableWriter::header() + "\n" +
                                 FeatureTableWriter::formatRow(sampleRow()) + "\n");
    EXPECT_FALSE(std::filesystem::exists(tmpDir_ / "features.csv.tmp"));
}

TEST_F(FeatureTableFileTest, UnwritableDirectoryFails) {
    auto path = tmpDir_ / "missing" / "features.csv";
    auto result = FeatureTableWriter::write(path, {sampleRow()});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::TableWriteFailed);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(FeatureTableFileTest, FailedCommitRemovesTemporary) {
    // A directory in the way makes the final rename fail.
    auto path = tmpDir_ / "features.csv";
    std::filesystem::create_directories(path / "occupied");

    auto result = FeatureTableWriter::write(path, {sampleRow()});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::TableCommitFailed);
    EXPECT_TRUE(std::filesystem::is_directory(path));
    EXPECT_FALSE(std::filesystem::exists(tmpDir_ / "features.csv.tmp"));
}
