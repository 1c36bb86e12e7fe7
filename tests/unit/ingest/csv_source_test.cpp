/// @file csv_source_test.cpp
/// @brief Unit tests for the CSV table readers.

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "tfe/foundation/time_utils.hpp"
#include "tfe/ingest/csv_source.hpp"

using namespace tfe::ingest;
using tfe::features::Handedness;
using tfe::foundation::ErrorCode;
using tfe::foundation::makeDate;
using tfe::foundation::PlayerId;

TEST(CsvSourceTest, SplitPlainLine) {
    auto fields = splitCsvLine("a,b,,d");
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0], "a");
    EXPECT_EQ(fields[2], "");
    EXPECT_EQ(fields[3], "d");
}

TEST(CsvSourceTest, SplitQuotedLine) {
    auto fields = splitCsvLine("1,\"Queen's Club, London\",\"say \"\"hi\"\"\",x\r");
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[1], "Queen's Club, London");
    EXPECT_EQ(fields[2], "say \"hi\"");
    EXPECT_EQ(fields[3], "x");
}

TEST(CsvSourceTest, ReadMatchRecordsByHeaderName) {
    std::istringstream in(
        "score,loser_id,winner_id,tourney_name,tourney_date,match_id,surface\n"
        "6-3 6-2,2,1,Brisbane,20230102,m1,Hard\n"
        "\n"
        "7-5 6-7(3) 6-1,4,3,\"Halle, Germany\",20230619,m2,\n");

    auto result = readMatchRecords(in);
    ASSERT_TRUE(result.hasValue());
    const auto& records = result.value();
    ASSERT_EQ(records.size(), 2u);

    EXPECT_EQ(records[0].matchId, "m1");
    EXPECT_EQ(records[0].date, "20230102");
    EXPECT_EQ(records[0].winnerId, "1");
    EXPECT_EQ(records[0].loserId, "2");
    EXPECT_EQ(records[0].surface, "Hard");
    EXPECT_EQ(records[1].tourneyName, "Halle, Germany");
    EXPECT_EQ(records[1].surface, "");
    EXPECT_EQ(records[1].score, "7-5 6-7(3) 6-1");
}

TEST(CsvSourceTest, MatchIdFromTourneyAndNumber) {
    std::istringstream in(
        "tourney_id,match_num,tourney_date,winner_id,loser_id\n"
        "2023-0339,300,20230102,1,2\n");

    auto result = readMatchRecords(in);
    ASSERT_TRUE(result.hasValue());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].matchId, "2023-0339-300");
}

TEST(CsvSourceTest, IncompleteTourneyKeyLeavesIdEmpty) {
    std::istringstream in(
        "tourney_id,match_num,tourney_date,winner_id,loser_id\n"
        ",,20230102,1,2\n"
        "2023-0339,,20230102,3,4\n"
        "2023-0339,301,20230102,5,6\n");

    auto result = readMatchRecords(in);
    ASSERT_TRUE(result.hasValue());
    ASSERT_EQ(result.value().size(), 3u);
    EXPECT_EQ(result.value()[0].matchId, "");
    EXPECT_EQ(result.value()[1].matchId, "");

    auto prepared = MatchStream::prepare(result.value());
    ASSERT_EQ(prepared.matches.size(), 1u);
    EXPECT_EQ(prepared.matches[0].matchId, "2023-0339-301");
    EXPECT_EQ(prepared.dropped.size(), 2u);
}

TEST(CsvSourceTest, HeaderLookupTrimsNames) {
    CsvHeader header({" match_id", "p1_id ", "\tscore"});
    EXPECT_EQ(header.find("match_id").value_or(99), 0u);
    EXPECT_EQ(header.find("p1_id").value_or(99), 1u);
    EXPECT_EQ(header.find("score").value_or(99), 2u);
    EXPECT_FALSE(header.find("p2_id").has_value());
}

TEST(CsvSourceTest, ReadHeaderStripsByteOrderMark) {
    std::istringstream in("\xEF\xBB\xBFmatch_id,p1_id\nm1,1\n");
    auto header = readCsvHeader(in);
    ASSERT_TRUE(header.hasValue());
    EXPECT_EQ(header.value().find("match_id").value_or(99), 0u);

    std::string next;
    ASSERT_TRUE(std::getline(in, next));
    EXPECT_EQ(next, "m1,1");
}

TEST(CsvSourceTest, MissingRequiredColumn) {
    std::istringstream in("match_id,tourney_date,winner_id\nm1,20230102,1\n");
    auto result = readMatchRecords(in);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::MissingColumn);
}

TEST(CsvSourceTest, EmptyTable) {
    std::istringstream in("");
    EXPECT_TRUE(readMatchRecords(in).hasError());
}

TEST(CsvSourceTest, HeaderWithByteOrderMark) {
    std::istringstream in("\xEF\xBB\xBFranking_date,rank,player\n20230102,5,100\n");
    auto result = readRankingRows(in);
    ASSERT_TRUE(result.hasValue());
    ASSERT_EQ(result.value().rows.size(), 1u);
}

TEST(CsvSourceTest, ReadRankingRowsDropsBadRows) {
    std::istringstream in(
        "ranking_date,rank,player,points\n"
        "20230102,1,104925,9000\n"
        "20230102,0,104926,10\n"
        "2023xx02,3,104927,10\n"
        "20230109,2,,10\n"
        "20230109,2,106421,8000\n");

    auto result = readRankingRows(in);
    ASSERT_TRUE(result.hasValue());
    const auto& load = result.value();
    EXPECT_EQ(load.dropped, 3u);
    ASSERT_EQ(load.rows.size(), 2u);
    EXPECT_EQ(load.rows[0].date, makeDate(2023, 1, 2));
    EXPECT_EQ(load.rows[0].playerId, PlayerId{104925});
    EXPECT_EQ(load.rows[0].rank, 1);
    EXPECT_EQ(load.rows[1].playerId, PlayerId{106421});
}

TEST(CsvSourceTest, ReadPlayerAttributes) {
    std::istringstream in(
        "player_id,name_first,hand\n"
        "1,Rafael,L\n"
        "bad,Nobody,R\n"
        "2,Roger,R\n"
        "3,Someone,\n");

    auto result = readPlayerAttributes(in);
    ASSERT_TRUE(result.hasValue());
    const auto& players = result.value();
    ASSERT_EQ(players.size(), 3u);
    EXPECT_EQ(players[0].hand, Handedness::Left);
    EXPECT_EQ(players[1].playerId, PlayerId{2});
    EXPECT_EQ(players[2].hand, Handedness::Unknown);
}

TEST(CsvSourceTest, LoadMissingFile) {
    auto result = loadMatchRecords("/nonexistent/tfe/matches.csv");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::FileOpenFailed);
}
