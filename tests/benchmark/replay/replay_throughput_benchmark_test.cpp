/// @file replay_throughput_benchmark_test.cpp
/// @brief Chronological replay and live query throughput.
///
/// Replays a synthetic multi-season match stream (a few hundred players,
/// several matches per day across all surfaces) and measures rows emitted
/// per second, then measures live queries per second against the final
/// snapshot.

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "tfe/foundation/engine_logger.hpp"
#include "tfe/foundation/time_utils.hpp"
#include "tfe/replay/chronological_orchestrator.hpp"
#include "tfe/replay/live_query_adapter.hpp"

using namespace tfe::replay;
using tfe::foundation::EngineLogger;
using tfe::foundation::LogCategory;
using tfe::foundation::LogLevel;
using tfe::foundation::makeDate;
using tfe::foundation::PlayerId;
using tfe::rating::Match;
using tfe::rating::Surface;

namespace {

// Benchmark parameters
constexpr int kMatchCount = 50000;
constexpr int kPlayerCount = 400;
constexpr int kMatchesPerDay = 12;
constexpr int kIterations = 5;
constexpr int kQueryCount = 100000;
constexpr double kMinReplayThroughput = 20000.0; // rows/sec
constexpr double kMinQueryThroughput = 20000.0;  // queries/sec

std::vector<Match> makeStream() {
    std::vector<Match> matches;
    matches.reserve(kMatchCount);

    // Linear congruential generator for a reproducible pairing.
    uint64_t state = 0x2545F4914F6CDD1DULL;
    auto next = [&state] {
        state = state * 6364136223846793005ULL + 1442695040888963407ULL;
        return static_cast<int64_t>(state >> 33);
    };

    const auto start = makeDate(2010, 1, 4);
    for (int i = 0; i < kMatchCount; ++i) {
        int64_t winner = 1 + next() % kPlayerCount;
        int64_t loser = 1 + next() % kPlayerCount;
        if (loser == winner) {
            loser = winner % kPlayerCount + 1;
        }
        Match m;
        m.matchId = "b" + std::to_string(i);
        m.date = start + std::chrono::days{i / kMatchesPerDay};
        m.surface = static_cast<Surface>(next() % 4);
        m.winnerId = PlayerId{winner};
        m.loserId = PlayerId{loser};
        m.setsPlayed = 2 + static_cast<int>(next() % 4);
        matches.push_back(std::move(m));
    }
    return matches;
}

double median(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    return values[values.size() / 2];
}

} // anonymous namespace

class ReplayThroughputBenchmark : public ::testing::Test {
protected:
    void SetUp() override {
        EngineLogger::instance().setCategoryLevel(LogCategory::Replay, LogLevel::Warning);
        matches_ = makeStream();
    }

    void TearDown() override {
        EngineLogger::instance().setCategoryLevel(LogCategory::Replay, LogLevel::Info);
    }

    ChronologicalOrchestrator orchestrator_{EngineConfig{}, nullptr, nullptr};
    std::vector<Match> matches_;
};

TEST_F(ReplayThroughputBenchmark, FullReplay) {
    std::vector<double> throughputs;
    throughputs.reserve(kIterations);

    for (int iter = 0; iter < kIterations; ++iter) {
        auto start = std::chrono::steady_clock::now();
        auto result = orchestrator_.replay(matches_);
        auto end = std::chrono::steady_clock::now();

        ASSERT_TRUE(result.hasValue());
        ASSERT_EQ(result.value().rows.size(), static_cast<std::size_t>(kMatchCount));
        double seconds = std::chrono::duration<double>(end - start).count();
        throughputs.push_back(static_cast<double>(kMatchCount) / seconds);
    }

    double medianTp = median(throughputs);
    std::cout << "\n"
              << "+-------------------------------------------------+\n"
              << "|  Chronological Replay Throughput                |\n"
              << "+-------------------------------------------------+\n"
              << "|  Matches:       " << std::setw(10) << kMatchCount
              << "                      |\n"
              << "|  Median:        " << std::setw(10) << std::fixed << std::setprecision(0)
              << medianTp << " rows/sec           |\n"
              << "|  Requirement:   " << std::setw(10) << kMinReplayThroughput
              << " rows/sec           |\n"
              << "+-------------------------------------------------+\n"
              << std::endl;

    EXPECT_GE(medianTp, kMinReplayThroughput);
}

TEST_F(ReplayThroughputBenchmark, LiveQueries) {
    auto replayed = orchestrator_.replay(matches_);
    ASSERT_TRUE(replayed.hasValue());
    LiveQueryAdapter live(replayed.value().snapshot);
    auto date = *replayed.value().snapshot->watermark + std::chrono::days{1};

    std::vector<double> throughputs;
    throughputs.reserve(kIterations);

    for (int iter = 0; iter < kIterations; ++iter) {
        int failures = 0;
        auto start = std::chrono::steady_clock::now();
        for (int i = 0; i < kQueryCount; ++i) {
            auto p1 = PlayerId{1 + i % kPlayerCount};
            auto p2 = PlayerId{1 + (i + 7) % kPlayerCount};
            if (!live.query(p1, p2, Surface::Hard, date)) {
                ++failures;
            }
        }
        auto end = std::chrono::steady_clock::now();

        ASSERT_EQ(failures, 0);
        double seconds = std::chrono::duration<double>(end - start).count();
        throughputs.push_back(static_cast<double>(kQueryCount) / seconds);
    }

    double medianTp = median(throughputs);
    std::cout << "\n"
              << "+-------------------------------------------------+\n"
              << "|  Live Query Throughput                          |\n"
              << "+-------------------------------------------------+\n"
              << "|  Median:        " << std::setw(10) << std::fixed << std::setprecision(0)
              << medianTp << " queries/sec        |\n"
              << "|  Requirement:   " << std::setw(10) << kMinQueryThroughput
              << " queries/sec        |\n"
              << "+-------------------------------------------------+\n"
              << std::endl;

    EXPECT_GE(medianTp, kMinQueryThroughput);
}
