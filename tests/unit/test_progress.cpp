#include <gtest/gtest.h>
#include "handoff/transfer/progress.hpp"

using namespace handoff::transfer;
using namespace handoff::core;

namespace {
constexpr std::uint64_t MIB = 1024 * 1024;
}

class ProgressTest : public ::testing::Test {
protected:
    ManualClock clock;
    TransferLimits limits;
};

TEST_F(ProgressTest, StatusNames) {
    EXPECT_EQ(file_status_name(FileStatus::TRANSFERRING), "transferring");
    EXPECT_EQ(batch_status_name(BatchStatus::CANCELLED), "cancelled");
    EXPECT_TRUE(is_terminal(FileStatus::FAILED));
    EXPECT_FALSE(is_terminal(FileStatus::PENDING));
}

TEST_F(ProgressTest, SpeedSamplesOncePerInterval) {
    SpeedTracker tracker(clock, std::chrono::milliseconds(500), 5);
    
    clock.advance(std::chrono::milliseconds(100));
    EXPECT_DOUBLE_EQ(tracker.record(1000), 0.0);
    EXPECT_EQ(tracker.sample_count(), 0u);
    
    clock.advance(std::chrono::milliseconds(400));
    EXPECT_DOUBLE_EQ(tracker.record(1000), 2000.0);
    EXPECT_EQ(tracker.sample_count(), 1u);
}

TEST_F(ProgressTest, SpeedAveragesOverWindow) {
    SpeedTracker tracker(clock, std::chrono::milliseconds(500), 2);
    
    std::uint64_t total = 0;
    for (std::uint64_t step : {1000u, 2000u, 3000u}) {
        clock.advance(std::chrono::seconds(1));
        total += step;
        tracker.record(total);
    }
    
    EXPECT_EQ(tracker.sample_count(), 2u);
    EXPECT_DOUBLE_EQ(tracker.speed(), 2500.0);
    
    tracker.reset();
    EXPECT_DOUBLE_EQ(tracker.speed(), 0.0);
}

TEST_F(ProgressTest, BatchReachesHundredOnlyAfterLastCompletion) {
    ProgressTracker tracker(clock, limits);
    tracker.begin_batch("batch-1", 3, 10 * MIB);
    tracker.add_file("a", "a.bin", 4 * MIB);
    tracker.add_file("b", "b.bin", 3 * MIB);
    tracker.add_file("c", "c.bin", 3 * MIB);
    
    const std::vector<std::pair<std::string, std::uint64_t>> plan = {{"a", 4}, {"b", 3}, {"c", 3}};
    int samples = 0;
    
    for (const auto& [id, chunks] : plan) {
        ASSERT_TRUE(tracker.start_file(id));
        EXPECT_EQ(tracker.batch().current_file_id, id);
        
        for (std::uint64_t i = 0; i < chunks; ++i) {
            clock.advance(std::chrono::milliseconds(500));
            ASSERT_TRUE(tracker.add_bytes(id, MIB));
            ++samples;
            if (samples >= 5) {
                EXPECT_NEAR(tracker.batch().average_speed, 2.0 * MIB, 1.0);
            }
            EXPECT_LT(tracker.batch().overall_percentage, 100.0);
        }
        
        auto file = tracker.file(id);
        ASSERT_TRUE(file.has_value());
        EXPECT_DOUBLE_EQ(file->percentage, 100.0);
        EXPECT_EQ(file->status, FileStatus::TRANSFERRING);
        ASSERT_TRUE(tracker.complete_file(id));
    }
    
    EXPECT_EQ(tracker.batch().bytes_transferred, 10 * MIB);
    EXPECT_EQ(tracker.batch().completed_files, 3u);
    EXPECT_DOUBLE_EQ(tracker.batch().overall_percentage, 100.0);
    ASSERT_TRUE(tracker.batch().estimated_time_remaining.has_value());
    EXPECT_EQ(*tracker.batch().estimated_time_remaining, std::chrono::seconds(0));
    EXPECT_FALSE(tracker.batch().current_file_id.has_value());
}

TEST_F(ProgressTest, EstimateUsesBatchRemainder) {
    ProgressTracker tracker(clock, limits);
    tracker.begin_batch("batch-1", 2, 8 * MIB);
    tracker.add_file("a", "a.bin", 4 * MIB);
    tracker.add_file("b", "b.bin", 4 * MIB);
    
    tracker.start_file("a");
    EXPECT_FALSE(tracker.batch().estimated_time_remaining.has_value());
    
    clock.advance(std::chrono::seconds(1));
    tracker.add_bytes("a", 2 * MIB);
    
    ASSERT_TRUE(tracker.batch().estimated_time_remaining.has_value());
    EXPECT_EQ(*tracker.batch().estimated_time_remaining, std::chrono::seconds(3));
    EXPECT_EQ(tracker.file("a")->estimated_time_remaining, tracker.batch().estimated_time_remaining);
    EXPECT_DOUBLE_EQ(tracker.file("a")->percentage, 50.0);
    EXPECT_DOUBLE_EQ(tracker.batch().overall_percentage, 25.0);
}

TEST_F(ProgressTest, BytesOnlyCountWhileTransferring) {
    ProgressTracker tracker(clock, limits);
    tracker.begin_batch("batch-1", 1, 100);
    tracker.add_file("a", "a.bin", 100);
    
    EXPECT_FALSE(tracker.add_bytes("a", 10));
    EXPECT_FALSE(tracker.add_bytes("missing", 10));
    EXPECT_FALSE(tracker.complete_file("a"));
    
    tracker.start_file("a");
    EXPECT_FALSE(tracker.start_file("a"));
    EXPECT_TRUE(tracker.add_bytes("a", 10));
    EXPECT_EQ(tracker.batch().bytes_transferred, 10u);
}

TEST_F(ProgressTest, TerminalStatesAreFinal) {
    ProgressTracker tracker(clock, limits);
    tracker.begin_batch("batch-1", 2, 200);
    tracker.add_file("a", "a.bin", 100);
    tracker.add_file("b", "b.bin", 100);
    
    tracker.start_file("a");
    ASSERT_TRUE(tracker.fail_file("a", "Disk full"));
    EXPECT_FALSE(tracker.complete_file("a"));
    EXPECT_FALSE(tracker.cancel_file("a"));
    EXPECT_FALSE(tracker.start_file("a"));
    EXPECT_EQ(tracker.file("a")->error, "Disk full");
    EXPECT_EQ(tracker.file("a")->status, FileStatus::FAILED);
    EXPECT_TRUE(tracker.any_failed());
    
    EXPECT_EQ(tracker.cancel_pending(), 1u);
    EXPECT_EQ(tracker.file("b")->status, FileStatus::CANCELLED);
    EXPECT_EQ(tracker.cancel_pending(), 0u);
}

TEST_F(ProgressTest, FailActiveOnlyTouchesTransferringFiles) {
    ProgressTracker tracker(clock, limits);
    tracker.begin_batch("batch-1", 3, 300);
    tracker.add_file("a", "a.bin", 100);
    tracker.add_file("b", "b.bin", 100);
    tracker.add_file("c", "c.bin", 100);
    
    tracker.start_file("a");
    tracker.add_bytes("a", 100);
    tracker.complete_file("a");
    tracker.start_file("b");
    
    EXPECT_EQ(tracker.fail_active("Connection lost"), 1u);
    EXPECT_EQ(tracker.file("a")->status, FileStatus::COMPLETED);
    EXPECT_EQ(tracker.file("b")->status, FileStatus::FAILED);
    EXPECT_EQ(tracker.file("c")->status, FileStatus::PENDING);
}

TEST_F(ProgressTest, FilesKeepInsertionOrder) {
    ProgressTracker tracker(clock, limits);
    tracker.begin_batch("batch-1", 3, 3);
    tracker.add_file("zeta", "z.bin", 1);
    tracker.add_file("alpha", "a.bin", 1);
    tracker.add_file("zeta", "again.bin", 1);
    tracker.add_file("mid", "m.bin", 1);
    
    auto files = tracker.files();
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].file_id, "zeta");
    EXPECT_EQ(files[0].file_name, "z.bin");
    EXPECT_EQ(files[1].file_id, "alpha");
    EXPECT_EQ(files[2].file_id, "mid");
}

TEST_F(ProgressTest, ListenerSeesEveryChangeAndFinish) {
    ProgressTracker tracker(clock, limits);
    std::vector<std::pair<BatchStatus, FileStatus>> seen;
    tracker.set_listener([&seen](const BatchProgress& batch, const TransferProgress& file) {
        seen.emplace_back(batch.status, file.status);
    });
    
    tracker.begin_batch("batch-1", 1, 10);
    tracker.add_file("a", "a.bin", 10);
    tracker.start_file("a");
    tracker.add_bytes("a", 10);
    tracker.complete_file("a");
    tracker.finish_batch(BatchStatus::COMPLETED);
    
    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen[0].second, FileStatus::TRANSFERRING);
    EXPECT_EQ(seen[2].second, FileStatus::COMPLETED);
    EXPECT_EQ(seen[3].first, BatchStatus::COMPLETED);
    EXPECT_EQ(tracker.batch().status, BatchStatus::COMPLETED);
}

TEST_F(ProgressTest, BeginBatchResetsState) {
    ProgressTracker tracker(clock, limits);
    tracker.begin_batch("first", 1, 10);
    tracker.add_file("a", "a.bin", 10);
    tracker.start_file("a");
    tracker.add_bytes("a", 5);
    
    tracker.begin_batch("second", 2, 20);
    EXPECT_EQ(tracker.batch().batch_id, "second");
    EXPECT_EQ(tracker.batch().bytes_transferred, 0u);
    EXPECT_EQ(tracker.batch().status, BatchStatus::TRANSFERRING);
    EXPECT_FALSE(tracker.has_file("a"));
}
