#pragma once

#include "handoff/core/clock.hpp"
#include "handoff/core/limits.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace handoff::transfer {

// Terminal states never change once reached.
enum class FileStatus {
    PENDING,
    TRANSFERRING,
    COMPLETED,
    FAILED,
    CANCELLED
};

enum class BatchStatus {
    IDLE,
    TRANSFERRING,
    COMPLETED,
    FAILED,
    CANCELLED
};

std::string file_status_name(FileStatus status);
std::string batch_status_name(BatchStatus status);
bool is_terminal(FileStatus status);

struct TransferProgress {
    std::string file_id;
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::uint64_t bytes_transferred = 0;
    double percentage = 0.0;
    double speed = 0.0;                 // bytes per second
    std::optional<std::chrono::seconds> estimated_time_remaining;
    FileStatus status = FileStatus::PENDING;
    std::string error;
};

struct BatchProgress {
    std::string batch_id;
    std::uint32_t total_files = 0;
    std::uint32_t completed_files = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t bytes_transferred = 0;
    double overall_percentage = 0.0;
    double average_speed = 0.0;         // bytes per second
    std::optional<std::chrono::seconds> estimated_time_remaining;
    std::optional<std::string> current_file_id;
    BatchStatus status = BatchStatus::IDLE;
};

// Sliding average of throughput samples taken at most once per interval.
class SpeedTracker {
public:
    SpeedTracker(const core::Clock& clock, std::chrono::milliseconds sample_interval, std::size_t window);
    
    void reset();
    
    // `total_bytes` is the running total; returns the current average.
    double record(std::uint64_t total_bytes);
    double speed() const { return speed_; }
    std::size_t sample_count() const { return samples_.size(); }

private:
    const core::Clock& clock_;
    std::chrono::milliseconds sample_interval_;
    std::size_t window_;
    core::Clock::time_point last_sample_time_;
    std::uint64_t last_sample_bytes_;
    std::deque<double> samples_;
    double speed_;
};

// Per-file and per-batch accounting for one direction of a transfer.
// The sum of per-file bytes always equals the batch total.
class ProgressTracker {
public:
    using Listener = std::function<void(const BatchProgress&, const TransferProgress&)>;
    
    ProgressTracker(const core::Clock& clock, const core::TransferLimits& limits);
    
    void begin_batch(const std::string& batch_id, std::uint32_t total_files, std::uint64_t total_bytes);
    void add_file(const std::string& file_id, const std::string& file_name, std::uint64_t size);
    
    bool start_file(const std::string& file_id);
    bool add_bytes(const std::string& file_id, std::uint64_t bytes);
    bool complete_file(const std::string& file_id);
    bool fail_file(const std::string& file_id, const std::string& error);
    bool cancel_file(const std::string& file_id);
    
    // Returns how many files changed.
    std::size_t fail_active(const std::string& error);
    std::size_t cancel_pending();
    
    void finish_batch(BatchStatus status);
    
    const BatchProgress& batch() const { return batch_; }
    std::optional<TransferProgress> file(const std::string& file_id) const;
    std::vector<TransferProgress> files() const;
    bool has_file(const std::string& file_id) const { return files_.count(file_id) > 0; }
    bool any_failed() const;
    
    void set_listener(Listener listener) { listener_ = std::move(listener); }

private:
    TransferProgress* find(const std::string& file_id);
    bool set_terminal(const std::string& file_id, FileStatus status, const std::string& error);
    void refresh_batch();
    void notify(const TransferProgress& file);
    
    SpeedTracker speed_;
    BatchProgress batch_;
    std::map<std::string, TransferProgress> files_;
    std::vector<std::string> order_;
    Listener listener_;
};

}
