#include "handoff/transfer/progress.hpp"
#include "handoff/core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace handoff::transfer {

namespace {
    // Batch percentage stays below this until every file has completed.
    constexpr double INCOMPLETE_PERCENTAGE_CAP = 99.9;

    std::optional<std::chrono::seconds> eta(std::uint64_t remaining_bytes, double speed) {
        if (speed <= 0.0) {
            return std::nullopt;
        }
        return std::chrono::seconds(static_cast<std::int64_t>(
            std::ceil(static_cast<double>(remaining_bytes) / speed)));
    }
}

std::string file_status_name(FileStatus status) {
    switch (status) {
        case FileStatus::PENDING: return "pending";
        case FileStatus::TRANSFERRING: return "transferring";
        case FileStatus::COMPLETED: return "completed";
        case FileStatus::FAILED: return "failed";
        case FileStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string batch_status_name(BatchStatus status) {
    switch (status) {
        case BatchStatus::IDLE: return "idle";
        case BatchStatus::TRANSFERRING: return "transferring";
        case BatchStatus::COMPLETED: return "completed";
        case BatchStatus::FAILED: return "failed";
        case BatchStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

bool is_terminal(FileStatus status) {
    return status == FileStatus::COMPLETED ||
           status == FileStatus::FAILED ||
           status == FileStatus::CANCELLED;
}

SpeedTracker::SpeedTracker(const core::Clock& clock, std::chrono::milliseconds sample_interval, std::size_t window)
    : clock_(clock)
    , sample_interval_(sample_interval)
    , window_(window == 0 ? 1 : window)
    , last_sample_time_(clock.now())
    , last_sample_bytes_(0)
    , speed_(0.0) {}

void SpeedTracker::reset() {
    last_sample_time_ = clock_.now();
    last_sample_bytes_ = 0;
    samples_.clear();
    speed_ = 0.0;
}

double SpeedTracker::record(std::uint64_t total_bytes) {
    auto now = clock_.now();
    auto elapsed = now - last_sample_time_;
    
    if (elapsed < sample_interval_) {
        return speed_;
    }
    
    auto seconds = std::chrono::duration<double>(elapsed).count();
    auto delta = total_bytes >= last_sample_bytes_ ? total_bytes - last_sample_bytes_ : 0;
    samples_.push_back(static_cast<double>(delta) / seconds);
    while (samples_.size() > window_) {
        samples_.pop_front();
    }
    
    last_sample_time_ = now;
    last_sample_bytes_ = total_bytes;
    speed_ = std::accumulate(samples_.begin(), samples_.end(), 0.0) / static_cast<double>(samples_.size());
    return speed_;
}

ProgressTracker::ProgressTracker(const core::Clock& clock, const core::TransferLimits& limits)
    : speed_(clock, limits.speed_sample_interval, limits.speed_sample_window) {}

void ProgressTracker::begin_batch(const std::string& batch_id, std::uint32_t total_files, std::uint64_t total_bytes) {
    batch_ = BatchProgress{};
    batch_.batch_id = batch_id;
    batch_.total_files = total_files;
    batch_.total_bytes = total_bytes;
    batch_.status = BatchStatus::TRANSFERRING;
    files_.clear();
    order_.clear();
    speed_.reset();
}

void ProgressTracker::add_file(const std::string& file_id, const std::string& file_name, std::uint64_t size) {
    if (files_.count(file_id) > 0) {
        LOG_WARN("File {} registered twice in batch {}", file_id, batch_.batch_id);
        return;
    }
    
    TransferProgress progress;
    progress.file_id = file_id;
    progress.file_name = file_name;
    progress.total_bytes = size;
    files_[file_id] = progress;
    order_.push_back(file_id);
}

bool ProgressTracker::start_file(const std::string& file_id) {
    auto* file = find(file_id);
    if (!file || file->status != FileStatus::PENDING) {
        return false;
    }
    
    file->status = FileStatus::TRANSFERRING;
    batch_.current_file_id = file_id;
    refresh_batch();
    notify(*file);
    return true;
}

bool ProgressTracker::add_bytes(const std::string& file_id, std::uint64_t bytes) {
    auto* file = find(file_id);
    if (!file || file->status != FileStatus::TRANSFERRING) {
        return false;
    }
    
    file->bytes_transferred += bytes;
    batch_.bytes_transferred += bytes;
    
    batch_.average_speed = speed_.record(batch_.bytes_transferred);
    file->speed = batch_.average_speed;
    file->percentage = file->total_bytes > 0
        ? std::min(100.0, 100.0 * static_cast<double>(file->bytes_transferred) / static_cast<double>(file->total_bytes))
        : 0.0;
    
    refresh_batch();
    file->estimated_time_remaining = batch_.estimated_time_remaining;
    notify(*file);
    return true;
}

bool ProgressTracker::complete_file(const std::string& file_id) {
    auto* file = find(file_id);
    if (!file || file->status != FileStatus::TRANSFERRING) {
        return false;
    }
    
    file->status = FileStatus::COMPLETED;
    file->percentage = 100.0;
    file->estimated_time_remaining = std::chrono::seconds(0);
    batch_.completed_files++;
    if (batch_.current_file_id == file_id) {
        batch_.current_file_id.reset();
    }
    
    refresh_batch();
    notify(*file);
    return true;
}

bool ProgressTracker::fail_file(const std::string& file_id, const std::string& error) {
    return set_terminal(file_id, FileStatus::FAILED, error);
}

bool ProgressTracker::cancel_file(const std::string& file_id) {
    return set_terminal(file_id, FileStatus::CANCELLED, "Cancelled");
}

std::size_t ProgressTracker::fail_active(const std::string& error) {
    std::size_t changed = 0;
    for (const auto& id : order_) {
        if (files_[id].status == FileStatus::TRANSFERRING && fail_file(id, error)) {
            ++changed;
        }
    }
    return changed;
}

std::size_t ProgressTracker::cancel_pending() {
    std::size_t changed = 0;
    for (const auto& id : order_) {
        if (files_[id].status == FileStatus::PENDING && cancel_file(id)) {
            ++changed;
        }
    }
    return changed;
}

void ProgressTracker::finish_batch(BatchStatus status) {
    batch_.status = status;
    batch_.current_file_id.reset();
    refresh_batch();
    
    LOG_INFO("Batch {} {}: {}/{} files, {} bytes", batch_.batch_id, batch_status_name(status),
             batch_.completed_files, batch_.total_files, batch_.bytes_transferred);
    
    if (listener_) {
        listener_(batch_, TransferProgress{});
    }
}

std::optional<TransferProgress> ProgressTracker::file(const std::string& file_id) const {
    auto it = files_.find(file_id);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<TransferProgress> ProgressTracker::files() const {
    std::vector<TransferProgress> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(files_.at(id));
    }
    return result;
}

bool ProgressTracker::any_failed() const {
    return std::any_of(files_.begin(), files_.end(), [](const auto& entry) {
        return entry.second.status == FileStatus::FAILED;
    });
}

TransferProgress* ProgressTracker::find(const std::string& file_id) {
    auto it = files_.find(file_id);
    return it == files_.end() ? nullptr : &it->second;
}

bool ProgressTracker::set_terminal(const std::string& file_id, FileStatus status, const std::string& error) {
    auto* file = find(file_id);
    if (!file || is_terminal(file->status)) {
        return false;
    }
    
    file->status = status;
    file->error = error;
    file->estimated_time_remaining.reset();
    if (batch_.current_file_id == file_id) {
        batch_.current_file_id.reset();
    }
    
    refresh_batch();
    notify(*file);
    return true;
}

void ProgressTracker::refresh_batch() {
    if (batch_.total_bytes == 0) {
        batch_.overall_percentage = 0.0;
    } else {
        batch_.overall_percentage = 100.0 * static_cast<double>(batch_.bytes_transferred) /
                                    static_cast<double>(batch_.total_bytes);
    }
    
    bool all_complete = batch_.total_files > 0 && batch_.completed_files >= batch_.total_files;
    if (all_complete) {
        batch_.overall_percentage = 100.0;
    } else {
        batch_.overall_percentage = std::min(batch_.overall_percentage, INCOMPLETE_PERCENTAGE_CAP);
    }
    
    auto remaining = batch_.total_bytes > batch_.bytes_transferred ? batch_.total_bytes - batch_.bytes_transferred : 0;
    batch_.estimated_time_remaining = all_complete ? std::optional<std::chrono::seconds>(std::chrono::seconds(0))
                                                   : eta(remaining, batch_.average_speed);
}

void ProgressTracker::notify(const TransferProgress& file) {
    if (listener_) {
        listener_(batch_, file);
    }
}

}
