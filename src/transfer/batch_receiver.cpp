#include "handoff/transfer/batch_receiver.hpp"
#include "handoff/crypto/hash.hpp"
#include "handoff/core/logger.hpp"
#include "handoff/core/utils.hpp"
#include <algorithm>

namespace handoff::transfer {

BatchReceiver::BatchReceiver(const core::Clock& clock, core::TransferLimits limits, SendFunction send)
    : limits_(limits)
    , send_(std::move(send))
    , progress_(clock, limits)
    , active_(false)
    , announced_files_(0)
    , announced_bytes_(0)
    , declared_files_(0)
    , declared_bytes_(0) {}

void BatchReceiver::handle(const network::BatchStartMessage& msg) {
    if (active_) {
        LOG_WARN("Batch {} replaced by {} before it completed", batch_id_, msg.batch_id);
        progress_.fail_active("Batch replaced by a new batch");
        finish(BatchStatus::FAILED);
    }
    
    reset();
    active_ = true;
    batch_id_ = msg.batch_id;
    announced_files_ = msg.total_files;
    announced_bytes_ = msg.total_size;
    progress_.begin_batch(msg.batch_id, msg.total_files, msg.total_size);
    
    if (msg.total_size > limits_.max_session_size) {
        batch_rejection_ = "Batch exceeds the session limit of " +
                           core::utils::StringUtils::format_bytes(limits_.max_session_size);
    } else if (msg.total_files > limits_.max_files_per_batch) {
        batch_rejection_ = "Batch of " + std::to_string(msg.total_files) + " files exceeds the limit of " +
                           std::to_string(limits_.max_files_per_batch);
    }
    
    if (!batch_rejection_.empty()) {
        LOG_WARN("Refusing the files of batch {}: {}", msg.batch_id, batch_rejection_);
        return;
    }
    LOG_INFO("Receiving batch {}: {} files, {}", msg.batch_id, msg.total_files,
             core::utils::StringUtils::format_bytes(msg.total_size));
}

void BatchReceiver::handle(const network::FileMetadataMessage& msg) {
    if (!active_ || msg.batch_id != batch_id_) {
        LOG_WARN("Metadata for {} outside of an active batch", msg.id);
        return;
    }
    if (incoming_.count(msg.id) > 0) {
        LOG_WARN("Duplicate metadata for {}", msg.id);
        return;
    }
    
    IncomingFile file;
    file.metadata.id = msg.id;
    file.metadata.name = msg.name;
    file.metadata.sanitized_name = sanitize_file_name(msg.name);
    file.metadata.size = msg.size;
    file.metadata.mime_type = msg.mime_type.empty() ? "application/octet-stream" : msg.mime_type;
    file.metadata.last_modified = msg.last_modified;
    file.metadata.total_chunks = msg.total_chunks;
    file.metadata.hash = msg.hash;
    file.batch_id = msg.batch_id;
    
    if (file.metadata.sanitized_name != msg.name) {
        LOG_WARN("Incoming file name '{}' sanitized to '{}'", msg.name, file.metadata.sanitized_name);
    }
    
    auto declared_error = check_declared(msg);
    progress_.add_file(msg.id, file.metadata.sanitized_name, msg.size);
    progress_.start_file(msg.id);
    auto& stored = incoming_[msg.id] = std::move(file);
    
    if (!declared_error.empty()) {
        reject(stored, declared_error);
    } else if (msg.size > limits_.max_file_size) {
        reject(stored, "File exceeds the maximum size of " +
                       core::utils::StringUtils::format_bytes(limits_.max_file_size));
    } else if (msg.total_chunks != chunk_count(msg.size, limits_.chunk_size)) {
        reject(stored, "Unexpected chunk count " + std::to_string(msg.total_chunks));
    }
}

void BatchReceiver::handle(const network::FileChunkMessage& msg) {
    auto* file = find(msg.file_id, "file_chunk");
    if (!file || file->failed) {
        return;
    }
    
    if (msg.chunk_index >= file->metadata.total_chunks) {
        reject(*file, "Chunk index " + std::to_string(msg.chunk_index) + " out of range");
        return;
    }
    if (file->chunks.count(msg.chunk_index) > 0) {
        LOG_DEBUG("Ignoring duplicate chunk {} of {}", msg.chunk_index, msg.file_id);
        return;
    }
    
    if (!crypto::hash_utils::constant_time_equals(crypto::hash_utils::chunk_checksum(msg.data), msg.checksum)) {
        reject(*file, "Chunk " + std::to_string(msg.chunk_index) + " failed checksum verification");
        return;
    }
    
    if (msg.chunk_index == 0 && file->metadata.hash &&
        !crypto::hash_utils::constant_time_equals(msg.checksum, *file->metadata.hash)) {
        reject(*file, "First chunk does not match the announced file hash");
        return;
    }
    
    auto offset = msg.chunk_index * limits_.chunk_size;
    auto expected = std::min<std::uint64_t>(limits_.chunk_size, file->metadata.size - offset);
    if (msg.data.size() != expected) {
        reject(*file, "Chunk " + std::to_string(msg.chunk_index) + " has unexpected size " +
                      std::to_string(msg.data.size()));
        return;
    }
    
    file->received_bytes += msg.data.size();
    file->chunks.emplace(msg.chunk_index, msg.data);
    progress_.add_bytes(msg.file_id, msg.data.size());
}

void BatchReceiver::handle(const network::FileCompleteMessage& msg) {
    auto* file = find(msg.file_id, "file_complete");
    if (!file || file->failed) {
        return;
    }
    
    if (file->chunks.size() != file->metadata.total_chunks) {
        reject(*file, "Missing " + std::to_string(file->metadata.total_chunks - file->chunks.size()) + " chunks");
        return;
    }
    if (file->received_bytes != file->metadata.size) {
        reject(*file, "Received " + std::to_string(file->received_bytes) + " of " +
                      std::to_string(file->metadata.size) + " bytes");
        return;
    }
    
    CompletedFile completed;
    completed.metadata = file->metadata;
    completed.bytes.reserve(file->metadata.size);
    for (auto& [index, data] : file->chunks) {
        completed.bytes.insert(completed.bytes.end(), data.begin(), data.end());
    }
    file->chunks.clear();
    
    if (!msg.final_hash.empty()) {
        auto digest = crypto::hash_utils::hash_to_hex(crypto::Sha256Hasher::hash(completed.bytes));
        if (!crypto::hash_utils::constant_time_equals(digest, msg.final_hash)) {
            reject(*file, "File hash mismatch");
            return;
        }
    }
    
    progress_.complete_file(msg.file_id);
    LOG_INFO("Received {} ({})", completed.metadata.sanitized_name,
             core::utils::StringUtils::format_bytes(completed.metadata.size));
    completed_.push_back(std::move(completed));
    incoming_.erase(msg.file_id);
}

void BatchReceiver::handle(const network::BatchCompleteMessage& msg) {
    if (!active_ || msg.batch_id != batch_id_) {
        LOG_WARN("batch_complete for unknown batch {}", msg.batch_id);
        return;
    }
    
    for (auto& [id, file] : incoming_) {
        if (!file.failed) {
            progress_.fail_file(id, "File was not completed");
            file.failed = true;
        }
    }
    
    auto failed = progress_.any_failed() || !batch_rejection_.empty();
    auto delivered = std::move(completed_);
    completed_.clear();
    finish(failed ? BatchStatus::FAILED : BatchStatus::COMPLETED);
    
    if (delivery_sink_) {
        for (auto& file : delivered) {
            delivery_sink_(std::move(file.bytes), file.metadata);
        }
    } else if (!delivered.empty()) {
        LOG_WARN("No delivery sink; discarding {} received files", delivered.size());
    }
}

void BatchReceiver::handle(const network::FileErrorMessage& msg) {
    auto* file = find(msg.file_id, "file_error");
    if (!file) {
        return;
    }
    
    LOG_WARN("Sender reported an error for {}: {}", file->metadata.sanitized_name, msg.error);
    file->failed = true;
    file->chunks.clear();
    progress_.fail_file(msg.file_id, msg.error);
}

void BatchReceiver::abort(const std::string& reason) {
    if (!active_) {
        return;
    }
    
    LOG_WARN("Aborting incoming batch {}: {}", batch_id_, reason);
    progress_.fail_active(reason);
    progress_.cancel_pending();
    finish(BatchStatus::FAILED);
}

std::size_t BatchReceiver::buffered_bytes() const {
    std::size_t total = 0;
    for (const auto& [id, file] : incoming_) {
        for (const auto& [index, data] : file.chunks) {
            total += data.size();
        }
    }
    for (const auto& file : completed_) {
        total += file.bytes.size();
    }
    return total;
}

std::string BatchReceiver::check_declared(const network::FileMetadataMessage& msg) {
    ++declared_files_;
    if (!batch_rejection_.empty()) {
        return batch_rejection_;
    }
    if (declared_files_ > announced_files_) {
        return "More files than the batch announced (" + std::to_string(announced_files_) + ")";
    }
    if (msg.size > announced_bytes_ - declared_bytes_) {
        return "Files exceed the " + core::utils::StringUtils::format_bytes(announced_bytes_) +
               " the batch announced";
    }
    declared_bytes_ += msg.size;
    return "";
}

BatchReceiver::IncomingFile* BatchReceiver::find(const std::string& file_id, const char* message_name) {
    auto it = incoming_.find(file_id);
    if (it == incoming_.end()) {
        LOG_WARN("{} for unknown file {}", message_name, file_id);
        return nullptr;
    }
    return &it->second;
}

void BatchReceiver::reject(IncomingFile& file, const std::string& error) {
    LOG_ERROR("Rejecting {}: {}", file.metadata.sanitized_name, error);
    file.failed = true;
    file.chunks.clear();
    progress_.fail_file(file.metadata.id, error);
    
    // A failed send may abort the batch and release `file`.
    auto file_id = file.metadata.id;
    network::FileErrorMessage message;
    message.file_id = file_id;
    message.error = error;
    if (!send_ || !send_(network::PeerMessage::make(std::move(message)))) {
        LOG_WARN("Could not report the failure of {} to the sender", file_id);
    }
}

void BatchReceiver::finish(BatchStatus status) {
    active_ = false;
    progress_.finish_batch(status);
    reset();
    
    auto handler = finished_handler_;
    auto summary = progress_.batch();
    if (handler) {
        handler(summary);
    }
}

void BatchReceiver::reset() {
    incoming_.clear();
    completed_.clear();
    batch_rejection_.clear();
    announced_files_ = 0;
    announced_bytes_ = 0;
    declared_files_ = 0;
    declared_bytes_ = 0;
}

}
