#include "handoff/transfer/batch_sender.hpp"
#include "handoff/crypto/random.hpp"
#include "handoff/core/logger.hpp"
#include "handoff/core/utils.hpp"
#include <algorithm>
#include <numeric>

namespace handoff::transfer {

BatchSender::BatchSender(boost::asio::io_context& io_context, const core::Clock& clock,
                         core::TransferLimits limits, SendFunction send)
    : io_context_(io_context)
    , limits_(limits)
    , send_(std::move(send))
    , progress_(clock, limits)
    , backlog_timer_(io_context)
    , file_index_(0)
    , chunk_index_(0)
    , file_started_(false)
    , file_rejected_(false)
    , running_(false)
    , cancel_requested_(false)
    , generation_(0) {}

std::string BatchSender::start(std::vector<PreparedFile> files) {
    if (running_) {
        LOG_WARN("Batch {} is still being sent", batch_id_);
        return "";
    }
    
    files_ = std::move(files);
    batch_id_ = crypto::SecureRandom::generate_hex_id();
    file_index_ = 0;
    chunk_index_ = 0;
    file_started_ = false;
    file_rejected_ = false;
    cancel_requested_ = false;
    running_ = true;
    ++generation_;
    
    auto total_size = std::accumulate(files_.begin(), files_.end(), std::uint64_t{0},
        [](std::uint64_t sum, const PreparedFile& file) { return sum + file.metadata.size; });
    
    progress_.begin_batch(batch_id_, static_cast<std::uint32_t>(files_.size()), total_size);
    for (const auto& file : files_) {
        progress_.add_file(file.metadata.id, file.metadata.sanitized_name, file.metadata.size);
    }
    
    LOG_INFO("Starting batch {}: {} files, {}", batch_id_, files_.size(),
             core::utils::StringUtils::format_bytes(total_size));
    
    network::BatchStartMessage start_message;
    start_message.batch_id = batch_id_;
    start_message.total_files = static_cast<std::uint32_t>(files_.size());
    start_message.total_size = total_size;
    
    auto batch_id = batch_id_;
    if (!transmit(network::PeerMessage::make(std::move(start_message)))) {
        fail_on_send("batch_start");
        return "";
    }
    
    schedule();
    return batch_id;
}

void BatchSender::cancel() {
    if (running_) {
        LOG_INFO("Cancellation requested for batch {}", batch_id_);
        cancel_requested_ = true;
    }
}

void BatchSender::abort(const std::string& reason) {
    if (!running_) {
        return;
    }
    
    LOG_WARN("Aborting batch {}: {}", batch_id_, reason);
    progress_.fail_active(reason);
    progress_.cancel_pending();
    finish(BatchStatus::FAILED);
}

bool BatchSender::handle_file_error(const network::FileErrorMessage& error) {
    if (!owns_file(error.file_id)) {
        return false;
    }
    
    LOG_WARN("Receiver rejected file {}: {}", error.file_id, error.error);
    progress_.fail_file(error.file_id, error.error);
    
    if (running_ && file_index_ < files_.size() && files_[file_index_].metadata.id == error.file_id) {
        file_rejected_ = true;
    }
    return true;
}

bool BatchSender::owns_file(const std::string& file_id) const {
    return progress_.has_file(file_id);
}

void BatchSender::schedule() {
    auto self = shared_from_this();
    auto generation = generation_;
    boost::asio::post(io_context_, [self, generation]() {
        self->step(generation);
    });
}

void BatchSender::wait_for_backlog() {
    auto self = shared_from_this();
    auto generation = generation_;
    backlog_timer_.expires_after(limits_.send_buffer_poll);
    backlog_timer_.async_wait([self, generation](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        self->step(generation);
    });
}

void BatchSender::step(std::uint64_t generation) {
    if (!running_ || generation != generation_) {
        return;
    }
    
    if (cancel_requested_) {
        for (const auto& file : files_) {
            progress_.cancel_file(file.metadata.id);
        }
        finish(BatchStatus::CANCELLED);
        return;
    }
    
    if (backlog_query_ && backlog_query_() > limits_.send_buffer_limit) {
        wait_for_backlog();
        return;
    }
    
    if (file_index_ >= files_.size()) {
        network::BatchCompleteMessage complete;
        complete.batch_id = batch_id_;
        if (!transmit(network::PeerMessage::make(std::move(complete)))) {
            fail_on_send("batch_complete");
            return;
        }
        finish(progress_.any_failed() ? BatchStatus::FAILED : BatchStatus::COMPLETED);
        return;
    }
    
    auto& file = files_[file_index_];
    
    if (!file_started_) {
        begin_file(file);
    } else if (file_rejected_) {
        LOG_INFO("Skipping remaining chunks of {}", file.metadata.sanitized_name);
        next_file();
    } else if (chunk_index_ < file.metadata.total_chunks) {
        send_chunk(file);
    } else {
        complete_file(file);
    }
    
    if (running_) {
        schedule();
    }
}

void BatchSender::begin_file(PreparedFile& file) {
    const auto& metadata = file.metadata;
    
    network::FileMetadataMessage message;
    message.id = metadata.id;
    message.name = metadata.sanitized_name;
    message.size = metadata.size;
    message.mime_type = metadata.mime_type;
    message.last_modified = metadata.last_modified;
    message.total_chunks = metadata.total_chunks;
    message.batch_id = batch_id_;
    message.file_index = static_cast<std::uint32_t>(file_index_);
    message.total_files_in_batch = static_cast<std::uint32_t>(files_.size());
    message.hash = metadata.hash;
    
    progress_.start_file(metadata.id);
    if (!transmit(network::PeerMessage::make(std::move(message)))) {
        fail_on_send("file_metadata");
        return;
    }
    
    LOG_DEBUG("Sending {} ({} chunks)", metadata.sanitized_name, metadata.total_chunks);
    hasher_.reset();
    chunk_index_ = 0;
    file_started_ = true;
    file_rejected_ = false;
}

void BatchSender::send_chunk(PreparedFile& file) {
    const auto& metadata = file.metadata;
    auto offset = chunk_index_ * limits_.chunk_size;
    auto length = static_cast<std::size_t>(std::min<std::uint64_t>(limits_.chunk_size, metadata.size - offset));
    
    buffer_.resize(length);
    std::size_t read = 0;
    try {
        read = file.source->read(offset, buffer_);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read {}: {}", metadata.sanitized_name, e.what());
        
        network::FileErrorMessage error;
        error.file_id = metadata.id;
        error.error = std::string("Failed to read file: ") + e.what();
        progress_.fail_file(metadata.id, error.error);
        if (!transmit(network::PeerMessage::make(std::move(error)))) {
            fail_on_send("file_error");
            return;
        }
        next_file();
        return;
    }
    
    if (read != length) {
        network::FileErrorMessage error;
        error.file_id = metadata.id;
        error.error = "File changed while it was being sent";
        LOG_ERROR("{}: {}", metadata.sanitized_name, error.error);
        progress_.fail_file(metadata.id, error.error);
        if (!transmit(network::PeerMessage::make(std::move(error)))) {
            fail_on_send("file_error");
            return;
        }
        next_file();
        return;
    }
    
    std::span<const std::uint8_t> bytes(buffer_.data(), length);
    auto hashed = hasher_.update(bytes);
    if (!hashed) {
        LOG_ERROR("Hashing {} failed: {}", metadata.sanitized_name, hashed.message);
    }
    
    network::FileChunkMessage chunk;
    chunk.file_id = metadata.id;
    chunk.chunk_index = chunk_index_;
    chunk.total_chunks = metadata.total_chunks;
    chunk.data.assign(bytes.begin(), bytes.end());
    chunk.checksum = crypto::hash_utils::chunk_checksum(bytes);
    
    if (!transmit(network::PeerMessage::make(std::move(chunk)))) {
        fail_on_send("file_chunk");
        return;
    }
    
    progress_.add_bytes(metadata.id, length);
    ++chunk_index_;
}

void BatchSender::complete_file(PreparedFile& file) {
    network::FileCompleteMessage complete;
    complete.file_id = file.metadata.id;
    complete.final_hash = crypto::hash_utils::hash_to_hex(hasher_.finalize());
    
    if (!transmit(network::PeerMessage::make(std::move(complete)))) {
        fail_on_send("file_complete");
        return;
    }
    
    progress_.complete_file(file.metadata.id);
    LOG_INFO("Sent {} ({})", file.metadata.sanitized_name,
             core::utils::StringUtils::format_bytes(file.metadata.size));
    next_file();
}

void BatchSender::next_file() {
    ++file_index_;
    chunk_index_ = 0;
    file_started_ = false;
    file_rejected_ = false;
}

bool BatchSender::transmit(const network::PeerMessage& message) {
    return send_ && send_(message);
}

void BatchSender::fail_on_send(const std::string& what) {
    // The connection may already have aborted the batch from inside send.
    if (!running_) {
        return;
    }
    
    LOG_ERROR("Failed to send {} for batch {}", what, batch_id_);
    progress_.fail_active("Failed to send " + what);
    progress_.cancel_pending();
    finish(BatchStatus::FAILED);
}

void BatchSender::finish(BatchStatus status) {
    running_ = false;
    ++generation_;
    backlog_timer_.cancel();
    progress_.finish_batch(status);
    
    // Copies; the handler may start the next batch.
    auto handler = finished_handler_;
    auto summary = progress_.batch();
    if (handler) {
        handler(summary);
    }
}

}
