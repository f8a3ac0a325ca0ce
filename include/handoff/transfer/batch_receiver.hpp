#pragma once

#include "handoff/transfer/batch_sender.hpp"
#include "handoff/transfer/file_validation.hpp"
#include "handoff/transfer/progress.hpp"
#include "handoff/network/peer_message.hpp"
#include "handoff/core/clock.hpp"
#include "handoff/core/limits.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace handoff::transfer {

// Receives each completed file once the batch has finished.
using DeliverySink = std::function<void(std::vector<std::uint8_t> bytes, const FileMetadata& metadata)>;

// Reassembles incoming batches. Chunks are buffered by index, so arrival order
// inside a file does not matter. A batch over the session or file-count limit is
// still tracked, but every file it announces is rejected with file_error. Files
// beyond the count or total size that batch_start announced are rejected as well.
class BatchReceiver {
public:
    BatchReceiver(const core::Clock& clock, core::TransferLimits limits, SendFunction send);
    
    void handle(const network::BatchStartMessage& msg);
    void handle(const network::FileMetadataMessage& msg);
    void handle(const network::FileChunkMessage& msg);
    void handle(const network::FileCompleteMessage& msg);
    void handle(const network::BatchCompleteMessage& msg);
    void handle(const network::FileErrorMessage& msg);
    
    // Connection loss: fails files in progress and drops every buffer.
    void abort(const std::string& reason);
    
    bool is_active() const { return active_; }
    bool has_file(const std::string& file_id) const { return incoming_.count(file_id) > 0; }
    std::size_t buffered_bytes() const;
    const ProgressTracker& progress() const { return progress_; }
    
    void set_delivery_sink(DeliverySink sink) { delivery_sink_ = std::move(sink); }
    void set_progress_listener(ProgressTracker::Listener listener) { progress_.set_listener(std::move(listener)); }
    void set_finished_handler(BatchFinishedHandler handler) { finished_handler_ = std::move(handler); }

private:
    struct IncomingFile {
        FileMetadata metadata;
        std::string batch_id;
        std::map<std::uint64_t, std::vector<std::uint8_t>> chunks;
        std::uint64_t received_bytes = 0;
        bool failed = false;
    };
    
    struct CompletedFile {
        FileMetadata metadata;
        std::vector<std::uint8_t> bytes;
    };
    
    std::string check_declared(const network::FileMetadataMessage& msg);
    IncomingFile* find(const std::string& file_id, const char* message_name);
    void reject(IncomingFile& file, const std::string& error);
    void finish(BatchStatus status);
    void reset();
    
    core::TransferLimits limits_;
    SendFunction send_;
    ProgressTracker progress_;
    DeliverySink delivery_sink_;
    BatchFinishedHandler finished_handler_;
    
    bool active_;
    std::string batch_id_;
    std::string batch_rejection_;
    std::uint32_t announced_files_;
    std::uint64_t announced_bytes_;
    std::uint32_t declared_files_;
    std::uint64_t declared_bytes_;
    std::map<std::string, IncomingFile> incoming_;
    std::vector<CompletedFile> completed_;
};

}
