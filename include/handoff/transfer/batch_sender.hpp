#pragma once

#include "handoff/transfer/file_source.hpp"
#include "handoff/transfer/file_validation.hpp"
#include "handoff/transfer/progress.hpp"
#include "handoff/network/peer_message.hpp"
#include "handoff/crypto/hash.hpp"
#include "handoff/core/clock.hpp"
#include "handoff/core/limits.hpp"
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace handoff::transfer {

// Returns false when the channel rejected the frame or is closed.
using SendFunction = std::function<bool(const network::PeerMessage&)>;
using BatchFinishedHandler = std::function<void(const BatchProgress&)>;
// Bytes the channel has accepted but not yet handed to the peer.
using BacklogQuery = std::function<std::size_t()>;

struct PreparedFile {
    std::shared_ptr<FileSource> source;
    FileMetadata metadata;
};

// Streams one batch of files, one chunk per io_context turn. While the backlog query
// reports more than `send_buffer_limit` bytes, it polls on a timer instead.
class BatchSender : public std::enable_shared_from_this<BatchSender> {
public:
    BatchSender(boost::asio::io_context& io_context, const core::Clock& clock,
                core::TransferLimits limits, SendFunction send);
    
    BatchSender(const BatchSender&) = delete;
    BatchSender& operator=(const BatchSender&) = delete;
    
    // Emits batch_start synchronously; chunks follow on later turns. Returns the batch id,
    // or an empty string when a batch is already running or batch_start could not be sent.
    std::string start(std::vector<PreparedFile> files);
    
    // Takes effect before the next chunk or file; nothing further is sent.
    void cancel();
    
    // Connection loss: fails the in-flight file and cancels the rest without sending.
    void abort(const std::string& reason);
    
    // Receiver rejected a file. Returns false when the id is not part of this batch.
    bool handle_file_error(const network::FileErrorMessage& error);
    
    bool is_running() const { return running_; }
    bool owns_file(const std::string& file_id) const;
    const ProgressTracker& progress() const { return progress_; }
    
    void set_progress_listener(ProgressTracker::Listener listener) { progress_.set_listener(std::move(listener)); }
    void set_finished_handler(BatchFinishedHandler handler) { finished_handler_ = std::move(handler); }
    void set_backlog_query(BacklogQuery query) { backlog_query_ = std::move(query); }

private:
    void schedule();
    void wait_for_backlog();
    void step(std::uint64_t generation);
    
    void begin_file(PreparedFile& file);
    void send_chunk(PreparedFile& file);
    void complete_file(PreparedFile& file);
    void next_file();
    
    bool transmit(const network::PeerMessage& message);
    void fail_on_send(const std::string& what);
    void finish(BatchStatus status);
    
    boost::asio::io_context& io_context_;
    core::TransferLimits limits_;
    SendFunction send_;
    ProgressTracker progress_;
    BatchFinishedHandler finished_handler_;
    BacklogQuery backlog_query_;
    boost::asio::steady_timer backlog_timer_;
    
    std::string batch_id_;
    std::vector<PreparedFile> files_;
    std::size_t file_index_;
    std::uint64_t chunk_index_;
    bool file_started_;
    bool file_rejected_;
    crypto::Sha256Hasher hasher_;
    std::vector<std::uint8_t> buffer_;
    
    bool running_;
    bool cancel_requested_;
    std::uint64_t generation_;
};

}
