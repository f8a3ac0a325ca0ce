#pragma once

#include "handoff/transfer/batch_receiver.hpp"
#include "handoff/transfer/batch_sender.hpp"
#include "handoff/transfer/file_validation.hpp"
#include "handoff/network/connection_state_machine.hpp"
#include "handoff/security/audit_log.hpp"
#include "handoff/core/clock.hpp"
#include "handoff/core/limits.hpp"
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <memory>
#include <string>
#include <vector>

namespace handoff::transfer {

enum class Direction {
    OUTGOING,
    INCOMING
};

struct SendOutcome {
    bool started = false;
    std::string batch_id;
    std::string error;
    BatchValidation validation;
};

using DirectionalProgressListener = std::function<void(Direction, const BatchProgress&, const TransferProgress&)>;
using DirectionalFinishedHandler = std::function<void(Direction, const BatchProgress&)>;

// Runs batches in both directions over one authenticated connection.
class TransferEngine : public std::enable_shared_from_this<TransferEngine> {
public:
    static std::shared_ptr<TransferEngine> create(boost::asio::io_context& io_context,
                                                  const core::Clock& clock,
                                                  core::TransferLimits limits);
    
    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;
    
    // Routes transfer messages from the connection here and follows its state.
    void attach(std::shared_ptr<network::ConnectionStateMachine> connection);
    // Bare send path without a state machine; handle_message is fed by the caller.
    void attach(SendFunction send);
    
    // Validates every file first; nothing is sent when the batch is rejected.
    SendOutcome send_files(const std::vector<std::shared_ptr<FileSource>>& files);
    void cancel();
    
    void handle_message(const network::PeerMessage& message);
    void on_connection_state(const network::ConnectionInfo& info);
    
    bool is_sending() const { return sender_->is_running(); }
    bool is_receiving() const { return receiver_->is_active(); }
    const ProgressTracker& outgoing() const { return sender_->progress(); }
    const ProgressTracker& incoming() const { return receiver_->progress(); }
    const core::TransferLimits& limits() const { return limits_; }
    
    void set_delivery_sink(DeliverySink sink) { receiver_->set_delivery_sink(std::move(sink)); }
    void set_audit_sink(security::AuditSink sink) { audit_sink_ = std::move(sink); }
    void set_progress_listener(DirectionalProgressListener listener);
    void set_finished_handler(DirectionalFinishedHandler handler) { finished_handler_ = std::move(handler); }

private:
    explicit TransferEngine(core::TransferLimits limits);
    
    bool transmit(const network::PeerMessage& message);
    void on_batch_finished(Direction direction, const BatchProgress& batch);
    void enter_phase(network::ConnectionState phase);
    void audit(security::AuditEventType type, security::AuditDetails details);
    
    core::TransferLimits limits_;
    std::shared_ptr<BatchSender> sender_;
    std::unique_ptr<BatchReceiver> receiver_;
    
    std::weak_ptr<network::ConnectionStateMachine> connection_;
    SendFunction send_;
    security::AuditSink audit_sink_;
    DirectionalFinishedHandler finished_handler_;
};

}
