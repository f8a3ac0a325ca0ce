#include "handoff/transfer/transfer_engine.hpp"
#include "handoff/core/logger.hpp"
#include "handoff/core/utils.hpp"

namespace handoff::transfer {

namespace {
    const std::string CONNECTION_LOST = "Connection lost";

    std::string join(const std::vector<std::string>& parts) {
        std::string joined;
        for (const auto& part : parts) {
            if (!joined.empty()) {
                joined += "; ";
            }
            joined += part;
        }
        return joined;
    }
}

std::shared_ptr<TransferEngine> TransferEngine::create(boost::asio::io_context& io_context,
                                                       const core::Clock& clock,
                                                       core::TransferLimits limits) {
    auto engine = std::shared_ptr<TransferEngine>(new TransferEngine(limits));
    std::weak_ptr<TransferEngine> weak = engine;
    
    auto send = [weak](const network::PeerMessage& message) {
        auto self = weak.lock();
        return self && self->transmit(message);
    };
    engine->sender_ = std::make_shared<BatchSender>(io_context, clock, limits, send);
    engine->receiver_ = std::make_unique<BatchReceiver>(clock, limits, send);
    engine->sender_->set_backlog_query([weak]() -> std::size_t {
        auto self = weak.lock();
        auto connection = self ? self->connection_.lock() : nullptr;
        return connection ? connection->buffered_bytes() : 0;
    });
    
    engine->sender_->set_finished_handler([weak](const BatchProgress& batch) {
        if (auto self = weak.lock()) {
            self->on_batch_finished(Direction::OUTGOING, batch);
        }
    });
    engine->receiver_->set_finished_handler([weak](const BatchProgress& batch) {
        if (auto self = weak.lock()) {
            self->on_batch_finished(Direction::INCOMING, batch);
        }
    });
    return engine;
}

TransferEngine::TransferEngine(core::TransferLimits limits)
    : limits_(limits) {}

void TransferEngine::attach(std::shared_ptr<network::ConnectionStateMachine> connection) {
    connection_ = connection;
    send_ = nullptr;
    
    std::weak_ptr<TransferEngine> weak = weak_from_this();
    connection->set_transfer_handler([weak](const network::PeerMessage& message) {
        if (auto self = weak.lock()) {
            self->handle_message(message);
        }
    });
    connection->add_state_listener([weak](const network::ConnectionInfo& info) {
        if (auto self = weak.lock()) {
            self->on_connection_state(info);
        }
    });
}

void TransferEngine::attach(SendFunction send) {
    connection_.reset();
    send_ = std::move(send);
}

void TransferEngine::set_progress_listener(DirectionalProgressListener listener) {
    if (!listener) {
        sender_->set_progress_listener(nullptr);
        receiver_->set_progress_listener(nullptr);
        return;
    }
    
    sender_->set_progress_listener([listener](const BatchProgress& batch, const TransferProgress& file) {
        listener(Direction::OUTGOING, batch, file);
    });
    receiver_->set_progress_listener([listener](const BatchProgress& batch, const TransferProgress& file) {
        listener(Direction::INCOMING, batch, file);
    });
}

SendOutcome TransferEngine::send_files(const std::vector<std::shared_ptr<FileSource>>& files) {
    SendOutcome outcome;
    
    if (auto connection = connection_.lock(); connection && !connection->is_authenticated()) {
        outcome.error = "Not connected to a peer";
        return outcome;
    }
    if (!connection_.lock() && !send_) {
        outcome.error = "No connection attached";
        return outcome;
    }
    if (sender_->is_running()) {
        outcome.error = "A batch is already being sent";
        return outcome;
    }
    
    outcome.validation = validate_batch(files, limits_);
    const auto& validation = outcome.validation;
    
    for (const auto& rejected : validation.rejected_files) {
        audit(security::AuditEventType::FILE_VALIDATION_FAILED, {
            {"fileName", rejected.source->name()},
            {"errors", join(rejected.result.errors)}
        });
    }
    
    if (!validation.accepted()) {
        outcome.error = validation.rejection_reason();
        LOG_WARN("Batch rejected: {}", outcome.error);
        return outcome;
    }
    
    std::vector<PreparedFile> prepared;
    prepared.reserve(validation.valid_files.size());
    for (const auto& source : validation.valid_files) {
        try {
            prepared.push_back(PreparedFile{source, create_file_metadata(*source, limits_)});
        } catch (const std::exception& e) {
            outcome.error = "Failed to read " + source->name() + ": " + e.what();
            LOG_ERROR("{}", outcome.error);
            return outcome;
        }
        audit(security::AuditEventType::FILE_VALIDATION_PASSED, {
            {"fileName", prepared.back().metadata.sanitized_name},
            {"size", std::to_string(prepared.back().metadata.size)}
        });
    }
    
    enter_phase(network::ConnectionState::TRANSFERRING);
    
    outcome.batch_id = sender_->start(std::move(prepared));
    if (outcome.batch_id.empty()) {
        outcome.error = "Failed to start the batch";
        return outcome;
    }
    
    outcome.started = true;
    audit(security::AuditEventType::TRANSFER_STARTED, {
        {"batchId", outcome.batch_id},
        {"totalFiles", std::to_string(validation.valid_files.size())},
        {"totalSize", std::to_string(validation.total_size)}
    });
    return outcome;
}

void TransferEngine::cancel() {
    sender_->cancel();
}

void TransferEngine::handle_message(const network::PeerMessage& message) {
    std::visit(network::overloaded{
        [this](const network::BatchStartMessage& msg) {
            enter_phase(network::ConnectionState::TRANSFERRING);
            receiver_->handle(msg);
        },
        [this](const network::FileMetadataMessage& msg) { receiver_->handle(msg); },
        [this](const network::FileChunkMessage& msg) { receiver_->handle(msg); },
        [this](const network::FileCompleteMessage& msg) { receiver_->handle(msg); },
        [this](const network::BatchCompleteMessage& msg) { receiver_->handle(msg); },
        [this](const network::FileErrorMessage& msg) {
            // Our own outgoing file, rejected by the receiver; otherwise the sender's report.
            if (!sender_->handle_file_error(msg)) {
                receiver_->handle(msg);
            }
        },
        [&message](const auto&) {
            LOG_WARN("Transfer engine ignoring {}", network::message_type_name(message.type()));
        }
    }, message.payload);
}

void TransferEngine::on_connection_state(const network::ConnectionInfo& info) {
    if (network::is_authenticated_state(info.state)) {
        return;
    }
    
    sender_->abort(CONNECTION_LOST);
    receiver_->abort(CONNECTION_LOST);
}

bool TransferEngine::transmit(const network::PeerMessage& message) {
    if (auto connection = connection_.lock()) {
        return connection->send(message);
    }
    return send_ && send_(message);
}

void TransferEngine::on_batch_finished(Direction direction, const BatchProgress& batch) {
    auto direction_name = direction == Direction::OUTGOING ? "outgoing" : "incoming";
    
    if (batch.status == BatchStatus::COMPLETED) {
        audit(security::AuditEventType::TRANSFER_COMPLETED, {
            {"batchId", batch.batch_id},
            {"direction", direction_name},
            {"files", std::to_string(batch.completed_files)},
            {"bytes", std::to_string(batch.bytes_transferred)}
        });
    } else {
        audit(security::AuditEventType::TRANSFER_FAILED, {
            {"batchId", batch.batch_id},
            {"direction", direction_name},
            {"status", batch_status_name(batch.status)},
            {"completedFiles", std::to_string(batch.completed_files)},
            {"totalFiles", std::to_string(batch.total_files)}
        });
    }
    
    if (!sender_->is_running() && !receiver_->is_active()) {
        enter_phase(network::ConnectionState::COMPLETED);
    }
    
    if (finished_handler_) {
        finished_handler_(direction, batch);
    }
}

void TransferEngine::enter_phase(network::ConnectionState phase) {
    auto connection = connection_.lock();
    if (!connection || !connection->is_authenticated()) {
        return;
    }
    if (!connection->set_transfer_phase(phase)) {
        LOG_DEBUG("Connection stays {} instead of {}", network::connection_state_name(connection->state()),
                  network::connection_state_name(phase));
    }
}

void TransferEngine::audit(security::AuditEventType type, security::AuditDetails details) {
    if (audit_sink_) {
        audit_sink_(type, details);
    }
}

}
