#include "handoff/network/connection_state_machine.hpp"
#include "handoff/crypto/hash.hpp"
#include "handoff/core/logger.hpp"
#include <atomic>

namespace handoff::network {

void ConnectionStateMachine::dispatch(const PeerMessage& message) {
    std::visit(overloaded{
        [this](const ConnectionRequestMessage& msg) { handle(msg); },
        [this](const ConnectionApprovedMessage& msg) { handle(msg); },
        [this](const ConnectionDeniedMessage& msg) { handle(msg); },
        [this](const PinRequiredMessage& msg) { handle(msg); },
        [this](const PinAttemptMessage& msg) { handle(msg); },
        [this](const PinVerifiedMessage& msg) { handle(msg); },
        [this](const PinInvalidMessage& msg) { handle(msg); },
        [this](const HeartbeatMessage& msg) { handle(msg); },
        [this](const DisconnectMessage& msg) { handle(msg); },
        [this, &message](const BatchStartMessage&) { forward_transfer_message(message); },
        [this, &message](const FileMetadataMessage&) { forward_transfer_message(message); },
        [this, &message](const FileChunkMessage&) { forward_transfer_message(message); },
        [this, &message](const FileCompleteMessage&) { forward_transfer_message(message); },
        [this, &message](const BatchCompleteMessage&) { forward_transfer_message(message); },
        [this, &message](const FileErrorMessage&) { forward_transfer_message(message); }
    }, message.payload);
}

void ConnectionStateMachine::handle(const ConnectionRequestMessage& msg) {
    if (role_ != Role::HOST) {
        LOG_WARN("Client ignoring connection_request");
        return;
    }
    if (host_phase_ != HostPhase::AWAITING_REQUEST) {
        LOG_WARN("Ignoring repeated connection_request from {}", msg.peer_id);
        return;
    }
    
    info_.remote_peer_id = msg.peer_id;
    
    if (rate_limiter_.is_limited(msg.peer_id)) {
        LOG_WARN("Peer {} is rate limited", msg.peer_id);
        audit(security::AuditEventType::RATE_LIMIT_EXCEEDED, {{"peerId", msg.peer_id}});
        deny_and_release("Too many connection attempts. Please try again later.",
                         security::AuditEventType::CONNECTION_DENIED);
        return;
    }
    
    auto entry = rate_limiter_.record_attempt(msg.peer_id);
    audit(security::AuditEventType::CONNECTION_ATTEMPT,
          {{"peerId", msg.peer_id}, {"attempts", std::to_string(entry.attempts)}});
    
    host_phase_ = HostPhase::AWAITING_DECISION;
    transition(ConnectionState::AWAITING_APPROVAL);
    start_approval_timer();
    request_approval(msg.peer_id, msg.device_info);
}

void ConnectionStateMachine::request_approval(const std::string& peer_id, const std::string& device_info) {
    auto generation = generation_;
    std::weak_ptr<ConnectionStateMachine> weak = weak_from_this();
    auto& io_context = io_context_;
    
    if (!approval_provider_) {
        LOG_WARN("No approval provider installed, denying {}", peer_id);
        boost::asio::post(io_context, [weak, generation] {
            if (auto self = weak.lock()) {
                self->on_approval_decision(generation, false);
            }
        });
        return;
    }
    
    auto decided = std::make_shared<std::atomic<bool>>(false);
    approval_provider_(peer_id, device_info, [weak, generation, decided, &io_context](bool approved) {
        if (decided->exchange(true)) {
            return;
        }
        boost::asio::post(io_context, [weak, generation, approved] {
            if (auto self = weak.lock()) {
                self->on_approval_decision(generation, approved);
            }
        });
    });
}

void ConnectionStateMachine::on_approval_decision(std::uint64_t generation, bool approved) {
    if (generation != generation_ || host_phase_ != HostPhase::AWAITING_DECISION) {
        LOG_DEBUG("Discarding stale approval decision");
        return;
    }
    
    approval_timer_.cancel();
    
    if (!approved) {
        deny_and_release("Connection denied by host", security::AuditEventType::CONNECTION_DENIED);
        return;
    }
    
    auto session = rooms_.get(info_.room_code);
    if (!session) {
        expire_room();
        return;
    }
    
    if (session->pin_hash) {
        host_phase_ = HostPhase::AWAITING_PIN;
        info_.is_pin_required = true;
        if (!send_payload(PinRequiredMessage{})) {
            release_peer("Failed to send PIN challenge");
            return;
        }
        LOG_INFO("Approved {}, waiting for PIN", info_.remote_peer_id);
        notify_listeners();
        return;
    }
    
    approve_peer();
}

void ConnectionStateMachine::on_approval_timeout(std::uint64_t generation) {
    if (generation != generation_ || host_phase_ != HostPhase::AWAITING_DECISION) {
        return;
    }
    
    LOG_WARN("Approval for {} timed out", info_.remote_peer_id);
    deny_and_release("Connection request timed out", security::AuditEventType::CONNECTION_DENIED);
}

void ConnectionStateMachine::approve_peer() {
    if (!send_payload(ConnectionApprovedMessage{})) {
        release_peer("Failed to send approval");
        return;
    }
    mark_authenticated();
}

void ConnectionStateMachine::expire_room() {
    if (!send_payload(ConnectionDeniedMessage{"Room code expired"})) {
        LOG_DEBUG("Expiry notice could not be delivered");
    }
    audit(security::AuditEventType::SESSION_TIMEOUT, {{"roomCode", info_.room_code.substr(0, 4) + "****"}});
    
    stop_timers();
    detach_channel();
    host_phase_ = HostPhase::NONE;
    transport_.stop_listening(info_.room_code);
    rooms_.destroy(info_.room_code);
    transition(ConnectionState::ERROR, "Room code expired");
}

void ConnectionStateMachine::handle(const PinAttemptMessage& msg) {
    if (role_ != Role::HOST || host_phase_ != HostPhase::AWAITING_PIN) {
        LOG_WARN("Ignoring unexpected pin_attempt");
        return;
    }
    
    auto session = rooms_.get(info_.room_code);
    if (!session) {
        expire_room();
        return;
    }
    
    if (session->pin_hash && crypto::hash_utils::constant_time_equals(msg.hashed_pin, *session->pin_hash)) {
        info_.is_pin_verified = true;
        audit(security::AuditEventType::PIN_VERIFIED);
        if (!send_payload(PinVerifiedMessage{})) {
            release_peer("Failed to confirm PIN");
            return;
        }
        approve_peer();
        return;
    }
    
    ++pin_failures_;
    audit(security::AuditEventType::PIN_FAILED, {{"attemptNumber", std::to_string(pin_failures_)}});
    
    auto remaining = limits_.max_pin_attempts > pin_failures_ ? limits_.max_pin_attempts - pin_failures_ : 0;
    if (remaining == 0) {
        exhaust_pin_attempts();
        return;
    }
    
    LOG_WARN("Incorrect PIN from {}, {} attempts remaining", info_.remote_peer_id, remaining);
    if (!send_payload(PinInvalidMessage{remaining})) {
        release_peer("Failed to report invalid PIN");
    }
}

void ConnectionStateMachine::exhaust_pin_attempts() {
    const std::string reason = "Too many incorrect PIN attempts";
    
    if (!send_payload(ConnectionDeniedMessage{reason})) {
        LOG_DEBUG("Denial could not be delivered");
    }
    audit(security::AuditEventType::CONNECTION_DENIED, {{"peerId", info_.remote_peer_id}, {"reason", reason}});
    
    stop_timers();
    detach_channel();
    host_phase_ = HostPhase::NONE;
    transport_.stop_listening(info_.room_code);
    rooms_.destroy(info_.room_code);
    
    info_.room_code.clear();
    info_.peer_id.clear();
    info_.remote_peer_id.clear();
    transition(ConnectionState::IDLE, reason);
}

void ConnectionStateMachine::handle(const ConnectionApprovedMessage&) {
    if (role_ != Role::CLIENT || info_.state != ConnectionState::AWAITING_APPROVAL) {
        LOG_WARN("Ignoring unexpected connection_approved");
        return;
    }
    
    pin_prompt_pending_ = false;
    mark_authenticated();
}

void ConnectionStateMachine::handle(const ConnectionDeniedMessage& msg) {
    if (role_ != Role::CLIENT) {
        LOG_WARN("Host ignoring connection_denied");
        return;
    }
    
    auto reason = msg.reason.empty() ? std::string("Connection denied") : msg.reason;
    audit(security::AuditEventType::CONNECTION_DENIED, {{"reason", reason}});
    
    stop_timers();
    detach_channel();
    pin_prompt_pending_ = false;
    transition(ConnectionState::ERROR, reason);
}

void ConnectionStateMachine::handle(const PinRequiredMessage&) {
    if (role_ != Role::CLIENT || info_.state != ConnectionState::AWAITING_APPROVAL) {
        LOG_WARN("Ignoring unexpected pin_required");
        return;
    }
    
    info_.is_pin_required = true;
    notify_listeners();
    request_pin(1);
}

void ConnectionStateMachine::handle(const PinVerifiedMessage&) {
    if (role_ != Role::CLIENT || info_.state != ConnectionState::AWAITING_APPROVAL) {
        LOG_WARN("Ignoring unexpected pin_verified");
        return;
    }
    
    info_.is_pin_verified = true;
    audit(security::AuditEventType::PIN_VERIFIED);
    notify_listeners();
}

void ConnectionStateMachine::handle(const PinInvalidMessage& msg) {
    if (role_ != Role::CLIENT || info_.state != ConnectionState::AWAITING_APPROVAL) {
        LOG_WARN("Ignoring unexpected pin_invalid");
        return;
    }
    
    audit(security::AuditEventType::PIN_FAILED, {{"attemptsRemaining", std::to_string(msg.attempts_remaining)}});
    
    std::uint32_t next_attempt = 1;
    if (msg.attempts_remaining < limits_.max_pin_attempts) {
        next_attempt = limits_.max_pin_attempts - msg.attempts_remaining + 1;
    }
    request_pin(next_attempt);
}

void ConnectionStateMachine::request_pin(std::uint32_t attempt_number) {
    auto generation = generation_;
    std::weak_ptr<ConnectionStateMachine> weak = weak_from_this();
    auto& io_context = io_context_;
    pin_prompt_pending_ = true;
    
    if (!pin_entry_provider_) {
        LOG_WARN("No PIN entry provider installed, cancelling");
        boost::asio::post(io_context, [weak, generation, attempt_number] {
            if (auto self = weak.lock()) {
                self->on_pin_entered(generation, attempt_number, std::nullopt);
            }
        });
        return;
    }
    
    auto answered = std::make_shared<std::atomic<bool>>(false);
    pin_entry_provider_(attempt_number,
        [weak, generation, attempt_number, answered, &io_context](std::optional<std::string> pin) {
            if (answered->exchange(true)) {
                return;
            }
            boost::asio::post(io_context, [weak, generation, attempt_number, pin = std::move(pin)]() mutable {
                if (auto self = weak.lock()) {
                    self->on_pin_entered(generation, attempt_number, std::move(pin));
                } else if (pin) {
                    crypto::secure_zero(*pin);
                }
            });
        });
}

void ConnectionStateMachine::on_pin_entered(std::uint64_t generation, std::uint32_t attempt_number,
                                            std::optional<std::string> pin) {
    if (generation != generation_ || !pin_prompt_pending_ ||
        info_.state != ConnectionState::AWAITING_APPROVAL) {
        if (pin) {
            crypto::secure_zero(*pin);
        }
        return;
    }
    
    pin_prompt_pending_ = false;
    
    if (!pin) {
        LOG_INFO("PIN entry cancelled");
        if (!send_payload(DisconnectMessage{})) {
            LOG_DEBUG("Disconnect notice could not be delivered");
        }
        stop_timers();
        detach_channel();
        info_.is_pin_required = false;
        transition(ConnectionState::IDLE, "PIN entry cancelled");
        return;
    }
    
    auto hashed = crypto::hash_utils::hash_pin(*pin);
    crypto::secure_zero(*pin);
    
    if (!send_payload(PinAttemptMessage{hashed, attempt_number})) {
        on_link_lost("Failed to send PIN attempt", true);
    }
}

void ConnectionStateMachine::handle(const HeartbeatMessage&) {
    LOG_TRACE("Heartbeat from {}", info_.remote_peer_id.empty() ? "host" : info_.remote_peer_id);
}

void ConnectionStateMachine::handle(const DisconnectMessage&) {
    LOG_INFO("Peer sent disconnect");
    
    if (role_ == Role::HOST && host_phase_ != HostPhase::AUTHENTICATED) {
        release_peer("Peer disconnected");
        return;
    }
    
    stop_timers();
    detach_channel();
    host_phase_ = HostPhase::NONE;
    pin_prompt_pending_ = false;
    
    if (role_ == Role::HOST && !info_.room_code.empty()) {
        transport_.stop_listening(info_.room_code);
        rooms_.destroy(info_.room_code);
    }
    
    transition(ConnectionState::DISCONNECTED);
}

void ConnectionStateMachine::forward_transfer_message(const PeerMessage& message) {
    if (!is_authenticated()) {
        LOG_WARN("Dropping {} received before authentication", message_type_name(message.type()));
        return;
    }
    if (!transfer_handler_) {
        LOG_WARN("No transfer handler for {}", message_type_name(message.type()));
        return;
    }
    transfer_handler_(message);
}

}
