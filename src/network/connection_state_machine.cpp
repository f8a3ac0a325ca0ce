#include "handoff/network/connection_state_machine.hpp"
#include "handoff/crypto/hash.hpp"
#include "handoff/crypto/random.hpp"
#include "handoff/core/logger.hpp"
#include "handoff/core/utils.hpp"

namespace handoff::network {

std::string connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::IDLE: return "idle";
        case ConnectionState::CONNECTING: return "connecting";
        case ConnectionState::AWAITING_APPROVAL: return "awaiting_approval";
        case ConnectionState::CONNECTED: return "connected";
        case ConnectionState::TRANSFERRING: return "transferring";
        case ConnectionState::COMPLETED: return "completed";
        case ConnectionState::ERROR: return "error";
        case ConnectionState::DISCONNECTED: return "disconnected";
    }
    return "unknown";
}

bool is_authenticated_state(ConnectionState state) {
    return state == ConnectionState::CONNECTED ||
           state == ConnectionState::TRANSFERRING ||
           state == ConnectionState::COMPLETED;
}

std::shared_ptr<ConnectionStateMachine> ConnectionStateMachine::create(Dependencies deps, Role role,
                                                                       core::SecurityLimits limits) {
    return std::shared_ptr<ConnectionStateMachine>(new ConnectionStateMachine(deps, role, limits));
}

ConnectionStateMachine::ConnectionStateMachine(Dependencies deps, Role role, core::SecurityLimits limits)
    : io_context_(deps.io_context)
    , transport_(deps.transport)
    , rooms_(deps.rooms)
    , rate_limiter_(deps.rate_limiter)
    , limits_(limits)
    , role_(role)
    , device_info_(core::utils::SystemUtils::device_description())
    , generation_(0)
    , host_phase_(HostPhase::NONE)
    , pin_failures_(0)
    , pin_prompt_pending_(false)
    , approval_timer_(deps.io_context)
    , heartbeat_timer_(deps.io_context) {}

ConnectionStateMachine::~ConnectionStateMachine() {
    stop_timers();
    if (channel_) {
        channel_->close();
    }
    if (role_ == Role::HOST && !info_.room_code.empty()) {
        transport_.stop_listening(info_.room_code);
        rooms_.destroy(info_.room_code);
    }
}

crypto::CryptoResult ConnectionStateMachine::connect(const std::string& room_code) {
    bool busy = info_.state == ConnectionState::CONNECTING ||
                info_.state == ConnectionState::AWAITING_APPROVAL ||
                is_authenticated() ||
                (info_.state == ConnectionState::IDLE && role_ == Role::HOST && !info_.room_code.empty());
    if (busy) {
        return crypto::CryptoResult(crypto::CryptoError::INVALID_STATE,
                                    "Already " + connection_state_name(info_.state));
    }
    
    if (!crypto::SecureRandom::initialize()) {
        transition(ConnectionState::ERROR, "Secure random source unavailable");
        return crypto::CryptoResult(crypto::CryptoError::RANDOM_GENERATION_FAILED,
                                    "Secure random source unavailable");
    }
    
    if (role_ == Role::CLIENT && !security::is_valid_room_code_format(room_code, limits_.room_code_length)) {
        return crypto::CryptoResult(crypto::CryptoError::INVALID_INPUT, "Invalid room code format");
    }
    
    reset_for_reconnect();
    return role_ == Role::HOST ? start_hosting() : join_room(room_code);
}

void ConnectionStateMachine::reset_for_reconnect() {
    stop_timers();
    detach_channel();
    
    if (role_ == Role::HOST && !info_.room_code.empty()) {
        transport_.stop_listening(info_.room_code);
        rooms_.destroy(info_.room_code);
    }
    
    info_ = ConnectionInfo{};
    host_phase_ = HostPhase::NONE;
    pin_failures_ = 0;
    pin_prompt_pending_ = false;
}

crypto::CryptoResult ConnectionStateMachine::start_hosting() {
    transition(ConnectionState::CONNECTING);
    
    auto session = rooms_.issue();
    info_.room_code = session.room_code;
    info_.peer_id = "st-" + core::utils::StringUtils::to_lower(session.room_code);
    
    if (pending_pin_hash_) {
        auto result = rooms_.set_pin(session.room_code, *pending_pin_hash_);
        if (!result) {
            rooms_.destroy(session.room_code);
            info_.room_code.clear();
            transition(ConnectionState::ERROR, result.message);
            return result;
        }
        info_.is_pin_required = true;
    }
    
    try {
        std::weak_ptr<ConnectionStateMachine> weak = weak_from_this();
        transport_.listen(session.room_code, [weak](std::shared_ptr<Channel> channel) {
            if (auto self = weak.lock()) {
                self->on_incoming_channel(std::move(channel));
            } else {
                channel->close();
            }
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to listen for room {}: {}", formatted_room_code(), e.what());
        rooms_.destroy(session.room_code);
        info_.room_code.clear();
        std::string error = std::string("Failed to open listener: ") + e.what();
        transition(ConnectionState::ERROR, error);
        return crypto::CryptoResult(crypto::CryptoError::INVALID_STATE, error);
    }
    
    audit(security::AuditEventType::ROOM_CREATED, {{"roomCode", session.room_code.substr(0, 4) + "****"}});
    LOG_INFO("Hosting room {}", formatted_room_code());
    transition(ConnectionState::IDLE);
    return crypto::CryptoResult();
}

crypto::CryptoResult ConnectionStateMachine::join_room(const std::string& room_code) {
    info_.room_code = security::normalize_room_code(room_code);
    info_.peer_id = "client-" + crypto::SecureRandom::generate_hex_id(6);
    transition(ConnectionState::CONNECTING);
    
    auto generation = ++generation_;
    std::weak_ptr<ConnectionStateMachine> weak = weak_from_this();
    transport_.connect(info_.room_code,
        [weak, generation](std::shared_ptr<Channel> channel, const std::string& error) {
            auto self = weak.lock();
            if (!self || self->generation_ != generation) {
                if (channel) {
                    channel->close();
                }
                return;
            }
            self->on_client_connected(std::move(channel), error);
        });
    
    return crypto::CryptoResult();
}

void ConnectionStateMachine::on_client_connected(std::shared_ptr<Channel> channel, const std::string& error) {
    if (info_.state != ConnectionState::CONNECTING) {
        if (channel) {
            channel->close();
        }
        return;
    }
    
    if (!channel) {
        audit(security::AuditEventType::ERROR, {{"reason", error}});
        transition(ConnectionState::ERROR, error.empty() ? "Unable to reach host" : error);
        return;
    }
    
    attach_channel(std::move(channel));
    
    if (!send_payload(ConnectionRequestMessage{info_.peer_id, device_info_})) {
        detach_channel();
        transition(ConnectionState::ERROR, "Failed to send connection request");
        return;
    }
    
    transition(ConnectionState::AWAITING_APPROVAL);
}

void ConnectionStateMachine::disconnect() {
    if (channel_ && channel_->is_open()) {
        if (!send_payload(DisconnectMessage{})) {
            LOG_DEBUG("Disconnect notice could not be delivered");
        }
    }
    
    stop_timers();
    detach_channel();
    
    if (role_ == Role::HOST && !info_.room_code.empty()) {
        transport_.stop_listening(info_.room_code);
        rooms_.destroy(info_.room_code);
    }
    
    host_phase_ = HostPhase::NONE;
    pin_prompt_pending_ = false;
    
    if (info_.state != ConnectionState::DISCONNECTED) {
        transition(ConnectionState::DISCONNECTED);
    }
}

crypto::CryptoResult ConnectionStateMachine::set_pin(const std::string& pin) {
    if (role_ != Role::HOST) {
        return crypto::CryptoResult(crypto::CryptoError::INVALID_STATE, "Only the host sets a PIN");
    }
    if (!security::is_valid_pin_format(pin, limits_.pin_length)) {
        return crypto::CryptoResult(crypto::CryptoError::INVALID_INPUT,
                                    "PIN must be exactly " + std::to_string(limits_.pin_length) + " digits");
    }
    
    auto pin_hash = crypto::hash_utils::hash_pin(pin);
    
    if (!info_.room_code.empty()) {
        auto result = rooms_.set_pin(info_.room_code, pin_hash);
        if (!result) {
            return result;
        }
    }
    
    pending_pin_hash_ = pin_hash;
    info_.is_pin_required = true;
    audit(security::AuditEventType::PIN_SET);
    notify_listeners();
    return crypto::CryptoResult();
}

bool ConnectionStateMachine::send(const PeerMessage& message) {
    if (!is_authenticated() || !channel_) {
        LOG_WARN("Refusing to send {} while {}", message_type_name(message.type()),
                 connection_state_name(info_.state));
        return false;
    }
    
    if (send_raw(message)) {
        return true;
    }
    
    LOG_ERROR("Channel rejected {} message", message_type_name(message.type()));
    on_link_lost("Failed to send message: channel rejected it", true);
    return false;
}

bool ConnectionStateMachine::set_transfer_phase(ConnectionState phase) {
    if (!is_authenticated()) {
        return false;
    }
    if (phase != ConnectionState::TRANSFERRING && phase != ConnectionState::COMPLETED) {
        return false;
    }
    if (phase == info_.state) {
        return true;
    }
    if (phase == ConnectionState::COMPLETED && info_.state != ConnectionState::TRANSFERRING) {
        return false;
    }
    
    transition(phase);
    return true;
}

void ConnectionStateMachine::add_state_listener(StateListener listener) {
    state_listeners_.push_back(std::move(listener));
}

std::string ConnectionStateMachine::formatted_room_code() const {
    return security::format_room_code(info_.room_code, limits_.room_code_length);
}

void ConnectionStateMachine::transition(ConnectionState next, const std::string& error) {
    auto previous = info_.state;
    info_.state = next;
    
    if (!error.empty()) {
        info_.error = error;
    } else if (next == ConnectionState::CONNECTING || next == ConnectionState::CONNECTED) {
        info_.error.clear();
    }
    
    if (!error.empty()) {
        LOG_INFO("{} state {} -> {} ({})", role_ == Role::HOST ? "Host" : "Client",
                 connection_state_name(previous), connection_state_name(next), error);
    } else {
        LOG_INFO("{} state {} -> {}", role_ == Role::HOST ? "Host" : "Client",
                 connection_state_name(previous), connection_state_name(next));
    }
    
    notify_listeners();
}

void ConnectionStateMachine::notify_listeners() {
    auto listeners = state_listeners_;
    auto snapshot = info_;
    for (const auto& listener : listeners) {
        listener(snapshot);
    }
}

void ConnectionStateMachine::attach_channel(std::shared_ptr<Channel> channel) {
    auto generation = ++generation_;
    channel_ = std::move(channel);
    
    std::weak_ptr<ConnectionStateMachine> weak = weak_from_this();
    channel_->set_message_handler([weak, generation](std::vector<std::uint8_t> frame) {
        if (auto self = weak.lock()) {
            self->on_frame(generation, std::move(frame));
        }
    });
    channel_->set_close_handler([weak, generation] {
        if (auto self = weak.lock()) {
            self->on_channel_closed(generation);
        }
    });
    channel_->set_error_handler([weak, generation](const std::string& error) {
        if (auto self = weak.lock()) {
            self->on_channel_error(generation, error);
        }
    });
    
    channel_->open();
}

void ConnectionStateMachine::detach_channel() {
    ++generation_;
    if (channel_) {
        channel_->close();
        channel_.reset();
    }
}

void ConnectionStateMachine::on_incoming_channel(std::shared_ptr<Channel> channel) {
    auto deny = [&channel](const std::string& reason) {
        if (!channel->send(PeerMessage::make(ConnectionDeniedMessage{reason}).serialize())) {
            LOG_DEBUG("Denial could not be delivered to {}", channel->remote_description());
        }
        channel->close();
    };
    
    if (channel_) {
        LOG_WARN("Rejecting second peer {}: already paired", channel->remote_description());
        audit(security::AuditEventType::CONNECTION_DENIED, {{"reason", "already paired"}});
        deny("Host is already paired with another device");
        return;
    }
    
    if (info_.state != ConnectionState::IDLE || info_.room_code.empty()) {
        channel->close();
        return;
    }
    
    if (!rooms_.is_valid(info_.room_code)) {
        deny("Room code expired");
        audit(security::AuditEventType::SESSION_TIMEOUT, {{"roomCode", info_.room_code.substr(0, 4) + "****"}});
        transport_.stop_listening(info_.room_code);
        rooms_.destroy(info_.room_code);
        transition(ConnectionState::ERROR, "Room code expired");
        return;
    }
    
    LOG_DEBUG("Incoming channel from {}", channel->remote_description());
    attach_channel(std::move(channel));
    host_phase_ = HostPhase::AWAITING_REQUEST;
}

void ConnectionStateMachine::on_frame(std::uint64_t generation, std::vector<std::uint8_t> frame) {
    if (generation != generation_) {
        return;
    }
    
    PeerMessage message;
    try {
        message = PeerMessage::deserialize(frame);
    } catch (const std::exception& e) {
        LOG_WARN("Dropping malformed message ({} bytes): {}", frame.size(), e.what());
        return;
    }
    
    LOG_DEBUG("Received {}", message_type_name(message.type()));
    dispatch(message);
}

void ConnectionStateMachine::on_channel_closed(std::uint64_t generation) {
    if (generation != generation_) {
        return;
    }
    on_link_lost("Connection closed by peer", false);
}

void ConnectionStateMachine::on_channel_error(std::uint64_t generation, const std::string& error) {
    if (generation != generation_) {
        return;
    }
    on_link_lost(error.empty() ? "Connection lost" : error, true);
}

void ConnectionStateMachine::on_link_lost(const std::string& reason, bool is_error) {
    if (role_ == Role::HOST && host_phase_ != HostPhase::AUTHENTICATED && host_phase_ != HostPhase::NONE) {
        release_peer(reason);
        return;
    }
    
    bool was_authenticated = is_authenticated();
    stop_timers();
    detach_channel();
    host_phase_ = HostPhase::NONE;
    pin_prompt_pending_ = false;
    
    if (role_ == Role::HOST && !info_.room_code.empty()) {
        transport_.stop_listening(info_.room_code);
        rooms_.destroy(info_.room_code);
    }
    
    if (was_authenticated && !is_error) {
        transition(ConnectionState::DISCONNECTED, reason);
    } else {
        audit(security::AuditEventType::ERROR, {{"reason", reason}});
        transition(ConnectionState::ERROR, reason);
    }
}

bool ConnectionStateMachine::send_raw(const PeerMessage& message) {
    if (!channel_ || !channel_->is_open()) {
        return false;
    }
    LOG_TRACE("Sending {}", message_type_name(message.type()));
    return channel_->send(message.serialize());
}

void ConnectionStateMachine::release_peer(const std::string& reason) {
    stop_timers();
    detach_channel();
    host_phase_ = HostPhase::NONE;
    info_.remote_peer_id.clear();
    info_.is_pin_verified = false;
    transition(ConnectionState::IDLE, reason);
}

void ConnectionStateMachine::deny_and_release(const std::string& reason, security::AuditEventType event) {
    if (!send_payload(ConnectionDeniedMessage{reason})) {
        LOG_DEBUG("Denial could not be delivered");
    }
    audit(event, {{"peerId", info_.remote_peer_id}, {"reason", reason}});
    release_peer(reason);
}

void ConnectionStateMachine::mark_authenticated() {
    if (role_ == Role::HOST) {
        host_phase_ = HostPhase::AUTHENTICATED;
        rate_limiter_.clear(info_.remote_peer_id);
    }
    
    info_.connected_at = core::unix_time_ms();
    audit(security::AuditEventType::CONNECTION_APPROVED, {{"peerId", info_.remote_peer_id}});
    transition(ConnectionState::CONNECTED);
    start_heartbeat();
}

void ConnectionStateMachine::start_approval_timer() {
    auto generation = generation_;
    std::weak_ptr<ConnectionStateMachine> weak = weak_from_this();
    
    approval_timer_.expires_after(limits_.approval_timeout);
    approval_timer_.async_wait([weak, generation](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (auto self = weak.lock()) {
            self->on_approval_timeout(generation);
        }
    });
}

void ConnectionStateMachine::start_heartbeat() {
    auto generation = generation_;
    std::weak_ptr<ConnectionStateMachine> weak = weak_from_this();
    
    heartbeat_timer_.expires_after(limits_.heartbeat_interval);
    heartbeat_timer_.async_wait([weak, generation](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        auto self = weak.lock();
        if (!self || self->generation_ != generation || !self->is_authenticated()) {
            return;
        }
        if (!self->send_raw(PeerMessage::make(HeartbeatMessage{}))) {
            LOG_WARN("Heartbeat could not be sent");
        }
        self->start_heartbeat();
    });
}

void ConnectionStateMachine::stop_timers() {
    approval_timer_.cancel();
    heartbeat_timer_.cancel();
}

void ConnectionStateMachine::audit(security::AuditEventType type, security::AuditDetails details) {
    if (audit_sink_) {
        audit_sink_(type, details);
    }
}

}
