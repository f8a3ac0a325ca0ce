#pragma once

#include "handoff/network/channel.hpp"
#include "handoff/network/peer_message.hpp"
#include "handoff/security/audit_log.hpp"
#include "handoff/security/rate_limiter.hpp"
#include "handoff/security/room_registry.hpp"
#include "handoff/crypto/crypto_types.hpp"
#include "handoff/core/limits.hpp"
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace handoff::network {

enum class ConnectionState {
    IDLE,
    CONNECTING,
    AWAITING_APPROVAL,
    CONNECTED,
    TRANSFERRING,
    COMPLETED,
    ERROR,
    DISCONNECTED
};

enum class Role {
    HOST,
    CLIENT
};

std::string connection_state_name(ConnectionState state);

// CONNECTED, TRANSFERRING and COMPLETED.
bool is_authenticated_state(ConnectionState state);

struct ConnectionInfo {
    ConnectionState state = ConnectionState::IDLE;
    std::string peer_id;
    std::string remote_peer_id;
    std::string room_code;
    std::optional<std::uint64_t> connected_at;  // unix ms
    std::string error;
    bool is_pin_required = false;
    bool is_pin_verified = false;
};

// One-shot responders; only the first call counts and it may come from any thread.
using ApprovalResponder = std::function<void(bool approved)>;
using ApprovalProvider = std::function<void(const std::string& peer_id,
                                            const std::string& device_info,
                                            ApprovalResponder respond)>;
using PinResponder = std::function<void(std::optional<std::string> pin)>;
using PinEntryProvider = std::function<void(std::uint32_t attempt_number, PinResponder respond)>;

using StateListener = std::function<void(const ConnectionInfo&)>;
using TransferMessageHandler = std::function<void(const PeerMessage&)>;

// Owns the handshake and lifecycle of a single peer link. Every callback runs
// on the io_context; create through create() so timers can hold a reference.
class ConnectionStateMachine : public std::enable_shared_from_this<ConnectionStateMachine> {
public:
    struct Dependencies {
        boost::asio::io_context& io_context;
        Transport& transport;
        security::RoomRegistry& rooms;
        security::RateLimiter& rate_limiter;
    };
    
    static std::shared_ptr<ConnectionStateMachine> create(Dependencies deps, Role role,
                                                          core::SecurityLimits limits);
    ~ConnectionStateMachine();
    
    ConnectionStateMachine(const ConnectionStateMachine&) = delete;
    ConnectionStateMachine& operator=(const ConnectionStateMachine&) = delete;
    
    // Host: issues a room and listens on it. Client: joins `room_code`.
    // Allowed from IDLE (no room), ERROR and DISCONNECTED; state is rebuilt.
    crypto::CryptoResult connect(const std::string& room_code = "");
    void disconnect();
    
    // Host only. Applies to the current room and to rooms issued later.
    crypto::CryptoResult set_pin(const std::string& pin);
    
    // Fails unless authenticated and the channel accepts the frame.
    bool send(const PeerMessage& message);
    std::size_t buffered_bytes() const { return channel_ ? channel_->buffered_bytes() : 0; }
    
    // CONNECTED -> TRANSFERRING -> COMPLETED, and back to TRANSFERRING for a new batch.
    bool set_transfer_phase(ConnectionState phase);
    
    void set_approval_provider(ApprovalProvider provider) { approval_provider_ = std::move(provider); }
    void set_pin_entry_provider(PinEntryProvider provider) { pin_entry_provider_ = std::move(provider); }
    void set_audit_sink(security::AuditSink sink) { audit_sink_ = std::move(sink); }
    void set_transfer_handler(TransferMessageHandler handler) { transfer_handler_ = std::move(handler); }
    void set_device_info(std::string device_info) { device_info_ = std::move(device_info); }
    void add_state_listener(StateListener listener);
    
    const ConnectionInfo& info() const { return info_; }
    ConnectionState state() const { return info_.state; }
    Role role() const { return role_; }
    bool is_authenticated() const { return is_authenticated_state(info_.state); }
    std::string formatted_room_code() const;
    const core::SecurityLimits& limits() const { return limits_; }

private:
    // Host-side progress through the handshake for the current channel.
    enum class HostPhase {
        NONE,
        AWAITING_REQUEST,
        AWAITING_DECISION,
        AWAITING_PIN,
        AUTHENTICATED
    };
    
    ConnectionStateMachine(Dependencies deps, Role role, core::SecurityLimits limits);
    
    crypto::CryptoResult start_hosting();
    crypto::CryptoResult join_room(const std::string& room_code);
    void reset_for_reconnect();
    
    void transition(ConnectionState next, const std::string& error = "");
    void notify_listeners();
    
    void attach_channel(std::shared_ptr<Channel> channel);
    void detach_channel();
    void on_incoming_channel(std::shared_ptr<Channel> channel);
    void on_client_connected(std::shared_ptr<Channel> channel, const std::string& error);
    void on_frame(std::uint64_t generation, std::vector<std::uint8_t> frame);
    void on_channel_closed(std::uint64_t generation);
    void on_channel_error(std::uint64_t generation, const std::string& error);
    void on_link_lost(const std::string& reason, bool is_error);
    
    bool send_raw(const PeerMessage& message);
    template<MessagePayload T>
    bool send_payload(T body) { return send_raw(PeerMessage::make(std::move(body))); }
    
    // Host: rejects the current peer and reopens the room to other devices.
    void release_peer(const std::string& reason);
    void deny_and_release(const std::string& reason, security::AuditEventType event);
    void approve_peer();
    void expire_room();
    void exhaust_pin_attempts();
    void mark_authenticated();
    
    void start_approval_timer();
    void start_heartbeat();
    void stop_timers();
    
    void request_approval(const std::string& peer_id, const std::string& device_info);
    void on_approval_decision(std::uint64_t generation, bool approved);
    void on_approval_timeout(std::uint64_t generation);
    void request_pin(std::uint32_t attempt_number);
    void on_pin_entered(std::uint64_t generation, std::uint32_t attempt_number,
                        std::optional<std::string> pin);
    
    // Message handlers, one per wire type.
    void dispatch(const PeerMessage& message);
    void handle(const ConnectionRequestMessage& msg);
    void handle(const ConnectionApprovedMessage& msg);
    void handle(const ConnectionDeniedMessage& msg);
    void handle(const PinRequiredMessage& msg);
    void handle(const PinAttemptMessage& msg);
    void handle(const PinVerifiedMessage& msg);
    void handle(const PinInvalidMessage& msg);
    void handle(const HeartbeatMessage& msg);
    void handle(const DisconnectMessage& msg);
    void forward_transfer_message(const PeerMessage& message);
    
    void audit(security::AuditEventType type, security::AuditDetails details = {});
    
    boost::asio::io_context& io_context_;
    Transport& transport_;
    security::RoomRegistry& rooms_;
    security::RateLimiter& rate_limiter_;
    core::SecurityLimits limits_;
    Role role_;
    
    ConnectionInfo info_;
    std::string device_info_;
    std::shared_ptr<Channel> channel_;
    std::uint64_t generation_;
    HostPhase host_phase_;
    std::uint32_t pin_failures_;
    std::optional<std::string> pending_pin_hash_;
    bool pin_prompt_pending_;
    
    boost::asio::steady_timer approval_timer_;
    boost::asio::steady_timer heartbeat_timer_;
    
    ApprovalProvider approval_provider_;
    PinEntryProvider pin_entry_provider_;
    security::AuditSink audit_sink_;
    TransferMessageHandler transfer_handler_;
    std::vector<StateListener> state_listeners_;
};

}
