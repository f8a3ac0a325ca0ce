#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace handoff::network {

// Reliable, ordered, message-oriented link to exactly one remote endpoint.
// Handlers fire only for remote-initiated events; a local close() is silent.
class Channel {
public:
    using MessageHandler = std::function<void(std::vector<std::uint8_t>)>;
    using CloseHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const std::string&)>;
    
    virtual ~Channel() = default;
    
    // Starts delivering inbound frames; frames that arrived earlier are held until then.
    virtual void open() = 0;
    
    // False when the channel is closed or refuses the frame.
    virtual bool send(std::vector<std::uint8_t> frame) = 0;
    
    // Pending outbound frames are still flushed.
    virtual void close() = 0;
    
    virtual bool is_open() const = 0;
    virtual std::string remote_description() const = 0;
    
    // Bytes accepted by send() that the remote end has not taken yet.
    virtual std::size_t buffered_bytes() const = 0;
    
    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }
    void set_close_handler(CloseHandler handler) { close_handler_ = std::move(handler); }
    void set_error_handler(ErrorHandler handler) { error_handler_ = std::move(handler); }

protected:
    void notify_message(std::vector<std::uint8_t> frame) {
        if (message_handler_) message_handler_(std::move(frame));
    }
    
    void notify_close() {
        if (close_handler_) close_handler_();
    }
    
    void notify_error(const std::string& error) {
        if (error_handler_) error_handler_(error);
    }

private:
    MessageHandler message_handler_;
    CloseHandler close_handler_;
    ErrorHandler error_handler_;
};

// Produces channels addressed by room code.
class Transport {
public:
    using IncomingHandler = std::function<void(std::shared_ptr<Channel>)>;
    // `channel` is null when `error` is set.
    using ConnectHandler = std::function<void(std::shared_ptr<Channel> channel, const std::string& error)>;
    
    virtual ~Transport() = default;
    
    virtual void listen(const std::string& room_code, IncomingHandler handler) = 0;
    virtual void stop_listening(const std::string& room_code) = 0;
    virtual void connect(const std::string& room_code, ConnectHandler handler) = 0;
};

}
