#pragma once

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace handoff::core {

// Reads answers from a terminal descriptor on the event loop. One read is kept
// outstanding for the lifetime of the object; each line goes to the prompt that
// is waiting at that moment and is dropped when none is.
class LinePrompt : public std::enable_shared_from_this<LinePrompt> {
public:
    // nullopt once the input is closed or cannot be read.
    using AnswerHandler = std::function<void(std::optional<std::string>)>;
    
    // The descriptor stays open when the prompt is destroyed.
    static std::shared_ptr<LinePrompt> create(boost::asio::io_context& io_context, int fd, std::ostream& out);
    ~LinePrompt();
    
    LinePrompt(const LinePrompt&) = delete;
    LinePrompt& operator=(const LinePrompt&) = delete;
    
    // Replaces a prompt that is still unanswered; its handler is never called.
    void ask(const std::string& question, AnswerHandler handler);
    
    bool is_waiting() const { return static_cast<bool>(pending_); }
    bool is_closed() const { return closed_; }

private:
    LinePrompt(boost::asio::io_context& io_context, std::ostream& out);
    
    void start(int fd);
    void read_line();
    void close_input(const std::string& reason);
    
    boost::asio::io_context& io_context_;
    boost::asio::posix::stream_descriptor input_;
    boost::asio::streambuf buffer_;
    std::ostream& out_;
    AnswerHandler pending_;
    bool closed_;
};

}
