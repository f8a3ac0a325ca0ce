#include "handoff/core/line_prompt.hpp"
#include "handoff/core/logger.hpp"
#include "handoff/core/utils.hpp"
#include <istream>

namespace handoff::core {

std::shared_ptr<LinePrompt> LinePrompt::create(boost::asio::io_context& io_context, int fd, std::ostream& out) {
    auto prompt = std::shared_ptr<LinePrompt>(new LinePrompt(io_context, out));
    prompt->start(fd);
    return prompt;
}

LinePrompt::LinePrompt(boost::asio::io_context& io_context, std::ostream& out)
    : io_context_(io_context)
    , input_(io_context)
    , out_(out)
    , closed_(false) {}

LinePrompt::~LinePrompt() {
    if (input_.is_open()) {
        input_.release();
    }
}

void LinePrompt::start(int fd) {
    boost::system::error_code ec;
    input_.assign(fd, ec);
    if (ec) {
        // Regular files and /dev/null cannot be watched by the reactor.
        closed_ = true;
        LOG_DEBUG("Interactive input unavailable on descriptor {}: {}", fd, ec.message());
        return;
    }
    read_line();
}

void LinePrompt::ask(const std::string& question, AnswerHandler handler) {
    out_ << question << std::flush;
    
    if (closed_) {
        LOG_WARN("No interactive input; treating the prompt as unanswered");
        boost::asio::post(io_context_, [handler = std::move(handler)] { handler(std::nullopt); });
        return;
    }
    if (pending_) {
        LOG_DEBUG("Unanswered prompt replaced");
    }
    pending_ = std::move(handler);
}

void LinePrompt::read_line() {
    std::weak_ptr<LinePrompt> weak = weak_from_this();
    boost::asio::async_read_until(input_, buffer_, '\n',
        [weak](const boost::system::error_code& ec, std::size_t) {
            auto self = weak.lock();
            if (!self || ec == boost::asio::error::operation_aborted) {
                return;
            }
            if (ec) {
                self->close_input(ec == boost::asio::error::eof ? "end of input" : ec.message());
                return;
            }
            
            std::istream stream(&self->buffer_);
            std::string line;
            std::getline(stream, line);
            
            auto handler = std::move(self->pending_);
            self->pending_ = nullptr;
            if (handler) {
                handler(utils::StringUtils::trim(line));
            } else {
                LOG_DEBUG("Discarding input typed while no prompt was open");
            }
            self->read_line();
        });
}

void LinePrompt::close_input(const std::string& reason) {
    LOG_DEBUG("Interactive input closed: {}", reason);
    closed_ = true;
    
    auto handler = std::move(pending_);
    pending_ = nullptr;
    if (handler) {
        handler(std::nullopt);
    }
}

}
