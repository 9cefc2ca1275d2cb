#include "console_platform.hpp"
#include "errors.hpp"
#include "event_logger.hpp"

#include <unistd.h>
#include <boost/asio/read_until.hpp>
#include <boost/asio/buffers_iterator.hpp>

namespace chatgate {

ConsolePlatform::ConsolePlatform(std::string user_id, std::string username, std::ostream& out)
    : user_id_(std::move(user_id)), username_(std::move(username)), out_(out) {}

void ConsolePlatform::set_handler(MessageCallback handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler_ = std::move(handler);
}

void ConsolePlatform::start(boost::asio::io_context& ioc) {
    int fd = ::dup(STDIN_FILENO);
    if (fd < 0) {
        throw std::runtime_error("cannot duplicate stdin");
    }
    input_ = std::make_unique<boost::asio::posix::stream_descriptor>(ioc, fd);
    do_read();
}

void ConsolePlatform::stop() {
    if (input_) {
        boost::system::error_code ec;
        input_->cancel(ec);
        input_->close(ec);
    }
}

void ConsolePlatform::send(const std::string& /*chat_id*/, const std::string& text) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << text << std::endl;
}

void ConsolePlatform::do_read() {
    boost::asio::async_read_until(*input_, buffer_, '\n',
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t bytes) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::PLATFORM, "internal",
                                     "console input closed: " + ec.message());
                }
                return;
            }
            std::string line(boost::asio::buffers_begin(self->buffer_.data()),
                             boost::asio::buffers_begin(self->buffer_.data()) + static_cast<std::ptrdiff_t>(bytes));
            self->buffer_.consume(bytes);
            while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
            if (!line.empty()) {
                self->deliver(line);
            }
            self->do_read();
        });
}

void ConsolePlatform::deliver(const std::string& line) {
    MessageCallback handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = handler_;
    }
    if (!handler) return;

    Message msg{
        .platform = name(),
        .chat_id = user_id_,
        .user_id = user_id_,
        .username = username_,
        .text = line
    };

    std::string reply;
    try {
        reply = handler(msg);
    } catch (const GatewayError& e) {
        reply = e.user_message();
    } catch (const std::exception& e) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::HANDLER_ERROR, "internal",
                         std::string("console handler failed: ") + e.what());
        reply = "Sorry, something went wrong.";
    }

    if (!reply.empty()) {
        send(user_id_, reply);
    }
}

}
