#pragma once

#include <string>
#include <functional>
#include <boost/asio/io_context.hpp>

#include "message.hpp"

namespace chatgate {

// Entry point a platform adapter calls for every inbound message.
// Returns the response text to transmit (empty means "send nothing").
// Throws GatewayError for security rejections; other exceptions come from the handler.
using MessageCallback = std::function<std::string(Message&)>;

// Capability interface for chat platform adapters (Telegram, Slack, ...).
class Platform {
public:
    virtual ~Platform() = default;

    virtual std::string name() const = 0;

    // Begins receiving messages. Adapters schedule their I/O on the supplied context.
    virtual void start(boost::asio::io_context& ioc) = 0;

    virtual void stop() = 0;

    virtual void send(const std::string& chat_id, const std::string& text) = 0;

    virtual void set_handler(MessageCallback handler) = 0;
};

}
