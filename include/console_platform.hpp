#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <iostream>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/streambuf.hpp>

#include "platform.hpp"

namespace chatgate {

// Development adapter: every stdin line is one DM from a fixed user, responses go to stdout.
class ConsolePlatform : public Platform, public std::enable_shared_from_this<ConsolePlatform> {
public:
    ConsolePlatform(std::string user_id, std::string username, std::ostream& out = std::cout);

    std::string name() const override { return "console"; }
    void start(boost::asio::io_context& ioc) override;
    void stop() override;
    void send(const std::string& chat_id, const std::string& text) override;
    void set_handler(MessageCallback handler) override;

    // Runs one line through the handler and writes the reply. Exposed for the read loop and tests.
    void deliver(const std::string& line);

private:
    void do_read();

    std::string user_id_;
    std::string username_;
    std::ostream& out_;
    std::mutex out_mutex_;

    MessageCallback handler_;
    std::mutex handler_mutex_;

    std::unique_ptr<boost::asio::posix::stream_descriptor> input_;
    boost::asio::streambuf buffer_;
};

}
