#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <any>

namespace chatgate {

// Normalized inbound message produced by a platform adapter.
// Consumed once by the router pipeline.
struct Message {
    std::string platform;
    std::string chat_id;
    std::string user_id;
    std::string username;
    std::string text;
    std::vector<std::string> media;  // local paths of images/voice/documents
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::any raw;                    // platform-specific payload

    // DMs carry the user's own ID as chat ID.
    bool is_group() const { return chat_id != user_id; }
};

}
