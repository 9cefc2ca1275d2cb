#pragma once

#include <string>
#include <chrono>
#include <boost/json.hpp>

namespace chatgate {

// Persisted message. Content is always vault ciphertext and user_id always hashed
// (or the literal "bot" for outbound records).
struct MessageRecord {
    std::string platform;
    std::string chat_id;
    std::string user_id;
    std::string username;
    std::string content;
    std::string direction; // "in" or "out"
    std::chrono::system_clock::time_point timestamp;
};

struct AuditRecord {
    std::string platform;
    std::string user_hash;
    std::string action;   // e.g. "unauthorized"
    std::string details;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

// Abstract interface for durable append of encrypted message records.
class MessageStore {
public:
    virtual ~MessageStore() = default;

    /**
     * Appends an encrypted message record.
     * @return true if persistence was successful.
     */
    virtual bool save_message(const MessageRecord& record) = 0;

    /**
     * Appends an audit trail entry.
     * @return true if persistence was successful.
     */
    virtual bool save_audit(const AuditRecord& record) = 0;
};

// JSON document form used by the Redis store.
boost::json::object to_json(const MessageRecord& record);
boost::json::object to_json(const AuditRecord& record);

}
