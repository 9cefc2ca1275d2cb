#include "message_store.hpp"
#include "text_util.hpp"

namespace chatgate {

boost::json::object to_json(const MessageRecord& record) {
    boost::json::object obj;
    obj["platform"] = record.platform;
    obj["chat_id"] = record.chat_id;
    obj["user_id"] = record.user_id;
    if (!record.username.empty()) obj["username"] = record.username;
    obj["content"] = record.content;
    obj["direction"] = record.direction;
    obj["timestamp"] = format_utc(record.timestamp);
    return obj;
}

boost::json::object to_json(const AuditRecord& record) {
    boost::json::object obj;
    obj["platform"] = record.platform;
    obj["user_id"] = record.user_hash;
    obj["action"] = record.action;
    if (!record.details.empty()) obj["details"] = record.details;
    obj["timestamp"] = format_utc(record.timestamp);
    return obj;
}

}
