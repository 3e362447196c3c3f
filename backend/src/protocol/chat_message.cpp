#include "protocol/chat_message.h"
#include "protocol/timestamp.h"

namespace beacon {

void to_json(nlohmann::json& j, const ChatMessage& message) {
    j = nlohmann::json{
        {"senderId", message.sender_id},
        {"senderName", message.sender_name},
        {"timestamp", format_iso8601(message.timestamp)},
        {"text", message.text},
        {"isFromCurrentUser", message.from_current_user},
    };
}

} // namespace beacon
