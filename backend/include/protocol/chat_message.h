#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace beacon {

/**
 * One application-level chat message, sent locally or received.
 */
struct ChatMessage {
    std::string text;
    std::string sender_id;
    std::string sender_name;
    std::chrono::system_clock::time_point timestamp{};

    /// Computed by comparing sender_id with the local device id, never read
    /// from the wire.
    bool from_current_user = false;
};

/// Persistence view of a message, including the local-origin flag.
void to_json(nlohmann::json& j, const ChatMessage& message);

} // namespace beacon
