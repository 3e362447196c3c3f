#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "core/status.h"
#include "protocol/chat_message.h"

namespace beacon::envelope {

/// Value of the "type" field on chat envelopes.
inline constexpr const char* kChatType = "chat";

/// Sender name used when a structured envelope omits one.
inline constexpr const char* kUnknownSender = "Unknown";

/**
 * Serialize a chat message as a single-line JSON envelope (no trailing
 * newline):
 *   {"type":"chat","senderId":..,"senderName":..,"timestamp":..,"text":..}
 *
 * Never throws; invalid UTF-8 is replaced rather than rejected.
 */
std::string serialize(const ChatMessage& message);

/// Result of decoding one inbound line.
struct ParsedMessage {
    ChatMessage message;
    /// True when the line was not a usable envelope and was taken verbatim.
    bool plain_text = false;
    /// ParseFallback alongside plain_text. Never a failure: message is usable.
    Status status;
};

/**
 * Decode one inbound line.
 *
 * Structured envelopes must carry a string "senderId"; every other field
 * falls back to a default (empty text, "Unknown" sender, receipt time).
 * Anything else becomes a plain-text message whose body is the whole line
 * and whose sender is derived from remote_address. Never throws.
 *
 * from_current_user is computed against local_id.
 */
ParsedMessage parse(std::string_view line,
                    const std::string& local_id,
                    const std::string& remote_address,
                    std::chrono::system_clock::time_point received_at);

/// Display name for a sender known only by its transport address:
/// last '/'-separated segment, "Device <first 8 chars>", or "Unknown Device".
std::string sender_name_from_address(const std::string& address);

} // namespace beacon::envelope
