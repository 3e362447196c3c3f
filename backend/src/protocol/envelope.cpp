/**
 * Envelope - newline-delimited JSON wire format for chat messages.
 *
 * Inbound lines degrade instead of failing: a partial envelope keeps its
 * sender and defaults the rest, non-JSON input becomes a plain-text message.
 */

#include "protocol/envelope.h"
#include "protocol/timestamp.h"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace beacon::envelope {

namespace {

const json* find_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        return &*it;
    }
    return nullptr;
}

// Older clients nested text and senderName under "payload".
const json* find_field(const json& obj, const char* key) {
    if (const json* v = find_string(obj, key)) {
        return v;
    }
    auto payload = obj.find("payload");
    if (payload != obj.end() && payload->is_object()) {
        return find_string(*payload, key);
    }
    return nullptr;
}

std::string_view strip_line_ending(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }
    return line;
}

} // namespace

std::string serialize(const ChatMessage& message) {
    json j = {
        {"type", kChatType},
        {"senderId", message.sender_id},
        {"senderName", message.sender_name},
        {"timestamp", format_iso8601(message.timestamp)},
        {"text", message.text},
    };
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string sender_name_from_address(const std::string& address) {
    auto slash = address.rfind('/');
    if (slash != std::string::npos) {
        return address.substr(slash + 1);
    }
    if (address.size() > 8) {
        return "Device " + address.substr(0, 8);
    }
    return "Unknown Device";
}

ParsedMessage parse(std::string_view line,
                    const std::string& local_id,
                    const std::string& remote_address,
                    std::chrono::system_clock::time_point received_at) {
    line = strip_line_ending(line);

    json j = json::parse(line.begin(), line.end(), nullptr, /*allow_exceptions=*/false);
    const json* sender_id = j.is_object() ? find_string(j, "senderId") : nullptr;

    ParsedMessage out;
    if (sender_id == nullptr) {
        spdlog::debug("envelope: plain-text fallback for {} byte line from {}",
                      line.size(), remote_address);
        out.plain_text = true;
        out.status = Status(ErrorCode::ParseFallback);
        out.message.text = std::string(line);
        out.message.sender_id = remote_address;
        out.message.sender_name = sender_name_from_address(remote_address);
        out.message.timestamp = received_at;
        out.message.from_current_user = !local_id.empty() && remote_address == local_id;
        return out;
    }

    out.message.sender_id = sender_id->get<std::string>();

    const json* text = find_field(j, "text");
    out.message.text = text ? text->get<std::string>() : std::string();

    const json* name = find_field(j, "senderName");
    out.message.sender_name = name ? name->get<std::string>() : std::string(kUnknownSender);

    out.message.timestamp = received_at;
    if (const json* ts = find_string(j, "timestamp")) {
        if (auto parsed = parse_iso8601(ts->get_ref<const std::string&>())) {
            out.message.timestamp = *parsed;
        } else {
            spdlog::debug("envelope: unreadable timestamp '{}', using receipt time",
                          ts->get_ref<const std::string&>());
        }
    }

    out.message.from_current_user = out.message.sender_id == local_id;
    return out;
}

} // namespace beacon::envelope
