/**
 * Status - explicit success/failure result for adapter and relay calls.
 */

#include "core/status.h"

#include <utility>

namespace beacon {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                  return "Ok";
        case ErrorCode::UnsupportedPlatform: return "UnsupportedPlatform";
        case ErrorCode::PermissionDenied:    return "PermissionDenied";
        case ErrorCode::NotInitialized:      return "NotInitialized";
        case ErrorCode::PeerNotFound:        return "PeerNotFound";
        case ErrorCode::ConnectFailed:       return "ConnectFailed";
        case ErrorCode::NotConnected:        return "NotConnected";
        case ErrorCode::SendFailed:          return "SendFailed";
        case ErrorCode::ParseFallback:       return "ParseFallback";
    }
    return "Unknown";
}

Status::Status(ErrorCode code, std::string reason)
    : code_(code), reason_(std::move(reason)) {}

std::string Status::message() const {
    std::string out = to_string(code_);
    if (!reason_.empty()) {
        out += "(" + reason_ + ")";
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const Status& status) {
    return os << status.message();
}

} // namespace beacon
