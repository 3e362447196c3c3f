#pragma once

#include <ostream>
#include <string>

namespace beacon {

/// Failure taxonomy shared by the transport adapter and the socket relay.
enum class ErrorCode {
    Ok,
    UnsupportedPlatform,
    PermissionDenied,
    NotInitialized,
    PeerNotFound,
    ConnectFailed,
    NotConnected,
    SendFailed,
    ParseFallback,
};

const char* to_string(ErrorCode code);

/**
 * Outcome of an adapter or relay operation.
 *
 * A default-constructed Status is success. Failures carry an ErrorCode and,
 * for ConnectFailed / SendFailed, the underlying reason.
 */
class Status {
public:
    Status() = default;
    Status(ErrorCode code, std::string reason = {});

    static Status success() { return Status(); }

    [[nodiscard]] bool ok() const { return code_ == ErrorCode::Ok; }
    [[nodiscard]] ErrorCode code() const { return code_; }
    [[nodiscard]] const std::string& reason() const { return reason_; }

    /// "ConnectFailed(connection refused)" or just "PeerNotFound".
    [[nodiscard]] std::string message() const;

    explicit operator bool() const { return ok(); }

private:
    ErrorCode code_ = ErrorCode::Ok;
    std::string reason_;
};

std::ostream& operator<<(std::ostream& os, const Status& status);

} // namespace beacon
