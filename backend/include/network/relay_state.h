#pragma once

namespace beacon {

/// Socket Relay lifecycle: Idle -> Listening | Connecting -> Open -> Closing -> Idle.
enum class RelayState {
    Idle,
    Listening,
    Connecting,
    Open,
    Closing,
};

/// Which end of the stream this device is.
enum class RelayRole {
    None,
    Listener,    // coordinating node
    Connector,   // joins the coordinator's listening endpoint
};

const char* to_string(RelayState state);
const char* to_string(RelayRole role);

} // namespace beacon
