#pragma once

namespace rulecast {

enum class RuleType {
    List,
    View,
    Create,
    Update,
    Delete
};

enum class RecordAction {
    Create,
    Update,
    Delete
};

enum class ConnectionState {
    Connecting,
    Open,
    Closing,
    Closed
};

enum class OverflowPolicy {
    Disconnect,
    DropOldest
};

enum class AuthRefreshPolicy {
    Snapshot,
    Live
};

} // namespace rulecast
