#pragma once

namespace timeledger {

enum class TrackingState {
    Idle,
    Tracking
};

enum class ErrorKind {
    AlreadyTracking,
    NotTracking,
    NothingToContinue,
    CorruptStore,
    IoFailure,
    InvalidTimestamp
};

} // namespace timeledger
