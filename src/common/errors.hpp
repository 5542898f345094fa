#pragma once

#include <stdexcept>
#include <string>

#include "common/enums.hpp"

namespace timeledger {

inline std::string toErrorKindString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::AlreadyTracking:
        return "already_tracking";
    case ErrorKind::NotTracking:
        return "not_tracking";
    case ErrorKind::NothingToContinue:
        return "nothing_to_continue";
    case ErrorKind::CorruptStore:
        return "corrupt_store";
    case ErrorKind::IoFailure:
        return "io_failure";
    case ErrorKind::InvalidTimestamp:
        return "invalid_timestamp";
    }
    return "unknown";
}

// Typed failure of a ledger operation. Terminal for the current command.
class LedgerError : public std::runtime_error {
public:
    LedgerError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    ErrorKind kind() const
    {
        return m_kind;
    }

private:
    ErrorKind m_kind;
};

} // namespace timeledger
