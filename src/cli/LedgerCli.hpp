#pragma once

#include <functional>

#include <QString>
#include <QStringList>
#include <QTimeZone>

#include "common/models.hpp"
#include "common/settings.hpp"

namespace timeledger {

class EntryLog;
class EntryStore;

class LedgerCli
{
public:
    using Clock = std::function<TimePoint()>;

    LedgerCli();
    LedgerCli(Clock clock, QTimeZone zone);

    // CLI dispatcher for tracking and report commands.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    // Mutating commands load the data file, apply one operation and persist.
    int runStart(const QStringList &args, const QStringList &words);
    int runStop(const QStringList &args);
    int runContinue();
    int runImport(const QStringList &positional);

    int runStatus();
    int runPath();
    int runList(const QStringList &args, const QStringList &positional);
    int runShow(const QStringList &args, const QStringList &positional);
    int runExport(const QStringList &args, const QStringList &positional);

    EntryLog entryLog() const;
    void persistIfModified(const EntryLog &log, const EntryStore &store) const;

    Clock m_clock;
    QTimeZone m_zone;
    Settings m_settings;
    TimePoint m_now;
};

} // namespace timeledger
