#include "cli/LedgerCli.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include <QDateTime>
#include <QFile>
#include <QSaveFile>
#include <QSet>

#include <nlohmann/json.hpp>

#include "cli/range_parser.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "ledger/entry_log.hpp"
#include "ledger/entry_store.hpp"
#include "report/ReportEngine.hpp"

namespace timeledger {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  timeledger [--data-file PATH] [--trace] <command>\n"
        "\n"
        "Commands:\n"
        "  start [DESCRIPTION] [--at TIME]   start time tracking\n"
        "  stop [--at TIME]                  stop time tracking\n"
        "  continue                          continue with the last description\n"
        "  status                            show the latest entry (exit 0 when active)\n"
        "  path                              show the data file path\n"
        "  list [FILTER] [--from T] [--to T]\n"
        "  show [FILTER] [--from T] [--to T] [--plain] [--remaining] [--seconds]\n"
        "       [--format PATTERN] [--json]  (default command)\n"
        "  export PATH [FILTER] [--from T] [--to T] [--readable]\n"
        "  import PATH\n"
        "\n"
        "FILTER is today (default), week, all, or part of a description.\n"
        "Description words are kept as typed; put them after \"--\" to keep option names.\n"
        "TIME formats: \"YYYY-MM-DD HH:MM:SS\", \"YYYY-MM-DD\", \"HH:MM:SS\", \"HH:MM\".\n");
}

const QSet<QString> &valueOptions()
{
    static const QSet<QString> options = {
        QStringLiteral("--data-file"),
        QStringLiteral("--from"),
        QStringLiteral("--to"),
        QStringLiteral("--at"),
        QStringLiteral("--format"),
    };
    return options;
}

// Options are only recognized before a lone "--".
QStringList optionArgs(const QStringList &args)
{
    const int end = args.indexOf(QStringLiteral("--"));
    return end < 0 ? args : args.mid(0, end);
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const QStringList options = optionArgs(args);
    const int idx = options.indexOf(key);
    if (idx < 0 || idx + 1 >= options.size()) {
        return {};
    }
    return options.at(idx + 1);
}

bool hasFlag(const QStringList &args, const QString &flag)
{
    return optionArgs(args).contains(flag);
}

// Arguments that are neither options nor option values, program name excluded.
QStringList positionalArgs(const QStringList &args)
{
    QStringList positional;
    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (valueOptions().contains(arg)) {
            ++i;
            continue;
        }
        if (arg.startsWith(QStringLiteral("--")) || arg == QStringLiteral("-s")) {
            continue;
        }
        positional.push_back(arg);
    }
    return positional;
}

// Description of `start`: every word after the command except the options
// start itself understands. Words after a lone "--" are taken verbatim.
QStringList descriptionWords(const QStringList &args, const QString &command)
{
    QStringList words;
    bool afterCommand = false;
    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg == QStringLiteral("--at") || arg == QStringLiteral("--data-file")) {
            ++i;
            continue;
        }
        if (arg == QStringLiteral("--trace")) {
            continue;
        }
        if (!afterCommand) {
            afterCommand = arg == command;
            continue;
        }
        if (arg == QStringLiteral("--")) {
            words += args.mid(i + 1);
            break;
        }
        words.push_back(arg);
    }
    return words;
}

QString timeOfDay(const ReportEngine &engine, TimePoint timestamp)
{
    return engine.formatLocal(timestamp).mid(11);
}

// "-" writes to stdout. Files are replaced atomically, so a failed export
// never leaves a truncated document behind.
void writeExport(const QString &path, const QByteArray &data)
{
    if (path == QStringLiteral("-")) {
        std::cout << data.toStdString() << std::endl;
        return;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw LedgerError(ErrorKind::IoFailure,
                          "could not write export file " + path.toStdString() + ": "
                              + file.errorString().toStdString());
    }
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        throw LedgerError(ErrorKind::IoFailure,
                          "short write to export file " + path.toStdString());
    }
    if (!file.commit()) {
        throw LedgerError(ErrorKind::IoFailure,
                          "could not replace export file " + path.toStdString() + ": "
                              + file.errorString().toStdString());
    }
}

} // namespace

LedgerCli::LedgerCli()
    : LedgerCli([] { return std::chrono::system_clock::now(); },
                QTimeZone::systemTimeZone())
{
}

LedgerCli::LedgerCli(Clock clock, QTimeZone zone)
    : m_clock(std::move(clock))
    , m_zone(std::move(zone))
{
}

int LedgerCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand and delegate to the command handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (hasFlag(args, QStringLiteral("--help")) || hasFlag(args, QStringLiteral("-h"))) {
        std::cout << usageText().toStdString();
        return 0;
    }

    // One clock read per invocation keeps start/stop pairs consistent.
    m_now = floorToSeconds(m_clock());
    m_settings = Settings::load();
    const QString dataFileArg = getArgValue(args, QStringLiteral("--data-file"));
    if (!dataFileArg.isEmpty()) {
        m_settings.dataFile = Settings::expandHome(dataFileArg);
    }

    QStringList positional = positionalArgs(args);
    const QString command = positional.isEmpty()
        ? QStringLiteral("show")
        : positional.takeFirst();

    TLOG_INFO(QStringLiteral("LedgerCli"),
              QStringLiteral("run"),
              QStringLiteral("ledger_cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()},
                              {"dataFile", m_settings.dataFile.toStdString()}}));

    try {
        if (command == QStringLiteral("start")) {
            return runStart(args, descriptionWords(args, command));
        }
        if (command == QStringLiteral("stop")) {
            return runStop(args);
        }
        if (command == QStringLiteral("continue")) {
            return runContinue();
        }
        if (command == QStringLiteral("status")) {
            return runStatus();
        }
        if (command == QStringLiteral("path")) {
            return runPath();
        }
        if (command == QStringLiteral("list")) {
            return runList(args, positional);
        }
        if (command == QStringLiteral("show")) {
            return runShow(args, positional);
        }
        if (command == QStringLiteral("export")) {
            return runExport(args, positional);
        }
        if (command == QStringLiteral("import")) {
            return runImport(positional);
        }
    } catch (const LedgerError &error) {
        TLOG_ERROR(QStringLiteral("LedgerCli"),
                   QStringLiteral("run"),
                   QStringLiteral("command_failed"),
                   QString::fromStdString(toErrorKindString(error.kind())),
                   QStringLiteral("abort_without_write"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"command", command.toStdString()},
                                   {"message", QString::fromUtf8(error.what()).toStdString()}}));
        std::cerr << error.what() << std::endl;
        return 1;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int LedgerCli::runStart(const QStringList &args, const QStringList &words)
{
    const std::string description = words.join(QLatin1Char(' ')).toStdString();
    const QString atValue = getArgValue(args, QStringLiteral("--at"));

    TimePoint at = m_now;
    if (!atValue.isEmpty()) {
        const RangeParser parser(m_zone, QDateTime::fromSecsSinceEpoch(toEpochSeconds(m_now)));
        const auto parsed = parser.parseInstant(atValue);
        if (!parsed.has_value()) {
            std::cerr << "Invalid time for --at: " << atValue.toStdString() << std::endl;
            return 1;
        }
        at = *parsed;
    }

    const EntryLog log = entryLog();
    EntryStore store = log.load();
    const ReportEngine engine(m_zone);

    if (m_settings.autoInsertStop && store.isTracking()) {
        if (!atValue.isEmpty()) {
            std::cerr << "Auto insert for stop events currently not supported with --at"
                      << std::endl;
            return 1;
        }
        const std::string previous = store.last()->description;
        const auto closed = store.switchTo(description, at);
        if (closed.has_value()) {
            std::cout << "Stopped \"" << previous << "\" after "
                      << ReportEngine::formatDuration(*closed).toStdString() << "\n";
        }
    } else {
        store.start(description, at);
    }

    persistIfModified(log, store);
    std::cout << "Started \"" << description << "\" at "
              << timeOfDay(engine, store.last()->start).toStdString() << std::endl;
    return 0;
}

int LedgerCli::runStop(const QStringList &args)
{
    const QString atValue = getArgValue(args, QStringLiteral("--at"));

    TimePoint at = m_now;
    if (!atValue.isEmpty()) {
        const RangeParser parser(m_zone, QDateTime::fromSecsSinceEpoch(toEpochSeconds(m_now)));
        const auto parsed = parser.parseInstant(atValue);
        if (!parsed.has_value()) {
            std::cerr << "Invalid time for --at: " << atValue.toStdString() << std::endl;
            return 1;
        }
        at = *parsed;
    }

    const EntryLog log = entryLog();
    EntryStore store = log.load();
    const auto elapsed = store.stop(at);
    persistIfModified(log, store);

    std::cout << "Stopped \"" << store.last()->description << "\" after "
              << ReportEngine::formatDuration(elapsed).toStdString() << std::endl;
    return 0;
}

int LedgerCli::runContinue()
{
    const EntryLog log = entryLog();
    EntryStore store = log.load();
    store.continueLast(m_now);
    persistIfModified(log, store);

    std::cout << "Continued \"" << store.last()->description << "\"" << std::endl;
    return 0;
}

int LedgerCli::runImport(const QStringList &positional)
{
    if (positional.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString path = Settings::expandHome(positional.first());
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw LedgerError(ErrorKind::IoFailure,
                          "could not read import file " + path.toStdString() + ": "
                              + file.errorString().toStdString());
    }

    std::vector<Entry> imported = EntryLog::parse(file.readAll());
    const std::size_t count = imported.size();

    const EntryLog log = entryLog();
    EntryStore store = log.load();
    store.replaceAll(std::move(imported));
    persistIfModified(log, store);

    TLOG_INFO(QStringLiteral("LedgerCli"),
              QStringLiteral("runImport"),
              QStringLiteral("entries_imported"),
              QStringLiteral("user_invocation"),
              QStringLiteral("replace_all"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"entries", count}, {"source", path.toStdString()}}));
    std::cout << "Imported " << count << " entries." << std::endl;
    return 0;
}

int LedgerCli::runStatus()
{
    const EntryStore store = entryLog().load();
    const auto last = store.last();
    if (!last.has_value()) {
        std::cout << "No Events found!" << std::endl;
        return 1;
    }

    const ReportEngine engine(m_zone);
    const bool active = last->isOpen();
    std::cout << "Active: " << (active ? "true" : "false") << "\n";
    if (!last->description.empty()) {
        std::cout << "Description: " << last->description << "\n";
    }
    if (active) {
        std::cout << "Start Time: " << timeOfDay(engine, last->start).toStdString() << "\n";
        std::cout << "Elapsed: "
                  << ReportEngine::formatDuration(EntryStore::elapsed(*last, m_now)).toStdString()
                  << std::endl;
        return 0;
    }
    std::cout << "End Time: " << timeOfDay(engine, *last->end).toStdString() << std::endl;
    return 1;
}

int LedgerCli::runPath()
{
    std::cout << entryLog().path().toStdString() << std::endl;
    return 0;
}

int LedgerCli::runList(const QStringList &args, const QStringList &positional)
{
    const RangeParser parser(m_zone, QDateTime::fromSecsSinceEpoch(toEpochSeconds(m_now)));
    const auto query = parser.resolve(getArgValue(args, QStringLiteral("--from")),
                                      getArgValue(args, QStringLiteral("--to")),
                                      positional.value(0));
    if (!query.has_value()) {
        std::cerr << "Invalid --from/--to value." << std::endl;
        return 1;
    }

    const EntryStore store = entryLog().load();
    const ReportEngine engine(m_zone);
    for (const auto &row : engine.list(store, *query, m_now)) {
        const QString end = row.running
            ? QStringLiteral("running")
            : engine.formatLocal(*row.entry.end);
        std::cout << engine.formatLocal(row.entry.start).toStdString() << " -> "
                  << end.toStdString() << "  "
                  << ReportEngine::formatDuration(row.elapsed).toStdString() << "  "
                  << row.entry.description << "\n";
    }
    std::cout.flush();
    return 0;
}

int LedgerCli::runShow(const QStringList &args, const QStringList &positional)
{
    const QString from = getArgValue(args, QStringLiteral("--from"));
    const QString to = getArgValue(args, QStringLiteral("--to"));
    const QString filter = positional.value(0);
    const bool plain = hasFlag(args, QStringLiteral("--plain"));
    const bool remaining = hasFlag(args, QStringLiteral("--remaining"));
    const bool json = hasFlag(args, QStringLiteral("--json"));
    QString format = getArgValue(args, QStringLiteral("--format"));
    if (format.isEmpty()) {
        format = QStringLiteral("{hh}:{mm}:{ss}");
    }

    const RangeParser parser(m_zone, QDateTime::fromSecsSinceEpoch(toEpochSeconds(m_now)));
    auto query = parser.resolve(from, to, filter);
    if (!query.has_value()) {
        std::cerr << "Invalid --from/--to value." << std::endl;
        return 1;
    }
    query->includeSeconds = hasFlag(args, QStringLiteral("--seconds"))
        || hasFlag(args, QStringLiteral("-s"));

    const EntryStore store = entryLog().load();
    const ReportEngine engine(m_zone);
    const ShowReport report = engine.show(store.entries(), *query, m_now);

    if (json) {
        nlohmann::json payload;
        payload["from"] = query->range.from.has_value()
            ? nlohmann::json(toIso8601Utc(*query->range.from))
            : nlohmann::json(nullptr);
        payload["to"] = query->range.to.has_value()
            ? nlohmann::json(toIso8601Utc(*query->range.to))
            : nlohmann::json(nullptr);
        payload["days"] = nlohmann::json::array();
        for (const auto &day : report.days) {
            payload["days"].push_back({
                {"day", day.day.toString(Qt::ISODate).toStdString()},
                {"totalSeconds", day.total.count()}
            });
        }
        payload["totalSeconds"] = report.grandTotal.count();
        payload["entries"] = report.entryCount;
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    if (remaining) {
        const bool week = filter == QStringLiteral("week");
        const bool today = filter.isEmpty() || filter == QStringLiteral("today");
        if (!from.isEmpty() || !to.isEmpty() || (!week && !today)) {
            std::cerr << "Remaining only works when \"from\" and \"to\" are not set and with "
                         "no filter or filter \"week\"" << std::endl;
            return 1;
        }

        auto left = ReportEngine::remaining(report.grandTotal,
                                            week ? m_settings.weeklyGoal : m_settings.dailyGoal);
        if (today) {
            const auto weekQuery = parser.resolve(QString(), QString(), QStringLiteral("week"));
            ReportQuery weekly = *weekQuery;
            weekly.includeSeconds = query->includeSeconds;
            const auto weekTotal = engine.show(store.entries(), weekly, m_now).grandTotal;
            left = std::min(left, ReportEngine::remaining(weekTotal, m_settings.weeklyGoal));
        }

        const QString time = ReportEngine::formatDuration(left, format);
        if (plain) {
            std::cout << time.toStdString() << std::endl;
        } else {
            std::cout << "Remaining Work Time: " << time.toStdString() << std::endl;
        }
        return 0;
    }

    const QString time = ReportEngine::formatDuration(report.grandTotal, format);
    if (plain) {
        std::cout << time.toStdString() << std::endl;
        return 0;
    }

    if (report.days.size() > 1) {
        for (const auto &day : report.days) {
            std::cout << day.day.toString(Qt::ISODate).toStdString() << "  "
                      << ReportEngine::formatDuration(day.total, format).toStdString() << "\n";
        }
    }
    std::cout << "Work Time: " << time.toStdString() << std::endl;
    return 0;
}

int LedgerCli::runExport(const QStringList &args, const QStringList &positional)
{
    if (positional.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString outPath = Settings::expandHome(positional.at(0));

    const RangeParser parser(m_zone, QDateTime::fromSecsSinceEpoch(toEpochSeconds(m_now)));
    const auto query = parser.resolve(getArgValue(args, QStringLiteral("--from")),
                                      getArgValue(args, QStringLiteral("--to")),
                                      positional.value(1),
                                      true);
    if (!query.has_value()) {
        std::cerr << "Invalid --from/--to value." << std::endl;
        return 1;
    }

    const EntryStore store = entryLog().load();
    const ReportEngine engine(m_zone);

    QByteArray data;
    if (hasFlag(args, QStringLiteral("--readable"))) {
        data = engine.exportReadable(store.entries(), *query).toUtf8();
    } else {
        data = QByteArray::fromStdString(
            engine.exportEntries(store.entries(), *query, m_now).dump(2));
    }

    writeExport(outPath, data);

    TLOG_INFO(QStringLiteral("LedgerCli"),
              QStringLiteral("runExport"),
              QStringLiteral("entries_exported"),
              QStringLiteral("user_invocation"),
              hasFlag(args, QStringLiteral("--readable")) ? QStringLiteral("readable")
                                                          : QStringLiteral("json"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"out", outPath.toStdString()}}));
    return 0;
}

EntryLog LedgerCli::entryLog() const
{
    return EntryLog(m_settings.dataFile);
}

void LedgerCli::persistIfModified(const EntryLog &log, const EntryStore &store) const
{
    if (!store.isModified()) {
        return;
    }
    log.persist(store);
}

} // namespace timeledger
