#include "ledger/entry_log.hpp"

#include <utility>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace timeledger {

namespace {

Entry entryFromJson(const nlohmann::json &record, int lineNumber)
{
    try {
        return record.get<Entry>();
    } catch (const LedgerError &error) {
        throw LedgerError(ErrorKind::CorruptStore,
                          "record " + std::to_string(lineNumber) + ": " + error.what());
    }
}

} // namespace

EntryLog::EntryLog(QString path)
    : m_path(std::move(path))
{
}

const QString &EntryLog::path() const
{
    return m_path;
}

EntryStore EntryLog::load() const
{
    QFile file(m_path);
    if (!file.exists()) {
        TLOG_DEBUG(QStringLiteral("EntryLog"),
                   QStringLiteral("load"),
                   QStringLiteral("data_file_missing"),
                   QStringLiteral("first_run"),
                   QStringLiteral("empty_store"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", m_path.toStdString()}}));
        return EntryStore{};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw LedgerError(ErrorKind::IoFailure,
                          "could not read data file " + m_path.toStdString() + ": "
                              + file.errorString().toStdString());
    }

    const QByteArray data = file.readAll();
    std::vector<Entry> entries = parse(data);

    TLOG_DEBUG(QStringLiteral("EntryLog"),
               QStringLiteral("load"),
               QStringLiteral("data_file_loaded"),
               QStringLiteral("command_invocation"),
               QStringLiteral("jsonl_parse"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", m_path.toStdString()},
                               {"entries", entries.size()}}));

    return EntryStore(std::move(entries));
}

void EntryLog::persist(const EntryStore &store) const
{
    const QFileInfo info(m_path);
    if (!QDir().mkpath(info.absolutePath())) {
        throw LedgerError(ErrorKind::IoFailure,
                          "could not create directory " + info.absolutePath().toStdString());
    }

    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw LedgerError(ErrorKind::IoFailure,
                          "could not write data file " + m_path.toStdString() + ": "
                              + file.errorString().toStdString());
    }

    const QByteArray data = serialize(store.entries());
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        throw LedgerError(ErrorKind::IoFailure,
                          "short write to data file " + m_path.toStdString());
    }
    if (!file.commit()) {
        throw LedgerError(ErrorKind::IoFailure,
                          "could not replace data file " + m_path.toStdString() + ": "
                              + file.errorString().toStdString());
    }

    TLOG_DEBUG(QStringLiteral("EntryLog"),
               QStringLiteral("persist"),
               QStringLiteral("data_file_written"),
               QStringLiteral("store_modified"),
               QStringLiteral("atomic_replace"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", m_path.toStdString()},
                               {"entries", store.entries().size()}}));
}

std::vector<Entry> EntryLog::parse(const QByteArray &data)
{
    std::vector<Entry> entries;

    const QByteArray trimmed = data.trimmed();
    if (trimmed.isEmpty()) {
        return entries;
    }

    if (trimmed.startsWith('[')) {
        nlohmann::json document;
        try {
            document = nlohmann::json::parse(trimmed.toStdString());
        } catch (const nlohmann::json::parse_error &error) {
            throw LedgerError(ErrorKind::CorruptStore,
                              std::string("invalid JSON document: ") + error.what());
        }
        int index = 0;
        for (const auto &record : document) {
            entries.push_back(entryFromJson(record, ++index));
        }
    } else {
        int lineNumber = 0;
        for (const QByteArray &rawLine : data.split('\n')) {
            ++lineNumber;
            const QByteArray line = rawLine.trimmed();
            if (line.isEmpty()) {
                continue;
            }
            nlohmann::json record;
            try {
                record = nlohmann::json::parse(line.toStdString());
            } catch (const nlohmann::json::parse_error &error) {
                throw LedgerError(ErrorKind::CorruptStore,
                                  "line " + std::to_string(lineNumber)
                                      + ": invalid JSON: " + error.what());
            }
            entries.push_back(entryFromJson(record, lineNumber));
        }
    }

    EntryStore::validate(entries);
    return entries;
}

QByteArray EntryLog::serialize(const std::vector<Entry> &entries)
{
    QByteArray out;
    for (const auto &entry : entries) {
        const nlohmann::json record = entry;
        out += QByteArray::fromStdString(record.dump());
        out += '\n';
    }
    return out;
}

} // namespace timeledger
