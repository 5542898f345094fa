#pragma once

#include <vector>

#include <QByteArray>
#include <QString>

#include "common/models.hpp"
#include "ledger/entry_store.hpp"

namespace timeledger {

// EntryLog reads and writes the data file: one JSON object per line,
// {"description", "start", "end"}. A JSON array of the same records (the
// export format) is accepted on read as well.
class EntryLog {
public:
    explicit EntryLog(QString path);

    const QString &path() const;

    // Missing or empty file yields an empty store.
    // Throws LedgerError(CorruptStore) or LedgerError(IoFailure).
    EntryStore load() const;

    // Atomic replace of the whole file. Throws LedgerError(IoFailure).
    void persist(const EntryStore &store) const;

    static std::vector<Entry> parse(const QByteArray &data);
    static QByteArray serialize(const std::vector<Entry> &entries);

private:
    QString m_path;
};

} // namespace timeledger
