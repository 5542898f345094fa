#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace timeledger {

// EntryStore owns the ordered entry sequence and the start/stop state
// machine. The store is Tracking exactly when the last entry is open.
// Every mutation validates first; a failed operation leaves it unchanged.
class EntryStore {
public:
    EntryStore() = default;

    // Adopts a loaded sequence. Throws LedgerError(CorruptStore) when the
    // sequence breaks an invariant.
    explicit EntryStore(std::vector<Entry> entries);

    TrackingState state() const;
    bool isTracking() const;
    bool isModified() const;

    const std::vector<Entry> &entries() const;
    std::optional<Entry> last() const;

    void start(const std::string &description, TimePoint now);
    // Returns the elapsed time of the entry it closed.
    std::chrono::seconds stop(TimePoint now);
    void continueLast(TimePoint now);

    // Closes the open entry (if any) and starts a new one at the same instant.
    // Returns the elapsed time of the closed entry when one was closed.
    std::optional<std::chrono::seconds> switchTo(const std::string &description,
                                                 TimePoint now);

    void replaceAll(std::vector<Entry> entries);

    std::vector<ListRow> list(TimePoint now) const;

    static void validate(const std::vector<Entry> &entries);
    static std::chrono::seconds elapsed(const Entry &entry, TimePoint now);

private:
    void requireNotBeforeLatest(TimePoint now) const;

    std::vector<Entry> m_entries;
    bool m_modified = false;
};

} // namespace timeledger
