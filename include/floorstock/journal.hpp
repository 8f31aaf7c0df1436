#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include <google/protobuf/message.h>
#include "floorstock/events.pb.h"

namespace floorstock {

/**
 * Durable, append-only store of inventory events.
 *
 * Every state change in the core is one entry. Sequence numbers start at 1
 * and increase by one per append; they order the ledger, not wall-clock time.
 */
class Journal {
public:
    virtual ~Journal() = default;

    /**
     * Append an event and return the stored entry (with its sequence).
     * Throws InventoryError(StorageFailure) if the entry could not be stored;
     * in that case the journal is unchanged.
     */
    virtual events::JournalEntry append(const google::protobuf::Message& event) = 0;

    /**
     * All entries in sequence order.
     */
    virtual std::vector<events::JournalEntry> read_all() const = 0;

    /**
     * Sequence of the most recent entry, 0 when empty.
     */
    virtual uint64_t last_sequence() const = 0;
};

/// Journal kept in memory; used by tests and throwaway sessions.
class MemoryJournal : public Journal {
public:
    events::JournalEntry append(const google::protobuf::Message& event) override;
    std::vector<events::JournalEntry> read_all() const override;
    uint64_t last_sequence() const override;

private:
    mutable std::mutex mutex_;
    std::vector<events::JournalEntry> entries_;
};

/// Journal backed by a file of length-delimited JournalEntry records.
class FileJournal : public Journal {
public:
    explicit FileJournal(const std::string& path);

    events::JournalEntry append(const google::protobuf::Message& event) override;
    std::vector<events::JournalEntry> read_all() const override;
    uint64_t last_sequence() const override;

    const std::string& path() const { return path_; }

private:
    /// Reads every intact entry; reports the byte length they occupy.
    std::vector<events::JournalEntry> load(int64_t* intact_bytes) const;

    std::string path_;
    mutable std::mutex mutex_;
    std::ofstream out_;
    uint64_t last_sequence_ = 0;
    int64_t size_ = 0;
};

} // namespace floorstock
