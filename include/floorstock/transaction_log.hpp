#pragma once

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "floorstock/events.pb.h"
#include "floorstock/journal.hpp"

namespace floorstock {

/**
 * Append-only movement ledger.
 *
 * Transactions are ordered by the journal sequence number. Replaying the
 * transactions of one (item, location) pair in that order reproduces its
 * on-hand quantity.
 */
class TransactionLog {
public:
    explicit TransactionLog(Journal& journal) : journal_(journal) {}

    /**
     * Stamp, journal and index a transaction. The returned copy carries its
     * sequence number. Nothing is indexed if the journal append throws.
     */
    events::Transaction append(events::Transaction tx);

    /**
     * Index a transaction read back from the journal.
     */
    void apply_entry(const events::JournalEntry& entry);

    std::vector<events::Transaction> all() const;
    std::vector<events::Transaction> for_item(const std::string& sku) const;
    std::vector<events::Transaction> for_pick_list(const std::string& pick_list_id) const;
    std::vector<events::Transaction> for_order(const std::string& order_id) const;

    /// Transactions moving stock into or out of one location for one item.
    std::vector<events::Transaction> for_key(const std::string& sku, const std::string& location) const;

    size_t size() const;

private:
    void index_locked(events::Transaction tx);
    std::vector<events::Transaction> collect(
        const std::unordered_map<std::string, std::vector<size_t>>& index,
        const std::string& key) const;

    Journal& journal_;
    mutable std::shared_mutex mutex_;
    std::vector<events::Transaction> transactions_;
    std::unordered_map<std::string, std::vector<size_t>> by_item_;
    std::unordered_map<std::string, std::vector<size_t>> by_pick_list_;
    std::unordered_map<std::string, std::vector<size_t>> by_order_;
};

} // namespace floorstock
