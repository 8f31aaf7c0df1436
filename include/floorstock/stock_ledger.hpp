#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <variant>
#include <vector>
#include "floorstock/catalog.hpp"
#include "floorstock/events.pb.h"
#include "floorstock/journal.hpp"
#include "floorstock/location_registry.hpp"
#include "floorstock/serial_registry.hpp"
#include "floorstock/transaction_log.hpp"

namespace floorstock {

struct StockKey {
    std::string sku;
    std::string location;

    bool operator<(const StockKey& other) const {
        return std::tie(sku, location) < std::tie(other.sku, other.location);
    }
    bool operator==(const StockKey& other) const {
        return sku == other.sku && location == other.location;
    }
};

/// Current state of one (item, location) pair. quantity >= reserved >= 0.
struct StockRecord {
    std::string sku;
    std::string location;
    double quantity = 0.0;
    double reserved = 0.0;
    uint64_t version = 0;
    int64_t last_count_at = 0;  // epoch seconds of the last adjust, 0 if never counted

    double available() const { return quantity - reserved; }
};

/**
 * Stock movements. Each tag has its own validation; all share one commit path.
 */
namespace movement {

struct Receive {
    std::string sku;
    std::string location;
    double quantity = 0.0;
    double unit_cost = 0.0;
    std::vector<std::string> serial_numbers;
};

struct Transfer {
    std::string sku;
    std::string from;
    std::string to;
    double quantity = 0.0;
    std::vector<std::string> serial_numbers;
};

struct Pick {
    std::string sku;
    std::string location;
    double quantity = 0.0;
    std::vector<std::string> serial_numbers;
};

struct Adjust {
    std::string sku;
    std::string location;
    double new_quantity = 0.0;
    std::string reason;
};

struct Return {
    std::string sku;
    std::string location;
    double quantity = 0.0;
    std::vector<std::string> serial_numbers;
};

struct Scrap {
    std::string sku;
    std::string location;
    double quantity = 0.0;
    std::vector<std::string> serial_numbers;
};

} // namespace movement

using Movement = std::variant<movement::Receive, movement::Transfer, movement::Pick,
                              movement::Adjust, movement::Return, movement::Scrap>;

/// Who and what a movement belongs to; copied onto the transaction.
struct MovementContext {
    std::string actor;
    std::string order_id;
    std::string pick_list_id;
    std::string pick_list_item_id;
    std::string reference;
    std::string notes;
};

/// Published after every committed mutation. Both totals are sums of
/// available over all locations, captured together with the change.
struct StockChange {
    std::string sku;
    double available_delta = 0.0;
    double item_available = 0.0;
    double item_available_before = 0.0;
};

using StockObserver = std::function<void(const StockChange&)>;

/// Reservation held by one holder (pick list) on one key.
struct HeldReservation {
    std::string holder;
    StockKey key;
    double quantity = 0.0;
};

/// A record whose state differs from what the ledger replay produces.
struct Discrepancy {
    StockKey key;
    double recorded_quantity = 0.0;
    double replayed_quantity = 0.0;
    double recorded_reserved = 0.0;
    double held_reserved = 0.0;
};

/**
 * Authoritative per-(item, location) stock state.
 *
 * Records live in an arena indexed by key; each slot has its own mutex, so
 * mutations on unrelated keys never wait for each other. A mutation appends
 * its journal entry while holding the slot lock and only then updates the
 * record, so the entry and the record change together or not at all.
 */
class StockLedger {
public:
    StockLedger(Journal& journal, TransactionLog& log, Catalog& catalog,
                LocationRegistry& locations, SerialRegistry& serials);

    StockLedger(const StockLedger&) = delete;
    StockLedger& operator=(const StockLedger&) = delete;

    events::Transaction apply(const Movement& movement, const MovementContext& context = {});

    /// Throws InsufficientStock if available < quantity.
    void reserve(const std::string& sku, const std::string& location, double quantity,
                 const std::string& holder);

    /// Reserves min(max_quantity, available) and returns the amount reserved.
    double reserve_available(const std::string& sku, const std::string& location, double max_quantity,
                             const std::string& holder);

    /// Throws InsufficientReservation if the holder holds less than quantity.
    void release(const std::string& sku, const std::string& location, double quantity,
                 const std::string& holder);

    /// Zero record for keys that never held stock.
    StockRecord current_stock(const std::string& sku, const std::string& location) const;
    std::vector<StockRecord> stock_for_item(const std::string& sku) const;
    std::vector<StockRecord> all_records() const;
    double item_on_hand(const std::string& sku) const;
    double item_available(const std::string& sku) const;

    std::vector<HeldReservation> reservations() const;
    double held_by(const std::string& holder, const std::string& sku, const std::string& location) const;

    void add_observer(StockObserver observer);

    /**
     * Compare every record with a replay of the transaction log, and every
     * reserved counter with the sum of its holders.
     */
    std::vector<Discrepancy> reconcile() const;

    /**
     * Recompute every record from journal entries (transactions and
     * reservation events). Intended for recovery, not for concurrent use.
     */
    void rebuild(const std::vector<events::JournalEntry>& entries);

    /// Replay one journal entry into the stock records. Catalog and serial
    /// effects of a transaction are replayed by their own components.
    void apply_entry(const events::JournalEntry& entry);

private:
    struct Slot {
        std::mutex mutex;
        StockRecord record;
        std::map<std::string, double> holders;
    };

    /// Locks on every slot of one item, taken in key order.
    struct ItemLock {
        std::vector<Slot*> slots;
        std::vector<std::unique_lock<std::mutex>> locks;
    };

    struct Committed {
        events::Transaction tx;
        StockChange change;
    };

    /// One record-level effect of a transaction.
    struct Effect {
        StockKey key;
        double quantity = 0.0;
        double reserved = 0.0;
    };

    static std::vector<Effect> effects_of(const events::Transaction& tx);
    static double available_delta(const events::Transaction& tx);

    /// Finds or creates the slot. Never called while a slot mutex is held.
    Slot& slot(const std::string& sku, const std::string& location);
    Slot* find_slot(const std::string& sku, const std::string& location) const;
    /// Slots of one item, or of every item when `sku` is null.
    std::vector<Slot*> slots_for(const std::string* sku) const;
    /// Retries until no slot of the item was created while locking.
    ItemLock lock_item(const std::string& sku);

    Committed apply_movement(const movement::Receive& m, const MovementContext& context);
    Committed apply_movement(const movement::Transfer& m, const MovementContext& context);
    Committed apply_movement(const movement::Pick& m, const MovementContext& context);
    Committed apply_movement(const movement::Adjust& m, const MovementContext& context);
    Committed apply_movement(const movement::Return& m, const MovementContext& context);
    Committed apply_movement(const movement::Scrap& m, const MovementContext& context);

    /// Common commit path; caller holds the locks of every slot in `slots`.
    Committed commit(events::Transaction tx, std::initializer_list<Slot*> slots);
    static void apply_effect_locked(Slot& slot, const Effect& effect, const events::Transaction& tx);
    static void apply_reservation_locked(Slot& slot, double quantity, const std::string& holder);

    /// Moves the item-wide available total and reports it before and after.
    StockChange shift_available(const std::string& sku, double delta);
    void notify(const StockChange& change);

    Journal& journal_;
    TransactionLog& log_;
    Catalog& catalog_;
    LocationRegistry& locations_;
    SerialRegistry& serials_;

    mutable std::shared_mutex index_mutex_;
    std::map<StockKey, std::unique_ptr<Slot>> slots_;

    std::mutex available_mutex_;
    std::map<std::string, double> available_totals_;

    std::mutex observers_mutex_;
    std::vector<StockObserver> observers_;
};

} // namespace floorstock
