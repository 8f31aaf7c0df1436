#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "floorstock/bom_engine.hpp"
#include "floorstock/catalog.hpp"
#include "floorstock/events.pb.h"
#include "floorstock/journal.hpp"
#include "floorstock/location_registry.hpp"
#include "floorstock/serial_registry.hpp"
#include "floorstock/stock_ledger.hpp"

namespace floorstock {

struct GenerateOptions {
    std::map<std::string, std::string> location_overrides;  // sku -> location code
    std::string assigned_to;
    std::string notes;
    std::string actor;
};

/**
 * Generates pick lists from BOMs and drives them to completion.
 *
 * Lifecycle:
 *   pending -> in_progress -> completed
 *   pending | in_progress -> cancelled
 *
 * Stock for every line is reserved at generation under the pick list id.
 * Every path out of pending/in_progress either consumes those reservations
 * (scan) or releases them (skip, complete of short lines, cancel).
 */
class PickListOrchestrator {
public:
    PickListOrchestrator(Journal& journal, StockLedger& ledger, BomEngine& boms, const Catalog& catalog,
                         const LocationRegistry& locations, SerialRegistry& serials);

    PickListOrchestrator(const PickListOrchestrator&) = delete;
    PickListOrchestrator& operator=(const PickListOrchestrator&) = delete;

    /**
     * Expand the BOM for the order and reserve stock for every line.
     *
     * Lines that cannot be fully reserved are marked short right away; an
     * optional line with nothing available is marked skipped. The BOM is
     * `bom_id` when given, otherwise the default for the order's product.
     */
    events::PickList generate(const events::Order& order, const std::optional<std::string>& bom_id,
                              const GenerateOptions& options = {});

    /**
     * Verify a scanned barcode against the list and pick the stock.
     * Throws BarcodeMismatch (nothing mutated) if the barcode names nothing
     * still to be picked on this list.
     */
    events::PickListItem scan(const std::string& pick_list_id, const std::string& barcode, double quantity,
                              const std::string& actor);

    /// First pending line, if any. Lines may be scanned in any order.
    std::optional<events::PickListItem> next_expected(const std::string& pick_list_id) const;

    /// Manager action: give up on a line and release what it still holds.
    events::PickListItem skip_item(const std::string& pick_list_id, const std::string& item_id,
                                   const std::string& actor, const std::string& reason);

    /// Throws IncompletePickList while any line is pending.
    events::PickList complete(const std::string& pick_list_id, const std::string& actor);

    /// Throws InvalidState for completed or cancelled lists.
    events::PickList cancel(const std::string& pick_list_id, const std::string& actor);

    events::PickList get(const std::string& pick_list_id) const;
    std::vector<events::PickList> list(std::optional<events::PickListStatus> status = std::nullopt,
                                       const std::optional<std::string>& order_id = std::nullopt) const;

    /// Stock each open list should still be holding, by (holder, sku, location).
    std::vector<HeldReservation> outstanding_reservations() const;

    /// Serial units open lists still hold reserved and unpicked.
    std::set<std::string> outstanding_serials() const;

    void apply_event(const google::protobuf::Any& event);
    void apply_transaction(const events::Transaction& tx);

private:
    struct Entry {
        std::mutex mutex;
        events::PickList list;
    };

    Entry& require_entry(const std::string& pick_list_id) const;
    std::string choose_location(const events::Item& item, const GenerateOptions& options) const;
    void reserve_line(const events::Order& order, const std::string& pick_list_id, const events::Item& item,
                      events::PickListItem& line);
    void release_line(const events::PickList& list, const events::PickListItem& line);
    void apply_pick_locked(events::PickList& list, const events::Transaction& tx);
    void apply_locked(events::PickList& list, const google::protobuf::Any& event);
    void insert(const events::PickList& list);

    static bool is_open(const events::PickList& list);
    static double outstanding(const events::PickListItem& line);
    static std::vector<std::string> unpicked_serials(const events::PickListItem& line);

    Journal& journal_;
    StockLedger& ledger_;
    BomEngine& boms_;
    const Catalog& catalog_;
    const LocationRegistry& locations_;
    SerialRegistry& serials_;

    mutable std::shared_mutex index_mutex_;
    std::map<std::string, std::unique_ptr<Entry>> lists_;
    uint64_t last_number_ = 0;
};

} // namespace floorstock
