#pragma once

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "floorstock/alert_monitor.hpp"
#include "floorstock/bom_engine.hpp"
#include "floorstock/catalog.hpp"
#include "floorstock/events.pb.h"
#include "floorstock/journal.hpp"
#include "floorstock/location_registry.hpp"
#include "floorstock/pick_list_orchestrator.hpp"
#include "floorstock/reports.hpp"
#include "floorstock/serial_registry.hpp"
#include "floorstock/stock_ledger.hpp"
#include "floorstock/transaction_log.hpp"

namespace floorstock {

/// Result of looking up a scanned code outside a pick list.
struct BarcodeLookup {
    std::optional<SerialUnit> serial;  // set when the code is a serial barcode
    events::Item item;
    std::vector<StockRecord> stock;
};

/// What recovery replayed and what it had to release.
struct RecoveryReport {
    size_t entries = 0;
    double released_quantity = 0.0;
    size_t released_serials = 0;
};

/// Counted stock for one (item, location) in a bulk import.
struct StockImportRow {
    std::string sku;
    std::string location;
    double quantity = 0.0;
};

/// A row left out of a bulk import. Rows are numbered from 1.
struct ImportRowError {
    size_t row = 0;
    std::string field;  // empty when the row as a whole was rejected
    std::string message;
};

struct ImportResult {
    size_t success_count = 0;
    std::vector<ImportRowError> errors;
    std::vector<std::string> created_ids;  // SKUs, or sku@location for new stock records

    size_t error_count() const { return errors.size(); }
};

/**
 * The inventory core: every component wired to one journal.
 *
 * All state changes go through the journal, so a new Inventory over an
 * existing journal followed by recover() reproduces the state of the last one.
 */
class Inventory {
public:
    explicit Inventory(std::unique_ptr<Journal> journal);

    Inventory(const Inventory&) = delete;
    Inventory& operator=(const Inventory&) = delete;

    /**
     * Replay the journal into every component, then release reservations no
     * open pick list accounts for (left behind by a crash mid-operation).
     * Call once, on a freshly constructed Inventory.
     */
    RecoveryReport recover();

    // ------------------------------------------------------------------------
    // Catalog and locations

    events::Item create_item(events::Item item);
    events::Item update_item(const std::string& sku, const ItemUpdate& update);
    void deactivate_item(const std::string& sku);
    events::Item get_item(const std::string& sku) const;
    std::vector<events::Item> list_items(bool active_only = true) const;

    events::Location register_location(events::Location location);
    void deactivate_location(const std::string& code);
    int seed_default_locations();
    std::vector<events::Location> list_locations(bool active_only = true) const;

    /// Register an individually tracked unit already counted in stock.
    SerialUnit register_serial(const std::string& sku, const std::string& serial_number,
                               const std::string& location, double cost);
    SerialUnit transition_serial(const std::string& serial_number, events::SerialStatus status,
                                 const std::string& order_id = "");
    SerialUnit get_serial(const std::string& serial_number) const;

    // ------------------------------------------------------------------------
    // Stock movements

    events::Transaction receive(const std::string& sku, const std::string& location, double quantity,
                                double unit_cost, const std::string& reference = "",
                                const std::vector<std::string>& serial_numbers = {},
                                const std::string& actor = "");

    events::Transaction transfer(const std::string& sku, const std::string& from, const std::string& to,
                                 double quantity, const std::vector<std::string>& serial_numbers = {},
                                 const std::string& actor = "");

    /// Privileged; the caller has checked the actor may count stock.
    events::Transaction adjust(const std::string& sku, const std::string& location, double new_quantity,
                               const std::string& reason, const std::string& actor);

    events::Transaction return_stock(const std::string& sku, const std::string& location, double quantity,
                                     const std::string& reason = "",
                                     const std::vector<std::string>& serial_numbers = {},
                                     const std::string& actor = "");

    events::Transaction scrap(const std::string& sku, const std::string& location, double quantity,
                              const std::string& reason = "",
                              const std::vector<std::string>& serial_numbers = {},
                              const std::string& actor = "");

    // ------------------------------------------------------------------------
    // Bulk import
    //
    // Rows are applied one at a time. A rejected row is reported and the rest
    // carry on; only a storage failure stops the import.

    ImportResult import_items(const std::vector<events::Item>& rows);

    /// Privileged; each row counts its (item, location) to the row quantity
    /// through an adjust referenced "Initial Stock Import".
    ImportResult import_stock(const std::vector<StockImportRow>& rows, const std::string& actor);

    // ------------------------------------------------------------------------
    // Bills of materials

    events::BillOfMaterials create_bom(events::BillOfMaterials draft);
    events::BillOfMaterials add_bom_component(const std::string& bom_id, const events::BomComponent& component);
    events::BillOfMaterials remove_bom_component(const std::string& bom_id, const std::string& sku);
    events::BillOfMaterials revise_bom(const std::string& bom_id, const std::vector<events::BomComponent>& components);
    void set_default_bom(const std::string& bom_id);
    void deactivate_bom(const std::string& bom_id);
    events::BillOfMaterials get_bom(const std::string& bom_id) const;
    std::vector<events::BillOfMaterials> list_boms(const std::optional<std::string>& product_type = std::nullopt) const;

    // ------------------------------------------------------------------------
    // Orders and pick lists

    /// Record the current snapshot of an order from the order workflow.
    void upsert_order(const events::Order& order);
    std::optional<events::Order> find_order(const std::string& order_id) const;

    /// Throws NotFound for unknown orders, NoBomFound if no BOM applies.
    events::PickList generate_pick_list(const std::string& order_id,
                                        const std::optional<std::string>& bom_id = std::nullopt,
                                        const GenerateOptions& options = {});
    events::PickListItem scan_pick(const std::string& pick_list_id, const std::string& barcode, double quantity,
                                   const std::string& actor = "");
    events::PickListItem skip_pick_item(const std::string& pick_list_id, const std::string& item_id,
                                        const std::string& actor, const std::string& reason);
    events::PickList complete_pick_list(const std::string& pick_list_id, const std::string& actor = "");
    events::PickList cancel_pick_list(const std::string& pick_list_id, const std::string& actor = "");
    std::optional<events::PickListItem> next_expected_pick(const std::string& pick_list_id) const;
    events::PickList get_pick_list(const std::string& pick_list_id) const;
    std::vector<events::PickList> list_pick_lists(std::optional<events::PickListStatus> status = std::nullopt,
                                                  const std::optional<std::string>& order_id = std::nullopt) const;

    // ------------------------------------------------------------------------
    // Queries

    std::vector<StockRecord> current_stock(const std::string& sku) const;
    StockRecord current_stock(const std::string& sku, const std::string& location) const;

    std::vector<events::Transaction> transactions_for_item(const std::string& sku) const;
    std::vector<events::Transaction> transactions_for_pick_list(const std::string& pick_list_id) const;
    std::vector<events::Transaction> transactions_for_order(const std::string& order_id) const;

    /// Throws NotFound for codes that are neither a serial nor an item barcode.
    BarcodeLookup lookup_barcode(const std::string& code) const;

    StockLevelsReport stock_levels_report(const std::optional<std::string>& location = std::nullopt,
                                          std::optional<events::ItemCategory> category = std::nullopt) const;
    ValuationReport valuation_report() const;

    std::vector<Discrepancy> reconcile() const;

    // ------------------------------------------------------------------------
    // Alerts

    events::Alert acknowledge_alert(const std::string& alert_id, const std::string& actor);
    std::vector<events::Alert> alerts(std::optional<bool> acknowledged = std::nullopt) const;

    StockLedger& ledger() { return ledger_; }
    const Journal& journal() const { return *journal_; }

private:
    void apply_entry(const events::JournalEntry& entry);
    void apply_order_event(const google::protobuf::Any& event);

    std::unique_ptr<Journal> journal_;
    Catalog catalog_;
    LocationRegistry locations_;
    SerialRegistry serials_;
    TransactionLog log_;
    StockLedger ledger_;
    BomEngine boms_;
    PickListOrchestrator pick_lists_;
    AlertMonitor alerts_;
    Reports reports_;

    mutable std::shared_mutex orders_mutex_;
    std::map<std::string, events::Order> orders_;
};

} // namespace floorstock
