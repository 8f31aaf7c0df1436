#include "floorstock/inventory.hpp"
#include "floorstock/errors.hpp"
#include "floorstock/helpers.hpp"
#include "floorstock/logging.hpp"
#include "floorstock/validation.hpp"
#include <mutex>
#include <tuple>

namespace floorstock {

namespace {

constexpr const char* STOCK_IMPORT_REFERENCE = "Initial Stock Import";

} // anonymous namespace

Inventory::Inventory(std::unique_ptr<Journal> journal)
    : journal_(std::move(journal)),
      catalog_(*journal_),
      locations_(*journal_),
      serials_(*journal_),
      log_(*journal_),
      ledger_(*journal_, log_, catalog_, locations_, serials_),
      boms_(*journal_, catalog_),
      pick_lists_(*journal_, ledger_, boms_, catalog_, locations_, serials_),
      alerts_(*journal_, catalog_),
      reports_(catalog_, locations_, ledger_) {
    ledger_.add_observer(alerts_.observer());
}

// ============================================================================
// Recovery
// ============================================================================

RecoveryReport Inventory::recover() {
    RecoveryReport report;
    auto entries = journal_->read_all();
    for (const auto& entry : entries) {
        apply_entry(entry);
    }
    report.entries = entries.size();

    // Reservations held beyond what open pick lists account for.
    std::map<std::tuple<std::string, std::string, std::string>, double> expected;
    for (const auto& held : pick_lists_.outstanding_reservations()) {
        expected[{held.holder, held.key.sku, held.key.location}] += held.quantity;
    }
    for (const auto& held : ledger_.reservations()) {
        auto it = expected.find({held.holder, held.key.sku, held.key.location});
        double wanted = it == expected.end() ? 0.0 : it->second;
        double excess = held.quantity - wanted;
        if (excess > helpers::QUANTITY_EPSILON) {
            log_warn("recovery", "dangling_reservation_released", {
                {"holder", held.holder},
                {"sku", held.key.sku},
                {"location", held.key.location},
                {"quantity", excess}
            });
            ledger_.release(held.key.sku, held.key.location, excess, held.holder);
            report.released_quantity += excess;
        } else if (excess < -helpers::QUANTITY_EPSILON) {
            log_error("recovery", "reservation_missing", {
                {"holder", held.holder},
                {"sku", held.key.sku},
                {"location", held.key.location},
                {"expected", wanted},
                {"held", held.quantity}
            });
        }
    }

    auto outstanding = pick_lists_.outstanding_serials();
    for (const auto& unit : serials_.units_in_status(events::RESERVED)) {
        if (outstanding.count(unit.serial_number) > 0) continue;
        log_warn("recovery", "dangling_serial_released", {{"serial", unit.serial_number}, {"order_id", unit.order_id}});
        serials_.release(unit.serial_number);
        ++report.released_serials;
    }

    log_info("recovery", "journal_replayed", {
        {"entries", report.entries},
        {"released_quantity", report.released_quantity},
        {"released_serials", report.released_serials}
    });
    return report;
}

void Inventory::apply_entry(const events::JournalEntry& entry) {
    const auto& event = entry.event();
    if (helpers::holds<events::Transaction>(event)) {
        events::Transaction tx;
        if (!event.UnpackTo(&tx)) {
            log_error("recovery", "unreadable_entry", {{"sequence", entry.sequence()}});
            return;
        }
        tx.set_sequence(entry.sequence());
        log_.apply_entry(entry);
        ledger_.apply_entry(entry);
        catalog_.apply_transaction(tx);
        serials_.apply_transaction(tx);
        pick_lists_.apply_transaction(tx);
        return;
    }

    ledger_.apply_entry(entry);
    catalog_.apply_event(event);
    locations_.apply_event(event);
    serials_.apply_event(event);
    boms_.apply_event(event);
    pick_lists_.apply_event(event);
    alerts_.apply_event(event);
    apply_order_event(event);
}

void Inventory::apply_order_event(const google::protobuf::Any& event) {
    if (!helpers::holds<events::OrderUpserted>(event)) return;
    events::OrderUpserted e;
    if (!event.UnpackTo(&e)) return;
    std::unique_lock lock(orders_mutex_);
    orders_[e.order().order_id()] = e.order();
}

// ============================================================================
// Catalog and locations
// ============================================================================

events::Item Inventory::create_item(events::Item item) {
    if (!item.default_location().empty()) locations_.require_active(item.default_location());
    return catalog_.create_item(std::move(item));
}

events::Item Inventory::update_item(const std::string& sku, const ItemUpdate& update) {
    if (update.default_location && !update.default_location->empty()) {
        locations_.require_active(*update.default_location);
    }
    return catalog_.update_item(sku, update);
}

void Inventory::deactivate_item(const std::string& sku) { catalog_.deactivate_item(sku); }

events::Item Inventory::get_item(const std::string& sku) const { return catalog_.get(sku); }

std::vector<events::Item> Inventory::list_items(bool active_only) const { return catalog_.list(active_only); }

events::Location Inventory::register_location(events::Location location) {
    return locations_.register_location(std::move(location));
}

void Inventory::deactivate_location(const std::string& code) { locations_.deactivate(code); }

int Inventory::seed_default_locations() { return locations_.seed_defaults(); }

std::vector<events::Location> Inventory::list_locations(bool active_only) const {
    return locations_.list(active_only);
}

SerialUnit Inventory::register_serial(const std::string& sku, const std::string& serial_number,
                                      const std::string& location, double cost) {
    auto item = catalog_.require_active(sku);
    if (!item.track_individually()) {
        throw InventoryError::invalid_argument("Item " + sku + " is not tracked by serial number");
    }
    locations_.require_active(location);
    return serials_.register_unit(sku, serial_number, location, cost);
}

SerialUnit Inventory::transition_serial(const std::string& serial_number, events::SerialStatus status,
                                        const std::string& order_id) {
    return serials_.transition(serial_number, status, order_id);
}

SerialUnit Inventory::get_serial(const std::string& serial_number) const { return serials_.get(serial_number); }

// ============================================================================
// Stock movements
// ============================================================================

events::Transaction Inventory::receive(const std::string& sku, const std::string& location, double quantity,
                                       double unit_cost, const std::string& reference,
                                       const std::vector<std::string>& serial_numbers, const std::string& actor) {
    MovementContext context;
    context.actor = actor;
    context.reference = reference;
    return ledger_.apply(movement::Receive{sku, location, quantity, unit_cost, serial_numbers}, context);
}

events::Transaction Inventory::transfer(const std::string& sku, const std::string& from, const std::string& to,
                                        double quantity, const std::vector<std::string>& serial_numbers,
                                        const std::string& actor) {
    MovementContext context;
    context.actor = actor;
    return ledger_.apply(movement::Transfer{sku, from, to, quantity, serial_numbers}, context);
}

events::Transaction Inventory::adjust(const std::string& sku, const std::string& location, double new_quantity,
                                      const std::string& reason, const std::string& actor) {
    MovementContext context;
    context.actor = actor;
    auto tx = ledger_.apply(movement::Adjust{sku, location, new_quantity, reason}, context);
    log_info("ledger", "stock_adjusted", {{"sku", sku}, {"location", location}, {"delta", tx.quantity()},
                                          {"actor", actor}, {"reason", reason}});
    return tx;
}

events::Transaction Inventory::return_stock(const std::string& sku, const std::string& location, double quantity,
                                            const std::string& reason,
                                            const std::vector<std::string>& serial_numbers,
                                            const std::string& actor) {
    MovementContext context;
    context.actor = actor;
    context.reference = reason;
    return ledger_.apply(movement::Return{sku, location, quantity, serial_numbers}, context);
}

events::Transaction Inventory::scrap(const std::string& sku, const std::string& location, double quantity,
                                     const std::string& reason, const std::vector<std::string>& serial_numbers,
                                     const std::string& actor) {
    MovementContext context;
    context.actor = actor;
    context.reference = reason;
    return ledger_.apply(movement::Scrap{sku, location, quantity, serial_numbers}, context);
}

// ============================================================================
// Bulk import
// ============================================================================

ImportResult Inventory::import_items(const std::vector<events::Item>& rows) {
    ImportResult result;
    for (size_t i = 0; i < rows.size(); ++i) {
        const size_t row = i + 1;
        try {
            auto created = create_item(rows[i]);
            result.created_ids.push_back(created.sku());
            ++result.success_count;
        } catch (const InventoryError& e) {
            if (e.is_defect()) throw;
            std::string field;
            if (e.code() == ErrorCode::DuplicateSku) field = "sku";
            if (e.code() == ErrorCode::NotFound) field = "default_location";
            result.errors.push_back({row, field, e.what()});
        }
    }

    log_info("import", "items_imported", {
        {"rows", rows.size()},
        {"created", result.success_count},
        {"errors", result.error_count()}
    });
    return result;
}

ImportResult Inventory::import_stock(const std::vector<StockImportRow>& rows, const std::string& actor) {
    ImportResult result;
    for (size_t i = 0; i < rows.size(); ++i) {
        const size_t row = i + 1;
        const auto& line = rows[i];
        if (line.sku.empty() || line.location.empty()) {
            result.errors.push_back({row, "", "SKU and location are required"});
            continue;
        }
        if (!catalog_.find(line.sku)) {
            result.errors.push_back({row, "sku", "Item not found: " + line.sku});
            continue;
        }
        auto location = locations_.find(line.location);
        if (!location || !location->is_active()) {
            result.errors.push_back({row, "location", "Location not found: " + line.location});
            continue;
        }

        const bool is_new = ledger_.current_stock(line.sku, line.location).version == 0;
        MovementContext context;
        context.actor = actor;
        context.notes = "import row " + std::to_string(row);
        try {
            ledger_.apply(movement::Adjust{line.sku, line.location, line.quantity, STOCK_IMPORT_REFERENCE}, context);
        } catch (const InventoryError& e) {
            if (e.is_defect()) throw;
            result.errors.push_back({row, "quantity", e.what()});
            continue;
        }
        if (is_new) result.created_ids.push_back(line.sku + "@" + line.location);
        ++result.success_count;
    }

    log_info("import", "stock_imported", {
        {"rows", rows.size()},
        {"imported", result.success_count},
        {"errors", result.error_count()},
        {"actor", actor}
    });
    return result;
}

// ============================================================================
// Bills of materials
// ============================================================================

events::BillOfMaterials Inventory::create_bom(events::BillOfMaterials draft) {
    return boms_.create(std::move(draft));
}

events::BillOfMaterials Inventory::add_bom_component(const std::string& bom_id,
                                                     const events::BomComponent& component) {
    return boms_.add_component(bom_id, component);
}

events::BillOfMaterials Inventory::remove_bom_component(const std::string& bom_id, const std::string& sku) {
    return boms_.remove_component(bom_id, sku);
}

events::BillOfMaterials Inventory::revise_bom(const std::string& bom_id,
                                              const std::vector<events::BomComponent>& components) {
    return boms_.revise(bom_id, components);
}

void Inventory::set_default_bom(const std::string& bom_id) { boms_.set_default(bom_id); }

void Inventory::deactivate_bom(const std::string& bom_id) { boms_.deactivate(bom_id); }

events::BillOfMaterials Inventory::get_bom(const std::string& bom_id) const { return boms_.get(bom_id); }

std::vector<events::BillOfMaterials> Inventory::list_boms(const std::optional<std::string>& product_type) const {
    return boms_.list(product_type);
}

// ============================================================================
// Orders and pick lists
// ============================================================================

void Inventory::upsert_order(const events::Order& order) {
    validation::require_not_empty(order.order_id(), "order_id");
    validation::require_not_empty(order.product_type(), "product_type");
    validation::require_positive(order.quantity(), "quantity");

    events::OrderUpserted event;
    *event.mutable_order() = order;
    apply_order_event(journal_->append(event).event());
}

std::optional<events::Order> Inventory::find_order(const std::string& order_id) const {
    std::shared_lock lock(orders_mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) return std::nullopt;
    return it->second;
}

events::PickList Inventory::generate_pick_list(const std::string& order_id, const std::optional<std::string>& bom_id,
                                               const GenerateOptions& options) {
    auto order = find_order(order_id);
    if (!order) throw InventoryError::not_found("Order not found: " + order_id);
    return pick_lists_.generate(*order, bom_id, options);
}

events::PickListItem Inventory::scan_pick(const std::string& pick_list_id, const std::string& barcode,
                                          double quantity, const std::string& actor) {
    return pick_lists_.scan(pick_list_id, barcode, quantity, actor);
}

events::PickListItem Inventory::skip_pick_item(const std::string& pick_list_id, const std::string& item_id,
                                               const std::string& actor, const std::string& reason) {
    return pick_lists_.skip_item(pick_list_id, item_id, actor, reason);
}

events::PickList Inventory::complete_pick_list(const std::string& pick_list_id, const std::string& actor) {
    return pick_lists_.complete(pick_list_id, actor);
}

events::PickList Inventory::cancel_pick_list(const std::string& pick_list_id, const std::string& actor) {
    return pick_lists_.cancel(pick_list_id, actor);
}

std::optional<events::PickListItem> Inventory::next_expected_pick(const std::string& pick_list_id) const {
    return pick_lists_.next_expected(pick_list_id);
}

events::PickList Inventory::get_pick_list(const std::string& pick_list_id) const {
    return pick_lists_.get(pick_list_id);
}

std::vector<events::PickList> Inventory::list_pick_lists(std::optional<events::PickListStatus> status,
                                                         const std::optional<std::string>& order_id) const {
    return pick_lists_.list(status, order_id);
}

// ============================================================================
// Queries
// ============================================================================

std::vector<StockRecord> Inventory::current_stock(const std::string& sku) const {
    return ledger_.stock_for_item(sku);
}

StockRecord Inventory::current_stock(const std::string& sku, const std::string& location) const {
    return ledger_.current_stock(sku, location);
}

std::vector<events::Transaction> Inventory::transactions_for_item(const std::string& sku) const {
    return log_.for_item(sku);
}

std::vector<events::Transaction> Inventory::transactions_for_pick_list(const std::string& pick_list_id) const {
    return log_.for_pick_list(pick_list_id);
}

std::vector<events::Transaction> Inventory::transactions_for_order(const std::string& order_id) const {
    return log_.for_order(order_id);
}

BarcodeLookup Inventory::lookup_barcode(const std::string& code) const {
    BarcodeLookup result;
    result.serial = serials_.find_by_barcode(code);
    if (result.serial) {
        result.item = catalog_.get(result.serial->sku);
        result.stock = ledger_.stock_for_item(result.serial->sku);
        return result;
    }

    auto item = catalog_.find_by_barcode(code);
    if (!item) item = catalog_.find(code);
    if (!item) throw InventoryError::not_found("Barcode not found: " + code);
    result.item = *item;
    result.stock = ledger_.stock_for_item(item->sku());
    return result;
}

StockLevelsReport Inventory::stock_levels_report(const std::optional<std::string>& location,
                                                 std::optional<events::ItemCategory> category) const {
    return reports_.stock_levels(location, category);
}

ValuationReport Inventory::valuation_report() const { return reports_.valuation(); }

std::vector<Discrepancy> Inventory::reconcile() const { return ledger_.reconcile(); }

// ============================================================================
// Alerts
// ============================================================================

events::Alert Inventory::acknowledge_alert(const std::string& alert_id, const std::string& actor) {
    return alerts_.acknowledge(alert_id, actor);
}

std::vector<events::Alert> Inventory::alerts(std::optional<bool> acknowledged) const {
    return alerts_.list(acknowledged);
}

} // namespace floorstock
