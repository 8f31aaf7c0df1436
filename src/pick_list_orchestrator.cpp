#include "floorstock/pick_list_orchestrator.hpp"
#include "floorstock/errors.hpp"
#include "floorstock/helpers.hpp"
#include "floorstock/logging.hpp"
#include "floorstock/validation.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace floorstock {

namespace {

constexpr double EPSILON = helpers::QUANTITY_EPSILON;

/// Pick list targeted by a pick-list event, if `event` is one of ours.
std::optional<std::string> pick_list_id_of(const google::protobuf::Any& event) {
    if (helpers::holds<events::PickItemScanned>(event)) {
        events::PickItemScanned e;
        if (event.UnpackTo(&e)) return e.pick_list_id();
    } else if (helpers::holds<events::PickItemSkipped>(event)) {
        events::PickItemSkipped e;
        if (event.UnpackTo(&e)) return e.pick_list_id();
    } else if (helpers::holds<events::PickListCompleted>(event)) {
        events::PickListCompleted e;
        if (event.UnpackTo(&e)) return e.pick_list_id();
    } else if (helpers::holds<events::PickListCancelled>(event)) {
        events::PickListCancelled e;
        if (event.UnpackTo(&e)) return e.pick_list_id();
    }
    return std::nullopt;
}

/// Number part of "PL-<year>-<number>".
uint64_t pick_list_number(const std::string& id) {
    auto pos = id.rfind('-');
    if (pos == std::string::npos) return 0;
    return std::strtoull(id.c_str() + pos + 1, nullptr, 10);
}

events::PickListItem* find_line(events::PickList& list, const std::string& item_id) {
    for (auto& line : *list.mutable_items()) {
        if (line.id() == item_id) return &line;
    }
    return nullptr;
}

/// Reserved unit given up when a different in-stock unit is scanned in its place.
std::optional<std::string> displaced_serial(const events::PickListItem& line) {
    const auto& picked = line.picked_serials();
    for (int i = line.reserved_serials_size() - 1; i >= 0; --i) {
        const auto& serial = line.reserved_serials(i);
        if (std::find(picked.begin(), picked.end(), serial) == picked.end()) return serial;
    }
    return std::nullopt;
}

} // anonymous namespace

PickListOrchestrator::PickListOrchestrator(Journal& journal, StockLedger& ledger, BomEngine& boms,
                                           const Catalog& catalog, const LocationRegistry& locations,
                                           SerialRegistry& serials)
    : journal_(journal), ledger_(ledger), boms_(boms), catalog_(catalog), locations_(locations),
      serials_(serials) {}

// ============================================================================
// Generation
// ============================================================================

events::PickList PickListOrchestrator::generate(const events::Order& order, const std::optional<std::string>& bom_id,
                                                const GenerateOptions& options) {
    validation::require_not_empty(order.order_id(), "order_id");
    validation::require_positive(order.quantity(), "order quantity");

    events::BillOfMaterials bom;
    if (bom_id && !bom_id->empty()) {
        bom = boms_.get(*bom_id);
        if (!bom.is_active()) throw InventoryError::no_bom_found("BOM " + *bom_id + " is inactive");
    } else {
        bom = boms_.resolve(order.product_type(), order.variant());
    }
    if (bom.components().empty()) {
        throw InventoryError::invalid_argument("BOM has no components: " + bom.id());
    }
    auto requirements = BomEngine::expand(bom, order.quantity());

    std::string id;
    {
        std::unique_lock lock(index_mutex_);
        id = "PL-" + std::to_string(helpers::current_year()) + "-" + helpers::zero_pad(++last_number_, 5);
    }

    events::PickList list;
    list.set_id(id);
    list.set_order_id(order.order_id());
    list.set_order_number(order.order_number());
    list.set_bom_id(bom.id());
    list.set_status(events::PICK_LIST_PENDING);
    list.set_assigned_to(options.assigned_to);
    list.set_created_by(options.actor);
    list.set_notes(options.notes);
    *list.mutable_created_at() = helpers::now();

    try {
        uint64_t index = 0;
        for (const auto& requirement : requirements) {
            auto item = catalog_.get(requirement.sku);
            auto* line = list.add_items();
            line->set_id(id + "-" + helpers::zero_pad(++index, 2));
            line->set_sku(requirement.sku);
            line->set_quantity_required(requirement.quantity);
            line->set_optional(requirement.optional);
            line->set_location(choose_location(item, options));
            reserve_line(order, id, item, *line);
        }

        events::PickListGenerated event;
        *event.mutable_pick_list() = list;
        journal_.append(event);
    } catch (const std::exception& e) {
        log_error("pick_list", "generate_failed", {{"pick_list_id", id}, {"order_id", order.order_id()},
                                                   {"error", e.what()}});
        for (const auto& line : list.items()) {
            try {
                release_line(list, line);
            } catch (const InventoryError& release_error) {
                log_error("pick_list", "rollback_release_failed", {{"pick_list_id", id}, {"sku", line.sku()},
                                                                   {"error", release_error.what()}});
            }
        }
        throw;
    }

    insert(list);

    int short_lines = 0;
    for (const auto& line : list.items()) {
        if (line.status() == events::PICK_ITEM_SHORT) ++short_lines;
    }
    log_info("pick_list", "generated", {
        {"pick_list_id", id},
        {"order_id", order.order_id()},
        {"bom_id", bom.id()},
        {"lines", list.items_size()},
        {"short_lines", short_lines}
    });
    return list;
}

std::string PickListOrchestrator::choose_location(const events::Item& item, const GenerateOptions& options) const {
    auto override_it = options.location_overrides.find(item.sku());
    if (override_it != options.location_overrides.end()) {
        return locations_.require_active(override_it->second).code();
    }

    const auto& preferred = item.default_location();
    if (!preferred.empty() && ledger_.current_stock(item.sku(), preferred).available() > EPSILON) {
        return preferred;
    }

    // No stock at the default: take the location holding the most.
    std::string best;
    double best_available = 0.0;
    for (const auto& record : ledger_.stock_for_item(item.sku())) {
        if (record.available() > best_available + EPSILON) {
            best = record.location;
            best_available = record.available();
        }
    }
    return best.empty() ? preferred : best;
}

void PickListOrchestrator::reserve_line(const events::Order& order, const std::string& pick_list_id,
                                        const events::Item& item, events::PickListItem& line) {
    const double required = line.quantity_required();
    double reserved = 0.0;

    if (!line.location().empty()) {
        if (item.track_individually()) {
            auto units = serials_.units_for_item(item.sku(), line.location(), events::IN_STOCK);
            double wanted = std::min(std::floor(required + EPSILON), static_cast<double>(units.size()));
            double held = wanted > 0 ? ledger_.reserve_available(item.sku(), line.location(), wanted, pick_list_id)
                                     : 0.0;
            line.set_quantity_reserved(held);
            double taken = 0.0;
            for (const auto& unit : units) {
                if (taken + EPSILON >= std::floor(held + EPSILON)) break;
                try {
                    serials_.reserve_for_order(unit.serial_number, order.order_id());
                } catch (const InventoryError& e) {
                    // Another list took the unit since it was listed.
                    if (e.code() != ErrorCode::InvalidTransition) throw;
                    continue;
                }
                line.add_reserved_serials(unit.serial_number);
                taken += 1.0;
            }
            if (held - taken > EPSILON) {
                ledger_.release(item.sku(), line.location(), held - taken, pick_list_id);
            }
            reserved = taken;
        } else {
            reserved = ledger_.reserve_available(item.sku(), line.location(), required, pick_list_id);
        }
    }

    line.set_quantity_reserved(reserved);
    double shortfall = required - reserved;
    if (shortfall > EPSILON) {
        line.set_quantity_short(shortfall);
        line.set_status(line.optional() && reserved <= EPSILON ? events::PICK_ITEM_SKIPPED
                                                               : events::PICK_ITEM_SHORT);
    } else {
        line.set_status(events::PICK_ITEM_PENDING);
    }
}

// ============================================================================
// Scanning
// ============================================================================

events::PickListItem PickListOrchestrator::scan(const std::string& pick_list_id, const std::string& barcode,
                                                double quantity, const std::string& actor) {
    validation::require_not_empty(barcode, "barcode");
    validation::require_positive(quantity, "quantity");

    auto& entry = require_entry(pick_list_id);
    std::lock_guard lock(entry.mutex);
    auto& list = entry.list;
    if (!is_open(list)) {
        throw InventoryError::invalid_state(
            "Pick list " + pick_list_id + " is " + helpers::to_string(list.status()));
    }

    // Serial barcodes first, then item barcodes and SKUs.
    auto unit = serials_.find_by_barcode(barcode);
    if (!unit) unit = serials_.find(barcode);
    std::string sku;
    if (unit) {
        sku = unit->sku;
    } else if (auto item = catalog_.find_by_barcode(barcode)) {
        sku = item->sku();
    } else if (auto item = catalog_.find(barcode)) {
        sku = item->sku();
    } else {
        throw InventoryError::barcode_mismatch("Unknown barcode: " + barcode);
    }

    events::PickListItem* line = nullptr;
    for (auto& candidate : *list.mutable_items()) {
        if (candidate.sku() == sku && outstanding(candidate) > EPSILON) {
            line = &candidate;
            break;
        }
    }
    if (!line) {
        throw InventoryError::barcode_mismatch("Item " + sku + " is not expected on pick list " + pick_list_id);
    }

    auto item = catalog_.get(sku);
    std::vector<std::string> serials;
    std::optional<std::string> displaced;
    if (item.track_individually()) {
        if (!unit) {
            throw InventoryError::invalid_argument("Scan the serial number barcode of each " + sku + " unit");
        }
        if (std::fabs(quantity - 1.0) > EPSILON) {
            throw InventoryError::invalid_argument("Serial-tracked items are picked one unit per scan");
        }
        auto reserved = unpicked_serials(*line);
        if (std::find(reserved.begin(), reserved.end(), unit->serial_number) == reserved.end()) {
            if (unit->status != events::IN_STOCK || unit->location != line->location()) {
                throw InventoryError::barcode_mismatch(
                    "Serial " + unit->serial_number + " is not available at " + line->location());
            }
            displaced = displaced_serial(*line);
        }
        serials.push_back(unit->serial_number);
    }

    if (quantity > outstanding(*line) + EPSILON) {
        throw InventoryError::invalid_argument(
            "Quantity " + std::to_string(quantity) + " exceeds the " + std::to_string(outstanding(*line)) +
            " still to pick for " + sku);
    }

    MovementContext context;
    context.actor = actor;
    context.order_id = list.order_id();
    context.pick_list_id = list.id();
    context.pick_list_item_id = line->id();
    context.reference = list.order_number();
    auto tx = ledger_.apply(movement::Pick{sku, line->location(), quantity, serials}, context);
    apply_pick_locked(list, tx);

    if (displaced) serials_.release(*displaced);

    events::PickItemScanned scanned;
    scanned.set_pick_list_id(list.id());
    scanned.set_item_id(line->id());
    scanned.set_scanned_barcode(barcode);
    scanned.set_actor(actor);
    *scanned.mutable_scanned_at() = tx.created_at();
    apply_locked(list, journal_.append(scanned).event());

    log_info("pick_list", "item_scanned", {
        {"pick_list_id", list.id()},
        {"item_id", line->id()},
        {"sku", sku},
        {"quantity", quantity},
        {"picked", line->quantity_picked()},
        {"status", helpers::to_string(line->status())}
    });
    return *line;
}

std::optional<events::PickListItem> PickListOrchestrator::next_expected(const std::string& pick_list_id) const {
    auto& entry = require_entry(pick_list_id);
    std::lock_guard lock(entry.mutex);
    for (const auto& line : entry.list.items()) {
        if (line.status() == events::PICK_ITEM_PENDING) return line;
    }
    return std::nullopt;
}

// ============================================================================
// Skip / complete / cancel
// ============================================================================

events::PickListItem PickListOrchestrator::skip_item(const std::string& pick_list_id, const std::string& item_id,
                                                     const std::string& actor, const std::string& reason) {
    auto& entry = require_entry(pick_list_id);
    std::lock_guard lock(entry.mutex);
    auto& list = entry.list;
    if (!is_open(list)) {
        throw InventoryError::invalid_state(
            "Pick list " + pick_list_id + " is " + helpers::to_string(list.status()));
    }

    auto* line = find_line(list, item_id);
    if (!line) throw InventoryError::not_found("Pick list item not found: " + item_id);
    if (line->status() != events::PICK_ITEM_PENDING && line->status() != events::PICK_ITEM_SHORT) {
        throw InventoryError::invalid_state(
            "Pick list item " + item_id + " is already " + helpers::to_string(line->status()));
    }

    const auto before = *line;
    events::PickItemSkipped event;
    event.set_pick_list_id(pick_list_id);
    event.set_item_id(item_id);
    event.set_actor(actor);
    event.set_reason(reason);
    apply_locked(list, journal_.append(event).event());
    release_line(list, before);

    log_info("pick_list", "item_skipped", {
        {"pick_list_id", pick_list_id},
        {"item_id", item_id},
        {"sku", line->sku()},
        {"actor", actor},
        {"reason", reason}
    });
    return *line;
}

events::PickList PickListOrchestrator::complete(const std::string& pick_list_id, const std::string& actor) {
    auto& entry = require_entry(pick_list_id);
    std::lock_guard lock(entry.mutex);
    auto& list = entry.list;
    if (!is_open(list)) {
        throw InventoryError::invalid_state(
            "Pick list " + pick_list_id + " is " + helpers::to_string(list.status()));
    }

    int pending = 0;
    for (const auto& line : list.items()) {
        if (line.status() == events::PICK_ITEM_PENDING) ++pending;
    }
    if (pending > 0) {
        throw InventoryError(ErrorCode::IncompletePickList,
                             "Pick list " + pick_list_id + " has " + std::to_string(pending) + " pending item(s)");
    }

    events::PickListCompleted event;
    event.set_pick_list_id(pick_list_id);
    event.set_bom_id(list.bom_id());
    event.set_actor(actor);
    *event.mutable_completed_at() = helpers::now();
    auto stored = journal_.append(event);
    apply_locked(list, stored.event());
    boms_.apply_event(stored.event());

    for (const auto& line : list.items()) {
        if (line.status() == events::PICK_ITEM_SHORT) release_line(list, line);
    }

    log_info("pick_list", "completed", {{"pick_list_id", pick_list_id}, {"actor", actor}});
    return list;
}

events::PickList PickListOrchestrator::cancel(const std::string& pick_list_id, const std::string& actor) {
    auto& entry = require_entry(pick_list_id);
    std::lock_guard lock(entry.mutex);
    auto& list = entry.list;
    if (!is_open(list)) {
        throw InventoryError::invalid_state(
            "Pick list " + pick_list_id + " is already " + helpers::to_string(list.status()));
    }

    events::PickListCancelled event;
    event.set_pick_list_id(pick_list_id);
    event.set_actor(actor);
    apply_locked(list, journal_.append(event).event());

    for (const auto& line : list.items()) {
        if (line.status() == events::PICK_ITEM_PENDING || line.status() == events::PICK_ITEM_SHORT) {
            release_line(list, line);
        }
    }

    log_info("pick_list", "cancelled", {{"pick_list_id", pick_list_id}, {"actor", actor}});
    return list;
}

void PickListOrchestrator::release_line(const events::PickList& list, const events::PickListItem& line) {
    double amount = line.quantity_reserved() - line.quantity_picked();
    if (amount > EPSILON && !line.location().empty()) {
        ledger_.release(line.sku(), line.location(), amount, list.id());
    }
    for (const auto& serial : unpicked_serials(line)) {
        auto unit = serials_.find(serial);
        if (unit && unit->status == events::RESERVED) serials_.release(serial);
    }
}

// ============================================================================
// Queries
// ============================================================================

events::PickList PickListOrchestrator::get(const std::string& pick_list_id) const {
    auto& entry = require_entry(pick_list_id);
    std::lock_guard lock(entry.mutex);
    return entry.list;
}

std::vector<events::PickList> PickListOrchestrator::list(std::optional<events::PickListStatus> status,
                                                         const std::optional<std::string>& order_id) const {
    std::vector<Entry*> entries;
    {
        std::shared_lock lock(index_mutex_);
        for (const auto& [id, entry] : lists_) entries.push_back(entry.get());
    }

    std::vector<events::PickList> result;
    for (Entry* entry : entries) {
        std::lock_guard lock(entry->mutex);
        if (status && entry->list.status() != *status) continue;
        if (order_id && entry->list.order_id() != *order_id) continue;
        result.push_back(entry->list);
    }
    return result;
}

std::vector<HeldReservation> PickListOrchestrator::outstanding_reservations() const {
    std::vector<HeldReservation> result;
    for (const auto& pick_list : list()) {
        if (!is_open(pick_list)) continue;
        for (const auto& line : pick_list.items()) {
            double amount = outstanding(line);
            if (amount > EPSILON) result.push_back({pick_list.id(), {line.sku(), line.location()}, amount});
        }
    }
    return result;
}

std::set<std::string> PickListOrchestrator::outstanding_serials() const {
    std::set<std::string> result;
    for (const auto& pick_list : list()) {
        if (!is_open(pick_list)) continue;
        for (const auto& line : pick_list.items()) {
            if (outstanding(line) <= EPSILON) continue;
            for (auto& serial : unpicked_serials(line)) result.insert(std::move(serial));
        }
    }
    return result;
}

// ============================================================================
// Event application
// ============================================================================

void PickListOrchestrator::apply_event(const google::protobuf::Any& event) {
    if (helpers::holds<events::PickListGenerated>(event)) {
        events::PickListGenerated e;
        if (event.UnpackTo(&e)) insert(e.pick_list());
        return;
    }

    auto id = pick_list_id_of(event);
    if (!id) return;
    Entry* entry = nullptr;
    {
        std::shared_lock lock(index_mutex_);
        auto it = lists_.find(*id);
        if (it == lists_.end()) return;
        entry = it->second.get();
    }
    std::lock_guard lock(entry->mutex);
    apply_locked(entry->list, event);
}

void PickListOrchestrator::apply_transaction(const events::Transaction& tx) {
    if (tx.type() != events::PICK || tx.pick_list_id().empty()) return;

    Entry* entry = nullptr;
    {
        std::shared_lock lock(index_mutex_);
        auto it = lists_.find(tx.pick_list_id());
        if (it == lists_.end()) return;
        entry = it->second.get();
    }
    std::lock_guard lock(entry->mutex);
    apply_pick_locked(entry->list, tx);
}

void PickListOrchestrator::apply_pick_locked(events::PickList& list, const events::Transaction& tx) {
    auto* line = find_line(list, tx.pick_list_item_id());
    if (!line) return;

    line->set_quantity_picked(line->quantity_picked() + tx.quantity());
    for (const auto& serial : tx.serial_numbers()) {
        auto* reserved = line->mutable_reserved_serials();
        if (std::find(reserved->begin(), reserved->end(), serial) == reserved->end()) {
            // An in-stock unit scanned in place of a reserved one takes its slot.
            if (auto displaced = displaced_serial(*line)) {
                std::replace(reserved->begin(), reserved->end(), *displaced, serial);
            }
        }
        line->add_picked_serials(serial);
    }
    if (line->quantity_picked() + EPSILON >= line->quantity_required()) {
        line->set_status(events::PICK_ITEM_PICKED);
    }

    if (list.status() == events::PICK_LIST_PENDING) {
        list.set_status(events::PICK_LIST_IN_PROGRESS);
        *list.mutable_started_at() = tx.created_at();
    }
}

void PickListOrchestrator::apply_locked(events::PickList& list, const google::protobuf::Any& event) {
    if (helpers::holds<events::PickItemScanned>(event)) {
        events::PickItemScanned e;
        if (!event.UnpackTo(&e)) return;
        auto* line = find_line(list, e.item_id());
        if (!line) return;
        line->set_scanned_barcode(e.scanned_barcode());
        line->set_picked_by(e.actor());
        *line->mutable_picked_at() = e.scanned_at();
    } else if (helpers::holds<events::PickItemSkipped>(event)) {
        events::PickItemSkipped e;
        if (!event.UnpackTo(&e)) return;
        auto* line = find_line(list, e.item_id());
        if (!line) return;
        line->set_status(events::PICK_ITEM_SKIPPED);
        if (!e.reason().empty()) line->set_notes(e.reason());
    } else if (helpers::holds<events::PickListCompleted>(event)) {
        events::PickListCompleted e;
        if (!event.UnpackTo(&e)) return;
        list.set_status(events::PICK_LIST_COMPLETED);
        *list.mutable_completed_at() = e.completed_at();
    } else if (helpers::holds<events::PickListCancelled>(event)) {
        list.set_status(events::PICK_LIST_CANCELLED);
    }
}

void PickListOrchestrator::insert(const events::PickList& list) {
    std::unique_lock lock(index_mutex_);
    last_number_ = std::max(last_number_, pick_list_number(list.id()));
    auto entry = std::make_unique<Entry>();
    entry->list = list;
    lists_[list.id()] = std::move(entry);
}

PickListOrchestrator::Entry& PickListOrchestrator::require_entry(const std::string& pick_list_id) const {
    std::shared_lock lock(index_mutex_);
    auto it = lists_.find(pick_list_id);
    if (it == lists_.end()) throw InventoryError::not_found("Pick list not found: " + pick_list_id);
    return *it->second;
}

bool PickListOrchestrator::is_open(const events::PickList& list) {
    return list.status() == events::PICK_LIST_PENDING || list.status() == events::PICK_LIST_IN_PROGRESS;
}

double PickListOrchestrator::outstanding(const events::PickListItem& line) {
    if (line.status() != events::PICK_ITEM_PENDING && line.status() != events::PICK_ITEM_SHORT) return 0.0;
    return std::max(0.0, line.quantity_reserved() - line.quantity_picked());
}

std::vector<std::string> PickListOrchestrator::unpicked_serials(const events::PickListItem& line) {
    std::vector<std::string> result;
    const auto& picked = line.picked_serials();
    for (const auto& serial : line.reserved_serials()) {
        if (std::find(picked.begin(), picked.end(), serial) == picked.end()) result.push_back(serial);
    }
    return result;
}

} // namespace floorstock
