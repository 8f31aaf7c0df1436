#include "floorstock/stock_ledger.hpp"
#include "floorstock/errors.hpp"
#include "floorstock/helpers.hpp"
#include "floorstock/logging.hpp"
#include "floorstock/validation.hpp"
#include <algorithm>
#include <cmath>

namespace floorstock {

namespace {

constexpr double EPSILON = helpers::QUANTITY_EPSILON;

void stamp(events::Transaction& tx, const MovementContext& context) {
    tx.set_actor(context.actor);
    tx.set_order_id(context.order_id);
    tx.set_pick_list_id(context.pick_list_id);
    tx.set_pick_list_item_id(context.pick_list_item_id);
    tx.set_reference(context.reference);
    tx.set_notes(context.notes);
}

template<typename M>
void copy_serials(events::Transaction& tx, const M& movement) {
    for (const auto& serial : movement.serial_numbers) {
        tx.add_serial_numbers(serial);
    }
}

void require_unit_count(const events::Item& item, const std::vector<std::string>& serials, double quantity) {
    if (serials.empty()) return;
    if (!item.track_individually()) {
        throw InventoryError::invalid_argument("Item " + item.sku() + " is not tracked by serial number");
    }
    if (std::fabs(static_cast<double>(serials.size()) - quantity) > EPSILON) {
        throw InventoryError::invalid_argument(
            "Quantity " + std::to_string(quantity) + " does not match " +
            std::to_string(serials.size()) + " serial numbers");
    }
}

} // anonymous namespace

StockLedger::StockLedger(Journal& journal, TransactionLog& log, Catalog& catalog,
                         LocationRegistry& locations, SerialRegistry& serials)
    : journal_(journal), log_(log), catalog_(catalog), locations_(locations), serials_(serials) {}

// ============================================================================
// Movements
// ============================================================================

events::Transaction StockLedger::apply(const Movement& movement, const MovementContext& context) {
    auto committed = std::visit([&](const auto& m) { return apply_movement(m, context); }, movement);
    const auto& tx = committed.tx;

    log_info("ledger", "movement_committed", {
        {"sequence", tx.sequence()},
        {"type", helpers::to_string(tx.type())},
        {"sku", tx.sku()},
        {"quantity", tx.quantity()},
        {"from", tx.from_location()},
        {"to", tx.to_location()}
    });

    if (committed.change.available_delta != 0.0) notify(committed.change);
    return std::move(committed.tx);
}

StockLedger::Committed StockLedger::apply_movement(const movement::Receive& m, const MovementContext& context) {
    validation::require_not_empty(m.sku, "sku");
    validation::require_not_empty(m.location, "location");
    validation::require_positive(m.quantity, "quantity");
    validation::require_non_negative(m.unit_cost, "unit_cost");
    auto item = catalog_.require_active(m.sku);
    locations_.require_active(m.location);
    require_unit_count(item, m.serial_numbers, m.quantity);

    // Every slot of the item stays locked until the commit, so on-hand and
    // average cost are those the new receipt is weighed against.
    auto& target = slot(m.sku, m.location);
    auto held = lock_item(m.sku);
    double old_on_hand = 0.0;
    for (Slot* s : held.slots) old_on_hand += s->record.quantity;
    double old_average = catalog_.get(m.sku).average_cost();

    double new_total = old_on_hand + m.quantity;
    double new_average = new_total > 0
        ? (old_on_hand * old_average + m.quantity * m.unit_cost) / new_total
        : m.unit_cost;

    events::Transaction tx;
    tx.set_type(events::RECEIVE);
    tx.set_sku(m.sku);
    tx.set_to_location(m.location);
    tx.set_quantity(m.quantity);
    tx.set_unit_cost(m.unit_cost);
    tx.set_new_average_cost(new_average);
    copy_serials(tx, m);
    stamp(tx, context);

    return commit(std::move(tx), {&target});
}

StockLedger::Committed StockLedger::apply_movement(const movement::Transfer& m, const MovementContext& context) {
    validation::require_not_empty(m.sku, "sku");
    validation::require_not_empty(m.from, "from_location");
    validation::require_not_empty(m.to, "to_location");
    validation::require_positive(m.quantity, "quantity");
    if (m.from == m.to) {
        throw InventoryError::invalid_argument("Transfer source and destination are the same: " + m.from);
    }
    auto item = catalog_.require_active(m.sku);
    locations_.require_active(m.from);
    locations_.require_active(m.to);
    require_unit_count(item, m.serial_numbers, m.quantity);

    auto& source = slot(m.sku, m.from);
    auto& destination = slot(m.sku, m.to);
    std::scoped_lock lock(source.mutex, destination.mutex);

    if (source.record.available() + EPSILON < m.quantity) {
        throw InventoryError::insufficient_stock(
            "Only " + std::to_string(source.record.available()) + " of " + m.sku +
            " available at " + m.from + ", requested " + std::to_string(m.quantity));
    }

    events::Transaction tx;
    tx.set_type(events::TRANSFER);
    tx.set_sku(m.sku);
    tx.set_from_location(m.from);
    tx.set_to_location(m.to);
    tx.set_quantity(m.quantity);
    tx.set_unit_cost(item.average_cost());
    copy_serials(tx, m);
    stamp(tx, context);

    return commit(std::move(tx), {&source, &destination});
}

StockLedger::Committed StockLedger::apply_movement(const movement::Pick& m, const MovementContext& context) {
    validation::require_not_empty(m.sku, "sku");
    validation::require_not_empty(m.location, "location");
    validation::require_positive(m.quantity, "quantity");
    validation::require_not_empty(context.pick_list_id, "pick_list_id");
    auto item = catalog_.get(m.sku);
    require_unit_count(item, m.serial_numbers, m.quantity);

    auto& source = slot(m.sku, m.location);
    std::lock_guard lock(source.mutex);

    auto held = source.holders.find(context.pick_list_id);
    double held_quantity = held == source.holders.end() ? 0.0 : held->second;
    if (source.record.reserved + EPSILON < m.quantity || held_quantity + EPSILON < m.quantity) {
        log_error("ledger", "insufficient_reservation", {
            {"sku", m.sku},
            {"location", m.location},
            {"holder", context.pick_list_id},
            {"held", held_quantity},
            {"reserved", source.record.reserved},
            {"requested", m.quantity}
        });
        throw InventoryError::insufficient_reservation(
            "Pick of " + std::to_string(m.quantity) + " " + m.sku + " at " + m.location +
            " exceeds the reservation held by " + context.pick_list_id);
    }

    events::Transaction tx;
    tx.set_type(events::PICK);
    tx.set_sku(m.sku);
    tx.set_from_location(m.location);
    tx.set_quantity(m.quantity);
    tx.set_unit_cost(item.average_cost());
    copy_serials(tx, m);
    stamp(tx, context);

    return commit(std::move(tx), {&source});
}

StockLedger::Committed StockLedger::apply_movement(const movement::Adjust& m, const MovementContext& context) {
    validation::require_not_empty(m.sku, "sku");
    validation::require_not_empty(m.location, "location");
    validation::require_non_negative(m.new_quantity, "new_quantity");
    auto item = catalog_.get(m.sku);
    locations_.require_active(m.location);

    auto& target = slot(m.sku, m.location);
    std::lock_guard lock(target.mutex);

    if (m.new_quantity + EPSILON < target.record.reserved) {
        throw InventoryError::insufficient_stock(
            "Cannot count " + m.sku + " at " + m.location + " below its reserved " +
            std::to_string(target.record.reserved));
    }

    double delta = m.new_quantity - target.record.quantity;
    events::Transaction tx;
    tx.set_type(events::ADJUST);
    tx.set_sku(m.sku);
    if (delta < 0) {
        tx.set_from_location(m.location);
    } else {
        tx.set_to_location(m.location);
    }
    tx.set_quantity(delta);
    tx.set_unit_cost(item.average_cost());
    stamp(tx, context);
    if (!m.reason.empty()) tx.set_reference(m.reason);

    return commit(std::move(tx), {&target});
}

StockLedger::Committed StockLedger::apply_movement(const movement::Return& m, const MovementContext& context) {
    validation::require_not_empty(m.sku, "sku");
    validation::require_not_empty(m.location, "location");
    validation::require_positive(m.quantity, "quantity");
    auto item = catalog_.get(m.sku);
    locations_.require_active(m.location);
    require_unit_count(item, m.serial_numbers, m.quantity);

    auto& target = slot(m.sku, m.location);
    std::lock_guard lock(target.mutex);

    events::Transaction tx;
    tx.set_type(events::RETURN);
    tx.set_sku(m.sku);
    tx.set_to_location(m.location);
    tx.set_quantity(m.quantity);
    tx.set_unit_cost(item.average_cost());
    copy_serials(tx, m);
    stamp(tx, context);

    return commit(std::move(tx), {&target});
}

StockLedger::Committed StockLedger::apply_movement(const movement::Scrap& m, const MovementContext& context) {
    validation::require_not_empty(m.sku, "sku");
    validation::require_not_empty(m.location, "location");
    validation::require_positive(m.quantity, "quantity");
    auto item = catalog_.get(m.sku);
    require_unit_count(item, m.serial_numbers, m.quantity);

    auto& source = slot(m.sku, m.location);
    std::lock_guard lock(source.mutex);

    if (source.record.available() + EPSILON < m.quantity) {
        throw InventoryError::insufficient_stock(
            "Only " + std::to_string(source.record.available()) + " of " + m.sku +
            " available at " + m.location + ", cannot scrap " + std::to_string(m.quantity));
    }

    events::Transaction tx;
    tx.set_type(events::SCRAP);
    tx.set_sku(m.sku);
    tx.set_from_location(m.location);
    tx.set_quantity(m.quantity);
    tx.set_unit_cost(item.average_cost());
    copy_serials(tx, m);
    stamp(tx, context);

    return commit(std::move(tx), {&source});
}

StockLedger::Committed StockLedger::commit(events::Transaction tx, std::initializer_list<Slot*> slots) {
    // The log append is the commit point: if it throws, no record has changed.
    // Serial units are checked and claimed under the same registry lock.
    auto committed = serials_.commit_movement(std::move(tx), [this](events::Transaction validated) {
        return log_.append(std::move(validated));
    });

    for (const auto& effect : effects_of(committed)) {
        for (Slot* s : slots) {
            if (s->record.location == effect.key.location) {
                apply_effect_locked(*s, effect, committed);
                break;
            }
        }
    }
    catalog_.apply_transaction(committed);

    auto change = shift_available(committed.sku(), available_delta(committed));
    return {std::move(committed), std::move(change)};
}

// ============================================================================
// Reservations
// ============================================================================

void StockLedger::reserve(const std::string& sku, const std::string& location, double quantity,
                          const std::string& holder) {
    validation::require_not_empty(sku, "sku");
    validation::require_not_empty(location, "location");
    validation::require_not_empty(holder, "holder");
    validation::require_positive(quantity, "quantity");

    StockChange change;
    {
        auto& target = slot(sku, location);
        std::lock_guard lock(target.mutex);
        if (target.record.available() + EPSILON < quantity) {
            throw InventoryError::insufficient_stock(
                "Only " + std::to_string(target.record.available()) + " of " + sku +
                " available at " + location + ", cannot reserve " + std::to_string(quantity));
        }

        events::StockReserved event;
        event.set_sku(sku);
        event.set_location(location);
        event.set_quantity(quantity);
        event.set_holder(holder);
        journal_.append(event);
        apply_reservation_locked(target, quantity, holder);
        change = shift_available(sku, -quantity);
    }
    notify(change);
}

double StockLedger::reserve_available(const std::string& sku, const std::string& location, double max_quantity,
                                      const std::string& holder) {
    validation::require_not_empty(sku, "sku");
    validation::require_not_empty(location, "location");
    validation::require_not_empty(holder, "holder");
    validation::require_positive(max_quantity, "quantity");

    double amount = 0.0;
    StockChange change;
    {
        auto& target = slot(sku, location);
        std::lock_guard lock(target.mutex);
        amount = std::min(max_quantity, target.record.available());
        if (amount <= EPSILON) return 0.0;

        events::StockReserved event;
        event.set_sku(sku);
        event.set_location(location);
        event.set_quantity(amount);
        event.set_holder(holder);
        journal_.append(event);
        apply_reservation_locked(target, amount, holder);
        change = shift_available(sku, -amount);
    }
    notify(change);
    return amount;
}

void StockLedger::release(const std::string& sku, const std::string& location, double quantity,
                          const std::string& holder) {
    validation::require_positive(quantity, "quantity");

    StockChange change;
    {
        auto* target = find_slot(sku, location);
        std::unique_lock<std::mutex> lock;
        double held_quantity = 0.0;
        if (target) {
            lock = std::unique_lock(target->mutex);
            auto held = target->holders.find(holder);
            if (held != target->holders.end()) held_quantity = held->second;
        }
        if (!target || held_quantity + EPSILON < quantity || target->record.reserved + EPSILON < quantity) {
            log_error("ledger", "insufficient_reservation", {
                {"sku", sku},
                {"location", location},
                {"holder", holder},
                {"held", held_quantity},
                {"requested", quantity}
            });
            throw InventoryError::insufficient_reservation(
                "Release of " + std::to_string(quantity) + " " + sku + " at " + location +
                " exceeds the reservation held by " + holder);
        }

        events::ReservationReleased event;
        event.set_sku(sku);
        event.set_location(location);
        event.set_quantity(quantity);
        event.set_holder(holder);
        journal_.append(event);
        apply_reservation_locked(*target, -quantity, holder);
        change = shift_available(sku, quantity);
    }
    notify(change);
}

// ============================================================================
// Queries
// ============================================================================

StockRecord StockLedger::current_stock(const std::string& sku, const std::string& location) const {
    auto* s = find_slot(sku, location);
    if (!s) {
        StockRecord empty;
        empty.sku = sku;
        empty.location = location;
        return empty;
    }
    std::lock_guard lock(s->mutex);
    return s->record;
}

std::vector<StockRecord> StockLedger::stock_for_item(const std::string& sku) const {
    std::vector<StockRecord> result;
    for (Slot* s : slots_for(&sku)) {
        std::lock_guard lock(s->mutex);
        if (s->record.version > 0) result.push_back(s->record);
    }
    return result;
}

std::vector<StockRecord> StockLedger::all_records() const {
    std::vector<StockRecord> result;
    for (Slot* s : slots_for(nullptr)) {
        std::lock_guard lock(s->mutex);
        if (s->record.version > 0) result.push_back(s->record);
    }
    return result;
}

double StockLedger::item_on_hand(const std::string& sku) const {
    double total = 0.0;
    for (Slot* s : slots_for(&sku)) {
        std::lock_guard lock(s->mutex);
        total += s->record.quantity;
    }
    return total;
}

double StockLedger::item_available(const std::string& sku) const {
    double total = 0.0;
    for (Slot* s : slots_for(&sku)) {
        std::lock_guard lock(s->mutex);
        total += s->record.available();
    }
    return total;
}

std::vector<HeldReservation> StockLedger::reservations() const {
    std::vector<HeldReservation> result;
    for (Slot* s : slots_for(nullptr)) {
        std::lock_guard lock(s->mutex);
        for (const auto& [holder, quantity] : s->holders) {
            result.push_back({holder, {s->record.sku, s->record.location}, quantity});
        }
    }
    return result;
}

double StockLedger::held_by(const std::string& holder, const std::string& sku, const std::string& location) const {
    auto* s = find_slot(sku, location);
    if (!s) return 0.0;
    std::lock_guard lock(s->mutex);
    auto it = s->holders.find(holder);
    return it == s->holders.end() ? 0.0 : it->second;
}

void StockLedger::add_observer(StockObserver observer) {
    std::lock_guard lock(observers_mutex_);
    observers_.push_back(std::move(observer));
}

// ============================================================================
// Reconciliation and replay
// ============================================================================

std::vector<Discrepancy> StockLedger::reconcile() const {
    std::vector<Discrepancy> result;
    for (Slot* s : slots_for(nullptr)) {
        std::lock_guard lock(s->mutex);
        const auto& record = s->record;

        double replayed = 0.0;
        for (const auto& tx : log_.for_key(record.sku, record.location)) {
            for (const auto& effect : effects_of(tx)) {
                if (effect.key.location == record.location) replayed += effect.quantity;
            }
        }
        double held = 0.0;
        for (const auto& [holder, quantity] : s->holders) held += quantity;

        if (std::fabs(replayed - record.quantity) > EPSILON || std::fabs(held - record.reserved) > EPSILON) {
            Discrepancy discrepancy;
            discrepancy.key = {record.sku, record.location};
            discrepancy.recorded_quantity = record.quantity;
            discrepancy.replayed_quantity = replayed;
            discrepancy.recorded_reserved = record.reserved;
            discrepancy.held_reserved = held;
            result.push_back(std::move(discrepancy));
        }
    }

    if (!result.empty()) {
        log_warn("ledger", "reconcile_discrepancies", {{"count", result.size()}});
    }
    return result;
}

void StockLedger::rebuild(const std::vector<events::JournalEntry>& entries) {
    for (Slot* s : slots_for(nullptr)) {
        std::lock_guard lock(s->mutex);
        s->record.quantity = 0.0;
        s->record.reserved = 0.0;
        s->record.version = 0;
        s->record.last_count_at = 0;
        s->holders.clear();
    }
    {
        std::lock_guard lock(available_mutex_);
        available_totals_.clear();
    }
    for (const auto& entry : entries) {
        apply_entry(entry);
    }
    log_info("ledger", "rebuilt", {{"entries", entries.size()}});
}

void StockLedger::apply_entry(const events::JournalEntry& entry) {
    const auto& event = entry.event();
    if (helpers::holds<events::Transaction>(event)) {
        events::Transaction tx;
        if (!event.UnpackTo(&tx)) return;
        for (const auto& effect : effects_of(tx)) {
            auto& target = slot(effect.key.sku, effect.key.location);
            std::lock_guard lock(target.mutex);
            apply_effect_locked(target, effect, tx);
        }
        shift_available(tx.sku(), available_delta(tx));
    } else if (helpers::holds<events::StockReserved>(event)) {
        events::StockReserved e;
        if (!event.UnpackTo(&e)) return;
        auto& target = slot(e.sku(), e.location());
        std::lock_guard lock(target.mutex);
        apply_reservation_locked(target, e.quantity(), e.holder());
        shift_available(e.sku(), -e.quantity());
    } else if (helpers::holds<events::ReservationReleased>(event)) {
        events::ReservationReleased e;
        if (!event.UnpackTo(&e)) return;
        auto& target = slot(e.sku(), e.location());
        std::lock_guard lock(target.mutex);
        apply_reservation_locked(target, -e.quantity(), e.holder());
        shift_available(e.sku(), e.quantity());
    }
}

// ============================================================================
// Internals
// ============================================================================

std::vector<StockLedger::Effect> StockLedger::effects_of(const events::Transaction& tx) {
    const double q = tx.quantity();
    switch (tx.type()) {
        case events::RECEIVE:
        case events::RETURN:
            return {{{tx.sku(), tx.to_location()}, q, 0.0}};
        case events::TRANSFER:
            return {{{tx.sku(), tx.from_location()}, -q, 0.0}, {{tx.sku(), tx.to_location()}, q, 0.0}};
        case events::PICK:
            return {{{tx.sku(), tx.from_location()}, -q, -q}};
        case events::ADJUST:
            // Signed delta; a decrease is recorded against the source location.
            if (!tx.to_location().empty()) return {{{tx.sku(), tx.to_location()}, q, 0.0}};
            return {{{tx.sku(), tx.from_location()}, q, 0.0}};
        case events::SCRAP:
            return {{{tx.sku(), tx.from_location()}, -q, 0.0}};
        default:
            return {};
    }
}

double StockLedger::available_delta(const events::Transaction& tx) {
    switch (tx.type()) {
        case events::RECEIVE:
        case events::RETURN:
        case events::ADJUST:
            return tx.quantity();
        case events::SCRAP:
            return -tx.quantity();
        default:
            return 0.0;
    }
}

void StockLedger::apply_effect_locked(Slot& slot, const Effect& effect, const events::Transaction& tx) {
    auto& record = slot.record;
    record.quantity += effect.quantity;
    record.reserved += effect.reserved;
    record.version++;

    if (effect.reserved != 0.0 && !tx.pick_list_id().empty()) {
        auto it = slot.holders.find(tx.pick_list_id());
        if (it != slot.holders.end()) {
            it->second += effect.reserved;
            if (it->second <= EPSILON) slot.holders.erase(it);
        }
    }
    if (tx.type() == events::ADJUST) {
        record.last_count_at = tx.created_at().seconds();
    }
}

void StockLedger::apply_reservation_locked(Slot& slot, double quantity, const std::string& holder) {
    slot.record.reserved += quantity;
    slot.record.version++;

    double& held = slot.holders[holder];
    held += quantity;
    if (held <= EPSILON) slot.holders.erase(holder);
}

StockLedger::Slot& StockLedger::slot(const std::string& sku, const std::string& location) {
    StockKey key{sku, location};
    {
        std::shared_lock lock(index_mutex_);
        auto it = slots_.find(key);
        if (it != slots_.end()) return *it->second;
    }

    std::unique_lock lock(index_mutex_);
    auto& entry = slots_[key];
    if (!entry) {
        entry = std::make_unique<Slot>();
        entry->record.sku = sku;
        entry->record.location = location;
    }
    return *entry;
}

StockLedger::Slot* StockLedger::find_slot(const std::string& sku, const std::string& location) const {
    std::shared_lock lock(index_mutex_);
    auto it = slots_.find(StockKey{sku, location});
    return it == slots_.end() ? nullptr : it->second.get();
}

std::vector<StockLedger::Slot*> StockLedger::slots_for(const std::string* sku) const {
    // Slots are never removed, so the pointers outlive the index lock.
    std::shared_lock lock(index_mutex_);
    std::vector<Slot*> result;
    auto it = sku ? slots_.lower_bound(StockKey{*sku, ""}) : slots_.begin();
    for (; it != slots_.end(); ++it) {
        if (sku && it->first.sku != *sku) break;
        result.push_back(it->second.get());
    }
    return result;
}

StockLedger::ItemLock StockLedger::lock_item(const std::string& sku) {
    for (;;) {
        ItemLock held;
        held.slots = slots_for(&sku);
        for (Slot* s : held.slots) held.locks.emplace_back(s->mutex);
        if (slots_for(&sku).size() == held.slots.size()) return held;
    }
}

StockChange StockLedger::shift_available(const std::string& sku, double delta) {
    std::lock_guard lock(available_mutex_);
    double& total = available_totals_[sku];

    StockChange change;
    change.sku = sku;
    change.available_delta = delta;
    change.item_available_before = total;
    total += delta;
    change.item_available = total;
    return change;
}

void StockLedger::notify(const StockChange& change) {
    std::vector<StockObserver> observers;
    {
        std::lock_guard lock(observers_mutex_);
        observers = observers_;
    }
    for (const auto& observer : observers) {
        observer(change);
    }
}

} // namespace floorstock
