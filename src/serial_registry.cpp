#include "floorstock/serial_registry.hpp"
#include "floorstock/errors.hpp"
#include "floorstock/helpers.hpp"
#include "floorstock/logging.hpp"
#include "floorstock/validation.hpp"
#include <mutex>
#include <set>

namespace floorstock {

bool SerialRegistry::can_transition(events::SerialStatus from, events::SerialStatus to) {
    switch (from) {
        case events::IN_STOCK:
            return to == events::RESERVED || to == events::IN_USE || to == events::SCRAPPED;
        case events::RESERVED:
            return to == events::IN_STOCK || to == events::IN_USE;
        case events::IN_USE:
            return to == events::SHIPPED || to == events::SCRAPPED;
        default:
            return false;
    }
}

SerialUnit SerialRegistry::register_unit(const std::string& sku, const std::string& serial_number,
                                         const std::string& location, double cost) {
    validation::require_not_empty(sku, "sku");
    validation::require_not_empty(serial_number, "serial_number");
    validation::require_not_empty(location, "location");
    validation::require_non_negative(cost, "cost");

    std::unique_lock lock(mutex_);
    if (units_.count(serial_number) > 0) {
        throw InventoryError::duplicate_serial("Serial already registered: " + serial_number);
    }

    events::SerialRegistered event;
    event.set_serial_number(serial_number);
    event.set_sku(sku);
    event.set_location(location);
    event.set_cost(cost);
    *event.mutable_received_at() = helpers::now();
    apply_locked(journal_.append(event).event());

    log_info("serials", "unit_registered", {{"serial", serial_number}, {"sku", sku}, {"location", location}});
    return units_.at(serial_number);
}

SerialUnit SerialRegistry::transition(const std::string& serial_number, events::SerialStatus status,
                                      const std::string& order_id) {
    std::unique_lock lock(mutex_);
    auto it = units_.find(serial_number);
    if (it == units_.end()) throw InventoryError::not_found("Serial not found: " + serial_number);
    return transition_locked(it->second, status, order_id);
}

SerialUnit SerialRegistry::reserve_for_order(const std::string& serial_number, const std::string& order_id) {
    validation::require_not_empty(order_id, "order_id");
    return transition(serial_number, events::RESERVED, order_id);
}

SerialUnit SerialRegistry::release(const std::string& serial_number) {
    return transition(serial_number, events::IN_STOCK);
}

SerialUnit SerialRegistry::transition_locked(SerialUnit& unit, events::SerialStatus status,
                                             const std::string& order_id) {
    if (!can_transition(unit.status, status)) {
        throw InventoryError::invalid_transition(
            "Serial " + unit.serial_number + " cannot move from " +
            helpers::to_string(unit.status) + " to " + helpers::to_string(status));
    }
    if (status == events::RESERVED && order_id.empty()) {
        throw InventoryError::invalid_argument("Reserving a serial requires an order id");
    }

    events::SerialTransitioned event;
    event.set_serial_number(unit.serial_number);
    event.set_status(status);
    // Releasing back to stock clears the order link; other edges keep it.
    if (status == events::RESERVED || status == events::IN_USE) {
        event.set_order_id(order_id.empty() ? unit.order_id : order_id);
    } else if (status != events::IN_STOCK) {
        event.set_order_id(unit.order_id);
    }
    apply_locked(journal_.append(event).event());
    return unit;
}

std::optional<SerialUnit> SerialRegistry::find(const std::string& serial_number) const {
    std::shared_lock lock(mutex_);
    auto it = units_.find(serial_number);
    if (it == units_.end()) return std::nullopt;
    return it->second;
}

std::optional<SerialUnit> SerialRegistry::find_by_barcode(const std::string& barcode) const {
    std::shared_lock lock(mutex_);
    auto it = by_barcode_.find(barcode);
    if (it == by_barcode_.end()) return std::nullopt;
    return units_.at(it->second);
}

SerialUnit SerialRegistry::get(const std::string& serial_number) const {
    auto unit = find(serial_number);
    if (!unit) throw InventoryError::not_found("Serial not found: " + serial_number);
    return *unit;
}

std::vector<SerialUnit> SerialRegistry::units_for_item(const std::string& sku,
                                                       const std::optional<std::string>& location,
                                                       std::optional<events::SerialStatus> status) const {
    std::shared_lock lock(mutex_);
    std::vector<SerialUnit> result;
    for (const auto& [serial, unit] : units_) {
        if (unit.sku != sku) continue;
        if (location && unit.location != *location) continue;
        if (status && unit.status != *status) continue;
        result.push_back(unit);
    }
    return result;
}

std::vector<SerialUnit> SerialRegistry::units_in_status(events::SerialStatus status) const {
    std::shared_lock lock(mutex_);
    std::vector<SerialUnit> result;
    for (const auto& [serial, unit] : units_) {
        if (unit.status == status) result.push_back(unit);
    }
    return result;
}

const SerialUnit& SerialRegistry::require_unit_locked(const std::string& serial_number,
                                                      const std::string& sku) const {
    auto it = units_.find(serial_number);
    if (it == units_.end()) throw InventoryError::not_found("Serial not found: " + serial_number);
    if (it->second.sku != sku) {
        throw InventoryError::invalid_argument("Serial " + serial_number + " belongs to " + it->second.sku);
    }
    return it->second;
}

void SerialRegistry::validate_movement(const events::Transaction& tx) const {
    if (tx.serial_numbers().empty()) return;
    std::shared_lock lock(mutex_);
    validate_locked(tx);
}

events::Transaction SerialRegistry::commit_movement(events::Transaction tx, const MovementAppender& append) {
    if (tx.serial_numbers().empty()) return append(std::move(tx));

    std::unique_lock lock(mutex_);
    validate_locked(tx);
    auto committed = append(std::move(tx));
    apply_transaction_locked(committed);
    return committed;
}

void SerialRegistry::validate_locked(const events::Transaction& tx) const {
    std::set<std::string> seen;
    for (const auto& serial : tx.serial_numbers()) {
        if (!seen.insert(serial).second) {
            throw InventoryError::duplicate_serial("Serial listed twice: " + serial);
        }
    }

    for (const auto& serial : tx.serial_numbers()) {
        switch (tx.type()) {
            case events::RECEIVE:
                if (units_.count(serial) > 0) {
                    throw InventoryError::duplicate_serial("Serial already registered: " + serial);
                }
                break;
            case events::TRANSFER: {
                const auto& unit = require_unit_locked(serial, tx.sku());
                if (unit.location != tx.from_location()) {
                    throw InventoryError::invalid_argument("Serial " + serial + " is not at " + tx.from_location());
                }
                if (unit.status != events::IN_STOCK) {
                    throw InventoryError::invalid_transition(
                        "Serial " + serial + " is " + helpers::to_string(unit.status) + " and cannot be transferred");
                }
                break;
            }
            case events::PICK: {
                const auto& unit = require_unit_locked(serial, tx.sku());
                if (unit.location != tx.from_location()) {
                    throw InventoryError::invalid_argument("Serial " + serial + " is not at " + tx.from_location());
                }
                if (!can_transition(unit.status, events::IN_USE)) {
                    throw InventoryError::invalid_transition(
                        "Serial " + serial + " is " + helpers::to_string(unit.status) + " and cannot be picked");
                }
                if (unit.status == events::RESERVED && unit.order_id != tx.order_id()) {
                    throw InventoryError::invalid_transition(
                        "Serial " + serial + " is reserved for order " + unit.order_id);
                }
                break;
            }
            case events::RETURN: {
                // No status may re-enter stock through a return: in_stock and
                // reserved units are still on hand, in_use only moves on to
                // shipped or scrapped, and shipped and scrapped are terminal.
                const auto& unit = require_unit_locked(serial, tx.sku());
                if (unit.status == events::IN_STOCK || unit.status == events::RESERVED) {
                    throw InventoryError::invalid_transition(
                        "Serial " + serial + " is " + helpers::to_string(unit.status) + " and already on hand");
                }
                throw InventoryError::invalid_transition(
                    "Serial " + serial + " is " + helpers::to_string(unit.status) + " and cannot be returned");
            }
            case events::SCRAP: {
                const auto& unit = require_unit_locked(serial, tx.sku());
                if (unit.location != tx.from_location()) {
                    throw InventoryError::invalid_argument("Serial " + serial + " is not at " + tx.from_location());
                }
                if (!can_transition(unit.status, events::SCRAPPED)) {
                    throw InventoryError::invalid_transition(
                        "Serial " + serial + " is " + helpers::to_string(unit.status) + " and cannot be scrapped");
                }
                break;
            }
            default:
                throw InventoryError::invalid_argument(
                    helpers::to_string(tx.type()) + " transactions do not carry serial numbers");
        }
    }
}

void SerialRegistry::apply_transaction(const events::Transaction& tx) {
    if (tx.serial_numbers().empty()) return;
    std::unique_lock lock(mutex_);
    apply_transaction_locked(tx);
}

void SerialRegistry::apply_transaction_locked(const events::Transaction& tx) {
    for (const auto& serial : tx.serial_numbers()) {
        if (tx.type() == events::RECEIVE) {
            SerialUnit unit;
            unit.serial_number = serial;
            unit.barcode = helpers::serial_barcode(serial);
            unit.sku = tx.sku();
            unit.location = tx.to_location();
            unit.cost = tx.unit_cost();
            unit.received_at = tx.created_at();
            by_barcode_[unit.barcode] = serial;
            units_[serial] = std::move(unit);
            continue;
        }

        auto it = units_.find(serial);
        if (it == units_.end()) continue;
        auto& unit = it->second;
        switch (tx.type()) {
            case events::TRANSFER:
                unit.location = tx.to_location();
                break;
            case events::PICK:
                unit.status = events::IN_USE;
                unit.order_id = tx.order_id();
                break;
            case events::SCRAP:
                unit.status = events::SCRAPPED;
                break;
            default:
                break;
        }
    }
}

void SerialRegistry::apply_event(const google::protobuf::Any& event) {
    std::unique_lock lock(mutex_);
    apply_locked(event);
}

void SerialRegistry::apply_locked(const google::protobuf::Any& event) {
    if (helpers::holds<events::SerialRegistered>(event)) {
        events::SerialRegistered e;
        if (!event.UnpackTo(&e)) return;
        SerialUnit unit;
        unit.serial_number = e.serial_number();
        unit.barcode = helpers::serial_barcode(e.serial_number());
        unit.sku = e.sku();
        unit.location = e.location();
        unit.cost = e.cost();
        unit.received_at = e.received_at();
        by_barcode_[unit.barcode] = unit.serial_number;
        units_[unit.serial_number] = std::move(unit);
    } else if (helpers::holds<events::SerialTransitioned>(event)) {
        events::SerialTransitioned e;
        if (!event.UnpackTo(&e)) return;
        auto it = units_.find(e.serial_number());
        if (it == units_.end()) return;
        it->second.status = e.status();
        it->second.order_id = e.order_id();
    }
}

} // namespace floorstock
