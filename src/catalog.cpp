#include "floorstock/catalog.hpp"
#include "floorstock/errors.hpp"
#include "floorstock/helpers.hpp"
#include "floorstock/logging.hpp"
#include "floorstock/validation.hpp"
#include <mutex>

namespace floorstock {

events::Item Catalog::create_item(events::Item item) {
    validation::require_not_empty(item.sku(), "sku");
    validation::require_not_empty(item.name(), "name");
    validation::require_non_negative(item.average_cost(), "average_cost");
    validation::require_non_negative(item.reorder_point(), "reorder_point");
    validation::require_non_negative(item.reorder_quantity(), "reorder_quantity");

    if (item.category() == events::ITEM_CATEGORY_UNSPECIFIED) item.set_category(events::COMPONENT);
    if (item.unit_of_measure() == events::UNIT_OF_MEASURE_UNSPECIFIED) item.set_unit_of_measure(events::EACH);
    if (item.barcode().empty()) item.set_barcode(item.sku());
    item.set_is_active(true);

    std::unique_lock lock(mutex_);
    if (items_.count(item.sku()) > 0) {
        throw InventoryError(ErrorCode::DuplicateSku, "SKU already exists: " + item.sku());
    }

    events::ItemCreated event;
    *event.mutable_item() = item;
    apply_locked(journal_.append(event).event());

    log_info("catalog", "item_created", {{"sku", item.sku()}, {"name", item.name()}});
    return item;
}

events::Item Catalog::update_item(const std::string& sku, const ItemUpdate& update) {
    std::unique_lock lock(mutex_);
    auto it = items_.find(sku);
    if (it == items_.end()) throw InventoryError::not_found("Item not found: " + sku);

    events::Item item = it->second;
    if (update.name) {
        validation::require_not_empty(*update.name, "name");
        item.set_name(*update.name);
    }
    if (update.description) item.set_description(*update.description);
    if (update.category) item.set_category(*update.category);
    if (update.unit_of_measure) item.set_unit_of_measure(*update.unit_of_measure);
    if (update.track_individually) item.set_track_individually(*update.track_individually);
    if (update.default_location) item.set_default_location(*update.default_location);
    if (update.reorder_point) {
        validation::require_non_negative(*update.reorder_point, "reorder_point");
        item.set_reorder_point(*update.reorder_point);
    }
    if (update.reorder_quantity) {
        validation::require_non_negative(*update.reorder_quantity, "reorder_quantity");
        item.set_reorder_quantity(*update.reorder_quantity);
    }
    if (update.barcode) item.set_barcode(update.barcode->empty() ? sku : *update.barcode);

    events::ItemUpdated event;
    *event.mutable_item() = item;
    apply_locked(journal_.append(event).event());
    return items_.at(sku);
}

void Catalog::deactivate_item(const std::string& sku) {
    std::unique_lock lock(mutex_);
    auto it = items_.find(sku);
    if (it == items_.end()) throw InventoryError::not_found("Item not found: " + sku);
    if (!it->second.is_active()) return;

    events::ItemDeactivated event;
    event.set_sku(sku);
    apply_locked(journal_.append(event).event());
    log_info("catalog", "item_deactivated", {{"sku", sku}});
}

std::optional<events::Item> Catalog::find(const std::string& sku) const {
    std::shared_lock lock(mutex_);
    auto it = items_.find(sku);
    if (it == items_.end()) return std::nullopt;
    return it->second;
}

std::optional<events::Item> Catalog::find_by_barcode(const std::string& barcode) const {
    std::shared_lock lock(mutex_);
    auto it = items_.find(barcode);
    if (it != items_.end()) return it->second;
    for (const auto& [sku, item] : items_) {
        if (item.barcode() == barcode) return item;
    }
    return std::nullopt;
}

events::Item Catalog::get(const std::string& sku) const {
    auto item = find(sku);
    if (!item) throw InventoryError::not_found("Item not found: " + sku);
    return *item;
}

events::Item Catalog::require_active(const std::string& sku) const {
    auto item = get(sku);
    if (!item.is_active()) throw InventoryError::not_found("Item is deactivated: " + sku);
    return item;
}

std::vector<events::Item> Catalog::list(bool active_only) const {
    std::shared_lock lock(mutex_);
    std::vector<events::Item> result;
    for (const auto& [sku, item] : items_) {
        if (active_only && !item.is_active()) continue;
        result.push_back(item);
    }
    return result;
}

void Catalog::apply_event(const google::protobuf::Any& event) {
    std::unique_lock lock(mutex_);
    apply_locked(event);
}

void Catalog::apply_transaction(const events::Transaction& tx) {
    if (tx.type() != events::RECEIVE) return;
    std::unique_lock lock(mutex_);
    auto it = items_.find(tx.sku());
    if (it != items_.end()) {
        it->second.set_average_cost(tx.new_average_cost());
    }
}

void Catalog::apply_locked(const google::protobuf::Any& event) {
    if (helpers::holds<events::ItemCreated>(event)) {
        events::ItemCreated e;
        if (event.UnpackTo(&e)) items_[e.item().sku()] = e.item();
    } else if (helpers::holds<events::ItemUpdated>(event)) {
        events::ItemUpdated e;
        if (event.UnpackTo(&e)) {
            auto it = items_.find(e.item().sku());
            if (it == items_.end()) return;
            // Average cost belongs to the receive transactions.
            double average_cost = it->second.average_cost();
            it->second = e.item();
            it->second.set_average_cost(average_cost);
        }
    } else if (helpers::holds<events::ItemDeactivated>(event)) {
        events::ItemDeactivated e;
        if (event.UnpackTo(&e)) {
            auto it = items_.find(e.sku());
            if (it != items_.end()) it->second.set_is_active(false);
        }
    }
}

} // namespace floorstock
