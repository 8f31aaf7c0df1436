#include "floorstock/bom_engine.hpp"
#include "floorstock/errors.hpp"
#include "floorstock/helpers.hpp"
#include "floorstock/logging.hpp"
#include "floorstock/validation.hpp"
#include <mutex>

namespace floorstock {

events::BillOfMaterials BomEngine::create(events::BillOfMaterials draft) {
    validation::require_not_empty(draft.name(), "name");
    validation::require_not_empty(draft.product_type(), "product_type");
    validate_components(draft.components());

    std::unique_lock lock(mutex_);
    draft.set_id(next_id_locked());
    draft.set_version(1);
    draft.set_is_active(true);
    draft.set_locked(false);

    events::BomCreated event;
    *event.mutable_bom() = draft;
    apply_locked(journal_.append(event).event());

    log_info("bom", "bom_created", {
        {"bom_id", draft.id()},
        {"product_type", draft.product_type()},
        {"variant", draft.variant()},
        {"components", draft.components_size()}
    });
    return boms_.at(draft.id());
}

events::BillOfMaterials BomEngine::add_component(const std::string& bom_id, const events::BomComponent& component) {
    google::protobuf::RepeatedPtrField<events::BomComponent> added;
    *added.Add() = component;
    validate_components(added);

    std::unique_lock lock(mutex_);
    auto& bom = require_editable(bom_id);

    events::BomComponentsChanged event;
    event.set_bom_id(bom_id);
    *event.mutable_components() = bom.components();
    *event.add_components() = component;
    apply_locked(journal_.append(event).event());
    return bom;
}

events::BillOfMaterials BomEngine::remove_component(const std::string& bom_id, const std::string& sku) {
    std::unique_lock lock(mutex_);
    auto& bom = require_editable(bom_id);

    events::BomComponentsChanged event;
    event.set_bom_id(bom_id);
    bool removed = false;
    for (const auto& component : bom.components()) {
        if (component.sku() == sku) {
            removed = true;
            continue;
        }
        *event.add_components() = component;
    }
    if (!removed) {
        throw InventoryError::not_found("Component " + sku + " not in BOM " + bom_id);
    }
    apply_locked(journal_.append(event).event());
    return bom;
}

events::BillOfMaterials BomEngine::revise(const std::string& bom_id,
                                          const std::vector<events::BomComponent>& components) {
    google::protobuf::RepeatedPtrField<events::BomComponent> revised(components.begin(), components.end());
    validate_components(revised);

    std::unique_lock lock(mutex_);
    const auto previous = require_bom(bom_id);
    if (!previous.is_active()) {
        throw InventoryError::invalid_state("BOM " + bom_id + " is inactive");
    }

    events::BillOfMaterials next = previous;
    next.set_id(next_id_locked());
    next.set_version(previous.version() + 1);
    next.set_locked(false);
    *next.mutable_components() = revised;

    events::BomCreated created;
    *created.mutable_bom() = next;
    apply_locked(journal_.append(created).event());

    events::BomDeactivated retired;
    retired.set_bom_id(bom_id);
    apply_locked(journal_.append(retired).event());

    log_info("bom", "bom_revised", {{"from", bom_id}, {"to", next.id()}, {"version", next.version()}});
    return boms_.at(next.id());
}

void BomEngine::set_default(const std::string& bom_id) {
    std::unique_lock lock(mutex_);
    auto& bom = require_bom(bom_id);
    if (!bom.is_active()) {
        throw InventoryError::invalid_state("BOM " + bom_id + " is inactive");
    }
    if (bom.is_default()) return;

    events::BomDefaultSet event;
    event.set_bom_id(bom_id);
    apply_locked(journal_.append(event).event());
}

void BomEngine::deactivate(const std::string& bom_id) {
    std::unique_lock lock(mutex_);
    auto& bom = require_bom(bom_id);
    if (!bom.is_active()) return;

    events::BomDeactivated event;
    event.set_bom_id(bom_id);
    apply_locked(journal_.append(event).event());
    log_info("bom", "bom_deactivated", {{"bom_id", bom_id}});
}

events::BillOfMaterials BomEngine::get(const std::string& bom_id) const {
    std::shared_lock lock(mutex_);
    auto it = boms_.find(bom_id);
    if (it == boms_.end()) throw InventoryError::not_found("BOM not found: " + bom_id);
    return it->second;
}

std::vector<events::BillOfMaterials> BomEngine::list(const std::optional<std::string>& product_type) const {
    std::shared_lock lock(mutex_);
    std::vector<events::BillOfMaterials> result;
    for (const auto& [id, bom] : boms_) {
        if (product_type && bom.product_type() != *product_type) continue;
        result.push_back(bom);
    }
    return result;
}

events::BillOfMaterials BomEngine::resolve(const std::string& product_type, const std::string& variant) const {
    std::shared_lock lock(mutex_);

    auto find_default = [&](const std::string& wanted_variant) -> const events::BillOfMaterials* {
        for (const auto& [id, bom] : boms_) {
            if (bom.is_active() && bom.is_default() && bom.product_type() == product_type &&
                bom.variant() == wanted_variant) {
                return &bom;
            }
        }
        return nullptr;
    };

    if (!variant.empty()) {
        if (const auto* bom = find_default(variant)) return *bom;
    }
    if (const auto* bom = find_default("")) return *bom;

    throw InventoryError::no_bom_found(
        "No BOM found for product type: " + product_type + (variant.empty() ? "" : " / " + variant));
}

std::vector<Requirement> BomEngine::expand(const std::string& bom_id, double order_quantity) const {
    return expand(get(bom_id), order_quantity);
}

std::vector<Requirement> BomEngine::expand(const events::BillOfMaterials& bom, double order_quantity) {
    validation::require_positive(order_quantity, "order_quantity");

    std::vector<Requirement> result;
    std::map<std::string, size_t> positions;
    for (const auto& component : bom.components()) {
        double quantity = component.quantity() * order_quantity;
        auto it = positions.find(component.sku());
        if (it != positions.end()) {
            auto& merged = result[it->second];
            merged.quantity += quantity;
            // A SKU listed once as required stays required.
            merged.optional = merged.optional && component.is_optional();
            continue;
        }
        positions[component.sku()] = result.size();
        result.push_back({component.sku(), quantity, component.is_optional()});
    }
    return result;
}

void BomEngine::apply_event(const google::protobuf::Any& event) {
    std::unique_lock lock(mutex_);
    apply_locked(event);
}

void BomEngine::validate_components(
    const google::protobuf::RepeatedPtrField<events::BomComponent>& components) const {
    for (const auto& component : components) {
        validation::require_not_empty(component.sku(), "component sku");
        validation::require_positive(component.quantity(), "component quantity");
        if (!catalog_.find(component.sku())) {
            throw InventoryError::not_found("Item not found: " + component.sku());
        }
    }
}

events::BillOfMaterials& BomEngine::require_bom(const std::string& bom_id) {
    auto it = boms_.find(bom_id);
    if (it == boms_.end()) throw InventoryError::not_found("BOM not found: " + bom_id);
    return it->second;
}

events::BillOfMaterials& BomEngine::require_editable(const std::string& bom_id) {
    auto& bom = require_bom(bom_id);
    if (bom.locked()) {
        throw InventoryError::invalid_state(
            "BOM " + bom_id + " is used by a completed pick list; create a revision instead");
    }
    return bom;
}

std::string BomEngine::next_id_locked() const {
    return "BOM-" + helpers::zero_pad(boms_.size() + 1, 5);
}

void BomEngine::apply_locked(const google::protobuf::Any& event) {
    // Giving a BOM the default flag takes it from every other BOM of the same product.
    auto claim_default = [this](const events::BillOfMaterials& owner) {
        for (auto& [id, bom] : boms_) {
            if (id != owner.id() && bom.product_type() == owner.product_type() &&
                bom.variant() == owner.variant()) {
                bom.set_is_default(false);
            }
        }
    };

    if (helpers::holds<events::BomCreated>(event)) {
        events::BomCreated e;
        if (!event.UnpackTo(&e)) return;
        auto& bom = boms_[e.bom().id()];
        bom = e.bom();
        if (bom.is_default()) claim_default(bom);
    } else if (helpers::holds<events::BomComponentsChanged>(event)) {
        events::BomComponentsChanged e;
        if (!event.UnpackTo(&e)) return;
        auto it = boms_.find(e.bom_id());
        if (it == boms_.end()) return;
        *it->second.mutable_components() = e.components();
    } else if (helpers::holds<events::BomDefaultSet>(event)) {
        events::BomDefaultSet e;
        if (!event.UnpackTo(&e)) return;
        auto it = boms_.find(e.bom_id());
        if (it == boms_.end()) return;
        it->second.set_is_default(true);
        claim_default(it->second);
    } else if (helpers::holds<events::BomDeactivated>(event)) {
        events::BomDeactivated e;
        if (!event.UnpackTo(&e)) return;
        auto it = boms_.find(e.bom_id());
        if (it == boms_.end()) return;
        it->second.set_is_active(false);
        it->second.set_is_default(false);
    } else if (helpers::holds<events::PickListCompleted>(event)) {
        events::PickListCompleted e;
        if (!event.UnpackTo(&e)) return;
        auto it = boms_.find(e.bom_id());
        if (it == boms_.end()) return;
        it->second.set_locked(true);
    }
}

} // namespace floorstock
