#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "floorstock/events.pb.h"
#include "floorstock/journal.hpp"

namespace floorstock {

/// Partial update of an item; unset fields are left alone. The SKU never changes.
struct ItemUpdate {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<events::ItemCategory> category;
    std::optional<events::UnitOfMeasure> unit_of_measure;
    std::optional<bool> track_individually;
    std::optional<std::string> default_location;
    std::optional<double> reorder_point;
    std::optional<double> reorder_quantity;
    std::optional<std::string> barcode;
};

/**
 * Item catalog.
 *
 * Items are soft-deactivated, never removed, so ledger entries keep a valid
 * reference. Average cost is only changed by receive transactions.
 */
class Catalog {
public:
    explicit Catalog(Journal& journal) : journal_(journal) {}

    events::Item create_item(events::Item item);
    events::Item update_item(const std::string& sku, const ItemUpdate& update);
    void deactivate_item(const std::string& sku);

    std::optional<events::Item> find(const std::string& sku) const;
    std::optional<events::Item> find_by_barcode(const std::string& barcode) const;

    /// Throws NotFound for unknown SKUs.
    events::Item get(const std::string& sku) const;

    /// Throws NotFound for unknown or deactivated SKUs.
    events::Item require_active(const std::string& sku) const;

    std::vector<events::Item> list(bool active_only = true) const;

    void apply_event(const google::protobuf::Any& event);
    void apply_transaction(const events::Transaction& tx);

private:
    void apply_locked(const google::protobuf::Any& event);

    Journal& journal_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, events::Item> items_;
};

} // namespace floorstock
