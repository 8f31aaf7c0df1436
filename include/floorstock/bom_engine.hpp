#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "floorstock/catalog.hpp"
#include "floorstock/events.pb.h"
#include "floorstock/journal.hpp"

namespace floorstock {

/// One line of an expanded BOM: total quantity of an item for an order.
struct Requirement {
    std::string sku;
    double quantity = 0.0;
    bool optional = false;
};

/**
 * Bills of materials: which components, and how many of each, make one unit
 * of a product.
 *
 * At most one active BOM is the default for a (product type, variant) pair.
 * A BOM referenced by a completed pick list is locked; its components can no
 * longer change, so changes go into a new version via revise().
 */
class BomEngine {
public:
    BomEngine(Journal& journal, const Catalog& catalog) : journal_(journal), catalog_(catalog) {}

    /// Creates a BOM from `draft`. The id, version and flags are assigned here.
    events::BillOfMaterials create(events::BillOfMaterials draft);

    events::BillOfMaterials add_component(const std::string& bom_id, const events::BomComponent& component);
    events::BillOfMaterials remove_component(const std::string& bom_id, const std::string& sku);

    /**
     * Replace the component list by creating a new version with a new id.
     * The previous version is deactivated and hands over its default flag.
     */
    events::BillOfMaterials revise(const std::string& bom_id, const std::vector<events::BomComponent>& components);

    void set_default(const std::string& bom_id);
    void deactivate(const std::string& bom_id);

    /// Throws NotFound.
    events::BillOfMaterials get(const std::string& bom_id) const;
    std::vector<events::BillOfMaterials> list(const std::optional<std::string>& product_type = std::nullopt) const;

    /**
     * Default active BOM for a product. Searches in priority order:
     *   1. default for (product_type, variant)
     *   2. default for (product_type, "")  (type-generic)
     * Throws NoBomFound if neither exists.
     */
    events::BillOfMaterials resolve(const std::string& product_type, const std::string& variant) const;

    /// Multiply every component by `order_quantity`; duplicate SKUs are merged.
    std::vector<Requirement> expand(const std::string& bom_id, double order_quantity) const;
    static std::vector<Requirement> expand(const events::BillOfMaterials& bom, double order_quantity);

    void apply_event(const google::protobuf::Any& event);

private:
    void validate_components(const google::protobuf::RepeatedPtrField<events::BomComponent>& components) const;
    events::BillOfMaterials& require_bom(const std::string& bom_id);
    events::BillOfMaterials& require_editable(const std::string& bom_id);
    std::string next_id_locked() const;
    void apply_locked(const google::protobuf::Any& event);

    Journal& journal_;
    const Catalog& catalog_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, events::BillOfMaterials> boms_;
};

} // namespace floorstock
