#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <google/protobuf/timestamp.pb.h>
#include "floorstock/catalog.hpp"
#include "floorstock/events.pb.h"
#include "floorstock/location_registry.hpp"
#include "floorstock/stock_ledger.hpp"

namespace floorstock {

struct LocationLevel {
    std::string location;
    std::string location_name;
    double quantity = 0.0;
    double reserved = 0.0;
    double available = 0.0;
};

struct ItemLevel {
    events::Item item;
    double total_quantity = 0.0;
    double total_value = 0.0;  // at average cost
    bool is_below_reorder = false;
    std::vector<LocationLevel> locations;
};

struct StockLevelsReport {
    google::protobuf::Timestamp generated_at;
    std::vector<ItemLevel> items;
};

struct ValuationTotals {
    double quantity = 0.0;
    double value = 0.0;
};

struct ValuationReport {
    google::protobuf::Timestamp generated_at;
    ValuationTotals total;
    std::map<std::string, ValuationTotals> by_category;
    std::map<std::string, ValuationTotals> by_location;
    std::vector<ItemLevel> items;
};

/**
 * Read-only stock reports over active items, valued at average cost.
 */
class Reports {
public:
    Reports(const Catalog& catalog, const LocationRegistry& locations, const StockLedger& ledger)
        : catalog_(catalog), locations_(locations), ledger_(ledger) {}

    /// Per-item levels, optionally narrowed to one location or category.
    StockLevelsReport stock_levels(const std::optional<std::string>& location = std::nullopt,
                                   std::optional<events::ItemCategory> category = std::nullopt) const;

    ValuationReport valuation() const;

private:
    ItemLevel level_of(const events::Item& item, const std::optional<std::string>& location) const;

    const Catalog& catalog_;
    const LocationRegistry& locations_;
    const StockLedger& ledger_;
};

} // namespace floorstock
