#include "floorstock/reports.hpp"
#include "floorstock/helpers.hpp"

namespace floorstock {

StockLevelsReport Reports::stock_levels(const std::optional<std::string>& location,
                                        std::optional<events::ItemCategory> category) const {
    StockLevelsReport report;
    report.generated_at = helpers::now();
    for (const auto& item : catalog_.list(true)) {
        if (category && item.category() != *category) continue;
        report.items.push_back(level_of(item, location));
    }
    return report;
}

ValuationReport Reports::valuation() const {
    ValuationReport report;
    report.generated_at = helpers::now();

    for (const auto& item : catalog_.list(true)) {
        auto level = level_of(item, std::nullopt);
        report.total.quantity += level.total_quantity;
        report.total.value += level.total_value;

        auto& by_category = report.by_category[helpers::to_string(item.category())];
        by_category.quantity += level.total_quantity;
        by_category.value += level.total_value;

        for (const auto& at : level.locations) {
            auto& by_location = report.by_location[at.location];
            by_location.quantity += at.quantity;
            by_location.value += at.quantity * item.average_cost();
        }
        report.items.push_back(std::move(level));
    }
    return report;
}

ItemLevel Reports::level_of(const events::Item& item, const std::optional<std::string>& location) const {
    ItemLevel level;
    level.item = item;
    for (const auto& record : ledger_.stock_for_item(item.sku())) {
        if (location && record.location != *location) continue;

        LocationLevel at;
        at.location = record.location;
        auto registered = locations_.find(record.location);
        at.location_name = registered ? registered->name() : record.location;
        at.quantity = record.quantity;
        at.reserved = record.reserved;
        at.available = record.available();
        level.total_quantity += record.quantity;
        level.locations.push_back(std::move(at));
    }
    level.total_value = level.total_quantity * item.average_cost();
    level.is_below_reorder = item.reorder_point() > 0 && level.total_quantity <= item.reorder_point();
    return level;
}

} // namespace floorstock
