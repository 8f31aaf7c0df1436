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
#include "floorstock/stock_ledger.hpp"

namespace floorstock {

/**
 * Raises low-stock and out-of-stock alerts from stock changes.
 *
 * Only a downward crossing raises an alert; recovering stock never clears
 * one. An alert stays open until acknowledged, and while it is open no
 * second alert of the same type is raised for the item.
 */
class AlertMonitor {
public:
    AlertMonitor(Journal& journal, const Catalog& catalog) : journal_(journal), catalog_(catalog) {}

    /// Evaluate one stock change; returns the alert raised, if any.
    std::optional<events::Alert> on_stock_change(const StockChange& change);

    /// Observer to register with the stock ledger.
    StockObserver observer();

    /// Throws NotFound for unknown ids, InvalidState if already acknowledged.
    events::Alert acknowledge(const std::string& alert_id, const std::string& actor);

    std::vector<events::Alert> list(std::optional<bool> acknowledged = std::nullopt) const;

    void apply_event(const google::protobuf::Any& event);

private:
    void apply_locked(const google::protobuf::Any& event);

    Journal& journal_;
    const Catalog& catalog_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, events::Alert> alerts_;
};

} // namespace floorstock
