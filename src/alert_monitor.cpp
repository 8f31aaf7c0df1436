#include "floorstock/alert_monitor.hpp"
#include "floorstock/errors.hpp"
#include "floorstock/helpers.hpp"
#include "floorstock/logging.hpp"
#include <mutex>

namespace floorstock {

std::optional<events::Alert> AlertMonitor::on_stock_change(const StockChange& change) {
    auto item = catalog_.find(change.sku);
    if (!item || item->reorder_point() <= 0) return std::nullopt;

    const double threshold = item->reorder_point();
    const double after = change.item_available;
    const double before = change.item_available_before;

    events::AlertType type;
    if (before > 0 && after <= 0) {
        type = events::OUT_OF_STOCK;
    } else if (before >= threshold && after < threshold && after > 0) {
        type = events::LOW_STOCK;
    } else {
        return std::nullopt;
    }

    std::unique_lock lock(mutex_);
    for (const auto& [id, alert] : alerts_) {
        if (alert.sku() == change.sku && alert.type() == type && !alert.acknowledged()) {
            return std::nullopt;
        }
    }

    events::Alert alert;
    alert.set_id("ALERT-" + helpers::zero_pad(alerts_.size() + 1, 6));
    alert.set_sku(change.sku);
    alert.set_type(type);
    alert.set_threshold(threshold);
    alert.set_available_at_raise(after);
    *alert.mutable_created_at() = helpers::now();

    events::AlertRaised event;
    *event.mutable_alert() = alert;
    apply_locked(journal_.append(event).event());

    log_warn("alerts", "alert_raised", {
        {"alert_id", alert.id()},
        {"sku", alert.sku()},
        {"type", helpers::to_string(type)},
        {"available", after},
        {"reorder_point", threshold}
    });
    return alert;
}

StockObserver AlertMonitor::observer() {
    return [this](const StockChange& change) {
        // Runs after the stock change has committed.
        try {
            on_stock_change(change);
        } catch (const InventoryError& e) {
            log_error("alerts", "alert_evaluation_failed", {{"sku", change.sku}, {"error", e.what()}});
        }
    };
}

events::Alert AlertMonitor::acknowledge(const std::string& alert_id, const std::string& actor) {
    std::unique_lock lock(mutex_);
    auto it = alerts_.find(alert_id);
    if (it == alerts_.end()) throw InventoryError::not_found("Alert not found: " + alert_id);
    if (it->second.acknowledged()) {
        throw InventoryError::invalid_state("Alert " + alert_id + " was already acknowledged by " +
                                            it->second.acknowledged_by());
    }

    events::AlertAcknowledged event;
    event.set_alert_id(alert_id);
    event.set_actor(actor);
    *event.mutable_acknowledged_at() = helpers::now();
    apply_locked(journal_.append(event).event());

    log_info("alerts", "alert_acknowledged", {{"alert_id", alert_id}, {"actor", actor}});
    return it->second;
}

std::vector<events::Alert> AlertMonitor::list(std::optional<bool> acknowledged) const {
    std::shared_lock lock(mutex_);
    std::vector<events::Alert> result;
    for (const auto& [id, alert] : alerts_) {
        if (acknowledged && alert.acknowledged() != *acknowledged) continue;
        result.push_back(alert);
    }
    return result;
}

void AlertMonitor::apply_event(const google::protobuf::Any& event) {
    std::unique_lock lock(mutex_);
    apply_locked(event);
}

void AlertMonitor::apply_locked(const google::protobuf::Any& event) {
    if (helpers::holds<events::AlertRaised>(event)) {
        events::AlertRaised e;
        if (!event.UnpackTo(&e)) return;
        alerts_[e.alert().id()] = e.alert();
    } else if (helpers::holds<events::AlertAcknowledged>(event)) {
        events::AlertAcknowledged e;
        if (!event.UnpackTo(&e)) return;
        auto it = alerts_.find(e.alert_id());
        if (it == alerts_.end()) return;
        it->second.set_acknowledged(true);
        it->second.set_acknowledged_by(e.actor());
        *it->second.mutable_acknowledged_at() = e.acknowledged_at();
    }
}

} // namespace floorstock
