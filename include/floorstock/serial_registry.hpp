#pragma once

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "floorstock/events.pb.h"
#include "floorstock/journal.hpp"

namespace floorstock {

/// One individually tracked unit.
struct SerialUnit {
    std::string serial_number;
    std::string barcode;
    std::string sku;
    std::string location;
    events::SerialStatus status = events::IN_STOCK;
    std::string order_id;
    double cost = 0.0;
    google::protobuf::Timestamp received_at;

    bool is_available() const { return status == events::IN_STOCK; }
};

/// Appends a movement to the transaction log and returns it as committed.
using MovementAppender = std::function<events::Transaction(events::Transaction)>;

/**
 * Registry of individually tracked units.
 *
 * Allowed status edges:
 *   in_stock -> reserved | in_use | scrapped
 *   reserved -> in_stock | in_use
 *   in_use   -> shipped | scrapped
 * shipped and scrapped are terminal.
 */
class SerialRegistry {
public:
    explicit SerialRegistry(Journal& journal) : journal_(journal) {}

    static bool can_transition(events::SerialStatus from, events::SerialStatus to);

    /// Throws DuplicateSerial if the serial exists for any item.
    SerialUnit register_unit(const std::string& sku, const std::string& serial_number,
                             const std::string& location, double cost);

    /// Throws InvalidTransition for edges outside the table. `order_id` is
    /// required when moving to reserved.
    SerialUnit transition(const std::string& serial_number, events::SerialStatus status,
                          const std::string& order_id = "");

    SerialUnit reserve_for_order(const std::string& serial_number, const std::string& order_id);
    SerialUnit release(const std::string& serial_number);

    std::optional<SerialUnit> find(const std::string& serial_number) const;
    std::optional<SerialUnit> find_by_barcode(const std::string& barcode) const;
    SerialUnit get(const std::string& serial_number) const;

    std::vector<SerialUnit> units_for_item(const std::string& sku,
                                           const std::optional<std::string>& location = std::nullopt,
                                           std::optional<events::SerialStatus> status = std::nullopt) const;

    /// Every unit currently in `status`, across all items.
    std::vector<SerialUnit> units_in_status(events::SerialStatus status) const;

    /**
     * Check that every unit named by a stock movement can take part in it.
     * Claims nothing; commit_movement repeats the check under its lock.
     */
    void validate_movement(const events::Transaction& tx) const;

    /**
     * Validate the units of a movement, append it through `append` and apply
     * its unit-level effect without releasing the registry lock in between,
     * so two movements can never claim the same unit.
     */
    events::Transaction commit_movement(events::Transaction tx, const MovementAppender& append);

    /// Apply the unit-level effect of a committed movement.
    void apply_transaction(const events::Transaction& tx);

    void apply_event(const google::protobuf::Any& event);

private:
    SerialUnit transition_locked(SerialUnit& unit, events::SerialStatus status, const std::string& order_id);
    const SerialUnit& require_unit_locked(const std::string& serial_number, const std::string& sku) const;
    void apply_locked(const google::protobuf::Any& event);
    void validate_locked(const events::Transaction& tx) const;
    void apply_transaction_locked(const events::Transaction& tx);

    Journal& journal_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, SerialUnit> units_;
    std::unordered_map<std::string, std::string> by_barcode_;
};

} // namespace floorstock
