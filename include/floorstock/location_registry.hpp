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

/**
 * Registry of the physical and logical locations (departments) stock can sit in.
 *
 * Locations are deactivated, never deleted: transactions reference them forever.
 */
class LocationRegistry {
public:
    explicit LocationRegistry(Journal& journal) : journal_(journal) {}

    events::Location register_location(events::Location location);
    void deactivate(const std::string& code);

    /// Registers the default shop-floor departments; returns how many were new.
    int seed_defaults();

    std::optional<events::Location> find(const std::string& code) const;

    /// Throws NotFound for unknown or deactivated codes.
    events::Location require_active(const std::string& code) const;

    std::vector<events::Location> list(bool active_only = true) const;

    void apply_event(const google::protobuf::Any& event);

private:
    void apply_locked(const google::protobuf::Any& event);

    Journal& journal_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, events::Location> locations_;
};

} // namespace floorstock
