#include "floorstock/location_registry.hpp"
#include "floorstock/errors.hpp"
#include "floorstock/helpers.hpp"
#include "floorstock/logging.hpp"
#include "floorstock/validation.hpp"
#include <mutex>

namespace floorstock {

namespace {

struct DefaultLocation {
    const char* code;
    const char* name;
    events::LocationType type;
};

constexpr DefaultLocation DEFAULT_LOCATIONS[] = {
    {"receiving", "Receiving", events::RECEIVING},
    {"powder_coat", "Powder Coat", events::PRODUCTION},
    {"polish", "Polish", events::PRODUCTION},
    {"finishing", "Finishing", events::PRODUCTION},
    {"assembly", "Assembly", events::PRODUCTION},
    {"steering_wheels", "Steering Wheels", events::PRODUCTION},
    {"wheel_caps", "Wheel Caps", events::PRODUCTION},
    {"shipping", "Shipping", events::SHIPPING},
    {"storage", "General Storage", events::STORAGE},
};

} // anonymous namespace

events::Location LocationRegistry::register_location(events::Location location) {
    validation::require_not_empty(location.code(), "code");
    validation::require_not_empty(location.name(), "name");
    if (location.type() == events::LOCATION_TYPE_UNSPECIFIED) location.set_type(events::PRODUCTION);
    location.set_is_active(true);

    std::unique_lock lock(mutex_);
    if (locations_.count(location.code()) > 0) {
        throw InventoryError(ErrorCode::DuplicateLocation, "Location already exists: " + location.code());
    }

    events::LocationRegistered event;
    *event.mutable_location() = location;
    apply_locked(journal_.append(event).event());

    log_info("catalog", "location_registered",
        {{"code", location.code()}, {"type", helpers::to_string(location.type())}});
    return location;
}

void LocationRegistry::deactivate(const std::string& code) {
    std::unique_lock lock(mutex_);
    auto it = locations_.find(code);
    if (it == locations_.end()) throw InventoryError::not_found("Location not found: " + code);
    if (!it->second.is_active()) return;

    events::LocationDeactivated event;
    event.set_code(code);
    apply_locked(journal_.append(event).event());
}

int LocationRegistry::seed_defaults() {
    int created = 0;
    for (const auto& def : DEFAULT_LOCATIONS) {
        if (find(def.code)) continue;
        events::Location location;
        location.set_code(def.code);
        location.set_name(def.name);
        location.set_description(std::string(def.name) + " Department");
        location.set_type(def.type);
        register_location(location);
        ++created;
    }
    return created;
}

std::optional<events::Location> LocationRegistry::find(const std::string& code) const {
    std::shared_lock lock(mutex_);
    auto it = locations_.find(code);
    if (it == locations_.end()) return std::nullopt;
    return it->second;
}

events::Location LocationRegistry::require_active(const std::string& code) const {
    auto location = find(code);
    if (!location) throw InventoryError::not_found("Location not found: " + code);
    if (!location->is_active()) throw InventoryError::not_found("Location is deactivated: " + code);
    return *location;
}

std::vector<events::Location> LocationRegistry::list(bool active_only) const {
    std::shared_lock lock(mutex_);
    std::vector<events::Location> result;
    for (const auto& [code, location] : locations_) {
        if (active_only && !location.is_active()) continue;
        result.push_back(location);
    }
    return result;
}

void LocationRegistry::apply_event(const google::protobuf::Any& event) {
    std::unique_lock lock(mutex_);
    apply_locked(event);
}

void LocationRegistry::apply_locked(const google::protobuf::Any& event) {
    if (helpers::holds<events::LocationRegistered>(event)) {
        events::LocationRegistered e;
        if (event.UnpackTo(&e)) locations_[e.location().code()] = e.location();
    } else if (helpers::holds<events::LocationDeactivated>(event)) {
        events::LocationDeactivated e;
        if (event.UnpackTo(&e)) {
            auto it = locations_.find(e.code());
            if (it != locations_.end()) it->second.set_is_active(false);
        }
    }
}

} // namespace floorstock
