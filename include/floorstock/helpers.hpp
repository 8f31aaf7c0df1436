#pragma once

#include <string>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "floorstock/events.pb.h"

namespace floorstock {

/**
 * Helper functions shared by the inventory components.
 */
namespace helpers {

constexpr const char* TYPE_URL_PREFIX = "type.googleapis.com/";

/// Tolerance for comparing fractional quantities (lbs, feet, gallons).
constexpr double QUANTITY_EPSILON = 1e-9;

/**
 * Extract the type name from a type URL.
 */
inline std::string type_name_from_url(const std::string& type_url) {
    auto pos = type_url.rfind('/');
    return pos != std::string::npos ? type_url.substr(pos + 1) : type_url;
}

/**
 * Check if a type URL names the given fully qualified message type.
 * @param type_url Full type URL (e.g., "type.googleapis.com/floorstock.events.ItemCreated")
 * @param type_name Fully qualified type name (e.g., "floorstock.events.ItemCreated")
 */
inline bool type_url_matches(const std::string& type_url, const std::string& type_name) {
    return type_url == std::string(TYPE_URL_PREFIX) + type_name;
}

/**
 * Check whether an Any holds a message of type T.
 */
template<typename T>
bool holds(const google::protobuf::Any& any) {
    return type_url_matches(any.type_url(), T::descriptor()->full_name());
}

/**
 * Pack a protobuf message into an Any.
 */
template<typename T>
google::protobuf::Any pack_any(const T& message) {
    google::protobuf::Any any;
    any.PackFrom(message, TYPE_URL_PREFIX);
    return any;
}

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Current calendar year (UTC), used in pick list numbers.
 */
int current_year();

/**
 * Barcode printed for a serial number: dashes and spaces removed.
 */
std::string serial_barcode(const std::string& serial_number);

/**
 * Left-pad a number with zeros to the given width.
 */
std::string zero_pad(uint64_t value, int width);

// Lower-case names for the enumerations, as shown to floor staff.
std::string to_string(events::TransactionType type);
std::string to_string(events::SerialStatus status);
std::string to_string(events::PickListStatus status);
std::string to_string(events::PickItemStatus status);
std::string to_string(events::AlertType type);
std::string to_string(events::ItemCategory category);
std::string to_string(events::LocationType type);

} // namespace helpers
} // namespace floorstock
