#include "floorstock/helpers.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace floorstock {
namespace helpers {

google::protobuf::Timestamp now() {
    auto time_point = std::chrono::system_clock::now();
    auto duration = time_point.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

int current_year() {
    auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    return tm.tm_year + 1900;
}

std::string serial_barcode(const std::string& serial_number) {
    std::string barcode;
    barcode.reserve(serial_number.size());
    for (char c : serial_number) {
        if (c != '-' && c != ' ') barcode.push_back(c);
    }
    return barcode;
}

std::string zero_pad(uint64_t value, int width) {
    std::ostringstream ss;
    ss << std::setw(width) << std::setfill('0') << value;
    return ss.str();
}

std::string to_string(events::TransactionType type) {
    switch (type) {
        case events::RECEIVE: return "receive";
        case events::TRANSFER: return "transfer";
        case events::PICK: return "pick";
        case events::ADJUST: return "adjust";
        case events::RETURN: return "return";
        case events::SCRAP: return "scrap";
        default: return "unspecified";
    }
}

std::string to_string(events::SerialStatus status) {
    switch (status) {
        case events::IN_STOCK: return "in_stock";
        case events::RESERVED: return "reserved";
        case events::IN_USE: return "in_use";
        case events::SHIPPED: return "shipped";
        case events::SCRAPPED: return "scrapped";
        default: return "unspecified";
    }
}

std::string to_string(events::PickListStatus status) {
    switch (status) {
        case events::PICK_LIST_PENDING: return "pending";
        case events::PICK_LIST_IN_PROGRESS: return "in_progress";
        case events::PICK_LIST_COMPLETED: return "completed";
        case events::PICK_LIST_CANCELLED: return "cancelled";
        default: return "unspecified";
    }
}

std::string to_string(events::PickItemStatus status) {
    switch (status) {
        case events::PICK_ITEM_PENDING: return "pending";
        case events::PICK_ITEM_PICKED: return "picked";
        case events::PICK_ITEM_SHORT: return "short";
        case events::PICK_ITEM_SKIPPED: return "skipped";
        default: return "unspecified";
    }
}

std::string to_string(events::AlertType type) {
    switch (type) {
        case events::LOW_STOCK: return "low_stock";
        case events::OUT_OF_STOCK: return "out_of_stock";
        default: return "unspecified";
    }
}

std::string to_string(events::ItemCategory category) {
    switch (category) {
        case events::COMPONENT: return "component";
        case events::CONSUMABLE: return "consumable";
        case events::FINISHED_GOOD: return "finished_good";
        default: return "unspecified";
    }
}

std::string to_string(events::LocationType type) {
    switch (type) {
        case events::PRODUCTION: return "production";
        case events::STORAGE: return "storage";
        case events::SHIPPING: return "shipping";
        case events::RECEIVING: return "receiving";
        default: return "unspecified";
    }
}

} // namespace helpers
} // namespace floorstock
