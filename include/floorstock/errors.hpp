#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/support/status_code_enum.h>

namespace floorstock {

/**
 * Error taxonomy for inventory operations.
 */
enum class ErrorCode {
    InvalidArgument,
    NotFound,
    DuplicateSku,
    DuplicateLocation,
    DuplicateSerial,
    InsufficientStock,
    InsufficientReservation,
    BarcodeMismatch,
    InvalidTransition,
    InvalidState,
    IncompletePickList,
    NoBomFound,
    StorageFailure
};

/**
 * Name of an error code, as used in log lines.
 */
inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::DuplicateSku: return "DuplicateSku";
        case ErrorCode::DuplicateLocation: return "DuplicateLocation";
        case ErrorCode::DuplicateSerial: return "DuplicateSerial";
        case ErrorCode::InsufficientStock: return "InsufficientStock";
        case ErrorCode::InsufficientReservation: return "InsufficientReservation";
        case ErrorCode::BarcodeMismatch: return "BarcodeMismatch";
        case ErrorCode::InvalidTransition: return "InvalidTransition";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IncompletePickList: return "IncompletePickList";
        case ErrorCode::NoBomFound: return "NoBOMFound";
        case ErrorCode::StorageFailure: return "StorageFailure";
    }
    return "Unknown";
}

/**
 * Exception thrown when an inventory operation is rejected.
 *
 * Validation outcomes (insufficient stock, barcode mismatch, ...) are expected
 * and returned to the caller for display. InsufficientReservation and
 * StorageFailure indicate a defect and map to INTERNAL.
 */
class InventoryError : public std::runtime_error {
public:
    InventoryError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

    grpc::StatusCode status_code() const {
        switch (code_) {
            case ErrorCode::InvalidArgument:
                return grpc::StatusCode::INVALID_ARGUMENT;
            case ErrorCode::NotFound:
            case ErrorCode::NoBomFound:
                return grpc::StatusCode::NOT_FOUND;
            case ErrorCode::DuplicateSku:
            case ErrorCode::DuplicateLocation:
            case ErrorCode::DuplicateSerial:
                return grpc::StatusCode::ALREADY_EXISTS;
            case ErrorCode::InsufficientStock:
            case ErrorCode::BarcodeMismatch:
            case ErrorCode::InvalidTransition:
            case ErrorCode::InvalidState:
            case ErrorCode::IncompletePickList:
                return grpc::StatusCode::FAILED_PRECONDITION;
            case ErrorCode::InsufficientReservation:
            case ErrorCode::StorageFailure:
                return grpc::StatusCode::INTERNAL;
        }
        return grpc::StatusCode::UNKNOWN;
    }

    /**
     * Returns true for ledger-consistency defects rather than operational outcomes.
     */
    bool is_defect() const {
        return code_ == ErrorCode::InsufficientReservation || code_ == ErrorCode::StorageFailure;
    }

    static InventoryError invalid_argument(const std::string& message) {
        return InventoryError(ErrorCode::InvalidArgument, message);
    }

    static InventoryError not_found(const std::string& message) {
        return InventoryError(ErrorCode::NotFound, message);
    }

    static InventoryError insufficient_stock(const std::string& message) {
        return InventoryError(ErrorCode::InsufficientStock, message);
    }

    static InventoryError insufficient_reservation(const std::string& message) {
        return InventoryError(ErrorCode::InsufficientReservation, message);
    }

    static InventoryError barcode_mismatch(const std::string& message) {
        return InventoryError(ErrorCode::BarcodeMismatch, message);
    }

    static InventoryError invalid_transition(const std::string& message) {
        return InventoryError(ErrorCode::InvalidTransition, message);
    }

    static InventoryError invalid_state(const std::string& message) {
        return InventoryError(ErrorCode::InvalidState, message);
    }

    static InventoryError duplicate_serial(const std::string& message) {
        return InventoryError(ErrorCode::DuplicateSerial, message);
    }

    static InventoryError no_bom_found(const std::string& message) {
        return InventoryError(ErrorCode::NoBomFound, message);
    }

    static InventoryError storage_failure(const std::string& message) {
        return InventoryError(ErrorCode::StorageFailure, message);
    }

private:
    ErrorCode code_;
};

} // namespace floorstock
