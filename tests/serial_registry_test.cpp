#include <gtest/gtest.h>
#include <string>
#include "floorstock/errors.hpp"
#include "floorstock/journal.hpp"
#include "floorstock/serial_registry.hpp"

using namespace floorstock;

// =============================================================================
// Status Edge Tests
// =============================================================================

struct Edge {
    events::SerialStatus from;
    events::SerialStatus to;
    bool allowed;
};

class SerialEdgeTest : public ::testing::TestWithParam<Edge> {};

TEST_P(SerialEdgeTest, CanTransition_ShouldFollowEdgeTable) {
    const auto& edge = GetParam();
    EXPECT_EQ(SerialRegistry::can_transition(edge.from, edge.to), edge.allowed);
}

INSTANTIATE_TEST_SUITE_P(
    Edges, SerialEdgeTest,
    ::testing::Values(
        Edge{events::IN_STOCK, events::RESERVED, true},
        Edge{events::IN_STOCK, events::IN_USE, true},
        Edge{events::IN_STOCK, events::SCRAPPED, true},
        Edge{events::IN_STOCK, events::SHIPPED, false},
        Edge{events::RESERVED, events::IN_STOCK, true},
        Edge{events::RESERVED, events::IN_USE, true},
        Edge{events::RESERVED, events::SCRAPPED, false},
        Edge{events::IN_USE, events::SHIPPED, true},
        Edge{events::IN_USE, events::SCRAPPED, true},
        Edge{events::IN_USE, events::IN_STOCK, false},
        Edge{events::SHIPPED, events::IN_STOCK, false},
        Edge{events::SCRAPPED, events::IN_STOCK, false}));

// =============================================================================
// SerialRegistry Tests
// =============================================================================

class SerialRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        serials_.register_unit("WHL-22", "SN-1001", "storage", 180.0);
    }

    MemoryJournal journal_;
    SerialRegistry serials_{journal_};
};

TEST_F(SerialRegistryTest, RegisterUnit_ShouldStartInStockWithBarcode) {
    auto unit = serials_.get("SN-1001");

    EXPECT_EQ(unit.status, events::IN_STOCK);
    EXPECT_EQ(unit.barcode, "SN1001");
    EXPECT_EQ(unit.location, "storage");
    EXPECT_TRUE(serials_.find_by_barcode("SN1001").has_value());
}

TEST_F(SerialRegistryTest, RegisterUnit_WithExistingSerial_ShouldThrowDuplicateSerial) {
    try {
        serials_.register_unit("WHL-24", "SN-1001", "storage", 0.0);
        FAIL() << "Expected DuplicateSerial";
    } catch (const InventoryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DuplicateSerial);
    }
}

TEST_F(SerialRegistryTest, ReserveThenRelease_ShouldClearOrder) {
    auto reserved = serials_.reserve_for_order("SN-1001", "ORD-7");
    EXPECT_EQ(reserved.status, events::RESERVED);
    EXPECT_EQ(reserved.order_id, "ORD-7");

    auto released = serials_.release("SN-1001");
    EXPECT_EQ(released.status, events::IN_STOCK);
    EXPECT_TRUE(released.order_id.empty());
}

TEST_F(SerialRegistryTest, Transition_ToReservedWithoutOrder_ShouldThrowInvalidArgument) {
    EXPECT_THROW(serials_.transition("SN-1001", events::RESERVED), InventoryError);
    EXPECT_EQ(serials_.get("SN-1001").status, events::IN_STOCK);
}

TEST_F(SerialRegistryTest, Transition_FromTerminal_ShouldThrowInvalidTransition) {
    serials_.transition("SN-1001", events::SCRAPPED);

    try {
        serials_.transition("SN-1001", events::IN_STOCK);
        FAIL() << "Expected InvalidTransition";
    } catch (const InventoryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidTransition);
    }
}

TEST_F(SerialRegistryTest, ValidateMovement_PickOfUnitReservedForAnotherOrder_ShouldThrow) {
    serials_.reserve_for_order("SN-1001", "ORD-7");

    events::Transaction pick;
    pick.set_type(events::PICK);
    pick.set_sku("WHL-22");
    pick.set_from_location("storage");
    pick.set_order_id("ORD-8");
    pick.add_serial_numbers("SN-1001");

    EXPECT_THROW(serials_.validate_movement(pick), InventoryError);

    pick.set_order_id("ORD-7");
    EXPECT_NO_THROW(serials_.validate_movement(pick));
}

TEST_F(SerialRegistryTest, ValidateMovement_TransferFromWrongLocation_ShouldThrow) {
    events::Transaction transfer;
    transfer.set_type(events::TRANSFER);
    transfer.set_sku("WHL-22");
    transfer.set_from_location("polish");
    transfer.set_to_location("assembly");
    transfer.add_serial_numbers("SN-1001");

    EXPECT_THROW(serials_.validate_movement(transfer), InventoryError);
}

TEST_F(SerialRegistryTest, ApplyTransaction_Pick_ShouldMarkUnitInUse) {
    events::Transaction pick;
    pick.set_type(events::PICK);
    pick.set_sku("WHL-22");
    pick.set_from_location("storage");
    pick.set_order_id("ORD-7");
    pick.add_serial_numbers("SN-1001");

    serials_.apply_transaction(pick);

    auto unit = serials_.get("SN-1001");
    EXPECT_EQ(unit.status, events::IN_USE);
    EXPECT_EQ(unit.order_id, "ORD-7");
}
