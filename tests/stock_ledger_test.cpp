#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "floorstock/catalog.hpp"
#include "floorstock/errors.hpp"
#include "floorstock/journal.hpp"
#include "floorstock/location_registry.hpp"
#include "floorstock/serial_registry.hpp"
#include "floorstock/stock_ledger.hpp"
#include "floorstock/transaction_log.hpp"

using namespace floorstock;

// =============================================================================
// StockLedger Tests
// =============================================================================

class StockLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        locations_.seed_defaults();
        add_item("PWD-BLK", false);
        add_item("WHL-22", true);
    }

    void add_item(const std::string& sku, bool tracked) {
        events::Item item;
        item.set_sku(sku);
        item.set_name(sku);
        item.set_track_individually(tracked);
        item.set_default_location("storage");
        catalog_.create_item(item);
    }

    MovementContext for_pick_list(const std::string& pick_list_id) {
        MovementContext context;
        context.pick_list_id = pick_list_id;
        context.order_id = "ORD-1";
        return context;
    }

    MemoryJournal journal_;
    Catalog catalog_{journal_};
    LocationRegistry locations_{journal_};
    SerialRegistry serials_{journal_};
    TransactionLog log_{journal_};
    StockLedger ledger_{journal_, log_, catalog_, locations_, serials_};
};

TEST_F(StockLedgerTest, Receive_ShouldUpdateQuantityAndAverageCost) {
    // When 100 are received at 0.10 and 200 more at 0.12
    ledger_.apply(movement::Receive{"PWD-BLK", "receiving", 100.0, 0.10, {}});
    auto tx = ledger_.apply(movement::Receive{"PWD-BLK", "receiving", 200.0, 0.12, {}});

    // Then on-hand is 300 and average cost is the weighted mean
    EXPECT_DOUBLE_EQ(ledger_.current_stock("PWD-BLK", "receiving").quantity, 300.0);
    EXPECT_NEAR(catalog_.get("PWD-BLK").average_cost(), 34.0 / 300.0, 1e-9);
    EXPECT_NEAR(tx.new_average_cost(), 0.113333333, 1e-6);
}

TEST_F(StockLedgerTest, Receive_OfUnknownItem_ShouldThrowNotFound) {
    try {
        ledger_.apply(movement::Receive{"NOPE", "receiving", 1.0, 1.0, {}});
        FAIL() << "Expected NotFound";
    } catch (const InventoryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
    EXPECT_EQ(log_.size(), 0u);
}

TEST_F(StockLedgerTest, Receive_WithNonPositiveQuantity_ShouldThrowInvalidArgument) {
    EXPECT_THROW(ledger_.apply(movement::Receive{"PWD-BLK", "receiving", 0.0, 1.0, {}}), InventoryError);
    EXPECT_THROW(ledger_.apply(movement::Receive{"PWD-BLK", "receiving", -5.0, 1.0, {}}), InventoryError);
}

TEST_F(StockLedgerTest, Receive_WithSerials_ShouldRegisterUnits) {
    ledger_.apply(movement::Receive{"WHL-22", "storage", 2.0, 150.0, {"SN-1", "SN-2"}});

    EXPECT_EQ(serials_.units_for_item("WHL-22", std::string("storage"), events::IN_STOCK).size(), 2u);
    EXPECT_DOUBLE_EQ(serials_.get("SN-2").cost, 150.0);
}

TEST_F(StockLedgerTest, Receive_WithSerialCountMismatch_ShouldThrowInvalidArgument) {
    EXPECT_THROW(ledger_.apply(movement::Receive{"WHL-22", "storage", 3.0, 150.0, {"SN-1", "SN-2"}}),
                 InventoryError);
    EXPECT_FALSE(serials_.find("SN-1").has_value());
}

TEST_F(StockLedgerTest, Transfer_ShouldMoveStockBetweenLocations) {
    ledger_.apply(movement::Receive{"PWD-BLK", "receiving", 50.0, 1.0, {}});

    ledger_.apply(movement::Transfer{"PWD-BLK", "receiving", "powder_coat", 20.0, {}});

    EXPECT_DOUBLE_EQ(ledger_.current_stock("PWD-BLK", "receiving").quantity, 30.0);
    EXPECT_DOUBLE_EQ(ledger_.current_stock("PWD-BLK", "powder_coat").quantity, 20.0);
    EXPECT_DOUBLE_EQ(ledger_.item_on_hand("PWD-BLK"), 50.0);
}

TEST_F(StockLedgerTest, Transfer_ToSameLocation_ShouldThrowInvalidArgument) {
    ledger_.apply(movement::Receive{"PWD-BLK", "receiving", 50.0, 1.0, {}});

    try {
        ledger_.apply(movement::Transfer{"PWD-BLK", "receiving", "receiving", 5.0, {}});
        FAIL() << "Expected InvalidArgument";
    } catch (const InventoryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
}

TEST_F(StockLedgerTest, Transfer_OfReservedStock_ShouldThrowInsufficientStock) {
    ledger_.apply(movement::Receive{"PWD-BLK", "receiving", 10.0, 1.0, {}});
    ledger_.reserve("PWD-BLK", "receiving", 8.0, "PL-1");

    try {
        ledger_.apply(movement::Transfer{"PWD-BLK", "receiving", "polish", 5.0, {}});
        FAIL() << "Expected InsufficientStock";
    } catch (const InventoryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InsufficientStock);
    }
    EXPECT_DOUBLE_EQ(ledger_.current_stock("PWD-BLK", "receiving").quantity, 10.0);
    EXPECT_DOUBLE_EQ(ledger_.current_stock("PWD-BLK", "polish").quantity, 0.0);
}

TEST_F(StockLedgerTest, Pick_ShouldConsumeQuantityAndReservation) {
    ledger_.apply(movement::Receive{"PWD-BLK", "storage", 40.0, 1.0, {}});
    ledger_.reserve("PWD-BLK", "storage", 15.0, "PL-1");

    ledger_.apply(movement::Pick{"PWD-BLK", "storage", 10.0, {}}, for_pick_list("PL-1"));

    auto record = ledger_.current_stock("PWD-BLK", "storage");
    EXPECT_DOUBLE_EQ(record.quantity, 30.0);
    EXPECT_DOUBLE_EQ(record.reserved, 5.0);
    EXPECT_DOUBLE_EQ(ledger_.held_by("PL-1", "PWD-BLK", "storage"), 5.0);
}

TEST_F(StockLedgerTest, Pick_BeyondReservation_ShouldThrowInsufficientReservation) {
    ledger_.apply(movement::Receive{"PWD-BLK", "storage", 40.0, 1.0, {}});
    ledger_.reserve("PWD-BLK", "storage", 5.0, "PL-1");
    auto before = ledger_.current_stock("PWD-BLK", "storage");

    try {
        ledger_.apply(movement::Pick{"PWD-BLK", "storage", 6.0, {}}, for_pick_list("PL-1"));
        FAIL() << "Expected InsufficientReservation";
    } catch (const InventoryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InsufficientReservation);
        EXPECT_EQ(e.status_code(), grpc::StatusCode::INTERNAL);
    }

    auto after = ledger_.current_stock("PWD-BLK", "storage");
    EXPECT_DOUBLE_EQ(after.quantity, before.quantity);
    EXPECT_DOUBLE_EQ(after.reserved, before.reserved);
    EXPECT_EQ(after.version, before.version);
}

TEST_F(StockLedgerTest, Pick_AgainstAnotherHoldersReservation_ShouldThrowInsufficientReservation) {
    ledger_.apply(movement::Receive{"PWD-BLK", "storage", 40.0, 1.0, {}});
    ledger_.reserve("PWD-BLK", "storage", 10.0, "PL-1");

    EXPECT_THROW(ledger_.apply(movement::Pick{"PWD-BLK", "storage", 5.0, {}}, for_pick_list("PL-2")),
                 InventoryError);
}

TEST_F(StockLedgerTest, Reserve_BeyondAvailable_ShouldThrowInsufficientStock) {
    ledger_.apply(movement::Receive{"PWD-BLK", "storage", 10.0, 1.0, {}});

    try {
        ledger_.reserve("PWD-BLK", "storage", 11.0, "PL-1");
        FAIL() << "Expected InsufficientStock";
    } catch (const InventoryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InsufficientStock);
    }
    EXPECT_DOUBLE_EQ(ledger_.current_stock("PWD-BLK", "storage").reserved, 0.0);
}

TEST_F(StockLedgerTest, ReserveAvailable_ShouldCapAtAvailable) {
    ledger_.apply(movement::Receive{"PWD-BLK", "storage", 60.0, 1.0, {}});

    double reserved = ledger_.reserve_available("PWD-BLK", "storage", 80.0, "PL-1");

    EXPECT_DOUBLE_EQ(reserved, 60.0);
    EXPECT_DOUBLE_EQ(ledger_.current_stock("PWD-BLK", "storage").available(), 0.0);
}

TEST_F(StockLedgerTest, Release_MoreThanHeld_ShouldThrowInsufficientReservation) {
    ledger_.apply(movement::Receive{"PWD-BLK", "storage", 10.0, 1.0, {}});
    ledger_.reserve("PWD-BLK", "storage", 4.0, "PL-1");

    try {
        ledger_.release("PWD-BLK", "storage", 5.0, "PL-1");
        FAIL() << "Expected InsufficientReservation";
    } catch (const InventoryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InsufficientReservation);
        EXPECT_TRUE(e.is_defect());
    }
    EXPECT_DOUBLE_EQ(ledger_.current_stock("PWD-BLK", "storage").reserved, 4.0);
}

TEST_F(StockLedgerTest, ConcurrentReservations_ShouldNeverOverReserve) {
    ledger_.apply(movement::Receive{"PWD-BLK", "storage", 50.0, 1.0, {}});

    // Given 20 holders racing for 5 units each against 50 available
    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 20; ++i) {
        threads.emplace_back([&, i] {
            try {
                ledger_.reserve("PWD-BLK", "storage", 5.0, "PL-" + std::to_string(i));
                ++succeeded;
            } catch (const InventoryError& e) {
                if (e.code() == ErrorCode::InsufficientStock) ++rejected;
            }
        });
    }
    for (auto& thread : threads) thread.join();

    // Then exactly the available amount was reserved
    EXPECT_EQ(succeeded.load(), 10);
    EXPECT_EQ(rejected.load(), 10);
    auto record = ledger_.current_stock("PWD-BLK", "storage");
    EXPECT_DOUBLE_EQ(record.reserved, 50.0);
    EXPECT_DOUBLE_EQ(record.available(), 0.0);
    EXPECT_TRUE(ledger_.reconcile().empty());
}

TEST_F(StockLedgerTest, Adjust_ShouldRecordSignedDeltaAndCountTime) {
    ledger_.apply(movement::Receive{"PWD-BLK", "storage", 40.0, 1.0, {}});

    auto down = ledger_.apply(movement::Adjust{"PWD-BLK", "storage", 37.5, "cycle count"});
    EXPECT_DOUBLE_EQ(down.quantity(), -2.5);
    EXPECT_EQ(down.from_location(), "storage");
    EXPECT_EQ(down.reference(), "cycle count");

    auto record = ledger_.current_stock("PWD-BLK", "storage");
    EXPECT_DOUBLE_EQ(record.quantity, 37.5);
    EXPECT_GT(record.last_count_at, 0);
}

TEST_F(StockLedgerTest, Adjust_BelowReserved_ShouldThrowInsufficientStock) {
    ledger_.apply(movement::Receive{"PWD-BLK", "storage", 40.0, 1.0, {}});
    ledger_.reserve("PWD-BLK", "storage", 30.0, "PL-1");

    try {
        ledger_.apply(movement::Adjust{"PWD-BLK", "storage", 20.0, "recount"});
        FAIL() << "Expected InsufficientStock";
    } catch (const InventoryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InsufficientStock);
    }
    EXPECT_DOUBLE_EQ(ledger_.current_stock("PWD-BLK", "storage").quantity, 40.0);
}

TEST_F(StockLedgerTest, Scrap_ShouldReduceQuantity) {
    ledger_.apply(movement::Receive{"PWD-BLK", "storage", 10.0, 1.0, {}});

    ledger_.apply(movement::Scrap{"PWD-BLK", "storage", 3.0, {}});

    EXPECT_DOUBLE_EQ(ledger_.current_stock("PWD-BLK", "storage").quantity, 7.0);
    EXPECT_THROW(ledger_.apply(movement::Scrap{"PWD-BLK", "storage", 8.0, {}}), InventoryError);
}

TEST_F(StockLedgerTest, Observer_ShouldSeeAvailableChanges) {
    std::vector<StockChange> changes;
    ledger_.add_observer([&](const StockChange& change) { changes.push_back(change); });

    ledger_.apply(movement::Receive{"PWD-BLK", "storage", 10.0, 1.0, {}});
    ledger_.reserve("PWD-BLK", "storage", 4.0, "PL-1");

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_DOUBLE_EQ(changes[0].available_delta, 10.0);
    EXPECT_DOUBLE_EQ(changes[1].available_delta, -4.0);
    EXPECT_DOUBLE_EQ(changes[1].item_available, 6.0);
}

TEST_F(StockLedgerTest, Reconcile_AfterMixedMovements_ShouldFindNothing) {
    ledger_.apply(movement::Receive{"PWD-BLK", "receiving", 100.0, 0.1, {}});
    ledger_.apply(movement::Transfer{"PWD-BLK", "receiving", "storage", 60.0, {}});
    ledger_.reserve("PWD-BLK", "storage", 25.0, "PL-1");
    ledger_.apply(movement::Pick{"PWD-BLK", "storage", 20.0, {}}, for_pick_list("PL-1"));
    ledger_.release("PWD-BLK", "storage", 5.0, "PL-1");
    ledger_.apply(movement::Adjust{"PWD-BLK", "receiving", 38.0, "recount"});
    ledger_.apply(movement::Return{"PWD-BLK", "storage", 2.0, {}});
    ledger_.apply(movement::Scrap{"PWD-BLK", "storage", 1.0, {}});

    EXPECT_TRUE(ledger_.reconcile().empty());
}

TEST_F(StockLedgerTest, Rebuild_FromJournal_ShouldReproduceRecords) {
    ledger_.apply(movement::Receive{"PWD-BLK", "receiving", 100.0, 0.1, {}});
    ledger_.apply(movement::Transfer{"PWD-BLK", "receiving", "storage", 60.0, {}});
    ledger_.reserve("PWD-BLK", "storage", 25.0, "PL-1");
    ledger_.apply(movement::Pick{"PWD-BLK", "storage", 10.0, {}}, for_pick_list("PL-1"));
    auto before = ledger_.all_records();

    // When a fresh ledger replays the journal
    MemoryJournal scratch;
    TransactionLog log(scratch);
    StockLedger replayed(scratch, log, catalog_, locations_, serials_);
    replayed.rebuild(journal_.read_all());

    // Then every record matches
    auto after = replayed.all_records();
    ASSERT_EQ(after.size(), before.size());
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(after[i].sku, before[i].sku);
        EXPECT_EQ(after[i].location, before[i].location);
        EXPECT_DOUBLE_EQ(after[i].quantity, before[i].quantity);
        EXPECT_DOUBLE_EQ(after[i].reserved, before[i].reserved);
    }
    EXPECT_DOUBLE_EQ(replayed.held_by("PL-1", "PWD-BLK", "storage"), 15.0);
}

// =============================================================================
// Returns
// =============================================================================

TEST_F(StockLedgerTest, Return_ShouldAddQuantityWithoutTouchingReserved) {
    ledger_.apply(movement::Receive{"PWD-BLK", "storage", 10.0, 1.0, {}});
    ledger_.reserve("PWD-BLK", "storage", 4.0, "PL-1");

    // When 3 come back to storage
    auto tx = ledger_.apply(movement::Return{"PWD-BLK", "storage", 3.0, {}});

    // Then on-hand grows and the reservation is untouched
    auto record = ledger_.current_stock("PWD-BLK", "storage");
    EXPECT_EQ(tx.type(), events::RETURN);
    EXPECT_EQ(tx.to_location(), "storage");
    EXPECT_DOUBLE_EQ(record.quantity, 13.0);
    EXPECT_DOUBLE_EQ(record.reserved, 4.0);
    EXPECT_DOUBLE_EQ(ledger_.held_by("PL-1", "PWD-BLK", "storage"), 4.0);
}

TEST_F(StockLedgerTest, Return_OfUnitStillOnHand_ShouldThrowInvalidTransition) {
    // Given two wheels on the shelf, one of them reserved for an order
    ledger_.apply(movement::Receive{"WHL-22", "storage", 2.0, 150.0, {"SN-A", "SN-B"}});
    ledger_.reserve("WHL-22", "storage", 1.0, "PL-1");
    serials_.reserve_for_order("SN-A", "ORD-1");
    auto entries = journal_.last_sequence();

    // When either unit is returned, the return is refused
    for (const std::string serial : {"SN-A", "SN-B"}) {
        try {
            ledger_.apply(movement::Return{"WHL-22", "storage", 1.0, {serial}});
            FAIL() << "Expected InvalidTransition for " << serial;
        } catch (const InventoryError& e) {
            EXPECT_EQ(e.code(), ErrorCode::InvalidTransition);
        }
    }

    // Then stock still matches the two physical units and the order keeps its unit
    auto record = ledger_.current_stock("WHL-22", "storage");
    EXPECT_DOUBLE_EQ(record.quantity, 2.0);
    EXPECT_DOUBLE_EQ(record.reserved, 1.0);
    EXPECT_EQ(serials_.get("SN-A").status, events::RESERVED);
    EXPECT_EQ(serials_.get("SN-A").order_id, "ORD-1");
    EXPECT_EQ(journal_.last_sequence(), entries);
}

TEST_F(StockLedgerTest, Return_OfUnitInUse_ShouldThrowInvalidTransition) {
    ledger_.apply(movement::Receive{"WHL-22", "storage", 1.0, 150.0, {"SN-A"}});
    ledger_.reserve("WHL-22", "storage", 1.0, "PL-1");
    ledger_.apply(movement::Pick{"WHL-22", "storage", 1.0, {"SN-A"}}, for_pick_list("PL-1"));

    EXPECT_THROW(ledger_.apply(movement::Return{"WHL-22", "storage", 1.0, {"SN-A"}}), InventoryError);
    EXPECT_EQ(serials_.get("SN-A").status, events::IN_USE);
    EXPECT_DOUBLE_EQ(ledger_.current_stock("WHL-22", "storage").quantity, 0.0);
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_F(StockLedgerTest, ConcurrentReceipts_OfSameSerial_ShouldRegisterItOnce) {
    add_item("WHL-24", true);

    for (int round = 0; round < 50; ++round) {
        const std::string serial = "SN-RACE-" + std::to_string(round);
        std::atomic<int> succeeded{0};
        std::atomic<int> duplicates{0};

        // When two items receive the same serial at the same time
        std::vector<std::thread> threads;
        for (const std::string sku : {"WHL-22", "WHL-24"}) {
            threads.emplace_back([&, sku] {
                try {
                    ledger_.apply(movement::Receive{sku, "storage", 1.0, 150.0, {serial}});
                    succeeded++;
                } catch (const InventoryError& e) {
                    if (e.code() == ErrorCode::DuplicateSerial) duplicates++;
                }
            });
        }
        for (auto& t : threads) t.join();

        // Then exactly one receipt owns the unit
        ASSERT_EQ(succeeded.load(), 1) << serial;
        ASSERT_EQ(duplicates.load(), 1) << serial;
        auto unit = serials_.get(serial);
        EXPECT_DOUBLE_EQ(ledger_.current_stock(unit.sku, "storage").quantity,
                         static_cast<double>(serials_.units_for_item(unit.sku).size()));
    }
}

TEST_F(StockLedgerTest, ConcurrentReceipts_ShouldAverageOverEveryLocation) {
    const std::vector<std::string> locations = {"receiving", "storage", "assembly", "polish"};

    std::vector<std::thread> threads;
    for (size_t i = 0; i < locations.size(); ++i) {
        threads.emplace_back([&, i] {
            for (int n = 0; n < 25; ++n) {
                ledger_.apply(movement::Receive{"PWD-BLK", locations[i], 2.0, 1.0 + i, {}});
            }
        });
    }
    for (auto& t : threads) t.join();

    // 50 units at each of 1, 2, 3 and 4
    EXPECT_DOUBLE_EQ(ledger_.item_on_hand("PWD-BLK"), 200.0);
    EXPECT_NEAR(catalog_.get("PWD-BLK").average_cost(), 2.5, 1e-9);
}

TEST_F(StockLedgerTest, ConcurrentChanges_ShouldReportUnbrokenAvailableTotals) {
    ledger_.apply(movement::Receive{"PWD-BLK", "storage", 40.0, 1.0, {}});
    ledger_.apply(movement::Receive{"PWD-BLK", "assembly", 40.0, 1.0, {}});

    std::mutex changes_mutex;
    std::vector<StockChange> changes;
    ledger_.add_observer([&](const StockChange& change) {
        std::lock_guard lock(changes_mutex);
        changes.push_back(change);
    });

    // When reservations at two locations run in parallel
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            const std::string location = i % 2 == 0 ? "storage" : "assembly";
            for (int n = 0; n < 5; ++n) {
                ledger_.reserve("PWD-BLK", location, 1.0, "PL-" + std::to_string(i));
            }
        });
    }
    for (auto& t : threads) t.join();

    // Then every change reports the total it moved from, and the totals chain
    ASSERT_EQ(changes.size(), 40u);
    std::sort(changes.begin(), changes.end(), [](const StockChange& a, const StockChange& b) {
        return a.item_available_before > b.item_available_before;
    });
    EXPECT_DOUBLE_EQ(changes.front().item_available_before, 80.0);
    for (size_t i = 0; i < changes.size(); ++i) {
        EXPECT_DOUBLE_EQ(changes[i].item_available, changes[i].item_available_before - 1.0);
        if (i + 1 < changes.size()) {
            EXPECT_DOUBLE_EQ(changes[i].item_available, changes[i + 1].item_available_before);
        }
    }
    EXPECT_DOUBLE_EQ(changes.back().item_available, 40.0);
}
