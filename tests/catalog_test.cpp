#include <gtest/gtest.h>
#include <string>
#include "floorstock/catalog.hpp"
#include "floorstock/errors.hpp"
#include "floorstock/journal.hpp"
#include "floorstock/location_registry.hpp"

using namespace floorstock;

// =============================================================================
// Catalog Tests
// =============================================================================

class CatalogTest : public ::testing::Test {
protected:
    events::Item make_item(const std::string& sku) {
        events::Item item;
        item.set_sku(sku);
        item.set_name("Item " + sku);
        return item;
    }

    MemoryJournal journal_;
    Catalog catalog_{journal_};
};

TEST_F(CatalogTest, CreateItem_ShouldApplyDefaults) {
    auto item = catalog_.create_item(make_item("WHL-001"));

    EXPECT_TRUE(item.is_active());
    EXPECT_EQ(item.category(), events::COMPONENT);
    EXPECT_EQ(item.unit_of_measure(), events::EACH);
    EXPECT_EQ(item.barcode(), "WHL-001");
    EXPECT_EQ(journal_.last_sequence(), 1u);
}

TEST_F(CatalogTest, CreateItem_WithDuplicateSku_ShouldThrowDuplicateSku) {
    catalog_.create_item(make_item("WHL-001"));

    try {
        catalog_.create_item(make_item("WHL-001"));
        FAIL() << "Expected DuplicateSku";
    } catch (const InventoryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DuplicateSku);
        EXPECT_EQ(e.status_code(), grpc::StatusCode::ALREADY_EXISTS);
    }
    EXPECT_EQ(journal_.last_sequence(), 1u);
}

TEST_F(CatalogTest, CreateItem_WithoutName_ShouldThrowInvalidArgument) {
    auto item = make_item("WHL-001");
    item.clear_name();
    EXPECT_THROW(catalog_.create_item(item), InventoryError);
    EXPECT_FALSE(catalog_.find("WHL-001").has_value());
}

TEST_F(CatalogTest, UpdateItem_ShouldKeepAverageCost) {
    catalog_.create_item(make_item("PWD-BLK"));
    events::Transaction receipt;
    receipt.set_type(events::RECEIVE);
    receipt.set_sku("PWD-BLK");
    receipt.set_new_average_cost(4.25);
    catalog_.apply_transaction(receipt);

    ItemUpdate update;
    update.name = "Black powder";
    update.reorder_point = 10.0;
    auto item = catalog_.update_item("PWD-BLK", update);

    EXPECT_EQ(item.name(), "Black powder");
    EXPECT_DOUBLE_EQ(item.reorder_point(), 10.0);
    EXPECT_DOUBLE_EQ(item.average_cost(), 4.25);
}

TEST_F(CatalogTest, DeactivateItem_ShouldHideFromActiveList) {
    catalog_.create_item(make_item("A"));
    catalog_.create_item(make_item("B"));

    catalog_.deactivate_item("A");

    EXPECT_EQ(catalog_.list(true).size(), 1u);
    EXPECT_EQ(catalog_.list(false).size(), 2u);
    EXPECT_THROW(catalog_.require_active("A"), InventoryError);
    EXPECT_FALSE(catalog_.get("A").is_active());
}

TEST_F(CatalogTest, FindByBarcode_ShouldMatchSkuOrPrintedBarcode) {
    auto item = make_item("CAP-CHR");
    item.set_barcode("0123456789");
    catalog_.create_item(item);

    EXPECT_TRUE(catalog_.find_by_barcode("0123456789").has_value());
    EXPECT_TRUE(catalog_.find_by_barcode("CAP-CHR").has_value());
    EXPECT_FALSE(catalog_.find_by_barcode("nope").has_value());
}

TEST_F(CatalogTest, Replay_ShouldRebuildSameCatalog) {
    catalog_.create_item(make_item("A"));
    catalog_.deactivate_item("A");

    Catalog replayed(journal_);
    for (const auto& entry : journal_.read_all()) {
        replayed.apply_event(entry.event());
    }

    ASSERT_TRUE(replayed.find("A").has_value());
    EXPECT_FALSE(replayed.find("A")->is_active());
}

// =============================================================================
// LocationRegistry Tests
// =============================================================================

class LocationRegistryTest : public ::testing::Test {
protected:
    MemoryJournal journal_;
    LocationRegistry locations_{journal_};
};

TEST_F(LocationRegistryTest, SeedDefaults_ShouldBeIdempotent) {
    int first = locations_.seed_defaults();
    int second = locations_.seed_defaults();

    EXPECT_GT(first, 0);
    EXPECT_EQ(second, 0);
    EXPECT_TRUE(locations_.find("powder_coat").has_value());
    EXPECT_EQ(locations_.find("receiving")->type(), events::RECEIVING);
}

TEST_F(LocationRegistryTest, RegisterLocation_WithDuplicateCode_ShouldThrowDuplicateLocation) {
    events::Location location;
    location.set_code("cell_3");
    location.set_name("Cell 3");
    locations_.register_location(location);

    try {
        locations_.register_location(location);
        FAIL() << "Expected DuplicateLocation";
    } catch (const InventoryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DuplicateLocation);
    }
}

TEST_F(LocationRegistryTest, Deactivate_ShouldFailRequireActive) {
    locations_.seed_defaults();
    locations_.deactivate("polish");

    EXPECT_THROW(locations_.require_active("polish"), InventoryError);
    EXPECT_TRUE(locations_.find("polish").has_value());
}
