#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "floorstock/bom_engine.hpp"
#include "floorstock/catalog.hpp"
#include "floorstock/errors.hpp"
#include "floorstock/helpers.hpp"
#include "floorstock/journal.hpp"

using namespace floorstock;

// =============================================================================
// BomEngine Tests
// =============================================================================

class BomEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* sku : {"WHL-22", "CAP-CHR", "LUG-NUT", "PWD-BLK"}) {
            events::Item item;
            item.set_sku(sku);
            item.set_name(sku);
            catalog_.create_item(item);
        }
    }

    static events::BomComponent component(const std::string& sku, double quantity, bool optional = false) {
        events::BomComponent c;
        c.set_sku(sku);
        c.set_quantity(quantity);
        c.set_is_optional(optional);
        return c;
    }

    events::BillOfMaterials draft(const std::string& variant, bool is_default,
                                  const std::vector<events::BomComponent>& components) {
        events::BillOfMaterials bom;
        bom.set_name("Wheel set " + variant);
        bom.set_product_type("wheel");
        bom.set_variant(variant);
        bom.set_is_default(is_default);
        for (const auto& c : components) *bom.add_components() = c;
        return bom;
    }

    MemoryJournal journal_;
    Catalog catalog_{journal_};
    BomEngine boms_{journal_, catalog_};
};

TEST_F(BomEngineTest, Create_ShouldAssignIdAndVersion) {
    auto bom = boms_.create(draft("", true, {component("WHL-22", 4)}));

    EXPECT_EQ(bom.id(), "BOM-00001");
    EXPECT_EQ(bom.version(), 1);
    EXPECT_TRUE(bom.is_active());
    EXPECT_FALSE(bom.locked());
}

TEST_F(BomEngineTest, Create_WithUnknownComponent_ShouldThrowNotFound) {
    try {
        boms_.create(draft("", false, {component("NOPE", 1)}));
        FAIL() << "Expected NotFound";
    } catch (const InventoryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
    EXPECT_TRUE(boms_.list().empty());
}

TEST_F(BomEngineTest, Create_WithZeroQuantityComponent_ShouldThrowInvalidArgument) {
    EXPECT_THROW(boms_.create(draft("", false, {component("WHL-22", 0)})), InventoryError);
}

TEST_F(BomEngineTest, Resolve_ShouldPreferVariantDefault) {
    auto generic = boms_.create(draft("", true, {component("WHL-22", 4)}));
    auto chrome = boms_.create(draft("chrome", true, {component("WHL-22", 4), component("CAP-CHR", 4)}));

    EXPECT_EQ(boms_.resolve("wheel", "chrome").id(), chrome.id());
    EXPECT_EQ(boms_.resolve("wheel", "matte").id(), generic.id());
    EXPECT_EQ(boms_.resolve("wheel", "").id(), generic.id());
}

TEST_F(BomEngineTest, Resolve_WithNoDefault_ShouldThrowNoBomFound) {
    boms_.create(draft("chrome", false, {component("WHL-22", 4)}));

    try {
        boms_.resolve("wheel", "chrome");
        FAIL() << "Expected NoBomFound";
    } catch (const InventoryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NoBomFound);
        EXPECT_EQ(e.status_code(), grpc::StatusCode::NOT_FOUND);
    }
}

TEST_F(BomEngineTest, SetDefault_ShouldLeaveOneDefaultPerVariant) {
    auto first = boms_.create(draft("chrome", true, {component("WHL-22", 4)}));
    auto second = boms_.create(draft("chrome", false, {component("WHL-22", 5)}));

    boms_.set_default(second.id());

    EXPECT_FALSE(boms_.get(first.id()).is_default());
    EXPECT_TRUE(boms_.get(second.id()).is_default());
    EXPECT_EQ(boms_.resolve("wheel", "chrome").id(), second.id());
}

TEST_F(BomEngineTest, SetDefault_OnInactiveBom_ShouldThrowInvalidState) {
    auto bom = boms_.create(draft("", false, {component("WHL-22", 4)}));
    boms_.deactivate(bom.id());

    EXPECT_THROW(boms_.set_default(bom.id()), InventoryError);
}

TEST_F(BomEngineTest, AddComponent_ToLockedBom_ShouldThrowInvalidState) {
    auto bom = boms_.create(draft("", true, {component("WHL-22", 4)}));
    events::PickListCompleted completed;
    completed.set_pick_list_id("PL-2026-00001");
    completed.set_bom_id(bom.id());
    boms_.apply_event(helpers::pack_any(completed));

    try {
        boms_.add_component(bom.id(), component("LUG-NUT", 20));
        FAIL() << "Expected InvalidState";
    } catch (const InventoryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidState);
    }
    EXPECT_EQ(boms_.get(bom.id()).components_size(), 1);
}

TEST_F(BomEngineTest, Revise_ShouldCreateNewVersionAndHandOverDefault) {
    auto original = boms_.create(draft("", true, {component("WHL-22", 4)}));

    auto revised = boms_.revise(original.id(), {component("WHL-22", 4), component("LUG-NUT", 20)});

    EXPECT_NE(revised.id(), original.id());
    EXPECT_EQ(revised.version(), 2);
    EXPECT_TRUE(revised.is_default());
    EXPECT_FALSE(boms_.get(original.id()).is_active());
    EXPECT_EQ(boms_.resolve("wheel", "").id(), revised.id());
}

TEST_F(BomEngineTest, RemoveComponent_NotInBom_ShouldThrowNotFound) {
    auto bom = boms_.create(draft("", false, {component("WHL-22", 4)}));

    EXPECT_THROW(boms_.remove_component(bom.id(), "CAP-CHR"), InventoryError);

    auto updated = boms_.remove_component(bom.id(), "WHL-22");
    EXPECT_EQ(updated.components_size(), 0);
}

TEST_F(BomEngineTest, Expand_ShouldMultiplyAndMergeDuplicates) {
    auto bom = boms_.create(draft("", false, {
        component("WHL-22", 4),
        component("PWD-BLK", 2.5),
        component("LUG-NUT", 10, true),
        component("LUG-NUT", 10)
    }));

    auto requirements = boms_.expand(bom.id(), 2.0);

    ASSERT_EQ(requirements.size(), 3u);
    EXPECT_EQ(requirements[0].sku, "WHL-22");
    EXPECT_DOUBLE_EQ(requirements[0].quantity, 8.0);
    EXPECT_DOUBLE_EQ(requirements[1].quantity, 5.0);
    EXPECT_EQ(requirements[2].sku, "LUG-NUT");
    EXPECT_DOUBLE_EQ(requirements[2].quantity, 40.0);
    EXPECT_FALSE(requirements[2].optional);
}

TEST_F(BomEngineTest, Expand_WithNonPositiveQuantity_ShouldThrowInvalidArgument) {
    auto bom = boms_.create(draft("", false, {component("WHL-22", 4)}));
    EXPECT_THROW(boms_.expand(bom.id(), 0.0), InventoryError);
}
