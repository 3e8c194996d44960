/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Per-record values keyed by another store's indices.
 */

#include <gtest/gtest.h>
#include "../src/object_dict_store.h"
#include "../src/store_registry.h"
#include "../src/persistence/errors.h"
#include "../src/persistence/memory_table.h"

using namespace pathstore;
using namespace pathstore::persist;

class ObjectDictStoreTest : public ::testing::Test {
protected:
    MemoryTable table;
    std::unique_ptr<StoreRegistry> registry;
    ObjectDictStore* phi = nullptr;

    void SetUp() override {
        registry.reset(new StoreRegistry(table));
        registry->create_store("Configuration");
        registry->initialize(SizingMetadata(3, 3));
        phi = &registry->create_dict_store("phi", "configurations");
    }

    static std::shared_ptr<Configuration> config(float shift) {
        return std::make_shared<Configuration>(
            3, 3, std::vector<float>{shift, 0, 0, shift + 1, 0, 0, shift + 2, 0, 0});
    }
};

TEST_F(ObjectDictStoreTest, CreatesValueAndFlagColumns) {
    EXPECT_TRUE(phi->is_initialized());
    EXPECT_TRUE(table.has_variable("phi.values"));
    EXPECT_TRUE(table.has_variable("phi.present"));
    EXPECT_EQ(&phi->key_store(), &registry->store_named("configurations"));
}

TEST_F(ObjectDictStoreTest, UnsavedKeysStayInMemory) {
    auto stored = config(0);
    auto unsaved = config(1);
    registry->save(stored);

    phi->set(stored, 0.5f);
    phi->set(unsaved, 1.5f);
    EXPECT_EQ(phi->pending(), 2u);

    EXPECT_EQ(phi->save(), 1u);
    EXPECT_EQ(phi->pending(), 1u);
    EXPECT_EQ(table.row_count("phi.values"), 1u);

    float v = 0;
    ASSERT_TRUE(phi->get(*unsaved, v));
    EXPECT_FLOAT_EQ(v, 1.5f);

    // The key gets an index; the held value follows on the next save
    EXPECT_EQ(registry->save(unsaved), 1u);
    EXPECT_EQ(phi->save(), 1u);
    EXPECT_EQ(phi->pending(), 0u);

    phi->clear_cache();
    ASSERT_TRUE(phi->get(1, v));
    EXPECT_FLOAT_EQ(v, 1.5f);
    ASSERT_TRUE(phi->get(*stored, v));
    EXPECT_FLOAT_EQ(v, 0.5f);
}

TEST_F(ObjectDictStoreTest, GapsReadAsAbsent) {
    for (int i = 0; i < 3; ++i) registry->save(config(float(i)));
    phi->set(2, 0.0f);
    phi->save();
    phi->clear_cache();

    float v = -1;
    EXPECT_FALSE(phi->get(0, v));
    EXPECT_FALSE(phi->get(1, v));
    ASSERT_TRUE(phi->get(2, v));
    EXPECT_FLOAT_EQ(v, 0.0f);
    EXPECT_FALSE(phi->get(7, v));
}

TEST_F(ObjectDictStoreTest, SetOnStoredKeyOverwrites) {
    auto c = config(0);
    registry->save(c);
    phi->set(c, 1.0f);
    phi->save();
    phi->set(0, 2.0f);

    float v = 0;
    ASSERT_TRUE(phi->get(*c, v));
    EXPECT_FLOAT_EQ(v, 2.0f);
    phi->clear_cache();
    ASSERT_TRUE(phi->get(0, v));
    EXPECT_FLOAT_EQ(v, 2.0f);

    phi->save();
    phi->clear_cache();
    ASSERT_TRUE(phi->get(0, v));
    EXPECT_FLOAT_EQ(v, 2.0f);
}

TEST_F(ObjectDictStoreTest, RejectsUnknownIndexAndNullKey) {
    EXPECT_THROW(phi->set(0, 1.0f), RecordNotFoundError);
    EXPECT_THROW(phi->set(std::shared_ptr<StorableObject>(), 1.0f), InvalidValueError);
}

TEST_F(ObjectDictStoreTest, UnknownKeyHasNoValue) {
    auto c = config(4);
    float v = 0;
    EXPECT_FALSE(phi->get(*c, v));
}

TEST_F(ObjectDictStoreTest, NameBindings) {
    EXPECT_EQ(&registry->create_dict_store("phi", "configurations"), phi);
    EXPECT_EQ(&registry->dict_store("phi"), phi);
    EXPECT_TRUE(registry->has_dict_store("phi"));
    EXPECT_FALSE(registry->has_dict_store("psi"));
    EXPECT_THROW(registry->dict_store("psi"), UnknownClassError);

    registry->create_store("Momentum");
    EXPECT_THROW(registry->create_dict_store("phi", "momenta"), SchemaConflictError);
    EXPECT_THROW(registry->create_dict_store("momenta", "configurations"), SchemaConflictError);
    EXPECT_THROW(registry->create_dict_store("psi", "trajectories"), UnknownClassError);
    EXPECT_THROW(registry->create_store("phi", "Configuration"), SchemaConflictError);
}

TEST_F(ObjectDictStoreTest, FlushAndReopen) {
    auto a = config(0);
    auto b = config(1);
    registry->save(a);
    phi->set(a, 0.25f);
    phi->set(b, 0.75f);
    registry->flush();
    EXPECT_EQ(phi->pending(), 1u);

    auto reopened = StoreRegistry::open(table);
    EXPECT_EQ(reopened->dict_store_names(), (std::vector<std::string>{"phi"}));
    ObjectDictStore& restored = reopened->dict_store("phi");
    EXPECT_EQ(restored.key_store().name(), "configurations");

    float v = 0;
    ASSERT_TRUE(restored.get(0, v));
    EXPECT_FLOAT_EQ(v, 0.25f);
    EXPECT_FALSE(restored.get(1, v));
    EXPECT_EQ(restored.pending(), 0u);
}
