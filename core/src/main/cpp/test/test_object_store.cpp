/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Indexed record stores: save, load, identity and lazy access.
 */

#include <gtest/gtest.h>
#include <cmath>
#include <thread>
#include <vector>
#include "../src/object_store.h"
#include "../src/store_registry.h"
#include "../src/persistence/memory_table.h"

using namespace pathstore;
using namespace pathstore::persist;

class ObjectStoreTest : public ::testing::Test {
protected:
    MemoryTable table;
    std::unique_ptr<StoreRegistry> registry;
    ObjectStore* store = nullptr;

    void SetUp() override {
        registry.reset(new StoreRegistry(table));
        store = &registry->create_store("Configuration");
        registry->initialize(SizingMetadata(3, 3));
    }

    static std::shared_ptr<Configuration> config(float shift) {
        return std::make_shared<Configuration>(
            3, 3, std::vector<float>{shift, 0, 0, shift + 1, 0, 0, shift + 2, 0, 0});
    }

    uint64_t coordinate_reads() const {
        return table.stats("configurations.coordinates").reads;
    }
};

TEST_F(ObjectStoreTest, SaveAndLoadThreeAtoms) {
    auto c = std::make_shared<Configuration>(
        3, 3, std::vector<float>{0, 0, 0, 1, 0, 0, 2, 0, 0});
    EXPECT_EQ(store->save(c), 0u);

    store->clear_cache();
    auto loaded = store->load_as<Configuration>(0);
    ASSERT_NE(loaded, c);
    ASSERT_EQ(loaded->coordinates().size(), 9u);
    for (size_t i = 0; i < 9; ++i) {
        EXPECT_NEAR(loaded->coordinates()[i], c->coordinates()[i], 1e-6);
    }
    EXPECT_TRUE(loaded->equals(*c));
}

TEST_F(ObjectStoreTest, IndicesAreDense) {
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(store->save(config(float(i))), uint64_t(i));
    }
    EXPECT_EQ(store->count(), 5u);
    EXPECT_TRUE(store->contains(4));
    EXPECT_FALSE(store->contains(5));
}

TEST_F(ObjectStoreTest, IdentityIsStable) {
    store->save(config(0));
    store->clear_cache();

    auto a = store->load(0);
    auto b = store->load(0);
    EXPECT_EQ(a, b);
    EXPECT_EQ(coordinate_reads(), 1u);

    uint64_t idx = 99;
    ASSERT_TRUE(store->index_of(*a, idx));
    EXPECT_EQ(idx, 0u);
}

TEST_F(ObjectStoreTest, ConcurrentLoadsShareOneObject) {
    store->save(config(0));
    store->clear_cache();
    table.reset_stats();

    const size_t kThreads = 8;
    std::vector<std::shared_ptr<StorableObject>> loaded(kThreads);
    std::vector<std::thread> workers;
    for (size_t t = 0; t < kThreads; ++t) {
        workers.emplace_back([this, &loaded, t] { loaded[t] = store->load(0); });
    }
    for (auto& w : workers) w.join();

    ASSERT_NE(loaded[0], nullptr);
    for (size_t t = 1; t < kThreads; ++t) {
        EXPECT_EQ(loaded[t], loaded[0]);
    }
    EXPECT_EQ(coordinate_reads(), 1u);
}

TEST_F(ObjectStoreTest, ConcurrentProxyResolution) {
    store->save(config(0));
    store->clear_cache();
    table.reset_stats();

    // One shared handle plus one handle per thread
    auto shared = store->proxy(0);
    const size_t kThreads = 8;
    std::vector<std::shared_ptr<StorableObject>> via_shared(kThreads);
    std::vector<std::shared_ptr<StorableObject>> via_own(kThreads);
    std::vector<std::thread> workers;
    for (size_t t = 0; t < kThreads; ++t) {
        workers.emplace_back([this, &shared, &via_shared, &via_own, t] {
            via_shared[t] = shared.get();
            via_own[t] = store->proxy(0).get();
        });
    }
    for (auto& w : workers) w.join();

    ASSERT_NE(via_shared[0], nullptr);
    for (size_t t = 0; t < kThreads; ++t) {
        EXPECT_EQ(via_shared[t], via_shared[0]);
        EXPECT_EQ(via_own[t], via_shared[0]);
    }
    EXPECT_TRUE(shared.is_resolved());
    EXPECT_EQ(coordinate_reads(), 1u);
}

TEST_F(ObjectStoreTest, SavedObjectIsTheLoadedObject) {
    auto c = config(0);
    store->save(c);
    EXPECT_EQ(store->load(0), c);
    EXPECT_EQ(coordinate_reads(), 0u);
}

TEST_F(ObjectStoreTest, ResaveDoesNotDuplicate) {
    auto c = config(0);
    EXPECT_EQ(store->save(c), 0u);
    EXPECT_EQ(store->save(c), 0u);
    EXPECT_EQ(store->count(), 1u);
}

TEST_F(ObjectStoreTest, LoadMissingThrows) {
    EXPECT_THROW(store->load(42), RecordNotFoundError);
    store->save(config(0));
    EXPECT_THROW(store->load(1), RecordNotFoundError);
}

TEST_F(ObjectStoreTest, InitializeTwice) {
    EXPECT_NO_THROW(store->initialize(SizingMetadata(3, 3)));
    EXPECT_THROW(store->initialize(SizingMetadata(4, 3)), SchemaConflictError);
    EXPECT_THROW(registry->initialize(SizingMetadata(3, 2)), SchemaConflictError);
    EXPECT_EQ(store->sizing().n_atoms, 3u);
}

TEST_F(ObjectStoreTest, UninitializedStoreRejectsSave) {
    MemoryTable other;
    StoreRegistry fresh(other);
    ObjectStore& s = fresh.create_store("Configuration");
    EXPECT_FALSE(s.is_initialized());
    EXPECT_THROW(s.save(config(0)), InconsistentStateError);
}

TEST_F(ObjectStoreTest, ClassMismatchThrows) {
    auto m = std::make_shared<Momentum>(3, 3, std::vector<float>(9, 0.0f));
    EXPECT_THROW(store->save(m), InconsistentStateError);
    EXPECT_EQ(store->count(), 0u);
}

TEST_F(ObjectStoreTest, WrongSizingRejected) {
    auto big = std::make_shared<Configuration>(4, 3, std::vector<float>(12, 0.0f));
    EXPECT_THROW(store->save(big), InvalidValueError);
    EXPECT_EQ(store->count(), 0u);
}

TEST_F(ObjectStoreTest, AllIsLazy) {
    for (int i = 0; i < 4; ++i) store->save(config(float(i)));
    store->clear_cache();
    table.reset_stats();

    LazySequence seq = store->all();
    EXPECT_EQ(seq.size(), 4u);
    std::vector<LazyProxy<StorableObject>> proxies;
    for (auto p : seq) {
        proxies.push_back(p);
    }
    EXPECT_EQ(proxies.size(), 4u);
    EXPECT_EQ(coordinate_reads(), 0u);

    auto third = proxies[2].as<Configuration>();
    EXPECT_FLOAT_EQ(third->coordinates()[0], 2.0f);
    EXPECT_EQ(coordinate_reads(), 1u);

    EXPECT_THROW(seq[4], RecordNotFoundError);
}

TEST_F(ObjectStoreTest, AllIsRestartable) {
    store->save(config(0));
    LazySequence seq = store->all();
    size_t first = 0, second = 0;
    for (auto p : seq) { (void)p; ++first; }
    for (auto p : seq) { (void)p; ++second; }
    EXPECT_EQ(first, 1u);
    EXPECT_EQ(second, 1u);
}

TEST_F(ObjectStoreTest, GetMany) {
    for (int i = 0; i < 3; ++i) store->save(config(float(i)));
    auto got = store->get({2, 0});
    ASSERT_EQ(got.size(), 2u);
    EXPECT_FLOAT_EQ(std::static_pointer_cast<Configuration>(got[0])->coordinates()[0], 2.0f);
    EXPECT_THROW(store->get({0, 7}), RecordNotFoundError);
}

TEST_F(ObjectStoreTest, OverwriteInPlace) {
    auto c = config(0);
    store->save(c);
    store->clear_cache();
    store->load(0);

    auto edited = std::make_shared<Configuration>(3, 3, std::vector<float>(9, 7.0f));
    edited->set_index(store->uid(), 0);
    EXPECT_EQ(store->save(edited), 0u);
    EXPECT_EQ(store->count(), 1u);

    EXPECT_EQ(store->load(0), edited);
    store->clear_cache();
    EXPECT_FLOAT_EQ(store->load_as<Configuration>(0)->coordinates()[4], 7.0f);
}

TEST_F(ObjectStoreTest, NamedRecords) {
    auto c = config(0);
    c->set_name("initial");
    store->save(c);
    store->save(config(1));

    uint64_t idx = 99;
    ASSERT_TRUE(store->find("initial", idx));
    EXPECT_EQ(idx, 0u);
    EXPECT_FALSE(store->find("final", idx));

    store->clear_cache();
    EXPECT_EQ(store->load(0)->name(), "initial");
    EXPECT_FALSE(store->load(1)->has_name());
}

TEST_F(ObjectStoreTest, VariableBlock) {
    for (int i = 0; i < 3; ++i) store->save(config(float(10 * i)));

    auto block = store->variable_block("coordinates", {2, 0}, {1});
    ASSERT_EQ(block.size(), 6u);
    EXPECT_FLOAT_EQ(block[0], 21.0f);
    EXPECT_FLOAT_EQ(block[3], 1.0f);

    auto whole = store->variable_block("coordinates", {1});
    EXPECT_EQ(whole.size(), 9u);

    EXPECT_THROW(store->variable_block("coordinates", {0}, {3}), InvalidValueError);
    EXPECT_THROW(store->variable_block("coordinates", {5}), RecordNotFoundError);
    EXPECT_THROW(store->variable_block("charges", {0}), InconsistentStateError);
}

TEST_F(ObjectStoreTest, BoundedCacheStillPreservesLiveIdentity) {
    store->set_cache_policy(std::make_shared<FixedEntriesCachePolicy>(2));
    for (int i = 0; i < 5; ++i) store->save(config(float(i)));

    CacheStats s = store->cache_stats();
    EXPECT_EQ(s.entries, 2u);
    EXPECT_EQ(s.capacity, 2u);
    EXPECT_EQ(s.evictions, 3u);

    // Evicted records are re-read on demand
    table.reset_stats();
    auto zero = store->load_as<Configuration>(0);
    EXPECT_FLOAT_EQ(zero->coordinates()[0], 0.0f);
    EXPECT_EQ(coordinate_reads(), 1u);
}
