/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Paired snapshot storage: one physical row per time-reversal pair.
 */

#include <gtest/gtest.h>
#include "../src/snapshot_store.h"
#include "../src/store_registry.h"
#include "../src/trajectory.h"
#include "../src/persistence/memory_table.h"

using namespace pathstore;
using namespace pathstore::persist;

class SnapshotStoreTest : public ::testing::Test {
protected:
    MemoryTable table;
    std::unique_ptr<StoreRegistry> registry;
    SnapshotStore* snaps = nullptr;

    void SetUp() override {
        registry.reset(new StoreRegistry(table));
        registry->create_store("ToySnapshot");
        snaps = &registry->snapshot_store("snapshots");
        registry->initialize(SizingMetadata(2, 2));
    }

    static std::shared_ptr<Snapshot> toy(float x, bool reversed = false) {
        return Snapshot::toy(2, 2, {x, x + 1, x + 2, x + 3}, {1, -1, 2, -2}, reversed);
    }

    IoStats coords() const { return table.stats("snapshots.coordinates"); }
    IoStats flags() const { return table.stats("snapshots.is_reversed"); }
};

TEST_F(SnapshotStoreTest, SaveAllocatesPair) {
    EXPECT_EQ(snaps->save(toy(0)), 0u);
    EXPECT_EQ(snaps->count(), 2u);
    EXPECT_EQ(snaps->save(toy(10)), 2u);
    EXPECT_EQ(snaps->count(), 4u);

    // One physical row per pair
    EXPECT_EQ(table.row_count("snapshots.coordinates"), 2u);
    EXPECT_EQ(table.row_count("snapshots.is_reversed"), 4u);
    EXPECT_EQ(coords().writes, 2u);

    for (uint64_t i = 0; i < 4; ++i) {
        EXPECT_NE(snaps->is_reversed(i), snaps->is_reversed(SnapshotStore::sibling(i)));
    }
    EXPECT_FALSE(snaps->is_reversed(0));
    EXPECT_TRUE(snaps->is_reversed(1));
}

TEST_F(SnapshotStoreTest, SiblingArithmetic) {
    EXPECT_EQ(SnapshotStore::sibling(0), 1u);
    EXPECT_EQ(SnapshotStore::sibling(1), 0u);
    EXPECT_EQ(SnapshotStore::sibling(6), 7u);
    EXPECT_EQ(SnapshotStore::pair_row(7), 3u);
}

TEST_F(SnapshotStoreTest, ReversedSaveTakesEvenSlot) {
    EXPECT_EQ(snaps->save(toy(0, true)), 0u);
    EXPECT_TRUE(snaps->is_reversed(0));
    EXPECT_FALSE(snaps->is_reversed(1));

    snaps->clear_cache();
    auto fwd = snaps->load_snapshot(1);
    EXPECT_FALSE(fwd->is_reversed());
    EXPECT_EQ(fwd->velocities(), (std::vector<float>{1, -1, 2, -2}));
}

TEST_F(SnapshotStoreTest, LoadReversedWithoutForward) {
    snaps->save(toy(0));
    snaps->clear_cache();
    table.reset_stats();

    auto bwd = snaps->load_snapshot(1);
    EXPECT_TRUE(bwd->is_reversed());
    EXPECT_EQ(bwd->coordinates(), (std::vector<float>{0, 1, 2, 3}));
    EXPECT_EQ(bwd->velocities(), (std::vector<float>{-1, 1, -2, 2}));
    EXPECT_EQ(coords().reads, 1u);

    // The forward twin comes from the cached payload
    auto fwd = snaps->load_snapshot(0);
    EXPECT_FALSE(fwd->is_reversed());
    EXPECT_TRUE(fwd->is_twin_of(*bwd));
    EXPECT_EQ(coords().reads, 1u);
    EXPECT_EQ(flags().reads, 2u);
}

TEST_F(SnapshotStoreTest, LoadReversedAfterSaveReadsNoPayload) {
    auto fwd = toy(0);
    snaps->save(fwd);
    table.reset_stats();

    auto bwd = snaps->load_snapshot(1);
    EXPECT_TRUE(bwd->is_reversed());
    EXPECT_TRUE(bwd->is_twin_of(*fwd));
    EXPECT_EQ(coords().reads, 0u);
    EXPECT_EQ(table.stats("snapshots.velocities").reads, 0u);
}

TEST_F(SnapshotStoreTest, SavingTwinWritesNothing) {
    auto fwd = toy(0);
    snaps->save(fwd);
    table.reset_stats();

    auto bwd = fwd->reversed_copy();
    EXPECT_EQ(snaps->save(bwd), 1u);
    EXPECT_EQ(snaps->count(), 2u);
    EXPECT_EQ(coords().writes, 0u);
    EXPECT_EQ(flags().writes, 0u);

    EXPECT_EQ(snaps->load(1), bwd);
}

TEST_F(SnapshotStoreTest, ReversedProxy) {
    snaps->save(toy(0));
    snaps->clear_cache();
    table.reset_stats();

    LazyProxy<Snapshot> p = snaps->reversed(0);
    EXPECT_EQ(p.index(), 1u);
    EXPECT_FALSE(p.is_resolved());
    EXPECT_EQ(coords().reads, 0u);
    EXPECT_TRUE(p->is_reversed());

    EXPECT_THROW(snaps->reversed(2), RecordNotFoundError);
}

TEST_F(SnapshotStoreTest, MissingIndex) {
    EXPECT_THROW(snaps->load(0), RecordNotFoundError);
    snaps->save(toy(0));
    EXPECT_THROW(snaps->load(2), RecordNotFoundError);
    EXPECT_THROW(snaps->is_reversed(2), RecordNotFoundError);
}

TEST_F(SnapshotStoreTest, BrokenPairingIsDetected) {
    snaps->save(toy(0));
    uint8_t same = 0;
    table.write_row("snapshots.is_reversed", 1, &same, 1);
    snaps->clear_cache();

    snaps->load(0);
    EXPECT_THROW(snaps->load(1), InconsistentStateError);
}

TEST_F(SnapshotStoreTest, VelocityBlockFollowsDirection) {
    snaps->save(toy(0));
    auto block = snaps->variable_block("velocities", {0, 1});
    ASSERT_EQ(block.size(), 8u);
    EXPECT_FLOAT_EQ(block[0], 1.0f);
    EXPECT_FLOAT_EQ(block[4], -1.0f);

    auto pos = snaps->variable_block("coordinates", {0, 1});
    EXPECT_FLOAT_EQ(pos[1], pos[5]);
}

TEST_F(SnapshotStoreTest, RewriteUpdatesBothHalves) {
    auto fwd = toy(0);
    snaps->save(fwd);
    snaps->load(1);

    auto edited = Snapshot::toy(2, 2, {5, 5, 5, 5}, {1, 1, 1, 1}, true);
    edited->set_index(snaps->uid(), 0);
    EXPECT_EQ(snaps->save(edited), 0u);
    EXPECT_EQ(snaps->count(), 2u);

    EXPECT_TRUE(snaps->is_reversed(0));
    EXPECT_FALSE(snaps->is_reversed(1));
    auto other = snaps->load_snapshot(1);
    EXPECT_EQ(other->coordinates(), (std::vector<float>{5, 5, 5, 5}));
    EXPECT_FALSE(other->is_reversed());
}

TEST_F(SnapshotStoreTest, TwinOfReplacedPayloadGetsItsOwnPair) {
    auto fwd = toy(0);
    snaps->save(fwd);
    auto stale_twin = fwd->reversed_copy();

    auto edited = toy(5);
    edited->set_index(snaps->uid(), 0);
    EXPECT_EQ(snaps->save(edited), 0u);

    // The old payload is gone from the row, so its twin is a new record
    uint64_t idx = snaps->save(stale_twin);
    EXPECT_EQ(idx, 2u);
    EXPECT_EQ(snaps->count(), 4u);

    snaps->clear_cache();
    auto loaded = snaps->load_snapshot(idx);
    EXPECT_TRUE(loaded->equals(*stale_twin));
    EXPECT_EQ(loaded->coordinates(), (std::vector<float>{0, 1, 2, 3}));
    EXPECT_EQ(snaps->load_snapshot(0)->coordinates(), (std::vector<float>{5, 6, 7, 8}));
}

TEST_F(SnapshotStoreTest, NameStaysOnSavedSlot) {
    auto fwd = toy(0);
    fwd->set_name("start");
    EXPECT_EQ(snaps->save(fwd), 0u);
    EXPECT_EQ(snaps->save(fwd->reversed_copy()), 1u);

    uint64_t idx = 99;
    ASSERT_TRUE(snaps->find("start", idx));
    EXPECT_EQ(idx, 0u);

    snaps->clear_cache();
    EXPECT_EQ(snaps->load(0)->name(), "start");
    EXPECT_FALSE(snaps->load(1)->has_name());
}

TEST_F(SnapshotStoreTest, RequiresPairedClass) {
    ClassDescriptor plain{"Configuration", false, {"coordinates"}, "frames"};
    FeatureSet features = FeatureSet::from_names(registry->features(), plain.features);
    EXPECT_THROW(SnapshotStore("frames", plain, features, table, *registry),
                 InconsistentStateError);
}

TEST_F(SnapshotStoreTest, FlagCollisionAllocatesNothing) {
    FeatureSet features = FeatureSet::from_names(registry->features(), {"coordinates"});
    features.add(std::make_shared<ArrayFeature>(
        "is_reversed", std::vector<ArrayFeature::Dim>{ArrayFeature::Dim::ATOM}));
    ClassDescriptor desc{"ToySnapshot", true, {"coordinates", "is_reversed"}, "flagged"};

    MemoryTable other;
    SnapshotStore store("flagged", desc, features, other, *registry);
    EXPECT_THROW(store.initialize(SizingMetadata(2, 2)), SchemaConflictError);
    EXPECT_FALSE(store.is_initialized());
    EXPECT_TRUE(other.variable_names().empty());
}

TEST_F(SnapshotStoreTest, TrajectoryOfStoredFrames) {
    Trajectory traj;
    for (int i = 0; i < 3; ++i) {
        uint64_t idx = snaps->save(toy(float(i)));
        traj.push_back(snaps->proxy(idx).as<Snapshot>());
    }

    Trajectory back = traj.reversed();
    EXPECT_EQ(back.indices(), (std::vector<uint64_t>{5, 3, 1}));
    EXPECT_TRUE(back[0]->is_reversed());
    EXPECT_FLOAT_EQ(back[0]->coordinates()[0], 2.0f);
    EXPECT_EQ(back.reversed().indices(), traj.indices());
}

class CompositeSnapshotTest : public ::testing::Test {
protected:
    MemoryTable table;
    std::unique_ptr<StoreRegistry> registry;

    void SetUp() override {
        registry.reset(new StoreRegistry(table));
        registry->create_store("Snapshot");
        registry->initialize(SizingMetadata(1, 3));
    }

    static std::shared_ptr<Snapshot> snapshot(float x) {
        return Snapshot::create(std::make_shared<Configuration>(1, 3, std::vector<float>{x, 0, 0}),
                                std::make_shared<Momentum>(1, 3, std::vector<float>{0, x, 0}));
    }
};

TEST_F(CompositeSnapshotTest, ChildrenReceiveParts) {
    SnapshotStore& snaps = registry->snapshot_store("snapshots");
    EXPECT_EQ(snaps.save(snapshot(1)), 0u);
    EXPECT_EQ(snaps.save(snapshot(2)), 2u);

    EXPECT_EQ(registry->store_named("configurations").count(), 2u);
    EXPECT_EQ(registry->store_named("momenta").count(), 2u);
    EXPECT_EQ(snaps.reference_index(2, "configuration"), 1u);
    EXPECT_EQ(snaps.reference_index(3, "momentum"), 1u);
    EXPECT_THROW(snaps.reference_index(0, "coordinates"), InconsistentStateError);
}

TEST_F(CompositeSnapshotTest, ReversedCompositeNegatesVelocities) {
    SnapshotStore& snaps = registry->snapshot_store("snapshots");
    snaps.save(snapshot(4));
    for (const auto& name : registry->store_names()) {
        registry->store_named(name).clear_cache();
    }

    auto bwd = snaps.load_snapshot(1);
    EXPECT_TRUE(bwd->is_reversed());
    EXPECT_FALSE(bwd->configuration().is_resolved());
    EXPECT_EQ(bwd->coordinates(), (std::vector<float>{4, 0, 0}));
    EXPECT_EQ(bwd->velocities(), (std::vector<float>{0, -4, 0}));

    // Both halves point at the same stored parts
    auto fwd = snaps.load_snapshot(0);
    EXPECT_EQ(fwd->configuration().get(), bwd->configuration().get());
}

TEST_F(CompositeSnapshotTest, SharedPartIsStoredOnce) {
    auto conf = std::make_shared<Configuration>(1, 3, std::vector<float>{1, 1, 1});
    auto a = Snapshot::create(conf, std::make_shared<Momentum>(1, 3, std::vector<float>{1, 0, 0}));
    auto b = Snapshot::create(conf, std::make_shared<Momentum>(1, 3, std::vector<float>{0, 1, 0}));

    registry->save(a);
    registry->save(b);
    EXPECT_EQ(registry->store_named("configurations").count(), 1u);
    EXPECT_EQ(registry->store_named("momenta").count(), 2u);
}
