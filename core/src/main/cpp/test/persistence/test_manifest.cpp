/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Store catalog serialization.
 */

#include <gtest/gtest.h>
#include "../../src/persistence/manifest.h"
#include "../../src/persistence/memory_table.h"
#include "../../src/persistence/config.h"

using namespace pathstore::persist;

class ManifestTest : public ::testing::Test {
protected:
    MemoryTable table_;

    static Manifest sample() {
        Manifest manifest;
        Manifest::SizingInfo sizing;
        sizing.present = true;
        sizing.n_atoms = 22;
        sizing.n_spatial = 3;
        sizing.topology = "alanine dipeptide";
        manifest.set_sizing(sizing);

        Manifest::StoreEntry configs;
        configs.name = "configurations";
        configs.class_name = "Configuration";
        configs.features = {"coordinates", "box_vectors"};
        configs.count = 5;
        manifest.add_store(configs);

        Manifest::StoreEntry snaps;
        snaps.name = "snapshots";
        snaps.class_name = "Snapshot";
        snaps.paired = true;
        snaps.features = {"configuration", "momentum"};
        snaps.count = 10;
        manifest.add_store(snaps);

        manifest.add_dict({"phi", "snapshots"});
        return manifest;
    }
};

TEST_F(ManifestTest, StoreAndLoad) {
    Manifest original = sample();
    original.store(table_);

    std::string raw;
    ASSERT_TRUE(table_.get_attribute(store::kCatalogAttribute, raw));
    EXPECT_NE(raw.find("\"snapshots\""), std::string::npos);

    Manifest loaded;
    ASSERT_TRUE(loaded.load(table_));
    EXPECT_EQ(loaded.get_version(), 1u);
    EXPECT_EQ(loaded.get_created_unix(), original.get_created_unix());

    const auto& sizing = loaded.get_sizing();
    EXPECT_TRUE(sizing.present);
    EXPECT_EQ(sizing.n_atoms, 22u);
    EXPECT_EQ(sizing.n_spatial, 3u);
    EXPECT_EQ(sizing.topology, "alanine dipeptide");

    const auto& stores = loaded.get_stores();
    ASSERT_EQ(stores.size(), 2u);
    EXPECT_EQ(stores[0].name, "configurations");
    EXPECT_FALSE(stores[0].paired);
    EXPECT_EQ(stores[0].features, (std::vector<std::string>{"coordinates", "box_vectors"}));
    EXPECT_EQ(stores[1].class_name, "Snapshot");
    EXPECT_TRUE(stores[1].paired);
    EXPECT_EQ(stores[1].count, 10u);

    const auto& dicts = loaded.get_dicts();
    ASSERT_EQ(dicts.size(), 1u);
    EXPECT_EQ(dicts[0].name, "phi");
    EXPECT_EQ(dicts[0].key_store, "snapshots");
}

TEST_F(ManifestTest, CatalogWithoutDicts) {
    Manifest loaded;
    ASSERT_TRUE(loaded.from_json("{\"version\": 1, \"stores\": []}"));
    EXPECT_TRUE(loaded.get_dicts().empty());
    EXPECT_FALSE(loaded.from_json("{\"version\": 1, \"dicts\": [{\"name\": \"phi\"}]}"));
}

TEST_F(ManifestTest, MissingCatalog) {
    Manifest manifest;
    EXPECT_FALSE(manifest.load(table_));
}

TEST_F(ManifestTest, UninitializedSizingIsNull) {
    Manifest manifest;
    std::string json = manifest.to_json();
    EXPECT_NE(json.find("\"sizing\": null"), std::string::npos);

    Manifest loaded;
    ASSERT_TRUE(loaded.from_json(json));
    EXPECT_FALSE(loaded.get_sizing().present);
    EXPECT_TRUE(loaded.get_stores().empty());
}

TEST_F(ManifestTest, RejectsMalformed) {
    Manifest manifest;
    EXPECT_FALSE(manifest.from_json("{not json"));
    EXPECT_FALSE(manifest.from_json("[1, 2]"));
    EXPECT_FALSE(manifest.from_json("{\"version\": 7, \"stores\": []}"));
    EXPECT_FALSE(manifest.from_json("{\"version\": 1, \"stores\": [{\"class\": \"Snapshot\"}]}"));
    EXPECT_FALSE(manifest.from_json("{\"version\": 1, \"sizing\": {\"n_atoms\": \"x\"}}"));
}
