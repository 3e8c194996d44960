/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Feature schema building and column encoding.
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cmath>
#include "../src/feature.h"
#include "../src/store_registry.h"
#include "../src/persistence/memory_table.h"

using namespace pathstore;
using namespace pathstore::persist;
using ::testing::_;
using ::testing::Return;

class MockFeature : public Feature {
public:
    explicit MockFeature(const std::string& name) : Feature(name) {}

    MOCK_METHOD(std::vector<VariableSpec>, variables, (const SizingMetadata&), (const, override));
    MOCK_METHOD(void, write, (TableInterface&, const std::string&, uint64_t,
                              const StorableObject&, StoreResolver&), (const, override));
    MOCK_METHOD(void, read, (const TableInterface&, const std::string&, uint64_t,
                             FieldMap&, StoreResolver&), (const, override));
};

class MockResolver : public StoreResolver {
public:
    MOCK_METHOD(ObjectStore&, store_named, (const std::string&), (override));
    MOCK_METHOD(ObjectStore&, store_for, (const std::string&), (override));
};

class FeatureTest : public ::testing::Test {
protected:
    MemoryTable table;
    MockResolver resolver;
    SizingMetadata sizing{2, 3};

    static VariableSpec float_var(const std::string& name) {
        VariableSpec spec;
        spec.name = name;
        spec.dtype = DataType::FLOAT32;
        spec.shape = {2};
        return spec;
    }
};

TEST_F(FeatureTest, DuplicateVariableFailsBeforeAnyAllocation) {
    auto a = std::make_shared<MockFeature>("a");
    auto b = std::make_shared<MockFeature>("b");
    EXPECT_CALL(*a, variables(_)).WillRepeatedly(Return(std::vector<VariableSpec>{float_var("x")}));
    EXPECT_CALL(*b, variables(_)).WillRepeatedly(Return(std::vector<VariableSpec>{float_var("x")}));
    EXPECT_CALL(*a, write(_, _, _, _, _)).Times(0);
    EXPECT_CALL(*b, write(_, _, _, _, _)).Times(0);

    FeatureSet set({a, b});
    EXPECT_THROW(set.init(table, "things", sizing), SchemaConflictError);
    EXPECT_TRUE(table.variable_names().empty());
}

TEST_F(FeatureTest, InitPrefixesVariables) {
    auto a = std::make_shared<MockFeature>("a");
    EXPECT_CALL(*a, variables(_)).WillRepeatedly(Return(std::vector<VariableSpec>{float_var("x")}));

    FeatureSet set({a});
    set.init(table, "things", sizing);
    EXPECT_TRUE(table.has_variable("things.x"));
    EXPECT_EQ(Feature::qualified("", "x"), "x");
}

TEST_F(FeatureTest, WriteAndReadRunInOrder) {
    auto a = std::make_shared<MockFeature>("a");
    auto b = std::make_shared<MockFeature>("b");
    ::testing::InSequence seq;
    EXPECT_CALL(*a, write(_, "p", 4u, _, _));
    EXPECT_CALL(*b, write(_, "p", 4u, _, _));
    EXPECT_CALL(*a, read(_, "p", 4u, _, _));
    EXPECT_CALL(*b, read(_, "p", 4u, _, _));

    FeatureSet set({a, b});
    StorableObject obj("Thing", FieldMap());
    set.write(table, "p", 4, obj, resolver);
    FieldMap out;
    set.read(table, "p", 4, out, resolver);
}

TEST_F(FeatureTest, ArrayFeatureShapes) {
    typedef ArrayFeature::Dim Dim;
    ArrayFeature coords("coordinates", {Dim::ATOM, Dim::SPATIAL});
    ArrayFeature box("box_vectors", {Dim::SPATIAL, Dim::SPATIAL}, Reversal::Identity, true);

    EXPECT_EQ(coords.shape(sizing), (std::vector<uint32_t>{2, 3}));
    EXPECT_EQ(box.shape(sizing), (std::vector<uint32_t>{3, 3}));
    EXPECT_TRUE(box.optional());

    auto vars = coords.variables(sizing);
    ASSERT_EQ(vars.size(), 1u);
    EXPECT_EQ(vars[0].name, "coordinates");
    EXPECT_EQ(vars[0].row_bytes(), 24u);
}

TEST_F(FeatureTest, ArrayFeatureRoundTrip) {
    typedef ArrayFeature::Dim Dim;
    ArrayFeature vel("velocities", {Dim::ATOM, Dim::SPATIAL}, Reversal::Negate);
    vel.init(table, "s", sizing);

    Momentum m(2, 3, {1, 2, 3, 4, 5, 6});
    vel.write(table, "s", 0, m, resolver);

    FieldMap out;
    vel.read(table, "s", 0, out, resolver);
    ASSERT_EQ(out.count("velocities"), 1u);
    EXPECT_EQ(out["velocities"].data, m.velocities());
    EXPECT_EQ(out["velocities"].reversal, Reversal::Negate);
}

TEST_F(FeatureTest, ArrayFeatureShapeMismatch) {
    typedef ArrayFeature::Dim Dim;
    ArrayFeature coords("coordinates", {Dim::ATOM, Dim::SPATIAL});
    coords.init(table, "s", sizing);

    Configuration wrong(3, 3, std::vector<float>(9, 0.0f));
    EXPECT_THROW(coords.write(table, "s", 0, wrong, resolver), InvalidValueError);
    EXPECT_EQ(table.row_count("s.coordinates"), 0u);
}

TEST_F(FeatureTest, OptionalFeatureAbsentRoundTrip) {
    typedef ArrayFeature::Dim Dim;
    ArrayFeature box("box_vectors", {Dim::SPATIAL, Dim::SPATIAL}, Reversal::Identity, true);
    ArrayFeature coords("coordinates", {Dim::ATOM, Dim::SPATIAL});
    box.init(table, "s", sizing);
    coords.init(table, "s", sizing);

    Configuration c(2, 3, std::vector<float>(6, 1.0f));
    box.write(table, "s", 0, c, resolver);
    EXPECT_EQ(table.row_count("s.box_vectors"), 1u);

    FieldMap out;
    box.read(table, "s", 0, out, resolver);
    EXPECT_EQ(out.count("box_vectors"), 0u);

    // Required fields are not optional
    StorableObject empty("Configuration", FieldMap());
    EXPECT_THROW(coords.write(table, "s", 0, empty, resolver), InvalidValueError);
}

TEST_F(FeatureTest, ReferenceFeatureDeclaresChild) {
    ReferenceFeature ref("configuration", "configurations", "Configuration");
    auto vars = ref.variables(sizing);
    ASSERT_EQ(vars.size(), 1u);
    EXPECT_EQ(vars[0].dtype, DataType::INT64);
    EXPECT_TRUE(vars[0].shape.empty());

    auto children = ref.child_stores();
    ASSERT_EQ(children.size(), 1u);
    EXPECT_EQ(children[0].first, "configurations");
    EXPECT_EQ(children[0].second, "Configuration");
}

TEST_F(FeatureTest, ReferenceFeatureReusesStoredIndex) {
    StoreRegistry registry(table);
    ObjectStore& configs = registry.create_store("Configuration");
    registry.initialize(sizing);

    auto c = std::make_shared<Configuration>(2, 3, std::vector<float>(6, 0.5f));
    configs.save(std::make_shared<Configuration>(2, 3, std::vector<float>(6, 0.0f)));
    uint64_t idx = configs.save(c);
    ASSERT_EQ(idx, 1u);

    ReferenceFeature ref("configuration", "configurations", "Configuration");
    ref.init(table, "holder", sizing);

    FieldMap f;
    f["configuration"] = FieldValue::reference(LazyProxy<StorableObject>(std::static_pointer_cast<StorableObject>(c)));
    StorableObject holder("Holder", std::move(f));
    ref.write(table, "holder", 0, holder, registry);

    // Already stored: no second copy in the child store
    EXPECT_EQ(configs.count(), 2u);
    EXPECT_EQ(ref.read_index(table, "holder", 0), 1u);

    FieldMap out;
    ref.read(table, "holder", 0, out, registry);
    ASSERT_TRUE(out["configuration"].is_reference());
    EXPECT_EQ(out["configuration"].ref.index(), 1u);
    EXPECT_EQ(out["configuration"].ref.get(), c);
}

TEST_F(FeatureTest, Registry) {
    FeatureRegistry reg;
    EXPECT_TRUE(reg.has("coordinates"));
    EXPECT_TRUE(reg.has("velocities"));
    EXPECT_TRUE(reg.has("box_vectors"));
    EXPECT_TRUE(reg.has("configuration"));
    EXPECT_TRUE(reg.has("momentum"));
    EXPECT_EQ(reg.get("velocities")->reversal(), Reversal::Negate);
    EXPECT_EQ(reg.get("box_vectors")->reversal(), Reversal::Identity);
    EXPECT_THROW(reg.get("charges"), UnknownClassError);

    auto dup = std::make_shared<ArrayFeature>("coordinates", std::vector<ArrayFeature::Dim>{});
    EXPECT_THROW(reg.register_feature(dup), SchemaConflictError);

    auto same = reg.get("coordinates");
    EXPECT_NO_THROW(reg.register_feature(same));

    auto set = FeatureSet::from_names(reg, {"coordinates", "velocities"});
    EXPECT_EQ(set.size(), 2u);
    EXPECT_NE(set.find("velocities"), nullptr);
    EXPECT_EQ(set.find("momentum"), nullptr);
    EXPECT_THROW(FeatureSet::from_names(reg, {"nope"}), UnknownClassError);
}
