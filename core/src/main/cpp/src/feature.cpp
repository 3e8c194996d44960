/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include "feature.h"
#include "object_store.h"
#include "storable_object.h"
#include "persistence/config.h"
#include "persistence/errors.h"
#include "util/endian.hpp"
#include "util/log.h"
#include <cmath>
#include <limits>

namespace pathstore {

// ---------------------------------------------------------------------------
// Feature
// ---------------------------------------------------------------------------

std::string Feature::qualified(const std::string& prefix, const std::string& variable) {
    if (prefix.empty()) return variable;
    return prefix + persist::table::kNameSeparator + variable;
}

void Feature::init(persist::TableInterface& table, const std::string& prefix,
                   const SizingMetadata& sizing) const {
    for (persist::VariableSpec spec : variables(sizing)) {
        spec.name = qualified(prefix, spec.name);
        table.create_variable(spec);
    }
}

// ---------------------------------------------------------------------------
// ArrayFeature
// ---------------------------------------------------------------------------

ArrayFeature::ArrayFeature(std::string name, std::vector<Dim> dims,
                           Reversal reversal, bool optional, std::string description)
    : Feature(std::move(name), reversal),
      dims_(std::move(dims)),
      optional_(optional),
      description_(std::move(description)) {}

std::vector<uint32_t> ArrayFeature::shape(const SizingMetadata& sizing) const {
    std::vector<uint32_t> s;
    s.reserve(dims_.size());
    for (Dim d : dims_) {
        s.push_back(d == Dim::ATOM ? sizing.n_atoms : sizing.n_spatial);
    }
    return s;
}

std::vector<persist::VariableSpec> ArrayFeature::variables(const SizingMetadata& sizing) const {
    persist::VariableSpec spec;
    spec.name = name();
    spec.dtype = persist::DataType::FLOAT32;
    spec.shape = shape(sizing);
    spec.description = description_;
    return {spec};
}

void ArrayFeature::write(persist::TableInterface& table, const std::string& prefix,
                         uint64_t row, const StorableObject& object,
                         StoreResolver&) const {
    const std::string var = qualified(prefix, name());
    persist::VariableSpec spec;
    if (!table.variable_spec(var, spec)) {
        throw persist::InconsistentStateError("variable '" + var + "' was never allocated");
    }

    std::vector<uint8_t> buf(spec.row_bytes());
    const FieldValue* v = object.find_field(name());
    if (!v) {
        if (!optional_) {
            throw persist::InvalidValueError(object.class_name() + " is missing required field '" +
                                             name() + "'");
        }
        std::vector<float> absent(spec.element_count(), std::numeric_limits<float>::quiet_NaN());
        util::store_lef32_array(buf.data(), absent.data(), absent.size());
    } else {
        if (!v->is_array()) {
            throw persist::InvalidValueError("field '" + name() + "' is not an array");
        }
        if (v->shape != spec.shape || v->data.size() != spec.element_count()) {
            throw persist::InvalidValueError("field '" + name() + "' has shape " +
                                             persist::format_shape(v->shape) +
                                             ", store expects " + spec.shape_string());
        }
        util::store_lef32_array(buf.data(), v->data.data(), v->data.size());
    }
    table.write_row(var, row, buf.data(), buf.size());
}

void ArrayFeature::read(const persist::TableInterface& table, const std::string& prefix,
                        uint64_t row, FieldMap& out, StoreResolver&) const {
    const std::string var = qualified(prefix, name());
    persist::VariableSpec spec;
    if (!table.variable_spec(var, spec)) {
        throw persist::InconsistentStateError("variable '" + var + "' was never allocated");
    }

    std::vector<uint8_t> buf(spec.row_bytes());
    table.read_row(var, row, buf.data(), buf.size());

    std::vector<float> data(spec.element_count());
    util::load_lef32_array(buf.data(), data.data(), data.size());

    if (optional_) {
        bool all_nan = true;
        for (float f : data) {
            if (!std::isnan(f)) { all_nan = false; break; }
        }
        if (all_nan) return;
    }
    out[name()] = FieldValue::array(spec.shape, std::move(data), reversal());
}

// ---------------------------------------------------------------------------
// ReferenceFeature
// ---------------------------------------------------------------------------

ReferenceFeature::ReferenceFeature(std::string name, std::string child_store, std::string child_class)
    : Feature(std::move(name)),
      child_store_(std::move(child_store)),
      child_class_(std::move(child_class)) {}

std::vector<persist::VariableSpec> ReferenceFeature::variables(const SizingMetadata&) const {
    persist::VariableSpec spec;
    spec.name = name();
    spec.dtype = persist::DataType::INT64;
    spec.description = "index into " + child_store_;
    return {spec};
}

std::vector<std::pair<std::string, std::string>> ReferenceFeature::child_stores() const {
    return {{child_store_, child_class_}};
}

void ReferenceFeature::write(persist::TableInterface& table, const std::string& prefix,
                             uint64_t row, const StorableObject& object,
                             StoreResolver& resolver) const {
    const FieldValue& v = object.field(name());
    if (!v.is_reference() || v.ref.is_null()) {
        throw persist::InvalidValueError("field '" + name() + "' is not a record reference");
    }

    ObjectStore& child = resolver.store_named(child_store_);
    uint64_t index = 0;
    if (v.ref.has_index() && v.ref.store() == &child) {
        index = v.ref.index();
    } else {
        std::shared_ptr<StorableObject> target = v.ref.get();
        if (!child.index_of(*target, index)) {
            index = child.save(target);
        }
    }

    uint8_t buf[8];
    util::store_le_i64(buf, static_cast<int64_t>(index));
    table.write_row(qualified(prefix, name()), row, buf, sizeof(buf));
}

uint64_t ReferenceFeature::read_index(const persist::TableInterface& table, const std::string& prefix,
                                      uint64_t row) const {
    uint8_t buf[8];
    table.read_row(qualified(prefix, name()), row, buf, sizeof(buf));
    int64_t index = util::load_le_i64(buf);
    if (index < 0) {
        throw persist::InconsistentStateError("negative reference index in '" +
                                              qualified(prefix, name()) + "'");
    }
    return static_cast<uint64_t>(index);
}

void ReferenceFeature::read(const persist::TableInterface& table, const std::string& prefix,
                            uint64_t row, FieldMap& out, StoreResolver& resolver) const {
    uint64_t index = read_index(table, prefix, row);
    ObjectStore& child = resolver.store_named(child_store_);
    out[name()] = FieldValue::reference(child.proxy(index));
}

// ---------------------------------------------------------------------------
// FeatureRegistry
// ---------------------------------------------------------------------------

FeatureRegistry::FeatureRegistry() {
    typedef ArrayFeature::Dim Dim;
    register_feature(std::make_shared<ArrayFeature>(
        "coordinates", std::vector<Dim>{Dim::ATOM, Dim::SPATIAL},
        Reversal::Identity, false, "atomic positions"));
    register_feature(std::make_shared<ArrayFeature>(
        "velocities", std::vector<Dim>{Dim::ATOM, Dim::SPATIAL},
        Reversal::Negate, false, "atomic velocities"));
    register_feature(std::make_shared<ArrayFeature>(
        "box_vectors", std::vector<Dim>{Dim::SPATIAL, Dim::SPATIAL},
        Reversal::Identity, true, "periodic box vectors"));
    register_feature(std::make_shared<ReferenceFeature>(
        "configuration", "configurations", "Configuration"));
    register_feature(std::make_shared<ReferenceFeature>(
        "momentum", "momenta", "Momentum"));
}

void FeatureRegistry::register_feature(FeaturePtr feature) {
    if (!feature) {
        throw persist::InvalidValueError("cannot register a null feature");
    }
    auto it = features_.find(feature->name());
    if (it != features_.end()) {
        if (it->second == feature) return;
        throw persist::SchemaConflictError("feature '" + feature->name() + "' is already registered");
    }
    features_.emplace(feature->name(), std::move(feature));
}

FeaturePtr FeatureRegistry::get(const std::string& name) const {
    auto it = features_.find(name);
    if (it == features_.end()) {
        throw persist::UnknownClassError(name);
    }
    return it->second;
}

std::vector<std::string> FeatureRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(features_.size());
    for (const auto& kv : features_) out.push_back(kv.first);
    return out;
}

// ---------------------------------------------------------------------------
// FeatureSet
// ---------------------------------------------------------------------------

FeatureSet FeatureSet::from_names(const FeatureRegistry& registry,
                                  const std::vector<std::string>& names) {
    FeatureSet set;
    for (const auto& n : names) {
        set.add(registry.get(n));
    }
    return set;
}

const Feature* FeatureSet::find(const std::string& name) const {
    for (const auto& f : features_) {
        if (f->name() == name) return f.get();
    }
    return nullptr;
}

std::vector<persist::VariableSpec> FeatureSet::variables(const std::string& prefix,
                                                         const SizingMetadata& sizing) const {
    std::vector<persist::VariableSpec> all;
    std::map<std::string, std::string> owner;
    for (const auto& f : features_) {
        for (persist::VariableSpec spec : f->variables(sizing)) {
            spec.name = Feature::qualified(prefix, spec.name);
            auto ins = owner.emplace(spec.name, f->name());
            if (!ins.second) {
                throw persist::SchemaConflictError("variable '" + spec.name + "' is declared by both '" +
                                                   ins.first->second + "' and '" + f->name() + "'");
            }
            all.push_back(std::move(spec));
        }
    }
    return all;
}

void FeatureSet::init(persist::TableInterface& table, const std::string& prefix,
                      const SizingMetadata& sizing) const {
    // Raises before any allocation when two features collide
    std::vector<persist::VariableSpec> all = variables(prefix, sizing);
    for (const auto& f : features_) {
        f->init(table, prefix, sizing);
    }
    debug() << "FeatureSet: allocated " << all.size() << " variables under '" << prefix << "'";
}

void FeatureSet::write(persist::TableInterface& table, const std::string& prefix,
                       uint64_t row, const StorableObject& object, StoreResolver& resolver) const {
    for (const auto& f : features_) {
        f->write(table, prefix, row, object, resolver);
    }
}

void FeatureSet::read(const persist::TableInterface& table, const std::string& prefix,
                      uint64_t row, FieldMap& out, StoreResolver& resolver) const {
    for (const auto& f : features_) {
        f->read(table, prefix, row, out, resolver);
    }
}

} // namespace pathstore
