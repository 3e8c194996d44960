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

#include "records.h"
#include "persistence/errors.h"
#include <cmath>

namespace pathstore {

namespace {

void require_finite(const std::vector<float>& values, const char* what) {
    for (size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            throw persist::InvalidValueError(std::string(what) + " contains a non-finite value at element " +
                                             std::to_string(i));
        }
    }
}

void require_size(const std::vector<float>& values, size_t expected, const char* what) {
    if (values.size() != expected) {
        throw persist::InvalidValueError(std::string(what) + " has " + std::to_string(values.size()) +
                                         " values, expecting " + std::to_string(expected));
    }
}

const FieldValue& require_array(const FieldMap& fields, const char* name, const char* owner) {
    auto it = fields.find(name);
    if (it == fields.end() || !it->second.is_array() || it->second.shape.size() != 2) {
        throw persist::InvalidValueError(std::string(owner) + " requires a two-dimensional '" +
                                         name + "' field");
    }
    require_size(it->second.data, it->second.element_count(), name);
    return it->second;
}

FieldMap configuration_fields(uint32_t n_atoms, uint32_t n_spatial,
                              std::vector<float> coordinates, std::vector<float> box_vectors) {
    require_size(coordinates, size_t(n_atoms) * n_spatial, "coordinates");
    require_finite(coordinates, "coordinates");

    FieldMap f;
    f["coordinates"] = FieldValue::array({n_atoms, n_spatial}, std::move(coordinates));
    if (!box_vectors.empty()) {
        require_size(box_vectors, size_t(n_spatial) * n_spatial, "box_vectors");
        require_finite(box_vectors, "box_vectors");
        f["box_vectors"] = FieldValue::array({n_spatial, n_spatial}, std::move(box_vectors));
    }
    return f;
}

FieldMap momentum_fields(uint32_t n_atoms, uint32_t n_spatial, std::vector<float> velocities) {
    require_size(velocities, size_t(n_atoms) * n_spatial, "velocities");
    require_finite(velocities, "velocities");

    FieldMap f;
    f["velocities"] = FieldValue::array({n_atoms, n_spatial}, std::move(velocities), Reversal::Negate);
    return f;
}

std::vector<float> negated(const std::vector<float>& v) {
    std::vector<float> out(v.size());
    for (size_t i = 0; i < v.size(); ++i) out[i] = -v[i];
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

Configuration::Configuration(uint32_t n_atoms, uint32_t n_spatial,
                             std::vector<float> coordinates,
                             std::vector<float> box_vectors)
    : StorableObject(kClassName, configuration_fields(n_atoms, n_spatial,
                                                      std::move(coordinates),
                                                      std::move(box_vectors))),
      n_atoms_(n_atoms), n_spatial_(n_spatial) {}

Configuration::Configuration(std::shared_ptr<const FieldMap> fields)
    : StorableObject(kClassName, std::move(fields)) {
    const FieldValue& c = require_array(this->fields(), "coordinates", kClassName);
    n_atoms_ = c.shape[0];
    n_spatial_ = c.shape[1];
    require_finite(c.data, "coordinates");
    if (const FieldValue* b = find_field("box_vectors")) {
        require_finite(b->data, "box_vectors");
    }
}

const std::vector<float>& Configuration::coordinates() const {
    return field("coordinates").data;
}

const std::vector<float>& Configuration::box_vectors() const {
    return field("box_vectors").data;
}

// ---------------------------------------------------------------------------
// Momentum
// ---------------------------------------------------------------------------

Momentum::Momentum(uint32_t n_atoms, uint32_t n_spatial, std::vector<float> velocities)
    : StorableObject(kClassName, momentum_fields(n_atoms, n_spatial, std::move(velocities))),
      n_atoms_(n_atoms), n_spatial_(n_spatial) {}

Momentum::Momentum(std::shared_ptr<const FieldMap> fields)
    : StorableObject(kClassName, std::move(fields)) {
    const FieldValue& v = require_array(this->fields(), "velocities", kClassName);
    n_atoms_ = v.shape[0];
    n_spatial_ = v.shape[1];
    require_finite(v.data, "velocities");
}

const std::vector<float>& Momentum::velocities() const {
    return field("velocities").data;
}

// ---------------------------------------------------------------------------
// Snapshot
// ---------------------------------------------------------------------------

Snapshot::Snapshot(std::string class_name, std::shared_ptr<const FieldMap> payload, bool reversed)
    : StorableObject(std::move(class_name), std::move(payload)), reversed_(reversed) {}

std::shared_ptr<Snapshot> Snapshot::create(const std::shared_ptr<Configuration>& configuration,
                                           const std::shared_ptr<Momentum>& momentum,
                                           bool reversed) {
    return create(LazyProxy<Configuration>(configuration), LazyProxy<Momentum>(momentum), reversed);
}

std::shared_ptr<Snapshot> Snapshot::create(LazyProxy<Configuration> configuration,
                                           LazyProxy<Momentum> momentum,
                                           bool reversed) {
    if (configuration.is_null() || momentum.is_null()) {
        throw persist::InvalidValueError("Snapshot requires a configuration and a momentum");
    }
    FieldMap f;
    f["configuration"] = FieldValue::reference(configuration);
    f["momentum"] = FieldValue::reference(momentum);
    return std::make_shared<Snapshot>(kClassName, std::make_shared<const FieldMap>(std::move(f)),
                                      reversed);
}

std::shared_ptr<Snapshot> Snapshot::toy(uint32_t n_atoms, uint32_t n_spatial,
                                        std::vector<float> coordinates,
                                        std::vector<float> velocities,
                                        bool reversed) {
    FieldMap f = configuration_fields(n_atoms, n_spatial, std::move(coordinates), {});
    FieldMap v = momentum_fields(n_atoms, n_spatial, std::move(velocities));
    f.insert(v.begin(), v.end());
    return std::make_shared<Snapshot>(kToyClassName, std::make_shared<const FieldMap>(std::move(f)),
                                      reversed);
}

LazyProxy<Configuration> Snapshot::configuration() const {
    return field("configuration").ref.as<Configuration>();
}

LazyProxy<Momentum> Snapshot::momentum() const {
    return field("momentum").ref.as<Momentum>();
}

std::vector<float> Snapshot::coordinates() const {
    if (is_toy()) {
        return field("coordinates").data;
    }
    return configuration()->coordinates();
}

std::vector<float> Snapshot::velocities() const {
    if (is_toy()) {
        return logical("velocities");
    }
    const std::vector<float>& v = momentum()->velocities();
    return reversed_ ? negated(v) : v;
}

std::vector<float> Snapshot::logical(const std::string& field_name) const {
    return field(field_name).logical(reversed_);
}

std::shared_ptr<Snapshot> Snapshot::reversed_copy() const {
    // Names belong to one slot; the twin starts unnamed
    return std::make_shared<Snapshot>(class_name(), shared_fields(), !reversed_);
}

bool Snapshot::equals(const StorableObject& o) const {
    const Snapshot* s = dynamic_cast<const Snapshot*>(&o);
    if (!s || s->reversed_ != reversed_) return false;
    return StorableObject::equals(o);
}

std::string Snapshot::describe() const {
    return StorableObject::describe() + (reversed_ ? " reversed" : "");
}

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------

std::shared_ptr<StorableObject> make_record(const std::string& class_name,
                                            std::shared_ptr<const FieldMap> fields) {
    if (class_name == Configuration::kClassName) {
        return std::make_shared<Configuration>(std::move(fields));
    }
    if (class_name == Momentum::kClassName) {
        return std::make_shared<Momentum>(std::move(fields));
    }
    if (class_name == Snapshot::kClassName || class_name == Snapshot::kToyClassName) {
        return std::make_shared<Snapshot>(class_name, std::move(fields), false);
    }
    return std::make_shared<StorableObject>(class_name, std::move(fields));
}

SizingMetadata sizing_from_template(const std::shared_ptr<const StorableObject>& record,
                                    const std::string& topology) {
    if (!record) {
        throw persist::InvalidValueError("sizing template is null");
    }

    const FieldValue* shaped = record->find_field("coordinates");
    if (!shaped) shaped = record->find_field("velocities");

    if (!shaped) {
        if (const FieldValue* ref = record->find_field("configuration")) {
            if (ref->is_reference()) {
                SizingMetadata s = sizing_from_template(ref->ref.get(), topology);
                s.template_record = record;
                return s;
            }
        }
        throw persist::InvalidValueError(record->class_name() + " carries no atom-by-spatial field to size from");
    }
    if (shaped->shape.size() != 2) {
        throw persist::InvalidValueError("sizing template field is not two-dimensional");
    }

    SizingMetadata s(shaped->shape[0], shaped->shape[1], topology);
    s.template_record = record;
    return s;
}

} // namespace pathstore
