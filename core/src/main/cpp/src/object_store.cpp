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

#include "object_store.h"
#include "persistence/config.h"
#include "persistence/errors.h"
#include "util/endian.hpp"
#include "util/log.h"
#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/error/en.h"

namespace pathstore {

namespace {
    std::atomic<uint64_t> next_store_uid{1};
}

// ---------------------------------------------------------------------------
// LazySequence
// ---------------------------------------------------------------------------

LazyProxy<StorableObject> LazySequence::iterator::operator*() const {
    return store_->proxy(pos_);
}

LazyProxy<StorableObject> LazySequence::operator[](uint64_t i) const {
    if (i >= count_) {
        throw persist::RecordNotFoundError(store_->name(), i);
    }
    return store_->proxy(i);
}

// ---------------------------------------------------------------------------
// ObjectStore
// ---------------------------------------------------------------------------

ObjectStore::ObjectStore(std::string name, ClassDescriptor descriptor, FeatureSet features,
                         persist::TableInterface& table, StoreResolver& resolver,
                         std::shared_ptr<CachePolicy> policy)
    : name_(std::move(name)),
      descriptor_(std::move(descriptor)),
      features_(std::move(features)),
      table_(table),
      resolver_(resolver),
      uid_(next_store_uid.fetch_add(1)),
      cache_(std::move(policy)) {
    debug() << "ObjectStore: created '" << name_ << "' for " << descriptor_.class_name
            << " (cache " << cache_.policy().name() << ", " << cache_.capacity() << " entries)";
}

std::string ObjectStore::variable_name(const std::string& local) const {
    return Feature::qualified(name_, local);
}

void ObjectStore::initialize(const SizingMetadata& sizing) {
    std::lock_guard<std::mutex> lock(mu_);
    if (initialized_) {
        if (sizing_ == sizing) {
            return;
        }
        throw persist::SchemaConflictError("store '" + name_ + "' already initialized with " +
                                           sizing_.to_string() + ", requested " + sizing.to_string());
    }
    check_schema(sizing);
    features_.init(table_, name_, sizing);
    init_extra(sizing);
    sizing_ = sizing;
    initialized_ = true;
    info() << "ObjectStore: initialized '" << name_ << "' (" << descriptor_.class_name << ", "
           << sizing.to_string() << ")";
}

bool ObjectStore::is_initialized() const {
    std::lock_guard<std::mutex> lock(mu_);
    return initialized_;
}

SizingMetadata ObjectStore::sizing() const {
    std::lock_guard<std::mutex> lock(mu_);
    return sizing_;
}

void ObjectStore::check_initialized() const {
    if (!initialized_) {
        throw persist::InconsistentStateError("store '" + name_ + "' used before initialize()");
    }
}

void ObjectStore::check_class(const StorableObject& object) const {
    if (object.class_name() != descriptor_.class_name) {
        throw persist::InconsistentStateError("store '" + name_ + "' holds " + descriptor_.class_name +
                                              " records, got " + object.class_name());
    }
}

void ObjectStore::write_fields(uint64_t row, const StorableObject& object) {
    features_.write(table_, name_, row, object, resolver_);
}

std::shared_ptr<const FieldMap> ObjectStore::read_fields(uint64_t row) {
    FieldMap fields;
    features_.read(table_, name_, row, fields, resolver_);
    return std::make_shared<const FieldMap>(std::move(fields));
}

void ObjectStore::remember_name(const StorableObject& object, uint64_t index) {
    if (!object.has_name()) return;
    names_[object.name()] = index;
    index_names_[index] = object.name();
}

void ObjectStore::apply_name(StorableObject& object, uint64_t index) const {
    auto it = index_names_.find(index);
    if (it != index_names_.end()) {
        object.set_name(it->second);
    }
}

uint64_t ObjectStore::save(const std::shared_ptr<StorableObject>& object) {
    if (!object) {
        throw persist::InvalidValueError("cannot save a null record into '" + name_ + "'");
    }
    check_class(*object);

    std::lock_guard<std::mutex> lock(mu_);
    check_initialized();

    uint64_t index = 0;
    if (object->index_in(uid_, index)) {
        write_fields(row_of(index), *object);
        remember_name(*object, index);
        cache_.invalidate(index);
        cache_.insert(index, object);
        debug() << "ObjectStore: rewrote " << name_ << "[" << index << "]";
        return index;
    }

    index = count_.load(std::memory_order_relaxed);
    write_fields(row_of(index), *object);
    count_.store(index + 1, std::memory_order_release);

    object->set_index(uid_, index);
    remember_name(*object, index);
    cache_.insert(index, object);
    trace() << "ObjectStore: saved " << name_ << "[" << index << "]";
    return index;
}

std::shared_ptr<StorableObject> ObjectStore::load(uint64_t index) {
    if (index >= count()) {
        throw persist::RecordNotFoundError(name_, index);
    }

    std::lock_guard<std::mutex> lock(mu_);
    check_initialized();

    if (std::shared_ptr<StorableObject> cached = cache_.get(index)) {
        return cached;
    }

    std::shared_ptr<StorableObject> object = make_record(descriptor_.class_name, read_fields(row_of(index)));
    object->set_index(uid_, index);
    apply_name(*object, index);
    cache_.insert(index, object);
    trace() << "ObjectStore: loaded " << name_ << "[" << index << "]";
    return object;
}

LazyProxy<StorableObject> ObjectStore::proxy(uint64_t index) {
    return LazyProxy<StorableObject>(this, index);
}

LazySequence ObjectStore::all() {
    return LazySequence(this, count());
}

std::vector<std::shared_ptr<StorableObject>> ObjectStore::get(const std::vector<uint64_t>& indices) {
    std::vector<std::shared_ptr<StorableObject>> out;
    out.reserve(indices.size());
    for (uint64_t i : indices) {
        out.push_back(load(i));
    }
    return out;
}

bool ObjectStore::index_of(const StorableObject& object, uint64_t& out) const {
    uint64_t index = 0;
    if (!object.index_in(uid_, index) || index >= count()) {
        return false;
    }
    out = index;
    return true;
}

bool ObjectStore::find(const std::string& name, uint64_t& out) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = names_.find(name);
    if (it == names_.end()) return false;
    out = it->second;
    return true;
}

std::vector<float> ObjectStore::variable_block(const std::string& variable,
                                               const std::vector<uint64_t>& frames,
                                               const std::vector<uint32_t>& atoms) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        check_initialized();
    }

    const std::string var = variable_name(variable);
    persist::VariableSpec spec;
    if (!table_.variable_spec(var, spec)) {
        throw persist::InconsistentStateError("store '" + name_ + "' has no variable '" + variable + "'");
    }
    if (spec.dtype != persist::DataType::FLOAT32 || spec.shape.size() != 2) {
        throw persist::InvalidValueError("variable '" + var + "' is not an atom-by-spatial float array");
    }

    const uint32_t n_atoms = spec.shape[0];
    const uint32_t n_spatial = spec.shape[1];
    std::vector<uint32_t> selected = atoms;
    if (selected.empty()) {
        selected.resize(n_atoms);
        for (uint32_t a = 0; a < n_atoms; ++a) selected[a] = a;
    }
    for (uint32_t a : selected) {
        if (a >= n_atoms) {
            throw persist::InvalidValueError("atom index " + std::to_string(a) + " out of range for '" +
                                             var + "'");
        }
    }

    const Feature* feature = features_.find(variable);
    const bool negates = feature && feature->reversal() == Reversal::Negate;

    std::vector<uint8_t> buf(spec.row_bytes());
    std::vector<float> row(spec.element_count());
    std::vector<float> out;
    out.reserve(frames.size() * selected.size() * n_spatial);

    for (uint64_t frame : frames) {
        if (frame >= count()) {
            throw persist::RecordNotFoundError(name_, frame);
        }
        table_.read_row(var, row_of(frame), buf.data(), buf.size());
        util::load_lef32_array(buf.data(), row.data(), row.size());
        const float sign = (negates && reversed_at(frame)) ? -1.0f : 1.0f;
        for (uint32_t a : selected) {
            const float* p = row.data() + size_t(a) * n_spatial;
            for (uint32_t d = 0; d < n_spatial; ++d) {
                out.push_back(sign * p[d]);
            }
        }
    }
    return out;
}

CacheStats ObjectStore::cache_stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    return cache_.stats();
}

void ObjectStore::clear_cache() {
    std::lock_guard<std::mutex> lock(mu_);
    cache_.clear();
}

void ObjectStore::set_cache_policy(std::shared_ptr<CachePolicy> policy) {
    std::lock_guard<std::mutex> lock(mu_);
    cache_.setPolicy(policy ? std::move(policy) : getDefaultCachePolicy());
}

void ObjectStore::write_metadata() {
    std::lock_guard<std::mutex> lock(mu_);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    for (const auto& kv : names_) {
        writer.Key(kv.first.c_str(), static_cast<rapidjson::SizeType>(kv.first.size()));
        writer.Uint64(kv.second);
    }
    writer.EndObject();

    table_.set_attribute(name_ + persist::store::kNamesSuffix,
                         std::string(buffer.GetString(), buffer.GetSize()));
}

void ObjectStore::restore(uint64_t count) {
    std::lock_guard<std::mutex> lock(mu_);
    count_.store(count, std::memory_order_release);
    cache_.clear();
    names_.clear();
    index_names_.clear();

    std::string json;
    if (!table_.get_attribute(name_ + persist::store::kNamesSuffix, json)) {
        return;
    }

    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        error() << "ObjectStore: unreadable name index for '" << name_ << "': "
                << rapidjson::GetParseError_En(doc.GetParseError());
        throw persist::StorageIOError("name index of store '" + name_ + "' is corrupt");
    }
    for (const auto& m : doc.GetObject()) {
        if (!m.value.IsUint64()) continue;
        std::string n(m.name.GetString(), m.name.GetStringLength());
        names_[n] = m.value.GetUint64();
        index_names_[m.value.GetUint64()] = n;
    }
    debug() << "ObjectStore: restored '" << name_ << "' with " << count << " records";
}

} // namespace pathstore
