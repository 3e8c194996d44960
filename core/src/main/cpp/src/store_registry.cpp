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

#include "store_registry.h"
#include "records.h"
#include "persistence/errors.h"
#include "persistence/manifest.h"
#include "util/log.h"

namespace pathstore {

namespace {

bool same_descriptor(const ClassDescriptor& a, const ClassDescriptor& b) {
    return a.class_name == b.class_name && a.paired == b.paired && a.features == b.features;
}

} // namespace

StoreRegistry::StoreRegistry(persist::TableInterface& table, const persist::StorageConfig& config)
    : table_(table), config_(config) {
    if (!config_.validate()) {
        throw persist::InvalidValueError("invalid storage configuration");
    }

    register_class({Configuration::kClassName, false, {"coordinates", "box_vectors"}, "configurations"});
    register_class({Momentum::kClassName, false, {"velocities"}, "momenta"});
    register_class({Snapshot::kClassName, true, {"configuration", "momentum"}, "snapshots"});
    register_class({Snapshot::kToyClassName, true, {"coordinates", "velocities"}, "snapshots"});
}

std::unique_ptr<StoreRegistry> StoreRegistry::open(persist::TableInterface& table,
                                                   const persist::StorageConfig& config) {
    return open(table, FeatureRegistry(), config);
}

std::unique_ptr<StoreRegistry> StoreRegistry::open(persist::TableInterface& table,
                                                   const FeatureRegistry& features,
                                                   const persist::StorageConfig& config) {
    persist::Manifest manifest;
    if (!manifest.load(table)) {
        throw persist::StorageIOError("table carries no readable store catalog");
    }

    std::unique_ptr<StoreRegistry> registry(new StoreRegistry(table, config));
    for (const auto& name : features.names()) {
        if (!registry->features_.has(name)) {
            registry->features_.register_feature(features.get(name));
        }
    }

    for (const auto& entry : manifest.get_stores()) {
        ClassDescriptor desc;
        desc.class_name = entry.class_name;
        desc.paired = entry.paired;
        desc.features = entry.features;
        desc.default_store = entry.name;
        if (!registry->has_class(desc.class_name)) {
            registry->register_class(desc);
        } else if (!same_descriptor(registry->descriptor(desc.class_name), desc)) {
            throw persist::SchemaConflictError("catalog layout of class '" + desc.class_name +
                                               "' differs from the registered descriptor");
        }
        registry->create_store(entry.name, entry.class_name);
    }

    const auto& sz = manifest.get_sizing();
    if (sz.present) {
        registry->initialize(SizingMetadata(sz.n_atoms, sz.n_spatial, sz.topology));
    }

    for (const auto& entry : manifest.get_stores()) {
        registry->store_named(entry.name).restore(entry.count);
    }

    for (const auto& entry : manifest.get_dicts()) {
        registry->create_dict_store(entry.name, entry.key_store);
    }

    info() << "StoreRegistry: reopened " << manifest.get_stores().size() << " stores, "
           << manifest.get_dicts().size() << " dict stores";
    return registry;
}

// ========== Classes ==========

void StoreRegistry::register_class(const ClassDescriptor& descriptor) {
    if (descriptor.class_name.empty()) {
        throw persist::InvalidValueError("class descriptor without a class name");
    }
    for (const auto& f : descriptor.features) {
        if (!features_.has(f)) {
            throw persist::UnknownClassError(f);
        }
    }

    std::lock_guard<std::mutex> lock(mu_);
    auto it = classes_.find(descriptor.class_name);
    if (it != classes_.end()) {
        if (same_descriptor(it->second, descriptor)) {
            return;
        }
        throw persist::SchemaConflictError("class '" + descriptor.class_name +
                                           "' is already registered with a different layout");
    }
    ClassDescriptor d = descriptor;
    if (d.default_store.empty()) {
        d.default_store = d.class_name;
    }
    classes_.emplace(d.class_name, d);
}

bool StoreRegistry::has_class(const std::string& class_name) const {
    std::lock_guard<std::mutex> lock(mu_);
    return classes_.count(class_name) != 0;
}

ClassDescriptor StoreRegistry::descriptor(const std::string& class_name) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = classes_.find(class_name);
    if (it == classes_.end()) {
        throw persist::UnknownClassError(class_name);
    }
    return it->second;
}

// ========== Stores ==========

std::shared_ptr<CachePolicy> StoreRegistry::make_cache_policy() const {
    if (config_.cache_policy.empty()) {
        return getDefaultCachePolicy();
    }
    std::shared_ptr<CachePolicy> policy = createCachePolicy(config_.cache_policy);
    if (!policy) {
        throw persist::InvalidValueError("unknown cache policy '" + config_.cache_policy + "'");
    }
    return policy;
}

ObjectStore& StoreRegistry::create_store(const std::string& store_name, const std::string& class_name) {
    std::vector<ObjectStore*> created;
    ObjectStore* store = nullptr;
    bool initialized = false;
    SizingMetadata sizing;
    {
        std::lock_guard<std::mutex> lock(mu_);
        store = &create_store_locked(store_name, class_name, created);
        initialized = initialized_;
        sizing = sizing_;
    }

    // Registry lock is not held across store calls; children come first
    if (initialized) {
        for (ObjectStore* s : created) {
            s->initialize(sizing);
        }
    }
    return *store;
}

ObjectStore& StoreRegistry::create_store(const std::string& class_name) {
    std::string store_name;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = classes_.find(class_name);
        if (it == classes_.end()) {
            throw persist::UnknownClassError(class_name);
        }
        store_name = it->second.default_store;
    }
    return create_store(store_name, class_name);
}

ObjectStore& StoreRegistry::create_store_locked(const std::string& store_name,
                                                const std::string& class_name,
                                                std::vector<ObjectStore*>& created) {
    auto existing = by_name_.find(store_name);
    if (existing != by_name_.end()) {
        if (existing->second->class_name() != class_name) {
            throw persist::SchemaConflictError("store '" + store_name + "' already holds " +
                                               existing->second->class_name());
        }
        return *existing->second;
    }

    for (const auto& d : dicts_) {
        if (d->name() == store_name) {
            throw persist::SchemaConflictError("'" + store_name + "' already names a dict store");
        }
    }

    auto cls = classes_.find(class_name);
    if (cls == classes_.end()) {
        throw persist::UnknownClassError(class_name);
    }
    const ClassDescriptor desc = cls->second;
    FeatureSet features = FeatureSet::from_names(features_, desc.features);

    // Children first, so they initialize before the parent
    for (const auto& f : features.features()) {
        for (const auto& child : f->child_stores()) {
            create_store_locked(child.first, child.second, created);
        }
    }

    std::unique_ptr<ObjectStore> store;
    if (desc.paired) {
        store.reset(new SnapshotStore(store_name, desc, std::move(features), table_, *this,
                                      make_cache_policy()));
    } else {
        store.reset(new ObjectStore(store_name, desc, std::move(features), table_, *this,
                                    make_cache_policy()));
    }

    ObjectStore& ref = *store;
    stores_.push_back(std::move(store));
    by_name_.emplace(store_name, &ref);
    by_class_.emplace(class_name, &ref);
    created.push_back(&ref);
    info() << "StoreRegistry: created store '" << store_name << "' for " << class_name;
    return ref;
}

ObjectStore& StoreRegistry::store_named_locked(const std::string& store_name) const {
    auto it = by_name_.find(store_name);
    if (it == by_name_.end()) {
        throw persist::UnknownClassError(store_name);
    }
    return *it->second;
}

ObjectStore& StoreRegistry::store_named(const std::string& store_name) {
    std::lock_guard<std::mutex> lock(mu_);
    return store_named_locked(store_name);
}

ObjectStore& StoreRegistry::store_for(const std::string& class_name) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = by_class_.find(class_name);
    if (it == by_class_.end()) {
        throw persist::UnknownClassError(class_name);
    }
    return *it->second;
}

SnapshotStore& StoreRegistry::snapshot_store(const std::string& store_name) {
    SnapshotStore* s = dynamic_cast<SnapshotStore*>(&store_named(store_name));
    if (!s) {
        throw persist::InconsistentStateError("store '" + store_name + "' is not a paired store");
    }
    return *s;
}

bool StoreRegistry::has_store(const std::string& store_name) const {
    std::lock_guard<std::mutex> lock(mu_);
    return by_name_.count(store_name) != 0;
}

std::vector<std::string> StoreRegistry::store_names() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> names;
    names.reserve(stores_.size());
    for (const auto& s : stores_) names.push_back(s->name());
    return names;
}

// ========== Dict stores ==========

ObjectDictStore& StoreRegistry::create_dict_store(const std::string& dict_name, const std::string& key_store) {
    ObjectDictStore* dict = nullptr;
    {
        std::lock_guard<std::mutex> lock(mu_);
        ObjectStore& keys = store_named_locked(key_store);
        for (const auto& d : dicts_) {
            if (d->name() != dict_name) continue;
            if (&d->key_store() != &keys) {
                throw persist::SchemaConflictError("dict store '" + dict_name + "' is keyed by " +
                                                   d->key_store().name());
            }
            return *d;
        }
        if (by_name_.count(dict_name)) {
            throw persist::SchemaConflictError("'" + dict_name + "' already names an object store");
        }
        dicts_.emplace_back(new ObjectDictStore(dict_name, keys, table_));
        dict = dicts_.back().get();
    }

    // Columns do not depend on sizing
    dict->initialize();
    info() << "StoreRegistry: created dict store '" << dict_name << "' keyed by " << key_store;
    return *dict;
}

ObjectDictStore& StoreRegistry::dict_store(const std::string& dict_name) {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& d : dicts_) {
        if (d->name() == dict_name) return *d;
    }
    throw persist::UnknownClassError(dict_name);
}

bool StoreRegistry::has_dict_store(const std::string& dict_name) const {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& d : dicts_) {
        if (d->name() == dict_name) return true;
    }
    return false;
}

std::vector<std::string> StoreRegistry::dict_store_names() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> names;
    names.reserve(dicts_.size());
    for (const auto& d : dicts_) names.push_back(d->name());
    return names;
}

// ========== Schema ==========

void StoreRegistry::initialize(const SizingMetadata& sizing) {
    std::vector<ObjectStore*> stores;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (initialized_) {
            if (sizing_ == sizing) {
                return;
            }
            throw persist::SchemaConflictError("registry already initialized with " + sizing_.to_string() +
                                               ", requested " + sizing.to_string());
        }
        for (const auto& s : stores_) stores.push_back(s.get());
    }

    // Creation order puts children before parents
    for (ObjectStore* s : stores) {
        s->initialize(sizing);
    }

    {
        std::lock_guard<std::mutex> lock(mu_);
        if (initialized_ && !(sizing_ == sizing)) {
            throw persist::SchemaConflictError("registry already initialized with " + sizing_.to_string() +
                                               ", requested " + sizing.to_string());
        }
        sizing_ = sizing;
        initialized_ = true;
        stores.clear();
        for (const auto& s : stores_) stores.push_back(s.get());
    }

    // Stores created while the first pass ran; identical repeats are no-ops
    for (ObjectStore* s : stores) {
        s->initialize(sizing);
    }
    info() << "StoreRegistry: initialized " << stores.size() << " stores (" << sizing.to_string() << ")";
}

bool StoreRegistry::is_initialized() const {
    std::lock_guard<std::mutex> lock(mu_);
    return initialized_;
}

SizingMetadata StoreRegistry::sizing() const {
    std::lock_guard<std::mutex> lock(mu_);
    return sizing_;
}

// ========== Records ==========

uint64_t StoreRegistry::save(const std::shared_ptr<StorableObject>& object) {
    if (!object) {
        throw persist::InvalidValueError("cannot save a null record");
    }
    return store_for(object->class_name()).save(object);
}

// ========== Durability ==========

void StoreRegistry::flush() {
    persist::Manifest manifest;
    std::vector<ObjectStore*> stores;
    std::vector<ObjectDictStore*> dicts;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (initialized_) {
            persist::Manifest::SizingInfo sz;
            sz.present = true;
            sz.n_atoms = sizing_.n_atoms;
            sz.n_spatial = sizing_.n_spatial;
            sz.topology = sizing_.topology;
            manifest.set_sizing(sz);
        }
        for (const auto& s : stores_) stores.push_back(s.get());
        for (const auto& d : dicts_) dicts.push_back(d.get());
    }

    // Registry lock is not held across store calls
    for (ObjectStore* s : stores) {
        s->write_metadata();

        persist::Manifest::StoreEntry entry;
        entry.name = s->name();
        entry.class_name = s->class_name();
        entry.paired = s->descriptor().paired;
        entry.features = s->descriptor().features;
        entry.count = s->count();
        manifest.add_store(entry);
    }
    for (ObjectDictStore* d : dicts) {
        d->save();
        manifest.add_dict({d->name(), d->key_store().name()});
    }

    manifest.store(table_);
    table_.flush();
    debug() << "StoreRegistry: flushed catalog of " << stores.size() << " stores";
}

} // namespace pathstore
