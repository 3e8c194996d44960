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

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "feature.h"
#include "object_dict_store.h"
#include "object_store.h"
#include "snapshot_store.h"
#include "sizing.h"
#include "persistence/storage_config.h"
#include "persistence/table_interface.h"

namespace pathstore {

/**
 * StoreRegistry: composes object stores over one table.
 *
 * Resolves class descriptors (class + ordered feature list) into concrete
 * stores, creates the child stores a parent's reference features need
 * before the parent, and persists a catalog so a file can be reopened.
 *
 * Usage:
 *   persist::FileTable table("run.pstr");
 *   StoreRegistry registry(table);
 *   registry.create_store("snapshots", "Snapshot");   // also configurations, momenta
 *   registry.initialize(SizingMetadata(22, 3, "alanine dipeptide"));
 *   uint64_t idx = registry.save(snapshot);
 *   registry.create_dict_store("phi", "snapshots").set(snapshot, 1.25f);
 *   registry.flush();
 *
 *   auto reopened = StoreRegistry::open(table);
 *   auto custom = StoreRegistry::open(table, my_features);
 *
 * Thread-safety:
 *   Store creation and lookup are serialized; record I/O goes through the
 *   individual stores. The registry lock is never held while calling into
 *   a store, so stores may resolve siblings while holding their own lock.
 */
class StoreRegistry : public StoreResolver {
public:
    explicit StoreRegistry(persist::TableInterface& table,
                           const persist::StorageConfig& config = persist::StorageConfig::defaults());
    ~StoreRegistry() override = default;

    // Disable copy/move
    StoreRegistry(const StoreRegistry&) = delete;
    StoreRegistry& operator=(const StoreRegistry&) = delete;

    /**
     * Rebuild a registry from a previously flushed table.
     * StorageIOError when the table carries no readable catalog.
     */
    static std::unique_ptr<StoreRegistry> open(persist::TableInterface& table,
                                               const persist::StorageConfig& config =
                                                   persist::StorageConfig::defaults());

    /**
     * Same, with collaborator features the catalog may name. Features the
     * new registry already knows under the same name are kept.
     */
    static std::unique_ptr<StoreRegistry> open(persist::TableInterface& table,
                                               const FeatureRegistry& features,
                                               const persist::StorageConfig& config =
                                                   persist::StorageConfig::defaults());

    // ========== Classes ==========

    FeatureRegistry& features() { return features_; }
    const FeatureRegistry& features() const { return features_; }

    /**
     * Register a class descriptor. Re-registering an identical descriptor is
     * a no-op; a different one under the same class throws SchemaConflictError.
     */
    void register_class(const ClassDescriptor& descriptor);
    bool has_class(const std::string& class_name) const;
    ClassDescriptor descriptor(const std::string& class_name) const;

    // ========== Stores ==========

    /**
     * Create a store for class_name, first creating any child store its
     * reference features require. Returns the existing store when one of
     * that name already holds the same class.
     */
    ObjectStore& create_store(const std::string& store_name, const std::string& class_name);

    // Create the store under the descriptor's default name
    ObjectStore& create_store(const std::string& class_name);

    ObjectStore& store_named(const std::string& store_name) override;
    ObjectStore& store_for(const std::string& class_name) override;
    SnapshotStore& snapshot_store(const std::string& store_name);

    bool has_store(const std::string& store_name) const;

    // Store names in creation order
    std::vector<std::string> store_names() const;

    // ========== Dict stores ==========

    /**
     * Create a dict store keyed by the records of key_store. Returns the
     * existing one when the name is already bound to the same key store;
     * SchemaConflictError when the name is taken otherwise.
     */
    ObjectDictStore& create_dict_store(const std::string& dict_name, const std::string& key_store);
    ObjectDictStore& dict_store(const std::string& dict_name);
    bool has_dict_store(const std::string& dict_name) const;
    std::vector<std::string> dict_store_names() const;

    // ========== Schema ==========

    /**
     * Initialize every store in dependency order. Stores created later are
     * initialized on creation. A differing repeat throws SchemaConflictError.
     */
    void initialize(const SizingMetadata& sizing);
    void initialize(const SystemDescription& system) { initialize(system.sizing()); }
    bool is_initialized() const;
    SizingMetadata sizing() const;

    // ========== Records ==========

    // Save into the store registered for the record's class
    uint64_t save(const std::shared_ptr<StorableObject>& object);

    // ========== Durability ==========

    // Write names, counts, dict values and the catalog, then flush the table
    void flush();

    persist::TableInterface& table() { return table_; }
    const persist::StorageConfig& config() const { return config_; }

private:
    // Appends every store it creates to created, children first
    ObjectStore& create_store_locked(const std::string& store_name, const std::string& class_name,
                                     std::vector<ObjectStore*>& created);
    ObjectStore& store_named_locked(const std::string& store_name) const;
    std::shared_ptr<CachePolicy> make_cache_policy() const;

    persist::TableInterface& table_;
    persist::StorageConfig config_;
    FeatureRegistry features_;

    mutable std::mutex mu_;
    std::map<std::string, ClassDescriptor> classes_;
    std::vector<std::unique_ptr<ObjectStore>> stores_;   // creation order
    std::map<std::string, ObjectStore*> by_name_;
    std::map<std::string, ObjectStore*> by_class_;       // first store of each class
    std::vector<std::unique_ptr<ObjectDictStore>> dicts_;
    bool initialized_ = false;
    SizingMetadata sizing_;
};

} // namespace pathstore
