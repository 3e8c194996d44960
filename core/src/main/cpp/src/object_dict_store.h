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

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include "object_store.h"
#include "persistence/table_interface.h"

namespace pathstore {

    /**
     * Per-record float values keyed by the records of another store, such
     * as an order parameter evaluated on snapshots.
     *
     * Values set on a record that is not yet stored stay in memory until a
     * save() after the record gets an index. Saved values live in two
     * columns indexed like the key store: "<name>.values" and a
     * "<name>.present" flag, so unset rows read back as absent.
     *
     * Usage:
     *   ObjectDictStore& phi = registry.create_dict_store("phi", "snapshots");
     *   phi.set(snapshot, 1.25f);
     *   registry.save(snapshot);
     *   phi.save();
     *
     * The key store and the table must outlive the dict store.
     */
    class ObjectDictStore {
    public:
        ObjectDictStore(std::string name, ObjectStore& keys, persist::TableInterface& table);

        ObjectDictStore(const ObjectDictStore&) = delete;
        ObjectDictStore& operator=(const ObjectDictStore&) = delete;

        const std::string& name() const { return name_; }
        ObjectStore& key_store() const { return keys_; }

        // Allocates both columns; repeats are no-ops
        void initialize();
        bool is_initialized() const;

        void set(const std::shared_ptr<StorableObject>& key, float value);

        // RecordNotFoundError when index is not a stored key
        void set(uint64_t index, float value);

        // False when no value is known for the key
        bool get(const StorableObject& key, float& out) const;
        bool get(uint64_t index, float& out) const;

        /**
         * Write every value whose key now has an index in the key store.
         * Values of keys that are still unsaved are kept. Returns the
         * number of rows written.
         */
        size_t save();

        // Values not yet written to the table
        size_t pending() const;

        // Drop loaded values; unsaved ones are kept
        void clear_cache();

    private:
        struct PendingValue {
            std::shared_ptr<StorableObject> key;
            float value;
        };

        void check_initialized() const;
        bool read_locked(uint64_t index, float& out) const;
        void write_locked(uint64_t index, float value);

        const std::string name_;
        ObjectStore& keys_;
        persist::TableInterface& table_;
        const std::string values_var_;
        const std::string present_var_;

        mutable std::mutex mu_;
        bool initialized_ = false;
        std::map<const StorableObject*, PendingValue> unsaved_;
        mutable std::map<uint64_t, float> values_;
        std::set<uint64_t> dirty_;
    };

} // namespace pathstore
