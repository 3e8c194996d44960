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

#include <atomic>
#include <cstdint>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "feature.h"
#include "lazy_proxy.h"
#include "object_cache.h"
#include "records.h"
#include "sizing.h"
#include "persistence/table_interface.h"

namespace pathstore {

    /**
     * Record class and the ordered feature list that makes up its layout.
     * Paired classes use the reversal encoding (see SnapshotStore).
     */
    struct ClassDescriptor {
        std::string class_name;
        bool paired = false;
        std::vector<std::string> features;
        std::string default_store;
    };

    class ObjectStore;

    /**
     * Lazy, finite, restartable sequence of proxies for indices [0, size).
     * Iterating performs no table reads; dereferencing a proxy does.
     */
    class LazySequence {
    public:
        class iterator {
        public:
            typedef std::forward_iterator_tag iterator_category;
            typedef LazyProxy<StorableObject> value_type;
            typedef std::ptrdiff_t difference_type;
            typedef void pointer;
            typedef LazyProxy<StorableObject> reference;

            iterator(ObjectStore* store, uint64_t pos) : store_(store), pos_(pos) {}

            LazyProxy<StorableObject> operator*() const;
            iterator& operator++() { ++pos_; return *this; }
            iterator operator++(int) { iterator tmp = *this; ++pos_; return tmp; }

            bool operator==(const iterator& o) const { return store_ == o.store_ && pos_ == o.pos_; }
            bool operator!=(const iterator& o) const { return !(*this == o); }

            uint64_t index() const { return pos_; }

        private:
            ObjectStore* store_;
            uint64_t pos_;
        };

        LazySequence(ObjectStore* store, uint64_t count) : store_(store), count_(count) {}

        iterator begin() const { return iterator(store_, 0); }
        iterator end() const { return iterator(store_, count_); }

        uint64_t size() const { return count_; }
        bool empty() const { return count_ == 0; }

        // RecordNotFoundError past the end
        LazyProxy<StorableObject> operator[](uint64_t i) const;

    private:
        ObjectStore* store_;
        uint64_t count_;
    };

    /**
     * Per-class table manager: index allocation, feature I/O and the
     * identity-preserving cache.
     *
     * Indices are allocated append-only from 0. The table is owned by the
     * caller (normally the StoreRegistry) and must outlive the store.
     * Single writer; concurrent readers are safe because "check cache,
     * else read and insert" runs under one per-store mutex.
     */
    class ObjectStore {
    public:
        ObjectStore(std::string name, ClassDescriptor descriptor, FeatureSet features,
                    persist::TableInterface& table, StoreResolver& resolver,
                    std::shared_ptr<CachePolicy> policy = getDefaultCachePolicy());
        virtual ~ObjectStore() = default;

        ObjectStore(const ObjectStore&) = delete;
        ObjectStore& operator=(const ObjectStore&) = delete;

        const std::string& name() const { return name_; }
        const std::string& class_name() const { return descriptor_.class_name; }
        const ClassDescriptor& descriptor() const { return descriptor_; }
        const FeatureSet& features() const { return features_; }

        // Process-unique id used to key per-record indices
        uint64_t uid() const { return uid_; }

        // One-time schema allocation; identical repeat is a no-op,
        // a differing repeat throws SchemaConflictError
        void initialize(const SizingMetadata& sizing);
        bool is_initialized() const;
        SizingMetadata sizing() const;

        virtual uint64_t save(const std::shared_ptr<StorableObject>& object);
        virtual std::shared_ptr<StorableObject> load(uint64_t index);

        template<typename T>
        std::shared_ptr<T> load_as(uint64_t index) {
            std::shared_ptr<T> typed = std::dynamic_pointer_cast<T>(load(index));
            if (!typed) {
                throw persist::InconsistentStateError("record " + std::to_string(index) + " of '" +
                                                      name_ + "' has an unexpected type");
            }
            return typed;
        }

        // Unresolved handle; performs no reads
        LazyProxy<StorableObject> proxy(uint64_t index);

        LazySequence all();
        std::vector<std::shared_ptr<StorableObject>> get(const std::vector<uint64_t>& indices);

        uint64_t count() const { return count_.load(std::memory_order_acquire); }
        bool contains(uint64_t index) const { return index < count(); }
        bool index_of(const StorableObject& object, uint64_t& out) const;
        bool find(const std::string& name, uint64_t& out) const;

        /**
         * Bulk read of an atom-by-spatial float variable as a flat array of
         * frames x atoms x spatial values, in the order requested. An empty
         * atom list selects every atom.
         */
        std::vector<float> variable_block(const std::string& variable,
                                          const std::vector<uint64_t>& frames,
                                          const std::vector<uint32_t>& atoms = std::vector<uint32_t>());

        CacheStats cache_stats() const;
        void clear_cache();
        void set_cache_policy(std::shared_ptr<CachePolicy> policy);

        // Names are kept in the "<store>.names" table attribute
        void write_metadata();
        // Reattach to rows already present in the table
        void restore(uint64_t count);

        std::string variable_name(const std::string& local) const;

    protected:
        // Table row holding the fields of index
        virtual uint64_t row_of(uint64_t index) const { return index; }
        // Whether the record at index is stored time-reversed
        virtual bool reversed_at(uint64_t) const { return false; }
        // Schema checks that must pass before anything is allocated
        virtual void check_schema(const SizingMetadata&) const {}
        // Extra variables beyond the feature set
        virtual void init_extra(const SizingMetadata&) {}

        void check_initialized() const;
        void check_class(const StorableObject& object) const;

        void write_fields(uint64_t row, const StorableObject& object);
        std::shared_ptr<const FieldMap> read_fields(uint64_t row);
        void remember_name(const StorableObject& object, uint64_t index);
        void apply_name(StorableObject& object, uint64_t index) const;

        const std::string name_;
        const ClassDescriptor descriptor_;
        const FeatureSet features_;
        persist::TableInterface& table_;
        StoreResolver& resolver_;
        const uint64_t uid_;

        mutable std::mutex mu_;
        ObjectCache cache_;
        std::atomic<uint64_t> count_{0};
        bool initialized_ = false;
        SizingMetadata sizing_;
        std::map<std::string, uint64_t> names_;
        std::map<uint64_t, std::string> index_names_;
    };

} // namespace pathstore
