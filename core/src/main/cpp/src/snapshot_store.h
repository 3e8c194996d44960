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
#include <string>
#include "object_store.h"
#include "records.h"

namespace pathstore {

    /**
     * Object store for paired snapshot classes.
     *
     * Indices 2k and 2k+1 are the two time directions of one physical
     * payload: feature variables hold one row per pair (row k) and only
     * the "<store>.is_reversed" column holds one row per index, with
     * is_reversed(i) == !is_reversed(i ^ 1). Whichever half is saved first
     * takes the even slot; saving its in-memory twin afterwards returns the
     * odd slot without writing anything.
     */
    class SnapshotStore : public ObjectStore {
    public:
        SnapshotStore(std::string name, ClassDescriptor descriptor, FeatureSet features,
                      persist::TableInterface& table, StoreResolver& resolver,
                      std::shared_ptr<CachePolicy> policy = getDefaultCachePolicy());

        uint64_t save(const std::shared_ptr<StorableObject>& object) override;
        std::shared_ptr<StorableObject> load(uint64_t index) override;

        std::shared_ptr<Snapshot> load_snapshot(uint64_t index) { return load_as<Snapshot>(index); }

        // Proxy for the time-reversed twin of index
        LazyProxy<Snapshot> reversed(uint64_t index);

        // Stored flag of index, read from the table
        bool is_reversed(uint64_t index) const;

        // Child-store index a composite snapshot references through feature
        uint64_t reference_index(uint64_t index, const std::string& feature) const;

        static uint64_t sibling(uint64_t index) { return index ^ 1; }
        static uint64_t pair_row(uint64_t index) { return index >> 1; }

    protected:
        uint64_t row_of(uint64_t index) const override { return pair_row(index); }
        bool reversed_at(uint64_t index) const override { return is_reversed(index); }
        void check_schema(const SizingMetadata& sizing) const override;
        void init_extra(const SizingMetadata& sizing) override;

    private:
        struct PayloadEntry {
            std::weak_ptr<const FieldMap> payload;
            uint64_t even_index;
            bool even_reversed;
        };

        std::string flag_variable() const;
        bool read_flag(uint64_t index) const;
        void write_flag(uint64_t index, bool reversed);
        void register_payload(const std::shared_ptr<const FieldMap>& payload,
                              uint64_t index, bool reversed);
        // Drop every payload registered for the pair holding index
        void forget_pair(uint64_t index);
        bool lookup_payload(const std::shared_ptr<const FieldMap>& payload, PayloadEntry& out);

        // Keyed by payload address; entries whose payload died are pruned
        std::map<const FieldMap*, PayloadEntry> payloads_;
    };

} // namespace pathstore
