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
#include <memory>
#include "lru.hpp"
#include "cache_policy.hpp"
#include "storable_object.h"

namespace pathstore {

    struct CacheStats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        size_t entries = 0;
        size_t capacity = 0;    // 0 = unlimited
    };

    /**
     * Bounded identity map from store index to materialized record.
     *
     * Not synchronized; the owning ObjectStore serializes access.
     */
    class ObjectCache {
    public:
        explicit ObjectCache(std::shared_ptr<CachePolicy> policy = getDefaultCachePolicy())
            : policy_(policy ? std::move(policy) : getDefaultCachePolicy()),
              lru_(policy_->getMaxEntries()) {}

        // Counts a hit or a miss and promotes on hit
        std::shared_ptr<StorableObject> get(uint64_t index) {
            std::shared_ptr<StorableObject> obj = lru_.get(index);
            if (obj) {
                stats_.hits++;
            } else {
                stats_.misses++;
            }
            return obj;
        }

        // No statistics, no promotion
        std::shared_ptr<StorableObject> peek(uint64_t index) const {
            return lru_.peek(index);
        }

        bool contains(uint64_t index) const { return lru_.contains(index); }

        // Inserting the object already cached under index is a no-op
        void insert(uint64_t index, std::shared_ptr<StorableObject> object) {
            lru_.add(index, std::move(object));
            while (lru_.overBudget()) {
                std::unique_ptr<LRUCache<StorableObject, uint64_t>::Node> victim = lru_.removeOne();
                if (!victim) break;
                stats_.evictions++;
            }
        }

        bool invalidate(uint64_t index) { return lru_.removeById(index); }

        void clear() { lru_.clear(); }

        size_t size() const { return lru_.size(); }
        size_t capacity() const { return lru_.getMaxEntries(); }
        const CachePolicy& policy() const { return *policy_; }

        void setPolicy(std::shared_ptr<CachePolicy> policy) {
            policy_ = std::move(policy);
            lru_.updateMaxEntries(policy_->getMaxEntries());
            while (lru_.overBudget()) {
                if (!lru_.removeOne()) break;
                stats_.evictions++;
            }
        }

        CacheStats stats() const {
            CacheStats s = stats_;
            s.entries = lru_.size();
            s.capacity = lru_.getMaxEntries();
            return s;
        }

        void resetStats() { stats_ = CacheStats(); }

    private:
        std::shared_ptr<CachePolicy> policy_;
        LRUCache<StorableObject, uint64_t> lru_;
        CacheStats stats_;
    };

} // namespace pathstore
