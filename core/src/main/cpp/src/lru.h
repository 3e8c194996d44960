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

#include <cstddef>
#include <memory>
#include <unordered_map>

namespace pathstore {

    /**
     * Generic Node for LRU Caching
     *
     * The cache shares ownership of the object with every holder; evicting a
     * node only drops the cache's reference.
     */
    template< typename CachedObjectType, typename IdType >
    struct LRUCacheNode {

        typedef LRUCacheNode<CachedObjectType, IdType> _SelfType;

        explicit LRUCacheNode(const IdType &i, std::shared_ptr<CachedObjectType> o, _SelfType *n)
                : id(i), object(std::move(o)), next(n), prev(nullptr) {}

        IdType id;
        std::shared_ptr<CachedObjectType> object;

        // linked list of cache nodes, MRU first
        _SelfType *next;
        _SelfType *prev;
    };

     /**
      * Definition for LRU Cache functionality
      *
      * Identity map from id to shared object, ordered by recency. The cache
      * does not evict on its own; owners call removeOne() while over budget.
      */
     template< typename CachedObjectType, typename IdType >
     class LRUCache {
     public:
        typedef size_t sizeType;
        typedef LRUCacheNode<CachedObjectType, IdType> Node;
        typedef std::shared_ptr<CachedObjectType> ObjectPtr;

        explicit LRUCache(const sizeType &maxEntries = 0)
                : _first(nullptr), _last(nullptr), _maxEntries(maxEntries) {}

        /**
         * Delete all of the nodes from the cache
         */
        ~LRUCache() { clear(); }

        LRUCache(const LRUCache&) = delete;
        LRUCache& operator=(const LRUCache&) = delete;

        sizeType getMaxEntries() const { return _maxEntries; }
        void updateMaxEntries(sizeType maxEntries) { _maxEntries = maxEntries; }

        // 0 means unbounded
        bool overBudget() const { return _maxEntries != 0 && _index.size() > _maxEntries; }

        sizeType size() const { return _index.size(); }
        bool empty() const { return _index.empty(); }
        bool contains(const IdType &id) const { return _index.count(id) != 0; }

        /**
         * Gets an item by id and promotes it to most recently used.
         * Returns nullptr when absent.
         */
        ObjectPtr get(const IdType &id);

        /**
         * Gets an item by id without touching the recency order
         */
        ObjectPtr peek(const IdType &id) const;

        /**
         * adds an item to the LRUCache as most recently used
         *   re-adding the same object is a no-op apart from promotion;
         *   adding a different object under a live id replaces it
         */
        Node* add(const IdType &id, ObjectPtr object);

        /**
         * removes the least recently used node; caller owns the result
         */
        std::unique_ptr<Node> removeOne();

        /**
         * removes the node for id, if present
         */
        bool removeById(const IdType &id);

        /**
         * Clears all nodes from the cache
         */
        void clear() {
            Node* n = _first;
            while (n) {
                Node* next = n->next;
                delete n;
                n = next;
            }
            _index.clear();
            _first = nullptr;
            _last = nullptr;
        }

     private:
        void unlink(Node* n);
        void pushFront(Node* n);

        // facilitate easy lookup by ID
        std::unordered_map<IdType, Node*> _index;

        // facilitate order by LRU
        Node* _first;
        Node* _last;

        sizeType _maxEntries;
     };

}
