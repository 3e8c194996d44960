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

#include "lru.h"

namespace pathstore {

    template< typename CachedObjectType, typename IdType >
    void LRUCache<CachedObjectType, IdType>::unlink(Node* n) {
        if (n->prev) {
            n->prev->next = n->next;
        } else {
            _first = n->next;
        }
        if (n->next) {
            n->next->prev = n->prev;
        } else {
            _last = n->prev;
        }
        n->next = nullptr;
        n->prev = nullptr;
    }

    template< typename CachedObjectType, typename IdType >
    void LRUCache<CachedObjectType, IdType>::pushFront(Node* n) {
        n->prev = nullptr;
        n->next = _first;
        if (_first) {
            _first->prev = n;
        }
        _first = n;
        if (!_last) {
            _last = n;
        }
    }

    /**
     * Adds a node to the front of the cache list
     */
    template< typename CachedObjectType, typename IdType >
    typename LRUCache<CachedObjectType, IdType>::Node*
        LRUCache<CachedObjectType, IdType>::add(const IdType &id, ObjectPtr object) {

        auto it = _index.find(id);
        if (it != _index.end()) {
            Node* existing = it->second;
            if (existing->object != object) {
                existing->object = std::move(object);
            }
            if (existing != _first) {
                unlink(existing);
                pushFront(existing);
            }
            return existing;
        }

        Node* node = new Node(id, std::move(object), nullptr);
        pushFront(node);
        _index.emplace(id, node);
        return node;
    }

    /**
     * Removes the LRU node
     */
    template< typename CachedObjectType, typename IdType >
    std::unique_ptr<typename LRUCache<CachedObjectType, IdType>::Node>
        LRUCache<CachedObjectType, IdType>::removeOne() {
        if (!_last)
            return nullptr;

        Node* node = _last;
        unlink(node);
        _index.erase(node->id);
        return std::unique_ptr<Node>(node);
    }

    template< typename CachedObjectType, typename IdType >
    bool LRUCache<CachedObjectType, IdType>::removeById(const IdType &id) {
        auto it = _index.find(id);
        if (it == _index.end())
            return false;

        Node* node = it->second;
        _index.erase(it);
        unlink(node);
        delete node;
        return true;
    }

    template< typename CachedObjectType, typename IdType >
    typename LRUCache<CachedObjectType, IdType>::ObjectPtr
        LRUCache<CachedObjectType, IdType>::get(const IdType &id) {
        auto it = _index.find(id);
        if (it == _index.end())
            return nullptr;

        Node* node = it->second;
        if (node != _first) {
            unlink(node);
            pushFront(node);
        }
        return node->object;
    }

    template< typename CachedObjectType, typename IdType >
    typename LRUCache<CachedObjectType, IdType>::ObjectPtr
        LRUCache<CachedObjectType, IdType>::peek(const IdType &id) const {
        auto it = _index.find(id);
        if (it == _index.end())
            return nullptr;
        return it->second->object;
    }

}
