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
#include <mutex>
#include <string>
#include <type_traits>
#include "persistence/errors.h"

namespace pathstore {

    class ObjectStore;
    class StorableObject;

    namespace detail {

        /**
         * Resolution state shared by every copy of a proxy.
         *
         *   UNRESOLVED -> RESOLVING -> RESOLVED   (terminal)
         *                          \-> FAILED     (terminal, RecordNotFoundError)
         *
         * Any other failure during RESOLVING returns the slot to UNRESOLVED.
         */
        class ProxySlot {
        public:
            enum class State {
                UNRESOLVED,
                RESOLVING,
                RESOLVED,
                FAILED
            };

            ProxySlot(ObjectStore* store, uint64_t index)
                : store_(store), index_(index), state_(State::UNRESOLVED) {}

            explicit ProxySlot(std::shared_ptr<StorableObject> object)
                : store_(nullptr), index_(0), state_(State::RESOLVED), object_(std::move(object)) {}

            ObjectStore* store() const { return store_; }
            uint64_t index() const { return index_; }

            State state() const {
                std::lock_guard<std::mutex> lock(mu_);
                return state_;
            }

            // Resolved object, or nullptr without triggering a load
            std::shared_ptr<StorableObject> peek() const {
                std::lock_guard<std::mutex> lock(mu_);
                return object_;
            }

            std::shared_ptr<StorableObject> resolve();

        private:
            ObjectStore* const store_;
            const uint64_t index_;

            mutable std::mutex mu_;
            State state_;
            std::shared_ptr<StorableObject> object_;
            std::unique_ptr<persist::RecordNotFoundError> failure_;
        };

    } // namespace detail

    /**
     * Handle to a record of type T held by an ObjectStore.
     *
     * Carries (store, index) until first access, then resolves through the
     * store's cache and loader. Copies share the resolution state. A proxy
     * built from an in-memory object is resolved from the start.
     */
    template<typename T>
    class LazyProxy {
    public:
        typedef detail::ProxySlot::State State;

        LazyProxy() = default;

        LazyProxy(ObjectStore* store, uint64_t index)
            : slot_(std::make_shared<detail::ProxySlot>(store, index)) {}

        explicit LazyProxy(std::shared_ptr<T> object) {
            if (object) {
                slot_ = std::make_shared<detail::ProxySlot>(
                    std::static_pointer_cast<StorableObject>(std::move(object)));
            }
        }

        // Upcast, sharing resolution state
        template<typename U,
                 typename = typename std::enable_if<std::is_base_of<T, U>::value &&
                                                    !std::is_same<T, U>::value>::type>
        LazyProxy(const LazyProxy<U>& o) : slot_(o.slot_) {}

        bool is_null() const { return !slot_; }
        explicit operator bool() const { return !is_null(); }

        State state() const {
            return slot_ ? slot_->state() : State::UNRESOLVED;
        }

        bool is_resolved() const { return state() == State::RESOLVED; }

        // True when the proxy addresses a stored record rather than wrapping
        // an in-memory object
        bool has_index() const { return slot_ && slot_->store() != nullptr; }
        ObjectStore* store() const { return slot_ ? slot_->store() : nullptr; }
        uint64_t index() const { return slot_ ? slot_->index() : 0; }

        std::shared_ptr<T> get() const {
            if (!slot_) {
                throw persist::InconsistentStateError("dereferencing a null proxy");
            }
            std::shared_ptr<T> typed = std::dynamic_pointer_cast<T>(slot_->resolve());
            if (!typed) {
                throw persist::InconsistentStateError("proxy target has an unexpected record class");
            }
            return typed;
        }

        T* operator->() const { return get().get(); }
        T& operator*() const { return *get(); }

        // Reinterpret as a proxy of another record type, sharing resolution state
        template<typename U>
        LazyProxy<U> as() const {
            LazyProxy<U> p;
            p.slot_ = slot_;
            return p;
        }

        bool same_target(const LazyProxy& o) const {
            if (slot_ == o.slot_) return true;
            if (!slot_ || !o.slot_) return false;
            if (has_index() && o.has_index()) {
                return slot_->store() == o.slot_->store() && slot_->index() == o.slot_->index();
            }
            if (!has_index() && !o.has_index()) {
                return slot_->peek() == o.slot_->peek();
            }
            return false;
        }

        const std::shared_ptr<detail::ProxySlot>& slot() const { return slot_; }

    private:
        template<typename U> friend class LazyProxy;

        std::shared_ptr<detail::ProxySlot> slot_;
    };

} // namespace pathstore
