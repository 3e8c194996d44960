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

#include "lazy_proxy.h"
#include "object_store.h"
#include "util/log.h"

namespace pathstore {
namespace detail {

std::shared_ptr<StorableObject> ProxySlot::resolve() {
    std::lock_guard<std::mutex> lock(mu_);

    switch (state_) {
        case State::RESOLVED:
            return object_;
        case State::FAILED:
            throw *failure_;
        case State::UNRESOLVED:
        case State::RESOLVING:
            break;
    }

    state_ = State::RESOLVING;
    try {
        object_ = store_->load(index_);
        state_ = State::RESOLVED;
        trace() << "LazyProxy: resolved " << store_->name() << "[" << index_ << "]";
        return object_;
    } catch (const persist::RecordNotFoundError& e) {
        failure_.reset(new persist::RecordNotFoundError(e));
        state_ = State::FAILED;
        debug() << "LazyProxy: " << e.what();
        throw;
    } catch (const std::exception&) {
        state_ = State::UNRESOLVED;
        throw;
    }
}

} // namespace detail
} // namespace pathstore
