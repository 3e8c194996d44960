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

#include "snapshot_store.h"
#include "persistence/config.h"
#include "persistence/errors.h"
#include "util/log.h"

namespace pathstore {

SnapshotStore::SnapshotStore(std::string name, ClassDescriptor descriptor, FeatureSet features,
                             persist::TableInterface& table, StoreResolver& resolver,
                             std::shared_ptr<CachePolicy> policy)
    : ObjectStore(std::move(name), std::move(descriptor), std::move(features),
                  table, resolver, std::move(policy)) {
    if (!descriptor_.paired) {
        throw persist::InconsistentStateError("store '" + name_ + "' requires a paired class, got " +
                                              descriptor_.class_name);
    }
}

std::string SnapshotStore::flag_variable() const {
    return variable_name(persist::store::kReversedFlag);
}

void SnapshotStore::check_schema(const SizingMetadata&) const {
    if (features_.find(persist::store::kReversedFlag)) {
        throw persist::SchemaConflictError("feature '" + std::string(persist::store::kReversedFlag) +
                                           "' collides with the reversal flag of '" + name_ + "'");
    }
}

void SnapshotStore::init_extra(const SizingMetadata&) {
    persist::VariableSpec spec;
    spec.name = flag_variable();
    spec.dtype = persist::DataType::BOOL;
    spec.description = "time direction of each slot";
    table_.create_variable(spec);
}

bool SnapshotStore::read_flag(uint64_t index) const {
    uint8_t b = 0;
    table_.read_row(flag_variable(), index, &b, 1);
    return b != 0;
}

void SnapshotStore::write_flag(uint64_t index, bool reversed) {
    uint8_t b = reversed ? 1 : 0;
    table_.write_row(flag_variable(), index, &b, 1);
}

bool SnapshotStore::is_reversed(uint64_t index) const {
    if (index >= count()) {
        throw persist::RecordNotFoundError(name_, index);
    }
    return read_flag(index);
}

void SnapshotStore::register_payload(const std::shared_ptr<const FieldMap>& payload,
                                     uint64_t index, bool reversed) {
    if (payloads_.size() >= 1024) {
        for (auto it = payloads_.begin(); it != payloads_.end();) {
            if (it->second.payload.expired()) {
                it = payloads_.erase(it);
            } else {
                ++it;
            }
        }
    }
    const uint64_t even = index & ~uint64_t(1);
    const bool even_reversed = (index == even) ? reversed : !reversed;
    payloads_[payload.get()] = PayloadEntry{payload, even, even_reversed};
}

void SnapshotStore::forget_pair(uint64_t index) {
    const uint64_t even = index & ~uint64_t(1);
    for (auto it = payloads_.begin(); it != payloads_.end();) {
        if (it->second.even_index == even) {
            it = payloads_.erase(it);
        } else {
            ++it;
        }
    }
}

bool SnapshotStore::lookup_payload(const std::shared_ptr<const FieldMap>& payload, PayloadEntry& out) {
    auto it = payloads_.find(payload.get());
    if (it == payloads_.end()) return false;
    // A recycled address is not the same payload
    if (it->second.payload.lock() != payload) {
        payloads_.erase(it);
        return false;
    }
    out = it->second;
    return true;
}

uint64_t SnapshotStore::save(const std::shared_ptr<StorableObject>& object) {
    if (!object) {
        throw persist::InvalidValueError("cannot save a null record into '" + name_ + "'");
    }
    check_class(*object);
    std::shared_ptr<Snapshot> snap = std::dynamic_pointer_cast<Snapshot>(object);
    if (!snap) {
        throw persist::InconsistentStateError("store '" + name_ + "' holds snapshots, got a plain " +
                                              object->class_name());
    }

    std::lock_guard<std::mutex> lock(mu_);
    check_initialized();

    uint64_t index = 0;
    if (snap->index_in(uid_, index)) {
        // Explicit rewrite: both halves of the pair are invalidated
        write_fields(row_of(index), *snap);
        write_flag(index, snap->is_reversed());
        write_flag(sibling(index), !snap->is_reversed());
        remember_name(*snap, index);
        cache_.invalidate(index);
        cache_.invalidate(sibling(index));
        cache_.insert(index, snap);
        // Twins of the replaced payload no longer match the row
        forget_pair(index);
        register_payload(snap->shared_fields(), index, snap->is_reversed());
        debug() << "SnapshotStore: rewrote pair " << pair_row(index) << " of " << name_;
        return index;
    }

    PayloadEntry entry;
    if (lookup_payload(snap->shared_fields(), entry)) {
        // Twin of a stored payload: address arithmetic only
        index = (snap->is_reversed() == entry.even_reversed) ? entry.even_index
                                                              : sibling(entry.even_index);
        snap->set_index(uid_, index);
        remember_name(*snap, index);
        cache_.insert(index, snap);
        trace() << "SnapshotStore: " << name_ << "[" << index << "] is the twin of a stored payload";
        return index;
    }

    index = count_.load(std::memory_order_relaxed);
    write_fields(pair_row(index), *snap);
    write_flag(index, snap->is_reversed());
    write_flag(sibling(index), !snap->is_reversed());
    count_.store(index + 2, std::memory_order_release);

    snap->set_index(uid_, index);
    remember_name(*snap, index);
    register_payload(snap->shared_fields(), index, snap->is_reversed());
    cache_.insert(index, snap);
    trace() << "SnapshotStore: saved pair " << pair_row(index) << " of " << name_
            << " at " << index << "/" << sibling(index);
    return index;
}

std::shared_ptr<StorableObject> SnapshotStore::load(uint64_t index) {
    if (index >= count()) {
        throw persist::RecordNotFoundError(name_, index);
    }

    std::lock_guard<std::mutex> lock(mu_);
    check_initialized();

    if (std::shared_ptr<StorableObject> cached = cache_.get(index)) {
        return cached;
    }

    std::shared_ptr<Snapshot> snap;
    const bool reversed = read_flag(index);

    std::shared_ptr<Snapshot> twin = std::dynamic_pointer_cast<Snapshot>(cache_.peek(sibling(index)));
    if (twin) {
        if (reversed == twin->is_reversed()) {
            error() << "SnapshotStore: " << name_ << "[" << index << "] and its sibling share direction";
            throw persist::InconsistentStateError("pairing violated in '" + name_ + "' at index " +
                                                  std::to_string(index));
        }
        snap = std::make_shared<Snapshot>(descriptor_.class_name, twin->shared_fields(), reversed);
        trace() << "SnapshotStore: derived " << name_ << "[" << index << "] from its cached sibling";
    } else {
        snap = std::make_shared<Snapshot>(descriptor_.class_name, read_fields(pair_row(index)), reversed);
        register_payload(snap->shared_fields(), index, reversed);
        trace() << "SnapshotStore: loaded " << name_ << "[" << index << "]";
    }

    snap->set_index(uid_, index);
    apply_name(*snap, index);
    cache_.insert(index, snap);
    return snap;
}

LazyProxy<Snapshot> SnapshotStore::reversed(uint64_t index) {
    if (index >= count()) {
        throw persist::RecordNotFoundError(name_, index);
    }
    return proxy(sibling(index)).as<Snapshot>();
}

uint64_t SnapshotStore::reference_index(uint64_t index, const std::string& feature) const {
    if (index >= count()) {
        throw persist::RecordNotFoundError(name_, index);
    }
    const ReferenceFeature* ref = dynamic_cast<const ReferenceFeature*>(features_.find(feature));
    if (!ref) {
        throw persist::InconsistentStateError("store '" + name_ + "' has no reference feature '" +
                                              feature + "'");
    }
    return ref->read_index(table_, name_, pair_row(index));
}

} // namespace pathstore
