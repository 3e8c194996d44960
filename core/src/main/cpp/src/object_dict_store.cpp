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

#include "object_dict_store.h"
#include "feature.h"
#include "persistence/config.h"
#include "persistence/errors.h"
#include "util/log.h"

namespace pathstore {

ObjectDictStore::ObjectDictStore(std::string name, ObjectStore& keys, persist::TableInterface& table)
    : name_(std::move(name)),
      keys_(keys),
      table_(table),
      values_var_(Feature::qualified(name_, persist::store::kDictValues)),
      present_var_(Feature::qualified(name_, persist::store::kDictPresent)) {
    if (name_.empty()) {
        throw persist::InvalidValueError("dict store without a name");
    }
}

void ObjectDictStore::initialize() {
    std::lock_guard<std::mutex> lock(mu_);
    if (initialized_) {
        return;
    }

    persist::VariableSpec values;
    values.name = values_var_;
    values.dtype = persist::DataType::FLOAT32;
    values.description = "value per " + keys_.name() + " record";
    table_.create_variable(values);

    persist::VariableSpec present;
    present.name = present_var_;
    present.dtype = persist::DataType::BOOL;
    present.description = "row of " + values_var_ + " is set";
    table_.create_variable(present);

    initialized_ = true;
    debug() << "ObjectDictStore: initialized '" << name_ << "' keyed by " << keys_.name();
}

bool ObjectDictStore::is_initialized() const {
    std::lock_guard<std::mutex> lock(mu_);
    return initialized_;
}

void ObjectDictStore::check_initialized() const {
    if (!initialized_) {
        throw persist::InconsistentStateError("dict store '" + name_ + "' is not initialized");
    }
}

void ObjectDictStore::set(const std::shared_ptr<StorableObject>& key, float value) {
    if (!key) {
        throw persist::InvalidValueError("dict store '" + name_ + "' cannot key on a null record");
    }
    std::lock_guard<std::mutex> lock(mu_);
    check_initialized();
    uint64_t index = 0;
    if (keys_.index_of(*key, index)) {
        unsaved_.erase(key.get());
        values_[index] = value;
        dirty_.insert(index);
        return;
    }
    unsaved_[key.get()] = PendingValue{key, value};
}

void ObjectDictStore::set(uint64_t index, float value) {
    if (index >= keys_.count()) {
        throw persist::RecordNotFoundError(keys_.name(), index);
    }
    std::lock_guard<std::mutex> lock(mu_);
    check_initialized();
    values_[index] = value;
    dirty_.insert(index);
}

bool ObjectDictStore::get(const StorableObject& key, float& out) const {
    std::lock_guard<std::mutex> lock(mu_);
    check_initialized();
    auto it = unsaved_.find(&key);
    if (it != unsaved_.end()) {
        out = it->second.value;
        return true;
    }
    uint64_t index = 0;
    if (!keys_.index_of(key, index)) {
        return false;
    }
    return read_locked(index, out);
}

bool ObjectDictStore::get(uint64_t index, float& out) const {
    std::lock_guard<std::mutex> lock(mu_);
    check_initialized();
    return read_locked(index, out);
}

bool ObjectDictStore::read_locked(uint64_t index, float& out) const {
    auto cached = values_.find(index);
    if (cached != values_.end()) {
        out = cached->second;
        return true;
    }
    if (index >= table_.row_count(present_var_)) {
        return false;
    }

    uint8_t present = 0;
    table_.read_row(present_var_, index, &present, 1);
    if (!present) {
        return false;
    }
    float value = 0.0f;
    table_.read_row(values_var_, index, &value, sizeof(value));
    values_[index] = value;
    out = value;
    return true;
}

void ObjectDictStore::write_locked(uint64_t index, float value) {
    uint8_t present = 1;
    table_.write_row(values_var_, index, &value, sizeof(value));
    table_.write_row(present_var_, index, &present, 1);
    values_[index] = value;
}

size_t ObjectDictStore::save() {
    std::lock_guard<std::mutex> lock(mu_);
    check_initialized();

    size_t written = 0;
    for (uint64_t index : dirty_) {
        write_locked(index, values_[index]);
        ++written;
    }
    dirty_.clear();

    for (auto it = unsaved_.begin(); it != unsaved_.end();) {
        uint64_t index = 0;
        if (keys_.index_of(*it->second.key, index)) {
            write_locked(index, it->second.value);
            ++written;
            it = unsaved_.erase(it);
        } else {
            ++it;
        }
    }

    debug() << "ObjectDictStore: saved " << written << " values of '" << name_ << "', "
            << unsaved_.size() << " wait for unsaved keys";
    return written;
}

size_t ObjectDictStore::pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return unsaved_.size() + dirty_.size();
}

void ObjectDictStore::clear_cache() {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = values_.begin(); it != values_.end();) {
        if (dirty_.count(it->first)) {
            ++it;
        } else {
            it = values_.erase(it);
        }
    }
}

} // namespace pathstore
