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

#include "storable_object.h"
#include "persistence/errors.h"

namespace pathstore {

StorableObject::StorableObject(std::string class_name, FieldMap fields)
    : class_name_(std::move(class_name)),
      fields_(std::make_shared<const FieldMap>(std::move(fields))) {}

StorableObject::StorableObject(std::string class_name, std::shared_ptr<const FieldMap> fields)
    : class_name_(std::move(class_name)),
      fields_(fields ? std::move(fields) : std::make_shared<const FieldMap>()) {}

const FieldValue* StorableObject::find_field(const std::string& name) const {
    auto it = fields_->find(name);
    return it == fields_->end() ? nullptr : &it->second;
}

const FieldValue& StorableObject::field(const std::string& name) const {
    const FieldValue* v = find_field(name);
    if (!v) {
        throw persist::InconsistentStateError(class_name_ + " has no field '" + name + "'");
    }
    return *v;
}

bool StorableObject::index_in(uint64_t store_uid, uint64_t& out) const {
    std::lock_guard<std::mutex> lock(index_mu_);
    auto it = indices_.find(store_uid);
    if (it == indices_.end()) return false;
    out = it->second;
    return true;
}

void StorableObject::set_index(uint64_t store_uid, uint64_t index) {
    std::lock_guard<std::mutex> lock(index_mu_);
    indices_[store_uid] = index;
}

void StorableObject::clear_index(uint64_t store_uid) {
    std::lock_guard<std::mutex> lock(index_mu_);
    indices_.erase(store_uid);
}

bool StorableObject::equals(const StorableObject& o) const {
    if (this == &o) return true;
    if (class_name_ != o.class_name_) return false;
    if (fields_ == o.fields_) return true;
    return fields_equal(*fields_, *o.fields_);
}

size_t StorableObject::memory_usage() const {
    size_t bytes = sizeof(*this);
    for (const auto& kv : *fields_) {
        bytes += kv.first.size() + sizeof(FieldValue);
        bytes += kv.second.data.size() * sizeof(float);
        bytes += kv.second.shape.size() * sizeof(uint32_t);
    }
    return bytes;
}

std::string StorableObject::describe() const {
    std::string s = class_name_;
    if (has_name()) {
        s += " '" + name_ + "'";
    }
    s += " {";
    bool first = true;
    for (const auto& kv : *fields_) {
        if (!first) s += ", ";
        first = false;
        s += kv.first;
    }
    return s + "}";
}

} // namespace pathstore
