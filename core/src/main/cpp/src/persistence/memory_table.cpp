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

#include "memory_table.h"
#include "errors.h"
#include "../util/log.h"
#include <cstring>

namespace pathstore {
namespace persist {

const MemoryTable::Column& MemoryTable::column(const std::string& name) const {
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        throw InconsistentStateError("unknown table variable '" + name + "'");
    }
    return it->second;
}

MemoryTable::Column& MemoryTable::column(const std::string& name) {
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        throw InconsistentStateError("unknown table variable '" + name + "'");
    }
    return it->second;
}

void MemoryTable::create_variable(const VariableSpec& spec) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = columns_.find(spec.name);
    if (it != columns_.end()) {
        if (it->second.spec != spec) {
            throw SchemaConflictError("variable '" + spec.name + "' already declared as " +
                                      dtype_name(it->second.spec.dtype) +
                                      it->second.spec.shape_string());
        }
        return;
    }
    Column col;
    col.spec = spec;
    columns_.emplace(spec.name, std::move(col));
    trace() << "MemoryTable: created variable " << spec.name << " "
            << dtype_name(spec.dtype) << spec.shape_string();
}

bool MemoryTable::has_variable(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mu_);
    return columns_.count(name) != 0;
}

bool MemoryTable::variable_spec(const std::string& name, VariableSpec& out) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = columns_.find(name);
    if (it == columns_.end()) return false;
    out = it->second.spec;
    return true;
}

std::vector<std::string> MemoryTable::variable_names() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& kv : columns_) names.push_back(kv.first);
    return names;
}

void MemoryTable::write_row(const std::string& name, uint64_t row,
                            const void* data, size_t len) {
    std::lock_guard<std::mutex> lock(mu_);
    Column& col = column(name);
    const size_t rb = col.spec.row_bytes();
    if (len != rb) {
        throw InvalidValueError("row of " + std::to_string(len) + " bytes for variable '" +
                                name + "' expecting " + std::to_string(rb));
    }
    if (row >= col.rows) {
        col.bytes.resize((row + 1) * rb, 0);
        col.rows = row + 1;
    }
    std::memcpy(col.bytes.data() + row * rb, data, len);
    col.io.writes++;
}

void MemoryTable::read_row(const std::string& name, uint64_t row,
                           void* out, size_t len) const {
    std::lock_guard<std::mutex> lock(mu_);
    const Column& col = column(name);
    if (row >= col.rows) {
        throw RecordNotFoundError(name, row);
    }
    const size_t rb = col.spec.row_bytes();
    if (len != rb) {
        throw InvalidValueError("read buffer of " + std::to_string(len) + " bytes for variable '" +
                                name + "' expecting " + std::to_string(rb));
    }
    std::memcpy(out, col.bytes.data() + row * rb, len);
    col.io.reads++;
}

uint64_t MemoryTable::row_count(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mu_);
    return column(name).rows;
}

void MemoryTable::set_attribute(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mu_);
    attributes_[key] = value;
}

bool MemoryTable::get_attribute(const std::string& key, std::string& out) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = attributes_.find(key);
    if (it == attributes_.end()) return false;
    out = it->second;
    return true;
}

IoStats MemoryTable::stats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = columns_.find(name);
    if (it == columns_.end()) return IoStats{};
    return it->second.io;
}

void MemoryTable::reset_stats() {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& kv : columns_) kv.second.io = IoStats{};
}

} // namespace persist
} // namespace pathstore
