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
#include <string>
#include <vector>
#include <cstdint>
#include <ctime>
#include "table_interface.h"

namespace pathstore {
namespace persist {

/**
 * Manifest - JSON catalog of a store registry
 *
 * Contains:
 * - Sizing metadata the stores were initialized with
 * - Store inventory in creation order (children before parents)
 *   with class descriptor and committed record count
 * - Dict stores with the store their keys belong to
 *
 * Kept in the table attribute "pathstore.catalog", so it lands in the
 * same file as the data and is covered by the table's footer checksum.
 */
class Manifest {
public:
    struct SizingInfo {
        bool present = false;
        uint32_t n_atoms = 0;
        uint32_t n_spatial = 0;
        std::string topology;
    };

    struct StoreEntry {
        std::string name;
        std::string class_name;
        bool paired = false;
        std::vector<std::string> features;
        uint64_t count = 0;
    };

    struct DictEntry {
        std::string name;
        std::string key_store;
    };

    Manifest();
    ~Manifest() = default;

    // Load from the table's catalog attribute (returns false if missing/corrupt)
    bool load(const TableInterface& table);

    // Store into the table's catalog attribute
    void store(TableInterface& table) const;

    // Getters
    uint32_t get_version() const { return version_; }
    time_t get_created_unix() const { return created_unix_; }
    const SizingInfo& get_sizing() const { return sizing_; }
    const std::vector<StoreEntry>& get_stores() const { return stores_; }
    const std::vector<DictEntry>& get_dicts() const { return dicts_; }

    // Setters
    void set_sizing(const SizingInfo& sizing) { sizing_ = sizing; }
    void set_stores(const std::vector<StoreEntry>& stores) { stores_ = stores; }
    void add_store(const StoreEntry& entry) { stores_.push_back(entry); }
    void add_dict(const DictEntry& entry) { dicts_.push_back(entry); }

    // JSON serialization
    std::string to_json() const;
    bool from_json(const std::string& json_str);

private:
    uint32_t version_ = 1;
    time_t created_unix_ = 0;
    SizingInfo sizing_;
    std::vector<StoreEntry> stores_;
    std::vector<DictEntry> dicts_;
};

} // namespace persist
} // namespace pathstore
