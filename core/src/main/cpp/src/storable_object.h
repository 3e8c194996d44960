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
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "field.h"

namespace pathstore {

    /**
     * Logical record: a class tag, feature-contributed fields and an
     * optional name. Fields are immutable and may be shared between
     * instances (a snapshot and its time-reversed twin share one map).
     *
     * Once saved, the record remembers its index in every store that holds
     * it, keyed by the store's process-unique id.
     */
    class StorableObject {
    public:
        StorableObject(std::string class_name, FieldMap fields);
        StorableObject(std::string class_name, std::shared_ptr<const FieldMap> fields);
        virtual ~StorableObject() = default;

        StorableObject(const StorableObject&) = delete;
        StorableObject& operator=(const StorableObject&) = delete;

        const std::string& class_name() const { return class_name_; }

        const std::string& name() const { return name_; }
        bool has_name() const { return !name_.empty(); }
        void set_name(const std::string& name) { name_ = name; }

        const FieldMap& fields() const { return *fields_; }
        const std::shared_ptr<const FieldMap>& shared_fields() const { return fields_; }

        // nullptr when the record has no such field
        const FieldValue* find_field(const std::string& name) const;

        // InconsistentStateError when the record has no such field
        const FieldValue& field(const std::string& name) const;

        bool index_in(uint64_t store_uid, uint64_t& out) const;
        void set_index(uint64_t store_uid, uint64_t index);
        void clear_index(uint64_t store_uid);

        // Value equality: class tag and field values
        virtual bool equals(const StorableObject& o) const;

        // Approximate heap footprint of the field payload
        virtual size_t memory_usage() const;

        virtual std::string describe() const;

    private:
        std::string class_name_;
        std::string name_;
        std::shared_ptr<const FieldMap> fields_;

        mutable std::mutex index_mu_;
        std::map<uint64_t, uint64_t> indices_;
    };

    typedef std::shared_ptr<StorableObject> StorableObjectPtr;

} // namespace pathstore
