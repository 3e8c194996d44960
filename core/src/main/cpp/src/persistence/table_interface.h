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
#include <cstdint>
#include <string>
#include <vector>
#include "variable.h"

namespace pathstore {
    namespace persist {

        /**
         * Named, typed, growable columns indexed by row, plus string attributes.
         *
         * Rows are raw little-endian bytes of exactly VariableSpec::row_bytes().
         * Writing past the current end grows the variable; rows in between
         * read back as zero bytes. Implementations serialize their own access.
         */
        class TableInterface {
        public:
            virtual ~TableInterface() = default;

            // 1) Schema
            // Creating an identical variable twice is a no-op; a different
            // declaration under an existing name throws SchemaConflictError.
            virtual void create_variable(const VariableSpec& spec) = 0;
            virtual bool has_variable(const std::string& name) const = 0;
            virtual bool variable_spec(const std::string& name, VariableSpec& out) const = 0;
            virtual std::vector<std::string> variable_names() const = 0;

            // 2) Rows
            virtual void write_row(const std::string& name, uint64_t row,
                                   const void* data, size_t len) = 0;
            // RecordNotFoundError if row >= row_count(name)
            virtual void read_row(const std::string& name, uint64_t row,
                                  void* out, size_t len) const = 0;
            virtual uint64_t row_count(const std::string& name) const = 0;

            // 3) Attributes
            virtual void set_attribute(const std::string& key, const std::string& value) = 0;
            virtual bool get_attribute(const std::string& key, std::string& out) const = 0;

            // 4) Durability (no-op for in-memory tables)
            virtual void flush() = 0;

            // 5) Instrumentation
            virtual IoStats stats(const std::string& name) const = 0;
            virtual void reset_stats() = 0;
        };

    } // namespace persist
} // namespace pathstore
