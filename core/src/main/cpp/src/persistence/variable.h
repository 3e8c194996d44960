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
#include <cstddef>
#include <string>
#include <vector>

namespace pathstore {
    namespace persist {

        // Element types a table variable can hold. BOOL is stored as one byte.
        enum class DataType : uint8_t {
            FLOAT32 = 0,
            INT64   = 1,
            BOOL    = 2
        };

        inline size_t dtype_size(DataType t) {
            switch (t) {
                case DataType::FLOAT32: return 4;
                case DataType::INT64:   return 8;
                case DataType::BOOL:    return 1;
            }
            return 0;
        }

        inline const char* dtype_name(DataType t) {
            switch (t) {
                case DataType::FLOAT32: return "float32";
                case DataType::INT64:   return "int64";
                case DataType::BOOL:    return "bool";
            }
            return "unknown";
        }

        inline bool parse_dtype(const std::string& s, DataType& out) {
            if (s == "float32") { out = DataType::FLOAT32; return true; }
            if (s == "int64")   { out = DataType::INT64;   return true; }
            if (s == "bool")    { out = DataType::BOOL;    return true; }
            return false;
        }

        inline std::string format_shape(const std::vector<uint32_t>& shape) {
            std::string s = "(";
            for (size_t i = 0; i < shape.size(); ++i) {
                if (i) s += ", ";
                s += std::to_string(shape[i]);
            }
            return s + ")";
        }

        /**
         * Declaration of one table variable: a column of fixed-shape values,
         * one value per row. An empty shape is a scalar.
         */
        struct VariableSpec {
            std::string name;
            DataType dtype = DataType::FLOAT32;
            std::vector<uint32_t> shape;
            std::string description;

            size_t element_count() const {
                size_t n = 1;
                for (uint32_t d : shape) n *= d;
                return n;
            }

            size_t row_bytes() const { return element_count() * dtype_size(dtype); }

            // Description is informational and does not take part in equality
            bool operator==(const VariableSpec& o) const {
                return name == o.name && dtype == o.dtype && shape == o.shape;
            }
            bool operator!=(const VariableSpec& o) const { return !(*this == o); }

            std::string shape_string() const { return format_shape(shape); }
        };

        // Per-variable I/O counters, observable by tests
        struct IoStats {
            uint64_t reads = 0;
            uint64_t writes = 0;
        };

    } // namespace persist
} // namespace pathstore
