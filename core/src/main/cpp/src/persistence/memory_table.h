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
#include "table_interface.h"
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace pathstore {
    namespace persist {

        class MemoryTable final : public TableInterface {
        public:
            void create_variable(const VariableSpec& spec) override;
            bool has_variable(const std::string& name) const override;
            bool variable_spec(const std::string& name, VariableSpec& out) const override;
            std::vector<std::string> variable_names() const override;

            void write_row(const std::string& name, uint64_t row,
                           const void* data, size_t len) override;
            void read_row(const std::string& name, uint64_t row,
                          void* out, size_t len) const override;
            uint64_t row_count(const std::string& name) const override;

            void set_attribute(const std::string& key, const std::string& value) override;
            bool get_attribute(const std::string& key, std::string& out) const override;

            void flush() override {} // no-op

            IoStats stats(const std::string& name) const override;
            void reset_stats() override;

        private:
            struct Column {
                VariableSpec spec;
                std::vector<uint8_t> bytes;   // row-major, row_bytes() per row
                uint64_t rows = 0;
                mutable IoStats io;
            };

            Column& column(const std::string& name);
            const Column& column(const std::string& name) const;

            mutable std::mutex mu_;
            std::map<std::string, Column> columns_;
            std::unordered_map<std::string, std::string> attributes_;
        };
    }
}
