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
#include "platform_fs.h"
#include "storage_config.h"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace pathstore {
namespace persist {

/**
 * FileTable - variable table in one random-access file
 *
 * Layout:
 *   [header: magic "PSTR", version, chunk_rows, reserved to 64 bytes]
 *   [chunk][chunk]...            fixed chunk_rows rows of one variable each
 *   [catalog JSON]               variables, chunk directory, attributes
 *   [footer: catalog offset(8), catalog length(8), crc32c(4), magic(4)]
 *
 * New chunks are appended at the end of the data region, overwriting the
 * previous catalog; flush() writes a fresh catalog and footer behind them.
 * Reopening a flushed file restores every variable and attribute.
 */
class FileTable final : public TableInterface {
public:
    explicit FileTable(const std::string& path,
                       OpenMode mode = OpenMode::ReadWrite,
                       const StorageConfig& config = StorageConfig::defaults());
    ~FileTable() override;

    FileTable(const FileTable&) = delete;
    FileTable& operator=(const FileTable&) = delete;

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

    void flush() override;

    IoStats stats(const std::string& name) const override;
    void reset_stats() override;

    const std::string& path() const { return path_; }
    uint32_t chunk_rows() const { return chunk_rows_; }
    bool read_only() const { return mode_ == OpenMode::ReadOnly; }

private:
    struct Column {
        VariableSpec spec;
        uint64_t rows = 0;
        std::vector<uint64_t> chunks;   // file offset of each chunk
        mutable IoStats io;
    };

    Column& column(const std::string& name);
    const Column& column(const std::string& name) const;

    void write_header();
    void read_header();
    void load_catalog(uint64_t file_size);
    uint64_t row_offset(const Column& col, uint64_t row) const;
    void allocate_chunks(Column& col, uint64_t row);
    void flush_locked();
    void require_writable() const;

    std::string catalog_to_json() const;
    void catalog_from_json(const std::string& json_str);

    std::string path_;
    OpenMode mode_;
    intptr_t fd_ = -1;
    uint32_t chunk_rows_;
    bool sync_on_flush_;
    uint64_t data_end_ = file_format::kHeaderSize;
    bool dirty_ = false;

    mutable std::mutex mu_;
    std::map<std::string, Column> columns_;
    std::map<std::string, std::string> attributes_;
};

} // namespace persist
} // namespace pathstore
