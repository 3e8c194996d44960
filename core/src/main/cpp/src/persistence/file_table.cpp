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

#include "file_table.h"
#include "checksums.h"
#include "errors.h"
#include "../util/endian.hpp"
#include "../util/log.h"
#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/error/en.h"
#include <cstring>
#include <exception>
#include <boost/filesystem.hpp>

namespace pathstore {
namespace persist {

namespace {

std::string io_message(const std::string& what, const std::string& path, int err) {
    return what + " '" + path + "': " + errnoWithDescription(err);
}

} // namespace

FileTable::FileTable(const std::string& path, OpenMode mode, const StorageConfig& config)
    : path_(path), mode_(mode),
      chunk_rows_(config.chunk_rows),
      sync_on_flush_(config.sync_on_flush) {
    if (!config.validate()) {
        throw InvalidValueError("invalid storage configuration for '" + path + "'");
    }

    boost::filesystem::path parent = boost::filesystem::path(path).parent_path();
    if (!parent.empty() && mode != OpenMode::ReadOnly) {
        FSResult dr = PlatformFS::ensure_directory(parent.string());
        if (!dr.ok) {
            throw StorageIOError(io_message("cannot create directory for", path, dr.err));
        }
    }

    FSResult r = PlatformFS::open_file(path, mode, &fd_);
    if (!r.ok) {
        throw StorageIOError(io_message("cannot open table file", path, r.err));
    }

    auto sz = PlatformFS::file_size(fd_);
    if (!sz.first.ok) {
        PlatformFS::close_file(fd_);
        throw StorageIOError(io_message("cannot stat table file", path, sz.first.err));
    }

    try {
        if (sz.second == 0) {
            if (mode == OpenMode::ReadOnly) {
                throw StorageIOError("table file '" + path + "' is empty");
            }
            write_header();
            dirty_ = true;
            if (sync_on_flush_ && !parent.empty()) {
                FSResult sr = PlatformFS::fsync_directory(parent.string());
                if (!sr.ok) {
                    warn() << "FileTable: cannot sync directory of " << path << ": "
                           << errnoWithDescription(sr.err);
                }
            }
            info() << "FileTable: created " << path << " (chunk_rows=" << chunk_rows_ << ")";
        } else {
            read_header();
            load_catalog(sz.second);
            info() << "FileTable: opened " << path << " with " << columns_.size()
                   << " variables";
        }
    } catch (const StoreError&) {
        PlatformFS::close_file(fd_);
        fd_ = -1;
        throw;
    }
}

FileTable::~FileTable() {
    if (fd_ < 0) return;
    if (dirty_ && mode_ != OpenMode::ReadOnly) {
        try {
            std::lock_guard<std::mutex> lock(mu_);
            flush_locked();
        } catch (const std::exception& e) {
            // Nothing may escape the destructor
            error() << "FileTable: flush on close failed for " << path_ << ": " << e.what();
        }
    }
    FSResult r = PlatformFS::close_file(fd_);
    if (!r.ok) {
        error() << "FileTable: close failed for " << path_ << ": " << errnoWithDescription(r.err);
    }
}

// ---------------------------------------------------------------------------
// Header / footer
// ---------------------------------------------------------------------------

void FileTable::write_header() {
    uint8_t hdr[file_format::kHeaderSize] = {0};
    util::store_le32(hdr + 0, file_format::kMagic);
    util::store_le32(hdr + 4, file_format::kVersion);
    util::store_le32(hdr + 8, chunk_rows_);
    FSResult r = PlatformFS::write_at(fd_, 0, hdr, sizeof(hdr));
    if (!r.ok) {
        throw StorageIOError(io_message("cannot write header of", path_, r.err));
    }
    data_end_ = file_format::kHeaderSize;
}

void FileTable::read_header() {
    uint8_t hdr[file_format::kHeaderSize];
    FSResult r = PlatformFS::read_at(fd_, 0, hdr, sizeof(hdr));
    if (!r.ok) {
        throw StorageIOError(io_message("cannot read header of", path_, r.err));
    }
    if (util::load_le32(hdr + 0) != file_format::kMagic) {
        throw StorageIOError("'" + path_ + "' is not a pathstore table (bad magic)");
    }
    uint32_t version = util::load_le32(hdr + 4);
    if (version != file_format::kVersion) {
        throw StorageIOError("'" + path_ + "' has unsupported version " + std::to_string(version));
    }
    chunk_rows_ = util::load_le32(hdr + 8);
    if (chunk_rows_ == 0 || chunk_rows_ > table::kMaxChunkRows) {
        throw StorageIOError("'" + path_ + "' has invalid chunk size " + std::to_string(chunk_rows_));
    }
}

void FileTable::load_catalog(uint64_t file_size) {
    if (file_size == file_format::kHeaderSize) {
        // Created but never flushed
        data_end_ = file_format::kHeaderSize;
        return;
    }
    if (file_size < file_format::kHeaderSize + file_format::kFooterSize) {
        throw StorageIOError("'" + path_ + "' is truncated");
    }

    uint8_t footer[file_format::kFooterSize];
    FSResult r = PlatformFS::read_at(fd_, file_size - file_format::kFooterSize, footer, sizeof(footer));
    if (!r.ok) {
        throw StorageIOError(io_message("cannot read footer of", path_, r.err));
    }

    uint64_t cat_off = util::load_le64(footer + 0);
    uint64_t cat_len = util::load_le64(footer + 8);
    uint32_t cat_crc = util::load_le32(footer + 16);
    uint32_t magic   = util::load_le32(footer + 20);

    if (magic != file_format::kFooterMagic) {
        throw StorageIOError("'" + path_ + "' has a corrupt footer (bad magic)");
    }
    if (cat_off < file_format::kHeaderSize ||
        cat_off + cat_len + file_format::kFooterSize != file_size) {
        throw StorageIOError("'" + path_ + "' has a corrupt footer (catalog bounds)");
    }

    std::string json(cat_len, '\0');
    r = PlatformFS::read_at(fd_, cat_off, &json[0], cat_len);
    if (!r.ok) {
        throw StorageIOError(io_message("cannot read catalog of", path_, r.err));
    }
    if (crc32c(json.data(), json.size()) != cat_crc) {
        throw StorageIOError("'" + path_ + "' catalog checksum mismatch");
    }

    catalog_from_json(json);
    data_end_ = cat_off;
}

std::string FileTable::catalog_to_json() const {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();

    writer.Key("version");
    writer.Uint(file_format::kVersion);

    writer.Key("chunk_rows");
    writer.Uint(chunk_rows_);

    writer.Key("variables");
    writer.StartArray();
    for (const auto& kv : columns_) {
        const Column& col = kv.second;
        writer.StartObject();
        writer.Key("name");
        writer.String(col.spec.name.c_str());
        writer.Key("dtype");
        writer.String(dtype_name(col.spec.dtype));
        writer.Key("shape");
        writer.StartArray();
        for (uint32_t d : col.spec.shape) writer.Uint(d);
        writer.EndArray();
        if (!col.spec.description.empty()) {
            writer.Key("description");
            writer.String(col.spec.description.c_str());
        }
        writer.Key("rows");
        writer.Uint64(col.rows);
        writer.Key("chunks");
        writer.StartArray();
        for (uint64_t off : col.chunks) writer.Uint64(off);
        writer.EndArray();
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("attributes");
    writer.StartObject();
    for (const auto& kv : attributes_) {
        writer.Key(kv.first.c_str(), static_cast<rapidjson::SizeType>(kv.first.size()));
        writer.String(kv.second.c_str(), static_cast<rapidjson::SizeType>(kv.second.size()));
    }
    writer.EndObject();

    writer.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize());
}

void FileTable::catalog_from_json(const std::string& json_str) {
    rapidjson::Document doc;
    doc.Parse(json_str.c_str(), json_str.size());

    if (doc.HasParseError()) {
        error() << "FileTable: catalog parse error at offset " << doc.GetErrorOffset()
                << ": " << rapidjson::GetParseError_En(doc.GetParseError());
        throw StorageIOError("'" + path_ + "' has an unreadable catalog");
    }
    if (!doc.IsObject() || !doc.HasMember("variables") || !doc["variables"].IsArray()) {
        throw StorageIOError("'" + path_ + "' catalog is missing its variable list");
    }

    columns_.clear();
    const auto& vars = doc["variables"];
    for (rapidjson::SizeType i = 0; i < vars.Size(); i++) {
        const auto& v = vars[i];
        if (!v.IsObject() || !v.HasMember("name") || !v["name"].IsString() ||
            !v.HasMember("dtype") || !v["dtype"].IsString()) {
            throw StorageIOError("'" + path_ + "' catalog has a malformed variable entry");
        }

        Column col;
        col.spec.name = v["name"].GetString();
        if (!parse_dtype(v["dtype"].GetString(), col.spec.dtype)) {
            throw StorageIOError("'" + path_ + "' catalog names unknown dtype for " + col.spec.name);
        }
        if (v.HasMember("shape") && v["shape"].IsArray()) {
            for (const auto& d : v["shape"].GetArray()) {
                if (d.IsUint()) col.spec.shape.push_back(d.GetUint());
            }
        }
        if (v.HasMember("description") && v["description"].IsString()) {
            col.spec.description = v["description"].GetString();
        }
        if (v.HasMember("rows") && v["rows"].IsUint64()) {
            col.rows = v["rows"].GetUint64();
        }
        if (v.HasMember("chunks") && v["chunks"].IsArray()) {
            for (const auto& c : v["chunks"].GetArray()) {
                if (c.IsUint64()) col.chunks.push_back(c.GetUint64());
            }
        }
        if (col.chunks.size() * chunk_rows_ < col.rows) {
            throw StorageIOError("'" + path_ + "' catalog lists too few chunks for " + col.spec.name);
        }
        columns_.emplace(col.spec.name, std::move(col));
    }

    attributes_.clear();
    if (doc.HasMember("attributes") && doc["attributes"].IsObject()) {
        for (const auto& m : doc["attributes"].GetObject()) {
            if (m.value.IsString()) {
                attributes_[std::string(m.name.GetString(), m.name.GetStringLength())] =
                    std::string(m.value.GetString(), m.value.GetStringLength());
            }
        }
    }
}

// ---------------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------------

FileTable::Column& FileTable::column(const std::string& name) {
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        throw InconsistentStateError("unknown table variable '" + name + "'");
    }
    return it->second;
}

const FileTable::Column& FileTable::column(const std::string& name) const {
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        throw InconsistentStateError("unknown table variable '" + name + "'");
    }
    return it->second;
}

void FileTable::require_writable() const {
    if (mode_ == OpenMode::ReadOnly) {
        throw StorageIOError("table file '" + path_ + "' is open read-only");
    }
}

void FileTable::create_variable(const VariableSpec& spec) {
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
    require_writable();
    if (spec.row_bytes() == 0 || spec.row_bytes() > table::kMaxRowBytes) {
        throw InvalidValueError("variable '" + spec.name + "' has unsupported row size");
    }
    Column col;
    col.spec = spec;
    columns_.emplace(spec.name, std::move(col));
    dirty_ = true;
    debug() << "FileTable: created variable " << spec.name << " "
            << dtype_name(spec.dtype) << spec.shape_string();
}

bool FileTable::has_variable(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mu_);
    return columns_.count(name) != 0;
}

bool FileTable::variable_spec(const std::string& name, VariableSpec& out) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = columns_.find(name);
    if (it == columns_.end()) return false;
    out = it->second.spec;
    return true;
}

std::vector<std::string> FileTable::variable_names() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& kv : columns_) names.push_back(kv.first);
    return names;
}

// ---------------------------------------------------------------------------
// Rows
// ---------------------------------------------------------------------------

uint64_t FileTable::row_offset(const Column& col, uint64_t row) const {
    return col.chunks[row / chunk_rows_] + (row % chunk_rows_) * col.spec.row_bytes();
}

void FileTable::allocate_chunks(Column& col, uint64_t row) {
    const uint64_t needed = row / chunk_rows_ + 1;
    const uint64_t chunk_bytes = uint64_t(chunk_rows_) * col.spec.row_bytes();
    while (col.chunks.size() < needed) {
        col.chunks.push_back(data_end_);
        data_end_ += chunk_bytes;
        trace() << "FileTable: chunk " << (col.chunks.size() - 1) << " of " << col.spec.name
                << " at offset " << col.chunks.back();
    }
    // Zero-extend so unwritten rows of the chunk read back as zero bytes
    FSResult r = PlatformFS::truncate_file(fd_, data_end_);
    if (!r.ok) {
        throw StorageIOError(io_message("cannot grow table file", path_, r.err));
    }
}

void FileTable::write_row(const std::string& name, uint64_t row,
                          const void* data, size_t len) {
    std::lock_guard<std::mutex> lock(mu_);
    require_writable();
    Column& col = column(name);
    const size_t rb = col.spec.row_bytes();
    if (len != rb) {
        throw InvalidValueError("row of " + std::to_string(len) + " bytes for variable '" +
                                name + "' expecting " + std::to_string(rb));
    }
    if (row / chunk_rows_ >= col.chunks.size()) {
        allocate_chunks(col, row);
    }
    FSResult r = PlatformFS::write_at(fd_, row_offset(col, row), data, len);
    if (!r.ok) {
        throw StorageIOError(io_message("cannot write row of " + name + " in", path_, r.err));
    }
    if (row >= col.rows) col.rows = row + 1;
    col.io.writes++;
    dirty_ = true;
}

void FileTable::read_row(const std::string& name, uint64_t row,
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
    FSResult r = PlatformFS::read_at(fd_, row_offset(col, row), out, len);
    if (!r.ok) {
        throw StorageIOError(io_message("cannot read row of " + name + " in", path_, r.err));
    }
    col.io.reads++;
}

uint64_t FileTable::row_count(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mu_);
    return column(name).rows;
}

// ---------------------------------------------------------------------------
// Attributes
// ---------------------------------------------------------------------------

void FileTable::set_attribute(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mu_);
    require_writable();
    attributes_[key] = value;
    dirty_ = true;
}

bool FileTable::get_attribute(const std::string& key, std::string& out) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = attributes_.find(key);
    if (it == attributes_.end()) return false;
    out = it->second;
    return true;
}

// ---------------------------------------------------------------------------
// Durability
// ---------------------------------------------------------------------------

void FileTable::flush() {
    std::lock_guard<std::mutex> lock(mu_);
    if (mode_ == OpenMode::ReadOnly) return;
    flush_locked();
}

void FileTable::flush_locked() {
    std::string json = catalog_to_json();

    uint8_t footer[file_format::kFooterSize];
    util::store_le64(footer + 0, data_end_);
    util::store_le64(footer + 8, json.size());
    util::store_le32(footer + 16, crc32c(json.data(), json.size()));
    util::store_le32(footer + 20, file_format::kFooterMagic);

    FSResult r = PlatformFS::write_at(fd_, data_end_, json.data(), json.size());
    if (r.ok) {
        r = PlatformFS::write_at(fd_, data_end_ + json.size(), footer, sizeof(footer));
    }
    if (r.ok) {
        r = PlatformFS::truncate_file(fd_, data_end_ + json.size() + sizeof(footer));
    }
    if (r.ok && sync_on_flush_) {
        r = PlatformFS::flush_file(fd_);
    }
    if (!r.ok) {
        throw StorageIOError(io_message("cannot write catalog of", path_, r.err));
    }

    dirty_ = false;
    debug() << "FileTable: flushed " << path_ << " (" << columns_.size() << " variables, catalog "
            << json.size() << " bytes)";
}

// ---------------------------------------------------------------------------
// Instrumentation
// ---------------------------------------------------------------------------

IoStats FileTable::stats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = columns_.find(name);
    if (it == columns_.end()) return IoStats{};
    return it->second.io;
}

void FileTable::reset_stats() {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& kv : columns_) kv.second.io = IoStats{};
}

} // namespace persist
} // namespace pathstore
