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

#include "manifest.h"
#include "config.h"
#include "../util/log.h"
#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/error/en.h"

namespace pathstore {
namespace persist {

Manifest::Manifest() {
    created_unix_ = std::time(nullptr);
}

bool Manifest::load(const TableInterface& table) {
    std::string json_str;
    if (!table.get_attribute(store::kCatalogAttribute, json_str)) {
        return false;
    }
    if (json_str.empty()) {
        return false;
    }
    return from_json(json_str);
}

void Manifest::store(TableInterface& table) const {
    table.set_attribute(store::kCatalogAttribute, to_json());
}

std::string Manifest::to_json() const {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();

    writer.Key("version");
    writer.Uint(version_);

    writer.Key("created_unix");
    writer.Int64(created_unix_);

    // Sizing metadata
    writer.Key("sizing");
    if (sizing_.present) {
        writer.StartObject();
        writer.Key("n_atoms");
        writer.Uint(sizing_.n_atoms);
        writer.Key("n_spatial");
        writer.Uint(sizing_.n_spatial);
        writer.Key("topology");
        writer.String(sizing_.topology.c_str(),
                      static_cast<rapidjson::SizeType>(sizing_.topology.size()));
        writer.EndObject();
    } else {
        writer.Null();
    }

    // Stores, in creation order
    writer.Key("stores");
    writer.StartArray();
    for (const auto& s : stores_) {
        writer.StartObject();
        writer.Key("name");
        writer.String(s.name.c_str());
        writer.Key("class");
        writer.String(s.class_name.c_str());
        writer.Key("paired");
        writer.Bool(s.paired);
        writer.Key("features");
        writer.StartArray();
        for (const auto& f : s.features) {
            writer.String(f.c_str());
        }
        writer.EndArray();
        writer.Key("count");
        writer.Uint64(s.count);
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("dicts");
    writer.StartArray();
    for (const auto& d : dicts_) {
        writer.StartObject();
        writer.Key("name");
        writer.String(d.name.c_str());
        writer.Key("keys");
        writer.String(d.key_store.c_str());
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();

    return buffer.GetString();
}

bool Manifest::from_json(const std::string& json_str) {
    rapidjson::Document doc;
    doc.Parse(json_str.c_str());

    // Check for parse errors
    if (doc.HasParseError()) {
        error() << "JSON parse error at offset " << doc.GetErrorOffset()
                << ": " << rapidjson::GetParseError_En(doc.GetParseError());
        return false;
    }

    // Validate it's an object
    if (!doc.IsObject()) {
        return false;
    }

    if (doc.HasMember("version") && doc["version"].IsUint()) {
        version_ = doc["version"].GetUint();
    }
    if (version_ != 1) {
        error() << "Unsupported catalog version " << version_;
        return false;
    }

    if (doc.HasMember("created_unix") && doc["created_unix"].IsInt64()) {
        created_unix_ = doc["created_unix"].GetInt64();
    }

    // Parse sizing
    sizing_ = SizingInfo();
    if (doc.HasMember("sizing") && doc["sizing"].IsObject()) {
        const auto& sz = doc["sizing"];
        if (!sz.HasMember("n_atoms") || !sz["n_atoms"].IsUint() ||
            !sz.HasMember("n_spatial") || !sz["n_spatial"].IsUint()) {
            return false;
        }
        sizing_.present = true;
        sizing_.n_atoms = sz["n_atoms"].GetUint();
        sizing_.n_spatial = sz["n_spatial"].GetUint();
        if (sz.HasMember("topology") && sz["topology"].IsString()) {
            sizing_.topology.assign(sz["topology"].GetString(), sz["topology"].GetStringLength());
        }
    }

    // Parse stores
    stores_.clear();
    if (doc.HasMember("stores") && doc["stores"].IsArray()) {
        const auto& stores = doc["stores"];
        for (rapidjson::SizeType i = 0; i < stores.Size(); i++) {
            if (!stores[i].IsObject()) continue;

            const auto& obj = stores[i];
            StoreEntry entry;

            if (!obj.HasMember("name") || !obj["name"].IsString() ||
                !obj.HasMember("class") || !obj["class"].IsString()) {
                return false;
            }
            entry.name = obj["name"].GetString();
            entry.class_name = obj["class"].GetString();

            if (obj.HasMember("paired") && obj["paired"].IsBool()) {
                entry.paired = obj["paired"].GetBool();
            }
            if (obj.HasMember("features") && obj["features"].IsArray()) {
                for (const auto& f : obj["features"].GetArray()) {
                    if (f.IsString()) entry.features.push_back(f.GetString());
                }
            }
            if (obj.HasMember("count") && obj["count"].IsUint64()) {
                entry.count = obj["count"].GetUint64();
            }

            stores_.push_back(entry);
        }
    }

    // Catalogs written before dict stores existed carry no "dicts"
    dicts_.clear();
    if (doc.HasMember("dicts") && doc["dicts"].IsArray()) {
        for (const auto& obj : doc["dicts"].GetArray()) {
            if (!obj.IsObject() ||
                !obj.HasMember("name") || !obj["name"].IsString() ||
                !obj.HasMember("keys") || !obj["keys"].IsString()) {
                return false;
            }
            DictEntry entry;
            entry.name = obj["name"].GetString();
            entry.key_store = obj["keys"].GetString();
            dicts_.push_back(entry);
        }
    }

    return true;
}

} // namespace persist
} // namespace pathstore
