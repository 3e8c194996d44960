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
#include <string>
#include <utility>
#include <vector>
#include "field.h"
#include "sizing.h"
#include "persistence/table_interface.h"

namespace pathstore {

    class ObjectStore;
    class StorableObject;

    /**
     * Lookup of sibling stores by name or record class. Features receive it
     * explicitly on every call instead of consulting global state.
     */
    class StoreResolver {
    public:
        virtual ~StoreResolver() = default;

        // UnknownClassError when absent
        virtual ObjectStore& store_named(const std::string& store_name) = 0;
        virtual ObjectStore& store_for(const std::string& class_name) = 0;
    };

    /**
     * Reusable descriptor bundling table variables, their allocation for a
     * given sizing, and per-record read/write at a row.
     *
     * Variable names returned by variables() are local; the owning store
     * prefixes them as "<store>.<variable>". Features are stateless and
     * may be shared by any number of stores.
     */
    class Feature {
    public:
        explicit Feature(std::string name, Reversal reversal = Reversal::Identity)
            : name_(std::move(name)), reversal_(reversal) {}
        virtual ~Feature() = default;

        const std::string& name() const { return name_; }
        Reversal reversal() const { return reversal_; }

        virtual std::vector<persist::VariableSpec> variables(const SizingMetadata& sizing) const = 0;

        // (store name, class name) of stores this feature writes into
        virtual std::vector<std::pair<std::string, std::string>> child_stores() const {
            return {};
        }

        // Allocate this feature's variables in the table
        virtual void init(persist::TableInterface& table, const std::string& prefix,
                          const SizingMetadata& sizing) const;

        virtual void write(persist::TableInterface& table, const std::string& prefix,
                           uint64_t row, const StorableObject& object,
                           StoreResolver& resolver) const = 0;

        virtual void read(const persist::TableInterface& table, const std::string& prefix,
                          uint64_t row, FieldMap& out, StoreResolver& resolver) const = 0;

        static std::string qualified(const std::string& prefix, const std::string& variable);

    private:
        std::string name_;
        Reversal reversal_;
    };

    typedef std::shared_ptr<const Feature> FeaturePtr;

    /**
     * Float32 array field shaped from the sizing metadata.
     *
     * An optional feature stores an absent field as a NaN row and omits it
     * again on read.
     */
    class ArrayFeature : public Feature {
    public:
        enum class Dim {
            ATOM,
            SPATIAL
        };

        ArrayFeature(std::string name, std::vector<Dim> dims,
                     Reversal reversal = Reversal::Identity,
                     bool optional = false,
                     std::string description = std::string());

        bool optional() const { return optional_; }
        std::vector<uint32_t> shape(const SizingMetadata& sizing) const;

        std::vector<persist::VariableSpec> variables(const SizingMetadata& sizing) const override;
        void write(persist::TableInterface& table, const std::string& prefix,
                   uint64_t row, const StorableObject& object,
                   StoreResolver& resolver) const override;
        void read(const persist::TableInterface& table, const std::string& prefix,
                  uint64_t row, FieldMap& out, StoreResolver& resolver) const override;

    private:
        std::vector<Dim> dims_;
        bool optional_;
        std::string description_;
    };

    /**
     * Reference to a record held by a child store, persisted as the child
     * index in one int64 column. Unsaved targets are saved into the child
     * store on write; reads produce unresolved proxies.
     */
    class ReferenceFeature : public Feature {
    public:
        ReferenceFeature(std::string name, std::string child_store, std::string child_class);

        const std::string& child_store() const { return child_store_; }
        const std::string& child_class() const { return child_class_; }

        std::vector<persist::VariableSpec> variables(const SizingMetadata& sizing) const override;
        std::vector<std::pair<std::string, std::string>> child_stores() const override;
        void write(persist::TableInterface& table, const std::string& prefix,
                   uint64_t row, const StorableObject& object,
                   StoreResolver& resolver) const override;
        void read(const persist::TableInterface& table, const std::string& prefix,
                  uint64_t row, FieldMap& out, StoreResolver& resolver) const override;

        // Stored child index at a row, without constructing a proxy
        uint64_t read_index(const persist::TableInterface& table, const std::string& prefix,
                            uint64_t row) const;

    private:
        std::string child_store_;
        std::string child_class_;
    };

    /**
     * Features known by name. Starts with the built-ins: coordinates,
     * velocities, box_vectors, configuration and momentum.
     */
    class FeatureRegistry {
    public:
        FeatureRegistry();

        // SchemaConflictError if the name is taken
        void register_feature(FeaturePtr feature);

        bool has(const std::string& name) const { return features_.count(name) != 0; }

        // UnknownClassError when absent
        FeaturePtr get(const std::string& name) const;

        std::vector<std::string> names() const;

    private:
        std::map<std::string, FeaturePtr> features_;
    };

    /**
     * Ordered composition of features forming one store's schema.
     */
    class FeatureSet {
    public:
        FeatureSet() = default;
        explicit FeatureSet(std::vector<FeaturePtr> features) : features_(std::move(features)) {}

        static FeatureSet from_names(const FeatureRegistry& registry,
                                     const std::vector<std::string>& names);

        void add(FeaturePtr feature) { features_.push_back(std::move(feature)); }

        const std::vector<FeaturePtr>& features() const { return features_; }
        size_t size() const { return features_.size(); }

        // nullptr when absent
        const Feature* find(const std::string& name) const;

        // Union of all features' variables, prefixed; SchemaConflictError on
        // a duplicate name
        std::vector<persist::VariableSpec> variables(const std::string& prefix,
                                                     const SizingMetadata& sizing) const;

        // Checks the whole schema before allocating anything
        void init(persist::TableInterface& table, const std::string& prefix,
                  const SizingMetadata& sizing) const;

        void write(persist::TableInterface& table, const std::string& prefix,
                   uint64_t row, const StorableObject& object, StoreResolver& resolver) const;
        void read(const persist::TableInterface& table, const std::string& prefix,
                  uint64_t row, FieldMap& out, StoreResolver& resolver) const;

    private:
        std::vector<FeaturePtr> features_;
    };

} // namespace pathstore
