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
#include <memory>
#include <string>
#include <vector>
#include "storable_object.h"
#include "sizing.h"

namespace pathstore {

    /**
     * Atomic positions of one frame, n_atoms x n_spatial, with optional
     * n_spatial x n_spatial periodic box vectors.
     */
    class Configuration : public StorableObject {
    public:
        static constexpr const char* kClassName = "Configuration";

        Configuration(uint32_t n_atoms, uint32_t n_spatial,
                      std::vector<float> coordinates,
                      std::vector<float> box_vectors = std::vector<float>());

        // Rebuilt from stored fields
        explicit Configuration(std::shared_ptr<const FieldMap> fields);

        uint32_t n_atoms() const { return n_atoms_; }
        uint32_t n_spatial() const { return n_spatial_; }

        const std::vector<float>& coordinates() const;
        bool has_box_vectors() const { return find_field("box_vectors") != nullptr; }
        const std::vector<float>& box_vectors() const;

    private:
        uint32_t n_atoms_;
        uint32_t n_spatial_;
    };

    /**
     * Atomic velocities of one frame, n_atoms x n_spatial.
     */
    class Momentum : public StorableObject {
    public:
        static constexpr const char* kClassName = "Momentum";

        Momentum(uint32_t n_atoms, uint32_t n_spatial, std::vector<float> velocities);
        explicit Momentum(std::shared_ptr<const FieldMap> fields);

        uint32_t n_atoms() const { return n_atoms_; }
        uint32_t n_spatial() const { return n_spatial_; }

        const std::vector<float>& velocities() const;

    private:
        uint32_t n_atoms_;
        uint32_t n_spatial_;
    };

    /**
     * Paired record: one phase-space point and a direction of time.
     *
     * Class "Snapshot" references a Configuration and a Momentum held by
     * child stores; class "ToySnapshot" carries coordinates and velocities
     * inline. The twin returned by reversed_copy() shares the physical
     * payload and differs only in is_reversed(); its logical velocities are
     * the stored ones negated. The twin does not inherit the name.
     */
    class Snapshot : public StorableObject {
    public:
        static constexpr const char* kClassName = "Snapshot";
        static constexpr const char* kToyClassName = "ToySnapshot";

        Snapshot(std::string class_name, std::shared_ptr<const FieldMap> payload, bool reversed);

        static std::shared_ptr<Snapshot> create(const std::shared_ptr<Configuration>& configuration,
                                                const std::shared_ptr<Momentum>& momentum,
                                                bool reversed = false);
        static std::shared_ptr<Snapshot> create(LazyProxy<Configuration> configuration,
                                                LazyProxy<Momentum> momentum,
                                                bool reversed = false);
        static std::shared_ptr<Snapshot> toy(uint32_t n_atoms, uint32_t n_spatial,
                                             std::vector<float> coordinates,
                                             std::vector<float> velocities,
                                             bool reversed = false);

        bool is_reversed() const { return reversed_; }
        bool is_toy() const { return class_name() == kToyClassName; }

        LazyProxy<Configuration> configuration() const;
        LazyProxy<Momentum> momentum() const;

        // Logical values: resolves references for composite snapshots
        std::vector<float> coordinates() const;
        std::vector<float> velocities() const;

        // Logical view of an inline array field
        std::vector<float> logical(const std::string& field_name) const;

        std::shared_ptr<Snapshot> reversed_copy() const;

        // Same physical payload, opposite direction
        bool is_twin_of(const Snapshot& o) const {
            return shared_fields() == o.shared_fields() && reversed_ != o.reversed_;
        }

        bool equals(const StorableObject& o) const override;
        std::string describe() const override;

    private:
        bool reversed_;
    };

    // Build the in-memory record for a class tag from stored fields
    std::shared_ptr<StorableObject> make_record(const std::string& class_name,
                                                std::shared_ptr<const FieldMap> fields);

    // Sizing metadata inferred from an example record
    SizingMetadata sizing_from_template(const std::shared_ptr<const StorableObject>& record,
                                        const std::string& topology = std::string());

} // namespace pathstore
