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

namespace pathstore {

    class StorableObject;

    /**
     * Sizing metadata fixed once per store: how many atoms each frame has,
     * the spatial dimensionality and an opaque topology description.
     * An optional template record supplies the values when they were
     * inferred from an example.
     */
    struct SizingMetadata {
        uint32_t n_atoms = 0;
        uint32_t n_spatial = 3;
        std::string topology;
        std::shared_ptr<const StorableObject> template_record;

        SizingMetadata() = default;
        SizingMetadata(uint32_t atoms, uint32_t spatial, std::string topo = std::string())
            : n_atoms(atoms), n_spatial(spatial), topology(std::move(topo)) {}

        // The template is only a source of the numbers, not part of the identity
        bool operator==(const SizingMetadata& o) const {
            return n_atoms == o.n_atoms && n_spatial == o.n_spatial && topology == o.topology;
        }
        bool operator!=(const SizingMetadata& o) const { return !(*this == o); }

        std::string to_string() const {
            return "n_atoms=" + std::to_string(n_atoms) + " n_spatial=" +
                   std::to_string(n_spatial) + " topology='" + topology + "'";
        }
    };

    /**
     * Capability interface for collaborator objects that describe a
     * molecular system (an engine, a topology file, a test fixture).
     */
    class SystemDescription {
    public:
        virtual ~SystemDescription() = default;

        virtual uint32_t n_atoms() const = 0;
        virtual uint32_t n_spatial() const = 0;
        virtual std::string topology() const = 0;

        SizingMetadata sizing() const {
            return SizingMetadata(n_atoms(), n_spatial(), topology());
        }
    };

} // namespace pathstore
