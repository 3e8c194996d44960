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
#include <vector>
#include "lazy_proxy.h"

namespace pathstore {

    class StorableObject;

    // How a field's logical value relates to its stored value when the
    // owning record is the time-reversed twin.
    enum class Reversal : uint8_t {
        Identity,
        Negate
    };

    /**
     * One feature-contributed value of a record: a float32 array of fixed
     * shape, or a reference to a record held by another store.
     */
    struct FieldValue {
        enum Kind {
            ARRAY,
            REFERENCE
        };

        Kind kind = ARRAY;
        std::vector<uint32_t> shape;
        std::vector<float> data;
        LazyProxy<StorableObject> ref;
        Reversal reversal = Reversal::Identity;

        static FieldValue array(std::vector<uint32_t> shape, std::vector<float> data,
                                Reversal reversal = Reversal::Identity);
        static FieldValue reference(LazyProxy<StorableObject> ref);

        bool is_array() const { return kind == ARRAY; }
        bool is_reference() const { return kind == REFERENCE; }

        size_t element_count() const;

        // Logical view: data negated when the field negates under reversal
        std::vector<float> logical(bool reversed) const;

        bool equals(const FieldValue& o) const;
    };

    typedef std::map<std::string, FieldValue> FieldMap;

    bool fields_equal(const FieldMap& a, const FieldMap& b);

} // namespace pathstore
