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

#include "field.h"
#include "storable_object.h"
#include <cmath>

namespace pathstore {

FieldValue FieldValue::array(std::vector<uint32_t> shape, std::vector<float> data,
                             Reversal reversal) {
    FieldValue v;
    v.kind = ARRAY;
    v.shape = std::move(shape);
    v.data = std::move(data);
    v.reversal = reversal;
    return v;
}

FieldValue FieldValue::reference(LazyProxy<StorableObject> ref) {
    FieldValue v;
    v.kind = REFERENCE;
    v.ref = std::move(ref);
    return v;
}

size_t FieldValue::element_count() const {
    size_t n = 1;
    for (uint32_t d : shape) n *= d;
    return n;
}

std::vector<float> FieldValue::logical(bool reversed) const {
    if (!reversed || reversal == Reversal::Identity) {
        return data;
    }
    std::vector<float> out(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        out[i] = -data[i];
    }
    return out;
}

bool FieldValue::equals(const FieldValue& o) const {
    if (kind != o.kind) return false;

    if (kind == ARRAY) {
        if (shape != o.shape || data.size() != o.data.size()) return false;
        for (size_t i = 0; i < data.size(); ++i) {
            if (data[i] != o.data[i] && !(std::isnan(data[i]) && std::isnan(o.data[i]))) {
                return false;
            }
        }
        return true;
    }

    if (ref.is_null() || o.ref.is_null()) {
        return ref.is_null() && o.ref.is_null();
    }
    if (ref.same_target(o.ref)) {
        return true;
    }
    // One side is an unsaved or differently addressed handle; compare targets
    std::shared_ptr<StorableObject> a = ref.get();
    std::shared_ptr<StorableObject> b = o.ref.get();
    return a == b || a->equals(*b);
}

bool fields_equal(const FieldMap& a, const FieldMap& b) {
    if (a.size() != b.size()) return false;
    auto ia = a.begin();
    auto ib = b.begin();
    for (; ia != a.end(); ++ia, ++ib) {
        if (ia->first != ib->first || !ia->second.equals(ib->second)) {
            return false;
        }
    }
    return true;
}

} // namespace pathstore
