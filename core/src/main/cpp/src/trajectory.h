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
#include <vector>
#include "lazy_proxy.h"
#include "records.h"

namespace pathstore {

    /**
     * Ordered sequence of snapshot handles.
     */
    class Trajectory {
    public:
        typedef std::vector<LazyProxy<Snapshot>>::const_iterator const_iterator;

        Trajectory() = default;
        explicit Trajectory(std::vector<LazyProxy<Snapshot>> frames) : frames_(std::move(frames)) {}

        void push_back(LazyProxy<Snapshot> frame) { frames_.push_back(std::move(frame)); }
        void push_back(const std::shared_ptr<Snapshot>& frame) { frames_.emplace_back(frame); }

        size_t size() const { return frames_.size(); }
        bool empty() const { return frames_.empty(); }

        const LazyProxy<Snapshot>& operator[](size_t i) const { return frames_[i]; }
        const LazyProxy<Snapshot>& front() const { return frames_.front(); }
        const LazyProxy<Snapshot>& back() const { return frames_.back(); }

        const_iterator begin() const { return frames_.begin(); }
        const_iterator end() const { return frames_.end(); }

        /**
         * Time-reversed trajectory: frames in reverse order, each replaced
         * by its twin. Stored frames map to index ^ 1 without any read;
         * in-memory frames become their reversed copies.
         */
        Trajectory reversed() const {
            std::vector<LazyProxy<Snapshot>> out;
            out.reserve(frames_.size());
            for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
                if (it->has_index()) {
                    out.emplace_back(it->store(), it->index() ^ 1);
                } else {
                    out.emplace_back((*it)->reversed_copy());
                }
            }
            return Trajectory(std::move(out));
        }

        // Store indices of stored frames; InconsistentStateError for in-memory ones
        std::vector<uint64_t> indices() const {
            std::vector<uint64_t> out;
            out.reserve(frames_.size());
            for (const auto& f : frames_) {
                if (!f.has_index()) {
                    throw persist::InconsistentStateError("trajectory frame is not stored");
                }
                out.push_back(f.index());
            }
            return out;
        }

    private:
        std::vector<LazyProxy<Snapshot>> frames_;
    };

} // namespace pathstore
