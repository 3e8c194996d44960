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

#include <cstddef>
#include <cstdlib>
#include <cstdint>
#include <string>
#include <memory>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <sys/sysinfo.h>
#include "persistence/config.h"

namespace pathstore {

namespace detail {
    inline size_t getTotalSystemMemory();
}

/**
 * Abstract base class for object cache sizing policies.
 *
 * Policies bound the number of materialized records an ObjectCache keeps
 * before evicting the least recently used one.
 */
class CachePolicy {
public:
    virtual ~CachePolicy() = default;

    /**
     * Get the maximum number of cached records.
     * @return Entry budget, or 0 for unlimited
     */
    virtual size_t getMaxEntries() const = 0;

    /**
     * Get the policy name for logging/debugging.
     */
    virtual const char* name() const = 0;
};

// ============================================================================
// System Memory Detection
// ============================================================================

namespace detail {

inline size_t getTotalSystemMemory() {
    struct sysinfo info;
    if (sysinfo(&info) == 0) {
        return info.totalram * info.mem_unit;
    }
    return 4ULL * 1024 * 1024 * 1024;  // Default 4GB
}

} // namespace detail

// ============================================================================
// Policy Implementations
// ============================================================================

/**
 * Unlimited cache - never evicts.
 */
class UnlimitedCachePolicy : public CachePolicy {
public:
    size_t getMaxEntries() const override { return 0; }
    const char* name() const override { return "Unlimited"; }
};

/**
 * Fixed number of records.
 */
class FixedEntriesCachePolicy : public CachePolicy {
public:
    explicit FixedEntriesCachePolicy(size_t entries) : budget_(entries) {}

    size_t getMaxEntries() const override { return budget_; }
    const char* name() const override { return "FixedEntries"; }

    void setBudget(size_t entries) { budget_ = entries; }

private:
    size_t budget_;
};

/**
 * Percentage of total system memory, converted to records through an
 * expected per-record footprint (a frame of n_atoms x 3 floats).
 */
class PercentageMemoryCachePolicy : public CachePolicy {
public:
    /**
     * @param percentage Percentage of system RAM (1-100)
     * @param bytesPerRecord Expected footprint of one cached record
     */
    PercentageMemoryCachePolicy(unsigned percentage, size_t bytesPerRecord = 64 * 1024)
        : percentage_(std::min(100u, std::max(1u, percentage)))
        , budget_(std::max<size_t>(1, (detail::getTotalSystemMemory() / 100 * percentage_)
                                       / std::max<size_t>(1, bytesPerRecord))) {}

    size_t getMaxEntries() const override { return budget_; }
    const char* name() const override { return "PercentageMemory"; }

    unsigned getPercentage() const { return percentage_; }

private:
    unsigned percentage_;
    size_t budget_;
};

/**
 * Tiered policy based on workload hints.
 */
enum class WorkloadType {
    Sampling,         // Write-heavy: new trajectories streamed in
    Analysis,         // Read-heavy: keep more frames resident
    Mixed,            // Balanced
    MemoryConstrained // Minimal footprint
};

class WorkloadCachePolicy : public CachePolicy {
public:
    explicit WorkloadCachePolicy(WorkloadType workload)
        : workload_(workload)
        , budget_(calculateBudget(workload)) {}

    size_t getMaxEntries() const override { return budget_; }
    const char* name() const override { return "Workload"; }

    WorkloadType getWorkload() const { return workload_; }

private:
    static size_t calculateBudget(WorkloadType workload) {
        const size_t base = persist::store::kDefaultCacheEntries;

        switch (workload) {
            case WorkloadType::Sampling:
                return base / 10;
            case WorkloadType::Analysis:
                return base * 4;
            case WorkloadType::Mixed:
                return base;
            case WorkloadType::MemoryConstrained:
                return base / 100;
        }
        return base;
    }

    WorkloadType workload_;
    size_t budget_;
};

// ============================================================================
// Factory Functions
// ============================================================================

/**
 * Create a policy from a simple string specification.
 *
 * Formats:
 *   "unlimited"           - No limit
 *   "5000"                - Fixed record count
 *   "25%"                 - Percentage of RAM
 *   "sampling" / "analysis" / "mixed" / "minimal" - Workload presets
 *
 * @return Shared pointer to the policy, or nullptr if invalid
 */
inline std::shared_ptr<CachePolicy> createCachePolicy(const std::string& spec) {
    if (spec.empty() || spec == "unlimited" || spec == "0") {
        return std::make_shared<UnlimitedCachePolicy>();
    }

    auto all_digits = [](const std::string& s) {
        return !s.empty() && std::all_of(s.begin(), s.end(),
                                         [](unsigned char c) { return std::isdigit(c) != 0; });
    };

    try {
        if (spec.back() == '%') {
            std::string num = spec.substr(0, spec.size() - 1);
            if (!all_digits(num)) return nullptr;
            unsigned long pct = std::stoul(num);
            if (pct > 100) return nullptr;
            return std::make_shared<PercentageMemoryCachePolicy>(static_cast<unsigned>(pct));
        }

        if (all_digits(spec)) {
            return std::make_shared<FixedEntriesCachePolicy>(std::stoull(spec));
        }
    } catch (const std::out_of_range&) {
        return nullptr;  // Does not fit
    }

    if (spec == "sampling" || spec == "write") {
        return std::make_shared<WorkloadCachePolicy>(WorkloadType::Sampling);
    } else if (spec == "analysis" || spec == "read") {
        return std::make_shared<WorkloadCachePolicy>(WorkloadType::Analysis);
    } else if (spec == "mixed" || spec == "balanced") {
        return std::make_shared<WorkloadCachePolicy>(WorkloadType::Mixed);
    } else if (spec == "minimal" || spec == "constrained") {
        return std::make_shared<WorkloadCachePolicy>(WorkloadType::MemoryConstrained);
    }

    return nullptr;  // Unknown policy string
}

/**
 * Get the default cache policy from environment variable PATHSTORE_CACHE_POLICY.
 * Falls back to a fixed budget of kDefaultCacheEntries if not set or invalid.
 */
inline std::shared_ptr<CachePolicy> getDefaultCachePolicy() {
    const char* envPolicy = std::getenv(persist::env::kCachePolicy);
    if (envPolicy) {
        auto policy = createCachePolicy(envPolicy);
        if (policy) return policy;
    }
    return std::make_shared<FixedEntriesCachePolicy>(persist::store::kDefaultCacheEntries);
}

} // namespace pathstore
