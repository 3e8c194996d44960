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
#include <cstdlib>
#include <string>
#include "config.h"  // For defaults

namespace pathstore {
namespace persist {

/**
 * Runtime configuration for a store registry and the table beneath it.
 * Can be customized per-registry instead of compile-time constants.
 */
struct StorageConfig {
    // Object cache sizing, parsed by createCachePolicy()
    std::string cache_policy   = "";                        // Empty: PATHSTORE_CACHE_POLICY or default

    // Variable table layout
    uint32_t chunk_rows        = table::kDefaultChunkRows;  // Rows per allocated chunk

    // Durability
    bool sync_on_flush         = true;                      // fsync the table file on flush()

    /**
     * Create config with defaults, optionally reading from environment
     */
    static StorageConfig defaults() {
        StorageConfig cfg;

        // Check environment variables for overrides
        if (const char* env = std::getenv(env::kCachePolicy)) {
            cfg.cache_policy = env;
        }

        if (const char* env = std::getenv(env::kChunkRows)) {
            unsigned long rows = std::strtoul(env, nullptr, 10);
            if (rows > 0) {
                cfg.chunk_rows = static_cast<uint32_t>(rows);
            }
        }

        if (const char* env = std::getenv(env::kSyncOnFlush)) {
            std::string v(env);
            cfg.sync_on_flush = !(v == "0" || v == "false" || v == "off");
        }

        return cfg;
    }

    /**
     * Create config for bulk sampling runs (many small writes)
     */
    static StorageConfig sampling() {
        StorageConfig cfg;
        cfg.cache_policy = "sampling";
        cfg.chunk_rows = 1024;               // Fewer, larger allocations
        cfg.sync_on_flush = true;
        return cfg;
    }

    /**
     * Create config for read-mostly analysis of finished runs
     */
    static StorageConfig analysis() {
        StorageConfig cfg;
        cfg.cache_policy = "analysis";
        cfg.chunk_rows = 256;
        cfg.sync_on_flush = false;           // Nothing new to make durable
        return cfg;
    }

    /**
     * Create config for memory-constrained systems
     */
    static StorageConfig low_memory() {
        StorageConfig cfg;
        cfg.cache_policy = "minimal";
        cfg.chunk_rows = 16;
        return cfg;
    }

    /**
     * Validate configuration
     */
    bool validate() const {
        if (chunk_rows < 1 || chunk_rows > table::kMaxChunkRows) {
            return false;
        }
        return true;
    }
};

} // namespace persist
} // namespace pathstore
