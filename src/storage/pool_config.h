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
#include <string>

namespace fdpool {
namespace storage {

namespace files {
    // Preallocation chunk used when a file is forced to a fixed length
    constexpr size_t kFillChunkSize = 4096;

    // Default number of descriptors a pool may keep open at once
    constexpr int kDefaultMaxOpenFiles = 100;

    // Descriptors left to the rest of the process when capping to RLIMIT_NOFILE
    constexpr size_t kReservedDescriptors = 64;
}

/**
 * Runtime configuration for a HandlePool
 */
struct PoolConfig {
    int  max_open_files           = files::kDefaultMaxOpenFiles;
    bool secure_delete_by_default = false;

    /**
     * Create config with defaults, optionally reading from environment
     */
    static PoolConfig defaults() {
        PoolConfig cfg;

        if (const char* env = std::getenv("FDPOOL_MAX_OPEN_FILES")) {
            cfg.max_open_files = std::stoi(env);
        }

        if (const char* env = std::getenv("FDPOOL_SECURE_DELETE")) {
            cfg.secure_delete_by_default = (std::string(env) != "0");
        }

        return cfg;
    }

    bool validate() const {
        return max_open_files > 0;
    }
};

} // namespace storage
} // namespace fdpool
