/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * On-disk description of a PooledFile, used to rebuild it after restart.
 *
 * Layout (big-endian, no padding):
 *   int32   magic
 *   int32   version
 *   uint16  path byte length, followed by the path bytes
 *   uint8   read_only
 *   int64   length
 *   int64   persistent_id   (-1 = not tracked by the naming service)
 *   uint8   secure_delete
 */

#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>

namespace fdpool {
namespace storage {

struct PooledFileRecord {
    static constexpr uint32_t MAGIC = 0x297c550a;
    static constexpr uint32_t VERSION = 1;

    std::string path;
    bool read_only = false;
    int64_t length = 0;
    int64_t persistent_id = -1;
    bool secure_delete = false;
};

// Throws StorageFormatError if the path does not fit, StorageIOError if the stream fails
void write_pooled_file_record(std::ostream& out, const PooledFileRecord& rec);

// Throws StorageFormatError on bad magic, version, length or a truncated record
PooledFileRecord read_pooled_file_record(std::istream& in);

} // namespace storage
} // namespace fdpool
