/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "pooled_file_record.h"
#include "storage_errors.h"
#include "../util/endian.hpp"
#include <istream>
#include <ostream>
#include <limits>
#include <vector>

namespace fdpool {
namespace storage {

namespace {

void write_bytes(std::ostream& out, const void* data, size_t len) {
    out.write(static_cast<const char*>(data), static_cast<std::streamsize>(len));
    if (!out) {
        throw StorageIOError("Failed to write pooled file record");
    }
}

void read_bytes(std::istream& in, void* data, size_t len) {
    in.read(static_cast<char*>(data), static_cast<std::streamsize>(len));
    if (static_cast<size_t>(in.gcount()) != len) {
        throw StorageFormatError("Truncated pooled file record");
    }
}

uint32_t read_u32(std::istream& in) {
    uint8_t b[4];
    read_bytes(in, b, sizeof(b));
    return util::load_be32(b);
}

uint64_t read_u64(std::istream& in) {
    uint8_t b[8];
    read_bytes(in, b, sizeof(b));
    return util::load_be64(b);
}

bool read_bool(std::istream& in) {
    uint8_t b;
    read_bytes(in, &b, 1);
    return b != 0;
}

} // namespace

void write_pooled_file_record(std::ostream& out, const PooledFileRecord& rec) {
    if (rec.path.size() > std::numeric_limits<uint16_t>::max()) {
        throw StorageFormatError("Path too long for pooled file record: " +
                                 std::to_string(rec.path.size()) + " bytes");
    }

    uint8_t header[10];
    util::store_be32(header, PooledFileRecord::MAGIC);
    util::store_be32(header + 4, PooledFileRecord::VERSION);
    util::store_be16(header + 8, static_cast<uint16_t>(rec.path.size()));
    write_bytes(out, header, sizeof(header));
    write_bytes(out, rec.path.data(), rec.path.size());

    uint8_t tail[18];
    tail[0] = rec.read_only ? 1 : 0;
    util::store_be64(tail + 1, static_cast<uint64_t>(rec.length));
    util::store_be64(tail + 9, static_cast<uint64_t>(rec.persistent_id));
    tail[17] = rec.secure_delete ? 1 : 0;
    write_bytes(out, tail, sizeof(tail));
}

PooledFileRecord read_pooled_file_record(std::istream& in) {
    if (read_u32(in) != PooledFileRecord::MAGIC) {
        throw StorageFormatError("Bad magic");
    }
    uint32_t version = read_u32(in);
    if (version != PooledFileRecord::VERSION) {
        throw StorageFormatError("Bad version " + std::to_string(version));
    }

    uint8_t len_bytes[2];
    read_bytes(in, len_bytes, sizeof(len_bytes));
    std::vector<char> path(util::load_be16(len_bytes));
    if (!path.empty()) {
        read_bytes(in, path.data(), path.size());
    }

    PooledFileRecord rec;
    rec.path.assign(path.begin(), path.end());
    rec.read_only = read_bool(in);
    rec.length = static_cast<int64_t>(read_u64(in));
    rec.persistent_id = static_cast<int64_t>(read_u64(in));
    rec.secure_delete = read_bool(in);

    if (rec.length < 0) {
        throw StorageFormatError("Bad length " + std::to_string(rec.length));
    }
    return rec;
}

} // namespace storage
} // namespace fdpool
