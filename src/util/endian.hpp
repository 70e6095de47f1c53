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

namespace fdpool {
namespace util {

/**
 * Byte order helpers for the persisted file records.
 *
 * Records are written in network (big-endian) order so that they stay
 * readable by tools that speak the classic DataOutput layout, regardless
 * of the host byte order.
 */

// Store functions - convert from host to big-endian wire format

inline void store_be16(uint8_t* buf, uint16_t val) {
    buf[0] = static_cast<uint8_t>(val >> 8);
    buf[1] = static_cast<uint8_t>(val);
}

inline void store_be32(uint8_t* buf, uint32_t val) {
    buf[0] = static_cast<uint8_t>(val >> 24);
    buf[1] = static_cast<uint8_t>(val >> 16);
    buf[2] = static_cast<uint8_t>(val >> 8);
    buf[3] = static_cast<uint8_t>(val);
}

inline void store_be64(uint8_t* buf, uint64_t val) {
    store_be32(buf, static_cast<uint32_t>(val >> 32));
    store_be32(buf + 4, static_cast<uint32_t>(val));
}

// Load functions - convert from big-endian wire format to host

inline uint16_t load_be16(const uint8_t* buf) {
    return static_cast<uint16_t>((static_cast<uint16_t>(buf[0]) << 8) |
                                 static_cast<uint16_t>(buf[1]));
}

inline uint32_t load_be32(const uint8_t* buf) {
    return (static_cast<uint32_t>(buf[0]) << 24) |
           (static_cast<uint32_t>(buf[1]) << 16) |
           (static_cast<uint32_t>(buf[2]) << 8) |
           static_cast<uint32_t>(buf[3]);
}

inline uint64_t load_be64(const uint8_t* buf) {
    return (static_cast<uint64_t>(load_be32(buf)) << 32) |
           static_cast<uint64_t>(load_be32(buf + 4));
}

} // namespace util
} // namespace fdpool
