/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "overwriting_eraser.h"
#include "pool_config.h"
#include "../util/log.h"
#include <boost/filesystem.hpp>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <errno.h>
#include <algorithm>
#include <cstring>
#include <random>
#include <vector>

namespace fdpool {
namespace storage {

bool OverwritingEraser::secure_erase(const std::string& path) {
    int flags = O_WRONLY;
#ifdef O_CLOEXEC
    flags |= O_CLOEXEC;
#endif
    int fd = ::open(path.c_str(), flags);
    if (fd < 0) {
        warning() << "[OverwritingEraser] Cannot open " << path << ": " << errnoWithDescription();
        return false;
    }

    bool ok = true;
    struct stat st;
    if (::fstat(fd, &st) != 0) {
        warning() << "[OverwritingEraser] Cannot stat " << path << ": " << errnoWithDescription();
        ok = false;
    }

    if (ok) {
        std::random_device rd;
        std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) | rd());
        std::vector<uint8_t> buf(files::kFillChunkSize);
        off_t size = st.st_size;
        for (off_t off = 0; ok && off < size; ) {
            for (size_t i = 0; i < buf.size(); i += sizeof(uint64_t)) {
                uint64_t v = gen();
                std::memcpy(buf.data() + i, &v, sizeof(uint64_t));
            }
            size_t n = static_cast<size_t>(std::min<off_t>(static_cast<off_t>(buf.size()), size - off));
            ssize_t w = ::pwrite(fd, buf.data(), n, off);
            if (w < 0) {
                if (errno == EINTR) continue;
                warning() << "[OverwritingEraser] Overwrite failed for " << path << ": "
                          << errnoWithDescription();
                ok = false;
                break;
            }
            off += w;
        }
    }

    if (ok && ::fsync(fd) != 0) {
        warning() << "[OverwritingEraser] fsync failed for " << path << ": " << errnoWithDescription();
        ok = false;
    }
    if (::close(fd) != 0) {
        ok = false;
    }

    boost::system::error_code ec;
    boost::filesystem::remove(path, ec);
    if (ec) {
        warning() << "[OverwritingEraser] Cannot remove " << path << ": " << ec.message();
        return false;
    }
    return ok;
}

} // namespace storage
} // namespace fdpool
