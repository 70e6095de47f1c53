/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "pooled_file.h"
#include "pooled_file_record.h"
#include "storage_errors.h"
#include "../util/endian.hpp"
#include "../util/log.h"
#include <boost/filesystem.hpp>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <algorithm>
#include <cstring>
#include <random>
#include <stdexcept>
#include <vector>

namespace fdpool {
namespace storage {

namespace fs = boost::filesystem;

namespace {

// Positional read looping over short reads. Returns bytes read, < len only at EOF.
size_t read_fully(int fd, uint8_t* buf, size_t len, int64_t offset, const std::string& path) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pread(fd, buf + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw StorageIOError("Failed to read " + path, errno);
        }
        if (n == 0) break;
        done += static_cast<size_t>(n);
    }
    return done;
}

void write_fully(int fd, const uint8_t* buf, size_t len, int64_t offset, const std::string& path) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pwrite(fd, buf + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw StorageIOError("Failed to write " + path, errno);
        }
        done += static_cast<size_t>(n);
    }
}

bool file_exists(const std::string& path) {
    boost::system::error_code ec;
    return fs::exists(path, ec);
}

} // namespace

void PooledFile::Lock::unlock() {
    if (file_) {
        PooledFile* f = file_;
        file_ = nullptr;
        f->pool_->release(*f);
    }
}

PooledFile::PooledFile(std::shared_ptr<HandlePool> pool, const std::string& path, bool read_only,
                       int64_t force_length, std::optional<uint64_t> seed_random,
                       int64_t persistent_id)
    : pool_(std::move(pool)), path_(path), read_only_(read_only),
      persistent_id_(persistent_id),
      secure_delete_(pool_->secure_delete_by_default()) {
    // Unlocking puts us on the idle list, so the descriptor is reusable right away
    Lock lock = lock_open();
    try {
        {
            std::lock_guard<std::mutex> io(io_mu_);
            int64_t current_length = fh_.size(path_);
            if (force_length >= 0 && force_length != current_length) {
                fill_to_length(force_length, seed_random);
                current_length = force_length;
            }
            length_ = current_length;
        }
        lock.unlock();
    } catch (...) {
        lock.unlock();
        pool_->close(*this);
        throw;
    }
}

PooledFile::PooledFile(std::shared_ptr<HandlePool> pool, const std::string& path,
                       const uint8_t* initial_contents, size_t offset, size_t size,
                       int64_t persistent_id)
    : pool_(std::move(pool)), path_(path), read_only_(false),
      length_(static_cast<int64_t>(size)),
      persistent_id_(persistent_id),
      secure_delete_(pool_->secure_delete_by_default()) {
    Lock lock = lock_open();
    try {
        {
            std::lock_guard<std::mutex> io(io_mu_);
            write_fully(fh_.fd, initial_contents + offset, size, 0, path_);
            if (::ftruncate(fh_.fd, static_cast<off_t>(size)) != 0) {
                throw StorageIOError("Failed to truncate " + path_, errno);
            }
        }
        lock.unlock();
    } catch (...) {
        lock.unlock();
        pool_->close(*this);
        throw;
    }
}

PooledFile::PooledFile(std::shared_ptr<HandlePool> pool, const PooledFileRecord& record,
                       const std::string& resolved_path)
    : pool_(std::move(pool)), path_(resolved_path), read_only_(record.read_only),
      length_(record.length), persistent_id_(record.persistent_id),
      secure_delete_(record.secure_delete) {
}

PooledFile::~PooledFile() {
    try {
        close();
    } catch (const PoolStateError& e) {
        error() << "[PooledFile] Destroyed while locked, force closing: " << e.what();
        pool_->abandon(*this);
    }
}

void PooledFile::fill_to_length(int64_t force_length, std::optional<uint64_t> seed_random) {
    // Preallocate. We want predictable disk usage, not minimal disk usage.
    std::optional<std::mt19937_64> gen;
    if (seed_random) {
        gen.emplace(*seed_random);
    }

    std::vector<uint8_t> buf(files::kFillChunkSize, 0);
    for (int64_t off = 0; off < force_length; off += files::kFillChunkSize) {
        if (gen) {
            for (size_t i = 0; i < buf.size(); i += sizeof(uint64_t)) {
                util::store_be64(buf.data() + i, (*gen)());
            }
        }
        size_t n = static_cast<size_t>(
            std::min<int64_t>(files::kFillChunkSize, force_length - off));
        write_fully(fh_.fd, buf.data(), n, off, path_);
    }

    if (::ftruncate(fh_.fd, static_cast<off_t>(force_length)) != 0) {
        throw StorageIOError("Failed to set length of " + path_, errno);
    }
}

void PooledFile::open_handle() {
    std::lock_guard<std::mutex> io(io_mu_);
    fh_ = FileHandle::open(path_, !read_only_);
}

bool PooledFile::close_handle() {
    std::lock_guard<std::mutex> io(io_mu_);
    if (!fh_.is_open()) {
        return false;
    }
    int err = fh_.close();
    if (err != 0) {
        error() << "[PooledFile] Error closing " << path_ << ": " << errnoWithDescription(err);
    }
    return true;
}

PooledFile::Lock PooledFile::lock_open() {
    pool_->acquire(*this);
    return Lock(this);
}

void PooledFile::pread(int64_t offset, uint8_t* buf, size_t buf_offset, size_t len) {
    if (offset < 0) {
        throw std::invalid_argument("Negative offset " + std::to_string(offset));
    }

    Lock lock = lock_open();
    std::lock_guard<std::mutex> io(io_mu_);
    size_t got = read_fully(fh_.fd, buf + buf_offset, len, offset, path_);
    if (got < len) {
        throw ShortReadError("Short read on " + path_ + ": wanted " + std::to_string(len) +
                             " bytes at " + std::to_string(offset) + ", got " +
                             std::to_string(got));
    }
}

void PooledFile::pwrite(int64_t offset, const uint8_t* buf, size_t buf_offset, size_t len) {
    if (offset < 0) {
        throw std::invalid_argument("Negative offset " + std::to_string(offset));
    }
    if (read_only_) {
        throw ReadOnlyError("Read only: " + path_);
    }
    if (offset > length_ || len > static_cast<uint64_t>(length_ - offset)) {
        throw BoundsError("Length limit exceeded: " + std::to_string(len) + " bytes at " +
                          std::to_string(offset) + " on " + path_ + " of length " +
                          std::to_string(length_));
    }

    Lock lock = lock_open();
    std::lock_guard<std::mutex> io(io_mu_);
    write_fully(fh_.fd, buf + buf_offset, len, offset, path_);
}

void PooledFile::close() {
    pool_->close(*this);
}

void PooledFile::free() {
    close();
    if (secure_delete_.load()) {
        if (!pool_->eraser().secure_erase(path_)) {
            error() << "[PooledFile] Unable to securely delete " << path_;
        }
    } else {
        boost::system::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            warning() << "[PooledFile] Unable to delete " << path_ << ": " << ec.message();
        }
    }
}

bool PooledFile::is_open() const {
    std::lock_guard<std::mutex> io(io_mu_);
    return fh_.is_open();
}

bool PooledFile::is_locked() const {
    std::lock_guard<std::mutex> lock(pool_->mu_);
    return lock_count_ != 0;
}

bool PooledFile::is_closed() const {
    std::lock_guard<std::mutex> lock(pool_->mu_);
    return closed_;
}

void PooledFile::store_to(std::ostream& out) const {
    PooledFileRecord rec;
    rec.path = path_;
    rec.read_only = read_only_;
    rec.length = length_;
    rec.persistent_id = persistent_id_;
    rec.secure_delete = secure_delete_.load();
    write_pooled_file_record(out, rec);
}

std::unique_ptr<PooledFile> PooledFile::restore_from(std::istream& in,
                                                     std::shared_ptr<HandlePool> pool,
                                                     const RestoreContext& ctx) {
    PooledFileRecord rec = read_pooled_file_record(in);

    std::string path = rec.path;
    if (rec.persistent_id != -1) {
        bool found = false;
        if (!file_exists(path)) {
            // Maybe moved after the last checkpoint?
            std::string expected = ctx.resolver.path_for_id(rec.persistent_id);
            if (file_exists(expected)) {
                ctx.tracker.register_file(expected);
                path = expected;
                found = true;
            }
        }
        if (!found) {
            path = ctx.resolver.relocate(path, rec.persistent_id);
            if (!file_exists(path)) {
                throw ResumeFailedError("Persistent file lost: " + path);
            }
        }
        if (path != rec.path) {
            info() << "[PooledFile] Restored " << rec.path << " from " << path;
        }
    } else if (!file_exists(path)) {
        throw ResumeFailedError("Lost file " + path);
    }

    return std::unique_ptr<PooledFile>(new PooledFile(std::move(pool), rec, path));
}

void PooledFile::on_resume() const {
    boost::system::error_code ec;
    if (!fs::exists(path_, ec)) {
        throw ResumeFailedError("File does not exist: " + path_);
    }
    boost::uintmax_t actual = fs::file_size(path_, ec);
    if (ec) {
        throw ResumeFailedError("Cannot stat " + path_ + ": " + ec.message());
    }
    if (static_cast<boost::uintmax_t>(length_) > actual) {
        throw ResumeFailedError("Bad length: " + path_ + " holds " + std::to_string(actual) +
                                " bytes, expected " + std::to_string(length_));
    }
}

} // namespace storage
} // namespace fdpool
