/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "handle_pool.h"
#include "pooled_file.h"
#include "overwriting_eraser.h"
#include "storage_errors.h"
#include "../util/log.h"
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <errno.h>
#include <iterator>
#include <stdexcept>
#ifndef _WIN32
#include <sys/resource.h>
#endif

namespace fdpool {
namespace storage {

FileHandle FileHandle::open(const std::string& path, bool writable) {
    // Open with O_CLOEXEC to prevent FD leaks to child processes
    int flags = writable ? (O_RDWR | O_CREAT) : O_RDONLY;
#ifdef O_CLOEXEC
    flags |= O_CLOEXEC;
#endif

    int fd = ::open(path.c_str(), flags, 0644);
    if (fd < 0) {
        throw StorageIOError("Failed to open file " + path, errno);
    }

    FileHandle fh;
    fh.fd = fd;
    fh.writable = writable;
    return fh;
}

int64_t FileHandle::size(const std::string& path) const {
    struct stat st;
    if (::fstat(fd, &st) != 0) {
        throw StorageIOError("Failed to stat file " + path, errno);
    }
    return static_cast<int64_t>(st.st_size);
}

int FileHandle::close() {
    int err = 0;
    if (fd >= 0) {
        if (::close(fd) != 0) {
            err = errno;
        }
        fd = -1;
    }
    return err;
}

HandlePool::HandlePool(const PoolConfig& config, std::shared_ptr<SecureEraser> eraser)
    : max_open_files_(config.max_open_files),
      secure_delete_by_default_(config.secure_delete_by_default),
      eraser_(std::move(eraser)) {
    if (!config.validate()) {
        throw std::invalid_argument("max_open_files must be positive, got " +
                                    std::to_string(config.max_open_files));
    }
    if (!eraser_) {
        eraser_ = std::make_shared<OverwritingEraser>();
    }

    // Check system limit
#ifndef _WIN32
    struct rlimit rlim;
    if (getrlimit(RLIMIT_NOFILE, &rlim) == 0 && rlim.rlim_cur != RLIM_INFINITY) {
        // Leave headroom for other FDs (stdin/stdout/stderr, sockets, etc)
        size_t safe_limit = rlim.rlim_cur > files::kReservedDescriptors
            ? rlim.rlim_cur - files::kReservedDescriptors
            : rlim.rlim_cur / 2;
        if (safe_limit > 0 && static_cast<size_t>(max_open_files_) > safe_limit) {
            max_open_files_ = static_cast<int>(safe_limit);
            info() << "[HandlePool] Capped max_open_files to "
                   << max_open_files_ << " based on system limit";
        }
    }
#endif
}

void HandlePool::set_max_open_files(int max) {
    if (max <= 0) {
        throw std::invalid_argument("max_open_files must be positive, got " +
                                    std::to_string(max));
    }

    bool grew;
    {
        std::lock_guard<std::mutex> lock(mu_);
        grew = max > max_open_files_;
        max_open_files_ = max;
    }
    info() << "[HandlePool] max_open_files set to " << max;

    // Waiters only sleep when the pool is full, a bigger pool may admit them
    if (grew) {
        cv_.notify_all();
    }
}

int HandlePool::max_open_files() const {
    std::lock_guard<std::mutex> lock(mu_);
    return max_open_files_;
}

int HandlePool::open_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return open_count_;
}

size_t HandlePool::idle_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return idle_.size();
}

uint64_t HandlePool::total_opens() const {
    std::lock_guard<std::mutex> lock(mu_);
    return total_opens_;
}

uint64_t HandlePool::total_evictions() const {
    std::lock_guard<std::mutex> lock(mu_);
    return total_evictions_;
}

void HandlePool::acquire(PooledFile& f) {
    std::unique_lock<std::mutex> lock(mu_);

    bool waited = false;
    while (true) {
        if (f.closed_) {
            // Pass on a wakeup we may have consumed on behalf of another waiter
            if (waited) cv_.notify_one();
            throw PoolStateError("Already closed: " + f.path_);
        }

        if (f.fh_.is_open()) {
            // Already open, may or may not be already locked
            if (f.lock_count_++ == 0) {
                idle_remove_locked(&f);
            }
            return;
        }

        if (open_count_ < max_open_files_) {
            f.lock_count_++;
            open_count_++;
            try {
                f.open_handle();
            } catch (const StorageIOError&) {
                // Not added to the idle set, the slot goes to someone else
                f.lock_count_--;
                open_count_--;
                cv_.notify_one();
                throw;
            }
            total_opens_++;
            // Others may be blocked on this same file, it no longer needs a slot
            if (waiters_ > 0) {
                cv_.notify_all();
            }
            return;
        }

        PooledFile* victim = idle_poll_first_locked();
        if (victim) {
            if (victim->close_handle()) {
                open_count_--;
            }
            total_evictions_++;
            trace() << "[HandlePool] Evicted " << victim->path_
                    << " to open " << f.path_;
            continue;
        }

        waiters_++;
        cv_.wait(lock);
        waiters_--;
        waited = true;
    }
}

void HandlePool::release(PooledFile& f) {
    std::lock_guard<std::mutex> lock(mu_);

    if (f.lock_count_ <= 0) {
        error() << "[HandlePool] Unbalanced unlock of " << f.path_;
        return;
    }
    if (--f.lock_count_ > 0) {
        return;
    }

    // The descriptor stays open until someone needs the slot
    idle_push_locked(&f);
    cv_.notify_one();
}

void HandlePool::close(PooledFile& f) {
    {
        std::lock_guard<std::mutex> lock(mu_);

        if (f.lock_count_ != 0) {
            throw PoolStateError("Must unlock first: " + f.path_);
        }
        if (f.closed_) {
            return;
        }
        f.closed_ = true;
        idle_remove_locked(&f);
        if (f.close_handle()) {
            open_count_--;
        }
    }
    // Waiters on f must fail, any other waiter may take the freed slot
    cv_.notify_all();
}

void HandlePool::abandon(PooledFile& f) {
    {
        std::lock_guard<std::mutex> lock(mu_);

        f.closed_ = true;
        f.lock_count_ = 0;
        idle_remove_locked(&f);
        if (f.close_handle()) {
            open_count_--;
        }
    }
    cv_.notify_all();
}

void HandlePool::idle_push_locked(PooledFile* f) {
    if (idle_index_.count(f)) {
        return;
    }
    idle_.push_back(f);
    idle_index_[f] = std::prev(idle_.end());
}

void HandlePool::idle_remove_locked(PooledFile* f) {
    auto it = idle_index_.find(f);
    if (it == idle_index_.end()) {
        return;
    }
    idle_.erase(it->second);
    idle_index_.erase(it);
}

PooledFile* HandlePool::idle_poll_first_locked() {
    if (idle_.empty()) {
        return nullptr;
    }
    PooledFile* first = idle_.front();
    idle_.pop_front();
    idle_index_.erase(first);
    return first;
}

} // namespace storage
} // namespace fdpool
