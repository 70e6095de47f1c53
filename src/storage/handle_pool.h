/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * HandlePool: bounds the number of real file descriptors held open by a
 * set of PooledFiles, evicting the least recently released idle one when
 * a new descriptor is needed.
 */

#pragma once

#include <condition_variable>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "collaborators.h"
#include "pool_config.h"

namespace fdpool {
namespace storage {

class PooledFile;

// One real descriptor. Owned by exactly one PooledFile.
struct FileHandle {
    int fd = -1;
    bool writable = false;

    bool is_open() const { return fd >= 0; }

    // Opens path O_RDWR|O_CREAT when writable, O_RDONLY otherwise.
    // Throws StorageIOError.
    static FileHandle open(const std::string& path, bool writable);

    // Current size via fstat. Throws StorageIOError.
    int64_t size(const std::string& path) const;

    // Close the file descriptor if open. Returns errno of a failed close, 0 otherwise.
    int close();
};

class HandlePool {
public:
    explicit HandlePool(const PoolConfig& config = PoolConfig(),
                        std::shared_ptr<SecureEraser> eraser = nullptr);
    ~HandlePool() = default;

    HandlePool(const HandlePool&) = delete;
    HandlePool& operator=(const HandlePool&) = delete;

    // Change the descriptor bound. Rejects max <= 0. Shrinking does not
    // evict anything; later acquisitions drain the excess.
    void set_max_open_files(int max);
    int max_open_files() const;

    // Real descriptors currently open
    int open_count() const;

    // Open but unlocked files, i.e. eviction candidates
    size_t idle_count() const;

    uint64_t total_opens() const;
    uint64_t total_evictions() const;

    bool secure_delete_by_default() const { return secure_delete_by_default_; }
    SecureEraser& eraser() { return *eraser_; }

private:
    friend class PooledFile;

    // Take a lock on f, opening its descriptor if needed. May evict
    // another idle file or block until one becomes idle.
    void acquire(PooledFile& f);

    // Drop a lock on f. At zero locks f becomes an eviction candidate.
    void release(PooledFile& f);

    // Mark f closed and give back its descriptor. Throws PoolStateError if locked.
    void close(PooledFile& f);

    // Destroyed while still locked: give back the descriptor and its slot anyway
    void abandon(PooledFile& f);

    void idle_push_locked(PooledFile* f);
    void idle_remove_locked(PooledFile* f);
    PooledFile* idle_poll_first_locked();

    mutable std::mutex mu_;
    std::condition_variable cv_;

    int max_open_files_;
    int open_count_ = 0;
    uint64_t total_opens_ = 0;
    uint64_t total_evictions_ = 0;
    int waiters_ = 0;
    bool secure_delete_by_default_;

    // Oldest released at the front. The index gives O(1) removal on close
    // or relock.
    std::list<PooledFile*> idle_;
    std::unordered_map<PooledFile*, std::list<PooledFile*>::iterator> idle_index_;

    std::shared_ptr<SecureEraser> eraser_;
};

} // namespace storage
} // namespace fdpool
