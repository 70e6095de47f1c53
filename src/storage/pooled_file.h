/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * PooledFile: a fixed-length random access file whose descriptor is
 * opened on demand through a shared HandlePool. Callers see the file as
 * always open; the pool closes idle descriptors behind their back.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "collaborators.h"
#include "handle_pool.h"

namespace fdpool {
namespace storage {

struct PooledFileRecord;

class PooledFile {
public:
    // Lock is a RAII handle proving the descriptor stays open. Move-only.
    class Lock {
    public:
        Lock() = default;

        Lock(Lock&& other) noexcept : file_(other.file_) {
            other.file_ = nullptr;
        }

        Lock& operator=(Lock&& other) noexcept {
            if (this != &other) {
                unlock();
                file_ = other.file_;
                other.file_ = nullptr;
            }
            return *this;
        }

        ~Lock() {
            unlock();
        }

        // No copy
        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;

        // Release early. Safe to call more than once.
        void unlock();

        explicit operator bool() const { return file_ != nullptr; }

    private:
        friend class PooledFile;
        explicit Lock(PooledFile* file) : file_(file) {}

        PooledFile* file_ = nullptr;
    };

    /**
     * Open (creating if writable) the file at path. If force_length >= 0
     * and differs from the current size, the whole file is rewritten to
     * exactly force_length bytes: zeros, or bytes from a generator seeded
     * with seed_random when one is given.
     *
     * persistent_id is the ID under which the naming service knows the
     * file, or -1.
     */
    PooledFile(std::shared_ptr<HandlePool> pool, const std::string& path, bool read_only,
               int64_t force_length, std::optional<uint64_t> seed_random,
               int64_t persistent_id);

    // Writable file holding exactly initial_contents[offset, offset + size)
    PooledFile(std::shared_ptr<HandlePool> pool, const std::string& path,
               const uint8_t* initial_contents, size_t offset, size_t size,
               int64_t persistent_id);

    ~PooledFile();

    PooledFile(const PooledFile&) = delete;
    PooledFile& operator=(const PooledFile&) = delete;

    /**
     * Rebuild a file from a record written by store_to(). The backing file
     * is looked up again (and moved if the naming service wants it
     * elsewhere) but not opened.
     *
     * Throws StorageFormatError for a bad record and ResumeFailedError if
     * the backing file cannot be found.
     */
    static std::unique_ptr<PooledFile> restore_from(std::istream& in,
                                                    std::shared_ptr<HandlePool> pool,
                                                    const RestoreContext& ctx);

    void store_to(std::ostream& out) const;

    // Post-restore consistency check: file exists and holds at least size() bytes
    void on_resume() const;

    // Blocks while the pool is full and every open file is locked
    Lock lock_open();

    // Read exactly len bytes at offset into buf + buf_offset
    void pread(int64_t offset, uint8_t* buf, size_t buf_offset, size_t len);

    // Write exactly len bytes. Never extends past size().
    void pwrite(int64_t offset, const uint8_t* buf, size_t buf_offset, size_t len);

    // Must not be locked. Idempotent.
    void close();

    // close() then delete the backing file, securely if requested.
    // Deletion failures are logged, not thrown.
    void free();

    int64_t size() const { return length_; }

    void set_secure_delete(bool secure_delete) { secure_delete_.store(secure_delete); }
    bool secure_delete() const { return secure_delete_.load(); }

    const std::string& path() const { return path_; }
    bool read_only() const { return read_only_; }
    int64_t persistent_id() const { return persistent_id_; }

    bool is_open() const;
    bool is_locked() const;
    bool is_closed() const;

private:
    friend class HandlePool;

    PooledFile(std::shared_ptr<HandlePool> pool, const PooledFileRecord& record,
               const std::string& resolved_path);

    void fill_to_length(int64_t force_length, std::optional<uint64_t> seed_random);

    // Called by the pool with its mutex held
    void open_handle();
    bool close_handle();

    std::shared_ptr<HandlePool> pool_;
    std::string path_;
    const bool read_only_;
    int64_t length_ = 0;                // fixed once the constructor returns
    const int64_t persistent_id_;
    std::atomic<bool> secure_delete_;

    // Guarded by pool_->mu_
    int lock_count_ = 0;
    bool closed_ = false;

    // Guarded by io_mu_, always taken after pool_->mu_
    mutable std::mutex io_mu_;
    FileHandle fh_;
};

} // namespace storage
} // namespace fdpool
