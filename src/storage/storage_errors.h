/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Exception types raised by the pooled file layer
 */

#pragma once

#include <stdexcept>
#include <string>
#include <cstring>

namespace fdpool {
namespace storage {

// Lock discipline violations and use after close. Not retryable.
class PoolStateError : public std::logic_error {
public:
    explicit PoolStateError(const std::string& what) : std::logic_error(what) {}
};

// open/read/write/truncate failures, carries the errno that caused them
class StorageIOError : public std::runtime_error {
public:
    explicit StorageIOError(const std::string& what, int err = 0)
        : std::runtime_error(err ? what + ": " + std::strerror(err) : what), err_(err) {}

    int error_code() const { return err_; }

private:
    int err_;
};

// Fewer bytes were available than requested
class ShortReadError : public StorageIOError {
public:
    explicit ShortReadError(const std::string& what) : StorageIOError(what) {}
};

// Write past the fixed length of a file
class BoundsError : public std::out_of_range {
public:
    explicit BoundsError(const std::string& what) : std::out_of_range(what) {}
};

class ReadOnlyError : public BoundsError {
public:
    explicit ReadOnlyError(const std::string& what) : BoundsError(what) {}
};

// Persisted record is malformed (magic, version, length, truncation)
class StorageFormatError : public std::runtime_error {
public:
    explicit StorageFormatError(const std::string& what) : std::runtime_error(what) {}
};

// Backing file is missing or undersized after a restart. The owner decides
// whether this is fatal.
class ResumeFailedError : public std::runtime_error {
public:
    explicit ResumeFailedError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace storage
} // namespace fdpool
