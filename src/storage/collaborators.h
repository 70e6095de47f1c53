/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Services the pooled file layer consumes but does not own: file naming
 * and placement, tracking of live persistent files, and secure erase.
 */

#pragma once

#include <cstdint>
#include <string>

namespace fdpool {
namespace storage {

// Maps persistent IDs to paths under the current storage configuration
class FilenameResolver {
public:
    virtual ~FilenameResolver() = default;

    // Where the file for this ID is expected to live right now
    virtual std::string path_for_id(int64_t id) const = 0;

    // Move the file to the expected location for id if it is elsewhere.
    // Returns the path the file ended up at.
    virtual std::string relocate(const std::string& old_path, int64_t id) = 0;
};

class FileTracker {
public:
    virtual ~FileTracker() = default;
    virtual void register_file(const std::string& path) = 0;
};

class SecureEraser {
public:
    virtual ~SecureEraser() = default;

    // Overwrite the contents and remove the file. false on any failure.
    virtual bool secure_erase(const std::string& path) = 0;
};

struct RestoreContext {
    FilenameResolver& resolver;
    FileTracker& tracker;
};

} // namespace storage
} // namespace fdpool
