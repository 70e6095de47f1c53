/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <mutex>
#include <set>
#include <string>
#include "collaborators.h"

namespace fdpool {
namespace storage {

// Remembers which persistent files are still in use after a restart
class PersistentFileTracker : public FileTracker {
public:
    void register_file(const std::string& path) override {
        std::lock_guard<std::mutex> lock(mu_);
        paths_.insert(path);
    }

    bool is_registered(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mu_);
        return paths_.count(path) != 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return paths_.size();
    }

private:
    mutable std::mutex mu_;
    std::set<std::string> paths_;
};

} // namespace storage
} // namespace fdpool
