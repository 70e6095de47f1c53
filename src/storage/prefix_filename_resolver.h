/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Names persistent files <dir>/<prefix><hex id>. When the directory or
 * prefix changes between runs, relocate() moves old files into place.
 */

#pragma once

#include <string>
#include "collaborators.h"

namespace fdpool {
namespace storage {

class PrefixFilenameResolver : public FilenameResolver {
public:
    PrefixFilenameResolver(const std::string& dir, const std::string& prefix);

    std::string path_for_id(int64_t id) const override;
    std::string relocate(const std::string& old_path, int64_t id) override;

    const std::string& dir() const { return dir_; }
    const std::string& prefix() const { return prefix_; }

private:
    std::string dir_;
    std::string prefix_;
};

} // namespace storage
} // namespace fdpool
