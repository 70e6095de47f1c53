/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "prefix_filename_resolver.h"
#include "../util/log.h"
#include <boost/filesystem.hpp>
#include <sstream>

namespace fdpool {
namespace storage {

namespace fs = boost::filesystem;

PrefixFilenameResolver::PrefixFilenameResolver(const std::string& dir, const std::string& prefix)
    : dir_(dir), prefix_(prefix) {
}

std::string PrefixFilenameResolver::path_for_id(int64_t id) const {
    std::ostringstream name;
    name << prefix_ << std::hex << static_cast<uint64_t>(id);
    return (fs::path(dir_) / name.str()).string();
}

std::string PrefixFilenameResolver::relocate(const std::string& old_path, int64_t id) {
    std::string expected = path_for_id(id);
    if (old_path == expected) {
        return old_path;
    }

    boost::system::error_code ec;
    fs::rename(old_path, expected, ec);
    if (!ec) {
        info() << "[PrefixFilenameResolver] Moved " << old_path << " to " << expected;
        return expected;
    }

    // rename() cannot cross filesystems, fall back to copy and remove
    if (ec == boost::system::errc::cross_device_link) {
        boost::system::error_code copy_ec;
        fs::copy_file(old_path, expected, fs::copy_options::overwrite_existing, copy_ec);
        if (!copy_ec) {
            boost::system::error_code rm_ec;
            fs::remove(old_path, rm_ec);
            if (rm_ec) {
                warning() << "[PrefixFilenameResolver] Copied " << old_path
                          << " but could not remove it: " << rm_ec.message();
            }
            return expected;
        }
        ec = copy_ec;
    }

    warning() << "[PrefixFilenameResolver] Unable to move " << old_path << " to "
              << expected << ": " << ec.message();
    return old_path;
}

} // namespace storage
} // namespace fdpool
