/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include "collaborators.h"

namespace fdpool {
namespace storage {

// Overwrites every byte with generator output, syncs, then unlinks.
class OverwritingEraser : public SecureEraser {
public:
    bool secure_erase(const std::string& path) override;
};

} // namespace storage
} // namespace fdpool
