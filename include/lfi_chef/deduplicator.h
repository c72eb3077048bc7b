// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: include/lfi_chef/deduplicator.h
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#ifndef LFI_CHEF_DEDUPLICATOR_H
#define LFI_CHEF_DEDUPLICATOR_H

#include <cstddef>
#include <string_view>
#include <unordered_set>

#include "lfi_chef/digest.h"

namespace lfi_chef
{

/**
 * Remembers the SHA-256 of every payload it has accepted. Storing digests
 * instead of payloads caps memory at 32 bytes per unique entry while staying
 * exact. Entries are never evicted.
 */
class Deduplicator
{
public:
    // True the first time a payload is seen, false for every repeat.
    [[nodiscard]] bool accept(std::string_view payload);

    bool contains(std::string_view payload) const;
    std::size_t size() const noexcept { return seen_.size(); }

private:
    std::unordered_set<Sha256Digest, DigestHash> seen_;
};

} // namespace lfi_chef

#endif // LFI_CHEF_DEDUPLICATOR_H
