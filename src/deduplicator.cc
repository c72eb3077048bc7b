// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: src/deduplicator.cc
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#include "lfi_chef/deduplicator.h"

namespace lfi_chef
{

bool Deduplicator::accept(std::string_view payload)
{
    return seen_.insert(sha256(payload)).second;
}

bool Deduplicator::contains(std::string_view payload) const
{
    return seen_.find(sha256(payload)) != seen_.end();
}

} // namespace lfi_chef
