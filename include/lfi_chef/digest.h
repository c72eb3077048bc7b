// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: include/lfi_chef/digest.h
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#ifndef LFI_CHEF_DIGEST_H
#define LFI_CHEF_DIGEST_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace lfi_chef
{

using Sha256Digest = std::array<std::uint8_t, 32>;

// Throws lfi_chef::Error when OpenSSL fails.
Sha256Digest sha256(std::string_view data);

std::string to_hex(const Sha256Digest &digest);

struct DigestHash
{
    std::size_t operator()(const Sha256Digest &digest) const noexcept
    {
        // The digest is already uniformly distributed.
        std::size_t value = 0;
        std::memcpy(&value, digest.data(), sizeof(value));
        return value;
    }
};

} // namespace lfi_chef

#endif // LFI_CHEF_DIGEST_H
