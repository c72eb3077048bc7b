// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: src/digest.cc
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#include "lfi_chef/digest.h"

#include <memory>

#include <openssl/evp.h>

#include "lfi_chef/errors.h"

namespace lfi_chef
{

namespace
{

struct MdCtxDeleter
{
    void operator()(EVP_MD_CTX *ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using UniqueMdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

} // namespace

Sha256Digest sha256(std::string_view data)
{
    UniqueMdCtx ctx(EVP_MD_CTX_new());
    if (!ctx)
    {
        throw Error("Digest context allocation failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
    {
        throw Error("SHA-256 digest init failed");
    }
    if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
    {
        throw Error("SHA-256 digest update failed");
    }

    Sha256Digest digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1 || digest_len != digest.size())
    {
        throw Error("SHA-256 digest final failed");
    }
    return digest;
}

std::string to_hex(const Sha256Digest &digest)
{
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (std::uint8_t byte : digest)
    {
        out.push_back(HEX[(byte >> 4) & 0x0F]);
        out.push_back(HEX[byte & 0x0F]);
    }
    return out;
}

} // namespace lfi_chef
