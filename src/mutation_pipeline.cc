// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: src/mutation_pipeline.cc
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#include "lfi_chef/mutation_pipeline.h"

#include <algorithm>
#include <limits>
#include <string>

#include <spdlog/spdlog.h>

#include "lfi_chef/errors.h"

namespace lfi_chef
{

namespace
{

constexpr std::size_t saturating_mul(std::size_t a, std::size_t b) noexcept
{
    if (a != 0 && b > std::numeric_limits<std::size_t>::max() / a)
    {
        return std::numeric_limits<std::size_t>::max();
    }
    return a * b;
}

constexpr std::size_t saturating_add(std::size_t a, std::size_t b) noexcept
{
    return (b > std::numeric_limits<std::size_t>::max() - a) ? std::numeric_limits<std::size_t>::max() : a + b;
}

Payload encode(const Payload &payload, const EncodingRule &rule, TargetOs os)
{
    Payload encoded = payload;
    if (rule.slash)
    {
        encoded = replace_all(encoded, "/", *rule.slash);
    }
    if (rule.backslash)
    {
        encoded = replace_all(encoded, "\\", *rule.backslash);
    }
    if (rule.period)
    {
        encoded = replace_all(encoded, ".", *rule.period);
    }
    if (is_windows(os) && rule.colon)
    {
        encoded = replace_all(encoded, ":", *rule.colon);
    }
    return encoded;
}

std::size_t null_byte_variants(NullByteMode mode) noexcept
{
    switch (mode)
    {
    case NullByteMode::None:
        return 0;
    case NullByteMode::Prepend:
    case NullByteMode::Append:
        return 1;
    case NullByteMode::Both:
        return 2;
    }
    return 0;
}

} // namespace

PayloadSet apply_encoding_stage(PayloadSet payloads, const std::vector<EncodingRule> &rules, TargetOs os)
{
    const std::size_t originals = payloads.size();

    for (const auto &rule : rules)
    {
        for (std::size_t i = 0; i < originals; ++i)
        {
            payloads.push_back(encode(payloads[i], rule, os));
        }
    }
    return payloads;
}

PayloadSet apply_traversal_stage(PayloadSet payloads, const TraversalRange &range,
                                 const std::vector<TraversalToken> &tokens, TargetOs os)
{
    const std::size_t originals = payloads.size();
    const std::string native(1, native_separator(os));

    for (unsigned step = 0; step < range.depth_count(); ++step)
    {
        const unsigned depth = range.start + step;
        for (const auto &token : tokens)
        {
            std::string prefix;
            prefix.reserve(token.climb.size() * depth);
            for (unsigned d = 0; d < depth; ++d)
            {
                prefix += token.climb;
            }

            for (std::size_t i = 0; i < originals; ++i)
            {
                payloads.push_back(prefix + replace_all(payloads[i], native, token.separator));
            }
        }
    }
    return payloads;
}

PayloadSet apply_null_byte_stage(PayloadSet payloads, NullByteMode mode)
{
    const bool append = mode == NullByteMode::Append || mode == NullByteMode::Both;
    const bool prepend = mode == NullByteMode::Prepend || mode == NullByteMode::Both;
    const std::size_t originals = payloads.size();

    for (std::size_t i = 0; i < originals; ++i)
    {
        if (append)
        {
            payloads.push_back(payloads[i] + std::string(NULL_BYTE));
        }
        if (prepend)
        {
            payloads.push_back(std::string(NULL_BYTE) + payloads[i]);
        }
    }
    return payloads;
}

std::size_t expansion_factor(const Config &config) noexcept
{
    std::size_t factor = 1 + config.encodings.size();
    if (config.traversal)
    {
        const auto variants = saturating_mul(config.traversal->depth_count(), config.traversal_tokens.size());
        factor = saturating_mul(factor, saturating_add(1, variants));
    }
    return saturating_mul(factor, 1 + null_byte_variants(config.null_byte));
}

MutationPipeline::MutationPipeline(const Config &config)
    : config_(config), factor_(expansion_factor(config))
{
    if (config_.max_payloads_per_line != 0 && factor_ > config_.max_payloads_per_line)
    {
        throw ValidationError("Requested mutations expand every line into " + std::to_string(factor_) +
                              " payloads, above the limit of " + std::to_string(config_.max_payloads_per_line) +
                              " (raise --max_payloads or drop some options)");
    }
    spdlog::debug("Mutation pipeline: {} encoding rules, {} traversal tokens, {} payloads per line",
                  config_.encodings.size(), config_.traversal_tokens.size(), factor_);
}

PayloadSet MutationPipeline::expand(const Payload &original) const
{
    PayloadSet payloads;
    payloads.reserve(std::min(factor_, DEFAULT_MAX_PAYLOADS_PER_LINE));
    payloads.push_back(original);

    if (!config_.encodings.empty())
    {
        payloads = apply_encoding_stage(std::move(payloads), config_.encodings, config_.os);
    }
    if (config_.traversal)
    {
        payloads = apply_traversal_stage(std::move(payloads), *config_.traversal, config_.traversal_tokens, config_.os);
    }
    if (config_.null_byte != NullByteMode::None)
    {
        payloads = apply_null_byte_stage(std::move(payloads), config_.null_byte);
    }
    return payloads;
}

} // namespace lfi_chef
