// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: include/lfi_chef/mutation_pipeline.h
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#ifndef LFI_CHEF_MUTATION_PIPELINE_H
#define LFI_CHEF_MUTATION_PIPELINE_H

#include <cstddef>
#include <string_view>
#include <vector>

#include "lfi_chef/config.h"
#include "lfi_chef/payload.h"

namespace lfi_chef
{

inline constexpr std::string_view NULL_BYTE = "%00";

// Each stage keeps the incoming payloads and appends its variants after them.
PayloadSet apply_encoding_stage(PayloadSet payloads, const std::vector<EncodingRule> &rules, TargetOs os);
PayloadSet apply_traversal_stage(PayloadSet payloads, const TraversalRange &range,
                                 const std::vector<TraversalToken> &tokens, TargetOs os);
PayloadSet apply_null_byte_stage(PayloadSet payloads, NullByteMode mode);

// Number of payloads one input line expands to, saturated at SIZE_MAX.
std::size_t expansion_factor(const Config &config) noexcept;

/**
 * Expands one wordlist line into its evasion variants:
 * encoding -> traversal -> null byte. Every stage re-processes the whole set
 * built so far, so the size is the product of the per-stage factors.
 *
 * Construction throws ValidationError if that product exceeds
 * Config::max_payloads_per_line.
 */
class MutationPipeline
{
public:
    explicit MutationPipeline(const Config &config);

    PayloadSet expand(const Payload &original) const;

    std::size_t payloads_per_line() const noexcept { return factor_; }

private:
    const Config &config_;
    std::size_t factor_;
};

} // namespace lfi_chef

#endif // LFI_CHEF_MUTATION_PIPELINE_H
