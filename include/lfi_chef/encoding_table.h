// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: include/lfi_chef/encoding_table.h
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#ifndef LFI_CHEF_ENCODING_TABLE_H
#define LFI_CHEF_ENCODING_TABLE_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lfi_chef/payload.h"

namespace lfi_chef
{

enum class EncodingFamily
{
    Url,         // u
    DoubleUrl,   // d
    Utf16,       // b
    OverlongUtf8 // o
};

/**
 * One coherent substitution set. An empty optional means the family has no
 * replacement for that character class and the class is left as-is.
 */
struct EncodingRule
{
    std::optional<std::string> slash;
    std::optional<std::string> backslash;
    std::optional<std::string> period;
    std::optional<std::string> colon;
};

struct FamilySelection
{
    std::vector<EncodingFamily> families;
    std::string unknown; // letters that matched no family
};

// Letters may appear in any order; families come back in table order, each once.
FamilySelection parse_encoding_families(std::string_view letters);

std::vector<EncodingRule> encoding_rules_for(EncodingFamily family, TargetOs os);

// Concatenation of every family's rules in the given order.
std::vector<EncodingRule> build_encoding_rules(const std::vector<EncodingFamily> &families, TargetOs os);

std::string_view to_string(EncodingFamily family) noexcept;

} // namespace lfi_chef

#endif // LFI_CHEF_ENCODING_TABLE_H
