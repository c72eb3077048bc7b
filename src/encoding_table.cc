// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: src/encoding_table.cc
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#include "lfi_chef/encoding_table.h"

#include <algorithm>
#include <array>
#include <iterator>
#include <utility>

namespace lfi_chef
{

namespace
{

struct RuleSpec
{
    const char *slash;
    const char *backslash;
    const char *period;
    const char *colon;
};

constexpr std::array<RuleSpec, 1> URL_RULES{{
    {"%2f", "%5c", "%2e", "%3a"},
}};

constexpr std::array<RuleSpec, 1> DOUBLE_URL_RULES{{
    {"%252f", "%255c", "%252e", "%253a"},
}};

// Both the plain code point and the "division slash" look-alikes.
constexpr std::array<RuleSpec, 2> UTF16_RULES{{
    {"%u002f", "%u005c", "%u002e", "%u003a"},
    {"%u2215", "%u2216", "%u002e", "%u003a"},
}};

constexpr std::array<RuleSpec, 3> OVERLONG_RULES{{
    {"%c0%af", "%c0%5c", "%c0%2e", "%c0%3a"},
    {"%e0%80%af", "%c0%80%5c", "%e0%40%ae", "%e0%80%3a"},
    {"%c0%2f", "%c0%5c", "%c0%ae", "%c0%3a"},
}};

constexpr std::array<std::pair<char, EncodingFamily>, 4> FAMILY_LETTERS{{
    {'u', EncodingFamily::Url},
    {'d', EncodingFamily::DoubleUrl},
    {'b', EncodingFamily::Utf16},
    {'o', EncodingFamily::OverlongUtf8},
}};

template <std::size_t N>
std::vector<EncodingRule> to_rules(const std::array<RuleSpec, N> &specs, TargetOs os)
{
    std::vector<EncodingRule> rules;
    rules.reserve(N);
    for (const auto &spec : specs)
    {
        EncodingRule rule;
        rule.slash = spec.slash;
        rule.backslash = spec.backslash;
        rule.period = spec.period;
        // Colons only carry meaning in windows drive paths.
        if (is_windows(os))
        {
            rule.colon = spec.colon;
        }
        rules.push_back(std::move(rule));
    }
    return rules;
}

} // namespace

FamilySelection parse_encoding_families(std::string_view letters)
{
    FamilySelection selection;
    for (const auto &[letter, family] : FAMILY_LETTERS)
    {
        if (letters.find(letter) != std::string_view::npos)
        {
            selection.families.push_back(family);
        }
    }

    for (char c : letters)
    {
        const bool known = std::any_of(FAMILY_LETTERS.begin(), FAMILY_LETTERS.end(),
                                       [c](const auto &entry) { return entry.first == c; });
        if (!known && selection.unknown.find(c) == std::string::npos)
        {
            selection.unknown.push_back(c);
        }
    }
    return selection;
}

std::vector<EncodingRule> encoding_rules_for(EncodingFamily family, TargetOs os)
{
    switch (family)
    {
    case EncodingFamily::Url:
        return to_rules(URL_RULES, os);
    case EncodingFamily::DoubleUrl:
        return to_rules(DOUBLE_URL_RULES, os);
    case EncodingFamily::Utf16:
        return to_rules(UTF16_RULES, os);
    case EncodingFamily::OverlongUtf8:
        return to_rules(OVERLONG_RULES, os);
    }
    return {};
}

std::vector<EncodingRule> build_encoding_rules(const std::vector<EncodingFamily> &families, TargetOs os)
{
    std::vector<EncodingRule> rules;
    for (const auto family : families)
    {
        auto family_rules = encoding_rules_for(family, os);
        rules.insert(rules.end(), std::make_move_iterator(family_rules.begin()),
                     std::make_move_iterator(family_rules.end()));
    }
    return rules;
}

std::string_view to_string(EncodingFamily family) noexcept
{
    switch (family)
    {
    case EncodingFamily::Url:
        return "url";
    case EncodingFamily::DoubleUrl:
        return "double-url";
    case EncodingFamily::Utf16:
        return "utf-16";
    case EncodingFamily::OverlongUtf8:
        return "overlong-utf-8";
    }
    return "unknown";
}

} // namespace lfi_chef
