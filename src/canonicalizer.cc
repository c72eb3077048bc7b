// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: src/canonicalizer.cc
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#include "lfi_chef/canonicalizer.h"

#include <algorithm>
#include <string>

namespace lfi_chef
{

namespace
{

constexpr std::size_t DRIVE_PREFIX_LEN = 2; // "<letter>:"

void apply_drive(std::string &line, std::optional<char> drive)
{
    if (drive)
    {
        const char letter = to_lower_char(*drive);
        if (has_drive_prefix(line))
        {
            line[0] = letter;
        }
        else
        {
            line.insert(0, std::string{letter, ':'});
        }
        return;
    }

    // Repeat so "c:d:\x" and "c: d:\x" settle in a single pass.
    while (has_drive_prefix(line))
    {
        line = std::string(trim_whitespace(std::string_view(line).substr(DRIVE_PREFIX_LEN)));
    }
}

} // namespace

bool has_drive_prefix(std::string_view line) noexcept
{
    return line.size() >= DRIVE_PREFIX_LEN && is_alpha_char(line[0]) && line[1] == ':';
}

Payload canonicalize(std::string_view raw_line, TargetOs os, std::optional<char> drive)
{
    Payload line(trim_whitespace(raw_line));

    if (is_windows(os))
    {
        std::transform(line.begin(), line.end(), line.begin(), to_lower_char);
        std::replace(line.begin(), line.end(), '/', '\\');
        apply_drive(line, drive);
    }
    else
    {
        std::replace(line.begin(), line.end(), '\\', '/');
    }

    return Payload(trim_whitespace(line));
}

} // namespace lfi_chef
