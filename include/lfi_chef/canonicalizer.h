// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: include/lfi_chef/canonicalizer.h
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#ifndef LFI_CHEF_CANONICALIZER_H
#define LFI_CHEF_CANONICALIZER_H

#include <optional>
#include <string_view>

#include "lfi_chef/payload.h"

namespace lfi_chef
{

// True when `line` starts with a single ASCII letter followed by ':'.
bool has_drive_prefix(std::string_view line) noexcept;

/**
 * Reduces a raw wordlist line to the one form that every spelling of the same
 * path shares on `os`.
 *
 * Windows lines are lower-cased and use '\'. With `drive` set, the line is
 * given that drive (replacing a different one); without it, any drive prefix
 * is removed. Other targets only get '\' turned into '/'. Surrounding
 * whitespace is always stripped.
 *
 * canonicalize(canonicalize(x)) == canonicalize(x) for every input.
 */
Payload canonicalize(std::string_view raw_line, TargetOs os, std::optional<char> drive = std::nullopt);

} // namespace lfi_chef

#endif // LFI_CHEF_CANONICALIZER_H
