// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: include/lfi_chef/payload.h
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#ifndef LFI_CHEF_PAYLOAD_H
#define LFI_CHEF_PAYLOAD_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lfi_chef
{

// Raw bytes of one candidate path. Never edited in place once produced.
using Payload = std::string;

// Generation order: original first, then each stage's output in stage order.
using PayloadSet = std::vector<Payload>;

enum class TargetOs
{
    Linux,
    Mac,
    Windows
};

enum class Mode
{
    Generate,
    Sanitize
};

std::optional<TargetOs> parse_target_os(std::string_view name);
std::optional<Mode> parse_mode(std::string_view name);
std::string_view to_string(TargetOs os) noexcept;
std::string_view to_string(Mode mode) noexcept;

constexpr bool is_windows(TargetOs os) noexcept { return os == TargetOs::Windows; }

// '\' on windows, '/' everywhere else.
constexpr char native_separator(TargetOs os) noexcept { return is_windows(os) ? '\\' : '/'; }

constexpr bool is_space_char(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

constexpr bool is_alpha_char(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

constexpr char to_lower_char(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

std::string_view trim_whitespace(std::string_view str) noexcept;

// Replaces every occurrence of `from` in `str`; an empty `from` leaves it untouched.
std::string replace_all(std::string_view str, std::string_view from, std::string_view to);

} // namespace lfi_chef

#endif // LFI_CHEF_PAYLOAD_H
