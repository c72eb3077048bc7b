// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: src/payload.cc
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#include "lfi_chef/payload.h"

namespace lfi_chef
{

std::optional<TargetOs> parse_target_os(std::string_view name)
{
    if (name == "linux")
        return TargetOs::Linux;
    if (name == "mac")
        return TargetOs::Mac;
    if (name == "windows")
        return TargetOs::Windows;
    return std::nullopt;
}

std::optional<Mode> parse_mode(std::string_view name)
{
    if (name == "generate")
        return Mode::Generate;
    if (name == "sanitize")
        return Mode::Sanitize;
    return std::nullopt;
}

std::string_view to_string(TargetOs os) noexcept
{
    switch (os)
    {
    case TargetOs::Linux:
        return "linux";
    case TargetOs::Mac:
        return "mac";
    case TargetOs::Windows:
        return "windows";
    }
    return "unknown";
}

std::string_view to_string(Mode mode) noexcept
{
    return mode == Mode::Generate ? "generate" : "sanitize";
}

std::string_view trim_whitespace(std::string_view str) noexcept
{
    std::size_t first = 0;
    while (first < str.size() && is_space_char(str[first]))
    {
        ++first;
    }
    std::size_t last = str.size();
    while (last > first && is_space_char(str[last - 1]))
    {
        --last;
    }
    return str.substr(first, last - first);
}

std::string replace_all(std::string_view str, std::string_view from, std::string_view to)
{
    std::string result;
    if (from.empty())
    {
        result.assign(str);
        return result;
    }
    result.reserve(str.size());

    std::size_t pos = 0;
    for (auto hit = str.find(from); hit != std::string_view::npos; hit = str.find(from, pos))
    {
        result.append(str.substr(pos, hit - pos));
        result.append(to);
        pos = hit + from.size();
    }
    result.append(str.substr(pos));
    return result;
}

} // namespace lfi_chef
