// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: src/config.cc
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#include "lfi_chef/config.h"

#include <charconv>
#include <utility>

#include <spdlog/spdlog.h>

#include "lfi_chef/errors.h"

namespace lfi_chef
{

namespace
{

std::optional<unsigned> parse_depth(std::string_view text)
{
    unsigned value = 0;
    const auto *first = text.data();
    const auto *last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return value;
}

std::string quoted(std::string_view text)
{
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    out.append(text);
    out.push_back('"');
    return out;
}

} // namespace

TraversalRange parse_traversal_range(std::string_view spec)
{
    std::optional<unsigned> start;
    std::optional<unsigned> end;

    const auto colon = spec.find(':');
    if (colon == std::string_view::npos)
    {
        start = 1;
        end = parse_depth(spec);
    }
    else
    {
        start = parse_depth(spec.substr(0, colon));
        end = parse_depth(spec.substr(colon + 1));
    }

    if (!start || !end)
    {
        throw ValidationError("Improper traversal input " + quoted(spec) +
                              ", expected a number or a start:end range");
    }
    if (*start < 1 || *end < 1 || *start > *end)
    {
        throw ValidationError("Improper traversal range " + quoted(spec) +
                              ", depths start at 1 and the start may not exceed the end");
    }
    return TraversalRange{*start, *end};
}

TraversalTokenParse parse_traversal_tokens(std::string_view spec)
{
    TraversalTokenParse result;
    std::size_t pos = 0;
    while (pos <= spec.size())
    {
        auto comma = spec.find(',', pos);
        if (comma == std::string_view::npos)
        {
            comma = spec.size();
        }
        const auto entry = spec.substr(pos, comma - pos);
        pos = comma + 1;

        if (entry.empty())
        {
            continue;
        }

        const auto colon = entry.find(':');
        if (colon == std::string_view::npos || colon == 0 ||
            entry.find(':', colon + 1) != std::string_view::npos)
        {
            result.malformed.emplace_back(entry);
            continue;
        }
        result.tokens.push_back(TraversalToken{std::string(entry.substr(0, colon)),
                                               std::string(entry.substr(colon + 1))});
    }
    return result;
}

std::vector<TraversalToken> default_traversal_tokens(TargetOs os)
{
    if (is_windows(os))
    {
        return {{"..\\", "\\"}, {"....\\\\", "\\\\"}};
    }
    return {{"../", "/"}, {"....//", "//"}};
}

std::optional<NullByteMode> parse_null_byte_mode(std::string_view letter)
{
    if (letter == "p")
        return NullByteMode::Prepend;
    if (letter == "a")
        return NullByteMode::Append;
    if (letter == "b")
        return NullByteMode::Both;
    return std::nullopt;
}

char parse_drive_letter(std::string_view letter)
{
    if (letter.size() != 1 || !is_alpha_char(letter.front()))
    {
        throw ValidationError("Specified Windows drive letter " + quoted(letter) + " is not of proper format");
    }
    return to_lower_char(letter.front());
}

ConfigReport build_config(const Options &options)
{
    ConfigReport report;
    Config &config = report.config;

    const auto mode = parse_mode(options.mode);
    if (!mode)
    {
        throw ValidationError("Unknown mode " + quoted(options.mode) + ", expected generate or sanitize");
    }
    const auto os = parse_target_os(options.os);
    if (!os)
    {
        throw ValidationError("Unknown OS " + quoted(options.os) + ", expected linux, mac or windows");
    }
    config.mode = *mode;
    config.os = *os;
    config.max_payloads_per_line = options.max_payloads;
    config.append_output = options.append;

    const bool generating = config.mode == Mode::Generate;

    if (!options.encoding.empty())
    {
        if (!generating)
        {
            report.ignored.push_back("--encoding only applies to generate mode");
        }
        else
        {
            const auto selection = parse_encoding_families(options.encoding);
            for (char c : selection.unknown)
            {
                report.ignored.push_back("unknown encoding letter " + quoted(std::string_view(&c, 1)));
            }
            for (const auto family : selection.families)
            {
                spdlog::debug("Encoding family {} selected", to_string(family));
            }
            config.encodings = build_encoding_rules(selection.families, config.os);
        }
    }

    if (!options.traversal.empty())
    {
        // Range problems are rejected even in sanitize mode.
        const auto range = parse_traversal_range(options.traversal);
        if (!generating)
        {
            report.ignored.push_back("--traversal only applies to generate mode");
        }
        else
        {
            config.traversal = range;
            if (options.traversal_chars.empty())
            {
                config.traversal_tokens = default_traversal_tokens(config.os);
            }
            else
            {
                auto parsed = parse_traversal_tokens(options.traversal_chars);
                for (const auto &entry : parsed.malformed)
                {
                    report.ignored.push_back("malformed traversal chars " + quoted(entry) +
                                             ", expected climb:separator");
                }
                if (parsed.tokens.empty())
                {
                    report.ignored.push_back("no usable traversal chars, traversal stage produces nothing");
                }
                config.traversal_tokens = std::move(parsed.tokens);
            }
        }
    }
    else if (!options.traversal_chars.empty())
    {
        report.ignored.push_back("--traversal_chars has no effect without --traversal");
    }

    if (!options.null_byte.empty())
    {
        const auto null_mode = parse_null_byte_mode(options.null_byte);
        if (!null_mode)
        {
            report.ignored.push_back("unknown null byte mode " + quoted(options.null_byte) +
                                     ", expected p, a or b");
        }
        else if (!generating)
        {
            report.ignored.push_back("--null_byte only applies to generate mode");
        }
        else
        {
            config.null_byte = *null_mode;
        }
    }

    if (!options.drive.empty())
    {
        const char letter = parse_drive_letter(options.drive);
        if (generating || !is_windows(config.os))
        {
            report.ignored.push_back("--drive only applies to windows sanitize mode");
        }
        else
        {
            config.drive = letter;
        }
    }

    return report;
}

} // namespace lfi_chef
