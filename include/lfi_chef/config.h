// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: include/lfi_chef/config.h
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#ifndef LFI_CHEF_CONFIG_H
#define LFI_CHEF_CONFIG_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lfi_chef/encoding_table.h"
#include "lfi_chef/payload.h"

namespace lfi_chef
{

inline constexpr std::size_t DEFAULT_MAX_PAYLOADS_PER_LINE = 1000000;

// Raw command line values, before any validation.
struct Options
{
    std::string in_file;
    std::string mode;
    std::string os;
    std::string encoding;
    std::string traversal;
    std::string traversal_chars;
    std::string null_byte;
    std::string out_file;
    std::string drive;
    std::size_t max_payloads = DEFAULT_MAX_PAYLOADS_PER_LINE;
    bool append = false;
    bool verbose = false;
    std::string log_file = "LFI-Chef.log";
};

enum class NullByteMode
{
    None,
    Prepend,
    Append,
    Both
};

struct TraversalRange
{
    unsigned start = 1;
    unsigned end = 1;

    unsigned depth_count() const noexcept { return end - start + 1; }
};

// A "climb" such as "../" repeated per depth, and the separator that replaces
// the native one in the payload body.
struct TraversalToken
{
    std::string climb;
    std::string separator;
};

struct Config
{
    Mode mode = Mode::Generate;
    TargetOs os = TargetOs::Linux;
    std::vector<EncodingRule> encodings;
    std::optional<TraversalRange> traversal;
    std::vector<TraversalToken> traversal_tokens;
    NullByteMode null_byte = NullByteMode::None;
    std::optional<char> drive; // lower-case ASCII letter
    std::size_t max_payloads_per_line = DEFAULT_MAX_PAYLOADS_PER_LINE; // 0 disables the cap
    bool append_output = false;
};

// `ignored` lists options that were dropped and replaced by defaults.
// Rejected options throw ValidationError instead.
struct ConfigReport
{
    Config config;
    std::vector<std::string> ignored;
};

ConfigReport build_config(const Options &options);

TraversalRange parse_traversal_range(std::string_view spec);

struct TraversalTokenParse
{
    std::vector<TraversalToken> tokens;
    std::vector<std::string> malformed;
};

TraversalTokenParse parse_traversal_tokens(std::string_view spec);
std::vector<TraversalToken> default_traversal_tokens(TargetOs os);

std::optional<NullByteMode> parse_null_byte_mode(std::string_view letter);
char parse_drive_letter(std::string_view letter);

} // namespace lfi_chef

#endif // LFI_CHEF_CONFIG_H
