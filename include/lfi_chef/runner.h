// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: include/lfi_chef/runner.h
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#ifndef LFI_CHEF_RUNNER_H
#define LFI_CHEF_RUNNER_H

#include <cstddef>
#include <filesystem>

#include "lfi_chef/config.h"
#include "lfi_chef/wordlist_io.h"

namespace lfi_chef
{

struct RunStats
{
    std::size_t lines_read = 0;
    std::size_t lines_skipped = 0; // blank after trimming
    std::size_t payloads_written = 0;
    std::size_t duplicates_dropped = 0; // sanitize only
};

// Both throw IoError when the reader or writer fails. Output written before
// the failure stays where it is.
RunStats run_generate(const Config &config, WordlistReader &reader, WordlistWriter &writer);
RunStats run_sanitize(const Config &config, WordlistReader &reader, WordlistWriter &writer);

// Opens both files and dispatches on config.mode. Throws IoError if either
// file cannot be opened.
RunStats run(const Config &config, const std::filesystem::path &in_path, const std::filesystem::path &out_path);

} // namespace lfi_chef

#endif // LFI_CHEF_RUNNER_H
