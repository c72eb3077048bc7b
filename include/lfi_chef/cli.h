// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: include/lfi_chef/cli.h
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#ifndef LFI_CHEF_CLI_H
#define LFI_CHEF_CLI_H

#include <exception>
#include <filesystem>
#include <ostream>
#include <string>

#include "lfi_chef/config.h"

namespace lfi_chef
{

/**
 * Output file for a run. Empty means a timestamped name in the current
 * directory. Only "~" and "~/..." expand to $HOME; "~user" style paths are
 * taken literally. Missing parent directories are created.
 */
std::filesystem::path resolve_output_path(const std::string &requested, const std::string &os);

// EXIT_VALIDATION, EXIT_IO or EXIT_INTERNAL for an exception that ended a run.
int exit_code_for(const std::exception &e) noexcept;

// Validates `options`, runs the mode and writes a summary to `out`. Never
// throws; failures are logged and mapped through exit_code_for.
int execute(const Options &options, std::ostream &out);

} // namespace lfi_chef

#endif // LFI_CHEF_CLI_H
