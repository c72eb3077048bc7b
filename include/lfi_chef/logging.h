// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: include/lfi_chef/logging.h
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#ifndef LFI_CHEF_LOGGING_H
#define LFI_CHEF_LOGGING_H

#include <string>

namespace lfi_chef
{

/**
 * Installs the default spdlog logger: colored stderr plus a file sink at
 * `log_file`. The file only receives warnings and errors unless `verbose`
 * is set. An unwritable log file leaves console logging in place.
 */
void setup_logging(const std::string &log_file, bool verbose);

} // namespace lfi_chef

#endif // LFI_CHEF_LOGGING_H
