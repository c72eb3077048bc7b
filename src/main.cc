// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: src/main.cc
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#include <iostream>
#include <string>

#include <CLI/CLI.hpp>

#include "lfi_chef/cli.h"
#include "lfi_chef/config.h"
#include "lfi_chef/errors.h"
#include "lfi_chef/logging.h"

inline constexpr const char *PROGRAM_NAME = PROJECT_NAME;
inline constexpr const char *PROGRAM_VERSION = PROJECT_VERSION;
inline constexpr const char *PROGRAM_AUTHOR = PROJECT_AUTHOR;
inline constexpr const char *PROGRAM_COPYRIGHT = PROJECT_COPYRIGHT;
inline constexpr const char *BUILD_DATE = __DATE__;
inline constexpr const char *BUILD_TIME = __TIME__;
inline constexpr const char *BUILD_PLATFORM = BUILD_PLATFORM_INFO;
inline constexpr const char *COMPILER_INFO = COMPILER_INFO_STRING;

namespace
{

void print_header()
{
    std::cout << PROGRAM_NAME << " " << PROGRAM_VERSION << " by " << PROGRAM_AUTHOR << std::endl;
    std::cout << PROGRAM_COPYRIGHT << " (" << BUILD_DATE << "-" << BUILD_TIME << "-"
              << BUILD_PLATFORM << "-" << COMPILER_INFO << ")" << std::endl
              << std::endl;
}

} // namespace

int main(int argc, char *argv[])
{
    std::ios_base::sync_with_stdio(false);

    CLI::App app{"LFI Chef automates LFI wordlist generation with integrated evasion techniques", PROGRAM_NAME};
    app.set_version_flag("--version",
                         std::string(PROGRAM_VERSION) + " (" + BUILD_DATE + " " + BUILD_TIME + " " +
                             BUILD_PLATFORM + ")");
    app.set_config("--config", "", "Read options from an INI or TOML file");

    lfi_chef::Options options{};

    app.add_option("in_file", options.in_file, "The path to the input wordlist")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("mode", options.mode, "The program's mode of operation")
        ->required()
        ->check(CLI::IsMember({"generate", "sanitize"}));
    app.add_option("os", options.os, "The OS of the LFI wordlist")
        ->required()
        ->check(CLI::IsMember({"linux", "mac", "windows"}));

    app.add_option("--encoding", options.encoding,
                   "Encodings used for generation: u (url), d (double url), b (16-bit unicode), "
                   "o (overlong utf-8), in any order/combination");
    app.add_option("--traversal", options.traversal,
                   "Directory traversal depth N (1..N) or range start:end");
    app.add_option("--traversal_chars", options.traversal_chars,
                   "Comma-separated climb:separator traversal sets like ../:/,....//://");
    app.add_option("--null_byte", options.null_byte, "Null byte injection: p (prepend), a (append), b (both)");
    app.add_option("--out_file", options.out_file, "Output wordlist path (default: generated name in cwd)");
    app.add_option("--drive", options.drive,
                   "Windows drive letter for sanitize mode; without it drive letters are stripped");
    app.add_option("--max_payloads", options.max_payloads,
                   "Abort when one line would expand into more payloads than this (0 = no limit)")
        ->capture_default_str();
    app.add_flag("--append", options.append, "Append to the output file instead of truncating it");
    app.add_flag("-v,--verbose", options.verbose, "Log debug output to console and log file");
    app.add_option("--log_file", options.log_file, "Log file path (empty disables file logging)")
        ->capture_default_str();

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        const int code = app.exit(e);
        return code == static_cast<int>(CLI::ExitCodes::Success) ? lfi_chef::EXIT_OK : lfi_chef::EXIT_VALIDATION;
    }

    print_header();
    lfi_chef::setup_logging(options.log_file, options.verbose);

    return lfi_chef::execute(options, std::cout);
}
