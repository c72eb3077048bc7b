// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: src/cli.cc
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#include "lfi_chef/cli.h"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <system_error>

#include <spdlog/spdlog.h>

#include "lfi_chef/errors.h"
#include "lfi_chef/runner.h"

namespace lfi_chef
{

namespace fs = std::filesystem;

namespace
{

fs::path default_output_name(const std::string &os)
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    const std::tm *local = std::localtime(&now);
    std::string name = "LFI-Chef_" + os + "_wordlist";
    if (local != nullptr)
    {
        name += "_" + std::to_string(local->tm_hour) + "_" + std::to_string(local->tm_min) + "_" +
                std::to_string(local->tm_sec);
    }
    return fs::current_path() / (name + ".txt");
}

bool is_home_relative(const std::string &path) noexcept
{
    return path == "~" || (path.size() >= 2 && path[0] == '~' && (path[1] == '/' || path[1] == '\\'));
}

} // namespace

fs::path resolve_output_path(const std::string &requested, const std::string &os)
{
    if (requested.empty())
    {
        return default_output_name(os);
    }

    fs::path path = requested;
    if (is_home_relative(requested))
    {
        const char *home = std::getenv("HOME");
        if (home == nullptr)
        {
            throw ValidationError("Cannot expand '~' in " + requested + ", HOME is not set");
        }
        const auto rest = requested.find_first_not_of("/\\", 1);
        path = fs::path(home) / (rest == std::string::npos ? std::string{} : requested.substr(rest));
    }

    std::error_code ec;
    if (fs::is_directory(path, ec))
    {
        throw ValidationError("Output path " + path.string() + " is a directory");
    }
    if (path.has_parent_path())
    {
        fs::create_directories(path.parent_path(), ec);
        if (ec)
        {
            throw IoError("Unable to create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }
    return path;
}

int exit_code_for(const std::exception &e) noexcept
{
    if (dynamic_cast<const ValidationError *>(&e) != nullptr)
    {
        return EXIT_VALIDATION;
    }
    if (dynamic_cast<const IoError *>(&e) != nullptr)
    {
        return EXIT_IO;
    }
    return EXIT_INTERNAL;
}

int execute(const Options &options, std::ostream &out)
{
    try
    {
        const auto report = build_config(options);
        for (const auto &note : report.ignored)
        {
            spdlog::warn("Ignored option: {}", note);
        }

        const fs::path in_path = options.in_file;
        const fs::path out_path = resolve_output_path(options.out_file, options.os);
        std::error_code ec;
        if (fs::equivalent(in_path, out_path, ec))
        {
            throw ValidationError("Output file " + out_path.string() + " is the input wordlist");
        }

        const auto start_time = std::chrono::steady_clock::now();
        const auto stats = run(report.config, in_path, out_path);
        const auto duration =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);

        out << "LFI " << options.os << " wordlist " << options.mode << " complete, stored at:\n\n\t"
            << out_path.string() << "\n\n";
        out << "Processed " << stats.lines_read << " lines (" << stats.lines_skipped << " blank), wrote "
            << stats.payloads_written << " payloads";
        if (report.config.mode == Mode::Sanitize)
        {
            out << ", dropped " << stats.duplicates_dropped << " duplicates";
        }
        out << ", in " << duration.count() << " ms." << std::endl;
        return EXIT_OK;
    }
    catch (const ValidationError &e)
    {
        spdlog::error("{}", e.what());
        return exit_code_for(e);
    }
    catch (const IoError &e)
    {
        spdlog::error("Error occurred during file operation: {}", e.what());
        return exit_code_for(e);
    }
    catch (const std::exception &e)
    {
        spdlog::critical("Unexpected exception occurred: {}", e.what());
        return exit_code_for(e);
    }
}

} // namespace lfi_chef
