// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: src/logging.cc
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#include "lfi_chef/logging.h"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace lfi_chef
{

void setup_logging(const std::string &log_file, bool verbose)
{
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    console->set_pattern("[%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks{console};
    std::string file_error;
    if (!log_file.empty())
    {
        try
        {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
            file->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
            file->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
            sinks.push_back(file);
        }
        catch (const spdlog::spdlog_ex &e)
        {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>(PROJECT_NAME, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!file_error.empty())
    {
        spdlog::warn("Logging to console only, cannot open {}: {}", log_file, file_error);
    }
}

} // namespace lfi_chef
