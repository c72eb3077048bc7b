// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: src/runner.cc
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#include "lfi_chef/runner.h"

#include <string>

#include <spdlog/spdlog.h>

#include "lfi_chef/canonicalizer.h"
#include "lfi_chef/deduplicator.h"
#include "lfi_chef/errors.h"
#include "lfi_chef/mutation_pipeline.h"

namespace lfi_chef
{

RunStats run_generate(const Config &config, WordlistReader &reader, WordlistWriter &writer)
{
    const MutationPipeline pipeline(config);
    RunStats stats;
    std::string line;

    while (reader.ReadLine(line))
    {
        ++stats.lines_read;
        const Payload original(trim_whitespace(line));
        if (original.empty())
        {
            ++stats.lines_skipped;
            continue;
        }

        // The set lives for this line only.
        const PayloadSet payloads = pipeline.expand(original);
        for (const auto &payload : payloads)
        {
            writer.Write(payload);
        }
        stats.payloads_written += payloads.size();
        spdlog::debug("{}:{} expanded into {} payloads", reader.name(), reader.line_number(), payloads.size());
    }

    writer.Flush();
    return stats;
}

RunStats run_sanitize(const Config &config, WordlistReader &reader, WordlistWriter &writer)
{
    Deduplicator seen;
    RunStats stats;
    std::string line;

    while (reader.ReadLine(line))
    {
        ++stats.lines_read;
        // Checked before canonicalizing, which would give a blank line a drive.
        if (trim_whitespace(line).empty())
        {
            ++stats.lines_skipped;
            continue;
        }

        const Payload canonical = canonicalize(line, config.os, config.drive);
        if (canonical.empty())
        {
            ++stats.lines_skipped;
            continue;
        }

        if (!seen.accept(canonical))
        {
            ++stats.duplicates_dropped;
            continue;
        }
        writer.Write(canonical);
        ++stats.payloads_written;
    }

    writer.Flush();
    return stats;
}

RunStats run(const Config &config, const std::filesystem::path &in_path, const std::filesystem::path &out_path)
{
    auto reader = WordlistReader::Create(in_path);
    if (!reader)
    {
        throw IoError("Unable to open input file: " + in_path.string());
    }

    // Built before the output is opened so a rejected configuration leaves no file behind.
    if (config.mode == Mode::Generate)
    {
        const MutationPipeline pipeline(config);
        spdlog::info("Every input line expands into {} payloads", pipeline.payloads_per_line());
    }

    auto writer = WordlistWriter::Create(out_path, config.append_output);
    if (!writer)
    {
        throw IoError("Unable to open output file: " + out_path.string());
    }

    spdlog::info("Running {} on the {} wordlist {} -> {}", to_string(config.mode), to_string(config.os),
                 in_path.filename().string(), out_path.string());
    if (config.mode == Mode::Generate)
    {
        return run_generate(config, *reader, *writer);
    }
    return run_sanitize(config, *reader, *writer);
}

} // namespace lfi_chef
