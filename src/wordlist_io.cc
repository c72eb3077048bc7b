// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: src/wordlist_io.cc
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#include "lfi_chef/wordlist_io.h"

#include <fstream>
#include <istream>
#include <ostream>
#include <utility>

#include <spdlog/spdlog.h>

#include "lfi_chef/errors.h"

namespace lfi_chef
{

std::unique_ptr<WordlistReader> WordlistReader::Create(const std::filesystem::path &path)
{
    auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!file->is_open())
    {
        spdlog::error("Unable to open input file: {}", path.string());
        return nullptr;
    }
    auto reader = std::make_unique<WordlistReader>(*file, path.string());
    reader->owned_ = std::move(file);
    return reader;
}

WordlistReader::WordlistReader(std::istream &in, std::string name)
    : in_(&in), name_(std::move(name))
{
}

bool WordlistReader::ReadLine(std::string &line)
{
    if (std::getline(*in_, line))
    {
        ++line_number_;
        return true;
    }
    if (in_->bad() || !in_->eof())
    {
        throw IoError("Unable to read " + name_ + " after line " + std::to_string(line_number_));
    }
    return false;
}

std::unique_ptr<WordlistWriter> WordlistWriter::Create(const std::filesystem::path &path, bool append)
{
    const auto mode = std::ios::binary | (append ? std::ios::app : std::ios::trunc);
    auto file = std::make_unique<std::ofstream>(path, mode);
    if (!file->is_open())
    {
        spdlog::error("Failed to open output file for writing: {}", path.string());
        return nullptr;
    }
    auto writer = std::make_unique<WordlistWriter>(*file, path.string());
    writer->owned_ = std::move(file);
    return writer;
}

WordlistWriter::WordlistWriter(std::ostream &out, std::string name)
    : out_(&out), name_(std::move(name))
{
}

void WordlistWriter::Write(std::string_view payload)
{
    out_->write(payload.data(), static_cast<std::streamsize>(payload.size()));
    out_->put('\n');
    if (out_->fail())
    {
        throw IoError("Failed to write to output file: " + name_);
    }
    ++written_;
}

void WordlistWriter::Flush()
{
    if (out_->flush().fail())
    {
        throw IoError("Failed to flush output file: " + name_);
    }
}

} // namespace lfi_chef
