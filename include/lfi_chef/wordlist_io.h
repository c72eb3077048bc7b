// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: include/lfi_chef/wordlist_io.h
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#ifndef LFI_CHEF_WORDLIST_IO_H
#define LFI_CHEF_WORDLIST_IO_H

#include <cstddef>
#include <filesystem>
#include <istream>
#include <ostream>
#include <memory>
#include <string>
#include <string_view>

namespace lfi_chef
{


// Reads a wordlist one '\n'-terminated line at a time, as raw bytes.
class WordlistReader
{
public:
    // nullptr if the file cannot be opened.
    static std::unique_ptr<WordlistReader> Create(const std::filesystem::path &path);

    // Does not take ownership of `in`.
    WordlistReader(std::istream &in, std::string name);

    // False at end of input. Throws IoError if the stream fails mid-read.
    bool ReadLine(std::string &line);

    std::size_t line_number() const noexcept { return line_number_; }
    const std::string &name() const noexcept { return name_; }

private:
    std::unique_ptr<std::istream> owned_;
    std::istream *in_;
    std::string name_;
    std::size_t line_number_ = 0;
};

class WordlistWriter
{
public:
    // nullptr if the file cannot be opened. Truncates unless `append` is set.
    static std::unique_ptr<WordlistWriter> Create(const std::filesystem::path &path, bool append = false);

    // Does not take ownership of `out`.
    WordlistWriter(std::ostream &out, std::string name);

    // Writes the payload followed by '\n'. Throws IoError on failure.
    void Write(std::string_view payload);
    void Flush();

    std::size_t written() const noexcept { return written_; }
    const std::string &name() const noexcept { return name_; }

private:
    std::unique_ptr<std::ostream> owned_;
    std::ostream *out_;
    std::string name_;
    std::size_t written_ = 0;
};

} // namespace lfi_chef

#endif // LFI_CHEF_WORDLIST_IO_H
