// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: include/lfi_chef/errors.h
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#ifndef LFI_CHEF_ERRORS_H
#define LFI_CHEF_ERRORS_H

#include <stdexcept>
#include <string>

namespace lfi_chef
{

class Error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Rejected user input. Reported before any output is produced.
class ValidationError : public Error
{
public:
    using Error::Error;
};

// Open, read or write failure on a wordlist file.
class IoError : public Error
{
public:
    using Error::Error;
};

inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_INTERNAL = 1;
inline constexpr int EXIT_VALIDATION = 2;
inline constexpr int EXIT_IO = 3;

} // namespace lfi_chef

#endif // LFI_CHEF_ERRORS_H
