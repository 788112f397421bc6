// SPDX-License-Identifier: Apache-2.0
// command.hpp
// Runs an external command with a hard deadline and captures its stdout.
#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace hdw::source {

// The command could not be started, or its output could not be read.
class CommandError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The deadline passed; the child has been killed and reaped.
class CommandTimeout : public CommandError
{
public:
    using CommandError::CommandError;
};

struct CommandResult
{
    int exit_code{0}; // 128 + signal when the child was killed by a signal
    std::string output; // stdout only; stderr is discarded
};

CommandResult run_command(const std::vector<std::string> &argv, std::chrono::milliseconds timeout);

// Splits on '\n', dropping a trailing '\r' and the empty remainder after a final newline.
std::vector<std::string> split_lines(const std::string &text);

} // namespace hdw::source
