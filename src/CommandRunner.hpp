#pragma once

#include <functional>
#include <string>

struct CommandResult {
    int exitCode = -1;
    std::string output;

    bool Ok() const { return exitCode == 0; }
};

using CommandRunner = std::function<CommandResult(const std::string&)>;

// Runs through /bin/sh and captures stdout. stderr is left on the terminal.
CommandResult RunShellCommand(const std::string& command);

// Runs with the terminal attached, for streaming commands such as `logs -f`.
int RunInteractiveCommand(const std::string& command);

std::string ShellQuote(const std::string& value);
