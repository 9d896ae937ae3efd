#include "CommandRunner.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace {
int DecodeExitStatus(int status) {
#ifdef _WIN32
    return status;
#else
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
#endif
}
} // namespace

CommandResult RunShellCommand(const std::string& command) {
    CommandResult result;
    if (command.empty()) {
        return result;
    }

#ifdef _WIN32
    FILE* pipe = _popen(command.c_str(), "r");
#else
    FILE* pipe = popen(command.c_str(), "r");
#endif
    if (pipe == nullptr) {
        return result;
    }

    std::array<char, 4096> buffer{};
    size_t read = 0;
    while ((read = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), read);
    }

#ifdef _WIN32
    result.exitCode = DecodeExitStatus(_pclose(pipe));
#else
    result.exitCode = DecodeExitStatus(pclose(pipe));
#endif
    return result;
}

int RunInteractiveCommand(const std::string& command) {
    if (command.empty()) {
        return -1;
    }

    return DecodeExitStatus(std::system(command.c_str()));
}

std::string ShellQuote(const std::string& value) {
    std::string quoted = "'";
    for (const char ch : value) {
        if (ch == '\'') {
            quoted += "'\\''";
        } else {
            quoted += ch;
        }
    }
    quoted += "'";
    return quoted;
}
