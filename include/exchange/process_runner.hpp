#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include "core/cancellation_token.hpp"

#include <string>

struct ProcessResult {
    int exitCode = -1;
    std::string output;
    bool cancelled = false;
    bool timedOut = false;
};

// Runs command through /bin/sh with input on stdin, collecting stdout. The
// child is killed when the token is cancelled or timeoutMs passes
// (timeoutMs <= 0 waits forever). Throws std::runtime_error if the process
// cannot be started.
ProcessResult runProcess(const std::string& command, const std::string& input,
                         const CancellationToken& token, int timeoutMs);

// Single-quotes text for /bin/sh.
std::string shellQuote(const std::string& text);

#endif
