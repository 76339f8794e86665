#pragma once

#include <expected>
#include <stop_token>
#include <string>
#include <vector>

struct ProcessResult {
    int exit_code = -1;
    std::string out;
    std::string err;
};

// Exit code reported when the child could not exec its program.
inline constexpr int kExecFailedCode = 127;

// Runs argv[0] (looked up in PATH) with the given arguments, capturing stdout
// and stderr. Returns an error only if the process could not be started or
// waited for; a non-zero exit is reported through ProcessResult::exit_code.
// A stop request terminates the child with SIGTERM (exit code 143).
std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv,
                                                      std::stop_token stop = {});
