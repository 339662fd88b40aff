#pragma once

#include "core/cancellation_token.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Outcome of a child process that ran to completion
 */
struct ProcessResult
{
    int exit_code = -1;
    bool signaled = false;          // Terminated by a signal it did not handle
    std::string stderr_tail;        // Last bytes written to stderr
    std::chrono::milliseconds elapsed{0};

    bool success() const { return !signaled && exit_code == 0; }
};

/**
 * @brief Runs external tools from an argument vector, never through a shell
 *
 * The child gets its own process group, /dev/null on stdin and stdout, and
 * its stderr captured through a pipe. On timeout or cancellation the whole
 * group receives SIGTERM, then SIGKILL once the grace period expires, and
 * the child is always reaped before run() returns or throws.
 */
class ProcessRunner
{
public:
    struct Options
    {
        std::chrono::milliseconds timeout{std::chrono::seconds(300)};
        std::chrono::milliseconds kill_grace{std::chrono::seconds(2)};
        size_t max_stderr_bytes = 16384;
        std::filesystem::path working_directory; // Empty keeps the current directory
    };

    /**
     * @brief Run a program to completion
     * @param argv Program followed by its arguments; argv[0] is looked up on PATH
     * @param options Timeout and capture settings
     * @param token Polled while the child runs
     * @return Exit status and stderr tail; a non-zero exit is not an error here
     * @throws TransformTimeout if the child outlives options.timeout
     * @throws TransformFailed if the token is cancelled or the program cannot be executed
     * @throws ResourceError if the pipe or the fork cannot be created
     */
    static ProcessResult run(const std::vector<std::string> &argv, const Options &options,
                             const CancellationToken &token);
};
