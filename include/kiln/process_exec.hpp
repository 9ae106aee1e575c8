#pragma once

#include "kiln/utility.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiln {

struct ProcessOutput {
    int exit_code = 0;
    std::string out;
    std::string err;
};

struct ProcessOptions {
    std::optional<std::string> working_dir;
    std::optional<std::unordered_map<std::string, std::string>> env; ///< Extends the parent environment.
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * @brief Executes a subprocess and captures its output.
 *
 * @param args The command line arguments (first argument is the executable).
 * @return The exit code and captured streams, or an `Io` error if the process could not be run.
 *         A missed deadline is an error with `timed_out` set.
 */
Result<ProcessOutput> process_exec(std::vector<std::string> args, const ProcessOptions &options = {});

/** @brief Replaces every `{key}` in each argument with its value. */
std::vector<std::string> expand_placeholders(std::vector<std::string> args,
                                             const std::unordered_map<std::string, std::string> &values);

} // namespace kiln
