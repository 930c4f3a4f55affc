#pragma once

#include <keyrescue/core/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace keyrescue::process {

/**
 * @brief Description of a short-lived child process.
 *
 * @code
 * ProcessSpec spec{.executable = "git", .args = {"rev-parse", "HEAD"}};
 * spec.in_directory(workspace).with_timeout(std::chrono::seconds{10});
 * auto out = runProcess(spec);
 * @endcode
 */
struct ProcessSpec {
    std::filesystem::path executable;             ///< Resolved through PATH when relative
    std::vector<std::string> args;                ///< Arguments (argv[1..])
    std::optional<std::filesystem::path> workdir; ///< Working directory (optional)
    std::chrono::milliseconds timeout{30'000};    ///< Wall-clock limit, child killed on expiry
    std::size_t maxOutputBytes{10 * 1024 * 1024}; ///< Combined stdout+stderr cap

    auto& with_timeout(std::chrono::milliseconds t) {
        timeout = t;
        return *this;
    }

    auto& in_directory(std::filesystem::path dir) {
        workdir = std::move(dir);
        return *this;
    }

    auto& with_max_output(std::size_t bytes) {
        maxOutputBytes = bytes;
        return *this;
    }
};

struct ProcessOutput {
    int exitCode{-1};
    std::string out;
    std::string err;

    bool ok() const noexcept { return exitCode == 0; }
};

/**
 * @brief Spawn the process, collect its output and wait for it to exit.
 *
 * Errors: ProcessFailed when the child cannot be spawned, Timeout when the
 * deadline passes, ResourceExhausted when output exceeds the cap. A non-zero
 * exit status is not an error; inspect ProcessOutput::exitCode.
 */
Result<ProcessOutput> runProcess(const ProcessSpec& spec);

} // namespace keyrescue::process
