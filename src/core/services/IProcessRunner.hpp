/**
 * @file IProcessRunner.hpp
 * @brief Interface for running external tools with captured output.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace lanwatch::core {

/**
 * @brief Outcome of one external process invocation.
 */
struct ProcessResult {
    int exitCode{-1};         ///< Exit status, 127 if the program could not be started
    std::string stdoutText;   ///< Captured standard output
    std::string stderrText;   ///< Captured standard error
    bool timedOut{false};     ///< The process was killed at the deadline
    bool spawnFailed{false};  ///< The program was not found or could not be executed

    [[nodiscard]] bool succeeded() const { return !spawnFailed && !timedOut && exitCode == 0; }
};

/**
 * @brief Spawns external programs.
 */
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    /**
     * @brief Runs a program to completion or until the timeout elapses.
     * @param argv Program followed by its arguments; argv[0] is looked up in PATH.
     * @param timeout Deadline after which the process is killed.
     */
    virtual ProcessResult run(const std::vector<std::string>& argv,
                              std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Checks whether a program can be found in PATH.
     */
    virtual bool isAvailable(const std::string& program) const = 0;
};

} // namespace lanwatch::core
