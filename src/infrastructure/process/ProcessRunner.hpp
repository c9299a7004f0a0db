#pragma once

#include "core/services/IProcessRunner.hpp"

namespace lanwatch::infra {

/**
 * @brief Runs external programs with fork/execvp and captures their output.
 *
 * Standard output and standard error are read through pipes while the child
 * runs. A child still running at the deadline is killed with SIGKILL and
 * reaped. If the program cannot be executed, the result has spawnFailed set
 * and exit code 127.
 */
class ProcessRunner : public core::IProcessRunner {
public:
    core::ProcessResult run(const std::vector<std::string>& argv,
                            std::chrono::milliseconds timeout) override;

    bool isAvailable(const std::string& program) const override;
};

} // namespace lanwatch::infra
