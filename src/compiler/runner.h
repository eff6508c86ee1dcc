// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_COMPILER_RUNNER_H
#define SCVERIFY_COMPILER_RUNNER_H

/**
 * @file runner.h
 * @brief Running compilers as child processes
 */

#include <compiler/cache.h>
#include <compiler/input.h>

#include <chrono>
#include <stdexcept>
#include <string>

class CThreadInterrupt;

namespace scverify {

static const int64_t DEFAULT_COMPILER_TIMEOUT = 0;

class CompilerRunError : public std::runtime_error
{
public:
    enum Kind {
        //! the compiler could not be started or exited unsuccessfully
        FAILED,
        //! interrupted or timed out, the process was killed
        CANCELLED,
    };

    CompilerRunError(Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

    Kind GetKind() const { return kind_; }

private:
    Kind kind_;
};

/** Executes a compiler on a standard JSON input */
class CompilerRunner
{
public:
    virtual ~CompilerRunner() {}

    /**
     * Run the compiler and return its standard output.
     * @param interrupt checked while the compiler runs, may be null
     * @throws CompilerRunError
     */
    virtual std::string Run(const Compiler& compiler, const CompilerInput& input, const CThreadInterrupt* interrupt) = 0;
};

/**
 * Runs `<binary> --standard-json` as a child process in its own process
 * group, feeding the input on stdin. On interrupt or timeout the whole group
 * is killed and reaped.
 */
class LocalCompilerRunner : public CompilerRunner
{
public:
    /** @param timeout zero disables the time limit */
    explicit LocalCompilerRunner(std::chrono::seconds timeout = std::chrono::seconds(DEFAULT_COMPILER_TIMEOUT));

    std::string Run(const Compiler& compiler, const CompilerInput& input, const CThreadInterrupt* interrupt) override;

    /** Run `<binary> --standard-json` with the given stdin */
    std::string Execute(const fs::path& binary, const std::string& stdinData, const CThreadInterrupt* interrupt);

private:
    const std::chrono::seconds timeout_;
};

} // namespace scverify

#endif // SCVERIFY_COMPILER_RUNNER_H
