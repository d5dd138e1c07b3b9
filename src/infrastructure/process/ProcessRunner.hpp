#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace channelscout::infra {

/**
 * @brief Captured outcome of a finished child process.
 */
struct ProcessResult {
    bool launched{false};     ///< False if the process could not be started at all
    int exitCode{-1};         ///< Exit status, or 128 + signal number if killed
    bool timedOut{false};     ///< Killed because the deadline expired
    bool cancelled{false};    ///< Killed because stop was requested
    std::string stdoutText;   ///< Everything written to standard output
    std::string stderrText;   ///< Everything written to standard error

    [[nodiscard]] bool succeeded() const {
        return launched && !timedOut && !cancelled && exitCode == 0;
    }
};

/**
 * @brief Runs external executables with captured output and a hard deadline.
 *
 * The child is started with fork/execvp; both output pipes are drained with poll()
 * so neither can fill up and stall the child. When the deadline passes or stop is
 * requested the child is killed with SIGKILL and reaped.
 */
class ProcessRunner {
public:
    /**
     * @brief Runs a program to completion.
     * @param executable Program name (looked up on PATH) or path.
     * @param args Arguments, not including argv[0].
     * @param timeout Hard deadline for the whole run.
     * @param stopToken Kills the child early when stop is requested.
     * @return Captured result. Launch failures are reported, not thrown.
     */
    static ProcessResult run(const std::string& executable, const std::vector<std::string>& args,
                             std::chrono::milliseconds timeout, std::stop_token stopToken = {});

    /**
     * @brief Resolves a program the way the shell would.
     * @param name Program name or path.
     * @return Absolute path of an executable file, or nullopt if none is found.
     */
    static std::optional<std::filesystem::path> findExecutable(const std::string& name);
};

} // namespace channelscout::infra
