/**
 * @file external_process.hpp
 * @brief Supervised child processes for automation-backed converters.
 */

#ifndef BINDER_EXTERNAL_PROCESS_HPP
#define BINDER_EXTERNAL_PROCESS_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace binder {

struct ProcessResult {
    int exit_code = -1;     ///< Exit status, or -1 if killed by a signal
    bool timed_out = false; ///< True if the time budget ran out and the child was killed
};

/**
 * @brief Split a command template into argv and substitute "{name}" placeholders.
 *
 * Tokens are separated by whitespace; double quotes group a token.
 * Substitution happens after splitting, so values containing spaces stay
 * one argument.
 *
 * @throws Error(ErrorKind::Configuration) on an unterminated quote or an
 * empty command.
 */
std::vector<std::string> expand_command(std::string_view command_template,
                                        const std::map<std::string, std::string>& values);

/**
 * @brief Runs one child process at a time, in its own process group.
 *
 * @details run() blocks until the child exits or the time budget expires,
 * in which case the whole process group is killed. terminate() is the
 * forced cleanup between attempts: it kills whatever this object started
 * and is still alive. Calling it twice, or before anything was started,
 * does nothing.
 */
class ExternalProcess {
public:
    ExternalProcess() = default;
    ~ExternalProcess() { terminate(); }

    ExternalProcess(const ExternalProcess&) = delete;
    ExternalProcess& operator=(const ExternalProcess&) = delete;

    /**
     * @brief Start @p argv and wait for it.
     * @param argv Program and arguments; the program is looked up in PATH.
     * @param timeout Time budget for the child.
     * @param working_dir Working directory of the child, current if empty.
     * @throws Error(ErrorKind::Automation) if the child cannot be started.
     */
    ProcessResult run(const std::vector<std::string>& argv,
                      std::chrono::milliseconds timeout,
                      const std::string& working_dir = {});

    /// Kill the process group of a child that is still running. Idempotent.
    void terminate() noexcept;

    [[nodiscard]] bool running() const noexcept;

private:
    /// Kill what is left of the exited child's group, then reap the child.
    int reap_group(pid_t pid) noexcept;

    mutable std::mutex mtx_;
    pid_t pid_ = -1;
};

} // namespace binder

#endif // BINDER_EXTERNAL_PROCESS_HPP
