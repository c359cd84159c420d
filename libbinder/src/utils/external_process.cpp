#include "../../include/external_process.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace binder {

namespace {

constexpr std::string_view kTag = "ExternalProcess";
constexpr auto kPollInterval = std::chrono::milliseconds(50);

std::string substitute(std::string token, const std::map<std::string, std::string>& values) {
    for (const auto& [name, value] : values) {
        const std::string key = "{" + name + "}";
        for (auto pos = token.find(key); pos != std::string::npos; pos = token.find(key, pos + value.size())) {
            token.replace(pos, key.size(), value);
        }
    }
    return token;
}

int decode_status(const int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

// posix_spawn attribute and file action objects, destroyed on scope exit
struct SpawnSetup {
    posix_spawnattr_t attr{};
    posix_spawn_file_actions_t actions{};

    SpawnSetup() {
        posix_spawnattr_init(&attr);
        posix_spawn_file_actions_init(&actions);
    }
    ~SpawnSetup() {
        posix_spawn_file_actions_destroy(&actions);
        posix_spawnattr_destroy(&attr);
    }
    SpawnSetup(const SpawnSetup&) = delete;
    SpawnSetup& operator=(const SpawnSetup&) = delete;
};

} // namespace

std::vector<std::string> expand_command(const std::string_view command_template,
                                        const std::map<std::string, std::string>& values) {
    std::vector<std::string> argv;
    std::string current;
    bool in_quotes = false;
    bool has_token = false;
    for (const char c : command_template) {
        if (c == '"') {
            in_quotes = !in_quotes;
            has_token = true;
        } else if (!in_quotes && (c == ' ' || c == '\t' || c == '\n')) {
            if (has_token) {
                argv.push_back(substitute(std::move(current), values));
                current.clear();
                has_token = false;
            }
        } else {
            current += c;
            has_token = true;
        }
    }
    if (in_quotes) {
        throw Error(ErrorKind::Configuration, "unterminated quote in command: " + std::string(command_template));
    }
    if (has_token) {
        argv.push_back(substitute(std::move(current), values));
    }
    if (argv.empty()) {
        throw Error(ErrorKind::Configuration, "empty command");
    }
    return argv;
}

ProcessResult ExternalProcess::run(const std::vector<std::string>& argv,
                                   const std::chrono::milliseconds timeout,
                                   const std::string& working_dir) {
    if (argv.empty()) {
        throw Error(ErrorKind::Configuration, "empty command");
    }
    if (running()) {
        throw Error(ErrorKind::Automation, "a child process is still running");
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    SpawnSetup setup;
    posix_spawnattr_setflags(&setup.attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&setup.attr, 0);
    posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&setup.actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&setup.actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
    if (!working_dir.empty()) {
        posix_spawn_file_actions_addchdir_np(&setup.actions, working_dir.c_str());
    }

    Logger::log(LogLevel::Debug, "Starting " + argv.front() + " (" + std::to_string(argv.size() - 1) + " args)", kTag);

    pid_t pid = -1;
    const int rc = posix_spawnp(&pid, args[0], &setup.actions, &setup.attr, args.data(), environ);
    if (rc != 0) {
        throw Error(ErrorKind::Automation, "cannot start " + argv.front() + ": " + std::strerror(rc));
    }
    {
        std::lock_guard lock(mtx_);
        pid_ = pid;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    ProcessResult result;
    for (;;) {
        siginfo_t info{};
        const int w = waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
        if (w == 0 && info.si_pid == pid) {
            result.exit_code = reap_group(pid);
            break;
        }
        if (w < 0 && errno != EINTR) {
            // already reaped by terminate()
            result.exit_code = -1;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            Logger::log(LogLevel::Warning, argv.front() + " exceeded its time budget, killing it", kTag);
            result.timed_out = true;
            terminate();
            break;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    {
        std::lock_guard lock(mtx_);
        if (pid_ == pid) pid_ = -1;
    }
    Logger::log(LogLevel::Debug, argv.front() + " finished with code " + std::to_string(result.exit_code), kTag);
    return result;
}

int ExternalProcess::reap_group(const pid_t pid) noexcept {
    std::lock_guard lock(mtx_);
    if (pid_ != pid) {
        // terminate() got there first
        return -1;
    }
    // the unreaped leader keeps the group id reserved, so this cannot hit another group;
    // helpers forked by the child may outlive it inside the group
    kill(-pid, SIGKILL);
    int status = 0;
    pid_t r;
    while ((r = waitpid(pid, &status, 0)) < 0 && errno == EINTR) {
    }
    pid_ = -1;
    return r == pid ? decode_status(status) : -1;
}

void ExternalProcess::terminate() noexcept {
    std::lock_guard lock(mtx_);
    if (pid_ <= 0) {
        return;
    }
    kill(-pid_, SIGKILL);
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    Logger::log(LogLevel::Debug, "Terminated process group " + std::to_string(pid_), kTag);
    pid_ = -1;
}

bool ExternalProcess::running() const noexcept {
    std::lock_guard lock(mtx_);
    return pid_ > 0;
}

} // namespace binder
