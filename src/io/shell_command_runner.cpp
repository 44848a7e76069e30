#include "csvsed/io/shell_command_runner.hpp"
#include "csvsed/core/errors.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace csvsed {

namespace {

using Clock = std::chrono::steady_clock;

// Owns one file descriptor
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    auto get() const -> int { return fd_; }
    auto is_open() const -> bool { return fd_ >= 0; }

    auto reset() -> void {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

auto make_pipe(const std::string& command) -> Pipe {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw ExecutionError(command, "Cannot create pipe for command \"" + command +
                                          "\": " + std::strerror(errno));
    }
    return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

// Kills and reaps the child unless it was already waited for.
// The child leads its own process group so grandchildren die with it.
class ChildProcess {
public:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}
    ~ChildProcess() {
        if (!reaped_) {
            ::kill(-pid_, SIGKILL);
            int status = 0;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
            }
        }
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Non-blocking; returns the wait status once the child has exited
    auto try_wait() -> std::optional<int> {
        int status = 0;
        pid_t result;
        do {
            result = ::waitpid(pid_, &status, WNOHANG);
        } while (result < 0 && errno == EINTR);

        if (result == 0) {
            return std::nullopt;
        }
        reaped_ = true;
        return result < 0 ? -1 : status;
    }

    auto kill_and_wait() -> void {
        ::kill(-pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        reaped_ = true;
    }

private:
    pid_t pid_;
    bool reaped_ = false;
};

// Writing to a child that closed its stdin must yield EPIPE, not a signal
class ScopedSigpipeBlock {
public:
    ScopedSigpipeBlock() {
        sigset_t block;
        sigemptyset(&block);
        sigaddset(&block, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &block, &old_mask_);
    }
    ~ScopedSigpipeBlock() {
        // Discard a SIGPIPE raised while blocked so restoring the mask cannot deliver it
        sigset_t pending;
        sigemptyset(&pending);
        if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1 &&
            sigismember(&old_mask_, SIGPIPE) == 0) {
            sigset_t only_pipe;
            sigemptyset(&only_pipe);
            sigaddset(&only_pipe, SIGPIPE);
            struct timespec zero = {0, 0};
            sigtimedwait(&only_pipe, nullptr, &zero);
        }
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    }

    ScopedSigpipeBlock(const ScopedSigpipeBlock&) = delete;
    ScopedSigpipeBlock& operator=(const ScopedSigpipeBlock&) = delete;

private:
    sigset_t old_mask_;
};

auto remaining_ms(const std::optional<Clock::time_point>& deadline) -> int {
    if (!deadline) {
        return -1;  // poll() waits indefinitely
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

auto expired(const std::optional<Clock::time_point>& deadline) -> bool {
    return deadline && Clock::now() >= *deadline;
}

// Appends whatever is available; returns false once the descriptor reached EOF
auto drain(UniqueFd& fd, std::string& sink) -> bool {
    std::array<char, 4096> buffer{};
    ssize_t count;
    do {
        count = ::read(fd.get(), buffer.data(), buffer.size());
    } while (count < 0 && errno == EINTR);

    if (count > 0) {
        sink.append(buffer.data(), static_cast<size_t>(count));
        return true;
    }
    if (count < 0 && errno == EAGAIN) {
        return true;
    }
    fd.reset();
    return false;
}

} // namespace

auto ShellCommandRunner::run(const std::string& command, const std::string& input,
                             std::chrono::milliseconds timeout) -> CommandResult {
    std::optional<Clock::time_point> deadline;
    if (timeout.count() > 0) {
        deadline = Clock::now() + timeout;
    }

    auto stdin_pipe = make_pipe(command);
    auto stdout_pipe = make_pipe(command);
    auto stderr_pipe = make_pipe(command);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdin_pipe.read_end.get(), STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdout_pipe.write_end.get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderr_pipe.write_end.get(), STDERR_FILENO);

    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attributes, 0);

    std::string shell = "/bin/sh";
    std::string flag = "-c";
    std::string script = command;
    std::vector<char*> argv{shell.data(), flag.data(), script.data(), nullptr};

    pid_t pid = 0;
    int spawn_status = posix_spawn(&pid, shell.c_str(), &actions, &attributes, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attributes);
    if (spawn_status != 0) {
        throw ExecutionError(command, "Cannot spawn command \"" + command +
                                          "\": " + std::strerror(spawn_status));
    }
    ChildProcess child(pid);

    // Parent keeps only its own ends
    stdin_pipe.read_end.reset();
    stdout_pipe.write_end.reset();
    stderr_pipe.write_end.reset();

    UniqueFd to_child = std::move(stdin_pipe.write_end);
    UniqueFd from_child = std::move(stdout_pipe.read_end);
    UniqueFd errors_from_child = std::move(stderr_pipe.read_end);
    ::fcntl(to_child.get(), F_SETFL, ::fcntl(to_child.get(), F_GETFL) | O_NONBLOCK);

    CommandResult result;
    size_t written = 0;
    if (input.empty()) {
        to_child.reset();
    }

    {
        ScopedSigpipeBlock sigpipe_guard;

        while (from_child.is_open() || errors_from_child.is_open()) {
            if (expired(deadline)) {
                child.kill_and_wait();
                result.timed_out = true;
                result.exit_status = -1;
                return result;
            }

            std::vector<pollfd> fds;
            if (to_child.is_open()) {
                fds.push_back(pollfd{to_child.get(), POLLOUT, 0});
            }
            if (from_child.is_open()) {
                fds.push_back(pollfd{from_child.get(), POLLIN, 0});
            }
            if (errors_from_child.is_open()) {
                fds.push_back(pollfd{errors_from_child.get(), POLLIN, 0});
            }

            int ready = ::poll(fds.data(), fds.size(), remaining_ms(deadline));
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw ExecutionError(command, "Cannot poll command \"" + command +
                                                  "\": " + std::strerror(errno));
            }

            for (const auto& entry : fds) {
                if (entry.revents == 0) {
                    continue;
                }
                if (entry.fd == to_child.get()) {
                    ssize_t count = ::write(to_child.get(), input.data() + written,
                                            input.size() - written);
                    if (count > 0) {
                        written += static_cast<size_t>(count);
                    }
                    // EPIPE: the command stopped reading, remaining input is dropped
                    if (written == input.size() || (count < 0 && errno != EAGAIN && errno != EINTR)) {
                        to_child.reset();
                    }
                } else if (entry.fd == from_child.get()) {
                    drain(from_child, result.output);
                } else if (entry.fd == errors_from_child.get()) {
                    drain(errors_from_child, result.error_output);
                }
            }
        }
    }
    to_child.reset();

    while (true) {
        if (auto status = child.try_wait()) {
            if (*status >= 0 && WIFEXITED(*status)) {
                result.exit_status = WEXITSTATUS(*status);
            } else if (*status >= 0 && WIFSIGNALED(*status)) {
                result.exit_status = 128 + WTERMSIG(*status);
            } else {
                result.exit_status = -1;
            }
            return result;
        }
        if (expired(deadline)) {
            child.kill_and_wait();
            result.timed_out = true;
            result.exit_status = -1;
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

} // namespace csvsed
