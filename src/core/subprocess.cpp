#include "core/subprocess.hpp"
#include <spdlog/spdlog.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <mutex>

namespace warden::core {

namespace {

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

} // namespace

ChildProcess::ChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ChildProcess::~ChildProcess() {
    if (!reaped_ && pid_ > 0) {
        terminate();
    }
    close_fds();
}

void ChildProcess::close_fds() {
    if (stdin_fd_ >= 0) close(stdin_fd_);
    if (stdout_fd_ >= 0) close(stdout_fd_);
    if (stderr_fd_ >= 0) close(stderr_fd_);
    stdin_fd_ = stdout_fd_ = stderr_fd_ = -1;
}

bool ChildProcess::is_running() {
    if (reaped_ || pid_ <= 0) {
        return false;
    }
    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        reaped_ = true;
        exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
        return false;
    }
    return result == 0;
}

int ChildProcess::reap() {
    if (reaped_ || pid_ <= 0) {
        return exit_code_;
    }
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) {
            reaped_ = true;
            return exit_code_;
        }
    }
    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    }
    return exit_code_;
}

void ChildProcess::terminate() {
    if (reaped_ || pid_ <= 0) {
        return;
    }
    kill(pid_, SIGTERM);
    reap();
}

ProcessOutput ChildProcess::communicate(const std::string& input) {
    ProcessOutput output;
    if (reaped_) {
        output.error = "process already reaped";
        return output;
    }

    size_t written = 0;
    if (input.empty() && stdin_fd_ >= 0) {
        close(stdin_fd_);
        stdin_fd_ = -1;
    }

    char buf[4096];
    while (stdin_fd_ >= 0 || stdout_fd_ >= 0 || stderr_fd_ >= 0) {
        struct pollfd fds[3];
        nfds_t count = 0;
        int* owners[3];
        if (stdin_fd_ >= 0) {
            fds[count] = {stdin_fd_, POLLOUT, 0};
            owners[count++] = &stdin_fd_;
        }
        if (stdout_fd_ >= 0) {
            fds[count] = {stdout_fd_, POLLIN, 0};
            owners[count++] = &stdout_fd_;
        }
        if (stderr_fd_ >= 0) {
            fds[count] = {stderr_fd_, POLLIN, 0};
            owners[count++] = &stderr_fd_;
        }

        if (poll(fds, count, -1) < 0) {
            if (errno == EINTR) continue;
            output.error = std::string("poll failed: ") + std::strerror(errno);
            terminate();
            close_fds();
            return output;
        }

        for (nfds_t i = 0; i < count; ++i) {
            int& fd = *owners[i];
            if (fds[i].revents == 0) continue;

            if (&fd == &stdin_fd_) {
                ssize_t n = write(fd, input.data() + written, input.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                }
                if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    // Child closed its stdin early; remaining input is dropped.
                    spdlog::debug("Child {} closed stdin after {} bytes", pid_, written);
                    written = input.size();
                }
                if (written >= input.size()) {
                    close(fd);
                    fd = -1;
                }
                continue;
            }

            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) {
                (&fd == &stdout_fd_ ? output.out : output.err).append(buf, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                close(fd);
                fd = -1;
            }
        }
    }

    output.exit_code = reap();
    output.success = true;
    return output;
}

std::unique_ptr<ChildProcess> spawn_process(const std::vector<std::string>& argv,
                                            const std::filesystem::path& working_dir,
                                            std::string& error) {
    if (argv.empty()) {
        error = "empty command line";
        return nullptr;
    }
    ignore_sigpipe();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // Reports exec failure back to the parent
    // Close-on-exec so children spawned concurrently from other threads do not
    // inherit these ends; dup2 clears the flag on the child's 0/1/2
    if (pipe2(stdin_pipe, O_CLOEXEC) < 0 || pipe2(stdout_pipe, O_CLOEXEC) < 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) < 0 || pipe2(exec_pipe, O_CLOEXEC) < 0) {
        error = std::string("failed to create pipes: ") + std::strerror(errno);
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(exec_pipe);
        return nullptr;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + std::strerror(errno);
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(exec_pipe);
        return nullptr;
    }

    if (pid == 0) {
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close(exec_pipe[0]);

        signal(SIGPIPE, SIG_DFL);
        if (!working_dir.empty() && chdir(working_dir.c_str()) < 0) {
            int err = errno;
            (void)!write(exec_pipe[1], &err, sizeof(err));
            _exit(127);
        }
        execvp(args[0], args.data());
        int err = errno;
        (void)!write(exec_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n > 0) {
        error = "failed to execute " + argv[0] + ": " + std::strerror(child_errno);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        int status = 0;
        waitpid(pid, &status, 0);
        return nullptr;
    }

    fcntl(stdin_pipe[1], F_SETFL, fcntl(stdin_pipe[1], F_GETFL) | O_NONBLOCK);
    spdlog::debug("Spawned {} (pid={})", argv[0], pid);
    return std::make_unique<ChildProcess>(pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]);
}

ProcessOutput run_process(const std::vector<std::string>& argv, const std::string& input) {
    std::string error;
    auto child = spawn_process(argv, {}, error);
    if (!child) {
        ProcessOutput output;
        output.error = error;
        return output;
    }
    return child->communicate(input);
}

} // namespace warden::core
