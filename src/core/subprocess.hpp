#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

namespace warden::core {

// Output collected from a finished child process
struct ProcessOutput {
    bool success = false;      // Child ran and was reaped
    int exit_code = -1;        // Exit status, or 128+signal when killed
    std::string out;
    std::string err;
    std::string error;         // Why communication failed, when success == false
};

// A child process connected by stdin/stdout/stderr pipes.
// Owns the pipe descriptors; the destructor terminates and reaps a child
// that is still running.
class ChildProcess {
public:
    ChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    bool is_running();

    // Feed input on stdin, close it, collect stdout/stderr until EOF and reap.
    ProcessOutput communicate(const std::string& input);

    // SIGTERM then reap
    void terminate();

private:
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    void close_fds();
    int reap();
};

// Fork and exec argv[0] (PATH lookup) with piped standard streams.
// Returns nullptr and fills error when the program cannot be started.
std::unique_ptr<ChildProcess> spawn_process(const std::vector<std::string>& argv,
                                            const std::filesystem::path& working_dir,
                                            std::string& error);

// Spawn, feed input and wait for completion.
ProcessOutput run_process(const std::vector<std::string>& argv, const std::string& input);

} // namespace warden::core
