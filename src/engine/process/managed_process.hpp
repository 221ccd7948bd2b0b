#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

enum class ProcessState { NotStarted, Running, Exited, Failed };

struct ProcessOptions {
    // argv[0] is resolved through PATH when it has no slash.
    std::vector<std::string> argv;
    std::string working_dir;
    // Prepended to the inherited value with ':' (e.g. PATH, LD_LIBRARY_PATH).
    std::vector<std::pair<std::string, std::string>> env_prepend;
    std::chrono::milliseconds timeout{std::chrono::seconds(120)};
};

struct ProcessOutput {
    int exit_code = 0;
    std::string out;
    std::string err;
};

struct ProcessError {
    enum class Kind { Spawn, Timeout, Signal, Io };

    Kind kind = Kind::Io;
    int code = 0; // errno for Spawn/Io, signal number for Signal
    std::string message;
    std::string err; // stderr captured before the failure
};

// One child process with captured stdout/stderr and a hard deadline.
// The destructor kills and reaps a child that is still running.
class ManagedProcess {
public:
    explicit ManagedProcess(ProcessOptions options);
    ~ManagedProcess();

    ManagedProcess(const ManagedProcess&) = delete;
    ManagedProcess& operator=(const ManagedProcess&) = delete;

    std::expected<void, ProcessError> start();

    // Collects output until the child exits or the deadline passes.
    // Non-zero exit codes are reported in ProcessOutput, not as errors.
    std::expected<ProcessOutput, ProcessError> wait();

    ProcessState state() const { return state_; }
    pid_t pid() const { return pid_; }

    // start() + wait()
    static std::expected<ProcessOutput, ProcessError> run(ProcessOptions options);

private:
    void kill_and_reap();
    void close_pipes();

    ProcessOptions options_;
    ProcessState state_ = ProcessState::NotStarted;
    pid_t pid_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;
    std::chrono::steady_clock::time_point deadline_;
};
