#include "managed_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace {

std::vector<std::string> build_environment(
    const std::vector<std::pair<std::string, std::string>>& prepend) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        env.emplace_back(*e);
    }

    for (const auto& [key, value] : prepend) {
        auto prefix = key + "=";
        bool found = false;
        for (auto& entry : env) {
            if (entry.starts_with(prefix)) {
                auto old = entry.substr(prefix.size());
                entry = prefix + value + (old.empty() ? "" : ":" + old);
                found = true;
                break;
            }
        }
        if (!found) env.push_back(prefix + value);
    }
    return env;
}

std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

ManagedProcess::ManagedProcess(ProcessOptions options)
    : options_(std::move(options)) {}

ManagedProcess::~ManagedProcess() {
    if (state_ == ProcessState::Running) {
        kill_and_reap();
        state_ = ProcessState::Failed;
    }
    close_pipes();
}

std::expected<void, ProcessError> ManagedProcess::start() {
    if (state_ != ProcessState::NotStarted) {
        return std::unexpected(ProcessError{
            .kind = ProcessError::Kind::Io, .code = EALREADY, .message = "process already started"});
    }
    if (options_.argv.empty()) {
        state_ = ProcessState::Failed;
        return std::unexpected(ProcessError{
            .kind = ProcessError::Kind::Spawn, .code = EINVAL, .message = "empty command line"});
    }

    // Everything the child touches is prepared before fork().
    auto args = options_.argv;
    auto argv = to_c_array(args);
    auto env = build_environment(options_.env_prepend);
    auto envp = to_c_array(env);

    int out_pipe[2], err_pipe[2], status_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        state_ = ProcessState::Failed;
        return std::unexpected(ProcessError{
            .kind = ProcessError::Kind::Io, .code = errno,
            .message = std::string("pipe() failed: ") + std::strerror(errno)});
    }
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        state_ = ProcessState::Failed;
        return std::unexpected(ProcessError{
            .kind = ProcessError::Kind::Io, .code = saved,
            .message = std::string("pipe() failed: ") + std::strerror(saved)});
    }
    if (::pipe2(status_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
        state_ = ProcessState::Failed;
        return std::unexpected(ProcessError{
            .kind = ProcessError::Kind::Io, .code = saved,
            .message = std::string("pipe() failed: ") + std::strerror(saved)});
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1],
                       status_pipe[0], status_pipe[1]}) {
            ::close(fd);
        }
        state_ = ProcessState::Failed;
        return std::unexpected(ProcessError{
            .kind = ProcessError::Kind::Spawn, .code = saved,
            .message = std::string("fork() failed: ") + std::strerror(saved)});
    }

    if (pid == 0) {
        // Child: own process group so a timeout kill reaches grandchildren too.
        ::setpgid(0, 0);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        if (!options_.working_dir.empty() && ::chdir(options_.working_dir.c_str()) < 0) {
            int e = errno;
            (void)!::write(status_pipe[1], &e, sizeof(e));
            ::_exit(127);
        }

        ::execvpe(argv[0], argv.data(), envp.data());
        int e = errno;
        (void)!::write(status_pipe[1], &e, sizeof(e));
        ::_exit(127);
    }

    // Parent
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(status_pipe[1]);
    pid_ = pid;
    out_fd_ = out_pipe[0];
    err_fd_ = err_pipe[0];

    // The status pipe closes on successful exec (O_CLOEXEC) or carries errno.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        while (::waitpid(pid_, nullptr, 0) < 0 && errno == EINTR) {}
        close_pipes();
        state_ = ProcessState::Failed;
        return std::unexpected(ProcessError{
            .kind = ProcessError::Kind::Spawn, .code = child_errno,
            .message = "failed to execute " + options_.argv[0] + ": " + std::strerror(child_errno)});
    }

    state_ = ProcessState::Running;
    deadline_ = std::chrono::steady_clock::now() + options_.timeout;
    return {};
}

std::expected<ProcessOutput, ProcessError> ManagedProcess::wait() {
    if (state_ != ProcessState::Running) {
        return std::unexpected(ProcessError{
            .kind = ProcessError::Kind::Io, .code = ECHILD, .message = "process is not running"});
    }

    ProcessOutput output;
    char buf[4096];

    auto timed_out = [&]() {
        kill_and_reap();
        close_pipes();
        state_ = ProcessState::Failed;
        auto secs = std::chrono::duration<double>(options_.timeout).count();
        return std::unexpected(ProcessError{
            .kind = ProcessError::Kind::Timeout, .code = ETIMEDOUT,
            .message = std::format("{} timed out after {:.1f}s", options_.argv[0], secs),
            .err = output.err});
    };

    while (out_fd_ >= 0 || err_fd_ >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline_ - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) return timed_out();

        pollfd fds[2];
        int nfds = 0;
        if (out_fd_ >= 0) fds[nfds++] = {.fd = out_fd_, .events = POLLIN, .revents = 0};
        if (err_fd_ >= 0) fds[nfds++] = {.fd = err_fd_, .events = POLLIN, .revents = 0};

        int rc = ::poll(fds, nfds, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            kill_and_reap();
            close_pipes();
            state_ = ProcessState::Failed;
            return std::unexpected(ProcessError{
                .kind = ProcessError::Kind::Io, .code = saved,
                .message = std::string("poll() failed: ") + std::strerror(saved)});
        }
        if (rc == 0) continue;

        for (int i = 0; i < nfds; i++) {
            if (fds[i].revents == 0) continue;
            bool is_out = fds[i].fd == out_fd_;
            ssize_t len = ::read(fds[i].fd, buf, sizeof(buf));
            if (len > 0) {
                (is_out ? output.out : output.err).append(buf, static_cast<size_t>(len));
            } else if (len == 0 || errno != EINTR) {
                close_fd(is_out ? out_fd_ : err_fd_);
            }
        }
    }

    // Pipes closed; the child is exiting. Reap it without passing the deadline.
    int status = 0;
    while (true) {
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_) break;
        if (r < 0 && errno != EINTR) {
            int saved = errno;
            state_ = ProcessState::Failed;
            return std::unexpected(ProcessError{
                .kind = ProcessError::Kind::Io, .code = saved,
                .message = std::string("waitpid() failed: ") + std::strerror(saved)});
        }
        if (std::chrono::steady_clock::now() >= deadline_) return timed_out();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (WIFSIGNALED(status)) {
        state_ = ProcessState::Failed;
        int sig = WTERMSIG(status);
        return std::unexpected(ProcessError{
            .kind = ProcessError::Kind::Signal, .code = sig,
            .message = options_.argv[0] + " killed by signal " + std::to_string(sig),
            .err = output.err});
    }

    state_ = ProcessState::Exited;
    output.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return output;
}

std::expected<ProcessOutput, ProcessError> ManagedProcess::run(ProcessOptions options) {
    ManagedProcess proc(std::move(options));
    auto started = proc.start();
    if (!started) return std::unexpected(started.error());
    return proc.wait();
}

void ManagedProcess::kill_and_reap() {
    if (pid_ <= 0) return;
    ::kill(-pid_, SIGKILL);
    ::kill(pid_, SIGKILL);
    while (::waitpid(pid_, nullptr, 0) < 0) {
        if (errno != EINTR) break;
    }
}

void ManagedProcess::close_pipes() {
    close_fd(out_fd_);
    close_fd(err_fd_);
}
