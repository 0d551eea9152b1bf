#include "sidecar/child_process.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr std::chrono::milliseconds kKillTimeout{2000};
constexpr std::chrono::milliseconds kPollStep{50};

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

ChildProcess::SpawnResult ChildProcess::spawn(const std::string& program,
                                              const std::vector<std::string>& args,
                                              const std::string& working_dir) {
    SpawnResult result;

    // Exec-status pipe: closed by a successful exec, carries errno otherwise
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    int read_fd = fds[0];
    int write_fd = fds[1];

    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        close_fd(read_fd);
        close_fd(write_fd);
        return result;
    }

    if (pid == 0) {
        // Child process
        close(read_fd);

        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }

        // Own process group so terminal signals meant for the shell skip it
        setpgid(0, 0);

        int err = 0;
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            err = errno;
        } else {
            execvp(program.c_str(), const_cast<char* const*>(argv.data()));
            err = errno;
        }

        // exec failed: report errno to the parent
        ssize_t n = write(write_fd, &err, sizeof(err));
        (void)n;
        _exit(127);
    }

    // Parent process
    close_fd(write_fd);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(read_fd, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(read_fd);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        // Reap the failed child so it does not linger as a zombie
        int status;
        waitpid(pid, &status, 0);
        result.error = program + ": " + std::strerror(child_errno);
        return result;
    }

    result.child.reset(new ChildProcess(pid));
    return result;
}

ChildProcess::~ChildProcess() {
    terminate();
}

void ChildProcess::record_status(int status) {
    reaped_ = true;
    exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

bool ChildProcess::is_alive() {
    if (reaped_ || pid_ <= 0) return false;

    int status;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        record_status(status);
        return false;
    }
    if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing left to own
        reaped_ = true;
        return false;
    }
    return true;
}

bool ChildProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (!is_alive()) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(kPollStep);
    }
}

bool ChildProcess::signal_group(int sig) {
    // The child leads its own group; workers it forked share the group id
    if (kill(-pid_, sig) == 0) return true;
    if (errno != ESRCH) {
        spdlog::error("[Process] Failed to signal group {}: {}", pid_, std::strerror(errno));
    }
    return false;
}

void ChildProcess::reap_stragglers() {
    if (pid_ <= 0 || group_cleared_) return;
    // A group id is not reused while any member is alive
    if (kill(-pid_, 0) == 0) {
        spdlog::warn("[Process] Killing processes left in group {}", pid_);
        signal_group(SIGKILL);
    }
    group_cleared_ = true;
}

bool ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (!is_alive()) {
        reap_stragglers();
        return true;
    }
    if (abandoned_) return false;

    if (signal_group(SIGTERM) && wait_for_exit(grace)) {
        spdlog::debug("[Process] pid {} exited after SIGTERM", pid_);
        reap_stragglers();
        return true;
    }

    // Force kill if still running
    signal_group(SIGKILL);
    if (wait_for_exit(kKillTimeout)) {
        spdlog::warn("[Process] pid {} killed after {} ms grace", pid_, grace.count());
        reap_stragglers();
        return true;
    }

    spdlog::error("[Process] pid {} did not exit after SIGKILL, giving up", pid_);
    abandoned_ = true;
    return false;
}
