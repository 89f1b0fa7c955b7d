#include "process/subprocess.hpp"
#include <sys/wait.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

namespace capture_bench {

namespace {

// Poll interval of bounded waits
constexpr std::chrono::milliseconds kPollInterval(20);

// Exit code of a child whose exec failed
constexpr int kExecFailedCode = 127;

// Only async-signal-safe calls between fork() and exec()
[[noreturn]] void failChild(int report_fd) {
    int err = errno;
    ssize_t written = ::write(report_fd, &err, sizeof(err));
    (void)written;
    _exit(kExecFailedCode);
}

void redirect(const char* path, int flags, int target_fd, int report_fd) {
    if (path[0] == '\0') {
        return;
    }
    int fd = ::open(path, flags, 0644);
    if (fd < 0) {
        failChild(report_fd);
    }
    if (fd != target_fd) {
        if (::dup2(fd, target_fd) < 0) {
            failChild(report_fd);
        }
        ::close(fd);
    }
}

// Close every descriptor above stderr except the exec report pipe
void closeInheritedFds(int keep_fd, long max_fd) {
    const unsigned int keep = static_cast<unsigned int>(keep_fd);
    const bool closed = (keep <= 3 || ::close_range(3, keep - 1, 0) == 0) &&
                        ::close_range(std::max(keep + 1, 3u), ~0U, 0) == 0;
    if (closed) {
        return;
    }
    for (long fd = 3; fd < max_fd; fd++) {
        if (fd != keep_fd) {
            ::close(static_cast<int>(fd));
        }
    }
}

} // namespace

std::string ExitStatus::describe() const {
    std::ostringstream oss;
    if (timed_out) {
        oss << "timed out";
    } else if (exited) {
        oss << "exit status " << exit_code;
    } else if (signaled) {
        oss << "killed by signal " << signal_number << " (" << strsignal(signal_number) << ")";
    } else {
        oss << "still running";
    }
    return oss.str();
}

Subprocess::Subprocess(Token, pid_t pid) : pid_(pid) {
}

Subprocess::~Subprocess() {
    if (!reaped_) {
        terminate();
    }
}

std::unique_ptr<Subprocess> Subprocess::spawn(const std::vector<std::string>& argv,
                                              const ProcessOptions& options,
                                              std::string& error_message) {
    if (argv.empty()) {
        error_message = "empty command line";
        return nullptr;
    }

    // Build everything the child needs before forking
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    const bool shared_output = options.stdout_path == options.stderr_path;
    const int write_flags = O_WRONLY | O_CREAT | O_TRUNC;
    const long max_fd = ::sysconf(_SC_OPEN_MAX);

    // Reports the child's errno if exec fails; closed by a successful exec
    int report_pipe[2];
    if (::pipe2(report_pipe, O_CLOEXEC) < 0) {
        error_message = "pipe2 failed: " + std::string(std::strerror(errno));
        return nullptr;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        error_message = "fork failed: " + std::string(std::strerror(errno));
        ::close(report_pipe[0]);
        ::close(report_pipe[1]);
        return nullptr;
    }

    if (pid == 0) {
        ::close(report_pipe[0]);
        closeInheritedFds(report_pipe[1], max_fd > 0 ? max_fd : 1024);
        redirect(options.stdin_path.c_str(), O_RDONLY, STDIN_FILENO, report_pipe[1]);
        redirect(options.stdout_path.c_str(), write_flags, STDOUT_FILENO, report_pipe[1]);
        if (shared_output && !options.stdout_path.empty()) {
            if (::dup2(STDOUT_FILENO, STDERR_FILENO) < 0) {
                failChild(report_pipe[1]);
            }
        } else {
            redirect(options.stderr_path.c_str(), write_flags, STDERR_FILENO, report_pipe[1]);
        }
        ::execvp(args[0], args.data());
        failChild(report_pipe[1]);
    }

    ::close(report_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(report_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(report_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        error_message = "failed to start " + argv[0] + ": " + std::strerror(child_errno);
        return nullptr;
    }

    return std::make_unique<Subprocess>(Token(), pid);
}

std::optional<std::string> Subprocess::findExecutable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) {
            return name;
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string search_path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    std::istringstream dirs(search_path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }

    return std::nullopt;
}

bool Subprocess::reap(int options) {
    if (reaped_) {
        return true;
    }

    int status = 0;
    pid_t ret;
    do {
        ret = ::waitpid(pid_, &status, options);
    } while (ret < 0 && errno == EINTR);

    if (ret == 0) {
        return false;
    }

    reaped_ = true;
    if (ret < 0) {
        // Already reaped elsewhere (ECHILD); nothing more to learn
        return true;
    }

    if (WIFEXITED(status)) {
        status_.exited = true;
        status_.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        status_.signaled = true;
        status_.signal_number = WTERMSIG(status);
    }
    return true;
}

bool Subprocess::running() {
    return !reap(WNOHANG);
}

ExitStatus Subprocess::waitFor(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (!reap(WNOHANG)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            terminate();
            status_.timed_out = true;
            return status_;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    return status_;
}

ExitStatus Subprocess::wait() {
    reap(0);
    return status_;
}

ExitStatus Subprocess::terminate(std::chrono::milliseconds grace) {
    if (reap(WNOHANG)) {
        return status_;
    }

    ::kill(pid_, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (!reap(WNOHANG)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            ::kill(pid_, SIGKILL);
            reap(0);
            break;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    return status_;
}

} // namespace capture_bench
