#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include <sys/types.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace capture_bench {

// Where the child's standard streams go. An empty path keeps the stream
// of the parent.
struct ProcessOptions {
    std::string stdin_path = "/dev/null";
    std::string stdout_path = "/dev/null";
    std::string stderr_path = "/dev/null";
};

struct ExitStatus {
    bool exited = false;        // terminated through exit()
    int exit_code = -1;
    bool signaled = false;      // terminated by a signal
    int signal_number = 0;
    bool timed_out = false;     // killed because a bounded wait expired

    bool success() const {
        return exited && exit_code == 0 && !timed_out;
    }

    // "exit status 1", "killed by signal 9", "timed out after 20s"...
    std::string describe() const;
};

// A child process that is always terminated and reaped by its owner.
//
// The destructor sends SIGTERM (then SIGKILL) to a child that is still
// running and waits for it, so every exit path releases the process.
class Subprocess {
    // Restricts construction to spawn() while still allowing make_unique
    struct Token {
        explicit Token() = default;
    };

public:
    Subprocess(Token, pid_t pid);
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    // Fork and exec argv[0] (searched on PATH). Descriptors other than the
    // three standard streams are not passed on. Returns nullptr and fills
    // error_message if the program could not be started.
    static std::unique_ptr<Subprocess> spawn(const std::vector<std::string>& argv,
                                             const ProcessOptions& options,
                                             std::string& error_message);

    // Absolute path of an executable, searching PATH for bare names
    static std::optional<std::string> findExecutable(const std::string& name);

    pid_t pid() const { return pid_; }

    // True until the child has exited and been reaped
    bool running();

    // Wait for the child. If it is still running after the timeout it is
    // terminated and the result has timed_out set.
    ExitStatus waitFor(std::chrono::milliseconds timeout);

    // Wait without a bound
    ExitStatus wait();

    // SIGTERM, then SIGKILL if the child is still alive after the grace
    // period. Tolerates a child that already exited.
    ExitStatus terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

private:
    // waitpid() with the given options; true once the child is reaped
    bool reap(int options);

    pid_t pid_;
    bool reaped_ = false;
    ExitStatus status_;
};

} // namespace capture_bench

#endif // SUBPROCESS_HPP
