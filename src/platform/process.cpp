#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <cerrno>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::~ProcessHandle() {
    if (valid()) terminate();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept : pid_(other.pid_) {
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        if (valid()) terminate();
        pid_ = other.pid_;
        other.pid_ = -1;
    }
    return *this;
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return -1;
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    pid_ = -1;
    if (ret < 0) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void ProcessHandle::terminate() {
    if (pid_ <= 0) return;
    kill(pid_, SIGTERM);
    for (int i = 0; i < 20; i++) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            pid_ = -1;
            return;
        }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    pid_ = -1;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::vector<std::string>& argv) {
    ProcessHandle handle;
    if (argv.empty()) return handle;

    // Build argv before forking; only async-signal-safe calls in the child
    std::vector<const char*> c_argv;
    for (const auto& a : argv) c_argv.push_back(a.c_str());
    c_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) return handle;

    if (pid == 0) {
        signal(SIGINT, SIG_DFL);
        signal(SIGQUIT, SIG_DFL);
        execvp(c_argv[0], const_cast<char* const*>(c_argv.data()));
        _exit(EXIT_SPAWN_FAILED);
    }

    handle.pid_ = pid;
    return handle;
}

namespace {

// Ignores SIGINT/SIGQUIT for its lifetime, restoring the previous actions.
class InterruptShield {
public:
    InterruptShield() {
        struct sigaction ignore = {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        sigaction(SIGINT, &ignore, &saved_int_);
        sigaction(SIGQUIT, &ignore, &saved_quit_);
    }

    ~InterruptShield() {
        sigaction(SIGINT, &saved_int_, nullptr);
        sigaction(SIGQUIT, &saved_quit_, nullptr);
    }

    InterruptShield(const InterruptShield&) = delete;
    InterruptShield& operator=(const InterruptShield&) = delete;

private:
    struct sigaction saved_int_ = {};
    struct sigaction saved_quit_ = {};
};

} // namespace

int run_command(const std::vector<std::string>& argv) {
    InterruptShield shield;
    auto handle = spawn(argv);
    if (!handle.valid()) return EXIT_SPAWN_FAILED;
    return handle.wait();
}

} // namespace platform
