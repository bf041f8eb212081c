#pragma once

#include <string>
#include <vector>

namespace platform {

// Child process started by spawn(). Move-only; a child that was never
// waited on is terminated when its handle is destroyed.
class ProcessHandle {
public:
    ProcessHandle() = default;
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    bool valid() const { return pid_ > 0; }
    int pid() const { return pid_; }

    // Exit code, 128+signal when killed by a signal, -1 if not running.
    int wait();

    // SIGTERM, then SIGKILL after 2s.
    void terminate();

private:
    int pid_ = -1;
    friend ProcessHandle spawn(const std::vector<std::string>& argv);
};

// Start argv[0] (looked up on PATH) with inherited stdio. Invalid handle
// if fork() fails; an exec failure shows up as exit code 127.
ProcessHandle spawn(const std::vector<std::string>& argv);

// spawn() + wait(), with SIGINT and SIGQUIT ignored in the caller while
// the child runs, so a terminal interrupt stops the child and the caller
// still gets to clean up (release its lock). Returns 127 if the program
// could not be started.
int run_command(const std::vector<std::string>& argv);

} // namespace platform
