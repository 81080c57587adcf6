#pragma once
#include <sys/types.h>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// A single child process started with fork/exec. Unlike popen() it can be
// signalled, waited on with a deadline and read from without a shell.
class Subprocess {
public:
    Subprocess() = default;
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    // argv[0] is looked up in PATH. stdout is piped back when capture_stdout
    // is set, otherwise discarded; stderr goes to stderr_path (or /dev/null).
    bool start(const std::vector<std::string>& argv,
               bool capture_stdout = false,
               const std::string& stderr_path = std::string());

    // Blocking read from the child's stdout. Returns 0 on EOF.
    ssize_t read_stdout(void* buf, size_t n);

    // Sends SIGTERM. Safe to call from another thread while wait*() blocks.
    void terminate();

    // Exit status (128 + signal when killed), or nullopt on timeout.
    std::optional<int> wait_for(std::chrono::milliseconds timeout);
    int wait();

    bool running() const;
    int exit_code() const;  // -1 until the child has been reaped

    static std::string describe(const std::vector<std::string>& argv);

private:
    std::optional<int> reap();  // non-blocking
    void close_stdout();

    mutable std::mutex m_;
    pid_t pid_ = -1;
    int out_fd_ = -1;
    int exit_code_ = -1;
    bool terminated_ = false;
};
