#include "subprocess.hpp"
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <thread>

static int open_or_null(const std::string& path) {
    if (!path.empty()) {
        int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd >= 0) return fd;
    }
    return open("/dev/null", O_RDWR | O_CLOEXEC);
}

Subprocess::~Subprocess() {
    if (running()) {
        terminate();
        if (!wait_for(std::chrono::seconds(2))) {
            std::lock_guard<std::mutex> lk(m_);
            if (pid_ > 0) kill(pid_, SIGKILL);
        }
        wait_for(std::chrono::seconds(1));
    }
    close_stdout();
}

bool Subprocess::start(const std::vector<std::string>& argv, bool capture_stdout,
                       const std::string& stderr_path) {
    if (argv.empty()) return false;
    std::lock_guard<std::mutex> lk(m_);
    if (pid_ > 0) return false;
    close_stdout();
    terminated_ = false;
    exit_code_ = -1;

    int out_pipe[2] = {-1, -1};
    if (capture_stdout && pipe2(out_pipe, O_CLOEXEC) < 0) { perror("pipe"); return false; }

    // Reports exec failure back to the parent; closes itself on success.
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        perror("pipe");
        if (capture_stdout) { close(out_pipe[0]); close(out_pipe[1]); }
        return false;
    }

    std::vector<char*> args;
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int err_fd = open_or_null(stderr_path);
    int null_fd = open("/dev/null", O_RDWR | O_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        perror("fork");
        close(err_pipe[0]); close(err_pipe[1]);
        if (capture_stdout) { close(out_pipe[0]); close(out_pipe[1]); }
        if (err_fd >= 0) close(err_fd);
        if (null_fd >= 0) close(null_fd);
        return false;
    }

    if (pid == 0) {
        // The daemon blocks SIGINT/SIGTERM for sigwait; children must not inherit that.
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        signal(SIGPIPE, SIG_DFL);
        dup2(null_fd, STDIN_FILENO);
        dup2(capture_stdout ? out_pipe[1] : null_fd, STDOUT_FILENO);
        dup2(err_fd, STDERR_FILENO);
        execvp(args[0], args.data());
        int e = errno;
        ssize_t ignored = write(err_pipe[1], &e, sizeof(e));
        (void)ignored;
        _exit(127);
    }

    close(err_pipe[1]);
    if (err_fd >= 0) close(err_fd);
    if (null_fd >= 0) close(null_fd);
    if (capture_stdout) close(out_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do { n = read(err_pipe[0], &child_errno, sizeof(child_errno)); } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    if (n > 0) {
        fprintf(stderr, "exec %s: %s\n", argv[0].c_str(), strerror(child_errno));
        int status;
        waitpid(pid, &status, 0);
        if (capture_stdout) close(out_pipe[0]);
        return false;
    }

    pid_ = pid;
    out_fd_ = capture_stdout ? out_pipe[0] : -1;
    return true;
}

ssize_t Subprocess::read_stdout(void* buf, size_t n) {
    if (out_fd_ < 0) return 0;
    ssize_t r;
    do { r = read(out_fd_, buf, n); } while (r < 0 && errno == EINTR);
    return r < 0 ? 0 : r;
}

void Subprocess::terminate() {
    std::lock_guard<std::mutex> lk(m_);
    if (pid_ > 0 && !terminated_) {
        kill(pid_, SIGTERM);
        terminated_ = true;
    }
}

std::optional<int> Subprocess::reap() {
    std::lock_guard<std::mutex> lk(m_);
    if (pid_ <= 0) return std::nullopt;
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == 0) return std::nullopt;
    pid_ = -1;
    exit_code_ = -1;
    if (r > 0 && WIFEXITED(status)) exit_code_ = WEXITSTATUS(status);
    else if (r > 0 && WIFSIGNALED(status)) exit_code_ = 128 + WTERMSIG(status);
    return exit_code_;
}

std::optional<int> Subprocess::wait_for(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (!running()) return exit_code();
        if (auto code = reap()) return code;
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

int Subprocess::wait() {
    while (true) {
        if (auto code = wait_for(std::chrono::seconds(1))) return *code;
    }
}

bool Subprocess::running() const {
    std::lock_guard<std::mutex> lk(m_);
    return pid_ > 0;
}

int Subprocess::exit_code() const {
    std::lock_guard<std::mutex> lk(m_);
    return exit_code_;
}

void Subprocess::close_stdout() {
    if (out_fd_ >= 0) { close(out_fd_); out_fd_ = -1; }
}

std::string Subprocess::describe(const std::vector<std::string>& argv) {
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i) oss << ' ';
        oss << argv[i];
    }
    return oss.str();
}
