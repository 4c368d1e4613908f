#include "child_process.hpp"
#include <iostream>
#include <stdexcept>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

namespace switchboard {

ChildProcess::ChildProcess(std::string tag, size_t max_lines)
    : tag_(std::move(tag)), max_lines_(max_lines) {}

ChildProcess::~ChildProcess() {
    terminate(0);
}

void ChildProcess::spawn(const std::vector<std::string>& argv,
                         const std::map<std::string, std::string>& env,
                         const std::string& cwd) {
    if (argv.empty()) {
        throw std::runtime_error("No command specified");
    }
    if (pid_ > 0) {
        throw std::runtime_error("Process already spawned");
    }

    int pipe_out[2];
    if (pipe(pipe_out) != 0) {
        throw std::runtime_error(std::string("Failed to create pipe: ") + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(pipe_out[0]);
        close(pipe_out[1]);
        throw std::runtime_error(std::string("Fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child process
        close(pipe_out[0]);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(pipe_out[1], STDOUT_FILENO);
        dup2(pipe_out[1], STDERR_FILENO);
        close(pipe_out[1]);
        setpgid(0, 0);

        for (auto& [k, v] : env) {
            setenv(k.c_str(), v.c_str(), 1);
        }
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            std::string msg = "cannot chdir to " + cwd + ": " + std::strerror(errno) + "\n";
            ssize_t ignored = write(STDERR_FILENO, msg.c_str(), msg.size());
            (void)ignored;
            _exit(126);
        }

        std::vector<const char*> args;
        for (auto& a : argv) args.push_back(a.c_str());
        args.push_back(nullptr);
        execvp(args[0], const_cast<char* const*>(args.data()));

        std::string msg = "exec " + argv[0] + " failed: " + std::strerror(errno) + "\n";
        ssize_t ignored = write(STDERR_FILENO, msg.c_str(), msg.size());
        (void)ignored;
        _exit(127);
    }

    // Parent process. Both sides set the group so it exists before any signal.
    setpgid(pid, pid);
    close(pipe_out[1]);
    pid_ = pid;
    out_fd_ = pipe_out[0];
    exit_code_ = -1;
    reaped_ = false;
    draining_ = true;
    drain_thread_ = std::thread([this]() { drain_loop(); });
}

bool ChildProcess::reap(bool block) {
    std::lock_guard<std::mutex> lock(proc_mutex_);
    if (pid_ <= 0 || reaped_) return true;
    int status = 0;
    pid_t r = waitpid(pid_, &status, block ? 0 : WNOHANG);
    if (r == 0) return false;
    reaped_ = true;
    if (r == pid_) {
        if (WIFEXITED(status)) exit_code_ = WEXITSTATUS(status);
        else if (WIFSIGNALED(status)) exit_code_ = 128 + WTERMSIG(status);
    }
    return true;
}

bool ChildProcess::running() {
    return !reap(false);
}

// The child leads its own process group; wrappers such as `sh -c` keep the
// real server in that group, so signals go to the whole group.
bool ChildProcess::group_alive() const {
    return pid_ > 0 && (kill(-pid_, 0) == 0 || errno == EPERM);
}

void ChildProcess::terminate(int grace_ms) {
    if (pid_ > 0 && (!reap(false) || group_alive())) {
        if (kill(-pid_, SIGTERM) != 0) kill(pid_, SIGTERM);
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (reap(false) && !group_alive()) break;
            usleep(50000);
        }
        // Force kill whatever is left of the group
        if (!reap(false) || group_alive()) {
            std::cerr << "[" << tag_ << "] Process group " << pid_ << " ignored SIGTERM, killing\n";
            if (kill(-pid_, SIGKILL) != 0) kill(pid_, SIGKILL);
            reap(true);
        }
    }

    draining_ = false;
    if (drain_thread_.joinable()) drain_thread_.join();
    if (out_fd_ >= 0) {
        close(out_fd_);
        out_fd_ = -1;
    }
    std::lock_guard<std::mutex> lock(proc_mutex_);
    pid_ = -1;
}

std::vector<std::string> ChildProcess::recent_output() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    return {lines_.begin(), lines_.end()};
}

void ChildProcess::push_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    lines_.push_back(line);
    while (lines_.size() > max_lines_) lines_.pop_front();
}

void ChildProcess::drain_loop() {
    std::string partial;
    char buf[4096];
    pollfd pfd;
    pfd.fd = out_fd_;
    pfd.events = POLLIN;

    auto split_lines = [&]() {
        size_t start = 0;
        size_t nl;
        while ((nl = partial.find('\n', start)) != std::string::npos) {
            std::string line = partial.substr(start, nl - start);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            push_line(line);
            start = nl + 1;
        }
        partial.erase(0, start);
    };

    bool eof = false;
    while (draining_) {
        int ret = poll(&pfd, 1, 200);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) continue;

        ssize_t n = read(out_fd_, buf, sizeof(buf));
        if (n <= 0) { // EOF: every writer closed
            eof = true;
            break;
        }
        partial.append(buf, static_cast<size_t>(n));
        split_lines();
    }

    // Whatever the child wrote before exiting may still sit in the pipe.
    while (!eof && poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN)) {
        ssize_t n = read(out_fd_, buf, sizeof(buf));
        if (n <= 0) break;
        partial.append(buf, static_cast<size_t>(n));
    }
    split_lines();
    if (!partial.empty()) push_line(partial);
}

} // namespace switchboard
