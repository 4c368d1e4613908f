#pragma once
#include <string>
#include <vector>
#include <map>
#include <deque>
#include <mutex>
#include <thread>
#include <atomic>
#include <sys/types.h>

namespace switchboard {

// A spawned server process. stdout and stderr share one pipe that a drain
// thread reads into a bounded ring of recent lines.
class ChildProcess {
public:
    explicit ChildProcess(std::string tag, size_t max_lines = 200);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Throws std::runtime_error when pipes or fork fail. An exec failure shows
    // up as an early exit with code 127.
    void spawn(const std::vector<std::string>& argv,
               const std::map<std::string, std::string>& env,
               const std::string& cwd);

    bool running();
    int exit_code() const { return exit_code_; }

    // SIGTERM to the process group, wait up to grace_ms, then SIGKILL.
    // Idempotent.
    void terminate(int grace_ms);

    std::vector<std::string> recent_output() const;

private:
    std::string tag_;
    size_t max_lines_;
    pid_t pid_ = -1;
    int out_fd_ = -1;
    int exit_code_ = -1;
    bool reaped_ = false;
    std::mutex proc_mutex_;

    std::thread drain_thread_;
    std::atomic<bool> draining_{false};
    mutable std::mutex output_mutex_;
    std::deque<std::string> lines_;

    void drain_loop();
    void push_line(const std::string& line);
    bool reap(bool block);
    bool group_alive() const;
};

} // namespace switchboard
