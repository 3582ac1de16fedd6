#pragma once

#include <engine/remote_shell.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

// In-process stand-in for a persistent remote shell. Understands a handful
// of commands (cd, pwd, export, echo, whoami, ls, true, false, block, drop)
// and keeps cwd and environment across run() calls like a real shell.
//
//   block  - waits for a release() token, Ctrl-C or close()
//   drop   - the transport dies mid-command
class FakeShell : public RemoteShell {
public:
    explicit FakeShell(std::string user = "alice", std::string home = "")
        : user_(std::move(user)),
          home_(home.empty() ? "/home/" + user_ : std::move(home)),
          cwd_(home_) {}

    ShellResult run(const std::string& command, const ChunkCallback& on_chunk) override {
        int now_active = ++active_;
        if (now_active > max_active_) max_active_ = now_active;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            started_.push_back(command);
        }
        cv_.notify_all();

        ShellResult result = execute(command, on_chunk);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_.push_back(command);
        }
        --active_;
        cv_.notify_all();
        return result;
    }

    bool send_control(char c) override {
        std::lock_guard<std::mutex> lock(mutex_);
        controls_.push_back(c);
        if (c == '\x03' || c == '\x04') interrupted_ = true;
        cv_.notify_all();
        return true;
    }

    bool resize(int cols, int rows) override {
        cols_ = cols;
        rows_ = rows;
        return true;
    }

    ConnectionStatus check_connectivity() override { return connectivity_; }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

    std::string banner() const override {
        return "Last login: Mon Oct 19 09:00:00 2026\r\n[" + user_ + "@fake ~]$ ";
    }

    std::string cwd() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return cwd_;
    }

    std::string home() const override { return home_; }

    // ── Test controls ──────────────────────────────────────────

    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        releases_++;
        cv_.notify_all();
    }

    // Wait until `count` commands have started (false on timeout)
    bool wait_started(size_t count, int timeout_ms = 2000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [&] { return started_.size() >= count; });
    }

    std::vector<std::string> started() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_;
    }

    std::vector<std::string> finished() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return finished_;
    }

    std::vector<char> controls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return controls_;
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    int max_active() const { return max_active_; }
    int cols() const { return cols_; }
    int rows() const { return rows_; }
    void set_connectivity(ConnectionStatus s) { connectivity_ = s; }

private:
    std::string user_;
    std::string home_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::string cwd_;
    std::map<std::string, std::string> env_;
    std::vector<std::string> started_;
    std::vector<std::string> finished_;
    std::vector<char> controls_;
    int releases_ = 0;
    bool interrupted_ = false;
    bool closed_ = false;
    std::atomic<int> active_{0};
    std::atomic<int> max_active_{0};
    std::atomic<int> cols_{0};
    std::atomic<int> rows_{0};
    std::atomic<ConnectionStatus> connectivity_{ConnectionStatus::CONNECTED};

    ShellResult ok(const std::string& output, const ChunkCallback& on_chunk, int exit_code = 0) {
        // Split the output to exercise chunk boundaries
        if (on_chunk && !output.empty()) {
            size_t half = output.size() / 2;
            if (half > 0) on_chunk(output.substr(0, half));
            on_chunk(output.substr(half));
        }
        ShellResult r;
        r.exit_code = exit_code;
        r.output = output;
        r.home = home_;
        std::lock_guard<std::mutex> lock(mutex_);
        r.cwd = cwd_;
        return r;
    }

    ShellResult transport_error(const std::string& message) {
        ShellResult r;
        r.error = message;
        return r;
    }

    ShellResult execute(const std::string& command, const ChunkCallback& on_chunk) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return transport_error("Shell channel closed");
        }

        std::istringstream iss(command);
        std::string verb;
        iss >> verb;
        std::string rest;
        std::getline(iss, rest);
        if (!rest.empty() && rest[0] == ' ') rest.erase(0, 1);

        if (verb == "pwd") {
            return ok(cwd() + "\n", on_chunk);
        }
        if (verb == "cd") {
            std::lock_guard<std::mutex> lock(mutex_);
            if (rest.empty()) {
                cwd_ = home_;
            } else if (rest[0] == '/') {
                cwd_ = rest;
            } else {
                cwd_ = cwd_ + "/" + rest;
            }
            ShellResult r;
            r.exit_code = 0;
            r.cwd = cwd_;
            r.home = home_;
            return r;
        }
        if (verb == "export") {
            auto eq = rest.find('=');
            {
                std::lock_guard<std::mutex> lock(mutex_);
                env_[rest.substr(0, eq)] = eq == std::string::npos ? "" : rest.substr(eq + 1);
            }
            return ok("", on_chunk);
        }
        if (verb == "echo") {
            if (!rest.empty() && rest[0] == '$') {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = env_.find(rest.substr(1));
                rest = it == env_.end() ? "" : it->second;
            }
            return ok(rest + "\n", on_chunk);
        }
        if (verb == "whoami") return ok(user_ + "\n", on_chunk);
        if (verb == "ls") return ok("notes.txt\r\nsrc\r\n", on_chunk);
        if (verb == "true") return ok("", on_chunk);
        if (verb == "false") return ok("", on_chunk, 1);
        if (verb == "drop") return transport_error("Remote shell exited");
        if (verb == "block") {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&] { return closed_ || interrupted_ || releases_ > 0; });
            if (closed_) return transport_error("Shell channel closed");
            bool was_interrupted = interrupted_;
            if (was_interrupted) {
                interrupted_ = false;
            } else {
                releases_--;
            }
            lock.unlock();
            if (was_interrupted) return ok("^C\n", on_chunk, 130);
            return ok("released\n", on_chunk);
        }
        return ok("bash: " + verb + ": command not found\n", on_chunk, 127);
    }
};

// Hands out FakeShells; hosts listed in `failures` fail with that code and
// sessions listed in `homes` get that home directory.
class FakeConnector : public ShellConnector {
public:
    ShellConnection connect(const ConnectionConfig& config, StatusCallback callback) override {
        if (callback) callback("Connecting to " + config.host + "...");
        connects++;
        auto it = failures.find(config.host);
        if (it != failures.end()) {
            return ShellConnection{it->second, "simulated failure for " + config.host, nullptr};
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto home = homes.find(config.name);
        auto shell = std::make_unique<FakeShell>(config.username,
                                                 home == homes.end() ? "" : home->second);
        shells[config.name] = shell.get();
        return ShellConnection{ErrorCode::NONE, "", std::move(shell)};
    }

    // Owned by the session; valid while the session is alive
    FakeShell* shell(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = shells.find(name);
        return it == shells.end() ? nullptr : it->second;
    }

    std::map<std::string, ErrorCode> failures;
    std::map<std::string, std::string> homes;
    std::map<std::string, FakeShell*> shells;
    int connects = 0;

private:
    std::mutex mutex_;
};

inline ConnectionConfig test_config(const std::string& name, const std::string& host = "fake") {
    ConnectionConfig c;
    c.name = name;
    c.host = host;
    c.username = "alice";
    c.password = "secret";
    return c;
}

// Wait for a command future without hanging the suite
template <typename T>
bool ready_within(std::future<T>& f, int timeout_ms = 2000) {
    return f.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::ready;
}
