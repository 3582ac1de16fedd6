#pragma once

#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include "broadcaster.hpp"
#include "browser_buffer.hpp"
#include "command_history.hpp"
#include "remote_shell.hpp"

// Outcome of Session::enqueue(). Either the command was admitted and
// `result` will become ready when it finishes, or `code` says why not.
struct Submission {
    ErrorCode code = ErrorCode::NONE;
    std::string error;
    std::string command_id;
    std::vector<BrowserCommandEntry> browser_commands;  // BROWSER_COMMANDS_EXECUTED only
    std::future<CommandResult> result;

    bool accepted() const { return code == ErrorCode::NONE; }
    bool retry_allowed() const { return is_retry_allowed(code); }
};

// One named remote shell shared by the human (USER) and agent (CLAUDE)
// sides.
//
// Commands run strictly one at a time, in admission order, on a dedicated
// worker thread. Everything mutable (queue, in-flight command, browser
// buffer, history, status) is guarded by mutex_. The worker never holds
// mutex_ while the remote command runs or while listeners are called.
//
//   IDLE --(queue non-empty)--> EXECUTING --(result)--> IDLE
//   IDLE | EXECUTING --(close)--> CLOSED
//
// The worker is always joined, never detached. A Session must therefore be
// destroyed off its own worker thread; SessionRegistry takes care of that
// for sessions closed from inside a listener.
class Session {
public:
    Session(ConnectionConfig config, std::unique_ptr<RemoteShell> shell,
            EngineSettings settings = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void start();

    // Admission + cross-protocol gate. Never blocks on the remote.
    Submission enqueue(const std::string& command, CommandOptions options = {});

    // Fail the in-flight and every queued command with SESSION_DISCONNECTED,
    // announce the disconnect and close the shell, then wait for the worker
    // to exit. Called from the worker itself (an output or history listener)
    // it returns without waiting; the owner must join() from another thread.
    void close();

    // Wait for the worker to exit. Does nothing on the worker thread.
    void join();

    bool on_worker_thread() const;

    // ── Terminal control ───────────────────────────────────────

    // Ctrl-C the in-flight command, only if `source` issued it.
    Result<void> interrupt(CommandSource source);

    // SIGINT, SIGTERM, SIGQUIT or SIGTSTP to whatever is running.
    Result<void> send_signal(const std::string& signal);

    Result<void> resize(int cols, int rows);

    // ── Observation ────────────────────────────────────────────

    ListenerId add_output_listener(OutputListener listener);
    bool remove_output_listener(ListenerId id);

    uint64_t add_history_listener(HistoryListener listener);
    bool remove_history_listener(uint64_t id);

    // Send text that did not come from a command (banner, notices).
    void broadcast_system(const std::string& text);

    // Check the transport while idle and record what it reports.
    ConnectionStatus check_connectivity();

    SessionInfo info() const;
    std::vector<CommandHistoryEntry> history() const;
    std::vector<BrowserCommandEntry> browser_buffer() const;
    void clear_browser_buffer();
    std::optional<CommandSource> in_flight_source() const;
    size_t queue_depth() const;
    std::string cwd() const;
    bool closed() const;

    const std::string& name() const { return config_.name; }
    const std::string& host() const { return config_.host; }
    const std::string& username() const { return config_.username; }

private:
    struct QueuedCommand {
        std::string command;
        CommandOptions options;
        int64_t enqueued_at;
        std::promise<CommandResult> promise;
    };

    ConnectionConfig config_;
    EngineSettings settings_;
    std::unique_ptr<RemoteShell> shell_;
    OutputBroadcaster broadcaster_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<QueuedCommand> queue_;
    std::optional<QueuedCommand> in_flight_;
    BrowserCommandBuffer buffer_;
    CommandHistory history_;
    ConnectionStatus status_ = ConnectionStatus::CONNECTED;
    int64_t last_activity_;
    std::optional<std::string> error_detail_;
    std::optional<int64_t> error_timestamp_;
    std::string cwd_;
    std::string home_;
    bool closed_ = false;

    std::mutex join_mutex_;
    std::thread worker_;
    std::thread::id worker_id_;

    void worker_loop();
    void execute(const std::string& command, const CommandOptions& options,
                 const std::string& cwd, const std::string& home, int64_t started_at);
    void emit(const std::string& content, const CommandOptions& options);
};
