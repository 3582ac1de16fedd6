#include "session.hpp"
#include "admission.hpp"
#include "transcript.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

namespace {

// A USER command cannot start while a CLAUDE command runs and vice versa.
// SYSTEM commands never collide with anything.
bool collides(CommandSource running, CommandSource incoming) {
    return (running == CommandSource::USER && incoming == CommandSource::CLAUDE) ||
           (running == CommandSource::CLAUDE && incoming == CommandSource::USER);
}

Submission rejected(ErrorCode code, const std::string& message,
                    const std::string& command_id = "") {
    Submission sub;
    sub.code = code;
    sub.error = message;
    sub.command_id = command_id;
    return sub;
}

} // namespace

Session::Session(ConnectionConfig config, std::unique_ptr<RemoteShell> shell,
                 EngineSettings settings)
    : config_(std::move(config)),
      settings_(settings),
      shell_(std::move(shell)),
      history_(settings.history_limit),
      last_activity_(now_ms()) {
    cwd_ = shell_->cwd();
    home_ = shell_->home();
}

Session::~Session() {
    bool was_closed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_closed = closed_;
        closed_ = true;
    }
    cv_.notify_all();
    if (!was_closed) shell_->close();
    join();
}

void Session::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable() || closed_) return;
    worker_ = std::thread([this] { worker_loop(); });
    worker_id_ = worker_.get_id();
}

// ── Admission ──────────────────────────────────────────────────

Submission Session::enqueue(const std::string& command, CommandOptions options) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (closed_) {
        return rejected(ErrorCode::SESSION_DISCONNECTED,
                        fmt::format("Session '{}' is disconnected", config_.name));
    }

    // Hand-off: the agent must see what the human did before it may run anything.
    if (options.source == CommandSource::CLAUDE && !buffer_.empty()) {
        Submission sub = rejected(ErrorCode::BROWSER_COMMANDS_EXECUTED,
            "User executed commands in the browser terminal; review them before retrying",
            options.command_id);
        sub.browser_commands = buffer_.drain();
        log_info("session {}: handed {} browser command(s) to the agent",
                 config_.name, sub.browser_commands.size());
        return sub;
    }

    if (in_flight_ && collides(in_flight_->options.source, options.source)) {
        log_debug("session {}: busy with a {} command, rejecting {} '{}'",
                  config_.name, source_name(in_flight_->options.source),
                  source_name(options.source), command);
        return rejected(ErrorCode::SESSION_BUSY,
            fmt::format("Session '{}' is executing a {} command; retry when it finishes",
                        config_.name, source_name(in_flight_->options.source)),
            options.command_id);
    }

    auto valid = validate_command_text(command);
    if (valid.is_err()) {
        log_debug("session {}: rejected '{}': {}", config_.name, command, valid.error);
        return rejected(valid.code, valid.error, options.command_id);
    }

    if (options.command_id.empty()) {
        options.command_id = generate_command_id();
    } else {
        auto id_ok = validate_command_id(options.command_id);
        if (id_ok.is_err()) return rejected(id_ok.code, id_ok.error);
    }

    if (queue_.size() >= settings_.max_queue_size) {
        log_warn("session {}: queue full, rejecting '{}'", config_.name, command);
        return rejected(ErrorCode::QUEUE_FULL,
            fmt::format("Command queue is full (maximum {} commands)", settings_.max_queue_size),
            options.command_id);
    }

    if (options.timeout_ms) {
        log_debug("session {}: timeout {}ms requested for {} (not enforced)",
                  config_.name, *options.timeout_ms, options.command_id);
    }

    int64_t now = now_ms();
    if (options.source == CommandSource::USER) {
        BrowserCommandEntry entry;
        entry.command = command;
        entry.command_id = options.command_id;
        entry.timestamp = now;
        entry.source = options.source;
        buffer_.append(std::move(entry));
    }

    Submission sub;
    sub.command_id = options.command_id;
    QueuedCommand queued{command, options, now, std::promise<CommandResult>()};
    sub.result = queued.promise.get_future();
    queue_.push_back(std::move(queued));

    log_info("session {}: admitted '{}' ({}, {}), {} waiting",
             config_.name, command, source_name(options.source),
             options.command_id, queue_.size());

    lock.unlock();
    cv_.notify_one();
    return sub;
}

// ── Execution ──────────────────────────────────────────────────

void Session::worker_loop() {
    for (;;) {
        std::string command;
        CommandOptions options;
        std::string cwd;
        std::string home;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
            if (closed_) return;

            in_flight_ = std::move(queue_.front());
            queue_.pop_front();
            command = in_flight_->command;
            options = in_flight_->options;
            cwd = cwd_;
            home = home_;
        }
        execute(command, options, cwd, home, now_ms());
    }
}

void Session::emit(const std::string& content, const CommandOptions& options) {
    if (content.empty()) return;
    TerminalOutputEntry entry;
    entry.session_name = config_.name;
    entry.content = content;
    entry.command_id = options.command_id;
    entry.source = options.source;
    entry.user_initiated = options.source == CommandSource::USER;
    broadcaster_.broadcast(entry);
}

void Session::execute(const std::string& command, const CommandOptions& options,
                      const std::string& cwd, const std::string& home,
                      int64_t started_at) {
    if (options.source != CommandSource::SYSTEM) {
        emit(echo_line(config_.username, config_.host, cwd, home, command), options);
    }

    CrlfNormalizer crlf;
    ShellResult shell_result = shell_->run(command, [&](const std::string& chunk) {
        emit(crlf.feed(chunk), options);
    });
    emit(crlf.finish(), options);

    int64_t finished_at = now_ms();
    std::optional<QueuedCommand> done;
    std::vector<HistoryListener> listeners;
    CommandHistoryEntry history_entry;
    CommandResult result;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        // close() already rejected this command
        if (!in_flight_) return;
        done = std::move(in_flight_);
        in_flight_.reset();

        if (shell_result.transport_failed()) {
            status_ = ConnectionStatus::ERROR;
            error_detail_ = shell_result.error;
            error_timestamp_ = finished_at;
            if (options.source == CommandSource::USER) {
                buffer_.update_result(options.command_id,
                                      CommandResult{"", shell_result.error, -1});
            }
        } else {
            result = CommandResult{clean_terminal_output(shell_result.output), "",
                                   shell_result.exit_code};
            if (!shell_result.cwd.empty()) cwd_ = shell_result.cwd;
            if (!shell_result.home.empty()) home_ = shell_result.home;
            last_activity_ = finished_at;
            if (options.source == CommandSource::USER) {
                buffer_.update_result(options.command_id, result);
            }

            history_entry = CommandHistoryEntry{
                command, started_at, finished_at - started_at, result.exit_code,
                result.success() ? HistoryStatus::SUCCESS : HistoryStatus::FAILURE,
                config_.name, options.source};
            history_.append(history_entry);
            listeners = history_.listeners();
        }
    }

    if (shell_result.transport_failed()) {
        log_error("session {}: '{}' failed: {}", config_.name, command, shell_result.error);
        done->promise.set_exception(std::make_exception_ptr(
            CommandError(ErrorCode::TRANSPORT_ERROR, shell_result.error)));
        return;
    }

    log_info("session {}: '{}' exited {} after {}ms",
             config_.name, command, result.exit_code, finished_at - started_at);

    for (const auto& listener : listeners) {
        try {
            listener(history_entry);
        } catch (const std::exception& e) {
            log_warn("session {}: history listener threw: {}", config_.name, e.what());
        }
    }
    done->promise.set_value(result);
}

// ── Lifecycle ──────────────────────────────────────────────────

void Session::close() {
    std::optional<QueuedCommand> in_flight;
    std::deque<QueuedCommand> queued;
    bool already_closed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        already_closed = closed_;
        if (!closed_) {
            closed_ = true;
            status_ = ConnectionStatus::DISCONNECTED;
            in_flight.swap(in_flight_);
            queued.swap(queue_);
            buffer_.clear();
        }
    }

    if (!already_closed) {
        cv_.notify_all();

        std::string reason = fmt::format("Session '{}' disconnected", config_.name);
        size_t rejected_count = 0;
        if (in_flight) {
            in_flight->promise.set_exception(std::make_exception_ptr(
                CommandError(ErrorCode::SESSION_DISCONNECTED, reason)));
            rejected_count++;
        }
        for (auto& cmd : queued) {
            cmd.promise.set_exception(std::make_exception_ptr(
                CommandError(ErrorCode::SESSION_DISCONNECTED, reason)));
            rejected_count++;
        }
        if (rejected_count > 0) {
            log_info("session {}: rejected {} pending command(s) on disconnect",
                     config_.name, rejected_count);
        }

        broadcast_system(fmt::format("Connection to {} closed\n", config_.host));

        // Unblocks a run() in progress
        shell_->close();
        log_info("session {}: closed", config_.name);
    }

    join();
}

void Session::join() {
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (!worker_.joinable() || on_worker_thread()) return;
    worker_.join();
}

bool Session::on_worker_thread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_id_ == std::this_thread::get_id();
}

bool Session::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

// ── Terminal control ───────────────────────────────────────────

Result<void> Session::interrupt(CommandSource source) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!in_flight_ || in_flight_->options.source != source) {
            return Result<void>::Err(ErrorCode::NO_ACTIVE_COMMAND,
                fmt::format("No {} command is running on session '{}'",
                            source_name(source), config_.name));
        }
        log_info("session {}: interrupting '{}'", config_.name, in_flight_->command);
    }
    if (!shell_->send_control('\x03')) {
        return Result<void>::Err(ErrorCode::TRANSPORT_ERROR, "Failed to send interrupt");
    }
    return Result<void>::Ok();
}

Result<void> Session::send_signal(const std::string& signal) {
    char control;
    if (signal == "SIGINT") {
        control = '\x03';
    } else if (signal == "SIGTERM" || signal == "SIGQUIT") {
        control = '\x04';
    } else if (signal == "SIGTSTP") {
        control = '\x1a';
    } else {
        return Result<void>::Err(ErrorCode::INVALID_SIGNAL,
            fmt::format("Unsupported signal '{}' (use SIGINT, SIGTERM, SIGQUIT or SIGTSTP)", signal));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Ctrl-D at an idle prompt would end the shell itself
        if (!in_flight_) {
            return Result<void>::Err(ErrorCode::NO_ACTIVE_COMMAND,
                fmt::format("No command is running on session '{}'", config_.name));
        }
    }
    if (!shell_->send_control(control)) {
        return Result<void>::Err(ErrorCode::TRANSPORT_ERROR, "Failed to send " + signal);
    }
    return Result<void>::Ok();
}

Result<void> Session::resize(int cols, int rows) {
    if (cols < 1 || rows < 1 || cols > MAX_TERM_DIMENSION || rows > MAX_TERM_DIMENSION) {
        return Result<void>::Err(ErrorCode::INVALID_DIMENSIONS,
            fmt::format("Terminal size {}x{} out of range (1-{})", cols, rows, MAX_TERM_DIMENSION));
    }
    if (closed()) {
        return Result<void>::Err(ErrorCode::SESSION_DISCONNECTED,
                                 fmt::format("Session '{}' is disconnected", config_.name));
    }
    if (!shell_->resize(cols, rows)) {
        return Result<void>::Err(ErrorCode::TRANSPORT_ERROR, "Failed to resize terminal");
    }
    return Result<void>::Ok();
}

// ── Observation ────────────────────────────────────────────────

ListenerId Session::add_output_listener(OutputListener listener) {
    return broadcaster_.add_listener(std::move(listener));
}

bool Session::remove_output_listener(ListenerId id) {
    return broadcaster_.remove_listener(id);
}

uint64_t Session::add_history_listener(HistoryListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.add_listener(std::move(listener));
}

bool Session::remove_history_listener(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.remove_listener(id);
}

void Session::broadcast_system(const std::string& text) {
    CrlfNormalizer crlf;
    std::string content = crlf.feed(text);
    content += crlf.finish();

    CommandOptions options;
    options.source = CommandSource::SYSTEM;
    emit(content, options);
}

ConnectionStatus Session::check_connectivity() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || in_flight_) return status_;
    }

    ConnectionStatus reported = shell_->check_connectivity();

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return status_;
    if (reported != status_) {
        log_info("session {}: status {} -> {}", config_.name,
                 status_name(status_), status_name(reported));
    }
    status_ = reported;
    if (reported == ConnectionStatus::CONNECTED) {
        error_detail_.reset();
        error_timestamp_.reset();
    } else if (reported == ConnectionStatus::ERROR || reported == ConnectionStatus::RECONNECTING) {
        error_detail_ = reported == ConnectionStatus::ERROR
            ? "Connection lost" : "Connection check failed, waiting for transport";
        error_timestamp_ = now_ms();
    }
    return status_;
}

SessionInfo Session::info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return SessionInfo{config_.name, config_.host, config_.username, status_,
                       last_activity_, error_detail_, error_timestamp_};
}

std::vector<CommandHistoryEntry> Session::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.entries();
}

std::vector<BrowserCommandEntry> Session::browser_buffer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.snapshot();
}

void Session::clear_browser_buffer() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.clear();
}

std::optional<CommandSource> Session::in_flight_source() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!in_flight_) return std::nullopt;
    return in_flight_->options.source;
}

size_t Session::queue_depth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::string Session::cwd() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cwd_;
}
