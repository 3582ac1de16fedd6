#include "session_registry.hpp"
#include "admission.hpp"
#include "transcript.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

SessionRegistry::SessionRegistry(ShellConnector& connector, EngineSettings settings)
    : connector_(connector), settings_(settings) {}

SessionRegistry::~SessionRegistry() {
    shutdown();
}

Result<std::shared_ptr<Session>> SessionRegistry::connect(const ConnectionConfig& config,
                                                          StatusCallback callback) {
    using R = Result<std::shared_ptr<Session>>;

    reap_retired();

    auto name_ok = validate_session_name(config.name);
    if (name_ok.is_err()) return R::Err(name_ok.code, name_ok.error);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return R::Err(ErrorCode::REGISTRY_SHUT_DOWN, "Session registry is shut down");
        }
        if (sessions_.count(config.name) || connecting_.count(config.name)) {
            return R::Err(ErrorCode::DUPLICATE_SESSION,
                          fmt::format("Session '{}' already exists", config.name));
        }
        connecting_.insert(config.name);
    }

    log_info("registry: connecting {} to {}@{}:{}",
             config.name, config.username, config.host, config.port);
    ShellConnection conn = connector_.connect(config, callback);

    std::unique_lock<std::mutex> lock(mutex_);
    connecting_.erase(config.name);

    if (!conn.ok()) {
        ErrorCode code = conn.code == ErrorCode::NONE ? ErrorCode::TRANSPORT_ERROR : conn.code;
        log_warn("registry: connect {} failed ({}): {}",
                 config.name, error_code_name(code), conn.error);
        return R::Err(code, conn.error.empty() ? "Failed to connect" : conn.error);
    }

    if (shut_down_) {
        lock.unlock();
        conn.shell->close();
        return R::Err(ErrorCode::REGISTRY_SHUT_DOWN, "Session registry is shut down");
    }

    std::string banner = conn.shell->banner();
    auto session = std::make_shared<Session>(config, std::move(conn.shell), settings_);
    sessions_[config.name] = session;
    lock.unlock();

    session->start();
    session->broadcast_system(strip_trailing_prompt(banner));
    log_info("registry: session {} connected", config.name);
    return R::Ok(session);
}

Result<void> SessionRegistry::disconnect(const std::string& name) {
    reap_retired();

    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(name);
        if (it == sessions_.end()) {
            return Result<void>::Err(ErrorCode::SESSION_NOT_FOUND,
                                     fmt::format("Session '{}' not found", name));
        }
        session = it->second;
        sessions_.erase(it);
        if (session->on_worker_thread()) retired_.push_back(session);
    }

    // Nothing below may touch the registry: on the worker thread its owner
    // may already be shutting it down once close() rejects the commands.
    session->close();
    log_info("registry: session {} disconnected", name);
    return Result<void>::Ok();
}

void SessionRegistry::reap_retired() {
    std::vector<std::shared_ptr<Session>> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retired.swap(retired_);
    }
    if (retired.empty()) return;

    std::vector<std::shared_ptr<Session>> still_running;
    for (auto& session : retired) {
        if (session->on_worker_thread()) {
            still_running.push_back(session);
        } else {
            session->join();
        }
    }
    if (!still_running.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        retired_.insert(retired_.end(), still_running.begin(), still_running.end());
    }
}

bool SessionRegistry::has_session(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(name) > 0;
}

Result<std::shared_ptr<Session>> SessionRegistry::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(name);
    if (it == sessions_.end()) {
        return Result<std::shared_ptr<Session>>::Err(ErrorCode::SESSION_NOT_FOUND,
            fmt::format("Session '{}' not found", name));
    }
    return Result<std::shared_ptr<Session>>::Ok(it->second);
}

std::vector<SessionInfo> SessionRegistry::list_sessions() const {
    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, session] : sessions_) sessions.push_back(session);
    }
    std::vector<SessionInfo> infos;
    infos.reserve(sessions.size());
    for (const auto& session : sessions) infos.push_back(session->info());
    return infos;
}

std::vector<std::string> SessionRegistry::session_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, session] : sessions_) names.push_back(name);
    return names;
}

void SessionRegistry::poll_connectivity() {
    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, session] : sessions_) sessions.push_back(session);
    }
    for (const auto& session : sessions) session->check_connectivity();
}

void SessionRegistry::shutdown() {
    std::map<std::string, std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down_ = true;
        sessions.swap(sessions_);
        for (const auto& [name, session] : sessions) {
            if (session->on_worker_thread()) retired_.push_back(session);
        }
    }
    for (auto& [name, session] : sessions) session->close();
    if (!sessions.empty()) {
        log_info("registry: shut down, closed {} session(s)", sessions.size());
    }
    reap_retired();
}
