#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "remote_shell.hpp"
#include "session.hpp"

// Owns every live Session, keyed by name. Connecting goes through the
// injected ShellConnector so the registry itself never touches the network.
//
// disconnect() may be called from a session's own listener. That session's
// worker cannot be joined from inside itself, so it is kept in retired_ and
// joined by the next connect(), disconnect() or shutdown() made from another
// thread. The registry must not be destroyed from a listener.
class SessionRegistry {
public:
    SessionRegistry(ShellConnector& connector, EngineSettings settings = {});
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Open a shell and register it under config.name. Nothing is registered
    // when the connector fails.
    Result<std::shared_ptr<Session>> connect(const ConnectionConfig& config,
                                             StatusCallback callback = nullptr);

    // Removes the session before failing its commands, so a caller woken by
    // the rejection already sees has_session(name) == false.
    Result<void> disconnect(const std::string& name);

    bool has_session(const std::string& name) const;
    Result<std::shared_ptr<Session>> get(const std::string& name) const;
    std::vector<SessionInfo> list_sessions() const;
    std::vector<std::string> session_names() const;

    // Check every idle session and record the status its transport reports.
    void poll_connectivity();

    // Disconnect everything and refuse new connects. Safe to call again; each
    // call also joins workers left by listener-initiated disconnects.
    void shutdown();

    const EngineSettings& settings() const { return settings_; }

private:
    ShellConnector& connector_;
    EngineSettings settings_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
    std::set<std::string> connecting_;
    std::vector<std::shared_ptr<Session>> retired_;
    bool shut_down_ = false;

    void reap_retired();
};
