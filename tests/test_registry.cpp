#include <gtest/gtest.h>
#include <engine/session_registry.hpp>
#include <core/log.hpp>
#include "fake_shell.hpp"
#include <filesystem>
#include <future>

namespace fs = std::filesystem;

class RegistryTest : public ::testing::Test {
protected:
    FakeConnector connector;
    std::unique_ptr<SessionRegistry> registry;

    void SetUp() override {
        set_log_path((fs::temp_directory_path() / "sshgate_test.log").string());
        registry = std::make_unique<SessionRegistry>(connector);
    }

    void TearDown() override {
        if (registry) registry->shutdown();
    }
};

TEST_F(RegistryTest, ConnectRegistersSession) {
    std::vector<std::string> progress;
    auto r = registry->connect(test_config("dev"),
                               [&](const std::string& m) { progress.push_back(m); });
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(progress.empty());

    EXPECT_TRUE(registry->has_session("dev"));
    auto got = registry->get("dev");
    ASSERT_TRUE(got.is_ok());
    EXPECT_EQ(got.value, r.value);

    auto infos = registry->list_sessions();
    ASSERT_EQ(infos.size(), 1u);
    EXPECT_EQ(infos[0].name, "dev");
    EXPECT_EQ(infos[0].host, "fake");
    EXPECT_EQ(infos[0].username, "alice");
    EXPECT_EQ(infos[0].status, ConnectionStatus::CONNECTED);
    EXPECT_FALSE(infos[0].error_detail.has_value());
}

TEST_F(RegistryTest, DuplicateNameRejected) {
    ASSERT_TRUE(registry->connect(test_config("dev")).is_ok());
    auto dup = registry->connect(test_config("dev", "other"));
    EXPECT_TRUE(dup.is_err());
    EXPECT_EQ(dup.code, ErrorCode::DUPLICATE_SESSION);
    EXPECT_EQ(connector.connects, 1);
}

TEST_F(RegistryTest, InvalidNamesNeverReachTheConnector) {
    for (const char* name : {"", "two words", "alice@dev"}) {
        auto r = registry->connect(test_config(name));
        EXPECT_EQ(r.code, ErrorCode::INVALID_SESSION_NAME) << name;
    }
    EXPECT_EQ(connector.connects, 0);
}

TEST_F(RegistryTest, ConnectFailuresAreClassifiedAndNotRegistered) {
    connector.failures["locked"] = ErrorCode::AUTH_FAILED;
    connector.failures["gone"] = ErrorCode::HOST_UNREACHABLE;
    connector.failures["slow"] = ErrorCode::CONNECT_TIMEOUT;

    EXPECT_EQ(registry->connect(test_config("a", "locked")).code, ErrorCode::AUTH_FAILED);
    EXPECT_EQ(registry->connect(test_config("b", "gone")).code, ErrorCode::HOST_UNREACHABLE);
    EXPECT_EQ(registry->connect(test_config("c", "slow")).code, ErrorCode::CONNECT_TIMEOUT);
    EXPECT_TRUE(registry->list_sessions().empty());

    // The name is free again after a failed attempt
    connector.failures.clear();
    EXPECT_TRUE(registry->connect(test_config("a")).is_ok());
}

TEST_F(RegistryTest, UnknownSessions) {
    EXPECT_FALSE(registry->has_session("nope"));
    EXPECT_EQ(registry->get("nope").code, ErrorCode::SESSION_NOT_FOUND);
    EXPECT_EQ(registry->disconnect("nope").code, ErrorCode::SESSION_NOT_FOUND);
}

TEST_F(RegistryTest, DisconnectRejectsInFlightAndQueuedCommands) {
    auto r = registry->connect(test_config("dev"));
    ASSERT_TRUE(r.is_ok());
    auto session = r.value;
    FakeShell* shell = connector.shell("dev");

    CommandOptions options;
    auto running = session->enqueue("block", options);
    ASSERT_TRUE(shell->wait_started(1));

    std::vector<Submission> queued;
    for (int i = 0; i < 5; i++) {
        queued.push_back(session->enqueue("echo " + std::to_string(i), options));
        ASSERT_TRUE(queued.back().accepted());
    }

    ASSERT_TRUE(registry->disconnect("dev").is_ok());
    EXPECT_FALSE(registry->has_session("dev"));
    EXPECT_TRUE(session->closed());
    EXPECT_TRUE(shell->is_closed());
    EXPECT_EQ(session->info().status, ConnectionStatus::DISCONNECTED);

    auto expect_disconnected = [](Submission& sub) {
        ASSERT_TRUE(ready_within(sub.result));
        try {
            sub.result.get();
            FAIL() << "expected SESSION_DISCONNECTED";
        } catch (const CommandError& e) {
            EXPECT_EQ(e.code(), ErrorCode::SESSION_DISCONNECTED);
        }
    };
    expect_disconnected(running);
    for (auto& sub : queued) expect_disconnected(sub);

    // None of the queued commands ever reached the shell
    EXPECT_EQ(shell->started().size(), 1u);
}

TEST_F(RegistryTest, EnqueueAfterDisconnectIsRejected) {
    auto r = registry->connect(test_config("dev"));
    ASSERT_TRUE(r.is_ok());
    auto session = r.value;
    ASSERT_TRUE(registry->disconnect("dev").is_ok());

    auto sub = session->enqueue("pwd", CommandOptions{});
    EXPECT_EQ(sub.code, ErrorCode::SESSION_DISCONNECTED);
    EXPECT_FALSE(sub.retry_allowed());
}

TEST_F(RegistryTest, SessionsAreIndependent) {
    auto a = registry->connect(test_config("a"));
    auto b = registry->connect(test_config("b"));
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());

    auto blocked = a.value->enqueue("block", CommandOptions{});
    ASSERT_TRUE(connector.shell("a")->wait_started(1));

    auto other = b.value->enqueue("whoami", CommandOptions{});
    ASSERT_TRUE(ready_within(other.result));
    EXPECT_EQ(other.result.get().stdout_data, "alice");

    ASSERT_TRUE(registry->disconnect("a").is_ok());
    EXPECT_THROW(blocked.result.get(), CommandError);
    EXPECT_TRUE(registry->has_session("b"));
}

TEST_F(RegistryTest, PollConnectivityRecordsTransportStatus) {
    ASSERT_TRUE(registry->connect(test_config("dev")).is_ok());
    connector.shell("dev")->set_connectivity(ConnectionStatus::ERROR);

    registry->poll_connectivity();
    auto infos = registry->list_sessions();
    ASSERT_EQ(infos.size(), 1u);
    EXPECT_EQ(infos[0].status, ConnectionStatus::ERROR);
    EXPECT_TRUE(infos[0].error_detail.has_value());
    EXPECT_TRUE(infos[0].error_timestamp.has_value());
}

TEST_F(RegistryTest, ShutdownClosesEverythingAndRefusesConnects) {
    ASSERT_TRUE(registry->connect(test_config("a")).is_ok());
    ASSERT_TRUE(registry->connect(test_config("b")).is_ok());
    FakeShell* a = connector.shell("a");
    FakeShell* b = connector.shell("b");

    // Keep the sessions (and their shells) alive past shutdown
    auto sa = registry->get("a").value;
    auto sb = registry->get("b").value;

    registry->shutdown();
    EXPECT_TRUE(registry->list_sessions().empty());
    EXPECT_TRUE(a->is_closed());
    EXPECT_TRUE(b->is_closed());
    EXPECT_EQ(registry->connect(test_config("c")).code, ErrorCode::REGISTRY_SHUT_DOWN);
}

TEST_F(RegistryTest, DisconnectFromOutputListener) {
    auto r = registry->connect(test_config("dev"));
    ASSERT_TRUE(r.is_ok());
    auto session = r.value;

    // A listener running on the worker thread tears the session down
    auto fired = std::make_shared<std::atomic<bool>>(false);
    auto finished = std::make_shared<std::promise<bool>>();
    auto disconnect_done = finished->get_future();
    session->add_output_listener([this, fired, finished](const TerminalOutputEntry& e) {
        if (e.content.find("src") != std::string::npos && !fired->exchange(true)) {
            bool ok = registry->disconnect("dev").is_ok();
            finished->set_value(ok);
        }
    });

    auto sub = session->enqueue("ls", CommandOptions{});
    ASSERT_TRUE(ready_within(disconnect_done));
    EXPECT_TRUE(disconnect_done.get());
    ASSERT_TRUE(ready_within(sub.result));
    EXPECT_THROW(sub.result.get(), CommandError);
    EXPECT_FALSE(registry->has_session("dev"));
    EXPECT_TRUE(session->closed());

    // Joins the worker that closed its own session
    registry->shutdown();
    EXPECT_TRUE(registry->list_sessions().empty());
}

TEST_F(RegistryTest, RegistryDestroyedRightAfterListenerDisconnect) {
    auto r = registry->connect(test_config("dev"));
    ASSERT_TRUE(r.is_ok());
    auto session = r.value;

    auto fired = std::make_shared<std::atomic<bool>>(false);
    SessionRegistry* owner = registry.get();
    session->add_output_listener([owner, fired](const TerminalOutputEntry& e) {
        if (e.content.find("src") != std::string::npos && !fired->exchange(true)) {
            EXPECT_TRUE(owner->disconnect("dev").is_ok());
        }
    });

    auto sub = session->enqueue("ls", CommandOptions{});
    ASSERT_TRUE(ready_within(sub.result));
    EXPECT_THROW(sub.result.get(), CommandError);

    // Waits for the worker still inside disconnect() before freeing anything
    registry.reset();
    EXPECT_TRUE(session->closed());
}

TEST_F(RegistryTest, DisconnectRemovesSessionBeforeRejecting) {
    auto r = registry->connect(test_config("dev"));
    ASSERT_TRUE(r.is_ok());
    FakeShell* shell = connector.shell("dev");

    auto sub = r.value->enqueue("block", CommandOptions{});
    ASSERT_TRUE(shell->wait_started(1));

    auto seen_after_rejection = std::async(std::launch::async, [&] {
        sub.result.wait();
        return registry->has_session("dev");
    });
    ASSERT_TRUE(registry->disconnect("dev").is_ok());
    EXPECT_FALSE(seen_after_rejection.get());
    EXPECT_THROW(sub.result.get(), CommandError);
}
