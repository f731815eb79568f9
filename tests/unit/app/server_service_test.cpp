/**
 * Tests for ServerService - start/reconcile decisions, batch operations and config refresh.
 *
 * The process backend is an in-memory fake and port probes always succeed, so the tests
 * exercise the decision logic only.
 */

#include <gtest/gtest.h>
#include <servherd/app/server_service.h>
#include <servherd/naming/name_generator.h>

#include "fake_process_backend.hpp"
#include "temp_dir_scope.hpp"

#include <fstream>

using namespace servherd;
using namespace servherd::app;
using servherd::test_support::FakeProcessBackend;
using servherd::test_support::TempDirScope;

namespace {

class ServerServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.tempDir = (tmp_.path() / "tmp").string();
        ASSERT_TRUE(registry_.load());
    }

    ServerService service(bool ciMode = false) {
        ServerService::Options opts;
        opts.ciMode = ciMode;
        opts.probe = [](int) -> Result<bool> { return true; };
        opts.confirm = [this](const std::string& question) {
            questions_.push_back(question);
            return answer_;
        };
        return ServerService(config_, registry_, backend_, opts);
    }

    StartOptions startOpts(const std::string& command, const std::string& cwd = "/proj") const {
        StartOptions o;
        o.command = command;
        o.cwd = cwd;
        return o;
    }

    registry::ServerEntry startServer(const std::string& command,
                                      std::optional<std::string> name = std::nullopt) {
        auto o = startOpts(command);
        o.name = std::move(name);
        auto r = service().start(o);
        EXPECT_TRUE(r) << r.error().message;
        return r.value().entry;
    }

    TempDirScope tmp_ = TempDirScope::unique_under("servherd-service");
    config::GlobalConfig config_;
    registry::RegistryService registry_{tmp_.path() / "registry.json"};
    FakeProcessBackend backend_;
    std::vector<std::string> questions_;
    bool answer_{false};
};

} // namespace

// ============================================================================
// start
// ============================================================================

TEST_F(ServerServiceTest, StartNewRendersPortAndRegisters) {
    auto r = service().start(startOpts("vite --port {{port}}"));
    ASSERT_TRUE(r) << r.error().message;
    const auto& e = r.value().entry;
    EXPECT_EQ(r.value().action, StartAction::Started);
    EXPECT_EQ(e.name, naming::generateDeterministicName("vite --port {{port}}"));
    EXPECT_EQ(e.resolvedCommand, "vite --port " + std::to_string(e.port));
    EXPECT_TRUE(config_.portRange.contains(e.port));
    EXPECT_EQ(e.hostname, "0.0.0.0");
    ASSERT_TRUE(e.configSnapshot.has_value());

    ASSERT_TRUE(backend_.lastSpec.has_value());
    EXPECT_EQ(backend_.lastSpec->name, e.processHandle);
    EXPECT_EQ(backend_.lastSpec->script, "vite");
    EXPECT_EQ(backend_.lastSpec->args,
              (std::vector<std::string>{"--port", std::to_string(e.port)}));
    EXPECT_EQ(backend_.lastSpec->env.at("PORT"), std::to_string(e.port));
    EXPECT_EQ(backend_.lastSpec->cwd, "/proj");

    EXPECT_TRUE(registry_.findByName(e.name).has_value());
}

TEST_F(ServerServiceTest, SecondStartOfRunningServerIsExisting) {
    auto first = startServer("vite --port {{port}}");
    backend_.calls.clear();
    auto r = service().start(startOpts("vite --port {{port}}"));
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().action, StartAction::Existing);
    EXPECT_EQ(r.value().entry.id, first.id);
    EXPECT_EQ(registry_.servers().size(), 1u);
    for (const auto& call : backend_.calls) {
        for (const char* op : {"start:", "remove:", "restart:", "stop:"}) {
            EXPECT_NE(call.rfind(op, 0), 0u) << "unexpected backend call " << call;
        }
    }
}

TEST_F(ServerServiceTest, StoppedServerIsRestarted) {
    auto first = startServer("vite --port {{port}}");
    backend_.setStatus(first.processHandle, ServerStatus::Stopped);
    auto r = service().start(startOpts("vite --port {{port}}"));
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().action, StartAction::Restarted);
    EXPECT_TRUE(backend_.called("restart:" + first.processHandle));
}

TEST_F(ServerServiceTest, MissingProcessStartsFresh) {
    auto first = startServer("vite --port {{port}}");
    backend_.processes.clear();
    backend_.calls.clear();
    auto r = service().start(startOpts("vite --port {{port}}"));
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().action, StartAction::Restarted);
    EXPECT_TRUE(backend_.called("restart:" + first.processHandle));
    EXPECT_TRUE(backend_.called("start:" + first.processHandle));
}

TEST_F(ServerServiceTest, ExplicitNameWithChangedCommandRestarts) {
    auto first = startServer("vite --port {{port}}", "web");
    auto o = startOpts("vite --port {{port}} --open");
    o.name = "web";
    auto r = service().start(o);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().action, StartAction::Restarted);
    EXPECT_TRUE(r.value().commandChanged);
    EXPECT_EQ(r.value().entry.resolvedCommand,
              "vite --port " + std::to_string(first.port) + " --open");
    EXPECT_TRUE(backend_.called("remove:" + first.processHandle));
}

TEST_F(ServerServiceTest, EnvChangeRestartsWithNewEnvironment) {
    auto o = startOpts("vite --port {{port}}");
    o.name = "web";
    o.env = EnvMap{{"API_URL", "http://localhost:{{port}}/api"}};
    auto first = service().start(o);
    ASSERT_TRUE(first) << first.error().message;
    const int port = first.value().entry.port;
    EXPECT_EQ(first.value().entry.env.at("API_URL"),
              "http://localhost:" + std::to_string(port) + "/api");

    backend_.calls.clear();
    o.env = EnvMap{{"API_URL", "http://example.test"}};
    auto r = service().start(o);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().action, StartAction::Restarted);
    EXPECT_TRUE(r.value().envChanged);
    EXPECT_EQ(r.value().entry.env.at("API_URL"), "http://example.test");
    ASSERT_GE(backend_.calls.size(), 2u);
    EXPECT_EQ(backend_.calls[0], "remove:servherd-web");
    EXPECT_EQ(backend_.calls[1], "start:servherd-web");
}

TEST_F(ServerServiceTest, FailedRemoveDuringEnvChangeKeepsRegistryEntry) {
    auto o = startOpts("vite --port {{port}}");
    o.name = "web";
    o.env = EnvMap{{"API_URL", "http://localhost:3000"}};
    ASSERT_TRUE(service().start(o));

    backend_.removeError = Error{ErrorCode::BackendConnectionFailed, "daemon went away"};
    o.env = EnvMap{{"API_URL", "http://localhost:4000"}};
    auto failed = service().start(o);
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::BackendConnectionFailed);
    auto stored = registry_.findByName("web");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->env.at("API_URL"), "http://localhost:3000");
    EXPECT_EQ(backend_.lastSpec->env.at("API_URL"), "http://localhost:3000");

    backend_.removeError.reset();
    auto retry = service().start(o);
    ASSERT_TRUE(retry) << retry.error().message;
    EXPECT_EQ(retry.value().action, StartAction::Restarted);
    EXPECT_TRUE(retry.value().envChanged);
    EXPECT_EQ(registry_.findByName("web")->env.at("API_URL"), "http://localhost:4000");
    EXPECT_EQ(backend_.lastSpec->env.at("API_URL"), "http://localhost:4000");
}

TEST_F(ServerServiceTest, SameEnvIsNotAChange) {
    auto o = startOpts("vite --port {{port}}");
    o.name = "web";
    o.env = EnvMap{{"API_URL", "http://localhost:{{port}}/api"}};
    ASSERT_TRUE(service().start(o));
    auto r = service().start(o);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().action, StartAction::Existing);
}

TEST_F(ServerServiceTest, ExplicitPortOutsideRangeFails) {
    auto o = startOpts("vite --port {{port}}");
    o.port = 70000;
    auto r = service().start(o);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::PortOutOfRange);
    EXPECT_TRUE(registry_.servers().empty());
}

TEST_F(ServerServiceTest, ExplicitPortIsUsed) {
    auto o = startOpts("vite --port {{port}}");
    o.port = 4321;
    auto r = service().start(o);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().entry.port, 4321);
    EXPECT_EQ(r.value().entry.resolvedCommand, "vite --port 4321");
}

TEST_F(ServerServiceTest, MissingCustomVariableFailsWithHint) {
    auto r = service().start(startOpts("vite --api {{api}}"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::TemplateMissingVariable);
    EXPECT_NE(r.error().message.find("Add with: servherd config --add api --value <value>"),
              std::string::npos);
    EXPECT_TRUE(registry_.servers().empty());
}

TEST_F(ServerServiceTest, FailedStartStaysRegistered) {
    backend_.startError = Error{ErrorCode::BackendStartFailed, "spawn failed"};
    auto r = service().start(startOpts("vite --port {{port}}"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::BackendStartFailed);
    EXPECT_EQ(registry_.servers().size(), 1u);
}

TEST_F(ServerServiceTest, NameCollisionFromOtherDirectoryGetsRandomName) {
    auto first = startServer("vite --port {{port}}");
    auto r = service().start(startOpts("vite --port {{port}}", "/other"));
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().action, StartAction::Started);
    EXPECT_NE(r.value().entry.name, first.name);
    EXPECT_EQ(registry_.servers().size(), 2u);
}

// ============================================================================
// Drift on start
// ============================================================================

TEST_F(ServerServiceTest, RangeShrinkReassignsPortOnStart) {
    auto first = startServer("vite --port {{port}}");
    const int original = first.port;
    config_.portRange = original >= 5000 ? config::PortRange{3000, 3999}
                                         : config::PortRange{5000, 9999};

    auto r = service().start(startOpts("vite --port {{port}}"));
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().action, StartAction::Refreshed);
    EXPECT_TRUE(r.value().configDrift);
    EXPECT_TRUE(r.value().portReassigned);
    EXPECT_EQ(r.value().originalPort, original);
    EXPECT_TRUE(config_.portRange.contains(r.value().entry.port));
    EXPECT_EQ(r.value().entry.resolvedCommand,
              "vite --port " + std::to_string(r.value().entry.port));
}

TEST_F(ServerServiceTest, HostnameDriftRefreshesOnStart) {
    startServer("vite --host {{hostname}} --port {{port}}");
    config_.hostname = "127.0.0.1";
    auto r = service().start(startOpts("vite --host {{hostname}} --port {{port}}"));
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().action, StartAction::Refreshed);
    EXPECT_FALSE(r.value().portReassigned);
    EXPECT_EQ(r.value().entry.hostname, "127.0.0.1");
    EXPECT_NE(r.value().entry.resolvedCommand.find("--host 127.0.0.1"), std::string::npos);
}

TEST_F(ServerServiceTest, PromptModeInCiDeclinesRefresh) {
    auto o = startOpts("vite --host {{hostname}} --port {{port}}");
    ASSERT_TRUE(service(true).start(o));
    config_.hostname = "127.0.0.1";
    config_.refreshOnChange = RefreshOnChange::Prompt;
    answer_ = true;

    auto r = service(true).start(o);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().action, StartAction::Existing);
    EXPECT_TRUE(r.value().userDeclinedRefresh);
    EXPECT_TRUE(r.value().configDrift);
    EXPECT_TRUE(questions_.empty());
}

TEST_F(ServerServiceTest, PromptModeAcceptedRefreshes) {
    startServer("vite --host {{hostname}} --port {{port}}");
    config_.hostname = "127.0.0.1";
    config_.refreshOnChange = RefreshOnChange::Prompt;
    answer_ = true;

    auto r = service().start(startOpts("vite --host {{hostname}} --port {{port}}"));
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().action, StartAction::Refreshed);
    ASSERT_EQ(questions_.size(), 1u);
    EXPECT_NE(questions_[0].find("config drift"), std::string::npos);
}

TEST_F(ServerServiceTest, ManualModeKeepsDrift) {
    startServer("vite --host {{hostname}} --port {{port}}");
    config_.hostname = "127.0.0.1";
    config_.refreshOnChange = RefreshOnChange::Manual;
    auto r = service().start(startOpts("vite --host {{hostname}} --port {{port}}"));
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().action, StartAction::Existing);
    EXPECT_TRUE(r.value().configDrift);
    EXPECT_FALSE(r.value().userDeclinedRefresh);
    EXPECT_EQ(r.value().entry.hostname, "0.0.0.0");
}

// ============================================================================
// Selectors and batch operations
// ============================================================================

TEST_F(ServerServiceTest, SelectorValidation) {
    auto svc = service();
    Selector none;
    auto r = svc.restart(none);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().message, "Provide a server name, --all, or --tag");

    Selector both;
    both.name = "web";
    both.all = true;
    r = svc.restart(both);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().message, "Specify only one of a server name, --all, or --tag");

    Selector missing;
    missing.name = "ghost";
    r = svc.restart(missing);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ServerNotFound);
    EXPECT_EQ(r.error().message, "Server \"ghost\" not found in registry");
}

TEST_F(ServerServiceTest, StopUnknownNameReportsPerServerFailure) {
    Selector s;
    s.name = "ghost";
    auto r = service().stop(s);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_FALSE(r.value()[0].success);
    EXPECT_EQ(r.value()[0].name, "ghost");
}

TEST_F(ServerServiceTest, StopByTag) {
    auto o = startOpts("vite --port {{port}}");
    o.name = "web";
    o.tags = {"frontend"};
    ASSERT_TRUE(service().start(o));
    auto api = startServer("node api.js --port {{port}}", "api");

    Selector s;
    s.tag = "frontend";
    auto r = service().stop(s);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_TRUE(r.value()[0].success);
    EXPECT_EQ(r.value()[0].status, ServerStatus::Stopped);
    EXPECT_TRUE(backend_.called("stop:servherd-web"));
    EXPECT_FALSE(backend_.called("stop:" + api.processHandle));
}

TEST_F(ServerServiceTest, ForcedStopRemovesProcess) {
    startServer("vite --port {{port}}", "web");
    Selector s;
    s.name = "web";
    ASSERT_TRUE(service().stop(s, true));
    EXPECT_TRUE(backend_.called("remove:servherd-web"));
    EXPECT_TRUE(registry_.findByName("web").has_value());
}

TEST_F(ServerServiceTest, RestartAllStartsMissingProcesses) {
    startServer("vite --port {{port}}", "web");
    backend_.processes.clear();
    Selector s;
    s.all = true;
    auto r = service().restart(s);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_TRUE(r.value()[0].success);
    EXPECT_EQ(r.value()[0].status, ServerStatus::Online);
}

TEST_F(ServerServiceTest, RestartRefreshesDriftedServer) {
    auto first = startServer("vite --port {{port}}", "web");
    config_.portRange = first.port >= 5000 ? config::PortRange{3000, 3999}
                                           : config::PortRange{5000, 9999};
    Selector s;
    s.name = "web";
    auto r = service().restart(s);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_TRUE(r.value()[0].configRefreshed);
    EXPECT_TRUE(r.value()[0].portReassigned);
    EXPECT_EQ(r.value()[0].originalPort, first.port);
    ASSERT_TRUE(r.value()[0].newPort.has_value());
    EXPECT_TRUE(config_.portRange.contains(*r.value()[0].newPort));
}

TEST_F(ServerServiceTest, RemoveInCiRequiresForce) {
    startServer("vite --port {{port}}", "web");
    Selector s;
    s.name = "web";
    auto r = service(true).remove(s);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidState);

    auto forced = service(true).remove(s, true);
    ASSERT_TRUE(forced);
    EXPECT_TRUE(forced.value()[0].success);
    EXPECT_FALSE(registry_.findByName("web").has_value());
}

TEST_F(ServerServiceTest, DeclinedRemoveIsCancelled) {
    startServer("vite --port {{port}}", "web");
    Selector s;
    s.name = "web";
    auto r = service().remove(s);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_TRUE(r.value()[0].cancelled);
    EXPECT_EQ(r.value()[0].message, "Cancelled by user");
    ASSERT_EQ(questions_.size(), 1u);
    EXPECT_EQ(questions_[0], "Are you sure you want to remove server \"web\"?");
    EXPECT_TRUE(registry_.findByName("web").has_value());
}

TEST_F(ServerServiceTest, ConfirmedRemoveDeletesEntryAndProcess) {
    startServer("vite --port {{port}}", "web");
    backend_.processes.clear();
    answer_ = true;
    Selector s;
    s.name = "web";
    auto r = service().remove(s);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value()[0].success);
    EXPECT_FALSE(registry_.findByName("web").has_value());
}

// ============================================================================
// refresh and config changes
// ============================================================================

TEST_F(ServerServiceTest, RefreshWithoutDrift) {
    startServer("vite --port {{port}}", "web");
    auto r = service().refresh(Selector{});
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_TRUE(r.value()[0].skipped);
    EXPECT_EQ(r.value()[0].message, "No servers have config drift");
}

TEST_F(ServerServiceTest, RefreshDryRunTouchesNothing) {
    startServer("vite --host {{hostname}} --port {{port}}", "web");
    config_.hostname = "localhost";
    backend_.calls.clear();
    auto r = service().refresh(Selector{}, true);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_TRUE(r.value()[0].skipped);
    EXPECT_EQ(r.value()[0].message, "Would refresh (dry-run mode)");
    EXPECT_TRUE(backend_.calls.empty());
    EXPECT_EQ(registry_.findByName("web")->hostname, "0.0.0.0");
}

TEST_F(ServerServiceTest, RefreshAppliesDrift) {
    startServer("vite --host {{hostname}} --port {{port}}", "web");
    config_.hostname = "localhost";
    auto r = service().refresh(Selector{});
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_TRUE(r.value()[0].success);
    EXPECT_TRUE(r.value()[0].configRefreshed);
    auto entry = registry_.findByName("web");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->hostname, "localhost");
    EXPECT_EQ(entry->configSnapshot->hostname, "localhost");
}

TEST_F(ServerServiceTest, ConfigChangeInManualModeOnlyReports) {
    startServer("vite --host {{hostname}} --port {{port}}", "web");
    startServer("node api.js --port {{port}}", "api");
    config_.hostname = "localhost";
    config_.refreshOnChange = RefreshOnChange::Manual;
    auto outcome = service().handleConfigChange("hostname");
    EXPECT_FALSE(outcome.refreshed);
    EXPECT_EQ(outcome.message,
              "1 server(s) use this config value. Run \"servherd refresh\" to apply changes.");
}

TEST_F(ServerServiceTest, ConfigChangeInAutoModeRefreshes) {
    startServer("vite --host {{hostname}} --port {{port}}", "web");
    config_.hostname = "localhost";
    config_.refreshOnChange = RefreshOnChange::Auto;
    auto outcome = service().handleConfigChange("hostname");
    EXPECT_TRUE(outcome.refreshed);
    EXPECT_EQ(outcome.message, "Refreshed 1 server(s): web");
    EXPECT_EQ(registry_.findByName("web")->hostname, "localhost");
}

TEST_F(ServerServiceTest, ConfigChangeWithNoUsersIsSilent) {
    startServer("node api.js --port {{port}}", "api");
    auto outcome = service().handleConfigChange("hostname");
    EXPECT_FALSE(outcome.refreshed);
    EXPECT_FALSE(outcome.message.has_value());
}

// ============================================================================
// info, list, logs, flush
// ============================================================================

TEST_F(ServerServiceTest, InfoReportsStatusAndDrift) {
    startServer("vite --host {{hostname}} --port {{port}}", "web");
    config_.hostname = "localhost";
    auto r = service().info("web");
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().status, ServerStatus::Online);
    EXPECT_TRUE(r.value().hasDrift);
    ASSERT_TRUE(r.value().process.has_value());

    EXPECT_EQ(service().info("ghost").error().code, ErrorCode::ServerNotFound);
}

TEST_F(ServerServiceTest, ListFiltersByRunningState) {
    startServer("vite --port {{port}}", "web");
    auto api = startServer("node api.js --port {{port}}", "api");
    backend_.setStatus(api.processHandle, ServerStatus::Stopped);

    ListOptions running;
    running.running = true;
    auto r = service().list(running);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].entry.name, "web");

    ListOptions stopped;
    stopped.stopped = true;
    r = service().list(stopped);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].entry.name, "api");

    ListOptions both;
    both.running = true;
    both.stopped = true;
    EXPECT_FALSE(service().list(both));
}

TEST_F(ServerServiceTest, ListSurfacesBackendFaults) {
    startServer("vite --port {{port}}", "web");
    backend_.describeError = Error{ErrorCode::BackendConnectionFailed, "daemon socket missing"};
    auto r = service().list(ListOptions{});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::BackendConnectionFailed);
}

TEST_F(ServerServiceTest, LogsNotices) {
    auto web = startServer("vite --port {{port}}", "web");
    LogsOptions opts;
    opts.name = "web";

    auto r = service().logs(opts);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().notice, "(no log path available)");

    backend_.processes[web.processHandle].outLogPath = (tmp_.path() / "nope.log").string();
    r = service().logs(opts);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().notice, "(log file does not exist)");

    backend_.processes.clear();
    r = service().logs(opts);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().notice, "(process not found)");
}

TEST_F(ServerServiceTest, LogsTailAndSince) {
    auto web = startServer("vite --port {{port}}", "web");
    const auto log = tmp_.path() / "web-out.log";
    {
        std::ofstream out(log);
        out << "2024-01-15T10:00:00.000Z: one\n"
            << "2024-01-15T11:00:00.000Z: two\n"
            << "2024-01-15T12:00:00.000Z: three\n";
    }
    backend_.processes[web.processHandle].outLogPath = log.string();

    LogsOptions opts;
    opts.name = "web";
    opts.lines = 2;
    auto r = service().logs(opts);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_FALSE(r.value().notice.has_value());
    EXPECT_EQ(r.value().lines, (std::vector<std::string>{"2024-01-15T11:00:00.000Z: two",
                                                         "2024-01-15T12:00:00.000Z: three"}));

    opts.lines = 50;
    opts.since = "2024-01-15T11:30:00Z";
    r = service().logs(opts);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().lines, (std::vector<std::string>{"2024-01-15T12:00:00.000Z: three"}));

    opts.since = "not a time";
    EXPECT_FALSE(service().logs(opts));
}

TEST_F(ServerServiceTest, FlushMessages) {
    startServer("vite --port {{port}}", "web");
    auto all = service().flush(std::nullopt);
    ASSERT_TRUE(all);
    EXPECT_EQ(all.value(), "Logs flushed for all servers");
    EXPECT_TRUE(backend_.called("flushAll"));

    auto one = service().flush(std::string("web"));
    ASSERT_TRUE(one);
    EXPECT_EQ(one.value(), "Logs flushed for server \"web\"");
    EXPECT_TRUE(backend_.called("flush:servherd-web"));

    EXPECT_FALSE(service().flush(std::string("ghost")));
}
