#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <mcp_fleet/registry/backend_registry.hpp>

#include "../mocks/mock_backend_process.hpp"
#include "../mocks/mock_process_table.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace mcp_fleet;
using namespace mcp_fleet::testing;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace {

struct ManualClock {
    SteadyClock::time_point now = SteadyClock::time_point{} + 1000s;
    ClockFn Fn() {
        return [this] { return now; };
    }
};

BackendConfig Command(const std::string& command) {
    BackendConfig config;
    config.command = command;
    config.args = {"-y", command + "-mcp"};
    return config;
}

nlohmann::json Tool(const std::string& name) {
    return {{"name", name}, {"description", name}, {"inputSchema", {{"type", "object"}}}};
}

RegistryOptions FastOptions() {
    RegistryOptions options;
    options.message_timeout = 200ms;
    return options;
}

// Fleet, catalog and registry in destruction-safe order.
struct Fixture {
    explicit Fixture(RegistryOptions options = FastOptions(), ClockFn clock = SystemSteadyClock())
        : registry(options, catalog, fleet.Factory(), std::move(clock)) {}

    MockFleet fleet;
    ToolCatalog catalog;
    BackendRegistry registry;
};

} // anonymous namespace

// ===========================================================================
// Start and handshake
// ===========================================================================

TEST_CASE("BackendRegistry: RegisterPopular does not start the process", "[registry]") {
    Fixture f;
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());

    CHECK(f.registry.Contains("time"));
    CHECK(f.registry.IsPopular("time"));
    CHECK(f.fleet.Get("time")->StartAttempts() == 0);
    CHECK(f.registry.DynamicCount() == 0);
}

TEST_CASE("BackendRegistry: Ensure runs the MCP handshake and fills the catalog", "[registry]") {
    Fixture f;
    f.fleet.Script("time")->SetTools({Tool("get_current_time"), Tool("convert_time")});
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());

    REQUIRE(f.registry.Ensure("time").IsOk());

    auto methods = f.fleet.Get("time")->SentMethods();
    REQUIRE(methods.size() >= 3);
    CHECK(methods[0] == "initialize");
    CHECK(methods[1] == "notifications/initialized");
    CHECK(methods[2] == "tools/list");

    CHECK(f.catalog.Resolve("time.get_current_time").IsOk());
    CHECK(f.catalog.Resolve("time.convert_time").IsOk());

    auto status = f.registry.Describe("time");
    REQUIRE(status.IsOk());
    CHECK(status.Value().alive);
    CHECK(status.Value().initialized);
    CHECK(status.Value().pid == MockBackend::kFirstPid + 1);
    CHECK(status.Value().tools == 2);
    CHECK(status.Value().start_count == 1);
}

TEST_CASE("BackendRegistry: Ensure on a running backend does not restart it", "[registry]") {
    Fixture f;
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());
    REQUIRE(f.registry.Ensure("time").IsOk());
    REQUIRE(f.registry.Ensure("time").IsOk());

    CHECK(f.fleet.Get("time")->Starts() == 1);
    CHECK(f.fleet.Get("time")->CountSent("initialize") == 1);
}

TEST_CASE("BackendRegistry: initialize params announce the gateway", "[registry]") {
    Fixture f;
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());
    REQUIRE(f.registry.Ensure("time").IsOk());

    auto first = protocol::Decode(f.fleet.Get("time")->SentLines().front());
    REQUIRE(first.IsOk());
    const auto& request = std::get<protocol::Request>(first.Value());
    CHECK(request.params["clientInfo"]["name"] == "mcp-fleet");
    CHECK(request.params.contains("protocolVersion"));
}

TEST_CASE("BackendRegistry: unanswered initialize is a start failure", "[registry]") {
    Fixture f;
    f.fleet.Script("slow")->Silence("initialize");
    REQUIRE(f.registry.RegisterPopular("slow", Command("npx")).IsOk());

    auto ensured = f.registry.Ensure("slow");
    REQUIRE(ensured.IsErr());
    CHECK(ensured.Error().category == ErrorCategory::ProcessStartFailure);
    CHECK_THAT(ensured.Error().detail.value_or(""), ContainsSubstring("no reply"));
    CHECK_FALSE(f.fleet.Get("slow")->Alive());
}

TEST_CASE("BackendRegistry: Ensure of an unknown name", "[registry]") {
    Fixture f;

    SECTION("without config is BackendNotFound") {
        auto ensured = f.registry.Ensure("ghost");
        REQUIRE(ensured.IsErr());
        CHECK(ensured.Error().category == ErrorCategory::BackendNotFound);
    }

    SECTION("with config adds a dynamic backend") {
        REQUIRE(f.registry.Ensure("ghost", Command("npx")).IsOk());
        CHECK(f.registry.Contains("ghost"));
        CHECK_FALSE(f.registry.IsPopular("ghost"));
        CHECK(f.registry.DynamicCount() == 1);
    }
}

TEST_CASE("BackendRegistry: StartPopular counts running backends", "[registry]") {
    Fixture f;
    f.fleet.Script("broken")->FailStarts(-1);
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());
    REQUIRE(f.registry.RegisterPopular("broken", Command("npx")).IsOk());

    CHECK(f.registry.StartPopular() == 1);
    CHECK(f.fleet.Get("time")->Alive());
    CHECK(f.registry.Contains("broken"));
}

// ===========================================================================
// Registration rules
// ===========================================================================

TEST_CASE("BackendRegistry: rejects invalid registrations", "[registry]") {
    Fixture f;

    SECTION("bad name") {
        auto added = f.registry.Add("has space", Command("npx"));
        REQUIRE(added.IsErr());
        CHECK(added.Error().category == ErrorCategory::InvalidRequest);
    }

    SECTION("empty command") {
        auto added = f.registry.Add("empty", BackendConfig{});
        REQUIRE(added.IsErr());
        CHECK(added.Error().category == ErrorCategory::InvalidRequest);
    }

    SECTION("disabled") {
        auto config = Command("npx");
        config.enabled = false;
        CHECK(f.registry.RegisterPopular("off", config).IsErr());
        CHECK_FALSE(f.registry.Contains("off"));
    }

    SECTION("duplicate popular") {
        REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());
        CHECK(f.registry.RegisterPopular("time", Command("uvx")).IsErr());
    }
}

TEST_CASE("BackendRegistry: Add of an existing name", "[registry]") {
    Fixture f;
    REQUIRE(f.registry.Add("fs", Command("npx")).IsOk());

    SECTION("same config is a no-op") {
        REQUIRE(f.registry.Add("fs", Command("npx")).IsOk());
        CHECK(f.fleet.Created() == 1);
        CHECK(f.fleet.Get("fs")->Starts() == 1);
    }

    SECTION("different config is refused") {
        auto added = f.registry.Add("fs", Command("uvx"));
        REQUIRE(added.IsErr());
        CHECK(added.Error().category == ErrorCategory::InvalidRequest);
    }
}

TEST_CASE("BackendRegistry: Add that fails to start leaves nothing behind", "[registry]") {
    Fixture f;
    f.fleet.Script("bad")->FailStarts(-1);

    auto added = f.registry.Add("bad", Command("false"));
    REQUIRE(added.IsErr());
    CHECK(added.Error().category == ErrorCategory::ProcessStartFailure);
    CHECK_FALSE(f.registry.Contains("bad"));
    CHECK(f.registry.DynamicCount() == 0);
}

TEST_CASE("BackendRegistry: dynamic backend limit", "[registry]") {
    auto options = FastOptions();
    options.max_dynamic_backends = 2;
    Fixture f(options);
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());
    REQUIRE(f.registry.Add("a", Command("npx")).IsOk());
    REQUIRE(f.registry.Add("b", Command("npx")).IsOk());

    auto third = f.registry.Add("c", Command("npx"));
    REQUIRE(third.IsErr());
    CHECK(third.Error().category == ErrorCategory::InvalidRequest);
    CHECK_THAT(third.Error().message, ContainsSubstring("maximum of 2"));
    CHECK(f.registry.DynamicCount() == 2);
    CHECK_FALSE(f.registry.Contains("c"));
}

TEST_CASE("BackendRegistry: Remove", "[registry]") {
    Fixture f;
    f.fleet.Script("fs")->SetTools({Tool("read_file")});
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());
    REQUIRE(f.registry.Add("fs", Command("npx")).IsOk());
    REQUIRE(f.catalog.Resolve("fs.read_file").IsOk());

    SECTION("stops the process and drops its tools") {
        auto fs = f.fleet.Get("fs");
        REQUIRE(f.registry.Remove("fs").IsOk());
        CHECK_FALSE(f.registry.Contains("fs"));
        CHECK_FALSE(fs->Alive());
        CHECK(f.catalog.ToolsFor("fs").empty());
    }

    SECTION("refuses popular backends") {
        auto removed = f.registry.Remove("time");
        REQUIRE(removed.IsErr());
        CHECK(removed.Error().category == ErrorCategory::InvalidRequest);
        CHECK(f.registry.Contains("time"));
    }

    SECTION("unknown name is BackendNotFound") {
        auto removed = f.registry.Remove("ghost");
        REQUIRE(removed.IsErr());
        CHECK(removed.Error().category == ErrorCategory::BackendNotFound);
    }
}

// ===========================================================================
// Sending and recovery
// ===========================================================================

TEST_CASE("BackendRegistry: Send to a dead backend restarts it first", "[registry]") {
    Fixture f;
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());
    REQUIRE(f.registry.Ensure("time").IsOk());
    auto backend = f.fleet.Get("time");

    backend->SimulateExit();
    REQUIRE(f.registry.Send("time", protocol::MakeNotification("notifications/progress")).IsOk());

    CHECK(backend->Starts() == 2);
    CHECK(backend->CountSent("initialize") == 2);
    CHECK(backend->SentMethods().back() == "notifications/progress");
}

TEST_CASE("BackendRegistry: a failed write gets one restart and retry", "[registry]") {
    Fixture f;
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());
    REQUIRE(f.registry.Ensure("time").IsOk());
    auto backend = f.fleet.Get("time");

    backend->FailSends(1);
    REQUIRE(f.registry.Send("time", protocol::MakeNotification("notifications/progress")).IsOk());

    CHECK(backend->Starts() == 2);
    CHECK(backend->CountSent("notifications/progress") == 1);
}

TEST_CASE("BackendRegistry: Send to an unknown backend", "[registry]") {
    Fixture f;
    auto sent = f.registry.Send("ghost", protocol::MakeNotification("ping"));
    REQUIRE(sent.IsErr());
    CHECK(sent.Error().category == ErrorCategory::BackendNotFound);
}

TEST_CASE("BackendRegistry: breaker opens after repeated start failures", "[registry]") {
    Fixture f;
    auto backend = f.fleet.Script("flaky");
    backend->FailStarts(-1);
    REQUIRE(f.registry.RegisterPopular("flaky", Command("npx")).IsOk());

    for (int i = 0; i < 5; ++i) {
        auto ensured = f.registry.Ensure("flaky");
        REQUIRE(ensured.IsErr());
        CHECK(ensured.Error().category == ErrorCategory::ProcessStartFailure);
    }
    CHECK(backend->StartAttempts() == 5);

    auto blocked = f.registry.Send("flaky", protocol::MakeNotification("ping"));
    REQUIRE(blocked.IsErr());
    CHECK(blocked.Error().category == ErrorCategory::CircuitOpen);
    CHECK(backend->StartAttempts() == 5);

    auto status = f.registry.Describe("flaky").Value();
    CHECK(status.breaker == BreakerState::Open);
    CHECK(status.health.state == HealthState::Failed);
    CHECK_FALSE(status.health.errors.empty());
}

TEST_CASE("BackendRegistry: breaker half-opens after the recovery timeout", "[registry]") {
    ManualClock clock;
    auto options = FastOptions();
    options.breaker.failure_threshold = 2;
    options.breaker.recovery_timeout = 30s;
    Fixture f(options, clock.Fn());
    auto backend = f.fleet.Script("flaky");
    backend->FailStarts(2);
    REQUIRE(f.registry.RegisterPopular("flaky", Command("npx")).IsOk());

    CHECK(f.registry.Ensure("flaky").IsErr());
    CHECK(f.registry.Ensure("flaky").IsErr());
    CHECK(f.registry.Ensure("flaky").Error().category == ErrorCategory::CircuitOpen);

    clock.now += 31s;
    REQUIRE(f.registry.Ensure("flaky").IsOk());
    CHECK(f.registry.Describe("flaky").Value().breaker == BreakerState::Closed);
}

// ===========================================================================
// Request/reply
// ===========================================================================

TEST_CASE("BackendRegistry: Exchange keeps the caller's id", "[registry]") {
    Fixture f;
    f.fleet.Script("time")->Reply("tools/call", {{"content", {{{"type", "text"}, {"text", "12:00"}}}}});
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());

    protocol::Request request{42, "tools/call", {{"name", "get_current_time"}}};
    auto reply = f.registry.Exchange("time", request, 1s);
    REQUIRE(reply.IsOk());

    const auto* response = std::get_if<protocol::Response>(&reply.Value());
    REQUIRE(response != nullptr);
    CHECK(response->id == 42);
    CHECK(response->result["content"][0]["text"] == "12:00");

    auto sent = protocol::Decode(f.fleet.Get("time")->SentLines().back());
    REQUIRE(sent.IsOk());
    CHECK(std::get<protocol::Request>(sent.Value()).id == 42);
}

TEST_CASE("BackendRegistry: Exchange times out without failing the backend", "[registry]") {
    Fixture f;
    f.fleet.Script("time")->Silence("tools/call");
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());
    REQUIRE(f.registry.Ensure("time").IsOk());

    protocol::Request request{"slow-1", "tools/call", nlohmann::json::object()};
    auto reply = f.registry.Exchange("time", request, 50ms);
    REQUIRE(reply.IsErr());
    CHECK(reply.Error().category == ErrorCategory::ResponseTimeout);
    CHECK(reply.Error().backend == "time");

    auto status = f.registry.Describe("time").Value();
    CHECK(status.alive);
    CHECK(status.pending_requests == 0);
    CHECK(status.health.state == HealthState::Healthy);
    CHECK(status.breaker == BreakerState::Closed);
}

TEST_CASE("BackendRegistry: Call unwraps results and errors", "[registry]") {
    Fixture f;
    auto backend = f.fleet.Script("time");
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());

    SECTION("result") {
        backend->Reply("resources/read", {{"contents", nlohmann::json::array()}});
        auto result = f.registry.Call("time", "resources/read", {{"uri", "x"}}, 1s);
        REQUIRE(result.IsOk());
        CHECK(result.Value().contains("contents"));
    }

    SECTION("error reply is BackendError") {
        backend->ReplyError("tools/call", protocol::kInvalidParams, "missing timezone");
        auto result = f.registry.Call("time", "tools/call", nlohmann::json::object(), 1s);
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::BackendError);
        CHECK_THAT(result.Error().message, ContainsSubstring("missing timezone"));
        CHECK_THAT(result.Error().message, ContainsSubstring("-32602"));
    }
}

TEST_CASE("BackendRegistry: Request ids are unique per call", "[registry]") {
    Fixture f;
    auto backend = f.fleet.Script("time");
    backend->Reply("ping", nlohmann::json::object());
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());

    REQUIRE(f.registry.Request("time", "ping", nullptr, 1s).IsOk());
    REQUIRE(f.registry.Request("time", "ping", nullptr, 1s).IsOk());

    std::vector<std::string> ids;
    for (const auto& line : backend->SentLines()) {
        auto decoded = protocol::Decode(line).Value();
        if (protocol::IsRequest(decoded)) {
            ids.push_back(*protocol::IdKeyOf(decoded));
        }
    }
    std::sort(ids.begin(), ids.end());
    CHECK(std::adjacent_find(ids.begin(), ids.end()) == ids.end());
}

// ===========================================================================
// Sessions
// ===========================================================================

TEST_CASE("BackendRegistry: subscribed queues receive backend output", "[registry]") {
    Fixture f;
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());
    REQUIRE(f.registry.Ensure("time").IsOk());

    auto queue = std::make_shared<SessionQueue>(8);
    REQUIRE(f.registry.Subscribe("time", "s1", queue).IsOk());
    f.fleet.Get("time")->Emit(R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})");

    auto message = queue->TryPop();
    REQUIRE(message.has_value());
    CHECK(protocol::MethodOf(*message) == "notifications/tools/list_changed");
    CHECK(f.registry.Describe("time").Value().sessions == 1);

    f.registry.Unsubscribe("time", "s1");
    CHECK(f.registry.Describe("time").Value().sessions == 0);
}

TEST_CASE("BackendRegistry: Subscribe to an unknown backend", "[registry]") {
    Fixture f;
    auto subscribed = f.registry.Subscribe("ghost", "s1", std::make_shared<SessionQueue>(8));
    REQUIRE(subscribed.IsErr());
    CHECK(subscribed.Error().category == ErrorCategory::BackendNotFound);
}

// ===========================================================================
// Idle cleanup and monitoring hooks
// ===========================================================================

TEST_CASE("BackendRegistry: CleanupIdle removes only idle dynamic backends", "[registry]") {
    ManualClock clock;
    Fixture f(FastOptions(), clock.Fn());
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());
    REQUIRE(f.registry.Ensure("time").IsOk());
    REQUIRE(f.registry.Add("old", Command("npx")).IsOk());

    clock.now += 500s;
    REQUIRE(f.registry.Add("fresh", Command("npx")).IsOk());

    clock.now += 200s;
    auto removed = f.registry.CleanupIdle(600s);
    CHECK(removed == std::vector<std::string>{"old"});
    CHECK(f.registry.Contains("time"));
    CHECK(f.registry.Contains("fresh"));
    CHECK_FALSE(f.registry.Contains("old"));
}

TEST_CASE("BackendRegistry: traffic keeps a dynamic backend alive", "[registry]") {
    ManualClock clock;
    Fixture f(FastOptions(), clock.Fn());
    REQUIRE(f.registry.Add("fs", Command("npx")).IsOk());

    clock.now += 500s;
    REQUIRE(f.registry.Send("fs", protocol::MakeNotification("ping")).IsOk());
    clock.now += 200s;

    CHECK(f.registry.CleanupIdle(600s).empty());
    CHECK(f.registry.Describe("fs").Value().idle == 200s);
}

TEST_CASE("BackendRegistry: LiveProcesses and ReportProcessLost", "[registry]") {
    Fixture f;
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());
    REQUIRE(f.registry.RegisterPopular("idle", Command("uvx")).IsOk());
    REQUIRE(f.registry.Ensure("time").IsOk());

    auto live = f.registry.LiveProcesses();
    REQUIRE(live.size() == 1);
    CHECK(live[0].backend == "time");
    CHECK(live[0].pid == MockBackend::kFirstPid + 1);

    CHECK(f.registry.ReportProcessLost("time", MockBackend::kFirstPid + 1,
                                       "process 50001 is a zombie"));
    CHECK(f.registry.LiveProcesses().empty());
    auto status = f.registry.Describe("time").Value();
    CHECK_FALSE(status.alive);
    REQUIRE_FALSE(status.health.errors.empty());
    CHECK(status.health.errors.back() == "process 50001 is a zombie");

    REQUIRE(f.registry.Ensure("time").IsOk());
    CHECK(f.fleet.Get("time")->Starts() == 2);
}

TEST_CASE("BackendRegistry: Restart replaces the process", "[registry]") {
    Fixture f;
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());
    REQUIRE(f.registry.Ensure("time").IsOk());

    REQUIRE(f.registry.Restart("time").IsOk());
    auto backend = f.fleet.Get("time");
    CHECK(backend->Stops() == 1);
    CHECK(backend->Starts() == 2);
    CHECK(f.registry.Describe("time").Value().pid == MockBackend::kFirstPid + 2);

    CHECK(f.registry.Restart("ghost").Error().category == ErrorCategory::BackendNotFound);
}

TEST_CASE("BackendRegistry: Shutdown stops processes but keeps entries", "[registry]") {
    Fixture f;
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());
    REQUIRE(f.registry.Add("fs", Command("npx")).IsOk());
    REQUIRE(f.registry.Ensure("time").IsOk());

    f.registry.Shutdown();
    CHECK_FALSE(f.fleet.Get("time")->Alive());
    CHECK_FALSE(f.fleet.Get("fs")->Alive());
    CHECK(f.registry.List().size() == 2);
}

TEST_CASE("BackendStatus: ToJson lists env keys but not values", "[registry]") {
    Fixture f;
    auto config = Command("npx");
    config.env["TAVILY_API_KEY"] = "secret";
    REQUIRE(f.registry.RegisterPopular("tavily", config).IsOk());

    auto j = f.registry.Describe("tavily").Value().ToJson();
    CHECK(j["popular"] == true);
    CHECK(j["alive"] == false);
    CHECK(j["env_keys"] == nlohmann::json::array({"TAVILY_API_KEY"}));
    CHECK(j.dump().find("secret") == std::string::npos);
}

TEST_CASE("BackendRegistry: ReportProcessLost ignores a replaced pid", "[registry]") {
    Fixture f;
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());
    REQUIRE(f.registry.Ensure("time").IsOk());
    REQUIRE(f.registry.Restart("time").IsOk());

    CHECK_FALSE(f.registry.ReportProcessLost("time", MockBackend::kFirstPid + 1, "stale"));
    CHECK_FALSE(f.registry.ReportProcessLost("time", 0, "no pid"));
    CHECK_FALSE(f.registry.ReportProcessLost("nope", MockBackend::kFirstPid + 2, "unknown"));

    auto status = f.registry.Describe("time").Value();
    CHECK(status.alive);
    CHECK(status.pid == MockBackend::kFirstPid + 2);
    CHECK(status.health.failure_count == 0);
    CHECK(f.fleet.Get("time")->Stops() == 1);
}

namespace {

// Restarts the backend between the monitor's snapshot and its query, then
// reports the old pid as gone.
class RestartingTable : public MockProcessTable {
public:
    explicit RestartingTable(BackendRegistry& registry) : registry_(registry) {}

    std::optional<ProcessInfo> Query(int pid) override {
        queried.push_back(pid);
        restarted = registry_.Restart("time").IsOk();
        return std::nullopt;
    }

    std::vector<int> queried;
    bool restarted = false;

private:
    BackendRegistry& registry_;
};

} // anonymous namespace

TEST_CASE("BackendRegistry: monitor does not stop a backend restarted after its snapshot",
          "[registry][monitor]") {
    Fixture f;
    REQUIRE(f.registry.RegisterPopular("time", Command("uvx")).IsOk());
    REQUIRE(f.registry.Ensure("time").IsOk());

    RestartingTable table(f.registry);
    ProcessMonitor monitor(f.registry, table, MonitorOptions{});

    CHECK(monitor.CheckBackends() == 0);
    REQUIRE(table.queried == std::vector<int>{MockBackend::kFirstPid + 1});
    REQUIRE(table.restarted);

    auto status = f.registry.Describe("time").Value();
    CHECK(status.alive);
    CHECK(status.pid == MockBackend::kFirstPid + 2);
    CHECK(status.health.failure_count == 0);
    REQUIRE(f.registry.LiveProcesses().size() == 1);
    CHECK(f.registry.LiveProcesses()[0].pid == MockBackend::kFirstPid + 2);
}
