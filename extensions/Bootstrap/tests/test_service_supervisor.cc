/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <catch.hpp>
#include <thread>
#include <atomic>
#include <algorithm>
#include <limits>
#include "ServiceSupervisor.h"
#include "FakeServices.h"
#include "PassiveTimer.h"
// -------------------------------------------------------------------------
using namespace ostack;
using namespace std::chrono;
// -------------------------------------------------------------------------
struct SupervisorFixture
{
    std::shared_ptr<FakePortRegistry> ports = std::make_shared<FakePortRegistry>();
    std::shared_ptr<FakeResolver> resolver = std::make_shared<FakeResolver>();
    std::shared_ptr<FakeLauncher> launcher = std::make_shared<FakeLauncher>();
    std::shared_ptr<FakeProbe> probe = std::make_shared<FakeProbe>();
    std::shared_ptr<EndpointBoard> board = std::make_shared<EndpointBoard>();
    std::shared_ptr<PassiveCondTimer> abortTimer = std::make_shared<PassiveCondTimer>();

    std::shared_ptr<ServiceSupervisor> make(const ServiceSpec& spec)
    {
        return std::make_shared<ServiceSupervisor>(spec, ports, resolver, launcher, probe, board, abortTimer);
    }
};
// -------------------------------------------------------------------------
static bool noDuplicates(const std::vector<int>& v)
{
    std::vector<int> s(v);
    std::sort(s.begin(), s.end());
    return std::adjacent_find(s.begin(), s.end()) == s.end();
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: launch on the first free port", "[supervisor]")
{
    auto spec = makeTestSpec("prometheus", {9090, 9091});
    probe->setHealthy(9090);

    auto sup = make(spec);
    auto st = sup->run();

    REQUIRE(st.status == ServiceStatus::Healthy);
    REQUIRE(st.currentPort == 9090);
    REQUIRE(st.attemptedPorts == std::vector<int>{9090});
    REQUIRE(launcher->launches() == 1);
    REQUIRE(st.ownedByUs());
    REQUIRE_FALSE(st.softSuccess);
    REQUIRE(st.executable == resolver->path);

    REQUIRE(launcher->requests[0].executable == resolver->path);
    REQUIRE(launcher->requests[0].args == std::vector<std::string>({"--port", "9090"}));

    std::vector<ServiceStatus> expected =
    {
        ServiceStatus::NotStarted,
        ServiceStatus::Discovering,
        ServiceStatus::Launching,
        ServiceStatus::Settling,
        ServiceStatus::Probing,
        ServiceStatus::Healthy
    };

    REQUIRE(st.history == expected);
    REQUIRE(board->peek("prometheus") == 9090);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: port held by the expected owner is reused", "[supervisor][bound]")
{
    auto spec = makeTestSpec("prometheus", {9090});
    ports->bind(9090, "Prometheus", 777);
    probe->setHealthy(9090);

    auto st = make(spec)->run();

    REQUIRE(st.status == ServiceStatus::Healthy);
    REQUIRE(st.currentPort == 9090);
    REQUIRE_FALSE(st.ownedByUs());
    REQUIRE_FALSE(st.softSuccess);
    REQUIRE(st.attemptedPorts.empty());
    REQUIRE(launcher->launches() == 0);
    REQUIRE(resolver->calls == 0);

    std::vector<ServiceStatus> expected =
    {
        ServiceStatus::NotStarted,
        ServiceStatus::Discovering,
        ServiceStatus::Bound,
        ServiceStatus::Probing,
        ServiceStatus::Healthy
    };

    REQUIRE(st.history == expected);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: second run against a healthy stack launches nothing", "[supervisor][bound]")
{
    auto spec = makeTestSpec("grafana", {3000, 3001}, {"grafana-server"});
    probe->setHealthy(3000);

    // the first run launches and the "process" takes the port
    launcher->onLaunch = [this](const LaunchRequest&, pid_t pid)
    {
        ports->bind(3000, "grafana-server", pid);
    };

    auto first = make(spec)->run();
    REQUIRE(first.status == ServiceStatus::Healthy);
    REQUIRE(launcher->launches() == 1);

    board = std::make_shared<EndpointBoard>();
    auto second = make(spec)->run();
    REQUIRE(second.status == ServiceStatus::Healthy);
    REQUIRE(second.currentPort == 3000);
    REQUIRE_FALSE(second.ownedByUs());
    REQUIRE(launcher->launches() == 1);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: long owner name seen through a truncated comm", "[supervisor][bound]")
{
    auto spec = makeTestSpec("dashboard", {8000, 8001}, {"obstack-dashboard"});
    ports->bind(8000, "obstack-dashboa", 4242);
    probe->setHealthy(8000);

    auto st = make(spec)->run();

    REQUIRE(st.status == ServiceStatus::Healthy);
    REQUIRE(st.currentPort == 8000);
    REQUIRE_FALSE(st.ownedByUs());
    REQUIRE(st.attemptedPorts.empty());
    REQUIRE(launcher->launches() == 0);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: soft success on an unresponsive expected owner", "[supervisor][bound]")
{
    auto spec = makeTestSpec("influxdb", {8086}, {"influxd"});
    ports->bind(8086, "influxd");

    PassiveTimer pt;
    auto st = make(spec)->run();

    REQUIRE(st.status == ServiceStatus::Healthy);
    REQUIRE(st.softSuccess);
    REQUIRE(st.currentPort == 8086);
    REQUIRE(launcher->launches() == 0);
    REQUIRE(probe->count() >= 2);
    // the probe window is a hard ceiling
    REQUIRE(pt.getCurrent() >= (timeout_t)spec.probeWindow_msec);
    REQUIRE(pt.getCurrent() < 2000);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: soft success can be switched off", "[supervisor][bound]")
{
    auto spec = makeTestSpec("influxdb", {8086, 8087}, {"influxd"});
    ports->bind(8086, "influxd");
    probe->setHealthy(8087);

    SECTION("per service")
    {
        spec.softSuccessOnBound = false;
        auto st = make(spec)->run();

        REQUIRE(st.status == ServiceStatus::Healthy);
        REQUIRE_FALSE(st.softSuccess);
        REQUIRE(st.currentPort == 8087);
        REQUIRE(st.attemptedPorts == std::vector<int>{8087});
        REQUIRE(launcher->launches() == 1);
    }

    SECTION("globally")
    {
        auto sup = make(spec);
        sup->setSoftSuccess(false);
        auto st = sup->run();

        REQUIRE(st.currentPort == 8087);
        REQUIRE(launcher->launches() == 1);
    }
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: port held by an unrelated process", "[supervisor][ports]")
{
    auto spec = makeTestSpec("prometheus", {9090});
    ports->bind(9090, "nginx");

    auto st = make(spec)->run();

    REQUIRE(st.status == ServiceStatus::ExhaustedPortRange);
    REQUIRE(st.attemptedPorts.empty());
    REQUIRE(st.currentPort == 0);
    REQUIRE(launcher->launches() == 0);
    REQUIRE_FALSE(st.lastError.empty());
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: unknown owner is not ours", "[supervisor][ports]")
{
    auto spec = makeTestSpec("prometheus", {9090, 9091});
    ports->bind(9090);  // owner can't be determined
    probe->setHealthy(9091);

    auto st = make(spec)->run();

    REQUIRE(st.status == ServiceStatus::Healthy);
    REQUIRE(st.currentPort == 9091);
    REQUIRE(st.attemptedPorts == std::vector<int>{9091});
    REQUIRE(launcher->launches() == 1);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: executable not found", "[supervisor]")
{
    auto spec = makeTestSpec("grafana", {3000, 3001});
    resolver->path = "";

    auto st = make(spec)->run();

    REQUIRE(st.status == ServiceStatus::ExecutableNotFound);
    REQUIRE(st.attemptedPorts.empty());
    REQUIRE(st.currentPort == 0);
    REQUIRE(launcher->launches() == 0);
    REQUIRE(probe->count() == 0);

    int port = 0;
    std::string reason;
    REQUIRE(board->wait("grafana", 0, port, reason) == EndpointBoard::WaitResult::Failed);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: unhealthy launch advances to the next port", "[supervisor][retry]")
{
    auto spec = makeTestSpec("dashboard", {8000, 8001, 8002});
    probe->setHealthy(8001);

    auto st = make(spec)->run();

    REQUIRE(st.status == ServiceStatus::Healthy);
    REQUIRE(st.currentPort == 8001);
    REQUIRE(st.attemptedPorts == std::vector<int>({8000, 8001}));
    REQUIRE(launcher->launches() == 2);
    REQUIRE(launcher->requests[1].args == std::vector<std::string>({"--port", "8001"}));

    // the first child is left running
    REQUIRE(launcher->dead.empty());
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: port range exhausted by unhealthy launches", "[supervisor][retry]")
{
    auto spec = makeTestSpec("dashboard", {8000, 8001, 8002});
    ports->bind(8001, "python3");

    auto st = make(spec)->run();

    REQUIRE(st.status == ServiceStatus::ExhaustedPortRange);
    REQUIRE(st.attemptedPorts == std::vector<int>({8000, 8002}));
    REQUIRE(st.attemptedPorts.size() <= spec.portRange.size());
    REQUIRE(noDuplicates(st.attemptedPorts));
    REQUIRE(launcher->launches() == 2);
    REQUIRE(st.currentPort == 0);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: launch error counts as an attempt", "[supervisor][retry]")
{
    auto spec = makeTestSpec("prometheus", {9090, 9091});
    launcher->failures = 1;
    probe->setHealthy(9091);

    auto st = make(spec)->run();

    REQUIRE(st.status == ServiceStatus::Healthy);
    REQUIRE(st.attemptedPorts == std::vector<int>({9090, 9091}));
    REQUIRE(st.launches == 2);
    REQUIRE(launcher->launches() == 1);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: health check error counts as a failed attempt", "[supervisor][retry]")
{
    SECTION("next port")
    {
        auto spec = makeTestSpec("prometheus", {9090, 9091});
        probe->broken.insert(9090);
        probe->setHealthy(9091);

        auto st = make(spec)->run();

        REQUIRE(st.status == ServiceStatus::Healthy);
        REQUIRE(st.currentPort == 9091);
        REQUIRE(st.attemptedPorts == std::vector<int>({9090, 9091}));
        REQUIRE(std::count(probe->probes.begin(), probe->probes.end(), 9090) > 1);
    }

    SECTION("whole range")
    {
        auto spec = makeTestSpec("prometheus", {9090});
        probe->broken.insert(9090);

        auto st = make(spec)->run();

        REQUIRE(st.status == ServiceStatus::ExhaustedPortRange);
        REQUIRE(st.currentPort == 0);
        REQUIRE_FALSE(st.lastError.empty());
    }
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: owner lookup error means unknown owner", "[supervisor][ports]")
{
    auto spec = makeTestSpec("prometheus", {9090, 9091});
    ports->bind(9090, "prometheus");
    ports->ownerErrors = true;
    probe->setHealthy(9091);

    auto st = make(spec)->run();

    REQUIRE(st.status == ServiceStatus::Healthy);
    REQUIRE(st.currentPort == 9091);
    REQUIRE(st.attemptedPorts == std::vector<int>{9091});
    REQUIRE(launcher->launches() == 1);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: unexpected error ends in Failed", "[supervisor]")
{
    auto spec = makeTestSpec("prometheus", {9090});
    ports->tableErrors = true;

    auto sup = make(spec);
    auto st = sup->run();

    REQUIRE(st.status == ServiceStatus::Failed);
    REQUIRE(isTerminal(st.status));
    REQUIRE(st.currentPort == 0);
    REQUIRE(st.lastError.find("Discovering") != std::string::npos);
    REQUIRE(st.lastError.find("fake port table is broken") != std::string::npos);
    REQUIRE(launcher->launches() == 0);

    int port = 0;
    std::string reason;
    REQUIRE(board->wait("prometheus", 0, port, reason) == EndpointBoard::WaitResult::Failed);

    // terminal state is kept
    ports->tableErrors = false;
    REQUIRE(sup->run().status == ServiceStatus::Failed);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: no probe before the settle delay", "[supervisor][timing]")
{
    auto spec = makeTestSpec("grafana", {3000});
    spec.settleDelay_msec = 300;
    probe->setHealthy(3000);

    auto st = make(spec)->run();

    REQUIRE(st.status == ServiceStatus::Healthy);
    REQUIRE(launcher->launchTime.size() == 1);
    REQUIRE_FALSE(probe->probeTime.empty());

    auto started = launcher->launchTime.begin()->second;
    auto firstProbe = probe->probeTime.front();
    REQUIRE(duration_cast<milliseconds>(firstProbe - started).count() >= 300);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: dead child cuts the probe window short", "[supervisor][timing]")
{
    auto spec = makeTestSpec("influxdb", {8086, 8087});
    spec.probeWindow_msec = 5000;
    probe->setHealthy(8087);

    launcher->onLaunch = [this](const LaunchRequest&, pid_t pid)
    {
        if (pid == 5000)
        {
            std::lock_guard<std::mutex> lock(launcher->mut);
            launcher->dead.insert(pid);
        }
    };

    PassiveTimer pt;
    auto st = make(spec)->run();

    REQUIRE(st.status == ServiceStatus::Healthy);
    REQUIRE(st.currentPort == 8087);
    REQUIRE(st.attemptedPorts == std::vector<int>({8086, 8087}));
    REQUIRE(pt.getCurrent() < 2000);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: dependant waits for the upstream port", "[supervisor][dependency]")
{
    auto upstream = makeTestSpec("prometheus", {9090});
    auto spec = makeTestSpec("grafana", {3000});
    spec.dependsOn = { "prometheus" };

    std::atomic<int> seenPort{-1};
    spec.argsBuilder = [&seenPort](const LaunchContext & ctx)
    {
        seenPort = ctx.portOf("prometheus");
        return std::vector<std::string> { "--prometheus", ctx.urlOf("prometheus") };
    };

    probe->setHealthy(3000);
    board->declare("prometheus");

    auto sup = make(spec);
    std::thread thr([sup]()
    {
        sup->run();
    });

    std::this_thread::sleep_for(milliseconds(200));
    REQUIRE(launcher->launches() == 0);
    REQUIRE(seenPort == -1);

    board->publish("prometheus", 9095);
    thr.join();

    REQUIRE(sup->state().status == ServiceStatus::Healthy);
    REQUIRE(seenPort == 9095);
    REQUIRE(launcher->requests[0].args[1] == "http://127.0.0.1:9095");
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: huge dependency timeout still waits", "[supervisor][dependency]")
{
    auto spec = makeTestSpec("grafana", {3000});
    spec.dependsOn = { "prometheus" };
    spec.probeWindow_msec = std::numeric_limits<size_t>::max();
    probe->setHealthy(3000);
    board->declare("prometheus");

    auto sup = make(spec);
    sup->setDependencyTimeout(std::numeric_limits<size_t>::max());

    std::thread thr([sup]()
    {
        sup->run();
    });

    std::this_thread::sleep_for(milliseconds(100));
    REQUIRE(launcher->launches() == 0);

    board->publish("prometheus", 9090);
    thr.join();

    REQUIRE(sup->state().status == ServiceStatus::Healthy);
    REQUIRE(sup->spec().probeWindow_msec == MaxTimeout_msec);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: upstream which never becomes healthy", "[supervisor][dependency]")
{
    auto spec = makeTestSpec("grafana", {3000});
    spec.dependsOn = { "prometheus" };
    probe->setHealthy(3000);
    board->declare("prometheus");

    SECTION("timeout")
    {
        auto sup = make(spec);
        sup->setDependencyTimeout(150);
        auto st = sup->run();

        REQUIRE(st.status == ServiceStatus::DependencyFailed);
        REQUIRE(st.lastError.find("prometheus") != std::string::npos);
    }

    SECTION("upstream failed")
    {
        board->fail("prometheus", "ExhaustedPortRange");
        auto st = make(spec)->run();

        REQUIRE(st.status == ServiceStatus::DependencyFailed);
    }

    SECTION("upstream is not declared")
    {
        spec.dependsOn = { "unknown" };
        auto st = make(spec)->run();

        REQUIRE(st.status == ServiceStatus::DependencyFailed);
    }

    REQUIRE(launcher->launches() == 0);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: optional upstream is left out", "[supervisor][dependency]")
{
    auto spec = makeTestSpec("dashboard", {8000});
    spec.uses = { "prometheus", "influxdb" };
    spec.envOverlay = [](const LaunchContext & ctx)
    {
        std::map<std::string, std::string> env;

        if (ctx.hasUpstream("prometheus"))
            env["OBSTACK_METRICS_URL"] = ctx.urlOf("prometheus");

        if (ctx.hasUpstream("influxdb"))
            env["OBSTACK_INFLUX_URL"] = ctx.urlOf("influxdb");

        return env;
    };

    probe->setHealthy(8000);
    board->declare("prometheus");
    board->declare("influxdb");
    board->fail("prometheus", "ExecutableNotFound");
    board->publish("influxdb", 8086);

    auto st = make(spec)->run();

    REQUIRE(st.status == ServiceStatus::Healthy);
    REQUIRE(launcher->launches() == 1);

    const auto& env = launcher->requests[0].env;
    REQUIRE(env.find("OBSTACK_METRICS_URL") == env.end());
    REQUIRE(env.at("OBSTACK_INFLUX_URL") == "http://127.0.0.1:8086");
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: abort before start", "[supervisor][abort]")
{
    auto spec = makeTestSpec("prometheus", {9090});
    probe->setHealthy(9090);
    abortTimer->terminate();

    auto st = make(spec)->run();

    REQUIRE(st.status == ServiceStatus::Aborted);
    REQUIRE(launcher->launches() == 0);
    REQUIRE(probe->count() == 0);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: abort interrupts the settle delay", "[supervisor][abort]")
{
    auto spec = makeTestSpec("grafana", {3000, 3001});
    spec.settleDelay_msec = 10000;
    probe->setHealthy(3000);

    auto sup = make(spec);
    PassiveTimer pt;

    std::thread thr([this]()
    {
        std::this_thread::sleep_for(milliseconds(100));
        abortTimer->terminate();
    });

    auto st = sup->run();
    thr.join();

    REQUIRE(st.status == ServiceStatus::Aborted);
    REQUIRE(pt.getCurrent() < 3000);
    REQUIRE(launcher->launches() == 1);
    REQUIRE(probe->count() == 0);
    // the launched child is not killed
    REQUIRE(launcher->dead.empty());
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: abort stops retries", "[supervisor][abort]")
{
    auto spec = makeTestSpec("dashboard", {8000, 8001, 8002, 8003});
    spec.probeWindow_msec = 10000;
    spec.probeInterval_msec = 50;

    auto sup = make(spec);

    std::thread thr([this]()
    {
        std::this_thread::sleep_for(milliseconds(150));
        abortTimer->terminate();
    });

    auto st = sup->run();
    thr.join();

    REQUIRE(st.status == ServiceStatus::Aborted);
    REQUIRE(launcher->launches() == 1);
    REQUIRE(st.attemptedPorts == std::vector<int>{8000});

    // dependants stop waiting
    int port = 0;
    std::string reason;
    REQUIRE(board->wait("dashboard", 0, port, reason) == EndpointBoard::WaitResult::Failed);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: disabled service", "[supervisor]")
{
    auto spec = makeTestSpec("influxdb", {8086});
    spec.enabled = false;

    auto st = make(spec)->run();

    REQUIRE(st.status == ServiceStatus::Disabled);
    REQUIRE(launcher->launches() == 0);
    REQUIRE(ports->queries == 0);
}
// -------------------------------------------------------------------------
TEST_CASE_METHOD(SupervisorFixture, "ServiceSupervisor: bad construction", "[supervisor]")
{
    auto spec = makeTestSpec("influxdb", {});
    REQUIRE_THROWS_AS(make(spec), ConfigError);

    spec.portRange = { 8086 };
    REQUIRE_THROWS_AS(std::make_shared<ServiceSupervisor>(spec, nullptr, resolver, launcher, probe, board, abortTimer), SystemError);
}
// -------------------------------------------------------------------------
