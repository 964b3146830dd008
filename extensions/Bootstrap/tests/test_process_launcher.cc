/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <catch.hpp>
#include <fstream>
#include <sstream>
#include <thread>
#include "ProcessLauncher.h"
#include "ExecutableResolver.h"
#include "FakeServices.h"
#include "PassiveTimer.h"
// -------------------------------------------------------------------------
using namespace ostack;
// -------------------------------------------------------------------------
static bool waitDead(PocoProcessLauncher& l, pid_t pid, timeout_t msec)
{
    PassiveTimer pt(msec);

    while (!pt.checkTime())
    {
        if (!l.isAlive(pid))
            return true;

        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    return !l.isAlive(pid);
}
// -------------------------------------------------------------------------
static std::string readFile(const std::string& fname)
{
    std::ifstream f(fname);
    std::stringstream s;
    s << f.rdbuf();
    return s.str();
}
// -------------------------------------------------------------------------
TEST_CASE("PocoProcessLauncher: command line", "[launcher]")
{
    PocoProcessLauncher l;

    LaunchRequest req;
    req.name = "prometheus";
    req.executable = "/usr/bin/prometheus";
    req.args = { "--web.listen-address=127.0.0.1:9091" };

    SECTION("attached, no log")
    {
        l.setDetach(false);
        REQUIRE_FALSE(l.detach());
        REQUIRE(l.buildCommandLine(req) == std::vector<std::string>({"/usr/bin/prometheus", "--web.listen-address=127.0.0.1:9091"}));
    }

    SECTION("attached, output to log file")
    {
        l.setDetach(false);
        req.logFile = "/tmp/obstack/logs/prometheus.log";
        auto cmd = l.buildCommandLine(req);

        REQUIRE(cmd.size() == 6);
        REQUIRE(cmd[1] == "-c");
        REQUIRE(cmd[3] == req.logFile);
        REQUIRE(cmd[4] == req.executable);
        REQUIRE(cmd[5] == req.args[0]);
    }

    SECTION("detached")
    {
        REQUIRE(l.detach());
        auto cmd = l.buildCommandLine(req);
        std::string setsid = FileExecutableResolver::findInPath("setsid");

        if (setsid.empty())
            REQUIRE(cmd.front() == req.executable);
        else
        {
            REQUIRE(cmd.front() == setsid);
            REQUIRE(cmd[1] == req.executable);
        }
    }
}
// -------------------------------------------------------------------------
TEST_CASE("PocoProcessLauncher: launch", "[launcher][process]")
{
    TempDir dir;
    PocoProcessLauncher l;

    LaunchRequest req;
    req.name = "test";
    req.executable = FileExecutableResolver::findInPath("sh");
    req.workDir = dir.path;
    REQUIRE_FALSE(req.executable.empty());

    SECTION("child is alive, then reaped")
    {
        req.args = { "-c", "sleep 0.3" };
        pid_t pid = l.launch(req);

        REQUIRE(pid > 0);
        REQUIRE(l.isAlive(pid));
        REQUIRE(waitDead(l, pid, 5000));
    }

    SECTION("output, environment and working directory")
    {
        req.args = { "-c", "echo \"$OBSTACK_TEST_VAR\"; pwd" };
        req.env["OBSTACK_TEST_VAR"] = "hello";
        req.logFile = dir.path + "/logs/test.log";

        pid_t pid = l.launch(req);
        REQUIRE(waitDead(l, pid, 5000));

        std::string out = readFile(req.logFile);
        REQUIRE(out.find("hello") != std::string::npos);
        REQUIRE(out.find(Poco::Path(dir.path).getFileName()) != std::string::npos);
    }

    SECTION("log file is appended")
    {
        req.logFile = dir.file("test.log", "previous run\n");
        req.args = { "-c", "echo next run" };

        pid_t pid = l.launch(req);
        REQUIRE(waitDead(l, pid, 5000));

        std::string out = readFile(req.logFile);
        REQUIRE(out.find("previous run") == 0);
        REQUIRE(out.find("next run") != std::string::npos);
    }
}
// -------------------------------------------------------------------------
TEST_CASE("PocoProcessLauncher: isAlive", "[launcher]")
{
    PocoProcessLauncher l;
    REQUIRE_FALSE(l.isAlive(0));
    REQUIRE_FALSE(l.isAlive(-1));
    REQUIRE(l.isAlive(::getpid()));
}
// -------------------------------------------------------------------------
