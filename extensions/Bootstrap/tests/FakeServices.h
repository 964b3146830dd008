/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef FakeServices_H_
#define FakeServices_H_
// -------------------------------------------------------------------------
#include <map>
#include <set>
#include <vector>
#include <mutex>
#include <chrono>
#include <functional>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <Poco/File.h>
#include <Poco/Path.h>
#include <Poco/TemporaryFile.h>
#include "PortRegistry.h"
#include "ExecutableResolver.h"
#include "ProcessLauncher.h"
#include "HealthProbe.h"
#include "Exceptions.h"
// -------------------------------------------------------------------------
namespace ostack
{
    // ports are bound by hand, no sockets
    class FakePortRegistry:
        public PortRegistry
    {
        public:
            bool isBound(int port) override
            {
                std::lock_guard<std::mutex> lock(mut);
                queries++;

                if (tableErrors)
                    throw SystemError("fake port table is broken");

                return bound.find(port) != bound.end();
            }

            ProcessIdentity ownerOf(int port) override
            {
                std::lock_guard<std::mutex> lock(mut);
                queries++;

                if (ownerErrors)
                    throw SystemError("fake owner lookup is broken");

                auto it = bound.find(port);

                if (it == bound.end())
                    return ProcessIdentity();

                return it->second;
            }

            void bind(int port, const std::string& name = "", pid_t pid = 0)
            {
                std::lock_guard<std::mutex> lock(mut);
                ProcessIdentity id;
                id.name = name;
                id.pid = name.empty() ? 0 : (pid > 0 ? pid : 100 + port);
                bound[port] = id;
            }

            void release(int port)
            {
                std::lock_guard<std::mutex> lock(mut);
                bound.erase(port);
            }

            std::mutex mut;
            std::map<int, ProcessIdentity> bound;
            int queries = 0;
            bool tableErrors = false;
            bool ownerErrors = false;
    };

    class FakeResolver:
        public ExecutableResolver
    {
        public:
            explicit FakeResolver(const std::string& p = "/opt/fake/bin/service"): path(p) {}

            std::string resolve(const std::vector<std::string>& candidates) override
            {
                std::lock_guard<std::mutex> lock(mut);
                calls++;
                return path;
            }

            std::mutex mut;
            std::string path;
            int calls = 0;
    };

    // records requests, never starts anything
    class FakeLauncher:
        public ProcessLauncher
    {
        public:
            pid_t launch(const LaunchRequest& req) override
            {
                std::function<void(const LaunchRequest&, pid_t)> cb;
                pid_t pid = 0;

                {
                    std::lock_guard<std::mutex> lock(mut);

                    if (failures > 0)
                    {
                        failures--;
                        throw SystemError("fake launch failure");
                    }

                    pid = nextPid++;
                    requests.push_back(req);
                    launchTime[pid] = std::chrono::steady_clock::now();
                    cb = onLaunch;
                }

                if (cb)
                    cb(req, pid);

                return pid;
            }

            bool isAlive(pid_t pid) override
            {
                std::lock_guard<std::mutex> lock(mut);
                return dead.find(pid) == dead.end();
            }

            size_t launches()
            {
                std::lock_guard<std::mutex> lock(mut);
                return requests.size();
            }

            std::mutex mut;
            std::vector<LaunchRequest> requests;
            std::map<pid_t, std::chrono::steady_clock::time_point> launchTime;
            std::set<pid_t> dead;
            std::function<void(const LaunchRequest&, pid_t)> onLaunch;
            int failures = 0;
            pid_t nextPid = 5000;
    };

    // healthy ports are set by hand
    class FakeProbe:
        public HealthProbe
    {
        public:
            bool probe(const HealthCheck& check, int port) override
            {
                std::lock_guard<std::mutex> lock(mut);
                probes.push_back(port);
                probeTime.push_back(std::chrono::steady_clock::now());

                if (broken.find(port) != broken.end())
                    throw std::runtime_error("fake probe error on port " + std::to_string(port));

                return healthy.find(port) != healthy.end();
            }

            void setHealthy(int port)
            {
                std::lock_guard<std::mutex> lock(mut);
                healthy.insert(port);
            }

            size_t count()
            {
                std::lock_guard<std::mutex> lock(mut);
                return probes.size();
            }

            std::mutex mut;
            std::set<int> healthy;
            std::set<int> broken;   // probe throws
            std::vector<int> probes;
            std::vector<std::chrono::steady_clock::time_point> probeTime;
    };

    // directory removed with its content at scope exit
    struct TempDir
    {
        std::string path;

        TempDir()
            : path(Poco::TemporaryFile::tempName())
        {
            Poco::File(path).createDirectories();
        }

        ~TempDir()
        {
            try
            {
                Poco::File(path).remove(true);
            }
            catch (const Poco::Exception& ex)
            {
                std::cerr << "(TempDir): " << ex.displayText() << std::endl;
            }
        }

        std::string file(const std::string& name, const std::string& content = "", bool exec = false) const
        {
            std::string p = path + "/" + name;
            Poco::File(Poco::Path(p).parent()).createDirectories();
            {
                std::ofstream f(p);
                f << content;
            }

            if (exec)
                Poco::File(p).setExecutable(true);

            return p;
        }
    };

    // short timings for tests
    inline ServiceSpec makeTestSpec(const std::string& name, const std::vector<int>& ports,
                                    const std::set<std::string>& owners = {})
    {
        ServiceSpec s;
        s.name = name;
        s.executableCandidates = { "/opt/fake/bin/" + name };
        s.portRange = ports;
        s.expectedOwnerNames = owners.empty() ? std::set<std::string> { name } : owners;
        s.healthCheck = parseHealthCheck("http:/health");
        s.settleDelay_msec = 0;
        s.probeInterval_msec = 10;
        s.probeWindow_msec = 100;
        s.argsBuilder = [](const LaunchContext & ctx)
        {
            return std::vector<std::string> { "--port", std::to_string(ctx.port) };
        };
        return s;
    }

} // end of namespace ostack
// -------------------------------------------------------------------------
#endif // FakeServices_H_
// -------------------------------------------------------------------------
