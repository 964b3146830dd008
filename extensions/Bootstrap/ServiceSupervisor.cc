/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <algorithm>
#include "ServiceSupervisor.h"
#include "Exceptions.h"
#include "Debug.h"
// -------------------------------------------------------------------------
namespace ostack
{
    // -------------------------------------------------------------------------
    ServiceSupervisor::ServiceSupervisor(const ServiceSpec& spec,
                                         std::shared_ptr<PortRegistry> ports,
                                         std::shared_ptr<ExecutableResolver> resolver,
                                         std::shared_ptr<ProcessLauncher> launcher,
                                         std::shared_ptr<HealthProbe> probe,
                                         std::shared_ptr<EndpointBoard> board,
                                         std::shared_ptr<PassiveCondTimer> abortTimer)
        : spec_(spec)
        , ports_(ports)
        , resolver_(resolver)
        , launcher_(launcher)
        , probe_(probe)
        , board_(board)
        , abort_(abortTimer)
        , mylog(std::make_shared<DebugStream>())
    {
        if (!ports_ || !resolver_ || !launcher_ || !probe_)
            throw SystemError("ServiceSupervisor(" + spec_.name + "): collaborators are not set");

        if (spec_.portRange.empty())
            throw ConfigError("ServiceSupervisor(" + spec_.name + "): empty port range");

        // timers take signed msec
        spec_.settleDelay_msec = std::min(spec_.settleDelay_msec, MaxTimeout_msec);
        spec_.probeInterval_msec = std::min(spec_.probeInterval_msec, MaxTimeout_msec);
        spec_.probeWindow_msec = std::min(spec_.probeWindow_msec, MaxTimeout_msec);

        if (!board_)
            board_ = std::make_shared<EndpointBoard>();

        if (!abort_)
            abort_ = std::make_shared<PassiveCondTimer>();

        board_->declare(spec_.name);

        state_.name = spec_.name;
        state_.required = spec_.required;
        state_.status = ServiceStatus::NotStarted;
        state_.history.push_back(ServiceStatus::NotStarted);

        mylog->setLogName(spec_.name);
    }
    // -------------------------------------------------------------------------
    std::shared_ptr<DebugStream> ServiceSupervisor::log()
    {
        return mylog;
    }
    // -------------------------------------------------------------------------
    const ServiceState& ServiceSupervisor::state() const
    {
        return state_;
    }
    // -------------------------------------------------------------------------
    const ServiceSpec& ServiceSupervisor::spec() const
    {
        return spec_;
    }
    // -------------------------------------------------------------------------
    void ServiceSupervisor::setDependencyTimeout(size_t msec)
    {
        dependencyTimeout_msec_ = std::min(msec, MaxTimeout_msec);
    }
    // -------------------------------------------------------------------------
    void ServiceSupervisor::setSoftSuccess(bool set)
    {
        softSuccess_ = set;
    }
    // -------------------------------------------------------------------------
    bool ServiceSupervisor::aborted() const
    {
        return abort_->isTerminated();
    }
    // -------------------------------------------------------------------------
    void ServiceSupervisor::enter(ServiceStatus st)
    {
        state_.status = st;
        state_.history.push_back(st);
        mylog->level2() << "-> " << to_string(st) << std::endl;
    }
    // -------------------------------------------------------------------------
    const ServiceState& ServiceSupervisor::finish(ServiceStatus st)
    {
        enter(st);

        if (st == ServiceStatus::Healthy)
        {
            board_->publish(spec_.name, state_.currentPort);
            mylog->info() << "healthy on port " << state_.currentPort
                          << (state_.softSuccess ? " (soft success)" : "")
                          << (state_.ownedByUs() ? "" : " (not launched by us)") << std::endl;
        }
        else
        {
            // dependants must not wait for us any more
            board_->fail(spec_.name, to_string(st) + (state_.lastError.empty() ? "" : ": " + state_.lastError));
            state_.currentPort = 0;

            if (st == ServiceStatus::Disabled)
                mylog->info() << "disabled" << std::endl;
            else if (st == ServiceStatus::Aborted)
                mylog->warn() << "aborted" << std::endl;
            else
                mylog->crit() << to_string(st) << ": " << state_.lastError << std::endl;
        }

        return state_;
    }
    // -------------------------------------------------------------------------
    const ServiceState& ServiceSupervisor::run()
    {
        if (isTerminal(state_.status))
            return state_;

        try
        {
            return runMachine();
        }
        catch (const std::exception& ex)
        {
            state_.lastError = "unexpected error while " + to_string(state_.status) + ": " + ex.what();
        }

        return finish(ServiceStatus::Failed);
    }
    // -------------------------------------------------------------------------
    const ServiceState& ServiceSupervisor::runMachine()
    {
        if (!spec_.enabled)
            return finish(ServiceStatus::Disabled);

        enter(ServiceStatus::Discovering);

        if (aborted())
            return finish(ServiceStatus::Aborted);

        int adopted = discover();

        if (adopted > 0)
        {
            state_.currentPort = adopted;
            enter(ServiceStatus::Bound);
            enter(ServiceStatus::Probing);

            auto r = probeWindow(0);

            if (r == ProbeResult::Healthy)
                return finish(ServiceStatus::Healthy);

            if (r == ProbeResult::Aborted)
                return finish(ServiceStatus::Aborted);

            // the running instance never answered the health check
            if (softSuccess_ && spec_.softSuccessOnBound
                    && ownerMatches(ownerOf(adopted), spec_.expectedOwnerNames))
            {
                mylog->warn() << "port " << adopted << " is held by the expected owner but the health check failed, "
                              << "accepting it as running" << std::endl;
                state_.softSuccess = true;
                return finish(ServiceStatus::Healthy);
            }

            mylog->warn() << "instance on port " << adopted << " is not healthy, launching a new one" << std::endl;
            state_.currentPort = 0;
        }

        state_.executable = resolver_->resolve(spec_.executableCandidates);

        if (state_.executable.empty())
        {
            state_.lastError = "no executable among " + std::to_string(spec_.executableCandidates.size()) + " candidate(s)";
            return finish(ServiceStatus::ExecutableNotFound);
        }

        mylog->info() << "executable: " << state_.executable << std::endl;

        enter(ServiceStatus::Launching);

        LaunchContext ctx;
        ctx.name = spec_.name;
        ctx.workDir = spec_.workDir;
        ctx.executable = state_.executable;
        ctx.host = spec_.healthCheck.host;

        if (!waitDependencies(ctx))
            return finish(aborted() ? ServiceStatus::Aborted : ServiceStatus::DependencyFailed);

        while (true)
        {
            if (aborted())
                return finish(ServiceStatus::Aborted);

            int port = pickFreePort();

            if (port == 0)
            {
                state_.lastError = "no free port in " + portRangeToString(spec_.portRange)
                                   + " (attempted: " + portRangeToString(state_.attemptedPorts) + ")";
                return finish(ServiceStatus::ExhaustedPortRange);
            }

            state_.attemptedPorts.push_back(port);
            state_.currentPort = port;

            if (!launchOn(port, ctx))
            {
                enter(ServiceStatus::Launching);
                continue;
            }

            enter(ServiceStatus::Settling);

            if (spec_.settleDelay_msec > 0 && !abort_->wait(spec_.settleDelay_msec))
                return finish(ServiceStatus::Aborted);

            enter(ServiceStatus::Probing);

            auto r = probeWindow(state_.processHandle);

            if (r == ProbeResult::Healthy)
                return finish(ServiceStatus::Healthy);

            if (r == ProbeResult::Aborted)
                return finish(ServiceStatus::Aborted);

            if (r == ProbeResult::ProcessDied)
                state_.lastError = "process " + std::to_string(state_.processHandle) + " exited on port " + std::to_string(port);
            else
            {
                state_.lastError = "not healthy on port " + std::to_string(port)
                                   + " within " + std::to_string(spec_.probeWindow_msec) + " msec";

                mylog->warn() << "PID " << state_.processHandle << " on port " << port
                              << " did not become healthy, left running" << std::endl;
            }

            mylog->warn() << state_.lastError << ", trying the next port" << std::endl;
            enter(ServiceStatus::Launching);
        }
    }
    // -------------------------------------------------------------------------
    int ServiceSupervisor::discover()
    {
        for (const auto& port : spec_.portRange)
        {
            if (aborted())
                return 0;

            if (!ports_->isBound(port))
                continue;

            auto owner = ownerOf(port);

            if (ownerMatches(owner, spec_.expectedOwnerNames))
            {
                mylog->info() << "already running on port " << port
                              << " (" << owner.name << ", PID " << owner.pid << ")" << std::endl;
                return port;
            }

            mylog->level3() << "port " << port << " is busy ("
                            << (owner.known() ? owner.name : std::string("unknown owner")) << ")" << std::endl;
        }

        return 0;
    }
    // -------------------------------------------------------------------------
    ProcessIdentity ServiceSupervisor::ownerOf(int port)
    {
        try
        {
            return ports_->ownerOf(port);
        }
        catch (const std::exception& ex)
        {
            mylog->level5() << "owner of port " << port << " is unknown: " << ex.what() << std::endl;
        }

        return ProcessIdentity();
    }
    // -------------------------------------------------------------------------
    bool ServiceSupervisor::waitDependencies(LaunchContext& ctx)
    {
        PassiveTimer deadline(dependencyTimeout_msec_);

        auto waitOne = [&](const std::string& dep, bool hard) -> bool
        {
            int port = 0;
            std::string reason;
            EndpointBoard::WaitResult r = EndpointBoard::WaitResult::Failed;

            mylog->level3() << "waiting for " << dep << (hard ? "" : " (optional)") << std::endl;

            try
            {
                r = board_->wait(dep, deadline.timeLeft(), port, reason);
            }
            catch (const NameNotFound& ex)
            {
                reason = ex.what();
            }

            if (r == EndpointBoard::WaitResult::Ready)
            {
                ctx.upstream[dep] = port;
                mylog->info() << "using " << dep << " on port " << port << std::endl;
                return true;
            }

            if (r == EndpointBoard::WaitResult::Aborted)
                return false;

            if (r == EndpointBoard::WaitResult::TimedOut)
                reason = "timeout " + std::to_string(dependencyTimeout_msec_) + " msec";

            if (!hard)
            {
                mylog->info() << dep << " is not available (" << reason << "), starting without it" << std::endl;
                return true;
            }

            state_.lastError = "dependency '" + dep + "' is not healthy: " + reason;
            return false;
        };

        for (const auto& dep : spec_.dependsOn)
        {
            if (!waitOne(dep, true))
                return false;
        }

        for (const auto& dep : spec_.uses)
        {
            if (!waitOne(dep, false))
                return false;
        }

        return true;
    }
    // -------------------------------------------------------------------------
    int ServiceSupervisor::pickFreePort()
    {
        for (const auto& port : spec_.portRange)
        {
            if (std::find(state_.attemptedPorts.begin(), state_.attemptedPorts.end(), port) != state_.attemptedPorts.end())
                continue;

            if (ports_->isBound(port))
            {
                mylog->level3() << "port " << port << " is busy, skip" << std::endl;
                continue;
            }

            return port;
        }

        return 0;
    }
    // -------------------------------------------------------------------------
    bool ServiceSupervisor::launchOn(int port, LaunchContext& ctx)
    {
        ctx.port = port;
        state_.launches++;

        try
        {
            if (spec_.preLaunch)
                spec_.preLaunch(ctx);

            LaunchRequest req;
            req.name = spec_.name;
            req.executable = state_.executable;
            req.workDir = spec_.workDir;
            req.logFile = spec_.logFile;

            if (spec_.argsBuilder)
                req.args = spec_.argsBuilder(ctx);

            if (spec_.envOverlay)
                req.env = spec_.envOverlay(ctx);

            state_.processHandle = launcher_->launch(req);
            mylog->info() << "launched on port " << port << " (PID " << state_.processHandle << ")" << std::endl;
            return true;
        }
        catch (const std::exception& ex)
        {
            state_.lastError = ex.what();
            mylog->crit() << "launch on port " << port << " failed: " << ex.what() << std::endl;
        }

        return false;
    }
    // -------------------------------------------------------------------------
    ServiceSupervisor::ProbeResult ServiceSupervisor::probeWindow(pid_t child)
    {
        PassiveTimer window(spec_.probeWindow_msec);
        int attempt = 0;

        while (true)
        {
            if (aborted())
                return ProbeResult::Aborted;

            if (child > 0 && !launcher_->isAlive(child))
                return ProbeResult::ProcessDied;

            attempt++;
            bool ok = false;

            try
            {
                ok = probe_->probe(spec_.healthCheck, state_.currentPort);
            }
            catch (const std::exception& ex)
            {
                mylog->level4() << "probe #" << attempt << " on port " << state_.currentPort
                                << " error: " << ex.what() << std::endl;
            }

            if (ok)
            {
                mylog->level3() << "probe #" << attempt << " on port " << state_.currentPort << " OK" << std::endl;
                return ProbeResult::Healthy;
            }

            mylog->level4() << "probe #" << attempt << " on port " << state_.currentPort << " failed" << std::endl;

            if (window.checkTime())
                return ProbeResult::Timeout;

            if (!abort_->waitWithin(spec_.probeInterval_msec, window))
                return ProbeResult::Aborted;
        }
    }
    // -------------------------------------------------------------------------
} // end of namespace ostack
