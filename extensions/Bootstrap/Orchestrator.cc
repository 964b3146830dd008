/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <thread>
#include <algorithm>
#include <set>
#include "Orchestrator.h"
#include "DependencyResolver.h"
#include "Exceptions.h"
#include "Debug.h"
// -------------------------------------------------------------------------
namespace ostack
{
    // -------------------------------------------------------------------------
    Orchestrator::Orchestrator(std::shared_ptr<PortRegistry> ports,
                               std::shared_ptr<ExecutableResolver> resolver,
                               std::shared_ptr<ProcessLauncher> launcher,
                               std::shared_ptr<HealthProbe> probe)
        : ports_(ports)
        , resolver_(resolver)
        , launcher_(launcher)
        , probe_(probe)
        , board_(std::make_shared<EndpointBoard>())
        , abortTimer_(std::make_shared<PassiveCondTimer>())
        , mylog(std::make_shared<DebugStream>())
    {
        mylog->setLogName("Orchestrator");
    }
    // -------------------------------------------------------------------------
    Orchestrator::~Orchestrator()
    {
        for (auto& c : conmap)
            c.second.disconnect();
    }
    // -------------------------------------------------------------------------
    std::shared_ptr<DebugStream> Orchestrator::log()
    {
        return mylog;
    }
    // -------------------------------------------------------------------------
    void Orchestrator::collectLog(const std::shared_ptr<DebugStream>& l)
    {
        if (!l || l == mylog)
            return;

        l->level(mylog->level());
        l->disableOnScreen();
        l->logFile("");

        std::lock_guard<std::mutex> lock(logMutex_);

        if (conmap.find(l) != conmap.end())
            return;

        auto conn = l->signal_stream_event().connect(sigc::mem_fun(*this, &Orchestrator::logOnEvent));
        conmap.emplace(l, conn);
    }
    // -------------------------------------------------------------------------
    void Orchestrator::logOnEvent(const std::string& s)
    {
        std::lock_guard<std::mutex> lock(logMutex_);
        mylog->any(false) << s << std::flush;
    }
    // -------------------------------------------------------------------------
    void Orchestrator::addService(const ServiceSpec& spec)
    {
        if (spec.name.empty())
            throw ConfigError("Service without name");

        if (hasService(spec.name))
            throw ConfigError("Duplicate service name '" + spec.name + "'");

        if (spec.portRange.empty())
            throw ConfigError("Service '" + spec.name + "' has an empty port range");

        specs_.push_back(spec);
    }
    // -------------------------------------------------------------------------
    bool Orchestrator::hasService(const std::string& name) const
    {
        return std::any_of(specs_.begin(), specs_.end(), [&name](const ServiceSpec & s)
        {
            return s.name == name;
        });
    }
    // -------------------------------------------------------------------------
    const std::vector<ServiceSpec>& Orchestrator::services() const
    {
        return specs_;
    }
    // -------------------------------------------------------------------------
    const ServiceSpec& Orchestrator::specOf(const std::string& name) const
    {
        for (const auto& s : specs_)
        {
            if (s.name == name)
                return s;
        }

        throw NameNotFound("Unknown service '" + name + "'");
    }
    // -------------------------------------------------------------------------
    void Orchestrator::setParallel(bool set)
    {
        parallel_ = set;
    }
    // -------------------------------------------------------------------------
    void Orchestrator::setDependencyTimeout(size_t msec)
    {
        dependencyTimeout_msec_ = msec;
    }
    // -------------------------------------------------------------------------
    void Orchestrator::setSoftSuccess(bool set)
    {
        softSuccess_ = set;
    }
    // -------------------------------------------------------------------------
    std::vector<std::string> Orchestrator::startOrder() const
    {
        std::map<std::string, std::set<std::string>> ignored;
        return resolveOrder(ignored);
    }
    // -------------------------------------------------------------------------
    std::vector<std::string> Orchestrator::resolveOrder(std::map<std::string, std::set<std::string>>& ignoredUses) const
    {
        DependencyResolver resolver;

        for (const auto& s : specs_)
        {
            resolver.addService(s.name,
                                std::set<std::string>(s.dependsOn.begin(), s.dependsOn.end()),
                                std::set<std::string>(s.uses.begin(), s.uses.end()));
        }

        auto order = resolver.resolve();

        for (const auto& e : resolver.ignored())
        {
            ignoredUses[e.service].insert(e.dependsOn);
            mylog->warn() << e.service << " starts without waiting for " << e.dependsOn
                          << " (" << e.reason << ")" << std::endl;
        }

        return order;
    }
    // -------------------------------------------------------------------------
    std::shared_ptr<ServiceSupervisor> Orchestrator::makeSupervisor(const ServiceSpec& spec)
    {
        std::shared_ptr<EndpointBoard> board;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            board = board_;
        }

        ServiceSpec s(spec);
        auto ign = ignoredUses_.find(spec.name);

        if (ign != ignoredUses_.end())
        {
            s.uses.erase(std::remove_if(s.uses.begin(), s.uses.end(), [&ign](const std::string & u)
            {
                return ign->second.count(u) > 0;
            }), s.uses.end());
        }

        auto sup = std::make_shared<ServiceSupervisor>(s, ports_, resolver_, launcher_, probe_, board, abortTimer_);
        sup->setDependencyTimeout(dependencyTimeout_msec_);
        sup->setSoftSuccess(softSuccess_);

        sup->log()->setLogName(spec.name);
        collectLog(sup->log());
        return sup;
    }
    // -------------------------------------------------------------------------
    std::vector<ServiceState> Orchestrator::run()
    {
        // configuration errors are reported before anything is started
        ignoredUses_.clear();
        auto order = resolveOrder(ignoredUses_);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            board_ = std::make_shared<EndpointBoard>();

            for (const auto& name : order)
                board_->declare(name);

            states_.clear();
        }

        if (aborted())
        {
            std::lock_guard<std::mutex> lock(mutex_);
            board_->abortAll();
        }

        if (mylog->is_info())
        {
            mylog->info() << "start order:";

            for (const auto& n : order)
                *mylog << " " << n;

            *mylog << (parallel_ ? " (parallel)" : " (sequential)") << std::endl;
        }

        auto result = parallel_ ? runParallel(order) : runSequential(order);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            states_ = result;
        }

        mylog->info() << "bootstrap finished, exit code " << exitCode() << std::endl;
        return result;
    }
    // -------------------------------------------------------------------------
    std::vector<ServiceState> Orchestrator::runSequential(const std::vector<std::string>& order)
    {
        std::vector<ServiceState> result;

        for (const auto& name : order)
        {
            auto sup = makeSupervisor(specOf(name));

            try
            {
                sup->run();
            }
            catch (const std::exception& ex)
            {
                std::lock_guard<std::mutex> lock(logMutex_);
                mylog->crit() << name << ": " << ex.what() << std::endl;
                board_->fail(name, ex.what());
            }

            result.push_back(sup->state());

            std::lock_guard<std::mutex> lock(mutex_);
            states_ = result;
        }

        return result;
    }
    // -------------------------------------------------------------------------
    std::vector<ServiceState> Orchestrator::runParallel(const std::vector<std::string>& order)
    {
        std::vector<std::shared_ptr<ServiceSupervisor>> sups;

        for (const auto& name : order)
            sups.push_back(makeSupervisor(specOf(name)));

        std::vector<std::thread> threads;
        threads.reserve(sups.size());

        for (auto& sup : sups)
        {
            auto board = board_;

            threads.emplace_back([this, sup, board]()
            {
                try
                {
                    sup->run();
                }
                catch (const std::exception& ex)
                {
                    std::lock_guard<std::mutex> lock(logMutex_);
                    mylog->crit() << sup->spec().name << ": " << ex.what() << std::endl;
                    board->fail(sup->spec().name, ex.what());
                }
            });
        }

        for (auto& t : threads)
            t.join();

        std::vector<ServiceState> result;

        for (const auto& sup : sups)
            result.push_back(sup->state());

        return result;
    }
    // -------------------------------------------------------------------------
    void Orchestrator::abort()
    {
        mylog->warn() << "abort requested, launched processes are left running" << std::endl;
        abortTimer_->terminate();

        std::lock_guard<std::mutex> lock(mutex_);
        board_->abortAll();
    }
    // -------------------------------------------------------------------------
    bool Orchestrator::aborted() const
    {
        return abortTimer_->isTerminated();
    }
    // -------------------------------------------------------------------------
    std::vector<ServiceState> Orchestrator::states() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return states_;
    }
    // -------------------------------------------------------------------------
    int Orchestrator::exitCode() const
    {
        if (aborted())
            return ExitAborted;

        std::lock_guard<std::mutex> lock(mutex_);

        for (const auto& st : states_)
        {
            if (!st.required || st.status == ServiceStatus::Disabled)
                continue;

            if (st.status != ServiceStatus::Healthy)
                return ExitRequiredFailed;
        }

        return ExitOK;
    }
    // -------------------------------------------------------------------------
    std::map<std::string, int> Orchestrator::endpoints() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, int> result;

        for (const auto& st : states_)
        {
            if (st.healthy())
                result[st.name] = st.currentPort;
        }

        return result;
    }
    // -------------------------------------------------------------------------
    void Orchestrator::printRunList(std::ostream& out) const
    {
        out << "=== obstack run list ===" << std::endl;
        out << "Mode: " << (parallel_ ? "parallel" : "sequential") << std::endl;
        out << std::endl;

        std::vector<std::string> order;

        try
        {
            order = startOrder();
        }
        catch (const ConfigError& e)
        {
            out << "ERROR: Failed to resolve dependencies: " << e.what() << std::endl;
            return;
        }

        int num = 1;
        std::vector<std::string> skipped;

        for (const auto& name : order)
        {
            const auto& s = specOf(name);

            if (!s.enabled)
            {
                skipped.push_back(s.name + " (disabled)");
                continue;
            }

            out << "  [" << num++ << "] " << s.name;

            if (!s.type.empty())
                out << " (" << s.type << ")";

            out << (s.required ? " required" : " optional") << std::endl;

            out << "      Candidates:";

            for (const auto& c : s.executableCandidates)
                out << " " << c;

            out << std::endl;

            std::string exe = resolver_ ? resolver_->resolve(s.executableCandidates) : "";
            out << "      Executable: " << (exe.empty() ? "NOT FOUND" : exe) << std::endl;
            out << "      Ports: " << portRangeToString(s.portRange) << std::endl;
            out << "      Health: " << to_string(s.healthCheck)
                << " (settle " << s.settleDelay_msec << "ms, interval " << s.probeInterval_msec
                << "ms, window " << s.probeWindow_msec << "ms)" << std::endl;

            if (!s.expectedOwnerNames.empty())
            {
                out << "      Owners:";

                for (const auto& o : s.expectedOwnerNames)
                    out << " " << o;

                out << std::endl;
            }

            if (!s.dependsOn.empty() || !s.uses.empty())
            {
                out << "      Depends:";

                for (const auto& d : s.dependsOn)
                    out << " " << d;

                for (const auto& d : s.uses)
                    out << " " << d << "(optional)";

                out << std::endl;
            }

            if (!s.workDir.empty())
                out << "      WorkDir: " << s.workDir << std::endl;

            if (!s.logFile.empty())
                out << "      Log: " << s.logFile << std::endl;

            out << std::endl;
        }

        if (!skipped.empty())
        {
            out << "Skipped:" << std::endl;

            for (const auto& s : skipped)
                out << "  - " << s << std::endl;

            out << std::endl;
        }

        out << "Total: " << (num - 1) << " services to start" << std::endl;
    }
    // -------------------------------------------------------------------------
} // end of namespace ostack
