/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef Orchestrator_H_
#define Orchestrator_H_
// -------------------------------------------------------------------------
#include <memory>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <unordered_map>
#include <mutex>
#include <iostream>
#include <sigc++/sigc++.h>
#include "ServiceInfo.h"
#include "ServiceSupervisor.h"
#include "EndpointBoard.h"
#include "PassiveTimer.h"
#include "DebugStream.h"
// -------------------------------------------------------------------------
namespace ostack
{
    //! process exit codes of obstack-bootstrap
    enum ExitCode
    {
        ExitOK = 0,
        ExitConfigError = 1,
        ExitAborted = 2,
        ExitRequiredFailed = 3
    };

    /*!
     * Runs one ServiceSupervisor per declared service.
     *
     * Sequential mode (default) runs the supervisors one by one in dependency
     * order. Parallel mode starts every supervisor on its own thread, dependants
     * block on the EndpointBoard until their upstream services are resolved.
     * abort() stops all waits and retries but never touches launched processes.
     */
    class Orchestrator
    {
        public:
            Orchestrator(std::shared_ptr<PortRegistry> ports,
                         std::shared_ptr<ExecutableResolver> resolver,
                         std::shared_ptr<ProcessLauncher> launcher,
                         std::shared_ptr<HealthProbe> probe);
            ~Orchestrator();

            /*! \throw ConfigError on duplicate name or empty port range */
            void addService(const ServiceSpec& spec);
            bool hasService(const std::string& name) const;
            const std::vector<ServiceSpec>& services() const;

            void setParallel(bool set);
            void setDependencyTimeout(size_t msec);
            void setSoftSuccess(bool set);

            /*!
             * Start order (hard and soft dependencies first).
             * A soft dependency on an unknown service or one that closes a cycle
             * is left out with a warning, the service does not wait for it.
             * \throw ConfigError on hard dependency cycles and unknown hard dependencies
             */
            std::vector<std::string> startOrder() const;

            /*!
             * Run all supervisors to terminal states.
             * \return states in start order
             * \throw ConfigError before anything is started
             */
            std::vector<ServiceState> run();

            //! operator abort (thread safe, may be called from any thread)
            void abort();
            bool aborted() const;

            //! states of the last run (in start order)
            std::vector<ServiceState> states() const;

            //! exit code of the last run
            int exitCode() const;

            //! healthy services -> port
            std::map<std::string, int> endpoints() const;

            /*!
             * Print run list (dry-run mode): what, where and in which order.
             */
            void printRunList(std::ostream& out) const;

            std::shared_ptr<DebugStream> log();

            /*!
             * Collect complete lines of l into our log.
             * l gets our levels and writes nowhere else, so lines of parallel
             * supervisors and shared collaborators never mix on the screen or in the log file.
             */
            void collectLog(const std::shared_ptr<DebugStream>& l);

        private:
            void logOnEvent(const std::string& s);

            std::vector<ServiceState> runSequential(const std::vector<std::string>& order);
            std::vector<ServiceState> runParallel(const std::vector<std::string>& order);
            std::shared_ptr<ServiceSupervisor> makeSupervisor(const ServiceSpec& spec);
            std::vector<std::string> resolveOrder(std::map<std::string, std::set<std::string>>& ignoredUses) const;
            const ServiceSpec& specOf(const std::string& name) const;

            std::shared_ptr<PortRegistry> ports_;
            std::shared_ptr<ExecutableResolver> resolver_;
            std::shared_ptr<ProcessLauncher> launcher_;
            std::shared_ptr<HealthProbe> probe_;

            std::shared_ptr<EndpointBoard> board_;
            std::shared_ptr<PassiveCondTimer> abortTimer_;

            std::vector<ServiceSpec> specs_;
            std::map<std::string, std::set<std::string>> ignoredUses_; // soft edges left out of the last run
            std::vector<ServiceState> states_;
            mutable std::mutex mutex_;

            bool parallel_ = false;
            size_t dependencyTimeout_msec_ = 120000;
            bool softSuccess_ = true;

            std::shared_ptr<DebugStream> mylog;
            std::mutex logMutex_;

            typedef std::unordered_map<std::shared_ptr<DebugStream>, sigc::connection> ConnectionMap;
            ConnectionMap conmap;
    };

} // end of namespace ostack
// -------------------------------------------------------------------------
#endif // Orchestrator_H_
// -------------------------------------------------------------------------
