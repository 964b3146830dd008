/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef ServiceSupervisor_H_
#define ServiceSupervisor_H_
// -------------------------------------------------------------------------
#include <memory>
#include <string>
#include "ServiceInfo.h"
#include "PortRegistry.h"
#include "ExecutableResolver.h"
#include "HealthProbe.h"
#include "ProcessLauncher.h"
#include "EndpointBoard.h"
#include "PassiveTimer.h"
#include "DebugStream.h"
// -------------------------------------------------------------------------
namespace ostack
{
    /*!
     * Lifecycle of one service from NotStarted to a terminal status.
     *
     * NotStarted -> Discovering -> (Bound -> Probing) | Launching -> Settling -> Probing -> Healthy
     * Probing -> Launching (next port) until ExhaustedPortRange.
     * ExecutableNotFound, DependencyFailed and Aborted are terminal too.
     *
     * The abort timer is shared by all supervisors of a run: its terminate()
     * interrupts every wait and no new attempts are made after it.
     * Processes are never killed: neither adopted ones nor our own.
     */
    class ServiceSupervisor
    {
        public:
            ServiceSupervisor(const ServiceSpec& spec,
                              std::shared_ptr<PortRegistry> ports,
                              std::shared_ptr<ExecutableResolver> resolver,
                              std::shared_ptr<ProcessLauncher> launcher,
                              std::shared_ptr<HealthProbe> probe,
                              std::shared_ptr<EndpointBoard> board,
                              std::shared_ptr<PassiveCondTimer> abortTimer);

            //! run the state machine to a terminal status
            const ServiceState& run();

            const ServiceState& state() const;
            const ServiceSpec& spec() const;

            //! max wait for every dependency, msec
            void setDependencyTimeout(size_t msec);
            void setSoftSuccess(bool set);

            std::shared_ptr<DebugStream> log();

        private:
            enum class ProbeResult
            {
                Healthy,
                Timeout,
                ProcessDied,
                Aborted
            };

            const ServiceState& runMachine();
            int discover();
            ProcessIdentity ownerOf(int port);
            bool waitDependencies(LaunchContext& ctx);
            int pickFreePort();
            bool launchOn(int port, LaunchContext& ctx);
            ProbeResult probeWindow(pid_t child);

            void enter(ServiceStatus st);
            const ServiceState& finish(ServiceStatus st);
            bool aborted() const;

            ServiceSpec spec_;
            ServiceState state_;

            std::shared_ptr<PortRegistry> ports_;
            std::shared_ptr<ExecutableResolver> resolver_;
            std::shared_ptr<ProcessLauncher> launcher_;
            std::shared_ptr<HealthProbe> probe_;
            std::shared_ptr<EndpointBoard> board_;
            std::shared_ptr<PassiveCondTimer> abort_;

            size_t dependencyTimeout_msec_ = 120000;
            bool softSuccess_ = true;

            std::shared_ptr<DebugStream> mylog;
    };

} // end of namespace ostack
// -------------------------------------------------------------------------
#endif // ServiceSupervisor_H_
// -------------------------------------------------------------------------
