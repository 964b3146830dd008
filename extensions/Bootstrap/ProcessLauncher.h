/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef ProcessLauncher_H_
#define ProcessLauncher_H_
// -------------------------------------------------------------------------
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <sys/types.h>
#include "DebugStream.h"
// -------------------------------------------------------------------------
namespace ostack
{
    struct LaunchRequest
    {
        std::string name;
        std::string executable;
        std::vector<std::string> args;
        std::map<std::string, std::string> env;   // overlay for the child only
        std::string workDir;
        std::string logFile;    // stdout+stderr of the child (append), empty = inherit
    };

    /*!
     * Start a child process that outlives the orchestrator.
     * launch() returns the pid (opaque handle) or throws SystemError.
     */
    class ProcessLauncher
    {
        public:
            virtual ~ProcessLauncher() = default;

            virtual pid_t launch(const LaunchRequest& req) = 0;
            virtual bool isAlive(pid_t pid) = 0;
    };

    /*!
     * Poco::Process based launcher.
     *
     * The child is started in its own session (setsid) so that Ctrl+C
     * in the orchestrator terminal does not reach it. Output is redirected
     * to logFile by a "sh -c exec" wrapper. Both wrappers exec the
     * real program, the returned pid is the pid of the service itself.
     */
    class PocoProcessLauncher:
        public ProcessLauncher
    {
        public:
            PocoProcessLauncher();

            pid_t launch(const LaunchRequest& req) override;
            bool isAlive(pid_t pid) override;

            void setDetach(bool set);
            bool detach() const;

            //! command and arguments actually passed to Poco::Process::launch
            std::vector<std::string> buildCommandLine(const LaunchRequest& req) const;

            std::shared_ptr<DebugStream> log();

        private:
            bool detach_ = true;
            std::string setsid_;
            std::string shell_;
            std::shared_ptr<DebugStream> mylog;
    };

} // end of namespace ostack
// -------------------------------------------------------------------------
#endif // ProcessLauncher_H_
// -------------------------------------------------------------------------
