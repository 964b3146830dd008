/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <cerrno>
#include <cstring>
#include <signal.h>
#include <sys/wait.h>
#include <Poco/Process.h>
#include <Poco/File.h>
#include <Poco/Path.h>
#include <Poco/Exception.h>
#include "ProcessLauncher.h"
#include "ExecutableResolver.h"
#include "Exceptions.h"
#include "Debug.h"
// -------------------------------------------------------------------------
namespace ostack
{
    // -------------------------------------------------------------------------
    PocoProcessLauncher::PocoProcessLauncher()
        : setsid_(FileExecutableResolver::findInPath("setsid"))
        , shell_(FileExecutableResolver::findInPath("sh"))
        , mylog(std::make_shared<DebugStream>())
    {
        mylog->setLogName("ProcessLauncher");

        if (shell_.empty())
            shell_ = "/bin/sh";
    }
    // -------------------------------------------------------------------------
    std::shared_ptr<DebugStream> PocoProcessLauncher::log()
    {
        return mylog;
    }
    // -------------------------------------------------------------------------
    void PocoProcessLauncher::setDetach(bool set)
    {
        detach_ = set;
    }
    // -------------------------------------------------------------------------
    bool PocoProcessLauncher::detach() const
    {
        return detach_;
    }
    // -------------------------------------------------------------------------
    std::vector<std::string> PocoProcessLauncher::buildCommandLine(const LaunchRequest& req) const
    {
        std::vector<std::string> cmd;

        if (detach_ && !setsid_.empty())
            cmd.push_back(setsid_);

        if (!req.logFile.empty())
        {
            // $0 is the log file, "$@" is the program with its arguments
            cmd.push_back(shell_);
            cmd.push_back("-c");
            cmd.push_back("exec \"$@\" >>\"$0\" 2>&1 </dev/null");
            cmd.push_back(req.logFile);
        }

        cmd.push_back(req.executable);
        cmd.insert(cmd.end(), req.args.begin(), req.args.end());
        return cmd;
    }
    // -------------------------------------------------------------------------
    pid_t PocoProcessLauncher::launch(const LaunchRequest& req)
    {
        if (detach_ && setsid_.empty())
            mylog->warn() << "setsid not found, " << req.name << " shares our session" << std::endl;

        if (!req.logFile.empty())
        {
            try
            {
                Poco::File(Poco::Path(req.logFile).parent()).createDirectories();
            }
            catch (const Poco::Exception& ex)
            {
                throw SystemError("can't create log directory for " + req.logFile + ": " + ex.displayText());
            }
        }

        auto cmd = buildCommandLine(req);
        const std::string command = cmd.front();
        std::vector<std::string> args(cmd.begin() + 1, cmd.end());

        Poco::Process::Env env(req.env.begin(), req.env.end());
        std::string workDir = req.workDir.empty() ? "." : req.workDir;

        if (mylog->is_info())
        {
            mylog->info() << "start " << req.name << ": " << req.executable;

            for (const auto& a : req.args)
                *mylog << " " << a;

            *mylog << std::endl;
        }

        try
        {
            Poco::ProcessHandle ph = Poco::Process::launch(
                                         command,
                                         args,
                                         workDir,
                                         nullptr,  // stdin
                                         nullptr,  // stdout
                                         nullptr,  // stderr
                                         env
                                     );

            pid_t pid = ph.id();
            mylog->info() << req.name << " started with PID " << pid << std::endl;
            return pid;
        }
        catch (const Poco::Exception& ex)
        {
            throw SystemError("failed to start " + req.name + ": " + ex.displayText());
        }
    }
    // -------------------------------------------------------------------------
    bool PocoProcessLauncher::isAlive(pid_t pid)
    {
        if (pid <= 0)
            return false;

        // reap our own child if it has exited, otherwise a zombie looks alive
        int status = 0;
        pid_t r = waitpid(pid, &status, WNOHANG);

        if (r == pid)
        {
            if (WIFEXITED(status))
                mylog->warn() << "PID " << pid << " exited with code " << WEXITSTATUS(status) << std::endl;
            else if (WIFSIGNALED(status))
                mylog->warn() << "PID " << pid << " terminated by signal " << WTERMSIG(status) << std::endl;

            return false;
        }

        if (r < 0 && errno != ECHILD)
            mylog->level5() << "waitpid(" << pid << "): " << strerror(errno) << std::endl;

        return ::kill(pid, 0) == 0 || errno == EPERM;
    }
    // -------------------------------------------------------------------------
} // end of namespace ostack
