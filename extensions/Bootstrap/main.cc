/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include "ConfigLoader.h"
#include "Orchestrator.h"
#include "StackReport.h"
#include "PortRegistry.h"
#include "ExecutableResolver.h"
#include "ProcessLauncher.h"
#include "HealthProbe.h"
#include "Exceptions.h"
#include "StackTypes.h"
#include "Debug.h"
// -------------------------------------------------------------------------
using namespace std;
using namespace ostack;
// -------------------------------------------------------------------------
static std::atomic<bool> g_abort{false};
// -------------------------------------------------------------------------
static void signal_handler(int sig)
{
    if (sig == SIGTERM || sig == SIGINT)
        g_abort = true;
}
// -------------------------------------------------------------------------
static void print_help(const std::string& prog)
{
    cout << prog << " [--confile obstack.xml] [OPTIONS]\n"
         << "\n"
         << "Observability stack bootstrap: finds, launches and health checks\n"
         << "Prometheus, InfluxDB, Grafana and the web dashboard.\n"
         << "Services which are already running are reused, nothing is ever stopped.\n"
         << "\n"
         << "Options:\n"
         << "  --confile FILE        XML configuration (default: built-in services)\n"
         << "  --stack-name NAME     ObservabilityStack section name in config\n"
         << "  --workdir DIR         Base directory for data, config and logs\n"
         << "                        (default: $HOME/.local/share/obstack)\n"
         << "  --enable NAME         Enable service (repeatable)\n"
         << "  --disable NAME        Disable service (repeatable)\n"
         << "  --ports NAME=RANGE    Port range for service (9090-9100 or 9090,9091)\n"
         << "  --exe NAME=PATH       Executable for service (a glob is allowed)\n"
         << "  --required NAME       Failure of the service fails the bootstrap\n"
         << "  --optional NAME       Failure of the service is only logged\n"
         << "  --no-soft-success     Never accept a port held by an expected process\n"
         << "                        which does not answer health checks\n"
         << "  --parallel            Start independent services concurrently\n"
         << "  --dependency-timeout MS  Max wait for upstream services (default: 120000)\n"
         << "  --open-browser        Open Grafana (or the dashboard) when healthy\n"
         << "  --json-summary FILE   Write summary as JSON\n"
         << "  --env-file FILE       Write OBSTACK_<NAME>_URL variables\n"
         << "  --runlist, --dry-run  Show what will be launched without starting\n"
         << "  --log-level LEVELS    Log levels (info,warn,crit,level1..level9,any)\n"
         << "  --logfile FILE        Duplicate log to file\n"
         << "  --verbose             Verbose output\n"
         << "  --help                Show this help\n"
         << "\n"
         << "Exit codes:\n"
         << "  0 - required services are healthy\n"
         << "  1 - configuration or command line error\n"
         << "  2 - aborted (SIGINT, SIGTERM)\n"
         << "  3 - a required service is not healthy\n"
         << endl;
}
// -------------------------------------------------------------------------
// NAME=VALUE
static bool splitAssign(const std::string& s, std::string& name, std::string& value)
{
    auto pos = s.find('=');

    if (pos == std::string::npos || pos == 0 || pos + 1 == s.size())
        return false;

    name = s.substr(0, pos);
    value = s.substr(pos + 1);
    return true;
}
// -------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    std::string confFile;
    std::string stackName;
    std::string workDir;
    std::string jsonSummary;
    std::string envFile;
    std::string logLevels;
    std::string logFile;
    size_t dependencyTimeout = 0;
    bool parallel = false;
    bool openBrowser = false;
    bool verbose = false;
    bool dryRun = false;
    ConfigLoader::Overrides ovr;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h")
        {
            print_help(argv[0]);
            return ExitOK;
        }

        if (arg == "--confile" && i + 1 < argc)
        {
            confFile = argv[++i];
            continue;
        }

        if (arg == "--stack-name" && i + 1 < argc)
        {
            stackName = argv[++i];
            continue;
        }

        if (arg == "--workdir" && i + 1 < argc)
        {
            workDir = argv[++i];
            continue;
        }

        if (arg == "--enable" && i + 1 < argc)
        {
            ovr.enable.push_back(argv[++i]);
            continue;
        }

        if (arg == "--disable" && i + 1 < argc)
        {
            ovr.disable.push_back(argv[++i]);
            continue;
        }

        if (arg == "--required" && i + 1 < argc)
        {
            ovr.required.push_back(argv[++i]);
            continue;
        }

        if (arg == "--optional" && i + 1 < argc)
        {
            ovr.optional.push_back(argv[++i]);
            continue;
        }

        if ((arg == "--ports" || arg == "--exe") && i + 1 < argc)
        {
            std::string name, value;

            if (!splitAssign(argv[++i], name, value))
            {
                cerr << "Error: bad " << arg << " '" << argv[i] << "', expected NAME=VALUE" << endl;
                return ExitConfigError;
            }

            if (arg == "--ports")
                ovr.ports[name] = value;
            else
                ovr.exe[name] = value;

            continue;
        }

        if (arg == "--no-soft-success")
        {
            ovr.noSoftSuccess = true;
            continue;
        }

        if (arg == "--parallel")
        {
            parallel = true;
            continue;
        }

        if (arg == "--dependency-timeout" && i + 1 < argc)
        {
            std::string v = argv[++i];

            try
            {
                dependencyTimeout = parseMsec(v);
            }
            catch (const OutOfRange& ex)
            {
                cerr << "Error: bad --dependency-timeout: " << ex.what() << endl;
                return ExitConfigError;
            }

            continue;
        }

        if (arg == "--open-browser")
        {
            openBrowser = true;
            continue;
        }

        if (arg == "--json-summary" && i + 1 < argc)
        {
            jsonSummary = argv[++i];
            continue;
        }

        if (arg == "--env-file" && i + 1 < argc)
        {
            envFile = argv[++i];
            continue;
        }

        if (arg == "--runlist" || arg == "--dry-run")
        {
            dryRun = true;
            continue;
        }

        if (arg == "--log-level" && i + 1 < argc)
        {
            logLevels = argv[++i];
            continue;
        }

        if (arg == "--logfile" && i + 1 < argc)
        {
            logFile = argv[++i];
            continue;
        }

        if (arg == "--verbose" || arg == "-v")
        {
            verbose = true;
            continue;
        }

        cerr << "Error: unknown argument '" << arg << "'" << endl;
        print_help(argv[0]);
        return ExitConfigError;
    }

    try
    {
        ConfigLoader loader;
        ConfigLoader::StackConfig config;

        if (!confFile.empty())
        {
            cout << "Loading configuration from " << confFile << endl;
            config = loader.load(confFile, stackName, workDir);
        }
        else
            config = loader.defaults(workDir);

        ConfigLoader::applyOverrides(config, ovr);

        auto ports = std::make_shared<ProcPortRegistry>();
        auto resolver = std::make_shared<FileExecutableResolver>();
        auto launcher = std::make_shared<PocoProcessLauncher>();
        auto probe = std::make_shared<NetHealthProbe>();

        Orchestrator orch(ports, resolver, launcher, probe);

        // Setup logging
        auto mylog = orch.log();

        if (!logLevels.empty())
            mylog->level(Debug::value(logLevels));
        else if (verbose)
            mylog->addLevel(Debug::ANY);
        else
        {
            mylog->addLevel(Debug::INFO);
            mylog->addLevel(Debug::WARN);
            mylog->addLevel(Debug::CRIT);
        }

        if (!logFile.empty())
            mylog->logFile(logFile);

        // supervisors and shared collaborators write through the orchestrator log
        for (const auto& l : { ports->log(), resolver->log(), launcher->log(), probe->log() })
            orch.collectLog(l);

        orch.setParallel(parallel || config.parallel);
        orch.setDependencyTimeout(dependencyTimeout > 0 ? dependencyTimeout : config.dependencyTimeout_msec);
        orch.setSoftSuccess(config.softSuccess);

        for (const auto& s : config.services)
            orch.addService(s);

        // Dry-run mode: show what will be launched and exit
        if (dryRun)
        {
            cout << "Work directory: " << config.workDir << endl;
            orch.printRunList(cout);
            return ExitOK;
        }

        // configuration errors before anything is started
        orch.startOrder();

        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);

        std::atomic<bool> finished{false};

        std::thread watcher([&orch, &finished]()
        {
            while (!finished)
            {
                if (g_abort && !orch.aborted())
                {
                    cerr << "Interrupted, stopping bootstrap (launched services keep running)..." << endl;
                    orch.abort();
                }

                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        cout << "Bootstrapping stack '" << config.name << "' in " << config.workDir << "..." << endl;

        std::vector<ServiceState> states;

        try
        {
            states = orch.run();
        }
        catch (const std::exception&)
        {
            finished = true;
            watcher.join();
            throw;
        }

        finished = true;
        watcher.join();

        int exitCode = orch.exitCode();
        StackReport report(states, orch.services(), exitCode, orch.aborted());
        report.print(cout);

        try
        {
            if (!jsonSummary.empty())
                report.writeJSON(jsonSummary);

            if (!envFile.empty())
                report.writeEnvFile(envFile);
        }
        catch (const SystemError& ex)
        {
            cerr << "Can't write report: " << ex.what() << endl;
        }

        if (openBrowser && !orch.aborted())
        {
            std::string url = report.browserURL();
            std::string xdg = resolver->resolve({"xdg-open"});

            if (url.empty())
                cerr << "Nothing to open in browser: Grafana and dashboard are down" << endl;
            else if (xdg.empty())
                cerr << "xdg-open not found, open " << url << " manually" << endl;
            else
            {
                try
                {
                    LaunchRequest req;
                    req.name = "browser";
                    req.executable = xdg;
                    req.args = { url };
                    launcher->launch(req);
                }
                catch (const SystemError& ex)
                {
                    cerr << "Can't open browser: " << ex.what() << endl;
                }
            }
        }

        return exitCode;
    }
    catch (const ConfigError& e)
    {
        cerr << "Configuration error: " << e.what() << endl;
        return ExitConfigError;
    }
    catch (const ostack::Exception& e)
    {
        cerr << "Error: " << e.what() << endl;
        return ExitConfigError;
    }
    catch (const std::exception& e)
    {
        cerr << "Error: " << e.what() << endl;
        return ExitConfigError;
    }
}
// -------------------------------------------------------------------------
