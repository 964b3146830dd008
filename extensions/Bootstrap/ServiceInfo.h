/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef ServiceInfo_H_
#define ServiceInfo_H_
// -------------------------------------------------------------------------
#include <string>
#include <vector>
#include <set>
#include <map>
#include <functional>
#include <limits>
#include <sys/types.h>
// -------------------------------------------------------------------------
namespace ostack
{
    // Service lifecycle phases (terminal and transient)
    enum class ServiceStatus
    {
        NotStarted,
        Discovering,
        Bound,              // Port held by an expected owner (transient)
        Launching,
        Settling,
        Probing,
        Healthy,            // terminal success
        ExhaustedPortRange, // no free port left in portRange
        ExecutableNotFound, // no candidate exists, nothing launched
        DependencyFailed,   // hard upstream failed or timed out
        Aborted,            // operator abort
        Disabled,           // switched off by configuration
        Failed              // unexpected error of a collaborator
    };

    std::string to_string(ServiceStatus st);
    bool isTerminal(ServiceStatus st);

    enum class HealthCheckType
    {
        TCP,    // connect only
        HTTP    // GET on paths, status code in acceptCodes
    };

    std::string to_string(HealthCheckType type);

    struct HealthCheck
    {
        HealthCheckType type = HealthCheckType::TCP;
        std::string host = "127.0.0.1";
        std::vector<std::string> paths;     // tried in order
        std::set<int> acceptCodes = {200};
        size_t timeout_msec = 1500;         // single request timeout

        bool isHTTP() const
        {
            return type == HealthCheckType::HTTP && !paths.empty();
        }
    };

    /*!
     * Parse health check string: "tcp" or "http:/path1,/path2".
     * \param accept comma separated status codes ("200,204"), empty = 200
     * \throw ConfigError on bad format
     */
    HealthCheck parseHealthCheck(const std::string& check, const std::string& accept = "");
    std::string to_string(const HealthCheck& hc);

    // Owner of a listening socket
    struct ProcessIdentity
    {
        pid_t pid = 0;
        std::string name;

        bool known() const
        {
            return pid > 0 && !name.empty();
        }
    };

    //! /proc/<pid>/comm keeps at most this many characters of a process name
    const size_t CommNameMax = 15;

    /*! case insensitive membership of owner name in names.
     * A name of exactly CommNameMax characters also matches a longer
     * expected name with the same beginning (truncated comm).
     */
    bool ownerMatches(const ProcessIdentity& owner, const std::set<std::string>& names);

    //! upper bound of every timing setting, msec (about 24 days)
    const size_t MaxTimeout_msec = std::numeric_limits<int>::max();

    /*!
     * Parse a timing in msec: "30000".
     * \throw OutOfRange when it is not a number or above MaxTimeout_msec
     */
    size_t parseMsec(const std::string& s);

    /*!
     * Parse port range: "9090-9100", "9090,9095", "9090-9092,9100".
     * Duplicates are dropped, order is kept.
     * \throw OutOfRange on bad ports or empty result
     */
    std::vector<int> parsePortRange(const std::string& spec);
    std::string portRangeToString(const std::vector<int>& ports);

    // What the argument and environment builders get
    struct LaunchContext
    {
        std::string name;
        int port = 0;
        std::string workDir;
        std::string executable;
        std::string host = "127.0.0.1";
        std::map<std::string, int> upstream;   // healthy upstream services -> port

        bool hasUpstream(const std::string& svc) const;
        int portOf(const std::string& svc) const;   // 0 if unknown
        std::string urlOf(const std::string& svc) const; // empty if unknown
        std::string url() const;
    };

    std::string makeURL(const std::string& host, int port);

    using ArgsBuilder = std::function<std::vector<std::string>(const LaunchContext&)>;
    using EnvBuilder = std::function<std::map<std::string, std::string>(const LaunchContext&)>;
    using PreLaunchHook = std::function<void(const LaunchContext&)>;

    // Declared service (immutable during a run)
    struct ServiceSpec
    {
        std::string name;
        std::string type;       //!< template type (prometheus, grafana...) or empty
        std::vector<std::string> executableCandidates;
        std::vector<int> portRange;
        std::set<std::string> expectedOwnerNames;

        ArgsBuilder argsBuilder;
        EnvBuilder envOverlay;
        PreLaunchHook preLaunch;

        HealthCheck healthCheck;
        size_t settleDelay_msec = 1000;
        size_t probeInterval_msec = 1000;
        size_t probeWindow_msec = 30000;

        bool required = false;
        bool enabled = true;
        bool softSuccessOnBound = true;

        std::vector<std::string> dependsOn;  // hard: must be Healthy
        std::vector<std::string> uses;       // soft: used if Healthy

        std::string workDir;
        std::string logFile;
    };

    // Runtime state of one service (one per run)
    struct ServiceState
    {
        std::string name;
        bool required = false;
        ServiceStatus status = ServiceStatus::NotStarted;
        std::vector<int> attemptedPorts;
        int currentPort = 0;
        pid_t processHandle = 0;    // launched by this run, 0 = not ours
        std::string executable;
        bool softSuccess = false;
        int launches = 0;
        std::string lastError;
        std::vector<ServiceStatus> history;   // every phase entered

        bool ownedByUs() const
        {
            return processHandle > 0;
        }

        bool healthy() const
        {
            return status == ServiceStatus::Healthy;
        }
    };

} // end of namespace ostack
// -------------------------------------------------------------------------
#endif // ServiceInfo_H_
// -------------------------------------------------------------------------
