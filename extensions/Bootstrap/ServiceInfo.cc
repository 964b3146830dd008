/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <sstream>
#include <algorithm>
#include "ServiceInfo.h"
#include "StackTypes.h"
#include "Exceptions.h"
// -------------------------------------------------------------------------
namespace ostack
{
    // -------------------------------------------------------------------------
    std::string to_string(ServiceStatus st)
    {
        switch (st)
        {
            case ServiceStatus::NotStarted:
                return "NotStarted";

            case ServiceStatus::Discovering:
                return "Discovering";

            case ServiceStatus::Bound:
                return "Bound";

            case ServiceStatus::Launching:
                return "Launching";

            case ServiceStatus::Settling:
                return "Settling";

            case ServiceStatus::Probing:
                return "Probing";

            case ServiceStatus::Healthy:
                return "Healthy";

            case ServiceStatus::ExhaustedPortRange:
                return "ExhaustedPortRange";

            case ServiceStatus::ExecutableNotFound:
                return "ExecutableNotFound";

            case ServiceStatus::DependencyFailed:
                return "DependencyFailed";

            case ServiceStatus::Aborted:
                return "Aborted";

            case ServiceStatus::Disabled:
                return "Disabled";

            case ServiceStatus::Failed:
                return "Failed";
        }

        return "Unknown";
    }
    // -------------------------------------------------------------------------
    bool isTerminal(ServiceStatus st)
    {
        switch (st)
        {
            case ServiceStatus::Healthy:
            case ServiceStatus::ExhaustedPortRange:
            case ServiceStatus::ExecutableNotFound:
            case ServiceStatus::DependencyFailed:
            case ServiceStatus::Aborted:
            case ServiceStatus::Disabled:
            case ServiceStatus::Failed:
                return true;

            default:
                break;
        }

        return false;
    }
    // -------------------------------------------------------------------------
    std::string to_string(HealthCheckType type)
    {
        switch (type)
        {
            case HealthCheckType::TCP:
                return "tcp";

            case HealthCheckType::HTTP:
                return "http";
        }

        return "unknown";
    }
    // -------------------------------------------------------------------------
    HealthCheck parseHealthCheck(const std::string& check, const std::string& accept)
    {
        HealthCheck hc;
        std::string s = trim(check);

        if (s.empty() || toLower(s) == "tcp")
            hc.type = HealthCheckType::TCP;
        else
        {
            auto pos = s.find(':');
            std::string kind = toLower(s.substr(0, pos));

            if (kind != "http")
                throw ConfigError("Unknown health check type '" + kind + "' in '" + check + "'");

            hc.type = HealthCheckType::HTTP;

            if (pos != std::string::npos)
            {
                for (const auto& p : explode_str(s.substr(pos + 1), ','))
                {
                    std::string path = trim(p);

                    if (path.empty())
                        continue;

                    if (path[0] != '/')
                        path = "/" + path;

                    hc.paths.push_back(path);
                }
            }

            if (hc.paths.empty())
                hc.paths.push_back("/");
        }

        if (!trim(accept).empty())
        {
            hc.acceptCodes.clear();

            for (const auto& c : explode_str(accept, ','))
            {
                std::string code = trim(c);

                if (!is_digit(code))
                    throw ConfigError("Bad status code '" + code + "' in '" + accept + "'");

                int v = std::stoi(code);

                if (v < 100 || v > 599)
                    throw ConfigError("Status code out of range: " + code);

                hc.acceptCodes.insert(v);
            }
        }

        return hc;
    }
    // -------------------------------------------------------------------------
    std::string to_string(const HealthCheck& hc)
    {
        std::ostringstream s;
        s << to_string(hc.type);

        if (hc.type == HealthCheckType::HTTP)
        {
            s << ":";

            for (size_t i = 0; i < hc.paths.size(); i++)
                s << (i ? "," : "") << hc.paths[i];

            s << " [";
            bool first = true;

            for (const auto& c : hc.acceptCodes)
            {
                s << (first ? "" : ",") << c;
                first = false;
            }

            s << "]";
        }

        return s.str();
    }
    // -------------------------------------------------------------------------
    bool ownerMatches(const ProcessIdentity& owner, const std::set<std::string>& names)
    {
        // unknown owner is never ours
        if (!owner.known())
            return false;

        const std::string oname = toLower(owner.name);

        for (const auto& n : names)
        {
            const std::string lname = toLower(n);

            if (lname == oname)
                return true;

            if (oname.size() == CommNameMax && lname.size() > CommNameMax && lname.compare(0, CommNameMax, oname) == 0)
                return true;
        }

        return false;
    }
    // -------------------------------------------------------------------------
    size_t parseMsec(const std::string& s)
    {
        std::string v = trim(s);

        // more than 10 digits is out of range anyway, stoull must not overflow
        if (!is_digit(v) || v.size() > 10)
            throw OutOfRange("Bad timeout '" + v + "' (0.." + std::to_string(MaxTimeout_msec) + " msec)");

        auto msec = std::stoull(v);

        if (msec > MaxTimeout_msec)
            throw OutOfRange("Timeout is too big: " + v + " msec (max " + std::to_string(MaxTimeout_msec) + ")");

        return msec;
    }
    // -------------------------------------------------------------------------
    static int parsePort(const std::string& s, const std::string& spec)
    {
        std::string v = trim(s);

        if (!is_digit(v) || v.size() > 5)
            throw OutOfRange("Bad port '" + v + "' in '" + spec + "'");

        int port = std::stoi(v);

        if (port <= 0 || port > 65535)
            throw OutOfRange("Port out of range: " + v);

        return port;
    }
    // -------------------------------------------------------------------------
    std::vector<int> parsePortRange(const std::string& spec)
    {
        std::vector<int> ports;

        auto add = [&ports](int p)
        {
            if (std::find(ports.begin(), ports.end(), p) == ports.end())
                ports.push_back(p);
        };

        for (const auto& item : explode_str(spec, ','))
        {
            auto dash = item.find('-');

            if (dash == std::string::npos)
            {
                add(parsePort(item, spec));
                continue;
            }

            int from = parsePort(item.substr(0, dash), spec);
            int to = parsePort(item.substr(dash + 1), spec);

            if (from > to)
                throw OutOfRange("Bad port range '" + item + "' (from > to)");

            for (int p = from; p <= to; p++)
                add(p);
        }

        if (ports.empty())
            throw OutOfRange("Empty port range '" + spec + "'");

        return ports;
    }
    // -------------------------------------------------------------------------
    std::string portRangeToString(const std::vector<int>& ports)
    {
        std::ostringstream s;
        size_t i = 0;

        // contiguous runs are printed as a-b
        while (i < ports.size())
        {
            size_t j = i;

            while (j + 1 < ports.size() && ports[j + 1] == ports[j] + 1)
                j++;

            if (i > 0)
                s << ",";

            s << ports[i];

            if (j > i)
                s << "-" << ports[j];

            i = j + 1;
        }

        return s.str();
    }
    // -------------------------------------------------------------------------
    std::string makeURL(const std::string& host, int port)
    {
        if (port <= 0)
            return "";

        return "http://" + host + ":" + std::to_string(port);
    }
    // -------------------------------------------------------------------------
    bool LaunchContext::hasUpstream(const std::string& svc) const
    {
        return upstream.find(svc) != upstream.end();
    }
    // -------------------------------------------------------------------------
    int LaunchContext::portOf(const std::string& svc) const
    {
        auto it = upstream.find(svc);

        if (it == upstream.end())
            return 0;

        return it->second;
    }
    // -------------------------------------------------------------------------
    std::string LaunchContext::urlOf(const std::string& svc) const
    {
        return makeURL(host, portOf(svc));
    }
    // -------------------------------------------------------------------------
    std::string LaunchContext::url() const
    {
        return makeURL(host, port);
    }
    // -------------------------------------------------------------------------
} // end of namespace ostack
