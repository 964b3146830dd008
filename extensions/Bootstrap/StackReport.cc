/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <sstream>
#include <iomanip>
#include <cctype>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Stringifier.h>
#include "StackReport.h"
#include "Provisioning.h"
#include "StackTypes.h"
// -------------------------------------------------------------------------
namespace ostack
{
    // -------------------------------------------------------------------------
    StackReport::StackReport(const std::vector<ServiceState>& states,
                             const std::vector<ServiceSpec>& specs,
                             int exitCode, bool aborted)
        : exitCode_(exitCode)
        , aborted_(aborted)
    {
        for (const auto& st : states)
        {
            const ServiceSpec* spec = nullptr;

            for (const auto& s : specs)
            {
                if (s.name == st.name)
                {
                    spec = &s;
                    break;
                }
            }

            Entry e;
            e.state = st;
            e.type = spec ? spec->type : "";
            e.hint = hint(st, spec);

            if (st.healthy())
                e.url = makeURL(spec ? spec->healthCheck.host : "127.0.0.1", st.currentPort);

            entries_.push_back(e);
        }
    }
    // -------------------------------------------------------------------------
    std::string StackReport::hint(const ServiceState& st, const ServiceSpec* spec)
    {
        std::ostringstream s;

        switch (st.status)
        {
            case ServiceStatus::Healthy:
                if (st.softSuccess)
                    s << "port " << st.currentPort << " is held by an expected process which does not answer health checks, reused as is";

                break;

            case ServiceStatus::ExecutableNotFound:
                s << "install " << (spec && !spec->type.empty() ? spec->type : st.name)
                  << " or point to it with --exe " << st.name << "=PATH";

                if (spec && !spec->executableCandidates.empty())
                {
                    s << " (searched:";

                    for (const auto& c : spec->executableCandidates)
                        s << " " << c;

                    s << ")";
                }

                break;

            case ServiceStatus::ExhaustedPortRange:
                if (st.attemptedPorts.empty())
                    s << "all ports are busy";
                else
                    s << "no healthy instance on ports " << portRangeToString(st.attemptedPorts);

                if (spec && !spec->logFile.empty() && st.launches > 0)
                    s << ", see " << spec->logFile;

                s << "; free a port or use --ports " << st.name << "=RANGE";
                break;

            case ServiceStatus::DependencyFailed:
                s << (st.lastError.empty() ? std::string("upstream service is not healthy") : st.lastError)
                  << "; fix the upstream service or make it optional";
                break;

            case ServiceStatus::Aborted:
                s << "bootstrap aborted by operator";
                break;

            case ServiceStatus::Disabled:
                s << "disabled, use --enable " << st.name;
                break;

            case ServiceStatus::Failed:
                s << (st.lastError.empty() ? std::string("unexpected error") : st.lastError)
                  << "; rerun with --log-level any for details";
                break;

            default:
                if (!st.lastError.empty())
                    s << st.lastError;

                break;
        }

        return s.str();
    }
    // -------------------------------------------------------------------------
    std::string StackReport::envName(const std::string& service, const std::string& suffix)
    {
        std::string n = "OBSTACK_";

        for (char c : service)
            n += std::isalnum((unsigned char)c) ? (char)std::toupper((unsigned char)c) : '_';

        return n + "_" + suffix;
    }
    // -------------------------------------------------------------------------
    void StackReport::print(std::ostream& out) const
    {
        ios_fmt_restorer ifs(out);

        out << std::endl << "--- Observability Stack Summary ---" << std::endl;

        for (const auto& e : entries_)
        {
            const auto& st = e.state;
            out << std::left << std::setw(12) << st.name << " "
                << std::setw(5) << (st.healthy() ? "OK" : "DOWN") << " ";

            if (st.healthy())
            {
                out << "url=" << e.url;

                if (!st.ownedByUs())
                    out << " (reused)";
                else
                    out << " (pid " << st.processHandle << ")";

                if (st.softSuccess)
                    out << " [soft]";
            }
            else
            {
                out << to_string(st.status);

                if (!st.required)
                    out << " (optional)";
            }

            out << std::endl;

            if (!e.hint.empty())
                out << std::setw(13) << "" << "hint: " << e.hint << std::endl;
        }

        out << "-----------------------------------" << std::endl;

        if (aborted_)
            out << "Bootstrap aborted" << std::endl;
        else if (exitCode_ != 0)
            out << "ERROR: required services are not healthy" << std::endl;

        out << std::endl;
    }
    // -------------------------------------------------------------------------
    std::string StackReport::toJSON() const
    {
        Poco::JSON::Object root;
        root.set("exitCode", exitCode_);
        root.set("aborted", aborted_);

        Poco::JSON::Object services;

        for (const auto& e : entries_)
        {
            const auto& st = e.state;
            Poco::JSON::Object obj;
            obj.set("status", to_string(st.status));
            obj.set("type", e.type);
            obj.set("required", st.required);
            obj.set("port", st.currentPort);
            obj.set("ownedByUs", st.ownedByUs());
            obj.set("pid", (int)st.processHandle);
            obj.set("softSuccess", st.softSuccess);
            obj.set("launches", st.launches);
            obj.set("executable", st.executable);

            Poco::JSON::Array attempts;

            for (const auto& p : st.attemptedPorts)
                attempts.add(p);

            obj.set("attempts", attempts);

            if (!e.url.empty())
                obj.set("url", e.url);

            if (!e.hint.empty())
                obj.set("hint", e.hint);

            if (!st.lastError.empty())
                obj.set("lastError", st.lastError);

            services.set(st.name, obj);
        }

        root.set("services", services);

        std::ostringstream oss;
        Poco::JSON::Stringifier::stringify(root, oss, 2);
        return oss.str();
    }
    // -------------------------------------------------------------------------
    std::string StackReport::toEnvFile() const
    {
        std::ostringstream s;
        s << "# generated by obstack-bootstrap" << std::endl;

        for (const auto& e : entries_)
        {
            if (e.url.empty())
                continue;

            s << envName(e.state.name) << "=" << e.url << std::endl;
            s << envName(e.state.name, "PORT") << "=" << e.state.currentPort << std::endl;
        }

        return s.str();
    }
    // -------------------------------------------------------------------------
    void StackReport::writeJSON(const std::string& path) const
    {
        Provisioning::writeFile(path, toJSON());
    }
    // -------------------------------------------------------------------------
    void StackReport::writeEnvFile(const std::string& path) const
    {
        Provisioning::writeFile(path, toEnvFile());
    }
    // -------------------------------------------------------------------------
    std::string StackReport::browserURL() const
    {
        for (const auto& type : {"grafana", "dashboard"})
        {
            for (const auto& e : entries_)
            {
                if ((e.type == type || e.state.name == type) && !e.url.empty())
                    return e.url;
            }
        }

        return "";
    }
    // -------------------------------------------------------------------------
} // end of namespace ostack
// -------------------------------------------------------------------------
