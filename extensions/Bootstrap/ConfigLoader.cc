/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <regex>
#include <Poco/Environment.h>
#include "ConfigLoader.h"
#include "ExecutableResolver.h"
#include "StackTypes.h"
#include "Exceptions.h"
// -------------------------------------------------------------------------
namespace ostack
{
    // -------------------------------------------------------------------------
    static size_t msecProp(const StackXML_iterator& it, const std::string& name, size_t defval)
    {
        const std::string s = it.getProp(name);

        if (s.empty())
            return defval;

        try
        {
            return parseMsec(s);
        }
        catch (const OutOfRange& ex)
        {
            throw ConfigError("(ConfigLoader): bad " + name + "='" + s + "' for '" + it.getProp("name") + "': " + ex.what());
        }
    }
    // -------------------------------------------------------------------------
    static std::vector<std::string> splitList(const std::string& s, char sep = ',')
    {
        std::vector<std::string> lst;

        for (const auto& v : explode_str(s, sep))
        {
            auto t = trim(v);

            if (!t.empty())
                lst.push_back(t);
        }

        return lst;
    }
    // -------------------------------------------------------------------------
    ServiceSpec* ConfigLoader::StackConfig::find(const std::string& name)
    {
        for (auto& s : services)
        {
            if (s.name == name)
                return &s;
        }

        return nullptr;
    }
    // -------------------------------------------------------------------------
    ConfigLoader::ConfigLoader(const ServiceTemplateRegistry& reg)
        : registry_(reg)
    {
    }
    // -------------------------------------------------------------------------
    std::string ConfigLoader::defaultWorkDir()
    {
        std::string home = Poco::Environment::get("HOME", "");

        if (home.empty())
            return "/tmp/obstack";

        return home + "/.local/share/obstack";
    }
    // -------------------------------------------------------------------------
    ConfigLoader::StackConfig ConfigLoader::defaults(const std::string& workDir) const
    {
        StackConfig config;
        config.name = "default";
        config.workDir = workDir.empty() ? defaultWorkDir() : workDir;
        config.services = registry_.defaultStack(config.workDir);
        return config;
    }
    // -------------------------------------------------------------------------
    ConfigLoader::StackConfig ConfigLoader::load(const std::string& xmlFile,
            const std::string& stackName,
            const std::string& workDir)
    {
        StackXML xml(xmlFile);
        return load(xml, stackName, workDir);
    }
    // -------------------------------------------------------------------------
    ConfigLoader::StackConfig ConfigLoader::load(const StackXML& xml,
            const std::string& stackName,
            const std::string& workDir)
    {
        xmlNode* root = xml.getFirstNode();

        if (!root)
            throw ConfigError("(ConfigLoader): empty XML configuration");

        xmlNode* stackNode = xml.findNode(root, "ObservabilityStack", stackName);

        if (!stackNode)
        {
            if (stackName.empty())
                throw ConfigError("(ConfigLoader): ObservabilityStack section not found in configuration");

            throw ConfigError("(ConfigLoader): ObservabilityStack '" + stackName + "' not found in configuration");
        }

        StackConfig config;
        StackXML_iterator sit(stackNode);
        config.name = sit.getProp("name");

        if (!workDir.empty())
            config.workDir = workDir;
        else
            config.workDir = FileExecutableResolver::expandPath(sit.getProp2("workDir", defaultWorkDir()));

        config.parallel = parseBool(sit.getProp("parallel"), false);
        config.dependencyTimeout_msec = msecProp(sit, "dependencyTimeout", config.dependencyTimeout_msec);
        config.softSuccess = parseBool(sit.getProp("softSuccess"), true);

        xmlNode* servicesNode = xml.findNode(stackNode->children, "Services");

        if (!servicesNode)
        {
            config.services = registry_.defaultStack(config.workDir);
        }
        else
        {
            for (auto node : StackXML::children(servicesNode, "service"))
            {
                auto spec = loadService(node, config.workDir);

                if (config.find(spec.name))
                    throw ConfigError("(ConfigLoader): duplicate service '" + spec.name + "'");

                config.services.push_back(spec);
            }
        }

        if (!config.softSuccess)
        {
            for (auto& s : config.services)
                s.softSuccessOnBound = false;
        }

        return config;
    }
    // -------------------------------------------------------------------------
    ServiceSpec ConfigLoader::loadService(xmlNode* node, const std::string& baseWorkDir) const
    {
        StackXML_iterator it(node);

        const std::string type = it.getProp("type");
        const std::string name = it.getProp2("name", type);

        if (name.empty())
            throw ConfigError("(ConfigLoader): <service> without name and type");

        TemplateParams params;

        for (const auto& p : {"dashboardsDir", "provisioningDir", "grafanaHome", "config"})
        {
            std::string v = it.getProp(p);

            if (!v.empty())
                params[p] = FileExecutableResolver::expandPath(v);
        }

        const std::string wd = FileExecutableResolver::expandPath(it.getProp("workDir"));
        ServiceSpec spec;

        if (!type.empty())
        {
            const ServiceTemplate* t = registry_.findByType(type);

            if (!t)
                throw ConfigError("(ConfigLoader): unknown service type '" + type + "' for '" + name + "'");

            spec = registry_.makeSpec(type, name, baseWorkDir, params);

            if (!wd.empty())
            {
                // builders capture the work directory
                spec.workDir = wd;

                if (t->bind)
                    t->bind(spec, params);
            }
        }
        else
        {
            spec.name = name;
            spec.workDir = wd.empty() ? baseWorkDir + "/" + name : wd;
            spec.logFile = baseWorkDir + "/logs/" + name + ".log";

            if (it.getProp("command").empty() && it.getProp("candidates").empty())
                throw ConfigError("(ConfigLoader): no command for service '" + name + "'");

            if (it.getProp("ports").empty())
                throw ConfigError("(ConfigLoader): no ports for service '" + name + "'");

            spec.healthCheck = parseHealthCheck("tcp");
        }

        // executable
        std::string candidates = it.getProp("candidates");

        if (!candidates.empty())
            spec.executableCandidates = splitList(candidates, ';');

        std::string command = it.getProp("command");

        if (!command.empty())
            spec.executableCandidates.insert(spec.executableCandidates.begin(), command);

        std::string ports = it.getProp("ports");

        if (!ports.empty())
        {
            try
            {
                spec.portRange = parsePortRange(ports);
            }
            catch (const OutOfRange& ex)
            {
                throw ConfigError("(ConfigLoader): service '" + name + "': " + ex.what());
            }
        }

        std::string owners = it.getProp("owners");

        if (!owners.empty())
        {
            auto lst = splitList(owners);
            spec.expectedOwnerNames = std::set<std::string>(lst.begin(), lst.end());
        }

        std::string hc = it.getProp("healthCheck");
        std::string accept = it.getProp("accept");

        if (!hc.empty())
            spec.healthCheck = parseHealthCheck(hc, accept);
        else if (!accept.empty())
            spec.healthCheck.acceptCodes = parseHealthCheck("http:/", accept).acceptCodes;

        spec.healthCheck.timeout_msec = msecProp(it, "checkTimeout", spec.healthCheck.timeout_msec);
        spec.settleDelay_msec = msecProp(it, "settleDelay", spec.settleDelay_msec);
        spec.probeInterval_msec = msecProp(it, "probeInterval", spec.probeInterval_msec);
        spec.probeWindow_msec = msecProp(it, "probeWindow", spec.probeWindow_msec);

        spec.required = parseBool(it.getProp("required"), spec.required);
        spec.enabled = parseBool(it.getProp("enabled"), spec.enabled);
        spec.softSuccessOnBound = parseBool(it.getProp("softSuccess"), spec.softSuccessOnBound);

        std::string deps = it.getProp("dependsOn");

        if (!deps.empty())
            spec.dependsOn = splitList(deps);

        // empty "uses" turns the soft dependencies of a template off
        if (xmlHasProp(node, (const xmlChar*)"uses"))
            spec.uses = splitList(it.getProp("uses"));

        std::string logFile = it.getProp("logFile");

        if (!logFile.empty())
            spec.logFile = logFile;

        // args
        std::vector<std::string> extraArgs = parseArgs(it.getProp("args"));

        if (!extraArgs.empty())
        {
            ArgsBuilder base = spec.argsBuilder;

            spec.argsBuilder = [base, extraArgs](const LaunchContext & ctx)
            {
                std::vector<std::string> args;

                if (base)
                    args = base(ctx);

                for (const auto& a : extraArgs)
                    args.push_back(ConfigLoader::expand(a, ctx));

                return args;
            };
        }

        // environment
        std::map<std::string, std::string> env;
        for (auto enode : StackXML::children(node, "env"))
        {
            std::string varName = StackXML::getProp(enode, "name");

            if (!varName.empty())
                env[varName] = StackXML::getProp(enode, "value");
        }

        if (!env.empty())
        {
            EnvBuilder base = spec.envOverlay;

            spec.envOverlay = [base, env](const LaunchContext & ctx)
            {
                std::map<std::string, std::string> result;

                if (base)
                    result = base(ctx);

                for (const auto& v : env)
                    result[v.first] = ConfigLoader::expand(v.second, ctx);

                return result;
            };
        }

        return spec;
    }
    // -------------------------------------------------------------------------
    void ConfigLoader::applyOverrides(StackConfig& cfg, const Overrides& ovr)
    {
        auto svc = [&cfg](const std::string & name) -> ServiceSpec&
        {
            ServiceSpec* s = cfg.find(name);

            if (!s)
                throw ConfigError("unknown service '" + name + "'");

            return *s;
        };

        for (const auto& n : ovr.enable)
            svc(n).enabled = true;

        for (const auto& n : ovr.disable)
            svc(n).enabled = false;

        for (const auto& n : ovr.required)
            svc(n).required = true;

        for (const auto& n : ovr.optional)
            svc(n).required = false;

        for (const auto& p : ovr.ports)
        {
            auto& s = svc(p.first);

            try
            {
                s.portRange = parsePortRange(p.second);
            }
            catch (const OutOfRange& ex)
            {
                throw ConfigError("bad port range for '" + p.first + "': " + ex.what());
            }
        }

        for (const auto& e : ovr.exe)
        {
            auto& s = svc(e.first);
            s.executableCandidates.insert(s.executableCandidates.begin(), e.second);
        }

        if (ovr.noSoftSuccess)
        {
            cfg.softSuccess = false;

            for (auto& s : cfg.services)
                s.softSuccessOnBound = false;
        }
    }
    // -------------------------------------------------------------------------
    std::string ConfigLoader::expand(const std::string& text, const LaunchContext& ctx)
    {
        static const std::regex re("\\$\\{([A-Za-z_][A-Za-z0-9_]*)(:([A-Za-z0-9_.-]+))?\\}");

        std::string result;
        auto begin = std::sregex_iterator(text.begin(), text.end(), re);
        auto end = std::sregex_iterator();
        size_t last = 0;

        for (auto i = begin; i != end; ++i)
        {
            const std::smatch& m = *i;
            result += text.substr(last, m.position(0) - last);
            last = m.position(0) + m.length(0);

            const std::string var = m[1].str();
            const std::string svc = m[3].str();

            if (!svc.empty())
            {
                if (var == "url")
                    result += ctx.urlOf(svc);
                else if (var == "port")
                    result += ctx.hasUpstream(svc) ? std::to_string(ctx.portOf(svc)) : "";
                else
                    result += m[0].str();

                continue;
            }

            if (var == "port")
                result += std::to_string(ctx.port);
            else if (var == "host")
                result += ctx.host;
            else if (var == "name")
                result += ctx.name;
            else if (var == "workDir")
                result += ctx.workDir;
            else
                result += Poco::Environment::get(var, "");
        }

        result += text.substr(last);
        return result;
    }
    // -------------------------------------------------------------------------
    std::vector<std::string> ConfigLoader::parseArgs(const std::string& argsStr)
    {
        std::vector<std::string> args;
        std::string current;
        bool inQuotes = false;
        char quoteChar = 0;

        for (char c : argsStr)
        {
            if (!inQuotes && (c == '"' || c == '\''))
            {
                inQuotes = true;
                quoteChar = c;
            }
            else if (inQuotes && c == quoteChar)
            {
                inQuotes = false;
                quoteChar = 0;
            }
            else if (!inQuotes && (c == ' ' || c == '\t'))
            {
                if (!current.empty())
                {
                    args.push_back(current);
                    current.clear();
                }
            }
            else
            {
                current += c;
            }
        }

        if (!current.empty())
            args.push_back(current);

        return args;
    }
    // -------------------------------------------------------------------------
    bool ConfigLoader::parseBool(const std::string& s, bool defval)
    {
        const std::string v = toLower(trim(s));

        if (v == "1" || v == "true" || v == "yes" || v == "on")
            return true;

        if (v == "0" || v == "false" || v == "no" || v == "off")
            return false;

        return defval;
    }
    // -------------------------------------------------------------------------
} // end of namespace ostack
// -------------------------------------------------------------------------
