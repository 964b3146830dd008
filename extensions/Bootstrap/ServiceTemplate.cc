/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <algorithm>
#include "ServiceTemplate.h"
#include "Provisioning.h"
#include "StackTypes.h"
#include "Exceptions.h"
// -------------------------------------------------------------------------
namespace ostack
{
    // -------------------------------------------------------------------------
    static std::string listenAddress(const LaunchContext& ctx)
    {
        return ctx.host + ":" + std::to_string(ctx.port);
    }
    // -------------------------------------------------------------------------
    static std::string param(const TemplateParams& params, const std::string& name, const std::string& defval)
    {
        auto it = params.find(name);

        if (it == params.end() || it->second.empty())
            return defval;

        return it->second;
    }
    // -------------------------------------------------------------------------
    static void bindPrometheus(ServiceSpec& spec, const TemplateParams& params)
    {
        const std::string config = param(params, "config", spec.workDir + "/prometheus.yml");
        const std::string data = spec.workDir + "/data";

        spec.preLaunch = [config, data](const LaunchContext & ctx)
        {
            Provisioning::makeDir(data);
            Provisioning::writePrometheusConfig(config, ctx);
        };

        spec.argsBuilder = [config, data](const LaunchContext & ctx)
        {
            return std::vector<std::string>
            {
                "--config.file=" + config,
                "--storage.tsdb.path=" + data,
                "--web.listen-address=" + listenAddress(ctx)
            };
        };
    }
    // -------------------------------------------------------------------------
    static void bindInfluxDB(ServiceSpec& spec, const TemplateParams& params)
    {
        const std::string bolt = spec.workDir + "/influxd.bolt";
        const std::string engine = spec.workDir + "/engine";

        spec.preLaunch = [engine](const LaunchContext&)
        {
            Provisioning::makeDir(engine);
        };

        spec.argsBuilder = [bolt, engine](const LaunchContext & ctx)
        {
            return std::vector<std::string>
            {
                "--http-bind-address=" + listenAddress(ctx),
                "--bolt-path=" + bolt,
                "--engine-path=" + engine
            };
        };
    }
    // -------------------------------------------------------------------------
    static void bindGrafana(ServiceSpec& spec, const TemplateParams& params)
    {
        const std::string wd = spec.workDir;
        const std::string prov = param(params, "provisioningDir", wd + "/provisioning");
        const std::string dashboards = param(params, "dashboardsDir", wd + "/dashboards");
        const std::string home = param(params, "grafanaHome", "");

        spec.preLaunch = [wd, prov, dashboards](const LaunchContext & ctx)
        {
            for (const auto& sub : {"/data", "/logs", "/plugins"})
                Provisioning::makeDir(wd + sub);

            Provisioning::writeGrafanaProvisioning(prov, dashboards, ctx);
        };

        spec.argsBuilder = [home](const LaunchContext & ctx)
        {
            std::vector<std::string> args;

            // grafana >= 10 ships a single "grafana" binary with subcommands
            if (ctx.executable.size() >= 8 && ctx.executable.compare(ctx.executable.size() - 8, 8, "/grafana") == 0)
                args.push_back("server");

            args.push_back("--homepath");
            args.push_back(home.empty() ? Provisioning::grafanaHome(ctx.executable) : home);
            return args;
        };

        spec.envOverlay = [wd, prov, home](const LaunchContext & ctx)
        {
            std::map<std::string, std::string> env =
            {
                { "GF_PATHS_HOME", home.empty() ? Provisioning::grafanaHome(ctx.executable) : home },
                { "GF_PATHS_DATA", wd + "/data" },
                { "GF_PATHS_LOGS", wd + "/logs" },
                { "GF_PATHS_PLUGINS", wd + "/plugins" },
                { "GF_PATHS_PROVISIONING", prov },
                { "GF_SERVER_HTTP_ADDR", ctx.host },
                { "GF_SERVER_HTTP_PORT", std::to_string(ctx.port) }
            };

            if (ctx.hasUpstream("prometheus"))
                env["OBSTACK_PROMETHEUS_URL"] = ctx.urlOf("prometheus");

            if (ctx.hasUpstream("influxdb"))
                env["OBSTACK_INFLUX_URL"] = ctx.urlOf("influxdb");

            return env;
        };
    }
    // -------------------------------------------------------------------------
    static void bindDashboard(ServiceSpec& spec, const TemplateParams& params)
    {
        spec.argsBuilder = [](const LaunchContext & ctx)
        {
            return std::vector<std::string> { "--host", ctx.host, "--port", std::to_string(ctx.port) };
        };

        spec.envOverlay = [](const LaunchContext & ctx)
        {
            std::map<std::string, std::string> env;

            if (ctx.hasUpstream("prometheus"))
                env["OBSTACK_METRICS_URL"] = ctx.urlOf("prometheus");

            if (ctx.hasUpstream("influxdb"))
                env["OBSTACK_INFLUX_URL"] = ctx.urlOf("influxdb");

            return env;
        };
    }
    // -------------------------------------------------------------------------
    ServiceTemplateRegistry::ServiceTemplateRegistry()
    {
        registerBuiltinTemplates();
    }
    // -------------------------------------------------------------------------
    void ServiceTemplateRegistry::registerBuiltinTemplates()
    {
        // Prometheus - metrics time series server (optional)
        {
            ServiceTemplate t;
            t.type = "prometheus";
            t.description = "metrics time-series server";
            t.candidates =
            {
                "prometheus",
                "~/.local/bin/prometheus",
                "~/.local/opt/prometheus-*/prometheus",
                "/opt/prometheus-*/prometheus",
                "/opt/prometheus/prometheus",
                "/usr/local/prometheus/prometheus"
            };
            t.ports = "9090-9100";
            t.owners = { "prometheus" };
            t.healthCheck = "http:/-/ready,/api/v1/status/runtimeinfo";
            t.accept = "200";
            t.settleDelay_msec = 1000;
            t.probeInterval_msec = 1000;
            t.probeWindow_msec = 30000;
            t.required = false;
            t.bind = bindPrometheus;
            registerTemplate(t);
        }

        // InfluxDB 2.x - columnar time series database (optional)
        {
            ServiceTemplate t;
            t.type = "influxdb";
            t.description = "columnar time-series database";
            t.candidates =
            {
                "influxd",
                "~/.local/bin/influxd",
                "~/.local/opt/influxdb2-*/influxd",
                "/opt/influxdb2-*/influxd",
                "/opt/influxdb*/usr/bin/influxd",
                "/usr/local/influxdb/influxd"
            };
            t.ports = "8086-8096";
            t.owners = { "influxd" };
            // unauthorized answers mean the server is up
            t.healthCheck = "http:/health,/ping";
            t.accept = "200,204,401,403";
            t.settleDelay_msec = 2000;
            t.probeInterval_msec = 1000;
            t.probeWindow_msec = 45000;
            t.required = false;
            t.bind = bindInfluxDB;
            registerTemplate(t);
        }

        // Grafana - dashboard UI server (required)
        {
            ServiceTemplate t;
            t.type = "grafana";
            t.description = "dashboard UI server";
            t.candidates =
            {
                "grafana-server",
                "grafana",
                "~/.local/opt/grafana-*/bin/grafana-server",
                "/opt/grafana-*/bin/grafana-server",
                "/opt/grafana/bin/grafana-server",
                "/usr/share/grafana/bin/grafana-server",
                "/usr/sbin/grafana-server"
            };
            t.ports = "3000-3010";
            t.owners = { "grafana-server", "grafana" };
            t.healthCheck = "http:/api/health";
            t.accept = "200";
            t.settleDelay_msec = 3000;
            t.probeInterval_msec = 1000;
            t.probeWindow_msec = 60000;
            t.required = true;
            t.uses = { "prometheus", "influxdb" };
            t.bind = bindGrafana;
            registerTemplate(t);
        }

        // first-party web dashboard (required)
        {
            ServiceTemplate t;
            t.type = "dashboard";
            t.description = "first-party web dashboard";
            t.candidates =
            {
                "obstack-dashboard",
                "~/.local/bin/obstack-dashboard",
                "${OBSTACK_HOME}/bin/obstack-dashboard"
            };
            t.ports = "8000-8010";
            t.owners = { "obstack-dashboard" };
            t.healthCheck = "http:/health";
            t.accept = "200";
            t.settleDelay_msec = 1000;
            t.probeInterval_msec = 1000;
            t.probeWindow_msec = 30000;
            t.required = true;
            t.uses = { "prometheus", "influxdb" };
            t.bind = bindDashboard;
            registerTemplate(t);
        }
    }
    // -------------------------------------------------------------------------
    const ServiceTemplate* ServiceTemplateRegistry::findByType(const std::string& type) const
    {
        auto it = typeIndex_.find(toLower(type));

        if (it != typeIndex_.end())
            return &templates_[it->second];

        return nullptr;
    }
    // -------------------------------------------------------------------------
    void ServiceTemplateRegistry::registerTemplate(const ServiceTemplate& tmpl)
    {
        const std::string key = toLower(tmpl.type);
        auto it = typeIndex_.find(key);

        if (it != typeIndex_.end())
        {
            templates_[it->second] = tmpl;
            return;
        }

        typeIndex_[key] = templates_.size();
        templates_.push_back(tmpl);
    }
    // -------------------------------------------------------------------------
    ServiceSpec ServiceTemplateRegistry::makeSpec(const std::string& type, const std::string& name,
            const std::string& baseWorkDir, const TemplateParams& params) const
    {
        const ServiceTemplate* t = findByType(type);

        if (!t)
            throw NameNotFound("Unknown service type '" + type + "'");

        ServiceSpec spec;
        spec.type = t->type;
        spec.name = name.empty() ? t->type : name;
        spec.executableCandidates = t->candidates;
        spec.portRange = parsePortRange(t->ports);
        spec.expectedOwnerNames = t->owners;
        spec.healthCheck = parseHealthCheck(t->healthCheck, t->accept);
        spec.settleDelay_msec = t->settleDelay_msec;
        spec.probeInterval_msec = t->probeInterval_msec;
        spec.probeWindow_msec = t->probeWindow_msec;
        spec.required = t->required;
        spec.uses = t->uses;
        spec.workDir = baseWorkDir + "/" + spec.name;
        spec.logFile = baseWorkDir + "/logs/" + spec.name + ".log";

        if (t->bind)
            t->bind(spec, params);

        return spec;
    }
    // -------------------------------------------------------------------------
    std::vector<ServiceSpec> ServiceTemplateRegistry::defaultStack(const std::string& baseWorkDir) const
    {
        std::vector<ServiceSpec> lst;

        for (const auto& type : {"prometheus", "influxdb", "grafana", "dashboard"})
            lst.push_back(makeSpec(type, "", baseWorkDir));

        return lst;
    }
    // -------------------------------------------------------------------------
    ServiceTemplateRegistry& getServiceTemplateRegistry()
    {
        static ServiceTemplateRegistry registry;
        return registry;
    }
    // -------------------------------------------------------------------------
} // end of namespace ostack
