/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <sstream>
#include <unistd.h>
#include <Poco/File.h>
#include <Poco/Path.h>
#include <Poco/FileStream.h>
#include <Poco/Exception.h>
#include "Provisioning.h"
#include "Exceptions.h"
// -------------------------------------------------------------------------
namespace ostack
{
    // -------------------------------------------------------------------------
    const std::string Provisioning::DatasourcesFile = "datasources/obstack-datasources.yml";
    const std::string Provisioning::DashboardsFile = "dashboards/obstack-dashboards.yml";
    // -------------------------------------------------------------------------
    std::string Provisioning::datasourcesYaml(const std::string& prometheusURL, const std::string& influxURL)
    {
        std::ostringstream s;
        s << "# generated by obstack-bootstrap" << std::endl
          << "apiVersion: 1" << std::endl;

        if (prometheusURL.empty() && influxURL.empty())
        {
            s << "datasources: []" << std::endl;
            return s.str();
        }

        s << "datasources:" << std::endl;

        if (!prometheusURL.empty())
        {
            s << "  - name: Prometheus" << std::endl
              << "    uid: obstack-prometheus" << std::endl
              << "    type: prometheus" << std::endl
              << "    access: proxy" << std::endl
              << "    url: " << prometheusURL << std::endl
              << "    isDefault: true" << std::endl
              << "    editable: true" << std::endl;
        }

        if (!influxURL.empty())
        {
            s << "  - name: InfluxDB" << std::endl
              << "    uid: obstack-influxdb" << std::endl
              << "    type: influxdb" << std::endl
              << "    access: proxy" << std::endl
              << "    url: " << influxURL << std::endl
              << "    isDefault: " << (prometheusURL.empty() ? "true" : "false") << std::endl
              << "    editable: true" << std::endl
              << "    jsonData:" << std::endl
              << "      version: Flux" << std::endl;
        }

        return s.str();
    }
    // -------------------------------------------------------------------------
    std::string Provisioning::dashboardsYaml(const std::string& dashboardsDir)
    {
        std::ostringstream s;
        s << "# generated by obstack-bootstrap" << std::endl
          << "apiVersion: 1" << std::endl
          << "providers:" << std::endl
          << "  - name: obstack" << std::endl
          << "    orgId: 1" << std::endl
          << "    folder: obstack" << std::endl
          << "    type: file" << std::endl
          << "    disableDeletion: false" << std::endl
          << "    allowUiUpdates: true" << std::endl
          << "    updateIntervalSeconds: 30" << std::endl
          << "    options:" << std::endl
          << "      path: " << dashboardsDir << std::endl
          << "      foldersFromFilesStructure: true" << std::endl;
        return s.str();
    }
    // -------------------------------------------------------------------------
    std::string Provisioning::prometheusYaml(const std::string& listenAddress)
    {
        std::ostringstream s;
        s << "# generated by obstack-bootstrap" << std::endl
          << "global:" << std::endl
          << "  scrape_interval: 15s" << std::endl
          << "  evaluation_interval: 15s" << std::endl
          << "scrape_configs:" << std::endl
          << "  - job_name: prometheus" << std::endl
          << "    static_configs:" << std::endl
          << "      - targets: ['" << listenAddress << "']" << std::endl;
        return s.str();
    }
    // -------------------------------------------------------------------------
    void Provisioning::makeDir(const std::string& path)
    {
        if (path.empty())
            return;

        try
        {
            Poco::File(path).createDirectories();
        }
        catch (const Poco::Exception& ex)
        {
            throw SystemError("can't create directory '" + path + "': " + ex.displayText());
        }
    }
    // -------------------------------------------------------------------------
    void Provisioning::writeFile(const std::string& path, const std::string& content)
    {
        Poco::Path p(path);
        makeDir(p.parent().toString());

        const std::string tmp = path + ".tmp." + std::to_string(::getpid());
        std::string err;

        try
        {
            {
                Poco::FileOutputStream out(tmp, std::ios::out | std::ios::trunc);
                out << content;
                out.close();

                if (!out.good())
                    throw SystemError("write error");
            }

            Poco::File(tmp).renameTo(path);
            return;
        }
        catch (const Poco::Exception& ex)
        {
            err = ex.displayText();
        }
        catch (const SystemError& ex)
        {
            err = ex.what();
        }

        // the temporary file must not stay beside the target
        try
        {
            Poco::File f(tmp);

            if (f.exists())
                f.remove();
        }
        catch (const Poco::Exception& ex)
        {
            err += " (and can't remove '" + tmp + "': " + ex.displayText() + ")";
        }

        throw SystemError("can't write '" + path + "': " + err);
    }
    // -------------------------------------------------------------------------
    void Provisioning::writeGrafanaProvisioning(const std::string& provDir,
            const std::string& dashboardsDir,
            const LaunchContext& ctx)
    {
        makeDir(dashboardsDir);

        // Grafana refuses to start when these directories are missing
        for (const auto& sub : {"datasources", "dashboards", "plugins", "notifiers", "alerting"})
            makeDir(provDir + "/" + sub);

        writeFile(provDir + "/" + DatasourcesFile, datasourcesYaml(ctx.urlOf("prometheus"), ctx.urlOf("influxdb")));
        writeFile(provDir + "/" + DashboardsFile, dashboardsYaml(dashboardsDir));
    }
    // -------------------------------------------------------------------------
    bool Provisioning::writePrometheusConfig(const std::string& path, const LaunchContext& ctx)
    {
        if (Poco::File(path).exists())
            return false;

        writeFile(path, prometheusYaml(ctx.host + ":" + std::to_string(ctx.port)));
        return true;
    }
    // -------------------------------------------------------------------------
    std::string Provisioning::grafanaHome(const std::string& executable)
    {
        if (executable.empty())
            return "";

        Poco::Path exe(executable);
        Poco::Path bin = exe.parent();

        if (bin.depth() > 0 && bin[bin.depth() - 1] == "bin")
        {
            std::string home = bin.parent().toString(Poco::Path::PATH_UNIX);

            // a distribution tarball: <home>/bin and <home>/conf/defaults.ini
            if (Poco::File(home + "conf/defaults.ini").exists())
            {
                if (home.size() > 1 && home.back() == '/')
                    home.pop_back();

                return home;
            }
        }

        return "/usr/share/grafana";
    }
    // -------------------------------------------------------------------------
} // end of namespace ostack
