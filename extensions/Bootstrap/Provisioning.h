/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef Provisioning_H_
#define Provisioning_H_
// -------------------------------------------------------------------------
#include <string>
#include "ServiceInfo.h"
// -------------------------------------------------------------------------
namespace ostack
{
    /*!
     * Files written for the services before they are launched:
     * Grafana provisioning (data sources and dashboard provider)
     * and a minimal prometheus.yml. The content is not validated.
     */
    class Provisioning
    {
        public:
            static const std::string DatasourcesFile;  // relative to the provisioning dir
            static const std::string DashboardsFile;

            //! Prometheus and InfluxDB data sources, only known URLs are listed
            static std::string datasourcesYaml(const std::string& prometheusURL, const std::string& influxURL);

            //! file provider for the staged dashboards directory
            static std::string dashboardsYaml(const std::string& dashboardsDir);

            //! scrape config of Prometheus itself
            static std::string prometheusYaml(const std::string& listenAddress);

            /*!
             * Write provisioning for Grafana.
             * \param provDir GF_PATHS_PROVISIONING
             * \param dashboardsDir staged dashboards (created if absent)
             * \param ctx upstream "prometheus" and "influxdb" are used when healthy
             * \throw SystemError on file system errors
             */
            static void writeGrafanaProvisioning(const std::string& provDir,
                                                 const std::string& dashboardsDir,
                                                 const LaunchContext& ctx);

            /*!
             * Write prometheus.yml unless it already exists.
             * \return true if the file was written
             */
            static bool writePrometheusConfig(const std::string& path, const LaunchContext& ctx);

            /*!
             * Write a file (via a temporary file and rename), create parent directories.
             * \throw SystemError
             */
            static void writeFile(const std::string& path, const std::string& content);

            //! create a directory with parents, \throw SystemError
            static void makeDir(const std::string& path);

            /*!
             * Grafana home directory for an executable:
             * <home>/bin/grafana-server -> <home>,
             * system packages (/usr/sbin/grafana-server) -> /usr/share/grafana
             */
            static std::string grafanaHome(const std::string& executable);
    };

} // end of namespace ostack
// -------------------------------------------------------------------------
#endif // Provisioning_H_
// -------------------------------------------------------------------------
