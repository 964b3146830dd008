/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef ConfigLoader_H_
#define ConfigLoader_H_
// -------------------------------------------------------------------------
#include <string>
#include <vector>
#include <map>
#include "ServiceInfo.h"
#include "ServiceTemplate.h"
#include "StackXML.h"
// -------------------------------------------------------------------------
namespace ostack
{
    /*!
     * Configuration loader for obstack-bootstrap.
     * Loads the service definitions of a stack from XML configuration.
     *
     * Expected XML structure:
     * <ObservabilityStack name="dev" workDir="/srv/obstack" parallel="0"
     *                     dependencyTimeout="120000" softSuccess="1">
     *   <Services>
     *     <service name="prometheus" type="prometheus" ports="9090-9100" required="0"/>
     *     <service name="custom" command="/usr/bin/foo" args="--port ${port}"
     *              healthCheck="http:/healthz" accept="200" ports="7000-7002">
     *       <env name="FOO_HOME" value="${workDir}/foo"/>
     *     </service>
     *   </Services>
     * </ObservabilityStack>
     *
     * A stack without <Services> gets the built-in services.
     */
    class ConfigLoader
    {
        public:
            struct StackConfig
            {
                std::string name;
                std::string workDir;
                bool parallel = false;
                size_t dependencyTimeout_msec = 120000;
                bool softSuccess = true;

                std::vector<ServiceSpec> services;

                ServiceSpec* find(const std::string& name);
            };

            // command line overrides
            struct Overrides
            {
                std::vector<std::string> enable;
                std::vector<std::string> disable;
                std::vector<std::string> required;
                std::vector<std::string> optional;
                std::map<std::string, std::string> ports;   // name -> port range
                std::map<std::string, std::string> exe;     // name -> executable (or glob)
                bool noSoftSuccess = false;
            };

            explicit ConfigLoader(const ServiceTemplateRegistry& reg = getServiceTemplateRegistry());

            /*!
             * Load stack configuration from XML file.
             * \param stackName name of ObservabilityStack section (default: first found)
             * \param workDir base directory, overrides the workDir attribute
             * \throw ConfigError
             */
            StackConfig load(const std::string& xmlFile,
                             const std::string& stackName = "",
                             const std::string& workDir = "");

            StackConfig load(const StackXML& xml,
                             const std::string& stackName = "",
                             const std::string& workDir = "");

            //! built-in stack (no configuration file)
            StackConfig defaults(const std::string& workDir = "") const;

            /*!
             * Apply command line overrides.
             * \throw ConfigError for unknown services and bad port ranges
             */
            static void applyOverrides(StackConfig& cfg, const Overrides& ovr);

            //! $HOME/.local/share/obstack
            static std::string defaultWorkDir();

            /*!
             * Expand ${port}, ${host}, ${name}, ${workDir}, ${url:<service>},
             * ${port:<service>} and environment variables ${VAR}.
             * Unknown upstream services expand to an empty string.
             */
            static std::string expand(const std::string& text, const LaunchContext& ctx);

            //! split by spaces, respect quotes
            static std::vector<std::string> parseArgs(const std::string& argsStr);

            //! "1", "true", "yes", "on" (or "0", "false", "no", "off")
            static bool parseBool(const std::string& s, bool defval);

        private:
            ServiceSpec loadService(xmlNode* node, const std::string& baseWorkDir) const;

            const ServiceTemplateRegistry& registry_;
    };

} // end of namespace ostack
// -------------------------------------------------------------------------
#endif // ConfigLoader_H_
// -------------------------------------------------------------------------
