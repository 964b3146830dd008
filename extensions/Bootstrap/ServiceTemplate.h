/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef ServiceTemplate_H_
#define ServiceTemplate_H_
// -------------------------------------------------------------------------
#include <string>
#include <vector>
#include <set>
#include <map>
#include <functional>
#include "ServiceInfo.h"
// -------------------------------------------------------------------------
namespace ostack
{
    //! extra template parameters from the configuration (dashboardsDir, grafanaHome...)
    typedef std::map<std::string, std::string> TemplateParams;

    /*!
     * Defaults for a known service type.
     * The builders of the built-in types find their upstream services by
     * the default service names ("prometheus", "influxdb").
     */
    struct ServiceTemplate
    {
        std::string type;                           //!< prometheus, grafana, influxdb, dashboard
        std::string description;
        std::vector<std::string> candidates;        //!< executable search order
        std::string ports;                          //!< default port range
        std::set<std::string> owners;               //!< process names of a running instance
        std::string healthCheck;                    //!< "tcp" or "http:/path,/path2"
        std::string accept;                         //!< accepted status codes
        size_t settleDelay_msec = 1000;
        size_t probeInterval_msec = 1000;
        size_t probeWindow_msec = 30000;
        bool required = false;
        std::vector<std::string> uses;              //!< soft upstream services

        //! installs argsBuilder, envOverlay and preLaunch into spec
        std::function<void(ServiceSpec& spec, const TemplateParams& params)> bind;
    };

    /*!
     * Registry of built-in service templates.
     */
    class ServiceTemplateRegistry
    {
        public:
            ServiceTemplateRegistry();

            /*!
             * Find template by type name (case insensitive).
             * \return Pointer to template or nullptr if not found
             */
            const ServiceTemplate* findByType(const std::string& type) const;

            /*! Register custom template (replaces a template of the same type) */
            void registerTemplate(const ServiceTemplate& tmpl);

            const std::vector<ServiceTemplate>& templates() const
            {
                return templates_;
            }

            /*!
             * Build a service from a template.
             * \param name service name (empty = type)
             * \param baseWorkDir the service works in <baseWorkDir>/<name>
             * \throw NameNotFound for an unknown type
             */
            ServiceSpec makeSpec(const std::string& type, const std::string& name,
                                 const std::string& baseWorkDir, const TemplateParams& params = {}) const;

            //! all built-in services in the default start order
            std::vector<ServiceSpec> defaultStack(const std::string& baseWorkDir) const;

        private:
            void registerBuiltinTemplates();

            std::vector<ServiceTemplate> templates_;
            std::map<std::string, size_t> typeIndex_;  // type -> index in templates_
    };

    /*!
     * Get global template registry (singleton).
     */
    ServiceTemplateRegistry& getServiceTemplateRegistry();

} // end of namespace ostack
// -------------------------------------------------------------------------
#endif // ServiceTemplate_H_
// -------------------------------------------------------------------------
