/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef StackReport_H_
#define StackReport_H_
// -------------------------------------------------------------------------
#include <string>
#include <vector>
#include <iostream>
#include "ServiceInfo.h"
// -------------------------------------------------------------------------
namespace ostack
{
    /*!
     * Final report of a bootstrap run:
     * text summary with a hint for every failed service,
     * JSON summary and an env-file with the resolved URLs.
     */
    class StackReport
    {
        public:
            struct Entry
            {
                ServiceState state;
                std::string type;
                std::string url;    // empty unless healthy
                std::string hint;
            };

            StackReport(const std::vector<ServiceState>& states,
                        const std::vector<ServiceSpec>& specs,
                        int exitCode, bool aborted);

            const std::vector<Entry>& entries() const
            {
                return entries_;
            }

            int exitCode() const
            {
                return exitCode_;
            }

            //! what the operator can do about a failed service (empty if nothing)
            static std::string hint(const ServiceState& st, const ServiceSpec* spec);

            //! OBSTACK_<NAME>_URL
            static std::string envName(const std::string& service, const std::string& suffix = "URL");

            void print(std::ostream& out) const;
            std::string toJSON() const;
            std::string toEnvFile() const;

            //! \throw SystemError
            void writeJSON(const std::string& path) const;
            void writeEnvFile(const std::string& path) const;

            //! Grafana URL, or the dashboard one when Grafana is not healthy
            std::string browserURL() const;

        private:
            std::vector<Entry> entries_;
            int exitCode_ = 0;
            bool aborted_ = false;
    };

} // end of namespace ostack
// -------------------------------------------------------------------------
#endif // StackReport_H_
// -------------------------------------------------------------------------
