/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef ExecutableResolver_H_
#define ExecutableResolver_H_
// -------------------------------------------------------------------------
#include <string>
#include <vector>
#include <memory>
#include "DebugStream.h"
// -------------------------------------------------------------------------
namespace ostack
{
    /*!
     * Find the first existing executable among ordered candidates.
     * Empty result means "not found".
     */
    class ExecutableResolver
    {
        public:
            virtual ~ExecutableResolver() = default;

            virtual std::string resolve(const std::vector<std::string>& candidates) = 0;
    };

    /*!
     * Candidates are path patterns:
     *  - "~/" and ${VAR} are expanded;
     *  - glob patterns ("/opt/grafana-*\/bin/grafana-server") are matched
     *    and the lexicographically greatest match wins (the latest version directory);
     *  - a bare name (no '/') is searched on PATH.
     */
    class FileExecutableResolver:
        public ExecutableResolver
    {
        public:
            FileExecutableResolver();

            std::string resolve(const std::vector<std::string>& candidates) override;

            //! all existing executables for one candidate, best first
            std::vector<std::string> expandCandidate(const std::string& pattern) const;

            static std::string expandPath(const std::string& path);
            static bool isExecutable(const std::string& path);
            static std::string findInPath(const std::string& name);

            //! compare "name-9.10" > "name-9.9" (numeric parts are compared as numbers)
            static bool versionLess(const std::string& a, const std::string& b);

            std::shared_ptr<DebugStream> log();

        private:
            std::shared_ptr<DebugStream> mylog;
    };

} // end of namespace ostack
// -------------------------------------------------------------------------
#endif // ExecutableResolver_H_
// -------------------------------------------------------------------------
