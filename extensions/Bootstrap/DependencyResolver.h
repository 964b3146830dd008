/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef DependencyResolver_H_
#define DependencyResolver_H_
// -------------------------------------------------------------------------
#include <string>
#include <vector>
#include <set>
#include <map>
#include "Exceptions.h"
// -------------------------------------------------------------------------
namespace ostack
{
    class CyclicDependencyException : public ConfigError
    {
        public:
            explicit CyclicDependencyException(const std::string& msg)
                : ConfigError(msg) {}
    };

    class UnknownDependencyException : public ConfigError
    {
        public:
            explicit UnknownDependencyException(const std::string& msg)
                : ConfigError(msg) {}
    };

    /*!
     * Start order of services.
     *
     * Hard edges (dependsOn) must be satisfied: an unknown service or a cycle
     * of hard edges is a configuration error.
     * Soft edges (uses) only order the start when possible: an unknown service
     * is ignored and a cycle that goes through a soft edge is broken there.
     * Ignored soft edges are reported by ignored().
     *
     * Upstream services come first, otherwise the declaration order is kept.
     */
    class DependencyResolver
    {
        public:
            DependencyResolver() = default;

            enum class Kind
            {
                Hard,
                Soft
            };

            struct Edge
            {
                std::string service;
                std::string dependsOn;
                std::string reason;
            };

            /*! Add a service with its dependencies (hard wins when a name is in both) */
            void addService(const std::string& name,
                            const std::set<std::string>& hard = {},
                            const std::set<std::string>& soft = {});

            /*! 'service' depends on 'dependsOn' */
            void addDependency(const std::string& service, const std::string& dependsOn, Kind kind = Kind::Hard);

            bool hasService(const std::string& name) const;

            void clear();

            /*!
             * \return services in the order they should be started
             * \throw CyclicDependencyException on a cycle of hard dependencies
             * \throw UnknownDependencyException on a hard dependency on unknown service
             */
            std::vector<std::string> resolve();

            //! soft edges left out by the last resolve()
            const std::vector<Edge>& ignored() const;

            //! hard and soft dependencies of a service
            std::set<std::string> getDependencies(const std::string& name) const;
            std::set<std::string> getDependencies(const std::string& name, Kind kind) const;

        private:
            struct Node
            {
                std::string name;
                std::set<std::string> hard;
                std::set<std::string> soft;
            };

            enum class VisitState { White, Gray, Black };

            typedef std::map<std::string, VisitState> VisitMap;

            void checkHard() const;
            void hardDfs(const std::string& name, VisitMap& visited) const;

            // false when a cycle through a soft edge was found, the edge is returned in broken
            bool dfs(const std::string& name, VisitMap& visited, std::vector<std::string>& path,
                     std::vector<std::string>& result, Edge& broken) const;

            bool isIgnored(const std::string& service, const std::string& dep) const;

            std::map<std::string, Node> nodes_;
            std::vector<std::string> order_;  // insertion order
            std::vector<Edge> ignored_;
    };

} // end of namespace ostack
// -------------------------------------------------------------------------
#endif // DependencyResolver_H_
// -------------------------------------------------------------------------
