/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <algorithm>
#include "DependencyResolver.h"
// -------------------------------------------------------------------------
namespace ostack
{
    // -------------------------------------------------------------------------
    void DependencyResolver::addService(const std::string& name,
                                        const std::set<std::string>& hard,
                                        const std::set<std::string>& soft)
    {
        if (nodes_.find(name) == nodes_.end())
            order_.push_back(name);

        Node n{name, hard, {}};

        for (const auto& s : soft)
        {
            if (hard.find(s) == hard.end())
                n.soft.insert(s);
        }

        nodes_[name] = n;
    }
    // -------------------------------------------------------------------------
    void DependencyResolver::addDependency(const std::string& service, const std::string& dependsOn, Kind kind)
    {
        if (nodes_.find(service) == nodes_.end())
            addService(service);

        Node& n = nodes_[service];

        if (kind == Kind::Hard)
        {
            n.soft.erase(dependsOn);
            n.hard.insert(dependsOn);
        }
        else if (n.hard.find(dependsOn) == n.hard.end())
            n.soft.insert(dependsOn);
    }
    // -------------------------------------------------------------------------
    bool DependencyResolver::hasService(const std::string& name) const
    {
        return nodes_.find(name) != nodes_.end();
    }
    // -------------------------------------------------------------------------
    void DependencyResolver::clear()
    {
        nodes_.clear();
        order_.clear();
        ignored_.clear();
    }
    // -------------------------------------------------------------------------
    std::set<std::string> DependencyResolver::getDependencies(const std::string& name) const
    {
        auto it = nodes_.find(name);

        if (it == nodes_.end())
            return {};

        std::set<std::string> all(it->second.hard);
        all.insert(it->second.soft.begin(), it->second.soft.end());
        return all;
    }
    // -------------------------------------------------------------------------
    std::set<std::string> DependencyResolver::getDependencies(const std::string& name, Kind kind) const
    {
        auto it = nodes_.find(name);

        if (it == nodes_.end())
            return {};

        return kind == Kind::Hard ? it->second.hard : it->second.soft;
    }
    // -------------------------------------------------------------------------
    const std::vector<DependencyResolver::Edge>& DependencyResolver::ignored() const
    {
        return ignored_;
    }
    // -------------------------------------------------------------------------
    bool DependencyResolver::isIgnored(const std::string& service, const std::string& dep) const
    {
        for (const auto& e : ignored_)
        {
            if (e.service == service && e.dependsOn == dep)
                return true;
        }

        return false;
    }
    // -------------------------------------------------------------------------
    void DependencyResolver::checkHard() const
    {
        for (const auto& kv : nodes_)
        {
            for (const auto& dep : kv.second.hard)
            {
                if (nodes_.find(dep) == nodes_.end())
                {
                    throw UnknownDependencyException(
                        "Service '" + kv.first + "' depends on unknown service '" + dep + "'");
                }

                if (dep == kv.first)
                    throw CyclicDependencyException("Service '" + dep + "' depends on itself");
            }
        }

        VisitMap visited;

        for (const auto& name : order_)
        {
            if (visited[name] == VisitState::White)
                hardDfs(name, visited);
        }
    }
    // -------------------------------------------------------------------------
    void DependencyResolver::hardDfs(const std::string& name, VisitMap& visited) const
    {
        visited[name] = VisitState::Gray;

        for (const auto& dep : nodes_.at(name).hard)
        {
            if (visited[dep] == VisitState::Gray)
            {
                throw CyclicDependencyException(
                    "Cyclic dependency detected: " + name + " -> " + dep);
            }

            if (visited[dep] == VisitState::White)
                hardDfs(dep, visited);
        }

        visited[name] = VisitState::Black;
    }
    // -------------------------------------------------------------------------
    std::vector<std::string> DependencyResolver::resolve()
    {
        ignored_.clear();

        // only hard edges can make the configuration invalid
        checkHard();

        for (const auto& kv : nodes_)
        {
            for (const auto& dep : kv.second.soft)
            {
                if (dep == kv.first)
                    ignored_.push_back(Edge{kv.first, dep, "uses itself"});
                else if (nodes_.find(dep) == nodes_.end())
                    ignored_.push_back(Edge{kv.first, dep, "unknown service"});
            }
        }

        // every pass either succeeds or drops one soft edge
        while (true)
        {
            VisitMap visited;
            std::vector<std::string> path;
            std::vector<std::string> result;
            Edge broken;
            bool ok = true;

            for (const auto& name : order_)
            {
                if (visited[name] != VisitState::White)
                    continue;

                if (!dfs(name, visited, path, result, broken))
                {
                    ok = false;
                    break;
                }
            }

            if (ok)
                return result;

            ignored_.push_back(broken);
        }
    }
    // -------------------------------------------------------------------------
    bool DependencyResolver::dfs(const std::string& name, VisitMap& visited, std::vector<std::string>& path,
                                 std::vector<std::string>& result, Edge& broken) const
    {
        visited[name] = VisitState::Gray;
        path.push_back(name);

        const Node& node = nodes_.at(name);

        std::vector<std::string> deps(node.hard.begin(), node.hard.end());

        for (const auto& s : node.soft)
        {
            if (!isIgnored(name, s))
                deps.push_back(s);
        }

        for (const auto& dep : deps)
        {
            if (visited[dep] == VisitState::Gray)
            {
                // cycle: path[k..end] -> dep. Hard edges alone have no cycles (checkHard),
                // the soft edge nearest to the end is dropped
                size_t k = std::find(path.begin(), path.end(), dep) - path.begin();
                path.push_back(dep);

                for (size_t i = path.size() - 1; i > k; i--)
                {
                    const std::string& from = path[i - 1];
                    const std::string& to = path[i];

                    if (nodes_.at(from).soft.count(to))
                    {
                        broken = Edge{from, to, "cyclic dependency"};
                        return false;
                    }
                }

                throw CyclicDependencyException("Cyclic dependency detected: " + name + " -> " + dep);
            }

            if (visited[dep] == VisitState::White && !dfs(dep, visited, path, result, broken))
                return false;
        }

        visited[name] = VisitState::Black;
        path.pop_back();
        result.push_back(name);
        return true;
    }
    // -------------------------------------------------------------------------
} // end of namespace ostack
