/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <algorithm>
#include <cctype>
#include <regex>
#include <set>
#include <Poco/Glob.h>
#include <Poco/File.h>
#include <Poco/Path.h>
#include <Poco/Environment.h>
#include <Poco/Exception.h>
#include "ExecutableResolver.h"
#include "StackTypes.h"
#include "Debug.h"
// -------------------------------------------------------------------------
namespace ostack
{
    // -------------------------------------------------------------------------
    FileExecutableResolver::FileExecutableResolver()
        : mylog(std::make_shared<DebugStream>())
    {
        mylog->setLogName("ExecutableResolver");
    }
    // -------------------------------------------------------------------------
    std::shared_ptr<DebugStream> FileExecutableResolver::log()
    {
        return mylog;
    }
    // -------------------------------------------------------------------------
    std::string FileExecutableResolver::resolve(const std::vector<std::string>& candidates)
    {
        for (const auto& c : candidates)
        {
            auto found = expandCandidate(c);

            if (!found.empty())
            {
                mylog->level3() << "'" << c << "' -> " << found.front() << std::endl;
                return found.front();
            }

            mylog->level4() << "'" << c << "' not found" << std::endl;
        }

        return "";
    }
    // -------------------------------------------------------------------------
    std::vector<std::string> FileExecutableResolver::expandCandidate(const std::string& pattern) const
    {
        std::vector<std::string> result;
        std::string path = expandPath(trim(pattern));

        if (path.empty())
            return result;

        // bare name
        if (path.find('/') == std::string::npos)
        {
            std::string p = findInPath(path);

            if (!p.empty())
                result.push_back(p);

            return result;
        }

        if (path.find_first_of("*?[{") == std::string::npos)
        {
            if (isExecutable(path))
                result.push_back(path);

            return result;
        }

        std::set<std::string> files;

        try
        {
            Poco::Glob::glob(path, files);
        }
        catch (const Poco::Exception& ex)
        {
            mylog->warn() << "glob '" << path << "' failed: " << ex.displayText() << std::endl;
            return result;
        }

        for (const auto& f : files)
        {
            if (isExecutable(f))
                result.push_back(f);
        }

        // latest version first
        std::sort(result.begin(), result.end(), [](const std::string& a, const std::string& b)
        {
            return versionLess(b, a);
        });

        return result;
    }
    // -------------------------------------------------------------------------
    std::string FileExecutableResolver::expandPath(const std::string& path)
    {
        std::string result = path;

        if (result == "~" || result.compare(0, 2, "~/") == 0)
        {
            std::string home = Poco::Environment::get("HOME", "");

            if (home.empty())
                home = Poco::Path::home();

            if (!home.empty() && home.back() == '/')
                home.pop_back();

            result = home + result.substr(1);
        }

        // ${VAR}, substituted values are not expanded again
        static const std::regex envRegex(R"(\$\{([^}]+)\})");

        std::string expanded;
        size_t last = 0;

        for (auto i = std::sregex_iterator(result.begin(), result.end(), envRegex); i != std::sregex_iterator(); ++i)
        {
            const std::smatch& m = *i;
            expanded += result.substr(last, m.position(0) - last);
            expanded += Poco::Environment::get(m[1].str(), "");
            last = m.position(0) + m.length(0);
        }

        expanded += result.substr(last);
        return expanded;
    }
    // -------------------------------------------------------------------------
    bool FileExecutableResolver::isExecutable(const std::string& path)
    {
        try
        {
            Poco::File f(path);
            return f.exists() && f.isFile() && f.canExecute();
        }
        catch (const Poco::Exception&)
        {
            return false;
        }
    }
    // -------------------------------------------------------------------------
    std::string FileExecutableResolver::findInPath(const std::string& name)
    {
        std::string path = Poco::Environment::get("PATH", "/usr/local/bin:/usr/bin:/bin");

        for (const auto& dir : explode_str(path, ':'))
        {
            std::string full = dir + "/" + name;

            if (isExecutable(full))
                return full;
        }

        return "";
    }
    // -------------------------------------------------------------------------
    bool FileExecutableResolver::versionLess(const std::string& a, const std::string& b)
    {
        size_t i = 0;
        size_t j = 0;

        while (i < a.size() && j < b.size())
        {
            if (std::isdigit((unsigned char)a[i]) && std::isdigit((unsigned char)b[j]))
            {
                size_t ie = i;
                size_t je = j;

                while (ie < a.size() && std::isdigit((unsigned char)a[ie]))
                    ie++;

                while (je < b.size() && std::isdigit((unsigned char)b[je]))
                    je++;

                unsigned long long na = std::stoull(a.substr(i, std::min<size_t>(ie - i, 18)));
                unsigned long long nb = std::stoull(b.substr(j, std::min<size_t>(je - j, 18)));

                if (na != nb)
                    return na < nb;

                i = ie;
                j = je;
                continue;
            }

            if (a[i] != b[j])
                return a[i] < b[j];

            i++;
            j++;
        }

        return (a.size() - i) < (b.size() - j);
    }
    // -------------------------------------------------------------------------
} // end of namespace ostack
