/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <fstream>
#include <sstream>
#include <cstring>
#include <climits>
#include <unistd.h>
#include <Poco/DirectoryIterator.h>
#include <Poco/Path.h>
#include <Poco/Exception.h>
#include "PortRegistry.h"
#include "StackTypes.h"
#include "Debug.h"
// -------------------------------------------------------------------------
namespace ostack
{
    // -------------------------------------------------------------------------
    ProcPortRegistry::ProcPortRegistry(const std::string& procRoot)
        : procRoot_(procRoot)
        , mylog(std::make_shared<DebugStream>())
    {
        mylog->setLogName("PortRegistry");
    }
    // -------------------------------------------------------------------------
    std::shared_ptr<DebugStream> ProcPortRegistry::log()
    {
        return mylog;
    }
    // -------------------------------------------------------------------------
    std::vector<ProcPortRegistry::ListenSocket> ProcPortRegistry::parseTcpTable(std::istream& in)
    {
        std::vector<ListenSocket> result;
        std::string line;

        // header: "sl local_address rem_address st tx_queue rx_queue tr tm->when retrnsmt uid timeout inode"
        if (!std::getline(in, line))
            return result;

        while (std::getline(in, line))
        {
            std::istringstream s(line);
            std::string sl, local, remote, st, queues, timer, retr, uid, timeout;
            unsigned long inode = 0;

            if (!(s >> sl >> local >> remote >> st >> queues >> timer >> retr >> uid >> timeout >> inode))
                continue;

            // 0A = TCP_LISTEN
            if (st != "0A")
                continue;

            auto colon = local.rfind(':');

            if (colon == std::string::npos)
                continue;

            ListenSocket ls;
            ls.port = (int)std::strtol(local.substr(colon + 1).c_str(), nullptr, 16);
            ls.inode = inode;

            if (ls.port > 0)
                result.push_back(ls);
        }

        return result;
    }
    // -------------------------------------------------------------------------
    std::vector<ProcPortRegistry::ListenSocket> ProcPortRegistry::listenSockets()
    {
        std::vector<ListenSocket> all;

        for (const auto& table : {"/net/tcp", "/net/tcp6"})
        {
            std::ifstream f(procRoot_ + table);

            if (!f.is_open())
            {
                mylog->level5() << "can't open " << procRoot_ << table << std::endl;
                continue;
            }

            auto lst = parseTcpTable(f);
            all.insert(all.end(), lst.begin(), lst.end());
        }

        return all;
    }
    // -------------------------------------------------------------------------
    bool ProcPortRegistry::isBound(int port)
    {
        for (const auto& ls : listenSockets())
        {
            if (ls.port == port)
                return true;
        }

        return false;
    }
    // -------------------------------------------------------------------------
    ProcessIdentity ProcPortRegistry::ownerOf(int port)
    {
        ProcessIdentity id;

        for (const auto& ls : listenSockets())
        {
            if (ls.port != port || ls.inode == 0)
                continue;

            pid_t pid = findPidByInode(ls.inode);

            if (pid <= 0)
                continue;

            id.pid = pid;
            id.name = processName(pid);

            if (id.known())
                break;
        }

        if (!id.known())
            mylog->level3() << "owner of port " << port << " is unknown" << std::endl;

        return id;
    }
    // -------------------------------------------------------------------------
    pid_t ProcPortRegistry::findPidByInode(unsigned long inode)
    {
        const std::string target = "socket:[" + std::to_string(inode) + "]";

        try
        {
            Poco::DirectoryIterator end;

            for (Poco::DirectoryIterator it(procRoot_); it != end; ++it)
            {
                const std::string pidName = it.name();

                if (!is_digit(pidName))
                    continue;

                const std::string fdDir = procRoot_ + "/" + pidName + "/fd";

                try
                {
                    for (Poco::DirectoryIterator fd(fdDir); fd != end; ++fd)
                    {
                        char buf[PATH_MAX];
                        ssize_t len = ::readlink(fd->path().c_str(), buf, sizeof(buf) - 1);

                        if (len <= 0)
                            continue;

                        buf[len] = '\0';

                        if (target == buf)
                            return (pid_t)uni_atoi(pidName);
                    }
                }
                catch (const Poco::Exception& ex)
                {
                    // foreign processes: permission denied, or the process is already gone
                    mylog->level9() << "skip " << fdDir << ": " << ex.displayText() << std::endl;
                }
            }
        }
        catch (const Poco::Exception& ex)
        {
            mylog->warn() << "can't scan " << procRoot_ << ": " << ex.displayText() << std::endl;
        }

        return 0;
    }
    // -------------------------------------------------------------------------
    static std::string exeName(const std::string& base)
    {
        char buf[PATH_MAX];
        ssize_t len = ::readlink((base + "/exe").c_str(), buf, sizeof(buf) - 1);

        if (len <= 0)
            return "";

        buf[len] = '\0';
        std::string path(buf);

        // "/usr/bin/foo (deleted)" after an upgrade of the binary
        const std::string deleted = " (deleted)";

        if (path.size() > deleted.size() && path.compare(path.size() - deleted.size(), deleted.size(), deleted) == 0)
            path.erase(path.size() - deleted.size());

        return Poco::Path(path).getFileName();
    }
    // -------------------------------------------------------------------------
    static std::string cmdlineName(const std::string& base)
    {
        std::ifstream cmdline(base + "/cmdline");
        std::string argv0;

        if (!cmdline.is_open() || !std::getline(cmdline, argv0, '\0') || argv0.empty())
            return "";

        return Poco::Path(argv0).getFileName();
    }
    // -------------------------------------------------------------------------
    std::string ProcPortRegistry::processName(pid_t pid)
    {
        const std::string base = procRoot_ + "/" + std::to_string(pid);

        std::ifstream comm(base + "/comm");
        std::string name;

        if (comm.is_open() && std::getline(comm, name))
            name = trim(name);

        if (name.empty())
            return exeName(base);

        if (name.size() < CommNameMax)
            return name;

        // comm is cut by the kernel, look for the full name
        for (const auto& full : {exeName(base), cmdlineName(base)})
        {
            if (full.size() > name.size() && full.compare(0, name.size(), name) == 0)
            {
                mylog->level9() << "pid " << pid << ": comm '" << name << "' is truncated, use '" << full << "'" << std::endl;
                return full;
            }
        }

        return name;
    }
    // -------------------------------------------------------------------------
} // end of namespace ostack
