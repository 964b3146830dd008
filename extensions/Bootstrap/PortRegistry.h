/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef PortRegistry_H_
#define PortRegistry_H_
// -------------------------------------------------------------------------
#include <string>
#include <vector>
#include <istream>
#include <memory>
#include "ServiceInfo.h"
#include "DebugStream.h"
// -------------------------------------------------------------------------
namespace ostack
{
    /*!
     * Local TCP listen sockets: is a port bound and who owns it.
     * Ownership is advisory: implementations never throw from
     * ownerOf() and return an unknown identity instead.
     */
    class PortRegistry
    {
        public:
            virtual ~PortRegistry() = default;

            virtual bool isBound(int port) = 0;
            virtual ProcessIdentity ownerOf(int port) = 0;
    };

    /*!
     * Linux implementation on top of procfs.
     *
     * /proc/net/tcp and /proc/net/tcp6 give LISTEN sockets (state 0A)
     * with their inodes, /proc/<pid>/fd links "socket:[inode]" give the pid,
     * /proc/<pid>/comm (or the basename of /proc/<pid>/exe) gives the name.
     * Sockets of other users can't be mapped to a pid without privileges,
     * such ports are bound but have an unknown owner.
     */
    class ProcPortRegistry:
        public PortRegistry
    {
        public:
            explicit ProcPortRegistry(const std::string& procRoot = "/proc");

            bool isBound(int port) override;
            ProcessIdentity ownerOf(int port) override;

            struct ListenSocket
            {
                int port = 0;
                unsigned long inode = 0;
            };

            //! Parse a /proc/net/tcp{,6} table, only LISTEN entries are returned
            static std::vector<ListenSocket> parseTcpTable(std::istream& in);

            std::shared_ptr<DebugStream> log();

        private:
            std::vector<ListenSocket> listenSockets();
            pid_t findPidByInode(unsigned long inode);
            std::string processName(pid_t pid);

            std::string procRoot_;
            std::shared_ptr<DebugStream> mylog;
    };

} // end of namespace ostack
// -------------------------------------------------------------------------
#endif // PortRegistry_H_
// -------------------------------------------------------------------------
