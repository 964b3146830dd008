/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef HealthProbe_H_
#define HealthProbe_H_
// -------------------------------------------------------------------------
#include <memory>
#include <string>
#include "ServiceInfo.h"
#include "DebugStream.h"
// -------------------------------------------------------------------------
namespace ostack
{
    /*!
     * One liveness check of a service on (host, port).
     * Never throws: any transport error means "not healthy".
     */
    class HealthProbe
    {
        public:
            virtual ~HealthProbe() = default;

            virtual bool probe(const HealthCheck& check, int port) = 0;
    };

    /*!
     * Layered check on top of Poco::Net.
     * HTTP GET is done for every path in turn until one answers with
     * an accepted status code. If none of the paths produced any HTTP answer
     * (connect/read errors) the TCP connect check is used as a fallback.
     * A service that answers with a wrong status code is not healthy.
     */
    class NetHealthProbe:
        public HealthProbe
    {
        public:
            NetHealthProbe();

            bool probe(const HealthCheck& check, int port) override;

            static bool checkTCP(const std::string& host, int port, size_t timeout_msec);

            enum class HTTPResult
            {
                Accepted,       // status is in acceptCodes
                Rejected,       // answered with another status
                Unreachable     // transport error
            };

            static HTTPResult checkHTTP(const std::string& host, int port, const std::string& path,
                                        const std::set<int>& accept, size_t timeout_msec, int& status);

            std::shared_ptr<DebugStream> log();

        private:
            std::shared_ptr<DebugStream> mylog;
    };

} // end of namespace ostack
// -------------------------------------------------------------------------
#endif // HealthProbe_H_
// -------------------------------------------------------------------------
