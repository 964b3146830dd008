/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <Poco/Net/StreamSocket.h>
#include <Poco/Net/SocketAddress.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Exception.h>
#include "HealthProbe.h"
#include "PassiveTimer.h"
#include "Debug.h"
// -------------------------------------------------------------------------
namespace ostack
{
    // -------------------------------------------------------------------------
    NetHealthProbe::NetHealthProbe()
        : mylog(std::make_shared<DebugStream>())
    {
        mylog->setLogName("HealthProbe");
    }
    // -------------------------------------------------------------------------
    std::shared_ptr<DebugStream> NetHealthProbe::log()
    {
        return mylog;
    }
    // -------------------------------------------------------------------------
    bool NetHealthProbe::probe(const HealthCheck& check, int port)
    {
        if (check.isHTTP())
        {
            bool answered = false;

            for (const auto& path : check.paths)
            {
                int status = 0;
                auto res = checkHTTP(check.host, port, path, check.acceptCodes, check.timeout_msec, status);

                if (res == HTTPResult::Accepted)
                {
                    mylog->level4() << check.host << ":" << port << path << " -> " << status << std::endl;
                    return true;
                }

                if (res == HTTPResult::Rejected)
                {
                    answered = true;
                    mylog->level4() << check.host << ":" << port << path
                                    << " -> " << status << " (not accepted)" << std::endl;
                }
                else
                    mylog->level5() << check.host << ":" << port << path << " unreachable" << std::endl;
            }

            if (answered)
                return false;
        }

        bool ok = checkTCP(check.host, port, check.timeout_msec);
        mylog->level4() << "tcp " << check.host << ":" << port << (ok ? " OK" : " FAIL") << std::endl;
        return ok;
    }
    // -------------------------------------------------------------------------
    bool NetHealthProbe::checkTCP(const std::string& host, int port, size_t timeout_msec)
    {
        try
        {
            Poco::Net::SocketAddress addr(host, (Poco::UInt16)port);
            Poco::Net::StreamSocket socket;
            socket.connect(addr, StackTimer::millisecToPoco(timeout_msec));
            socket.close();
            return true;
        }
        catch (const Poco::Exception&)
        {
            return false;
        }
    }
    // -------------------------------------------------------------------------
    NetHealthProbe::HTTPResult NetHealthProbe::checkHTTP(const std::string& host, int port, const std::string& path,
            const std::set<int>& accept, size_t timeout_msec, int& status)
    {
        status = 0;

        try
        {
            Poco::Net::HTTPClientSession session(host, (Poco::UInt16)port);
            session.setTimeout(StackTimer::millisecToPoco(timeout_msec));

            Poco::Net::HTTPRequest request(Poco::Net::HTTPRequest::HTTP_GET, path.empty() ? "/" : path,
                                           Poco::Net::HTTPMessage::HTTP_1_1);
            session.sendRequest(request);

            Poco::Net::HTTPResponse response;
            session.receiveResponse(response);

            status = (int)response.getStatus();
            return accept.count(status) ? HTTPResult::Accepted : HTTPResult::Rejected;
        }
        catch (const Poco::Exception&)
        {
            return HTTPResult::Unreachable;
        }
        catch (const std::exception&)
        {
            return HTTPResult::Unreachable;
        }
    }
    // -------------------------------------------------------------------------
} // end of namespace ostack
