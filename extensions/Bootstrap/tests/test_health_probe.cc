/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <catch.hpp>
#include <Poco/Net/HTTPServer.h>
#include <Poco/Net/HTTPRequestHandler.h>
#include <Poco/Net/HTTPRequestHandlerFactory.h>
#include <Poco/Net/HTTPServerParams.h>
#include <Poco/Net/HTTPServerRequest.h>
#include <Poco/Net/HTTPServerResponse.h>
#include <Poco/Net/ServerSocket.h>
#include "HealthProbe.h"
#include "PassiveTimer.h"
// -------------------------------------------------------------------------
using namespace ostack;
using namespace Poco::Net;
// -------------------------------------------------------------------------
// "/health" -> 204, "/ping" -> 200, "/unauthorized" -> 401, other -> 404
class StatusHandler:
    public HTTPRequestHandler
{
    public:
        void handleRequest(HTTPServerRequest& req, HTTPServerResponse& resp) override
        {
            const std::string uri = req.getURI();

            if (uri == "/health")
                resp.setStatus(HTTPResponse::HTTP_NO_CONTENT);
            else if (uri == "/ping")
                resp.setStatus(HTTPResponse::HTTP_OK);
            else if (uri == "/unauthorized")
                resp.setStatus(HTTPResponse::HTTP_UNAUTHORIZED);
            else
                resp.setStatus(HTTPResponse::HTTP_NOT_FOUND);

            resp.setContentLength(0);
            resp.send();
        }
};

class StatusHandlerFactory:
    public HTTPRequestHandlerFactory
{
    public:
        HTTPRequestHandler* createRequestHandler(const HTTPServerRequest&) override
        {
            return new StatusHandler();
        }
};
// -------------------------------------------------------------------------
struct HTTPFixture
{
    ServerSocket socket{0};
    HTTPServer server{new StatusHandlerFactory(), socket, new HTTPServerParams()};
    int port = 0;
    NetHealthProbe probe;

    HTTPFixture()
    {
        port = socket.address().port();
        server.start();
    }

    ~HTTPFixture()
    {
        server.stopAll(true);
    }
};
// -------------------------------------------------------------------------
TEST_CASE_METHOD(HTTPFixture, "NetHealthProbe: http checks", "[health][http]")
{
    int status = 0;
    REQUIRE(NetHealthProbe::checkHTTP("127.0.0.1", port, "/ping", {200}, 1000, status) == NetHealthProbe::HTTPResult::Accepted);
    REQUIRE(status == 200);

    REQUIRE(NetHealthProbe::checkHTTP("127.0.0.1", port, "/health", {200}, 1000, status) == NetHealthProbe::HTTPResult::Rejected);
    REQUIRE(status == 204);

    SECTION("first accepted path")
    {
        REQUIRE(probe.probe(parseHealthCheck("http:/missing,/ping"), port));
        REQUIRE(probe.probe(parseHealthCheck("http:/health", "200,204"), port));
    }

    SECTION("auth protected endpoint is alive when 401 is accepted")
    {
        REQUIRE_FALSE(probe.probe(parseHealthCheck("http:/unauthorized"), port));
        REQUIRE(probe.probe(parseHealthCheck("http:/unauthorized", "200,401"), port));
    }

    SECTION("answer with a wrong code is not healthy, no tcp fallback")
    {
        REQUIRE_FALSE(probe.probe(parseHealthCheck("http:/missing"), port));
    }

    SECTION("tcp check")
    {
        REQUIRE(probe.probe(parseHealthCheck("tcp"), port));
        REQUIRE(NetHealthProbe::checkTCP("127.0.0.1", port, 500));
    }
}
// -------------------------------------------------------------------------
TEST_CASE("NetHealthProbe: silent listener falls back to tcp", "[health][tcp]")
{
    // accepted by the kernel backlog, never answers HTTP
    ServerSocket silent(0);
    int port = silent.address().port();

    auto hc = parseHealthCheck("http:/api/health");
    hc.timeout_msec = 200;

    int status = 0;
    REQUIRE(NetHealthProbe::checkHTTP("127.0.0.1", port, "/api/health", hc.acceptCodes, hc.timeout_msec, status)
            == NetHealthProbe::HTTPResult::Unreachable);

    NetHealthProbe probe;
    REQUIRE(probe.probe(hc, port));
}
// -------------------------------------------------------------------------
TEST_CASE("NetHealthProbe: closed port", "[health][tcp]")
{
    int port = 0;
    {
        ServerSocket tmp(0);
        port = tmp.address().port();
        tmp.close();
    }

    NetHealthProbe probe;
    auto hc = parseHealthCheck("http:/ping");
    hc.timeout_msec = 300;

    PassiveTimer pt;
    REQUIRE_FALSE(probe.probe(hc, port));
    REQUIRE_FALSE(probe.probe(parseHealthCheck("tcp"), port));
    REQUIRE_FALSE(NetHealthProbe::checkTCP("127.0.0.1", port, 300));
    REQUIRE(pt.getCurrent() < 3000);
}
// -------------------------------------------------------------------------
