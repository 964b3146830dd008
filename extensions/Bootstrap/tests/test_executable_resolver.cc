/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <catch.hpp>
#include <Poco/Environment.h>
#include "ExecutableResolver.h"
#include "FakeServices.h"
// -------------------------------------------------------------------------
using namespace ostack;
// -------------------------------------------------------------------------
TEST_CASE("FileExecutableResolver: versionLess", "[resolver]")
{
    REQUIRE(FileExecutableResolver::versionLess("grafana-9.9.0", "grafana-10.1.0"));
    REQUIRE_FALSE(FileExecutableResolver::versionLess("grafana-10.1.0", "grafana-9.9.0"));
    REQUIRE(FileExecutableResolver::versionLess("prometheus-2.9", "prometheus-2.10"));
    REQUIRE(FileExecutableResolver::versionLess("1.2", "1.2.1"));
    REQUIRE_FALSE(FileExecutableResolver::versionLess("1.2", "1.2"));
    REQUIRE(FileExecutableResolver::versionLess("abc", "abd"));
}
// -------------------------------------------------------------------------
TEST_CASE("FileExecutableResolver: expandPath", "[resolver]")
{
    Poco::Environment::set("OBSTACK_TEST_ROOT", "/opt/obstack");
    REQUIRE(FileExecutableResolver::expandPath("${OBSTACK_TEST_ROOT}/bin/influxd") == "/opt/obstack/bin/influxd");
    REQUIRE(FileExecutableResolver::expandPath("${OBSTACK_TEST_UNSET_VAR}/influxd") == "/influxd");
    REQUIRE(FileExecutableResolver::expandPath("/usr/bin/influxd") == "/usr/bin/influxd");

    // values are substituted once
    Poco::Environment::set("OBSTACK_TEST_SELF", "${OBSTACK_TEST_SELF}/x");
    REQUIRE(FileExecutableResolver::expandPath("${OBSTACK_TEST_SELF}/bin") == "${OBSTACK_TEST_SELF}/x/bin");
    REQUIRE(FileExecutableResolver::expandPath("${OBSTACK_TEST_ROOT}:${OBSTACK_TEST_ROOT}") == "/opt/obstack:/opt/obstack");

    std::string home = FileExecutableResolver::expandPath("~");
    REQUIRE_FALSE(home.empty());
    REQUIRE(home.back() != '/');
    REQUIRE(FileExecutableResolver::expandPath("~/bin/prometheus") == home + "/bin/prometheus");
}
// -------------------------------------------------------------------------
TEST_CASE("FileExecutableResolver: candidates", "[resolver]")
{
    TempDir dir;
    std::string g9 = dir.file("grafana-9.5.2/bin/grafana-server", "#!/bin/sh\n", true);
    std::string g10 = dir.file("grafana-10.1.0/bin/grafana-server", "#!/bin/sh\n", true);
    std::string g11 = dir.file("grafana-11.0.0/bin/grafana-server", "not executable");
    std::string prom = dir.file("prometheus", "#!/bin/sh\n", true);

    FileExecutableResolver resolver;

    SECTION("glob: latest version first, non executable files are skipped")
    {
        auto lst = resolver.expandCandidate(dir.path + "/grafana-*/bin/grafana-server");
        REQUIRE(lst == std::vector<std::string>({g10, g9}));
    }

    SECTION("first existing candidate wins")
    {
        REQUIRE(resolver.resolve({dir.path + "/missing", prom, g9}) == prom);
        REQUIRE(resolver.resolve({dir.path + "/grafana-*/bin/grafana-server", prom}) == g10);
    }

    SECTION("plain path must be executable")
    {
        REQUIRE(resolver.resolve({g11}).empty());
        REQUIRE(FileExecutableResolver::isExecutable(prom));
        REQUIRE_FALSE(FileExecutableResolver::isExecutable(g11));
        REQUIRE_FALSE(FileExecutableResolver::isExecutable(dir.path));
    }

    SECTION("nothing found")
    {
        REQUIRE(resolver.resolve({}).empty());
        REQUIRE(resolver.resolve({"", dir.path + "/nothing-*/bin/x"}).empty());
    }

    SECTION("bare name is searched on PATH")
    {
        std::string sh = FileExecutableResolver::findInPath("sh");
        REQUIRE_FALSE(sh.empty());
        REQUIRE(resolver.resolve({"obstack-no-such-program", "sh"}) == sh);
        REQUIRE(FileExecutableResolver::findInPath("obstack-no-such-program").empty());
    }
}
// -------------------------------------------------------------------------
