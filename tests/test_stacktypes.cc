#include <catch.hpp>
// -----------------------------------------------------------------------------
#include <sstream>
#include <limits>
#include <iomanip>
#include <cstdint>
#include <cstdio>
#include "StackTypes.h"
// -----------------------------------------------------------------------------
using namespace std;
using namespace ostack;
// -----------------------------------------------------------------------------
TEST_CASE("StackTypes: uni_atoi", "[stacktypes][uni_atoi]" )
{
    SECTION("int")
    {
        REQUIRE( uni_atoi("100") == 100 );
        REQUIRE( uni_atoi("-100") == -100 );
        REQUIRE( uni_atoi("0") == 0 );
        REQUIRE( uni_atoi("") == 0 );
        REQUIRE( uni_atoi((const char*)nullptr) == 0 );

        ostringstream imax;
        imax << std::numeric_limits<int>::max();
        REQUIRE( uni_atoi(imax.str()) == std::numeric_limits<int>::max() );
    }

    SECTION("hex")
    {
        // glibc <stdio.h> declares struct obstack, our namespace lives beside it
        char buf[16];
        std::snprintf(buf, sizeof(buf), "0x%x", 9090);
        REQUIRE( ostack::uni_atoi(buf) == 9090 );

        REQUIRE( uni_atoi("0xff") == 0xff );
        REQUIRE( uni_atoi("0x0") == 0 );
        REQUIRE( (uint32_t)uni_atoi("0xffffffff") == 0xffffffff );
    }
}
// -----------------------------------------------------------------------------
TEST_CASE("StackTypes: explode_str", "[stacktypes][explode]" )
{
    auto t1 = explode_str("prometheus,influxdb,grafana", ',');
    REQUIRE( t1.size() == 3 );
    REQUIRE( t1[0] == "prometheus" );
    REQUIRE( t1[2] == "grafana" );

    // empty items are dropped
    auto t2 = explode_str(",,9090,,9091,", ',');
    REQUIRE( t2 == std::vector<std::string>({"9090", "9091"}) );

    REQUIRE( explode_str("", ',').empty() );
    REQUIRE( explode_str(",", ',').empty() );

    auto t3 = explode_str("/usr/bin:/bin", ':');
    REQUIRE( t3.size() == 2 );
}
// -----------------------------------------------------------------------------
TEST_CASE("StackTypes: strings", "[stacktypes][strings]" )
{
    REQUIRE( is_digit("9090") );
    REQUIRE_FALSE( is_digit("") );
    REQUIRE_FALSE( is_digit("-10") );
    REQUIRE_FALSE( is_digit("100.0") );
    REQUIRE_FALSE( is_digit("10 000") );

    REQUIRE( trim("  grafana \t\n") == "grafana" );
    REQUIRE( trim(" \t ") == "" );
    REQUIRE( trim("a b") == "a b" );

    REQUIRE( toLower("Grafana-Server") == "grafana-server" );
}
// -----------------------------------------------------------------------------
TEST_CASE("StackTypes: ios_fmt_restorer", "[stacktypes][ios]" )
{
    ostringstream s;

    {
        ios_fmt_restorer r(s);
        s << std::hex << std::setw(6) << std::setfill('0') << 255;
    }

    s << " " << 255;
    REQUIRE( s.str() == "0000ff 255" );
}
// -----------------------------------------------------------------------------
