#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <jau/darray.hpp>
#include <central_bt/BTUUID.hpp>

using namespace central_bt;

TEST_CASE( "UUID Format Test 01", "[datatype][uuid]" ) {
    // 16-bit SIG UUID in base UUID form collapses to its short form
    REQUIRE( "180d" == formatUuid("0000180D-0000-1000-8000-00805F9B34FB") );
    REQUIRE( "2a37" == formatUuid("00002a37-0000-1000-8000-00805f9b34fb") );
    REQUIRE( "180d" == formatUuid("{0000180d-0000-1000-8000-00805f9b34fb}") );

    // Vendor UUID keeps all 32 hex digits
    REQUIRE( "6e400001b5a3f393e0a9e50e24dcca9e" == formatUuid("6E400001-B5A3-F393-E0A9-E50E24DCCA9E") );
    REQUIRE( "6e400001b5a3f393e0a9e50e24dcca9e" == formatUuid("{6e400001-b5a3-f393-e0a9-e50e24dcca9e}") );

    // 32-bit UUIDs in base form don't collapse
    REQUIRE( "12345678000010008000" "00805f9b34fb" == formatUuid("12345678-0000-1000-8000-00805f9b34fb") );

    // Short forms pass through lower cased
    REQUIRE( "180d" == formatUuid("180D") );
    REQUIRE( "180d" == formatUuid("180d") );
    REQUIRE( "" == formatUuid("") );
}

TEST_CASE( "UUID Format Idempotence Test 02", "[datatype][uuid]" ) {
    const jau::darray<std::string> inputs = { "0000180D-0000-1000-8000-00805F9B34FB", "180D",
                                              "6E400001-B5A3-F393-E0A9-E50E24DCCA9E", "{00002902-0000-1000-8000-00805f9b34fb}" };
    for(const std::string& in : inputs) {
        const std::string once = formatUuid(in);
        std::cout << "uuid '" << in << "' -> '" << once << "'" << std::endl;
        REQUIRE( once == formatUuid(once) );
    }
    const jau::darray<std::string> f = formatUuids(inputs);
    REQUIRE( 4 == f.size() );
    REQUIRE( "180d" == f[0] );
    REQUIRE( "180d" == f[1] );
    REQUIRE( "2902" == f[3] );
}

TEST_CASE( "UUID Filter Test 03", "[datatype][uuid]" ) {
    const jau::darray<std::string> none;
    REQUIRE( true == matchesUuidFilter(none, "180d") );
    REQUIRE( true == matchesUuidFilter(none, "6e400001b5a3f393e0a9e50e24dcca9e") );

    const jau::darray<std::string> filter = { "0000180D-0000-1000-8000-00805F9B34FB", "180F" };
    REQUIRE( true == matchesUuidFilter(filter, "180d") );
    REQUIRE( true == matchesUuidFilter(filter, "180f") );
    REQUIRE( false == matchesUuidFilter(filter, "1800") );
}
