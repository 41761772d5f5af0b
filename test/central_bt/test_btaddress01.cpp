#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <central_bt/BTAddress.hpp>
#include <central_bt/BTTypes0.hpp>

using namespace central_bt;

TEST_CASE( "BDAddress String Test 01", "[datatype][address]" ) {
    {
        const uint64_t a = 0x0011223344AAULL;
        printf("address 0x%" PRIx64 " -> '%s', id '%s'\n", a, to_address_string(a).c_str(), to_device_id(a).c_str());
        REQUIRE( "00:11:22:33:44:aa" == to_address_string(a) );
        REQUIRE( "0011223344aa" == to_device_id(a) );
        REQUIRE( BDAddressType::BDADDR_LE_PUBLIC == to_BDAddressType(a) );
        REQUIRE( "public" == to_string(to_BDAddressType(a)) );
    }
    {
        const uint64_t a = 0xC1B2A3040506ULL;
        REQUIRE( "c1:b2:a3:04:05:06" == to_address_string(a) );
        REQUIRE( "c1b2a3040506" == to_device_id(a) );
        REQUIRE( BDAddressType::BDADDR_LE_RANDOM == to_BDAddressType(a) );
        REQUIRE( "random" == to_string(to_BDAddressType(a)) );
    }
    {
        // Bits beyond 48 are ignored
        const uint64_t a = 0xFFFF000000000001ULL;
        REQUIRE( "00:00:00:00:00:01" == to_address_string(a) );
    }
}

TEST_CASE( "Misc Types Test 02", "[datatype][types]" ) {
    REQUIRE( ConnectableState::YES == to_ConnectableState(AD_PDU_Type::ADV_IND) );
    REQUIRE( ConnectableState::YES == to_ConnectableState(AD_PDU_Type::ADV_DIRECT_IND) );
    REQUIRE( ConnectableState::NO == to_ConnectableState(AD_PDU_Type::ADV_NONCONN_IND) );
    REQUIRE( ConnectableState::NO == to_ConnectableState(AD_PDU_Type::ADV_SCAN_IND) );
    REQUIRE( ConnectableState::UNKNOWN == to_ConnectableState(AD_PDU_Type::SCAN_RSP) );

    REQUIRE( "unsupported" == to_string(RadioState::UNSUPPORTED) );
    REQUIRE( "unknown" == to_string(RadioState::UNKNOWN) );
    REQUIRE( "poweredOn" == to_string(RadioState::POWERED_ON) );
    REQUIRE( "poweredOff" == to_string(RadioState::POWERED_OFF) );

    const InvalidStateException e("Device not connectable: x", E_FILE_LINE);
    REQUIRE( ErrorKind::INVALID_STATE == e.getKind() );
    const UnsupportedException u("Not supported", E_FILE_LINE);
    REQUIRE( ErrorKind::UNSUPPORTED == u.getKind() );
}
