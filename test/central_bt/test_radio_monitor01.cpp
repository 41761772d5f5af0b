#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <jau/darray.hpp>
#include <central_bt/BTRadioMonitor.hpp>

#include "cbt_fake_transport.hpp"

using namespace central_bt;
using namespace cbt_test;

TEST_CASE( "Radio Monitor Test 01", "[radio]" ) {
    FakeTransport transport;
    FakeRadioRef wifi = std::make_shared<FakeRadio>(TransportRadioKind::WIFI, TransportRadioState::ON);
    FakeRadioRef bt = std::make_shared<FakeRadio>(TransportRadioKind::BLUETOOTH, TransportRadioState::OFF);
    transport.radios.push_back(wifi);
    transport.radios.push_back(bt);

    jau::darray<RadioState> events;
    BTRadioMonitor monitor([&events](const RadioState s) { events.push_back(s); });
    REQUIRE( RadioState::UNKNOWN == monitor.getState() );

    monitor.init(transport);
    REQUIRE( 0 == events.size() );
    transport.d.runAll();

    // Bluetooth radio picked, initial state reported
    REQUIRE( bt == monitor.getRadio() );
    REQUIRE( 1 == events.size() );
    REQUIRE( RadioState::POWERED_OFF == events[0] );

    bt->fire(TransportRadioState::ON);
    bt->fire(TransportRadioState::ON);
    REQUIRE( 2 == events.size() );
    REQUIRE( RadioState::POWERED_ON == events[1] );

    // Off and disabled resolve to the same state
    bt->fire(TransportRadioState::OFF);
    bt->fire(TransportRadioState::DISABLED);
    REQUIRE( 3 == events.size() );
    REQUIRE( RadioState::POWERED_OFF == events[2] );
    REQUIRE( RadioState::POWERED_OFF == monitor.getState() );

    bt->fire(TransportRadioState::UNKNOWN);
    REQUIRE( 4 == events.size() );
    REQUIRE( RadioState::UNKNOWN == events[3] );

    REQUIRE( false == monitor.update(RadioState::UNKNOWN) );
}

TEST_CASE( "Radio Monitor Unsupported Test 02", "[radio]" ) {
    {
        FakeTransport transport;
        transport.radios.push_back( std::make_shared<FakeRadio>(TransportRadioKind::WIFI, TransportRadioState::ON) );
        jau::darray<RadioState> events;
        BTRadioMonitor monitor([&events](const RadioState s) { events.push_back(s); });
        monitor.init(transport);
        transport.d.runAll();
        REQUIRE( nullptr == monitor.getRadio() );
        REQUIRE( 1 == events.size() );
        REQUIRE( RadioState::UNSUPPORTED == events[0] );
    }
    {
        FakeTransport transport;
        transport.radiosStatus = GattCommStatus::TRANSPORT_ERROR;
        jau::darray<RadioState> events;
        BTRadioMonitor monitor([&events](const RadioState s) { events.push_back(s); });
        monitor.init(transport);
        transport.d.runAll();
        REQUIRE( 1 == events.size() );
        REQUIRE( RadioState::UNSUPPORTED == monitor.getState() );
    }
}
