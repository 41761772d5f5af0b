#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <central_bt/BTDeviceRegistry.hpp>
#include <central_bt/BTGattResolver.hpp>
#include <central_bt/BTAdvertisementAggregator.hpp>

#include "cbt_fake_transport.hpp"

using namespace central_bt;
using namespace cbt_test;

static const uint64_t addr01 = 0x0011223344AAULL;
static const std::string id01 = "0011223344aa";
static const uint64_t addr02 = 0x0011223344BBULL;
static const std::string id02 = "0011223344bb";

TEST_CASE( "Device Registry Connect Test 01", "[registry][connect]" ) {
    FakeTransport transport;
    BTResourceTracker tracker;
    BTDeviceRegistry registry(transport, tracker);
    BTAdvertisementAggregator aggregator(registry);

    REQUIRE_THROWS_AS( registry.connect(id01, [](const BTExceptionRef&) { }), NotFoundException );

    (void)aggregator.onAdvertisementReceived( FakeTransport::makeAdvertisement(addr01, AD_PDU_Type::ADV_NONCONN_IND) );
    REQUIRE_THROWS_AS( registry.connect(id01, [](const BTExceptionRef&) { }), InvalidStateException );
    REQUIRE( 0 == transport.connectCount );
    REQUIRE( 0 == transport.d.getPendingCount() );
    REQUIRE( false == registry.isConnected(id01) );

    // First seen via scan response, connectable state remains unknown
    (void)aggregator.onAdvertisementReceived( FakeTransport::makeAdvertisement(addr02, AD_PDU_Type::SCAN_RSP) );
    REQUIRE( ConnectableState::UNKNOWN == registry.getConnectable(id02) );
    REQUIRE_THROWS_AS( registry.connect(id02, [](const BTExceptionRef&) { }), InvalidStateException );
    REQUIRE( 0 == transport.connectCount );
    REQUIRE( 0 == transport.d.getPendingCount() );
    REQUIRE( false == registry.isConnected(id02) );
}

TEST_CASE( "Device Registry Connect Test 02", "[registry][connect]" ) {
    FakeTransport transport;
    BTResourceTracker tracker;
    BTDeviceRegistry registry(transport, tracker);
    BTAdvertisementAggregator aggregator(registry);
    FakeDeviceRef dev = transport.addStandardDevice(addr01, 0x12);

    (void)aggregator.onAdvertisementReceived( FakeTransport::makeAdvertisement(addr01, AD_PDU_Type::ADV_IND) );

    int okCount = 0;
    BTExceptionRef lastErr;
    CompletionCallback cb = [&](const BTExceptionRef& err) {
        lastErr = err;
        if( nullptr == err ) { ++okCount; }
    };

    // Unreachable first
    transport.connectStatus = GattCommStatus::UNREACHABLE;
    registry.connect(id01, cb);
    transport.d.runAll();
    REQUIRE( nullptr != lastErr );
    REQUIRE( ErrorKind::TRANSPORT_FAILURE == lastErr->getKind() );
    REQUIRE( std::string::npos != std::string(lastErr->what()).find("Device unreachable: "+id01) );
    REQUIRE( false == registry.isConnected(id01) );
    REQUIRE( 0 == tracker.getTrackedCount(id01) );

    transport.connectStatus = GattCommStatus::SUCCESS;
    registry.connect(id01, cb);
    transport.d.runAll();
    REQUIRE( 1 == okCount );
    REQUIRE( true == registry.isConnected(id01) );
    REQUIRE( 1 == tracker.getTrackedCount(id01) );
    REQUIRE( 2 == transport.connectCount );

    // Already connected completes without the transport
    registry.connect(id01, cb);
    REQUIRE( 2 == okCount );
    REQUIRE( 2 == transport.connectCount );
    REQUIRE( 0 == transport.d.getPendingCount() );
}

TEST_CASE( "Device Registry Disconnect Test 03", "[registry][disconnect]" ) {
    FakeTransport transport;
    BTResourceTracker tracker;
    BTDeviceRegistry registry(transport, tracker);
    BTGattResolver resolver(registry);
    BTAdvertisementAggregator aggregator(registry);
    FakeDeviceRef dev = transport.addStandardDevice(addr01, 0x12);
    FakeServiceRef svc = dev->services[0];
    FakeCharRef chr = svc->characteristics[0];

    (void)aggregator.onAdvertisementReceived( FakeTransport::makeAdvertisement(addr01, AD_PDU_Type::ADV_IND) );
    REQUIRE_THROWS_AS( registry.discoverServices(id01, jau::darray<std::string>(), [](const BTExceptionRef&, const jau::darray<std::string>&) { }),
                       InvalidStateException );
    REQUIRE( false == registry.disconnect(id01) );

    registry.connect(id01, [](const BTExceptionRef&) { });
    transport.d.runAll();

    jau::darray<std::string> services;
    registry.discoverServices(id01, jau::darray<std::string>(), [&](const BTExceptionRef& err, const jau::darray<std::string>& uuids) {
        REQUIRE( nullptr == err );
        services = uuids;
    });
    transport.d.runAll();
    REQUIRE( 1 == services.size() );
    REQUIRE( "180d" == services[0] );
    REQUIRE( 1 == dev->uncachedQueryCount );
    // Discovery leaves the resolution cache untouched
    REQUIRE( 0 == registry.getServiceCacheSize(id01) );

    int resolved = 0;
    resolver.resolveCharacteristic(id01, "180D", "2A37", [&](const BTExceptionRef& err, const TransportGattCharRef& c) {
        REQUIRE( nullptr == err );
        REQUIRE( chr == c );
        ++resolved;
    });
    transport.d.runAll();
    REQUIRE( 1 == resolved );
    REQUIRE( 1 == registry.getServiceCacheSize(id01) );
    REQUIRE( 1 == registry.getCharCacheSize(id01) );
    REQUIRE( 3 == tracker.getTrackedCount(id01) );

    REQUIRE( true == registry.disconnect(id01) );
    REQUIRE( false == registry.isConnected(id01) );
    REQUIRE( 0 == registry.getServiceCacheSize(id01) );
    REQUIRE( 0 == registry.getCharCacheSize(id01) );
    REQUIRE( 0 == registry.getDescCacheSize(id01) );
    REQUIRE( 0 == tracker.getTrackedCount(id01) );
    REQUIRE( 1 == dev->releaseCount );
    REQUIRE( 1 == svc->releaseCount );
    REQUIRE( 1 == chr->releaseCount );

    REQUIRE_THROWS_AS( resolver.resolveService(id01, "180d", [](const BTExceptionRef&, const TransportGattServiceRef&) { }),
                       InvalidStateException );

    // Reconnect re-resolves from scratch
    registry.connect(id01, [](const BTExceptionRef&) { });
    transport.d.runAll();
    const int cachedQueries = dev->cachedQueryCount;
    resolver.resolveService(id01, "180d", [&](const BTExceptionRef& err, const TransportGattServiceRef&) {
        REQUIRE( nullptr == err );
        ++resolved;
    });
    transport.d.runAll();
    REQUIRE( 2 == resolved );
    REQUIRE( cachedQueries+1 == dev->cachedQueryCount );

    // Served from the cache now
    resolver.resolveService(id01, "0000180d-0000-1000-8000-00805f9b34fb", [&](const BTExceptionRef& err, const TransportGattServiceRef&) {
        REQUIRE( nullptr == err );
        ++resolved;
    });
    REQUIRE( 3 == resolved );
    REQUIRE( 0 == transport.d.getPendingCount() );
}
