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

class ResolverFixture {
    public:
        FakeTransport transport;
        BTResourceTracker tracker;
        BTDeviceRegistry registry;
        BTGattResolver resolver;
        BTAdvertisementAggregator aggregator;
        FakeDeviceRef dev;

        ResolverFixture()
        : registry(transport, tracker), resolver(registry), aggregator(registry)
        {
            dev = transport.addStandardDevice(addr01, BTGattChar::Read | BTGattChar::Notify);
            (void)aggregator.onAdvertisementReceived( FakeTransport::makeAdvertisement(addr01, AD_PDU_Type::ADV_IND) );
            registry.connect(id01, [](const BTExceptionRef&) { });
            transport.d.runAll();
        }
};

TEST_CASE( "GATT Resolver Concurrent Test 01", "[gatt][resolver]" ) {
    ResolverFixture f;
    REQUIRE( true == f.registry.isConnected(id01) );

    TransportGattServiceRef s1, s2;
    int done = 0;
    f.resolver.resolveService(id01, "180d", [&](const BTExceptionRef& err, const TransportGattServiceRef& s) {
        REQUIRE( nullptr == err );
        s1 = s;
        ++done;
    });
    f.resolver.resolveService(id01, "180D", [&](const BTExceptionRef& err, const TransportGattServiceRef& s) {
        REQUIRE( nullptr == err );
        s2 = s;
        ++done;
    });
    // No in-flight deduplication, both query
    REQUIRE( 2 == f.dev->cachedQueryCount );
    f.transport.d.runAll();

    REQUIRE( 2 == done );
    REQUIRE( nullptr != s1 );
    REQUIRE( s1 == s2 );
    REQUIRE( 1 == f.registry.getServiceCacheSize(id01) );
    // connection and one service
    REQUIRE( 2 == f.tracker.getTrackedCount(id01) );
}

TEST_CASE( "GATT Resolver Disconnect Test 02", "[gatt][resolver]" ) {
    ResolverFixture f;

    BTExceptionRef result;
    int done = 0;
    f.resolver.resolveCharacteristic(id01, "180d", "2a37", [&](const BTExceptionRef& err, const TransportGattCharRef& c) {
        result = err;
        REQUIRE( nullptr == c );
        ++done;
    });
    // service resolved, characteristic query in flight
    REQUIRE( true == f.transport.d.runNext() );
    REQUIRE( 1 == f.transport.d.getPendingCount() );
    REQUIRE( 1 == f.registry.getServiceCacheSize(id01) );

    REQUIRE( true == f.registry.disconnect(id01) );
    f.transport.d.runAll();

    REQUIRE( 1 == done );
    REQUIRE( nullptr != result );
    REQUIRE( ErrorKind::INVALID_STATE == result->getKind() );
    REQUIRE( 0 == f.registry.getServiceCacheSize(id01) );
    REQUIRE( 0 == f.registry.getCharCacheSize(id01) );
    REQUIRE( 0 == f.tracker.getTrackedCount(id01) );
    // Late enumeration result released, not cached
    REQUIRE( 1 == f.dev->services[0]->characteristics[0]->releaseCount );
}

TEST_CASE( "GATT Resolver NotFound Test 03", "[gatt][resolver]" ) {
    ResolverFixture f;

    BTExceptionRef result;
    f.resolver.resolveService(id01, "1800", [&](const BTExceptionRef& err, const TransportGattServiceRef&) { result = err; });
    f.transport.d.runAll();
    REQUIRE( nullptr != result );
    REQUIRE( ErrorKind::NOT_FOUND == result->getKind() );
    REQUIRE( 0 == f.registry.getServiceCacheSize(id01) );

    result = nullptr;
    f.resolver.resolveDescriptor(id01, "180d", "2a37", "2901", [&](const BTExceptionRef& err, const TransportGattDescRef&) { result = err; });
    f.transport.d.runAll();
    REQUIRE( nullptr != result );
    REQUIRE( ErrorKind::NOT_FOUND == result->getKind() );
    // Upper levels got cached on the way
    REQUIRE( 1 == f.registry.getServiceCacheSize(id01) );
    REQUIRE( 1 == f.registry.getCharCacheSize(id01) );
    REQUIRE( 0 == f.registry.getDescCacheSize(id01) );

    REQUIRE_THROWS_AS( f.resolver.resolveService("ffffffffffff", "180d", [](const BTExceptionRef&, const TransportGattServiceRef&) { }),
                       NotFoundException );

    // Enumeration failure surfaces as transport failure
    f.dev->status = GattCommStatus::PROTOCOL_ERROR;
    result = nullptr;
    f.resolver.resolveService(id01, "180f", [&](const BTExceptionRef& err, const TransportGattServiceRef&) { result = err; });
    f.transport.d.runAll();
    REQUIRE( nullptr != result );
    REQUIRE( ErrorKind::TRANSPORT_FAILURE == result->getKind() );
}

TEST_CASE( "GATT Discovery Test 04", "[gatt][resolver][discovery]" ) {
    ResolverFixture f;
    FakeServiceRef svc = f.dev->services[0];
    svc->includedServices.push_back( std::make_shared<FakeService>(f.transport.d, "0000180F-0000-1000-8000-00805F9B34FB") );
    svc->includedServices.push_back( std::make_shared<FakeService>(f.transport.d, "6E400001-B5A3-F393-E0A9-E50E24DCCA9E") );

    jau::darray<std::string> included;
    f.resolver.discoverIncludedServices(id01, "180d", jau::darray<std::string>(), [&](const BTExceptionRef& err, const jau::darray<std::string>& uuids) {
        REQUIRE( nullptr == err );
        included = uuids;
    });
    f.transport.d.runAll();
    REQUIRE( 2 == included.size() );
    REQUIRE( "180f" == included[0] );
    REQUIRE( "6e400001b5a3f393e0a9e50e24dcca9e" == included[1] );

    jau::darray<std::string> filter;
    filter.push_back("180F");
    f.resolver.discoverIncludedServices(id01, "180d", filter, [&](const BTExceptionRef& err, const jau::darray<std::string>& uuids) {
        REQUIRE( nullptr == err );
        included = uuids;
    });
    f.transport.d.runAll();
    REQUIRE( 1 == included.size() );
    REQUIRE( "180f" == included[0] );

    jau::darray<BTGattChar> chars;
    f.resolver.discoverCharacteristics(id01, "180d", jau::darray<std::string>(), [&](const BTExceptionRef& err, const jau::darray<BTGattChar>& cs) {
        REQUIRE( nullptr == err );
        for(const BTGattChar& c : cs) { chars.push_back(c); }
    });
    f.transport.d.runAll();
    REQUIRE( 1 == chars.size() );
    REQUIRE( "2a37" == chars[0].uuid );
    const jau::darray<std::string> names = chars[0].getPropertyNames();
    REQUIRE( 2 == names.size() );
    REQUIRE( "read" == names[0] );
    REQUIRE( "notify" == names[1] );

    jau::darray<std::string> descs;
    f.resolver.discoverDescriptors(id01, "180d", "2a37", [&](const BTExceptionRef& err, const jau::darray<std::string>& uuids) {
        REQUIRE( nullptr == err );
        descs = uuids;
    });
    f.transport.d.runAll();
    REQUIRE( 1 == descs.size() );
    REQUIRE( "2902" == descs[0] );
    // Uncached enumeration each time
    REQUIRE( 1 == f.dev->services[0]->characteristics[0]->descQueryCount );

    int resolved = 0;
    f.resolver.resolveDescriptor(id01, "180d", "2a37", "2902", [&](const BTExceptionRef& err, const TransportGattDescRef& d) {
        REQUIRE( nullptr == err );
        REQUIRE( nullptr != d );
        ++resolved;
    });
    f.transport.d.runAll();
    REQUIRE( 1 == resolved );
    REQUIRE( 1 == f.registry.getDescCacheSize(id01) );
}

TEST_CASE( "GATT Resolver Release Test 05", "[gatt][resolver][release]" ) {
    ResolverFixture f;
    FakeServiceRef svc01 = f.dev->services[0];
    FakeServiceRef svc02 = std::make_shared<FakeService>(f.transport.d, "0000180F-0000-1000-8000-00805F9B34FB");
    f.dev->services.push_back(svc02);
    FakeCharRef chr01 = svc01->characteristics[0];
    FakeCharRef chr02 = std::make_shared<FakeChar>(f.transport.d, "00002A38-0000-1000-8000-00805F9B34FB", BTGattChar::Read);
    svc01->characteristics.push_back(chr02);

    int resolved = 0;
    f.resolver.resolveCharacteristic(id01, "180d", "2a37", [&](const BTExceptionRef& err, const TransportGattCharRef& c) {
        REQUIRE( nullptr == err );
        REQUIRE( chr01 == c );
        ++resolved;
    });
    f.transport.d.runAll();
    REQUIRE( 1 == resolved );
    REQUIRE( 1 == f.registry.getServiceCacheSize(id01) );
    REQUIRE( 1 == f.registry.getCharCacheSize(id01) );
    // connection, both services and both characteristics
    REQUIRE( 5 == f.tracker.getTrackedCount(id01) );

    REQUIRE( true == f.registry.disconnect(id01) );
    REQUIRE( 0 == f.tracker.getTrackedCount(id01) );
    REQUIRE( 1 == f.dev->releaseCount );
    REQUIRE( 1 == svc01->releaseCount );
    REQUIRE( 1 == svc02->releaseCount );
    REQUIRE( 1 == chr01->releaseCount );
    REQUIRE( 1 == chr02->releaseCount );
}

TEST_CASE( "GATT Resolver Reconnect Test 06", "[gatt][resolver][release]" ) {
    ResolverFixture f;
    FakeServiceRef svc01 = f.dev->services[0];

    // Resources tracked after a reconnect belong to the new connection only
    REQUIRE( true == f.registry.disconnect(id01) );
    REQUIRE( 1 == f.dev->releaseCount );
    f.registry.connect(id01, [](const BTExceptionRef&) { });
    f.transport.d.runAll();
    REQUIRE( true == f.registry.isConnected(id01) );
    REQUIRE( 1 == f.tracker.getTrackedCount(id01) );
    REQUIRE( 1 == f.dev->releaseCount );

    f.resolver.resolveService(id01, "180d", [](const BTExceptionRef& err, const TransportGattServiceRef&) {
        REQUIRE( nullptr == err );
    });
    f.transport.d.runAll();
    REQUIRE( 2 == f.tracker.getTrackedCount(id01) );
    REQUIRE( 0 == svc01->releaseCount );

    REQUIRE( true == f.registry.disconnect(id01) );
    REQUIRE( 2 == f.dev->releaseCount );
    REQUIRE( 1 == svc01->releaseCount );
}
