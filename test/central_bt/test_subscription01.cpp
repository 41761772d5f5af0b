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
#include <central_bt/BTSubscriptionManager.hpp>
#include <central_bt/BTAdvertisementAggregator.hpp>

#include "cbt_fake_transport.hpp"

using namespace central_bt;
using namespace cbt_test;

static const uint64_t addr01 = 0x0011223344AAULL;
static const std::string id01 = "0011223344aa";

class SubscriptionFixture {
    public:
        FakeTransport transport;
        BTResourceTracker tracker;
        KeepAlive keepAlive;
        BTDeviceRegistry registry;
        BTGattResolver resolver;
        BTAdvertisementAggregator aggregator;
        BTSubscriptionManager subscriptions;
        FakeDeviceRef dev;
        FakeCharRef chr;

        int notificationCount = 0;
        std::string lastNotification;
        std::vector<uint8_t> lastValue;

        SubscriptionFixture()
        : registry(transport, tracker), resolver(registry), aggregator(registry),
          subscriptions(registry, resolver, keepAlive,
                  [this](const std::string& id, const std::string& svc, const std::string& c, const jau::TROOctets& value) {
                      ++notificationCount;
                      lastNotification = id+"/"+svc+"/"+c;
                      lastValue.assign(value.get_ptr(), value.get_ptr()+value.size());
                  })
        {
            dev = transport.addStandardDevice(addr01, BTGattChar::Read | BTGattChar::Notify);
            chr = dev->services[0]->characteristics[0];
            (void)aggregator.onAdvertisementReceived( FakeTransport::makeAdvertisement(addr01, AD_PDU_Type::ADV_IND) );
            registry.connect(id01, [](const BTExceptionRef&) { });
            transport.d.runAll();
        }
};

TEST_CASE( "Subscription Enable Disable Test 01", "[subscription]" ) {
    SubscriptionFixture f;

    int okCount = 0;
    bool lastState = false;
    NotifyCallback cb = [&](const BTExceptionRef& err, const bool enabled) {
        REQUIRE( nullptr == err );
        lastState = enabled;
        ++okCount;
    };

    f.subscriptions.setNotify(id01, "180d", "2a37", true, cb);
    f.transport.d.runAll();
    REQUIRE( 1 == okCount );
    REQUIRE( true == lastState );
    REQUIRE( 1 == f.chr->cccdWriteCount );
    REQUIRE( ClientCharConfigValue::NOTIFY == f.chr->lastCccd );
    REQUIRE( true == f.subscriptions.isSubscribed(id01, "0000180D-0000-1000-8000-00805F9B34FB", "2A37") );
    REQUIRE( 1 == f.subscriptions.getSubscriptionCount() );
    REQUIRE( 1 == f.keepAlive.getCount() );
    REQUIRE( 1 == f.chr->listeners.size() );

    // Second enable completes without a descriptor write
    f.subscriptions.setNotify(id01, "180D", "2A37", true, cb);
    REQUIRE( 2 == okCount );
    REQUIRE( true == lastState );
    REQUIRE( 0 == f.transport.d.getPendingCount() );
    REQUIRE( 1 == f.chr->cccdWriteCount );
    REQUIRE( 1 == f.keepAlive.getCount() );

    f.chr->fire( { 0x06, 0x4a } );
    REQUIRE( 1 == f.notificationCount );
    REQUIRE( id01+"/180d/2a37" == f.lastNotification );
    REQUIRE( 2 == f.lastValue.size() );
    REQUIRE( 0x4a == f.lastValue[1] );

    f.subscriptions.setNotify(id01, "180d", "2a37", false, cb);
    f.transport.d.runAll();
    REQUIRE( 3 == okCount );
    REQUIRE( false == lastState );
    REQUIRE( 2 == f.chr->cccdWriteCount );
    REQUIRE( ClientCharConfigValue::NONE == f.chr->lastCccd );
    REQUIRE( false == f.subscriptions.isSubscribed(id01, "180d", "2a37") );
    REQUIRE( 0 == f.keepAlive.getCount() );
    REQUIRE( 0 == f.chr->listeners.size() );

    // Second disable completes without a descriptor write
    f.subscriptions.setNotify(id01, "180d", "2a37", false, cb);
    REQUIRE( 4 == okCount );
    REQUIRE( false == lastState );
    REQUIRE( 2 == f.chr->cccdWriteCount );

    f.chr->fire( { 0x06, 0x4b } );
    REQUIRE( 1 == f.notificationCount );
}

TEST_CASE( "Subscription Failure Test 02", "[subscription]" ) {
    SubscriptionFixture f;

    BTExceptionRef lastErr;
    bool lastState = false;
    NotifyCallback cb = [&](const BTExceptionRef& err, const bool enabled) {
        lastErr = err;
        lastState = enabled;
    };

    // Failed enable leaves it disabled
    f.chr->cccdStatus = GattCommStatus::ACCESS_DENIED;
    f.subscriptions.setNotify(id01, "180d", "2a37", true, cb);
    f.transport.d.runAll();
    REQUIRE( nullptr != lastErr );
    REQUIRE( ErrorKind::TRANSPORT_FAILURE == lastErr->getKind() );
    REQUIRE( false == lastState );
    REQUIRE( false == f.subscriptions.isSubscribed(id01, "180d", "2a37") );
    REQUIRE( 0 == f.keepAlive.getCount() );
    REQUIRE( 0 == f.chr->listeners.size() );

    f.chr->cccdStatus = GattCommStatus::SUCCESS;
    f.subscriptions.setNotify(id01, "180d", "2a37", true, cb);
    f.transport.d.runAll();
    REQUIRE( nullptr == lastErr );
    REQUIRE( true == lastState );

    // Failed disable leaves it enabled
    f.chr->cccdStatus = GattCommStatus::TRANSPORT_ERROR;
    f.subscriptions.setNotify(id01, "180d", "2a37", false, cb);
    f.transport.d.runAll();
    REQUIRE( nullptr != lastErr );
    REQUIRE( true == lastState );
    REQUIRE( true == f.subscriptions.isSubscribed(id01, "180d", "2a37") );
    REQUIRE( 1 == f.keepAlive.getCount() );
    REQUIRE( 1 == f.chr->listeners.size() );

    // Unknown characteristic
    f.subscriptions.setNotify(id01, "180d", "2a38", true, cb);
    f.transport.d.runAll();
    REQUIRE( nullptr != lastErr );
    REQUIRE( ErrorKind::NOT_FOUND == lastErr->getKind() );

    // Disabling an unknown characteristic or service fails the same way
    lastErr = nullptr;
    f.subscriptions.setNotify(id01, "180d", "2a38", false, cb);
    f.transport.d.runAll();
    REQUIRE( nullptr != lastErr );
    REQUIRE( ErrorKind::NOT_FOUND == lastErr->getKind() );
    REQUIRE( false == lastState );

    lastErr = nullptr;
    f.subscriptions.setNotify(id01, "1800", "2a00", false, cb);
    f.transport.d.runAll();
    REQUIRE( nullptr != lastErr );
    REQUIRE( ErrorKind::NOT_FOUND == lastErr->getKind() );
    REQUIRE( 1 == f.subscriptions.getSubscriptionCount() );
    // No descriptor write for either
    REQUIRE( 3 == f.chr->cccdWriteCount );
}

TEST_CASE( "Subscription Disconnect Test 03", "[subscription]" ) {
    SubscriptionFixture f;

    f.subscriptions.setNotify(id01, "180d", "2a37", true, [](const BTExceptionRef&, const bool) { });
    f.transport.d.runAll();
    REQUIRE( 1 == f.keepAlive.getCount() );

    REQUIRE( 1 == f.subscriptions.removeAll(id01) );
    REQUIRE( true == f.registry.disconnect(id01) );
    REQUIRE( 0 == f.subscriptions.getSubscriptionCount() );
    REQUIRE( 0 == f.keepAlive.getCount() );
    REQUIRE( 0 == f.chr->listeners.size() );
    // No descriptor write on disconnect
    REQUIRE( 1 == f.chr->cccdWriteCount );

    REQUIRE_THROWS_AS( f.subscriptions.setNotify(id01, "180d", "2a37", true, [](const BTExceptionRef&, const bool) { }),
                       InvalidStateException );
    REQUIRE_THROWS_AS( f.subscriptions.setNotify("ffffffffffff", "180d", "2a37", true, [](const BTExceptionRef&, const bool) { }),
                       NotFoundException );
}
