#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <central_bt/BTAdvertisementAggregator.hpp>

#include "cbt_fake_transport.hpp"

using namespace central_bt;
using namespace cbt_test;

static const uint64_t addr01 = 0x0011223344AAULL;
static const uint64_t addr02 = 0x0011223344BBULL;

static AdvertisementDataSection txPowerSection(const uint8_t raw) {
    AdvertisementDataSection s;
    s.type = number(GAP_T::TX_POWER_LEVEL);
    s.data.push_back(raw);
    return s;
}

TEST_CASE( "Advertisement Aggregation Test 01", "[advertisement][aggregator]" ) {
    FakeTransport transport;
    BTResourceTracker tracker;
    BTDeviceRegistry registry(transport, tracker);
    BTAdvertisementAggregator aggregator(registry);

    {
        AdvertisementEvent e = FakeTransport::makeAdvertisement(addr01, AD_PDU_Type::ADV_IND);
        e.localName = "Sensor";
        e.serviceUuids.push_back("0000180D-0000-1000-8000-00805F9B34FB");
        e.serviceUuids.push_back("180F");
        e.dataSections.push_back( txPowerSection(0xF4) );
        ManufacturerDataSection m;
        m.company = 0x004C;
        m.data.push_back(0x01);
        m.data.push_back(0x02);
        e.manufacturerData.push_back(m);

        // Non scan response packets are folded in silently
        REQUIRE( nullptr == aggregator.onAdvertisementReceived(e) );
        REQUIRE( 1 == registry.getDeviceCount() );
        REQUIRE( ConnectableState::YES == registry.getConnectable("0011223344aa") );
    }
    {
        AdvertisementEvent e = FakeTransport::makeAdvertisement(addr01, AD_PDU_Type::SCAN_RSP);
        e.rssi = -70;
        e.serviceUuids.push_back("180d");
        e.serviceUuids.push_back("1800");

        DiscoveryReportRef r = aggregator.onAdvertisementReceived(e);
        REQUIRE( nullptr != r );
        std::cout << r->toString() << std::endl;
        REQUIRE( "0011223344aa" == r->id );
        REQUIRE( "00:11:22:33:44:aa" == r->address );
        REQUIRE( BDAddressType::BDADDR_LE_PUBLIC == r->addressType );
        REQUIRE( ConnectableState::YES == r->connectable );
        REQUIRE( -70 == r->rssi );
        REQUIRE( 0 == r->serviceData.size() );

        const AdvertisementData& adv = r->advertisement;
        // Name and TX power survive the scan response lacking them
        REQUIRE( "Sensor" == adv.getName() );
        REQUIRE( true == adv.isSet(EIRDataType::TX_POWER) );
        REQUIRE( -12 == adv.getTxPower() );
        REQUIRE( -70 == adv.getRSSI() );

        // Deduplicated in first seen order
        REQUIRE( 3 == adv.getServices().size() );
        REQUIRE( "180d" == adv.getServices()[0] );
        REQUIRE( "180f" == adv.getServices()[1] );
        REQUIRE( "1800" == adv.getServices()[2] );

        // Company identifier little endian prefix
        std::shared_ptr<jau::POctets> msd = adv.getManufacturerData();
        REQUIRE( nullptr != msd );
        REQUIRE( 4 == msd->size() );
        REQUIRE( 0x4C == msd->get_uint8(0) );
        REQUIRE( 0x00 == msd->get_uint8(1) );
        REQUIRE( 0x01 == msd->get_uint8(2) );
        REQUIRE( 0x02 == msd->get_uint8(3) );
    }
    REQUIRE( 1 == registry.getDeviceCount() );
}

TEST_CASE( "Advertisement Connectable Test 02", "[advertisement][aggregator]" ) {
    FakeTransport transport;
    BTResourceTracker tracker;
    BTDeviceRegistry registry(transport, tracker);
    BTAdvertisementAggregator aggregator(registry);

    // First packet decides
    REQUIRE( nullptr == aggregator.onAdvertisementReceived( FakeTransport::makeAdvertisement(addr02, AD_PDU_Type::ADV_NONCONN_IND) ) );
    REQUIRE( nullptr == aggregator.onAdvertisementReceived( FakeTransport::makeAdvertisement(addr02, AD_PDU_Type::ADV_IND) ) );
    REQUIRE( ConnectableState::NO == registry.getConnectable("0011223344bb") );

    // Scan response as first packet leaves it unknown
    REQUIRE( nullptr != aggregator.onAdvertisementReceived( FakeTransport::makeAdvertisement(addr01, AD_PDU_Type::SCAN_RSP) ) );
    REQUIRE( ConnectableState::UNKNOWN == registry.getConnectable("0011223344aa") );

    // TX power absent
    const AdvertisementData adv = registry.getAdvertisement("0011223344aa");
    REQUIRE( false == adv.isSet(EIRDataType::TX_POWER) );
    REQUIRE( nullptr == adv.getManufacturerData() );
    REQUIRE( 0 == adv.getServices().size() );

    int8_t tx = 0;
    jau::darray<AdvertisementDataSection> sections;
    sections.push_back( txPowerSection(0x04) );
    REQUIRE( true == findTxPowerLevel(sections, tx) );
    REQUIRE( 4 == tx );

    REQUIRE_THROWS_AS( registry.getConnectable("ffffffffffff"), NotFoundException );
}
