/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2020 Gothel Software e.K.
 * Copyright (c) 2020 ZAFENA AB
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/debug.hpp>

#include "BTAdvertisementAggregator.hpp"

using namespace central_bt;

DiscoveryReportRef BTAdvertisementAggregator::onAdvertisementReceived(const AdvertisementEvent& event) noexcept {
    bool created = false;
    BTDeviceRef device = registry.getOrCreateDevice(event.address, created);

    int8_t txPower = 0;
    const bool hasTxPower = findTxPowerLevel(event.dataSections, txPower);

    const std::lock_guard<std::recursive_mutex> lock(registry.getMutex()); // RAII-style acquire and relinquish via destructor
    if( created ) {
        device->connectable = to_ConnectableState(event.type);
    }
    AdvertisementData& adv = device->advertisement;
    if( event.localName.size() > 0 ) {
        adv.setName(event.localName);
    }
    if( hasTxPower ) {
        adv.setTxPower(txPower);
    }
    if( event.manufacturerData.size() > 0 ) {
        adv.setManufacturerData(event.manufacturerData[0]);
    }
    for(const std::string& uuid : event.serviceUuids) {
        adv.addService(uuid);
    }
    adv.setRSSI(event.rssi);

    if( AD_PDU_Type::SCAN_RSP != event.type ) {
        DBG_PRINT("BTAdvertisementAggregator: %s: %s, deferred", device->id.c_str(), to_string(event.type).c_str());
        return nullptr;
    }
    std::shared_ptr<DiscoveryReport> report = std::make_shared<DiscoveryReport>();
    report->id = device->id;
    report->address = device->addressString;
    report->addressType = device->addressType;
    report->connectable = device->connectable;
    report->rssi = event.rssi;
    report->advertisement = adv;
    DBG_PRINT("BTAdvertisementAggregator: %s", report->toString().c_str());
    return report;
}

void BTAdvertisementAggregator::onWatcherStopped(const WatcherStatus status) noexcept {
    switch( status ) {
        case WatcherStatus::ABORTED:
            ERR_PRINT("BTAdvertisementAggregator: watcher aborted");
            break;
        case WatcherStatus::STOPPED:
            DBG_PRINT("BTAdvertisementAggregator: watcher stopped");
            break;
        default:
            WARN_PRINT("BTAdvertisementAggregator: unexpected watcher status %s", to_string(status).c_str());
            break;
    }
}
