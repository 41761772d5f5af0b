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
#include <jau/environment.hpp>

#include "BTCentral.hpp"
#include "BTUUID.hpp"

using namespace central_bt;

static const jau::TROOctets emptyOctets(nullptr, 0, jau::endian::little);

CentralEnv::CentralEnv() noexcept
: DEBUG_GLOBAL( jau::environment::get("central_bt").debug ),
  exploding( jau::environment::getExplodingProperties("central_bt.central") ),
  DEBUG_EVENT( jau::environment::getBooleanProperty("central_bt.debug.central.event", false) ),
  SCAN_ACTIVE( jau::environment::getBooleanProperty("central_bt.central.scan.active", true) ),
  RSSI_STUB( jau::environment::getInt32Property("central_bt.central.rssi.stub", 0, -127 /* min */, 20 /* max */) )
{
}

BTCentral::statusListenerList_t::equal_comparator BTCentral::statusListenerRefEqComparator =
        [](const CentralStatusListenerRef &a, const CentralStatusListenerRef &b) -> bool { return *a == *b; };

BTCentral::BTCentral(BTTransport& transport_) noexcept
: env(CentralEnv::get()), transport(transport_),
  keepAlive(), tracker(), registry(transport, tracker), resolver(registry),
  subscriptions(registry, resolver, keepAlive,
        [this](const std::string& id, const std::string& serviceUuid, const std::string& charUuid, const jau::TROOctets& value) {
            onNotification(id, serviceUuid, charUuid, value);
        }),
  radioMonitor([this](const RadioState state) { onRadioStateChanged(state); }),
  aggregator(registry),
  watcher(nullptr), scanning(false)
{
}

BTCentral::~BTCentral() noexcept {
    close();
}

void BTCentral::close() noexcept {
    DBG_PRINT("BTCentral::close: %s", toString().c_str());
    {
        const std::lock_guard<std::mutex> lock(mtx_scan); // RAII-style acquire and relinquish via destructor
        if( nullptr != watcher ) {
            if( scanning ) {
                watcher->stop();
                scanning = false;
                keepAlive.unref();
            }
            watcher->setReceivedCallback( [](const AdvertisementEvent&) { } );
            watcher->setStoppedCallback( [](const WatcherStatus) { } );
        }
    }
    TransportRadioRef radio = radioMonitor.getRadio();
    if( nullptr != radio ) {
        radio->setStateChangedCallback( [](const TransportRadioState) { } );
    }
    const jau::darray<std::string> ids = registry.getConnectedDeviceIds();
    for(const std::string& id : ids) {
        subscriptions.removeAll(id);
        registry.disconnect(id);
    }
    statusListenerList.clear();
}

bool BTCentral::addStatusListener(const CentralStatusListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("CentralStatusListener ref is null");
        return false;
    }
    const bool added = statusListenerList.push_back_unique(l, statusListenerRefEqComparator);
    if( added ) {
        // initial state notification
        try {
            l->stateChange(radioMonitor.getState());
        } catch (std::exception &e) {
            ERR_PRINT("BTCentral::addStatusListener: %s: Caught exception %s", l->toString().c_str(), e.what());
        }
    }
    return added;
}

bool BTCentral::removeStatusListener(const CentralStatusListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("CentralStatusListener ref is null");
        return false;
    }
    const size_type count = statusListenerList.erase_matching(l, false /* all_matching */, statusListenerRefEqComparator);
    return count > 0;
}

BTCentral::size_type BTCentral::removeAllStatusListener() noexcept {
    const size_type count = statusListenerList.size();
    statusListenerList.clear();
    return count;
}

void BTCentral::init() {
    TransportAdvertisementWatcherRef w = transport.getAdvertisementWatcher();
    if( nullptr == w ) {
        throw InvalidStateException("Transport provides no advertisement watcher", E_FILE_LINE);
    }
    w->setReceivedCallback( [this](const AdvertisementEvent& event) { onAdvertisementReceived(event); } );
    w->setStoppedCallback( [this](const WatcherStatus status) { onWatcherStopped(status); } );
    {
        const std::lock_guard<std::mutex> lock(mtx_scan); // RAII-style acquire and relinquish via destructor
        watcher = w;
    }
    radioMonitor.init(transport);
    WORDY_PRINT("BTCentral::init: %s", toString().c_str());
}

void BTCentral::onRadioStateChanged(const RadioState state) noexcept {
    COND_PRINT(env.DEBUG_EVENT, "BTCentral::stateChange: %s", to_string(state).c_str());
    sendEvent("stateChange", [&](CentralStatusListener& l) { l.stateChange(state); });
}

void BTCentral::onAdvertisementReceived(const AdvertisementEvent& event) noexcept {
    DiscoveryReportRef report = aggregator.onAdvertisementReceived(event);
    if( nullptr == report ) {
        return;
    }
    COND_PRINT(env.DEBUG_EVENT, "BTCentral::discover: %s", report->toString().c_str());
    sendEvent("discover", [&](CentralStatusListener& l) { l.discover(*report); });
}

void BTCentral::onWatcherStopped(const WatcherStatus status) noexcept {
    aggregator.onWatcherStopped(status);
    bool wasScanning;
    {
        const std::lock_guard<std::mutex> lock(mtx_scan); // RAII-style acquire and relinquish via destructor
        wasScanning = scanning;
        if( scanning ) {
            scanning = false;
            keepAlive.unref();
        }
    }
    if( wasScanning ) {
        COND_PRINT(env.DEBUG_EVENT, "BTCentral::scanStop: watcher %s", to_string(status).c_str());
        sendEvent("scanStop", [](CentralStatusListener& l) { l.scanStop(); });
    }
}

void BTCentral::onNotification(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                               const jau::TROOctets& value) noexcept
{
    COND_PRINT(env.DEBUG_EVENT, "BTCentral::read: %s/%s/%s notification, %zu bytes", id.c_str(), serviceUuid.c_str(), charUuid.c_str(), (size_t)value.size());
    sendEvent("read", [&](CentralStatusListener& l) { l.read(id, serviceUuid, charUuid, value, true /* isNotification */, nullptr); });
}

void BTCentral::startScanning(const jau::darray<std::string>& serviceUuids, const bool allowDuplicates) {
    bool started = false;
    {
        const std::lock_guard<std::mutex> lock(mtx_scan); // RAII-style acquire and relinquish via destructor
        if( nullptr == watcher ) {
            throw InvalidStateException("Not initialized", E_FILE_LINE);
        }
        if( scanning && WatcherStatus::STARTED == watcher->getStatus() ) {
            DBG_PRINT("BTCentral::startScanning: already scanning");
            return;
        }
        std::string filter;
        for(const std::string& u : serviceUuids) {
            if( filter.size() > 0 ) { filter.append(","); }
            filter.append(formatUuid(u));
        }
        DBG_PRINT("BTCentral::startScanning: [%s], allowDuplicates %d, active %d", filter.c_str(), allowDuplicates, env.SCAN_ACTIVE);
        watcher->setScanningMode(env.SCAN_ACTIVE);
        watcher->start();
        if( !scanning ) {
            scanning = true;
            keepAlive.ref();
            started = true;
        }
    }
    if( !started ) {
        DBG_PRINT("BTCentral::startScanning: watcher restarted while scanning");
        return;
    }
    COND_PRINT(env.DEBUG_EVENT, "BTCentral::scanStart");
    sendEvent("scanStart", [](CentralStatusListener& l) { l.scanStart(); });
}

void BTCentral::stopScanning() {
    {
        const std::lock_guard<std::mutex> lock(mtx_scan); // RAII-style acquire and relinquish via destructor
        if( nullptr == watcher || !scanning ) {
            DBG_PRINT("BTCentral::stopScanning: not scanning");
            return;
        }
        scanning = false;
        keepAlive.unref();
        if( WatcherStatus::STARTED == watcher->getStatus() ) {
            watcher->stop();
        }
    }
    COND_PRINT(env.DEBUG_EVENT, "BTCentral::scanStop");
    sendEvent("scanStop", [](CentralStatusListener& l) { l.scanStop(); });
}

bool BTCentral::isScanning() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_scan); // RAII-style acquire and relinquish via destructor
    return scanning;
}

void BTCentral::connect(const std::string& id) {
    DBG_PRINT("BTCentral::connect: %s", id.c_str());
    registry.connect(id, [this, id](const BTExceptionRef& err) {
        COND_PRINT(env.DEBUG_EVENT, "BTCentral::connect: %s, error %s", id.c_str(), nullptr != err ? err->what() : "none");
        sendEvent("connect", [&](CentralStatusListener& l) { l.connect(id, err); });
    });
}

void BTCentral::disconnect(const std::string& id) {
    DBG_PRINT("BTCentral::disconnect: %s", id.c_str());
    (void)registry.getDevice(id); // throws if unknown
    subscriptions.removeAll(id);
    if( registry.disconnect(id) ) {
        COND_PRINT(env.DEBUG_EVENT, "BTCentral::disconnect: %s", id.c_str());
        sendEvent("disconnect", [&](CentralStatusListener& l) { l.disconnect(id); });
    }
}

void BTCentral::onConnectionLost(const std::string& id) noexcept {
    try {
        disconnect(id);
    } catch (BTException &e) {
        ERR_PRINT("BTCentral::onConnectionLost: %s: %s", id.c_str(), e.what());
    }
}

void BTCentral::updateRssi(const std::string& id) {
    (void)registry.getDevice(id); // throws if unknown
    const int8_t rssi = static_cast<int8_t>(env.RSSI_STUB);
    COND_PRINT(env.DEBUG_EVENT, "BTCentral::rssiUpdate: %s, %d", id.c_str(), rssi);
    sendEvent("rssiUpdate", [&](CentralStatusListener& l) { l.rssiUpdate(id, rssi, nullptr); });
}

void BTCentral::discoverServices(const std::string& id, const jau::darray<std::string>& serviceUuids) {
    registry.discoverServices(id, serviceUuids, [this, id](const BTExceptionRef& err, const jau::darray<std::string>& uuids) {
        COND_PRINT(env.DEBUG_EVENT, "BTCentral::servicesDiscover: %s, %zu services, error %s", id.c_str(), (size_t)uuids.size(), nullptr != err ? err->what() : "none");
        sendEvent("servicesDiscover", [&](CentralStatusListener& l) { l.servicesDiscover(id, uuids, err); });
    });
}

void BTCentral::discoverIncludedServices(const std::string& id, const std::string& serviceUuid,
                                         const jau::darray<std::string>& serviceUuids)
{
    const std::string svcUuid = formatUuid(serviceUuid);
    resolver.discoverIncludedServices(id, svcUuid, serviceUuids, [this, id, svcUuid](const BTExceptionRef& err, const jau::darray<std::string>& uuids) {
        COND_PRINT(env.DEBUG_EVENT, "BTCentral::includedServicesDiscover: %s/%s, %zu services", id.c_str(), svcUuid.c_str(), (size_t)uuids.size());
        sendEvent("includedServicesDiscover", [&](CentralStatusListener& l) { l.includedServicesDiscover(id, svcUuid, uuids, err); });
    });
}

void BTCentral::discoverCharacteristics(const std::string& id, const std::string& serviceUuid,
                                        const jau::darray<std::string>& charUuids)
{
    const std::string svcUuid = formatUuid(serviceUuid);
    resolver.discoverCharacteristics(id, svcUuid, charUuids, [this, id, svcUuid](const BTExceptionRef& err, const jau::darray<BTGattChar>& chars) {
        COND_PRINT(env.DEBUG_EVENT, "BTCentral::characteristicsDiscover: %s/%s, %zu characteristics", id.c_str(), svcUuid.c_str(), (size_t)chars.size());
        sendEvent("characteristicsDiscover", [&](CentralStatusListener& l) { l.characteristicsDiscover(id, svcUuid, chars, err); });
    });
}

void BTCentral::discoverDescriptors(const std::string& id, const std::string& serviceUuid, const std::string& charUuid) {
    const std::string svcUuid = formatUuid(serviceUuid);
    const std::string chrUuid = formatUuid(charUuid);
    resolver.discoverDescriptors(id, svcUuid, chrUuid, [this, id, svcUuid, chrUuid](const BTExceptionRef& err, const jau::darray<std::string>& uuids) {
        COND_PRINT(env.DEBUG_EVENT, "BTCentral::descriptorsDiscover: %s/%s/%s, %zu descriptors", id.c_str(), svcUuid.c_str(), chrUuid.c_str(), (size_t)uuids.size());
        sendEvent("descriptorsDiscover", [&](CentralStatusListener& l) { l.descriptorsDiscover(id, svcUuid, chrUuid, uuids, err); });
    });
}

void BTCentral::read(const std::string& id, const std::string& serviceUuid, const std::string& charUuid) {
    const std::string svcUuid = formatUuid(serviceUuid);
    const std::string chrUuid = formatUuid(charUuid);
    resolver.resolveCharacteristic(id, svcUuid, chrUuid, [this, id, svcUuid, chrUuid](const BTExceptionRef& err, const TransportGattCharRef& characteristic) {
        if( nullptr != err ) {
            sendEvent("read", [&](CentralStatusListener& l) { l.read(id, svcUuid, chrUuid, emptyOctets, false, err); });
            return;
        }
        characteristic->readValue(CacheMode::UNCACHED, [this, id, svcUuid, chrUuid](const TransportResult& res, const jau::TROOctets& value) {
            BTExceptionRef err2 = checkCommunicationResult(res, id);
            const jau::TROOctets& data = nullptr == err2 ? value : emptyOctets;
            COND_PRINT(env.DEBUG_EVENT, "BTCentral::read: %s/%s/%s, %zu bytes, error %s", id.c_str(), svcUuid.c_str(), chrUuid.c_str(),
                    (size_t)data.size(), nullptr != err2 ? err2->what() : "none");
            sendEvent("read", [&](CentralStatusListener& l) { l.read(id, svcUuid, chrUuid, data, false, err2); });
        });
    });
}

void BTCentral::write(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                      const jau::TROOctets& data, const bool withoutResponse)
{
    const std::string svcUuid = formatUuid(serviceUuid);
    const std::string chrUuid = formatUuid(charUuid);
    std::shared_ptr<jau::POctets> value = std::make_shared<jau::POctets>(data.get_ptr(), data.size(), jau::endian::little);
    resolver.resolveCharacteristic(id, svcUuid, chrUuid, [this, id, svcUuid, chrUuid, value, withoutResponse](const BTExceptionRef& err, const TransportGattCharRef& characteristic) {
        if( nullptr != err ) {
            if( withoutResponse ) {
                DBG_PRINT("BTCentral::write: %s/%s/%s: suppressed failure %s", id.c_str(), svcUuid.c_str(), chrUuid.c_str(), err->what());
            } else {
                sendEvent("write", [&](CentralStatusListener& l) { l.write(id, svcUuid, chrUuid, err); });
            }
            return;
        }
        characteristic->writeValue(*value, !withoutResponse, [this, id, svcUuid, chrUuid, withoutResponse](const TransportResult& res) {
            BTExceptionRef err2 = checkCommunicationResult(res, id);
            if( nullptr != err2 && withoutResponse ) {
                DBG_PRINT("BTCentral::write: %s/%s/%s: suppressed failure %s", id.c_str(), svcUuid.c_str(), chrUuid.c_str(), err2->what());
                return;
            }
            COND_PRINT(env.DEBUG_EVENT, "BTCentral::write: %s/%s/%s, error %s", id.c_str(), svcUuid.c_str(), chrUuid.c_str(), nullptr != err2 ? err2->what() : "none");
            sendEvent("write", [&](CentralStatusListener& l) { l.write(id, svcUuid, chrUuid, err2); });
        });
    });
}

void BTCentral::broadcast(const std::string& id, const std::string& serviceUuid, const std::string& charUuid, const bool broadcast_) {
    const std::string svcUuid = formatUuid(serviceUuid);
    const std::string chrUuid = formatUuid(charUuid);
    const BTExceptionRef err = std::make_shared<UnsupportedException>("Not supported", E_FILE_LINE);
    sendEvent("broadcast", [&](CentralStatusListener& l) { l.broadcast(id, svcUuid, chrUuid, broadcast_, err); });
}

void BTCentral::notify(const std::string& id, const std::string& serviceUuid, const std::string& charUuid, const bool notify_) {
    const std::string svcUuid = formatUuid(serviceUuid);
    const std::string chrUuid = formatUuid(charUuid);
    subscriptions.setNotify(id, svcUuid, chrUuid, notify_, [this, id, svcUuid, chrUuid](const BTExceptionRef& err, const bool state) {
        COND_PRINT(env.DEBUG_EVENT, "BTCentral::notify: %s/%s/%s, state %d, error %s", id.c_str(), svcUuid.c_str(), chrUuid.c_str(),
                state, nullptr != err ? err->what() : "none");
        sendEvent("notify", [&](CentralStatusListener& l) { l.notify(id, svcUuid, chrUuid, state, err); });
    });
}

void BTCentral::readValue(const std::string& id, const std::string& serviceUuid, const std::string& charUuid, const std::string& descUuid) {
    const std::string svcUuid = formatUuid(serviceUuid);
    const std::string chrUuid = formatUuid(charUuid);
    const std::string dscUuid = formatUuid(descUuid);
    resolver.resolveDescriptor(id, svcUuid, chrUuid, dscUuid, [this, id, svcUuid, chrUuid, dscUuid](const BTExceptionRef& err, const TransportGattDescRef& descriptor) {
        if( nullptr != err ) {
            sendEvent("readValue", [&](CentralStatusListener& l) { l.readValue(id, svcUuid, chrUuid, dscUuid, emptyOctets, err); });
            return;
        }
        descriptor->readValue(CacheMode::UNCACHED, [this, id, svcUuid, chrUuid, dscUuid](const TransportResult& res, const jau::TROOctets& value) {
            BTExceptionRef err2 = checkCommunicationResult(res, id);
            const jau::TROOctets& data = nullptr == err2 ? value : emptyOctets;
            COND_PRINT(env.DEBUG_EVENT, "BTCentral::readValue: %s/%s/%s/%s, %zu bytes", id.c_str(), svcUuid.c_str(), chrUuid.c_str(), dscUuid.c_str(), (size_t)data.size());
            sendEvent("readValue", [&](CentralStatusListener& l) { l.readValue(id, svcUuid, chrUuid, dscUuid, data, err2); });
        });
    });
}

void BTCentral::writeValue(const std::string& id, const std::string& serviceUuid, const std::string& charUuid, const std::string& descUuid,
                           const jau::TROOctets& data)
{
    const std::string svcUuid = formatUuid(serviceUuid);
    const std::string chrUuid = formatUuid(charUuid);
    const std::string dscUuid = formatUuid(descUuid);
    std::shared_ptr<jau::POctets> value = std::make_shared<jau::POctets>(data.get_ptr(), data.size(), jau::endian::little);
    resolver.resolveDescriptor(id, svcUuid, chrUuid, dscUuid, [this, id, svcUuid, chrUuid, dscUuid, value](const BTExceptionRef& err, const TransportGattDescRef& descriptor) {
        if( nullptr != err ) {
            sendEvent("writeValue", [&](CentralStatusListener& l) { l.writeValue(id, svcUuid, chrUuid, dscUuid, err); });
            return;
        }
        descriptor->writeValue(*value, [this, id, svcUuid, chrUuid, dscUuid](const TransportResult& res) {
            BTExceptionRef err2 = checkCommunicationResult(res, id);
            COND_PRINT(env.DEBUG_EVENT, "BTCentral::writeValue: %s/%s/%s/%s, error %s", id.c_str(), svcUuid.c_str(), chrUuid.c_str(), dscUuid.c_str(),
                    nullptr != err2 ? err2->what() : "none");
            sendEvent("writeValue", [&](CentralStatusListener& l) { l.writeValue(id, svcUuid, chrUuid, dscUuid, err2); });
        });
    });
}

void BTCentral::readHandle(const std::string& id, const uint16_t handle) {
    const BTExceptionRef err = std::make_shared<UnsupportedException>("Not supported", E_FILE_LINE);
    sendEvent("readHandle", [&](CentralStatusListener& l) { l.readHandle(id, handle, emptyOctets, err); });
}

void BTCentral::writeHandle(const std::string& id, const uint16_t handle, const jau::TROOctets& data, const bool withoutResponse) {
    (void)data;
    if( withoutResponse ) {
        return;
    }
    const BTExceptionRef err = std::make_shared<UnsupportedException>("Not supported", E_FILE_LINE);
    sendEvent("writeHandle", [&](CentralStatusListener& l) { l.writeHandle(id, handle, err); });
}

std::string BTCentral::toString() const noexcept {
    return "Central[radio "+to_string(radioMonitor.getState())+", keepAlive "+std::to_string(keepAlive.getCount())+
           ", devices "+std::to_string(registry.getDeviceCount())+", subscriptions "+std::to_string(subscriptions.getSubscriptionCount())+"]";
}
