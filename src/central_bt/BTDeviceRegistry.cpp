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
#include <jau/basic_algos.hpp>

#include "BTDeviceRegistry.hpp"
#include "BTUUID.hpp"

using namespace central_bt;

static const jau::darray<std::string> emptyUuidList;

BTDeviceRef BTDeviceRegistry::getOrCreateDevice(const uint64_t address, bool& created) noexcept {
    const std::string id = to_device_id(address);
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    auto it = devices.find(id);
    if( devices.end() != it ) {
        created = false;
        return it->second;
    }
    BTDeviceRef device = std::make_shared<BTDevice>(address);
    devices.emplace(id, device);
    created = true;
    return device;
}

BTDeviceRef BTDeviceRegistry::findDevice(const std::string& id) const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    auto it = devices.find(id);
    return devices.end() != it ? it->second : nullptr;
}

BTDeviceRef BTDeviceRegistry::getDevice(const std::string& id) const {
    BTDeviceRef device = findDevice(id);
    if( nullptr == device ) {
        throw NotFoundException("Unknown device: "+id, E_FILE_LINE);
    }
    return device;
}

BTDeviceRegistry::size_type BTDeviceRegistry::getDeviceCount() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    return devices.size();
}

jau::darray<std::string> BTDeviceRegistry::getConnectedDeviceIds() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    jau::darray<std::string> res;
    for(const auto& e : devices) {
        if( nullptr != e.second->connection ) {
            res.push_back(e.first);
        }
    }
    return res;
}

bool BTDeviceRegistry::isConnected(const std::string& id) const {
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    return nullptr != getDevice(id)->connection;
}

ConnectableState BTDeviceRegistry::getConnectable(const std::string& id) const {
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    return getDevice(id)->connectable;
}

AdvertisementData BTDeviceRegistry::getAdvertisement(const std::string& id) const {
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    return getDevice(id)->advertisement;
}

TransportDeviceRef BTDeviceRegistry::getConnection(const std::string& id) const {
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    TransportDeviceRef conn = getDevice(id)->connection;
    if( nullptr == conn ) {
        throw InvalidStateException("Device not connected: "+id, E_FILE_LINE);
    }
    return conn;
}

BTDeviceRegistry::size_type BTDeviceRegistry::getServiceCacheSize(const std::string& id) const {
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    return getDevice(id)->serviceCache.size();
}

BTDeviceRegistry::size_type BTDeviceRegistry::getCharCacheSize(const std::string& id) const {
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    return getDevice(id)->charCache.size();
}

BTDeviceRegistry::size_type BTDeviceRegistry::getDescCacheSize(const std::string& id) const {
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    return getDevice(id)->descCache.size();
}

void BTDeviceRegistry::connect(const std::string& id, CompletionCallback cb) {
    uint64_t address;
    bool connected;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
        BTDeviceRef device = getDevice(id);
        if( ConnectableState::YES != device->connectable ) {
            throw InvalidStateException("Device not connectable: "+id, E_FILE_LINE);
        }
        address = device->address;
        connected = nullptr != device->connection;
    }
    if( connected ) {
        DBG_PRINT("BTDeviceRegistry::connect: %s: already connected", id.c_str());
        cb(nullptr);
        return;
    }
    DBG_PRINT("BTDeviceRegistry::connect: %s: start", id.c_str());
    transport.connectByAddress(address, [this, id, cb](const TransportResult& res, const TransportDeviceRef& conn) {
        BTExceptionRef err = checkCommunicationResult(res, id);
        if( nullptr == err && nullptr == conn ) {
            err = std::make_shared<TransportException>("Device unreachable: "+id, E_FILE_LINE);
        }
        if( nullptr != err ) {
            DBG_PRINT("BTDeviceRegistry::connect: %s: failed: %s", id.c_str(), err->what());
            cb(err);
            return;
        }
        bool attached = false;
        {
            const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
            BTDeviceRef device = findDevice(id);
            if( nullptr != device && nullptr == device->connection ) {
                device->connection = conn;
                tracker.track(id, conn);
                attached = true;
            }
        }
        if( !attached ) {
            // Concurrent connect won the race, keep its handle
            DBG_PRINT("BTDeviceRegistry::connect: %s: already attached, releasing redundant handle", id.c_str());
            conn->release();
        }
        cb(nullptr);
    });
}

bool BTDeviceRegistry::disconnect(const std::string& id) {
    BTResourceTracker::releasable_list_t resources;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
        BTDeviceRef device = getDevice(id);
        if( nullptr == device->connection ) {
            DBG_PRINT("BTDeviceRegistry::disconnect: %s: not connected", id.c_str());
            return false;
        }
        device->clearConnection();
        // Detached together with the connection, a later connect tracks into a fresh set
        resources = tracker.take(id);
    }
    const size_type released = BTResourceTracker::release(resources);
    DBG_PRINT("BTDeviceRegistry::disconnect: %s: released %zu resources", id.c_str(), (size_t)released);
    return true;
}

void BTDeviceRegistry::discoverServices(const std::string& id, const jau::darray<std::string>& filter, UuidListCallback cb) {
    TransportDeviceRef conn = getConnection(id);
    conn->getServices(CacheMode::UNCACHED, [this, id, conn, filter, cb](const TransportResult& res, const jau::darray<TransportGattServiceRef>& services) {
        BTExceptionRef err = checkCommunicationResult(res, id);
        if( nullptr != err ) {
            cb(err, emptyUuidList);
            return;
        }
        jau::darray<std::string> uuids;
        bool connected;
        {
            const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
            connected = isConnectedWith(findDevice(id), conn);
            if( connected ) {
                jau::for_each(services.cbegin(), services.cend(), [&](const TransportGattServiceRef &s) {
                    tracker.track(id, s);
                    const std::string uuid = formatUuid(s->getUuid());
                    if( matchesUuidFilter(filter, uuid) ) {
                        uuids.push_back(uuid);
                    }
                });
            }
        }
        if( !connected ) {
            jau::for_each(services.cbegin(), services.cend(), [](const TransportGattServiceRef &s) {
                s->release();
            });
            cb(std::make_shared<InvalidStateException>("Device disconnected: "+id, E_FILE_LINE), emptyUuidList);
            return;
        }
        cb(nullptr, uuids);
    });
}

std::string BTDeviceRegistry::toString() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    std::string out("Registry["+std::to_string(devices.size())+" devices");
    for(const auto& e : devices) {
        out.append(", ").append(e.second->toString());
    }
    out.append("]");
    return out;
}
