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

#include "BTGattResolver.hpp"
#include "BTUUID.hpp"

using namespace central_bt;

static const jau::darray<std::string> emptyUuidList;
static const jau::darray<BTGattChar> emptyCharList;

static BTExceptionRef makeDisconnectedError(const std::string& id) noexcept {
    return std::make_shared<InvalidStateException>("Device disconnected: "+id, E_FILE_LINE);
}

template<typename T>
static std::shared_ptr<T> findByUuid(const jau::darray<std::shared_ptr<T>>& objs, const std::string& formattedUuid) noexcept {
    auto it = jau::find_if(objs.cbegin(), objs.cend(), [&formattedUuid](const std::shared_ptr<T> &o) -> bool {
        return nullptr != o && formatUuid(o->getUuid()) == formattedUuid;
    });
    return objs.cend() != it ? *it : nullptr;
}

template<typename T>
std::shared_ptr<T> BTGattResolver::storeIfConnected(const std::string& id, const TransportDeviceRef& conn,
                                                    std::unordered_map<std::string, std::shared_ptr<T>> BTDevice::* cache,
                                                    const std::string& key, const std::shared_ptr<T>& obj) noexcept
{
    const std::lock_guard<std::recursive_mutex> lock(registry.getMutex()); // RAII-style acquire and relinquish via destructor
    BTDeviceRef device = registry.findDevice(id);
    if( !registry.isConnectedWith(device, conn) ) {
        return nullptr;
    }
    // A concurrent resolution may have stored the slot already, keep the first.
    // Both handles are tracked already via trackIfConnected().
    auto res = ((*device).*cache).emplace(key, obj);
    return res.first->second;
}

template<typename T>
bool BTGattResolver::trackIfConnected(const std::string& id, const TransportDeviceRef& conn,
                                      const jau::darray<std::shared_ptr<T>>& objs) noexcept
{
    bool connected;
    {
        const std::lock_guard<std::recursive_mutex> lock(registry.getMutex()); // RAII-style acquire and relinquish via destructor
        connected = registry.isConnectedWith(registry.findDevice(id), conn);
        if( connected ) {
            jau::for_each(objs.cbegin(), objs.cend(), [&](const std::shared_ptr<T> &o) {
                registry.getTracker().track(id, o);
            });
        }
    }
    if( !connected ) {
        jau::for_each(objs.cbegin(), objs.cend(), [](const std::shared_ptr<T> &o) {
            o->release();
        });
    }
    return connected;
}

void BTGattResolver::resolveService(const std::string& id, const std::string& serviceUuid, ServiceResolvedCallback cb) {
    const std::string svcUuid = formatUuid(serviceUuid);
    TransportDeviceRef conn;
    TransportGattServiceRef cached;
    {
        const std::lock_guard<std::recursive_mutex> lock(registry.getMutex()); // RAII-style acquire and relinquish via destructor
        conn = registry.getConnection(id);
        BTDeviceRef device = registry.getDevice(id);
        auto it = device->serviceCache.find(svcUuid);
        if( device->serviceCache.end() != it ) {
            cached = it->second;
        }
    }
    if( nullptr != cached ) {
        cb(nullptr, cached);
        return;
    }
    DBG_PRINT("BTGattResolver::resolveService: %s: query %s", id.c_str(), svcUuid.c_str());
    conn->getServices(CacheMode::CACHED, [this, id, svcUuid, conn, cb](const TransportResult& res, const jau::darray<TransportGattServiceRef>& services) {
        BTExceptionRef err = checkCommunicationResult(res, id);
        if( nullptr != err ) {
            cb(err, nullptr);
            return;
        }
        // Every enumerated handle is owned by the device, not only the match
        if( !trackIfConnected(id, conn, services) ) {
            cb(makeDisconnectedError(id), nullptr);
            return;
        }
        TransportGattServiceRef found = findByUuid(services, svcUuid);
        if( nullptr == found ) {
            cb(std::make_shared<NotFoundException>("Service "+svcUuid+" not found on device "+id, E_FILE_LINE), nullptr);
            return;
        }
        TransportGattServiceRef stored = storeIfConnected(id, conn, &BTDevice::serviceCache, svcUuid, found);
        if( nullptr == stored ) {
            cb(makeDisconnectedError(id), nullptr);
            return;
        }
        cb(nullptr, stored);
    });
}

void BTGattResolver::resolveCharacteristic(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                                           CharResolvedCallback cb)
{
    const std::string svcUuid = formatUuid(serviceUuid);
    const std::string chrUuid = formatUuid(charUuid);
    const std::string key = BTDevice::charKey(svcUuid, chrUuid);
    TransportDeviceRef conn;
    TransportGattCharRef cached;
    {
        const std::lock_guard<std::recursive_mutex> lock(registry.getMutex()); // RAII-style acquire and relinquish via destructor
        conn = registry.getConnection(id);
        BTDeviceRef device = registry.getDevice(id);
        auto it = device->charCache.find(key);
        if( device->charCache.end() != it ) {
            cached = it->second;
        }
    }
    if( nullptr != cached ) {
        cb(nullptr, cached);
        return;
    }
    resolveService(id, svcUuid, [this, id, chrUuid, key, conn, cb](const BTExceptionRef& err, const TransportGattServiceRef& service) {
        if( nullptr != err ) {
            cb(err, nullptr);
            return;
        }
        DBG_PRINT("BTGattResolver::resolveCharacteristic: %s: query %s", id.c_str(), key.c_str());
        service->getCharacteristics(CacheMode::CACHED, [this, id, chrUuid, key, conn, cb](const TransportResult& res, const jau::darray<TransportGattCharRef>& chars) {
            BTExceptionRef err2 = checkCommunicationResult(res, id);
            if( nullptr != err2 ) {
                cb(err2, nullptr);
                return;
            }
            if( !trackIfConnected(id, conn, chars) ) {
                cb(makeDisconnectedError(id), nullptr);
                return;
            }
            TransportGattCharRef found = findByUuid(chars, chrUuid);
            if( nullptr == found ) {
                cb(std::make_shared<NotFoundException>("Characteristic "+key+" not found on device "+id, E_FILE_LINE), nullptr);
                return;
            }
            TransportGattCharRef stored = storeIfConnected(id, conn, &BTDevice::charCache, key, found);
            if( nullptr == stored ) {
                cb(makeDisconnectedError(id), nullptr);
                return;
            }
            cb(nullptr, stored);
        });
    });
}

void BTGattResolver::resolveDescriptor(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                                       const std::string& descUuid, DescResolvedCallback cb)
{
    const std::string svcUuid = formatUuid(serviceUuid);
    const std::string chrUuid = formatUuid(charUuid);
    const std::string dscUuid = formatUuid(descUuid);
    const std::string key = BTDevice::descKey(svcUuid, chrUuid, dscUuid);
    TransportDeviceRef conn;
    TransportGattDescRef cached;
    {
        const std::lock_guard<std::recursive_mutex> lock(registry.getMutex()); // RAII-style acquire and relinquish via destructor
        conn = registry.getConnection(id);
        BTDeviceRef device = registry.getDevice(id);
        auto it = device->descCache.find(key);
        if( device->descCache.end() != it ) {
            cached = it->second;
        }
    }
    if( nullptr != cached ) {
        cb(nullptr, cached);
        return;
    }
    resolveCharacteristic(id, svcUuid, chrUuid, [this, id, dscUuid, key, conn, cb](const BTExceptionRef& err, const TransportGattCharRef& characteristic) {
        if( nullptr != err ) {
            cb(err, nullptr);
            return;
        }
        DBG_PRINT("BTGattResolver::resolveDescriptor: %s: query %s", id.c_str(), key.c_str());
        characteristic->getDescriptors(CacheMode::CACHED, [this, id, dscUuid, key, conn, cb](const TransportResult& res, const jau::darray<TransportGattDescRef>& descs) {
            BTExceptionRef err2 = checkCommunicationResult(res, id);
            if( nullptr != err2 ) {
                cb(err2, nullptr);
                return;
            }
            if( !trackIfConnected(id, conn, descs) ) {
                cb(makeDisconnectedError(id), nullptr);
                return;
            }
            TransportGattDescRef found = findByUuid(descs, dscUuid);
            if( nullptr == found ) {
                cb(std::make_shared<NotFoundException>("Descriptor "+key+" not found on device "+id, E_FILE_LINE), nullptr);
                return;
            }
            TransportGattDescRef stored = storeIfConnected(id, conn, &BTDevice::descCache, key, found);
            if( nullptr == stored ) {
                cb(makeDisconnectedError(id), nullptr);
                return;
            }
            cb(nullptr, stored);
        });
    });
}

void BTGattResolver::discoverIncludedServices(const std::string& id, const std::string& serviceUuid,
                                              const jau::darray<std::string>& filter, UuidListCallback cb)
{
    const TransportDeviceRef conn = registry.getConnection(id);
    resolveService(id, serviceUuid, [this, id, conn, filter, cb](const BTExceptionRef& err, const TransportGattServiceRef& service) {
        if( nullptr != err ) {
            cb(err, emptyUuidList);
            return;
        }
        service->getIncludedServices(CacheMode::UNCACHED, [this, id, conn, filter, cb](const TransportResult& res, const jau::darray<TransportGattServiceRef>& services) {
            BTExceptionRef err2 = checkCommunicationResult(res, id);
            if( nullptr != err2 ) {
                cb(err2, emptyUuidList);
                return;
            }
            if( !trackIfConnected(id, conn, services) ) {
                cb(makeDisconnectedError(id), emptyUuidList);
                return;
            }
            jau::darray<std::string> uuids;
            jau::for_each(services.cbegin(), services.cend(), [&](const TransportGattServiceRef &s) {
                const std::string uuid = formatUuid(s->getUuid());
                if( matchesUuidFilter(filter, uuid) ) {
                    uuids.push_back(uuid);
                }
            });
            cb(nullptr, uuids);
        });
    });
}

void BTGattResolver::discoverCharacteristics(const std::string& id, const std::string& serviceUuid,
                                             const jau::darray<std::string>& filter, CharsDiscoveredCallback cb)
{
    const TransportDeviceRef conn = registry.getConnection(id);
    resolveService(id, serviceUuid, [this, id, conn, filter, cb](const BTExceptionRef& err, const TransportGattServiceRef& service) {
        if( nullptr != err ) {
            cb(err, emptyCharList);
            return;
        }
        service->getCharacteristics(CacheMode::UNCACHED, [this, id, conn, filter, cb](const TransportResult& res, const jau::darray<TransportGattCharRef>& chars) {
            BTExceptionRef err2 = checkCommunicationResult(res, id);
            if( nullptr != err2 ) {
                cb(err2, emptyCharList);
                return;
            }
            if( !trackIfConnected(id, conn, chars) ) {
                cb(makeDisconnectedError(id), emptyCharList);
                return;
            }
            jau::darray<BTGattChar> infos;
            jau::for_each(chars.cbegin(), chars.cend(), [&](const TransportGattCharRef &c) {
                const std::string uuid = formatUuid(c->getUuid());
                if( matchesUuidFilter(filter, uuid) ) {
                    infos.push_back( BTGattChar(uuid, c->getProperties()) );
                }
            });
            cb(nullptr, infos);
        });
    });
}

void BTGattResolver::discoverDescriptors(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                                         UuidListCallback cb)
{
    const TransportDeviceRef conn = registry.getConnection(id);
    resolveCharacteristic(id, serviceUuid, charUuid, [this, id, conn, cb](const BTExceptionRef& err, const TransportGattCharRef& characteristic) {
        if( nullptr != err ) {
            cb(err, emptyUuidList);
            return;
        }
        characteristic->getDescriptors(CacheMode::UNCACHED, [this, id, conn, cb](const TransportResult& res, const jau::darray<TransportGattDescRef>& descs) {
            BTExceptionRef err2 = checkCommunicationResult(res, id);
            if( nullptr != err2 ) {
                cb(err2, emptyUuidList);
                return;
            }
            if( !trackIfConnected(id, conn, descs) ) {
                cb(makeDisconnectedError(id), emptyUuidList);
                return;
            }
            jau::darray<std::string> uuids;
            jau::for_each(descs.cbegin(), descs.cend(), [&](const TransportGattDescRef &d) {
                uuids.push_back( formatUuid(d->getUuid()) );
            });
            cb(nullptr, uuids);
        });
    });
}
