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
#include <cinttypes>

#include <jau/debug.hpp>
#include <jau/darray.hpp>

#include "BTSubscriptionManager.hpp"
#include "BTUUID.hpp"

using namespace central_bt;

bool BTSubscriptionManager::hasSubscription(const std::string& key) const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_subscriptions); // RAII-style acquire and relinquish via destructor
    return subscriptions.end() != subscriptions.find(key);
}

bool BTSubscriptionManager::isSubscribed(const std::string& id, const std::string& serviceUuid, const std::string& charUuid) const noexcept {
    return hasSubscription( subscriptionKey(id, formatUuid(serviceUuid), formatUuid(charUuid)) );
}

BTSubscriptionManager::size_type BTSubscriptionManager::getSubscriptionCount() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_subscriptions); // RAII-style acquire and relinquish via destructor
    return subscriptions.size();
}

bool BTSubscriptionManager::attach(const std::string& key, const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                                   const TransportGattCharRef& characteristic) noexcept
{
    if( nullptr == registry.findDevice(id) || !registry.isConnected(id) ) {
        return false;
    }
    const uint64_t token = characteristic->addValueChangedListener(
            [this, id, serviceUuid, charUuid](const jau::TROOctets& value) {
                notificationCallback(id, serviceUuid, charUuid, value);
            });
    bool added;
    {
        const std::lock_guard<std::mutex> lock(mtx_subscriptions); // RAII-style acquire and relinquish via destructor
        added = subscriptions.emplace(key, Subscription{id, characteristic, token}).second;
    }
    if( added ) {
        keepAlive.ref();
    } else {
        // Concurrent enable attached first
        (void)characteristic->removeValueChangedListener(token);
    }
    return true;
}

bool BTSubscriptionManager::detach(const std::string& key, Subscription& removed) noexcept {
    {
        const std::lock_guard<std::mutex> lock(mtx_subscriptions); // RAII-style acquire and relinquish via destructor
        auto it = subscriptions.find(key);
        if( subscriptions.end() == it ) {
            return false;
        }
        removed = it->second;
        subscriptions.erase(it);
    }
    keepAlive.unref();
    if( !removed.characteristic->removeValueChangedListener(removed.token) ) {
        WARN_PRINT("BTSubscriptionManager::detach: %s: unknown listener token %" PRIu64, key.c_str(), removed.token);
    }
    return true;
}

void BTSubscriptionManager::setNotify(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                                      const bool enable_, NotifyCallback cb)
{
    const std::string svcUuid = formatUuid(serviceUuid);
    const std::string chrUuid = formatUuid(charUuid);
    const std::string key = subscriptionKey(id, svcUuid, chrUuid);

    (void)registry.getConnection(id); // throws if unknown or not connected

    resolver.resolveCharacteristic(id, svcUuid, chrUuid, [this, key, id, svcUuid, chrUuid, enable_, cb](const BTExceptionRef& err, const TransportGattCharRef& characteristic) {
        if( nullptr != err ) {
            cb(err, false);
            return;
        }
        if( enable_ ) {
            enable(key, id, svcUuid, chrUuid, characteristic, cb);
        } else {
            disable(key, id, svcUuid, chrUuid, cb);
        }
    });
}

void BTSubscriptionManager::enable(const std::string& key, const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                                   const TransportGattCharRef& characteristic, NotifyCallback cb)
{
    if( hasSubscription(key) ) {
        DBG_PRINT("BTSubscriptionManager::enable: %s: already enabled", key.c_str());
        cb(nullptr, true);
        return;
    }
    characteristic->writeClientCharConfig(ClientCharConfigValue::NOTIFY,
            [this, key, id, serviceUuid, charUuid, characteristic, cb](const TransportResult& res) {
        BTExceptionRef err = checkCommunicationResult(res, id);
        if( nullptr != err ) {
            DBG_PRINT("BTSubscriptionManager::enable: %s: failed: %s", key.c_str(), err->what());
            cb(err, false);
            return;
        }
        if( !attach(key, id, serviceUuid, charUuid, characteristic) ) {
            cb(std::make_shared<InvalidStateException>("Device disconnected: "+id, E_FILE_LINE), false);
            return;
        }
        DBG_PRINT("BTSubscriptionManager::enable: %s: enabled", key.c_str());
        cb(nullptr, true);
    });
}

void BTSubscriptionManager::disable(const std::string& key, const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                                    NotifyCallback cb)
{
    Subscription removed;
    if( !detach(key, removed) ) {
        DBG_PRINT("BTSubscriptionManager::disable: %s: not enabled", key.c_str());
        cb(nullptr, false);
        return;
    }
    const TransportGattCharRef characteristic = removed.characteristic;
    characteristic->writeClientCharConfig(ClientCharConfigValue::NONE,
            [this, key, id, serviceUuid, charUuid, characteristic, cb](const TransportResult& res) {
        BTExceptionRef err = checkCommunicationResult(res, id);
        if( nullptr != err ) {
            // Restore the entry, the peripheral still notifies
            (void)attach(key, id, serviceUuid, charUuid, characteristic);
            DBG_PRINT("BTSubscriptionManager::disable: %s: failed: %s", key.c_str(), err->what());
            cb(err, true);
            return;
        }
        DBG_PRINT("BTSubscriptionManager::disable: %s: disabled", key.c_str());
        cb(nullptr, false);
    });
}

BTSubscriptionManager::size_type BTSubscriptionManager::removeAll(const std::string& id) noexcept {
    jau::darray<Subscription> removed;
    {
        const std::lock_guard<std::mutex> lock(mtx_subscriptions); // RAII-style acquire and relinquish via destructor
        for(auto it = subscriptions.begin(); it != subscriptions.end(); ) {
            if( it->second.id == id ) {
                removed.push_back(it->second);
                it = subscriptions.erase(it);
            } else {
                ++it;
            }
        }
    }
    for(Subscription& s : removed) {
        keepAlive.unref();
        (void)s.characteristic->removeValueChangedListener(s.token);
    }
    DBG_PRINT("BTSubscriptionManager::removeAll: %s: removed %zu", id.c_str(), (size_t)removed.size());
    return removed.size();
}
