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

#ifndef CBT_SUBSCRIPTION_MANAGER_HPP_
#define CBT_SUBSCRIPTION_MANAGER_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <unordered_map>

#include <mutex>

#include <jau/functional.hpp>
#include <jau/octets.hpp>

#include "BTTypes0.hpp"
#include "BTTransport.hpp"
#include "BTDeviceRegistry.hpp"
#include "BTGattResolver.hpp"
#include "BTResourceTracker.hpp"

namespace central_bt {

    /** \addtogroup CBTUserClientAPI
     *
     *  @{
     */

    /** Completion of BTSubscriptionManager::setNotify(), delivering the resulting subscription state. */
    typedef jau::function<void(const BTExceptionRef&, const bool enabled)> NotifyCallback;

    /** Receives value changed notifications of subscribed characteristics. */
    typedef jau::function<void(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                               const jau::TROOctets& value)> NotificationCallback;

    /**
     * Tracks active notification subscriptions per (device, service, characteristic)
     * and enforces idempotent enable and disable.
     *
     * Presence of an entry means subscribed. A liveness reference is held per entry.
     * A failed descriptor write leaves the subscription state unchanged.
     */
    class BTSubscriptionManager {
        public:
            typedef jau::nsize_t size_type;

        private:
            struct Subscription {
                std::string id;
                TransportGattCharRef characteristic;
                uint64_t token = 0;
            };

            BTDeviceRegistry& registry;
            BTGattResolver& resolver;
            KeepAlive& keepAlive;
            NotificationCallback notificationCallback;

            std::unordered_map<std::string, Subscription> subscriptions;
            mutable std::mutex mtx_subscriptions;

            static std::string subscriptionKey(const std::string& id, const std::string& serviceUuid, const std::string& charUuid) noexcept {
                return id+"/"+serviceUuid+"/"+charUuid;
            }

            bool hasSubscription(const std::string& key) const noexcept;

            /**
             * Registers the value changed listener and stores the entry, unless already existing.
             * @return false if the device is no longer connected
             */
            bool attach(const std::string& key, const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                        const TransportGattCharRef& characteristic) noexcept;

            /** Removes the entry, detaches its listener and releases its liveness reference. */
            bool detach(const std::string& key, Subscription& removed) noexcept;

            void enable(const std::string& key, const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                        const TransportGattCharRef& characteristic, NotifyCallback cb);

            void disable(const std::string& key, const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                         NotifyCallback cb);

        public:
            BTSubscriptionManager(BTDeviceRegistry& registry_, BTGattResolver& resolver_, KeepAlive& keepAlive_,
                                  NotificationCallback notificationCallback_) noexcept
            : registry(registry_), resolver(resolver_), keepAlive(keepAlive_), notificationCallback(notificationCallback_) {}

            BTSubscriptionManager(const BTSubscriptionManager&) = delete;
            void operator=(const BTSubscriptionManager&) = delete;

            /**
             * Enables or disables notifications of the given characteristic.
             *
             * The characteristic is resolved first in both directions,
             * an unknown one completes with NotFoundException.
             *
             * Enabling an enabled or disabling a disabled characteristic completes
             * without a descriptor write.
             * Otherwise completes after the client characteristic configuration descriptor write.
             *
             * @throws NotFoundException if the device is unknown
             * @throws InvalidStateException if not connected
             */
            void setNotify(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                           const bool enable, NotifyCallback cb);

            bool isSubscribed(const std::string& id, const std::string& serviceUuid, const std::string& charUuid) const noexcept;

            size_type getSubscriptionCount() const noexcept;

            /**
             * Removes all subscriptions of the given device without any descriptor write,
             * used on disconnect and connection loss.
             * @return number of removed subscriptions
             */
            size_type removeAll(const std::string& id) noexcept;
    };

    /**@}*/

} // namespace central_bt

#endif /* CBT_SUBSCRIPTION_MANAGER_HPP_ */
