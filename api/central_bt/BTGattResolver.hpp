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

#ifndef CBT_GATT_RESOLVER_HPP_
#define CBT_GATT_RESOLVER_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/darray.hpp>
#include <jau/functional.hpp>

#include "BTTypes0.hpp"
#include "BTTransport.hpp"
#include "BTDeviceRegistry.hpp"
#include "BTGattChar.hpp"

namespace central_bt {

    /** \addtogroup CBTUserClientAPI
     *
     *  @{
     */

    typedef jau::function<void(const BTExceptionRef&, const TransportGattServiceRef&)> ServiceResolvedCallback;
    typedef jau::function<void(const BTExceptionRef&, const TransportGattCharRef&)> CharResolvedCallback;
    typedef jau::function<void(const BTExceptionRef&, const TransportGattDescRef&)> DescResolvedCallback;

    /** Completion delivering discovered characteristics, the list is empty if error is set. */
    typedef jau::function<void(const BTExceptionRef&, const jau::darray<BTGattChar>&)> CharsDiscoveredCallback;

    /**
     * Cached on-demand resolution of services, characteristics and descriptors,
     * backed by the BTDeviceRegistry's per device caches.
     *
     * Resolution uses the transport's cached query mode,
     * while the discover operations use uncached mode reflecting the current peripheral state.
     *
     * All UUID arguments are normalized via formatUuid().
     *
     * Concurrent resolution of the same key is not deduplicated:
     * each issues its own query and the first stored handle is kept.
     * A result arriving after the device has been disconnected is discarded
     * and completes with InvalidStateException.
     *
     * Each operation throws synchronously NotFoundException for an unknown device
     * and InvalidStateException if the device is not connected.
     * Later failures are delivered via the callback.
     */
    class BTGattResolver {
        private:
            BTDeviceRegistry& registry;

            /**
             * Stores the given, already tracked object in the given cache if the device still holds the given connection
             * and returns the cached instance, otherwise nullptr.
             */
            template<typename T>
            std::shared_ptr<T> storeIfConnected(const std::string& id, const TransportDeviceRef& conn,
                                                std::unordered_map<std::string, std::shared_ptr<T>> BTDevice::* cache,
                                                const std::string& key, const std::shared_ptr<T>& obj) noexcept;

            /** Tracks all given objects if still connected, otherwise releases them. */
            template<typename T>
            bool trackIfConnected(const std::string& id, const TransportDeviceRef& conn,
                                  const jau::darray<std::shared_ptr<T>>& objs) noexcept;

        public:
            explicit BTGattResolver(BTDeviceRegistry& registry_) noexcept
            : registry(registry_) {}

            BTGattResolver(const BTGattResolver&) = delete;
            void operator=(const BTGattResolver&) = delete;

            /**
             * Returns the cached service or queries all services in cached mode,
             * stores and returns the one matching the given UUID.
             * Completes with NotFoundException if no service matches.
             */
            void resolveService(const std::string& id, const std::string& serviceUuid, ServiceResolvedCallback cb);

            /** Same pattern one level down, cached by (service, characteristic). */
            void resolveCharacteristic(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                                       CharResolvedCallback cb);

            /** Same pattern one level deeper, cached by (service, characteristic, descriptor). */
            void resolveDescriptor(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                                   const std::string& descUuid, DescResolvedCallback cb);

            /** Uncached enumeration of the included services of the resolved service, filtered by the allow-list. */
            void discoverIncludedServices(const std::string& id, const std::string& serviceUuid,
                                          const jau::darray<std::string>& filter, UuidListCallback cb);

            /** Uncached enumeration of the characteristics of the resolved service, filtered by the allow-list. */
            void discoverCharacteristics(const std::string& id, const std::string& serviceUuid,
                                         const jau::darray<std::string>& filter, CharsDiscoveredCallback cb);

            /** Uncached enumeration of the descriptors of the resolved characteristic. */
            void discoverDescriptors(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                                     UuidListCallback cb);
    };

    /**@}*/

} // namespace central_bt

#endif /* CBT_GATT_RESOLVER_HPP_ */
