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

#ifndef CBT_DEVICE_REGISTRY_HPP_
#define CBT_DEVICE_REGISTRY_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <unordered_map>

#include <mutex>

#include <jau/darray.hpp>
#include <jau/functional.hpp>

#include "BTTypes0.hpp"
#include "BTDevice.hpp"
#include "BTTransport.hpp"
#include "BTResourceTracker.hpp"

namespace central_bt {

    /** \addtogroup CBTUserClientAPI
     *
     *  @{
     */

    /** Completion of an asynchronous operation, error is nullptr on success. */
    typedef jau::function<void(const BTExceptionRef&)> CompletionCallback;

    /** Completion delivering formatted UUIDs, the list is empty if error is set. */
    typedef jau::function<void(const BTExceptionRef&, const jau::darray<std::string>&)> UuidListCallback;

    /**
     * Authoritative table of known devices keyed by their identifier,
     * owning their connection handles and cached GATT object graphs.
     *
     * One instance is owned by BTCentral and passed to its companion components.
     *
     * All record mutation and cache access is serialized by the registry lock,
     * which is never held while calling into the transport or completion callbacks.
     *
     * Operations taking a device identifier throw NotFoundException if no record exists.
     */
    class BTDeviceRegistry {
        friend class BTGattResolver;

        public:
            typedef jau::nsize_t size_type;

        private:
            BTTransport& transport;
            BTResourceTracker& tracker;
            mutable std::recursive_mutex mtx_registry;
            std::unordered_map<std::string, BTDeviceRef> devices;

            /** Returns true if the given device holds the given connection. Caller holds the registry lock. */
            bool isConnectedWith(const BTDeviceRef& device, const TransportDeviceRef& conn) const noexcept {
                return nullptr != device && nullptr != conn && device->connection == conn;
            }

        public:
            BTDeviceRegistry(BTTransport& transport_, BTResourceTracker& tracker_) noexcept
            : transport(transport_), tracker(tracker_) {}

            BTDeviceRegistry(const BTDeviceRegistry&) = delete;
            void operator=(const BTDeviceRegistry&) = delete;

            /** The registry lock, guarding all BTDevice state. */
            std::recursive_mutex& getMutex() const noexcept { return mtx_registry; }

            BTResourceTracker& getTracker() noexcept { return tracker; }

            /**
             * Returns the record for the given 48-bit address, creating it with default fields if not existing.
             * @param created set to true if the record has been newly created
             */
            BTDeviceRef getOrCreateDevice(const uint64_t address, bool& created) noexcept;

            /** Returns the record for the given identifier or nullptr. */
            BTDeviceRef findDevice(const std::string& id) const noexcept;

            /** Returns the record for the given identifier, throws NotFoundException if unknown. */
            BTDeviceRef getDevice(const std::string& id) const;

            size_type getDeviceCount() const noexcept;

            /** Returns the identifiers of all connected devices. */
            jau::darray<std::string> getConnectedDeviceIds() const noexcept;

            bool isConnected(const std::string& id) const;

            ConnectableState getConnectable(const std::string& id) const;

            /** Returns a snapshot of the merged advertisement data. */
            AdvertisementData getAdvertisement(const std::string& id) const;

            /** Returns the connection handle, throws InvalidStateException if not connected. */
            TransportDeviceRef getConnection(const std::string& id) const;

            size_type getServiceCacheSize(const std::string& id) const;
            size_type getCharCacheSize(const std::string& id) const;
            size_type getDescCacheSize(const std::string& id) const;

            /**
             * Asynchronously resolves a connection handle for the device's address
             * and attaches it to the record, tracked as a releasable resource.
             *
             * An already connected device completes successfully without a transport call.
             *
             * @throws NotFoundException if the device is unknown
             * @throws InvalidStateException unless the device is known to be connectable, without calling the transport
             */
            void connect(const std::string& id, CompletionCallback cb);

            /**
             * Detaches the connection handle, clears all three caches atomically
             * and releases all tracked resources of the device.
             *
             * A no-op if not connected. Subscriptions are removed by the caller beforehand.
             *
             * @return true if the device had been connected
             * @throws NotFoundException if the device is unknown
             */
            bool disconnect(const std::string& id);

            /**
             * Enumerates all services in uncached mode, tracks each of them
             * and completes with the formatted UUIDs passing the given allow-list.
             *
             * The single service cache used by deeper resolution is left untouched.
             *
             * @throws NotFoundException if the device is unknown
             * @throws InvalidStateException if not connected
             */
            void discoverServices(const std::string& id, const jau::darray<std::string>& filter, UuidListCallback cb);

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace central_bt

#endif /* CBT_DEVICE_REGISTRY_HPP_ */
