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

#ifndef CBT_CENTRAL_HPP_
#define CBT_CENTRAL_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <mutex>

#include <jau/environment.hpp>
#include <jau/cow_darray.hpp>
#include <jau/darray.hpp>
#include <jau/octets.hpp>
#include <jau/debug.hpp>

#include "BTTypes0.hpp"
#include "BTTransport.hpp"
#include "BTResourceTracker.hpp"
#include "BTDeviceRegistry.hpp"
#include "BTGattResolver.hpp"
#include "BTSubscriptionManager.hpp"
#include "BTRadioMonitor.hpp"
#include "BTAdvertisementAggregator.hpp"
#include "CentralStatusListener.hpp"

namespace central_bt {

    /** \addtogroup CBTUserClientAPI
     *
     *  @{
     */

    /**
     * Central environment runtime configuration, initialized once at first use.
     */
    class CentralEnv : public jau::root_environment {
        private:
            CentralEnv() noexcept; // NOLINT(modernize-use-equals-delete)

        public:
            /** Global Debug flag, retrieved first to triggers environment initialization. */
            const bool DEBUG_GLOBAL;

        private:
            const bool exploding; // just to trigger exploding properties

        public:
            /**
             * Debug all emitted application events
             * <p>
             * Environment variable is 'central_bt.debug.central.event'.
             * </p>
             */
            const bool DEBUG_EVENT;

            /**
             * Active scanning requesting scan responses, defaults to true.
             * <p>
             * Discovery events are only emitted for scan responses,
             * hence passive scanning yields none.
             * </p>
             * <p>
             * Environment variable is 'central_bt.central.scan.active'.
             * </p>
             */
            const bool SCAN_ACTIVE;

            /**
             * Value reported by BTCentral::updateRssi(), defaults to 0.
             * <p>
             * Environment variable is 'central_bt.central.rssi.stub', range [-127..20].
             * </p>
             */
            const int32_t RSSI_STUB;

        public:
            static CentralEnv& get() noexcept {
                /**
                 * Thread safe starting with C++11 6.7:
                 *
                 * If control enters the declaration concurrently while the variable is being initialized,
                 * the concurrent execution shall wait for completion of the initialization.
                 *
                 * (Magic Statics)
                 */
                static CentralEnv e;
                return e;
            }
    };

    /**
     * BLE central facade owning one instance of each component,
     * exposing the application operations and emitting their results
     * to the registered CentralStatusListener.
     *
     * Synchronous precondition violations are thrown:
     * - NotFoundException for an unknown device
     * - InvalidStateException if not connected or not connectable
     *
     * Asynchronous failures are delivered via the matching listener event.
     *
     * A fire-and-forget write, i.e. `withoutResponse`, never reports its failure.
     */
    class BTCentral {
        public:
            typedef jau::nsize_t size_type;

        private:
            const CentralEnv& env;
            BTTransport& transport;

            KeepAlive keepAlive;
            BTResourceTracker tracker;
            BTDeviceRegistry registry;
            BTGattResolver resolver;
            BTSubscriptionManager subscriptions;
            BTRadioMonitor radioMonitor;
            BTAdvertisementAggregator aggregator;

            TransportAdvertisementWatcherRef watcher;
            bool scanning;
            std::mutex mtx_scan;

            typedef jau::cow_darray<CentralStatusListenerRef, size_type> statusListenerList_t;
            static statusListenerList_t::equal_comparator statusListenerRefEqComparator;
            statusListenerList_t statusListenerList;

            template<typename F>
            void sendEvent(const char* name, F f) noexcept {
                int i=0;
                jau::for_each_fidelity(statusListenerList, [&](CentralStatusListenerRef &l) {
                    try {
                        f(*l);
                    } catch (std::exception &e) {
                        ERR_PRINT("BTCentral::%s-CBs %d/%zu: %s: Caught exception %s",
                                name, i+1, (size_t)statusListenerList.size(), l->toString().c_str(), e.what());
                    }
                    i++;
                });
            }

            void onAdvertisementReceived(const AdvertisementEvent& event) noexcept;
            void onWatcherStopped(const WatcherStatus status) noexcept;
            void onRadioStateChanged(const RadioState state) noexcept;
            void onNotification(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                                const jau::TROOctets& value) noexcept;

            void close() noexcept;

        public:
            explicit BTCentral(BTTransport& transport_) noexcept;

            BTCentral(const BTCentral&) = delete;
            void operator=(const BTCentral&) = delete;

            /** Stops scanning, disconnects all devices and detaches from the transport. */
            ~BTCentral() noexcept;

            /**
             * Adds the given listener, returns false if already added or null.
             */
            bool addStatusListener(const CentralStatusListenerRef& l) noexcept;

            bool removeStatusListener(const CentralStatusListenerRef& l) noexcept;

            size_type removeAllStatusListener() noexcept;

            /**
             * Starts the radio enumeration and attaches to the advertisement watcher.
             * Must be called once before scanning.
             */
            void init();

            /**
             * Starts scanning, a no-op if already scanning.
             *
             * The service UUID filter and allow duplicates flag are accepted for reference only,
             * discovery events are not filtered.
             *
             * @throws InvalidStateException if init() hasn't been called
             */
            void startScanning(const jau::darray<std::string>& serviceUuids, const bool allowDuplicates);

            /** Stops scanning, a no-op if not scanning. */
            void stopScanning();

            bool isScanning() noexcept;

            void connect(const std::string& id);

            /** Emits the disconnect event if the device has been connected, never fails for a known device. */
            void disconnect(const std::string& id);

            /** Transport initiated disconnect, same state effects as disconnect(). */
            void onConnectionLost(const std::string& id) noexcept;

            /** Stub reporting CentralEnv::RSSI_STUB. */
            void updateRssi(const std::string& id);

            void discoverServices(const std::string& id, const jau::darray<std::string>& serviceUuids);

            void discoverIncludedServices(const std::string& id, const std::string& serviceUuid,
                                          const jau::darray<std::string>& serviceUuids);

            void discoverCharacteristics(const std::string& id, const std::string& serviceUuid,
                                         const jau::darray<std::string>& charUuids);

            void discoverDescriptors(const std::string& id, const std::string& serviceUuid, const std::string& charUuid);

            void read(const std::string& id, const std::string& serviceUuid, const std::string& charUuid);

            void write(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                       const jau::TROOctets& data, const bool withoutResponse);

            /** Unsupported, emits the broadcast event with UnsupportedException. */
            void broadcast(const std::string& id, const std::string& serviceUuid, const std::string& charUuid, const bool broadcast_);

            void notify(const std::string& id, const std::string& serviceUuid, const std::string& charUuid, const bool notify_);

            void readValue(const std::string& id, const std::string& serviceUuid, const std::string& charUuid, const std::string& descUuid);

            void writeValue(const std::string& id, const std::string& serviceUuid, const std::string& charUuid, const std::string& descUuid,
                            const jau::TROOctets& data);

            /** Unsupported, emits the readHandle event with UnsupportedException. */
            void readHandle(const std::string& id, const uint16_t handle);

            /** Unsupported, emits the writeHandle event with UnsupportedException unless `withoutResponse`. */
            void writeHandle(const std::string& id, const uint16_t handle, const jau::TROOctets& data, const bool withoutResponse);

            RadioState getRadioState() const noexcept { return radioMonitor.getState(); }

            const KeepAlive& getKeepAlive() const noexcept { return keepAlive; }

            BTDeviceRegistry& getRegistry() noexcept { return registry; }

            BTSubscriptionManager& getSubscriptionManager() noexcept { return subscriptions; }

            BTResourceTracker& getResourceTracker() noexcept { return tracker; }

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace central_bt

#endif /* CBT_CENTRAL_HPP_ */
